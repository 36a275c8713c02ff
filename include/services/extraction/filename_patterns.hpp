// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace dicom_extractor::services {

/**
 * @brief Last run of decimal digits in a name ("Patient-07_b12" -> 12)
 */
[[nodiscard]] std::optional<int> lastNumberIn(std::string_view name);

/**
 * @brief Number immediately following @p prefix in @p name
 *
 * "seg_Patient7_1.2.3.nrrd" with prefix "Patient" gives 7. Every
 * occurrence of the prefix is tried, the first one followed by digits wins.
 */
[[nodiscard]] std::optional<int> numberAfterPrefix(std::string_view name,
                                                   std::string_view prefix);

/**
 * @brief Label volume files read through ITK (.nrrd, .nhdr, .nii,
 *        .nii.gz, .mha, .mhd)
 */
[[nodiscard]] bool hasLabelVolumeExtension(const std::filesystem::path& path);

}  // namespace dicom_extractor::services
