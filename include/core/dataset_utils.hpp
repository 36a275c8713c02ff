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

/**
 * @file dataset_utils.hpp
 * @brief Small accessors over GDCM data sets shared by the DICOM readers
 * @details Value extraction helpers used by the header reader and by the
 *          SEG and RTSTRUCT segmentation strategies. All string accessors
 *          strip DICOM padding (trailing spaces and NULs).
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <gdcmDataSet.h>
#include <gdcmTag.h>

namespace dicom_extractor::core {

/// Format a tag as the "gggg|eeee" key used in metadata maps
[[nodiscard]] std::string formatTagKey(uint16_t group, uint16_t element);

/// Parse a "gggg|eeee" key (case-insensitive hex)
[[nodiscard]] std::optional<gdcm::Tag> parseTagKey(std::string_view key);

/// Strip trailing spaces and NULs
[[nodiscard]] std::string trimDicomPadding(std::string value);

/// Raw string value of an element, empty when absent or empty
[[nodiscard]] std::string getStringValue(const gdcm::DataSet& ds,
                                         const gdcm::Tag& tag);

/// Split a backslash-separated multi-value string into doubles
[[nodiscard]] std::vector<double> parseDoubleValues(const std::string& str);

/// Parse a single integer string ("IS" VR), nullopt on failure
[[nodiscard]] std::optional<int> parseIntValue(const std::string& str);

/// Read a binary US element in host byte order, nullopt when absent
[[nodiscard]] std::optional<uint16_t> getUInt16Value(const gdcm::DataSet& ds,
                                                     const gdcm::Tag& tag);

/**
 * @brief Copy out the nested data sets of a sequence element
 *
 * Returned items are owned copies: GDCM may materialize an undefined
 * length sequence into a temporary that dies with the smart pointer.
 */
[[nodiscard]] std::vector<gdcm::DataSet> getSequenceItems(
    const gdcm::DataSet& ds, const gdcm::Tag& seqTag);

/// First item of a sequence, nullopt when absent or empty
[[nodiscard]] std::optional<gdcm::DataSet> getFirstSequenceItem(
    const gdcm::DataSet& ds, const gdcm::Tag& seqTag);

}  // namespace dicom_extractor::core
