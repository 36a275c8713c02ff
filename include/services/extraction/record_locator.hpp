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
 * @file record_locator.hpp
 * @brief Discovery of patient directories and their source files
 * @details The patients root holds one sub-directory per patient. Image
 *          files are found recursively below it; label volume files are
 *          picked up both beside the images and in an optional shared
 *          segmentation directory, where they are matched to the patient by
 *          "<prefix><number>" in the file name. The patient number is the
 *          last run of digits in the patient directory name.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "services/extraction/segmentation_resolver.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dicom_extractor::services {

struct LocatorOptions {
    std::filesystem::path patientsRoot;

    /// Shared directory of label volumes, empty when not used
    std::filesystem::path segmentationsDirectory;

    /// Token preceding the patient number in shared label volume names
    std::string patientPrefix;
};

/// Source files found for one patient directory
struct PatientSources {
    std::filesystem::path patientPath;
    std::optional<int> patientNumber;

    /// DICOM candidates, images and SEG/RTSTRUCT alike, sorted
    std::vector<std::filesystem::path> dicomFiles;

    /// Label volume files, colocated first, then shared
    std::vector<SegmentationSource> labelVolumes;
};

class RecordLocator {
public:
    explicit RecordLocator(LocatorOptions options);
    ~RecordLocator();

    RecordLocator(const RecordLocator&) = delete;
    RecordLocator& operator=(const RecordLocator&) = delete;
    RecordLocator(RecordLocator&&) noexcept;
    RecordLocator& operator=(RecordLocator&&) noexcept;

    /**
     * @brief Patient directories under the root, sorted by name
     * @return Empty list when the root does not exist
     */
    [[nodiscard]] std::vector<std::filesystem::path> listPatients() const;

    /// Collect the source files of one patient directory
    [[nodiscard]] PatientSources locate(const std::filesystem::path& patientPath) const;

    [[nodiscard]] const LocatorOptions& options() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_extractor::services
