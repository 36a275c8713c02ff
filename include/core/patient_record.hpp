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
 * @file patient_record.hpp
 * @brief Data model shared by the extraction pipeline and the store writer
 * @details ImageSeries is one reconstructed volume, Segmentation a set of
 *          canonical organ masks resolved onto one series, and PatientRecord
 *          the ordered criterion -> (series, segmentation) mapping handed to
 *          the writer. FailureRecord carries the non-fatal conditions that
 *          are aggregated across a run.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "dicom_loader.hpp"

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dicom_extractor::core {

/// One logical volume, unique by series UID within a patient
struct ImageSeries {
    std::string seriesInstanceUid;
    std::string seriesDescription;
    std::string modality;

    /// Slice files in physical order
    std::vector<std::filesystem::path> files;

    /// Metadata of the first slice, keyed "gggg|eeee"
    std::map<std::string, std::string> metadata;

    VolumeType::Pointer image;

    /// Volume shape in ITK index order (x, y, z)
    [[nodiscard]] std::array<size_t, 3> dimensions() const;

    /// Metadata value, empty when absent
    [[nodiscard]] std::string value(std::string_view tagKey) const;
};

/// One raw label of a segmentation source, before aliasing
struct Segment {
    std::string label;
    MaskType::Pointer mask;
};

/// Canonical organ masks resolved onto exactly one series
struct Segmentation {
    std::string referencedSeriesUid;
    std::filesystem::path sourcePath;
    std::map<std::string, MaskType::Pointer> organs;
};

struct RecordEntry {
    std::string criterionName;
    ImageSeries series;
    std::optional<Segmentation> segmentation;
};

struct PatientRecord {
    std::string patientId;
    std::filesystem::path patientPath;
    std::vector<RecordEntry> entries;

    /// Names of the transforms applied to the arrays, in order
    std::vector<std::string> transformsHistory;

    /// Entry for a criterion, nullptr when absent
    [[nodiscard]] const RecordEntry* find(std::string_view criterionName) const;
    [[nodiscard]] RecordEntry* find(std::string_view criterionName);
};

enum class FailureReason {
    NoImageFiles,
    MixedPatientIds,
    NoMatchingImages,
    MissingCriterion,
    UnresolvedSegmentationReference,
    UnrecognizedSegmentationFormat,
    SegmentationReadFailed,
    InconsistentSeriesGeometry,
    UnreadableFile,
    ReaderFailed,
    TransformFailed
};

[[nodiscard]] std::string_view toString(FailureReason reason);

struct FailureRecord {
    std::string patientId;
    FailureReason reason = FailureReason::NoMatchingImages;
    std::string detail;

    [[nodiscard]] std::string toString() const;
};

/// A patient missing one or more configured criteria
struct PatientWhoFailed {
    std::string patientId;

    /// Missing criterion -> descriptions it would have accepted
    std::map<std::string, std::vector<std::string>> failedImages;

    /// Descriptions observed in the patient's image series
    std::vector<std::string> availableDescriptions;
};

} // namespace dicom_extractor::core
