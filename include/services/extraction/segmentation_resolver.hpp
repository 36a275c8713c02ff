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
 * @file segmentation_resolver.hpp
 * @brief Format-dispatching resolution of segmentation sources
 * @details A segmentation source is one file holding labeled masks for a
 *          single image series. Three encodings are supported, each resolved
 *          by its own strategy function:
 *
 *          | Format             | Encoding                  | Reference            |
 *          |--------------------|---------------------------|----------------------|
 *          | StructuredLabel    | DICOM SEG (binary frames) | ReferencedSeriesSeq  |
 *          | RegionContour      | DICOM RTSTRUCT (polygons) | RTReferencedSeriesSeq|
 *          | FilenameConvention | NRRD / NIfTI / MetaImage  | UID in the file name |
 *
 *          Strategies are plain functions held in a registry keyed by the
 *          detected format, so tests and callers can register replacements.
 *          Every strategy places its masks on the grid of the referenced
 *          series.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/patient_record.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dicom_extractor::services {

enum class SegmentationFormat {
    StructuredLabel,
    RegionContour,
    FilenameConvention
};

[[nodiscard]] std::string_view toString(SegmentationFormat format);

/// One candidate segmentation file
struct SegmentationSource {
    std::filesystem::path path;

    /// Known format, e.g. from the DICOM header already read by the locator
    std::optional<SegmentationFormat> format;
};

/// Per-patient state a strategy resolves against
struct ResolveContext {
    /// Loaded series of the patient keyed by Series Instance UID
    std::map<std::string, core::VolumeType::Pointer> referenceVolumes;

    /// Last number in the patient directory name
    std::optional<int> patientNumber;

    /// Token preceding the patient number in label volume file names
    std::string patientPrefix;
};

/// Raw segments placed on the grid of the referenced series
struct ResolvedSegmentation {
    std::string referencedSeriesUid;
    std::vector<core::Segment> segments;
};

/**
 * @brief Error information for segmentation resolution
 */
struct ResolveError {
    enum class Code {
        UnrecognizedFormat,
        UnresolvedReference,
        PatientMismatch,
        ReadFailed,
        InvalidContent
    };

    Code code = Code::ReadFailed;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::UnrecognizedFormat: return "Unrecognized format: " + message;
            case Code::UnresolvedReference: return "Unresolved reference: " + message;
            case Code::PatientMismatch: return "Patient mismatch: " + message;
            case Code::ReadFailed: return "Read failed: " + message;
            case Code::InvalidContent: return "Invalid content: " + message;
        }
        return "Unknown error";
    }

    /// Failure reason recorded for this error
    [[nodiscard]] core::FailureReason failureReason() const noexcept {
        switch (code) {
            case Code::UnrecognizedFormat:
                return core::FailureReason::UnrecognizedSegmentationFormat;
            case Code::UnresolvedReference:
            case Code::PatientMismatch:
                return core::FailureReason::UnresolvedSegmentationReference;
            case Code::ReadFailed:
            case Code::InvalidContent:
                return core::FailureReason::SegmentationReadFailed;
        }
        return core::FailureReason::SegmentationReadFailed;
    }
};

using ResolveFunction = std::function<std::expected<ResolvedSegmentation, ResolveError>(
    const SegmentationSource&, const ResolveContext&)>;

/// DICOM SEG strategy
[[nodiscard]] std::expected<ResolvedSegmentation, ResolveError>
resolveStructuredLabel(const SegmentationSource& source, const ResolveContext& context);

/// DICOM RTSTRUCT strategy
[[nodiscard]] std::expected<ResolvedSegmentation, ResolveError>
resolveRegionContour(const SegmentationSource& source, const ResolveContext& context);

/**
 * @brief Label volume strategy
 *
 * The referenced series is the first UID of the context, in UID order,
 * that occurs anywhere in the file name. When one UID is a prefix of
 * another both match and the lexicographically smaller one wins.
 */
[[nodiscard]] std::expected<ResolvedSegmentation, ResolveError>
resolveFilenameConvention(const SegmentationSource& source, const ResolveContext& context);

class SegmentationResolver {
public:
    /// Registry holding the three built-in strategies
    SegmentationResolver();

    /// Replace or add the strategy for a format
    void registerStrategy(SegmentationFormat format, ResolveFunction function);

    /**
     * @brief Determine the encoding of a source
     *
     * Label volume extensions are checked first; otherwise the DICOM
     * Modality decides (SEG or RTSTRUCT).
     */
    [[nodiscard]] static std::expected<SegmentationFormat, ResolveError>
    detectFormat(const std::filesystem::path& path);

    /**
     * @brief Resolve one source against the patient's loaded series
     * @return Segments on the referenced grid; UnresolvedReference when the
     *         referenced series is not among @p context's volumes
     */
    [[nodiscard]] std::expected<ResolvedSegmentation, ResolveError>
    resolve(const SegmentationSource& source, const ResolveContext& context) const;

private:
    std::map<SegmentationFormat, ResolveFunction> strategies_;
};

}  // namespace dicom_extractor::services
