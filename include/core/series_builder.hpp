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

#include "dicom_loader.hpp"
#include "patient_record.hpp"

#include <array>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dicom_extractor::core {

/// Slices of one series, ordered along the slice normal
struct SeriesGroup {
    std::string seriesInstanceUid;
    std::string seriesDescription;
    std::string modality;
    std::vector<SliceInfo> slices;

    /// Metadata of the first ordered slice
    std::map<std::string, std::string> metadata;
};

/// A series dropped during grouping and why
struct DroppedSeries {
    std::string seriesInstanceUid;
    std::string reason;
};

struct GroupingResult {
    std::vector<SeriesGroup> series;
    std::vector<DroppedSeries> dropped;
};

/**
 * @brief Pixel reconstruction seam
 *
 * Produces the sampled array and its geometry (origin, spacing, direction)
 * from an ordered slice list.
 */
class VolumeReader {
public:
    virtual ~VolumeReader() = default;

    [[nodiscard]] virtual std::expected<VolumeType::Pointer, DicomErrorInfo>
    read(const std::vector<std::filesystem::path>& files) = 0;
};

/// Default reader backed by ITK ImageSeriesReader + GDCMImageIO
class ItkVolumeReader : public VolumeReader {
public:
    [[nodiscard]] std::expected<VolumeType::Pointer, DicomErrorInfo>
    read(const std::vector<std::filesystem::path>& files) override;

private:
    DicomLoader loader_;
};

/**
 * @brief Groups per-file headers into ordered series and builds volumes
 *
 * Grouping is keyed by Series Instance UID. Within a group, slices are
 * ordered by the projection of ImagePositionPatient onto the slice normal,
 * falling back to InstanceNumber for coincident positions. Groups whose
 * in-plane size or orientation differs between slices are dropped.
 */
class SeriesBuilder {
public:
    SeriesBuilder();
    explicit SeriesBuilder(std::shared_ptr<VolumeReader> reader);
    ~SeriesBuilder();

    // Non-copyable, movable
    SeriesBuilder(const SeriesBuilder&) = delete;
    SeriesBuilder& operator=(const SeriesBuilder&) = delete;
    SeriesBuilder(SeriesBuilder&&) noexcept;
    SeriesBuilder& operator=(SeriesBuilder&&) noexcept;

    /**
     * @brief Group image headers by series and order each group
     * @param headers Headers of non-segmentation image files
     * @return Ordered groups (by UID) plus the groups that were dropped
     */
    [[nodiscard]] static GroupingResult groupSlices(const std::vector<DicomHeader>& headers);

    /**
     * @brief Reconstruct the volume of a grouped series
     * @param group Group produced by groupSlices()
     * @return ImageSeries with its volume on success
     */
    [[nodiscard]] std::expected<ImageSeries, DicomErrorInfo>
    buildSeries(const SeriesGroup& group);

    /// Sort slices along the normal of the first slice, then by
    /// InstanceNumber, then by SliceLocation
    static void sortSlices(std::vector<SliceInfo>& slices);

    /**
     * @brief Describe a geometry inconsistency between slices
     * @return Reason text, or std::nullopt when the slices agree
     */
    [[nodiscard]] static std::optional<std::string>
    findGeometryInconsistency(const std::vector<SliceInfo>& slices);

    /**
     * @brief Calculate slice spacing from series information
     * @param slices Sorted slice information
     * @return Median spacing in mm
     */
    static double calculateSliceSpacing(const std::vector<SliceInfo>& slices);

    /**
     * @brief Validate uniform slice spacing and orientation
     * @param slices Sorted slice information
     * @return true if series is consistent
     */
    static bool validateSeriesConsistency(const std::vector<SliceInfo>& slices);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_extractor::core
