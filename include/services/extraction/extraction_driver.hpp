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
 * @file extraction_driver.hpp
 * @brief Per-patient extraction pipeline exposed as a lazy record stream
 * @details For each patient directory the driver runs, in order:
 *          - source discovery (RecordLocator)
 *          - header reading and series grouping (DicomLoader, SeriesBuilder)
 *          - description matching (MatchCriteria), with optional correction
 *            of missing criteria through a caller-supplied handler
 *          - pixel reconstruction of the matched series (VolumeReader)
 *          - segmentation resolution and aliasing
 *          - assembly (RecordAssembler) and the configured transforms
 *
 *          Failures are collected and the driver moves on to the next
 *          patient. The MatchCriteria dictionary is owned by the caller and
 *          is the only state shared between patients.
 *
 * ## Example
 * @code
 * auto criteria = MatchCriteria::create({{"CT", {"AXIAL CT"}}});
 * ExtractionDriver driver(RecordLocator({root}), *criteria, SegmentAliaser());
 * while (auto item = driver.next()) {
 *     if (*item) { use(item->value()); }
 * }
 * @endcode
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/series_builder.hpp"
#include "services/extraction/match_criteria.hpp"
#include "services/extraction/record_locator.hpp"
#include "services/extraction/record_stream.hpp"
#include "services/extraction/record_transform.hpp"
#include "services/extraction/segment_aliaser.hpp"
#include "services/extraction/segmentation_resolver.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dicom_extractor::services {

/**
 * @brief Chooses a description for a criterion no series satisfied
 *
 * Receives the patient id, the criterion name and the descriptions found in
 * the patient's series. Returning one of those descriptions adds it to the
 * criterion; std::nullopt leaves the dictionary unchanged.
 */
using MissingCriterionHandler = std::function<std::optional<std::string>(
    const std::string& patientId,
    const std::string& criterion,
    const std::vector<std::string>& availableDescriptions)>;

/// Progress callback (patients processed, total, current patient directory)
using ExtractionProgressCallback = std::function<void(
    size_t current, size_t total, const std::string& patient)>;

class ExtractionDriver : public RecordStream {
public:
    /**
     * @param locator Source discovery for the patients root
     * @param criteria Caller-owned dictionary, must outlive the driver
     * @param aliaser Segment label aliasing
     */
    ExtractionDriver(RecordLocator locator,
                     MatchCriteria& criteria,
                     SegmentAliaser aliaser);
    ~ExtractionDriver() override;

    ExtractionDriver(const ExtractionDriver&) = delete;
    ExtractionDriver& operator=(const ExtractionDriver&) = delete;
    ExtractionDriver(ExtractionDriver&&) noexcept;
    ExtractionDriver& operator=(ExtractionDriver&&) noexcept;

    /// Replace the pixel reader (default: ITK ImageSeriesReader)
    void setVolumeReader(std::shared_ptr<core::VolumeReader> reader);

    /// Replace the segmentation strategy registry
    void setResolver(SegmentationResolver resolver);

    /// Append a transform; transforms run in insertion order
    void addTransform(std::shared_ptr<const RecordTransform> transform);

    void setMissingCriterionHandler(MissingCriterionHandler handler);

    /// Save the dictionary here after a patient whose handler changed it
    void setMatchCriteriaOutput(std::filesystem::path path);

    void setProgressCallback(ExtractionProgressCallback callback);

    // RecordStream
    [[nodiscard]] std::optional<RecordResult> next() override;
    void reset() override;
    [[nodiscard]] size_t size() const override;
    [[nodiscard]] const std::vector<core::FailureRecord>& failures() const override;
    [[nodiscard]] const std::vector<core::PatientWhoFailed>& patientsWhoFailed() const override;

    /// Number of items already yielded
    [[nodiscard]] size_t position() const noexcept;

    /// Patients whose item was a failure
    [[nodiscard]] const std::vector<std::string>& failedPatientIds() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_extractor::services
