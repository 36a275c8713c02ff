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
 * @file record_assembler.hpp
 * @brief Joins matched series with resolved segmentations into a record
 * @details The assembler is the last per-patient stage before transforms.
 *          It keeps one series per criterion (the first in UID order),
 *          attaches every segmentation whose referenced UID names a kept
 *          series and merges several segmentations of one series organ-wise
 *          with a logical OR. Segmentations that join nothing are dropped
 *          and reported.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/patient_record.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace dicom_extractor::services {

/// A loaded series together with the criterion it satisfied
struct MatchedSeries {
    std::string criterionName;
    core::ImageSeries series;
};

struct AssemblyResult {
    core::PatientRecord record;

    /// Non-fatal conditions met while assembling
    std::vector<core::FailureRecord> failures;
};

class RecordAssembler {
public:
    RecordAssembler();
    ~RecordAssembler();

    RecordAssembler(const RecordAssembler&) = delete;
    RecordAssembler& operator=(const RecordAssembler&) = delete;
    RecordAssembler(RecordAssembler&&) noexcept;
    RecordAssembler& operator=(RecordAssembler&&) noexcept;

    /**
     * @brief Build the record of one patient
     * @param patientId Shared PatientID of the patient's files
     * @param patientPath Patient directory
     * @param matched Matched series, in any order
     * @param segmentations Aliased segmentations, in source order
     * @param criterionOrder Output order of criteria; criteria not listed
     *        follow in order of first appearance in UID order
     * @return The record, or a NoMatchingImages failure when @p matched
     *         is empty
     */
    [[nodiscard]] std::expected<AssemblyResult, core::FailureRecord>
    assemble(const std::string& patientId,
             const std::filesystem::path& patientPath,
             std::vector<MatchedSeries> matched,
             std::vector<core::Segmentation> segmentations,
             const std::vector<std::string>& criterionOrder = {}) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_extractor::services
