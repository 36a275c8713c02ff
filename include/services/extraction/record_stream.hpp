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

#include "core/patient_record.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

namespace dicom_extractor::services {

/// One pulled item: a record or the failure that replaced it
using RecordResult = std::expected<core::PatientRecord, core::FailureRecord>;

/**
 * @brief Lazy, restartable sequence of patient records
 *
 * Nothing is computed until next() is called. A failed item does not end
 * the sequence; only std::nullopt does.
 */
class RecordStream {
public:
    virtual ~RecordStream() = default;

    /// Next record or failure, std::nullopt when exhausted
    [[nodiscard]] virtual std::optional<RecordResult> next() = 0;

    /// Restart from the first patient and clear accumulated failures
    virtual void reset() = 0;

    /// Number of items the sequence yields
    [[nodiscard]] virtual size_t size() const = 0;

    /// Every failure recorded so far, non-fatal ones included
    [[nodiscard]] virtual const std::vector<core::FailureRecord>& failures() const = 0;

    /// Patients missing one or more configured criteria
    [[nodiscard]] virtual const std::vector<core::PatientWhoFailed>& patientsWhoFailed() const = 0;
};

}  // namespace dicom_extractor::services
