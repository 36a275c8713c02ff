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
 * @file match_criteria.hpp
 * @brief Description matching dictionary for series selection
 * @details MatchCriteria maps logical criterion names (e.g. "CT") to ordered
 *          sets of accepted series descriptions. Matching is exact string
 *          membership with no case folding or other normalization. With no
 *          criteria configured every series is accepted under its own
 *          description.
 *
 *          The dictionary may grow during a run, but only through
 *          addAcceptedDescription(), which returns the updated set and
 *          notifies the registered observer. Callers running patients in
 *          parallel should copy the dictionary per worker and merge the
 *          additions afterwards.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/dicom_loader.hpp"
#include "core/patient_record.hpp"

#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dicom_extractor::services {

/**
 * @brief Error information for match dictionary operations
 */
struct MatchError {
    enum class Code {
        Success,
        OverlappingCriteria,
        UnknownCriterion,
        FileOpenFailed,
        FileWriteFailed,
        InvalidFormat
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::OverlappingCriteria: return "Overlapping criteria: " + message;
            case Code::UnknownCriterion: return "Unknown criterion: " + message;
            case Code::FileOpenFailed: return "File open failed: " + message;
            case Code::FileWriteFailed: return "File write failed: " + message;
            case Code::InvalidFormat: return "Invalid format: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Mutable, caller-owned dictionary of accepted series descriptions
 */
class MatchCriteria {
public:
    /// Criterion name -> accepted descriptions, in configuration order
    using CriteriaList = std::vector<std::pair<std::string, std::vector<std::string>>>;

    /// Called after a description was appended to a criterion
    using ChangeObserver = std::function<void(const std::string& criterion,
                                              const std::string& description)>;

    /// Identity dictionary: every series matches under its own description
    MatchCriteria();

    /**
     * @brief Build a dictionary from configured criteria
     * @param criteria Criterion name -> accepted descriptions
     * @param tagKey Metadata field compared against the descriptions
     * @return Dictionary, or OverlappingCriteria when one description is
     *         accepted by two criteria
     */
    [[nodiscard]] static std::expected<MatchCriteria, MatchError>
    create(CriteriaList criteria,
           std::string tagKey = core::dicom_tags::SeriesDescription);

    /**
     * @brief Load a JSON object of name -> array of descriptions
     */
    [[nodiscard]] static std::expected<MatchCriteria, MatchError>
    loadFromFile(const std::filesystem::path& path,
                 std::string tagKey = core::dicom_tags::SeriesDescription);

    /**
     * @brief Persist the dictionary, including descriptions added this run
     */
    [[nodiscard]] std::expected<void, MatchError>
    saveToFile(const std::filesystem::path& path) const;

    /// True when no criteria are configured
    [[nodiscard]] bool isIdentity() const noexcept { return criteria_.empty(); }

    [[nodiscard]] const std::string& tagKey() const noexcept { return tagKey_; }

    [[nodiscard]] const CriteriaList& criteria() const noexcept { return criteria_; }

    [[nodiscard]] std::vector<std::string> criterionNames() const;

    /// Accepted set of a criterion, nullptr when the name is unknown
    [[nodiscard]] const std::vector<std::string>*
    acceptedDescriptions(const std::string& criterion) const;

    /**
     * @brief Match a description against the dictionary
     * @return Criterion name, or std::nullopt on a miss. In identity mode
     *         the description itself is returned.
     */
    [[nodiscard]] std::optional<std::string> match(const std::string& description) const;

    /**
     * @brief Match a series using the configured tag
     *
     * In identity mode a series with an empty description is keyed by its
     * series UID so that every accepted series gets a usable name.
     */
    [[nodiscard]] std::optional<std::string> matchSeries(const core::ImageSeries& series) const;

    /// Value of the configured tag for a series
    [[nodiscard]] std::string descriptionOf(const core::ImageSeries& series) const;

    /**
     * @brief Append a description to a criterion's accepted set
     *
     * Adding a description the criterion already accepts is a no-op and
     * does not notify the observer.
     *
     * @return The updated accepted set, UnknownCriterion for an unknown
     *         name, OverlappingCriteria when another criterion accepts it
     */
    [[nodiscard]] std::expected<std::vector<std::string>, MatchError>
    addAcceptedDescription(const std::string& criterion, const std::string& description);

    void setChangeObserver(ChangeObserver observer);

private:
    CriteriaList criteria_;
    std::string tagKey_ = core::dicom_tags::SeriesDescription;
    ChangeObserver observer_;
};

}  // namespace dicom_extractor::services
