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
 * @file extraction_config.hpp
 * @brief JSON run configuration of an extraction
 * @details Example:
 *
 * @code{.json}
 * {
 *   "patientsRoot": "data/patients",
 *   "destination": "out/patients.h5",
 *   "overwrite": false,
 *   "segmentationsDirectory": "data/segmentations",
 *   "patientPrefix": "Patient",
 *   "matchTag": "0008|103e",
 *   "matchCriteria": { "T2": ["t2_tse_tra"], "ADC": ["ep2d_diff_ADC"] },
 *   "matchCriteriaOutput": "out/criteria.json",
 *   "organAliases": "organs.json",
 *   "attributes": ["0008|103e", "0018|0050"],
 *   "organsToKeep": ["Prostate"],
 *   "transpose": true,
 *   "storeDicomHeader": true,
 *   "interactive": false,
 *   "resampleSpacing": [1.0, 1.0, 3.0],
 *   "resampleInterpolation": "linear",
 *   "logging": { "level": "info", "file": true, "directory": "logs" }
 * }
 * @endcode
 *
 * matchCriteria and organAliases take either an inline object or the path
 * of a JSON file holding one. Relative paths are resolved against the
 * directory of the configuration file.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/logging.hpp"
#include "services/extraction/match_criteria.hpp"
#include "services/extraction/segment_aliaser.hpp"
#include "services/extraction/volume_resampler.hpp"

#include <array>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dicom_extractor::services {

/**
 * @brief Error information for configuration loading
 */
struct ConfigError {
    enum class Code {
        Success,
        FileOpenFailed,
        ParseError,
        MissingField,
        InvalidValue
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileOpenFailed: return "File open failed: " + message;
            case Code::ParseError: return "Parse error: " + message;
            case Code::MissingField: return "Missing field: " + message;
            case Code::InvalidValue: return "Invalid value: " + message;
        }
        return "Unknown error";
    }
};

struct ExtractionConfig {
    std::filesystem::path patientsRoot;
    std::filesystem::path destination;
    bool overwrite = false;

    std::filesystem::path segmentationsDirectory;
    std::string patientPrefix;

    /// Metadata field compared against the accepted descriptions
    std::string matchTag = core::dicom_tags::SeriesDescription;

    /// Empty means identity matching
    MatchCriteria::CriteriaList matchCriteria;
    std::filesystem::path matchCriteriaOutput;

    /// Built-in Prostate/Rectum/Bladder table unless configured
    SegmentAliaser::AliasTable organAliases = SegmentAliaser::defaultTable();

    std::vector<std::string> attributes;
    std::vector<std::string> organsToKeep;
    bool transpose = true;
    bool storeDicomHeader = true;
    bool interactive = false;

    std::optional<std::array<double, 3>> resampleSpacing;

    /// Criteria the resampling applies to (empty = all)
    std::vector<std::string> resampleCriteria;

    /// "nearest", "linear" or "bspline"; applies to images only
    VolumeResampler::Interpolation resampleInterpolation = VolumeResampler::Interpolation::Linear;

    logging::LogConfig logging;

    /**
     * @brief Load and validate a configuration file
     * @return Config, or ConfigError on unreadable or invalid JSON, a missing
     *         required field or a malformed value
     */
    [[nodiscard]] static std::expected<ExtractionConfig, ConfigError>
    loadFromFile(const std::filesystem::path& path);

    /**
     * @brief Parse a configuration document
     * @param json Document text
     * @param baseDirectory Directory relative paths are resolved against
     */
    [[nodiscard]] static std::expected<ExtractionConfig, ConfigError>
    parse(std::string_view json, const std::filesystem::path& baseDirectory);
};

}  // namespace dicom_extractor::services
