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
 * @file segment_aliaser.hpp
 * @brief Raw segment label to canonical organ name mapping
 * @details Segmentation sources name their segments inconsistently
 *          ("Segment_1", "Prostate", "prostate_gland", ...). SegmentAliaser
 *          maps each raw label to a canonical organ through an alias table
 *          (organ -> accepted raw labels). Unmapped segments are dropped with
 *          a warning; segments sharing an organ are merged voxel-wise (OR).
 *          An empty table passes every raw label through unchanged.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/patient_record.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dicom_extractor::services {

/**
 * @brief Error information for alias table operations
 */
struct AliasError {
    enum class Code {
        Success,
        OverlappingAliases,
        IncompatibleMasks,
        FileOpenFailed,
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
            case Code::OverlappingAliases: return "Overlapping aliases: " + message;
            case Code::IncompatibleMasks: return "Incompatible masks: " + message;
            case Code::FileOpenFailed: return "File open failed: " + message;
            case Code::InvalidFormat: return "Invalid format: " + message;
        }
        return "Unknown error";
    }
};

/// Canonical organ names with their default raw-label aliases
namespace organs {
inline constexpr const char* Prostate = "Prostate";
inline constexpr const char* Rectum = "Rectum";
inline constexpr const char* Bladder = "Bladder";
}  // namespace organs

class SegmentAliaser {
public:
    /// Canonical organ -> accepted raw labels, in configuration order
    using AliasTable = std::vector<std::pair<std::string, std::vector<std::string>>>;

    /// Identity aliaser: raw labels are kept as organ names
    SegmentAliaser();
    ~SegmentAliaser();

    SegmentAliaser(const SegmentAliaser&) = delete;
    SegmentAliaser& operator=(const SegmentAliaser&) = delete;
    SegmentAliaser(SegmentAliaser&&) noexcept;
    SegmentAliaser& operator=(SegmentAliaser&&) noexcept;

    /**
     * @brief Build an aliaser from a table
     * @return OverlappingAliases when a raw label is listed for two organs
     */
    [[nodiscard]] static std::expected<SegmentAliaser, AliasError>
    create(const AliasTable& table);

    /// Load a JSON object of organ -> array of raw labels
    [[nodiscard]] static std::expected<SegmentAliaser, AliasError>
    loadFromFile(const std::filesystem::path& path);

    /// Prostate, Rectum and Bladder with their "Segment_<n>" aliases
    [[nodiscard]] static AliasTable defaultTable();

    [[nodiscard]] bool isIdentity() const noexcept;

    /**
     * @brief Canonical organ of a raw label
     * @return Organ name, or std::nullopt when the label is unmapped
     */
    [[nodiscard]] std::optional<std::string> canonicalName(const std::string& rawLabel) const;

    /**
     * @brief Alias and merge the segments of one segmentation
     * @param segments Raw segments, all congruent with one reference grid
     * @return Organ -> mask; masks sharing an organ are OR-merged into a
     *         fresh image so the inputs are left untouched
     */
    [[nodiscard]] std::expected<std::map<std::string, core::MaskType::Pointer>, AliasError>
    apply(const std::vector<core::Segment>& segments) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_extractor::services
