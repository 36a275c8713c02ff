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
 * @file record_transform.hpp
 * @brief Caller-supplied transforms applied to assembled records
 * @details Transforms see a record as plain named arrays: images keyed by
 *          criterion and masks keyed by criterion and organ. They run in
 *          order after assembly and before the record is yielded. A
 *          transform reports failure by throwing; the driver turns that into
 *          a TransformFailed record for the patient.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/patient_record.hpp"
#include "services/extraction/volume_resampler.hpp"

#include <array>
#include <map>
#include <string>
#include <vector>

namespace dicom_extractor::services {

struct TransformData {
    /// criterion -> image
    std::map<std::string, core::VolumeType::Pointer> images;

    /// criterion -> organ -> mask
    std::map<std::string, std::map<std::string, core::MaskType::Pointer>> masks;

    [[nodiscard]] static TransformData fromRecord(const core::PatientRecord& record);

    /// Write images and masks back into the entries of @p record
    void applyTo(core::PatientRecord& record) const;
};

class RecordTransform {
public:
    virtual ~RecordTransform() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Transform the arrays of one record
     * @throws std::exception or itk::ExceptionObject on failure
     */
    [[nodiscard]] virtual TransformData apply(TransformData data) const = 0;
};

/**
 * @brief Resample images and masks to a spacing
 *
 * Images use the configured interpolation (linear unless set); masks are
 * always resampled nearest neighbour so they stay binary.
 */
class ResampleTransform : public RecordTransform {
public:
    /**
     * @param targetSpacing Output spacing in mm (x, y, z)
     * @param criteria Criteria to resample; empty means all. Names not
     *        present in a record are ignored.
     * @param interpolation Image interpolation
     */
    explicit ResampleTransform(
        std::array<double, 3> targetSpacing,
        std::vector<std::string> criteria = {},
        VolumeResampler::Interpolation interpolation = VolumeResampler::Interpolation::Linear);

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] TransformData apply(TransformData data) const override;

private:
    [[nodiscard]] bool selects(const std::string& criterion) const;

    std::array<double, 3> targetSpacing_;
    std::vector<std::string> criteria_;
    VolumeResampler::Interpolation interpolation_;
};

}  // namespace dicom_extractor::services
