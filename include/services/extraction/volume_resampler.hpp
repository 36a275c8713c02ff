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
 * @file volume_resampler.hpp
 * @brief ITK-based resampling of volumes, masks and label volumes
 * @details Wraps itk::ResampleImageFilter for the two situations the
 *          extraction pipeline needs:
 *          - moving a label volume onto the grid of its reference series
 *            (nearest neighbour, so label values survive)
 *          - changing the voxel spacing of an assembled record
 *            (images interpolated, masks nearest neighbour)
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/dicom_loader.hpp"

#include <array>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <itkImageBase.h>

namespace dicom_extractor::services {

/**
 * @brief Error information for resampling operations
 */
struct ResampleError {
    enum class Code {
        Success,
        InvalidInput,
        InvalidParameters,
        ProcessingFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::InvalidParameters: return "Invalid parameters: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
        }
        return "Unknown error";
    }
};

class VolumeResampler {
public:
    using ImageType = core::VolumeType;
    using MaskType = core::MaskType;
    using LabelVolumeType = core::LabelVolumeType;

    /**
     * @brief Interpolation method for resampling
     */
    enum class Interpolation {
        NearestNeighbor,  ///< For label maps and binary masks
        Linear,           ///< General purpose (default)
        BSpline           ///< Cubic B-spline, smooth, slower
    };

    /**
     * @brief Parameters for spacing changes
     */
    struct Parameters {
        /// Target spacing in mm per axis (x, y, z)
        std::array<double, 3> targetSpacing = {1.0, 1.0, 1.0};

        Interpolation interpolation = Interpolation::Linear;

        [[nodiscard]] bool isValid() const noexcept {
            for (double s : targetSpacing) {
                if (!(s > 0.0)) {
                    return false;
                }
            }
            return true;
        }
    };

    /**
     * @brief Resample an image to a new spacing, keeping origin and direction
     */
    [[nodiscard]] static std::expected<ImageType::Pointer, ResampleError>
    resample(ImageType::Pointer input, const Parameters& params);

    /**
     * @brief Resample a binary mask to a new spacing (nearest neighbour)
     */
    [[nodiscard]] static std::expected<MaskType::Pointer, ResampleError>
    resampleMask(MaskType::Pointer input, const std::array<double, 3>& targetSpacing);

    /**
     * @brief Resample a label volume onto the grid of @p reference
     *
     * Output has the reference's size, origin, spacing and direction.
     * Voxels outside the label volume become background (0).
     */
    [[nodiscard]] static std::expected<LabelVolumeType::Pointer, ResampleError>
    resampleLabelsOnto(LabelVolumeType::Pointer labels, const ImageType* reference);

    /// Binary mask counterpart of resampleLabelsOnto()
    [[nodiscard]] static std::expected<MaskType::Pointer, ResampleError>
    resampleMaskOnto(MaskType::Pointer mask, const ImageType* reference);

    /**
     * @brief Check whether two images share size, origin, spacing and direction
     */
    [[nodiscard]] static bool sameGrid(const itk::ImageBase<3>* a,
                                       const itk::ImageBase<3>* b);

    [[nodiscard]] static std::string interpolationToString(Interpolation interp);

    [[nodiscard]] static std::optional<Interpolation>
    interpolationFromString(std::string_view name);
};

}  // namespace dicom_extractor::services
