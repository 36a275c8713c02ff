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

/// @file volume_generator.hpp
/// @brief In-memory volumes and masks for unit tests
///
/// Creates deterministic ITK images with the extractor's pixel types on a
/// chosen grid, so tests can build records without touching the disk.

#include "core/dicom_loader.hpp"

#include <array>

#include <itkImage.h>
#include <itkImageRegionIterator.h>

namespace dicom_extractor::test_utils {

using core::LabelVolumeType;
using core::MaskType;
using core::VolumeType;

/// Grid description shared by the generators
struct Grid {
    std::array<size_t, 3> size = {4, 4, 3};
    std::array<double, 3> spacing = {1.0, 1.0, 2.0};
    std::array<double, 3> origin = {0.0, 0.0, 0.0};
};

template <typename TImage>
typename TImage::Pointer createImage(const Grid& grid,
                                     typename TImage::PixelType fill = 0) {
    auto image = TImage::New();

    typename TImage::SizeType size;
    typename TImage::SpacingType spacing;
    typename TImage::PointType origin;
    for (unsigned int d = 0; d < 3; ++d) {
        size[d] = grid.size[d];
        spacing[d] = grid.spacing[d];
        origin[d] = grid.origin[d];
    }

    typename TImage::RegionType region;
    region.SetSize(size);
    image->SetRegions(region);
    image->SetSpacing(spacing);
    image->SetOrigin(origin);
    image->Allocate();
    image->FillBuffer(fill);
    return image;
}

/// Volume whose voxel (x, y, z) holds 100 * z + 10 * y + x
inline VolumeType::Pointer createRampVolume(const Grid& grid = {}) {
    auto image = createImage<VolumeType>(grid);
    itk::ImageRegionIterator<VolumeType> it(image, image->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto idx = it.GetIndex();
        it.Set(static_cast<float>(100 * idx[2] + 10 * idx[1] + idx[0]));
    }
    return image;
}

/// Binary mask with the voxels of an index box (inclusive) set to 1
inline MaskType::Pointer createBoxMask(const Grid& grid,
                                       std::array<long, 3> lower,
                                       std::array<long, 3> upper) {
    auto mask = createImage<MaskType>(grid);
    itk::ImageRegionIterator<MaskType> it(mask, mask->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto idx = it.GetIndex();
        bool inside = true;
        for (unsigned int d = 0; d < 3; ++d) {
            inside = inside && idx[d] >= lower[d] && idx[d] <= upper[d];
        }
        if (inside) {
            it.Set(1);
        }
    }
    return mask;
}

}  // namespace dicom_extractor::test_utils
