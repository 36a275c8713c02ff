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

#include "core/mask_operations.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace dicom_extractor::core {

std::expected<void, MaskError>
MaskOperations::validateCompatibility(MaskType::Pointer maskA, MaskType::Pointer maskB)
{
    if (!maskA || !maskB) {
        return std::unexpected(MaskError{
            MaskError::Code::InvalidInput,
            "Null mask pointer"});
    }

    auto sizeA = maskA->GetLargestPossibleRegion().GetSize();
    auto sizeB = maskB->GetLargestPossibleRegion().GetSize();

    if (sizeA != sizeB) {
        std::ostringstream oss;
        oss << "A=" << sizeA[0] << "x" << sizeA[1] << "x" << sizeA[2]
            << " vs B=" << sizeB[0] << "x" << sizeB[1] << "x" << sizeB[2];
        return std::unexpected(MaskError{
            MaskError::Code::DimensionMismatch,
            oss.str()});
    }

    auto spacingA = maskA->GetSpacing();
    auto spacingB = maskB->GetSpacing();
    constexpr double kTolerance = 1e-6;
    for (unsigned int d = 0; d < 3; ++d) {
        if (std::abs(spacingA[d] - spacingB[d]) > kTolerance) {
            return std::unexpected(MaskError{
                MaskError::Code::DimensionMismatch,
                "Spacing mismatch between masks"});
        }
    }

    return {};
}

std::expected<MaskType::Pointer, MaskError>
MaskOperations::computeUnion(MaskType::Pointer maskA, MaskType::Pointer maskB)
{
    auto validation = validateCompatibility(maskA, maskB);
    if (!validation) {
        return std::unexpected(validation.error());
    }

    auto output = createEmptyLike(maskA.GetPointer());
    const auto* bufA = maskA->GetBufferPointer();
    const auto* bufB = maskB->GetBufferPointer();
    auto* bufOut = output->GetBufferPointer();

    const size_t totalVoxels = maskA->GetLargestPossibleRegion().GetNumberOfPixels();
    for (size_t i = 0; i < totalVoxels; ++i) {
        bufOut[i] = (bufA[i] != 0 || bufB[i] != 0) ? 1 : 0;
    }

    return output;
}

MaskType::Pointer MaskOperations::binarize(MaskType::Pointer mask)
{
    if (!mask) {
        return nullptr;
    }
    auto output = createEmptyLike(mask.GetPointer());
    const auto* in = mask->GetBufferPointer();
    auto* out = output->GetBufferPointer();
    const size_t totalVoxels = mask->GetLargestPossibleRegion().GetNumberOfPixels();
    for (size_t i = 0; i < totalVoxels; ++i) {
        out[i] = in[i] != 0 ? 1 : 0;
    }
    return output;
}

size_t MaskOperations::countForeground(MaskType::Pointer mask)
{
    if (!mask) {
        return 0;
    }
    const auto* buffer = mask->GetBufferPointer();
    const size_t totalVoxels = mask->GetLargestPossibleRegion().GetNumberOfPixels();
    return static_cast<size_t>(std::count_if(buffer, buffer + totalVoxels,
                                             [](uint8_t v) { return v != 0; }));
}

} // namespace dicom_extractor::core
