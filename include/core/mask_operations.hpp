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

#include "dicom_loader.hpp"

#include <expected>
#include <string>

namespace dicom_extractor::core {

/**
 * @brief Error information for mask operations
 */
struct MaskError {
    enum class Code {
        InvalidInput,
        DimensionMismatch
    };

    Code code = Code::InvalidInput;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::DimensionMismatch: return "Dimension mismatch: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Voxel-wise operations on binary organ masks
 *
 * All operations produce a NEW mask and leave their inputs untouched.
 * Binary masks hold 0 (background) and 1 (foreground).
 */
class MaskOperations {
public:
    /**
     * @brief Logical OR of two masks (A ∪ B)
     * @return New 0/1 mask with A's geometry
     */
    [[nodiscard]] static std::expected<MaskType::Pointer, MaskError>
    computeUnion(MaskType::Pointer maskA, MaskType::Pointer maskB);

    /**
     * @brief Require identical size and spacing
     */
    [[nodiscard]] static std::expected<void, MaskError>
    validateCompatibility(MaskType::Pointer maskA, MaskType::Pointer maskB);

    /// Empty mask on the grid of @p reference
    template <typename TImage>
    [[nodiscard]] static MaskType::Pointer createEmptyLike(const TImage* reference)
    {
        auto output = MaskType::New();
        MaskType::RegionType region;
        region.SetSize(reference->GetLargestPossibleRegion().GetSize());
        output->SetRegions(region);
        output->SetSpacing(reference->GetSpacing());
        output->SetOrigin(reference->GetOrigin());
        output->SetDirection(reference->GetDirection());
        output->Allocate(true);
        return output;
    }

    /// Copy of @p mask with every non-zero voxel set to 1
    [[nodiscard]] static MaskType::Pointer binarize(MaskType::Pointer mask);

    /// Number of non-zero voxels
    [[nodiscard]] static size_t countForeground(MaskType::Pointer mask);
};

} // namespace dicom_extractor::core
