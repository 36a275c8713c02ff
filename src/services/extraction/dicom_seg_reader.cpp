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

#include "services/extraction/segmentation_resolver.hpp"

#include "core/dataset_utils.hpp"
#include "core/logging.hpp"
#include "core/mask_operations.hpp"
#include "services/extraction/volume_resampler.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <map>
#include <optional>
#include <vector>

#include <gdcmDataSet.h>
#include <gdcmReader.h>
#include <gdcmTag.h>

namespace dicom_extractor::services {

namespace {

// Reference
const gdcm::Tag kReferencedSeriesSequence{0x0008, 0x1115};
const gdcm::Tag kSeriesInstanceUid{0x0020, 0x000E};

// Segment description
const gdcm::Tag kSegmentSequence{0x0062, 0x0002};
const gdcm::Tag kSegmentNumber{0x0062, 0x0004};
const gdcm::Tag kSegmentLabel{0x0062, 0x0005};
const gdcm::Tag kSegmentDescription{0x0062, 0x0006};

// Functional groups
const gdcm::Tag kSharedFunctionalGroupsSequence{0x5200, 0x9229};
const gdcm::Tag kPerFrameFunctionalGroupsSequence{0x5200, 0x9230};
const gdcm::Tag kSegmentIdentificationSequence{0x0062, 0x000A};
const gdcm::Tag kReferencedSegmentNumber{0x0062, 0x000B};
const gdcm::Tag kPlanePositionSequence{0x0020, 0x9113};
const gdcm::Tag kPlaneOrientationSequence{0x0020, 0x9116};
const gdcm::Tag kPixelMeasuresSequence{0x0028, 0x9110};
const gdcm::Tag kImagePositionPatient{0x0020, 0x0032};
const gdcm::Tag kImageOrientationPatient{0x0020, 0x0037};
const gdcm::Tag kPixelSpacing{0x0028, 0x0030};
const gdcm::Tag kSliceThickness{0x0018, 0x0050};
const gdcm::Tag kSpacingBetweenSlices{0x0018, 0x0088};

// Image pixel module
const gdcm::Tag kRows{0x0028, 0x0010};
const gdcm::Tag kColumns{0x0028, 0x0011};
const gdcm::Tag kBitsAllocated{0x0028, 0x0100};
const gdcm::Tag kPixelData{0x7FE0, 0x0010};

/// In-plane geometry of one frame
struct FrameGeometry {
    std::array<double, 3> position = {0.0, 0.0, 0.0};
    std::array<double, 6> orientation = {1.0, 0.0, 0.0, 0.0, 1.0, 0.0};
    double rowSpacing = 1.0;     ///< Distance between rows (mm)
    double columnSpacing = 1.0;  ///< Distance between columns (mm)
    double sliceSpacing = 0.0;   ///< From PixelMeasures, 0 when absent

    [[nodiscard]] std::array<double, 3> normal() const {
        const auto& o = orientation;
        return {o[1] * o[5] - o[2] * o[4],
                o[2] * o[3] - o[0] * o[5],
                o[0] * o[4] - o[1] * o[3]};
    }

    [[nodiscard]] bool samePlaneAs(const FrameGeometry& other) const {
        constexpr double kTolerance = 1e-4;
        for (size_t i = 0; i < 6; ++i) {
            if (std::abs(orientation[i] - other.orientation[i]) > kTolerance) {
                return false;
            }
        }
        return std::abs(rowSpacing - other.rowSpacing) <= kTolerance
            && std::abs(columnSpacing - other.columnSpacing) <= kTolerance;
    }
};

/// One decodable frame and where it sits along the frame normal
struct FramePlacement {
    size_t frame = 0;
    int segmentNumber = 0;
    double offset = 0.0;
};

/// Apply orientation and pixel spacing from a functional group item
void readPlaneGeometry(const gdcm::DataSet& group, FrameGeometry& geometry) {
    if (auto orient = core::getFirstSequenceItem(group, kPlaneOrientationSequence)) {
        auto values = core::parseDoubleValues(
            core::getStringValue(*orient, kImageOrientationPatient));
        if (values.size() >= 6) {
            for (size_t i = 0; i < 6; ++i) {
                geometry.orientation[i] = values[i];
            }
        }
    }
    if (auto measures = core::getFirstSequenceItem(group, kPixelMeasuresSequence)) {
        auto values = core::parseDoubleValues(
            core::getStringValue(*measures, kPixelSpacing));
        if (values.size() >= 2) {
            geometry.rowSpacing = values[0];
            geometry.columnSpacing = values[1];
        }
        for (const auto& tag : {kSpacingBetweenSlices, kSliceThickness}) {
            auto thickness = core::parseDoubleValues(core::getStringValue(*measures, tag));
            if (!thickness.empty() && thickness.front() > 0.0) {
                geometry.sliceSpacing = thickness.front();
                break;
            }
        }
    }
}

double dot(const std::vector<double>& position, const std::array<double, 3>& axis) {
    return position[0] * axis[0] + position[1] * axis[1] + position[2] * axis[2];
}

/**
 * @brief Empty mask on the grid spanned by the SEG frames
 *
 * Index axes are (column, row, frame plane); the frame planes are
 * @p sliceSpacing apart along the frame normal starting at @p origin.
 */
core::MaskType::Pointer createFrameGrid(const FrameGeometry& geometry,
                                        const std::vector<double>& origin,
                                        double sliceSpacing,
                                        uint16_t rows, uint16_t columns, size_t planes) {
    auto mask = core::MaskType::New();

    core::MaskType::SizeType size;
    size[0] = columns;
    size[1] = rows;
    size[2] = planes;
    core::MaskType::RegionType region;
    region.SetSize(size);
    mask->SetRegions(region);

    core::MaskType::SpacingType spacing;
    spacing[0] = geometry.columnSpacing;
    spacing[1] = geometry.rowSpacing;
    spacing[2] = sliceSpacing;
    mask->SetSpacing(spacing);

    core::MaskType::PointType point;
    core::MaskType::DirectionType direction;
    const auto normal = geometry.normal();
    for (unsigned int d = 0; d < 3; ++d) {
        point[d] = origin[d];
        direction[d][0] = geometry.orientation[d];
        direction[d][1] = geometry.orientation[3 + d];
        direction[d][2] = normal[d];
    }
    mask->SetOrigin(point);
    mask->SetDirection(direction);

    mask->Allocate();
    mask->FillBuffer(0);
    return mask;
}

std::string segmentLabel(const gdcm::DataSet& item, int number) {
    auto label = core::getStringValue(item, kSegmentLabel);
    if (label.empty()) {
        label = core::getStringValue(item, kSegmentDescription);
    }
    if (label.empty()) {
        label = std::format("Segment_{}", number);
    }
    return label;
}

}  // anonymous namespace

std::expected<ResolvedSegmentation, ResolveError>
resolveStructuredLabel(const SegmentationSource& source, const ResolveContext& context) {
    auto logger = logging::LoggerFactory::create("SegmentationResolver");
    const auto fileName = source.path.filename().string();

    gdcm::Reader reader;
    reader.SetFileName(source.path.string().c_str());
    try {
        if (!reader.Read()) {
            return std::unexpected(ResolveError{
                ResolveError::Code::ReadFailed,
                "GDCM could not read " + fileName
            });
        }
    } catch (const std::exception& e) {
        return std::unexpected(ResolveError{
            ResolveError::Code::ReadFailed,
            fileName + ": " + e.what()
        });
    }
    const auto& ds = reader.GetFile().GetDataSet();

    ResolvedSegmentation result;
    if (auto ref = core::getFirstSequenceItem(ds, kReferencedSeriesSequence)) {
        result.referencedSeriesUid = core::getStringValue(*ref, kSeriesInstanceUid);
    }
    if (result.referencedSeriesUid.empty()) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has no ReferencedSeriesSequence"
        });
    }

    auto refIt = context.referenceVolumes.find(result.referencedSeriesUid);
    if (refIt == context.referenceVolumes.end() || !refIt->second) {
        return std::unexpected(ResolveError{
            ResolveError::Code::UnresolvedReference,
            fileName + " references series " + result.referencedSeriesUid
                + " which is not loaded"
        });
    }
    const core::VolumeType* reference = refIt->second.GetPointer();

    auto rows = core::getUInt16Value(ds, kRows);
    auto columns = core::getUInt16Value(ds, kColumns);
    auto bitsAllocated = core::getUInt16Value(ds, kBitsAllocated);
    if (!rows || !columns || *rows == 0 || *columns == 0) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has no Rows/Columns"
        });
    }
    const int bits = bitsAllocated.value_or(1);
    if (bits != 1 && bits != 8) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            std::format("{}: unsupported BitsAllocated {}", fileName, bits)
        });
    }

    // Segment number -> label, in segment number order
    std::map<int, std::string> labels;
    for (const auto& item : core::getSequenceItems(ds, kSegmentSequence)) {
        auto number = core::getUInt16Value(item, kSegmentNumber);
        if (!number) {
            logger->warn("{}: segment item without SegmentNumber skipped", fileName);
            continue;
        }
        labels.emplace(*number, segmentLabel(item, *number));
    }
    if (labels.empty()) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has an empty SegmentSequence"
        });
    }

    FrameGeometry shared;
    if (auto sharedGroup = core::getFirstSequenceItem(ds, kSharedFunctionalGroupsSequence)) {
        readPlaneGeometry(*sharedGroup, shared);
    }

    auto frames = core::getSequenceItems(ds, kPerFrameFunctionalGroupsSequence);
    if (frames.empty()) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has no PerFrameFunctionalGroupsSequence"
        });
    }

    if (!ds.FindDataElement(kPixelData)) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has no PixelData"
        });
    }
    const auto* pixelValue = ds.GetDataElement(kPixelData).GetByteValue();
    if (pixelValue == nullptr) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + ": encapsulated PixelData is not supported"
        });
    }
    const auto* pixels = reinterpret_cast<const unsigned char*>(pixelValue->GetPointer());
    const size_t pixelBytes = pixelValue->GetLength();

    const size_t framePixels = static_cast<size_t>(*rows) * *columns;
    const size_t requiredBits = framePixels * frames.size() * static_cast<size_t>(bits);
    if (pixelBytes * 8 < requiredBits) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            std::format("{}: PixelData holds {} bytes, {} frames need {} bits",
                        fileName, pixelBytes, frames.size(), requiredBits)
        });
    }

    // Frame placement; the first usable frame fixes the in-plane geometry
    std::optional<FrameGeometry> grid;
    std::vector<double> origin;
    std::vector<FramePlacement> placements;
    for (size_t f = 0; f < frames.size(); ++f) {
        const auto& frame = frames[f];

        auto ident = core::getFirstSequenceItem(frame, kSegmentIdentificationSequence);
        auto number = ident ? core::getUInt16Value(*ident, kReferencedSegmentNumber)
                            : std::nullopt;
        if (!number || !labels.contains(*number)) {
            logger->warn("{}: frame {} references no known segment", fileName, f);
            continue;
        }

        FrameGeometry geometry = shared;
        readPlaneGeometry(frame, geometry);
        auto position = core::getFirstSequenceItem(frame, kPlanePositionSequence);
        auto ipp = position
            ? core::parseDoubleValues(core::getStringValue(*position, kImagePositionPatient))
            : std::vector<double>{};
        if (ipp.size() < 3) {
            logger->warn("{}: frame {} has no ImagePositionPatient", fileName, f);
            continue;
        }

        if (!grid) {
            grid = geometry;
            origin = ipp;
        } else if (!geometry.samePlaneAs(*grid)) {
            logger->warn("{}: frame {} differs in orientation or pixel spacing, skipped",
                         fileName, f);
            continue;
        }
        placements.push_back(FramePlacement{f, *number, dot(ipp, grid->normal())});
    }

    if (!grid) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has no frame with a known segment and position"
        });
    }

    // Distinct frame planes along the normal
    constexpr double kPlaneTolerance = 1e-3;
    std::vector<double> planes;
    for (const auto& placement : placements) {
        planes.push_back(placement.offset);
    }
    std::sort(planes.begin(), planes.end());
    planes.erase(std::unique(planes.begin(), planes.end(),
                             [](double a, double b) { return std::abs(a - b) < kPlaneTolerance; }),
                 planes.end());

    double sliceSpacing = 0.0;
    for (size_t i = 1; i < planes.size(); ++i) {
        double gap = planes[i] - planes[i - 1];
        if (sliceSpacing == 0.0 || gap < sliceSpacing) {
            sliceSpacing = gap;
        }
    }
    if (sliceSpacing == 0.0) {
        sliceSpacing = grid->sliceSpacing > 0.0 ? grid->sliceSpacing
                                                : reference->GetSpacing()[2];
    }

    // Shift the origin onto the lowest plane
    const auto normal = grid->normal();
    const double originOffset = dot(origin, normal);
    for (unsigned int d = 0; d < 3; ++d) {
        origin[d] += (planes.front() - originOffset) * normal[d];
    }
    const auto planeCount = static_cast<size_t>(
        std::lround((planes.back() - planes.front()) / sliceSpacing)) + 1;

    std::map<int, core::MaskType::Pointer> segmentMasks;
    for (const auto& [number, label] : labels) {
        segmentMasks[number] = createFrameGrid(*grid, origin, sliceSpacing,
                                               *rows, *columns, planeCount);
    }

    for (const auto& placement : placements) {
        auto& mask = segmentMasks.at(placement.segmentNumber);
        const long plane = std::lround((placement.offset - planes.front()) / sliceSpacing);

        for (int r = 0; r < *rows; ++r) {
            for (int c = 0; c < *columns; ++c) {
                size_t index = placement.frame * framePixels
                    + static_cast<size_t>(r) * *columns + c;
                bool set = bits == 1
                    ? ((pixels[index / 8] >> (index % 8)) & 0x01) != 0
                    : pixels[index] != 0;
                if (set) {
                    core::MaskType::IndexType voxel = {{c, r, plane}};
                    mask->SetPixel(voxel, 1);
                }
            }
        }
    }

    for (auto& [number, mask] : segmentMasks) {
        if (!VolumeResampler::sameGrid(mask, reference)) {
            auto resampled = VolumeResampler::resampleMaskOnto(mask, reference);
            if (!resampled) {
                return std::unexpected(ResolveError{
                    ResolveError::Code::ReadFailed,
                    fileName + ": " + resampled.error().toString()
                });
            }
            mask = *resampled;
        }
        // Snap to the reference geometry within sameGrid() tolerance
        mask->CopyInformation(reference);

        if (core::MaskOperations::countForeground(mask) == 0) {
            logger->warn("{}: segment {} has no voxel inside series {}",
                         fileName, number, result.referencedSeriesUid);
        }
        result.segments.push_back(core::Segment{labels.at(number), mask});
    }
    return result;
}

}  // namespace dicom_extractor::services
