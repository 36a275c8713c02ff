#include "services/extraction/segmentation_resolver.hpp"

#include "core/dataset_utils.hpp"
#include "core/logging.hpp"
#include "core/mask_operations.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <map>
#include <utility>

#include <gdcmDataSet.h>
#include <gdcmReader.h>
#include <gdcmTag.h>

#include <itkContinuousIndex.h>

namespace dicom_extractor::services {

namespace {

// Reference chain
const gdcm::Tag kReferencedFrameOfReferenceSequence{0x3006, 0x0010};
const gdcm::Tag kRTReferencedStudySequence{0x3006, 0x0012};
const gdcm::Tag kRTReferencedSeriesSequence{0x3006, 0x0014};
const gdcm::Tag kSeriesInstanceUid{0x0020, 0x000E};

// Structure set
const gdcm::Tag kStructureSetROISequence{0x3006, 0x0020};
const gdcm::Tag kROINumber{0x3006, 0x0022};
const gdcm::Tag kROIName{0x3006, 0x0026};

// ROI contour
const gdcm::Tag kROIContourSequence{0x3006, 0x0039};
const gdcm::Tag kReferencedROINumber{0x3006, 0x0084};
const gdcm::Tag kContourSequence{0x3006, 0x0040};
const gdcm::Tag kContourGeometricType{0x3006, 0x0042};
const gdcm::Tag kContourData{0x3006, 0x0050};

/// Polygon vertex in continuous index space (x, y)
using Vertex = std::pair<double, double>;
using Polygon = std::vector<Vertex>;

std::string findReferencedSeries(const gdcm::DataSet& ds) {
    for (const auto& frameRef : core::getSequenceItems(ds, kReferencedFrameOfReferenceSequence)) {
        for (const auto& study : core::getSequenceItems(frameRef, kRTReferencedStudySequence)) {
            for (const auto& series : core::getSequenceItems(study, kRTReferencedSeriesSequence)) {
                auto uid = core::getStringValue(series, kSeriesInstanceUid);
                if (!uid.empty()) {
                    return uid;
                }
            }
        }
    }
    return "";
}

/**
 * @brief Even-odd scanline fill of all polygons of one slice
 *
 * Crossings of every polygon are collected together, so a voxel inside an
 * even number of polygons stays empty. Voxel centres sit on integer indices.
 */
void fillSlice(core::MaskType* mask, long z, const std::vector<Polygon>& polygons) {
    const auto size = mask->GetLargestPossibleRegion().GetSize();
    std::vector<double> crossings;

    for (long y = 0; y < static_cast<long>(size[1]); ++y) {
        const double yc = static_cast<double>(y);
        crossings.clear();

        for (const auto& polygon : polygons) {
            const size_t n = polygon.size();
            for (size_t i = 0; i < n; ++i) {
                const auto& [x0, y0] = polygon[i];
                const auto& [x1, y1] = polygon[(i + 1) % n];
                if ((y0 <= yc && yc < y1) || (y1 <= yc && yc < y0)) {
                    crossings.push_back(x0 + (yc - y0) * (x1 - x0) / (y1 - y0));
                }
            }
        }
        std::sort(crossings.begin(), crossings.end());

        for (size_t k = 0; k + 1 < crossings.size(); k += 2) {
            long xBegin = std::max(0L, static_cast<long>(std::ceil(crossings[k])));
            long xEnd = std::min(static_cast<long>(size[0]) - 1,
                                 static_cast<long>(std::floor(crossings[k + 1])));
            for (long x = xBegin; x <= xEnd; ++x) {
                core::MaskType::IndexType voxel = {{x, y, z}};
                mask->SetPixel(voxel, 1);
            }
        }
    }
}

}  // anonymous namespace

std::expected<ResolvedSegmentation, ResolveError>
resolveRegionContour(const SegmentationSource& source, const ResolveContext& context) {
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
    result.referencedSeriesUid = findReferencedSeries(ds);
    if (result.referencedSeriesUid.empty()) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has no RTReferencedSeriesSequence"
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
    const auto referenceSize = reference->GetLargestPossibleRegion().GetSize();

    // ROI number -> name, in ROI number order
    std::map<int, std::string> roiNames;
    for (const auto& item : core::getSequenceItems(ds, kStructureSetROISequence)) {
        auto number = core::parseIntValue(core::getStringValue(item, kROINumber));
        if (!number) {
            logger->warn("{}: StructureSetROI item without ROINumber skipped", fileName);
            continue;
        }
        auto name = core::getStringValue(item, kROIName);
        roiNames[*number] = name.empty() ? std::format("ROI_{}", *number) : name;
    }
    if (roiNames.empty()) {
        return std::unexpected(ResolveError{
            ResolveError::Code::InvalidContent,
            fileName + " has an empty StructureSetROISequence"
        });
    }

    std::map<int, core::MaskType::Pointer> masks;
    for (const auto& [number, name] : roiNames) {
        masks[number] = core::MaskOperations::createEmptyLike(reference);
    }

    size_t clippedVertices = 0;
    for (const auto& roiContour : core::getSequenceItems(ds, kROIContourSequence)) {
        auto number = core::parseIntValue(core::getStringValue(roiContour, kReferencedROINumber));
        if (!number || !masks.contains(*number)) {
            logger->warn("{}: ROIContour references unknown ROI", fileName);
            continue;
        }

        // Slice index -> polygons on that slice
        std::map<long, std::vector<Polygon>> slices;
        for (const auto& contour : core::getSequenceItems(roiContour, kContourSequence)) {
            auto type = core::getStringValue(contour, kContourGeometricType);
            if (type != "CLOSED_PLANAR") {
                logger->debug("{}: skipping {} contour of ROI {}", fileName, type, *number);
                continue;
            }
            auto data = core::parseDoubleValues(core::getStringValue(contour, kContourData));
            if (data.size() < 9) {
                continue;
            }

            Polygon polygon;
            polygon.reserve(data.size() / 3);
            double zSum = 0.0;
            for (size_t i = 0; i + 2 < data.size(); i += 3) {
                core::VolumeType::PointType point;
                point[0] = data[i];
                point[1] = data[i + 1];
                point[2] = data[i + 2];
                itk::ContinuousIndex<double, 3> cidx;
                if (!reference->TransformPhysicalPointToContinuousIndex(point, cidx)) {
                    ++clippedVertices;
                }
                polygon.emplace_back(cidx[0], cidx[1]);
                zSum += cidx[2];
            }

            long z = std::lround(zSum / static_cast<double>(polygon.size()));
            if (z < 0 || z >= static_cast<long>(referenceSize[2])) {
                logger->warn("{}: contour of ROI {} lies outside series {}",
                             fileName, *number, result.referencedSeriesUid);
                continue;
            }
            slices[z].push_back(std::move(polygon));
        }

        for (const auto& [z, polygons] : slices) {
            fillSlice(masks[*number].GetPointer(), z, polygons);
        }
    }

    if (clippedVertices > 0) {
        logger->warn("{}: {} contour points lie outside series {}",
                     fileName, clippedVertices, result.referencedSeriesUid);
    }

    for (const auto& [number, name] : roiNames) {
        result.segments.push_back(core::Segment{name, masks[number]});
    }
    return result;
}

}  // namespace dicom_extractor::services
