#include "services/extraction/segmentation_resolver.hpp"

#include "core/logging.hpp"
#include "core/mask_operations.hpp"
#include "services/extraction/filename_patterns.hpp"
#include "services/extraction/volume_resampler.hpp"

#include <format>
#include <set>
#include <utility>

#include <itkImageFileReader.h>
#include <itkImageRegionConstIterator.h>
#include <itkImageRegionIterator.h>
#include <itkMetaDataObject.h>

namespace dicom_extractor::services {

namespace {

using LabelVolumeType = core::LabelVolumeType;

/// Segment name and the label value it occupies in the volume
using LabelEntry = std::pair<std::string, LabelVolumeType::PixelType>;

std::string getMetaString(const itk::MetaDataDictionary& dict, const std::string& key) {
    std::string value;
    itk::ExposeMetaData<std::string>(dict, key, value);
    return value;
}

/**
 * @brief Segment table written by 3D Slicer into .seg.nrrd headers
 *
 * Keys are "Segment<N>_Name" and "Segment<N>_LabelValue" for N = 0, 1, ...
 */
std::vector<LabelEntry> readSlicerSegments(const itk::MetaDataDictionary& dict) {
    std::vector<LabelEntry> entries;
    for (int n = 0;; ++n) {
        auto nameKey = std::format("Segment{}_Name", n);
        if (!dict.HasKey(nameKey)) {
            break;
        }
        auto name = getMetaString(dict, nameKey);
        int labelValue = n + 1;
        auto valueKey = std::format("Segment{}_LabelValue", n);
        if (dict.HasKey(valueKey)) {
            try {
                labelValue = std::stoi(getMetaString(dict, valueKey));
            } catch (const std::exception&) {
                // keep the positional default
            }
        }
        entries.emplace_back(name.empty() ? std::format("Segment_{}", labelValue) : name,
                             static_cast<LabelVolumeType::PixelType>(labelValue));
    }
    return entries;
}

std::vector<LabelEntry> distinctLabels(const LabelVolumeType* labels) {
    std::set<LabelVolumeType::PixelType> values;
    itk::ImageRegionConstIterator<LabelVolumeType> it(labels, labels->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        if (it.Get() != 0) {
            values.insert(it.Get());
        }
    }

    std::vector<LabelEntry> entries;
    for (auto value : values) {
        entries.emplace_back(std::format("Segment_{}", value), value);
    }
    return entries;
}

core::MaskType::Pointer extractLabel(const LabelVolumeType* labels,
                                     LabelVolumeType::PixelType value) {
    auto mask = core::MaskOperations::createEmptyLike(labels);
    itk::ImageRegionConstIterator<LabelVolumeType> in(labels, labels->GetLargestPossibleRegion());
    itk::ImageRegionIterator<core::MaskType> out(mask, mask->GetLargestPossibleRegion());
    for (in.GoToBegin(), out.GoToBegin(); !in.IsAtEnd(); ++in, ++out) {
        if (in.Get() == value) {
            out.Set(1);
        }
    }
    return mask;
}

}  // anonymous namespace

std::expected<ResolvedSegmentation, ResolveError>
resolveFilenameConvention(const SegmentationSource& source, const ResolveContext& context) {
    auto logger = logging::LoggerFactory::create("SegmentationResolver");
    const auto fileName = source.path.filename().string();

    if (!context.patientPrefix.empty() && context.patientNumber) {
        auto fileNumber = numberAfterPrefix(fileName, context.patientPrefix);
        if (fileNumber && *fileNumber != *context.patientNumber) {
            return std::unexpected(ResolveError{
                ResolveError::Code::PatientMismatch,
                std::format("{} belongs to {}{}, not {}{}", fileName,
                            context.patientPrefix, *fileNumber,
                            context.patientPrefix, *context.patientNumber)
            });
        }
    }

    ResolvedSegmentation result;
    const core::VolumeType* reference = nullptr;
    for (const auto& [uid, volume] : context.referenceVolumes) {
        if (!uid.empty() && volume && fileName.find(uid) != std::string::npos) {
            result.referencedSeriesUid = uid;
            reference = volume.GetPointer();
            break;
        }
    }
    if (reference == nullptr) {
        return std::unexpected(ResolveError{
            ResolveError::Code::UnresolvedReference,
            fileName + " contains no loaded series UID"
        });
    }

    using ReaderType = itk::ImageFileReader<LabelVolumeType>;
    auto reader = ReaderType::New();
    reader->SetFileName(source.path.string());

    LabelVolumeType::Pointer labels;
    std::vector<LabelEntry> entries;
    try {
        reader->Update();
        labels = reader->GetOutput();
        labels->DisconnectPipeline();
        entries = readSlicerSegments(reader->GetImageIO()->GetMetaDataDictionary());
    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(ResolveError{
            ResolveError::Code::ReadFailed,
            fileName + ": " + e.GetDescription()
        });
    }

    if (!VolumeResampler::sameGrid(labels, reference)) {
        logger->debug("{}: resampling labels onto series {}", fileName, result.referencedSeriesUid);
        auto resampled = VolumeResampler::resampleLabelsOnto(labels, reference);
        if (!resampled) {
            return std::unexpected(ResolveError{
                ResolveError::Code::ReadFailed,
                fileName + ": " + resampled.error().toString()
            });
        }
        labels = *resampled;
    }

    if (entries.empty()) {
        entries = distinctLabels(labels);
    }
    if (entries.empty()) {
        logger->warn("{}: label volume contains no foreground", fileName);
    }

    for (const auto& [name, value] : entries) {
        auto mask = extractLabel(labels, value);
        // Snap to the reference geometry within sameGrid() tolerance
        mask->CopyInformation(reference);
        result.segments.push_back(core::Segment{name, mask});
    }
    return result;
}

}  // namespace dicom_extractor::services
