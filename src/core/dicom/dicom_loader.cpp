#include "core/dicom_loader.hpp"
#include "core/dataset_utils.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <gdcmDictEntry.h>
#include <gdcmDicts.h>
#include <gdcmGlobal.h>
#include <gdcmReader.h>
#include <gdcmStringFilter.h>
#include <gdcmVR.h>

#include <itkGDCMImageIO.h>
#include <itkImageSeriesReader.h>

namespace dicom_extractor::core {

namespace {

const gdcm::Tag kPixelData{0x7fe0, 0x0010};

std::string toLowerKey(std::string_view key) {
    std::string lowered(key);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

/// Binary and nested VRs never land in the metadata map
bool isTextualVR(gdcm::VR::VRType vr) {
    switch (vr) {
        case gdcm::VR::SQ:
        case gdcm::VR::OB:
        case gdcm::VR::OW:
        case gdcm::VR::OF:
        case gdcm::VR::OD:
        case gdcm::VR::OL:
        case gdcm::VR::UN:
        case gdcm::VR::OB_OW:
        case gdcm::VR::INVALID:
            return false;
        default:
            return true;
    }
}

void fillSliceInfo(DicomHeader& header) {
    auto& slice = header.slice;
    slice.seriesInstanceUid = header.seriesInstanceUid;

    if (auto rows = parseIntValue(header.value(dicom_tags::Rows))) {
        slice.rows = *rows;
    }
    if (auto columns = parseIntValue(header.value(dicom_tags::Columns))) {
        slice.columns = *columns;
    }
    if (auto instance = parseIntValue(header.value(dicom_tags::InstanceNumber))) {
        slice.instanceNumber = *instance;
    }

    auto location = parseDoubleValues(header.value(dicom_tags::SliceLocation));
    if (!location.empty()) {
        slice.sliceLocation = location.front();
    }

    auto position = parseDoubleValues(header.value(dicom_tags::ImagePositionPatient));
    if (position.size() >= 3) {
        std::copy_n(position.begin(), 3, slice.imagePosition.begin());
    }

    auto orientation = parseDoubleValues(header.value(dicom_tags::ImageOrientationPatient));
    if (orientation.size() >= 6) {
        std::copy_n(orientation.begin(), 6, slice.imageOrientation.begin());
    }
}

}  // anonymous namespace

std::string DicomHeader::value(std::string_view tagKey) const {
    auto it = elements.find(toLowerKey(tagKey));
    return it != elements.end() ? it->second : std::string{};
}

bool DicomHeader::isSegmentation() const {
    return DicomLoader::isSegmentationModality(modality);
}

std::string DicomErrorInfo::toString() const {
    switch (code) {
        case DicomError::FileNotFound:
            return "File not found: " + message;
        case DicomError::InvalidDicomFormat:
            return "Invalid DICOM format: " + message;
        case DicomError::MetadataExtractionFailed:
            return "Metadata extraction failed: " + message;
        case DicomError::SeriesAssemblyFailed:
            return "Series assembly failed: " + message;
        case DicomError::DecodingFailed:
            return "Decoding failed: " + message;
    }
    return "Unknown error: " + message;
}

class DicomLoader::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;

    Impl() : logger(logging::LoggerFactory::create("DicomLoader")) {}
};

DicomLoader::DicomLoader() : impl_(std::make_unique<Impl>()) {}

DicomLoader::~DicomLoader() = default;

DicomLoader::DicomLoader(DicomLoader&&) noexcept = default;
DicomLoader& DicomLoader::operator=(DicomLoader&&) noexcept = default;

std::expected<DicomHeader, DicomErrorInfo>
DicomLoader::loadHeader(const std::filesystem::path& filePath) const
{
    if (!std::filesystem::is_regular_file(filePath)) {
        return std::unexpected(DicomErrorInfo{
            DicomError::FileNotFound,
            filePath.string()
        });
    }

    gdcm::Reader reader;
    reader.SetFileName(filePath.string().c_str());
    if (!reader.ReadUpToTag(kPixelData, std::set<gdcm::Tag>{})) {
        return std::unexpected(DicomErrorInfo{
            DicomError::InvalidDicomFormat,
            filePath.string()
        });
    }

    const auto& file = reader.GetFile();
    const auto& ds = file.GetDataSet();
    const auto& dicts = gdcm::Global::GetInstance().GetDicts();

    gdcm::StringFilter stringFilter;
    stringFilter.SetFile(file);

    DicomHeader header;
    header.slice.filePath = filePath;

    for (auto it = ds.Begin(); it != ds.End(); ++it) {
        const gdcm::Tag& tag = it->GetTag();
        if (tag.IsPrivate() || tag.IsGroupLength() || tag == kPixelData) {
            continue;
        }

        gdcm::VR::VRType vr = it->GetVR();
        if (vr == gdcm::VR::INVALID) {
            vr = dicts.GetDictEntry(tag).GetVR();
        }
        if (!isTextualVR(vr)) {
            continue;
        }

        header.elements[formatTagKey(tag.GetGroup(), tag.GetElement())] =
            trimDicomPadding(stringFilter.ToString(tag));
    }

    header.patientId = header.value(dicom_tags::PatientId);
    header.seriesInstanceUid = header.value(dicom_tags::SeriesInstanceUid);
    header.seriesDescription = header.value(dicom_tags::SeriesDescription);
    header.modality = header.value(dicom_tags::Modality);
    header.sopClassUid = header.value(dicom_tags::SopClassUid);

    if (header.seriesInstanceUid.empty()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::MetadataExtractionFailed,
            "Missing SeriesInstanceUID in " + filePath.string()
        });
    }

    fillSliceInfo(header);
    return header;
}

std::expected<VolumeType::Pointer, DicomErrorInfo>
DicomLoader::loadSeries(const std::vector<std::filesystem::path>& files) const
{
    if (files.empty()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            "No slices provided"
        });
    }

    try {
        std::vector<std::string> fileNames;
        fileNames.reserve(files.size());
        for (const auto& file : files) {
            fileNames.push_back(file.string());
        }

        using ReaderType = itk::ImageSeriesReader<VolumeType>;
        auto reader = ReaderType::New();
        reader->SetImageIO(itk::GDCMImageIO::New());
        reader->SetFileNames(fileNames);
        reader->Update();

        VolumeType::Pointer volume = reader->GetOutput();
        volume->DisconnectPipeline();

        impl_->logger->debug("Loaded {} slices into volume {}x{}x{}",
                             files.size(),
                             volume->GetLargestPossibleRegion().GetSize()[0],
                             volume->GetLargestPossibleRegion().GetSize()[1],
                             volume->GetLargestPossibleRegion().GetSize()[2]);
        return volume;

    } catch (const itk::ExceptionObject& e) {
        return std::unexpected(DicomErrorInfo{
            DicomError::DecodingFailed,
            std::string("Failed to load series: ") + e.GetDescription()
        });
    }
}

std::string DicomLoader::tagName(std::string_view tagKey)
{
    auto tag = parseTagKey(tagKey);
    if (!tag || tag->IsPrivate()) {
        return std::string(tagKey);
    }
    const auto& entry = gdcm::Global::GetInstance().GetDicts().GetDictEntry(*tag);
    const char* name = entry.GetName();
    if (name == nullptr || *name == '\0' || std::string_view(name) == "?") {
        return std::string(tagKey);
    }
    return name;
}

bool DicomLoader::isSegmentationModality(std::string_view modality)
{
    return modality == "SEG" || modality == "RTSTRUCT";
}

} // namespace dicom_extractor::core
