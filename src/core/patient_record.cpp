#include "core/patient_record.hpp"

#include <algorithm>
#include <cctype>

namespace dicom_extractor::core {

std::array<size_t, 3> ImageSeries::dimensions() const
{
    if (!image) {
        return {0, 0, 0};
    }
    const auto size = image->GetLargestPossibleRegion().GetSize();
    return {size[0], size[1], size[2]};
}

std::string ImageSeries::value(std::string_view tagKey) const
{
    std::string key(tagKey);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = metadata.find(key);
    return it != metadata.end() ? it->second : std::string{};
}

const RecordEntry* PatientRecord::find(std::string_view criterionName) const
{
    auto it = std::find_if(entries.begin(), entries.end(),
        [criterionName](const RecordEntry& entry) {
            return entry.criterionName == criterionName;
        });
    return it != entries.end() ? &*it : nullptr;
}

RecordEntry* PatientRecord::find(std::string_view criterionName)
{
    auto it = std::find_if(entries.begin(), entries.end(),
        [criterionName](const RecordEntry& entry) {
            return entry.criterionName == criterionName;
        });
    return it != entries.end() ? &*it : nullptr;
}

std::string_view toString(FailureReason reason)
{
    switch (reason) {
        case FailureReason::NoImageFiles:                    return "no image files";
        case FailureReason::MixedPatientIds:                 return "mixed patient ids";
        case FailureReason::NoMatchingImages:                return "no matching images";
        case FailureReason::MissingCriterion:                return "missing criterion";
        case FailureReason::UnresolvedSegmentationReference: return "unresolved segmentation reference";
        case FailureReason::UnrecognizedSegmentationFormat:  return "unrecognized segmentation format";
        case FailureReason::SegmentationReadFailed:          return "segmentation read failed";
        case FailureReason::InconsistentSeriesGeometry:      return "inconsistent series geometry";
        case FailureReason::UnreadableFile:                  return "unreadable file";
        case FailureReason::ReaderFailed:                    return "reader failed";
        case FailureReason::TransformFailed:                 return "transform failed";
    }
    return "unknown";
}

std::string FailureRecord::toString() const
{
    std::string text = patientId + ": " + std::string(core::toString(reason));
    if (!detail.empty()) {
        text += " (" + detail + ")";
    }
    return text;
}

} // namespace dicom_extractor::core
