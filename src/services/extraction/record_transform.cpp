#include "services/extraction/record_transform.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <utility>

namespace dicom_extractor::services {

TransformData TransformData::fromRecord(const core::PatientRecord& record) {
    TransformData data;
    for (const auto& entry : record.entries) {
        data.images[entry.criterionName] = entry.series.image;
        if (entry.segmentation) {
            data.masks[entry.criterionName] = entry.segmentation->organs;
        }
    }
    return data;
}

void TransformData::applyTo(core::PatientRecord& record) const {
    for (auto& entry : record.entries) {
        if (auto it = images.find(entry.criterionName); it != images.end()) {
            entry.series.image = it->second;
        }
        if (auto it = masks.find(entry.criterionName);
            it != masks.end() && entry.segmentation) {
            entry.segmentation->organs = it->second;
        }
    }
}

ResampleTransform::ResampleTransform(std::array<double, 3> targetSpacing,
                                     std::vector<std::string> criteria,
                                     VolumeResampler::Interpolation interpolation)
    : targetSpacing_(targetSpacing)
    , criteria_(std::move(criteria))
    , interpolation_(interpolation) {}

std::string ResampleTransform::name() const {
    if (interpolation_ == VolumeResampler::Interpolation::Linear) {
        return std::format("Resample({:g}, {:g}, {:g})",
                           targetSpacing_[0], targetSpacing_[1], targetSpacing_[2]);
    }
    return std::format("Resample({:g}, {:g}, {:g}, {})",
                       targetSpacing_[0], targetSpacing_[1], targetSpacing_[2],
                       VolumeResampler::interpolationToString(interpolation_));
}

bool ResampleTransform::selects(const std::string& criterion) const {
    return criteria_.empty()
        || std::find(criteria_.begin(), criteria_.end(), criterion) != criteria_.end();
}

TransformData ResampleTransform::apply(TransformData data) const {
    VolumeResampler::Parameters params;
    params.targetSpacing = targetSpacing_;
    params.interpolation = interpolation_;

    for (auto& [criterion, image] : data.images) {
        if (!selects(criterion) || !image) {
            continue;
        }
        auto resampled = VolumeResampler::resample(image, params);
        if (!resampled) {
            throw std::runtime_error(criterion + ": " + resampled.error().toString());
        }
        image = *resampled;
    }

    for (auto& [criterion, organs] : data.masks) {
        if (!selects(criterion)) {
            continue;
        }
        for (auto& [organ, mask] : organs) {
            auto resampled = VolumeResampler::resampleMask(mask, targetSpacing_);
            if (!resampled) {
                throw std::runtime_error(criterion + "/" + organ + ": "
                                         + resampled.error().toString());
            }
            mask = *resampled;
        }
    }
    return data;
}

}  // namespace dicom_extractor::services
