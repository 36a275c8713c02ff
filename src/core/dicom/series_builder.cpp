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

#include "core/series_builder.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace dicom_extractor::core {

namespace {

std::array<double, 3> sliceNormal(const std::array<double, 6>& ori)
{
    // Cross product of row and column direction cosines
    return {
        ori[1] * ori[5] - ori[2] * ori[4],
        ori[2] * ori[3] - ori[0] * ori[5],
        ori[0] * ori[4] - ori[1] * ori[3]
    };
}

double projectOnNormal(const SliceInfo& slice, const std::array<double, 3>& normal)
{
    return slice.imagePosition[0] * normal[0]
         + slice.imagePosition[1] * normal[1]
         + slice.imagePosition[2] * normal[2];
}

}  // anonymous namespace

std::expected<VolumeType::Pointer, DicomErrorInfo>
ItkVolumeReader::read(const std::vector<std::filesystem::path>& files)
{
    return loader_.loadSeries(files);
}

class SeriesBuilder::Impl {
public:
    std::shared_ptr<VolumeReader> reader;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(std::shared_ptr<VolumeReader> volumeReader)
        : reader(std::move(volumeReader))
        , logger(logging::LoggerFactory::create("SeriesBuilder"))
    {
    }
};

SeriesBuilder::SeriesBuilder()
    : impl_(std::make_unique<Impl>(std::make_shared<ItkVolumeReader>()))
{
}

SeriesBuilder::SeriesBuilder(std::shared_ptr<VolumeReader> reader)
    : impl_(std::make_unique<Impl>(std::move(reader)))
{
}

SeriesBuilder::~SeriesBuilder() = default;

SeriesBuilder::SeriesBuilder(SeriesBuilder&&) noexcept = default;
SeriesBuilder& SeriesBuilder::operator=(SeriesBuilder&&) noexcept = default;

GroupingResult SeriesBuilder::groupSlices(const std::vector<DicomHeader>& headers)
{
    std::map<std::string, std::vector<const DicomHeader*>> byUid;
    for (const auto& header : headers) {
        byUid[header.seriesInstanceUid].push_back(&header);
    }

    GroupingResult result;
    for (auto& [uid, members] : byUid) {
        std::vector<SliceInfo> slices;
        slices.reserve(members.size());
        for (const auto* header : members) {
            slices.push_back(header->slice);
        }

        if (auto reason = findGeometryInconsistency(slices)) {
            result.dropped.push_back(DroppedSeries{uid, *reason});
            continue;
        }

        sortSlices(slices);

        // Metadata comes from the first slice in physical order
        const auto firstPath = slices.front().filePath;
        auto first = std::find_if(members.begin(), members.end(),
            [&firstPath](const DicomHeader* header) {
                return header->slice.filePath == firstPath;
            });

        SeriesGroup group;
        group.seriesInstanceUid = uid;
        group.seriesDescription = (*first)->seriesDescription;
        group.modality = (*first)->modality;
        group.metadata = (*first)->elements;
        group.slices = std::move(slices);
        result.series.push_back(std::move(group));
    }
    return result;
}

std::expected<ImageSeries, DicomErrorInfo>
SeriesBuilder::buildSeries(const SeriesGroup& group)
{
    impl_->logger->debug("Building volume for series {} ({} slices)",
                         group.seriesInstanceUid, group.slices.size());

    if (group.slices.empty()) {
        return std::unexpected(DicomErrorInfo{
            DicomError::SeriesAssemblyFailed,
            "No slices in series " + group.seriesInstanceUid
        });
    }

    if (!validateSeriesConsistency(group.slices)) {
        impl_->logger->warn("Inconsistent slice spacing detected in series {}",
                            group.seriesInstanceUid);
    }

    std::vector<std::filesystem::path> files;
    files.reserve(group.slices.size());
    for (const auto& slice : group.slices) {
        files.push_back(slice.filePath);
    }

    auto volume = impl_->reader->read(files);
    if (!volume) {
        impl_->logger->error("Failed to build volume for series {}: {}",
                             group.seriesInstanceUid, volume.error().message);
        return std::unexpected(volume.error());
    }

    ImageSeries series;
    series.seriesInstanceUid = group.seriesInstanceUid;
    series.seriesDescription = group.seriesDescription;
    series.modality = group.modality;
    series.files = std::move(files);
    series.metadata = group.metadata;
    series.image = *volume;
    return series;
}

void SeriesBuilder::sortSlices(std::vector<SliceInfo>& slices)
{
    if (slices.size() < 2) {
        return;
    }
    const auto normal = sliceNormal(slices.front().imageOrientation);

    std::stable_sort(slices.begin(), slices.end(),
        [&normal](const SliceInfo& a, const SliceInfo& b) {
            double projA = projectOnNormal(a, normal);
            double projB = projectOnNormal(b, normal);
            if (std::abs(projA - projB) > 1e-6) {
                return projA < projB;
            }
            if (a.instanceNumber != b.instanceNumber) {
                return a.instanceNumber < b.instanceNumber;
            }
            return a.sliceLocation < b.sliceLocation;
        });
}

std::optional<std::string>
SeriesBuilder::findGeometryInconsistency(const std::vector<SliceInfo>& slices)
{
    if (slices.empty()) {
        return std::string("empty series");
    }

    const auto& ref = slices.front();
    for (const auto& slice : slices) {
        if (slice.rows != ref.rows || slice.columns != ref.columns) {
            return std::format("in-plane size {}x{} differs from {}x{} ({})",
                               slice.columns, slice.rows,
                               ref.columns, ref.rows,
                               slice.filePath.filename().string());
        }
        for (size_t i = 0; i < 6; ++i) {
            if (std::abs(slice.imageOrientation[i] - ref.imageOrientation[i]) > 1e-4) {
                return std::format("image orientation differs ({})",
                                   slice.filePath.filename().string());
            }
        }
    }
    return std::nullopt;
}

double SeriesBuilder::calculateSliceSpacing(const std::vector<SliceInfo>& slices)
{
    if (slices.size() < 2) {
        return 1.0;
    }

    // Sort slices by position along slice normal for order-independent calculation
    auto sorted = slices;
    sortSlices(sorted);

    std::vector<double> spacings;
    spacings.reserve(sorted.size() - 1);

    for (size_t i = 1; i < sorted.size(); ++i) {
        const auto& prev = sorted[i - 1];
        const auto& curr = sorted[i];

        double dx = curr.imagePosition[0] - prev.imagePosition[0];
        double dy = curr.imagePosition[1] - prev.imagePosition[1];
        double dz = curr.imagePosition[2] - prev.imagePosition[2];
        double distance = std::sqrt(dx * dx + dy * dy + dz * dz);

        if (distance > 1e-6) {
            spacings.push_back(distance);
        }
    }

    if (spacings.empty()) {
        // Fallback: use slice location difference
        double locDiff = std::abs(sorted.back().sliceLocation - sorted.front().sliceLocation);
        return locDiff / (sorted.size() - 1);
    }

    // Median spacing for robustness against outliers
    std::sort(spacings.begin(), spacings.end());
    return spacings[spacings.size() / 2];
}

bool SeriesBuilder::validateSeriesConsistency(const std::vector<SliceInfo>& slices)
{
    if (slices.size() < 2) {
        return true;
    }

    double expectedSpacing = calculateSliceSpacing(slices);
    constexpr double tolerance = 0.1; // 10% tolerance

    for (size_t i = 1; i < slices.size(); ++i) {
        const auto& prev = slices[i - 1];
        const auto& curr = slices[i];

        double dx = curr.imagePosition[0] - prev.imagePosition[0];
        double dy = curr.imagePosition[1] - prev.imagePosition[1];
        double dz = curr.imagePosition[2] - prev.imagePosition[2];
        double distance = std::sqrt(dx * dx + dy * dy + dz * dz);

        if (std::abs(distance - expectedSpacing) > expectedSpacing * tolerance) {
            return false;
        }
    }

    const auto& refOrientation = slices.front().imageOrientation;
    for (const auto& slice : slices) {
        for (size_t i = 0; i < 6; ++i) {
            if (std::abs(slice.imageOrientation[i] - refOrientation[i]) > 1e-4) {
                return false;
            }
        }
    }

    return true;
}

} // namespace dicom_extractor::core
