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

#include "core/logging.hpp"
#include "services/extraction/filename_patterns.hpp"

namespace dicom_extractor::services {

std::string_view toString(SegmentationFormat format) {
    switch (format) {
        case SegmentationFormat::StructuredLabel: return "StructuredLabel";
        case SegmentationFormat::RegionContour: return "RegionContour";
        case SegmentationFormat::FilenameConvention: return "FilenameConvention";
    }
    return "Unknown";
}

SegmentationResolver::SegmentationResolver() {
    strategies_[SegmentationFormat::StructuredLabel] = resolveStructuredLabel;
    strategies_[SegmentationFormat::RegionContour] = resolveRegionContour;
    strategies_[SegmentationFormat::FilenameConvention] = resolveFilenameConvention;
}

void SegmentationResolver::registerStrategy(SegmentationFormat format,
                                            ResolveFunction function) {
    strategies_[format] = std::move(function);
}

std::expected<SegmentationFormat, ResolveError>
SegmentationResolver::detectFormat(const std::filesystem::path& path) {
    if (hasLabelVolumeExtension(path)) {
        return SegmentationFormat::FilenameConvention;
    }

    core::DicomLoader loader;
    auto header = loader.loadHeader(path);
    if (!header) {
        return std::unexpected(ResolveError{
            ResolveError::Code::UnrecognizedFormat,
            path.filename().string() + ": " + header.error().toString()
        });
    }
    if (header->modality == "SEG") {
        return SegmentationFormat::StructuredLabel;
    }
    if (header->modality == "RTSTRUCT") {
        return SegmentationFormat::RegionContour;
    }
    return std::unexpected(ResolveError{
        ResolveError::Code::UnrecognizedFormat,
        path.filename().string() + ": modality '" + header->modality
            + "' is not a segmentation"
    });
}

std::expected<ResolvedSegmentation, ResolveError>
SegmentationResolver::resolve(const SegmentationSource& source,
                              const ResolveContext& context) const {
    auto logger = logging::LoggerFactory::create("SegmentationResolver");

    SegmentationFormat format;
    if (source.format) {
        format = *source.format;
    } else {
        auto detected = detectFormat(source.path);
        if (!detected) {
            return std::unexpected(detected.error());
        }
        format = *detected;
    }

    auto it = strategies_.find(format);
    if (it == strategies_.end() || !it->second) {
        return std::unexpected(ResolveError{
            ResolveError::Code::UnrecognizedFormat,
            "no strategy registered for " + std::string(toString(format))
        });
    }

    logger->debug("Resolving {} as {}", source.path.filename().string(), toString(format));

    auto resolved = it->second(source, context);
    if (!resolved) {
        return resolved;
    }

    if (!context.referenceVolumes.contains(resolved->referencedSeriesUid)) {
        return std::unexpected(ResolveError{
            ResolveError::Code::UnresolvedReference,
            source.path.filename().string() + " references series "
                + resolved->referencedSeriesUid + " which is not loaded"
        });
    }

    logger->debug("{} resolved to series {} with {} segments",
                  source.path.filename().string(),
                  resolved->referencedSeriesUid,
                  resolved->segments.size());
    return resolved;
}

}  // namespace dicom_extractor::services
