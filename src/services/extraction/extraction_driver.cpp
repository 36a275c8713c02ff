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

#include "services/extraction/extraction_driver.hpp"

#include "core/logging.hpp"
#include "services/extraction/record_assembler.hpp"

#include <algorithm>
#include <format>
#include <set>
#include <utility>

#include <itkMacro.h>

namespace dicom_extractor::services {

namespace {

/// Header-only view of a series, carrying what matching needs
core::ImageSeries matchViewOf(const core::SeriesGroup& group) {
    core::ImageSeries view;
    view.seriesInstanceUid = group.seriesInstanceUid;
    view.seriesDescription = group.seriesDescription;
    view.modality = group.modality;
    view.metadata = group.metadata;
    return view;
}

std::string joined(const std::vector<std::string>& values) {
    std::string text;
    for (const auto& value : values) {
        if (!text.empty()) {
            text += ", ";
        }
        text += value;
    }
    return text;
}

}  // anonymous namespace

class ExtractionDriver::Impl {
public:
    RecordLocator locator;
    MatchCriteria* criteria;
    SegmentAliaser aliaser;
    SegmentationResolver resolver;
    core::SeriesBuilder builder;
    core::DicomLoader loader;
    RecordAssembler assembler;
    std::vector<std::shared_ptr<const RecordTransform>> transforms;
    MissingCriterionHandler missingHandler;
    std::filesystem::path criteriaOutput;
    ExtractionProgressCallback progressCallback;

    std::optional<std::vector<std::filesystem::path>> patients;
    size_t position = 0;
    std::vector<core::FailureRecord> failures;
    std::vector<core::PatientWhoFailed> patientsWhoFailed;
    std::vector<std::string> failedPatientIds;

    std::shared_ptr<spdlog::logger> logger;

    Impl(RecordLocator loc, MatchCriteria& crit, SegmentAliaser alias)
        : locator(std::move(loc))
        , criteria(&crit)
        , aliaser(std::move(alias))
        , logger(logging::LoggerFactory::create("ExtractionDriver")) {}

    const std::vector<std::filesystem::path>& patientList() {
        if (!patients) {
            patients = locator.listPatients();
        }
        return *patients;
    }

    void recordFailure(core::FailureRecord failure) {
        logger->warn("{}", failure.toString());
        failures.push_back(std::move(failure));
    }

    RecordResult fail(core::FailureRecord failure) {
        logger->error("{}", failure.toString());
        failures.push_back(failure);
        failedPatientIds.push_back(failure.patientId);
        return std::unexpected(std::move(failure));
    }

    /// criterion -> groups satisfying it, groups in UID order
    std::vector<std::pair<std::string, const core::SeriesGroup*>>
    matchGroups(const std::vector<core::SeriesGroup>& groups) const {
        std::vector<std::pair<std::string, const core::SeriesGroup*>> matched;
        for (const auto& group : groups) {
            auto name = criteria->matchSeries(matchViewOf(group));
            if (name) {
                matched.emplace_back(*name, &group);
            } else {
                logger->debug("Series {} ('{}') matches no criterion",
                              group.seriesInstanceUid,
                              criteria->descriptionOf(matchViewOf(group)));
            }
        }
        return matched;
    }

    /**
     * @brief Offer missing criteria to the handler
     * @return true when the dictionary changed
     */
    bool correctMissing(const std::string& patientId,
                        const std::vector<std::string>& missing,
                        const std::vector<std::string>& available) {
        if (!missingHandler) {
            return false;
        }
        bool changed = false;
        for (const auto& criterion : missing) {
            auto choice = missingHandler(patientId, criterion, available);
            if (!choice) {
                continue;
            }
            if (std::find(available.begin(), available.end(), *choice) == available.end()) {
                logger->warn("{}: '{}' is not an available description, ignored",
                             patientId, *choice);
                continue;
            }
            auto added = criteria->addAcceptedDescription(criterion, *choice);
            if (!added) {
                logger->warn("{}: cannot add '{}' to {}: {}", patientId, *choice,
                             criterion, added.error().toString());
                continue;
            }
            logger->info("{}: criterion {} now accepts '{}'", patientId, criterion, *choice);
            changed = true;
        }
        return changed;
    }

    void persistCriteria() {
        if (criteriaOutput.empty()) {
            return;
        }
        auto saved = criteria->saveToFile(criteriaOutput);
        if (!saved) {
            logger->error("Cannot save match criteria: {}", saved.error().toString());
        } else {
            logger->info("Match criteria saved to {}", criteriaOutput.string());
        }
    }

    RecordResult processPatient(const std::filesystem::path& patientPath);
};

RecordResult ExtractionDriver::Impl::processPatient(const std::filesystem::path& patientPath) {
    const auto directoryName = patientPath.filename().string();
    auto sources = locator.locate(patientPath);

    if (sources.dicomFiles.empty()) {
        return fail(core::FailureRecord{
            directoryName, core::FailureReason::NoImageFiles,
            "no files under " + patientPath.string()
        });
    }

    // Headers
    std::vector<core::DicomHeader> imageHeaders;
    std::vector<SegmentationSource> segmentationSources;
    std::set<std::string> patientIds;
    for (const auto& file : sources.dicomFiles) {
        auto header = loader.loadHeader(file);
        if (!header) {
            recordFailure(core::FailureRecord{
                directoryName, core::FailureReason::UnreadableFile,
                file.filename().string() + ": " + header.error().toString()
            });
            continue;
        }
        patientIds.insert(header->patientId);
        if (header->isSegmentation()) {
            segmentationSources.push_back(SegmentationSource{
                file,
                header->modality == "SEG" ? SegmentationFormat::StructuredLabel
                                          : SegmentationFormat::RegionContour
            });
        } else {
            imageHeaders.push_back(std::move(*header));
        }
    }

    if (imageHeaders.empty()) {
        return fail(core::FailureRecord{
            directoryName, core::FailureReason::NoImageFiles,
            "no readable image files under " + patientPath.string()
        });
    }
    if (patientIds.size() > 1) {
        return fail(core::FailureRecord{
            directoryName, core::FailureReason::MixedPatientIds,
            joined(std::vector<std::string>(patientIds.begin(), patientIds.end()))
        });
    }

    std::string patientId = *patientIds.begin();
    if (patientId.empty()) {
        logger->warn("{}: files carry no PatientID, using the directory name", directoryName);
        patientId = directoryName;
    }

    // Grouping
    auto grouping = core::SeriesBuilder::groupSlices(imageHeaders);
    for (const auto& dropped : grouping.dropped) {
        recordFailure(core::FailureRecord{
            patientId, core::FailureReason::InconsistentSeriesGeometry,
            dropped.seriesInstanceUid + ": " + dropped.reason
        });
    }

    std::vector<std::string> available;
    for (const auto& group : grouping.series) {
        auto description = criteria->descriptionOf(matchViewOf(group));
        if (std::find(available.begin(), available.end(), description) == available.end()) {
            available.push_back(description);
        }
    }

    // Matching
    auto matched = matchGroups(grouping.series);
    if (!criteria->isIdentity()) {
        auto findMissing = [&]() {
            std::vector<std::string> missing;
            for (const auto& name : criteria->criterionNames()) {
                bool found = std::any_of(matched.begin(), matched.end(),
                    [&name](const auto& item) { return item.first == name; });
                if (!found) {
                    missing.push_back(name);
                }
            }
            return missing;
        };

        auto missing = findMissing();
        if (!missing.empty() && correctMissing(patientId, missing, available)) {
            persistCriteria();
            matched = matchGroups(grouping.series);
            missing = findMissing();
        }

        if (!missing.empty()) {
            core::PatientWhoFailed report;
            report.patientId = patientId;
            report.availableDescriptions = available;
            for (const auto& name : missing) {
                if (const auto* accepted = criteria->acceptedDescriptions(name)) {
                    report.failedImages[name] = *accepted;
                }
            }
            patientsWhoFailed.push_back(std::move(report));
            recordFailure(core::FailureRecord{
                patientId, core::FailureReason::MissingCriterion, joined(missing)
            });
        }
    }

    if (matched.empty()) {
        return fail(core::FailureRecord{
            patientId, core::FailureReason::NoMatchingImages,
            "available descriptions: " + joined(available)
        });
    }

    // Pixel reconstruction
    std::vector<MatchedSeries> loaded;
    ResolveContext context;
    context.patientNumber = sources.patientNumber;
    context.patientPrefix = locator.options().patientPrefix;
    for (const auto& [criterion, group] : matched) {
        auto series = builder.buildSeries(*group);
        if (!series) {
            recordFailure(core::FailureRecord{
                patientId, core::FailureReason::ReaderFailed,
                group->seriesInstanceUid + ": " + series.error().toString()
            });
            continue;
        }
        logger->debug("{}: {} <- series {} ({} slices)", patientId, criterion,
                      series->seriesInstanceUid, series->files.size());
        context.referenceVolumes[series->seriesInstanceUid] = series->image;
        loaded.push_back(MatchedSeries{criterion, std::move(*series)});
    }
    if (loaded.empty()) {
        return fail(core::FailureRecord{
            patientId, core::FailureReason::ReaderFailed,
            "no matched series could be reconstructed"
        });
    }

    // Segmentations
    for (auto& labelVolume : sources.labelVolumes) {
        segmentationSources.push_back(std::move(labelVolume));
    }
    std::vector<core::Segmentation> segmentations;
    for (const auto& source : segmentationSources) {
        std::expected<ResolvedSegmentation, ResolveError> resolved;
        try {
            resolved = resolver.resolve(source, context);
        } catch (const itk::ExceptionObject& e) {
            resolved = std::unexpected(ResolveError{
                ResolveError::Code::ReadFailed, e.GetDescription()});
        } catch (const std::exception& e) {
            resolved = std::unexpected(ResolveError{
                ResolveError::Code::ReadFailed, e.what()});
        }
        if (!resolved) {
            recordFailure(core::FailureRecord{
                patientId, resolved.error().failureReason(),
                source.path.filename().string() + ": " + resolved.error().toString()
            });
            continue;
        }

        auto organs = aliaser.apply(resolved->segments);
        if (!organs) {
            recordFailure(core::FailureRecord{
                patientId, core::FailureReason::SegmentationReadFailed,
                source.path.filename().string() + ": " + organs.error().toString()
            });
            continue;
        }
        if (organs->empty()) {
            logger->warn("{}: {} has no segment with a known organ",
                         patientId, source.path.filename().string());
            continue;
        }
        segmentations.push_back(core::Segmentation{
            resolved->referencedSeriesUid, source.path, std::move(*organs)
        });
    }

    // Assembly
    auto assembled = assembler.assemble(patientId, patientPath, std::move(loaded),
                                        std::move(segmentations),
                                        criteria->criterionNames());
    if (!assembled) {
        return fail(assembled.error());
    }
    for (auto& failure : assembled->failures) {
        failures.push_back(std::move(failure));
    }
    auto record = std::move(assembled->record);

    // Transforms
    if (!transforms.empty()) {
        std::string current;
        try {
            auto data = TransformData::fromRecord(record);
            std::vector<std::string> applied;
            for (const auto& transform : transforms) {
                current = transform->name();
                data = transform->apply(std::move(data));
                applied.push_back(current);
            }
            data.applyTo(record);
            record.transformsHistory.insert(record.transformsHistory.end(),
                                            applied.begin(), applied.end());
        } catch (const itk::ExceptionObject& e) {
            return fail(core::FailureRecord{
                patientId, core::FailureReason::TransformFailed,
                current + ": " + e.GetDescription()
            });
        } catch (const std::exception& e) {
            return fail(core::FailureRecord{
                patientId, core::FailureReason::TransformFailed,
                current + ": " + e.what()
            });
        }
    }

    logger->info("{}: record with {} entries", patientId, record.entries.size());
    return record;
}

ExtractionDriver::ExtractionDriver(RecordLocator locator,
                                   MatchCriteria& criteria,
                                   SegmentAliaser aliaser)
    : impl_(std::make_unique<Impl>(std::move(locator), criteria, std::move(aliaser))) {}

ExtractionDriver::~ExtractionDriver() = default;

ExtractionDriver::ExtractionDriver(ExtractionDriver&&) noexcept = default;
ExtractionDriver& ExtractionDriver::operator=(ExtractionDriver&&) noexcept = default;

void ExtractionDriver::setVolumeReader(std::shared_ptr<core::VolumeReader> reader) {
    impl_->builder = core::SeriesBuilder(std::move(reader));
}

void ExtractionDriver::setResolver(SegmentationResolver resolver) {
    impl_->resolver = std::move(resolver);
}

void ExtractionDriver::addTransform(std::shared_ptr<const RecordTransform> transform) {
    impl_->transforms.push_back(std::move(transform));
}

void ExtractionDriver::setMissingCriterionHandler(MissingCriterionHandler handler) {
    impl_->missingHandler = std::move(handler);
}

void ExtractionDriver::setMatchCriteriaOutput(std::filesystem::path path) {
    impl_->criteriaOutput = std::move(path);
}

void ExtractionDriver::setProgressCallback(ExtractionProgressCallback callback) {
    impl_->progressCallback = std::move(callback);
}

std::optional<RecordResult> ExtractionDriver::next() {
    const auto& patients = impl_->patientList();
    if (impl_->position >= patients.size()) {
        return std::nullopt;
    }

    const auto patientPath = patients[impl_->position++];
    impl_->logger->info("Processing {} ({}/{})", patientPath.filename().string(),
                        impl_->position, patients.size());

    RecordResult result = std::unexpected(core::FailureRecord{});
    try {
        result = impl_->processPatient(patientPath);
    } catch (const itk::ExceptionObject& e) {
        result = impl_->fail(core::FailureRecord{
            patientPath.filename().string(), core::FailureReason::ReaderFailed,
            e.GetDescription()
        });
    } catch (const std::exception& e) {
        result = impl_->fail(core::FailureRecord{
            patientPath.filename().string(), core::FailureReason::ReaderFailed,
            e.what()
        });
    }

    if (impl_->progressCallback) {
        impl_->progressCallback(impl_->position, patients.size(),
                                patientPath.filename().string());
    }
    return result;
}

void ExtractionDriver::reset() {
    impl_->patients.reset();
    impl_->position = 0;
    impl_->failures.clear();
    impl_->patientsWhoFailed.clear();
    impl_->failedPatientIds.clear();
}

size_t ExtractionDriver::size() const {
    return impl_->patientList().size();
}

const std::vector<core::FailureRecord>& ExtractionDriver::failures() const {
    return impl_->failures;
}

const std::vector<core::PatientWhoFailed>& ExtractionDriver::patientsWhoFailed() const {
    return impl_->patientsWhoFailed;
}

size_t ExtractionDriver::position() const noexcept {
    return impl_->position;
}

const std::vector<std::string>& ExtractionDriver::failedPatientIds() const noexcept {
    return impl_->failedPatientIds;
}

}  // namespace dicom_extractor::services
