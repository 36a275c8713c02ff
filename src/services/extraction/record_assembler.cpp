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

#include "services/extraction/record_assembler.hpp"

#include "core/logging.hpp"
#include "core/mask_operations.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace dicom_extractor::services {

class RecordAssembler::Impl {
public:
    std::shared_ptr<spdlog::logger> logger;

    Impl() : logger(logging::LoggerFactory::create("RecordAssembler")) {}

    /// OR @p incoming into @p target organ by organ
    void merge(core::Segmentation& target,
               const core::Segmentation& incoming,
               const std::string& patientId,
               std::vector<core::FailureRecord>& failures) const {
        for (const auto& [organ, mask] : incoming.organs) {
            auto it = target.organs.find(organ);
            if (it == target.organs.end()) {
                target.organs.emplace(organ, mask);
                continue;
            }
            auto merged = core::MaskOperations::computeUnion(it->second, mask);
            if (!merged) {
                logger->warn("{}: cannot merge {} from {}: {}", patientId, organ,
                             incoming.sourcePath.filename().string(),
                             merged.error().toString());
                failures.push_back(core::FailureRecord{
                    patientId, core::FailureReason::SegmentationReadFailed,
                    incoming.sourcePath.filename().string() + ": " + merged.error().toString()
                });
                continue;
            }
            it->second = *merged;
        }
    }
};

RecordAssembler::RecordAssembler() : impl_(std::make_unique<Impl>()) {}

RecordAssembler::~RecordAssembler() = default;

RecordAssembler::RecordAssembler(RecordAssembler&&) noexcept = default;
RecordAssembler& RecordAssembler::operator=(RecordAssembler&&) noexcept = default;

std::expected<AssemblyResult, core::FailureRecord>
RecordAssembler::assemble(const std::string& patientId,
                          const std::filesystem::path& patientPath,
                          std::vector<MatchedSeries> matched,
                          std::vector<core::Segmentation> segmentations,
                          const std::vector<std::string>& criterionOrder) const {
    if (matched.empty()) {
        return std::unexpected(core::FailureRecord{
            patientId, core::FailureReason::NoMatchingImages,
            "no series satisfied any criterion"
        });
    }

    std::stable_sort(matched.begin(), matched.end(),
        [](const MatchedSeries& a, const MatchedSeries& b) {
            return a.series.seriesInstanceUid < b.series.seriesInstanceUid;
        });

    AssemblyResult result;
    result.record.patientId = patientId;
    result.record.patientPath = patientPath;

    // One series per criterion, first in UID order
    std::map<std::string, core::RecordEntry> kept;
    std::vector<std::string> appearance;
    for (auto& item : matched) {
        if (kept.contains(item.criterionName)) {
            impl_->logger->warn("{}: series {} also satisfies {}, keeping {}",
                                patientId, item.series.seriesInstanceUid,
                                item.criterionName,
                                kept.at(item.criterionName).series.seriesInstanceUid);
            continue;
        }
        appearance.push_back(item.criterionName);
        kept.emplace(item.criterionName,
                     core::RecordEntry{item.criterionName, std::move(item.series), std::nullopt});
    }

    // Join on series UID
    std::map<std::string, core::RecordEntry*> byUid;
    for (auto& [name, entry] : kept) {
        byUid.emplace(entry.series.seriesInstanceUid, &entry);
    }
    for (auto& segmentation : segmentations) {
        auto it = byUid.find(segmentation.referencedSeriesUid);
        if (it == byUid.end()) {
            impl_->logger->warn("{}: {} references series {} which is not in the record",
                                patientId, segmentation.sourcePath.filename().string(),
                                segmentation.referencedSeriesUid);
            result.failures.push_back(core::FailureRecord{
                patientId, core::FailureReason::UnresolvedSegmentationReference,
                segmentation.sourcePath.filename().string() + " -> "
                    + segmentation.referencedSeriesUid
            });
            continue;
        }

        auto& entry = *it->second;
        if (!entry.segmentation) {
            entry.segmentation = std::move(segmentation);
        } else {
            impl_->logger->debug("{}: merging {} into the segmentation of {}",
                                 patientId, segmentation.sourcePath.filename().string(),
                                 entry.criterionName);
            impl_->merge(*entry.segmentation, segmentation, patientId, result.failures);
        }
    }

    // Configured order first, then the rest in order of appearance
    std::set<std::string> placed;
    auto place = [&](const std::string& name) {
        auto it = kept.find(name);
        if (it == kept.end() || placed.contains(name)) {
            return;
        }
        placed.insert(name);
        result.record.entries.push_back(std::move(it->second));
    };
    for (const auto& name : criterionOrder) {
        place(name);
    }
    for (const auto& name : appearance) {
        place(name);
    }

    impl_->logger->debug("{}: assembled {} entries", patientId, result.record.entries.size());
    return result;
}

}  // namespace dicom_extractor::services
