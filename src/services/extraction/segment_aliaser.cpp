#include "services/extraction/segment_aliaser.hpp"

#include "core/logging.hpp"
#include "core/mask_operations.hpp"

#include <fstream>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace dicom_extractor::services {

class SegmentAliaser::Impl {
public:
    /// raw label -> canonical organ
    std::unordered_map<std::string, std::string> aliases;
    std::shared_ptr<spdlog::logger> logger;

    Impl() : logger(logging::LoggerFactory::create("SegmentAliaser")) {}
};

SegmentAliaser::SegmentAliaser() : impl_(std::make_unique<Impl>()) {}

SegmentAliaser::~SegmentAliaser() = default;

SegmentAliaser::SegmentAliaser(SegmentAliaser&&) noexcept = default;
SegmentAliaser& SegmentAliaser::operator=(SegmentAliaser&&) noexcept = default;

std::expected<SegmentAliaser, AliasError>
SegmentAliaser::create(const AliasTable& table) {
    SegmentAliaser aliaser;
    for (const auto& [organ, rawLabels] : table) {
        for (const auto& rawLabel : rawLabels) {
            auto [it, inserted] = aliaser.impl_->aliases.emplace(rawLabel, organ);
            if (!inserted && it->second != organ) {
                return std::unexpected(AliasError{
                    AliasError::Code::OverlappingAliases,
                    "'" + rawLabel + "' is listed for both '" + it->second
                        + "' and '" + organ + "'"
                });
            }
        }
    }
    return aliaser;
}

std::expected<SegmentAliaser, AliasError>
SegmentAliaser::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(AliasError{
            AliasError::Code::FileOpenFailed,
            path.string()
        });
    }

    AliasTable table;
    try {
        auto j = nlohmann::ordered_json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(AliasError{
                AliasError::Code::InvalidFormat,
                path.string() + ": expected an object of organ -> labels"
            });
        }
        for (const auto& item : j.items()) {
            table.emplace_back(item.key(),
                               item.value().get<std::vector<std::string>>());
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(AliasError{
            AliasError::Code::InvalidFormat,
            path.string() + ": " + e.what()
        });
    }
    return create(table);
}

SegmentAliaser::AliasTable SegmentAliaser::defaultTable() {
    return {
        {organs::Prostate, {"Segment_1", "Prostate"}},
        {organs::Rectum, {"Segment_2", "Rectum"}},
        {organs::Bladder, {"Segment_3", "Bladder"}},
    };
}

bool SegmentAliaser::isIdentity() const noexcept {
    return impl_->aliases.empty();
}

std::optional<std::string>
SegmentAliaser::canonicalName(const std::string& rawLabel) const {
    if (isIdentity()) {
        return rawLabel;
    }
    auto it = impl_->aliases.find(rawLabel);
    if (it == impl_->aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::expected<std::map<std::string, core::MaskType::Pointer>, AliasError>
SegmentAliaser::apply(const std::vector<core::Segment>& segments) const {
    std::map<std::string, core::MaskType::Pointer> result;

    for (const auto& segment : segments) {
        auto organ = canonicalName(segment.label);
        if (!organ) {
            impl_->logger->warn("Segment '{}' has no canonical organ, dropped",
                                segment.label);
            continue;
        }

        auto existing = result.find(*organ);
        if (existing == result.end()) {
            result.emplace(*organ, core::MaskOperations::binarize(segment.mask));
            continue;
        }

        impl_->logger->debug("Merging segment '{}' into organ '{}'",
                             segment.label, *organ);
        auto merged = core::MaskOperations::computeUnion(existing->second, segment.mask);
        if (!merged) {
            return std::unexpected(AliasError{
                AliasError::Code::IncompatibleMasks,
                "'" + segment.label + "' -> '" + *organ + "': "
                    + merged.error().toString()
            });
        }
        existing->second = *merged;
    }

    return result;
}

}  // namespace dicom_extractor::services
