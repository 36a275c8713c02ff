#include "services/extraction/match_criteria.hpp"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

namespace dicom_extractor::services {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

}  // anonymous namespace

MatchCriteria::MatchCriteria() = default;

std::expected<MatchCriteria, MatchError>
MatchCriteria::create(CriteriaList criteria, std::string tagKey) {
    for (size_t i = 0; i < criteria.size(); ++i) {
        for (size_t j = i + 1; j < criteria.size(); ++j) {
            if (criteria[i].first == criteria[j].first) {
                return std::unexpected(MatchError{
                    MatchError::Code::InvalidFormat,
                    "criterion '" + criteria[i].first + "' is defined twice"
                });
            }
            for (const auto& description : criteria[i].second) {
                if (contains(criteria[j].second, description)) {
                    return std::unexpected(MatchError{
                        MatchError::Code::OverlappingCriteria,
                        "'" + description + "' is accepted by both '"
                            + criteria[i].first + "' and '" + criteria[j].first + "'"
                    });
                }
            }
        }
    }

    MatchCriteria result;
    result.criteria_ = std::move(criteria);
    result.tagKey_ = std::move(tagKey);
    return result;
}

std::expected<MatchCriteria, MatchError>
MatchCriteria::loadFromFile(const std::filesystem::path& path, std::string tagKey) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(MatchError{
            MatchError::Code::FileOpenFailed,
            path.string()
        });
    }

    CriteriaList criteria;
    try {
        auto j = nlohmann::ordered_json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(MatchError{
                MatchError::Code::InvalidFormat,
                path.string() + ": expected an object of name -> descriptions"
            });
        }
        for (const auto& item : j.items()) {
            criteria.emplace_back(item.key(),
                                  item.value().get<std::vector<std::string>>());
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(MatchError{
            MatchError::Code::InvalidFormat,
            path.string() + ": " + e.what()
        });
    }

    return create(std::move(criteria), std::move(tagKey));
}

std::expected<void, MatchError>
MatchCriteria::saveToFile(const std::filesystem::path& path) const {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    for (const auto& [name, descriptions] : criteria_) {
        j[name] = descriptions;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        return std::unexpected(MatchError{
            MatchError::Code::FileWriteFailed,
            path.string()
        });
    }
    file << j.dump(4);
    if (!file) {
        return std::unexpected(MatchError{
            MatchError::Code::FileWriteFailed,
            path.string()
        });
    }
    return {};
}

std::vector<std::string> MatchCriteria::criterionNames() const {
    std::vector<std::string> names;
    names.reserve(criteria_.size());
    for (const auto& [name, descriptions] : criteria_) {
        names.push_back(name);
    }
    return names;
}

const std::vector<std::string>*
MatchCriteria::acceptedDescriptions(const std::string& criterion) const {
    for (const auto& [name, descriptions] : criteria_) {
        if (name == criterion) {
            return &descriptions;
        }
    }
    return nullptr;
}

std::optional<std::string> MatchCriteria::match(const std::string& description) const {
    if (isIdentity()) {
        return description;
    }
    for (const auto& [name, descriptions] : criteria_) {
        if (contains(descriptions, description)) {
            return name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> MatchCriteria::matchSeries(const core::ImageSeries& series) const {
    const auto description = descriptionOf(series);
    if (isIdentity() && description.empty()) {
        return series.seriesInstanceUid;
    }
    return match(description);
}

std::string MatchCriteria::descriptionOf(const core::ImageSeries& series) const {
    return series.value(tagKey_);
}

std::expected<std::vector<std::string>, MatchError>
MatchCriteria::addAcceptedDescription(const std::string& criterion,
                                      const std::string& description) {
    auto target = std::find_if(criteria_.begin(), criteria_.end(),
        [&criterion](const auto& entry) { return entry.first == criterion; });
    if (target == criteria_.end()) {
        return std::unexpected(MatchError{
            MatchError::Code::UnknownCriterion,
            criterion
        });
    }

    for (const auto& [name, descriptions] : criteria_) {
        if (name != criterion && contains(descriptions, description)) {
            return std::unexpected(MatchError{
                MatchError::Code::OverlappingCriteria,
                "'" + description + "' is already accepted by '" + name + "'"
            });
        }
    }

    if (!contains(target->second, description)) {
        target->second.push_back(description);
        if (observer_) {
            observer_(criterion, description);
        }
    }
    return target->second;
}

void MatchCriteria::setChangeObserver(ChangeObserver observer) {
    observer_ = std::move(observer);
}

}  // namespace dicom_extractor::services
