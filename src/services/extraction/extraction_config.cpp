#include "services/extraction/extraction_config.hpp"

#include "core/dataset_utils.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace dicom_extractor::services {

namespace {

using Json = nlohmann::ordered_json;
using NamedLists = std::vector<std::pair<std::string, std::vector<std::string>>>;

std::filesystem::path resolvePath(const std::filesystem::path& base,
                                  const std::string& value) {
    std::filesystem::path path(value);
    if (path.empty() || path.is_absolute() || base.empty()) {
        return path;
    }
    return base / path;
}

std::expected<NamedLists, ConfigError>
namedListsFromObject(const Json& j, const std::string& field) {
    if (!j.is_object()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            field + ": expected an object of name -> array of strings"
        });
    }
    NamedLists lists;
    for (const auto& item : j.items()) {
        if (!item.value().is_array()) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                field + "." + item.key() + ": expected an array of strings"
            });
        }
        lists.emplace_back(item.key(), item.value().get<std::vector<std::string>>());
    }
    return lists;
}

/// Inline object, or path string of a file holding the object
std::expected<NamedLists, ConfigError>
namedListsField(const Json& value, const std::string& field,
                const std::filesystem::path& base) {
    if (!value.is_string()) {
        return namedListsFromObject(value, field);
    }

    auto path = resolvePath(base, value.get<std::string>());
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileOpenFailed,
            field + ": " + path.string()
        });
    }
    try {
        return namedListsFromObject(Json::parse(file), field);
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::ParseError,
            path.string() + ": " + e.what()
        });
    }
}

std::expected<std::array<double, 3>, ConfigError> spacingField(const Json& value) {
    std::array<double, 3> spacing{};
    if (value.is_number()) {
        spacing.fill(value.get<double>());
    } else if (value.is_array() && value.size() == 3) {
        for (size_t i = 0; i < 3; ++i) {
            spacing[i] = value.at(i).get<double>();
        }
    } else {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "resampleSpacing: expected a number or an array of three numbers"
        });
    }
    for (double s : spacing) {
        if (!(s > 0.0)) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "resampleSpacing: values must be positive"
            });
        }
    }
    return spacing;
}

}  // anonymous namespace

std::expected<ExtractionConfig, ConfigError>
ExtractionConfig::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileOpenFailed,
            path.string()
        });
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path.parent_path());
}

std::expected<ExtractionConfig, ConfigError>
ExtractionConfig::parse(std::string_view json, const std::filesystem::path& baseDirectory) {
    ExtractionConfig config;
    try {
        auto j = Json::parse(std::string(json));
        if (!j.is_object()) {
            return std::unexpected(ConfigError{
                ConfigError::Code::ParseError,
                "configuration must be a JSON object"
            });
        }

        for (const char* field : {"patientsRoot", "destination"}) {
            if (!j.contains(field) || !j.at(field).is_string()
                || j.at(field).get<std::string>().empty()) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::MissingField,
                    field
                });
            }
        }
        config.patientsRoot = resolvePath(baseDirectory, j.at("patientsRoot").get<std::string>());
        config.destination = resolvePath(baseDirectory, j.at("destination").get<std::string>());
        config.overwrite = j.value("overwrite", false);

        if (j.contains("segmentationsDirectory")) {
            config.segmentationsDirectory = resolvePath(
                baseDirectory, j.at("segmentationsDirectory").get<std::string>());
        }
        config.patientPrefix = j.value("patientPrefix", "");

        config.matchTag = j.value("matchTag", std::string(core::dicom_tags::SeriesDescription));
        if (!core::parseTagKey(config.matchTag)) {
            return std::unexpected(ConfigError{
                ConfigError::Code::InvalidValue,
                "matchTag: '" + config.matchTag + "' is not a gggg|eeee tag"
            });
        }

        if (j.contains("matchCriteria") && !j.at("matchCriteria").is_null()) {
            auto criteria = namedListsField(j.at("matchCriteria"), "matchCriteria", baseDirectory);
            if (!criteria) {
                return std::unexpected(criteria.error());
            }
            config.matchCriteria = std::move(*criteria);
        }
        if (j.contains("matchCriteriaOutput")) {
            config.matchCriteriaOutput = resolvePath(
                baseDirectory, j.at("matchCriteriaOutput").get<std::string>());
        }

        if (j.contains("organAliases") && !j.at("organAliases").is_null()) {
            auto aliases = namedListsField(j.at("organAliases"), "organAliases", baseDirectory);
            if (!aliases) {
                return std::unexpected(aliases.error());
            }
            config.organAliases = std::move(*aliases);
        }

        config.attributes = j.value("attributes", std::vector<std::string>{});
        for (const auto& key : config.attributes) {
            if (!core::parseTagKey(key)) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "attributes: '" + key + "' is not a gggg|eeee tag"
                });
            }
        }
        config.organsToKeep = j.value("organsToKeep", std::vector<std::string>{});
        config.transpose = j.value("transpose", true);
        config.storeDicomHeader = j.value("storeDicomHeader", true);
        config.interactive = j.value("interactive", false);

        if (j.contains("resampleSpacing") && !j.at("resampleSpacing").is_null()) {
            auto spacing = spacingField(j.at("resampleSpacing"));
            if (!spacing) {
                return std::unexpected(spacing.error());
            }
            config.resampleSpacing = *spacing;
        }
        config.resampleCriteria = j.value("resampleCriteria", std::vector<std::string>{});

        if (j.contains("resampleInterpolation")) {
            auto name = j.at("resampleInterpolation").get<std::string>();
            auto interpolation = VolumeResampler::interpolationFromString(name);
            if (!interpolation) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "resampleInterpolation: unknown method '" + name + "'"
                });
            }
            config.resampleInterpolation = *interpolation;
        }

        if (j.contains("logging")) {
            const auto& log = j.at("logging");
            auto levelName = log.value("level", std::string("info"));
            auto level = logging::logLevelFromString(levelName);
            if (!level) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "logging.level: unknown level '" + levelName + "'"
                });
            }
            config.logging.level = *level;
            config.logging.enableFileLogging = log.value("file", false);
            if (log.contains("directory")) {
                config.logging.logDirectory = resolvePath(
                    baseDirectory, log.at("directory").get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::ParseError,
            e.what()
        });
    }
    return config;
}

}  // namespace dicom_extractor::services
