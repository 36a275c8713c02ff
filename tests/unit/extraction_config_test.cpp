#include <gtest/gtest.h>

#include "services/extraction/extraction_config.hpp"

#include <filesystem>
#include <fstream>

using namespace dicom_extractor;
using namespace dicom_extractor::services;

class ExtractionConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "dicom_extractor_config_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path writeFile(const std::string& name, const std::string& content) {
        auto path = tempDir_ / name;
        std::ofstream(path) << content;
        return path;
    }

    std::filesystem::path tempDir_;
};

// =============================================================================
// Required fields and defaults
// =============================================================================

TEST_F(ExtractionConfigTest, MinimalConfigUsesDefaults) {
    auto config = ExtractionConfig::parse(
        R"({"patientsRoot": "/data/patients", "destination": "/out/store.h5"})", "/base");
    ASSERT_TRUE(config.has_value()) << config.error().toString();

    EXPECT_EQ(config->patientsRoot, "/data/patients");
    EXPECT_EQ(config->destination, "/out/store.h5");
    EXPECT_FALSE(config->overwrite);
    EXPECT_TRUE(config->segmentationsDirectory.empty());
    EXPECT_EQ(config->matchTag, "0008|103e");
    EXPECT_TRUE(config->matchCriteria.empty());
    EXPECT_EQ(config->organAliases, SegmentAliaser::defaultTable());
    EXPECT_TRUE(config->transpose);
    EXPECT_TRUE(config->storeDicomHeader);
    EXPECT_FALSE(config->interactive);
    EXPECT_FALSE(config->resampleSpacing.has_value());
    EXPECT_EQ(config->resampleInterpolation, VolumeResampler::Interpolation::Linear);
    EXPECT_EQ(config->logging.level, logging::LogLevel::Info);
    EXPECT_FALSE(config->logging.enableFileLogging);
}

TEST_F(ExtractionConfigTest, MissingDestinationIsReported) {
    auto config = ExtractionConfig::parse(R"({"patientsRoot": "/data"})", "");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigError::Code::MissingField);
    EXPECT_EQ(config.error().message, "destination");
}

TEST_F(ExtractionConfigTest, EmptyPatientsRootIsMissing) {
    auto config = ExtractionConfig::parse(R"({"patientsRoot": "", "destination": "x.h5"})", "");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigError::Code::MissingField);
}

TEST_F(ExtractionConfigTest, MalformedJsonIsParseError) {
    auto config = ExtractionConfig::parse(R"({"patientsRoot": )", "");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigError::Code::ParseError);

    auto array = ExtractionConfig::parse("[1, 2]", "");
    ASSERT_FALSE(array.has_value());
    EXPECT_EQ(array.error().code, ConfigError::Code::ParseError);
}

// =============================================================================
// Full configuration
// =============================================================================

TEST_F(ExtractionConfigTest, FullConfigIsRead) {
    auto config = ExtractionConfig::parse(R"({
        "patientsRoot": "patients",
        "destination": "out/store.h5",
        "overwrite": true,
        "segmentationsDirectory": "segs",
        "patientPrefix": "Patient",
        "matchTag": "0018|1030",
        "matchCriteria": {"T2": ["t2_tse_tra"], "ADC": ["ep2d_diff_ADC", "ADC"]},
        "matchCriteriaOutput": "out/criteria.json",
        "organAliases": {},
        "attributes": ["0008|103E", "0018|0050"],
        "organsToKeep": ["Prostate"],
        "transpose": false,
        "storeDicomHeader": false,
        "interactive": true,
        "resampleSpacing": [0.5, 0.5, 3],
        "resampleCriteria": ["T2"],
        "resampleInterpolation": "bspline",
        "logging": {"level": "debug", "file": true, "directory": "logs"}
    })", "/base");
    ASSERT_TRUE(config.has_value()) << config.error().toString();

    EXPECT_EQ(config->patientsRoot, std::filesystem::path("/base/patients"));
    EXPECT_EQ(config->destination, std::filesystem::path("/base/out/store.h5"));
    EXPECT_TRUE(config->overwrite);
    EXPECT_EQ(config->segmentationsDirectory, std::filesystem::path("/base/segs"));
    EXPECT_EQ(config->patientPrefix, "Patient");
    EXPECT_EQ(config->matchTag, "0018|1030");

    ASSERT_EQ(config->matchCriteria.size(), 2u);
    EXPECT_EQ(config->matchCriteria[0].first, "T2");
    EXPECT_EQ(config->matchCriteria[1].first, "ADC");
    EXPECT_EQ(config->matchCriteria[1].second.size(), 2u);
    EXPECT_EQ(config->matchCriteriaOutput, std::filesystem::path("/base/out/criteria.json"));

    // An explicit empty table switches aliasing off
    EXPECT_TRUE(config->organAliases.empty());

    EXPECT_EQ(config->attributes.size(), 2u);
    EXPECT_EQ(config->organsToKeep, (std::vector<std::string>{"Prostate"}));
    EXPECT_FALSE(config->transpose);
    EXPECT_FALSE(config->storeDicomHeader);
    EXPECT_TRUE(config->interactive);
    ASSERT_TRUE(config->resampleSpacing.has_value());
    EXPECT_EQ(*config->resampleSpacing, (std::array<double, 3>{0.5, 0.5, 3.0}));
    EXPECT_EQ(config->resampleCriteria, (std::vector<std::string>{"T2"}));
    EXPECT_EQ(config->resampleInterpolation, VolumeResampler::Interpolation::BSpline);

    EXPECT_EQ(config->logging.level, logging::LogLevel::Debug);
    EXPECT_TRUE(config->logging.enableFileLogging);
    EXPECT_EQ(config->logging.logDirectory, std::filesystem::path("/base/logs"));
}

TEST_F(ExtractionConfigTest, ScalarSpacingAppliesToAllAxes) {
    auto config = ExtractionConfig::parse(
        R"({"patientsRoot": "p", "destination": "d.h5", "resampleSpacing": 2})", "");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(*config->resampleSpacing, (std::array<double, 3>{2.0, 2.0, 2.0}));
}

// =============================================================================
// Invalid values
// =============================================================================

TEST_F(ExtractionConfigTest, InvalidValuesAreRejected) {
    const std::string prefix = R"({"patientsRoot": "p", "destination": "d.h5", )";
    for (const std::string field : {
             R"("matchTag": "SeriesDescription")",
             R"("attributes": ["0008-103e"])",
             R"("resampleSpacing": [1, 0, 1])",
             R"("resampleSpacing": [1, 1])",
             R"("resampleInterpolation": "cubic")",
             R"("logging": {"level": "loud"})",
             R"("matchCriteria": ["T2"])",
             R"("organAliases": {"Prostate": "Segment_1"})",
         }) {
        auto config = ExtractionConfig::parse(prefix + field + "}", "");
        ASSERT_FALSE(config.has_value()) << field;
        EXPECT_EQ(config.error().code, ConfigError::Code::InvalidValue) << field;
    }
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ExtractionConfigTest, LoadResolvesAgainstConfigDirectory) {
    writeFile("criteria.json", R"({"T2": ["t2_tse_tra"]})");
    writeFile("organs.json", R"({"Gland": ["Segment_1"]})");
    auto path = writeFile("run.json", R"({
        "patientsRoot": "patients",
        "destination": "/abs/store.h5",
        "matchCriteria": "criteria.json",
        "organAliases": "organs.json"
    })");

    auto config = ExtractionConfig::loadFromFile(path);
    ASSERT_TRUE(config.has_value()) << config.error().toString();
    EXPECT_EQ(config->patientsRoot, tempDir_ / "patients");
    EXPECT_EQ(config->destination, std::filesystem::path("/abs/store.h5"));
    ASSERT_EQ(config->matchCriteria.size(), 1u);
    EXPECT_EQ(config->matchCriteria[0].first, "T2");
    ASSERT_EQ(config->organAliases.size(), 1u);
    EXPECT_EQ(config->organAliases[0].first, "Gland");
}

TEST_F(ExtractionConfigTest, MissingReferencedFileIsReported) {
    auto path = writeFile("run.json", R"({
        "patientsRoot": "patients",
        "destination": "store.h5",
        "matchCriteria": "nowhere.json"
    })");

    auto config = ExtractionConfig::loadFromFile(path);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigError::Code::FileOpenFailed);
}

TEST_F(ExtractionConfigTest, MissingConfigFileIsReported) {
    auto config = ExtractionConfig::loadFromFile(tempDir_ / "absent.json");
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ConfigError::Code::FileOpenFailed);
}
