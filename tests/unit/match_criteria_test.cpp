#include <gtest/gtest.h>

#include "services/extraction/match_criteria.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>

using namespace dicom_extractor;
using namespace dicom_extractor::services;

namespace {

core::ImageSeries makeSeries(const std::string& uid, const std::string& description,
                             const std::string& protocol = "")
{
    core::ImageSeries series;
    series.seriesInstanceUid = uid;
    series.seriesDescription = description;
    if (!description.empty()) {
        series.metadata["0008|103e"] = description;
    }
    if (!protocol.empty()) {
        series.metadata["0018|1030"] = protocol;
    }
    return series;
}

MatchCriteria prostateCriteria()
{
    auto criteria = MatchCriteria::create({
        {"T2", {"t2_tse_tra", "T2 AXIAL"}},
        {"ADC", {"ep2d_diff_ADC"}},
    });
    EXPECT_TRUE(criteria.has_value());
    return std::move(*criteria);
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TEST(MatchCriteriaTest, DefaultIsIdentity) {
    MatchCriteria criteria;
    EXPECT_TRUE(criteria.isIdentity());
    EXPECT_TRUE(criteria.criterionNames().empty());
    EXPECT_EQ(criteria.tagKey(), "0008|103e");
}

TEST(MatchCriteriaTest, CriterionNamesKeepConfigurationOrder) {
    auto criteria = prostateCriteria();
    EXPECT_EQ(criteria.criterionNames(), (std::vector<std::string>{"T2", "ADC"}));
    ASSERT_NE(criteria.acceptedDescriptions("T2"), nullptr);
    EXPECT_EQ(criteria.acceptedDescriptions("T2")->size(), 2u);
    EXPECT_EQ(criteria.acceptedDescriptions("DWI"), nullptr);
}

TEST(MatchCriteriaTest, OverlappingDescriptionsAreRejected) {
    auto criteria = MatchCriteria::create({
        {"A", {"shared"}},
        {"B", {"other", "shared"}},
    });
    ASSERT_FALSE(criteria.has_value());
    EXPECT_EQ(criteria.error().code, MatchError::Code::OverlappingCriteria);
}

TEST(MatchCriteriaTest, DuplicateCriterionIsRejected) {
    auto criteria = MatchCriteria::create({{"A", {"x"}}, {"A", {"y"}}});
    ASSERT_FALSE(criteria.has_value());
    EXPECT_EQ(criteria.error().code, MatchError::Code::InvalidFormat);
}

// =============================================================================
// Matching
// =============================================================================

TEST(MatchCriteriaTest, ExactMembershipMatches) {
    auto criteria = prostateCriteria();
    EXPECT_EQ(criteria.match("t2_tse_tra"), "T2");
    EXPECT_EQ(criteria.match("T2 AXIAL"), "T2");
    EXPECT_EQ(criteria.match("ep2d_diff_ADC"), "ADC");
}

TEST(MatchCriteriaTest, NoNormalizationIsApplied) {
    auto criteria = prostateCriteria();
    EXPECT_FALSE(criteria.match("T2_TSE_TRA").has_value());
    EXPECT_FALSE(criteria.match("t2_tse_tra ").has_value());
    EXPECT_FALSE(criteria.match("").has_value());
}

TEST(MatchCriteriaTest, IdentityReturnsDescription) {
    MatchCriteria criteria;
    EXPECT_EQ(criteria.match("anything at all"), "anything at all");
    EXPECT_EQ(criteria.matchSeries(makeSeries("1.2.3", "AXIAL")), "AXIAL");
}

TEST(MatchCriteriaTest, IdentityFallsBackToUidForEmptyDescription) {
    MatchCriteria criteria;
    EXPECT_EQ(criteria.matchSeries(makeSeries("1.2.3", "")), "1.2.3");
}

TEST(MatchCriteriaTest, MatchSeriesUsesConfiguredTag) {
    auto criteria = MatchCriteria::create({{"T2", {"prostate_t2"}}}, "0018|1030");
    ASSERT_TRUE(criteria.has_value());
    EXPECT_EQ(criteria->matchSeries(makeSeries("1.2.3", "whatever", "prostate_t2")), "T2");
    EXPECT_FALSE(criteria->matchSeries(makeSeries("1.2.4", "prostate_t2")).has_value());
}

// =============================================================================
// Mutation
// =============================================================================

TEST(MatchCriteriaTest, AddAcceptedDescriptionGrowsSetAndNotifies) {
    auto criteria = prostateCriteria();
    std::vector<std::pair<std::string, std::string>> notified;
    criteria.setChangeObserver([&notified](const std::string& c, const std::string& d) {
        notified.emplace_back(c, d);
    });

    auto updated = criteria.addAcceptedDescription("ADC", "ADC_map");
    ASSERT_TRUE(updated.has_value()) << updated.error().toString();
    EXPECT_EQ(*updated, (std::vector<std::string>{"ep2d_diff_ADC", "ADC_map"}));
    EXPECT_EQ(criteria.match("ADC_map"), "ADC");
    ASSERT_EQ(notified.size(), 1u);
    EXPECT_EQ(notified[0].first, "ADC");
    EXPECT_EQ(notified[0].second, "ADC_map");
}

TEST(MatchCriteriaTest, AddingKnownDescriptionIsNoOp) {
    auto criteria = prostateCriteria();
    int calls = 0;
    criteria.setChangeObserver([&calls](const std::string&, const std::string&) { ++calls; });

    auto updated = criteria.addAcceptedDescription("T2", "T2 AXIAL");
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->size(), 2u);
    EXPECT_EQ(calls, 0);
}

TEST(MatchCriteriaTest, AddToUnknownCriterionFails) {
    auto criteria = prostateCriteria();
    auto updated = criteria.addAcceptedDescription("DWI", "ep2d_diff");
    ASSERT_FALSE(updated.has_value());
    EXPECT_EQ(updated.error().code, MatchError::Code::UnknownCriterion);
}

TEST(MatchCriteriaTest, AddKeepsSetsDisjoint) {
    auto criteria = prostateCriteria();
    auto updated = criteria.addAcceptedDescription("ADC", "t2_tse_tra");
    ASSERT_FALSE(updated.has_value());
    EXPECT_EQ(updated.error().code, MatchError::Code::OverlappingCriteria);
    EXPECT_EQ(criteria.match("t2_tse_tra"), "T2");
}

// =============================================================================
// Persistence
// =============================================================================

class MatchCriteriaFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "dicom_extractor_criteria_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
};

TEST_F(MatchCriteriaFileTest, SaveAndLoadPreserveOrderAndAdditions) {
    auto criteria = prostateCriteria();
    ASSERT_TRUE(criteria.addAcceptedDescription("ADC", "ADC_map").has_value());

    auto path = tempDir_ / "criteria.json";
    auto saved = criteria.saveToFile(path);
    ASSERT_TRUE(saved.has_value()) << saved.error().toString();

    auto loaded = MatchCriteria::loadFromFile(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().toString();
    EXPECT_EQ(loaded->criteria(), criteria.criteria());
}

TEST_F(MatchCriteriaFileTest, LoadRejectsNonObject) {
    auto path = tempDir_ / "bad.json";
    std::ofstream(path) << R"(["T2", "ADC"])";

    auto loaded = MatchCriteria::loadFromFile(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, MatchError::Code::InvalidFormat);
}

TEST_F(MatchCriteriaFileTest, LoadReportsMissingFile) {
    auto loaded = MatchCriteria::loadFromFile(tempDir_ / "missing.json");
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, MatchError::Code::FileOpenFailed);
}

TEST_F(MatchCriteriaFileTest, SavedFileIsNameToArrayObject) {
    auto criteria = prostateCriteria();
    auto path = tempDir_ / "criteria.json";
    ASSERT_TRUE(criteria.saveToFile(path).has_value());

    std::ifstream file(path);
    auto j = nlohmann::json::parse(file);
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j.at("ADC").get<std::vector<std::string>>(),
              (std::vector<std::string>{"ep2d_diff_ADC"}));
}
