#include <gtest/gtest.h>

#include "core/mask_operations.hpp"
#include "services/extraction/segment_aliaser.hpp"
#include "test_utils/volume_generator.hpp"

#include <filesystem>
#include <fstream>

using namespace dicom_extractor;
using namespace dicom_extractor::services;
using dicom_extractor::test_utils::createBoxMask;
using dicom_extractor::test_utils::Grid;

// =============================================================================
// Alias table
// =============================================================================

TEST(SegmentAliaserTest, EmptyTableIsIdentity) {
    SegmentAliaser aliaser;
    EXPECT_TRUE(aliaser.isIdentity());
    EXPECT_EQ(aliaser.canonicalName("Segment_7"), "Segment_7");
}

TEST(SegmentAliaserTest, DefaultTableMapsNumberedSegments) {
    auto aliaser = SegmentAliaser::create(SegmentAliaser::defaultTable());
    ASSERT_TRUE(aliaser.has_value());
    EXPECT_FALSE(aliaser->isIdentity());
    EXPECT_EQ(aliaser->canonicalName("Segment_1"), "Prostate");
    EXPECT_EQ(aliaser->canonicalName("Prostate"), "Prostate");
    EXPECT_EQ(aliaser->canonicalName("Segment_2"), "Rectum");
    EXPECT_EQ(aliaser->canonicalName("Segment_3"), "Bladder");
    EXPECT_FALSE(aliaser->canonicalName("Segment_4").has_value());
    EXPECT_FALSE(aliaser->canonicalName("prostate").has_value());
}

TEST(SegmentAliaserTest, LabelListedForTwoOrgansIsRejected) {
    auto aliaser = SegmentAliaser::create({
        {"Prostate", {"gland"}},
        {"Bladder", {"gland"}},
    });
    ASSERT_FALSE(aliaser.has_value());
    EXPECT_EQ(aliaser.error().code, AliasError::Code::OverlappingAliases);
}

TEST(SegmentAliaserTest, RepeatedLabelForSameOrganIsAccepted) {
    auto aliaser = SegmentAliaser::create({{"Prostate", {"gland", "gland"}}});
    ASSERT_TRUE(aliaser.has_value());
    EXPECT_EQ(aliaser->canonicalName("gland"), "Prostate");
}

// =============================================================================
// Applying to segments
// =============================================================================

TEST(SegmentAliaserTest, UnmappedSegmentsAreDropped) {
    auto aliaser = SegmentAliaser::create(SegmentAliaser::defaultTable());
    ASSERT_TRUE(aliaser.has_value());

    Grid grid;
    std::vector<core::Segment> segments = {
        {"Segment_1", createBoxMask(grid, {0, 0, 0}, {1, 1, 1})},
        {"Urethra", createBoxMask(grid, {2, 2, 2}, {2, 2, 2})},
    };

    auto organs = aliaser->apply(segments);
    ASSERT_TRUE(organs.has_value()) << organs.error().toString();
    ASSERT_EQ(organs->size(), 1u);
    ASSERT_EQ(organs->count("Prostate"), 1u);
    EXPECT_EQ(core::MaskOperations::countForeground(organs->at("Prostate")), 8u);
}

TEST(SegmentAliaserTest, SegmentsSharingAnOrganAreMerged) {
    auto aliaser = SegmentAliaser::create(SegmentAliaser::defaultTable());
    ASSERT_TRUE(aliaser.has_value());

    Grid grid;
    auto first = createBoxMask(grid, {0, 0, 0}, {0, 0, 0});
    auto second = createBoxMask(grid, {1, 0, 0}, {1, 0, 0});
    std::vector<core::Segment> segments = {
        {"Segment_1", first},
        {"Prostate", second},
    };

    auto organs = aliaser->apply(segments);
    ASSERT_TRUE(organs.has_value());
    ASSERT_EQ(organs->size(), 1u);
    EXPECT_EQ(core::MaskOperations::countForeground(organs->at("Prostate")), 2u);
    EXPECT_EQ(core::MaskOperations::countForeground(first), 1u);
    EXPECT_EQ(core::MaskOperations::countForeground(second), 1u);
}

TEST(SegmentAliaserTest, IdentityKeepsRawLabels) {
    SegmentAliaser aliaser;
    Grid grid;
    std::vector<core::Segment> segments = {
        {"Segment_1", createBoxMask(grid, {0, 0, 0}, {0, 0, 0})},
        {"Segment_2", createBoxMask(grid, {1, 1, 1}, {1, 1, 1})},
    };

    auto organs = aliaser.apply(segments);
    ASSERT_TRUE(organs.has_value());
    EXPECT_EQ(organs->size(), 2u);
    EXPECT_EQ(organs->count("Segment_1"), 1u);
    EXPECT_EQ(organs->count("Segment_2"), 1u);
}

TEST(SegmentAliaserTest, MergingIncongruentMasksFails) {
    auto aliaser = SegmentAliaser::create({{"Prostate", {"a", "b"}}});
    ASSERT_TRUE(aliaser.has_value());

    Grid small;
    Grid large;
    large.size = {8, 8, 3};
    std::vector<core::Segment> segments = {
        {"a", createBoxMask(small, {0, 0, 0}, {0, 0, 0})},
        {"b", createBoxMask(large, {0, 0, 0}, {0, 0, 0})},
    };

    auto organs = aliaser->apply(segments);
    ASSERT_FALSE(organs.has_value());
    EXPECT_EQ(organs.error().code, AliasError::Code::IncompatibleMasks);
}

// =============================================================================
// Loading
// =============================================================================

class SegmentAliaserFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "dicom_extractor_aliaser_test";
        std::filesystem::remove_all(tempDir_);
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    std::filesystem::path tempDir_;
};

TEST_F(SegmentAliaserFileTest, LoadsOrganToLabelsObject) {
    auto path = tempDir_ / "aliases.json";
    std::ofstream(path) << R"({"Prostate": ["Segment_1", "gland"], "Rectum": ["rect"]})";

    auto aliaser = SegmentAliaser::loadFromFile(path);
    ASSERT_TRUE(aliaser.has_value()) << aliaser.error().toString();
    EXPECT_EQ(aliaser->canonicalName("gland"), "Prostate");
    EXPECT_EQ(aliaser->canonicalName("rect"), "Rectum");
}

TEST_F(SegmentAliaserFileTest, MalformedFileIsRejected) {
    auto path = tempDir_ / "aliases.json";
    std::ofstream(path) << R"({"Prostate": "Segment_1"})";

    auto aliaser = SegmentAliaser::loadFromFile(path);
    ASSERT_FALSE(aliaser.has_value());
    EXPECT_EQ(aliaser.error().code, AliasError::Code::InvalidFormat);
}

TEST_F(SegmentAliaserFileTest, MissingFileIsReported) {
    auto aliaser = SegmentAliaser::loadFromFile(tempDir_ / "none.json");
    ASSERT_FALSE(aliaser.has_value());
    EXPECT_EQ(aliaser.error().code, AliasError::Code::FileOpenFailed);
}
