#include <gtest/gtest.h>

#include "services/extraction/filename_patterns.hpp"

using namespace dicom_extractor::services;

TEST(LastNumberInTest, TakesTheLastRunOfDigits) {
    EXPECT_EQ(lastNumberIn("Patient-07_b12"), 12);
    EXPECT_EQ(lastNumberIn("Patient7"), 7);
    EXPECT_EQ(lastNumberIn("case_003_final"), 3);
}

TEST(LastNumberInTest, NoDigitsGivesNothing) {
    EXPECT_FALSE(lastNumberIn("PatientA").has_value());
    EXPECT_FALSE(lastNumberIn("").has_value());
}

TEST(NumberAfterPrefixTest, ReadsDigitsFollowingPrefix) {
    EXPECT_EQ(numberAfterPrefix("seg_Patient7_1.2.3.nrrd", "Patient"), 7);
    EXPECT_EQ(numberAfterPrefix("Patient12.nii.gz", "Patient"), 12);
}

TEST(NumberAfterPrefixTest, SkipsOccurrencesWithoutDigits) {
    EXPECT_EQ(numberAfterPrefix("Patient_labels_Patient3.nrrd", "Patient"), 3);
}

TEST(NumberAfterPrefixTest, MissingPrefixGivesNothing) {
    EXPECT_FALSE(numberAfterPrefix("Case7.nrrd", "Patient").has_value());
    EXPECT_FALSE(numberAfterPrefix("Patient7.nrrd", "").has_value());
    EXPECT_FALSE(numberAfterPrefix("PatientX.nrrd", "Patient").has_value());
}

TEST(NumberAfterPrefixTest, PrefixIsCaseSensitive) {
    EXPECT_FALSE(numberAfterPrefix("patient7.nrrd", "Patient").has_value());
}

TEST(LabelVolumeExtensionTest, RecognizedExtensions) {
    EXPECT_TRUE(hasLabelVolumeExtension("a/Patient1.seg.nrrd"));
    EXPECT_TRUE(hasLabelVolumeExtension("labels.nhdr"));
    EXPECT_TRUE(hasLabelVolumeExtension("labels.nii"));
    EXPECT_TRUE(hasLabelVolumeExtension("labels.NII.GZ"));
    EXPECT_TRUE(hasLabelVolumeExtension("labels.mha"));
    EXPECT_TRUE(hasLabelVolumeExtension("labels.mhd"));
}

TEST(LabelVolumeExtensionTest, OtherFilesAreNotLabelVolumes) {
    EXPECT_FALSE(hasLabelVolumeExtension("slice_0.dcm"));
    EXPECT_FALSE(hasLabelVolumeExtension("IM00001"));
    EXPECT_FALSE(hasLabelVolumeExtension("labels.gz"));
    EXPECT_FALSE(hasLabelVolumeExtension("labels.raw"));
}
