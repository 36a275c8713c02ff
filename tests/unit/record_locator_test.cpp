#include <gtest/gtest.h>

#include "services/extraction/record_locator.hpp"

#include <filesystem>
#include <fstream>

using namespace dicom_extractor::services;

class RecordLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "dicom_extractor_locator_test";
        std::filesystem::remove_all(tempDir_);
        root_ = tempDir_ / "patients";
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    void touch(const std::filesystem::path& path) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << "x";
    }

    std::filesystem::path tempDir_;
    std::filesystem::path root_;
};

// =============================================================================
// Patient listing
// =============================================================================

TEST_F(RecordLocatorTest, ListsPatientDirectoriesSorted) {
    std::filesystem::create_directories(root_ / "Patient10");
    std::filesystem::create_directories(root_ / "Patient02");
    std::filesystem::create_directories(root_ / ".cache");
    touch(root_ / "notes.txt");

    RecordLocator locator({root_, {}, {}});
    auto patients = locator.listPatients();
    ASSERT_EQ(patients.size(), 2u);
    EXPECT_EQ(patients[0].filename(), "Patient02");
    EXPECT_EQ(patients[1].filename(), "Patient10");
}

TEST_F(RecordLocatorTest, MissingRootGivesNoPatients) {
    RecordLocator locator({tempDir_ / "absent", {}, {}});
    EXPECT_TRUE(locator.listPatients().empty());
}

TEST_F(RecordLocatorTest, SharedSegmentationDirectoryIsNotAPatient) {
    std::filesystem::create_directories(root_ / "Patient1");
    std::filesystem::create_directories(root_ / "Segmentations");

    RecordLocator locator({root_, root_ / "Segmentations", "Patient"});
    auto patients = locator.listPatients();
    ASSERT_EQ(patients.size(), 1u);
    EXPECT_EQ(patients[0].filename(), "Patient1");
}

// =============================================================================
// Source collection
// =============================================================================

TEST_F(RecordLocatorTest, CollectsFilesRecursively) {
    auto patient = root_ / "Patient7";
    touch(patient / "study" / "series_b" / "IM0002");
    touch(patient / "study" / "series_a" / "IM0001.dcm");
    touch(patient / "labels_1.2.3.seg.nrrd");
    touch(patient / ".DS_Store");
    touch(patient / "DICOMDIR");

    RecordLocator locator({root_, {}, {}});
    auto sources = locator.locate(patient);

    EXPECT_EQ(sources.patientPath, patient);
    EXPECT_EQ(sources.patientNumber, 7);
    ASSERT_EQ(sources.dicomFiles.size(), 2u);
    EXPECT_EQ(sources.dicomFiles[0].filename(), "IM0001.dcm");
    EXPECT_EQ(sources.dicomFiles[1].filename(), "IM0002");
    ASSERT_EQ(sources.labelVolumes.size(), 1u);
    EXPECT_EQ(sources.labelVolumes[0].path.filename(), "labels_1.2.3.seg.nrrd");
    EXPECT_EQ(sources.labelVolumes[0].format, SegmentationFormat::FilenameConvention);
}

TEST_F(RecordLocatorTest, PatientWithoutDigitsHasNoNumber) {
    auto patient = root_ / "Anonymous";
    std::filesystem::create_directories(patient);

    RecordLocator locator({root_, {}, {}});
    auto sources = locator.locate(patient);
    EXPECT_FALSE(sources.patientNumber.has_value());
    EXPECT_TRUE(sources.dicomFiles.empty());
    EXPECT_TRUE(sources.labelVolumes.empty());
}

TEST_F(RecordLocatorTest, SharedLabelVolumesMatchByPatientNumber) {
    auto shared = tempDir_ / "segmentations";
    touch(shared / "Patient3_1.2.3.nrrd");
    touch(shared / "Patient33_1.2.3.nrrd");
    touch(shared / "Patient03_extra.nii.gz");
    touch(shared / "Patient3_readme.txt");
    auto patient = root_ / "Patient3";
    touch(patient / "own_1.2.3.nrrd");

    RecordLocator locator({root_, shared, "Patient"});
    auto sources = locator.locate(patient);

    ASSERT_EQ(sources.labelVolumes.size(), 3u);
    EXPECT_EQ(sources.labelVolumes[0].path.filename(), "own_1.2.3.nrrd");
    EXPECT_EQ(sources.labelVolumes[1].path.filename(), "Patient03_extra.nii.gz");
    EXPECT_EQ(sources.labelVolumes[2].path.filename(), "Patient3_1.2.3.nrrd");
}

TEST_F(RecordLocatorTest, SharedDirectoryNeedsPrefix) {
    auto shared = tempDir_ / "segmentations";
    touch(shared / "Patient3_1.2.3.nrrd");
    auto patient = root_ / "Patient3";
    std::filesystem::create_directories(patient);

    RecordLocator locator({root_, shared, ""});
    EXPECT_TRUE(locator.locate(patient).labelVolumes.empty());
    EXPECT_EQ(locator.options().segmentationsDirectory, shared);
}
