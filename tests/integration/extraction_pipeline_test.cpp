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

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <H5Cpp.h>
#include <itkImageFileWriter.h>

#include "services/export/patient_store_writer.hpp"
#include "services/extraction/extraction_driver.hpp"

#include "../test_utils/synthetic_dicom.hpp"
#include "../test_utils/volume_generator.hpp"

using namespace dicom_extractor;
using namespace dicom_extractor::services;
namespace synthetic = dicom_extractor::test_utils;

// =============================================================================
// Helpers
// =============================================================================

namespace {

constexpr const char* kCtUid = "1.2.3.4.100";

std::vector<char> readBytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::vector<uint8_t> readMask(const H5::Group& group, const std::string& name) {
    auto dataset = group.openDataSet(name);
    auto space = dataset.getSpace();
    std::vector<uint8_t> values(space.getSimpleExtentNpoints());
    dataset.read(values.data(), H5::PredType::NATIVE_UINT8);
    return values;
}

}  // namespace

// =============================================================================
// Fixture: patients root with real DICOM files, run through ITK and HDF5
// =============================================================================

class ExtractionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = std::filesystem::temp_directory_path() / "dicom_extractor_pipeline_test";
        std::filesystem::remove_all(tempDir_);
        root_ = tempDir_ / "patients";
        shared_ = tempDir_ / "segmentations";
        destination_ = tempDir_ / "store.h5";
        std::filesystem::create_directories(root_);
        std::filesystem::create_directories(shared_);

        auto criteria = MatchCriteria::create({{"CT", {"AXIAL CT"}}});
        ASSERT_TRUE(criteria.has_value());
        criteria_ = std::move(*criteria);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir_);
    }

    void writeCt(const std::string& patientDir, const std::string& patientId) {
        synthetic::ImageSeriesSpec spec;
        spec.patientId = patientId;
        spec.seriesUid = kCtUid;
        auto files = synthetic::writeImageSeries(root_ / patientDir / "ct", spec);
        ASSERT_EQ(files.size(), 3u);
    }

    std::expected<StoreSummary, StoreError> run(bool overwrite = false) {
        auto aliaser = SegmentAliaser::create(SegmentAliaser::defaultTable());
        EXPECT_TRUE(aliaser.has_value());
        ExtractionDriver driver(RecordLocator({root_, shared_, "Patient"}),
                                criteria_, std::move(*aliaser));
        PatientStoreWriter writer;
        return writer.create(driver, destination_, overwrite);
    }

    std::filesystem::path tempDir_;
    std::filesystem::path root_;
    std::filesystem::path shared_;
    std::filesystem::path destination_;
    MatchCriteria criteria_;
};

// Scenario A: one matching CT series and no segmentation
TEST_F(ExtractionPipelineTest, SingleSeriesWithoutSegmentation) {
    writeCt("Patient1", "P001");

    auto summary = run();
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();
    EXPECT_EQ(summary->written, 1u);
    EXPECT_EQ(summary->failed, 0u);

    H5::H5File file(destination_.string(), H5F_ACC_RDONLY);
    auto patient = file.openGroup("P001");
    EXPECT_EQ(patient.getNumObjs(), 1u);

    auto ct = patient.openGroup("CT");
    EXPECT_TRUE(ct.nameExists("Image"));
    EXPECT_TRUE(ct.nameExists("Dicom_header"));
    EXPECT_EQ(ct.getNumObjs(), 2u);

    // Pixels survive the GDCM write and ITK read: (x=3, y=2, z=1) in [y][x][z]
    auto image = ct.openDataSet("Image");
    std::vector<float> pixels(48);
    image.read(pixels.data(), H5::PredType::NATIVE_FLOAT);
    EXPECT_FLOAT_EQ(pixels[(2 * 4 + 3) * 3 + 1], 123.0f);

    std::vector<double> spacing(3);
    ct.openAttribute("Spacing").read(H5::PredType::NATIVE_DOUBLE, spacing.data());
    EXPECT_NEAR(spacing[2], 2.0, 1e-6);
}

// Scenario B: two raw labels aliased to one organ are OR-merged
TEST_F(ExtractionPipelineTest, AliasedLabelsAreMerged) {
    writeCt("Patient2", "P002");

    synthetic::SegSpec seg;
    seg.patientId = "P002";
    seg.referencedSeriesUid = kCtUid;
    seg.segments = {{1, "Segment_1"}, {2, "Prostate"}};
    std::vector<uint8_t> first(16, 0);
    first[1 * 4 + 1] = 1;
    std::vector<uint8_t> second(16, 0);
    second[2 * 4 + 2] = 1;
    second[1 * 4 + 1] = 1;
    seg.frames = {
        {1, {0.0, 0.0, 2.0}, first},
        {2, {0.0, 0.0, 2.0}, second},
    };
    ASSERT_TRUE(synthetic::writeSegmentation(root_ / "Patient2" / "seg.dcm", seg));

    auto summary = run();
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();
    EXPECT_EQ(summary->written, 1u);

    H5::H5File file(destination_.string(), H5F_ACC_RDONLY);
    auto ct = file.openGroup("/P002/CT");
    ASSERT_TRUE(ct.nameExists("Prostate"));
    EXPECT_FALSE(ct.nameExists("Segment_1"));

    auto mask = readMask(ct, "Prostate");
    ASSERT_EQ(mask.size(), 48u);
    size_t count = 0;
    for (auto value : mask) {
        count += value;
    }
    EXPECT_EQ(count, 2u);
    EXPECT_EQ(mask[(1 * 4 + 1) * 3 + 1], 1);
    EXPECT_EQ(mask[(2 * 4 + 2) * 3 + 1], 1);
}

// Scenario C: a label volume naming no loaded series is dropped, the image is kept
TEST_F(ExtractionPipelineTest, UnresolvedLabelVolumeKeepsImages) {
    writeCt("Patient7", "P007");

    synthetic::Grid grid;
    auto labels = synthetic::createImage<core::LabelVolumeType>(grid, 1);
    const std::string unknownUid(40, '9');
    auto writer = itk::ImageFileWriter<core::LabelVolumeType>::New();
    writer->SetFileName((shared_ / ("Patient7_" + unknownUid + ".nrrd")).string());
    writer->SetInput(labels);
    writer->Update();

    auto summary = run();
    ASSERT_TRUE(summary.has_value()) << summary.error().toString();
    EXPECT_EQ(summary->written, 1u);
    EXPECT_EQ(summary->failed, 0u);

    size_t segmentationFailures = 0;
    for (const auto& failure : summary->failures) {
        EXPECT_EQ(failure.patientId, "P007");
        if (failure.reason == core::FailureReason::UnresolvedSegmentationReference) {
            ++segmentationFailures;
            EXPECT_NE(failure.detail.find(unknownUid), std::string::npos);
        }
    }
    EXPECT_EQ(segmentationFailures, 1u);

    H5::H5File file(destination_.string(), H5F_ACC_RDONLY);
    auto ct = file.openGroup("/P007/CT");
    EXPECT_TRUE(ct.nameExists("Image"));
    EXPECT_EQ(ct.getNumObjs(), 2u);
}

// Scenario D: an existing store is not replaced without overwrite
TEST_F(ExtractionPipelineTest, ExistingStoreIsUntouched) {
    writeCt("Patient1", "P001");
    ASSERT_TRUE(run().has_value());
    const auto before = readBytes(destination_);
    ASSERT_FALSE(before.empty());

    writeCt("Patient2", "P002");
    auto second = run(false);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error().code, StoreError::Code::DestinationExists);
    EXPECT_EQ(readBytes(destination_), before);

    auto replaced = run(true);
    ASSERT_TRUE(replaced.has_value());
    EXPECT_EQ(replaced->written, 2u);
}

// Missing criteria are collected across the run
TEST_F(ExtractionPipelineTest, PatientsWhoFailedAreSummarized) {
    writeCt("Patient1", "P001");

    synthetic::ImageSeriesSpec other;
    other.patientId = "P003";
    other.seriesUid = "1.2.3.4.300";
    other.description = "LOCALIZER";
    synthetic::writeImageSeries(root_ / "Patient3" / "loc", other);

    auto summary = run();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->written, 1u);
    EXPECT_EQ(summary->failed, 1u);
    ASSERT_EQ(summary->patientsWhoFailed.size(), 1u);
    EXPECT_EQ(summary->patientsWhoFailed[0].patientId, "P003");
    EXPECT_EQ(summary->patientsWhoFailed[0].availableDescriptions,
              (std::vector<std::string>{"LOCALIZER"}));
}
