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

/**
 * @file dicom_loader.hpp
 * @brief DICOM header parsing and series pixel loading
 * @details Provides the DicomLoader class. Headers are parsed with GDCM up to
 *          the pixel data so that directory scans stay cheap; pixel volumes
 *          are reconstructed with ITK's ImageSeriesReader on an ordered file
 *          list produced by the SeriesBuilder.
 *
 * ## Thread Safety
 * - DicomHeader structs are safe to read from any thread after construction
 * - Individual loader instances are not thread-safe
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <array>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <itkImage.h>
#include <itkSmartPointer.h>

namespace dicom_extractor::core {

/// Well-known metadata keys ("gggg|eeee", lower-case hex as ITK writes them)
namespace dicom_tags {
inline constexpr const char* PatientId = "0010|0020";
inline constexpr const char* PatientName = "0010|0010";
inline constexpr const char* Modality = "0008|0060";
inline constexpr const char* SeriesDescription = "0008|103e";
inline constexpr const char* SeriesInstanceUid = "0020|000e";
inline constexpr const char* SopClassUid = "0008|0016";
inline constexpr const char* InstanceNumber = "0020|0013";
inline constexpr const char* SliceLocation = "0020|1041";
inline constexpr const char* ImagePositionPatient = "0020|0032";
inline constexpr const char* ImageOrientationPatient = "0020|0037";
inline constexpr const char* Rows = "0028|0010";
inline constexpr const char* Columns = "0028|0011";
}  // namespace dicom_tags

/// Slice information for grouping and sorting
struct SliceInfo {
    std::filesystem::path filePath;
    std::string seriesInstanceUid;
    double sliceLocation = 0.0;
    int instanceNumber = 0;
    int rows = 0;
    int columns = 0;
    std::array<double, 3> imagePosition = {0.0, 0.0, 0.0};
    std::array<double, 6> imageOrientation = {1.0, 0.0, 0.0, 0.0, 1.0, 0.0};
};

/// Header of one DICOM file, pixel data excluded
struct DicomHeader {
    std::string patientId;
    std::string seriesInstanceUid;
    std::string seriesDescription;
    std::string modality;
    std::string sopClassUid;
    SliceInfo slice;

    /// Every top-level non-binary element, keyed "gggg|eeee"
    std::map<std::string, std::string> elements;

    /**
     * @brief Value of a metadata element
     * @param tagKey "gggg|eeee" key, case-insensitive
     * @return The value, or an empty string when absent
     */
    [[nodiscard]] std::string value(std::string_view tagKey) const;

    /// True for SEG and RTSTRUCT objects
    [[nodiscard]] bool isSegmentation() const;
};

/// Error types for DICOM loading
enum class DicomError {
    FileNotFound,
    InvalidDicomFormat,
    MetadataExtractionFailed,
    SeriesAssemblyFailed,
    DecodingFailed
};

/// Error result with message
struct DicomErrorInfo {
    DicomError code;
    std::string message;

    [[nodiscard]] std::string toString() const;
};

/// Image types
using VolumeType = itk::Image<float, 3>;
using MaskType = itk::Image<uint8_t, 3>;
using LabelVolumeType = itk::Image<uint16_t, 3>;

/**
 * @brief DICOM header reader and series volume loader
 */
class DicomLoader {
public:
    DicomLoader();
    ~DicomLoader();

    // Non-copyable, movable
    DicomLoader(const DicomLoader&) = delete;
    DicomLoader& operator=(const DicomLoader&) = delete;
    DicomLoader(DicomLoader&&) noexcept;
    DicomLoader& operator=(DicomLoader&&) noexcept;

    /**
     * @brief Parse a DICOM header, stopping before the pixel data
     * @param filePath Path to the DICOM file
     * @return Header on success, error info on failure
     */
    [[nodiscard]] std::expected<DicomHeader, DicomErrorInfo>
    loadHeader(const std::filesystem::path& filePath) const;

    /**
     * @brief Reconstruct a 3D volume from an ordered slice list
     * @param files Slice files in physical order
     * @return ITK volume carrying origin, spacing and direction
     */
    [[nodiscard]] std::expected<VolumeType::Pointer, DicomErrorInfo>
    loadSeries(const std::vector<std::filesystem::path>& files) const;

    /**
     * @brief Human-readable dictionary name of a tag ("Series Description")
     * @param tagKey "gggg|eeee" key
     * @return Dictionary name, or @p tagKey itself for unknown/private tags
     */
    [[nodiscard]] static std::string tagName(std::string_view tagKey);

    /**
     * @brief Check whether a modality denotes a segmentation object
     */
    [[nodiscard]] static bool isSegmentationModality(std::string_view modality);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace dicom_extractor::core
