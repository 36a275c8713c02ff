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

#include "services/export/patient_store_writer.hpp"

#include "core/dicom_loader.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <system_error>
#include <utility>

#include <H5Cpp.h>
#include <hdf5.h>

#include <nlohmann/json.hpp>

namespace dicom_extractor::services {

namespace {

constexpr const char* kImageDataset = "Image";
constexpr const char* kDicomHeaderDataset = "Dicom_header";
constexpr const char* kPixelTypeName = "32-bit float";

/// HDF5 link names cannot contain '/'
std::string objectName(const std::string& name) {
    if (name.empty()) {
        return "_";
    }
    std::string result = name;
    std::replace(result.begin(), result.end(), '/', '_');
    return result;
}

bool linkExists(const H5::Group& parent, const std::string& name) {
    return H5Lexists(parent.getId(), name.c_str(), H5P_DEFAULT) > 0;
}

/// Create a group whose object header carries no time stamps
H5::Group createGroup(const H5::Group& parent, const std::string& name) {
    hid_t gcpl = H5Pcreate(H5P_GROUP_CREATE);
    H5Pset_obj_track_times(gcpl, 0);
    hid_t gid = H5Gcreate2(parent.getId(), name.c_str(), H5P_DEFAULT, gcpl, H5P_DEFAULT);
    H5Pclose(gcpl);
    if (gid < 0) {
        throw H5::GroupIException("createGroup", "cannot create group " + name);
    }
    H5Gclose(gid);
    return parent.openGroup(name);
}

H5::DSetCreatPropList untimedDatasetProperties() {
    H5::DSetCreatPropList plist;
    H5Pset_obj_track_times(plist.getId(), 0);
    return plist;
}

void writeStringAttribute(H5::Group& group, const std::string& name, const std::string& value) {
    H5::StrType type(H5::PredType::C_S1, std::max<size_t>(1, value.size()));
    H5::DataSpace scalar(H5S_SCALAR);
    auto attribute = group.createAttribute(name, type, scalar);
    attribute.write(type, value);
}

template <typename T>
void writeArrayAttribute(H5::Group& group, const std::string& name,
                         const H5::PredType& fileType, const H5::PredType& memType,
                         const std::vector<T>& values) {
    hsize_t dims[1] = {values.size()};
    H5::DataSpace space(1, dims);
    auto attribute = group.createAttribute(name, fileType, space);
    attribute.write(memType, values.data());
}

/**
 * @brief Copy an ITK buffer into the stored array layout
 *
 * ITK memory order is x fastest, i.e. [z][y][x]. The transposed layout is
 * [y][x][z].
 */
template <typename TPixel>
std::vector<TPixel> layoutBuffer(const itk::Image<TPixel, 3>* image, bool transpose,
                                 std::array<hsize_t, 3>& dims) {
    const auto size = image->GetBufferedRegion().GetSize();
    const size_t nx = size[0];
    const size_t ny = size[1];
    const size_t nz = size[2];
    const TPixel* input = image->GetBufferPointer();

    std::vector<TPixel> output(nx * ny * nz);
    if (!transpose) {
        dims = {nz, ny, nx};
        std::copy(input, input + output.size(), output.begin());
        return output;
    }

    dims = {ny, nx, nz};
    for (size_t z = 0; z < nz; ++z) {
        for (size_t y = 0; y < ny; ++y) {
            for (size_t x = 0; x < nx; ++x) {
                output[(y * nx + x) * nz + z] = input[x + nx * (y + ny * z)];
            }
        }
    }
    return output;
}

}  // anonymous namespace

class PatientStoreWriter::Impl {
public:
    StoreOptions options;
    ProgressCallback progressCallback;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(StoreOptions opts)
        : options(std::move(opts))
        , logger(logging::LoggerFactory::create("PatientStoreWriter")) {}

    bool keepOrgan(const std::string& organ) const {
        return options.organsToKeep.empty()
            || std::find(options.organsToKeep.begin(), options.organsToKeep.end(), organ)
                   != options.organsToKeep.end();
    }

    void writeAttributes(H5::Group& group, const core::ImageSeries& series) const {
        for (const auto& tagKey : options.attributes) {
            auto name = core::DicomLoader::tagName(tagKey);
            if (group.attrExists(name)) {
                logger->warn("Attribute '{}' ({}) already written, skipped", name, tagKey);
                continue;
            }
            writeStringAttribute(group, name, series.value(tagKey));
        }

        if (!options.geometryAttributes || !series.image) {
            return;
        }
        const auto* image = series.image.GetPointer();
        const auto size = image->GetLargestPossibleRegion().GetSize();
        std::vector<int> sizeValues;
        std::vector<double> origin;
        std::vector<double> spacing;
        std::vector<double> direction;
        for (unsigned int i = 0; i < 3; ++i) {
            sizeValues.push_back(static_cast<int>(size[i]));
            origin.push_back(image->GetOrigin()[i]);
            spacing.push_back(image->GetSpacing()[i]);
            for (unsigned int j = 0; j < 3; ++j) {
                direction.push_back(image->GetDirection()[i][j]);
            }
        }
        writeArrayAttribute(group, "Size", H5::PredType::STD_I32LE,
                            H5::PredType::NATIVE_INT, sizeValues);
        writeArrayAttribute(group, "Origin", H5::PredType::IEEE_F64LE,
                            H5::PredType::NATIVE_DOUBLE, origin);
        writeArrayAttribute(group, "Spacing", H5::PredType::IEEE_F64LE,
                            H5::PredType::NATIVE_DOUBLE, spacing);
        writeArrayAttribute(group, "Direction", H5::PredType::IEEE_F64LE,
                            H5::PredType::NATIVE_DOUBLE, direction);
        writeStringAttribute(group, "Pixel Type", kPixelTypeName);
    }

    std::array<hsize_t, 3> writeImage(H5::Group& group, const core::VolumeType* image) const {
        std::array<hsize_t, 3> dims{};
        auto buffer = layoutBuffer(image, options.transpose, dims);
        H5::DataSpace space(3, dims.data());
        auto dataset = group.createDataSet(kImageDataset, H5::PredType::IEEE_F32LE,
                                           space, untimedDatasetProperties());
        dataset.write(buffer.data(), H5::PredType::NATIVE_FLOAT);
        return dims;
    }

    void writeMask(H5::Group& group, const std::string& organ,
                   const core::MaskType* mask, const std::array<hsize_t, 3>& imageDims) const {
        std::array<hsize_t, 3> dims{};
        auto buffer = layoutBuffer(mask, options.transpose, dims);
        if (dims != imageDims) {
            logger->warn("Mask {} does not match the image shape, skipped", organ);
            return;
        }
        H5::DataSpace space(3, dims.data());
        auto dataset = group.createDataSet(objectName(organ), H5::PredType::STD_U8LE,
                                           space, untimedDatasetProperties());
        dataset.write(buffer.data(), H5::PredType::NATIVE_UINT8);
    }

    void writeDicomHeader(H5::Group& group, const core::ImageSeries& series) const {
        nlohmann::json header(series.metadata);
        auto text = header.dump();
        H5::StrType type(H5::PredType::C_S1, std::max<size_t>(1, text.size()));
        H5::DataSpace scalar(H5S_SCALAR);
        auto dataset = group.createDataSet(kDicomHeaderDataset, type, scalar,
                                           untimedDatasetProperties());
        dataset.write(text, type);
    }

    void writeRecord(H5::H5File& file, const core::PatientRecord& record) const {
        const auto patientName = objectName(record.patientId);
        const bool merging = linkExists(file, patientName);
        if (merging) {
            logger->info("Patient {} already stored, merging", record.patientId);
        }
        H5::Group patientGroup = merging ? file.openGroup(patientName)
                                         : createGroup(file, patientName);

        for (const auto& entry : record.entries) {
            const auto criterionName = objectName(entry.criterionName);
            if (linkExists(patientGroup, criterionName)) {
                logger->info("{}/{} already stored, kept", record.patientId, entry.criterionName);
                continue;
            }
            if (!entry.series.image) {
                logger->warn("{}/{} has no image, skipped", record.patientId, entry.criterionName);
                continue;
            }

            auto group = createGroup(patientGroup, criterionName);
            writeAttributes(group, entry.series);
            for (size_t i = 0; i < record.transformsHistory.size(); ++i) {
                writeStringAttribute(group, std::format("Transforms_{}", i),
                                     record.transformsHistory[i]);
            }
            auto dims = writeImage(group, entry.series.image.GetPointer());

            if (entry.segmentation) {
                for (const auto& [organ, mask] : entry.segmentation->organs) {
                    if (!mask || !keepOrgan(organ)) {
                        continue;
                    }
                    writeMask(group, organ, mask.GetPointer(), dims);
                }
            }
            if (options.storeDicomHeader) {
                writeDicomHeader(group, entry.series);
            }
            logger->debug("{}/{} written", record.patientId, entry.criterionName);
        }
    }
};

PatientStoreWriter::PatientStoreWriter() : impl_(std::make_unique<Impl>(StoreOptions{})) {}

PatientStoreWriter::PatientStoreWriter(StoreOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

PatientStoreWriter::~PatientStoreWriter() = default;

PatientStoreWriter::PatientStoreWriter(PatientStoreWriter&&) noexcept = default;
PatientStoreWriter& PatientStoreWriter::operator=(PatientStoreWriter&&) noexcept = default;

void PatientStoreWriter::setProgressCallback(ProgressCallback callback) {
    impl_->progressCallback = std::move(callback);
}

const StoreOptions& PatientStoreWriter::options() const noexcept {
    return impl_->options;
}

std::expected<StoreSummary, StoreError>
PatientStoreWriter::create(RecordStream& stream,
                           const std::filesystem::path& destination,
                           bool overwrite) {
    std::error_code ec;
    if (std::filesystem::exists(destination, ec) && !overwrite) {
        return std::unexpected(StoreError{
            StoreError::Code::DestinationExists,
            destination.string()
        });
    }
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            return std::unexpected(StoreError{
                StoreError::Code::FileCreateFailed,
                destination.parent_path().string() + ": " + ec.message()
            });
        }
    }

    H5::Exception::dontPrint();

    StoreSummary summary;
    const size_t total = stream.size();
    size_t pulled = 0;
    try {
        std::unique_ptr<H5::H5File> file;
        try {
            H5::FileCreatPropList fcpl;
            H5Pset_obj_track_times(fcpl.getId(), 0);
            file = std::make_unique<H5::H5File>(destination.string(), H5F_ACC_TRUNC, fcpl);
        } catch (const H5::Exception& e) {
            return std::unexpected(StoreError{
                StoreError::Code::FileCreateFailed,
                destination.string() + ": " + e.getDetailMsg()
            });
        }
        impl_->logger->info("Writing {} patients to {}", total, destination.string());

        while (auto item = stream.next()) {
            ++pulled;
            std::string patientId;
            if (*item) {
                patientId = (*item)->patientId;
                impl_->writeRecord(*file, **item);
                file->flush(H5F_SCOPE_GLOBAL);
                summary.writtenPatientIds.push_back(patientId);
                ++summary.written;
            } else {
                patientId = item->error().patientId;
                ++summary.failed;
            }
            if (impl_->progressCallback) {
                impl_->progressCallback(pulled, total, patientId);
            }
        }
        file->close();
    } catch (const H5::Exception& e) {
        impl_->logger->error("HDF5 error in {}: {}", e.getFuncName(), e.getDetailMsg());
        return std::unexpected(StoreError{
            StoreError::Code::WriteFailed,
            e.getFuncName() + ": " + e.getDetailMsg()
        });
    }

    summary.failures = stream.failures();
    summary.patientsWhoFailed = stream.patientsWhoFailed();
    impl_->logger->info("Store complete: {} written, {} failed", summary.written, summary.failed);
    return summary;
}

}  // namespace dicom_extractor::services
