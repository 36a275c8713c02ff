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
 * @file patient_store_writer.hpp
 * @brief HDF5 store of extracted patient records
 * @details Consumes a RecordStream and writes every record into one HDF5
 *          file with the layout
 *
 *          @code
 *          /<patient id>                      group
 *          /<patient id>/<criterion>          group, DICOM and geometry attributes,
 *                                             Transforms_<i> for each applied transform
 *          /<patient id>/<criterion>/Image    float32 dataset
 *          /<patient id>/<criterion>/<organ>  uint8 dataset, same shape as Image
 *          /<patient id>/<criterion>/Dicom_header  JSON string dataset
 *          @endcode
 *
 *          Arrays are stored as [y][x][z] by default, or in ITK memory order
 *          [z][y][x] when transposition is disabled. Object time stamps are
 *          not recorded, so writing the same records twice gives identical
 *          files.
 *
 * ## Thread Safety
 * - A destination must not be written by two create() calls at once
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include "core/patient_record.hpp"
#include "services/extraction/record_stream.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dicom_extractor::services {

/**
 * @brief Error information for store operations
 */
struct StoreError {
    enum class Code {
        Success,
        DestinationExists,
        FileCreateFailed,
        WriteFailed
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::DestinationExists: return "Destination exists: " + message;
            case Code::FileCreateFailed: return "File create failed: " + message;
            case Code::WriteFailed: return "Write failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Options for store layout
 */
struct StoreOptions {
    /// "gggg|eeee" tags copied as string attributes of each criterion group
    std::vector<std::string> attributes;

    /// Organs to write (empty = all)
    std::vector<std::string> organsToKeep;

    /// Store arrays as [y][x][z] instead of [z][y][x]
    bool transpose = true;

    /// Write the series metadata as a Dicom_header JSON dataset
    bool storeDicomHeader = true;

    /// Write Size, Origin, Spacing, Direction and Pixel Type attributes
    bool geometryAttributes = true;
};

struct StoreSummary {
    size_t written = 0;
    size_t failed = 0;
    std::vector<std::string> writtenPatientIds;
    std::vector<core::FailureRecord> failures;
    std::vector<core::PatientWhoFailed> patientsWhoFailed;
};

class PatientStoreWriter {
public:
    /// Called after each stream item (items pulled, total, patient id)
    using ProgressCallback = std::function<void(size_t current, size_t total,
                                                const std::string& patientId)>;

    PatientStoreWriter();
    explicit PatientStoreWriter(StoreOptions options);
    ~PatientStoreWriter();

    // Non-copyable, movable
    PatientStoreWriter(const PatientStoreWriter&) = delete;
    PatientStoreWriter& operator=(const PatientStoreWriter&) = delete;
    PatientStoreWriter(PatientStoreWriter&&) noexcept;
    PatientStoreWriter& operator=(PatientStoreWriter&&) noexcept;

    void setProgressCallback(ProgressCallback callback);

    [[nodiscard]] const StoreOptions& options() const noexcept;

    /**
     * @brief Drain @p stream into a new HDF5 file
     *
     * The stream is consumed from its current position. Each record is
     * fully written and flushed before the next one is pulled.
     *
     * @param stream Records to write
     * @param destination HDF5 file path
     * @param overwrite Replace an existing file
     * @return Summary, or DestinationExists without touching an existing
     *         file when @p overwrite is false
     */
    [[nodiscard]] std::expected<StoreSummary, StoreError>
    create(RecordStream& stream,
           const std::filesystem::path& destination,
           bool overwrite = false);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace dicom_extractor::services
