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

#include "core/logging.hpp"
#include "services/export/patient_store_writer.hpp"
#include "services/extraction/extraction_config.hpp"
#include "services/extraction/extraction_driver.hpp"
#include "services/extraction/match_criteria.hpp"
#include "services/extraction/record_locator.hpp"
#include "services/extraction/record_transform.hpp"
#include "services/extraction/segment_aliaser.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using namespace dicom_extractor;

/**
 * @brief Command line options
 */
struct Options {
    std::filesystem::path configPath;
    bool forceOverwrite = false;
    bool forceInteractive = false;
    std::optional<logging::LogLevel> logLevel;
};

void printUsage(const char* programName) {
    std::cout << R"(
DICOM Extractor - Patient record extraction to HDF5

Usage: )" << programName << R"( <config.json> [options]

Arguments:
  config.json         Extraction configuration (JSON)

Options:
  --overwrite         Replace an existing destination file
  --interactive       Prompt for descriptions of missing criteria
  --log-level <name>  trace, debug, info, warning, error, critical, off
  -h, --help          Show this help message

Exit Codes:
  0  Success
  1  Invalid arguments or configuration
  2  Store could not be written
)";
}

bool parseArguments(int argc, char* argv[], Options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--overwrite") {
            opts.forceOverwrite = true;
        } else if (arg == "--interactive") {
            opts.forceInteractive = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            opts.logLevel = logging::logLevelFromString(argv[++i]);
            if (!opts.logLevel) {
                std::cerr << "Error: Unknown log level '" << argv[i] << "'\n";
                return false;
            }
        } else if (arg.starts_with("-")) {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else if (opts.configPath.empty()) {
            opts.configPath = arg;
        } else {
            std::cerr << "Error: Too many arguments\n";
            return false;
        }
    }

    if (opts.configPath.empty()) {
        std::cerr << "Error: No configuration file specified\n";
        return false;
    }
    return true;
}

/**
 * @brief Ask on the terminal which description should satisfy a criterion
 */
std::optional<std::string> promptForDescription(const std::string& patientId,
                                                const std::string& criterion,
                                                const std::vector<std::string>& available) {
    std::cout << "\nPatient " << patientId << " has no series for criterion '"
              << criterion << "'.\nAvailable descriptions:\n";
    for (size_t i = 0; i < available.size(); ++i) {
        std::cout << "  [" << (i + 1) << "] " << available[i] << "\n";
    }
    std::cout << "Select a number to accept it for '" << criterion
              << "', or press Enter to skip: " << std::flush;

    std::string line;
    if (!std::getline(std::cin, line) || line.empty()) {
        return std::nullopt;
    }
    try {
        size_t choice = std::stoul(line);
        if (choice >= 1 && choice <= available.size()) {
            return available[choice - 1];
        }
    } catch (const std::exception&) {
        // not a number, fall through
    }
    std::cout << "Invalid selection, criterion left unchanged\n";
    return std::nullopt;
}

void printSummary(const services::StoreSummary& summary,
                  std::chrono::milliseconds elapsed) {
    std::cout << "\n========================================\n";
    std::cout << "           Extraction Summary\n";
    std::cout << "========================================\n";
    std::cout << "  Patients written: " << summary.written << "\n";
    std::cout << "  Patients failed:  " << summary.failed << "\n";
    std::cout << "  Issues recorded:  " << summary.failures.size() << "\n";
    std::cout << "  Total time:       " << elapsed.count() << " ms\n";

    if (!summary.patientsWhoFailed.empty()) {
        std::cout << "\n  Patients with missing criteria:\n";
        for (const auto& patient : summary.patientsWhoFailed) {
            std::cout << "    " << patient.patientId << ":";
            for (const auto& [criterion, accepted] : patient.failedImages) {
                std::cout << " " << criterion;
            }
            std::cout << "\n";
        }
    }
    if (!summary.failures.empty()) {
        std::cout << "\n  Issues:\n";
        for (const auto& failure : summary.failures) {
            std::cout << "    " << failure.toString() << "\n";
        }
    }
    std::cout << "========================================\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parseArguments(argc, argv, opts)) {
        printUsage(argv[0]);
        return 1;
    }

    auto config = services::ExtractionConfig::loadFromFile(opts.configPath);
    if (!config) {
        std::cerr << "Error: " << config.error().toString() << "\n";
        return 1;
    }
    if (opts.logLevel) {
        config->logging.level = *opts.logLevel;
    }
    logging::LoggerFactory::configure(config->logging);
    auto logger = logging::LoggerFactory::create("Main");

    if (!std::filesystem::is_directory(config->patientsRoot)) {
        std::cerr << "Error: Patients root is not a directory: "
                  << config->patientsRoot.string() << "\n";
        return 1;
    }

    auto criteria = services::MatchCriteria::create(config->matchCriteria, config->matchTag);
    if (!criteria) {
        std::cerr << "Error: " << criteria.error().toString() << "\n";
        return 1;
    }
    criteria->setChangeObserver([&logger](const std::string& criterion,
                                          const std::string& description) {
        logger->info("Criterion '{}' accepts '{}'", criterion, description);
    });

    auto aliaser = services::SegmentAliaser::create(config->organAliases);
    if (!aliaser) {
        std::cerr << "Error: " << aliaser.error().toString() << "\n";
        return 1;
    }

    services::LocatorOptions locatorOptions;
    locatorOptions.patientsRoot = config->patientsRoot;
    locatorOptions.segmentationsDirectory = config->segmentationsDirectory;
    locatorOptions.patientPrefix = config->patientPrefix;

    services::ExtractionDriver driver(services::RecordLocator(std::move(locatorOptions)),
                                      *criteria, std::move(*aliaser));
    if (!config->matchCriteriaOutput.empty()) {
        driver.setMatchCriteriaOutput(config->matchCriteriaOutput);
    }
    if (config->interactive || opts.forceInteractive) {
        driver.setMissingCriterionHandler(promptForDescription);
    }
    if (config->resampleSpacing) {
        driver.addTransform(std::make_shared<services::ResampleTransform>(
            *config->resampleSpacing, config->resampleCriteria,
            config->resampleInterpolation));
    }

    services::StoreOptions storeOptions;
    storeOptions.attributes = config->attributes;
    storeOptions.organsToKeep = config->organsToKeep;
    storeOptions.transpose = config->transpose;
    storeOptions.storeDicomHeader = config->storeDicomHeader;

    services::PatientStoreWriter writer(std::move(storeOptions));
    writer.setProgressCallback([&logger](size_t current, size_t total,
                                         const std::string& patientId) {
        logger->info("[{}/{}] {}", current, total, patientId);
    });

    auto startTime = std::chrono::steady_clock::now();
    auto summary = writer.create(driver, config->destination,
                                 config->overwrite || opts.forceOverwrite);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime);

    if (!summary) {
        std::cerr << "Error: " << summary.error().toString() << "\n";
        logging::LoggerFactory::shutdown();
        return 2;
    }

    printSummary(*summary, elapsed);
    std::cout << "Output: " << config->destination.string() << "\n";
    logging::LoggerFactory::shutdown();
    return 0;
}
