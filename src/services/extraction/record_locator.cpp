#include "services/extraction/record_locator.hpp"

#include "core/logging.hpp"
#include "services/extraction/filename_patterns.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace dicom_extractor::services {

namespace {

bool isIgnoredFile(const std::filesystem::path& path) {
    auto name = path.filename().string();
    return name.empty() || name.front() == '.' || name == "DICOMDIR";
}

}  // anonymous namespace

class RecordLocator::Impl {
public:
    LocatorOptions options;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(LocatorOptions opts)
        : options(std::move(opts))
        , logger(logging::LoggerFactory::create("RecordLocator")) {}

    void collectShared(PatientSources& sources) const {
        if (options.segmentationsDirectory.empty()) {
            return;
        }
        if (options.patientPrefix.empty() || !sources.patientNumber) {
            logger->debug("No prefix or patient number for {}, shared directory skipped",
                          sources.patientPath.filename().string());
            return;
        }

        std::error_code ec;
        std::vector<std::filesystem::path> matches;
        for (const auto& entry :
             std::filesystem::directory_iterator(options.segmentationsDirectory, ec)) {
            if (!entry.is_regular_file(ec) || !hasLabelVolumeExtension(entry.path())) {
                continue;
            }
            auto number = numberAfterPrefix(entry.path().filename().string(),
                                            options.patientPrefix);
            if (number && *number == *sources.patientNumber) {
                matches.push_back(entry.path());
            }
        }
        if (ec) {
            logger->warn("Cannot scan segmentation directory {}: {}",
                         options.segmentationsDirectory.string(), ec.message());
        }

        std::sort(matches.begin(), matches.end());
        for (auto& path : matches) {
            sources.labelVolumes.push_back(
                SegmentationSource{std::move(path), SegmentationFormat::FilenameConvention});
        }
    }
};

RecordLocator::RecordLocator(LocatorOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {}

RecordLocator::~RecordLocator() = default;

RecordLocator::RecordLocator(RecordLocator&&) noexcept = default;
RecordLocator& RecordLocator::operator=(RecordLocator&&) noexcept = default;

std::vector<std::filesystem::path> RecordLocator::listPatients() const {
    std::vector<std::filesystem::path> patients;
    std::error_code ec;
    if (!std::filesystem::is_directory(impl_->options.patientsRoot, ec)) {
        impl_->logger->error("Patients root {} is not a directory",
                             impl_->options.patientsRoot.string());
        return patients;
    }

    for (const auto& entry :
         std::filesystem::directory_iterator(impl_->options.patientsRoot, ec)) {
        if (!entry.is_directory(ec) || isIgnoredFile(entry.path())) {
            continue;
        }
        const auto& shared = impl_->options.segmentationsDirectory;
        if (!shared.empty() && std::filesystem::equivalent(entry.path(), shared, ec)) {
            continue;
        }
        patients.push_back(entry.path());
    }
    std::sort(patients.begin(), patients.end());

    impl_->logger->info("Found {} patient directories under {}",
                        patients.size(), impl_->options.patientsRoot.string());
    return patients;
}

PatientSources RecordLocator::locate(const std::filesystem::path& patientPath) const {
    PatientSources sources;
    sources.patientPath = patientPath;
    sources.patientNumber = lastNumberIn(patientPath.filename().string());

    std::error_code ec;
    std::vector<std::filesystem::path> colocatedLabels;
    auto scanOptions = std::filesystem::directory_options::skip_permission_denied;
    for (auto it = std::filesystem::recursive_directory_iterator(patientPath, scanOptions, ec);
         it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            impl_->logger->warn("Error while scanning {}: {}", patientPath.string(), ec.message());
            break;
        }
        if (!it->is_regular_file(ec) || isIgnoredFile(it->path())) {
            continue;
        }
        if (hasLabelVolumeExtension(it->path())) {
            colocatedLabels.push_back(it->path());
        } else {
            sources.dicomFiles.push_back(it->path());
        }
    }

    std::sort(sources.dicomFiles.begin(), sources.dicomFiles.end());
    std::sort(colocatedLabels.begin(), colocatedLabels.end());
    for (auto& path : colocatedLabels) {
        sources.labelVolumes.push_back(
            SegmentationSource{std::move(path), SegmentationFormat::FilenameConvention});
    }
    impl_->collectShared(sources);

    impl_->logger->debug("{}: {} DICOM candidates, {} label volumes",
                         patientPath.filename().string(),
                         sources.dicomFiles.size(), sources.labelVolumes.size());
    return sources;
}

const LocatorOptions& RecordLocator::options() const noexcept {
    return impl_->options;
}

}  // namespace dicom_extractor::services
