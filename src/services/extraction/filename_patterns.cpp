#include "services/extraction/filename_patterns.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace dicom_extractor::services {

namespace {

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::optional<int> parseDigits(std::string_view digits) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

std::optional<int> lastNumberIn(std::string_view name) {
    size_t end = name.size();
    while (end > 0 && !isDigit(name[end - 1])) {
        --end;
    }
    if (end == 0) {
        return std::nullopt;
    }
    size_t begin = end;
    while (begin > 0 && isDigit(name[begin - 1])) {
        --begin;
    }
    return parseDigits(name.substr(begin, end - begin));
}

std::optional<int> numberAfterPrefix(std::string_view name, std::string_view prefix) {
    if (prefix.empty()) {
        return std::nullopt;
    }
    size_t pos = name.find(prefix);
    while (pos != std::string_view::npos) {
        size_t begin = pos + prefix.size();
        size_t end = begin;
        while (end < name.size() && isDigit(name[end])) {
            ++end;
        }
        if (end > begin) {
            return parseDigits(name.substr(begin, end - begin));
        }
        pos = name.find(prefix, pos + 1);
    }
    return std::nullopt;
}

bool hasLabelVolumeExtension(const std::filesystem::path& path) {
    std::string name = path.filename().string();
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto endsWith = [&name](std::string_view suffix) {
        return name.size() >= suffix.size()
            && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return endsWith(".nrrd") || endsWith(".nhdr") || endsWith(".nii")
        || endsWith(".nii.gz") || endsWith(".mha") || endsWith(".mhd");
}

}  // namespace dicom_extractor::services
