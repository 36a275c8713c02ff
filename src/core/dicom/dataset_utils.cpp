#include "core/dataset_utils.hpp"

#include <charconv>
#include <cstdio>
#include <sstream>

#include <gdcmDataElement.h>
#include <gdcmElement.h>
#include <gdcmItem.h>
#include <gdcmSequenceOfItems.h>

namespace dicom_extractor::core {

std::string formatTagKey(uint16_t group, uint16_t element) {
    char buffer[10];
    std::snprintf(buffer, sizeof(buffer), "%04x|%04x", group, element);
    return std::string(buffer);
}

std::optional<gdcm::Tag> parseTagKey(std::string_view key) {
    if (key.size() != 9 || key[4] != '|') {
        return std::nullopt;
    }
    uint16_t group = 0;
    uint16_t element = 0;
    auto groupPart = key.substr(0, 4);
    auto elementPart = key.substr(5, 4);
    auto [gEnd, gErr] = std::from_chars(groupPart.data(),
                                        groupPart.data() + groupPart.size(),
                                        group, 16);
    auto [eEnd, eErr] = std::from_chars(elementPart.data(),
                                        elementPart.data() + elementPart.size(),
                                        element, 16);
    if (gErr != std::errc{} || eErr != std::errc{}
        || gEnd != groupPart.data() + groupPart.size()
        || eEnd != elementPart.data() + elementPart.size()) {
        return std::nullopt;
    }
    return gdcm::Tag(group, element);
}

std::string trimDicomPadding(std::string value) {
    while (!value.empty() && (value.back() == ' ' || value.back() == '\0')) {
        value.pop_back();
    }
    return value;
}

std::string getStringValue(const gdcm::DataSet& ds, const gdcm::Tag& tag) {
    if (!ds.FindDataElement(tag)) {
        return "";
    }
    const auto& de = ds.GetDataElement(tag);
    if (de.IsEmpty() || de.GetByteValue() == nullptr) {
        return "";
    }
    return trimDicomPadding(std::string(de.GetByteValue()->GetPointer(),
                                        de.GetByteValue()->GetLength()));
}

std::vector<double> parseDoubleValues(const std::string& str) {
    std::vector<double> values;
    if (str.empty()) {
        return values;
    }
    std::stringstream ss(str);
    std::string token;
    while (std::getline(ss, token, '\\')) {
        try {
            values.push_back(std::stod(token));
        } catch (const std::exception&) {
            values.push_back(0.0);
        }
    }
    return values;
}

std::optional<int> parseIntValue(const std::string& str) {
    auto first = str.find_first_not_of(' ');
    if (first == std::string::npos) {
        return std::nullopt;
    }
    int value = 0;
    const char* begin = str.data() + first;
    const char* end = str.data() + str.size();
    if (*begin == '+') {
        ++begin;
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{}) {
        return std::nullopt;
    }
    return value;
}

std::optional<uint16_t> getUInt16Value(const gdcm::DataSet& ds,
                                       const gdcm::Tag& tag) {
    if (!ds.FindDataElement(tag)) {
        return std::nullopt;
    }
    const auto& de = ds.GetDataElement(tag);
    const auto* bv = de.GetByteValue();
    if (bv == nullptr || bv->GetLength() < sizeof(uint16_t)) {
        return std::nullopt;
    }
    // GDCM keeps binary values in host order once read, whatever the
    // transfer syntax of the file
    gdcm::Element<gdcm::VR::US, gdcm::VM::VM1> element;
    element.SetFromDataElement(de);
    return element.GetValue();
}

std::vector<gdcm::DataSet> getSequenceItems(const gdcm::DataSet& ds,
                                            const gdcm::Tag& seqTag) {
    std::vector<gdcm::DataSet> items;
    if (!ds.FindDataElement(seqTag)) {
        return items;
    }
    const auto& de = ds.GetDataElement(seqTag);
    auto sq = de.GetValueAsSQ();
    if (!sq) {
        return items;
    }
    items.reserve(sq->GetNumberOfItems());
    // GDCM items are 1-indexed
    for (gdcm::SequenceOfItems::SizeType i = 1; i <= sq->GetNumberOfItems(); ++i) {
        items.push_back(sq->GetItem(i).GetNestedDataSet());
    }
    return items;
}

std::optional<gdcm::DataSet> getFirstSequenceItem(const gdcm::DataSet& ds,
                                                  const gdcm::Tag& seqTag) {
    if (!ds.FindDataElement(seqTag)) {
        return std::nullopt;
    }
    const auto& de = ds.GetDataElement(seqTag);
    auto sq = de.GetValueAsSQ();
    if (!sq || sq->GetNumberOfItems() == 0) {
        return std::nullopt;
    }
    return sq->GetItem(1).GetNestedDataSet();
}

}  // namespace dicom_extractor::core
