/**
 * @file DeviceClassifier.cpp
 * @brief Decide which devices need quirky playback handling
 */

#include "DeviceClassifier.h"

#include <algorithm>
#include <cctype>

namespace {

constexpr const char* QUIRKY_VENDOR = "sonos";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string lookup(const std::map<std::string, std::string>& attributes, const char* key) {
    auto it = attributes.find(key);
    return it != attributes.end() ? it->second : std::string();
}

// "[]", "" and whitespace count as no members
bool hasMembers(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c)) && c != '[' && c != ']' && c != ',') {
            return true;
        }
    }
    return false;
}

} // namespace

DeviceClass DeviceClassifier::classify(const std::string& deviceId,
                                       const std::map<std::string, std::string>& attributes) {
    DeviceClass result;

    if (toLower(deviceId).find(QUIRKY_VENDOR) != std::string::npos) {
        result.isQuirky = true;
        result.reason = "device id";
        return result;
    }

    if (toLower(lookup(attributes, "friendly_name")).find(QUIRKY_VENDOR) != std::string::npos) {
        result.isQuirky = true;
        result.reason = "friendly_name";
        return result;
    }

    if (toLower(lookup(attributes, "platform")) == QUIRKY_VENDOR ||
        toLower(lookup(attributes, "integration")) == QUIRKY_VENDOR) {
        result.isQuirky = true;
        result.reason = "integration";
        return result;
    }

    if (hasMembers(lookup(attributes, "group_members"))) {
        result.isQuirky = true;
        result.reason = "group_members";
        return result;
    }

    return result;
}
