/**
 * @file DeviceClassifier.h
 * @brief Decide which devices need quirky playback handling
 *
 * Quirky devices get a state snapshot before playback, a state restore
 * afterwards, and content-type negotiation. Unknown devices are standard.
 */

#ifndef REPLAY2PLAYER_DEVICE_CLASSIFIER_H
#define REPLAY2PLAYER_DEVICE_CLASSIFIER_H

#include <map>
#include <string>

struct DeviceClass {
    bool isQuirky = false;
    std::string reason;     // diagnostics only
};

class DeviceClassifier {
public:
    static DeviceClass classify(const std::string& deviceId,
                                const std::map<std::string, std::string>& attributes);

    static bool isQuirky(const std::string& deviceId,
                         const std::map<std::string, std::string>& attributes) {
        return classify(deviceId, attributes).isQuirky;
    }
};

#endif // REPLAY2PLAYER_DEVICE_CLASSIFIER_H
