// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <algorithm>

#include "presence_checker.hpp"
#include "usbwait_log.hpp"

std::optional<DeviceID> CheckPresence(const DeviceSnapshot &snapshot, const std::vector<DeviceID> &targets)
{
    for (const auto &entry : snapshot) {
        if (!entry) {
            continue;
        }

        if (std::find(targets.begin(), targets.end(), *entry) != targets.end()) {
            return entry;
        }
    }

    return std::nullopt;
}

std::optional<DeviceID> CheckPresence(DeviceSource &source, const std::vector<DeviceID> &targets)
{
    USBWAIT_LOG;

    DeviceSnapshot snapshot;
    int ret = source.GetDevices(snapshot);
    if (ret < 0) {
        // Indistinguishable from absence at this level
        log(USBWAIT_LOG_LEVEL_DEBUG) << "Device enumeration failed: " << ret << endLog;
        return std::nullopt;
    }

    std::optional<DeviceID> present = CheckPresence(snapshot, targets);
    log(USBWAIT_LOG_LEVEL_DEBUG) << "Enumerated " << static_cast<unsigned int>(snapshot.size()) << " devices, match: "
        << (present ? present->ToString() : "none") << endLog;

    return present;
}
