// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "device_id.hpp"

#define USBWAIT_DEFAULT_POLL_INTERVAL_MS 1000

struct WaitOptions {
    std::vector<DeviceID> m_deviceIds;
    bool m_detach = false;
    bool m_nowait = false;
    // std::nullopt blocks in the event handler without a timeout
    std::optional<std::chrono::milliseconds> m_pollInterval{std::chrono::milliseconds(USBWAIT_DEFAULT_POLL_INTERVAL_MS)};
};

std::optional<std::chrono::milliseconds> PollIntervalFromMilliseconds(int milliseconds);

// Reads a YAML config file into options. Device ids from the file are appended.
//
//   devices: ["1d6b:0002", "0bda:8153"]
//   detach: false
//   nowait: false
//   poll_interval_ms: 1000
void LoadWaitConfig(const std::string &configPath, WaitOptions &options);
