// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <stdexcept>
#include <yaml-cpp/yaml.h>

#include "wait_config.hpp"
#include "usbwait_log.hpp"

std::optional<std::chrono::milliseconds> PollIntervalFromMilliseconds(int milliseconds)
{
    if (milliseconds < 0) {
        throw std::invalid_argument("Poll interval must not be negative: " + std::to_string(milliseconds));
    }

    if (milliseconds == 0) {
        return std::nullopt;
    }

    return std::chrono::milliseconds(milliseconds);
}

void LoadWaitConfig(const std::string &configPath, WaitOptions &options)
{
    USBWAIT_LOG;

    YAML::Node config;
    try {
        config = YAML::LoadFile(configPath);
    } catch (const YAML::BadFile& e) {
        throw std::runtime_error("Unable to open config file: " + configPath);
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("Invalid config file: " + configPath + ": " + e.what());
    }

    if (config.IsNull()) {
        log(USBWAIT_LOG_LEVEL_WARNING) << "Config file is empty: " << configPath << endLog;
        return;
    }

    if (!config.IsMap()) {
        throw std::invalid_argument("Invalid config file: " + configPath);
    }

    try {
        if (config["devices"]) {
            const YAML::Node &devices = config["devices"];
            if (!devices.IsSequence()) {
                throw std::invalid_argument("Invalid config file: " + configPath + ": devices must be a list");
            }

            for (const auto &device : devices) {
                // DeviceIDParseError propagates as is
                DeviceID id = ParseDeviceID(device.as<std::string>());
                log(USBWAIT_LOG_LEVEL_DEBUG) << "Adding device from config: " << id.ToString() << endLog;
                options.m_deviceIds.push_back(id);
            }
        }

        if (config["detach"]) {
            options.m_detach = config["detach"].as<bool>();
        }

        if (config["nowait"]) {
            options.m_nowait = config["nowait"].as<bool>();
        }

        if (config["poll_interval_ms"]) {
            options.m_pollInterval = PollIntervalFromMilliseconds(config["poll_interval_ms"].as<int>());
        }
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("Invalid config file: " + configPath + ": " + e.what());
    }
}
