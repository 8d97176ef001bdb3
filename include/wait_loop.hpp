// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "device_id.hpp"
#include "wait_config.hpp"

#define USBWAIT_VERSION "1.0.0"

#define USBWAIT_EXIT_SUCCESS 0
#define USBWAIT_EXIT_NO_DEVICE 1
#define USBWAIT_EXIT_ERROR -1

class USBTransport;

enum WaitStatus {
    // Devices were already in the requested state
    WAIT_STATUS_SATISFIED,
    // A hotplug event brought the devices into the requested state
    WAIT_STATUS_EVENT,
    WAIT_STATUS_UNSUPPORTED,
    // nowait was requested and the devices were not in the requested state
    WAIT_STATUS_NO_DEVICE,
};

std::string WaitStatusToString(WaitStatus status);

struct WaitResult {
    WaitStatus m_status;
    std::optional<DeviceID> m_deviceId;
};

// Writes the matched id to out, or the unsupported advisory to err, and returns the exit code.
int ReportWaitResult(const WaitResult &result, std::ostream &out, std::ostream &err);

class WaitLoop {
public:
    WaitLoop(USBTransport &transport, const WaitOptions &options)
        : m_transport{transport}, m_options{options}
    {}

    // Throws USBError when the hotplug facility fails.
    WaitResult Run();

private:
    USBTransport &m_transport;
    WaitOptions m_options;

    bool IsSatisfied(const std::optional<DeviceID> &present) const
    {
        return present.has_value() != m_options.m_detach;
    }

    WaitResult WaitForEvents();
};
