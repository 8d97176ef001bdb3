// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <memory>
#include <ostream>
#include <stdexcept>
#include <libusb-1.0/libusb.h>

#include "wait_loop.hpp"
#include "usb_transport.hpp"
#include "presence_checker.hpp"
#include "hotplug_bridge.hpp"
#include "usbwait_log.hpp"

std::string WaitStatusToString(WaitStatus status)
{
    switch (status) {
        case WAIT_STATUS_SATISFIED:
            return "satisfied";
        case WAIT_STATUS_EVENT:
            return "event";
        case WAIT_STATUS_UNSUPPORTED:
            return "unsupported";
        case WAIT_STATUS_NO_DEVICE:
            return "no device";
        default:
            return "unknown";
    }
}

int ReportWaitResult(const WaitResult &result, std::ostream &out, std::ostream &err)
{
    switch (result.m_status) {
        case WAIT_STATUS_SATISFIED:
        case WAIT_STATUS_EVENT:
            // Nothing to name when the devices are simply absent
            if (result.m_deviceId) {
                out << result.m_deviceId->ToString() << std::endl;
            }
            return USBWAIT_EXIT_SUCCESS;
        case WAIT_STATUS_UNSUPPORTED:
            err << "libusb hotplug api unsupported!" << std::endl;
            return USBWAIT_EXIT_SUCCESS;
        case WAIT_STATUS_NO_DEVICE:
        default:
            return USBWAIT_EXIT_NO_DEVICE;
    }
}

WaitResult WaitLoop::Run()
{
    USBWAIT_LOG;

    log(USBWAIT_LOG_LEVEL_INFO) << "Waiting for " << DeviceIDListToString(m_options.m_deviceIds)
        << " to " << (m_options.m_detach ? "detach" : "attach") << "..." << endLog;

    std::optional<DeviceID> present = CheckPresence(m_transport, m_options.m_deviceIds);
    if (IsSatisfied(present)) {
        log(USBWAIT_LOG_LEVEL_INFO) << "Already " << (m_options.m_detach ? "detached" : "attached") << endLog;
        return WaitResult{WAIT_STATUS_SATISFIED, present};
    }

    if (m_options.m_nowait) {
        log(USBWAIT_LOG_LEVEL_INFO) << "No matching device and nowait requested" << endLog;
        return WaitResult{WAIT_STATUS_NO_DEVICE, std::nullopt};
    }

    if (!m_transport.HasHotplug()) {
        log(USBWAIT_LOG_LEVEL_DEBUG) << "Hotplug is NOT supported" << endLog;
        return WaitResult{WAIT_STATUS_UNSUPPORTED, std::nullopt};
    }

    log(USBWAIT_LOG_LEVEL_INFO) << "Waiting for USB events..." << endLog;

    return WaitForEvents();
}

WaitResult WaitLoop::WaitForEvents()
{
    USBWAIT_LOG;

    std::unique_ptr<USBContext> context = m_transport.CreateContext();
    std::shared_ptr<HotplugEventChannel> channel = std::make_shared<HotplugEventChannel>();

    // The initial state is already known, so existing devices are not replayed.
    std::unique_ptr<HotplugRegistration> registration = context->RegisterHotplug(false,
        std::make_unique<HotplugBridge>(channel));
    log(USBWAIT_LOG_LEVEL_DEBUG) << "Hotplug callback registered" << endLog;

    while (true) {
        log(USBWAIT_LOG_LEVEL_INFO) << "Loop..." << endLog;

        int ret = context->HandleEvents(m_options.m_pollInterval);
        if (ret < 0) {
            if (ret == LIBUSB_ERROR_INTERRUPTED) {
                log(USBWAIT_LOG_LEVEL_DEBUG) << "Event handling interrupted" << endLog;
                continue;
            }
            log(USBWAIT_LOG_LEVEL_ERROR) << "Failed to handle events: " << libusb_error_name(ret) << endLog;
            throw USBError(std::string("Failed to handle events: ") + libusb_error_name(ret), ret);
        }

        HotplugEvent event;
        HotplugChannelStatus status = channel->TryReceive(event);
        if (status == HOTPLUG_CHANNEL_EMPTY) {
            continue;
        } else if (status == HOTPLUG_CHANNEL_DISCONNECTED) {
            log(USBWAIT_LOG_LEVEL_ERROR) << "Hotplug event channel disconnected" << endLog;
            throw std::runtime_error("Hotplug event channel disconnected");
        }

        // The event only says something changed, re-enumerate to find out what.
        std::optional<DeviceID> present = CheckPresence(*context, m_options.m_deviceIds);

        log(USBWAIT_LOG_LEVEL_INFO) << "Event from " << (event.m_deviceId ? event.m_deviceId->ToString() : "unknown device")
            << " (" << (event.m_type == HOTPLUG_EVENT_DEVICE_ARRIVED ? "arrived" : "left") << ")"
            << ", connected: " << (present ? present->ToString() : "none") << endLog;

        if (IsSatisfied(present)) {
            registration.reset();
            channel->CloseReceiver();
            log(USBWAIT_LOG_LEVEL_DEBUG) << "Hotplug callback released" << endLog;

            return WaitResult{WAIT_STATUS_EVENT, present ? present : event.m_deviceId};
        }
    }
}
