// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <iomanip>
#include <libusb-1.0/libusb.h>
#include <string>

#include "libusb_transport.hpp"
#include "usbwait_log.hpp"

class LibUSBHotplugRegistration : public HotplugRegistration {
public:
    LibUSBHotplugRegistration(libusb_context *ctx, std::unique_ptr<HotplugHandler> handler)
        : HotplugRegistration(std::move(handler)), m_ctx{ctx}, m_callbackHandle{0}, m_registered{false}
    {}

    ~LibUSBHotplugRegistration() override
    {
        USBWAIT_LOG;

        if (m_registered) {
            libusb_hotplug_deregister_callback(m_ctx, m_callbackHandle);
            log(USBWAIT_LOG_LEVEL_DEBUG) << "Hotplug callback deregistered" << endLog;
        }
    }

    int Register(bool enumerate)
    {
        USBWAIT_LOG;

        int ret = libusb_hotplug_register_callback(m_ctx,
                                                static_cast<libusb_hotplug_event>(LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED | LIBUSB_HOTPLUG_EVENT_DEVICE_LEFT),
                                                enumerate ? LIBUSB_HOTPLUG_ENUMERATE : static_cast<libusb_hotplug_flag>(0),
                                                LIBUSB_HOTPLUG_MATCH_ANY,
                                                LIBUSB_HOTPLUG_MATCH_ANY,
                                                LIBUSB_HOTPLUG_MATCH_ANY,
                                                HotplugEventCallback,
                                                m_handler.get(),
                                                &m_callbackHandle);
        if (ret != LIBUSB_SUCCESS) {
            log(USBWAIT_LOG_LEVEL_ERROR) << "Failed to register hotplug callback: " << libusb_error_name(ret) << endLog;
            return ret;
        }

        m_registered = true;
        return ret;
    }

private:
    libusb_context *m_ctx;
    libusb_hotplug_callback_handle m_callbackHandle;
    bool m_registered;

    static int LIBUSB_CALL HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data);
};

int LIBUSB_CALL LibUSBHotplugRegistration::HotplugEventCallback(libusb_context *ctx, libusb_device *device,
                                                libusb_hotplug_event event, void *user_data)
{
    USBWAIT_LOG;

    HotplugHandler *handler = static_cast<HotplugHandler*>(user_data);

    HotplugEvent hotplugEvent{event == LIBUSB_HOTPLUG_EVENT_DEVICE_ARRIVED ? HOTPLUG_EVENT_DEVICE_ARRIVED : HOTPLUG_EVENT_DEVICE_LEFT,
        std::nullopt};

    // The device is only valid for the duration of the callback
    libusb_device_descriptor desc;
    int ret = libusb_get_device_descriptor(device, &desc);
    if (ret < 0) {
        log(USBWAIT_LOG_LEVEL_WARNING) << "Failed to get device descriptor: " << libusb_error_name(ret) << endLog;
    } else {
        hotplugEvent.m_deviceId = DeviceID{desc.idVendor, desc.idProduct};
        log(USBWAIT_LOG_LEVEL_DEBUG) << (hotplugEvent.m_type == HOTPLUG_EVENT_DEVICE_ARRIVED ? "Device arrived" : "Device left")
            << ": vid: 0x" << std::hex << std::setw(4) << std::setfill('0') << desc.idVendor
            << ", pid: 0x" << std::hex << std::setw(4) << std::setfill('0') << desc.idProduct << endLog;
    }

    if (hotplugEvent.m_type == HOTPLUG_EVENT_DEVICE_ARRIVED) {
        handler->DeviceArrived(hotplugEvent);
    } else {
        handler->DeviceLeft(hotplugEvent);
    }

    return 0;
}

LibUSBContext::LibUSBContext(bool usbDebug) : m_ctx{nullptr}
{
    USBWAIT_LOG;

    int ret = libusb_init(&m_ctx);
    if (ret < 0) {
        log(USBWAIT_LOG_LEVEL_ERROR) << "Failed to initialize libusb: " << libusb_error_name(ret) << endLog;
        throw USBError(std::string("Failed to initialize libusb: ") + libusb_error_name(ret), ret);
    }

    if (usbDebug) {
        libusb_set_option(m_ctx, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_DEBUG);
    }
}

LibUSBContext::~LibUSBContext()
{
    USBWAIT_LOG;

    if (m_ctx) {
        libusb_exit(m_ctx);
        m_ctx = nullptr;
    }
}

int LibUSBContext::ReadDeviceList(libusb_context *ctx, DeviceSnapshot &snapshot)
{
    USBWAIT_LOG;

    libusb_device **devices = nullptr;
    ssize_t count = libusb_get_device_list(ctx, &devices);
    if (count < 0) {
        log(USBWAIT_LOG_LEVEL_DEBUG) << "Failed to get device list: " << libusb_error_name(static_cast<int>(count)) << endLog;
        return static_cast<int>(count);
    }

    snapshot.clear();
    snapshot.reserve(static_cast<size_t>(count));
    for (ssize_t i = 0; i < count; ++i) {
        libusb_device_descriptor desc;
        int ret = libusb_get_device_descriptor(devices[i], &desc);
        if (ret < 0) {
            log(USBWAIT_LOG_LEVEL_DEBUG) << "Failed to get device descriptor: " << libusb_error_name(ret) << endLog;
            snapshot.push_back(std::nullopt);
        } else {
            snapshot.push_back(DeviceID{desc.idVendor, desc.idProduct});
        }
    }

    libusb_free_device_list(devices, 1);

    return LIBUSB_SUCCESS;
}

int LibUSBContext::GetDevices(DeviceSnapshot &snapshot)
{
    return ReadDeviceList(m_ctx, snapshot);
}

std::unique_ptr<HotplugRegistration> LibUSBContext::RegisterHotplug(bool enumerate,
    std::unique_ptr<HotplugHandler> handler)
{
    USBWAIT_LOG;

    auto registration = std::make_unique<LibUSBHotplugRegistration>(m_ctx, std::move(handler));
    int ret = registration->Register(enumerate);
    if (ret != LIBUSB_SUCCESS) {
        throw USBError(std::string("Failed to register hotplug callback: ") + libusb_error_name(ret), ret);
    }

    return registration;
}

int LibUSBContext::HandleEvents(std::optional<std::chrono::milliseconds> timeout)
{
    int ret;

    if (timeout) {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(*timeout).count();
        struct timeval tv;
        tv.tv_sec = static_cast<decltype(tv.tv_sec)>(us / 1000000);
        tv.tv_usec = static_cast<decltype(tv.tv_usec)>(us % 1000000);
        ret = libusb_handle_events_timeout_completed(m_ctx, &tv, nullptr);
    } else {
        ret = libusb_handle_events_completed(m_ctx, nullptr);
    }

    return ret;
}

bool LibUSBTransport::HasHotplug() const
{
    return libusb_has_capability(LIBUSB_CAP_HAS_HOTPLUG) != 0;
}

int LibUSBTransport::GetDevices(DeviceSnapshot &snapshot)
{
    USBWAIT_LOG;

    libusb_context *ctx = nullptr;
    int ret = libusb_init(&ctx);
    if (ret < 0) {
        log(USBWAIT_LOG_LEVEL_DEBUG) << "Failed to initialize libusb: " << libusb_error_name(ret) << endLog;
        return ret;
    }

    if (m_usbDebug) {
        libusb_set_option(ctx, LIBUSB_OPTION_LOG_LEVEL, LIBUSB_LOG_LEVEL_DEBUG);
    }

    ret = LibUSBContext::ReadDeviceList(ctx, snapshot);
    libusb_exit(ctx);

    return ret;
}

std::unique_ptr<USBContext> LibUSBTransport::CreateContext()
{
    USBWAIT_LOG;

    return std::make_unique<LibUSBContext>(m_usbDebug);
}
