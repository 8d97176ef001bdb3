// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once
#include <memory>
#include <libusb-1.0/libusb.h>

#include "usb_transport.hpp"

class LibUSBContext : public USBContext {
public:
    LibUSBContext(bool usbDebug);
    ~LibUSBContext() override;

    LibUSBContext(const LibUSBContext&) = delete;
    LibUSBContext& operator=(const LibUSBContext&) = delete;

    int GetDevices(DeviceSnapshot &snapshot) override;
    std::unique_ptr<HotplugRegistration> RegisterHotplug(bool enumerate,
        std::unique_ptr<HotplugHandler> handler) override;
    int HandleEvents(std::optional<std::chrono::milliseconds> timeout) override;

    static int ReadDeviceList(libusb_context *ctx, DeviceSnapshot &snapshot);

private:
    libusb_context *m_ctx;
};

class LibUSBTransport : public USBTransport {
public:
    LibUSBTransport(bool usbDebug) : m_usbDebug{usbDebug}
    {}

    bool HasHotplug() const override;
    int GetDevices(DeviceSnapshot &snapshot) override;
    std::unique_ptr<USBContext> CreateContext() override;

private:
    bool m_usbDebug;
};
