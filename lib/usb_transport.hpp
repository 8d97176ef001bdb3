// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once
#include <vector>
#include <cstdint>
#include <memory>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include "device_id.hpp"

// One entry per enumerated device, std::nullopt when its descriptor could not be read.
using DeviceSnapshot = std::vector<std::optional<DeviceID>>;

enum HotplugEventType {
    HOTPLUG_EVENT_DEVICE_ARRIVED,
    HOTPLUG_EVENT_DEVICE_LEFT,
};

struct HotplugEvent {
    HotplugEventType m_type;
    std::optional<DeviceID> m_deviceId;
};

class USBError : public std::runtime_error {
public:
    USBError(const std::string &what, int code) : std::runtime_error(what), m_code{code}
    {}

    int GetCode() const { return m_code; }

private:
    int m_code;
};

class HotplugHandler {
public:
    virtual ~HotplugHandler()
    {}

    virtual void DeviceArrived(const HotplugEvent &event) = 0;
    virtual void DeviceLeft(const HotplugEvent &event) = 0;
};

// Owns a native hotplug subscription together with its handler.
// Destroying the registration deregisters the callback.
class HotplugRegistration {
public:
    HotplugRegistration(std::unique_ptr<HotplugHandler> handler) : m_handler{std::move(handler)}
    {}
    virtual ~HotplugRegistration()
    {}

    HotplugRegistration(const HotplugRegistration&) = delete;
    HotplugRegistration& operator=(const HotplugRegistration&) = delete;

    HotplugHandler *GetHandler() { return m_handler.get(); }

protected:
    std::unique_ptr<HotplugHandler> m_handler;
};

class DeviceSource {
public:
    virtual ~DeviceSource()
    {}

    // Returns 0 on success or a negative libusb error code.
    virtual int GetDevices(DeviceSnapshot &snapshot) = 0;
};

class USBContext : public DeviceSource {
public:
    virtual std::unique_ptr<HotplugRegistration> RegisterHotplug(bool enumerate,
        std::unique_ptr<HotplugHandler> handler) = 0;

    // Blocks until events were handled or the timeout expired. No timeout blocks indefinitely.
    virtual int HandleEvents(std::optional<std::chrono::milliseconds> timeout) = 0;
};

class USBTransport : public DeviceSource {
public:
    virtual bool HasHotplug() const = 0;
    virtual std::unique_ptr<USBContext> CreateContext() = 0;
};
