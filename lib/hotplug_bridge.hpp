// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <memory>
#include <mutex>
#include <queue>

#include "usb_transport.hpp"

enum HotplugChannelStatus {
    HOTPLUG_CHANNEL_EVENT,
    HOTPLUG_CHANNEL_EMPTY,
    HOTPLUG_CHANNEL_DISCONNECTED,
};

// Unbounded FIFO between the hotplug callback (producer) and the wait loop (consumer).
class HotplugEventChannel {
public:
    HotplugEventChannel()
    {}

    // Returns false if the receiver has gone away. The event is dropped.
    bool Send(const HotplugEvent &event);

    // Never blocks. Disconnected once the sender is closed and the queue drained.
    HotplugChannelStatus TryReceive(HotplugEvent &event);

    void CloseSender();
    void CloseReceiver();

private:
    std::queue<HotplugEvent> m_events;
    std::mutex m_eventsMutex;
    bool m_senderOpen = true;
    bool m_receiverOpen = true;
};

class HotplugBridge : public HotplugHandler {
public:
    HotplugBridge(std::shared_ptr<HotplugEventChannel> channel) : m_channel{channel}
    {}
    ~HotplugBridge() override;

    void DeviceArrived(const HotplugEvent &event) override;
    void DeviceLeft(const HotplugEvent &event) override;

private:
    std::shared_ptr<HotplugEventChannel> m_channel;
};
