// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include "hotplug_bridge.hpp"
#include "usbwait_log.hpp"

bool HotplugEventChannel::Send(const HotplugEvent &event)
{
    std::lock_guard<std::mutex> lock(m_eventsMutex);
    if (!m_receiverOpen) {
        return false;
    }

    m_events.push(event);
    return true;
}

HotplugChannelStatus HotplugEventChannel::TryReceive(HotplugEvent &event)
{
    std::lock_guard<std::mutex> lock(m_eventsMutex);

    if (m_events.empty()) {
        return m_senderOpen ? HOTPLUG_CHANNEL_EMPTY : HOTPLUG_CHANNEL_DISCONNECTED;
    }

    event = m_events.front();
    m_events.pop();
    return HOTPLUG_CHANNEL_EVENT;
}

void HotplugEventChannel::CloseSender()
{
    std::lock_guard<std::mutex> lock(m_eventsMutex);
    m_senderOpen = false;
}

void HotplugEventChannel::CloseReceiver()
{
    std::lock_guard<std::mutex> lock(m_eventsMutex);
    m_receiverOpen = false;
    std::queue<HotplugEvent>().swap(m_events);
}

HotplugBridge::~HotplugBridge()
{
    m_channel->CloseSender();
}

void HotplugBridge::DeviceArrived(const HotplugEvent &event)
{
    USBWAIT_LOG;

    if (!m_channel->Send(event)) {
        log(USBWAIT_LOG_LEVEL_TRACE) << "Receiver gone, dropping arrival event" << endLog;
    }
}

void HotplugBridge::DeviceLeft(const HotplugEvent &event)
{
    USBWAIT_LOG;

    if (!m_channel->Send(event)) {
        log(USBWAIT_LOG_LEVEL_TRACE) << "Receiver gone, dropping departure event" << endLog;
    }
}
