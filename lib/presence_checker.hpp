// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <optional>
#include <vector>

#include "device_id.hpp"
#include "usb_transport.hpp"

// Returns the first snapshot entry, in enumeration order, matching any of the targets.
std::optional<DeviceID> CheckPresence(const DeviceSnapshot &snapshot, const std::vector<DeviceID> &targets);

// Enumerates through source first. A failed enumeration is reported as no device present.
std::optional<DeviceID> CheckPresence(DeviceSource &source, const std::vector<DeviceID> &targets);
