// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <stdexcept>

struct DeviceID {
    uint16_t m_vendorId;
    uint16_t m_productId;

    bool operator==(const DeviceID& other) const {
        return m_vendorId == other.m_vendorId && m_productId == other.m_productId;
    }

    bool operator!=(const DeviceID& other) const {
        return !(*this == other);
    }

    // Lowercase hex without padding, "vid:pid".
    std::string ToString() const;
};

enum DeviceIDParseErrorKind {
    DEVICE_ID_PARSE_ERROR_MISSING_SEPARATOR,
    DEVICE_ID_PARSE_ERROR_INVALID_VENDOR_ID,
    DEVICE_ID_PARSE_ERROR_INVALID_PRODUCT_ID,
};

class DeviceIDParseError : public std::invalid_argument {
public:
    DeviceIDParseError(DeviceIDParseErrorKind kind, const std::string &token = "");

    DeviceIDParseErrorKind GetKind() const { return m_kind; }
    const std::string &GetToken() const { return m_token; }

private:
    DeviceIDParseErrorKind m_kind;
    std::string m_token;
};

// Parses "vid:pid" where both fields are base-16. Fields after the second are ignored.
DeviceID ParseDeviceID(const std::string &text);

std::string DeviceIDListToString(const std::vector<DeviceID> &ids);
