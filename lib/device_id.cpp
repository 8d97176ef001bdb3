// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <sstream>
#include <cctype>

#include "device_id.hpp"

static std::string DeviceIDParseErrorMessage(DeviceIDParseErrorKind kind, const std::string &token)
{
    switch (kind) {
        case DEVICE_ID_PARSE_ERROR_MISSING_SEPARATOR:
            return "missing : separator";
        case DEVICE_ID_PARSE_ERROR_INVALID_VENDOR_ID:
            return "invalid hex VID " + token;
        case DEVICE_ID_PARSE_ERROR_INVALID_PRODUCT_ID:
            return "invalid hex PID " + token;
        default:
            return "invalid device id";
    }
}

DeviceIDParseError::DeviceIDParseError(DeviceIDParseErrorKind kind, const std::string &token)
    : std::invalid_argument(DeviceIDParseErrorMessage(kind, token)), m_kind{kind}, m_token{token}
{}

std::string DeviceID::ToString() const
{
    std::ostringstream os;
    os << std::hex << m_vendorId << ":" << m_productId;
    return os.str();
}

static bool ParseHex16(const std::string &token, uint16_t &value)
{
    if (token.empty()) {
        return false;
    }

    uint32_t result = 0;
    for (char c : token) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        int digit = std::isdigit(static_cast<unsigned char>(c)) ? c - '0'
            : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
        result = (result << 4) | static_cast<uint32_t>(digit);
        if (result > 0xFFFF) {
            return false;
        }
    }

    value = static_cast<uint16_t>(result);
    return true;
}

DeviceID ParseDeviceID(const std::string &text)
{
    size_t separator = text.find(':');
    if (separator == std::string::npos) {
        throw DeviceIDParseError(DEVICE_ID_PARSE_ERROR_MISSING_SEPARATOR);
    }

    std::string vendorToken = text.substr(0, separator);
    size_t end = text.find(':', separator + 1);
    std::string productToken = text.substr(separator + 1,
        end == std::string::npos ? std::string::npos : end - separator - 1);

    DeviceID id{};
    if (!ParseHex16(vendorToken, id.m_vendorId)) {
        throw DeviceIDParseError(DEVICE_ID_PARSE_ERROR_INVALID_VENDOR_ID, vendorToken);
    }
    if (!ParseHex16(productToken, id.m_productId)) {
        throw DeviceIDParseError(DEVICE_ID_PARSE_ERROR_INVALID_PRODUCT_ID, productToken);
    }

    return id;
}

std::string DeviceIDListToString(const std::vector<DeviceID> &ids)
{
    std::string str = "[";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            str += ", ";
        }
        str += ids[i].ToString();
    }
    str += "]";
    return str;
}
