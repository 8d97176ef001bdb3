// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#pragma once

#include <sstream>
#include <string>
#include <fstream>
#include <memory>
#include <mutex>
#include <iomanip>

enum UsbWaitLogLevel {
    USBWAIT_LOG_LEVEL_TRACE,
    USBWAIT_LOG_LEVEL_DEBUG,
    USBWAIT_LOG_LEVEL_INFO,
    USBWAIT_LOG_LEVEL_WARNING,
    USBWAIT_LOG_LEVEL_ERROR,
    USBWAIT_LOG_LEVEL_NONE
};

class UsbWaitLog {
public:
    std::ostringstream m_os;
    std::string m_funcName;
    UsbWaitLogLevel m_logLevel;

    UsbWaitLog(const std::string &funcName);
    ~UsbWaitLog();

    UsbWaitLog & operator()(UsbWaitLogLevel level);
    UsbWaitLog & operator<<(const char *str);
    UsbWaitLog & operator<<(const std::string &str);
    UsbWaitLog & operator<<(int val);
    UsbWaitLog & operator<<(unsigned int val);

    template <typename T>
    UsbWaitLog & operator<<(T value) {
        m_os << value;
        return *this;
    }

    static UsbWaitLogLevel StringToLevel(const std::string &level);
    static std::string LevelToString(UsbWaitLogLevel level);
    static std::string FormatLog(UsbWaitLogLevel level, const
        std::string &funcName, const std::string &message);

};

UsbWaitLog & endLog(UsbWaitLog &log);
UsbWaitLog & operator<<(UsbWaitLog &log, UsbWaitLog &(*finalizeLog)(UsbWaitLog &));

// Diagnostics never go to stdout, which carries the matched device id.
class UsbWaitLogStore {
public:
    static UsbWaitLogStore& getInstance();
    void Log(UsbWaitLogLevel level, const std::string& message);
    void Open(const std::string &logPath, UsbWaitLogLevel minLogLevel);
    void Close();
    ~UsbWaitLogStore();

private:
    UsbWaitLogStore();
    UsbWaitLogStore(const UsbWaitLogStore&) = delete;
    UsbWaitLogStore& operator=(const UsbWaitLogStore&) = delete;

    std::unique_ptr<std::ostream> m_logStream;
    std::ofstream m_logFile;
    UsbWaitLogLevel m_minLogLevel;
    std::mutex m_logMutex;
    static std::unique_ptr<UsbWaitLogStore> instance;
    static std::once_flag initInstanceFlag;
};

#define USBWAIT_LOG UsbWaitLog log(__FUNCTION__)
