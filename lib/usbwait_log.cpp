// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include "usbwait_log.hpp"
#include <iostream>
#include <mutex>
#include <chrono>
#include <ctime>
#include <stdexcept>

std::unique_ptr<UsbWaitLogStore> UsbWaitLogStore::instance;
std::once_flag UsbWaitLogStore::initInstanceFlag;

UsbWaitLog::UsbWaitLog(const std::string &funcName) : m_funcName{funcName}, m_logLevel{USBWAIT_LOG_LEVEL_NONE}
{
    UsbWaitLogStore::getInstance().Log(USBWAIT_LOG_LEVEL_TRACE,
        UsbWaitLog::FormatLog(USBWAIT_LOG_LEVEL_TRACE, m_funcName, "-> Entering"));
}

UsbWaitLog::~UsbWaitLog()
{
    UsbWaitLogStore::getInstance().Log(USBWAIT_LOG_LEVEL_TRACE,
        UsbWaitLog::FormatLog(USBWAIT_LOG_LEVEL_TRACE, m_funcName, "<- Exiting"));
}

UsbWaitLog & UsbWaitLog::operator()(UsbWaitLogLevel level) {
    m_logLevel = level;
    return *this;
}

UsbWaitLog & UsbWaitLog::operator<<(const char *str) {
    m_os << str;
    return *this;
}

UsbWaitLog & UsbWaitLog::operator<<(const std::string &str) {
    m_os << str;
    return *this;
}

UsbWaitLog & UsbWaitLog::operator<<(int val) {
    m_os << val;
    return *this;
}

UsbWaitLog & UsbWaitLog::operator<<(unsigned int val) {
    m_os << val;
    return *this;
}

UsbWaitLog & endLog(UsbWaitLog &log) {
    UsbWaitLogStore::getInstance().Log(log.m_logLevel,
        UsbWaitLog::FormatLog(log.m_logLevel, log.m_funcName, log.m_os.str()));
    log.m_os.str("");
    return log;
}

UsbWaitLog & operator<<(UsbWaitLog &log, UsbWaitLog &(*finalizeLog)(UsbWaitLog &)) {
    return finalizeLog(log);
}

UsbWaitLogLevel UsbWaitLog::StringToLevel(const std::string &level) {
    if (level == "NONE") return USBWAIT_LOG_LEVEL_NONE;
    if (level == "TRACE") return USBWAIT_LOG_LEVEL_TRACE;
    if (level == "DEBUG") return USBWAIT_LOG_LEVEL_DEBUG;
    if (level == "INFO") return USBWAIT_LOG_LEVEL_INFO;
    if (level == "WARNING") return USBWAIT_LOG_LEVEL_WARNING;
    if (level == "ERROR") return USBWAIT_LOG_LEVEL_ERROR;
    throw std::invalid_argument("Unknown log level: " + level);
}

std::string UsbWaitLog::LevelToString(UsbWaitLogLevel level) {
    switch (level) {
        case USBWAIT_LOG_LEVEL_NONE: return "NONE";
        case USBWAIT_LOG_LEVEL_TRACE: return "TRACE";
        case USBWAIT_LOG_LEVEL_DEBUG: return "DEBUG";
        case USBWAIT_LOG_LEVEL_INFO: return "INFO";
        case USBWAIT_LOG_LEVEL_WARNING: return "WARNING";
        case USBWAIT_LOG_LEVEL_ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string UsbWaitLog::FormatLog(UsbWaitLogLevel logLevel, const std::string &funcName, const std::string &message) {
    std::ostringstream os;
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto tm = *std::localtime(&t);

    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()) % 1000000;

    os << std::put_time(&tm, "[%H:%M:%S");
    os << '.' << std::setw(6) << std::setfill('0') << us.count() << "]";

    std::string levelString = "[" + UsbWaitLog::LevelToString(logLevel) + "]";
    os << "" << std::setfill(' ') << std::setw(9) << std::left << levelString << funcName << ": " << message;
    return os.str();
}

UsbWaitLogStore::UsbWaitLogStore() : m_minLogLevel{USBWAIT_LOG_LEVEL_WARNING} {}

UsbWaitLogStore::~UsbWaitLogStore() {
    Close();
}

UsbWaitLogStore& UsbWaitLogStore::getInstance() {
    std::call_once(initInstanceFlag, []() {
        instance.reset(new UsbWaitLogStore);
    });
    return *instance;
}

void UsbWaitLogStore::Open(const std::string &logPath, UsbWaitLogLevel minLogLevel) {
    std::lock_guard<std::mutex> lock(m_logMutex);

    m_minLogLevel = minLogLevel;

    if (logPath == "" || logPath == "stderr") {
        m_logStream = std::make_unique<std::ostream>(std::cerr.rdbuf());
    } else {
        m_logFile.open(logPath, std::ios::out | std::ios::trunc);
        if (!m_logFile.is_open()) {
            throw std::runtime_error("Failed to open log file: " + logPath);
        }
        m_logStream = std::make_unique<std::ostream>(m_logFile.rdbuf());
    }
}

void UsbWaitLogStore::Close() {
    std::lock_guard<std::mutex> lock(m_logMutex);

    m_logStream.reset();
    if (m_logFile.is_open()) {
        m_logFile.close();
    }
}

void UsbWaitLogStore::Log(UsbWaitLogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_logMutex);

    if (m_logStream) {
        if (level >= m_minLogLevel && level != USBWAIT_LOG_LEVEL_NONE) {
            *m_logStream << message << std::endl;
            m_logStream->flush();
        }
    }
}
