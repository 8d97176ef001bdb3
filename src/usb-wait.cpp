// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <iostream>
#include <string>
#include <vector>
#include <cxxopts.hpp>

#include "wait_loop.hpp"
#include "wait_config.hpp"
#include "device_id.hpp"
#include "usbwait_log.hpp"
#include "libusb_transport.hpp"

int main(int argc, char* argv[])
{
    cxxopts::Options options("usb-wait", "Wait for USB devices to attach or detach");

    options.add_options()
        ("i,id", "Device id, vid:pid", cxxopts::value<std::vector<std::string>>())
        ("d,detach", "Watch for detach events", cxxopts::value<bool>()->default_value("false"))
        ("n,nowait", "Return immediately", cxxopts::value<bool>()->default_value("false"))
        ("v,verbose", "Print out extra information", cxxopts::value<bool>()->default_value("false"))
        ("D,debug", "Enable debug logging", cxxopts::value<bool>()->default_value("false"))
        ("log-level", "Log level (TRACE, DEBUG, INFO, WARNING, ERROR, NONE)", cxxopts::value<std::string>())
        ("u,usb-debug", "Enable USB debug logging", cxxopts::value<bool>()->default_value("false"))
        ("l,log", "Log file path", cxxopts::value<std::string>()->default_value(""))
        ("c,config", "Config file path", cxxopts::value<std::string>())
        ("t,poll-interval", "Event handling timeout in milliseconds, 0 to block", cxxopts::value<int>())
        ("h,help", "Print usage")
        ("V,version", "Print version");

    options.parse_positional({"id"});
    options.positional_help("[vid:pid...]");

    cxxopts::ParseResult result;
    try {
        result = options.parse(argc, argv);
    } catch (const cxxopts::OptionException& e) {
        std::cerr << "Error parsing options: " << e.what() << std::endl;
        std::cerr << options.help() << std::endl;
        return USBWAIT_EXIT_ERROR;
    }

    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return USBWAIT_EXIT_SUCCESS;
    }

    if (result.count("version")) {
        std::cout << "usb-wait: v" << USBWAIT_VERSION << std::endl;
        return USBWAIT_EXIT_SUCCESS;
    }

    bool verbose = result["verbose"].as<bool>();
    bool debug = result["debug"].as<bool>();
    bool usbDebug = result["usb-debug"].as<bool>();
    std::string logFilePath = result["log"].as<std::string>();

    UsbWaitLogLevel logLevel = debug ? USBWAIT_LOG_LEVEL_DEBUG : (verbose ? USBWAIT_LOG_LEVEL_INFO : USBWAIT_LOG_LEVEL_WARNING);

    try {
        if (result.count("log-level")) {
            logLevel = UsbWaitLog::StringToLevel(result["log-level"].as<std::string>());
        }
        UsbWaitLogStore::getInstance().Open(logFilePath, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to open log: " << e.what() << std::endl;
        return USBWAIT_EXIT_ERROR;
    }

    WaitOptions waitOptions;
    try {
        if (result.count("config")) {
            LoadWaitConfig(result["config"].as<std::string>(), waitOptions);
        }

        // Command line options take precedence over the config file
        if (result.count("id")) {
            for (const auto &id : result["id"].as<std::vector<std::string>>()) {
                waitOptions.m_deviceIds.push_back(ParseDeviceID(id));
            }
        }
        if (result["detach"].as<bool>()) {
            waitOptions.m_detach = true;
        }
        if (result["nowait"].as<bool>()) {
            waitOptions.m_nowait = true;
        }
        if (result.count("poll-interval")) {
            waitOptions.m_pollInterval = PollIntervalFromMilliseconds(result["poll-interval"].as<int>());
        }
    } catch (const DeviceIDParseError& e) {
        std::cerr << "Invalid device id: " << e.what() << std::endl;
        return USBWAIT_EXIT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return USBWAIT_EXIT_ERROR;
    }

    if (waitOptions.m_deviceIds.empty()) {
        std::cerr << "At least one device id is required" << std::endl;
        std::cerr << options.help() << std::endl;
        return USBWAIT_EXIT_ERROR;
    }

    LibUSBTransport transport(usbDebug);
    WaitLoop waitLoop(transport, waitOptions);

    WaitResult waitResult;
    try {
        waitResult = waitLoop.Run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        UsbWaitLogStore::getInstance().Close();
        return USBWAIT_EXIT_ERROR;
    }

    UsbWaitLogStore::getInstance().Close();

    return ReportWaitResult(waitResult, std::cout, std::cerr);
}
