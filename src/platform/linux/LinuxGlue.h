#pragma once
#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "configuration.h"
#include "yaml-cpp/yaml.h"

enum host_log_level { level_error, level_warn, level_info, level_debug, level_trace };

extern std::ofstream traceFile;

/// Parse command line options into host_config / the command vector. Returns false if argp rejected them.
bool linuxParseArgs(int argc, char **argv);

/// Locate and load config.yaml (the -c path, ./config.yaml, then /etc/eezpad/config.yaml)
bool linuxSetup();

bool loadConfig(const char *configPath);

extern struct host_config_struct {
    std::map<host_log_level, std::string> logLevels = {
        {level_error, "error"}, {level_warn, "warn"}, {level_info, "info"}, {level_debug, "debug"}, {level_trace, "trace"}};

    // Serial
    std::string serialPort = ""; // empty means search by USB id
    int usbVid = EEZPAD_USB_VID;
    int usbPid = EEZPAD_USB_PID;
    int baud = EEZPAD_SERIAL_BAUD;

    // Device
    char profile = '0';
    int bannerWaitMs = DEFAULT_BANNER_WAIT_MS;

    // Logging
    host_log_level logoutputlevel = level_info;
    std::string traceFilename;
    bool ascii_logs = false;
    bool ascii_logs_explicit = false;

    // Command line only
    std::string configPath = "";
    bool verboseEnabled = false;
    bool yamlOnly = false;
    std::string command = "";
    std::vector<std::string> commandArgs;

    std::string emit_yaml()
    {
        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "Serial" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "Port" << YAML::Value << serialPort;
        out << YAML::Key << "USB_VID" << YAML::Value << YAML::Hex << usbVid;
        out << YAML::Key << "USB_PID" << YAML::Value << YAML::Hex << usbPid;
        out << YAML::Key << "Baud" << YAML::Value << YAML::Dec << baud;
        out << YAML::EndMap; // Serial

        out << YAML::Key << "Device" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "Profile" << YAML::Value << (int)(profile - '0');
        out << YAML::Key << "BannerWaitMs" << YAML::Value << bannerWaitMs;
        out << YAML::EndMap; // Device

        out << YAML::Key << "Logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "LogLevel" << YAML::Value << logLevels[logoutputlevel];
        if (traceFilename != "")
            out << YAML::Key << "TraceFile" << YAML::Value << traceFilename;
        if (ascii_logs_explicit)
            out << YAML::Key << "AsciiLogs" << YAML::Value << ascii_logs;
        out << YAML::EndMap; // Logging

        out << YAML::EndMap;
        return out.c_str();
    }
} host_config;
