#include "LinuxGlue.h"
#include "configuration.h"

#include <argp.h>
#include <iostream>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

host_config_struct host_config;
std::ofstream traceFile;

const char *argp_program_version = optstr(APP_VERSION);

// Command line values win over config.yaml, so they are only applied once the config is loaded
static const char *optionPort = nullptr;
static const char *optionProfile = nullptr;

char stdoutBuffer[512];

static error_t parse_opt(int key, char *arg, struct argp_state *state)
{
    switch (key) {
    case 'c':
        host_config.configPath = arg;
        break;
    case 'p':
        optionPort = arg;
        break;
    case 'P':
        if (arg[0] < '0' || arg[0] >= '0' + EEZPAD_NUM_PROFILES || arg[1] != '\0')
            argp_error(state, "profile must be 0-%d", EEZPAD_NUM_PROFILES - 1);
        optionProfile = arg;
        break;
    case 'v':
        host_config.verboseEnabled = true;
        break;
    case 'y':
        host_config.yamlOnly = true;
        break;
    case ARGP_KEY_ARG:
        if (host_config.command.empty())
            host_config.command = arg;
        else
            host_config.commandArgs.push_back(arg);
        break;
    case ARGP_KEY_END:
        if (host_config.command.empty() && !host_config.yamlOnly)
            argp_usage(state);
        break;
    default:
        return ARGP_ERR_UNKNOWN;
    }
    return 0;
}

bool linuxParseArgs(int argc, char **argv)
{
    static struct argp_option options[] = {{"config", 'c', "CONFIG_PATH", 0, "Full path of the .yaml config file to use."},
                                           {"port", 'p', "DEVICE", 0, "Serial device to use instead of searching by USB id."},
                                           {"profile", 'P', "0-4", 0, "Key profile that key commands apply to."},
                                           {"verbose", 'v', 0, 0, "Set log level to full debug"},
                                           {"output-yaml", 'y', 0, 0, "Output config yaml and exit"},
                                           {0}};
    static char doc[] = "Configure an EezBotFun macro pad over USB serial.\v"
                        "Commands:\n"
                        "  version\n"
                        "  macro KEY TEXT\n"
                        "  alias KEY TEXT\n"
                        "  unalias KEY\n"
                        "  script KEY TEXT\n"
                        "  unscript KEY\n"
                        "  key KEY MACRO [ALIAS [SCRIPT]]\n"
                        "  led COLOR BRIGHTNESS\n"
                        "  wifi SSID PASSWORD\n";
    static char args_doc[] = "COMMAND [ARG...]";
    static struct argp argp = {options, parse_opt, args_doc, doc, 0, 0, 0};

    return argp_parse(&argp, argc, argv, 0, 0, 0) == 0;
}

bool linuxSetup()
{
    // Force stdout to be line buffered
    setvbuf(stdout, stdoutBuffer, _IOLBF, sizeof(stdoutBuffer));

    if (host_config.configPath != "") {
        if (loadConfig(host_config.configPath.c_str())) {
            if (!host_config.yamlOnly)
                std::cerr << "Using " << host_config.configPath << " as config file" << std::endl;
        } else {
            std::cerr << "Unable to use " << host_config.configPath << " as config file" << std::endl;
            return false;
        }
    } else if (access(EEZPAD_LOCAL_CONFIG, R_OK) == 0) {
        if (loadConfig(EEZPAD_LOCAL_CONFIG)) {
            if (!host_config.yamlOnly)
                std::cerr << "Using local " EEZPAD_LOCAL_CONFIG " as config file" << std::endl;
        } else {
            std::cerr << "Unable to use local " EEZPAD_LOCAL_CONFIG " as config file" << std::endl;
            return false;
        }
    } else if (access(EEZPAD_SYSTEM_CONFIG, R_OK) == 0) {
        if (loadConfig(EEZPAD_SYSTEM_CONFIG)) {
            if (!host_config.yamlOnly)
                std::cerr << "Using " EEZPAD_SYSTEM_CONFIG " as config file" << std::endl;
        } else {
            std::cerr << "Unable to use " EEZPAD_SYSTEM_CONFIG " as config file" << std::endl;
            return false;
        }
    }
    // No config file at all is fine, the defaults find the pad by its USB id

    if (optionPort != nullptr)
        host_config.serialPort = optionPort;
    if (optionProfile != nullptr)
        host_config.profile = optionProfile[0];

    if (host_config.traceFilename != "") {
        traceFile.open(host_config.traceFilename, std::ios::out | std::ios::app);
        if (!traceFile.is_open()) {
            std::cerr << "*** Unable to open trace file " << host_config.traceFilename << std::endl;
            return false;
        }
    }
    if (host_config.verboseEnabled && host_config.logoutputlevel != level_trace) {
        host_config.logoutputlevel = level_debug;
    }
    return true;
}

bool loadConfig(const char *configPath)
{
    YAML::Node yamlConfig;
    try {
        yamlConfig = YAML::LoadFile(configPath);
        if (yamlConfig["Logging"]) {
            std::string level = yamlConfig["Logging"]["LogLevel"].as<std::string>("info");
            bool known = false;
            for (auto &l : host_config.logLevels) {
                if (level == l.second) {
                    host_config.logoutputlevel = l.first;
                    known = true;
                    break;
                }
            }
            if (!known)
                std::cerr << "Unknown LogLevel " << level << ", keeping " << host_config.logLevels[host_config.logoutputlevel]
                          << std::endl;
            host_config.traceFilename = yamlConfig["Logging"]["TraceFile"].as<std::string>("");
            if (yamlConfig["Logging"]["AsciiLogs"]) {
                // Default is !isatty(2) but can be set explicitly in config.yaml
                host_config.ascii_logs = yamlConfig["Logging"]["AsciiLogs"].as<bool>();
                host_config.ascii_logs_explicit = true;
            }
        }
        if (yamlConfig["Serial"]) {
            host_config.serialPort = yamlConfig["Serial"]["Port"].as<std::string>("");
            host_config.usbVid = yamlConfig["Serial"]["USB_VID"].as<int>(EEZPAD_USB_VID);
            host_config.usbPid = yamlConfig["Serial"]["USB_PID"].as<int>(EEZPAD_USB_PID);
            host_config.baud = yamlConfig["Serial"]["Baud"].as<int>(EEZPAD_SERIAL_BAUD);
        }
        if (yamlConfig["Device"]) {
            int profile = yamlConfig["Device"]["Profile"].as<int>(0);
            if (profile < 0 || profile >= EEZPAD_NUM_PROFILES) {
                std::cerr << "*** Device.Profile must be 0-" << EEZPAD_NUM_PROFILES - 1 << std::endl;
                return false;
            }
            host_config.profile = (char)('0' + profile);
            int bannerWaitMs = yamlConfig["Device"]["BannerWaitMs"].as<int>(DEFAULT_BANNER_WAIT_MS);
            if (bannerWaitMs < 0 || bannerWaitMs > MAX_BANNER_WAIT_MS) {
                std::cerr << "*** Device.BannerWaitMs must be 0-" << MAX_BANNER_WAIT_MS << std::endl;
                return false;
            }
            host_config.bannerWaitMs = bannerWaitMs;
        }
    } catch (YAML::Exception &e) {
        std::cerr << "*** Exception " << e.what() << std::endl;
        return false;
    }
    return true;
}
