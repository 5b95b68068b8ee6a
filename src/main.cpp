#include "configuration.h"

#include "ConfigService.h"
#include "HostConsole.h"
#include "concurrency/PeriodicTask.h"
#include "error.h"
#include "platform/linux/LinuxGlue.h"
#include "serial/ConnectionManager.h"
#include "serial/PosixSerialTransport.h"
#include "timing.h"

#include <algorithm>
#include <functional>
#include <iostream>
#include <memory>
#include <stdlib.h>
#include <unistd.h>

// How long we give the read loop to close the port after disconnect()
#define DISCONNECT_WAIT_MS 1000

struct Command {
    const char *name;
    size_t minArgs, maxArgs;
};

static const Command commands[] = {
    {"version", 0, 0}, {"macro", 2, 2},  {"alias", 2, 2}, {"unalias", 1, 1}, {"script", 2, 2},
    {"unscript", 1, 1}, {"key", 2, 4}, {"led", 2, 2},   {"wifi", 2, 2},
};

static const Command *findCommand(const std::string &name)
{
    for (const auto &c : commands) {
        if (name == c.name)
            return &c;
    }
    return NULL;
}

/// Strict decimal parse, false on trailing junk
static bool parseInt(const std::string &s, int &out)
{
    if (s.empty())
        return false;
    char *end = NULL;
    long v = strtol(s.c_str(), &end, 10);
    if (*end != '\0' || v < INT32_MIN || v > INT32_MAX)
        return false;
    out = (int)v;
    return true;
}

/**
 * Run the scheduler (and with it the read loop) until done() says so or timeoutMs has passed.
 */
static bool runUntil(uint32_t timeoutMs, const std::function<bool()> &done)
{
    uint32_t start = timing::millis();
    while (!done()) {
        uint32_t elapsed = timing::millis() - start;
        if (elapsed >= timeoutMs)
            return false;

        concurrency::periodicScheduler.loop();

        // Short naps only, done() is rechecked after each one and usleep() takes less than a second
        uint32_t delayMsec = READ_POLL_IDLE_MS;
        int32_t toNextTask = concurrency::periodicScheduler.msecToNextTask();
        if (toNextTask >= 0 && (uint32_t)toNextTask < delayMsec)
            delayMsec = (uint32_t)toNextTask;
        delayMsec = std::min(delayMsec, timeoutMs - elapsed);
        if (delayMsec > 0)
            usleep((useconds_t)delayMsec * 1000);
    }
    return true;
}

static ErrorCode runCommand(ConfigService &service, ConnectionManager &conn)
{
    const std::string &cmd = host_config.command;
    const std::vector<std::string> &args = host_config.commandArgs;

    if (cmd == "version") {
        // connect() already asked, just wait for the banner
        if (!runUntil(host_config.bannerWaitMs, [&conn] { return conn.getVersion() >= 0 || !conn.isConnected(); }) ||
            conn.getVersion() < 0) {
            LOG_ERROR("No version banner from %s within %d ms", conn.describe(), host_config.bannerWaitMs);
            return ErrorCode::TRANSPORT_IO;
        }
        std::cout << conn.getVersion() << std::endl;
        return ErrorCode::NONE;
    }

    if (cmd == "led") {
        int brightness;
        if (!parseInt(args[1], brightness)) {
            LOG_ERROR("Brightness '%s' is not a number", args[1].c_str());
            return ErrorCode::VALIDATION;
        }
        return service.setLed(args[0], brightness);
    }

    if (cmd == "wifi")
        return service.setWifi(args[0], args[1]);

    // Everything else is per key
    int key;
    if (!parseInt(args[0], key)) {
        LOG_ERROR("Key '%s' is not a number", args[0].c_str());
        return ErrorCode::VALIDATION;
    }

    if (cmd == "macro")
        return service.bindMacro(key, args[1]);
    if (cmd == "alias")
        return service.setAlias(key, args[1]);
    if (cmd == "unalias")
        return service.removeAlias(key);
    if (cmd == "script")
        return service.setScript(key, args[1]);
    if (cmd == "unscript")
        return service.removeScript(key);

    // key KEY MACRO [ALIAS [SCRIPT]]
    const std::string *alias = args.size() > 2 ? &args[2] : NULL;
    const std::string *script = args.size() > 3 ? &args[3] : NULL;
    return service.saveKeyConfig(key, args[1], alias, script);
}

int main(int argc, char **argv)
{
    if (!linuxParseArgs(argc, argv))
        return EXIT_FAILURE;
    if (!linuxSetup())
        return EXIT_FAILURE;

    if (host_config.yamlOnly) {
        std::cout << host_config.emit_yaml() << std::endl;
        return EXIT_SUCCESS;
    }

    // After the config, it decides about colors
    consoleInit();
    LOG_INFO("eezpadctl %s", optstr(APP_VERSION));

    const Command *command = findCommand(host_config.command);
    if (!command) {
        LOG_ERROR("Unknown command '%s', see --help", host_config.command.c_str());
        return EXIT_FAILURE;
    }
    if (host_config.commandArgs.size() < command->minArgs || host_config.commandArgs.size() > command->maxArgs) {
        LOG_ERROR("Wrong number of arguments for '%s', see --help", command->name);
        return EXIT_FAILURE;
    }

    ConnectionManager conn(std::unique_ptr<Transport>(new PosixSerialTransport(
                               host_config.serialPort, (uint16_t)host_config.usbVid, (uint16_t)host_config.usbPid)),
                           (uint32_t)host_config.baud);

    ErrorCode err = conn.connect();
    if (err != ErrorCode::NONE)
        return EXIT_FAILURE;

    ConfigService service(conn, host_config.profile);
    err = runCommand(service, conn);
    if (err != ErrorCode::NONE && service.lastReason())
        std::cerr << "eezpadctl: " << service.lastReason() << std::endl;

    conn.disconnect();
    if (!runUntil(DISCONNECT_WAIT_MS, [&conn] { return conn.getState() == eezpad::ConnectionState::DISCONNECTED; }))
        LOG_WARN("%s did not close in time", conn.describe());

    if (traceFile.is_open())
        traceFile.close();

    return err == ErrorCode::NONE ? EXIT_SUCCESS : EXIT_FAILURE;
}
