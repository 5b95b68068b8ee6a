#pragma once

#include "error.h"
#include "protocol/InputValidator.h"
#include "protocol/MessageCodec.h"
#include "serial/ConnectionManager.h"
#include <string>
#include <vector>

/**
 * What a front end talks to: every configuration action validated, encoded and sent over one ConnectionManager.
 *
 * Each call either sends all its frames or none of them. On VALIDATION or FRAME_TOO_LONG the reason is available from
 * lastReason() until the next call.
 */
class ConfigService
{
    ConnectionManager &conn;

    /// The profile per key actions apply to, only changed by selectProfile()
    char profile;

    const char *reason = NULL;

  public:
    explicit ConfigService(ConnectionManager &conn, char profile = '0');

    ErrorCode selectProfile(char p);
    char getProfile() const { return profile; }

    /// Bind raw macro text (with {tokens}) to a key of the current profile
    ErrorCode bindMacro(int keyIndex, const std::string &rawMacro);

    ErrorCode setAlias(int keyIndex, const std::string &alias);
    ErrorCode removeAlias(int keyIndex);

    ErrorCode setScript(int keyIndex, const std::string &script);
    ErrorCode removeScript(int keyIndex);

    ErrorCode setLed(const std::string &color, int brightness);

    ErrorCode setWifi(const std::string &ssid, const std::string &password);

    /// The answer arrives later, through ConnectionManager::onBanner()
    ErrorCode queryVersion();

    /**
     * Configure one key in one go: the macro, then the alias, then the script.
     *
     * A NULL alias or script removes the existing one, the way the web configurator does when that section is hidden.
     */
    ErrorCode saveKeyConfig(int keyIndex, const std::string &rawMacro, const std::string *alias, const std::string *script);

    /// Why the last call was refused, NULL if it was not
    const char *lastReason() const { return reason; }

  private:
    /// Record a refusal
    ErrorCode reject(ErrorCode code, const char *why);

    ErrorCode checkKey(int keyIndex);

    /// Encode every message first, then send them in order. Nothing is sent if any of them does not fit.
    ErrorCode sendAll(const std::vector<ConfigMessage> &msgs);
};
