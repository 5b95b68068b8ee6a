#include "ConfigService.h"
#include "configuration.h"

ConfigService::ConfigService(ConnectionManager &_conn, char _profile) : conn(_conn), profile('0')
{
    if (selectProfile(_profile) != ErrorCode::NONE)
        LOG_WARN("Profile '%c' is not valid, using profile 0", _profile);
}

ErrorCode ConfigService::reject(ErrorCode code, const char *why)
{
    reason = why;
    LOG_ERROR("Refused: %s", why);
    RECORD_ERROR(code);
    return code;
}

ErrorCode ConfigService::selectProfile(char p)
{
    reason = NULL;
    ValidationResult r = validator::validateProfile(p);
    if (!r.ok)
        return reject(ErrorCode::VALIDATION, r.reason);

    if (p != profile)
        LOG_INFO("Selected profile %c", p);
    profile = p;
    return ErrorCode::NONE;
}

ErrorCode ConfigService::checkKey(int keyIndex)
{
    ValidationResult r = validator::validateKeyIndex(keyIndex);
    if (!r.ok)
        return reject(ErrorCode::VALIDATION, r.reason);
    return ErrorCode::NONE;
}

ErrorCode ConfigService::sendAll(const std::vector<ConfigMessage> &msgs)
{
    std::vector<std::string> frames;
    for (const auto &m : msgs) {
        std::string frame;
        if (!codec::encode(m, frame))
            return reject(ErrorCode::FRAME_TOO_LONG, "text too long for one frame");
        frames.push_back(frame);
    }

    for (size_t i = 0; i < frames.size(); i++) {
        LOG_DEBUG("Send %s for profile %c", codec::kindName(msgs[i].kind), profile);
        ErrorCode err = conn.send(frames[i]);
        if (err != ErrorCode::NONE)
            return err;
    }
    return ErrorCode::NONE;
}

ErrorCode ConfigService::bindMacro(int keyIndex, const std::string &rawMacro)
{
    reason = NULL;
    if (checkKey(keyIndex) != ErrorCode::NONE)
        return ErrorCode::VALIDATION;

    ValidationResult r = validator::validateMacro(rawMacro);
    if (!r.ok)
        return reject(ErrorCode::VALIDATION, r.reason);

    return sendAll({codec::makeMacro(profile, keyIndex, rawMacro)});
}

ErrorCode ConfigService::setAlias(int keyIndex, const std::string &alias)
{
    reason = NULL;
    if (checkKey(keyIndex) != ErrorCode::NONE)
        return ErrorCode::VALIDATION;
    return sendAll({codec::makeAliasAdd(profile, keyIndex, alias)});
}

ErrorCode ConfigService::removeAlias(int keyIndex)
{
    reason = NULL;
    if (checkKey(keyIndex) != ErrorCode::NONE)
        return ErrorCode::VALIDATION;
    return sendAll({codec::makeAliasRemove(profile, keyIndex)});
}

ErrorCode ConfigService::setScript(int keyIndex, const std::string &script)
{
    reason = NULL;
    if (checkKey(keyIndex) != ErrorCode::NONE)
        return ErrorCode::VALIDATION;
    return sendAll({codec::makeScriptAdd(profile, keyIndex, script)});
}

ErrorCode ConfigService::removeScript(int keyIndex)
{
    reason = NULL;
    if (checkKey(keyIndex) != ErrorCode::NONE)
        return ErrorCode::VALIDATION;
    return sendAll({codec::makeScriptRemove(profile, keyIndex)});
}

ErrorCode ConfigService::setLed(const std::string &color, int brightness)
{
    reason = NULL;
    ValidationResult r = validator::validateLedColor(color);
    if (!r.ok)
        return reject(ErrorCode::VALIDATION, r.reason);
    if (brightness < 0)
        return reject(ErrorCode::VALIDATION, "brightness must not be negative");
    return sendAll({codec::makeLedColor(color, brightness)});
}

ErrorCode ConfigService::setWifi(const std::string &ssid, const std::string &password)
{
    reason = NULL;
    ValidationResult r = validator::validateWifi(ssid, password);
    if (!r.ok)
        return reject(ErrorCode::VALIDATION, r.reason);
    if (ssid.find('.') != std::string::npos)
        LOG_WARN("SSID contains '.', the device may split it from the password at the wrong place");
    return sendAll({codec::makeWifi(ssid, password)});
}

ErrorCode ConfigService::queryVersion()
{
    reason = NULL;
    return sendAll({codec::makeVersionQuery()});
}

ErrorCode ConfigService::saveKeyConfig(int keyIndex, const std::string &rawMacro, const std::string *alias,
                                       const std::string *script)
{
    reason = NULL;
    if (checkKey(keyIndex) != ErrorCode::NONE)
        return ErrorCode::VALIDATION;

    ValidationResult r = validator::validateMacro(rawMacro);
    if (!r.ok)
        return reject(ErrorCode::VALIDATION, r.reason);

    std::vector<ConfigMessage> msgs;
    msgs.push_back(codec::makeMacro(profile, keyIndex, rawMacro));
    msgs.push_back(alias ? codec::makeAliasAdd(profile, keyIndex, *alias) : codec::makeAliasRemove(profile, keyIndex));
    msgs.push_back(script ? codec::makeScriptAdd(profile, keyIndex, *script) : codec::makeScriptRemove(profile, keyIndex));
    return sendAll(msgs);
}
