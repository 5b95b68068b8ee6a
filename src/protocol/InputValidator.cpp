#include "InputValidator.h"
#include "ModifierTable.h"
#include "configuration.h"
#include <ctype.h>

namespace validator
{

ValidationResult validateMacro(const std::string &raw)
{
    std::string replaced = modifiers::substitute(raw);
    size_t modifierNum = modifiers::countModifiers(raw);
    size_t len = replaced.size();

    ValidationResult r;
    if (modifierNum > 0) {
        if (len - modifierNum > MAX_CHORD_KEYS)
            r = ValidationResult::reject("only 6 keys allowed when using a key modifier, such as {lctrl}");
    } else if (len > MAX_MACRO_CHARS) {
        r = ValidationResult::reject("too many chars, only 128 allowed");
    }

    r.escapedLength = len;
    r.modifierCount = modifierNum;
    if (!r.ok)
        LOG_DEBUG("Reject macro, escaped len=%u modifiers=%u", (unsigned)len, (unsigned)modifierNum);
    return r;
}

ValidationResult validateProfile(char profile)
{
    if (profile < '0' || profile >= '0' + EEZPAD_NUM_PROFILES)
        return ValidationResult::reject("profile must be 0-4");
    return ValidationResult::accept();
}

ValidationResult validateKeyIndex(int keyIndex)
{
    if (keyIndex < EEZPAD_MIN_KEY_INDEX || keyIndex > EEZPAD_MAX_KEY_INDEX)
        return ValidationResult::reject("key must be 1-8");
    return ValidationResult::accept();
}

ValidationResult validateLedColor(const std::string &color)
{
    std::string hex = (!color.empty() && color[0] == '#') ? color.substr(1) : color;
    if (hex.size() != 6)
        return ValidationResult::reject("color must be 6 hex digits, like #ff8800");
    for (char c : hex) {
        if (!isxdigit((unsigned char)c))
            return ValidationResult::reject("color must be 6 hex digits, like #ff8800");
    }
    return ValidationResult::accept();
}

ValidationResult validateWifi(const std::string &ssid, const std::string &password)
{
    if (ssid.empty())
        return ValidationResult::reject("ssid must not be empty");
    if (ssid.size() > MAX_WIFI_SSID_LEN)
        return ValidationResult::reject("ssid is longer than 32 bytes");
    if (password.size() > MAX_WIFI_PASSWORD_LEN)
        return ValidationResult::reject("password is longer than 64 bytes");
    return ValidationResult::accept();
}

} // namespace validator
