#pragma once

#include <stddef.h>
#include <string>

// Plain text macros are typed one key at a time from a buffer of this size on the device
#define MAX_MACRO_CHARS 128
// A chord is sent as one boot keyboard report: 8 modifier bits plus 6 key slots
#define MAX_CHORD_KEYS 6

#define MAX_WIFI_SSID_LEN 32
#define MAX_WIFI_PASSWORD_LEN 64

/**
 * Outcome of a validation check. reason is a static human readable string, set only when ok is false.
 */
struct ValidationResult {
    bool ok = true;
    const char *reason = nullptr;

    // Filled in by validateMacro
    size_t escapedLength = 0;
    size_t modifierCount = 0;

    static ValidationResult accept() { return ValidationResult(); }
    static ValidationResult reject(const char *why)
    {
        ValidationResult r;
        r.ok = false;
        r.reason = why;
        return r;
    }
};

namespace validator
{

/**
 * Decide whether the device can represent a raw (pre-substitution) macro.
 *
 * With modifiers present the whole macro is one chord, so at most MAX_CHORD_KEYS non-modifier keys may remain after
 * substitution. Without modifiers the escaped text may be up to MAX_MACRO_CHARS long.
 */
ValidationResult validateMacro(const std::string &raw);

ValidationResult validateProfile(char profile);

ValidationResult validateKeyIndex(int keyIndex);

/// "#RRGGBB" or "RRGGBB"
ValidationResult validateLedColor(const std::string &color);

ValidationResult validateWifi(const std::string &ssid, const std::string &password);

} // namespace validator
