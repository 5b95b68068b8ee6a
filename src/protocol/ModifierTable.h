#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

/**
 * Bracketed key names the configurator accepts inside macro text, and the single byte the firmware expects for each.
 *
 * The codes sit above printable ASCII (0xA8-0xE7) so they can never collide with typed characters. Modifiers use the
 * HID usage ids of the modifier keys (0xE0-0xE7), the others are the firmware's own private assignments.
 */
struct ModifierToken {
    const char *name; // including braces, e.g. "{lctrl}"
    uint8_t code;
    bool isModifier; // one of the 8 ctrl/shift/alt/gui keys
};

namespace modifiers
{

/// Number of entries in the table
extern const size_t tokenCount;

/// Entry i in substitution order
const ModifierToken &tokenAt(size_t i);

/// Look up a token by its bracketed name, NULL if unknown
const ModifierToken *findToken(const std::string &name);

/// Reverse lookup, NULL if code is not a sentinel
const ModifierToken *findCode(uint8_t code);

/**
 * Replace every occurrence of every known token with its sentinel byte. Unknown bracketed names stay as typed.
 *
 * Tokens are applied in table order, one full pass per token.
 */
std::string substitute(const std::string &raw);

/// Number of distinct modifier tokens (ctrl/shift/alt/gui, left or right) named in raw, pre-substitution text
size_t countModifiers(const std::string &raw);

/// Render escaped text back into token form, for logging
std::string describe(const std::string &escaped);

} // namespace modifiers
