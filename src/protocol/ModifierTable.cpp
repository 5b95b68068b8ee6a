#include "ModifierTable.h"

namespace
{

// Substitution order matches what the firmware's web configurator always sent
constexpr ModifierToken tokens[] = {
    {"{lctrl}", 0xE0, true},
    {"{lshift}", 0xE1, true},
    {"{lalt}", 0xE2, true},
    {"{lgui}", 0xE3, true},
    {"{rctrl}", 0xE4, true},
    {"{rshift}", 0xE5, true},
    {"{ralt}", 0xE6, true},
    {"{rgui}", 0xE7, true},

    {"{arrowup}", 0xD2, false},
    {"{arrowdown}", 0xD1, false},
    {"{arrowleft}", 0xD0, false},
    {"{arrowright}", 0xCF, false},
    {"{pagedown}", 0xCE, false},
    {"{end}", 0xCD, false},
    {"{delete}", 0xCC, false},
    {"{pageup}", 0xCB, false},
    {"{home}", 0xCA, false},
    {"{insert}", 0xC9, false},
    {"{pause}", 0xC8, false},
    {"{scrolllock}", 0xC7, false},
    {"{prtscr}", 0xC6, false},
    {"{f12}", 0xC5, false},
    {"{f11}", 0xC4, false},
    {"{f10}", 0xC3, false},
    {"{f9}", 0xC2, false},
    {"{f8}", 0xC1, false},
    {"{f7}", 0xC0, false},
    {"{f6}", 0xBF, false},
    {"{f5}", 0xBE, false},
    {"{f4}", 0xBD, false},
    {"{f3}", 0xBC, false},
    {"{f2}", 0xBB, false},
    {"{f1}", 0xBA, false},

    {"{enter}", 0xA8, false},
    {"{escape}", 0xA9, false},
    {"{bkspace}", 0xAA, false},
    {"{tab}", 0xAB, false},
    {"{space}", 0xAC, false},
};

constexpr size_t numTokens = sizeof(tokens) / sizeof(tokens[0]);

constexpr bool sameName(const char *a, const char *b)
{
    while (*a && *a == *b) {
        a++;
        b++;
    }
    return *a == *b;
}

constexpr bool tableIsUnique()
{
    for (size_t i = 0; i < numTokens; i++) {
        for (size_t j = i + 1; j < numTokens; j++) {
            if (tokens[i].code == tokens[j].code || sameName(tokens[i].name, tokens[j].name))
                return false;
        }
    }
    return true;
}

constexpr bool codesAreSentinels()
{
    for (size_t i = 0; i < numTokens; i++) {
        if (tokens[i].code < 0xA8 || tokens[i].code > 0xE7)
            return false;
    }
    return true;
}

constexpr size_t modifierEntries()
{
    size_t n = 0;
    for (size_t i = 0; i < numTokens; i++) {
        if (tokens[i].isModifier)
            n++;
    }
    return n;
}

static_assert(tableIsUnique(), "key token names and codes must be unique");
static_assert(codesAreSentinels(), "key token codes must stay outside printable ASCII");
static_assert(modifierEntries() == 8, "exactly 8 modifier keys (l/r x ctrl/shift/alt/gui)");

} // namespace

namespace modifiers
{

const size_t tokenCount = numTokens;

const ModifierToken &tokenAt(size_t i)
{
    return tokens[i];
}

const ModifierToken *findToken(const std::string &name)
{
    for (const auto &t : tokens) {
        if (name == t.name)
            return &t;
    }
    return NULL;
}

const ModifierToken *findCode(uint8_t code)
{
    for (const auto &t : tokens) {
        if (t.code == code)
            return &t;
    }
    return NULL;
}

std::string substitute(const std::string &raw)
{
    std::string placed = raw;
    for (const auto &t : tokens) {
        const std::string name(t.name);
        size_t pos = 0;
        while ((pos = placed.find(name, pos)) != std::string::npos) {
            placed.replace(pos, name.size(), 1, (char)t.code);
            pos += 1;
        }
    }
    return placed;
}

size_t countModifiers(const std::string &raw)
{
    size_t n = 0;
    for (const auto &t : tokens) {
        if (!t.isModifier)
            continue;
        // Each modifier key is held once per chord, however often it is named
        if (raw.find(t.name) != std::string::npos)
            n++;
    }
    return n;
}

std::string describe(const std::string &escaped)
{
    std::string out;
    for (char c : escaped) {
        const ModifierToken *t = findCode((uint8_t)c);
        if (t)
            out += t->name;
        else
            out += c;
    }
    return out;
}

} // namespace modifiers
