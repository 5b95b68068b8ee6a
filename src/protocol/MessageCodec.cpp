#include "MessageCodec.h"
#include "ModifierTable.h"
#include <string.h>

bool ConfigMessage::hasKey() const
{
    switch (kind) {
    case MessageKind::MACRO_BIND:
    case MessageKind::ALIAS_ADD:
    case MessageKind::ALIAS_REMOVE:
    case MessageKind::SCRIPT_ADD:
    case MessageKind::SCRIPT_REMOVE:
        return true;
    default:
        return false;
    }
}

static ConfigMessage makeKeyMessage(MessageKind kind, char profile, int keyIndex, const std::string &payload)
{
    ConfigMessage m;
    m.kind = kind;
    m.profile = profile;
    m.keyIndex = keyIndex;
    m.payload = payload;
    return m;
}

/// Parse "<profile>.<key>:" at the start of body, returns the offset just past the ':' or 0 on failure
static size_t parseKeyPrefix(const std::string &body, ConfigMessage &out)
{
    if (body.size() < 4 || body[1] != '.')
        return 0;

    size_t colon = body.find(':', 2);
    if (colon == std::string::npos || colon == 2)
        return 0;
    if (colon > 3 && body[2] == '0')
        return 0; // we never write leading zeros

    int key = 0;
    for (size_t i = 2; i < colon; i++) {
        if (body[i] < '0' || body[i] > '9')
            return 0;
        key = key * 10 + (body[i] - '0');
        if (key > 0xffff)
            return 0; // nobody has a macro pad this big, treat as garbage
    }

    out.profile = body[0];
    out.keyIndex = key;
    return colon + 1;
}

namespace codec
{

ConfigMessage makeMacro(char profile, int keyIndex, const std::string &rawMacro)
{
    ConfigMessage m = makeKeyMessage(MessageKind::MACRO_BIND, profile, keyIndex, modifiers::substitute(rawMacro));
    m.modifierFlag = modifiers::countModifiers(rawMacro) > 0;
    return m;
}

ConfigMessage makeLedColor(const std::string &color, int brightness)
{
    ConfigMessage m;
    m.kind = MessageKind::LED_COLOR;
    // The device wants bare hex digits
    m.payload = (!color.empty() && color[0] == '#') ? color.substr(1) : color;
    m.payload += std::to_string(brightness);
    return m;
}

ConfigMessage makeAliasAdd(char profile, int keyIndex, const std::string &alias)
{
    return makeKeyMessage(MessageKind::ALIAS_ADD, profile, keyIndex, alias);
}

ConfigMessage makeAliasRemove(char profile, int keyIndex)
{
    return makeKeyMessage(MessageKind::ALIAS_REMOVE, profile, keyIndex, "");
}

ConfigMessage makeWifi(const std::string &ssid, const std::string &password)
{
    ConfigMessage m;
    m.kind = MessageKind::WIFI_CONFIG;
    m.payload = ssid + "." + password;
    return m;
}

ConfigMessage makeVersionQuery()
{
    ConfigMessage m;
    m.kind = MessageKind::VERSION_QUERY;
    return m;
}

ConfigMessage makeScriptAdd(char profile, int keyIndex, const std::string &script)
{
    return makeKeyMessage(MessageKind::SCRIPT_ADD, profile, keyIndex, script);
}

ConfigMessage makeScriptRemove(char profile, int keyIndex)
{
    return makeKeyMessage(MessageKind::SCRIPT_REMOVE, profile, keyIndex, "");
}

Frame buildFrame(const ConfigMessage &msg)
{
    Frame f;
    f.type = (char)msg.kind;

    if (msg.hasKey()) {
        f.body += msg.profile;
        f.body += '.';
        f.body += std::to_string(msg.keyIndex);
        f.body += ':';
        if (msg.kind == MessageKind::MACRO_BIND)
            f.body += msg.modifierFlag ? '1' : '0';
        // remove kinds carry an empty payload
        f.body += msg.payload;
    } else if (msg.kind != MessageKind::VERSION_QUERY) {
        f.body = msg.payload;
    }
    return f;
}

size_t lengthField(size_t totalFrameLen)
{
    return totalFrameLen - (FRAME_MAGIC_LEN + 1);
}

bool encodeFrame(const Frame &frame, std::string &out)
{
    out.clear();
    size_t total = FRAME_HEADER_LEN + frame.body.size();
    if (lengthField(total) > MAX_FRAME_LEN_FIELD)
        return false;

    out.reserve(total);
    out += FRAME_MAGIC;
    out += '\0'; // length placeholder
    out += frame.type;
    out += frame.body;

    out[FRAME_LEN_OFFSET] = (char)lengthField(out.size());
    return true;
}

bool encode(const ConfigMessage &msg, std::string &out)
{
    return encodeFrame(buildFrame(msg), out);
}

bool decodeFrame(const uint8_t *buf, size_t len, Frame &out)
{
    if (len < FRAME_HEADER_LEN || memcmp(buf, FRAME_MAGIC, FRAME_MAGIC_LEN) != 0)
        return false;
    if (buf[FRAME_LEN_OFFSET] != lengthField(len))
        return false;

    out.type = (char)buf[FRAME_TYPE_OFFSET];
    out.body.assign((const char *)buf + FRAME_HEADER_LEN, len - FRAME_HEADER_LEN);
    return true;
}

bool parseMessage(const Frame &frame, ConfigMessage &out)
{
    out = ConfigMessage();
    if (frame.type < (char)MessageKind::MACRO_BIND || frame.type > (char)MessageKind::SCRIPT_REMOVE)
        return false;
    out.kind = (MessageKind)frame.type;

    if (!out.hasKey()) {
        if (out.kind == MessageKind::VERSION_QUERY && !frame.body.empty())
            return false;
        out.payload = frame.body;
        return true;
    }

    size_t start = parseKeyPrefix(frame.body, out);
    if (!start)
        return false;

    switch (out.kind) {
    case MessageKind::MACRO_BIND:
        if (start >= frame.body.size() || (frame.body[start] != '0' && frame.body[start] != '1'))
            return false;
        out.modifierFlag = frame.body[start] == '1';
        out.payload = frame.body.substr(start + 1);
        return true;
    case MessageKind::ALIAS_REMOVE:
    case MessageKind::SCRIPT_REMOVE:
        return start == frame.body.size();
    default:
        out.payload = frame.body.substr(start);
        return true;
    }
}

const char *kindName(MessageKind kind)
{
    switch (kind) {
    case MessageKind::MACRO_BIND:
        return "macro-bind";
    case MessageKind::LED_COLOR:
        return "led-color";
    case MessageKind::ALIAS_ADD:
        return "alias-add";
    case MessageKind::ALIAS_REMOVE:
        return "alias-remove";
    case MessageKind::WIFI_CONFIG:
        return "wifi-config";
    case MessageKind::VERSION_QUERY:
        return "version-query";
    case MessageKind::SCRIPT_ADD:
        return "script-add";
    case MessageKind::SCRIPT_REMOVE:
        return "script-remove";
    }
    return "unknown";
}

} // namespace codec
