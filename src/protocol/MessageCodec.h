#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

/**
 * ## Wire encoding

Every configuration message is one frame written to the serial port, with no terminator and no acknowledgement:

    offset 0-2 : magic "ebf"
    offset 3   : length, one byte, value = total frame length - 4 (the magic and the length byte are not counted)
    offset 4   : type, one ASCII digit (see MessageKind)
    offset 5.. : kind specific body

The length is a single raw byte, so a frame carries at most MAX_FRAME_LEN_FIELD bytes after the length byte. This is a
limit of the device protocol: frames that do not fit are refused by encodeFrame, never truncated.

Per key bodies look like "<profile>.<key>:<payload>", e.g. "ebf\x0b" "0" "1.1:0hello" binds "hello" to key 1 of
profile 1.
 */

#define FRAME_MAGIC "ebf"
#define FRAME_MAGIC_LEN 3
#define FRAME_LEN_OFFSET 3
#define FRAME_TYPE_OFFSET 4
#define FRAME_HEADER_LEN 5
#define MAX_FRAME_LEN_FIELD 0xff

enum class MessageKind : char {
    MACRO_BIND = '0',
    LED_COLOR = '1',
    ALIAS_ADD = '2',
    ALIAS_REMOVE = '3',
    WIFI_CONFIG = '4',
    VERSION_QUERY = '5',
    SCRIPT_ADD = '6',
    SCRIPT_REMOVE = '7',
};

/**
 * One logical configuration action, before framing.
 *
 * profile and keyIndex are only meaningful for the per key kinds (macro, alias, script). For MACRO_BIND the payload is
 * already escaped (sentinel bytes instead of {tokens}) and modifierFlag tells the device whether it is a chord.
 */
struct ConfigMessage {
    MessageKind kind = MessageKind::VERSION_QUERY;
    char profile = '0';
    int keyIndex = 0;
    bool modifierFlag = false;
    std::string payload;

    bool hasKey() const;
};

/**
 * The frame layer: magic and length are implied, only type and body are stored.
 */
struct Frame {
    char type = '5';
    std::string body;
};

namespace codec
{

/// Messages for each kind. makeMacro escapes raw (unvalidated) macro text through the modifier table.
ConfigMessage makeMacro(char profile, int keyIndex, const std::string &rawMacro);
ConfigMessage makeLedColor(const std::string &color, int brightness);
ConfigMessage makeAliasAdd(char profile, int keyIndex, const std::string &alias);
ConfigMessage makeAliasRemove(char profile, int keyIndex);
ConfigMessage makeWifi(const std::string &ssid, const std::string &password);
ConfigMessage makeVersionQuery();
ConfigMessage makeScriptAdd(char profile, int keyIndex, const std::string &script);
ConfigMessage makeScriptRemove(char profile, int keyIndex);

/// Assemble the kind specific body
Frame buildFrame(const ConfigMessage &msg);

/**
 * Serialize a frame: magic, a length placeholder, type and body in one pass, then patch the length byte.
 *
 * Returns false (and leaves out empty) if the frame does not fit the length field.
 */
bool encodeFrame(const Frame &frame, std::string &out);

/// buildFrame + encodeFrame
bool encode(const ConfigMessage &msg, std::string &out);

/**
 * Parse exactly one frame. Fails on a bad magic, a length byte that does not match the buffer, or a missing type.
 */
bool decodeFrame(const uint8_t *buf, size_t len, Frame &out);

/// Inverse of buildFrame. Fails on an unknown type or a body that does not have the shape of its kind.
bool parseMessage(const Frame &frame, ConfigMessage &out);

/// Total frame length - 4, what belongs at FRAME_LEN_OFFSET
size_t lengthField(size_t totalFrameLen);

const char *kindName(MessageKind kind);

} // namespace codec
