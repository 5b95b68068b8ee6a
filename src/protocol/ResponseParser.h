#pragma once

#include "Observer.h"
#include <stddef.h>
#include <stdint.h>
#include <string>

/// Inbound banner kinds the firmware prints among its free text output
enum class BannerKind : uint8_t {
    VERSION, // "APP-VER=<n>"
};

/// Handed to observers of ResponseParser::onBanner. Only valid during the notification.
struct DeviceBanner {
    BannerKind kind;
    int32_t value;
};

/**
 * Finds banners in the device's inbound text stream.
 *
 * Chunks are appended to a scan buffer. Once the buffer is longer than a marker and contains it, the text after the
 * marker is parsed as a base 10 integer (trailing non digits are ignored), a DeviceBanner is emitted and the buffer is
 * cleared. Text that never matches stays buffered: bounding that is up to the caller (see trimTo()).
 *
 * A number split across chunks is emitted as soon as its first digits arrive, the device sends the banner in one write.
 */
class ResponseParser
{
  public:
    struct Marker {
        const char *text;
        BannerKind kind;
    };

    /// Append a chunk, emit at most one banner. Returns true if a banner was emitted.
    bool feed(const uint8_t *data, size_t len);
    bool feed(const std::string &chunk) { return feed((const uint8_t *)chunk.data(), chunk.size()); }

    /// Bytes waiting for a marker
    size_t pending() const { return buffer.size(); }

    /// Keep only the last keep bytes, so a marker that straddles the cut can still match
    void trimTo(size_t keep);

    void reset() { buffer.clear(); }

    Observable<const DeviceBanner *> onBanner;

    /// Longest marker, a buffer must be longer than this before we scan it
    static size_t maxMarkerLength();

  private:
    std::string buffer;

    /// Parse the digits after a marker, false if there are none
    static bool parseNumber(const std::string &text, int32_t &value);
};
