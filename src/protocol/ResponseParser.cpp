#include "ResponseParser.h"
#include "configuration.h"
#include <ctype.h>
#include <string.h>

// Every banner we understand, scanned in this order
static const ResponseParser::Marker markers[] = {
    {"APP-VER=", BannerKind::VERSION},
};

size_t ResponseParser::maxMarkerLength()
{
    size_t longest = 0;
    for (const auto &m : markers) {
        size_t l = strlen(m.text);
        if (l > longest)
            longest = l;
    }
    return longest;
}

bool ResponseParser::parseNumber(const std::string &text, int32_t &value)
{
    size_t i = 0;
    while (i < text.size() && isspace((unsigned char)text[i]))
        i++;

    bool negative = false;
    if (i < text.size() && (text[i] == '-' || text[i] == '+')) {
        negative = text[i] == '-';
        i++;
    }

    if (i >= text.size() || !isdigit((unsigned char)text[i]))
        return false;

    int64_t n = 0;
    for (; i < text.size() && isdigit((unsigned char)text[i]); i++) {
        if (n < INT32_MAX)
            n = n * 10 + (text[i] - '0');
    }
    if (n > INT32_MAX)
        n = INT32_MAX;
    value = (int32_t)(negative ? -n : n);
    return true;
}

bool ResponseParser::feed(const uint8_t *data, size_t len)
{
    buffer.append((const char *)data, len);

    for (const auto &m : markers) {
        size_t markerLen = strlen(m.text);
        if (buffer.size() <= markerLen)
            continue;

        size_t at = buffer.find(m.text);
        if (at == std::string::npos)
            continue;

        std::string rest = buffer.substr(at + markerLen);
        if (rest.empty())
            return false; // marker seen, wait for the number in the next chunk

        DeviceBanner banner;
        banner.kind = m.kind;
        if (!parseNumber(rest, banner.value)) {
            LOG_WARN("Malformed banner %s, dropping %u bytes", m.text, (unsigned)buffer.size());
            buffer.clear();
            return false;
        }

        LOG_DEBUG("Banner %s%d", m.text, banner.value);
        buffer.clear();
        onBanner.notifyObservers(&banner);
        return true;
    }

    return false;
}

void ResponseParser::trimTo(size_t keep)
{
    if (buffer.size() > keep)
        buffer.erase(0, buffer.size() - keep);
}
