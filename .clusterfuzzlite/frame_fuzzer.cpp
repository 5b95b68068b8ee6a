// Fuzzer that feeds arbitrary bytes to the frame decoder and to the banner parser, the two places that see untrusted
// input.
#include <stddef.h>
#include <stdint.h>
#include <string>

#include "HostConsole.h"
#include "configuration.h"
#include "platform/linux/LinuxGlue.h"
#include "protocol/MessageCodec.h"
#include "protocol/ResponseParser.h"

namespace
{
// Banners are counted so the parser's notify path is exercised too
int bannersSeen = 0;

class BannerCounter
{
  public:
    CallbackObserver<BannerCounter, const DeviceBanner *> observer =
        CallbackObserver<BannerCounter, const DeviceBanner *>(this, &BannerCounter::onBanner);

    int onBanner(const DeviceBanner *)
    {
        bannersSeen++;
        return 0;
    }
};
} // namespace

int LLVMFuzzerInitialize(int *argc, char ***argv)
{
    host_config.logoutputlevel = level_error;
    host_config.ascii_logs = true;
    host_config.ascii_logs_explicit = true;
    consoleInit();
    return 0;
}

// Every input is tried as a frame, and also streamed to a fresh parser in small chunks so that markers straddle chunk
// boundaries.
int LLVMFuzzerTestOneInput(const uint8_t *data, size_t length)
{
    Frame frame;
    if (codec::decodeFrame(data, length, frame)) {
        ConfigMessage msg;
        if (codec::parseMessage(frame, msg)) {
            // A frame that parses must encode back to exactly the input
            std::string again;
            if (!codec::encode(msg, again) || again != std::string((const char *)data, length))
                __builtin_trap();
        }
    }

    ResponseParser parser;
    BannerCounter counter;
    counter.observer.observe(&parser.onBanner);
    for (size_t off = 0; off < length; off += 7) {
        size_t n = length - off < 7 ? length - off : 7;
        parser.feed(data + off, n);
        if (parser.pending() > MAX_UNMATCHED_RX)
            parser.trimTo(ResponseParser::maxMarkerLength());
    }
    return 0;
}
