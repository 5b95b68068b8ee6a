#include "UsbSerialFinder.h"
#include "configuration.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

/// Read a sysfs id attribute ("303a\n"), -1 if missing or unparseable
static long readHexAttr(const std::filesystem::path &p)
{
    std::ifstream in(p);
    std::string s;
    if (!(in >> s))
        return -1;
    try {
        return std::stol(s, nullptr, 16);
    } catch (const std::exception &e) {
        LOG_DEBUG("Ignore %s: %s", p.c_str(), e.what());
        return -1;
    }
}

/// Walk up from the tty's device node until we reach the USB device that carries idVendor/idProduct
static bool matchesUsbId(const std::filesystem::path &ttyDir, uint16_t vid, uint16_t pid)
{
    std::error_code ec;
    std::filesystem::path dev = std::filesystem::canonical(ttyDir / "device", ec);
    if (ec)
        return false; // virtual tty, no hardware behind it

    for (int depth = 0; depth < 4 && !dev.empty() && dev != dev.root_path(); depth++) {
        if (std::filesystem::exists(dev / "idVendor", ec)) {
            return readHexAttr(dev / "idVendor") == vid && readHexAttr(dev / "idProduct") == pid;
        }
        dev = dev.parent_path();
    }
    return false;
}

std::string findUsbSerialPort(uint16_t vid, uint16_t pid, const std::string &sysRoot)
{
    std::vector<std::string> found;
    std::error_code ec;

    std::filesystem::directory_iterator it(sysRoot, ec);
    if (ec) {
        LOG_WARN("Cannot list %s: %s", sysRoot.c_str(), ec.message().c_str());
        return "";
    }

    for (const std::filesystem::directory_entry &entry : it) {
        std::string name = entry.path().filename().string();
        if (name.rfind("ttyACM", 0) != 0 && name.rfind("ttyUSB", 0) != 0)
            continue;
        if (matchesUsbId(entry.path(), vid, pid))
            found.push_back(name);
    }

    if (found.empty())
        return "";

    // ttyACM sorts before ttyUSB, the pad enumerates as CDC ACM
    std::sort(found.begin(), found.end());
    if (found.size() > 1)
        LOG_INFO("%u devices match %04x:%04x, using %s", (unsigned)found.size(), vid, pid, found[0].c_str());
    return "/dev/" + found[0];
}
