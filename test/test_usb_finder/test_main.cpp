#include "TestUtil.h"
#include "serial/UsbSerialFinder.h"
#include <filesystem>
#include <fstream>
#include <stdlib.h>
#include <unity.h>

namespace fs = std::filesystem;

static fs::path sysRoot;

static void writeAttr(const fs::path &p, const char *value)
{
    std::ofstream out(p);
    out << value << "\n";
}

/// A USB device with one interface, and a tty under /sys/class/tty pointing at the interface
static void addUsbTty(const char *tty, const char *usbDev, const char *vid, const char *pid)
{
    fs::path dev = sysRoot / "devices" / usbDev;
    fs::path intf = dev / (std::string(usbDev) + ":1.0");
    fs::create_directories(intf);
    writeAttr(dev / "idVendor", vid);
    writeAttr(dev / "idProduct", pid);

    fs::path ttyDir = sysRoot / "class" / tty;
    fs::create_directories(ttyDir);
    fs::create_directory_symlink(intf, ttyDir / "device");
}

void setUp(void)
{
    char tmpl[] = "/tmp/eezpad-sysfs-XXXXXX";
    TEST_ASSERT_NOT_NULL(mkdtemp(tmpl));
    sysRoot = tmpl;
    fs::create_directories(sysRoot / "class");
}

void tearDown(void)
{
    std::error_code ec;
    fs::remove_all(sysRoot, ec);
}

static std::string find(uint16_t vid, uint16_t pid)
{
    return findUsbSerialPort(vid, pid, (sysRoot / "class").string());
}

static void test_findsMatchingDevice()
{
    addUsbTty("ttyUSB0", "1-2", "10c4", "ea60");
    addUsbTty("ttyACM3", "1-1", "303a", "0012");
    fs::create_directories(sysRoot / "class" / "ttyS0"); // no device behind it

    TEST_ASSERT_EQUAL_STRING("/dev/ttyACM3", find(0x303A, 0x0012).c_str());
    TEST_ASSERT_EQUAL_STRING("/dev/ttyUSB0", find(0x10C4, 0xEA60).c_str());
}

static void test_noMatchGivesEmpty()
{
    addUsbTty("ttyACM0", "1-1", "303a", "1001");
    TEST_ASSERT_EQUAL_STRING("", find(0x303A, 0x0012).c_str());
}

static void test_severalMatchesPickFirstByName()
{
    addUsbTty("ttyACM1", "1-3", "303a", "0012");
    addUsbTty("ttyACM0", "1-4", "303a", "0012");
    TEST_ASSERT_EQUAL_STRING("/dev/ttyACM0", find(0x303A, 0x0012).c_str());
}

static void test_missingSysfsGivesEmpty()
{
    TEST_ASSERT_EQUAL_STRING("", findUsbSerialPort(0x303A, 0x0012, (sysRoot / "nope").string()).c_str());
}

void setup()
{
    initializeTestEnvironment();
    UNITY_BEGIN();
    RUN_TEST(test_findsMatchingDevice);
    RUN_TEST(test_noMatchGivesEmpty);
    RUN_TEST(test_severalMatchesPickFirstByName);
    RUN_TEST(test_missingSysfsGivesEmpty);
    exit(UNITY_END());
}

void loop() {}
