#pragma once

#include <stdint.h>
#include <string>

/**
 * Find the tty of a USB CDC/serial device by vendor and product id, by walking /sys/class/tty.
 *
 * Returns "/dev/<name>" for the first match (ttyACM* before ttyUSB*, then by name), or "" if none is attached.
 * sysRoot exists so tests can point at a fake sysfs tree.
 */
std::string findUsbSerialPort(uint16_t vid, uint16_t pid, const std::string &sysRoot = "/sys/class/tty");
