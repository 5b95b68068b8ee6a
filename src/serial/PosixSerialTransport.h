#pragma once

#include "Transport.h"
#include <string>

/**
 * Transport over a Linux tty in raw mode.
 *
 * The port is either given explicitly (config.yaml Serial.Port or -p) or searched for by USB id when open() is called,
 * so the device may be plugged in after the process started.
 */
class PosixSerialTransport : public Transport
{
    std::string portPath;
    std::string openedPath;
    uint16_t vid, pid;
    int fd = -1;

  public:
    /// An empty path means "search by vid/pid on open()"
    PosixSerialTransport(const std::string &path, uint16_t vid, uint16_t pid);
    ~PosixSerialTransport();

    virtual bool open(uint32_t baud) override;
    virtual int read(uint8_t *buf, size_t maxLen) override;
    virtual bool write(const uint8_t *buf, size_t len) override;
    virtual void close() override;
    virtual bool isOpen() const override { return fd >= 0; }
    virtual const char *describe() const override;

  private:
    bool configure(uint32_t baud);
};
