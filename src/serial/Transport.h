#pragma once

#include <stddef.h>
#include <stdint.h>

// Results of Transport::read() besides a byte count
#define TRANSPORT_READ_EOF -1
#define TRANSPORT_READ_ERROR -2

/**
 * The byte pipe to the device: open, read, write, close.
 *
 * All calls return promptly, a read with nothing pending returns 0 rather than waiting. That keeps the single
 * cooperative thread of control free while the device is quiet.
 */
class Transport
{
  public:
    virtual ~Transport() {}

    /// Select the device and open it at baud. False if there is no device or it could not be configured.
    virtual bool open(uint32_t baud) = 0;

    /**
     * Read whatever is pending, up to maxLen bytes.
     *
     * Returns the byte count (0 if nothing is pending), TRANSPORT_READ_EOF once the device went away or
     * TRANSPORT_READ_ERROR on an IO error.
     */
    virtual int read(uint8_t *buf, size_t maxLen) = 0;

    /// Write all of buf, false on any failure (a partial write counts as a failure)
    virtual bool write(const uint8_t *buf, size_t len) = 0;

    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /// For log messages, e.g. "/dev/ttyACM0"
    virtual const char *describe() const = 0;
};
