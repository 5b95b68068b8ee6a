#pragma once

#include "serial/Transport.h"
#include <deque>
#include <string>
#include <vector>

/**
 * In-memory Transport: reads are served from a script of chunks, writes are captured frame by frame.
 *
 * A test keeps a raw pointer after handing ownership to a ConnectionManager, the manager outlives every use in a test.
 */
class MockTransport : public Transport
{
  public:
    /// Chunks returned by successive read() calls, one per call. An empty queue reads as "nothing yet".
    std::deque<std::string> rx;
    /// Every successful write(), in order
    std::vector<std::string> writes;

    bool failOpen = false;
    bool failWrite = false;
    /// Once rx is drained, report this instead of 0 (TRANSPORT_READ_EOF / TRANSPORT_READ_ERROR)
    int afterRx = 0;

    int openCalls = 0;
    int closeCalls = 0;
    int readCalls = 0;
    uint32_t openedBaud = 0;

    virtual bool open(uint32_t baud) override
    {
        openCalls++;
        if (failOpen)
            return false;
        openedBaud = baud;
        opened = true;
        return true;
    }

    virtual int read(uint8_t *buf, size_t maxLen) override
    {
        readCalls++;
        if (!opened)
            return TRANSPORT_READ_ERROR;
        if (rx.empty())
            return afterRx;

        std::string &chunk = rx.front();
        size_t n = chunk.size() < maxLen ? chunk.size() : maxLen;
        chunk.copy((char *)buf, n);
        chunk.erase(0, n);
        if (chunk.empty())
            rx.pop_front();
        return (int)n;
    }

    virtual bool write(const uint8_t *buf, size_t len) override
    {
        if (!opened || failWrite)
            return false;
        writes.push_back(std::string((const char *)buf, len));
        return true;
    }

    virtual void close() override
    {
        closeCalls++;
        opened = false;
    }

    virtual bool isOpen() const override { return opened; }

    virtual const char *describe() const override { return "mock"; }

  private:
    bool opened = false;
};
