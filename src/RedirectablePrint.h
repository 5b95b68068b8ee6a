#pragma once

#include "concurrency/Lock.h"
#include <stdarg.h>
#include <stdio.h>

/**
 * A log sink that can be switched to squirt its bytes to a different stdio stream.
 * This class is mostly useful to allow debug printing to be redirected away from stdout
 * (for instance while eezpadctl is printing command output that scripts consume).
 */
class RedirectablePrint
{
    FILE *dest;

    /// Serializes whole log lines
    concurrency::Lock inDebugPrint;

  public:
    explicit RedirectablePrint(FILE *_dest) : dest(_dest) {}
    virtual ~RedirectablePrint() {}

    RedirectablePrint(const RedirectablePrint &) = delete;
    RedirectablePrint &operator=(const RedirectablePrint &) = delete;

    /**
     * Set a new destination
     */
    void setDestination(FILE *dest);

    size_t write(const char *buf, size_t len);
    size_t print(const char *s);

    /**
     * Debug logging print message
     *
     * A newline is appended to the format, so each call produces exactly one log line. Messages below the
     * configured LogLevel are dropped; TRACE messages are also copied to the trace file when one is configured.
     */
    void log(const char *logLevel, const char *format, ...) __attribute__((format(printf, 3, 4)));

    /** like printf but va_list based */
    size_t vprintf(const char *logLevel, const char *format, va_list arg);

  protected:
    /// Subclasses can override if they need to change how we format over the console
    virtual void log_to_serial(const char *logLevel, const char *format, va_list arg);

  private:
    void log_to_trace(const char *format, va_list arg);
    bool isFiltered(const char *logLevel) const;
};
