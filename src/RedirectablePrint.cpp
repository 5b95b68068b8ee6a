#include "RedirectablePrint.h"
#include "concurrency/LockGuard.h"
#include "concurrency/PeriodicTask.h"
#include "configuration.h"
#include "platform/linux/LinuxGlue.h"
#include "timing.h"
#include <assert.h>
#include <cctype>
#include <cstring>
#include <time.h>

void RedirectablePrint::setDestination(FILE *_dest)
{
    assert(_dest);
    dest = _dest;
}

size_t RedirectablePrint::write(const char *buf, size_t len)
{
    return fwrite(buf, 1, len, dest);
}

size_t RedirectablePrint::print(const char *s)
{
    return write(s, strlen(s));
}

size_t RedirectablePrint::vprintf(const char *logLevel, const char *format, va_list arg)
{
    va_list copy;
    static char printBuf[512];

    bool color = !host_config.ascii_logs;

    va_copy(copy, arg);
    int res = vsnprintf(printBuf, sizeof(printBuf), format, copy);
    va_end(copy);
    if (res < 0)
        return 0;
    size_t len = (size_t)res;

    // If the resulting string is longer than sizeof(printBuf)-1 characters, the remaining characters are still counted for the
    // return value

    if (len > sizeof(printBuf) - 1) {
        len = sizeof(printBuf) - 1;
        printBuf[sizeof(printBuf) - 2] = '\n';
    }
    // Sentinel key codes and stray device bytes must not reach the terminal raw
    for (size_t f = 0; f < len; f++) {
        if (!std::isprint(static_cast<unsigned char>(printBuf[f])) && printBuf[f] != '\n')
            printBuf[f] = '#';
    }
    if (color && logLevel != nullptr) {
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_DEBUG) == 0)
            write("\u001b[34m", 5);
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_INFO) == 0)
            write("\u001b[32m", 5);
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_WARN) == 0)
            write("\u001b[33m", 5);
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_ERROR) == 0)
            write("\u001b[31m", 5);
    }
    len = write(printBuf, len);
    if (color && logLevel != nullptr) {
        write("\u001b[0m", 4);
    }
    return len;
}

void RedirectablePrint::log_to_serial(const char *logLevel, const char *format, va_list arg)
{
    bool color = !host_config.ascii_logs;

    // include the header
    if (color) {
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_DEBUG) == 0)
            write("\u001b[34m", 5);
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_INFO) == 0)
            write("\u001b[32m", 5);
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_WARN) == 0)
            write("\u001b[33m", 5);
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_ERROR) == 0)
            write("\u001b[31m", 5);
        if (strcmp(logLevel, EEZPAD_LOG_LEVEL_TRACE) == 0)
            write("\u001b[35m", 5);
    }

    time_t now = time(NULL);
    struct tm local;
    char header[48];
    if (localtime_r(&now, &local)) {
        snprintf(header, sizeof(header), "%s %s| %02d:%02d:%02d %u ", logLevel, color ? "\u001b[0m" : "", local.tm_hour,
                 local.tm_min, local.tm_sec, timing::millis() / 1000);
    } else {
        snprintf(header, sizeof(header), "%s %s| ??:??:?? %u ", logLevel, color ? "\u001b[0m" : "", timing::millis() / 1000);
    }
    print(header);

    auto task = concurrency::PeriodicTask::currentTask;
    if (task) {
        print("[");
        print(task->taskName);
        print("] ");
    }
    vprintf(logLevel, format, arg);
}

void RedirectablePrint::log_to_trace(const char *format, va_list arg)
{
    if (!traceFile.is_open())
        return;

    char traceBuf[512];
    va_list copy;
    va_copy(copy, arg);
    int res = vsnprintf(traceBuf, sizeof(traceBuf), format, copy);
    va_end(copy);
    if (res < 0)
        return;
    try {
        traceFile << traceBuf << std::flush;
    } catch (const std::ios_base::failure &e) {
        fprintf(stderr, "trace file write failed: %s\n", e.what());
    }
}

bool RedirectablePrint::isFiltered(const char *logLevel) const
{
    if (strcmp(logLevel, EEZPAD_LOG_LEVEL_TRACE) == 0)
        return host_config.logoutputlevel < level_trace;
    if (strcmp(logLevel, EEZPAD_LOG_LEVEL_DEBUG) == 0)
        return host_config.logoutputlevel < level_debug;
    if (strcmp(logLevel, EEZPAD_LOG_LEVEL_INFO) == 0)
        return host_config.logoutputlevel < level_info;
    if (strcmp(logLevel, EEZPAD_LOG_LEVEL_WARN) == 0)
        return host_config.logoutputlevel < level_warn;
    return false;
}

void RedirectablePrint::log(const char *logLevel, const char *format, ...)
{
    // append \n to format
    size_t len = strlen(format);
    char *newFormat = new char[len + 2];
    strcpy(newFormat, format);
    newFormat[len] = '\n';
    newFormat[len + 1] = '\0';

    // level trace is special, it may go to the trace file even when the console filters it
    if (strcmp(logLevel, EEZPAD_LOG_LEVEL_TRACE) == 0) {
        va_list arg;
        va_start(arg, format);
        log_to_trace(newFormat, arg);
        va_end(arg);
    }

    if (isFiltered(logLevel)) {
        delete[] newFormat;
        return;
    }

    {
        concurrency::LockGuard g(&inDebugPrint);

        va_list arg;
        va_start(arg, format);
        log_to_serial(logLevel, newFormat, arg);
        va_end(arg);
        fflush(dest);
    }

    delete[] newFormat;
}
