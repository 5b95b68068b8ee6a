#include "error.h"
#include "configuration.h"

static ErrorCode lastError = ErrorCode::NONE;
static uint32_t errorCount;

void recordError(ErrorCode code, uint32_t line, const char *filename)
{
    if (filename) {
        LOG_DEBUG("Record error %s at %s:%lu", errorCodeName(code), filename, (unsigned long)line);
    } else {
        LOG_DEBUG("Record error %s", errorCodeName(code));
    }

    lastError = code;
    errorCount++;
}

ErrorCode getLastError()
{
    return lastError;
}

uint32_t getErrorCount()
{
    return errorCount;
}

void clearErrors()
{
    lastError = ErrorCode::NONE;
    errorCount = 0;
}

const char *errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::NONE:
        return "NONE";
    case ErrorCode::VALIDATION:
        return "VALIDATION";
    case ErrorCode::FRAME_TOO_LONG:
        return "FRAME_TOO_LONG";
    case ErrorCode::NOT_CONNECTED:
        return "NOT_CONNECTED";
    case ErrorCode::ALREADY_CONNECTED:
        return "ALREADY_CONNECTED";
    case ErrorCode::TRANSPORT_OPEN:
        return "TRANSPORT_OPEN";
    case ErrorCode::TRANSPORT_IO:
        return "TRANSPORT_IO";
    }
    return "UNKNOWN";
}
