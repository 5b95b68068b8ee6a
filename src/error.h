#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * Result of every core operation that can fail. Nothing in the core is fatal: the caller decides whether to reconnect,
 * resend or give up.
 */
enum class ErrorCode : uint8_t {
    NONE = 0,
    /// Raw input rejected before any frame was built
    VALIDATION,
    /// The frame would not fit the single byte length field
    FRAME_TOO_LONG,
    /// send() outside of the CONNECTED state
    NOT_CONNECTED,
    /// connect() while a connection is already up or in progress
    ALREADY_CONNECTED,
    /// No port found for our USB id, or open/termios setup failed
    TRANSPORT_OPEN,
    /// A read or write failed mid-operation, the link is being torn down
    TRANSPORT_IO,
};

/// A macro that include filename and line
#define RECORD_ERROR(code) recordError(code, __LINE__, __FILE__)

/// Log an error at the boundary where it is reported and remember it for getLastError()
void recordError(ErrorCode code, uint32_t line = 0, const char *filename = NULL);

/// Most recently recorded error (NONE if there was none since the last clearErrors)
ErrorCode getLastError();

/// Number of errors recorded since the last clearErrors
uint32_t getErrorCount();

void clearErrors();

const char *errorCodeName(ErrorCode code);
