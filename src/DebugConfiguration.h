#pragma once

#include "configuration.h"

// -----------------------------------------------------------------------------
// DEBUG
// -----------------------------------------------------------------------------

#define EEZPAD_LOG_LEVEL_DEBUG "DEBUG"
#define EEZPAD_LOG_LEVEL_INFO "INFO "
#define EEZPAD_LOG_LEVEL_WARN "WARN "
#define EEZPAD_LOG_LEVEL_ERROR "ERROR"
#define EEZPAD_LOG_LEVEL_CRIT "CRIT "
#define EEZPAD_LOG_LEVEL_TRACE "TRACE"

#include "HostConsole.h"

#define DEBUG_PORT (*console) // Host debug port

#if !defined(DEBUG_MUTE)
#define LOG_DEBUG(...) DEBUG_PORT.log(EEZPAD_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) DEBUG_PORT.log(EEZPAD_LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_WARN(...) DEBUG_PORT.log(EEZPAD_LOG_LEVEL_WARN, __VA_ARGS__)
#define LOG_ERROR(...) DEBUG_PORT.log(EEZPAD_LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_CRIT(...) DEBUG_PORT.log(EEZPAD_LOG_LEVEL_CRIT, __VA_ARGS__)
#define LOG_TRACE(...) DEBUG_PORT.log(EEZPAD_LOG_LEVEL_TRACE, __VA_ARGS__)
#else
#define LOG_DEBUG(...)
#define LOG_INFO(...)
#define LOG_WARN(...)
#define LOG_ERROR(...)
#define LOG_CRIT(...)
#define LOG_TRACE(...)
#endif
