#pragma once

#include <stdint.h>

// -----------------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------------

// If app version is not specified we assume we are not being invoked by the build script
#ifndef APP_VERSION
#error APP_VERSION must be set by the build environment
#endif

/// Convert a preprocessor name into a quoted string
#define xstr(s) ystr(s)
#define ystr(s) #s

/// Convert a preprocessor name into a quoted string and if that string is empty use "unset"
#define optstr(s) (xstr(s)[0] ? xstr(s) : "unset")

// -----------------------------------------------------------------------------
// Device identity
// -----------------------------------------------------------------------------

// USB id of the EezBotFun macro pad (ESP32-S3 native USB CDC)
#ifndef EEZPAD_USB_VID
#define EEZPAD_USB_VID 0x303A
#endif
#ifndef EEZPAD_USB_PID
#define EEZPAD_USB_PID 0x0012
#endif

// The firmware only listens at this rate
#ifndef EEZPAD_SERIAL_BAUD
#define EEZPAD_SERIAL_BAUD 115200
#endif

// Number of key binding profiles on the device, selected by '0'..'4'
#define EEZPAD_NUM_PROFILES 5
#define EEZPAD_MIN_KEY_INDEX 1
#define EEZPAD_MAX_KEY_INDEX 8

// -----------------------------------------------------------------------------
// Serial link tuning
// -----------------------------------------------------------------------------

// How often the read loop polls the port right after traffic, and when the device has been quiet
#define READ_POLL_ACTIVE_MS 5
#define READ_POLL_IDLE_MS 50
// Consider the device quiet after this long without inbound bytes
#define READ_RECENT_RX_MS 2000

// Largest chunk we pull from the port per read loop iteration
#define MAX_RX_CHUNK 256

// Unmatched inbound text beyond this is reported and trimmed to its tail
#define MAX_UNMATCHED_RX 1024

// How long eezpadctl waits for the version banner after connecting
#define DEFAULT_BANNER_WAIT_MS 2000
#define MAX_BANNER_WAIT_MS 600000

// -----------------------------------------------------------------------------
// Host paths
// -----------------------------------------------------------------------------

#define EEZPAD_LOCAL_CONFIG "config.yaml"
#define EEZPAD_SYSTEM_CONFIG "/etc/eezpad/config.yaml"

#include "DebugConfiguration.h"
