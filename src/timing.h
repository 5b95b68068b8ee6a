#pragma once

#include <stdint.h>

namespace timing
{

/// Msecs since an arbitrary start point, from the monotonic clock. Wraps like the firmware's millis().
uint32_t millis();

} // namespace timing
