#pragma once

#include "RedirectablePrint.h"

/**
 * The log console of a host process. Log lines go to stderr so that command output written to stdout stays
 * machine readable.
 */
class HostConsole : public RedirectablePrint
{
  public:
    HostConsole();

    void flush();
};

/// Creates the console; LOG_* macros may only be used after this
void consoleInit();

extern HostConsole *console;
