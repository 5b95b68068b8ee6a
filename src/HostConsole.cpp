#include "HostConsole.h"
#include "configuration.h"
#include "platform/linux/LinuxGlue.h"
#include <unistd.h>

HostConsole *console;

void consoleInit()
{
    if (console)
        return;
    console = new HostConsole();
}

HostConsole::HostConsole() : RedirectablePrint(stderr)
{
    // Colors only make sense on a terminal, unless config.yaml says otherwise
    if (!host_config.ascii_logs_explicit)
        host_config.ascii_logs = !isatty(fileno(stderr));
}

void HostConsole::flush()
{
    fflush(stderr);
}
