#include "HostConsole.h"
#include "platform/linux/LinuxGlue.h"

#include "TestUtil.h"

void initializeTestEnvironment()
{
    host_config.logoutputlevel = level_warn;
    host_config.ascii_logs = true;
    host_config.ascii_logs_explicit = true;
    consoleInit();
}

int main()
{
    setup();
    for (;;)
        loop();
}
