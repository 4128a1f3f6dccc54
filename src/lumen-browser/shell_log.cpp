#include "shell_log.h"

#include "shell_status.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

bool shell_log_enabled()
{
    static int enabled = -1;
    if (enabled < 0) {
        const char *quiet = getenv("LUMEN_QUIET");
        enabled = (quiet && quiet[0] != '\0' && !(quiet[0] == '0' && quiet[1] == '\0')) ? 0 : 1;
    }
    return enabled == 1;
}

void shell_log(const char *func, const char *fmt, ...)
{
    if (!func || !fmt) return;
    if (!shell_log_enabled()) return;
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "[lumen] %s(): ", func);
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    va_end(args);
}

const char *shell_status_name(ShellStatus status)
{
    switch (status) {
        case ShellStatus::Ok: return "Ok";
        case ShellStatus::TabNotFound: return "TabNotFound";
        case ShellStatus::WindowClosed: return "WindowClosed";
        default: return "Unknown";
    }
}
