#ifndef LUMEN_BROWSER_SHELL_LOG_H
#define LUMEN_BROWSER_SHELL_LOG_H

// stderr logging with the "[lumen] func(): " prefix. Silenced when
// LUMEN_QUIET is set to a non-empty value other than "0".
void shell_log(const char *func, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));

bool shell_log_enabled();

#define LOG_ENTER(fmt, ...) shell_log(__func__, fmt, ##__VA_ARGS__)

#endif // LUMEN_BROWSER_SHELL_LOG_H
