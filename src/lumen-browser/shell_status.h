#ifndef LUMEN_BROWSER_SHELL_STATUS_H
#define LUMEN_BROWSER_SHELL_STATUS_H

// Result of a compositor or tab-session operation. Callers at the message
// boundary report anything other than Ok back to the overlay UI.
enum class ShellStatus {
    Ok,
    TabNotFound,
    WindowClosed,
};

const char *shell_status_name(ShellStatus status);

#endif // LUMEN_BROWSER_SHELL_STATUS_H
