#ifndef LUMEN_BROWSER_SHELL_SETTINGS_H
#define LUMEN_BROWSER_SHELL_SETTINGS_H

#include <string>

#include "resize_coordinator.h"

extern const char *kSettingsFileName;
extern const char *kDefaultHomepage;
extern const char *kDefaultOverlayUrl;

struct ShellSettings {
    int header_offset = 60;
    int sidebar_width = 250;
    bool layout_inset = false;
    int resize_debounce_ms = (int)kResizeDebounceMs;
    int overlay_hide_delay_ms = 1000;
    int window_width = 1200;
    int window_height = 800;
    std::string homepage;
    std::string overlay_url;
    // From the command line; empty means open the homepage.
    std::string startup_url;
};

// Reads filename from the lumen config directory. Missing keys and
// out-of-range values keep their defaults.
void shell_settings_load(ShellSettings *settings, const char *filename);

// Picks up the first non-option argument as the startup url.
void shell_settings_apply_args(ShellSettings *settings, int argc, char **argv);

LayoutParams shell_settings_layout(const ShellSettings &settings);

// Url the first tab opens.
std::string shell_settings_initial_url(const ShellSettings &settings);

// Prefixes https:// when input carries no scheme.
std::string normalize_url(const char *input);

#endif // LUMEN_BROWSER_SHELL_SETTINGS_H
