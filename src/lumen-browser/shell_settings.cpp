#include "shell_settings.h"

#include <cstdio>

extern "C" {
#include "../shared/config_utils.h"
}

const char *kSettingsFileName = "lumen-browser.conf";
const char *kDefaultHomepage = "https://www.google.com";
const char *kDefaultOverlayUrl = "about:blank";

namespace {
int read_non_negative(const char *filename, const char *key, int default_value)
{
    int value = config_read_int(filename, key, default_value);
    if (value < 0) {
        fprintf(stderr, "[lumen] settings: %s=%d out of range, using %d\n", key, value, default_value);
        return default_value;
    }
    return value;
}

int read_positive(const char *filename, const char *key, int default_value)
{
    int value = read_non_negative(filename, key, default_value);
    return value == 0 ? default_value : value;
}

std::string read_string(const char *filename, const char *key, const char *default_value)
{
    char buf[2048];
    config_read_string(filename, key, buf, sizeof(buf), default_value);
    if (!buf[0]) return std::string(default_value ? default_value : "");
    return std::string(buf);
}
}  // namespace

void shell_settings_load(ShellSettings *settings, const char *filename)
{
    if (!settings) return;
    if (!filename) filename = kSettingsFileName;
    ShellSettings defaults;
    settings->header_offset = read_non_negative(filename, "header_offset", defaults.header_offset);
    settings->sidebar_width = read_non_negative(filename, "sidebar_width", defaults.sidebar_width);
    settings->layout_inset = config_read_int(filename, "layout_inset", 0) != 0;
    settings->resize_debounce_ms = read_non_negative(filename, "resize_debounce_ms", defaults.resize_debounce_ms);
    settings->overlay_hide_delay_ms = read_non_negative(filename, "overlay_hide_delay_ms", defaults.overlay_hide_delay_ms);
    settings->window_width = read_positive(filename, "window_width", defaults.window_width);
    settings->window_height = read_positive(filename, "window_height", defaults.window_height);
    settings->homepage = normalize_url(read_string(filename, "homepage", kDefaultHomepage).c_str());
    settings->overlay_url = read_string(filename, "overlay_url", kDefaultOverlayUrl);
}

void shell_settings_apply_args(ShellSettings *settings, int argc, char **argv)
{
    if (!settings || !argv) return;
    for (int i = 1; i < argc; ++i) {
        const char *arg = argv[i];
        if (!arg || arg[0] == '\0' || arg[0] == '-') continue;
        settings->startup_url = normalize_url(arg);
        return;
    }
}

LayoutParams shell_settings_layout(const ShellSettings &settings)
{
    LayoutParams layout;
    layout.header_offset = settings.header_offset;
    layout.sidebar_width = settings.sidebar_width;
    layout.mode = settings.layout_inset ? LayoutMode::Inset : LayoutMode::Overlay;
    return layout;
}

std::string shell_settings_initial_url(const ShellSettings &settings)
{
    if (!settings.startup_url.empty()) return settings.startup_url;
    if (!settings.homepage.empty()) return settings.homepage;
    return std::string(kDefaultHomepage);
}

std::string normalize_url(const char *input)
{
    if (!input || input[0] == '\0') return std::string();
    std::string normalized(input);
    size_t colon = normalized.find(':');
    bool has_scheme = false;
    if (colon != std::string::npos && colon > 0) {
        std::string prefix = normalized.substr(0, colon);
        std::string lower;
        lower.reserve(prefix.size());
        for (char c : prefix) {
            if (c >= 'A' && c <= 'Z') lower.push_back((char)(c - 'A' + 'a'));
            else lower.push_back(c);
        }
        if (lower == "about" || lower == "chrome" || lower == "data" || lower == "file" ||
            lower == "view-source" || lower == "javascript" || lower == "mailto") {
            has_scheme = true;
        } else if (normalized.size() >= colon + 3 && normalized[colon + 1] == '/' &&
                   normalized[colon + 2] == '/') {
            has_scheme = true;
        }
    }
    if (!has_scheme) {
        normalized.insert(0, "https://");
    }
    return normalized;
}
