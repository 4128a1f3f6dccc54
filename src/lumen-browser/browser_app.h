#ifndef LUMEN_BROWSER_BROWSER_APP_H
#define LUMEN_BROWSER_BROWSER_APP_H

#include <X11/Intrinsic.h>

#include <memory>
#include <string>
#include <vector>

#include <include/cef_app.h>

#include "shell_settings.h"

class ShellWindow;

struct BrowserPaths {
    std::string resources_path;
    std::string locales_path;
    std::string subprocess_path;
};

struct BrowserPreflightState {
    BrowserPaths cef_paths;
    bool force_disable_gpu = false;
    std::string cache_suffix;
    std::vector<char *> cef_argv;
};

class BrowserApp {
public:
    static BrowserApp &instance();

    int run(int argc, char *argv[]);

    BrowserPaths discover_cef_paths() const;
    // Drops --lumen-cache-suffix= from the CEF arguments and returns its value.
    void split_cef_args(int argc, char *argv[], std::vector<char *> *cef_argv, std::string *cache_suffix) const;
    bool has_opengl_support() const;
    void apply_gpu_switches(bool disable_gpu) const;
    std::string build_cache_path(const std::string &suffix) const;
    // Returns the subprocess exit code, or -1 in the browser process.
    int run_cef_preflight(int argc, char *argv[], CefRefPtr<CefApp> cef_app, BrowserPreflightState *state) const;
    bool initialize_cef(const BrowserPreflightState &preflight, CefRefPtr<CefApp> cef_app);
    void shutdown_cef() const;

    void begin_shutdown(const char *reason);

private:
    BrowserApp() = default;

    static void cef_message_pump(XtPointer client_data, XtIntervalId *id);
    static void on_browser_closed(int remaining);

    XtAppContext app_ = NULL;
    bool shutdown_requested_ = false;
    std::unique_ptr<ShellWindow> window_;
};

#endif // LUMEN_BROWSER_BROWSER_APP_H
