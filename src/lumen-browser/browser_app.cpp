#include "browser_app.h"

#include <Xm/Xm.h>
#include <X11/Intrinsic.h>

#include <dlfcn.h>
#include <limits.h>
#include <unistd.h>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <system_error>

#include <include/cef_browser_process_handler.h>
#include <include/cef_command_line.h>

#include "cef_render_surface.h"
#include "shell_log.h"
#include "shell_window.h"

namespace {
const unsigned long kMessagePumpMs = 10;
const char *kCacheSuffixArg = "--lumen-cache-suffix=";
}  // namespace

class LumenCefApp : public CefApp, public CefBrowserProcessHandler {
 public:
  CefRefPtr<CefBrowserProcessHandler> GetBrowserProcessHandler() override { return this; }

  void OnContextInitialized() override {
    fprintf(stderr, "[lumen] CEF context initialized\n");
  }

 private:
  IMPLEMENT_REFCOUNTING(LumenCefApp);
};

int main(int argc, char *argv[])
{
    return BrowserApp::instance().run(argc, argv);
}

BrowserApp &BrowserApp::instance()
{
    static BrowserApp app;
    return app;
}

int BrowserApp::run(int argc, char *argv[])
{
    CefRefPtr<CefApp> cef_app = new LumenCefApp();
    BrowserPreflightState preflight;
    int exit_code = run_cef_preflight(argc, argv, cef_app, &preflight);
    if (exit_code >= 0) {
        return exit_code;
    }

    ShellSettings settings;
    shell_settings_load(&settings, kSettingsFileName);

    XtAppContext app;
    Widget toplevel = XtVaAppInitialize(&app, "LumenBrowser", NULL, 0,
                                        &argc, argv, NULL, NULL);
    fprintf(stderr, "[lumen] XtAppInitialize returned with toplevel=%p\n", (void *)toplevel);
    app_ = app;
    shell_settings_apply_args(&settings, argc, argv);
    XtVaSetValues(toplevel,
                  XmNtitle, "Lumen",
                  XmNiconName, "Lumen",
                  XmNwidth, settings.window_width,
                  XmNheight, settings.window_height,
                  NULL);

    if (!initialize_cef(preflight, cef_app)) {
        return 1;
    }
    set_cef_browser_closed_handler(on_browser_closed);

    window_ = std::make_unique<ShellWindow>(1, app, toplevel, settings);
    if (!window_->build()) {
        fprintf(stderr, "[lumen] failed to build the browser window\n");
        window_.reset();
        shutdown_cef();
        return 1;
    }
    window_->set_closed_handler([this](ShellWindow *window) {
        (void)window;
        begin_shutdown("window closed");
    });

    XtRealizeWidget(toplevel);
    fprintf(stderr, "[lumen] XtRealizeWidget completed\n");
    window_->start();
    XtAppAddTimeOut(app, kMessagePumpMs, cef_message_pump, (XtPointer)this);

    XtAppMainLoop(app);
    LOG_ENTER("main loop finished, open browsers=%d", cef_open_browser_count());
    window_.reset();
    set_cef_browser_closed_handler(nullptr);
    shutdown_cef();
    return 0;
}

void BrowserApp::cef_message_pump(XtPointer client_data, XtIntervalId *id)
{
    (void)id;
    BrowserApp *self = (BrowserApp *)client_data;
    CefDoMessageLoopWork();
    if (!self || !self->app_) return;
    if (XtAppGetExitFlag(self->app_)) return;
    XtAppAddTimeOut(self->app_, kMessagePumpMs, cef_message_pump, client_data);
}

void BrowserApp::on_browser_closed(int remaining)
{
    BrowserApp &app = BrowserApp::instance();
    if (!app.shutdown_requested_) return;
    fprintf(stderr, "[lumen] browser closed, pending=%d\n", remaining);
    if (remaining <= 0 && app.app_) {
        fprintf(stderr, "[lumen] shutdown complete, exiting main loop\n");
        XtAppSetExitFlag(app.app_);
    }
}

void BrowserApp::begin_shutdown(const char *reason)
{
    if (shutdown_requested_) return;
    shutdown_requested_ = true;
    int pending = cef_open_browser_count();
    fprintf(stderr,
            "[lumen] begin shutdown reason=%s pending=%d\n",
            reason ? reason : "(null)",
            pending);
    if (pending == 0 && app_) {
        XtAppSetExitFlag(app_);
    }
}

namespace {
std::string exe_path()
{
    char buffer[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len <= 0) return std::string();
    buffer[len] = '\0';
    return std::string(buffer);
}

bool dir_has_files(const std::filesystem::path &path)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) return false;
    return std::filesystem::directory_iterator(path, ec) != std::filesystem::directory_iterator();
}

// Environment override first, then suffix below the working directory and
// each parent of the executable's directory.
std::string find_cef_dir(const char *env_name, const char *suffix)
{
    const char *env_value = getenv(env_name);
    if (env_value && dir_has_files(env_value)) return std::string(env_value);

    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (!ec && dir_has_files(cwd / suffix)) return (cwd / suffix).string();

    std::string exe = exe_path();
    if (!exe.empty()) {
        std::filesystem::path dir = std::filesystem::path(exe).parent_path();
        while (!dir.empty()) {
            if (dir_has_files(dir / suffix)) return (dir / suffix).string();
            if (dir == dir.root_path()) break;
            dir = dir.parent_path();
        }
    }
    fprintf(stderr, "[lumen] %s not found (set %s)\n", suffix, env_name);
    return std::string();
}
}  // namespace

BrowserPaths BrowserApp::discover_cef_paths() const
{
    BrowserPaths paths;
    paths.resources_path = find_cef_dir("CEF_RESOURCE_PATH", "third_party/cef/resources");
    paths.locales_path = find_cef_dir("CEF_LOCALES_PATH", "third_party/cef/locales");
    paths.subprocess_path = exe_path();
    return paths;
}

void BrowserApp::split_cef_args(int argc, char *argv[], std::vector<char *> *cef_argv, std::string *cache_suffix) const
{
    cef_argv->clear();
    cache_suffix->clear();
    if (argc <= 0 || !argv) return;
    const size_t prefix_len = strlen(kCacheSuffixArg);
    cef_argv->push_back(argv[0]);
    for (int i = 1; i < argc; ++i) {
        if (!argv[i]) continue;
        if (strncmp(argv[i], kCacheSuffixArg, prefix_len) != 0) {
            cef_argv->push_back(argv[i]);
            continue;
        }
        // Lumen-only switch; the suffix ends up in a directory name.
        cache_suffix->assign(argv[i] + prefix_len);
        for (char &c : *cache_suffix) {
            if (!isalnum((unsigned char)c) && c != '-' && c != '_') c = '_';
        }
    }
}

bool BrowserApp::has_opengl_support() const
{
    void *gl = dlopen("libGL.so.1", RTLD_LAZY | RTLD_LOCAL);
    if (!gl) gl = dlopen("libGL.so", RTLD_LAZY | RTLD_LOCAL);
    if (!gl) return false;
    bool usable = dlsym(gl, "glXGetCurrentContext") != NULL;
    dlclose(gl);
    return usable;
}

void BrowserApp::apply_gpu_switches(bool disable_gpu) const
{
    if (!disable_gpu) return;
    CefRefPtr<CefCommandLine> global = CefCommandLine::GetGlobalCommandLine();
    if (!global) return;
    global->AppendSwitch("disable-gpu");
    global->AppendSwitch("disable-software-rasterizer");
    global->AppendSwitch("disable-gpu-compositing");
}

std::string BrowserApp::build_cache_path(const std::string &suffix) const
{
    std::error_code ec;
    std::filesystem::path cache_path = std::filesystem::current_path(ec);
    if (ec) return std::string();
    cache_path /= suffix.empty() ? std::string("build/lumen-browser-cache")
                                 : "build/lumen-browser-cache-" + suffix;
    std::filesystem::create_directories(cache_path, ec);
    if (ec) {
        fprintf(stderr, "[lumen] cannot create cache dir %s: %s\n", cache_path.c_str(), ec.message().c_str());
        return std::string();
    }
    return cache_path.string();
}

int BrowserApp::run_cef_preflight(int argc, char *argv[], CefRefPtr<CefApp> cef_app, BrowserPreflightState *state) const
{
    if (!state) return -1;
    state->cef_paths = discover_cef_paths();
    state->force_disable_gpu = !has_opengl_support();
    if (state->force_disable_gpu) {
        fprintf(stderr,
                "[lumen] OpenGL stack missing (libGL), forcing --disable-gpu + software fallback\n");
    }
    split_cef_args(argc, argv, &state->cef_argv, &state->cache_suffix);
    CefMainArgs main_args((int)state->cef_argv.size(), state->cef_argv.data());
    apply_gpu_switches(state->force_disable_gpu);
    int exit_code = CefExecuteProcess(main_args, cef_app, nullptr);
    if (exit_code >= 0) {
        return exit_code;
    }
    fprintf(stderr, "[lumen] browser process, resources=%s locales=%s subprocess=%s\n",
            state->cef_paths.resources_path.empty() ? "(none)" : state->cef_paths.resources_path.c_str(),
            state->cef_paths.locales_path.empty() ? "(none)" : state->cef_paths.locales_path.c_str(),
            state->cef_paths.subprocess_path.empty() ? "(none)" : state->cef_paths.subprocess_path.c_str());
    return -1;
}

bool BrowserApp::initialize_cef(const BrowserPreflightState &preflight, CefRefPtr<CefApp> cef_app)
{
    CefSettings settings;
    settings.no_sandbox = 1;
    settings.external_message_pump = 1;
    settings.command_line_args_disabled = 1;
    settings.log_severity = LOGSEVERITY_WARNING;
    std::string cache_path = build_cache_path(preflight.cache_suffix);
    if (!cache_path.empty()) {
        CefString(&settings.root_cache_path) = cache_path;
        CefString(&settings.log_file) = cache_path + "/cef.log";
        fprintf(stderr, "[lumen] root_cache_path=%s\n", cache_path.c_str());
    }
    const BrowserPaths &paths = preflight.cef_paths;
    if (!paths.resources_path.empty()) {
        CefString(&settings.resources_dir_path) = paths.resources_path;
    }
    if (!paths.locales_path.empty()) {
        CefString(&settings.locales_dir_path) = paths.locales_path;
    }
    if (!paths.subprocess_path.empty()) {
        CefString(&settings.browser_subprocess_path) = paths.subprocess_path;
    }
    CefMainArgs main_args((int)preflight.cef_argv.size(),
                          const_cast<char **>(preflight.cef_argv.data()));
    fprintf(stderr, "[lumen] calling CefInitialize\n");
    bool cef_ok = CefInitialize(main_args, settings, cef_app, nullptr);
    fprintf(stderr, "[lumen] CefInitialize result=%d\n", cef_ok ? 1 : 0);
    return cef_ok;
}

void BrowserApp::shutdown_cef() const
{
    fprintf(stderr, "[lumen] calling CefShutdown\n");
    CefShutdown();
}
