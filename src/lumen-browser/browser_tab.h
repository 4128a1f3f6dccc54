#ifndef LUMEN_BROWSER_BROWSER_TAB_H
#define LUMEN_BROWSER_BROWSER_TAB_H

#include <string>

struct BrowserTab {
    std::string id;
    int window_id = 0;
    std::string url;
    std::string title;
    std::string favicon_url;
    bool loading = false;
    bool can_go_back = false;
    bool can_go_forward = false;
    bool is_active = false;
    bool suspended = false;
};

#endif // LUMEN_BROWSER_BROWSER_TAB_H
