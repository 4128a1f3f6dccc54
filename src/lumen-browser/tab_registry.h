#ifndef LUMEN_BROWSER_TAB_REGISTRY_H
#define LUMEN_BROWSER_TAB_REGISTRY_H

#include <list>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "browser_tab.h"
#include "render_surface.h"

// Owns the tabs of one window together with their content surfaces, keyed
// by tab id and kept in insertion order.
class TabRegistry {
public:
    TabRegistry() = default;
    TabRegistry(const TabRegistry &) = delete;
    TabRegistry &operator=(const TabRegistry &) = delete;

    // Returns false when the id is already taken or surface is null.
    bool insert(const BrowserTab &tab, std::unique_ptr<RenderSurface> surface);
    // Either out-param may be null. Returns false for unknown ids.
    bool remove(const std::string &tab_id, BrowserTab *tab_out, std::unique_ptr<RenderSurface> *surface_out);

    BrowserTab *get(const std::string &tab_id);
    const BrowserTab *get(const std::string &tab_id) const;
    RenderSurface *surfaceFor(const std::string &tab_id) const;
    BrowserTab *findBySurface(const RenderSurface *surface);

    std::vector<BrowserTab> all() const;
    std::vector<std::string> ids() const;
    // Most recently inserted tab id, empty when the registry is empty.
    std::string lastId() const;

    bool setActive(const std::string &tab_id);
    void clearActive();
    const std::string &activeTabId() const { return active_tab_id_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    int countSuspended() const;

    // Drops every entry; the caller destroys the returned surfaces.
    std::vector<std::unique_ptr<RenderSurface>> takeAllSurfaces();

private:
    struct Entry {
        BrowserTab tab;
        std::unique_ptr<RenderSurface> surface;
        std::list<std::string>::iterator order_it;
    };

    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<const RenderSurface *, std::string> by_surface_;
    std::list<std::string> order_;
    std::string active_tab_id_;
};

#endif // LUMEN_BROWSER_TAB_REGISTRY_H
