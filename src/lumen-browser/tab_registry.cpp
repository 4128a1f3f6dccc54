#include "tab_registry.h"

#include <utility>

bool TabRegistry::insert(const BrowserTab &tab, std::unique_ptr<RenderSurface> surface)
{
    if (!surface || tab.id.empty()) return false;
    if (entries_.find(tab.id) != entries_.end()) return false;
    Entry entry;
    entry.tab = tab;
    entry.order_it = order_.insert(order_.end(), tab.id);
    by_surface_[surface.get()] = tab.id;
    entry.surface = std::move(surface);
    entries_.emplace(tab.id, std::move(entry));
    return true;
}

bool TabRegistry::remove(const std::string &tab_id, BrowserTab *tab_out, std::unique_ptr<RenderSurface> *surface_out)
{
    auto it = entries_.find(tab_id);
    if (it == entries_.end()) return false;
    Entry &entry = it->second;
    order_.erase(entry.order_it);
    by_surface_.erase(entry.surface.get());
    if (tab_out) *tab_out = entry.tab;
    if (surface_out) *surface_out = std::move(entry.surface);
    if (active_tab_id_ == tab_id) active_tab_id_.clear();
    entries_.erase(it);
    return true;
}

BrowserTab *TabRegistry::get(const std::string &tab_id)
{
    auto it = entries_.find(tab_id);
    return it == entries_.end() ? nullptr : &it->second.tab;
}

const BrowserTab *TabRegistry::get(const std::string &tab_id) const
{
    auto it = entries_.find(tab_id);
    return it == entries_.end() ? nullptr : &it->second.tab;
}

RenderSurface *TabRegistry::surfaceFor(const std::string &tab_id) const
{
    auto it = entries_.find(tab_id);
    return it == entries_.end() ? nullptr : it->second.surface.get();
}

BrowserTab *TabRegistry::findBySurface(const RenderSurface *surface)
{
    if (!surface) return nullptr;
    auto it = by_surface_.find(surface);
    if (it == by_surface_.end()) return nullptr;
    return get(it->second);
}

std::vector<BrowserTab> TabRegistry::all() const
{
    std::vector<BrowserTab> tabs;
    tabs.reserve(order_.size());
    for (const auto &id : order_) {
        tabs.push_back(entries_.at(id).tab);
    }
    return tabs;
}

std::vector<std::string> TabRegistry::ids() const
{
    return std::vector<std::string>(order_.begin(), order_.end());
}

std::string TabRegistry::lastId() const
{
    if (order_.empty()) return std::string();
    return order_.back();
}

bool TabRegistry::setActive(const std::string &tab_id)
{
    BrowserTab *target = get(tab_id);
    if (!target) return false;
    BrowserTab *previous = get(active_tab_id_);
    if (previous && previous != target) {
        previous->is_active = false;
    }
    target->is_active = true;
    active_tab_id_ = tab_id;
    return true;
}

void TabRegistry::clearActive()
{
    BrowserTab *previous = get(active_tab_id_);
    if (previous) previous->is_active = false;
    active_tab_id_.clear();
}

int TabRegistry::countSuspended() const
{
    int count = 0;
    for (const auto &pair : entries_) {
        if (pair.second.tab.suspended) count++;
    }
    return count;
}

std::vector<std::unique_ptr<RenderSurface>> TabRegistry::takeAllSurfaces()
{
    std::vector<std::unique_ptr<RenderSurface>> surfaces;
    surfaces.reserve(entries_.size());
    for (const auto &id : order_) {
        surfaces.push_back(std::move(entries_.at(id).surface));
    }
    entries_.clear();
    by_surface_.clear();
    order_.clear();
    active_tab_id_.clear();
    return surfaces;
}
