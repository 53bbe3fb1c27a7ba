#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace forge {

/**
 * Copy-on-write map of aggregate slots keyed by id.
 *
 * Lookups load the published map atomically and take no lock. Inserts copy
 * the map under a writer mutex and publish the copy; the slots themselves are
 * shared, so an insert never disturbs a writer holding a slot.
 */
template<typename T>
class Registry {
public:
    using Map = std::map<std::string, std::shared_ptr<T>>;

    Registry() : map_(std::make_shared<const Map>()) {}

    std::shared_ptr<T> find(const std::string& id) const {
        auto map = std::atomic_load(&map_);
        auto it = map->find(id);
        return it != map->end() ? it->second : nullptr;
    }

    /**
     * Returns false if the id is already registered.
     */
    bool insert(const std::string& id, std::shared_ptr<T> slot) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        auto current = std::atomic_load(&map_);
        if (current->count(id) > 0) return false;
        auto next = std::make_shared<Map>(*current);
        next->emplace(id, std::move(slot));
        std::atomic_store(&map_, std::shared_ptr<const Map>(std::move(next)));
        return true;
    }

    std::shared_ptr<const Map> snapshot() const { return std::atomic_load(&map_); }

private:
    std::shared_ptr<const Map> map_;
    std::mutex write_mutex_;
};

} // namespace forge
