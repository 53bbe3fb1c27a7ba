#include "master_data.hpp"
#include <algorithm>

namespace forge::allocation {

void InMemoryMasterData::set_bom(const std::string& item_id, std::vector<BomLine> lines) {
    std::lock_guard<std::mutex> lock(mutex_);
    boms_[item_id] = std::move(lines);
}

void InMemoryMasterData::set_routing(const std::string& item_id, std::vector<RoutingStep> steps) {
    std::sort(steps.begin(), steps.end(), [](const RoutingStep& a, const RoutingStep& b) {
        return a.sequence < b.sequence;
    });
    std::lock_guard<std::mutex> lock(mutex_);
    routings_[item_id] = std::move(steps);
}

std::vector<BomLine> InMemoryMasterData::bom_for(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = boms_.find(item_id);
    return it != boms_.end() ? it->second : std::vector<BomLine>{};
}

std::vector<RoutingStep> InMemoryMasterData::routing_for(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = routings_.find(item_id);
    return it != routings_.end() ? it->second : std::vector<RoutingStep>{};
}

} // namespace forge::allocation
