#include "resource_board.hpp"
#include "forge/errors.hpp"
#include "forge/logging.hpp"

namespace forge::production {

void ResourceBoard::claim(const std::string& resource_id, const ResourceClaim& claim) {
    if (resource_id.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(resource_id);
    if (it != claims_.end() && !(it->second == claim)) {
        log_warn("production", "resource_double_booked", {
            {"resource_id", resource_id},
            {"held_by", it->second.production_order_id},
            {"held_sequence", it->second.sequence},
            {"requested_by", claim.production_order_id},
            {"requested_sequence", claim.sequence}
        });
        throw ConflictError("Resource " + resource_id + " is busy with operation " +
                            std::to_string(it->second.sequence) + " of " +
                            it->second.production_order_id);
    }
    claims_[resource_id] = claim;
}

void ResourceBoard::free(const std::string& resource_id, const ResourceClaim& claim) {
    if (resource_id.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(resource_id);
    if (it != claims_.end() && it->second == claim) claims_.erase(it);
}

std::optional<ResourceClaim> ResourceBoard::holder(const std::string& resource_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = claims_.find(resource_id);
    if (it == claims_.end()) return std::nullopt;
    return it->second;
}

} // namespace forge::production
