#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace forge::production {

/// The operation occupying a resource.
struct ResourceClaim {
    std::string production_order_id;
    uint32_t sequence = 0;

    bool operator==(const ResourceClaim& other) const {
        return production_order_id == other.production_order_id && sequence == other.sequence;
    }
};

/**
 * Which running operation holds each machine or work cell.
 */
class ResourceBoard {
public:
    /**
     * Throws ConflictError when another operation holds the resource.
     * An empty resource id claims nothing.
     */
    void claim(const std::string& resource_id, const ResourceClaim& claim);

    /// No-op unless the resource is held by this claim.
    void free(const std::string& resource_id, const ResourceClaim& claim);

    std::optional<ResourceClaim> holder(const std::string& resource_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ResourceClaim> claims_;
};

} // namespace forge::production
