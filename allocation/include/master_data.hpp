#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "forge/quantity.hpp"

namespace forge::allocation {

/// One component of a bill of materials.
struct BomLine {
    std::string component_id;
    Quantity quantity_per = 0;
    Quantity scrap_factor = 0;
    /// Operation that consumes the component; 0 means the first operation.
    uint32_t operation_sequence = 0;
};

/// One step of a routing.
struct RoutingStep {
    uint32_t sequence = 0;
    std::string work_center;
    int64_t setup_minutes = 0;
    int64_t run_minutes = 0;
};

/**
 * Bill-of-materials and routing lookup, owned by the master-data service.
 */
class MasterData {
public:
    virtual ~MasterData() = default;
    virtual std::vector<BomLine> bom_for(const std::string& item_id) const = 0;
    virtual std::vector<RoutingStep> routing_for(const std::string& item_id) const = 0;
};

class InMemoryMasterData : public MasterData {
public:
    void set_bom(const std::string& item_id, std::vector<BomLine> lines);
    void set_routing(const std::string& item_id, std::vector<RoutingStep> steps);

    std::vector<BomLine> bom_for(const std::string& item_id) const override;
    std::vector<RoutingStep> routing_for(const std::string& item_id) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<BomLine>> boms_;
    std::map<std::string, std::vector<RoutingStep>> routings_;
};

} // namespace forge::allocation
