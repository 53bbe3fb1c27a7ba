#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "forge/errors.hpp"
#include "forge/registry.hpp"
#include "inventory_ledger.hpp"
#include "master_data.hpp"

namespace forge::allocation {

enum class AllocationStatus {
    Pending,
    Allocated,
    Consumed,
    /// Given back by a skip or cancel; never reserved again.
    Released
};

const char* allocation_status_name(AllocationStatus status);

/**
 * A material requirement of one production operation and the stock, if any,
 * reserved against it.
 */
struct Allocation {
    std::string allocation_id;
    std::string production_order_id;
    std::string item_id;
    Quantity quantity = 0;
    Quantity quantity_reserved = 0;
    Quantity quantity_consumed = 0;
    DemandRef demand;
    ConsumptionBasis basis;
    AllocationStatus status = AllocationStatus::Pending;

    bool is_open() const {
        return status == AllocationStatus::Pending || status == AllocationStatus::Allocated;
    }
};

/**
 * Requirements of production orders and their reservations in the ledger.
 *
 * Allocations are grouped per order. Changes to one order are serialized by
 * that order's mutex; readers see the last published copy.
 */
class AllocationStore {
public:
    explicit AllocationStore(inventory::InventoryLedger& ledger);

    /**
     * Create one allocation per BOM line sized for order_quantity and try to
     * reserve each. A line that cannot be reserved stays pending. Called
     * once per order.
     */
    std::vector<Allocation> generate_requirements(const std::string& production_order_id,
                                                  const std::vector<BomLine>& materials,
                                                  Quantity order_quantity,
                                                  const DemandRef& demand,
                                                  const std::string& actor);

    std::vector<Allocation> requirements_for(const std::string& production_order_id) const;
    std::vector<Allocation> requirements_for(const std::string& production_order_id,
                                             uint32_t sequence) const;

    /**
     * Change the required quantity of a pending or allocated requirement.
     * Throws InvalidTransitionError once consumed or released.
     */
    Allocation reallocate(const std::string& allocation_id, Quantity new_quantity,
                          const std::string& actor);

    /**
     * Retry reservation of the operation's pending requirements. Returns the
     * ones still pending.
     */
    std::vector<Allocation> try_reserve_pending(const std::string& production_order_id,
                                                uint32_t sequence,
                                                const std::string& actor);

    /// Returns the quantity given back to available.
    Quantity release_operation(const std::string& production_order_id, uint32_t sequence,
                               const std::string& actor);
    Quantity release_order(const std::string& production_order_id, const std::string& actor);

    /**
     * Ledger lines consuming the operation's reserved requirements for the
     * given output.
     */
    std::vector<inventory::ConsumeLine> consumption_lines(const std::string& production_order_id,
                                                          uint32_t sequence,
                                                          Quantity quantity_good,
                                                          Quantity quantity_scrap) const;

    /// Mark requirements consumed after the ledger committed.
    void consume_operation(const std::string& production_order_id,
                           const std::vector<inventory::Consumption>& consumptions);

    /**
     * Allocated requirements whose item dropped below its reservations after
     * they were made. An item's deficit is charged to the requirements in the
     * given order, each short by at most what it reserved.
     */
    std::vector<BlockingIssue> short_reservations(const std::vector<Allocation>& requirements) const;

    /// Open allocations against an item, across all orders.
    std::vector<Allocation> for_item(const std::string& item_id) const;

    std::optional<Allocation> find(const std::string& allocation_id) const;

private:
    struct OrderAllocations {
        std::mutex mutex;
        std::vector<Allocation> allocations;
        std::shared_ptr<const std::vector<Allocation>> published;
    };

    std::shared_ptr<OrderAllocations> require_order(const std::string& production_order_id) const;
    static void publish(OrderAllocations& order);
    Quantity release_matching(OrderAllocations& order, const std::string& actor,
                              const std::function<bool(const Allocation&)>& predicate);

    inventory::InventoryLedger& ledger_;
    Registry<OrderAllocations> orders_;

    mutable std::mutex index_mutex_;
    std::unordered_map<std::string, std::string> allocation_orders_;
};

} // namespace forge::allocation
