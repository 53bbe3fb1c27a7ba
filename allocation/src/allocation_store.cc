#include "allocation_store.hpp"
#include "forge/errors.hpp"
#include "forge/logging.hpp"
#include "forge/validation.hpp"
#include <algorithm>

namespace forge::allocation {

using namespace forge::validation;

const char* allocation_status_name(AllocationStatus status) {
    switch (status) {
        case AllocationStatus::Pending: return "pending";
        case AllocationStatus::Allocated: return "allocated";
        case AllocationStatus::Consumed: return "consumed";
        case AllocationStatus::Released: return "released";
    }
    return "pending";
}

AllocationStore::AllocationStore(inventory::InventoryLedger& ledger) : ledger_(ledger) {}

std::shared_ptr<AllocationStore::OrderAllocations> AllocationStore::require_order(
    const std::string& production_order_id) const {
    auto order = orders_.find(production_order_id);
    if (!order) {
        throw NotFoundError("No requirements for production order " + production_order_id);
    }
    return order;
}

void AllocationStore::publish(OrderAllocations& order) {
    std::atomic_store(&order.published,
                      std::make_shared<const std::vector<Allocation>>(order.allocations));
}

std::vector<Allocation> AllocationStore::generate_requirements(
    const std::string& production_order_id,
    const std::vector<BomLine>& materials,
    Quantity order_quantity,
    const DemandRef& demand,
    const std::string& actor) {
    require_not_empty(production_order_id, "production_order_id");
    require_positive(order_quantity, "order_quantity");

    std::vector<std::shared_ptr<const inventory::ItemState>> items;
    for (const auto& line : materials) {
        require_positive(line.quantity_per, "quantity_per for " + line.component_id);
        require_non_negative(line.scrap_factor, "scrap_factor for " + line.component_id);
        items.push_back(ledger_.require_item(line.component_id));
    }

    auto order = std::make_shared<OrderAllocations>();
    order->published = std::make_shared<const std::vector<Allocation>>();
    std::lock_guard<std::mutex> lock(order->mutex);
    if (!orders_.insert(production_order_id, order)) {
        throw InvalidArgumentError("Requirements already generated for " + production_order_id);
    }

    for (size_t i = 0; i < materials.size(); ++i) {
        const auto& line = materials[i];
        Allocation allocation;
        allocation.allocation_id = ledger_.next_allocation_id();
        allocation.production_order_id = production_order_id;
        allocation.item_id = line.component_id;
        allocation.quantity = scaled_requirement(line.quantity_per, order_quantity,
                                                 line.scrap_factor, items[i]->stock_increment);
        allocation.demand = demand;
        allocation.demand.set_operation_sequence(line.operation_sequence);
        allocation.basis.set_quantity_per(line.quantity_per);
        allocation.basis.set_scrap_factor(line.scrap_factor);

        try {
            ledger_.reserve(allocation.item_id, allocation.quantity, allocation.demand,
                            allocation.basis, actor, allocation.allocation_id);
            allocation.quantity_reserved = allocation.quantity;
            allocation.status = AllocationStatus::Allocated;
        } catch (const ShortageError& e) {
            log_warn("allocation", "requirement_left_pending", {
                {"production_order_id", production_order_id},
                {"allocation_id", allocation.allocation_id},
                {"item_id", e.item_id()},
                {"required", format_quantity(e.requested())},
                {"available", format_quantity(e.available())},
                {"short_by", format_quantity(e.short_by())}
            });
        }

        {
            std::lock_guard<std::mutex> index_lock(index_mutex_);
            allocation_orders_[allocation.allocation_id] = production_order_id;
        }
        order->allocations.push_back(std::move(allocation));
    }

    publish(*order);
    return order->allocations;
}

std::vector<Allocation> AllocationStore::requirements_for(
    const std::string& production_order_id) const {
    auto order = orders_.find(production_order_id);
    if (!order) return {};
    return *std::atomic_load(&order->published);
}

std::vector<Allocation> AllocationStore::requirements_for(const std::string& production_order_id,
                                                          uint32_t sequence) const {
    std::vector<Allocation> result;
    for (auto& allocation : requirements_for(production_order_id)) {
        if (allocation.demand.operation_sequence() == sequence) {
            result.push_back(std::move(allocation));
        }
    }
    return result;
}

Allocation AllocationStore::reallocate(const std::string& allocation_id, Quantity new_quantity,
                                       const std::string& actor) {
    require_positive(new_quantity, "quantity");
    std::string production_order_id;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = allocation_orders_.find(allocation_id);
        if (it == allocation_orders_.end()) {
            throw NotFoundError("Allocation " + allocation_id + " not found");
        }
        production_order_id = it->second;
    }

    auto order = require_order(production_order_id);
    std::lock_guard<std::mutex> lock(order->mutex);
    for (auto& allocation : order->allocations) {
        if (allocation.allocation_id != allocation_id) continue;

        switch (allocation.status) {
            case AllocationStatus::Pending:
                allocation.quantity = new_quantity;
                break;
            case AllocationStatus::Allocated:
                ledger_.resize(allocation_id, new_quantity, actor);
                allocation.quantity = new_quantity;
                allocation.quantity_reserved = new_quantity;
                break;
            case AllocationStatus::Consumed:
            case AllocationStatus::Released: {
                InvalidTransitionError error("allocation " + allocation_id,
                                             allocation_status_name(allocation.status),
                                             "reallocate");
                log_error("allocation", "invalid_transition", {
                    {"error", error.what()},
                    {"allocation_id", allocation_id}
                });
                throw error;
            }
        }
        publish(*order);
        log_info("allocation", "requirement_reallocated", {
            {"allocation_id", allocation_id},
            {"item_id", allocation.item_id},
            {"quantity", format_quantity(new_quantity)},
            {"status", allocation_status_name(allocation.status)}
        });
        return allocation;
    }
    throw NotFoundError("Allocation " + allocation_id + " not found");
}

std::vector<Allocation> AllocationStore::try_reserve_pending(
    const std::string& production_order_id, uint32_t sequence, const std::string& actor) {
    auto order = orders_.find(production_order_id);
    if (!order) return {};

    std::lock_guard<std::mutex> lock(order->mutex);
    std::vector<Allocation> still_pending;
    bool changed = false;
    for (auto& allocation : order->allocations) {
        if (allocation.status != AllocationStatus::Pending ||
            allocation.demand.operation_sequence() != sequence) {
            continue;
        }
        try {
            ledger_.reserve(allocation.item_id, allocation.quantity, allocation.demand,
                            allocation.basis, actor, allocation.allocation_id);
            allocation.quantity_reserved = allocation.quantity;
            allocation.status = AllocationStatus::Allocated;
            changed = true;
        } catch (const ShortageError& e) {
            log_debug("allocation", "requirement_still_short", {
                {"allocation_id", allocation.allocation_id},
                {"item_id", e.item_id()},
                {"short_by", format_quantity(e.short_by())}
            });
            still_pending.push_back(allocation);
        }
    }
    if (changed) publish(*order);
    return still_pending;
}

Quantity AllocationStore::release_matching(
    OrderAllocations& order, const std::string& actor,
    const std::function<bool(const Allocation&)>& predicate) {
    Quantity released = 0;
    bool changed = false;
    for (auto& allocation : order.allocations) {
        if (!allocation.is_open() || !predicate(allocation)) continue;
        if (allocation.status == AllocationStatus::Allocated) {
            released += ledger_.release(allocation.allocation_id, actor);
        }
        allocation.quantity_reserved = 0;
        allocation.status = AllocationStatus::Released;
        changed = true;
    }
    if (changed) publish(order);
    return released;
}

Quantity AllocationStore::release_operation(const std::string& production_order_id,
                                            uint32_t sequence, const std::string& actor) {
    auto order = orders_.find(production_order_id);
    if (!order) return 0;
    std::lock_guard<std::mutex> lock(order->mutex);
    return release_matching(*order, actor, [sequence](const Allocation& allocation) {
        return allocation.demand.operation_sequence() == sequence;
    });
}

Quantity AllocationStore::release_order(const std::string& production_order_id,
                                        const std::string& actor) {
    auto order = orders_.find(production_order_id);
    if (!order) return 0;
    std::lock_guard<std::mutex> lock(order->mutex);
    return release_matching(*order, actor, [](const Allocation&) { return true; });
}

std::vector<inventory::ConsumeLine> AllocationStore::consumption_lines(
    const std::string& production_order_id,
    uint32_t sequence,
    Quantity quantity_good,
    Quantity quantity_scrap) const {
    std::vector<inventory::ConsumeLine> lines;
    for (const auto& allocation : requirements_for(production_order_id, sequence)) {
        if (allocation.status != AllocationStatus::Allocated) continue;
        lines.push_back(inventory::ConsumeLine{
            allocation.allocation_id, quantity_good, quantity_scrap,
            "Consumed by " + production_order_id + " operation " + std::to_string(sequence)});
    }
    return lines;
}

void AllocationStore::consume_operation(const std::string& production_order_id,
                                        const std::vector<inventory::Consumption>& consumptions) {
    auto order = require_order(production_order_id);
    std::lock_guard<std::mutex> lock(order->mutex);
    for (const auto& consumption : consumptions) {
        for (auto& allocation : order->allocations) {
            if (allocation.allocation_id == consumption.allocation_id) {
                allocation.quantity_consumed = consumption.quantity_consumed;
                allocation.quantity_reserved = 0;
                allocation.status = AllocationStatus::Consumed;
            }
        }
    }
    publish(*order);
}

std::vector<BlockingIssue> AllocationStore::short_reservations(
    const std::vector<Allocation>& requirements) const {
    std::vector<BlockingIssue> issues;
    std::unordered_map<std::string, Quantity> deficit;
    for (const auto& requirement : requirements) {
        if (requirement.status != AllocationStatus::Allocated) continue;
        auto it = deficit.find(requirement.item_id);
        if (it == deficit.end()) {
            auto item = ledger_.item(requirement.item_id);
            Quantity missing = item ? std::max<Quantity>(0, -item->available()) : 0;
            it = deficit.emplace(requirement.item_id, missing).first;
        }
        Quantity short_by = std::min(requirement.quantity_reserved, it->second);
        if (short_by == 0) continue;
        it->second -= short_by;
        issues.push_back(BlockingIssue{requirement.item_id, requirement.allocation_id,
                                       requirement.quantity_reserved,
                                       requirement.quantity_reserved - short_by, short_by});
    }
    return issues;
}

std::vector<Allocation> AllocationStore::for_item(const std::string& item_id) const {
    std::vector<Allocation> result;
    auto orders = orders_.snapshot();
    for (const auto& entry : *orders) {
        auto allocations = std::atomic_load(&entry.second->published);
        for (const auto& allocation : *allocations) {
            if (allocation.item_id == item_id && allocation.is_open()) {
                result.push_back(allocation);
            }
        }
    }
    return result;
}

std::optional<Allocation> AllocationStore::find(const std::string& allocation_id) const {
    std::string production_order_id;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = allocation_orders_.find(allocation_id);
        if (it == allocation_orders_.end()) return std::nullopt;
        production_order_id = it->second;
    }
    for (const auto& allocation : requirements_for(production_order_id)) {
        if (allocation.allocation_id == allocation_id) return allocation;
    }
    return std::nullopt;
}

} // namespace forge::allocation
