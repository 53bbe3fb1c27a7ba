#pragma once

#include <functional>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "forge/projections.pb.h"
#include "allocation_store.hpp"
#include "inventory_ledger.hpp"
#include "production_orders.hpp"
#include "purchasing.hpp"

namespace forge::pegging {

using Clock = std::function<google::protobuf::Timestamp()>;

/**
 * Demand pegging projections.
 *
 * Everything here is recomputed from published snapshots on each call and
 * never stored, so the same state always yields the same answer.
 */
class ShortageResolver {
public:
    /**
     * default_lead_time_days applies to items registered without a lead time.
     * today defaults to the system clock.
     */
    ShortageResolver(const inventory::InventoryLedger& ledger,
                     const allocation::AllocationStore& allocations,
                     const production::ProductionOrders& orders,
                     PurchasingGateway& purchasing,
                     uint32_t default_lead_time_days,
                     Clock today = nullptr);

    /**
     * Walk reserved demand, then pending requirements by need date, against
     * on_hand + incoming. Demand past that supply is blocking.
     */
    ItemShortage shortage_for(const std::string& item_id) const;

    DemandSummary demand_summary(const std::string& item_id) const;

    /**
     * Short materials among the order's open requirements, with ranked
     * expedite and create actions covering the shortfall.
     */
    BlockingIssues blocking_issues(const std::string& production_order_id) const;

    /**
     * By kind (expedite, create PO, complete production, create production),
     * then earliest availability, then smallest net-new quantity, then item
     * id and reference ids. Ranks start at 1.
     */
    static std::vector<ResolutionAction> rank_actions(std::vector<ResolutionAction> actions);

    google::protobuf::Timestamp today() const { return today_(); }

    /// Hand a create action to purchasing; returns the requested PO id.
    std::string request_purchase(const ResolutionAction& action, const std::string& reference);

private:
    std::vector<PurchaseLine> sorted_open_lines(const std::string& item_id) const;
    std::vector<ResolutionAction> actions_for(const inventory::ItemState& item,
                                              Quantity shortfall) const;

    const inventory::InventoryLedger& ledger_;
    const allocation::AllocationStore& allocations_;
    const production::ProductionOrders& orders_;
    PurchasingGateway& purchasing_;
    uint32_t default_lead_time_days_;
    Clock today_;
};

} // namespace forge::pegging
