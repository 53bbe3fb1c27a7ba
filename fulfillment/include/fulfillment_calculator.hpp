#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "forge/projections.pb.h"
#include "inventory_ledger.hpp"
#include "production_orders.hpp"
#include "sales_orders.hpp"
#include "shortage_resolver.hpp"

namespace forge::fulfillment {

/**
 * Derives how ready a sales order is to ship.
 *
 * Nothing is cached: every call reads the current snapshots, so repeated
 * calls over unchanged state agree.
 */
class FulfillmentCalculator {
public:
    FulfillmentCalculator(const SalesOrders& sales_orders,
                          const inventory::InventoryLedger& ledger,
                          const production::ProductionOrders& production_orders,
                          const pegging::ShortageResolver& resolver);

    /**
     * A line is ready when its production order is complete, or when stock
     * covers what is left to ship and the item has no shortage. Lines are
     * evaluated in order and each ready line claims its remaining quantity,
     * so later lines of the same item see only what is left.
     *
     * Shipped orders report 100 percent and cancelled orders 0, without
     * looking at lines.
     */
    FulfillmentStatus fulfillment_status(const std::string& sales_order_id) const;

    /**
     * What keeps an open sales order from shipping, line by line, with ranked
     * remediation: expedite or create purchase orders, then complete or
     * create production orders. Lines that fulfillment_status counts as
     * ready carry no issues.
     *
     * The estimated ready date is the latest dated supply or production due
     * date plus a two day processing buffer. It stays unset when the order
     * can ship or nothing dated is later than today.
     */
    SalesOrderBlockingIssues blocking_issues(const std::string& sales_order_id) const;

private:
    /// Explicitly linked orders and orders created for this line.
    std::vector<std::shared_ptr<const production::ProductionOrderState>> production_for(
        const SalesOrderState& order, const SalesLineState& line) const;

    LineFulfillment line_status(const SalesLineState& line,
                                std::map<std::string, Quantity>& committed) const;

    const SalesOrders& sales_orders_;
    const inventory::InventoryLedger& ledger_;
    const production::ProductionOrders& production_orders_;
    const pegging::ShortageResolver& resolver_;
};

const char* fulfillment_state_name(FulfillmentState state);

} // namespace forge::fulfillment
