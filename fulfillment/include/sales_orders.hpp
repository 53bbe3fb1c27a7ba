#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "forge/quantity.hpp"
#include "forge/registry.hpp"
#include "sales_order_state.hpp"

namespace forge::fulfillment {

struct SalesLineSpec {
    std::string line_id;
    std::string item_id;
    Quantity quantity = 0;
    std::string production_order_id;
};

struct SalesOrderSpec {
    std::string sales_order_id;
    std::string customer;
    std::vector<SalesLineSpec> lines;
};

/**
 * Sales order aggregates, driven by order entry and the shipping
 * collaborator. One mutex per order; reads load the published snapshot.
 */
class SalesOrders {
public:
    std::shared_ptr<const SalesOrderState> place(const SalesOrderSpec& spec, const std::string& actor);

    /// Make-to-order link from a line to the production order building it.
    std::shared_ptr<const SalesOrderState> link_production(const std::string& sales_order_id,
                                                           const std::string& line_id,
                                                           const std::string& production_order_id,
                                                           const std::string& actor);

    /// Partial shipments accumulate; a line never ships past its quantity.
    std::shared_ptr<const SalesOrderState> record_shipment(const std::string& sales_order_id,
                                                           const std::string& line_id,
                                                           Quantity quantity,
                                                           const std::string& actor);

    std::shared_ptr<const SalesOrderState> mark_shipped(const std::string& sales_order_id,
                                                        const std::string& carrier,
                                                        const std::string& tracking_number,
                                                        const std::string& actor);

    std::shared_ptr<const SalesOrderState> cancel(const std::string& sales_order_id,
                                                  const std::string& reason,
                                                  const std::string& actor);

    /// Throws NotFoundError for an unknown order.
    std::shared_ptr<const SalesOrderState> order(const std::string& sales_order_id) const;
    EventBook event_book(const std::string& sales_order_id) const;

private:
    struct OrderSlot {
        std::mutex mutex;
        SalesOrderState state;
        EventBook events;
        std::shared_ptr<const SalesOrderState> published;
    };

    std::shared_ptr<OrderSlot> require_slot(const std::string& sales_order_id) const;

    template<typename T>
    std::shared_ptr<const SalesOrderState> append(OrderSlot& slot, const T& event,
                                                  const std::string& actor);

    Registry<OrderSlot> orders_;
};

} // namespace forge::fulfillment
