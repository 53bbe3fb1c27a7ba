#pragma once

#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "forge/quantity.hpp"
#include "forge/types.pb.h"
#include "forge/sales.pb.h"

namespace forge::fulfillment {

enum class SalesOrderStatus { Open, Shipped, Cancelled };

const char* sales_order_status_name(SalesOrderStatus status);

struct SalesLineState {
    std::string line_id;
    std::string item_id;
    Quantity quantity = 0;
    Quantity quantity_shipped = 0;
    /// Set for make-to-order lines.
    std::string production_order_id;

    Quantity remaining() const { return quantity - quantity_shipped; }
};

/**
 * Sales order aggregate state. Fulfillment is derived by
 * FulfillmentCalculator and never stored here.
 */
struct SalesOrderState {
    std::string sales_order_id;
    std::string customer;
    SalesOrderStatus status = SalesOrderStatus::Open;
    std::vector<SalesLineState> lines;
    google::protobuf::Timestamp placed_at;
    std::string carrier;
    std::string tracking_number;
    google::protobuf::Timestamp shipped_at;
    std::string cancel_reason;

    bool exists() const { return !sales_order_id.empty(); }

    const SalesLineState* find_line(const std::string& line_id) const;
    SalesLineState* find_line(const std::string& line_id);

    static SalesOrderState from_event_book(const EventBook& event_book);
    static void apply_event(SalesOrderState& state, const google::protobuf::Any& event_any);
};

/// Wire form of the order; status uses sales_order_status_name.
SalesOrderView view_of(const SalesOrderState& state);

} // namespace forge::fulfillment
