#include "sales_orders.hpp"
#include <set>
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"
#include "forge/validation.hpp"

namespace forge::fulfillment {

namespace {

[[noreturn]] void reject(const SalesOrderState& state, const std::string& action) {
    InvalidTransitionError error("sales order " + state.sales_order_id,
                                 sales_order_status_name(state.status), action);
    log_error("fulfillment", "invalid_transition", {
        {"error", error.what()},
        {"sales_order_id", state.sales_order_id},
        {"from", sales_order_status_name(state.status)},
        {"action", action}
    });
    throw error;
}

void require_open(const SalesOrderState& state, const std::string& action) {
    if (state.status != SalesOrderStatus::Open) reject(state, action);
}

SalesLineState& require_line(SalesOrderState& state, const std::string& line_id) {
    auto* line = state.find_line(line_id);
    if (!line) {
        throw NotFoundError("Line " + line_id + " not found on sales order " + state.sales_order_id);
    }
    return *line;
}

} // anonymous namespace

std::shared_ptr<SalesOrders::OrderSlot> SalesOrders::require_slot(
    const std::string& sales_order_id) const {
    auto slot = orders_.find(sales_order_id);
    if (!slot) throw NotFoundError("Sales order " + sales_order_id + " not found");
    return slot;
}

template<typename T>
std::shared_ptr<const SalesOrderState> SalesOrders::append(OrderSlot& slot, const T& event,
                                                           const std::string& actor) {
    auto any = helpers::pack(event);
    SalesOrderState::apply_event(slot.state, any);
    helpers::append_packed(slot.events, any, actor);
    auto published = std::make_shared<const SalesOrderState>(slot.state);
    std::atomic_store(&slot.published, published);
    return published;
}

std::shared_ptr<const SalesOrderState> SalesOrders::place(const SalesOrderSpec& spec,
                                                          const std::string& actor) {
    validation::require_not_empty(spec.sales_order_id, "sales_order_id");
    validation::require_not_empty(spec.customer, "customer");

    SalesOrderPlaced event;
    event.set_sales_order_id(spec.sales_order_id);
    event.set_customer(spec.customer);
    *event.mutable_placed_at() = helpers::now();
    std::set<std::string> seen;
    for (const auto& line : spec.lines) {
        validation::require_not_empty(line.line_id, "line_id");
        validation::require_not_empty(line.item_id, "item_id");
        validation::require_positive(line.quantity, "quantity");
        if (!seen.insert(line.line_id).second) {
            throw InvalidArgumentError("Duplicate line " + line.line_id + " on sales order " +
                                       spec.sales_order_id);
        }
        auto* added = event.add_lines();
        added->set_line_id(line.line_id);
        added->set_item_id(line.item_id);
        added->set_quantity(line.quantity);
        added->set_production_order_id(line.production_order_id);
    }

    auto slot = std::make_shared<OrderSlot>();
    slot->events = helpers::new_event_book("sales_order", spec.sales_order_id);
    auto published = append(*slot, event, actor);
    if (!orders_.insert(spec.sales_order_id, slot)) {
        throw InvalidArgumentError("Sales order " + spec.sales_order_id + " already exists");
    }
    log_info("fulfillment", "sales_order_placed", {
        {"sales_order_id", spec.sales_order_id},
        {"customer", spec.customer},
        {"lines", spec.lines.size()}
    });
    return published;
}

std::shared_ptr<const SalesOrderState> SalesOrders::link_production(
    const std::string& sales_order_id, const std::string& line_id,
    const std::string& production_order_id, const std::string& actor) {
    validation::require_not_empty(production_order_id, "production_order_id");
    auto slot = require_slot(sales_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    require_open(slot->state, "link_production");
    require_line(slot->state, line_id);

    ProductionLinked event;
    event.set_line_id(line_id);
    event.set_production_order_id(production_order_id);
    auto published = append(*slot, event, actor);
    log_info("fulfillment", "production_linked", {
        {"sales_order_id", sales_order_id},
        {"line_id", line_id},
        {"production_order_id", production_order_id}
    });
    return published;
}

std::shared_ptr<const SalesOrderState> SalesOrders::record_shipment(
    const std::string& sales_order_id, const std::string& line_id, Quantity quantity,
    const std::string& actor) {
    validation::require_positive(quantity, "quantity");
    auto slot = require_slot(sales_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    require_open(slot->state, "record_shipment");
    const auto& line = require_line(slot->state, line_id);
    if (quantity > line.remaining()) {
        throw InvalidArgumentError("Shipment of " + format_quantity(quantity) + " " + line.item_id +
                                   " exceeds remaining " + format_quantity(line.remaining()) +
                                   " on line " + line_id);
    }

    ShipmentRecorded event;
    event.set_line_id(line_id);
    event.set_quantity(quantity);
    auto published = append(*slot, event, actor);
    log_info("fulfillment", "shipment_recorded", {
        {"sales_order_id", sales_order_id},
        {"line_id", line_id},
        {"quantity", format_quantity(quantity)}
    });
    return published;
}

std::shared_ptr<const SalesOrderState> SalesOrders::mark_shipped(
    const std::string& sales_order_id, const std::string& carrier,
    const std::string& tracking_number, const std::string& actor) {
    auto slot = require_slot(sales_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    require_open(slot->state, "mark_shipped");

    SalesOrderShipped event;
    event.set_carrier(carrier);
    event.set_tracking_number(tracking_number);
    *event.mutable_shipped_at() = helpers::now();
    auto published = append(*slot, event, actor);
    log_info("fulfillment", "sales_order_shipped", {
        {"sales_order_id", sales_order_id},
        {"carrier", carrier},
        {"tracking_number", tracking_number}
    });
    return published;
}

std::shared_ptr<const SalesOrderState> SalesOrders::cancel(const std::string& sales_order_id,
                                                           const std::string& reason,
                                                           const std::string& actor) {
    validation::require_reason(reason, "reason");
    auto slot = require_slot(sales_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    require_open(slot->state, "cancel");

    SalesOrderCancelled event;
    event.set_reason(reason);
    auto published = append(*slot, event, actor);
    log_info("fulfillment", "sales_order_cancelled", {
        {"sales_order_id", sales_order_id},
        {"reason", reason}
    });
    return published;
}

std::shared_ptr<const SalesOrderState> SalesOrders::order(const std::string& sales_order_id) const {
    return std::atomic_load(&require_slot(sales_order_id)->published);
}

EventBook SalesOrders::event_book(const std::string& sales_order_id) const {
    auto slot = require_slot(sales_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->events;
}

} // namespace forge::fulfillment
