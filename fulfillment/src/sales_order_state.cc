#include "sales_order_state.hpp"

namespace forge::fulfillment {

const char* sales_order_status_name(SalesOrderStatus status) {
    switch (status) {
        case SalesOrderStatus::Open: return "open";
        case SalesOrderStatus::Shipped: return "shipped";
        case SalesOrderStatus::Cancelled: return "cancelled";
    }
    return "unspecified";
}

SalesOrderView view_of(const SalesOrderState& state) {
    SalesOrderView view;
    view.set_sales_order_id(state.sales_order_id);
    view.set_customer(state.customer);
    view.set_status(sales_order_status_name(state.status));
    for (const auto& line : state.lines) {
        auto* added = view.add_lines();
        added->set_line_id(line.line_id);
        added->set_item_id(line.item_id);
        added->set_quantity(line.quantity);
        added->set_quantity_shipped(line.quantity_shipped);
        added->set_production_order_id(line.production_order_id);
    }
    *view.mutable_placed_at() = state.placed_at;
    view.set_carrier(state.carrier);
    view.set_tracking_number(state.tracking_number);
    *view.mutable_shipped_at() = state.shipped_at;
    view.set_cancel_reason(state.cancel_reason);
    return view;
}

const SalesLineState* SalesOrderState::find_line(const std::string& line_id) const {
    for (const auto& line : lines) {
        if (line.line_id == line_id) return &line;
    }
    return nullptr;
}

SalesLineState* SalesOrderState::find_line(const std::string& line_id) {
    for (auto& line : lines) {
        if (line.line_id == line_id) return &line;
    }
    return nullptr;
}

SalesOrderState SalesOrderState::from_event_book(const EventBook& event_book) {
    SalesOrderState state;
    for (const auto& page : event_book.pages()) {
        apply_event(state, page.event());
    }
    return state;
}

void SalesOrderState::apply_event(SalesOrderState& state, const google::protobuf::Any& event_any) {
    if (event_any.Is<SalesOrderPlaced>()) {
        SalesOrderPlaced event;
        event_any.UnpackTo(&event);
        state.sales_order_id = event.sales_order_id();
        state.customer = event.customer();
        state.placed_at = event.placed_at();
        state.lines.clear();
        for (const auto& line : event.lines()) {
            state.lines.push_back(SalesLineState{line.line_id(), line.item_id(), line.quantity(), 0,
                                                 line.production_order_id()});
        }
    } else if (event_any.Is<ProductionLinked>()) {
        ProductionLinked event;
        event_any.UnpackTo(&event);
        if (auto* line = state.find_line(event.line_id())) {
            line->production_order_id = event.production_order_id();
        }
    } else if (event_any.Is<ShipmentRecorded>()) {
        ShipmentRecorded event;
        event_any.UnpackTo(&event);
        if (auto* line = state.find_line(event.line_id())) {
            line->quantity_shipped += event.quantity();
        }
    } else if (event_any.Is<SalesOrderShipped>()) {
        SalesOrderShipped event;
        event_any.UnpackTo(&event);
        state.status = SalesOrderStatus::Shipped;
        state.carrier = event.carrier();
        state.tracking_number = event.tracking_number();
        state.shipped_at = event.shipped_at();
    } else if (event_any.Is<SalesOrderCancelled>()) {
        SalesOrderCancelled event;
        event_any.UnpackTo(&event);
        state.status = SalesOrderStatus::Cancelled;
        state.cancel_reason = event.reason();
    }
}

} // namespace forge::fulfillment
