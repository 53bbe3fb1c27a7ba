#include "item_state.hpp"

namespace forge::inventory {

const char* spool_status_name(SpoolStatus status) {
    switch (status) {
        case SpoolStatus::Active: return "active";
        case SpoolStatus::Empty: return "empty";
    }
    return "active";
}

ItemState ItemState::from_event_book(const EventBook& event_book) {
    ItemState state;
    for (const auto& page : event_book.pages()) {
        if (page.has_event()) {
            apply_event(state, page.event());
        }
    }
    return state;
}

void ItemState::apply_event(ItemState& state, const google::protobuf::Any& event_any) {
    if (event_any.Is<ItemRegistered>()) {
        ItemRegistered event;
        if (event_any.UnpackTo(&event)) {
            state.item_id = event.item_id();
            state.unit = event.unit();
            if (event.has_reorder_point()) state.reorder_point = event.reorder_point();
            state.standard_cost = event.standard_cost();
            state.stock_increment = event.stock_increment() > 0 ? event.stock_increment() : 1;
            state.lead_time_days = event.lead_time_days();
        }
    } else if (event_any.Is<StockAdjusted>()) {
        StockAdjusted event;
        if (event_any.UnpackTo(&event)) {
            state.on_hand += event.transaction().quantity_delta();
        }
    } else if (event_any.Is<StockReserved>()) {
        StockReserved event;
        if (event_any.UnpackTo(&event)) {
            state.allocated += event.quantity();
            state.reservations[event.allocation_id()] =
                Reservation{event.allocation_id(), event.quantity(), event.demand(), event.basis()};
        }
    } else if (event_any.Is<ReservationResized>()) {
        ReservationResized event;
        if (event_any.UnpackTo(&event)) {
            auto it = state.reservations.find(event.allocation_id());
            if (it != state.reservations.end()) {
                state.allocated += event.new_quantity() - it->second.quantity;
                it->second.quantity = event.new_quantity();
            }
        }
    } else if (event_any.Is<ReservationReleased>()) {
        ReservationReleased event;
        if (event_any.UnpackTo(&event)) {
            auto it = state.reservations.find(event.allocation_id());
            if (it != state.reservations.end()) {
                state.allocated -= it->second.quantity;
                state.reservations.erase(it);
            }
        }
    } else if (event_any.Is<ReservationConsumed>()) {
        ReservationConsumed event;
        if (event_any.UnpackTo(&event)) {
            auto it = state.reservations.find(event.allocation_id());
            if (it != state.reservations.end()) {
                state.allocated -= it->second.quantity;
                state.reservations.erase(it);
            }
            state.on_hand += event.transaction().quantity_delta();
        }
    } else if (event_any.Is<SpoolRegistered>()) {
        SpoolRegistered event;
        if (event_any.UnpackTo(&event)) {
            SpoolState spool;
            spool.spool_id = event.spool_id();
            spool.initial_weight = event.initial_weight();
            spool.current_weight = event.initial_weight();
            spool.supplier_lot = event.supplier_lot();
            spool.expires_at = event.expires_at();
            spool.status = event.initial_weight() > 0 ? SpoolStatus::Active : SpoolStatus::Empty;
            state.spools[spool.spool_id] = spool;
            state.on_hand += event.transaction().quantity_delta();
        }
    } else if (event_any.Is<SpoolWeightAdjusted>()) {
        SpoolWeightAdjusted event;
        if (event_any.UnpackTo(&event)) {
            auto it = state.spools.find(event.spool_id());
            if (it != state.spools.end()) {
                it->second.current_weight = event.new_weight();
                it->second.status = event.new_weight() > 0 ? SpoolStatus::Active : SpoolStatus::Empty;
            }
            state.on_hand += event.transaction().quantity_delta();
        }
    }
}

} // namespace forge::inventory
