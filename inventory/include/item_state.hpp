#pragma once

#include <map>
#include <optional>
#include <string>
#include <google/protobuf/any.pb.h>
#include "forge/quantity.hpp"
#include "forge/types.pb.h"
#include "forge/inventory.pb.h"

namespace forge::inventory {

/// Stock committed to one demand source.
struct Reservation {
    std::string allocation_id;
    Quantity quantity = 0;
    DemandRef demand;
    ConsumptionBasis basis;
};

enum class SpoolStatus { Active, Empty };

/// Traceable weight-based sub-unit of an item's on-hand quantity.
struct SpoolState {
    std::string spool_id;
    Quantity initial_weight = 0;
    Quantity current_weight = 0;
    std::string supplier_lot;
    google::protobuf::Timestamp expires_at;
    SpoolStatus status = SpoolStatus::Active;
};

/// Item aggregate state.
struct ItemState {
    std::string item_id;
    std::string unit;
    std::optional<Quantity> reorder_point;
    Quantity standard_cost = 0;
    Quantity stock_increment = 1;
    uint32_t lead_time_days = 0;
    Quantity on_hand = 0;
    Quantity allocated = 0;
    std::map<std::string, Reservation> reservations;
    std::map<std::string, SpoolState> spools;

    bool exists() const { return !item_id.empty(); }
    /// Negative while a shortage exists; never clamped.
    Quantity available() const { return on_hand - allocated; }

    /// Build state from an EventBook by applying all events.
    static ItemState from_event_book(const EventBook& event_book);

    /// Apply a single event to the state.
    static void apply_event(ItemState& state, const google::protobuf::Any& event_any);
};

const char* spool_status_name(SpoolStatus status);

} // namespace forge::inventory
