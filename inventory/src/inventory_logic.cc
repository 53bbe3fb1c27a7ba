#include "inventory_logic.hpp"
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/validation.hpp"
#include <algorithm>

namespace forge::inventory {

using namespace forge::validation;

namespace {

void require_item(const ItemState& state) {
    if (!state.exists()) throw NotFoundError("Item does not exist");
}

const Reservation& require_reservation(const ItemState& state, const std::string& allocation_id) {
    auto it = state.reservations.find(allocation_id);
    if (it == state.reservations.end()) {
        throw NotFoundError("No reservation " + allocation_id + " on item " + state.item_id);
    }
    return it->second;
}

} // anonymous namespace

InventoryTransaction InventoryLogic::make_transaction(const ItemState& state,
                                                      Quantity delta,
                                                      const TransactionContext& context,
                                                      const std::string& spool_id) {
    InventoryTransaction transaction;
    transaction.set_transaction_id(context.transaction_id);
    transaction.set_item_id(state.item_id);
    transaction.set_spool_id(spool_id);
    transaction.set_quantity_delta(delta);
    transaction.set_unit_cost(state.standard_cost);
    transaction.set_kind(context.kind);
    transaction.set_reference_type(context.reference_type);
    transaction.set_reference_id(context.reference_id);
    transaction.set_actor(context.actor);
    *transaction.mutable_created_at() = helpers::now();
    transaction.set_reason(context.reason);
    return transaction;
}

ItemRegistered InventoryLogic::handle_register(const ItemState& state, const ItemSpec& spec) {
    if (state.exists()) throw InvalidArgumentError("Item " + spec.item_id + " already exists");
    require_not_empty(spec.item_id, "item_id");
    require_not_empty(spec.unit, "unit");
    require_positive(spec.stock_increment, "stock_increment");
    require_non_negative(spec.standard_cost, "standard_cost");

    ItemRegistered event;
    event.set_item_id(spec.item_id);
    event.set_unit(spec.unit);
    if (spec.reorder_point) {
        event.set_reorder_point(*spec.reorder_point);
        event.set_has_reorder_point(true);
    }
    event.set_standard_cost(spec.standard_cost);
    event.set_stock_increment(spec.stock_increment);
    event.set_lead_time_days(spec.lead_time_days);
    return event;
}

StockReserved InventoryLogic::handle_reserve(const ItemState& state,
                                             const std::string& allocation_id,
                                             Quantity quantity,
                                             const DemandRef& demand,
                                             const ConsumptionBasis& basis) {
    require_item(state);
    require_not_empty(allocation_id, "allocation_id");
    require_positive(quantity, "quantity");
    if (state.reservations.count(allocation_id) > 0) {
        throw InvalidArgumentError("Reservation " + allocation_id + " already exists");
    }
    if (quantity > state.available()) {
        throw ShortageError(state.item_id, quantity, state.available());
    }

    StockReserved event;
    event.set_allocation_id(allocation_id);
    event.set_quantity(quantity);
    *event.mutable_demand() = demand;
    *event.mutable_basis() = basis;
    event.set_available_after(state.available() - quantity);
    return event;
}

ReservationResized InventoryLogic::handle_resize(const ItemState& state,
                                                 const std::string& allocation_id,
                                                 Quantity new_quantity) {
    require_item(state);
    require_positive(new_quantity, "quantity");
    const auto& reservation = require_reservation(state, allocation_id);

    Quantity growth = new_quantity - reservation.quantity;
    if (growth > state.available()) {
        throw ShortageError(state.item_id, growth, state.available());
    }

    ReservationResized event;
    event.set_allocation_id(allocation_id);
    event.set_previous_quantity(reservation.quantity);
    event.set_new_quantity(new_quantity);
    return event;
}

ReservationReleased InventoryLogic::handle_release(const ItemState& state,
                                                   const std::string& allocation_id) {
    require_item(state);
    const auto& reservation = require_reservation(state, allocation_id);

    ReservationReleased event;
    event.set_allocation_id(allocation_id);
    event.set_quantity_released(reservation.quantity);
    return event;
}

ReservationConsumed InventoryLogic::handle_consume(const ItemState& state,
                                                   const std::string& allocation_id,
                                                   Quantity quantity_good,
                                                   Quantity quantity_scrap,
                                                   const TransactionContext& context) {
    require_item(state);
    require_non_negative(quantity_good, "quantity_good");
    require_non_negative(quantity_scrap, "quantity_scrap");
    const auto& reservation = require_reservation(state, allocation_id);

    Quantity required = scaled_requirement(reservation.basis.quantity_per(),
                                           quantity_good + quantity_scrap,
                                           reservation.basis.scrap_factor(),
                                           state.stock_increment);
    Quantity consumed = std::min(required, reservation.quantity);
    if (consumed > state.on_hand) {
        throw ShortageError(state.item_id, consumed, state.on_hand);
    }

    ReservationConsumed event;
    event.set_allocation_id(allocation_id);
    event.set_quantity_consumed(consumed);
    event.set_quantity_released(reservation.quantity - consumed);
    if (consumed > 0) {
        *event.mutable_transaction() = make_transaction(state, -consumed, context);
    }
    return event;
}

StockAdjusted InventoryLogic::handle_adjust(const ItemState& state,
                                            Quantity delta,
                                            const TransactionContext& context) {
    require_item(state);
    require_reason(context.reason);
    if (delta == 0) throw InvalidArgumentError("Adjustment of " + state.item_id + " must be non-zero");
    if (state.on_hand + delta < 0) {
        throw ShortageError(state.item_id, -delta, state.on_hand);
    }

    StockAdjusted event;
    *event.mutable_transaction() = make_transaction(state, delta, context);
    return event;
}

SpoolRegistered InventoryLogic::handle_register_spool(const ItemState& state,
                                                      const SpoolSpec& spec,
                                                      const TransactionContext& context) {
    require_item(state);
    require_not_empty(spec.spool_id, "spool_id");
    require_non_negative(spec.initial_weight, "initial_weight");
    require_reason(context.reason);
    if (state.spools.count(spec.spool_id) > 0) {
        throw InvalidArgumentError("Spool " + spec.spool_id + " already exists");
    }

    SpoolRegistered event;
    event.set_spool_id(spec.spool_id);
    event.set_initial_weight(spec.initial_weight);
    event.set_supplier_lot(spec.supplier_lot);
    *event.mutable_expires_at() = spec.expires_at;
    *event.mutable_transaction() =
        make_transaction(state, spec.initial_weight, context, spec.spool_id);
    return event;
}

std::optional<SpoolWeightAdjusted> InventoryLogic::handle_adjust_spool(
    const ItemState& state,
    const std::string& spool_id,
    Quantity new_weight,
    const TransactionContext& context) {
    require_item(state);
    require_non_negative(new_weight, "new_weight");
    auto it = state.spools.find(spool_id);
    if (it == state.spools.end()) throw NotFoundError("Spool " + spool_id + " not found");

    const auto& spool = it->second;
    if (new_weight == spool.current_weight) return std::nullopt;
    require_reason(context.reason);

    Quantity delta = new_weight - spool.current_weight;
    if (state.on_hand + delta < 0) {
        throw ShortageError(state.item_id, -delta, state.on_hand);
    }

    SpoolWeightAdjusted event;
    event.set_spool_id(spool_id);
    event.set_previous_weight(spool.current_weight);
    event.set_new_weight(new_weight);
    *event.mutable_transaction() = make_transaction(state, delta, context, spool_id);
    return event;
}

} // namespace forge::inventory
