#pragma once

#include <optional>
#include <string>
#include "forge/quantity.hpp"
#include "forge/inventory.pb.h"
#include "item_state.hpp"

namespace forge::inventory {

/// Attributes of a new stocked item.
struct ItemSpec {
    std::string item_id;
    std::string unit = "EA";
    std::optional<Quantity> reorder_point;
    Quantity standard_cost = 0;
    /// Smallest stockable unit; 1 is 0.0001.
    Quantity stock_increment = 1;
    uint32_t lead_time_days = 0;
};

/// A spool or lot received into an item.
struct SpoolSpec {
    std::string spool_id;
    std::string item_id;
    Quantity initial_weight = 0;
    std::string supplier_lot;
    google::protobuf::Timestamp expires_at;
};

/// Identity and provenance stamped onto a new transaction.
struct TransactionContext {
    std::string transaction_id;
    TransactionKind kind = TRANSACTION_ADJUSTMENT;
    std::string reference_type;
    std::string reference_id;
    std::string actor;
    std::string reason;
};

/**
 * Business logic for the item aggregate.
 *
 * Each handler validates the command against the current state and returns
 * the event to persist. Handlers never mutate state; the ledger applies the
 * returned event.
 */
class InventoryLogic {
public:
    static ItemRegistered handle_register(const ItemState& state, const ItemSpec& spec);

    /**
     * Throws ShortageError when available stock cannot cover quantity.
     * Never reserves partially.
     */
    static StockReserved handle_reserve(const ItemState& state,
                                        const std::string& allocation_id,
                                        Quantity quantity,
                                        const DemandRef& demand,
                                        const ConsumptionBasis& basis);

    /**
     * Growing a reservation is checked like a new reserve.
     */
    static ReservationResized handle_resize(const ItemState& state,
                                            const std::string& allocation_id,
                                            Quantity new_quantity);

    static ReservationReleased handle_release(const ItemState& state,
                                              const std::string& allocation_id);

    /**
     * Consume quantity_per * (good + scrap) * (1 + scrap_factor), rounded up to
     * the stock increment and capped at the reserved amount. The rest of the
     * reservation is released.
     */
    static ReservationConsumed handle_consume(const ItemState& state,
                                              const std::string& allocation_id,
                                              Quantity quantity_good,
                                              Quantity quantity_scrap,
                                              const TransactionContext& context);

    /**
     * Signed on-hand change. Rejected if on_hand would go negative.
     */
    static StockAdjusted handle_adjust(const ItemState& state,
                                       Quantity delta,
                                       const TransactionContext& context);

    static SpoolRegistered handle_register_spool(const ItemState& state,
                                                 const SpoolSpec& spec,
                                                 const TransactionContext& context);

    /**
     * Returns nothing when the weight is unchanged.
     */
    static std::optional<SpoolWeightAdjusted> handle_adjust_spool(
        const ItemState& state,
        const std::string& spool_id,
        Quantity new_weight,
        const TransactionContext& context);

    /// Ledger entry for a change to the given item.
    static InventoryTransaction make_transaction(const ItemState& state,
                                                 Quantity delta,
                                                 const TransactionContext& context,
                                                 const std::string& spool_id = "");
};

} // namespace forge::inventory
