#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "forge/registry.hpp"
#include "allocation_store.hpp"
#include "inventory_ledger.hpp"
#include "master_data.hpp"
#include "operation_logic.hpp"
#include "production_order_state.hpp"
#include "resource_board.hpp"

namespace forge::production {

/**
 * Operation state machine for production orders.
 *
 * Each order sits behind its own mutex; a call locks the order, then the
 * resource board, then item slots in the ledger. Every command returns the
 * order view after the change.
 */
class ProductionOrders {
public:
    ProductionOrders(inventory::InventoryLedger& ledger,
                     allocation::AllocationStore& allocations,
                     const allocation::MasterData& master_data,
                     ResourceBoard& resources);

    ProductionOrderView create(const ProductionOrderSpec& spec, const std::string& actor);

    /**
     * Snapshot BOM and routing, create the operations and generate material
     * requirements. Only draft orders can be released.
     */
    ProductionOrderView release(const std::string& production_order_id, const std::string& actor);

    ProductionOrderView schedule(const std::string& production_order_id, uint32_t sequence,
                                 const std::string& actor);

    /**
     * Throws BlockedError listing every short material when a requirement
     * still cannot be reserved, and ConflictError when the resource is busy.
     */
    ProductionOrderView start(const std::string& production_order_id,
                              uint32_t sequence,
                              const std::string& resource_id,
                              const std::string& operator_name,
                              const std::string& actor);

    /**
     * Consume materials for good + bad pieces, receive finished goods once the
     * last operation is done, and skip downstream operations when no good
     * pieces remain. Ledger effects are one atomic batch.
     */
    ProductionOrderView complete(const std::string& production_order_id,
                                 uint32_t sequence,
                                 const CompletionReport& report,
                                 const std::string& actor);

    /**
     * Returns the operation's unconsumed allocations to available stock.
     */
    ProductionOrderView skip(const std::string& production_order_id,
                             uint32_t sequence,
                             const std::string& reason,
                             const std::string& actor);

    ProductionOrderView hold(const std::string& production_order_id, const std::string& reason,
                             const std::string& actor);
    ProductionOrderView resume(const std::string& production_order_id, const std::string& actor);
    ProductionOrderView cancel(const std::string& production_order_id, const std::string& reason,
                               const std::string& actor);

    ProductionOrderView view(const std::string& production_order_id) const;
    ProductionOrderStatus status(const std::string& production_order_id) const;

    /// Published snapshot; throws NotFoundError for an unknown order.
    std::shared_ptr<const ProductionOrderState> order(const std::string& production_order_id) const;
    std::vector<std::shared_ptr<const ProductionOrderState>> orders() const;
    EventBook event_book(const std::string& production_order_id) const;

private:
    struct OrderSlot {
        std::mutex mutex;
        ProductionOrderState state;
        EventBook events;
        std::shared_ptr<const ProductionOrderState> published;
    };

    std::shared_ptr<OrderSlot> require_slot(const std::string& production_order_id) const;

    template<typename T>
    void append(OrderSlot& slot, const T& event, const std::string& actor);
    static void publish(OrderSlot& slot);

    ProductionOrderView view_of(const ProductionOrderState& state) const;
    inventory::ReceiptLine finished_goods(const ProductionOrderState& state) const;

    inventory::InventoryLedger& ledger_;
    allocation::AllocationStore& allocations_;
    const allocation::MasterData& master_data_;
    ResourceBoard& resources_;
    Registry<OrderSlot> orders_;
};

} // namespace forge::production
