#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "forge/registry.hpp"
#include "gl_outbox.hpp"
#include "inventory_logic.hpp"
#include "item_state.hpp"

namespace forge::inventory {

/// Business document a ledger change is booked against.
struct Reference {
    std::string type;
    std::string id;
};

/// Release of reserved stock into consumption.
struct ConsumeLine {
    std::string allocation_id;
    Quantity quantity_good = 0;
    Quantity quantity_scrap = 0;
    std::string reason;
};

/// Stock entering an item: purchase receipt or finished goods.
struct ReceiptLine {
    std::string item_id;
    Quantity quantity = 0;
    TransactionKind kind = TRANSACTION_RECEIPT;
    std::string reason;
};

/**
 * Multi-item change applied all-or-nothing.
 */
struct LedgerBatch {
    std::vector<ConsumeLine> consumes;
    std::vector<ReceiptLine> receipts;
    Reference reference;
    std::string actor;
};

struct Consumption {
    std::string allocation_id;
    std::string item_id;
    Quantity quantity_consumed = 0;
    Quantity quantity_released = 0;
    /// Empty transaction id when nothing was consumed.
    InventoryTransaction transaction;
};

struct BatchResult {
    std::vector<Consumption> consumptions;
    std::vector<InventoryTransaction> transactions;
};

/**
 * Per-item stock ledger.
 *
 * Each item is an aggregate behind its own mutex; changes touching several
 * items lock them in ascending id order. Readers load an immutable snapshot
 * published after every change and never block writers.
 */
class InventoryLedger {
public:
    InventoryLedger() = default;
    InventoryLedger(const InventoryLedger&) = delete;
    InventoryLedger& operator=(const InventoryLedger&) = delete;

    void register_item(const ItemSpec& spec, const std::string& actor);

    /// Allocation ids are ledger-wide and never reused.
    std::string next_allocation_id();

    /**
     * Reserve quantity for a demand. An empty allocation_id gets a fresh one.
     * Throws ShortageError without reserving anything when available < quantity.
     */
    Reservation reserve(const std::string& item_id,
                        Quantity quantity,
                        const DemandRef& demand,
                        const ConsumptionBasis& basis,
                        const std::string& actor,
                        const std::string& allocation_id = "");

    /// Returns the quantity given back to available.
    Quantity release(const std::string& allocation_id, const std::string& actor);

    /// Returns the previous reserved quantity.
    Quantity resize(const std::string& allocation_id, Quantity new_quantity,
                    const std::string& actor);

    Consumption consume(const ConsumeLine& line, const Reference& reference,
                        const std::string& actor);

    /**
     * Validate every line against working copies of the involved items, then
     * publish all of them. Throws before any change is visible.
     */
    BatchResult commit(const LedgerBatch& batch);

    InventoryTransaction adjust(const std::string& item_id,
                                Quantity delta,
                                const std::string& reason,
                                const std::string& actor,
                                const Reference& reference = {});

    InventoryTransaction receive(const std::string& item_id,
                                 Quantity quantity,
                                 const std::string& reason,
                                 const std::string& actor,
                                 const Reference& reference = {});

    InventoryTransaction register_spool(const SpoolSpec& spec,
                                        const std::string& reason,
                                        const std::string& actor);

    /**
     * Returns nothing when the weight is unchanged. Throws
     * ReasonRequiredError when it changes without a reason.
     */
    std::optional<InventoryTransaction> adjust_spool(const std::string& spool_id,
                                                     Quantity new_weight,
                                                     const std::string& reason,
                                                     const std::string& actor);

    /// Snapshot, or nullptr for an unknown item.
    std::shared_ptr<const ItemState> item(const std::string& item_id) const;
    /// Snapshot; throws NotFoundError for an unknown item.
    std::shared_ptr<const ItemState> require_item(const std::string& item_id) const;
    std::vector<std::shared_ptr<const ItemState>> items() const;

    std::optional<SpoolState> spool(const std::string& spool_id) const;
    std::vector<InventoryTransaction> transactions(const std::string& item_id) const;
    EventBook event_book(const std::string& item_id) const;
    /// Item holding the reservation, if any.
    std::optional<std::string> item_for_allocation(const std::string& allocation_id) const;

    GlOutbox& outbox() { return outbox_; }

private:
    struct ItemSlot {
        std::mutex mutex;
        ItemState state;
        EventBook events;
        std::vector<InventoryTransaction> transactions;
        std::shared_ptr<const ItemState> published;
    };

    struct Staging;
    class LockedItems;

    std::shared_ptr<ItemSlot> require_slot(const std::string& item_id) const;
    std::string require_allocation_item(const std::string& allocation_id) const;
    std::string require_spool_item(const std::string& spool_id) const;
    std::string next_transaction_id();
    void publish(Staging& staging, LockedItems& locked, const std::string& actor);

    Registry<ItemSlot> items_;
    GlOutbox outbox_;

    mutable std::mutex index_mutex_;
    std::unordered_map<std::string, std::string> allocation_items_;
    std::unordered_map<std::string, std::string> spool_items_;

    std::atomic<uint64_t> transaction_counter_{0};
    std::atomic<uint64_t> allocation_counter_{0};
};

} // namespace forge::inventory
