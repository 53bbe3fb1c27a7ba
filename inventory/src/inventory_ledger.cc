#include "inventory_ledger.hpp"
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"
#include "forge/validation.hpp"
#include <cstdio>
#include <set>

namespace forge::inventory {

using namespace forge::validation;

namespace {

std::string format_id(const char* prefix, uint64_t value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%s-%08llu", prefix,
                  static_cast<unsigned long long>(value));
    return buffer;
}

} // anonymous namespace

/**
 * Holds the mutexes of a set of items, acquired in ascending id order.
 */
class InventoryLedger::LockedItems {
public:
    LockedItems(const InventoryLedger& ledger, const std::set<std::string>& item_ids) {
        for (const auto& id : item_ids) {
            slots_.emplace(id, ledger.require_slot(id));
        }
        for (auto& entry : slots_) {
            locks_.emplace_back(entry.second->mutex);
        }
    }

    ItemSlot& slot(const std::string& item_id) { return *slots_.at(item_id); }
    const std::map<std::string, std::shared_ptr<ItemSlot>>& slots() const { return slots_; }

private:
    std::map<std::string, std::shared_ptr<ItemSlot>> slots_;
    std::vector<std::unique_lock<std::mutex>> locks_;
};

/**
 * Working copies of locked items plus everything a change will publish.
 */
struct InventoryLedger::Staging {
    explicit Staging(LockedItems& locked) {
        for (const auto& entry : locked.slots()) {
            working.emplace(entry.first, entry.second->state);
        }
    }

    ItemState& state(const std::string& item_id) { return working.at(item_id); }

    template<typename T>
    void stage(const std::string& item_id, const T& event) {
        auto any = helpers::pack(event);
        ItemState::apply_event(working.at(item_id), any);
        events[item_id].push_back(std::move(any));
    }

    void record(const InventoryTransaction& transaction) {
        if (!transaction.transaction_id().empty()) transactions.push_back(transaction);
    }

    std::map<std::string, ItemState> working;
    std::map<std::string, std::vector<google::protobuf::Any>> events;
    std::vector<InventoryTransaction> transactions;
    std::vector<std::pair<std::string, std::string>> opened_allocations;
    std::vector<std::string> closed_allocations;
};

std::shared_ptr<InventoryLedger::ItemSlot> InventoryLedger::require_slot(
    const std::string& item_id) const {
    auto slot = items_.find(item_id);
    if (!slot) throw NotFoundError("Item " + item_id + " not found");
    return slot;
}

std::string InventoryLedger::require_allocation_item(const std::string& allocation_id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = allocation_items_.find(allocation_id);
    if (it == allocation_items_.end()) {
        throw NotFoundError("Reservation " + allocation_id + " not found");
    }
    return it->second;
}

std::string InventoryLedger::require_spool_item(const std::string& spool_id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = spool_items_.find(spool_id);
    if (it == spool_items_.end()) throw NotFoundError("Spool " + spool_id + " not found");
    return it->second;
}

std::string InventoryLedger::next_transaction_id() {
    return format_id("TXN", ++transaction_counter_);
}

std::string InventoryLedger::next_allocation_id() {
    return format_id("ALLOC", ++allocation_counter_);
}

void InventoryLedger::publish(Staging& staging, LockedItems& locked, const std::string& actor) {
    for (auto& entry : staging.events) {
        auto& slot = locked.slot(entry.first);
        slot.state = std::move(staging.working.at(entry.first));
        for (const auto& event : entry.second) {
            helpers::append_packed(slot.events, event, actor);
        }
        std::atomic_store(&slot.published, std::make_shared<const ItemState>(slot.state));
    }
    for (const auto& transaction : staging.transactions) {
        locked.slot(transaction.item_id()).transactions.push_back(transaction);
    }

    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        for (const auto& opened : staging.opened_allocations) {
            allocation_items_[opened.first] = opened.second;
        }
        for (const auto& closed : staging.closed_allocations) {
            allocation_items_.erase(closed);
        }
    }

    for (const auto& transaction : staging.transactions) {
        outbox_.enqueue(outbox_.posting_for(transaction));
    }
}

void InventoryLedger::register_item(const ItemSpec& spec, const std::string& actor) {
    auto slot = std::make_shared<ItemSlot>();
    auto event = InventoryLogic::handle_register(slot->state, spec);
    auto any = helpers::pack(event);
    ItemState::apply_event(slot->state, any);
    slot->events = helpers::new_event_book("item", spec.item_id);
    helpers::append_packed(slot->events, any, actor);
    slot->published = std::make_shared<const ItemState>(slot->state);

    if (!items_.insert(spec.item_id, slot)) {
        throw InvalidArgumentError("Item " + spec.item_id + " already exists");
    }
    log_info("inventory", "item_registered", {
        {"item_id", spec.item_id},
        {"unit", spec.unit},
        {"stock_increment", format_quantity(spec.stock_increment)}
    });
}

Reservation InventoryLedger::reserve(const std::string& item_id,
                                     Quantity quantity,
                                     const DemandRef& demand,
                                     const ConsumptionBasis& basis,
                                     const std::string& actor,
                                     const std::string& allocation_id) {
    std::string id = allocation_id.empty() ? next_allocation_id() : allocation_id;

    LockedItems locked(*this, {item_id});
    Staging staging(locked);
    auto event = InventoryLogic::handle_reserve(staging.state(item_id), id, quantity, demand, basis);
    staging.stage(item_id, event);
    staging.opened_allocations.emplace_back(id, item_id);
    publish(staging, locked, actor);

    log_info("inventory", "stock_reserved", {
        {"item_id", item_id},
        {"allocation_id", id},
        {"quantity", format_quantity(quantity)},
        {"available_after", format_quantity(event.available_after())}
    });
    return Reservation{id, quantity, demand, basis};
}

Quantity InventoryLedger::release(const std::string& allocation_id, const std::string& actor) {
    std::string item_id = require_allocation_item(allocation_id);

    LockedItems locked(*this, {item_id});
    Staging staging(locked);
    auto event = InventoryLogic::handle_release(staging.state(item_id), allocation_id);
    staging.stage(item_id, event);
    staging.closed_allocations.push_back(allocation_id);
    publish(staging, locked, actor);

    log_info("inventory", "reservation_released", {
        {"item_id", item_id},
        {"allocation_id", allocation_id},
        {"quantity", format_quantity(event.quantity_released())}
    });
    return event.quantity_released();
}

Quantity InventoryLedger::resize(const std::string& allocation_id, Quantity new_quantity,
                                 const std::string& actor) {
    std::string item_id = require_allocation_item(allocation_id);

    LockedItems locked(*this, {item_id});
    Staging staging(locked);
    auto event = InventoryLogic::handle_resize(staging.state(item_id), allocation_id, new_quantity);
    staging.stage(item_id, event);
    publish(staging, locked, actor);

    log_info("inventory", "reservation_resized", {
        {"item_id", item_id},
        {"allocation_id", allocation_id},
        {"from", format_quantity(event.previous_quantity())},
        {"to", format_quantity(new_quantity)}
    });
    return event.previous_quantity();
}

Consumption InventoryLedger::consume(const ConsumeLine& line, const Reference& reference,
                                     const std::string& actor) {
    LedgerBatch batch;
    batch.consumes.push_back(line);
    batch.reference = reference;
    batch.actor = actor;
    return commit(batch).consumptions.front();
}

BatchResult InventoryLedger::commit(const LedgerBatch& batch) {
    std::set<std::string> item_ids;
    std::vector<std::string> consume_items;
    for (const auto& line : batch.consumes) {
        consume_items.push_back(require_allocation_item(line.allocation_id));
        item_ids.insert(consume_items.back());
    }
    for (const auto& line : batch.receipts) {
        require_not_empty(line.item_id, "item_id");
        require_positive(line.quantity, "quantity");
        require_reason(line.reason);
        item_ids.insert(line.item_id);
    }
    if (item_ids.empty()) return {};

    LockedItems locked(*this, item_ids);
    Staging staging(locked);
    BatchResult result;

    for (size_t i = 0; i < batch.consumes.size(); ++i) {
        const auto& line = batch.consumes[i];
        const auto& item_id = consume_items[i];
        TransactionContext context{next_transaction_id(), TRANSACTION_CONSUMPTION,
                                   batch.reference.type, batch.reference.id, batch.actor,
                                   line.reason.empty()
                                       ? "Consumed for " + batch.reference.type + " " + batch.reference.id
                                       : line.reason};
        auto event = InventoryLogic::handle_consume(staging.state(item_id), line.allocation_id,
                                                    line.quantity_good, line.quantity_scrap,
                                                    context);
        staging.stage(item_id, event);
        staging.record(event.transaction());
        staging.closed_allocations.push_back(line.allocation_id);
        result.consumptions.push_back(Consumption{line.allocation_id, item_id,
                                                  event.quantity_consumed(),
                                                  event.quantity_released(),
                                                  event.transaction()});
    }

    for (const auto& line : batch.receipts) {
        TransactionContext context{next_transaction_id(), line.kind, batch.reference.type,
                                   batch.reference.id, batch.actor, line.reason};
        auto event = InventoryLogic::handle_adjust(staging.state(line.item_id), line.quantity, context);
        staging.stage(line.item_id, event);
        staging.record(event.transaction());
    }

    result.transactions = staging.transactions;
    publish(staging, locked, batch.actor);

    for (const auto& transaction : result.transactions) {
        log_info("inventory", "transaction_posted", {
            {"transaction_id", transaction.transaction_id()},
            {"item_id", transaction.item_id()},
            {"kind", TransactionKind_Name(transaction.kind())},
            {"quantity_delta", format_quantity(transaction.quantity_delta())},
            {"reference", batch.reference.type + ":" + batch.reference.id}
        });
    }
    return result;
}

InventoryTransaction InventoryLedger::adjust(const std::string& item_id,
                                             Quantity delta,
                                             const std::string& reason,
                                             const std::string& actor,
                                             const Reference& reference) {
    require_reason(reason);

    LockedItems locked(*this, {item_id});
    Staging staging(locked);
    TransactionContext context{next_transaction_id(), TRANSACTION_ADJUSTMENT,
                               reference.type, reference.id, actor, reason};
    auto event = InventoryLogic::handle_adjust(staging.state(item_id), delta, context);
    staging.stage(item_id, event);
    staging.record(event.transaction());
    publish(staging, locked, actor);

    log_info("inventory", "stock_adjusted", {
        {"item_id", item_id},
        {"transaction_id", event.transaction().transaction_id()},
        {"delta", format_quantity(delta)},
        {"reason", reason}
    });
    return event.transaction();
}

InventoryTransaction InventoryLedger::receive(const std::string& item_id,
                                              Quantity quantity,
                                              const std::string& reason,
                                              const std::string& actor,
                                              const Reference& reference) {
    LedgerBatch batch;
    batch.receipts.push_back(ReceiptLine{item_id, quantity, TRANSACTION_RECEIPT, reason});
    batch.reference = reference;
    batch.actor = actor;
    return commit(batch).transactions.front();
}

InventoryTransaction InventoryLedger::register_spool(const SpoolSpec& spec,
                                                     const std::string& reason,
                                                     const std::string& actor) {
    require_reason(reason);
    require_not_empty(spec.spool_id, "spool_id");
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        if (!spool_items_.emplace(spec.spool_id, spec.item_id).second) {
            throw InvalidArgumentError("Spool " + spec.spool_id + " already exists");
        }
    }

    try {
        LockedItems locked(*this, {spec.item_id});
        Staging staging(locked);
        TransactionContext context{next_transaction_id(), TRANSACTION_RECEIPT,
                                   "spool", spec.spool_id, actor, reason};
        auto event = InventoryLogic::handle_register_spool(staging.state(spec.item_id), spec, context);
        staging.stage(spec.item_id, event);
        if (event.transaction().quantity_delta() != 0) staging.record(event.transaction());
        publish(staging, locked, actor);

        log_info("inventory", "spool_registered", {
            {"item_id", spec.item_id},
            {"spool_id", spec.spool_id},
            {"supplier_lot", spec.supplier_lot},
            {"weight", format_quantity(spec.initial_weight)}
        });
        return event.transaction();
    } catch (...) {
        std::lock_guard<std::mutex> lock(index_mutex_);
        spool_items_.erase(spec.spool_id);
        throw;
    }
}

std::optional<InventoryTransaction> InventoryLedger::adjust_spool(const std::string& spool_id,
                                                                  Quantity new_weight,
                                                                  const std::string& reason,
                                                                  const std::string& actor) {
    std::string item_id = require_spool_item(spool_id);

    LockedItems locked(*this, {item_id});
    Staging staging(locked);
    TransactionContext context{next_transaction_id(), TRANSACTION_SPOOL_ADJUSTMENT,
                               "spool", spool_id, actor, reason};
    auto event = InventoryLogic::handle_adjust_spool(staging.state(item_id), spool_id,
                                                     new_weight, context);
    if (!event) {
        log_debug("inventory", "spool_weight_unchanged", {{"spool_id", spool_id}});
        return std::nullopt;
    }
    staging.stage(item_id, *event);
    staging.record(event->transaction());
    publish(staging, locked, actor);

    log_info("inventory", "spool_weight_adjusted", {
        {"item_id", item_id},
        {"spool_id", spool_id},
        {"from", format_quantity(event->previous_weight())},
        {"to", format_quantity(new_weight)},
        {"reason", reason}
    });
    return event->transaction();
}

std::shared_ptr<const ItemState> InventoryLedger::item(const std::string& item_id) const {
    auto slot = items_.find(item_id);
    if (!slot) return nullptr;
    return std::atomic_load(&slot->published);
}

std::shared_ptr<const ItemState> InventoryLedger::require_item(const std::string& item_id) const {
    return std::atomic_load(&require_slot(item_id)->published);
}

std::vector<std::shared_ptr<const ItemState>> InventoryLedger::items() const {
    std::vector<std::shared_ptr<const ItemState>> result;
    auto map = items_.snapshot();
    for (const auto& entry : *map) {
        result.push_back(std::atomic_load(&entry.second->published));
    }
    return result;
}

std::optional<SpoolState> InventoryLedger::spool(const std::string& spool_id) const {
    std::string item_id;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = spool_items_.find(spool_id);
        if (it == spool_items_.end()) return std::nullopt;
        item_id = it->second;
    }
    auto state = item(item_id);
    if (!state) return std::nullopt;
    auto it = state->spools.find(spool_id);
    if (it == state->spools.end()) return std::nullopt;
    return it->second;
}

std::vector<InventoryTransaction> InventoryLedger::transactions(const std::string& item_id) const {
    auto slot = require_slot(item_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->transactions;
}

EventBook InventoryLedger::event_book(const std::string& item_id) const {
    auto slot = require_slot(item_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->events;
}

std::optional<std::string> InventoryLedger::item_for_allocation(
    const std::string& allocation_id) const {
    std::lock_guard<std::mutex> lock(index_mutex_);
    auto it = allocation_items_.find(allocation_id);
    if (it == allocation_items_.end()) return std::nullopt;
    return it->second;
}

} // namespace forge::inventory
