#include "production_orders.hpp"
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"

namespace forge::production {

namespace {

constexpr const char* REFERENCE_TYPE = "production_order";

} // anonymous namespace

ProductionOrders::ProductionOrders(inventory::InventoryLedger& ledger,
                                   allocation::AllocationStore& allocations,
                                   const allocation::MasterData& master_data,
                                   ResourceBoard& resources)
    : ledger_(ledger), allocations_(allocations), master_data_(master_data), resources_(resources) {}

std::shared_ptr<ProductionOrders::OrderSlot> ProductionOrders::require_slot(
    const std::string& production_order_id) const {
    auto slot = orders_.find(production_order_id);
    if (!slot) throw NotFoundError("Production order " + production_order_id + " not found");
    return slot;
}

template<typename T>
void ProductionOrders::append(OrderSlot& slot, const T& event, const std::string& actor) {
    auto any = helpers::pack(event);
    ProductionOrderState::apply_event(slot.state, any);
    helpers::append_packed(slot.events, any, actor);
}

void ProductionOrders::publish(OrderSlot& slot) {
    std::atomic_store(&slot.published, std::make_shared<const ProductionOrderState>(slot.state));
}

inventory::ReceiptLine ProductionOrders::finished_goods(const ProductionOrderState& state) const {
    return inventory::ReceiptLine{state.item_id, state.quantity_completed(),
                                  TRANSACTION_PRODUCTION_RECEIPT,
                                  "Production order " + state.production_order_id + " completed"};
}

ProductionOrderView ProductionOrders::create(const ProductionOrderSpec& spec,
                                             const std::string& actor) {
    ledger_.require_item(spec.item_id);

    auto slot = std::make_shared<OrderSlot>();
    auto event = OperationLogic::handle_create(slot->state, spec);
    slot->events = helpers::new_event_book("production_order", spec.production_order_id);
    append(*slot, event, actor);
    publish(*slot);

    if (!orders_.insert(spec.production_order_id, slot)) {
        throw InvalidArgumentError("Production order " + spec.production_order_id + " already exists");
    }
    log_info("production", "production_order_created", {
        {"production_order_id", spec.production_order_id},
        {"item_id", spec.item_id},
        {"quantity", format_quantity(spec.quantity_ordered)}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::release(const std::string& production_order_id,
                                              const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    const auto& state = slot->state;

    auto event = OperationLogic::handle_release(state, master_data_.bom_for(state.item_id),
                                                master_data_.routing_for(state.item_id));

    std::vector<allocation::BomLine> materials;
    for (const auto& line : event.materials()) {
        materials.push_back(allocation::BomLine{line.component_id(), line.quantity_per(),
                                                line.scrap_factor(), line.operation_sequence()});
    }
    DemandRef demand;
    demand.set_type(DEMAND_PRODUCTION_OPERATION);
    demand.set_production_order_id(production_order_id);
    demand.set_sales_order_id(state.sales_order_id);
    demand.set_sales_order_line_id(state.sales_order_line_id);
    *demand.mutable_needed_by() = state.due_date;

    auto requirements = allocations_.generate_requirements(
        production_order_id, materials, state.quantity_ordered, demand, actor);
    size_t pending = 0;
    for (const auto& requirement : requirements) {
        for (auto& plan : *event.mutable_operations()) {
            if (plan.sequence() == requirement.demand.operation_sequence()) {
                plan.add_allocation_ids(requirement.allocation_id);
            }
        }
        if (requirement.status == allocation::AllocationStatus::Pending) ++pending;
    }

    append(*slot, event, actor);
    publish(*slot);
    log_info("production", "production_order_released", {
        {"production_order_id", production_order_id},
        {"operations", event.operations_size()},
        {"requirements", requirements.size()},
        {"pending_requirements", pending}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::schedule(const std::string& production_order_id,
                                               uint32_t sequence,
                                               const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    auto event = OperationLogic::handle_schedule(slot->state, sequence);
    append(*slot, event, actor);
    publish(*slot);
    log_info("production", "operation_scheduled", {
        {"production_order_id", production_order_id},
        {"sequence", sequence}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::start(const std::string& production_order_id,
                                            uint32_t sequence,
                                            const std::string& resource_id,
                                            const std::string& operator_name,
                                            const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    auto event = OperationLogic::handle_start(slot->state, sequence, resource_id, operator_name);

    auto still_pending = allocations_.try_reserve_pending(production_order_id, sequence, actor);
    std::vector<BlockingIssue> issues;
    for (const auto& requirement : still_pending) {
        auto item = ledger_.item(requirement.item_id);
        Quantity available = item ? item->available() : 0;
        issues.push_back(BlockingIssue{requirement.item_id, requirement.allocation_id,
                                       requirement.quantity, available,
                                       requirement.quantity - available});
    }
    // Reservations can go short when stock is adjusted down after release.
    for (auto& issue : allocations_.short_reservations(
             allocations_.requirements_for(production_order_id, sequence))) {
        issues.push_back(std::move(issue));
    }
    if (!issues.empty()) {
        BlockedError error(production_order_id, sequence, std::move(issues));
        log_warn("production", "operation_blocked", {
            {"error", error.what()},
            {"production_order_id", production_order_id},
            {"sequence", sequence},
            {"short_materials", error.issues().size()}
        });
        throw error;
    }

    resources_.claim(resource_id, ResourceClaim{production_order_id, sequence});

    append(*slot, event, actor);
    publish(*slot);
    log_info("production", "operation_started", {
        {"production_order_id", production_order_id},
        {"sequence", sequence},
        {"resource_id", resource_id},
        {"operator", operator_name}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::complete(const std::string& production_order_id,
                                               uint32_t sequence,
                                               const CompletionReport& report,
                                               const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    auto event = OperationLogic::handle_complete(slot->state, sequence, report);

    // Project the order forward to decide on cascades and the receipt.
    ProductionOrderState next = slot->state;
    ProductionOrderState::apply_event(next, helpers::pack(event));
    std::vector<OperationSkipped> skips;
    if (report.quantity_good == 0) {
        skips = OperationLogic::cascade_skips(next, sequence);
        for (const auto& skip : skips) {
            ProductionOrderState::apply_event(next, helpers::pack(skip));
        }
    }
    bool finished = next.all_operations_terminal();
    event.set_final_operation(finished);

    inventory::LedgerBatch batch;
    batch.consumes = allocations_.consumption_lines(production_order_id, sequence,
                                                    report.quantity_good, report.quantity_bad);
    if (finished && next.quantity_completed() > 0) {
        batch.receipts.push_back(finished_goods(next));
    }
    batch.reference = inventory::Reference{REFERENCE_TYPE, production_order_id};
    batch.actor = actor;
    auto result = ledger_.commit(batch);

    allocations_.consume_operation(production_order_id, result.consumptions);
    for (auto& skip : skips) {
        skip.set_quantity_released(
            allocations_.release_operation(production_order_id, skip.sequence(), actor));
    }
    const auto* op = slot->state.find_operation(sequence);
    resources_.free(op->resource_id, ResourceClaim{production_order_id, sequence});

    append(*slot, event, actor);
    for (const auto& skip : skips) {
        append(*slot, skip, actor);
        log_info("production", "operation_auto_skipped", {
            {"production_order_id", production_order_id},
            {"sequence", skip.sequence()},
            {"quantity_released", format_quantity(skip.quantity_released())}
        });
    }
    publish(*slot);

    log_info("production", "operation_completed", {
        {"production_order_id", production_order_id},
        {"sequence", sequence},
        {"good", format_quantity(report.quantity_good)},
        {"bad", format_quantity(report.quantity_bad)},
        {"transactions", result.transactions.size()},
        {"final", finished}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::skip(const std::string& production_order_id,
                                           uint32_t sequence,
                                           const std::string& reason,
                                           const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    auto event = OperationLogic::handle_skip(slot->state, sequence, reason);
    const auto* op = slot->state.find_operation(sequence);
    bool was_running = op->status == OPERATION_RUNNING;
    std::string resource_id = op->resource_id;

    ProductionOrderState next = slot->state;
    ProductionOrderState::apply_event(next, helpers::pack(event));
    if (next.all_operations_terminal() && next.quantity_completed() > 0) {
        inventory::LedgerBatch batch;
        batch.receipts.push_back(finished_goods(next));
        batch.reference = inventory::Reference{REFERENCE_TYPE, production_order_id};
        batch.actor = actor;
        ledger_.commit(batch);
    }

    event.set_quantity_released(allocations_.release_operation(production_order_id, sequence, actor));
    if (was_running) resources_.free(resource_id, ResourceClaim{production_order_id, sequence});

    append(*slot, event, actor);
    publish(*slot);
    log_info("production", "operation_skipped", {
        {"production_order_id", production_order_id},
        {"sequence", sequence},
        {"reason", reason},
        {"quantity_released", format_quantity(event.quantity_released())}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::hold(const std::string& production_order_id,
                                           const std::string& reason,
                                           const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    auto event = OperationLogic::handle_hold(slot->state, reason);
    append(*slot, event, actor);
    publish(*slot);
    log_info("production", "production_order_held", {
        {"production_order_id", production_order_id},
        {"reason", reason}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::resume(const std::string& production_order_id,
                                             const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    auto event = OperationLogic::handle_resume(slot->state);
    append(*slot, event, actor);
    publish(*slot);
    log_info("production", "production_order_resumed", {{"production_order_id", production_order_id}});
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::cancel(const std::string& production_order_id,
                                             const std::string& reason,
                                             const std::string& actor) {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);

    auto event = OperationLogic::handle_cancel(slot->state, reason);
    event.set_quantity_released(allocations_.release_order(production_order_id, actor));
    for (const auto& op : slot->state.operations) {
        if (op.status == OPERATION_RUNNING) {
            resources_.free(op.resource_id, ResourceClaim{production_order_id, op.sequence});
        }
    }

    append(*slot, event, actor);
    publish(*slot);
    log_info("production", "production_order_cancelled", {
        {"production_order_id", production_order_id},
        {"reason", reason},
        {"quantity_released", format_quantity(event.quantity_released())}
    });
    return view_of(slot->state);
}

ProductionOrderView ProductionOrders::view_of(const ProductionOrderState& state) const {
    bool has_pending = false;
    for (const auto& requirement : allocations_.requirements_for(state.production_order_id)) {
        if (requirement.status == allocation::AllocationStatus::Pending) has_pending = true;
    }

    ProductionOrderView view;
    view.set_production_order_id(state.production_order_id);
    view.set_item_id(state.item_id);
    view.set_quantity_ordered(state.quantity_ordered);
    view.set_quantity_completed(state.quantity_completed());
    view.set_quantity_scrapped(state.quantity_scrapped());
    view.set_status(derive_status(state, has_pending));
    view.set_sales_order_id(state.sales_order_id);
    view.set_sales_order_line_id(state.sales_order_line_id);
    for (const auto& op : state.operations) {
        auto* out = view.add_operations();
        out->set_sequence(op.sequence);
        out->set_work_center(op.work_center);
        out->set_resource_id(op.resource_id);
        out->set_status(op.status);
        out->set_planned_setup_minutes(op.planned_setup_minutes);
        out->set_planned_run_minutes(op.planned_run_minutes);
        out->set_actual_run_minutes(op.actual_run_minutes);
        out->set_quantity_completed(op.quantity_completed);
        out->set_quantity_scrapped(op.quantity_scrapped);
        out->set_scrap_reason(op.scrap_reason);
        out->set_notes(op.notes);
        out->set_operator_name(op.operator_name);
        for (const auto& id : op.allocation_ids) out->add_allocation_ids(id);
    }
    return view;
}

ProductionOrderView ProductionOrders::view(const std::string& production_order_id) const {
    return view_of(*order(production_order_id));
}

ProductionOrderStatus ProductionOrders::status(const std::string& production_order_id) const {
    return view(production_order_id).status();
}

std::shared_ptr<const ProductionOrderState> ProductionOrders::order(
    const std::string& production_order_id) const {
    return std::atomic_load(&require_slot(production_order_id)->published);
}

std::vector<std::shared_ptr<const ProductionOrderState>> ProductionOrders::orders() const {
    std::vector<std::shared_ptr<const ProductionOrderState>> result;
    auto map = orders_.snapshot();
    for (const auto& entry : *map) {
        result.push_back(std::atomic_load(&entry.second->published));
    }
    return result;
}

EventBook ProductionOrders::event_book(const std::string& production_order_id) const {
    auto slot = require_slot(production_order_id);
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->events;
}

} // namespace forge::production
