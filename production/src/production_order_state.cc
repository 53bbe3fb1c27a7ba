#include "production_order_state.hpp"

namespace forge::production {

const char* operation_status_name(OperationStatus status) {
    switch (status) {
        case OPERATION_PENDING: return "pending";
        case OPERATION_QUEUED: return "queued";
        case OPERATION_RUNNING: return "running";
        case OPERATION_COMPLETE: return "complete";
        case OPERATION_SKIPPED: return "skipped";
        default: return "unspecified";
    }
}

const char* production_status_name(ProductionOrderStatus status) {
    switch (status) {
        case PRODUCTION_DRAFT: return "draft";
        case PRODUCTION_RELEASED: return "released";
        case PRODUCTION_IN_PROGRESS: return "in_progress";
        case PRODUCTION_COMPLETE: return "complete";
        case PRODUCTION_SHORT: return "short";
        case PRODUCTION_ON_HOLD: return "on_hold";
        case PRODUCTION_CANCELLED: return "cancelled";
        default: return "unspecified";
    }
}

const OperationState* ProductionOrderState::find_operation(uint32_t sequence) const {
    for (const auto& op : operations) {
        if (op.sequence == sequence) return &op;
    }
    return nullptr;
}

OperationState* ProductionOrderState::find_operation(uint32_t sequence) {
    for (auto& op : operations) {
        if (op.sequence == sequence) return &op;
    }
    return nullptr;
}

const OperationState* ProductionOrderState::previous_operation(uint32_t sequence) const {
    const OperationState* previous = nullptr;
    for (const auto& op : operations) {
        if (op.sequence == sequence) return previous;
        previous = &op;
    }
    return nullptr;
}

bool ProductionOrderState::all_operations_terminal() const {
    if (operations.empty()) return false;
    for (const auto& op : operations) {
        if (!op.is_terminal()) return false;
    }
    return true;
}

Quantity ProductionOrderState::quantity_completed() const {
    for (auto it = operations.rbegin(); it != operations.rend(); ++it) {
        if (it->status == OPERATION_COMPLETE) return it->quantity_completed;
    }
    return 0;
}

Quantity ProductionOrderState::quantity_scrapped() const {
    Quantity total = 0;
    for (const auto& op : operations) total += op.quantity_scrapped;
    return total;
}

ProductionOrderStatus derive_status(const ProductionOrderState& state,
                                    bool has_pending_requirements) {
    if (state.cancelled) return PRODUCTION_CANCELLED;
    if (state.on_hold) return PRODUCTION_ON_HOLD;
    if (!state.released) return PRODUCTION_DRAFT;

    bool untouched = true;
    for (const auto& op : state.operations) {
        if (op.status != OPERATION_PENDING && op.status != OPERATION_QUEUED) {
            untouched = false;
            break;
        }
    }
    if (untouched) return has_pending_requirements ? PRODUCTION_SHORT : PRODUCTION_RELEASED;

    if (state.all_operations_terminal()) {
        return state.quantity_completed() >= state.quantity_ordered ? PRODUCTION_COMPLETE
                                                                    : PRODUCTION_SHORT;
    }
    return PRODUCTION_IN_PROGRESS;
}

ProductionOrderState ProductionOrderState::from_event_book(const EventBook& event_book) {
    ProductionOrderState state;
    for (const auto& page : event_book.pages()) {
        if (page.has_event()) {
            apply_event(state, page.event());
        }
    }
    return state;
}

void ProductionOrderState::apply_event(ProductionOrderState& state,
                                       const google::protobuf::Any& event_any) {
    if (event_any.Is<ProductionOrderCreated>()) {
        ProductionOrderCreated event;
        if (event_any.UnpackTo(&event)) {
            state.production_order_id = event.production_order_id();
            state.item_id = event.item_id();
            state.quantity_ordered = event.quantity_ordered();
            state.sales_order_id = event.sales_order_id();
            state.sales_order_line_id = event.sales_order_line_id();
            state.due_date = event.due_date();
        }
    } else if (event_any.Is<ProductionOrderReleased>()) {
        ProductionOrderReleased event;
        if (event_any.UnpackTo(&event)) {
            state.released = true;
            state.materials.assign(event.materials().begin(), event.materials().end());
            state.operations.clear();
            for (const auto& plan : event.operations()) {
                OperationState op;
                op.sequence = plan.sequence();
                op.work_center = plan.work_center();
                op.planned_setup_minutes = plan.setup_minutes();
                op.planned_run_minutes = plan.run_minutes();
                op.allocation_ids.assign(plan.allocation_ids().begin(), plan.allocation_ids().end());
                state.operations.push_back(std::move(op));
            }
        }
    } else if (event_any.Is<OperationScheduled>()) {
        OperationScheduled event;
        if (event_any.UnpackTo(&event)) {
            if (auto* op = state.find_operation(event.sequence())) op->status = OPERATION_QUEUED;
        }
    } else if (event_any.Is<OperationStarted>()) {
        OperationStarted event;
        if (event_any.UnpackTo(&event)) {
            if (auto* op = state.find_operation(event.sequence())) {
                op->status = OPERATION_RUNNING;
                op->resource_id = event.resource_id();
                op->operator_name = event.operator_name();
                op->started_at = event.started_at();
            }
        }
    } else if (event_any.Is<OperationCompleted>()) {
        OperationCompleted event;
        if (event_any.UnpackTo(&event)) {
            if (auto* op = state.find_operation(event.sequence())) {
                op->status = OPERATION_COMPLETE;
                op->quantity_completed = event.quantity_completed();
                op->quantity_scrapped = event.quantity_scrapped();
                op->scrap_reason = event.scrap_reason();
                op->actual_run_minutes = event.actual_run_minutes();
                op->completed_at = event.completed_at();
            }
        }
    } else if (event_any.Is<OperationSkipped>()) {
        OperationSkipped event;
        if (event_any.UnpackTo(&event)) {
            if (auto* op = state.find_operation(event.sequence())) {
                op->status = OPERATION_SKIPPED;
                op->notes = event.notes();
            }
        }
    } else if (event_any.Is<ProductionOrderHeld>()) {
        ProductionOrderHeld event;
        if (event_any.UnpackTo(&event)) {
            state.on_hold = true;
            state.hold_reason = event.reason();
        }
    } else if (event_any.Is<ProductionOrderResumed>()) {
        state.on_hold = false;
        state.hold_reason.clear();
    } else if (event_any.Is<ProductionOrderCancelled>()) {
        state.cancelled = true;
        state.on_hold = false;
    }
}

} // namespace forge::production
