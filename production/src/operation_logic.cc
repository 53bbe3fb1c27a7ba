#include "operation_logic.hpp"
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"
#include "forge/validation.hpp"
#include <algorithm>
#include <set>

namespace forge::production {

using namespace forge::validation;

const char* operation_action_name(OperationAction action) {
    switch (action) {
        case OperationAction::Schedule: return "schedule";
        case OperationAction::Start: return "start";
        case OperationAction::Complete: return "complete";
        case OperationAction::Skip: return "skip";
    }
    return "unknown";
}

std::optional<OperationStatus> next_status(OperationStatus from, OperationAction action) {
    switch (from) {
        case OPERATION_PENDING:
            switch (action) {
                case OperationAction::Schedule: return OPERATION_QUEUED;
                case OperationAction::Start: return OPERATION_RUNNING;
                case OperationAction::Skip: return OPERATION_SKIPPED;
                case OperationAction::Complete: return std::nullopt;
            }
            break;
        case OPERATION_QUEUED:
            switch (action) {
                case OperationAction::Start: return OPERATION_RUNNING;
                case OperationAction::Skip: return OPERATION_SKIPPED;
                case OperationAction::Schedule:
                case OperationAction::Complete: return std::nullopt;
            }
            break;
        case OPERATION_RUNNING:
            switch (action) {
                case OperationAction::Complete: return OPERATION_COMPLETE;
                case OperationAction::Skip: return OPERATION_SKIPPED;
                case OperationAction::Schedule:
                case OperationAction::Start: return std::nullopt;
            }
            break;
        case OPERATION_COMPLETE:
        case OPERATION_SKIPPED:
        default:
            return std::nullopt;
    }
    return std::nullopt;
}

namespace {

std::string order_entity(const ProductionOrderState& state) {
    return "production order " + state.production_order_id;
}

[[noreturn]] void reject(const std::string& entity, const std::string& from,
                         const std::string& action) {
    InvalidTransitionError error(entity, from, action);
    log_error("production", "invalid_transition", {
        {"error", error.what()},
        {"entity", entity},
        {"from", from},
        {"action", action}
    });
    throw error;
}

void require_order(const ProductionOrderState& state) {
    if (!state.exists()) throw NotFoundError("Production order does not exist");
}

/// Released, not held, not cancelled.
void require_active(const ProductionOrderState& state, const std::string& action) {
    require_order(state);
    if (state.cancelled) reject(order_entity(state), "cancelled", action);
    if (state.on_hold) reject(order_entity(state), "on_hold", action);
    if (!state.released) reject(order_entity(state), "draft", action);
}

const OperationState& require_operation(const ProductionOrderState& state, uint32_t sequence) {
    const auto* op = state.find_operation(sequence);
    if (!op) {
        throw NotFoundError("Operation " + std::to_string(sequence) + " not found on " +
                            state.production_order_id);
    }
    return *op;
}

void require_transition(const ProductionOrderState& state, const OperationState& op,
                        OperationAction action) {
    if (!next_status(op.status, action)) {
        reject("operation " + std::to_string(op.sequence) + " of " + state.production_order_id,
               operation_status_name(op.status), operation_action_name(action));
    }
}

void require_previous_terminal(const ProductionOrderState& state, const OperationState& op,
                               OperationAction action) {
    const auto* previous = state.previous_operation(op.sequence);
    if (previous && !previous->is_terminal()) {
        throw InvalidTransitionError(
            "operation " + std::to_string(op.sequence) + " of " + state.production_order_id +
                " (previous operation " + std::to_string(previous->sequence) + " is " +
                operation_status_name(previous->status) + ")",
            operation_status_name(op.status), operation_action_name(action));
    }
}

} // anonymous namespace

ProductionOrderCreated OperationLogic::handle_create(const ProductionOrderState& state,
                                                     const ProductionOrderSpec& spec) {
    if (state.exists()) {
        throw InvalidArgumentError("Production order " + spec.production_order_id + " already exists");
    }
    require_not_empty(spec.production_order_id, "production_order_id");
    require_not_empty(spec.item_id, "item_id");
    require_positive(spec.quantity_ordered, "quantity_ordered");

    ProductionOrderCreated event;
    event.set_production_order_id(spec.production_order_id);
    event.set_item_id(spec.item_id);
    event.set_quantity_ordered(spec.quantity_ordered);
    *event.mutable_due_date() = spec.due_date;
    event.set_sales_order_id(spec.sales_order_id);
    event.set_sales_order_line_id(spec.sales_order_line_id);
    return event;
}

ProductionOrderReleased OperationLogic::handle_release(
    const ProductionOrderState& state,
    const std::vector<allocation::BomLine>& bom,
    const std::vector<allocation::RoutingStep>& routing) {
    require_order(state);
    if (state.cancelled) reject(order_entity(state), "cancelled", "release");
    if (state.released) reject(order_entity(state), "released", "release");
    if (routing.empty()) {
        throw InvalidArgumentError("Item " + state.item_id + " has no routing");
    }

    auto steps = routing;
    std::sort(steps.begin(), steps.end(), [](const auto& a, const auto& b) {
        return a.sequence < b.sequence;
    });
    std::set<uint32_t> sequences;
    for (const auto& step : steps) {
        require_positive(step.sequence, "routing sequence");
        if (!sequences.insert(step.sequence).second) {
            throw InvalidArgumentError("Duplicate routing sequence " + std::to_string(step.sequence));
        }
    }

    ProductionOrderReleased event;
    for (const auto& step : steps) {
        auto* plan = event.add_operations();
        plan->set_sequence(step.sequence);
        plan->set_work_center(step.work_center);
        plan->set_setup_minutes(step.setup_minutes);
        plan->set_run_minutes(step.run_minutes);
    }
    for (const auto& line : bom) {
        uint32_t sequence = line.operation_sequence == 0 ? steps.front().sequence
                                                         : line.operation_sequence;
        if (sequences.count(sequence) == 0) {
            throw InvalidArgumentError("Material " + line.component_id +
                                       " references unknown operation " + std::to_string(sequence));
        }
        auto* material = event.add_materials();
        material->set_component_id(line.component_id);
        material->set_quantity_per(line.quantity_per);
        material->set_scrap_factor(line.scrap_factor);
        material->set_operation_sequence(sequence);
    }
    return event;
}

OperationScheduled OperationLogic::handle_schedule(const ProductionOrderState& state,
                                                   uint32_t sequence) {
    require_active(state, "schedule");
    const auto& op = require_operation(state, sequence);
    require_transition(state, op, OperationAction::Schedule);
    require_previous_terminal(state, op, OperationAction::Schedule);

    OperationScheduled event;
    event.set_sequence(sequence);
    return event;
}

OperationStarted OperationLogic::handle_start(const ProductionOrderState& state,
                                              uint32_t sequence,
                                              const std::string& resource_id,
                                              const std::string& operator_name) {
    require_active(state, "start");
    const auto& op = require_operation(state, sequence);
    require_transition(state, op, OperationAction::Start);
    require_previous_terminal(state, op, OperationAction::Start);

    OperationStarted event;
    event.set_sequence(sequence);
    event.set_resource_id(resource_id);
    event.set_operator_name(operator_name);
    *event.mutable_started_at() = helpers::now();
    return event;
}

Quantity OperationLogic::planned_quantity(const ProductionOrderState& state, uint32_t sequence) {
    const OperationState* previous = state.previous_operation(sequence);
    while (previous) {
        if (previous->status == OPERATION_COMPLETE) return previous->quantity_completed;
        if (previous->status != OPERATION_SKIPPED) return 0;
        previous = state.previous_operation(previous->sequence);
    }
    return state.quantity_ordered;
}

OperationCompleted OperationLogic::handle_complete(const ProductionOrderState& state,
                                                   uint32_t sequence,
                                                   const CompletionReport& report) {
    require_active(state, "complete");
    const auto& op = require_operation(state, sequence);
    require_transition(state, op, OperationAction::Complete);
    require_non_negative(report.quantity_good, "quantity_good");
    require_non_negative(report.quantity_bad, "quantity_bad");
    if (report.actual_run_minutes) {
        require_non_negative(*report.actual_run_minutes, "actual_run_minutes");
    }

    Quantity planned = planned_quantity(state, sequence);
    Quantity total = report.quantity_good + report.quantity_bad;
    if (total > planned) {
        throw InvalidArgumentError("Total quantity " + format_quantity(total) +
                                   " exceeds maximum allowed " + format_quantity(planned) +
                                   " for operation " + std::to_string(sequence) + " of " +
                                   state.production_order_id);
    }
    if (total == 0 && planned > 0) {
        throw InvalidArgumentError("Operation " + std::to_string(sequence) + " of " +
                                   state.production_order_id + " must report at least one piece");
    }
    if (report.quantity_bad > 0) require_reason(report.scrap_reason, "scrap_reason");

    auto completed_at = helpers::now();
    int64_t run_minutes = 0;
    if (report.actual_run_minutes) {
        run_minutes = *report.actual_run_minutes;
    } else if (op.started_at.seconds() > 0) {
        run_minutes = std::max<int64_t>(0, (completed_at.seconds() - op.started_at.seconds()) / 60);
    }

    OperationCompleted event;
    event.set_sequence(sequence);
    event.set_quantity_completed(report.quantity_good);
    event.set_quantity_scrapped(report.quantity_bad);
    event.set_scrap_reason(report.scrap_reason);
    event.set_actual_run_minutes(run_minutes);
    *event.mutable_completed_at() = completed_at;
    return event;
}

OperationSkipped OperationLogic::handle_skip(const ProductionOrderState& state,
                                             uint32_t sequence,
                                             const std::string& reason) {
    require_active(state, "skip");
    const auto& op = require_operation(state, sequence);
    require_transition(state, op, OperationAction::Skip);
    if (op.status == OPERATION_RUNNING) {
        require_reason(reason);
    } else {
        require_previous_terminal(state, op, OperationAction::Skip);
    }

    OperationSkipped event;
    event.set_sequence(sequence);
    event.set_notes("SKIPPED: " + reason);
    return event;
}

std::vector<OperationSkipped> OperationLogic::cascade_skips(const ProductionOrderState& state,
                                                            uint32_t sequence) {
    std::vector<OperationSkipped> events;
    for (const auto& op : state.operations) {
        if (op.sequence <= sequence) continue;
        if (op.status != OPERATION_PENDING && op.status != OPERATION_QUEUED) continue;
        OperationSkipped event;
        event.set_sequence(op.sequence);
        event.set_notes("SKIPPED: Auto-skipped - no pieces from operation " +
                        std::to_string(sequence));
        events.push_back(std::move(event));
    }
    return events;
}

ProductionOrderHeld OperationLogic::handle_hold(const ProductionOrderState& state,
                                                const std::string& reason) {
    require_order(state);
    require_reason(reason);
    if (state.cancelled) reject(order_entity(state), "cancelled", "hold");
    if (state.on_hold) reject(order_entity(state), "on_hold", "hold");
    if (state.all_operations_terminal()) reject(order_entity(state), "finished", "hold");

    ProductionOrderHeld event;
    event.set_reason(reason);
    return event;
}

ProductionOrderResumed OperationLogic::handle_resume(const ProductionOrderState& state) {
    require_order(state);
    if (state.cancelled) reject(order_entity(state), "cancelled", "resume");
    if (!state.on_hold) reject(order_entity(state), "not held", "resume");
    return ProductionOrderResumed();
}

ProductionOrderCancelled OperationLogic::handle_cancel(const ProductionOrderState& state,
                                                       const std::string& reason) {
    require_order(state);
    require_reason(reason);
    if (state.cancelled) reject(order_entity(state), "cancelled", "cancel");
    if (state.all_operations_terminal()) reject(order_entity(state), "finished", "cancel");

    ProductionOrderCancelled event;
    event.set_reason(reason);
    return event;
}

} // namespace forge::production
