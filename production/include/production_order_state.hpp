#pragma once

#include <string>
#include <vector>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "forge/quantity.hpp"
#include "forge/types.pb.h"
#include "forge/production.pb.h"

namespace forge::production {

/// One manufacturing step of a production order.
struct OperationState {
    uint32_t sequence = 0;
    std::string work_center;
    std::string resource_id;
    OperationStatus status = OPERATION_PENDING;
    int64_t planned_setup_minutes = 0;
    int64_t planned_run_minutes = 0;
    int64_t actual_run_minutes = 0;
    Quantity quantity_completed = 0;
    Quantity quantity_scrapped = 0;
    std::string scrap_reason;
    std::string notes;
    std::string operator_name;
    google::protobuf::Timestamp started_at;
    google::protobuf::Timestamp completed_at;
    std::vector<std::string> allocation_ids;

    bool is_terminal() const {
        return status == OPERATION_COMPLETE || status == OPERATION_SKIPPED;
    }
};

/**
 * Production order aggregate state.
 *
 * The order status is not stored; see derive_status.
 */
struct ProductionOrderState {
    std::string production_order_id;
    std::string item_id;
    Quantity quantity_ordered = 0;
    google::protobuf::Timestamp due_date;
    std::string sales_order_id;
    std::string sales_order_line_id;
    bool released = false;
    bool on_hold = false;
    bool cancelled = false;
    std::string hold_reason;
    std::vector<MaterialLine> materials;
    std::vector<OperationState> operations;

    bool exists() const { return !production_order_id.empty(); }

    /// Operations are kept in sequence order.
    const OperationState* find_operation(uint32_t sequence) const;
    OperationState* find_operation(uint32_t sequence);

    /// The operation before sequence, or nullptr for the first.
    const OperationState* previous_operation(uint32_t sequence) const;

    bool all_operations_terminal() const;

    /// Good output of the last completed operation.
    Quantity quantity_completed() const;
    Quantity quantity_scrapped() const;

    static ProductionOrderState from_event_book(const EventBook& event_book);
    static void apply_event(ProductionOrderState& state, const google::protobuf::Any& event_any);
};

/**
 * Roll the order status up from its flags and operations:
 * cancelled, on hold and draft first; then all operations untouched gives
 * released (short when a requirement could not be reserved); all terminal
 * gives complete or short by quantity; anything else is in progress.
 */
ProductionOrderStatus derive_status(const ProductionOrderState& state,
                                    bool has_pending_requirements);

const char* operation_status_name(OperationStatus status);
const char* production_status_name(ProductionOrderStatus status);

} // namespace forge::production
