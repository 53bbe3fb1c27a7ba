#pragma once

#include <optional>
#include <string>
#include <vector>
#include "forge/production.pb.h"
#include "master_data.hpp"
#include "production_order_state.hpp"

namespace forge::production {

enum class OperationAction { Schedule, Start, Complete, Skip };

const char* operation_action_name(OperationAction action);

/**
 * Transition table for operations. Returns nothing for a transition the
 * state machine does not allow; complete and skipped have no way out.
 */
std::optional<OperationStatus> next_status(OperationStatus from, OperationAction action);

/// Attributes of a new production order.
struct ProductionOrderSpec {
    std::string production_order_id;
    std::string item_id;
    Quantity quantity_ordered = 0;
    google::protobuf::Timestamp due_date;
    std::string sales_order_id;
    std::string sales_order_line_id;
};

/// Output reported for a running operation.
struct CompletionReport {
    Quantity quantity_good = 0;
    Quantity quantity_bad = 0;
    std::string scrap_reason;
    /// Wall-clock minutes since start when not given.
    std::optional<int64_t> actual_run_minutes;
};

/**
 * Business logic for the production order aggregate.
 *
 * Handlers validate a command against the order state and return the event
 * to persist. Invalid transitions are logged at error level before throwing.
 */
class OperationLogic {
public:
    static ProductionOrderCreated handle_create(const ProductionOrderState& state,
                                                const ProductionOrderSpec& spec);

    /**
     * Snapshot the routing and BOM. Materials without an operation go to the
     * first one.
     */
    static ProductionOrderReleased handle_release(const ProductionOrderState& state,
                                                  const std::vector<allocation::BomLine>& bom,
                                                  const std::vector<allocation::RoutingStep>& routing);

    static OperationScheduled handle_schedule(const ProductionOrderState& state, uint32_t sequence);

    static OperationStarted handle_start(const ProductionOrderState& state,
                                         uint32_t sequence,
                                         const std::string& resource_id,
                                         const std::string& operator_name);

    static OperationCompleted handle_complete(const ProductionOrderState& state,
                                              uint32_t sequence,
                                              const CompletionReport& report);

    static OperationSkipped handle_skip(const ProductionOrderState& state,
                                        uint32_t sequence,
                                        const std::string& reason);

    /**
     * Pending and queued operations after sequence, skipped because no good
     * pieces reached them.
     */
    static std::vector<OperationSkipped> cascade_skips(const ProductionOrderState& state,
                                                       uint32_t sequence);

    static ProductionOrderHeld handle_hold(const ProductionOrderState& state,
                                           const std::string& reason);
    static ProductionOrderResumed handle_resume(const ProductionOrderState& state);
    static ProductionOrderCancelled handle_cancel(const ProductionOrderState& state,
                                                  const std::string& reason);

    /**
     * Most pieces (good + bad) an operation may report: the order quantity for
     * the first operation, otherwise the good output of the last completed
     * upstream operation, looking past skipped ones.
     */
    static Quantity planned_quantity(const ProductionOrderState& state, uint32_t sequence);
};

} // namespace forge::production
