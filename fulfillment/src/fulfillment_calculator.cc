#include "fulfillment_calculator.hpp"
#include "forge/errors.hpp"
#include <algorithm>

namespace forge::fulfillment {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t READY_BUFFER_DAYS = 2;

bool same_target(const ResolutionAction& a, const ResolutionAction& b) {
    return a.kind() == b.kind() && a.item_id() == b.item_id() &&
           a.purchase_order_id() == b.purchase_order_id() &&
           a.production_order_id() == b.production_order_id();
}

/// Several production orders can propose the same action; keep the largest.
void merge_action(std::vector<ResolutionAction>& actions, const ResolutionAction& action) {
    for (auto& existing : actions) {
        if (!same_target(existing, action)) continue;
        if (action.quantity() > existing.quantity()) existing = action;
        return;
    }
    actions.push_back(action);
}

void extend_to(google::protobuf::Timestamp& latest, const google::protobuf::Timestamp& candidate) {
    if (candidate.seconds() == 0) return;
    if (latest.seconds() == 0 || latest.seconds() < candidate.seconds()) latest = candidate;
}

} // anonymous namespace

const char* fulfillment_state_name(FulfillmentState state) {
    switch (state) {
        case FULFILLMENT_READY_TO_SHIP: return "ready_to_ship";
        case FULFILLMENT_PARTIALLY_READY: return "partially_ready";
        case FULFILLMENT_BLOCKED: return "blocked";
        case FULFILLMENT_SHIPPED: return "shipped";
        case FULFILLMENT_CANCELLED: return "cancelled";
        default: return "unspecified";
    }
}

FulfillmentCalculator::FulfillmentCalculator(const SalesOrders& sales_orders,
                                             const inventory::InventoryLedger& ledger,
                                             const production::ProductionOrders& production_orders,
                                             const pegging::ShortageResolver& resolver)
    : sales_orders_(sales_orders),
      ledger_(ledger),
      production_orders_(production_orders),
      resolver_(resolver) {}

LineFulfillment FulfillmentCalculator::line_status(const SalesLineState& line,
                                                   std::map<std::string, Quantity>& committed) const {
    LineFulfillment result;
    result.set_line_id(line.line_id);
    result.set_item_id(line.item_id);
    result.set_quantity_remaining(line.remaining());
    result.set_production_order_id(line.production_order_id);

    auto item = ledger_.item(line.item_id);
    Quantity& claimed = committed[line.item_id];
    Quantity available = (item ? item->available() : 0) - claimed;
    result.set_quantity_available(available);

    if (line.remaining() <= 0) {
        result.set_is_ready(true);
        return result;
    }

    if (!line.production_order_id.empty()) {
        try {
            auto status = production_orders_.status(line.production_order_id);
            if (status == PRODUCTION_COMPLETE) {
                claimed += line.remaining();
                result.set_is_ready(true);
                return result;
            }
        } catch (const NotFoundError&) {
            result.set_blocking_reason("Production order " + line.production_order_id + " not found");
            return result;
        }
    }

    if (!item) {
        result.set_blocking_reason("Item " + line.item_id + " not found");
        return result;
    }
    if (available < line.remaining()) {
        result.set_blocking_reason("Available " + format_quantity(available) + " " + item->unit +
                                   " of " + line.item_id + " is below remaining " +
                                   format_quantity(line.remaining()));
        return result;
    }
    auto shortage = resolver_.shortage_for(line.item_id);
    if (shortage.short_quantity() > 0) {
        result.set_blocking_reason("Item " + line.item_id + " is short " +
                                   format_quantity(shortage.short_quantity()) + " " + item->unit);
        return result;
    }
    claimed += line.remaining();
    result.set_is_ready(true);
    return result;
}

FulfillmentStatus FulfillmentCalculator::fulfillment_status(const std::string& sales_order_id) const {
    auto order = sales_orders_.order(sales_order_id);

    FulfillmentStatus status;
    status.set_sales_order_id(order->sales_order_id);
    switch (order->status) {
        case SalesOrderStatus::Shipped:
            status.set_state(FULFILLMENT_SHIPPED);
            status.set_percent(100);
            return status;
        case SalesOrderStatus::Cancelled:
            status.set_state(FULFILLMENT_CANCELLED);
            status.set_percent(0);
            return status;
        case SalesOrderStatus::Open:
            break;
    }

    // Earlier lines claim stock first so two lines never count the same unit.
    std::map<std::string, Quantity> committed;
    int64_t ready = 0;
    for (const auto& line : order->lines) {
        auto line_result = line_status(line, committed);
        if (line_result.is_ready()) ++ready;
        *status.add_lines() = std::move(line_result);
    }

    int64_t total = static_cast<int64_t>(order->lines.size());
    if (total == 0 || ready == 0) {
        status.set_state(FULFILLMENT_BLOCKED);
    } else if (ready == total) {
        status.set_state(FULFILLMENT_READY_TO_SHIP);
    } else {
        status.set_state(FULFILLMENT_PARTIALLY_READY);
    }
    status.set_percent(total == 0 ? 0 : percent_half_up(ready, total));
    return status;
}

std::vector<std::shared_ptr<const production::ProductionOrderState>>
FulfillmentCalculator::production_for(const SalesOrderState& order,
                                      const SalesLineState& line) const {
    std::vector<std::shared_ptr<const production::ProductionOrderState>> result;
    for (const auto& production : production_orders_.orders()) {
        bool linked = !line.production_order_id.empty() &&
                      production->production_order_id == line.production_order_id;
        bool made_for = production->sales_order_id == order.sales_order_id &&
                        production->sales_order_line_id == line.line_id;
        if (linked || made_for) result.push_back(production);
    }
    return result;
}

SalesOrderBlockingIssues FulfillmentCalculator::blocking_issues(
    const std::string& sales_order_id) const {
    auto order = sales_orders_.order(sales_order_id);

    SalesOrderBlockingIssues result;
    result.set_sales_order_id(order->sales_order_id);
    result.set_customer(order->customer);
    if (order->status != SalesOrderStatus::Open) {
        result.set_can_fulfill(order->status == SalesOrderStatus::Shipped);
        return result;
    }

    std::map<std::string, Quantity> committed;
    std::vector<ResolutionAction> actions;
    google::protobuf::Timestamp latest;
    uint32_t blocking = 0;
    size_t ready = 0;

    for (const auto& line : order->lines) {
        auto status = line_status(line, committed);
        if (status.is_ready()) {
            ++ready;
            continue;
        }

        auto* out = result.add_lines();
        out->set_line_id(line.line_id);
        out->set_item_id(line.item_id);
        out->set_quantity_remaining(line.remaining());
        Quantity available = std::max<Quantity>(0, status.quantity_available());
        out->set_quantity_available(available);
        out->set_quantity_short(std::max<Quantity>(0, line.remaining() - available));

        if (!ledger_.item(line.item_id)) {
            auto* issue = out->add_issues();
            issue->set_kind(LINE_ISSUE_ITEM_NOT_FOUND);
            issue->set_message("Item " + line.item_id + " not found");
            blocking += static_cast<uint32_t>(out->issues_size());
            continue;
        }

        auto productions = production_for(*order, line);
        bool missing_reported = false;
        if (!line.production_order_id.empty() &&
            std::none_of(productions.begin(), productions.end(), [&line](const auto& production) {
                return production->production_order_id == line.production_order_id;
            })) {
            auto* issue = out->add_issues();
            issue->set_kind(LINE_ISSUE_PRODUCTION_MISSING);
            issue->set_production_order_id(line.production_order_id);
            issue->set_message("Production order " + line.production_order_id + " not found");
            missing_reported = true;
        }

        bool in_production = false;
        for (const auto& production : productions) {
            const auto& production_order_id = production->production_order_id;
            // Finished or cancelled orders will not produce any more.
            if (production->cancelled || production->all_operations_terminal()) continue;
            in_production = true;

            auto production_status = production_orders_.status(production_order_id);
            auto* issue = out->add_issues();
            issue->set_kind(LINE_ISSUE_PRODUCTION_INCOMPLETE);
            issue->set_production_order_id(production_order_id);
            issue->set_production_status(production_status);
            issue->set_quantity_remaining(production->quantity_ordered);
            *issue->mutable_estimated_completion() = production->due_date;
            issue->set_message("Production order " + production_order_id + " is " +
                               production::production_status_name(production_status));

            ResolutionAction complete;
            complete.set_kind(RESOLUTION_COMPLETE_PRODUCTION_ORDER);
            complete.set_item_id(production->item_id);
            complete.set_production_order_id(production_order_id);
            complete.set_quantity(production->quantity_ordered);
            *complete.mutable_available_at() = production->due_date;
            complete.set_description("Complete production order " + production_order_id + " for " +
                                     format_quantity(production->quantity_ordered) + " of " +
                                     production->item_id);
            merge_action(actions, complete);
            extend_to(latest, production->due_date);

            auto materials = resolver_.blocking_issues(production_order_id);
            for (const auto& material : materials.material_issues()) {
                auto* shortage = out->add_issues();
                shortage->set_kind(LINE_ISSUE_MATERIAL_SHORTAGE);
                shortage->set_production_order_id(production_order_id);
                shortage->set_message("Material " + material.item_id() + " is short " +
                                      format_quantity(material.quantity_short()) + " for " +
                                      production_order_id);
                *shortage->mutable_material() = material;
            }
            for (const auto& action : materials.resolution_actions()) {
                merge_action(actions, action);
                extend_to(latest, action.available_at());
            }
        }

        if (!in_production) {
            Quantity needed = out->quantity_short() > 0 ? out->quantity_short() : line.remaining();
            if (!missing_reported) {
                auto* issue = out->add_issues();
                issue->set_kind(LINE_ISSUE_PRODUCTION_MISSING);
                issue->set_quantity_remaining(needed);
                issue->set_message("No open production order for " + format_quantity(needed) +
                                   " of " + line.item_id);
            }
            ResolutionAction create;
            create.set_kind(RESOLUTION_CREATE_PRODUCTION_ORDER);
            create.set_item_id(line.item_id);
            create.set_quantity(needed);
            create.set_net_new_quantity(needed);
            create.set_description("Create production order for " + format_quantity(needed) +
                                   " of " + line.item_id);
            merge_action(actions, create);
        }
        blocking += static_cast<uint32_t>(out->issues_size());
    }

    bool can_fulfill = !order->lines.empty() && ready == order->lines.size();
    result.set_can_fulfill(can_fulfill);
    result.set_blocking_count(blocking);

    auto today = resolver_.today();
    if (!can_fulfill && latest.seconds() > today.seconds()) {
        google::protobuf::Timestamp estimated;
        estimated.set_seconds(latest.seconds() + READY_BUFFER_DAYS * SECONDS_PER_DAY);
        *result.mutable_estimated_ready_at() = estimated;
        int64_t seconds = estimated.seconds() - today.seconds();
        result.set_days_until_ready(
            static_cast<int32_t>((seconds + SECONDS_PER_DAY - 1) / SECONDS_PER_DAY));
    }

    for (auto& action : pegging::ShortageResolver::rank_actions(std::move(actions))) {
        *result.add_resolution_actions() = std::move(action);
    }
    return result;
}

} // namespace forge::fulfillment
