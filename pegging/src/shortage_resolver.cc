#include "shortage_resolver.hpp"
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"
#include "forge/validation.hpp"
#include <algorithm>
#include <map>

namespace forge::pegging {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;

struct PeggedDemand {
    std::string allocation_id;
    DemandRef demand;
    Quantity quantity = 0;
};

bool by_need_date(const PeggedDemand& a, const PeggedDemand& b) {
    if (helpers::earlier(a.demand.needed_by(), b.demand.needed_by())) return true;
    if (helpers::earlier(b.demand.needed_by(), a.demand.needed_by())) return false;
    return a.allocation_id < b.allocation_id;
}

IncomingSupply incoming_of(const PurchaseLine& line) {
    IncomingSupply supply;
    supply.set_purchase_order_id(line.purchase_order_id);
    supply.set_line_id(line.line_id);
    supply.set_quantity_open(line.quantity_open);
    *supply.mutable_promised_by() = line.promised_by;
    return supply;
}

} // anonymous namespace

ShortageResolver::ShortageResolver(const inventory::InventoryLedger& ledger,
                                   const allocation::AllocationStore& allocations,
                                   const production::ProductionOrders& orders,
                                   PurchasingGateway& purchasing,
                                   uint32_t default_lead_time_days,
                                   Clock today)
    : ledger_(ledger),
      allocations_(allocations),
      orders_(orders),
      purchasing_(purchasing),
      default_lead_time_days_(default_lead_time_days),
      today_(today ? std::move(today) : Clock(&helpers::now)) {}

std::vector<PurchaseLine> ShortageResolver::sorted_open_lines(const std::string& item_id) const {
    auto lines = purchasing_.open_lines(item_id);
    std::sort(lines.begin(), lines.end(), [](const PurchaseLine& a, const PurchaseLine& b) {
        if (helpers::earlier(a.promised_by, b.promised_by)) return true;
        if (helpers::earlier(b.promised_by, a.promised_by)) return false;
        if (a.purchase_order_id != b.purchase_order_id) return a.purchase_order_id < b.purchase_order_id;
        return a.line_id < b.line_id;
    });
    return lines;
}

ItemShortage ShortageResolver::shortage_for(const std::string& item_id) const {
    auto item = ledger_.require_item(item_id);
    Quantity incoming = 0;
    for (const auto& line : purchasing_.open_lines(item_id)) incoming += line.quantity_open;

    std::vector<PeggedDemand> reserved;
    for (const auto& entry : item->reservations) {
        reserved.push_back(PeggedDemand{entry.first, entry.second.demand, entry.second.quantity});
    }
    std::vector<PeggedDemand> pending;
    for (const auto& allocation : allocations_.for_item(item_id)) {
        if (allocation.status == allocation::AllocationStatus::Pending) {
            pending.push_back(PeggedDemand{allocation.allocation_id, allocation.demand,
                                           allocation.quantity});
        }
    }
    std::sort(reserved.begin(), reserved.end(), by_need_date);
    std::sort(pending.begin(), pending.end(), by_need_date);
    reserved.insert(reserved.end(), pending.begin(), pending.end());

    ItemShortage shortage;
    shortage.set_item_id(item_id);
    Quantity supply = item->on_hand + incoming;
    Quantity cumulative = 0;
    for (const auto& demand : reserved) {
        cumulative += demand.quantity;
        if (cumulative > supply) *shortage.add_blocking_demand() = demand.demand;
    }
    shortage.set_short_quantity(std::max<Quantity>(0, cumulative - supply));
    return shortage;
}

DemandSummary ShortageResolver::demand_summary(const std::string& item_id) const {
    auto item = ledger_.require_item(item_id);
    auto lines = sorted_open_lines(item_id);

    DemandSummary summary;
    summary.set_item_id(item_id);
    summary.set_unit(item->unit);
    if (item->reorder_point) {
        summary.set_reorder_point(*item->reorder_point);
        summary.set_has_reorder_point(true);
    }

    Quantity incoming = 0;
    for (const auto& line : lines) {
        incoming += line.quantity_open;
        *summary.add_incoming() = incoming_of(line);
    }
    auto* quantities = summary.mutable_quantities();
    quantities->set_on_hand(item->on_hand);
    quantities->set_allocated(item->allocated);
    quantities->set_available(item->available());
    quantities->set_incoming(incoming);
    quantities->set_projected(item->available() + incoming);

    for (const auto& entry : item->reservations) {
        auto* detail = summary.add_allocations();
        detail->set_allocation_id(entry.first);
        *detail->mutable_demand() = entry.second.demand;
        detail->set_quantity(entry.second.quantity);
        detail->set_status("allocated");
    }
    for (const auto& allocation : allocations_.for_item(item_id)) {
        if (allocation.status != allocation::AllocationStatus::Pending) continue;
        auto* detail = summary.add_allocations();
        detail->set_allocation_id(allocation.allocation_id);
        *detail->mutable_demand() = allocation.demand;
        detail->set_quantity(allocation.quantity);
        detail->set_status(allocation::allocation_status_name(allocation.status));
    }

    *summary.mutable_shortage() = shortage_for(item_id);
    return summary;
}

std::vector<ResolutionAction> ShortageResolver::actions_for(const inventory::ItemState& item,
                                                            Quantity shortfall) const {
    std::vector<ResolutionAction> actions;
    Quantity remaining = shortfall;
    for (const auto& line : sorted_open_lines(item.item_id)) {
        if (remaining <= 0) break;
        Quantity cover = std::min(line.quantity_open, remaining);
        ResolutionAction action;
        action.set_kind(RESOLUTION_EXPEDITE_PURCHASE_ORDER);
        action.set_item_id(item.item_id);
        action.set_purchase_order_id(line.purchase_order_id);
        action.set_quantity(cover);
        action.set_net_new_quantity(0);
        *action.mutable_available_at() = line.promised_by;
        action.set_description("Expedite PO " + line.purchase_order_id + " for " +
                               format_quantity(cover) + " " + item.unit + " of " + item.item_id);
        actions.push_back(std::move(action));
        remaining -= cover;
    }

    if (remaining > 0) {
        uint32_t lead_time = item.lead_time_days > 0 ? item.lead_time_days : default_lead_time_days_;
        auto available_at = today_();
        available_at.set_seconds(available_at.seconds() + lead_time * SECONDS_PER_DAY);

        ResolutionAction action;
        action.set_kind(RESOLUTION_CREATE_PURCHASE_ORDER);
        action.set_item_id(item.item_id);
        action.set_quantity(remaining);
        action.set_net_new_quantity(remaining);
        *action.mutable_available_at() = available_at;
        action.set_description("Create PO for " + format_quantity(remaining) + " " + item.unit +
                               " of " + item.item_id);
        actions.push_back(std::move(action));
    }
    return actions;
}

BlockingIssues ShortageResolver::blocking_issues(const std::string& production_order_id) const {
    auto order = orders_.order(production_order_id);

    auto requirements = allocations_.requirements_for(production_order_id);
    std::stable_sort(requirements.begin(), requirements.end(),
                     [](const allocation::Allocation& a, const allocation::Allocation& b) {
                         return a.demand.operation_sequence() < b.demand.operation_sequence();
                     });

    BlockingIssues result;
    result.set_production_order_id(order->production_order_id);

    std::map<std::string, BlockingIssue> short_reserved;
    for (auto& issue : allocations_.short_reservations(requirements)) {
        short_reserved.emplace(issue.allocation_id, std::move(issue));
    }

    std::map<std::string, Quantity> unclaimed;
    std::map<std::string, Quantity> shortfall;
    std::map<std::string, std::shared_ptr<const inventory::ItemState>> items;
    for (const auto& requirement : requirements) {
        auto reserved = short_reserved.find(requirement.allocation_id);
        bool pending = requirement.status == allocation::AllocationStatus::Pending;
        if (!pending && reserved == short_reserved.end()) continue;

        auto& item = items[requirement.item_id];
        if (!item) {
            item = ledger_.require_item(requirement.item_id);
            unclaimed[requirement.item_id] = std::max<Quantity>(0, item->available());
        }
        Quantity covered = 0;
        Quantity short_by = 0;
        if (pending) {
            Quantity& available = unclaimed[requirement.item_id];
            covered = std::min(available, requirement.quantity);
            short_by = requirement.quantity - covered;
            available -= covered;
            if (short_by == 0) continue;
        } else {
            covered = reserved->second.available;
            short_by = reserved->second.short_by;
        }

        auto* issue = result.add_material_issues();
        issue->set_item_id(requirement.item_id);
        issue->set_allocation_id(requirement.allocation_id);
        issue->set_operation_sequence(requirement.demand.operation_sequence());
        issue->set_quantity_required(requirement.quantity);
        issue->set_quantity_available(covered);
        issue->set_quantity_short(short_by);
        for (const auto& line : sorted_open_lines(requirement.item_id)) {
            *issue->add_incoming() = incoming_of(line);
        }
        shortfall[requirement.item_id] += short_by;
    }

    result.set_can_produce(result.material_issues_size() == 0);

    std::vector<ResolutionAction> actions;
    for (const auto& entry : shortfall) {
        auto item_actions = actions_for(*items.at(entry.first), entry.second);
        actions.insert(actions.end(), item_actions.begin(), item_actions.end());
    }
    for (auto& action : rank_actions(std::move(actions))) {
        *result.add_resolution_actions() = std::move(action);
    }
    return result;
}

std::vector<ResolutionAction> ShortageResolver::rank_actions(std::vector<ResolutionAction> actions) {
    std::stable_sort(actions.begin(), actions.end(),
                     [](const ResolutionAction& a, const ResolutionAction& b) {
        if (a.kind() != b.kind()) return a.kind() < b.kind();
        if (helpers::earlier(a.available_at(), b.available_at())) return true;
        if (helpers::earlier(b.available_at(), a.available_at())) return false;
        if (a.net_new_quantity() != b.net_new_quantity()) {
            return a.net_new_quantity() < b.net_new_quantity();
        }
        if (a.item_id() != b.item_id()) return a.item_id() < b.item_id();
        if (a.purchase_order_id() != b.purchase_order_id()) {
            return a.purchase_order_id() < b.purchase_order_id();
        }
        return a.production_order_id() < b.production_order_id();
    });
    for (size_t i = 0; i < actions.size(); ++i) {
        actions[i].set_rank(static_cast<uint32_t>(i + 1));
    }
    return actions;
}

std::string ShortageResolver::request_purchase(const ResolutionAction& action,
                                               const std::string& reference) {
    if (action.kind() != RESOLUTION_CREATE_PURCHASE_ORDER) {
        throw InvalidArgumentError("Only create actions become purchase requests");
    }
    validation::require_positive(action.quantity(), "quantity");

    PurchaseRequest request;
    request.item_id = action.item_id();
    request.quantity = action.quantity();
    request.reference = reference;
    request.needed_by = action.available_at();
    auto purchase_order_id = purchasing_.request_purchase_order(request);

    log_info("pegging", "purchase_requested", {
        {"purchase_order_id", purchase_order_id},
        {"item_id", request.item_id},
        {"quantity", format_quantity(request.quantity)},
        {"reference", reference}
    });
    return purchase_order_id;
}

} // namespace forge::pegging
