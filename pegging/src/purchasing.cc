#include "purchasing.hpp"
#include "forge/errors.hpp"
#include "forge/validation.hpp"
#include <algorithm>

namespace forge::pegging {

void InMemoryPurchasing::add_line(const PurchaseLine& line) {
    validation::require_not_empty(line.purchase_order_id, "purchase_order_id");
    validation::require_not_empty(line.item_id, "item_id");
    validation::require_positive(line.quantity_open, "quantity_open");
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(line);
}

void InMemoryPurchasing::receive(const std::string& purchase_order_id, Quantity quantity) {
    validation::require_positive(quantity, "quantity");
    std::lock_guard<std::mutex> lock(mutex_);

    Quantity open = 0;
    for (const auto& line : lines_) {
        if (line.purchase_order_id == purchase_order_id) open += line.quantity_open;
    }
    if (open == 0) throw NotFoundError("No open lines on purchase order " + purchase_order_id);
    if (quantity > open) {
        throw InvalidArgumentError("Receipt of " + format_quantity(quantity) + " exceeds open " +
                                   format_quantity(open) + " on " + purchase_order_id);
    }

    Quantity remaining = quantity;
    for (auto& line : lines_) {
        if (remaining == 0) break;
        if (line.purchase_order_id != purchase_order_id) continue;
        Quantity received = std::min(line.quantity_open, remaining);
        line.quantity_open -= received;
        remaining -= received;
    }
    lines_.erase(std::remove_if(lines_.begin(), lines_.end(),
                                [](const PurchaseLine& line) { return line.quantity_open == 0; }),
                 lines_.end());
}

std::vector<PurchaseLine> InMemoryPurchasing::open_lines(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PurchaseLine> result;
    for (const auto& line : lines_) {
        if (line.item_id == item_id) result.push_back(line);
    }
    return result;
}

std::string InMemoryPurchasing::request_purchase_order(const PurchaseRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    return "PO-REQ-" + std::to_string(++next_request_);
}

std::vector<PurchaseRequest> InMemoryPurchasing::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

} // namespace forge::pegging
