#pragma once

#include <mutex>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "forge/quantity.hpp"

namespace forge::pegging {

/// Open quantity on one purchase-order line.
struct PurchaseLine {
    std::string purchase_order_id;
    std::string line_id;
    std::string item_id;
    Quantity quantity_open = 0;
    google::protobuf::Timestamp promised_by;
};

/// Proposal handed to purchasing for a new order.
struct PurchaseRequest {
    std::string item_id;
    Quantity quantity = 0;
    std::string reference;
    google::protobuf::Timestamp needed_by;
};

/**
 * Purchase-order collaborator. Owns the PO lifecycle; the engine only reads
 * open lines and proposes new orders.
 */
class PurchasingGateway {
public:
    virtual ~PurchasingGateway() = default;
    virtual std::vector<PurchaseLine> open_lines(const std::string& item_id) const = 0;

    /// Returns the id of the requested purchase order.
    virtual std::string request_purchase_order(const PurchaseRequest& request) = 0;
};

class InMemoryPurchasing : public PurchasingGateway {
public:
    void add_line(const PurchaseLine& line);

    /**
     * Receipt against a purchase order, oldest open line first. Fully
     * received lines drop out of open_lines.
     */
    void receive(const std::string& purchase_order_id, Quantity quantity);

    std::vector<PurchaseLine> open_lines(const std::string& item_id) const override;
    std::string request_purchase_order(const PurchaseRequest& request) override;

    std::vector<PurchaseRequest> requests() const;

private:
    mutable std::mutex mutex_;
    std::vector<PurchaseLine> lines_;
    std::vector<PurchaseRequest> requests_;
    uint64_t next_request_ = 0;
};

} // namespace forge::pegging
