#pragma once

#include <memory>
#include <string>
#include "forge/config.hpp"
#include "allocation_store.hpp"
#include "fulfillment_calculator.hpp"
#include "inventory_ledger.hpp"
#include "master_data.hpp"
#include "production_orders.hpp"
#include "purchasing.hpp"
#include "resource_board.hpp"
#include "sales_orders.hpp"
#include "shortage_resolver.hpp"

namespace forge {

/**
 * Wires the engine's components around one inventory ledger.
 *
 * Master data and purchasing are collaborators owned by the caller and must
 * outlive the engine.
 */
class Engine {
public:
    Engine(const EngineConfig& config,
           const allocation::MasterData& master_data,
           pegging::PurchasingGateway& purchasing,
           pegging::Clock today = nullptr);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    inventory::InventoryLedger& ledger() { return ledger_; }
    allocation::AllocationStore& allocations() { return allocations_; }
    production::ResourceBoard& resources() { return resources_; }
    production::ProductionOrders& production_orders() { return production_orders_; }
    fulfillment::SalesOrders& sales_orders() { return sales_orders_; }
    pegging::ShortageResolver& resolver() { return resolver_; }
    const fulfillment::FulfillmentCalculator& fulfillment() const { return fulfillment_; }

    /// Throws NotFoundError when the production order does not exist.
    std::shared_ptr<const fulfillment::SalesOrderState> link_production(
        const std::string& sales_order_id, const std::string& line_id,
        const std::string& production_order_id);

    const EngineConfig& config() const { return config_; }

private:
    EngineConfig config_;
    inventory::InventoryLedger ledger_;
    allocation::AllocationStore allocations_;
    production::ResourceBoard resources_;
    production::ProductionOrders production_orders_;
    fulfillment::SalesOrders sales_orders_;
    pegging::ShortageResolver resolver_;
    fulfillment::FulfillmentCalculator fulfillment_;
};

} // namespace forge
