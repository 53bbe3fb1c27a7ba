#include "engine.hpp"

namespace forge {

Engine::Engine(const EngineConfig& config,
               const allocation::MasterData& master_data,
               pegging::PurchasingGateway& purchasing,
               pegging::Clock today)
    : config_(config),
      allocations_(ledger_),
      production_orders_(ledger_, allocations_, master_data, resources_),
      resolver_(ledger_, allocations_, production_orders_, purchasing,
                config.default_lead_time_days, std::move(today)),
      fulfillment_(sales_orders_, ledger_, production_orders_, resolver_) {}

std::shared_ptr<const fulfillment::SalesOrderState> Engine::link_production(
    const std::string& sales_order_id, const std::string& line_id,
    const std::string& production_order_id) {
    production_orders_.order(production_order_id);
    return sales_orders_.link_production(sales_order_id, line_id, production_order_id,
                                         config_.actor);
}

} // namespace forge
