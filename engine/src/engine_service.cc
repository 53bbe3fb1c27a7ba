#include "engine_service.hpp"
#include "forge/logging.hpp"

namespace forge {

namespace {

BlockedDetail blocked_detail(const BlockedError& error) {
    BlockedDetail detail;
    detail.set_production_order_id(error.production_order_id());
    detail.set_operation_sequence(error.sequence());
    for (const auto& issue : error.issues()) {
        auto* added = detail.add_issues();
        added->set_item_id(issue.item_id);
        added->set_allocation_id(issue.allocation_id);
        added->set_operation_sequence(error.sequence());
        added->set_quantity_required(issue.required);
        added->set_quantity_available(issue.available);
        added->set_quantity_short(issue.short_by);
    }
    return detail;
}

} // anonymous namespace

grpc::Status to_grpc_status(const EngineError& error) {
    if (const auto* blocked = dynamic_cast<const BlockedError*>(&error)) {
        return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, error.what(),
                            blocked_detail(*blocked).SerializeAsString());
    }
    switch (error.code()) {
        case EngineError::StatusCode::InvalidArgument:
            return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, error.what());
        case EngineError::StatusCode::FailedPrecondition:
            return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, error.what());
        case EngineError::StatusCode::NotFound:
            return grpc::Status(grpc::StatusCode::NOT_FOUND, error.what());
        case EngineError::StatusCode::Aborted:
            return grpc::Status(grpc::StatusCode::ABORTED, error.what());
        default:
            return grpc::Status(grpc::StatusCode::UNKNOWN, error.what());
    }
}

class FulfillmentEngineService final : public FulfillmentEngine::Service {
public:
    explicit FulfillmentEngineService(Engine& engine) : engine_(engine) {}

    grpc::Status RegisterItem(grpc::ServerContext* context,
                              const RegisterItemRequest* request,
                              DemandSummary* response) override {
        try {
            inventory::ItemSpec spec;
            spec.item_id = request->item_id();
            if (!request->unit().empty()) spec.unit = request->unit();
            if (request->has_reorder_point()) spec.reorder_point = request->reorder_point();
            spec.standard_cost = request->standard_cost();
            if (request->stock_increment() > 0) spec.stock_increment = request->stock_increment();
            spec.lead_time_days = request->lead_time_days();
            engine_.ledger().register_item(spec, actor());
            *response = engine_.resolver().demand_summary(spec.item_id);
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status RegisterSpool(grpc::ServerContext* context,
                               const RegisterSpoolRequest* request,
                               InventoryTransaction* response) override {
        try {
            inventory::SpoolSpec spec;
            spec.spool_id = request->spool_id();
            spec.item_id = request->item_id();
            spec.initial_weight = request->initial_weight();
            spec.supplier_lot = request->supplier_lot();
            spec.expires_at = request->expires_at();
            *response = engine_.ledger().register_spool(spec, request->reason(),
                                                        actor_or_default(request->actor()));
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status AdjustStock(grpc::ServerContext* context,
                             const AdjustStockRequest* request,
                             InventoryTransaction* response) override {
        try {
            inventory::Reference reference{request->reference_type(), request->reference_id()};
            *response = engine_.ledger().adjust(request->item_id(), request->quantity_delta(),
                                                request->reason(),
                                                actor_or_default(request->actor()), reference);
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status CreateProductionOrder(grpc::ServerContext* context,
                                       const CreateProductionOrderRequest* request,
                                       ProductionOrderView* response) override {
        try {
            production::ProductionOrderSpec spec;
            spec.production_order_id = request->production_order_id();
            spec.item_id = request->item_id();
            spec.quantity_ordered = request->quantity_ordered();
            spec.due_date = request->due_date();
            spec.sales_order_id = request->sales_order_id();
            spec.sales_order_line_id = request->sales_order_line_id();
            *response = engine_.production_orders().create(spec, actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status HoldProductionOrder(grpc::ServerContext* context,
                                     const ProductionOrderReasonRequest* request,
                                     ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().hold(request->production_order_id(),
                                                         request->reason(), actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status ResumeProductionOrder(grpc::ServerContext* context,
                                       const ProductionOrderRequest* request,
                                       ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().resume(request->production_order_id(), actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status CancelProductionOrder(grpc::ServerContext* context,
                                       const ProductionOrderReasonRequest* request,
                                       ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().cancel(request->production_order_id(),
                                                           request->reason(), actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status PlaceSalesOrder(grpc::ServerContext* context,
                                 const PlaceSalesOrderRequest* request,
                                 SalesOrderView* response) override {
        try {
            fulfillment::SalesOrderSpec spec;
            spec.sales_order_id = request->sales_order_id();
            spec.customer = request->customer();
            for (const auto& line : request->lines()) {
                spec.lines.push_back({line.line_id(), line.item_id(), line.quantity(),
                                      line.production_order_id()});
            }
            *response = fulfillment::view_of(*engine_.sales_orders().place(spec, actor()));
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status LinkProduction(grpc::ServerContext* context,
                                const LinkProductionRequest* request,
                                SalesOrderView* response) override {
        try {
            *response = fulfillment::view_of(*engine_.link_production(
                request->sales_order_id(), request->line_id(), request->production_order_id()));
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status RecordShipment(grpc::ServerContext* context,
                                const RecordShipmentRequest* request,
                                SalesOrderView* response) override {
        try {
            *response = fulfillment::view_of(*engine_.sales_orders().record_shipment(
                request->sales_order_id(), request->line_id(), request->quantity(),
                actor_or_default(request->actor())));
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status MarkShipped(grpc::ServerContext* context,
                             const MarkShippedRequest* request,
                             SalesOrderView* response) override {
        try {
            *response = fulfillment::view_of(*engine_.sales_orders().mark_shipped(
                request->sales_order_id(), request->carrier(), request->tracking_number(),
                actor_or_default(request->actor())));
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status CancelSalesOrder(grpc::ServerContext* context,
                                  const CancelSalesOrderRequest* request,
                                  SalesOrderView* response) override {
        try {
            *response = fulfillment::view_of(*engine_.sales_orders().cancel(
                request->sales_order_id(), request->reason(), actor()));
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status GetSalesOrderBlockingIssues(grpc::ServerContext* context,
                                             const SalesOrderRequest* request,
                                             SalesOrderBlockingIssues* response) override {
        try {
            *response = engine_.fulfillment().blocking_issues(request->sales_order_id());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status ReleaseProductionOrder(grpc::ServerContext* context,
                                        const ProductionOrderRequest* request,
                                        ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().release(request->production_order_id(), actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status ScheduleOperation(grpc::ServerContext* context,
                                   const OperationRequest* request,
                                   ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().schedule(request->production_order_id(),
                                                             request->sequence(), actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status StartOperation(grpc::ServerContext* context,
                                const StartOperationRequest* request,
                                ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().start(
                request->production_order_id(), request->sequence(), request->resource_id(),
                request->operator_name(), actor());
            return grpc::Status::OK;
        } catch (const BlockedError& e) {
            log_warn("engine", "operation_blocked", {
                {"production_order_id", e.production_order_id()},
                {"sequence", e.sequence()},
                {"issues", e.issues().size()}
            });
            return to_grpc_status(e);
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status CompleteOperation(grpc::ServerContext* context,
                                   const CompleteOperationRequest* request,
                                   ProductionOrderView* response) override {
        try {
            production::CompletionReport report;
            report.quantity_good = request->quantity_good();
            report.quantity_bad = request->quantity_bad();
            report.scrap_reason = request->scrap_reason();
            if (request->has_actual_run_minutes()) {
                report.actual_run_minutes = request->actual_run_minutes();
            }
            *response = engine_.production_orders().complete(request->production_order_id(),
                                                             request->sequence(), report, actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status SkipOperation(grpc::ServerContext* context,
                               const SkipOperationRequest* request,
                               ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().skip(request->production_order_id(),
                                                         request->sequence(), request->reason(),
                                                         actor());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status GetProductionOrder(grpc::ServerContext* context,
                                    const ProductionOrderRequest* request,
                                    ProductionOrderView* response) override {
        try {
            *response = engine_.production_orders().view(request->production_order_id());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status GetFulfillmentStatus(grpc::ServerContext* context,
                                      const SalesOrderRequest* request,
                                      FulfillmentStatus* response) override {
        try {
            *response = engine_.fulfillment().fulfillment_status(request->sales_order_id());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status GetDemandSummary(grpc::ServerContext* context,
                                  const ItemRequest* request,
                                  DemandSummary* response) override {
        try {
            *response = engine_.resolver().demand_summary(request->item_id());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status GetBlockingIssues(grpc::ServerContext* context,
                                   const ProductionOrderRequest* request,
                                   BlockingIssues* response) override {
        try {
            *response = engine_.resolver().blocking_issues(request->production_order_id());
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status AdjustSpool(grpc::ServerContext* context,
                             const AdjustSpoolRequest* request,
                             AdjustSpoolResponse* response) override {
        try {
            auto transaction = engine_.ledger().adjust_spool(
                request->spool_id(), request->current_weight(), request->reason(),
                actor_or_default(request->actor()));
            response->set_changed(transaction.has_value());
            if (transaction) *response->mutable_transaction() = *transaction;
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

    grpc::Status ReceiveStock(grpc::ServerContext* context,
                              const ReceiveStockRequest* request,
                              InventoryTransaction* response) override {
        try {
            inventory::Reference reference{request->reference_type(), request->reference_id()};
            *response = engine_.ledger().receive(request->item_id(), request->quantity(),
                                                 request->reason(),
                                                 actor_or_default(request->actor()), reference);
            return grpc::Status::OK;
        } catch (const EngineError& e) {
            return to_grpc_status(e);
        }
    }

private:
    const std::string& actor() const { return engine_.config().actor; }

    std::string actor_or_default(const std::string& requested) const {
        return requested.empty() ? actor() : requested;
    }

    Engine& engine_;
};

std::unique_ptr<FulfillmentEngine::Service> create_engine_service(Engine& engine) {
    return std::make_unique<FulfillmentEngineService>(engine);
}

} // namespace forge
