#include <gtest/gtest.h>
#include <sstream>
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"
#include "engine.hpp"

using namespace forge;

class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_stream(&log_);

        inventory::ItemSpec widget;
        widget.item_id = "WIDGET";
        engine_.ledger().register_item(widget, "test");
        inventory::ItemSpec filament;
        filament.item_id = "PLA-BLACK";
        filament.unit = "KG";
        filament.stock_increment = parse_quantity("0.01");
        engine_.ledger().register_item(filament, "test");

        master_data_.set_routing("WIDGET", {{10, "PRINT", 15, 120}, {20, "PACK", 0, 10}});
        master_data_.set_bom("WIDGET", {{"PLA-BLACK", parse_quantity("0.333"), 0, 0}});
    }

    void TearDown() override { set_log_stream(nullptr); }

    std::ostringstream log_;
    EngineConfig config_;
    allocation::InMemoryMasterData master_data_;
    pegging::InMemoryPurchasing purchasing_;
    Engine engine_{config_, master_data_, purchasing_,
                   [] { return helpers::date_timestamp(2026, 10, 18); }};
};

TEST_F(EngineTest, MakeToOrder_FromShortageToShipment_ShouldFlowEndToEnd) {
    // Given a sales order for 3 widgets built by PO-1 with no filament on hand
    production::ProductionOrderSpec spec;
    spec.production_order_id = "PO-1";
    spec.item_id = "WIDGET";
    spec.quantity_ordered = units(3);
    spec.sales_order_id = "SO-1";
    spec.sales_order_line_id = "1";
    engine_.production_orders().create(spec, "test");
    engine_.sales_orders().place(fulfillment::SalesOrderSpec{"SO-1", "Acme", {{"1", "WIDGET", units(3), ""}}},
                                 "test");
    engine_.link_production("SO-1", "1", "PO-1");
    auto released = engine_.production_orders().release("PO-1", "test");
    EXPECT_EQ(released.status(), PRODUCTION_SHORT);

    // Then the order is blocked with a create action for the rounded requirement
    auto issues = engine_.resolver().blocking_issues("PO-1");
    ASSERT_EQ(issues.material_issues_size(), 1);
    EXPECT_EQ(issues.material_issues(0).quantity_required(), parse_quantity("1.0"));
    EXPECT_EQ(issues.material_issues(0).operation_sequence(), 10u);
    EXPECT_EQ(engine_.fulfillment().fulfillment_status("SO-1").state(), FULFILLMENT_BLOCKED);
    EXPECT_THROW(engine_.production_orders().start("PO-1", 10, "PRINTER-1", "ana", "test"),
                 BlockedError);

    // When filament arrives and both operations run
    engine_.ledger().receive("PLA-BLACK", units(2), "Purchase receipt", "test");
    engine_.production_orders().start("PO-1", 10, "PRINTER-1", "ana", "test");
    engine_.production_orders().complete("PO-1", 10, production::CompletionReport{units(3), 0, "", 90},
                                         "test");
    engine_.production_orders().start("PO-1", 20, "", "ana", "test");
    engine_.production_orders().complete("PO-1", 20, production::CompletionReport{units(3), 0, "", 5},
                                         "test");

    // Then the sales order can ship
    auto status = engine_.fulfillment().fulfillment_status("SO-1");
    EXPECT_EQ(status.state(), FULFILLMENT_READY_TO_SHIP);
    EXPECT_EQ(status.percent(), 100u);
    EXPECT_EQ(engine_.ledger().require_item("WIDGET")->on_hand, units(3));
    EXPECT_EQ(engine_.ledger().require_item("PLA-BLACK")->on_hand, units(1));

    engine_.sales_orders().mark_shipped("SO-1", "UPS", "1Z999", "shipping");
    EXPECT_EQ(engine_.fulfillment().fulfillment_status("SO-1").state(), FULFILLMENT_SHIPPED);
}

TEST_F(EngineTest, LinkProduction_UnknownProductionOrder_ShouldThrowNotFound) {
    engine_.sales_orders().place(fulfillment::SalesOrderSpec{"SO-1", "Acme", {{"1", "WIDGET", units(1), ""}}},
                                 "test");
    EXPECT_THROW(engine_.link_production("SO-1", "1", "PO-404"), NotFoundError);
}

TEST_F(EngineTest, GlOutbox_ShouldCarryEveryLedgerTransaction) {
    inventory::RecordingGlSink sink;
    engine_.ledger().receive("PLA-BLACK", units(5), "Purchase receipt", "test");
    engine_.ledger().adjust("PLA-BLACK", units(-1), "Cycle count", "test");

    auto report = engine_.ledger().outbox().drain(sink);

    EXPECT_EQ(report.delivered, 2u);
    EXPECT_EQ(sink.postings().size(), 2u);
    EXPECT_EQ(sink.postings()[1].quantity_delta(), units(-1));
}

// =============================================================================
// Sales order blocking issues
// =============================================================================

TEST_F(EngineTest, SalesOrderBlockingIssues_ProductionShortAndUnplannedLine_ShouldRankActions) {
    // Given line 1 built by PO-1, which is short on filament with half of it on order
    production::ProductionOrderSpec spec;
    spec.production_order_id = "PO-1";
    spec.item_id = "WIDGET";
    spec.quantity_ordered = units(3);
    spec.due_date = helpers::date_timestamp(2026, 11, 1);
    spec.sales_order_id = "SO-1";
    spec.sales_order_line_id = "1";
    engine_.production_orders().create(spec, "test");
    engine_.sales_orders().place(fulfillment::SalesOrderSpec{"SO-1", "Acme",
                                                             {{"1", "WIDGET", units(3), ""},
                                                              {"2", "WIDGET", units(2), ""}}},
                                 "test");
    engine_.link_production("SO-1", "1", "PO-1");
    engine_.production_orders().release("PO-1", "test");
    purchasing_.add_line(pegging::PurchaseLine{"PUR-1", "1", "PLA-BLACK", parse_quantity("0.5"),
                                               helpers::date_timestamp(2026, 10, 25)});

    // When
    auto issues = engine_.fulfillment().blocking_issues("SO-1");

    // Then each line explains what holds it up
    EXPECT_FALSE(issues.can_fulfill());
    EXPECT_EQ(issues.customer(), "Acme");
    EXPECT_EQ(issues.blocking_count(), 3u);
    ASSERT_EQ(issues.lines_size(), 2);
    const auto& built = issues.lines(0);
    EXPECT_EQ(built.line_id(), "1");
    EXPECT_EQ(built.quantity_short(), units(3));
    ASSERT_EQ(built.issues_size(), 2);
    EXPECT_EQ(built.issues(0).kind(), LINE_ISSUE_PRODUCTION_INCOMPLETE);
    EXPECT_EQ(built.issues(0).production_status(), PRODUCTION_SHORT);
    EXPECT_EQ(built.issues(1).kind(), LINE_ISSUE_MATERIAL_SHORTAGE);
    EXPECT_EQ(built.issues(1).material().quantity_short(), parse_quantity("1.0"));
    const auto& unplanned = issues.lines(1);
    ASSERT_EQ(unplanned.issues_size(), 1);
    EXPECT_EQ(unplanned.issues(0).kind(), LINE_ISSUE_PRODUCTION_MISSING);
    EXPECT_EQ(unplanned.issues(0).message(), "No open production order for 2 of WIDGET");

    // And the actions are ranked purchasing first, then production
    ASSERT_EQ(issues.resolution_actions_size(), 4);
    EXPECT_EQ(issues.resolution_actions(0).kind(), RESOLUTION_EXPEDITE_PURCHASE_ORDER);
    EXPECT_EQ(issues.resolution_actions(0).purchase_order_id(), "PUR-1");
    EXPECT_EQ(issues.resolution_actions(1).kind(), RESOLUTION_CREATE_PURCHASE_ORDER);
    EXPECT_EQ(issues.resolution_actions(1).net_new_quantity(), parse_quantity("0.5"));
    EXPECT_EQ(issues.resolution_actions(2).kind(), RESOLUTION_COMPLETE_PRODUCTION_ORDER);
    EXPECT_EQ(issues.resolution_actions(2).production_order_id(), "PO-1");
    EXPECT_EQ(issues.resolution_actions(3).kind(), RESOLUTION_CREATE_PRODUCTION_ORDER);
    EXPECT_EQ(issues.resolution_actions(3).quantity(), units(2));
    EXPECT_EQ(issues.resolution_actions(3).rank(), 4u);

    // And the order is expected two days after the latest dated action
    EXPECT_EQ(issues.estimated_ready_at().seconds(), helpers::date_timestamp(2026, 11, 3).seconds());
    EXPECT_EQ(issues.days_until_ready(), 16);
}

TEST_F(EngineTest, SalesOrderBlockingIssues_StockOnHand_ShouldFulfill) {
    // Given
    engine_.ledger().receive("WIDGET", units(5), "Opening balance", "test");
    engine_.sales_orders().place(fulfillment::SalesOrderSpec{"SO-1", "Acme", {{"1", "WIDGET", units(5), ""}}},
                                 "test");

    // When
    auto issues = engine_.fulfillment().blocking_issues("SO-1");

    // Then
    EXPECT_TRUE(issues.can_fulfill());
    EXPECT_EQ(issues.blocking_count(), 0u);
    EXPECT_EQ(issues.lines_size(), 0);
    EXPECT_EQ(issues.resolution_actions_size(), 0);
    EXPECT_FALSE(issues.has_estimated_ready_at());
}

TEST_F(EngineTest, SalesOrderBlockingIssues_ShippedOrCancelled_ShouldReportNoLines) {
    // Given
    engine_.sales_orders().place(fulfillment::SalesOrderSpec{"SO-1", "Acme", {{"1", "WIDGET", units(1), ""}}},
                                 "test");
    engine_.sales_orders().place(fulfillment::SalesOrderSpec{"SO-2", "Acme", {{"1", "WIDGET", units(1), ""}}},
                                 "test");
    engine_.sales_orders().mark_shipped("SO-1", "UPS", "1Z999", "shipping");
    engine_.sales_orders().cancel("SO-2", "Customer request", "test");

    // When
    auto shipped = engine_.fulfillment().blocking_issues("SO-1");
    auto cancelled = engine_.fulfillment().blocking_issues("SO-2");

    // Then
    EXPECT_TRUE(shipped.can_fulfill());
    EXPECT_EQ(shipped.lines_size(), 0);
    EXPECT_FALSE(cancelled.can_fulfill());
    EXPECT_EQ(cancelled.lines_size(), 0);
    EXPECT_THROW(engine_.fulfillment().blocking_issues("SO-404"), NotFoundError);
}

TEST_F(EngineTest, SalesOrderView_AfterLinkAndShipment_ShouldCarryLines) {
    // Given
    production::ProductionOrderSpec spec;
    spec.production_order_id = "PO-1";
    spec.item_id = "WIDGET";
    spec.quantity_ordered = units(3);
    engine_.production_orders().create(spec, "test");
    engine_.sales_orders().place(fulfillment::SalesOrderSpec{"SO-1", "Acme", {{"1", "WIDGET", units(3), ""}}},
                                 "test");
    engine_.link_production("SO-1", "1", "PO-1");

    // When
    auto view = fulfillment::view_of(*engine_.sales_orders().record_shipment("SO-1", "1", units(1),
                                                                            "shipping"));

    // Then
    EXPECT_EQ(view.sales_order_id(), "SO-1");
    EXPECT_EQ(view.status(), "open");
    ASSERT_EQ(view.lines_size(), 1);
    EXPECT_EQ(view.lines(0).production_order_id(), "PO-1");
    EXPECT_EQ(view.lines(0).quantity_shipped(), units(1));
}
