#include <gtest/gtest.h>
#include <google/protobuf/util/message_differencer.h>
#include <sstream>
#include "forge/errors.hpp"
#include "forge/helpers.hpp"
#include "forge/logging.hpp"
#include "fulfillment_calculator.hpp"

using namespace forge;
using namespace forge::fulfillment;
using google::protobuf::util::MessageDifferencer;

class FulfillmentCalculatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_stream(&log_);
        register_item("BRACKET", units(20));
        register_item("HINGE", units(10));
        register_item("PANEL", 0);
    }

    void TearDown() override { set_log_stream(nullptr); }

    void register_item(const std::string& item_id, Quantity on_hand) {
        inventory::ItemSpec spec;
        spec.item_id = item_id;
        ledger_.register_item(spec, "test");
        if (on_hand > 0) ledger_.receive(item_id, on_hand, "Initial count", "test");
    }

    void place_three_lines() {
        SalesOrderSpec spec;
        spec.sales_order_id = "SO-1";
        spec.customer = "Acme";
        spec.lines = {
            {"1", "BRACKET", units(5), ""},
            {"2", "HINGE", units(10), ""},
            {"3", "PANEL", units(2), ""},
        };
        sales_.place(spec, "test");
    }

    std::ostringstream log_;
    inventory::InventoryLedger ledger_;
    allocation::AllocationStore allocations_{ledger_};
    allocation::InMemoryMasterData master_data_;
    production::ResourceBoard resources_;
    production::ProductionOrders orders_{ledger_, allocations_, master_data_, resources_};
    pegging::InMemoryPurchasing purchasing_;
    pegging::ShortageResolver resolver_{ledger_, allocations_, orders_, purchasing_, 14};
    SalesOrders sales_;
    FulfillmentCalculator calculator_{sales_, ledger_, orders_, resolver_};
};

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_TwoOfThreeReady_ShouldBePartiallyReadyAt67) {
    // Given
    place_three_lines();

    // When
    auto status = calculator_.fulfillment_status("SO-1");

    // Then
    EXPECT_EQ(status.state(), FULFILLMENT_PARTIALLY_READY);
    EXPECT_EQ(status.percent(), 67u);
    ASSERT_EQ(status.lines_size(), 3);
    EXPECT_TRUE(status.lines(0).is_ready());
    EXPECT_TRUE(status.lines(1).is_ready());
    EXPECT_FALSE(status.lines(2).is_ready());
    EXPECT_FALSE(status.lines(2).blocking_reason().empty());
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_ShouldBeIdempotent) {
    place_three_lines();

    auto first = calculator_.fulfillment_status("SO-1");
    auto second = calculator_.fulfillment_status("SO-1");

    EXPECT_TRUE(MessageDifferencer::Equals(first, second));
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_AllLinesStocked_ShouldBeReadyToShip) {
    place_three_lines();
    ledger_.receive("PANEL", units(2), "Receipt", "test");

    auto status = calculator_.fulfillment_status("SO-1");

    EXPECT_EQ(status.state(), FULFILLMENT_READY_TO_SHIP);
    EXPECT_EQ(status.percent(), 100u);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_TwoLinesSharingStock_ShouldNotCountItTwice) {
    // Given 10 hinges on hand and two lines of 6
    SalesOrderSpec spec{"SO-5", "Acme", {{"1", "HINGE", units(6), ""},
                                         {"2", "HINGE", units(6), ""}}};
    sales_.place(spec, "test");

    // When
    auto status = calculator_.fulfillment_status("SO-5");

    // Then
    ASSERT_EQ(status.lines_size(), 2);
    EXPECT_TRUE(status.lines(0).is_ready());
    EXPECT_FALSE(status.lines(1).is_ready());
    EXPECT_EQ(status.lines(1).quantity_available(), units(4));
    EXPECT_EQ(status.state(), FULFILLMENT_PARTIALLY_READY);
    EXPECT_EQ(status.percent(), 50u);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_NoLineReady_ShouldBeBlocked) {
    SalesOrderSpec spec{"SO-2", "Acme", {{"1", "PANEL", units(1), ""}}};
    sales_.place(spec, "test");

    auto status = calculator_.fulfillment_status("SO-2");

    EXPECT_EQ(status.state(), FULFILLMENT_BLOCKED);
    EXPECT_EQ(status.percent(), 0u);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_WithoutLines_ShouldBeBlockedAtZero) {
    sales_.place(SalesOrderSpec{"SO-EMPTY", "Acme", {}}, "test");

    auto status = calculator_.fulfillment_status("SO-EMPTY");

    EXPECT_EQ(status.state(), FULFILLMENT_BLOCKED);
    EXPECT_EQ(status.percent(), 0u);
    EXPECT_EQ(status.lines_size(), 0);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_ItemShortForProduction_ShouldNotBeReady) {
    // Given
    register_item("WIDGET", 0);
    master_data_.set_routing("WIDGET", {{10, "ASSEMBLE", 0, 30}});
    master_data_.set_bom("WIDGET", {{"HINGE", units(2), 0, 10}});
    production::ProductionOrderSpec order;
    order.production_order_id = "PO-1";
    order.item_id = "WIDGET";
    order.quantity_ordered = units(6);
    orders_.create(order, "test");
    orders_.release("PO-1", "test");
    sales_.place(SalesOrderSpec{"SO-3", "Acme", {{"1", "HINGE", units(4), ""}}}, "test");

    // When
    auto status = calculator_.fulfillment_status("SO-3");

    // Then
    ASSERT_EQ(status.lines_size(), 1);
    EXPECT_EQ(status.lines(0).quantity_available(), units(10));
    EXPECT_FALSE(status.lines(0).is_ready());
    EXPECT_EQ(status.state(), FULFILLMENT_BLOCKED);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_PartialShipment_ShouldUseRemainingQuantity) {
    SalesOrderSpec spec{"SO-4", "Acme", {{"1", "PANEL", units(3), ""}}};
    sales_.place(spec, "test");
    ledger_.receive("PANEL", units(1), "Receipt", "test");
    sales_.record_shipment("SO-4", "1", units(2), "shipping");

    auto status = calculator_.fulfillment_status("SO-4");

    EXPECT_EQ(status.lines(0).quantity_remaining(), units(1));
    EXPECT_EQ(status.state(), FULFILLMENT_READY_TO_SHIP);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_Shipped_ShouldNotRecomputeLines) {
    place_three_lines();
    sales_.mark_shipped("SO-1", "UPS", "1Z999", "shipping");

    auto status = calculator_.fulfillment_status("SO-1");

    EXPECT_EQ(status.state(), FULFILLMENT_SHIPPED);
    EXPECT_EQ(status.percent(), 100u);
    EXPECT_EQ(status.lines_size(), 0);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_Cancelled_ShouldReportCancelled) {
    place_three_lines();
    sales_.cancel("SO-1", "Customer request", "test");

    auto status = calculator_.fulfillment_status("SO-1");

    EXPECT_EQ(status.state(), FULFILLMENT_CANCELLED);
    EXPECT_EQ(status.percent(), 0u);
}

TEST_F(FulfillmentCalculatorTest, FulfillmentStatus_UnknownOrder_ShouldThrowNotFound) {
    EXPECT_THROW(calculator_.fulfillment_status("SO-404"), NotFoundError);
}

// =============================================================================
// Sales order lifecycle
// =============================================================================

TEST_F(FulfillmentCalculatorTest, RecordShipment_PastRemaining_ShouldThrow) {
    place_three_lines();
    sales_.record_shipment("SO-1", "1", units(3), "shipping");

    EXPECT_THROW(sales_.record_shipment("SO-1", "1", units(3), "shipping"), InvalidArgumentError);
    EXPECT_THROW(sales_.record_shipment("SO-1", "9", units(1), "shipping"), NotFoundError);
    EXPECT_EQ(sales_.order("SO-1")->find_line("1")->quantity_shipped, units(3));
}

TEST_F(FulfillmentCalculatorTest, ShippedOrder_ShouldRejectFurtherChanges) {
    place_three_lines();
    sales_.mark_shipped("SO-1", "UPS", "1Z999", "shipping");

    EXPECT_THROW(sales_.cancel("SO-1", "Too late", "test"), InvalidTransitionError);
    EXPECT_THROW(sales_.mark_shipped("SO-1", "UPS", "1Z999", "shipping"), InvalidTransitionError);
}

TEST_F(FulfillmentCalculatorTest, Place_DuplicateOrderOrLine_ShouldThrow) {
    place_three_lines();
    EXPECT_THROW(place_three_lines(), InvalidArgumentError);

    SalesOrderSpec duplicate_lines{"SO-9", "Acme", {{"1", "PANEL", units(1), ""},
                                                     {"1", "HINGE", units(1), ""}}};
    EXPECT_THROW(sales_.place(duplicate_lines, "test"), InvalidArgumentError);
}

TEST_F(FulfillmentCalculatorTest, EventBook_ShouldRebuildSalesOrder) {
    place_three_lines();
    sales_.link_production("SO-1", "3", "PO-7", "test");
    sales_.record_shipment("SO-1", "1", units(5), "shipping");

    auto rebuilt = SalesOrderState::from_event_book(sales_.event_book("SO-1"));

    EXPECT_EQ(rebuilt.customer, "Acme");
    EXPECT_EQ(rebuilt.find_line("3")->production_order_id, "PO-7");
    EXPECT_EQ(rebuilt.find_line("1")->remaining(), 0);
}
