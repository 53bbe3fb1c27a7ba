#include <gtest/gtest.h>
#include <sstream>
#include "forge/errors.hpp"
#include "forge/logging.hpp"
#include "allocation_store.hpp"

using namespace forge;
using namespace forge::allocation;

class AllocationStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_stream(&log_);
        register_item("PLA-BLACK", units(10));
        register_item("INSERT-M3", units(100));
        demand_.set_type(DEMAND_PRODUCTION_OPERATION);
        demand_.set_production_order_id("PO-1");
    }

    void TearDown() override { set_log_stream(nullptr); }

    void register_item(const std::string& item_id, Quantity on_hand) {
        inventory::ItemSpec spec;
        spec.item_id = item_id;
        ledger_.register_item(spec, "test");
        if (on_hand > 0) ledger_.receive(item_id, on_hand, "Initial count", "test");
    }

    std::ostringstream log_;
    inventory::InventoryLedger ledger_;
    AllocationStore store_{ledger_};
    DemandRef demand_;
};

TEST_F(AllocationStoreTest, GenerateRequirements_WithStock_ShouldReserveEachLine) {
    // Given
    std::vector<BomLine> materials{
        {"PLA-BLACK", parse_quantity("0.25"), 0, 10},
        {"INSERT-M3", units(4), 0, 20},
    };

    // When
    auto requirements = store_.generate_requirements("PO-1", materials, units(20), demand_, "test");

    // Then
    ASSERT_EQ(requirements.size(), 2u);
    EXPECT_EQ(requirements[0].quantity, units(5));
    EXPECT_EQ(requirements[0].status, AllocationStatus::Allocated);
    EXPECT_EQ(requirements[0].demand.operation_sequence(), 10u);
    EXPECT_EQ(requirements[1].quantity, units(80));
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->available(), units(5));
    EXPECT_EQ(ledger_.require_item("INSERT-M3")->available(), units(20));
}

TEST_F(AllocationStoreTest, GenerateRequirements_WithoutStock_ShouldLeaveLinePending) {
    // When
    auto requirements = store_.generate_requirements(
        "PO-1", {{"PLA-BLACK", units(1), 0, 10}}, units(12), demand_, "test");

    // Then
    ASSERT_EQ(requirements.size(), 1u);
    EXPECT_EQ(requirements[0].status, AllocationStatus::Pending);
    EXPECT_EQ(requirements[0].quantity_reserved, 0);
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->allocated, 0);
    EXPECT_NE(log_.str().find("requirement_left_pending"), std::string::npos);
}

TEST_F(AllocationStoreTest, GenerateRequirements_Twice_ShouldThrow) {
    store_.generate_requirements("PO-1", {{"PLA-BLACK", units(1), 0, 10}}, units(1), demand_, "test");
    EXPECT_THROW(store_.generate_requirements("PO-1", {{"PLA-BLACK", units(1), 0, 10}}, units(1),
                                              demand_, "test"),
                 InvalidArgumentError);
}

TEST_F(AllocationStoreTest, GenerateRequirements_UnknownComponent_ShouldThrowNotFound) {
    EXPECT_THROW(store_.generate_requirements("PO-1", {{"MISSING", units(1), 0, 10}}, units(1),
                                              demand_, "test"),
                 NotFoundError);
    EXPECT_TRUE(store_.requirements_for("PO-1").empty());
}

TEST_F(AllocationStoreTest, TryReservePending_AfterReceipt_ShouldAllocate) {
    // Given
    store_.generate_requirements("PO-1", {{"PLA-BLACK", units(1), 0, 10}}, units(12), demand_, "test");
    ledger_.receive("PLA-BLACK", units(5), "Purchase receipt", "test");

    // When
    auto still_pending = store_.try_reserve_pending("PO-1", 10, "test");

    // Then
    EXPECT_TRUE(still_pending.empty());
    EXPECT_EQ(store_.requirements_for("PO-1", 10).front().status, AllocationStatus::Allocated);
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->available(), units(3));
}

TEST_F(AllocationStoreTest, Reallocate_AllocatedRequirement_ShouldResizeReservation) {
    auto requirements = store_.generate_requirements(
        "PO-1", {{"PLA-BLACK", units(1), 0, 10}}, units(4), demand_, "test");

    auto updated = store_.reallocate(requirements[0].allocation_id, units(6), "test");

    EXPECT_EQ(updated.quantity, units(6));
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->allocated, units(6));
}

TEST_F(AllocationStoreTest, Reallocate_ReleasedRequirement_ShouldThrowInvalidTransition) {
    auto requirements = store_.generate_requirements(
        "PO-1", {{"PLA-BLACK", units(1), 0, 10}}, units(4), demand_, "test");
    store_.release_order("PO-1", "test");

    EXPECT_THROW(store_.reallocate(requirements[0].allocation_id, units(2), "test"),
                 InvalidTransitionError);
}

TEST_F(AllocationStoreTest, ReleaseOperation_ShouldReturnOnlyThatOperationsStock) {
    // Given
    store_.generate_requirements("PO-1",
                                 {{"PLA-BLACK", units(1), 0, 10}, {"INSERT-M3", units(1), 0, 20}},
                                 units(4), demand_, "test");

    // When
    auto released = store_.release_operation("PO-1", 20, "test");

    // Then
    EXPECT_EQ(released, units(4));
    EXPECT_EQ(ledger_.require_item("INSERT-M3")->allocated, 0);
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->allocated, units(4));
    EXPECT_EQ(store_.requirements_for("PO-1", 20).front().status, AllocationStatus::Released);
}

TEST_F(AllocationStoreTest, ForItem_ShouldListOpenAllocationsAcrossOrders) {
    store_.generate_requirements("PO-1", {{"PLA-BLACK", units(1), 0, 10}}, units(4), demand_, "test");
    DemandRef other = demand_;
    other.set_production_order_id("PO-2");
    store_.generate_requirements("PO-2", {{"PLA-BLACK", units(1), 0, 10}}, units(8), other, "test");

    auto open = store_.for_item("PLA-BLACK");

    ASSERT_EQ(open.size(), 2u);
    int pending = 0;
    for (const auto& allocation : open) {
        if (allocation.status == AllocationStatus::Pending) ++pending;
    }
    EXPECT_EQ(pending, 1);
}

TEST_F(AllocationStoreTest, ConsumptionLines_ShouldCoverAllocatedRequirementsOfOperation) {
    store_.generate_requirements("PO-1",
                                 {{"PLA-BLACK", units(1), 0, 10}, {"INSERT-M3", units(2), 0, 10}},
                                 units(4), demand_, "test");

    auto lines = store_.consumption_lines("PO-1", 10, units(3), units(1));

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].quantity_good, units(3));
    EXPECT_EQ(lines[0].quantity_scrap, units(1));
    EXPECT_EQ(lines[0].reason, "Consumed by PO-1 operation 10");
}
