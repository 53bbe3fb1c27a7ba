#include <gtest/gtest.h>
#include <atomic>
#include <sstream>
#include <thread>
#include <vector>
#include "forge/errors.hpp"
#include "forge/logging.hpp"
#include "inventory_ledger.hpp"

using namespace forge;
using namespace forge::inventory;

class InventoryLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_log_stream(&log_);
        ItemSpec spec;
        spec.item_id = "PLA-BLACK";
        spec.unit = "KG";
        spec.standard_cost = units(20);
        ledger_.register_item(spec, "test");
        ledger_.receive("PLA-BLACK", units(10), "Initial count", "test");
    }

    void TearDown() override { set_log_stream(nullptr); }

    DemandRef demand(const std::string& production_order_id, uint32_t sequence = 10) {
        DemandRef ref;
        ref.set_type(DEMAND_PRODUCTION_OPERATION);
        ref.set_production_order_id(production_order_id);
        ref.set_operation_sequence(sequence);
        return ref;
    }

    ConsumptionBasis basis(Quantity quantity_per, Quantity scrap_factor = 0) {
        ConsumptionBasis result;
        result.set_quantity_per(quantity_per);
        result.set_scrap_factor(scrap_factor);
        return result;
    }

    std::ostringstream log_;
    InventoryLedger ledger_;
};

// =============================================================================
// Reservation
// =============================================================================

TEST_F(InventoryLedgerTest, Reserve_WithinAvailable_ShouldReduceAvailableOnly) {
    // When
    auto reservation = ledger_.reserve("PLA-BLACK", units(4), demand("PO-1"), basis(units(1)), "test");

    // Then
    auto item = ledger_.require_item("PLA-BLACK");
    EXPECT_EQ(reservation.allocation_id, "ALLOC-00000001");
    EXPECT_EQ(item->on_hand, units(10));
    EXPECT_EQ(item->allocated, units(4));
    EXPECT_EQ(item->available(), units(6));
    EXPECT_EQ(ledger_.item_for_allocation(reservation.allocation_id).value(), "PLA-BLACK");
}

TEST_F(InventoryLedgerTest, Reserve_BeyondAvailable_ShouldThrowShortageWithoutReserving) {
    try {
        ledger_.reserve("PLA-BLACK", units(12), demand("PO-1"), basis(units(1)), "test");
        FAIL() << "Expected ShortageError";
    } catch (const ShortageError& e) {
        EXPECT_EQ(e.item_id(), "PLA-BLACK");
        EXPECT_EQ(e.requested(), units(12));
        EXPECT_EQ(e.available(), units(10));
        EXPECT_EQ(e.short_by(), units(2));
    }
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->allocated, 0);
}

TEST_F(InventoryLedgerTest, Reserve_ConcurrentSixAgainstTen_ShouldSucceedExactlyOnce) {
    // Given
    std::atomic<int> successes{0};
    std::atomic<int> shortages{0};
    auto attempt = [&](const std::string& order) {
        try {
            ledger_.reserve("PLA-BLACK", units(6), demand(order), basis(units(1)), "test");
            ++successes;
        } catch (const ShortageError&) {
            ++shortages;
        }
    };

    // When
    std::thread first(attempt, "PO-1");
    std::thread second(attempt, "PO-2");
    first.join();
    second.join();

    // Then
    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(shortages.load(), 1);
    auto item = ledger_.require_item("PLA-BLACK");
    EXPECT_EQ(item->allocated, units(6));
    EXPECT_EQ(item->available(), units(4));
}

TEST_F(InventoryLedgerTest, Reserve_ManyThreads_ShouldNeverOverAllocate) {
    std::vector<std::thread> threads;
    std::atomic<int> successes{0};
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&, i] {
            try {
                ledger_.reserve("PLA-BLACK", units(1), demand("PO-" + std::to_string(i)),
                                basis(units(1)), "test");
                ++successes;
            } catch (const ShortageError&) {
            }
        });
    }
    for (auto& thread : threads) thread.join();

    auto item = ledger_.require_item("PLA-BLACK");
    EXPECT_EQ(successes.load(), 10);
    EXPECT_EQ(item->allocated, units(10));
    EXPECT_EQ(item->available(), 0);
}

TEST_F(InventoryLedgerTest, Release_ShouldRestoreAvailable) {
    auto reservation = ledger_.reserve("PLA-BLACK", units(4), demand("PO-1"), basis(units(1)), "test");

    auto released = ledger_.release(reservation.allocation_id, "test");

    EXPECT_EQ(released, units(4));
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->available(), units(10));
    EXPECT_FALSE(ledger_.item_for_allocation(reservation.allocation_id).has_value());
    EXPECT_THROW(ledger_.release(reservation.allocation_id, "test"), NotFoundError);
}

TEST_F(InventoryLedgerTest, Resize_GrowingPastAvailable_ShouldThrowShortage) {
    auto reservation = ledger_.reserve("PLA-BLACK", units(4), demand("PO-1"), basis(units(1)), "test");

    EXPECT_THROW(ledger_.resize(reservation.allocation_id, units(11), "test"), ShortageError);
    EXPECT_EQ(ledger_.resize(reservation.allocation_id, units(7), "test"), units(4));
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->allocated, units(7));
}

// =============================================================================
// Consumption
// =============================================================================

TEST_F(InventoryLedgerTest, Consume_EightGoodTwoBadWithFivePercentScrap_ShouldConsumeTenAndAHalf) {
    // Given
    auto reservation = ledger_.reserve("PLA-BLACK", parse_quantity("10.5"), demand("PO-1"),
                                       basis(units(1), 500), "test");

    // When
    auto consumption = ledger_.consume(
        ConsumeLine{reservation.allocation_id, units(8), units(2), ""},
        Reference{"production_order", "PO-1"}, "test");

    // Then
    EXPECT_EQ(consumption.quantity_consumed, parse_quantity("10.5"));
    EXPECT_EQ(consumption.quantity_released, 0);
    EXPECT_EQ(consumption.transaction.quantity_delta(), -parse_quantity("10.5"));
    EXPECT_EQ(consumption.transaction.kind(), TRANSACTION_CONSUMPTION);
}

TEST_F(InventoryLedgerTest, Consume_LessThanReserved_ShouldReleaseRemainder) {
    // Given
    ledger_.receive("PLA-BLACK", units(10), "Restock", "test");
    auto reservation = ledger_.reserve("PLA-BLACK", units(10), demand("PO-1"), basis(units(1)), "test");

    // When
    auto consumption = ledger_.consume(ConsumeLine{reservation.allocation_id, units(6), 0, ""},
                                       Reference{"production_order", "PO-1"}, "test");

    // Then
    auto item = ledger_.require_item("PLA-BLACK");
    EXPECT_EQ(consumption.quantity_consumed, units(6));
    EXPECT_EQ(consumption.quantity_released, units(4));
    EXPECT_EQ(item->on_hand, units(14));
    EXPECT_EQ(item->allocated, 0);
}

TEST_F(InventoryLedgerTest, Consume_NothingProduced_ShouldPostNoTransaction) {
    auto reservation = ledger_.reserve("PLA-BLACK", units(3), demand("PO-1"), basis(units(1)), "test");
    auto before = ledger_.transactions("PLA-BLACK").size();

    auto consumption = ledger_.consume(ConsumeLine{reservation.allocation_id, 0, 0, ""},
                                       Reference{"production_order", "PO-1"}, "test");

    EXPECT_EQ(consumption.quantity_consumed, 0);
    EXPECT_TRUE(consumption.transaction.transaction_id().empty());
    EXPECT_EQ(ledger_.transactions("PLA-BLACK").size(), before);
}

TEST_F(InventoryLedgerTest, Commit_WithOneBadLine_ShouldChangeNothing) {
    // Given
    ItemSpec widget;
    widget.item_id = "WIDGET";
    ledger_.register_item(widget, "test");
    auto reservation = ledger_.reserve("PLA-BLACK", units(5), demand("PO-1"), basis(units(1)), "test");

    LedgerBatch batch;
    batch.consumes.push_back(ConsumeLine{reservation.allocation_id, units(5), 0, ""});
    batch.consumes.push_back(ConsumeLine{"ALLOC-MISSING", units(1), 0, ""});
    batch.receipts.push_back(ReceiptLine{"WIDGET", units(5), TRANSACTION_PRODUCTION_RECEIPT, "Done"});
    batch.reference = Reference{"production_order", "PO-1"};
    batch.actor = "test";

    // When / Then
    EXPECT_THROW(ledger_.commit(batch), NotFoundError);
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->on_hand, units(10));
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->allocated, units(5));
    EXPECT_EQ(ledger_.require_item("WIDGET")->on_hand, 0);
}

// =============================================================================
// Adjustments and spools
// =============================================================================

TEST_F(InventoryLedgerTest, Adjust_WithEmptyReason_ShouldChangeNothing) {
    // Given
    auto transactions_before = ledger_.transactions("PLA-BLACK").size();
    auto pending_before = ledger_.outbox().pending();

    // When / Then
    EXPECT_THROW(ledger_.adjust("PLA-BLACK", units(-2), "", "test"), ReasonRequiredError);
    EXPECT_THROW(ledger_.adjust("PLA-BLACK", units(-2), "   ", "test"), ReasonRequiredError);
    EXPECT_EQ(ledger_.transactions("PLA-BLACK").size(), transactions_before);
    EXPECT_EQ(ledger_.outbox().pending(), pending_before);
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->on_hand, units(10));
}

TEST_F(InventoryLedgerTest, Adjust_BelowZero_ShouldThrowShortage) {
    EXPECT_THROW(ledger_.adjust("PLA-BLACK", units(-11), "Cycle count", "test"), ShortageError);
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->on_hand, units(10));
}

TEST_F(InventoryLedgerTest, Adjust_WithReason_ShouldPostTransactionAndQueueGlPosting) {
    auto pending_before = ledger_.outbox().pending();

    auto transaction = ledger_.adjust("PLA-BLACK", units(-2), "Cycle count", "auditor");

    EXPECT_EQ(transaction.quantity_delta(), units(-2));
    EXPECT_EQ(transaction.reason(), "Cycle count");
    EXPECT_EQ(transaction.actor(), "auditor");
    EXPECT_EQ(transaction.unit_cost(), units(20));
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->on_hand, units(8));
    EXPECT_EQ(ledger_.outbox().pending(), pending_before + 1);
}

TEST_F(InventoryLedgerTest, AdjustSpool_SameWeight_ShouldBeNoOpWithoutReason) {
    // Given
    SpoolSpec spool{"SPOOL-1", "PLA-BLACK", units(1), "LOT-7", {}};
    ledger_.register_spool(spool, "Received", "test");
    auto transactions_before = ledger_.transactions("PLA-BLACK").size();

    // When
    auto result = ledger_.adjust_spool("SPOOL-1", units(1), "", "test");

    // Then
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(ledger_.transactions("PLA-BLACK").size(), transactions_before);
}

TEST_F(InventoryLedgerTest, AdjustSpool_ChangedWeightWithoutReason_ShouldThrow) {
    SpoolSpec spool{"SPOOL-1", "PLA-BLACK", units(1), "LOT-7", {}};
    ledger_.register_spool(spool, "Received", "test");

    EXPECT_THROW(ledger_.adjust_spool("SPOOL-1", parse_quantity("0.8"), "", "test"),
                 ReasonRequiredError);
    EXPECT_EQ(ledger_.spool("SPOOL-1")->current_weight, units(1));
}

TEST_F(InventoryLedgerTest, AdjustSpool_WeighedLighter_ShouldPostNegativeDelta) {
    SpoolSpec spool{"SPOOL-1", "PLA-BLACK", units(1), "LOT-7", {}};
    ledger_.register_spool(spool, "Received", "test");

    auto transaction = ledger_.adjust_spool("SPOOL-1", parse_quantity("0.75"), "Weighed", "test");

    ASSERT_TRUE(transaction.has_value());
    EXPECT_EQ(transaction->quantity_delta(), -parse_quantity("0.25"));
    EXPECT_EQ(transaction->spool_id(), "SPOOL-1");
    EXPECT_EQ(ledger_.spool("SPOOL-1")->current_weight, parse_quantity("0.75"));
    EXPECT_EQ(ledger_.require_item("PLA-BLACK")->on_hand, parse_quantity("10.75"));
}

TEST_F(InventoryLedgerTest, EventBook_ShouldRebuildPublishedState) {
    ledger_.reserve("PLA-BLACK", units(4), demand("PO-1"), basis(units(1)), "test");
    ledger_.adjust("PLA-BLACK", units(1), "Found stock", "test");

    auto rebuilt = ItemState::from_event_book(ledger_.event_book("PLA-BLACK"));
    auto published = ledger_.require_item("PLA-BLACK");

    EXPECT_EQ(rebuilt.on_hand, published->on_hand);
    EXPECT_EQ(rebuilt.allocated, published->allocated);
    EXPECT_EQ(rebuilt.reservations.size(), 1u);
}

TEST_F(InventoryLedgerTest, UnknownItem_ShouldThrowNotFound) {
    EXPECT_EQ(ledger_.item("MISSING"), nullptr);
    EXPECT_THROW(ledger_.require_item("MISSING"), NotFoundError);
    EXPECT_THROW(ledger_.receive("MISSING", units(1), "Receipt", "test"), NotFoundError);
}
