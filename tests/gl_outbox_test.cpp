#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include "forge/logging.hpp"
#include "forge/quantity.hpp"
#include "gl_outbox.hpp"

using namespace forge;
using namespace forge::inventory;

class GlOutboxTest : public ::testing::Test {
protected:
    void SetUp() override { set_log_stream(&log_); }
    void TearDown() override { set_log_stream(nullptr); }

    GlPosting posting(const std::string& transaction_id) {
        GlPosting result;
        result.set_transaction_id(transaction_id);
        result.set_item_id("PLA-BLACK");
        result.set_quantity_delta(units(-1));
        return result;
    }

    std::ostringstream log_;
    GlOutbox outbox_;
    RecordingGlSink sink_;
};

TEST_F(GlOutboxTest, Enqueue_SameTransactionTwice_ShouldQueueOnce) {
    EXPECT_TRUE(outbox_.enqueue(posting("TXN-1")));
    EXPECT_FALSE(outbox_.enqueue(posting("TXN-1")));
    EXPECT_EQ(outbox_.pending(), 1u);
}

TEST_F(GlOutboxTest, Drain_ShouldDeliverInOrder) {
    outbox_.enqueue(posting("TXN-1"));
    outbox_.enqueue(posting("TXN-2"));

    auto report = outbox_.drain(sink_);

    EXPECT_EQ(report.delivered, 2u);
    EXPECT_EQ(report.pending, 0u);
    auto delivered = sink_.postings();
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(delivered[0].transaction_id(), "TXN-1");
    EXPECT_EQ(delivered[1].transaction_id(), "TXN-2");
}

TEST_F(GlOutboxTest, Drain_WhenSinkFails_ShouldKeepFailedPostingAtHead) {
    // Given
    outbox_.enqueue(posting("TXN-1"));
    outbox_.enqueue(posting("TXN-2"));
    outbox_.enqueue(posting("TXN-3"));
    sink_.fail_next(1);

    // When
    auto first = outbox_.drain(sink_);

    // Then
    EXPECT_EQ(first.delivered, 0u);
    EXPECT_EQ(first.failed, 1u);
    EXPECT_EQ(first.pending, 3u);
    EXPECT_NE(log_.str().find("gl_posting_failed"), std::string::npos);

    auto second = outbox_.drain(sink_);
    EXPECT_EQ(second.delivered, 3u);
    EXPECT_EQ(sink_.postings().front().transaction_id(), "TXN-1");
}

TEST_F(GlOutboxTest, Drain_ShouldForgetDeliveredTransactionIds) {
    // Given
    outbox_.enqueue(posting("TXN-1"));
    outbox_.enqueue(posting("TXN-2"));
    outbox_.enqueue(posting("TXN-3"));
    sink_.fail_next(1);
    outbox_.drain(sink_, 1);
    EXPECT_EQ(outbox_.tracked(), 3u);

    // When
    outbox_.drain(sink_, 2);

    // Then only the undelivered posting is still tracked
    EXPECT_EQ(outbox_.tracked(), 1u);
    EXPECT_FALSE(outbox_.enqueue(posting("TXN-3")));

    outbox_.drain(sink_);
    EXPECT_EQ(outbox_.tracked(), 0u);
    EXPECT_EQ(outbox_.pending(), 0u);
}

TEST_F(GlOutboxTest, Drain_WithBatchLimit_ShouldLeaveRest) {
    outbox_.enqueue(posting("TXN-1"));
    outbox_.enqueue(posting("TXN-2"));

    auto report = outbox_.drain(sink_, 1);

    EXPECT_EQ(report.delivered, 1u);
    EXPECT_EQ(report.pending, 1u);
}

TEST_F(GlOutboxTest, Dispatcher_Stop_ShouldFlushQueue) {
    outbox_.enqueue(posting("TXN-1"));
    {
        GlOutboxDispatcher dispatcher(outbox_, sink_, std::chrono::milliseconds(10000));
        dispatcher.start();
        outbox_.enqueue(posting("TXN-2"));
        dispatcher.stop();
    }

    EXPECT_EQ(outbox_.pending(), 0u);
    EXPECT_EQ(sink_.postings().size(), 2u);
}

TEST_F(GlOutboxTest, PostingFor_ShouldCarryTransactionIdentity) {
    InventoryTransaction transaction;
    transaction.set_transaction_id("TXN-9");
    transaction.set_item_id("PLA-BLACK");
    transaction.set_quantity_delta(units(3));
    transaction.set_unit_cost(units(20));
    transaction.set_reference_type("purchase_order");
    transaction.set_reference_id("PO-1");

    auto result = outbox_.posting_for(transaction);

    EXPECT_EQ(result.transaction_id(), "TXN-9");
    EXPECT_EQ(result.quantity_delta(), units(3));
    EXPECT_EQ(result.unit_cost(), units(20));
    EXPECT_EQ(result.reference_id(), "PO-1");
}

TEST_F(GlOutboxTest, Drain_IntoLoggingSink_ShouldLogEachPosting) {
    // Given
    LoggingGlSink sink;
    outbox_.enqueue(posting("TXN-1"));
    outbox_.enqueue(posting("TXN-2"));

    // When
    auto report = outbox_.drain(sink);

    // Then
    EXPECT_EQ(report.delivered, 2u);
    EXPECT_EQ(outbox_.tracked(), 0u);
    auto output = log_.str();
    auto first = output.find("\"transaction_id\":\"TXN-1\"");
    auto second = output.find("\"transaction_id\":\"TXN-2\"");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
    EXPECT_NE(output.find("gl_posted"), std::string::npos);
    EXPECT_NE(output.find("\"quantity_delta\":\"-1\""), std::string::npos);
}
