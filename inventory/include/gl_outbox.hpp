#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>
#include "forge/inventory.pb.h"

namespace forge::inventory {

/**
 * General-ledger collaborator. Throws on delivery failure.
 */
class GlPostingSink {
public:
    virtual ~GlPostingSink() = default;
    virtual void post(const GlPosting& posting) = 0;
};

/**
 * In-memory sink. fail_next(n) makes the next n deliveries throw.
 */
class RecordingGlSink : public GlPostingSink {
public:
    void post(const GlPosting& posting) override;

    void fail_next(size_t count);
    std::vector<GlPosting> postings() const;

private:
    mutable std::mutex mutex_;
    std::vector<GlPosting> postings_;
    size_t failures_remaining_ = 0;
};

/**
 * Writes each posting to the structured log as gl_posted; the GL side
 * ingests the log keyed by transaction id. Holds no state.
 */
class LoggingGlSink : public GlPostingSink {
public:
    void post(const GlPosting& posting) override;
};

struct DrainReport {
    size_t delivered = 0;
    size_t failed = 0;
    size_t pending = 0;
};

/**
 * Queue of ledger postings awaiting hand-off to the GL.
 *
 * Delivery is FIFO and at-least-once; the transaction id is the idempotency
 * key. An id is refused while it is queued or being delivered and forgotten
 * once the sink accepts it, so memory is bounded by the backlog. The sink
 * must ignore a transaction id it has already posted.
 */
class GlOutbox {
public:
    GlPosting posting_for(const InventoryTransaction& transaction) const;

    /**
     * Returns false if the transaction id is already queued or in flight.
     */
    bool enqueue(const GlPosting& posting);

    /**
     * Deliver up to max_batch postings. Stops at the first failure, which is
     * logged and left at the head of the queue.
     */
    DrainReport drain(GlPostingSink& sink,
                      size_t max_batch = std::numeric_limits<size_t>::max());

    size_t pending() const;
    /// Transaction ids queued or in flight.
    size_t tracked() const;

private:
    mutable std::mutex mutex_;
    std::deque<GlPosting> queue_;
    std::unordered_set<std::string> outstanding_;
};

/**
 * Drains an outbox into a sink on a background thread.
 */
class GlOutboxDispatcher {
public:
    GlOutboxDispatcher(GlOutbox& outbox, GlPostingSink& sink, std::chrono::milliseconds interval);
    ~GlOutboxDispatcher();

    GlOutboxDispatcher(const GlOutboxDispatcher&) = delete;
    GlOutboxDispatcher& operator=(const GlOutboxDispatcher&) = delete;

    void start();
    /// Stops the thread after one final drain.
    void stop();

private:
    void run();

    GlOutbox& outbox_;
    GlPostingSink& sink_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace forge::inventory
