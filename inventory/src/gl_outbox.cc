#include "gl_outbox.hpp"
#include "forge/logging.hpp"
#include "forge/quantity.hpp"
#include <stdexcept>

namespace forge::inventory {

void RecordingGlSink::post(const GlPosting& posting) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failures_remaining_ > 0) {
        --failures_remaining_;
        throw std::runtime_error("GL unavailable for " + posting.transaction_id());
    }
    postings_.push_back(posting);
}

void RecordingGlSink::fail_next(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_remaining_ = count;
}

std::vector<GlPosting> RecordingGlSink::postings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return postings_;
}

void LoggingGlSink::post(const GlPosting& posting) {
    log_info("gl", "gl_posted", {
        {"transaction_id", posting.transaction_id()},
        {"item_id", posting.item_id()},
        {"quantity_delta", format_quantity(posting.quantity_delta())},
        {"unit_cost", format_quantity(posting.unit_cost())},
        {"reference_type", posting.reference_type()},
        {"reference_id", posting.reference_id()},
        {"reason", posting.reason()}
    });
}

GlPosting GlOutbox::posting_for(const InventoryTransaction& transaction) const {
    GlPosting posting;
    posting.set_transaction_id(transaction.transaction_id());
    posting.set_item_id(transaction.item_id());
    posting.set_quantity_delta(transaction.quantity_delta());
    posting.set_unit_cost(transaction.unit_cost());
    posting.set_reference_type(transaction.reference_type());
    posting.set_reference_id(transaction.reference_id());
    posting.set_reason(transaction.reason());
    return posting;
}

bool GlOutbox::enqueue(const GlPosting& posting) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!outstanding_.insert(posting.transaction_id()).second) return false;
    queue_.push_back(posting);
    return true;
}

DrainReport GlOutbox::drain(GlPostingSink& sink, size_t max_batch) {
    std::vector<GlPosting> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (!queue_.empty() && batch.size() < max_batch) {
            batch.push_back(std::move(queue_.front()));
            queue_.pop_front();
        }
    }

    DrainReport report;
    size_t index = 0;
    for (; index < batch.size(); ++index) {
        try {
            sink.post(batch[index]);
            ++report.delivered;
        } catch (const std::exception& e) {
            ++report.failed;
            log_error("gl", "gl_posting_failed", {
                {"transaction_id", batch[index].transaction_id()},
                {"item_id", batch[index].item_id()},
                {"error", e.what()}
            });
            break;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < index; ++i) {
        outstanding_.erase(batch[i].transaction_id());
    }
    for (size_t i = batch.size(); i > index; --i) {
        queue_.push_front(std::move(batch[i - 1]));
    }
    report.pending = queue_.size();
    return report;
}

size_t GlOutbox::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t GlOutbox::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_.size();
}

GlOutboxDispatcher::GlOutboxDispatcher(GlOutbox& outbox, GlPostingSink& sink,
                                       std::chrono::milliseconds interval)
    : outbox_(outbox), sink_(sink), interval_(interval) {}

GlOutboxDispatcher::~GlOutboxDispatcher() { stop(); }

void GlOutboxDispatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable()) return;
    stopping_ = false;
    thread_ = std::thread(&GlOutboxDispatcher::run, this);
}

void GlOutboxDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!thread_.joinable()) return;
        stopping_ = true;
    }
    wake_.notify_all();
    thread_.join();
}

void GlOutboxDispatcher::run() {
    log_info("gl", "outbox_dispatcher_started", {{"interval_ms", interval_.count()}});
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        wake_.wait_for(lock, interval_, [this] { return stopping_; });
        bool last = stopping_;
        lock.unlock();
        auto report = outbox_.drain(sink_);
        if (report.delivered > 0 || report.failed > 0) {
            log_debug("gl", "outbox_drained", {
                {"delivered", report.delivered},
                {"failed", report.failed},
                {"pending", report.pending}
            });
        }
        lock.lock();
        if (last) break;
    }
    log_info("gl", "outbox_dispatcher_stopped");
}

} // namespace forge::inventory
