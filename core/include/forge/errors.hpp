#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include "forge/quantity.hpp"

namespace forge {

/**
 * Base exception for all engine errors.
 */
class EngineError : public std::runtime_error {
public:
    enum class StatusCode {
        InvalidArgument,
        FailedPrecondition,
        NotFound,
        Aborted
    };

    EngineError(const std::string& message, StatusCode code)
        : std::runtime_error(message), code_(code) {}

    StatusCode code() const { return code_; }

    /**
     * Returns true if this is a "not found" error.
     */
    bool is_not_found() const { return code_ == StatusCode::NotFound; }

    /**
     * Returns true if this is a "precondition failed" error.
     */
    bool is_precondition_failed() const { return code_ == StatusCode::FailedPrecondition; }

    /**
     * Returns true if this is an "invalid argument" error.
     */
    bool is_invalid_argument() const { return code_ == StatusCode::InvalidArgument; }

private:
    StatusCode code_;
};

/**
 * Thrown when an item's available quantity cannot cover a request.
 * Recoverable: the caller gets the exact shortfall to act on.
 */
class ShortageError : public EngineError {
public:
    ShortageError(const std::string& item_id, Quantity requested, Quantity available)
        : EngineError("Insufficient stock for " + item_id + ": requested " +
                          format_quantity(requested) + ", available " +
                          format_quantity(available) + ", short by " +
                          format_quantity(requested - available),
                      StatusCode::FailedPrecondition),
          item_id_(item_id), requested_(requested), available_(available) {}

    const std::string& item_id() const { return item_id_; }
    Quantity requested() const { return requested_; }
    Quantity available() const { return available_; }
    Quantity short_by() const { return requested_ - available_; }

private:
    std::string item_id_;
    Quantity requested_;
    Quantity available_;
};

/**
 * One unmet material prerequisite of an operation.
 */
struct BlockingIssue {
    std::string item_id;
    std::string allocation_id;
    Quantity required = 0;
    Quantity available = 0;
    Quantity short_by = 0;
};

/**
 * Thrown when an operation cannot start because of unmet prerequisites.
 */
class BlockedError : public EngineError {
public:
    BlockedError(const std::string& production_order_id, uint32_t sequence,
                 std::vector<BlockingIssue> issues)
        : EngineError(describe(production_order_id, sequence, issues),
                      StatusCode::FailedPrecondition),
          production_order_id_(production_order_id), sequence_(sequence),
          issues_(std::move(issues)) {}

    const std::string& production_order_id() const { return production_order_id_; }
    uint32_t sequence() const { return sequence_; }
    const std::vector<BlockingIssue>& issues() const { return issues_; }

private:
    static std::string describe(const std::string& production_order_id, uint32_t sequence,
                                const std::vector<BlockingIssue>& issues) {
        std::string message = "Operation " + std::to_string(sequence) + " of " +
                              production_order_id + " blocked by material shortages:";
        for (const auto& issue : issues) {
            message += " " + issue.item_id + " short by " + format_quantity(issue.short_by) + ";";
        }
        return message;
    }

    std::string production_order_id_;
    uint32_t sequence_;
    std::vector<BlockingIssue> issues_;
};

/**
 * Thrown on a transition out of a terminal or incompatible state.
 * Seeing one means a programming error or a lost race.
 */
class InvalidTransitionError : public EngineError {
public:
    InvalidTransitionError(const std::string& entity, const std::string& from,
                           const std::string& action)
        : EngineError("Cannot " + action + " " + entity + " in status '" + from + "'",
                      StatusCode::FailedPrecondition),
          entity_(entity), from_(from), action_(action) {}

    const std::string& entity() const { return entity_; }
    const std::string& from() const { return from_; }
    const std::string& action() const { return action_; }

private:
    std::string entity_;
    std::string from_;
    std::string action_;
};

/**
 * Thrown when an audited change arrives without a reason.
 * Always raised before any mutation.
 */
class ReasonRequiredError : public EngineError {
public:
    explicit ReasonRequiredError(const std::string& field)
        : EngineError(field + " is required", StatusCode::InvalidArgument), field_(field) {}

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

/**
 * Thrown when an invalid argument is provided.
 */
class InvalidArgumentError : public EngineError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : EngineError(message, StatusCode::InvalidArgument) {}
};

/**
 * Thrown when a referenced aggregate does not exist.
 */
class NotFoundError : public EngineError {
public:
    explicit NotFoundError(const std::string& message)
        : EngineError(message, StatusCode::NotFound) {}
};

/**
 * Thrown when a shared resource is held by another operation.
 */
class ConflictError : public EngineError {
public:
    explicit ConflictError(const std::string& message)
        : EngineError(message, StatusCode::Aborted) {}
};

} // namespace forge
