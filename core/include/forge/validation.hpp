#pragma once

#include <string>
#include <vector>
#include "errors.hpp"

namespace forge {
namespace validation {

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw InvalidArgumentError(field_name + " must be positive");
    }
}

/**
 * Require that a value is non-negative (zero or greater).
 */
template<typename T>
void require_non_negative(T value, const std::string& field_name = "value") {
    if (value < 0) {
        throw InvalidArgumentError(field_name + " must be non-negative");
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

/**
 * Require that a collection is not empty.
 */
template<typename T>
void require_not_empty(const std::vector<T>& collection, const std::string& field_name = "collection") {
    if (collection.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

/**
 * Require an audit reason: non-empty after trimming whitespace.
 */
inline void require_reason(const std::string& reason, const std::string& field_name = "reason") {
    if (reason.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ReasonRequiredError(field_name);
    }
}

} // namespace validation
} // namespace forge
