#pragma once

#include <cstdint>
#include <string>

namespace forge {

/**
 * Fixed-point decimal with four fractional digits: 1.0 is 10000.
 * Used for stock quantities, scrap factors and unit costs.
 */
using Quantity = int64_t;

constexpr Quantity QUANTITY_SCALE = 10000;

/**
 * Whole units to fixed point.
 */
constexpr Quantity units(int64_t whole) { return whole * QUANTITY_SCALE; }

/**
 * Parse a decimal string such as "10.5" or "-0.25".
 * Throws InvalidArgumentError on malformed input or more than four decimals.
 */
Quantity parse_quantity(const std::string& text);

/**
 * Render without trailing zeros: 105000 -> "10.5".
 */
std::string format_quantity(Quantity quantity);

/**
 * Round a non-negative quantity up to a multiple of increment.
 */
Quantity ceil_to_increment(Quantity quantity, Quantity increment);

/**
 * quantity_per * count * (1 + scrap_factor), rounded up to increment.
 * All arguments are fixed point.
 */
Quantity scaled_requirement(Quantity quantity_per, Quantity count, Quantity scrap_factor,
                            Quantity increment);

/**
 * round(100 * numerator / denominator), halves rounded up. 0 when denominator is 0.
 */
uint32_t percent_half_up(int64_t numerator, int64_t denominator);

} // namespace forge
