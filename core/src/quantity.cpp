#include "forge/quantity.hpp"
#include "forge/errors.hpp"
#include <cctype>
#include <limits>

namespace forge {

Quantity parse_quantity(const std::string& text) {
    if (text.empty()) throw InvalidArgumentError("Quantity must not be empty");

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        pos = 1;
    }

    int64_t whole = 0;
    int64_t fraction = 0;
    int fraction_digits = 0;
    bool seen_digit = false;
    bool seen_point = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_point) throw InvalidArgumentError("Malformed quantity: " + text);
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidArgumentError("Malformed quantity: " + text);
        }
        seen_digit = true;
        int digit = c - '0';
        if (seen_point) {
            if (++fraction_digits > 4) {
                throw InvalidArgumentError("Quantity has more than four decimals: " + text);
            }
            fraction = fraction * 10 + digit;
        } else {
            if (whole > (std::numeric_limits<int64_t>::max() / QUANTITY_SCALE - digit) / 10) {
                throw InvalidArgumentError("Quantity out of range: " + text);
            }
            whole = whole * 10 + digit;
        }
    }
    if (!seen_digit) throw InvalidArgumentError("Malformed quantity: " + text);

    for (int i = fraction_digits; i < 4; ++i) fraction *= 10;
    Quantity value = whole * QUANTITY_SCALE + fraction;
    return negative ? -value : value;
}

std::string format_quantity(Quantity quantity) {
    bool negative = quantity < 0;
    // Magnitude as unsigned so INT64_MIN survives.
    uint64_t magnitude = negative ? 0 - static_cast<uint64_t>(quantity) : static_cast<uint64_t>(quantity);
    uint64_t whole = magnitude / QUANTITY_SCALE;
    uint64_t fraction = magnitude % QUANTITY_SCALE;

    std::string result = negative ? "-" : "";
    result += std::to_string(whole);
    if (fraction != 0) {
        std::string digits = std::to_string(fraction);
        digits.insert(0, 4 - digits.size(), '0');
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        result += "." + digits;
    }
    return result;
}

Quantity ceil_to_increment(Quantity quantity, Quantity increment) {
    if (quantity < 0) throw InvalidArgumentError("Cannot round a negative quantity");
    if (increment <= 1) return quantity;
    Quantity remainder = quantity % increment;
    return remainder == 0 ? quantity : quantity + (increment - remainder);
}

Quantity scaled_requirement(Quantity quantity_per, Quantity count, Quantity scrap_factor,
                            Quantity increment) {
    if (quantity_per < 0 || count < 0 || scrap_factor < 0) {
        throw InvalidArgumentError("Requirement inputs must be non-negative");
    }
    // Three fixed-point factors: divide by scale squared, rounding up.
    using Wide = __int128;
    const Wide denominator = static_cast<Wide>(QUANTITY_SCALE) * QUANTITY_SCALE;
    Wide numerator = static_cast<Wide>(quantity_per) * count * (QUANTITY_SCALE + scrap_factor);
    Wide value = (numerator + denominator - 1) / denominator;
    if (value > std::numeric_limits<Quantity>::max()) {
        throw InvalidArgumentError("Requirement out of range");
    }
    return ceil_to_increment(static_cast<Quantity>(value), increment);
}

uint32_t percent_half_up(int64_t numerator, int64_t denominator) {
    if (denominator <= 0) return 0;
    return static_cast<uint32_t>((200 * numerator + denominator) / (2 * denominator));
}

} // namespace forge
