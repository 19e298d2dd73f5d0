#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <cstdint>
#include <string>
#include <type_traits>

namespace rg {

/**
 * @brief Decimal number used for coordinates, distances and sums.
 *
 * 50 significant decimal digits. Cell coordinates and sums of cell values are
 * held in this type so that distance comparisons are reproducible and the
 * running sum of an integer grid is exact.
 */
using Decimal = boost::multiprecision::cpp_dec_float_50;

enum class RoundingMode {
    Up,        // away from zero
    Down,      // towards zero
    Ceiling,   // towards +inf
    Floor,     // towards -inf
    HalfUp,
    HalfDown,
    HalfEven
};

inline constexpr int kMaxDecimalPlaces = 30;

/**
 * @brief Round @p v to @p dp decimal places.
 * @throws ArithmeticDomainError if dp is outside [0, kMaxDecimalPlaces] or v is not finite
 */
Decimal roundTo(const Decimal& v, int dp, RoundingMode rm);

/**
 * @brief Square root rounded to @p dp decimal places.
 *
 * The result is the exact square root rounded with @p rm, so an exact root
 * (e.g. sqrt(25) at any dp) is returned exactly in every mode.
 * @throws ArithmeticDomainError for negative input or invalid dp
 */
Decimal sqrtTo(const Decimal& v, int dp, RoundingMode rm);

// Euclidean distance between (x1, y1) and (x2, y2), rounded like sqrtTo.
Decimal distance(const Decimal& x1, const Decimal& y1,
                 const Decimal& x2, const Decimal& y2,
                 int dp, RoundingMode rm);

// Largest integer <= v as a 64-bit index. Throws ArithmeticDomainError when it does not fit.
std::int64_t floorToIndex(const Decimal& v);

// Parses a plain or exponent-form decimal. Throws ConfigError on malformed text.
Decimal parseDecimal(const std::string& text);

// Shortest fixed-point text (no trailing zeros).
std::string toString(const Decimal& v);

// "up", "down", "ceiling", "floor", "half_up", "half_down", "half_even"
RoundingMode roundingModeFromString(const std::string& name);

template<typename T>
Decimal toDecimal(T v)
{
    if constexpr (std::is_integral_v<T>) {
        return Decimal(static_cast<long long>(v));
    } else {
        return Decimal(static_cast<double>(v));
    }
}

} // namespace rg
