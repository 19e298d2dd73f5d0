#include "rg/core/util/Decimal.hpp"
#include "rg/core/util/Errors.hpp"

#include <limits>
#include <stdexcept>

namespace rg {

namespace {

// Intermediate type wide enough that squares of dp-rounded roots stay exact.
using Wide = boost::multiprecision::cpp_dec_float_100;

void checkPlaces(int dp)
{
    if (dp < 0 || dp > kMaxDecimalPlaces) {
        throw ArithmeticDomainError("decimal places out of range: " + std::to_string(dp));
    }
}

template<typename N>
void requireFinite(const N& v, const char* what)
{
    if (!(boost::multiprecision::isfinite)(v)) {
        throw ArithmeticDomainError(std::string(what) + ": non-finite value");
    }
}

template<typename N>
N scaleOf(int exponent)
{
    return N(("1e" + std::to_string(exponent)).c_str());
}

template<typename N>
bool isOdd(const N& integral)
{
    N half = boost::multiprecision::trunc(integral / 2);
    return half * 2 != integral;
}

template<typename N>
bool roundsAway(RoundingMode rm, bool negative, const N& absFrac, const N& truncated)
{
    const N half("0.5");
    switch (rm) {
        case RoundingMode::Up:       return true;
        case RoundingMode::Down:     return false;
        case RoundingMode::Ceiling:  return !negative;
        case RoundingMode::Floor:    return negative;
        case RoundingMode::HalfUp:   return absFrac >= half;
        case RoundingMode::HalfDown: return absFrac > half;
        case RoundingMode::HalfEven:
            if (absFrac != half) return absFrac > half;
            return isOdd(truncated);
    }
    return false;
}

} // namespace

Decimal roundTo(const Decimal& v, int dp, RoundingMode rm)
{
    checkPlaces(dp);
    requireFinite(v, "roundTo");

    Wide scaled = Wide(v) * scaleOf<Wide>(dp);
    Wide truncated = boost::multiprecision::trunc(scaled);
    Wide frac = scaled - truncated;
    if (frac == 0) {
        return v;
    }
    bool negative = scaled < 0;
    if (roundsAway(rm, negative, Wide(boost::multiprecision::abs(frac)), truncated)) {
        truncated += negative ? -1 : 1;
    }
    return Decimal(Wide(truncated * scaleOf<Wide>(-dp)));
}

Decimal sqrtTo(const Decimal& v, int dp, RoundingMode rm)
{
    checkPlaces(dp);
    requireFinite(v, "sqrtTo");
    if (v < 0) {
        throw ArithmeticDomainError("sqrtTo: negative argument " + toString(v));
    }

    const Wide w(v);
    const Wide ulp = scaleOf<Wide>(-dp);
    Wide lo = boost::multiprecision::trunc(Wide(boost::multiprecision::sqrt(w)) * scaleOf<Wide>(dp)) * ulp;

    // Correct the candidate so that lo^2 <= v < (lo + ulp)^2.
    while (lo > 0 && lo * lo > w) {
        lo -= ulp;
    }
    while ((lo + ulp) * (lo + ulp) <= w) {
        lo += ulp;
    }
    if (lo * lo == w) {
        return Decimal(lo);
    }

    const Wide hi = lo + ulp;
    switch (rm) {
        case RoundingMode::Down:
        case RoundingMode::Floor:
            return Decimal(lo);
        case RoundingMode::Up:
        case RoundingMode::Ceiling:
            return Decimal(hi);
        case RoundingMode::HalfUp:
        case RoundingMode::HalfDown:
        case RoundingMode::HalfEven: {
            const Wide mid = lo + ulp / 2;
            const Wide mid2 = mid * mid;
            if (w > mid2) return Decimal(hi);
            if (w < mid2) return Decimal(lo);
            if (rm == RoundingMode::HalfUp) return Decimal(hi);
            if (rm == RoundingMode::HalfDown) return Decimal(lo);
            return isOdd(Wide(lo * scaleOf<Wide>(dp))) ? Decimal(hi) : Decimal(lo);
        }
    }
    return Decimal(lo);
}

Decimal distance(const Decimal& x1, const Decimal& y1,
                 const Decimal& x2, const Decimal& y2,
                 int dp, RoundingMode rm)
{
    Decimal dx = x1 - x2;
    Decimal dy = y1 - y2;
    return sqrtTo(dx * dx + dy * dy, dp, rm);
}

std::int64_t floorToIndex(const Decimal& v)
{
    requireFinite(v, "floorToIndex");
    Decimal f = boost::multiprecision::floor(v);
    if (f < Decimal(std::numeric_limits<std::int64_t>::min()) ||
        f > Decimal(std::numeric_limits<std::int64_t>::max())) {
        throw ArithmeticDomainError("index out of 64-bit range: " + toString(f));
    }
    return f.convert_to<std::int64_t>();
}

Decimal parseDecimal(const std::string& text)
{
    Decimal d;
    try {
        d = Decimal(text.c_str());
    } catch (const std::runtime_error& e) {
        throw ConfigError("not a decimal number: '" + text + "' (" + e.what() + ")");
    }
    if (!(boost::multiprecision::isfinite)(d)) {
        throw ConfigError("not a finite decimal number: '" + text + "'");
    }
    return d;
}

std::string toString(const Decimal& v)
{
    std::string s = v.str(0, std::ios_base::fixed);
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

RoundingMode roundingModeFromString(const std::string& name)
{
    if (name == "up") return RoundingMode::Up;
    if (name == "down") return RoundingMode::Down;
    if (name == "ceiling") return RoundingMode::Ceiling;
    if (name == "floor") return RoundingMode::Floor;
    if (name == "half_up") return RoundingMode::HalfUp;
    if (name == "half_down") return RoundingMode::HalfDown;
    if (name == "half_even") return RoundingMode::HalfEven;
    throw ConfigError("unknown rounding mode: " + name);
}

} // namespace rg
