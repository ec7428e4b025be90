#include <deepeq/ChainComparer.hh>

#include <cmath>
#include <cstdint>
#include <cstring>
#include <stdexcept>

using namespace deepeq;

namespace
{
    // Integers are compared as sign and magnitude so that any mix of signed and unsigned 64-bit
    // values can be compared without overflow.
    struct Magnitude
    {
        bool negative;
        unsigned long long abs;
    };

    Magnitude
    magnitude(ValueHandle const& v)
    {
        if (v.isUnsigned()) {
            return {false, v.getUIntValue()};
        }
        long long i = v.getIntValue();
        if (i < 0) {
            return {true, 0ULL - static_cast<unsigned long long>(i)};
        }
        return {false, static_cast<unsigned long long>(i)};
    }

    long double
    to_long_double(Magnitude const& m)
    {
        long double result = static_cast<long double>(m.abs);
        return m.negative ? -result : result;
    }

    double
    to_double(ValueHandle const& v)
    {
        if (v.isReal()) {
            return v.getRealValue();
        }
        if (v.isUnsigned()) {
            return static_cast<double>(v.getUIntValue());
        }
        return static_cast<double>(v.getIntValue());
    }

    // Map the bits of a floating point number onto an unsigned integer whose order matches the
    // order of the numbers, so the distance in units in the last place is a subtraction. Both
    // zeroes map to the same point.
    uint64_t
    ordered_bits(double d)
    {
        uint64_t u;
        memcpy(&u, &d, sizeof(u));
        static uint64_t const sign = 1ULL << 63;
        return (u & sign) ? (sign - (u & ~sign)) : (sign + u);
    }

    uint64_t
    ordered_bits(float f)
    {
        uint32_t u;
        memcpy(&u, &f, sizeof(u));
        static uint32_t const sign = 1U << 31;
        uint64_t magnitude = u & ~sign;
        return (u & sign) ? (sign - magnitude) : (sign + magnitude);
    }

    template <typename T>
    bool
    same_bits(T a, T b)
    {
        return memcmp(&a, &b, sizeof(T)) == 0;
    }

    // Percent tolerances are checked as |e - a| * 100 <= |e * amount| so that a difference of
    // exactly the allowed percentage is accepted.
    template <typename T>
    bool
    within(T expected, T actual, Tolerance const& tolerance)
    {
        if (!(std::isfinite(expected) && std::isfinite(actual))) {
            return same_bits(expected, actual);
        }
        switch (tolerance.getMode()) {
        case tm_linear:
            return static_cast<double>(std::fabs(expected - actual)) <= tolerance.getAmount();

        case tm_percent:
            if (expected == 0) {
                return actual == 0;
            }
            return static_cast<double>(std::fabs(expected - actual)) * 100.0 <=
                std::fabs(static_cast<double>(expected) * tolerance.getAmount());

        case tm_ulps:
            {
                uint64_t e = ordered_bits(expected);
                uint64_t a = ordered_bits(actual);
                uint64_t distance = (e > a) ? (e - a) : (a - e);
                return distance <= static_cast<uint64_t>(tolerance.getUlps());
            }

        default:
            return expected == actual;
        }
    }

    bool
    integers_within(ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance)
    {
        Magnitude e = magnitude(x);
        Magnitude a = magnitude(y);
        bool exact = (e.abs == a.abs) && ((e.negative == a.negative) || (e.abs == 0));
        switch (tolerance.getMode()) {
        case tm_linear:
            return exact ||
                (std::fabs(to_long_double(e) - to_long_double(a)) <=
                 static_cast<long double>(tolerance.getAmount()));

        case tm_percent:
            if (exact || (e.abs == 0)) {
                return exact;
            }
            return std::fabs(to_long_double(e) - to_long_double(a)) * 100.0L <=
                std::fabs(to_long_double(e) * static_cast<long double>(tolerance.getAmount()));

        case tm_ulps:
            throw std::logic_error("a tolerance in units in the last place requires floating point"
                                   " values; integers were compared");

        default:
            return exact;
        }
    }
} // namespace

char const*
CC_Numerics::getName() const
{
    return "numerics";
}

ChainComparer::verdict_e
CC_Numerics::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState&)
{
    if (!(x.isNumber() && y.isNumber())) {
        return v_not_applicable;
    }
    if (tolerance.getMode() == tm_time) {
        throw std::logic_error(
            "a time tolerance was used to compare numbers: " + x.unparse() + " and " +
            y.unparse());
    }

    bool x_double = x.isReal() && !x.isSingle();
    bool y_double = y.isReal() && !y.isSingle();
    if (x_double || y_double) {
        return verdict(within(to_double(x), to_double(y), tolerance));
    }
    if (x.isSingle() || y.isSingle()) {
        return verdict(within(
            static_cast<float>(to_double(x)), static_cast<float>(to_double(y)), tolerance));
    }
    return verdict(integers_within(x, y, tolerance));
}
