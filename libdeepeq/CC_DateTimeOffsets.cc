#include <deepeq/ChainComparer.hh>

using namespace deepeq;

namespace
{
    // Absolute difference of two microsecond counts; exact for any pair of 64-bit values.
    unsigned long long
    distance(long long a, long long b)
    {
        return (a > b) ? (static_cast<unsigned long long>(a) - static_cast<unsigned long long>(b))
                       : (static_cast<unsigned long long>(b) - static_cast<unsigned long long>(a));
    }
} // namespace

char const*
CC_DateTimeOffsets::getName() const
{
    return "date/time offsets";
}

ChainComparer::verdict_e
CC_DateTimeOffsets::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState&)
{
    if (!(x.isDateTimeOffset() && y.isDateTimeOffset())) {
        return v_not_applicable;
    }

    bool result = false;
    if (tolerance.getMode() == tm_time) {
        result = distance(x.getUTCInstant(), y.getUTCInstant()) <=
            static_cast<unsigned long long>(tolerance.getTime().count());
    } else {
        result = x.getUTCInstant() == y.getUTCInstant();
    }
    if (result && engine.getWithSameOffset()) {
        result = x.getUTCOffset() == y.getUTCOffset();
    }
    return verdict(result);
}
