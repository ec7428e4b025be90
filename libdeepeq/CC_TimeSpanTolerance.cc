#include <deepeq/ChainComparer.hh>

using namespace deepeq;

char const*
CC_TimeSpanTolerance::getName() const
{
    return "time tolerance";
}

ChainComparer::verdict_e
CC_TimeSpanTolerance::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState&)
{
    if (tolerance.getMode() != tm_time) {
        return v_not_applicable;
    }

    long long a = 0;
    long long b = 0;
    if (x.isDateTime() && y.isDateTime()) {
        a = x.getDateTimeValue();
        b = y.getDateTimeValue();
    } else if (x.isTimeSpan() && y.isTimeSpan()) {
        a = x.getTimeSpanValue().count();
        b = y.getTimeSpanValue().count();
    } else {
        return v_not_applicable;
    }

    unsigned long long diff =
        (a > b) ? (static_cast<unsigned long long>(a) - static_cast<unsigned long long>(b))
                : (static_cast<unsigned long long>(b) - static_cast<unsigned long long>(a));
    return verdict(diff <= static_cast<unsigned long long>(tolerance.getTime().count()));
}
