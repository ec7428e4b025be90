#include <deepeq/ChainComparer.hh>

#include <deepeq/Util.hh>

using namespace deepeq;

char const*
CC_Strings::getName() const
{
    return "strings";
}

ChainComparer::verdict_e
CC_Strings::equal(ValueHandle const& x, ValueHandle const& y, Tolerance const&, ComparisonState&)
{
    if (!(x.isString() && y.isString())) {
        return v_not_applicable;
    }
    auto const& s1 = x.getStringValue();
    auto const& s2 = y.getStringValue();
    if (engine.getIgnoreCase()) {
        return verdict(Util::utf8_fold_case(s1) == Util::utf8_fold_case(s2));
    }
    return verdict(s1 == s2);
}
