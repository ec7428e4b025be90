#include <deepeq/ChainComparer.hh>

#include <deepeq/Util.hh>

using namespace deepeq;

char const*
CC_Chars::getName() const
{
    return "chars";
}

ChainComparer::verdict_e
CC_Chars::equal(ValueHandle const& x, ValueHandle const& y, Tolerance const&, ComparisonState&)
{
    if (!(x.isChar() && y.isChar())) {
        return v_not_applicable;
    }
    auto c1 = x.getCharValue();
    auto c2 = y.getCharValue();
    if (engine.getIgnoreCase()) {
        return verdict(Util::fold_case(c1) == Util::fold_case(c2));
    }
    return verdict(c1 == c2);
}
