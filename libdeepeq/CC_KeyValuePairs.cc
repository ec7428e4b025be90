#include <deepeq/ChainComparer.hh>

using namespace deepeq;

char const*
CC_KeyValuePairs::getName() const
{
    return "key/value pairs";
}

ChainComparer::verdict_e
CC_KeyValuePairs::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState& state)
{
    if (!(x.isPair() && y.isPair())) {
        return v_not_applicable;
    }
    if (!engine.areEqual(x.getKey(), y.getKey(), Tolerance::exact(), state)) {
        // Pairs with different keys differ as a whole.
        state.clearFailurePoints();
        return v_not_equal;
    }
    if (!engine.areEqual(x.getValue(), y.getValue(), tolerance, state)) {
        FailurePoint fp;
        fp.key = x.getKey();
        fp.expected_value = x.getValue();
        fp.actual_value = y.getValue();
        state.addFailurePoint(std::move(fp));
        return v_not_equal;
    }
    return v_equal;
}
