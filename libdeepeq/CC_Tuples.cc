#include <deepeq/ChainComparer.hh>

using namespace deepeq;

char const*
CC_Tuples::getName() const
{
    return "tuples";
}

ChainComparer::verdict_e
CC_Tuples::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState& state)
{
    if (!(x.isTuple() && y.isTuple())) {
        return v_not_applicable;
    }
    auto x_items = x.getItems();
    auto y_items = y.getItems();
    if (x_items.size() != y_items.size()) {
        // Tuples of different arity are different types; leave them to native equality.
        return v_not_applicable;
    }
    for (size_t i = 0; i < x_items.size(); ++i) {
        if (!engine.areEqual(x_items.at(i), y_items.at(i), tolerance, state)) {
            FailurePoint fp;
            fp.position = static_cast<long long>(i);
            fp.expected_value = x_items.at(i);
            fp.actual_value = y_items.at(i);
            state.addFailurePoint(std::move(fp));
            return v_not_equal;
        }
    }
    return v_equal;
}
