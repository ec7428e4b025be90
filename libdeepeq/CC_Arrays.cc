#include <deepeq/ChainComparer.hh>

using namespace deepeq;

char const*
CC_Arrays::getName() const
{
    return "arrays";
}

ChainComparer::verdict_e
CC_Arrays::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState& state)
{
    if (!((x.isArray() || y.isArray()) && x.isIterable() && y.isIterable())) {
        return v_not_applicable;
    }

    auto x_elements = x.getElements();
    auto y_elements = y.getElements();
    if (engine.getCompareAsCollection()) {
        return verdict(
            enumerables.compareElements(x_elements, y_elements, {}, {}, tolerance, state));
    }

    // Anything else that can be iterated counts as one-dimensional.
    auto shape_x = x.isArray() ? x.getDimensions() : std::vector<size_t>{x_elements.size()};
    auto shape_y = y.isArray() ? y.getDimensions() : std::vector<size_t>{y_elements.size()};
    if (shape_x.size() != shape_y.size()) {
        return v_not_equal;
    }
    // A difference in the first dimension shows up as a missing element.
    for (size_t d = 1; d < shape_x.size(); ++d) {
        if (shape_x[d] != shape_y[d]) {
            return v_not_equal;
        }
    }
    return verdict(
        enumerables.compareElements(x_elements, y_elements, shape_x, shape_y, tolerance, state));
}
