#include <deepeq/ChainComparer.hh>

#include <algorithm>

using namespace deepeq;

namespace
{
    // Convert a row-major position to an index per dimension.
    std::vector<size_t>
    index_of(size_t flat, std::vector<size_t> const& shape)
    {
        std::vector<size_t> result(shape.size(), 0);
        for (size_t d = shape.size(); d > 0; --d) {
            if (shape[d - 1] == 0) {
                return {};
            }
            result[d - 1] = flat % shape[d - 1];
            flat /= shape[d - 1];
        }
        return result;
    }
} // namespace

char const*
CC_Enumerables::getName() const
{
    return "enumerables";
}

ChainComparer::verdict_e
CC_Enumerables::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState& state)
{
    if (!(x.isIterable() && y.isIterable())) {
        return v_not_applicable;
    }
    return verdict(compareElements(x.getElements(), y.getElements(), {}, {}, tolerance, state));
}

bool
CC_Enumerables::compareElements(
    std::vector<ValueHandle> const& x_elements,
    std::vector<ValueHandle> const& y_elements,
    std::vector<size_t> const& shape_x,
    std::vector<size_t> const& shape_y,
    Tolerance const& tolerance,
    ComparisonState& state) const
{
    size_t count = std::max(x_elements.size(), y_elements.size());
    for (size_t i = 0; i < count; ++i) {
        bool x_has_data = i < x_elements.size();
        bool y_has_data = i < y_elements.size();
        if (x_has_data && y_has_data &&
            engine.areEqual(x_elements[i], y_elements[i], tolerance, state)) {
            continue;
        }
        if (!(x_has_data && y_has_data)) {
            state.clearFailurePoints();
        }
        FailurePoint fp;
        fp.position = static_cast<long long>(i);
        fp.indices = index_of(i, x_has_data ? shape_x : shape_y);
        fp.expected_has_data = x_has_data;
        fp.actual_has_data = y_has_data;
        if (x_has_data) {
            fp.expected_value = x_elements[i];
        }
        if (y_has_data) {
            fp.actual_value = y_elements[i];
        }
        state.addFailurePoint(std::move(fp));
        return false;
    }
    return true;
}
