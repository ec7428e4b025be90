#include <deepeq/ChainComparer.hh>

using namespace deepeq;

namespace
{
    // other is null when the right-hand dictionary has no matching key.
    void
    add_failure(
        ComparisonState& state,
        ValueHandle const& key,
        ValueHandle const& value,
        ValueHandle const* other)
    {
        FailurePoint fp;
        fp.key = key;
        fp.expected_value = value;
        if (other) {
            fp.actual_value = *other;
        } else {
            fp.actual_has_data = false;
        }
        state.addFailurePoint(std::move(fp));
    }
} // namespace

char const*
CC_Dictionaries::getName() const
{
    return "dictionaries";
}

ChainComparer::verdict_e
CC_Dictionaries::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState& state)
{
    if (!(x.isDictionary() && y.isDictionary())) {
        return v_not_applicable;
    }

    auto x_items = x.getDictItems();
    auto y_items = y.getDictItems();
    if (x_items.size() != y_items.size()) {
        return v_not_equal;
    }

    // Each right-hand entry may be matched by only one left-hand key. Keys are first paired the
    // way the dictionary itself identifies them. A left-hand key left unpaired may then take any
    // remaining right-hand key the engine considers equal, trying each such candidate until one
    // has an equal value. Keys are compared exactly even when a tolerance applies to the values.
    std::vector<bool> matched(y_items.size(), false);
    std::vector<bool> paired(x_items.size(), false);
    for (size_t j = 0; j < x_items.size(); ++j) {
        auto const& [key, value] = x_items[j];
        for (size_t i = 0; i < y_items.size(); ++i) {
            if (matched[i] || !key.nativeEquals(y_items[i].first)) {
                continue;
            }
            matched[i] = true;
            paired[j] = true;
            auto const& other = y_items[i].second;
            if (!engine.areEqual(value, other, tolerance, state)) {
                add_failure(state, key, value, &other);
                return v_not_equal;
            }
            break;
        }
    }

    for (size_t j = 0; j < x_items.size(); ++j) {
        if (paired[j]) {
            continue;
        }
        auto const& [key, value] = x_items[j];
        size_t found = y_items.size();
        size_t first_candidate = y_items.size();
        for (size_t i = 0; i < y_items.size(); ++i) {
            if (matched[i] || !engine.areEqual(key, y_items[i].first, Tolerance::exact(), state)) {
                continue;
            }
            if (first_candidate == y_items.size()) {
                first_candidate = i;
            }
            if (engine.areEqual(value, y_items[i].second, tolerance, state)) {
                found = i;
                break;
            }
        }
        if (found < y_items.size()) {
            matched[found] = true;
            continue;
        }
        if (first_candidate == y_items.size()) {
            state.clearFailurePoints();
            add_failure(state, key, value, nullptr);
            return v_not_equal;
        }
        // Report the first candidate, repeating its comparison to rebuild the nested trail.
        auto const& other = y_items[first_candidate].second;
        if (!engine.areEqual(value, other, tolerance, state)) {
            add_failure(state, key, value, &other);
        }
        return v_not_equal;
    }
    return v_equal;
}
