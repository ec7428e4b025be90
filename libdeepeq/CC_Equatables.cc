#include <deepeq/ChainComparer.hh>

#include <deepeq/DomainObject.hh>

using namespace deepeq;

char const*
CC_Equatables::getName() const
{
    return "equatables";
}

ChainComparer::verdict_e
CC_Equatables::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const&, ComparisonState& state)
{
    if (!(x.isObject() && y.isObject())) {
        return v_not_applicable;
    }
    // In collection mode, collection-like objects at the top level are compared by their
    // elements instead.
    if (engine.getCompareAsCollection() && state.isTopLevel()) {
        return v_not_applicable;
    }
    auto x_obj = x.getObject();
    auto y_obj = y.getObject();
    if (x_obj->isEquatableWith(*y_obj)) {
        return verdict(x_obj->equatableEquals(*y_obj));
    }
    if (y_obj->isEquatableWith(*x_obj)) {
        return verdict(y_obj->equatableEquals(*x_obj));
    }
    return v_not_applicable;
}
