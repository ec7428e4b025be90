#include <deepeq/ChainComparer.hh>

#include <deepeq/DomainObject.hh>

using namespace deepeq;

namespace
{
    // Hands element comparisons back to the engine. When the right-hand object is the one doing
    // the comparison, its arguments arrive reversed and are swapped back so that expected stays
    // on the left.
    class EngineElements: public ElementComparer
    {
      public:
        EngineElements(
            EqualityComparer const& engine,
            Tolerance const& tolerance,
            ComparisonState& state,
            bool swapped) :
            engine(engine),
            tolerance(tolerance),
            state(state),
            swapped(swapped)
        {
        }
        ~EngineElements() override = default;

        bool
        areEqual(ValueHandle const& a, ValueHandle const& b) override
        {
            return swapped ? engine.areEqual(b, a, tolerance, state)
                           : engine.areEqual(a, b, tolerance, state);
        }

      private:
        EqualityComparer const& engine;
        Tolerance const& tolerance;
        ComparisonState& state;
        bool swapped;
    };
} // namespace

char const*
CC_Structural::getName() const
{
    return "structural";
}

ChainComparer::verdict_e
CC_Structural::equal(
    ValueHandle const& x, ValueHandle const& y, Tolerance const& tolerance, ComparisonState& state)
{
    if (!(x.isObject() && y.isObject())) {
        return v_not_applicable;
    }
    auto x_obj = x.getObject();
    auto y_obj = y.getObject();
    if (x_obj->isStructural()) {
        EngineElements elements(engine, tolerance, state, false);
        return verdict(x_obj->structuralEquals(*y_obj, elements));
    }
    if (y_obj->isStructural()) {
        EngineElements elements(engine, tolerance, state, true);
        return verdict(y_obj->structuralEquals(*x_obj, elements));
    }
    return v_not_applicable;
}
