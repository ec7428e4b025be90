#include <deepeq/ExternalComparer.hh>

#include <stdexcept>
#include <utility>

using namespace deepeq;

namespace
{
    class FunctionComparer: public ExternalComparer
    {
      public:
        FunctionComparer(
            ExternalComparer::predicate_t can_compare, ExternalComparer::predicate_t are_equal) :
            can_compare(std::move(can_compare)),
            are_equal(std::move(are_equal))
        {
        }

        ~FunctionComparer() override = default;

        bool
        canCompare(ValueHandle const& x, ValueHandle const& y) const override
        {
            return can_compare(x, y);
        }

        bool
        areEqual(ValueHandle const& x, ValueHandle const& y) const override
        {
            return are_equal(x, y);
        }

      private:
        ExternalComparer::predicate_t can_compare;
        ExternalComparer::predicate_t are_equal;
    };
} // namespace

ExternalComparer::~ExternalComparer() = default;

std::shared_ptr<ExternalComparer>
ExternalComparer::create(predicate_t can_compare, predicate_t are_equal)
{
    if (!(can_compare && are_equal)) {
        throw std::logic_error("ExternalComparer::create called with an empty function");
    }
    return std::make_shared<FunctionComparer>(std::move(can_compare), std::move(are_equal));
}

std::shared_ptr<ExternalComparer>
ExternalComparer::forType(deq_value_type_e type_code, predicate_t are_equal)
{
    return create(
        [type_code](ValueHandle const& x, ValueHandle const& y) {
            return (x.getTypeCode() == type_code) && (y.getTypeCode() == type_code);
        },
        std::move(are_equal));
}

std::shared_ptr<ExternalComparer>
ExternalComparer::fromComparison(deq_value_type_e type_code, comparison_t compare)
{
    if (!compare) {
        throw std::logic_error("ExternalComparer::fromComparison called with an empty function");
    }
    return forType(type_code, [compare](ValueHandle const& x, ValueHandle const& y) {
        return compare(x, y) == 0;
    });
}
