#include <deepeq/assert_test.h>

#include <deepeq/DomainObject.hh>
#include <deepeq/EqualityComparer.hh>
#include <deepeq/ExternalComparer.hh>
#include <deepeq/Util.hh>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace deepeq;

typedef ValueHandle VH;

namespace
{
    class Point: public EquatableObject<Point>
    {
      public:
        Point(int x, int y) :
            x(x),
            y(y)
        {
        }
        ~Point() override = default;

        std::string
        getTypeName() const override
        {
            return "Point";
        }

        std::string
        unparse() const override
        {
            return "Point(" + std::to_string(x) + ", " + std::to_string(y) + ")";
        }

        bool
        equals(Point const& other) const override
        {
            ++calls;
            return (x == other.x) && (y == other.y);
        }

        int x;
        int y;
        static int calls;
    };

    int Point::calls = 0;

    // Accepts any object and considers it equal.
    class Wildcard: public DomainObject
    {
      public:
        ~Wildcard() override = default;

        bool
        isEquatableWith(DomainObject const&) const override
        {
            return true;
        }

        bool
        equatableEquals(DomainObject const&) const override
        {
            return true;
        }
    };

    // Structural: compares its items through the engine with those of another Bag or of any
    // enumerable object.
    class Bag: public DomainObject
    {
      public:
        Bag(std::vector<VH> items) :
            items(std::move(items))
        {
        }
        ~Bag() override = default;

        bool
        isStructural() const override
        {
            return true;
        }

        bool
        structuralEquals(DomainObject const& other, ElementComparer& elements) const override
        {
            std::vector<VH> other_items;
            if (auto bag = dynamic_cast<Bag const*>(&other)) {
                other_items = bag->items;
            } else if (other.isEnumerable()) {
                other_items = other.getElements();
            } else {
                return false;
            }
            if (other_items.size() != items.size()) {
                return false;
            }
            for (size_t i = 0; i < items.size(); ++i) {
                if (!elements.areEqual(items.at(i), other_items.at(i))) {
                    return false;
                }
            }
            return true;
        }

        std::vector<VH> items;
    };

    // Enumerable, and equatable by size only.
    class Numbers: public EquatableObject<Numbers>
    {
      public:
        Numbers(std::vector<VH> items) :
            items(std::move(items))
        {
        }
        ~Numbers() override = default;

        bool
        equals(Numbers const& other) const override
        {
            return items.size() == other.items.size();
        }

        bool
        isEnumerable() const override
        {
            return true;
        }

        std::vector<VH>
        getElements() const override
        {
            return items;
        }

        std::vector<VH> items;
    };

    class Broken: public DomainObject
    {
      public:
        ~Broken() override = default;

        bool
        isEquatableWith(DomainObject const&) const override
        {
            throw std::runtime_error("Broken: isEquatableWith");
        }
    };
} // namespace

static VH
point(int x, int y)
{
    return VH::newObject(std::make_shared<Point>(x, y));
}

static VH
bag_of(std::vector<VH> items)
{
    return VH::newObject(std::make_shared<Bag>(std::move(items)));
}

static void
test_equatable()
{
    EqualityComparer engine;
    assert(engine.areEqual(point(1, 2), point(1, 2)));
    assert(!engine.areEqual(point(1, 2), point(2, 1)));
    assert(point(3, 4).unparse() == "Point(3, 4)");

    // Either side may decide
    auto wildcard = VH::newObject(std::make_shared<Wildcard>());
    assert(engine.areEqual(wildcard, point(1, 2)));
    assert(engine.areEqual(point(1, 2), wildcard));

    // Objects without any contract fall back to identity
    auto plain = VH::newObject(std::make_shared<DomainObject>());
    assert(engine.areEqual(plain, plain));
    assert(!engine.areEqual(plain, VH::newObject(std::make_shared<DomainObject>())));
    assert(!engine.areEqual(plain, point(1, 2)));

    // Nested
    auto x = VH::newDictionary({{VH::newString("p"), point(1, 2)}});
    auto y = VH::newDictionary({{VH::newString("p"), point(1, 3)}});
    auto result = engine.compare(x, y);
    assert(!result);
    assert(
        result.failure_points.at(0).unparse() ==
        "at key \"p\": expected Point(1, 2) but was Point(1, 3)");
    std::cout << "equatable done" << std::endl;
}

static void
test_structural()
{
    EqualityComparer engine;
    auto b1 = bag_of({VH::newReal(1.0), VH::newString("A")});
    auto b2 = bag_of({VH::newReal(1.1), VH::newString("a")});
    assert(!engine.areEqual(b1, b2));
    // Configuration and tolerance reach the elements
    engine.setIgnoreCase(true);
    assert(!engine.areEqual(b1, b2));
    assert(engine.areEqual(b1, b2, Tolerance::linear(0.2)));
    assert(engine.areEqual(b2, b1, Tolerance::linear(0.2)));
    // A structural object on the right decides too
    assert(!engine.areEqual(point(1, 1), b1));

    // When the right-hand object decides, the elements keep their orientation, so a percent
    // tolerance stays relative to the left-hand element.
    auto hundred = VH::newObject(std::make_shared<Numbers>(std::vector<VH>{VH::newReal(100.0)}));
    auto large = bag_of({VH::newReal(110.0)});
    assert(engine.areEqual(hundred, large, Tolerance::percent(10)));
    assert(!engine.areEqual(hundred, large, Tolerance::percent(9.5)));
    assert(engine.areEqual(large, hundred, Tolerance::percent(9.5)));
    assert(!engine.areEqual(VH::newObject(std::make_shared<DomainObject>()), large));

    // A structural object that contains itself
    auto bag = std::make_shared<Bag>(std::vector<VH>{VH::newInteger(1)});
    auto self = VH::newObject(bag);
    bag->items.push_back(self);
    auto other_bag = std::make_shared<Bag>(std::vector<VH>{VH::newInteger(1)});
    auto other = VH::newObject(other_bag);
    other_bag->items.push_back(other);
    assert(engine.areEqual(self, self));
    assert(!engine.areEqual(self, other));
    bag->items.clear();
    other_bag->items.clear();
    std::cout << "structural done" << std::endl;
}

static void
test_enumerable()
{
    EqualityComparer engine;
    auto n1 = VH::newObject(std::make_shared<Numbers>(std::vector<VH>{VH::newInteger(1)}));
    auto n2 = VH::newObject(std::make_shared<Numbers>(std::vector<VH>{VH::newInteger(2)}));
    // The equatable contract wins over enumeration
    assert(engine.areEqual(n1, n2));

    // In collection mode the top-level pair is compared element by element, but nested pairs
    // still use the equatable contract.
    engine.setCompareAsCollection(true);
    assert(!engine.areEqual(n1, n2));
    assert(engine.areEqual(VH::newSequence({n1}), VH::newSequence({n2})));

    // An enumerable object equals a sequence with the same elements
    assert(engine.areEqual(n1, VH::newSequence({VH::newInteger(1)})));
    assert(engine.areEqual(VH::newArray({VH::newInteger(1)}), n1));
    std::cout << "enumerable done" << std::endl;
}

static void
test_exceptions()
{
    EqualityComparer engine;
    auto broken = VH::newObject(std::make_shared<Broken>());
    try {
        engine.areEqual(broken, VH::newObject(std::make_shared<Broken>()));
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "Broken: isEquatableWith");
    }
    std::cout << "exceptions done" << std::endl;
}

static void
test_external()
{
    EqualityComparer engine;
    assert(engine.getExternalComparers().empty());
    try {
        engine.addExternalComparer(nullptr);
        assert(false);
    } catch (std::logic_error&) {
    }
    try {
        ExternalComparer::create(nullptr, nullptr);
        assert(false);
    } catch (std::logic_error&) {
    }

    // Case-insensitive strings through forType
    engine.addExternalComparer(ExternalComparer::forType(vt_string, [](VH const& x, VH const& y) {
        return Util::utf8_fold_case(x.getStringValue()) == Util::utf8_fold_case(y.getStringValue());
    }));
    assert(engine.areEqual(VH::newString("ABC"), VH::newString("abc")));
    // External comparers apply at every depth
    assert(engine.areEqual(
        VH::newSequence({VH::newString("X")}), VH::newSequence({VH::newString("x")})));

    // Integers equal modulo 10 through a three-way comparison
    engine.addExternalComparer(
        ExternalComparer::fromComparison(vt_integer, [](VH const& x, VH const& y) {
            return static_cast<int>((x.getIntValue() % 10) - (y.getIntValue() % 10));
        }));
    assert(engine.getExternalComparers().size() == 2);
    assert(engine.areEqual(VH::newInteger(3), VH::newInteger(13)));
    assert(!engine.areEqual(VH::newInteger(3), VH::newInteger(14)));
    // Only when both sides have the type
    assert(!engine.areEqual(VH::newInteger(3), VH::newUnsigned(13)));

    // External comparers take precedence over the equatable contract
    Point::calls = 0;
    engine.addExternalComparer(ExternalComparer::forObjects<Point>(
        [](Point const& a, Point const& b) { return a.x == b.x; }));
    assert(engine.areEqual(point(1, 2), point(1, 5)));
    assert(Point::calls == 0);

    // Registration order is priority order
    EqualityComparer ordered;
    ordered.addExternalComparer(ExternalComparer::create(
        [](VH const& x, VH const&) { return x.isNumber(); },
        [](VH const&, VH const&) { return true; }));
    ordered.addExternalComparer(ExternalComparer::forType(
        vt_integer, [](VH const&, VH const&) { return false; }));
    assert(ordered.areEqual(VH::newInteger(1), VH::newInteger(2)));

    // Absent values never reach external comparers
    assert(!ordered.areEqual(VH::newNull(), VH::newInteger(1)));

    engine.clearExternalComparers();
    assert(engine.getExternalComparers().empty());
    assert(!engine.areEqual(VH::newString("ABC"), VH::newString("abc")));
    assert(!engine.areEqual(point(1, 2), point(1, 5)));
    std::cout << "external done" << std::endl;
}

int
main()
{
    test_equatable();
    test_structural();
    test_enumerable();
    test_exceptions();
    test_external();
    std::cout << "objects: all tests passed" << std::endl;
    return 0;
}
