#include <deepeq/assert_test.h>

#include <deepeq/BufferInputSource.hh>
#include <deepeq/EqualityComparer.hh>
#include <deepeq/Logger.hh>
#include <deepeq/Pl_String.hh>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace deepeq;
using namespace std::chrono_literals;

typedef ValueHandle VH;

// One value of each kind, built fresh on every call so that no two results share objects.
static std::vector<VH>
samples()
{
    return {
        VH::newNull(),
        VH::newBool(true),
        VH::newInteger(-3),
        VH::newUnsigned(3),
        VH::newReal(2.5),
        VH::newSingle(2.5f),
        VH::newString("text"),
        VH::newChar('c'),
        VH::newArray({2, 1}, {VH::newInteger(1), VH::newInteger(2)}),
        VH::newSequence({VH::newString("a"), VH::newSequence({VH::newReal(1.5)})}),
        VH::newDictionary({{VH::newString("k"), VH::newSequence({VH::newInteger(1)})}}),
        VH::newPair(VH::newString("k"), VH::newInteger(1)),
        VH::newTuple({VH::newInteger(1), VH::newString("b")}),
        VH::newStream(std::make_shared<BufferInputSource>("stream", "bytes")),
        VH::newDateTime(1000),
        VH::newDateTimeOffset(1000, 60),
        VH::newTimeSpan(5s),
    };
}

static void
test_reflexive_and_symmetric()
{
    EqualityComparer engine;
    auto xs = samples();
    auto ys = samples();
    for (size_t i = 0; i < xs.size(); ++i) {
        // Reflexive, both for the same handle and for an equal copy
        assert(engine.areEqual(xs[i], xs[i]));
        assert(engine.areEqual(xs[i], ys[i]));
        for (size_t j = 0; j < ys.size(); ++j) {
            bool forward = engine.areEqual(xs[i], ys[j]);
            bool backward = engine.areEqual(ys[j], xs[i]);
            if (forward != backward) {
                std::cout << "asymmetric: " << xs[i].unparse() << " and " << ys[j].unparse()
                          << std::endl;
            }
            assert(forward == backward);
        }
    }
    std::cout << "reflexive and symmetric done" << std::endl;
}

static void
test_absent()
{
    EqualityComparer engine;
    assert(engine.areEqual(VH(), VH()));
    assert(engine.areEqual(VH::newNull(), VH::newNull()));
    assert(engine.areEqual(VH(), VH::newNull()));
    for (auto const& v: samples()) {
        if (v.isNull()) {
            continue;
        }
        assert(!engine.areEqual(VH::newNull(), v));
        assert(!engine.areEqual(v, VH::newNull()));
        assert(!engine.areEqual(VH(), v));
    }
    // Absent elements
    assert(engine.areEqual(
        VH::newSequence({VH::newNull(), VH()}), VH::newSequence({VH(), VH::newNull()})));
    auto result =
        engine.compare(VH::newSequence({VH::newNull()}), VH::newSequence({VH::newInteger(0)}));
    assert(result.failure_points.at(0).unparse() == "at index 0: expected null but was 0");
    std::cout << "absent done" << std::endl;
}

static void
test_cycles()
{
    EqualityComparer engine;
    auto a = VH::newSequence({VH::newInteger(1)});
    a.appendItem(a);
    auto b = VH::newSequence({VH::newInteger(1)});
    b.appendItem(b);

    // A cyclic value is equal to itself, but two distinct cycles are not equal
    assert(engine.areEqual(a, a));
    assert(!engine.areEqual(a, b));
    assert(!engine.areEqual(b, a));

    // Mutual recursion through a dictionary
    auto d1 = VH::newDictionary();
    auto d2 = VH::newDictionary();
    d1.setKey(VH::newString("next"), d2);
    d2.setKey(VH::newString("next"), d1);
    assert(engine.areEqual(d1, d1));
    assert(!engine.areEqual(d1, d2));

    // Shared, non-cyclic substructure is fine
    auto shared = VH::newSequence({VH::newInteger(7)});
    assert(engine.areEqual(
        VH::newSequence({shared, shared}),
        VH::newSequence({VH::newSequence({VH::newInteger(7)}), shared})));

    a.clearItems();
    b.clearItems();
    d1.clearItems();
    d2.clearItems();
    std::cout << "cycles done" << std::endl;
}

static void
test_failure_trail()
{
    EqualityComparer engine;
    auto x = VH::newSequence({VH::newInteger(1), VH::newInteger(2), VH::newInteger(3)});
    auto y = VH::newSequence({VH::newInteger(1), VH::newInteger(2)});
    auto result = engine.compare(x, y);
    assert(!result.equal && !static_cast<bool>(result));
    assert(result.failure_points.size() == 1);
    auto const& fp = result.failure_points.at(0);
    assert(fp.position == 2);
    assert(fp.expected_has_data && !fp.actual_has_data);
    assert(fp.expected_value.getIntValue() == 3);
    assert(!fp.actual_value);

    // Outermost first
    auto grid = [](long long last) {
        return VH::newArray(
            {2, 2},
            {VH::newInteger(1), VH::newInteger(2), VH::newInteger(3), VH::newInteger(last)});
    };
    auto deep_x = VH::newDictionary({{VH::newString("rows"), grid(4)}});
    auto deep_y = VH::newDictionary({{VH::newString("rows"), grid(5)}});
    result = engine.compare(deep_x, deep_y);
    assert(result.failure_points.size() == 2);
    assert(result.failure_points.at(0).key.getStringValue() == "rows");
    assert(result.failure_points.at(1).unparse() == "at index [1,1]: expected 4 but was 5");

    // Successful comparisons have no failure points, even after failed key lookups
    auto k_x = VH::newDictionary({{VH::newSequence({VH::newInteger(1)}), VH::newInteger(1)},
                                  {VH::newSequence({VH::newInteger(2)}), VH::newInteger(2)}});
    auto k_y = VH::newDictionary({{VH::newSequence({VH::newInteger(2)}), VH::newInteger(2)},
                                  {VH::newSequence({VH::newInteger(1)}), VH::newInteger(1)}});
    result = engine.compare(k_x, k_y);
    assert(result && result.failure_points.empty());

    // Values that differ as a whole have no failure points
    result = engine.compare(VH::newInteger(1), VH::newInteger(2));
    assert(!result && result.failure_points.empty());
    std::cout << "failure trail done" << std::endl;
}

static void
test_configuration()
{
    EqualityComparer engine;
    assert(engine.getLogger() == Logger::defaultLogger());
    auto logger = Logger::create();
    engine.setLogger(logger);
    assert(engine.getLogger() == logger);
    engine.setLogger(nullptr);
    assert(engine.getLogger() == Logger::defaultLogger());

    assert(!engine.getWithSameOffset());
    engine.setWithSameOffset(true);
    try {
        engine.areEqual(VH::newInteger(1), VH::newInteger(1), Tolerance::time(1s));
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "configuration: " << e.what() << std::endl;
    }
    engine.setWithSameOffset(false);
    std::cout << "configuration done" << std::endl;
}

static void
test_debug()
{
    setenv("DEEPEQ_DEBUG", "1", 1);
    EqualityComparer engine;
    unsetenv("DEEPEQ_DEBUG");

    std::string trace;
    auto logger = Logger::create();
    logger->setInfo(std::make_shared<Pl_String>("trace", nullptr, trace));
    engine.setLogger(logger);

    assert(engine.areEqual(VH::newInteger(1), VH::newReal(1.0)));
    assert(trace == "DEBUG: numerics: integer and real at depth 1 are equal\n");

    trace.clear();
    auto a = VH::newSequence();
    a.appendItem(a);
    auto b = VH::newSequence();
    b.appendItem(b);
    assert(!engine.areEqual(a, b));
    assert(trace.find("DEBUG: cycle detected comparing sequence with sequence") == 0);
    assert(
        trace.find("DEBUG: enumerables: sequence and sequence at depth 1 are not equal\n") !=
        std::string::npos);
    a.clearItems();
    b.clearItems();

    trace.clear();
    assert(!engine.areEqual(VH::newBool(true), VH::newBool(false)));
    assert(trace == "DEBUG: native equality: boolean and boolean at depth 1 are not equal\n");

    // Without DEEPEQ_DEBUG nothing is written
    EqualityComparer quiet;
    quiet.setLogger(logger);
    trace.clear();
    assert(quiet.areEqual(VH::newInteger(1), VH::newInteger(1)));
    assert(trace.empty());
    std::cout << "debug done" << std::endl;
}

int
main()
{
    test_reflexive_and_symmetric();
    test_absent();
    test_cycles();
    test_failure_trail();
    test_configuration();
    test_debug();
    std::cout << "engine: all tests passed" << std::endl;
    return 0;
}
