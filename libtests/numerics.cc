#include <deepeq/assert_test.h>

#include <deepeq/EqualityComparer.hh>

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

using namespace deepeq;
using namespace std::chrono_literals;

typedef ValueHandle VH;

static EqualityComparer engine;

static bool
eq(VH const& x, VH const& y, Tolerance const& tolerance = Tolerance::exact())
{
    bool result = engine.areEqual(x, y, tolerance);
    // Numeric comparisons never record failure points of their own.
    assert(engine.compare(x, y, tolerance).failure_points.empty());
    return result;
}

static void
test_promotion()
{
    // Different widths and signedness
    assert(eq(VH::newInteger(5, 8), VH::newInteger(5, 64)));
    assert(eq(VH::newInteger(5), VH::newUnsigned(5, 16)));
    assert(!eq(VH::newInteger(-1, 64), VH::newUnsigned(18446744073709551615ULL, 64)));
    auto min64 = VH::newInteger(-9223372036854775807LL - 1, 64);
    assert(!eq(VH::newUnsigned(9223372036854775808ULL, 64), min64));
    assert(eq(VH::newInteger(0), VH::newUnsigned(0)));

    // Integral and fractional
    assert(eq(VH::newInteger(2), VH::newReal(2.0)));
    assert(!eq(VH::newInteger(2), VH::newReal(2.5)));
    assert(eq(VH::newReal(2.0), VH::newUnsigned(2)));

    // With a single and no double, comparison happens in single precision
    assert(eq(VH::newSingle(0.1f), VH::newSingle(0.1f)));
    assert(!eq(VH::newSingle(0.1f), VH::newReal(0.1)));
    assert(eq(VH::newSingle(16777217.0f), VH::newInteger(16777217)));
    assert(!eq(VH::newReal(16777217.0), VH::newSingle(16777216.0f)));

    // Numbers are not equal to other types
    assert(!eq(VH::newInteger(1), VH::newBool(true)));
    assert(!eq(VH::newInteger(1), VH::newString("1")));
    std::cout << "promotion done" << std::endl;
}

static void
test_special_values()
{
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();
    assert(eq(VH::newReal(nan), VH::newReal(nan)));
    assert(!eq(VH::newReal(nan), VH::newReal(-nan)));
    assert(eq(VH::newReal(inf), VH::newReal(inf)));
    assert(!eq(VH::newReal(inf), VH::newReal(-inf)));
    assert(!eq(VH::newReal(inf), VH::newReal(1e308), Tolerance::linear(inf)));
    assert(eq(VH::newSingle(std::nanf("")), VH::newSingle(std::nanf(""))));
    // Zeroes of either sign are equal as numbers
    assert(eq(VH::newReal(0.0), VH::newReal(-0.0)));
    std::cout << "special values done" << std::endl;
}

static void
test_linear()
{
    auto tol = Tolerance::linear(5);
    assert(eq(VH::newInteger(100), VH::newInteger(105), tol));
    assert(eq(VH::newInteger(100), VH::newInteger(95), tol));
    assert(!eq(VH::newInteger(100), VH::newInteger(106), tol));
    assert(!eq(VH::newInteger(100), VH::newInteger(94), tol));
    assert(eq(VH::newReal(1.0), VH::newReal(6.0), tol));
    assert(!eq(VH::newReal(1.0), VH::newReal(6.0000001), tol));
    assert(eq(VH::newReal(0.5), VH::newReal(0.75), Tolerance::linear(0.25)));

    // Extremes of the integer range don't overflow
    auto big = VH::newUnsigned(18446744073709551615ULL, 64);
    auto small = VH::newInteger(-9223372036854775807LL - 1, 64);
    assert(!eq(big, small, tol));
    assert(eq(big, VH::newUnsigned(18446744073709551611ULL, 64), Tolerance::linear(4)));
    std::cout << "linear done" << std::endl;
}

static void
test_percent()
{
    auto tol = Tolerance::percent(10);
    assert(eq(VH::newInteger(100), VH::newInteger(110), tol));
    assert(eq(VH::newInteger(100), VH::newInteger(90), tol));
    assert(!eq(VH::newInteger(100), VH::newInteger(111), tol));
    assert(!eq(VH::newInteger(100), VH::newInteger(89), tol));
    // Relative to the expected value, so the operands are not interchangeable
    assert(eq(VH::newInteger(-100), VH::newInteger(-110), tol));
    assert(!eq(VH::newReal(90.0), VH::newReal(100.0), tol));
    assert(eq(VH::newInteger(111), VH::newInteger(100), tol));
    assert(eq(VH::newReal(200.0), VH::newReal(220.0), tol));
    assert(!eq(VH::newReal(200.0), VH::newReal(220.5), tol));
    // An expected value of zero requires exact equality
    assert(eq(VH::newInteger(0), VH::newInteger(0), tol));
    assert(!eq(VH::newInteger(0), VH::newInteger(1), Tolerance::percent(1000)));
    assert(!eq(VH::newReal(0.0), VH::newReal(1e-300), Tolerance::percent(1000)));
    std::cout << "percent done" << std::endl;
}

static void
test_ulps()
{
    double one = 1.0;
    double next = std::nextafter(one, 2.0);
    double next2 = std::nextafter(next, 2.0);
    assert(!eq(VH::newReal(one), VH::newReal(next)));
    assert(eq(VH::newReal(one), VH::newReal(next), Tolerance::ulps(1)));
    assert(!eq(VH::newReal(one), VH::newReal(next2), Tolerance::ulps(1)));
    assert(eq(VH::newReal(next2), VH::newReal(one), Tolerance::ulps(2)));

    // Distance across zero
    double tiny = std::numeric_limits<double>::denorm_min();
    assert(eq(VH::newReal(-tiny), VH::newReal(tiny), Tolerance::ulps(2)));
    assert(!eq(VH::newReal(-tiny), VH::newReal(tiny), Tolerance::ulps(1)));

    float f = 1.0f;
    float fnext = std::nextafter(f, 2.0f);
    assert(eq(VH::newSingle(f), VH::newSingle(fnext), Tolerance::ulps(1)));
    assert(!eq(VH::newSingle(f), VH::newSingle(fnext), Tolerance::ulps(0)));

    try {
        engine.areEqual(VH::newInteger(1), VH::newInteger(2), Tolerance::ulps(1));
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "ulps on integers: " << e.what() << std::endl;
    }
    std::cout << "ulps done" << std::endl;
}

static void
test_time_tolerance()
{
    try {
        engine.areEqual(VH::newReal(1.0), VH::newReal(1.0), Tolerance::time(1s));
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "time tolerance on numbers: " << e.what() << std::endl;
    }
}

static void
test_nested()
{
    // The tolerance applies at every depth
    auto tol = Tolerance::linear(0.01);
    auto x = VH::newSequence({VH::newReal(1.0), VH::newSequence({VH::newReal(2.0)})});
    auto y = VH::newSequence({VH::newReal(1.005), VH::newSequence({VH::newReal(2.009)})});
    assert(engine.areEqual(x, y, tol));
    assert(!engine.areEqual(x, y));

    auto z = VH::newSequence({VH::newReal(1.0), VH::newSequence({VH::newReal(2.02)})});
    auto result = engine.compare(x, z, tol);
    assert(!result.equal);
    assert(result.failure_points.size() == 2);
    assert(result.failure_points.at(0).position == 1);
    assert(result.failure_points.at(1).unparse() == "at index 0: expected 2 but was 2.02");
    std::cout << "nested done" << std::endl;
}

int
main()
{
    test_promotion();
    test_special_values();
    test_linear();
    test_percent();
    test_ulps();
    test_time_tolerance();
    test_nested();
    std::cout << "numerics: all tests passed" << std::endl;
    return 0;
}
