#include <deepeq/assert_test.h>

#include <deepeq/EqualityComparer.hh>

#include <iostream>
#include <stdexcept>

using namespace deepeq;
using namespace std::chrono_literals;

typedef ValueHandle VH;
typedef Util::CalendarTime CT;

static void
test_datetimes()
{
    EqualityComparer engine;
    auto t1 = VH::newDateTime(CT(2024, 3, 1, 12, 0, 0));
    auto t2 = VH::newDateTime(CT(2024, 3, 1, 12, 0, 0));
    auto t3 = VH::newDateTime(CT(2024, 3, 1, 12, 0, 2));
    assert(engine.areEqual(t1, t2));
    assert(!engine.areEqual(t1, t3));
    assert(engine.areEqual(t1, t3, Tolerance::time(2s)));
    assert(engine.areEqual(t3, t1, Tolerance::time(2s)));
    assert(!engine.areEqual(t1, t3, Tolerance::time(1999999us)));
    // Numeric tolerances don't apply to timestamps
    assert(!engine.areEqual(t1, t3, Tolerance::linear(5e6)));

    // A naive timestamp is not an offset timestamp
    assert(!engine.areEqual(t1, VH::newDateTimeOffset(CT(2024, 3, 1, 12, 0, 0))));
    std::cout << "datetimes done" << std::endl;
}

static void
test_timespans()
{
    EqualityComparer engine;
    assert(engine.areEqual(VH::newTimeSpan(90s), VH::newTimeSpan(90000ms)));
    assert(!engine.areEqual(VH::newTimeSpan(90s), VH::newTimeSpan(91s)));
    assert(engine.areEqual(VH::newTimeSpan(90s), VH::newTimeSpan(91s), Tolerance::time(1s)));
    assert(!engine.areEqual(VH::newTimeSpan(90s), VH::newTimeSpan(92s), Tolerance::time(1s)));
    assert(engine.areEqual(VH::newTimeSpan(-1s), VH::newTimeSpan(1s), Tolerance::time(2s)));
    // Timestamps and durations don't mix
    assert(!engine.areEqual(VH::newTimeSpan(0s), VH::newDateTime(0), Tolerance::time(1s)));
    std::cout << "timespans done" << std::endl;
}

static void
test_offsets()
{
    EqualityComparer engine;
    // The same instant observed in two time zones
    auto paris = VH::newDateTimeOffset(CT(2024, 3, 1, 13, 0, 0, 0, 60));
    auto utc = VH::newDateTimeOffset(CT(2024, 3, 1, 12, 0, 0, 0, 0));
    auto later = VH::newDateTimeOffset(CT(2024, 3, 1, 12, 0, 1, 0, 0));
    assert(engine.areEqual(paris, utc));
    assert(!engine.areEqual(paris, later));
    assert(engine.areEqual(paris, later, Tolerance::time(1s)));
    assert(!engine.areEqual(paris, later, Tolerance::time(999ms)));

    engine.setWithSameOffset(true);
    assert(engine.getWithSameOffset());
    assert(!engine.areEqual(paris, utc));
    assert(engine.areEqual(utc, VH::newDateTimeOffset(CT(2024, 3, 1, 12, 0, 0))));
    // Nested values are checked the same way
    assert(!engine.areEqual(VH::newSequence({paris}), VH::newSequence({utc})));

    // A time tolerance can't be combined with same-offset comparison
    try {
        engine.compare(paris, later, Tolerance::time(1s));
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "same offset with tolerance: " << e.what() << std::endl;
    }
    // Other tolerances are accepted and ignored for offset timestamps
    assert(engine.areEqual(utc, utc, Tolerance::linear(1)));
    assert(!engine.areEqual(paris, later, Tolerance::percent(50)));
    std::cout << "offsets done" << std::endl;
}

static void
test_rendering()
{
    EqualityComparer engine;
    auto x = VH::newSequence({VH::newDateTimeOffset(CT(2024, 3, 1, 13, 0, 0, 0, 60))});
    auto y = VH::newSequence({VH::newDateTimeOffset(CT(2024, 3, 1, 13, 0, 0, 0, 0))});
    auto result = engine.compare(x, y);
    assert(!result);
    assert(
        result.failure_points.at(0).unparse() ==
        "at index 0: expected 2024-03-01T13:00:00+01:00 but was 2024-03-01T13:00:00+00:00");
    std::cout << "rendering done" << std::endl;
}

int
main()
{
    test_datetimes();
    test_timespans();
    test_offsets();
    test_rendering();
    std::cout << "temporal: all tests passed" << std::endl;
    return 0;
}
