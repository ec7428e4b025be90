#include <deepeq/assert_test.h>

#include <deepeq/Tolerance.hh>

#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace deepeq;
using namespace std::chrono_literals;

static void
test_factories()
{
    auto exact = Tolerance::exact();
    assert(exact.isExact() && (exact.getMode() == tm_exact));
    assert(exact.unparse() == "exact");

    auto linear = Tolerance::linear(0.5);
    assert(!linear.isExact() && (linear.getMode() == tm_linear));
    assert(linear.getAmount() == 0.5);
    assert(linear.unparse() == "within 0.5");

    auto percent = Tolerance::percent(5);
    assert((percent.getMode() == tm_percent) && (percent.getAmount() == 5.0));
    assert(percent.unparse() == "within 5%");

    auto ulps = Tolerance::ulps(4);
    assert((ulps.getMode() == tm_ulps) && (ulps.getUlps() == 4));
    assert(ulps.unparse() == "within 4 ulps");

    auto time = Tolerance::time(2ms);
    assert((time.getMode() == tm_time) && (time.getTime() == 2000us));
    assert(time.unparse() == "within 2000us");

    // Zero amounts are allowed and are not the same as exact
    assert(!Tolerance::linear(0).isExact());

    // Tolerances are values
    Tolerance copy = percent;
    copy = linear;
    assert(copy.getMode() == tm_linear);
    assert(percent.getMode() == tm_percent);
    std::cout << "factories done" << std::endl;
}

static void
test_invalid()
{
    auto expect_logic_error = [](char const* what, auto fn) {
        try {
            fn();
            assert(false);
        } catch (std::logic_error& e) {
            std::cout << what << ": " << e.what() << std::endl;
        }
    };
    expect_logic_error("negative linear", [] { Tolerance::linear(-1); });
    expect_logic_error("NaN linear", [] { Tolerance::linear(std::nan("")); });
    expect_logic_error("negative percent", [] { Tolerance::percent(-0.1); });
    expect_logic_error("negative ulps", [] { Tolerance::ulps(-1); });
    expect_logic_error("negative time", [] { Tolerance::time(-1us); });
}

int
main()
{
    test_factories();
    test_invalid();
    std::cout << "tolerance: all tests passed" << std::endl;
    return 0;
}
