#include <deepeq/Tolerance.hh>

#include <deepeq/Util.hh>

#include <cmath>
#include <stdexcept>

using namespace deepeq;

Tolerance::Tolerance(
    deq_tolerance_mode_e mode, double amount, long long ulps, std::chrono::microseconds time) :
    mode(mode),
    amount(amount),
    ulps_(ulps),
    time_(time)
{
}

Tolerance
Tolerance::exact()
{
    return {tm_exact, 0.0, 0, std::chrono::microseconds(0)};
}

Tolerance
Tolerance::linear(double amount)
{
    if (std::isnan(amount) || amount < 0.0) {
        throw std::logic_error(
            "Tolerance::linear: amount must be non-negative; got " +
            Util::double_to_string(amount));
    }
    return {tm_linear, amount, 0, std::chrono::microseconds(0)};
}

Tolerance
Tolerance::percent(double amount)
{
    if (std::isnan(amount) || amount < 0.0) {
        throw std::logic_error(
            "Tolerance::percent: amount must be non-negative; got " +
            Util::double_to_string(amount));
    }
    return {tm_percent, amount, 0, std::chrono::microseconds(0)};
}

Tolerance
Tolerance::ulps(long long amount)
{
    if (amount < 0) {
        throw std::logic_error(
            "Tolerance::ulps: amount must be non-negative; got " + std::to_string(amount));
    }
    return {tm_ulps, 0.0, amount, std::chrono::microseconds(0)};
}

Tolerance
Tolerance::time(std::chrono::microseconds amount)
{
    if (amount.count() < 0) {
        throw std::logic_error(
            "Tolerance::time: amount must be non-negative; got " +
            std::to_string(amount.count()) + "us");
    }
    return {tm_time, 0.0, 0, amount};
}

deq_tolerance_mode_e
Tolerance::getMode() const
{
    return mode;
}

bool
Tolerance::isExact() const
{
    return mode == tm_exact;
}

double
Tolerance::getAmount() const
{
    return amount;
}

long long
Tolerance::getUlps() const
{
    return ulps_;
}

std::chrono::microseconds
Tolerance::getTime() const
{
    return time_;
}

std::string
Tolerance::unparse() const
{
    switch (mode) {
    case tm_exact:
        return "exact";
    case tm_linear:
        return "within " + Util::double_to_string(amount);
    case tm_percent:
        return "within " + Util::double_to_string(amount) + "%";
    case tm_ulps:
        return "within " + std::to_string(ulps_) + " ulps";
    case tm_time:
        return "within " + std::to_string(time_.count()) + "us";
    }
    throw std::logic_error("INTERNAL ERROR: unknown tolerance mode");
}
