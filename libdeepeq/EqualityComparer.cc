#include <deepeq/EqualityComparer.hh>

#include <deepeq/ChainComparer.hh>
#include <deepeq/ComparisonState.hh>
#include <deepeq/Util.hh>

#include <stdexcept>
#include <utility>

using namespace deepeq;

class EqualityComparer::Members
{
    friend class EqualityComparer;

  public:
    ~Members() = default;

  private:
    Members(EqualityComparer const& engine);
    Members(Members const&) = delete;

    bool ignore_case{false};
    bool compare_as_collection{false};
    bool with_same_offset{false};
    bool debug{false};
    std::vector<std::shared_ptr<ExternalComparer>> external_comparers;
    std::shared_ptr<Logger> logger;
    // Built-in rules in priority order. The enumerables rule comes last; it is kept separately
    // because the arrays rule walks elements with it.
    std::vector<std::unique_ptr<ChainComparer>> chain;
    std::unique_ptr<CC_Enumerables> enumerables;
};

EqualityComparer::Members::Members(EqualityComparer const& engine) :
    debug(Util::get_env("DEEPEQ_DEBUG")),
    logger(Logger::defaultLogger()),
    enumerables(std::make_unique<CC_Enumerables>(engine))
{
    chain.push_back(std::make_unique<CC_Arrays>(engine, *enumerables));
    chain.push_back(std::make_unique<CC_Dictionaries>(engine));
    chain.push_back(std::make_unique<CC_KeyValuePairs>(engine));
    chain.push_back(std::make_unique<CC_Strings>(engine));
    chain.push_back(std::make_unique<CC_Streams>(engine));
    chain.push_back(std::make_unique<CC_Chars>(engine));
    chain.push_back(std::make_unique<CC_Directories>(engine));
    chain.push_back(std::make_unique<CC_Numerics>(engine));
    chain.push_back(std::make_unique<CC_DateTimeOffsets>(engine));
    chain.push_back(std::make_unique<CC_TimeSpanTolerance>(engine));
    chain.push_back(std::make_unique<CC_Tuples>(engine));
    chain.push_back(std::make_unique<CC_Structural>(engine));
    chain.push_back(std::make_unique<CC_Equatables>(engine));
}

EqualityComparer::EqualityComparer() :
    m(new Members(*this))
{
}

EqualityComparer::~EqualityComparer() = default;

void
EqualityComparer::setIgnoreCase(bool val)
{
    m->ignore_case = val;
}

bool
EqualityComparer::getIgnoreCase() const
{
    return m->ignore_case;
}

void
EqualityComparer::setCompareAsCollection(bool val)
{
    m->compare_as_collection = val;
}

bool
EqualityComparer::getCompareAsCollection() const
{
    return m->compare_as_collection;
}

void
EqualityComparer::setWithSameOffset(bool val)
{
    m->with_same_offset = val;
}

bool
EqualityComparer::getWithSameOffset() const
{
    return m->with_same_offset;
}

void
EqualityComparer::addExternalComparer(std::shared_ptr<ExternalComparer> comparer)
{
    if (!comparer) {
        throw std::logic_error("EqualityComparer::addExternalComparer called with null comparer");
    }
    m->external_comparers.push_back(std::move(comparer));
}

void
EqualityComparer::clearExternalComparers()
{
    m->external_comparers.clear();
}

std::vector<std::shared_ptr<ExternalComparer>> const&
EqualityComparer::getExternalComparers() const
{
    return m->external_comparers;
}

void
EqualityComparer::setLogger(std::shared_ptr<Logger> logger)
{
    m->logger = logger ? std::move(logger) : Logger::defaultLogger();
}

std::shared_ptr<Logger>
EqualityComparer::getLogger() const
{
    return m->logger;
}

void
EqualityComparer::debug(std::string const& msg) const
{
    if (m->debug) {
        m->logger->info("DEBUG: " + msg + "\n");
    }
}

void
EqualityComparer::checkConfiguration(Tolerance const& tolerance) const
{
    if (m->with_same_offset && (tolerance.getMode() == tm_time)) {
        throw std::logic_error(
            "EqualityComparer: a time tolerance may not be combined with same-offset comparison");
    }
}

ComparisonResult
EqualityComparer::compare(
    ValueHandle const& expected, ValueHandle const& actual, Tolerance const& tolerance) const
{
    checkConfiguration(tolerance);
    ComparisonState state;
    ComparisonResult result;
    result.equal = areEqual(expected, actual, tolerance, state);
    if (!result.equal) {
        result.failure_points = std::move(state.getFailurePoints());
    }
    return result;
}

bool
EqualityComparer::areEqual(
    ValueHandle const& expected, ValueHandle const& actual, Tolerance const& tolerance) const
{
    return compare(expected, actual, tolerance).equal;
}

bool
EqualityComparer::areEqual(
    ValueHandle const& x,
    ValueHandle const& y,
    Tolerance const& tolerance,
    ComparisonState& state) const
{
    state.clearFailurePoints();

    if (x.isAbsent() || y.isAbsent()) {
        return x.isAbsent() && y.isAbsent();
    }
    if (x.isSameObjectAs(y)) {
        return true;
    }
    if (state.contains(x, y)) {
        if (m->debug) {
            debug(
                "cycle detected comparing " + std::string(x.getTypeName()) + " with " +
                y.getTypeName() + " at depth " + std::to_string(state.depth()));
        }
        return false;
    }

    ComparisonState::Guard guard(state, x, y);

    char const* rule = nullptr;
    bool result = false;
    for (auto const& comparer: m->external_comparers) {
        if (comparer->canCompare(x, y)) {
            rule = "external comparer";
            result = comparer->areEqual(x, y);
            break;
        }
    }
    if (!rule) {
        for (auto const& comparer: m->chain) {
            auto verdict = comparer->equal(x, y, tolerance, state);
            if (verdict != ChainComparer::v_not_applicable) {
                rule = comparer->getName();
                result = (verdict == ChainComparer::v_equal);
                break;
            }
        }
    }
    if (!rule) {
        auto verdict = m->enumerables->equal(x, y, tolerance, state);
        if (verdict != ChainComparer::v_not_applicable) {
            rule = m->enumerables->getName();
            result = (verdict == ChainComparer::v_equal);
        }
    }
    if (!rule) {
        rule = "native equality";
        result = x.nativeEquals(y);
    }

    if (m->debug) {
        debug(
            std::string(rule) + ": " + x.getTypeName() + " and " + y.getTypeName() +
            " at depth " + std::to_string(state.depth()) + " are " +
            (result ? "equal" : "not equal"));
    }
    if (result) {
        state.clearFailurePoints();
    }
    return result;
}
