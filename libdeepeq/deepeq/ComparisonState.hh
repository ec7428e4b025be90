#ifndef COMPARISONSTATE_HH
#define COMPARISONSTATE_HH

#include <deepeq/FailurePoint.hh>
#include <deepeq/ValueHandle.hh>

#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace deepeq
{
    // State of one top-level comparison: the pairs of values being compared along the current
    // recursion path, used to detect cycles, and the failure trail.
    //
    // Pairs are identified by the addresses of their values, never by content, since looking at
    // content could itself recurse into the cycle being detected. Every value on the path is kept
    // alive by the handles of the callers, so addresses can't be reused while they are on the
    // path.
    class ComparisonState
    {
      public:
        ComparisonState() = default;
        ComparisonState(ComparisonState const&) = delete;
        ComparisonState& operator=(ComparisonState const&) = delete;

        // Holds a pair on the path for the lifetime of the guard.
        class Guard
        {
          public:
            Guard(ComparisonState& state, ValueHandle const& x, ValueHandle const& y) :
                state(state),
                entry(key(x, y))
            {
                if (!state.enter(entry)) {
                    throw std::logic_error(
                        "INTERNAL ERROR: ComparisonState::Guard: pair is already being compared");
                }
            }
            ~Guard()
            {
                state.exit(entry);
            }
            Guard(Guard const&) = delete;
            Guard& operator=(Guard const&) = delete;

          private:
            ComparisonState& state;
            std::pair<Value const*, Value const*> entry;
        };

        bool
        contains(ValueHandle const& x, ValueHandle const& y) const
        {
            return std::find(path.begin(), path.end(), key(x, y)) != path.end();
        }

        // True while comparing the pair passed to compare itself rather than something nested in
        // it.
        bool
        isTopLevel() const
        {
            return path.size() == 1;
        }

        size_t
        depth() const
        {
            return path.size();
        }

        // Failure points are added while unwinding, so each one is inserted before the ones
        // recorded by deeper levels.
        void
        addFailurePoint(FailurePoint fp)
        {
            failure_points.insert(failure_points.begin(), std::move(fp));
        }

        void
        clearFailurePoints()
        {
            failure_points.clear();
        }

        std::vector<FailurePoint>&
        getFailurePoints()
        {
            return failure_points;
        }

      private:
        static std::pair<Value const*, Value const*>
        key(ValueHandle const& x, ValueHandle const& y)
        {
            return {x.obj.get(), y.obj.get()};
        }

        bool
        enter(std::pair<Value const*, Value const*> const& entry)
        {
            if (std::find(path.begin(), path.end(), entry) != path.end()) {
                return false;
            }
            path.push_back(entry);
            return true;
        }

        void
        exit(std::pair<Value const*, Value const*> const& entry)
        {
            // Guards are strictly nested, so the entry is always the last one.
            if (!path.empty() && (path.back() == entry)) {
                path.pop_back();
            }
        }

        std::vector<std::pair<Value const*, Value const*>> path;
        std::vector<FailurePoint> failure_points;
    };
} // namespace deepeq

#endif // COMPARISONSTATE_HH
