#ifndef CHAINCOMPARER_HH
#define CHAINCOMPARER_HH

#include <deepeq/ComparisonState.hh>
#include <deepeq/EqualityComparer.hh>
#include <deepeq/Tolerance.hh>
#include <deepeq/ValueHandle.hh>

#include <vector>

namespace deepeq
{
    // One built-in rule of EqualityComparer. Rules are tried in a fixed order; the first that
    // applies to a pair decides it.
    class ChainComparer
    {
      public:
        enum verdict_e { v_not_applicable, v_equal, v_not_equal };

        virtual ~ChainComparer() = default;

        // Name used in DEEPEQ_DEBUG traces
        virtual char const* getName() const = 0;

        virtual verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) = 0;

        static verdict_e
        verdict(bool equal)
        {
            return equal ? v_equal : v_not_equal;
        }

      protected:
        ChainComparer(EqualityComparer const& engine) :
            engine(engine)
        {
        }

        EqualityComparer const& engine;
    };

    // Shared by the enumerables and arrays rules: walk two element lists in lockstep and record
    // the first mismatch. shape_x and shape_y, when not empty, are the dimensions used to compute
    // the multi-dimensional index of a failure point.
    class CC_Enumerables: public ChainComparer
    {
      public:
        CC_Enumerables(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Enumerables() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;

        bool compareElements(
            std::vector<ValueHandle> const& x_elements,
            std::vector<ValueHandle> const& y_elements,
            std::vector<size_t> const& shape_x,
            std::vector<size_t> const& shape_y,
            Tolerance const& tolerance,
            ComparisonState& state) const;
    };

    class CC_Arrays: public ChainComparer
    {
      public:
        CC_Arrays(EqualityComparer const& engine, CC_Enumerables const& enumerables) :
            ChainComparer(engine),
            enumerables(enumerables)
        {
        }
        ~CC_Arrays() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;

      private:
        CC_Enumerables const& enumerables;
    };

    class CC_Dictionaries: public ChainComparer
    {
      public:
        CC_Dictionaries(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Dictionaries() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_KeyValuePairs: public ChainComparer
    {
      public:
        CC_KeyValuePairs(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_KeyValuePairs() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Strings: public ChainComparer
    {
      public:
        CC_Strings(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Strings() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Streams: public ChainComparer
    {
      public:
        CC_Streams(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Streams() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Chars: public ChainComparer
    {
      public:
        CC_Chars(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Chars() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Directories: public ChainComparer
    {
      public:
        CC_Directories(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Directories() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Numerics: public ChainComparer
    {
      public:
        CC_Numerics(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Numerics() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_DateTimeOffsets: public ChainComparer
    {
      public:
        CC_DateTimeOffsets(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_DateTimeOffsets() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_TimeSpanTolerance: public ChainComparer
    {
      public:
        CC_TimeSpanTolerance(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_TimeSpanTolerance() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Tuples: public ChainComparer
    {
      public:
        CC_Tuples(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Tuples() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Structural: public ChainComparer
    {
      public:
        CC_Structural(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Structural() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };

    class CC_Equatables: public ChainComparer
    {
      public:
        CC_Equatables(EqualityComparer const& engine) :
            ChainComparer(engine)
        {
        }
        ~CC_Equatables() override = default;
        char const* getName() const override;
        verdict_e equal(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) override;
    };
} // namespace deepeq

#endif // CHAINCOMPARER_HH
