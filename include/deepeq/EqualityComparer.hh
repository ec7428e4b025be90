// Copyright (c) 2024-2025 The deepeq authors
//
// This file is part of deepeq.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef DEEPEQ_EQUALITYCOMPARER_HH
#define DEEPEQ_EQUALITYCOMPARER_HH

#include <deepeq/DLL.h>
#include <deepeq/ExternalComparer.hh>
#include <deepeq/FailurePoint.hh>
#include <deepeq/Logger.hh>
#include <deepeq/Tolerance.hh>
#include <deepeq/ValueHandle.hh>

#include <memory>
#include <string>
#include <vector>

namespace deepeq
{
    class ComparisonState;

    // Deep structural equality for ValueHandle values.
    //
    // compare(expected, actual, tolerance) decides equality as follows:
    //
    // * Two absent values (uninitialized or null) are equal; an absent value is not equal to a
    //   present one.
    // * A value is equal to itself.
    // * A pair of containers that is already being compared further up the same path is not
    //   equal. This makes every comparison terminate, and it means two distinct cyclic
    //   structures never compare equal.
    // * Registered external comparers are tried in registration order. The first that accepts the
    //   pair decides.
    // * Built-in rules are tried in this order: arrays, dictionaries, key/value pairs, strings,
    //   streams, chars, directories, numbers, offset timestamps, timestamps and durations with a
    //   time tolerance, tuples, structural objects, equatable objects, and finally anything else
    //   that can be iterated. The first rule that applies decides.
    // * Otherwise ValueHandle::nativeEquals decides.
    //
    // Rules that recurse into elements call back into the same EqualityComparer, so every rule,
    // the tolerance and cycle detection apply at every depth.
    //
    // Swapping expected and actual doesn't change the verdict, with one exception: a percent
    // tolerance is a percentage of the expected value, so compare(100, 111, 10%) is not equal
    // while compare(111, 100, 10%) is equal. The failure trail always reports the expected side
    // first.
    //
    // Configuration is expected to be set up before comparisons start. A single EqualityComparer
    // may be used for concurrent comparisons as long as its configuration doesn't change, since
    // each call to compare keeps its state and result separately.
    //
    // If the environment variable DEEPEQ_DEBUG is set when the comparer is created, each decision
    // is traced on the logger's info channel.
    class EqualityComparer
    {
      public:
        DEEPEQ_DLL
        EqualityComparer();
        DEEPEQ_DLL
        ~EqualityComparer();

        // Compare strings and chars without regard to case, using a culture-invariant simple
        // case mapping.
        DEEPEQ_DLL
        void setIgnoreCase(bool);
        DEEPEQ_DLL
        bool getIgnoreCase() const;

        // Compare arrays by their elements in row-major order, ignoring rank and dimensions.
        // Equatable domain objects at the top level are also compared element by element.
        DEEPEQ_DLL
        void setCompareAsCollection(bool);
        DEEPEQ_DLL
        bool getCompareAsCollection() const;

        // Offset timestamps must have the same UTC offset as well as the same instant. May not be
        // combined with a time tolerance.
        DEEPEQ_DLL
        void setWithSameOffset(bool);
        DEEPEQ_DLL
        bool getWithSameOffset() const;

        DEEPEQ_DLL
        void addExternalComparer(std::shared_ptr<ExternalComparer>);
        DEEPEQ_DLL
        void clearExternalComparers();
        DEEPEQ_DLL
        std::vector<std::shared_ptr<ExternalComparer>> const& getExternalComparers() const;

        // Logger used for DEEPEQ_DEBUG tracing. Passing a null pointer selects the default
        // logger.
        DEEPEQ_DLL
        void setLogger(std::shared_ptr<Logger>);
        DEEPEQ_DLL
        std::shared_ptr<Logger> getLogger() const;

        // Compare expected with actual. Throws std::logic_error before comparing anything if the
        // configuration and tolerance conflict.
        DEEPEQ_DLL
        ComparisonResult compare(
            ValueHandle const& expected,
            ValueHandle const& actual,
            Tolerance const& tolerance = Tolerance::exact()) const;

        // Convenience form of compare that discards the failure points.
        DEEPEQ_DLL
        bool areEqual(
            ValueHandle const& expected,
            ValueHandle const& actual,
            Tolerance const& tolerance = Tolerance::exact()) const;

        // The rest of the header file is for deepeq internal use only.

        // Recursive entry point used by the built-in rules.
        bool areEqual(
            ValueHandle const& x,
            ValueHandle const& y,
            Tolerance const& tolerance,
            ComparisonState& state) const;

      private:
        void checkConfiguration(Tolerance const& tolerance) const;
        void debug(std::string const& msg) const;

        class Members;

        EqualityComparer(EqualityComparer const&) = delete;
        EqualityComparer& operator=(EqualityComparer const&) = delete;

        std::shared_ptr<Members> m;
    };
} // namespace deepeq

#endif // DEEPEQ_EQUALITYCOMPARER_HH
