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

#ifndef DEEPEQ_TOLERANCE_HH
#define DEEPEQ_TOLERANCE_HH

#include <deepeq/Constants.h>
#include <deepeq/DLL.h>

#include <chrono>
#include <string>

namespace deepeq
{
    // An immutable description of the deviation allowed when numeric or temporal values are
    // compared. The same tolerance is applied at every depth of a comparison; keys of
    // dictionaries and pairs are always compared exactly.
    class DEEPEQ_DLL_CLASS Tolerance
    {
      public:
        // Values must be equal.
        DEEPEQ_DLL
        static Tolerance exact();

        // Numbers are equal when |expected - actual| <= amount.
        DEEPEQ_DLL
        static Tolerance linear(double amount);

        // Numbers are equal when |expected - actual| <= |expected * amount / 100|. When the
        // expected value is zero, only exact equality is accepted.
        DEEPEQ_DLL
        static Tolerance percent(double amount);

        // Floating point numbers are equal when no more than amount representable values lie
        // between them. Using this tolerance on two integers is a logic error.
        DEEPEQ_DLL
        static Tolerance ulps(long long amount);

        // Timestamps, offset timestamps and durations are equal when they are no more than amount
        // apart. Using this tolerance on numbers is a logic error.
        DEEPEQ_DLL
        static Tolerance time(std::chrono::microseconds amount);

        DEEPEQ_DLL
        deq_tolerance_mode_e getMode() const;
        DEEPEQ_DLL
        bool isExact() const;
        // Amount of a linear or percent tolerance
        DEEPEQ_DLL
        double getAmount() const;
        DEEPEQ_DLL
        long long getUlps() const;
        DEEPEQ_DLL
        std::chrono::microseconds getTime() const;

        // Short description such as "within 5%" for use in diagnostics.
        DEEPEQ_DLL
        std::string unparse() const;

      private:
        Tolerance(
            deq_tolerance_mode_e mode,
            double amount,
            long long ulps,
            std::chrono::microseconds time);

        deq_tolerance_mode_e mode;
        double amount;
        long long ulps_;
        std::chrono::microseconds time_;
    };
} // namespace deepeq

#endif // DEEPEQ_TOLERANCE_HH
