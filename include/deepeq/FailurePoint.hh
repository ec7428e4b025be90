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

#ifndef DEEPEQ_FAILUREPOINT_HH
#define DEEPEQ_FAILUREPOINT_HH

#include <deepeq/DLL.h>
#include <deepeq/ValueHandle.hh>

#include <string>
#include <vector>

namespace deepeq
{
    // Where two values first differed at one level of nesting. A comparison that fails while
    // recursing records one failure point per level along the first diverging path, outermost
    // first.
    struct FailurePoint
    {
        // Flat position within a sequence, array or stream, or -1 when the position is given by
        // key.
        long long position{-1};
        // For multi-dimensional arrays, the index of the element in each dimension.
        std::vector<size_t> indices;
        // For dictionaries and directories, the key or entry name.
        ValueHandle key;
        ValueHandle expected_value;
        ValueHandle actual_value;
        // False when that side has nothing at this position, for example because it is shorter.
        bool expected_has_data{true};
        bool actual_has_data{true};

        // Render as e.g. "at index [1,2]: expected 5 but was 6" or
        // "at key "b": expected 2 but was <none>".
        DEEPEQ_DLL
        std::string unparse() const;
    };

    // Returned by EqualityComparer::compare.
    struct ComparisonResult
    {
        bool equal{false};
        // Empty when equal is true. May also be empty on failure when the values differ as a
        // whole rather than at some position, for example streams of different lengths.
        std::vector<FailurePoint> failure_points;

        explicit
        operator bool() const
        {
            return equal;
        }
    };
} // namespace deepeq

#endif // DEEPEQ_FAILUREPOINT_HH
