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

#ifndef DEEPEQ_INTC_HH
#define DEEPEQ_INTC_HH

#include <deepeq/Types.h>

#include <cstddef>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>
#include <utility>

// Safe integer conversion that detects overflows. Each converter throws std::range_error if the
// value can't be represented in the target type.

namespace deepeq::IntC
{
    template <typename To, typename From>
    To
    convert(From const& i)
    {
        static_assert(std::is_integral_v<From> && std::is_integral_v<To>);
        if (!std::in_range<To>(i)) {
            std::ostringstream msg;
            msg.imbue(std::locale::classic());
            msg << "integer out of range converting " << i << " from a " << sizeof(From) << "-byte "
                << (std::is_signed_v<From> ? "signed" : "unsigned") << " type to a " << sizeof(To)
                << "-byte " << (std::is_signed_v<To> ? "signed" : "unsigned") << " type";
            throw std::range_error(msg.str());
        }
        return static_cast<To>(i);
    }

    template <typename T>
    int
    to_int(T const& i)
    {
        return convert<int>(i);
    }

    template <typename T>
    unsigned int
    to_uint(T const& i)
    {
        return convert<unsigned int>(i);
    }

    template <typename T>
    unsigned long
    to_ulong(T const& i)
    {
        return convert<unsigned long>(i);
    }

    template <typename T>
    size_t
    to_size(T const& i)
    {
        return convert<size_t>(i);
    }

    template <typename T>
    deq_offset_t
    to_offset(T const& i)
    {
        return convert<deq_offset_t>(i);
    }

    template <typename T>
    long long
    to_longlong(T const& i)
    {
        return convert<long long>(i);
    }

    // Throw std::range_error if cur + delta would overflow or underflow T.
    template <typename T>
    void
    range_check(T const& cur, T const& delta)
    {
        if ((delta > 0) && ((std::numeric_limits<T>::max() - cur) < delta)) {
            std::ostringstream msg;
            msg.imbue(std::locale::classic());
            msg << "adding " << delta << " to " << cur << " would cause an integer overflow";
            throw std::range_error(msg.str());
        } else if ((delta < 0) && ((std::numeric_limits<T>::min() - cur) > delta)) {
            std::ostringstream msg;
            msg.imbue(std::locale::classic());
            msg << "adding " << delta << " to " << cur << " would cause an integer underflow";
            throw std::range_error(msg.str());
        }
    }
} // namespace deepeq::IntC

#endif // DEEPEQ_INTC_HH
