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

#ifndef DEEPEQ_EXTERNALCOMPARER_HH
#define DEEPEQ_EXTERNALCOMPARER_HH

#include <deepeq/Constants.h>
#include <deepeq/DLL.h>
#include <deepeq/DomainObject.hh>
#include <deepeq/ValueHandle.hh>

#include <functional>
#include <memory>

namespace deepeq
{
    // A caller-supplied comparison registered with EqualityComparer::addExternalComparer.
    // External comparers are consulted in registration order, before any built-in rule, for the
    // top-level pair and for every pair reached while recursing. The first one whose canCompare
    // accepts a pair decides its equality completely.
    class DEEPEQ_DLL_CLASS ExternalComparer
    {
      public:
        DEEPEQ_DLL
        ExternalComparer() = default;
        DEEPEQ_DLL
        virtual ~ExternalComparer();

        virtual bool canCompare(ValueHandle const& x, ValueHandle const& y) const = 0;
        virtual bool areEqual(ValueHandle const& x, ValueHandle const& y) const = 0;

        typedef std::function<bool(ValueHandle const&, ValueHandle const&)> predicate_t;
        typedef std::function<int(ValueHandle const&, ValueHandle const&)> comparison_t;

        // Build a comparer from a capability test and an equality function.
        DEEPEQ_DLL
        static std::shared_ptr<ExternalComparer>
        create(predicate_t can_compare, predicate_t are_equal);

        // Applies when both values have the given type code.
        DEEPEQ_DLL
        static std::shared_ptr<ExternalComparer>
        forType(deq_value_type_e type_code, predicate_t are_equal);

        // Applies when both values have the given type code; values are equal when compare returns
        // zero.
        DEEPEQ_DLL
        static std::shared_ptr<ExternalComparer>
        fromComparison(deq_value_type_e type_code, comparison_t compare);

        // Applies when both values are domain objects whose dynamic type is T or derived from T.
        template <typename T>
        static std::shared_ptr<ExternalComparer>
        forObjects(std::function<bool(T const&, T const&)> are_equal)
        {
            auto object_of = [](ValueHandle const& v) -> T const* {
                return v.isObject() ? dynamic_cast<T const*>(v.getObject().get()) : nullptr;
            };
            return create(
                [object_of](ValueHandle const& x, ValueHandle const& y) {
                    return object_of(x) && object_of(y);
                },
                [object_of, are_equal](ValueHandle const& x, ValueHandle const& y) {
                    return are_equal(*object_of(x), *object_of(y));
                });
        }

      private:
        ExternalComparer(ExternalComparer const&) = delete;
        ExternalComparer& operator=(ExternalComparer const&) = delete;
    };
} // namespace deepeq

#endif // DEEPEQ_EXTERNALCOMPARER_HH
