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

#ifndef DEEPEQ_DOMAINOBJECT_HH
#define DEEPEQ_DOMAINOBJECT_HH

#include <deepeq/DLL.h>
#include <deepeq/ValueHandle.hh>

#include <string>
#include <vector>

namespace deepeq
{
    // Passed to DomainObject::structuralEquals. Each call compares two elements through the
    // EqualityComparer that is running the comparison, with its configuration, tolerance and
    // cycle detection.
    class DEEPEQ_DLL_CLASS ElementComparer
    {
      public:
        DEEPEQ_DLL
        virtual ~ElementComparer();
        virtual bool areEqual(ValueHandle const& x, ValueHandle const& y) = 0;
    };

    // Base class for caller-defined values. Wrap an instance with ValueHandle::newObject to compare
    // it. A subclass opts into the equality contracts below by overriding the corresponding
    // virtual methods; the defaults opt out of everything except native equality, which defaults to
    // identity.
    //
    // Exceptions thrown by any of these methods propagate out of EqualityComparer::compare.
    class DEEPEQ_DLL_CLASS DomainObject
    {
      public:
        DEEPEQ_DLL
        DomainObject() = default;
        DEEPEQ_DLL
        virtual ~DomainObject();

        // Name used in diagnostics.
        DEEPEQ_DLL
        virtual std::string getTypeName() const;
        // Diagnostic rendering. The default is "<" + getTypeName() + ">".
        DEEPEQ_DLL
        virtual std::string unparse() const;

        // Equality used when no other rule applies. The default is identity.
        DEEPEQ_DLL
        virtual bool nativeEquals(DomainObject const& other) const;

        // Structural contract. If isStructural() returns true, structuralEquals decides equality
        // with any other value that is a domain object, using the element comparer for the values
        // it holds.
        DEEPEQ_DLL
        virtual bool isStructural() const;
        DEEPEQ_DLL
        virtual bool structuralEquals(DomainObject const& other, ElementComparer& elements) const;

        // Type-native contract. If isEquatableWith(other) returns true, equatableEquals(other)
        // decides equality without any generic recursion. See EquatableObject.
        DEEPEQ_DLL
        virtual bool isEquatableWith(DomainObject const& other) const;
        DEEPEQ_DLL
        virtual bool equatableEquals(DomainObject const& other) const;

        // Enumeration contract. An enumerable object is compared element by element, in order,
        // when no earlier rule applies.
        DEEPEQ_DLL
        virtual bool isEnumerable() const;
        DEEPEQ_DLL
        virtual std::vector<ValueHandle> getElements() const;

      private:
        DomainObject(DomainObject const&) = delete;
        DomainObject& operator=(DomainObject const&) = delete;
    };

    // Convenience base for objects that are equatable with objects of their own type T (usually
    // the derived class itself). Subclasses implement equals.
    template <typename T>
    class EquatableObject: public DomainObject
    {
      public:
        ~EquatableObject() override = default;

        virtual bool equals(T const& other) const = 0;

        bool
        isEquatableWith(DomainObject const& other) const override
        {
            return dynamic_cast<T const*>(&other) != nullptr;
        }

        bool
        equatableEquals(DomainObject const& other) const override
        {
            return equals(dynamic_cast<T const&>(other));
        }
    };
} // namespace deepeq

#endif // DEEPEQ_DOMAINOBJECT_HH
