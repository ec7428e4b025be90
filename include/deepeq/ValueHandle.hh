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

#ifndef DEEPEQ_VALUEHANDLE_HH
#define DEEPEQ_VALUEHANDLE_HH

#include <deepeq/Constants.h>
#include <deepeq/DLL.h>
#include <deepeq/Types.h>
#include <deepeq/Util.hh>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace deepeq
{
    class ComparisonState;
    class DomainObject;
    class InputSource;
    class Value;

    // A ValueHandle is a cheap, copyable reference to a shared value. Copying a handle never
    // copies the value it refers to, and two handles are the same object exactly when they refer
    // to the same underlying value. A default-constructed handle is uninitialized; like an explicit
    // null, it is treated as an absent value by EqualityComparer.
    //
    // Containers hold handles to their elements, so a container may be made to contain itself,
    // directly or indirectly. Since values are reference counted, such cycles must be broken by
    // the caller, for example with clearItems(), before the last handle goes away.
    //
    // Calling an accessor on a value of the wrong type throws std::logic_error with a message of
    // the form "operation for array attempted on value of type string: getDimensions".
    class DEEPEQ_DLL_CLASS ValueHandle
    {
        friend class ComparisonState;

      public:
        ValueHandle() = default;
        ValueHandle(ValueHandle const&) = default;
        ValueHandle& operator=(ValueHandle const&) = default;
        ValueHandle(ValueHandle&&) = default;
        ValueHandle& operator=(ValueHandle&&) = default;

        // True for every handle that refers to a value, including an explicit null.
        explicit inline operator bool() const;

        // Factories

        DEEPEQ_DLL
        static ValueHandle newNull();
        DEEPEQ_DLL
        static ValueHandle newBool(bool value);
        // bits must be 8, 16, 32 or 64, and value must fit.
        DEEPEQ_DLL
        static ValueHandle newInteger(long long value, int bits = 32);
        DEEPEQ_DLL
        static ValueHandle newUnsigned(unsigned long long value, int bits = 32);
        DEEPEQ_DLL
        static ValueHandle newReal(double value);
        // Single-precision real. Numeric comparisons involving it and no double are carried out in
        // single precision.
        DEEPEQ_DLL
        static ValueHandle newSingle(float value);
        // UTF-8 encoded text
        DEEPEQ_DLL
        static ValueHandle newString(std::string const& utf8_value);
        DEEPEQ_DLL
        static ValueHandle newChar(unsigned long codepoint);

        // A rectangular array whose elements are stored in row-major order. The product of the
        // dimensions must equal the number of items, and there must be at least one dimension.
        DEEPEQ_DLL
        static ValueHandle
        newArray(std::vector<size_t> const& dimensions, std::vector<ValueHandle> const& items);
        // One-dimensional array
        DEEPEQ_DLL
        static ValueHandle newArray(std::vector<ValueHandle> const& items);
        DEEPEQ_DLL
        static ValueHandle newSequence(std::vector<ValueHandle> const& items = {});
        DEEPEQ_DLL
        static ValueHandle
        newDictionary(std::vector<std::pair<ValueHandle, ValueHandle>> const& items = {});
        DEEPEQ_DLL
        static ValueHandle newPair(ValueHandle const& key, ValueHandle const& value);
        DEEPEQ_DLL
        static ValueHandle newTuple(std::vector<ValueHandle> const& items);
        DEEPEQ_DLL
        static ValueHandle
        newStream(std::shared_ptr<InputSource> source, deq_stream_filter_e filter = sf_none);
        DEEPEQ_DLL
        static ValueHandle newDirectory(std::string const& path);
        // Naive timestamps in microseconds since 1970-01-01T00:00:00, or from calendar fields
        // whose tz_delta is ignored.
        DEEPEQ_DLL
        static ValueHandle newDateTime(long long micros);
        DEEPEQ_DLL
        static ValueHandle newDateTime(Util::CalendarTime const& time);
        // An instant in microseconds since the UTC epoch plus the UTC offset, in minutes east of
        // Greenwich, at which it was observed. The CalendarTime overload takes local wall-clock
        // fields and the offset from tz_delta.
        DEEPEQ_DLL
        static ValueHandle newDateTimeOffset(long long utc_micros, int offset_minutes);
        DEEPEQ_DLL
        static ValueHandle newDateTimeOffset(Util::CalendarTime const& time);
        DEEPEQ_DLL
        static ValueHandle newTimeSpan(std::chrono::microseconds duration);
        DEEPEQ_DLL
        static ValueHandle newObject(std::shared_ptr<DomainObject> object);

        // Type information

        DEEPEQ_DLL
        deq_value_type_e getTypeCode() const;
        DEEPEQ_DLL
        char const* getTypeName() const;

        DEEPEQ_DLL
        bool isInitialized() const;
        // Explicit null only
        DEEPEQ_DLL
        bool isNull() const;
        // Uninitialized or null
        DEEPEQ_DLL
        bool isAbsent() const;
        DEEPEQ_DLL
        bool isBool() const;
        DEEPEQ_DLL
        bool isInteger() const;
        DEEPEQ_DLL
        bool isUnsigned() const;
        DEEPEQ_DLL
        bool isReal() const;
        DEEPEQ_DLL
        bool isSingle() const;
        // Integer, unsigned or real
        DEEPEQ_DLL
        bool isNumber() const;
        DEEPEQ_DLL
        bool isString() const;
        DEEPEQ_DLL
        bool isChar() const;
        DEEPEQ_DLL
        bool isArray() const;
        DEEPEQ_DLL
        bool isSequence() const;
        DEEPEQ_DLL
        bool isDictionary() const;
        DEEPEQ_DLL
        bool isPair() const;
        DEEPEQ_DLL
        bool isTuple() const;
        DEEPEQ_DLL
        bool isStream() const;
        DEEPEQ_DLL
        bool isDirectory() const;
        DEEPEQ_DLL
        bool isDateTime() const;
        DEEPEQ_DLL
        bool isDateTimeOffset() const;
        DEEPEQ_DLL
        bool isTimeSpan() const;
        DEEPEQ_DLL
        bool isObject() const;

        // True if getElements() may be called: arrays, sequences, dictionaries and domain objects
        // that are enumerable.
        DEEPEQ_DLL
        bool isIterable() const;

        // Scalar accessors

        DEEPEQ_DLL
        bool getBoolValue() const;
        DEEPEQ_DLL
        long long getIntValue() const;
        DEEPEQ_DLL
        unsigned long long getUIntValue() const;
        // Declared width of an integer or unsigned value
        DEEPEQ_DLL
        int getIntBits() const;
        DEEPEQ_DLL
        double getRealValue() const;
        DEEPEQ_DLL
        std::string const& getStringValue() const;
        DEEPEQ_DLL
        unsigned long getCharValue() const;
        DEEPEQ_DLL
        long long getDateTimeValue() const;
        DEEPEQ_DLL
        long long getUTCInstant() const;
        DEEPEQ_DLL
        int getUTCOffset() const;
        DEEPEQ_DLL
        std::chrono::microseconds getTimeSpanValue() const;
        DEEPEQ_DLL
        std::string const& getDirectoryPath() const;
        DEEPEQ_DLL
        std::shared_ptr<InputSource> getStreamSource() const;
        DEEPEQ_DLL
        deq_stream_filter_e getStreamFilter() const;
        DEEPEQ_DLL
        std::shared_ptr<DomainObject> getObject() const;

        // Arrays, sequences and tuples

        // For arrays, the declared dimensions; for sequences and tuples, a single dimension equal
        // to the item count.
        DEEPEQ_DLL
        std::vector<size_t> getDimensions() const;
        DEEPEQ_DLL
        size_t getRank() const;
        DEEPEQ_DLL
        size_t getItemCount() const;
        DEEPEQ_DLL
        ValueHandle getItem(size_t n) const;
        DEEPEQ_DLL
        std::vector<ValueHandle> getItems() const;
        // Modifying operations. An array's shape is fixed, so only setItem may be applied to it.
        DEEPEQ_DLL
        void setItem(size_t n, ValueHandle const& item);
        DEEPEQ_DLL
        void appendItem(ValueHandle const& item);
        DEEPEQ_DLL
        void eraseItem(size_t n);
        // Sequences, dictionaries, tuples and arrays; an array is reset to a single empty
        // dimension.
        DEEPEQ_DLL
        void clearItems();

        // Dictionaries. Keys are located with nativeEquals.

        DEEPEQ_DLL
        std::vector<std::pair<ValueHandle, ValueHandle>> getDictItems() const;
        DEEPEQ_DLL
        bool hasKey(ValueHandle const& key) const;
        // Return the value for key or an uninitialized handle if there is none.
        DEEPEQ_DLL
        ValueHandle getKeyValue(ValueHandle const& key) const;
        // Replace the value of an existing key or append a new entry.
        DEEPEQ_DLL
        void setKey(ValueHandle const& key, ValueHandle const& value);
        DEEPEQ_DLL
        void removeKey(ValueHandle const& key);

        // Pairs
        DEEPEQ_DLL
        ValueHandle getKey() const;
        DEEPEQ_DLL
        ValueHandle getValue() const;

        // Elements in iteration order. Dictionaries yield one pair per entry.
        DEEPEQ_DLL
        std::vector<ValueHandle> getElements() const;

        // Equality without any recursion: scalars compare by type and value, containers, streams
        // and directories by identity, and domain objects through DomainObject::nativeEquals.
        DEEPEQ_DLL
        bool nativeEquals(ValueHandle const& other) const;

        // True if both handles refer to the same value.
        DEEPEQ_DLL
        bool isSameObjectAs(ValueHandle const& other) const;

        // Render as short text for diagnostics. Containers re-entered while rendering are shown as
        // "...".
        DEEPEQ_DLL
        std::string unparse() const;

      private:
        ValueHandle(std::shared_ptr<Value> const& obj) :
            obj(obj)
        {
        }
        ValueHandle(std::shared_ptr<Value>&& obj) :
            obj(std::move(obj))
        {
        }

        template <typename T>
        T* as() const;
        void typeError(char const* expected_type, char const* operation) const;
        void unparseInternal(std::string& result, std::vector<Value const*>& path) const;

        std::shared_ptr<Value> obj;
    };

    inline ValueHandle::operator bool() const
    {
        return static_cast<bool>(obj);
    }
} // namespace deepeq

#endif // DEEPEQ_VALUEHANDLE_HH
