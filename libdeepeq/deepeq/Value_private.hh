#ifndef VALUE_PRIVATE_HH
#define VALUE_PRIVATE_HH

#include <deepeq/Constants.h>
#include <deepeq/DomainObject.hh>
#include <deepeq/InputSource.hh>
#include <deepeq/ValueHandle.hh>

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// One class per value type. The alternatives of Value::value appear in the same order as the
// type codes in deq_value_type_e so that a value's type code is the index of its alternative.

namespace deepeq
{
    class DEQ_Null final
    {
    };

    class DEQ_Bool final
    {
      public:
        explicit DEQ_Bool(bool val) :
            val(val)
        {
        }
        bool val;
    };

    class DEQ_Integer final
    {
      public:
        DEQ_Integer(long long val, int bits) :
            val(val),
            bits(bits)
        {
        }
        long long val;
        int bits;
    };

    class DEQ_Unsigned final
    {
      public:
        DEQ_Unsigned(unsigned long long val, int bits) :
            val(val),
            bits(bits)
        {
        }
        unsigned long long val;
        int bits;
    };

    class DEQ_Real final
    {
      public:
        DEQ_Real(double val, bool single) :
            val(val),
            single(single)
        {
        }
        // A single-precision value is stored widened; the conversion is exact.
        double val;
        bool single;
    };

    class DEQ_String final
    {
      public:
        explicit DEQ_String(std::string val) :
            val(std::move(val))
        {
        }
        std::string val;
    };

    class DEQ_Char final
    {
      public:
        explicit DEQ_Char(unsigned long val) :
            val(val)
        {
        }
        unsigned long val;
    };

    class DEQ_Array final
    {
      public:
        DEQ_Array(std::vector<size_t> dimensions, std::vector<ValueHandle> elements) :
            dimensions(std::move(dimensions)),
            elements(std::move(elements))
        {
        }
        std::vector<size_t> dimensions;
        std::vector<ValueHandle> elements;
    };

    class DEQ_Sequence final
    {
      public:
        explicit DEQ_Sequence(std::vector<ValueHandle> elements) :
            elements(std::move(elements))
        {
        }
        std::vector<ValueHandle> elements;
    };

    class DEQ_Dictionary final
    {
      public:
        explicit DEQ_Dictionary(std::vector<std::pair<ValueHandle, ValueHandle>> items) :
            items(std::move(items))
        {
        }
        // Insertion order is kept for rendering; it plays no part in equality.
        std::vector<std::pair<ValueHandle, ValueHandle>> items;
    };

    class DEQ_Pair final
    {
      public:
        DEQ_Pair(ValueHandle key, ValueHandle value) :
            key(std::move(key)),
            value(std::move(value))
        {
        }
        ValueHandle key;
        ValueHandle value;
    };

    class DEQ_Tuple final
    {
      public:
        explicit DEQ_Tuple(std::vector<ValueHandle> elements) :
            elements(std::move(elements))
        {
        }
        std::vector<ValueHandle> elements;
    };

    class DEQ_Stream final
    {
      public:
        DEQ_Stream(std::shared_ptr<InputSource> source, deq_stream_filter_e filter) :
            source(std::move(source)),
            filter(filter)
        {
        }
        std::shared_ptr<InputSource> source;
        deq_stream_filter_e filter;
    };

    class DEQ_Directory final
    {
      public:
        explicit DEQ_Directory(std::string path) :
            path(std::move(path))
        {
        }
        std::string path;
    };

    class DEQ_DateTime final
    {
      public:
        explicit DEQ_DateTime(long long micros) :
            micros(micros)
        {
        }
        long long micros;
    };

    class DEQ_DateTimeOffset final
    {
      public:
        DEQ_DateTimeOffset(long long utc_micros, int offset_minutes) :
            utc_micros(utc_micros),
            offset_minutes(offset_minutes)
        {
        }
        long long utc_micros;
        int offset_minutes;
    };

    class DEQ_TimeSpan final
    {
      public:
        explicit DEQ_TimeSpan(std::chrono::microseconds duration) :
            duration(duration)
        {
        }
        std::chrono::microseconds duration;
    };

    class DEQ_Object final
    {
      public:
        explicit DEQ_Object(std::shared_ptr<DomainObject> object) :
            object(std::move(object))
        {
        }
        std::shared_ptr<DomainObject> object;
    };

    class Value
    {
      public:
        template <typename T>
        Value(T&& value) :
            value(std::forward<T>(value))
        {
        }

        template <typename T, typename... Args>
        static std::shared_ptr<Value>
        create(Args&&... args)
        {
            return std::make_shared<Value>(std::forward<T>(T(std::forward<Args>(args)...)));
        }

        // Return a unique type code for the value
        deq_value_type_e
        getTypeCode() const
        {
            return static_cast<deq_value_type_e>(value.index());
        }

      private:
        friend class ValueHandle;

        Value(Value const&) = delete;
        Value& operator=(Value const&) = delete;

        typedef std::variant<
            std::monostate,
            DEQ_Null,
            DEQ_Bool,
            DEQ_Integer,
            DEQ_Unsigned,
            DEQ_Real,
            DEQ_String,
            DEQ_Char,
            DEQ_Array,
            DEQ_Sequence,
            DEQ_Dictionary,
            DEQ_Pair,
            DEQ_Tuple,
            DEQ_Stream,
            DEQ_Directory,
            DEQ_DateTime,
            DEQ_DateTimeOffset,
            DEQ_TimeSpan,
            DEQ_Object>
            Variant;
        Variant value;
    };

    template <typename T>
    T*
    ValueHandle::as() const
    {
        if (!obj) {
            return nullptr;
        }
        if (std::holds_alternative<T>(obj->value)) {
            return &std::get<T>(obj->value);
        }
        return nullptr;
    }
} // namespace deepeq

#endif // VALUE_PRIVATE_HH
