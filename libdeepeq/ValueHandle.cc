#include <deepeq/ValueHandle.hh>

#include <deepeq/Value_private.hh>

#include <deepeq/DomainObject.hh>
#include <deepeq/InputSource.hh>
#include <deepeq/IntC.hh>
#include <deepeq/Util.hh>

#include <algorithm>
#include <array>
#include <charconv>
#include <stdexcept>

using namespace deepeq;

namespace
{
    long long const micros_per_minute = 60LL * 1000000LL;

    void
    check_bits(int bits, char const* factory)
    {
        if (!((bits == 8) || (bits == 16) || (bits == 32) || (bits == 64))) {
            throw std::logic_error(
                std::string("ValueHandle::") + factory + ": unsupported integer width " +
                std::to_string(bits));
        }
    }

    std::string
    unparse_single(double val)
    {
        char buf[64];
        auto r = std::to_chars(buf, buf + sizeof(buf), static_cast<float>(val));
        if (r.ec != std::errc()) {
            throw std::logic_error("ValueHandle::unparse: buffer too small");
        }
        return {buf, r.ptr};
    }

    std::string
    unparse_string(std::string const& val)
    {
        std::string result = "\"";
        for (char ch: val) {
            switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                result += ch;
            }
        }
        result += "\"";
        return result;
    }

    // [-][d.]hh:mm:ss[.ffffff]
    std::string
    unparse_timespan(std::chrono::microseconds duration)
    {
        long long us = duration.count();
        std::string result;
        unsigned long long mag = 0;
        if (us < 0) {
            result += "-";
            mag = 0ULL - static_cast<unsigned long long>(us);
        } else {
            mag = static_cast<unsigned long long>(us);
        }
        unsigned long long fraction = mag % 1000000ULL;
        unsigned long long seconds = mag / 1000000ULL;
        unsigned long long days = seconds / 86400ULL;
        seconds %= 86400ULL;
        if (days > 0) {
            result += Util::uint_to_string(days) + ".";
        }
        result += Util::uint_to_string(seconds / 3600, 2) + ":" +
            Util::uint_to_string((seconds / 60) % 60, 2) + ":" +
            Util::uint_to_string(seconds % 60, 2);
        if (fraction != 0) {
            result += "." + Util::uint_to_string(fraction, 6);
        }
        return result;
    }
} // namespace

ValueHandle
ValueHandle::newNull()
{
    return {Value::create<DEQ_Null>()};
}

ValueHandle
ValueHandle::newBool(bool value)
{
    return {Value::create<DEQ_Bool>(value)};
}

ValueHandle
ValueHandle::newInteger(long long value, int bits)
{
    check_bits(bits, "newInteger");
    if (bits < 64) {
        long long limit = 1LL << (bits - 1);
        if ((value < -limit) || (value >= limit)) {
            throw std::logic_error(
                "ValueHandle::newInteger: " + std::to_string(value) + " does not fit in " +
                std::to_string(bits) + " bits");
        }
    }
    return {Value::create<DEQ_Integer>(value, bits)};
}

ValueHandle
ValueHandle::newUnsigned(unsigned long long value, int bits)
{
    check_bits(bits, "newUnsigned");
    if ((bits < 64) && (value >= (1ULL << bits))) {
        throw std::logic_error(
            "ValueHandle::newUnsigned: " + std::to_string(value) + " does not fit in " +
            std::to_string(bits) + " bits");
    }
    return {Value::create<DEQ_Unsigned>(value, bits)};
}

ValueHandle
ValueHandle::newReal(double value)
{
    return {Value::create<DEQ_Real>(value, false)};
}

ValueHandle
ValueHandle::newSingle(float value)
{
    return {Value::create<DEQ_Real>(static_cast<double>(value), true)};
}

ValueHandle
ValueHandle::newString(std::string const& utf8_value)
{
    return {Value::create<DEQ_String>(utf8_value)};
}

ValueHandle
ValueHandle::newChar(unsigned long codepoint)
{
    if (codepoint > 0x10ffff) {
        throw std::logic_error(
            "ValueHandle::newChar: " + std::to_string(codepoint) + " is not a Unicode code point");
    }
    return {Value::create<DEQ_Char>(codepoint)};
}

ValueHandle
ValueHandle::newArray(std::vector<size_t> const& dimensions, std::vector<ValueHandle> const& items)
{
    if (dimensions.empty()) {
        throw std::logic_error("ValueHandle::newArray: an array must have at least one dimension");
    }
    size_t count = 1;
    std::string shape;
    for (auto d: dimensions) {
        if (!shape.empty()) {
            shape += "x";
        }
        shape += std::to_string(d);
        if ((d != 0) && (count > (static_cast<size_t>(-1) / d))) {
            throw std::logic_error("ValueHandle::newArray: dimensions " + shape + " are too large");
        }
        count *= d;
    }
    if (count != items.size()) {
        throw std::logic_error(
            "ValueHandle::newArray: dimensions " + shape + " don't match " +
            std::to_string(items.size()) + " items");
    }
    return {Value::create<DEQ_Array>(dimensions, items)};
}

ValueHandle
ValueHandle::newArray(std::vector<ValueHandle> const& items)
{
    return newArray({items.size()}, items);
}

ValueHandle
ValueHandle::newSequence(std::vector<ValueHandle> const& items)
{
    return {Value::create<DEQ_Sequence>(items)};
}

ValueHandle
ValueHandle::newDictionary(std::vector<std::pair<ValueHandle, ValueHandle>> const& items)
{
    ValueHandle result(
        Value::create<DEQ_Dictionary>(std::vector<std::pair<ValueHandle, ValueHandle>>()));
    for (auto const& [key, value]: items) {
        result.setKey(key, value);
    }
    return result;
}

ValueHandle
ValueHandle::newPair(ValueHandle const& key, ValueHandle const& value)
{
    return {Value::create<DEQ_Pair>(key, value)};
}

ValueHandle
ValueHandle::newTuple(std::vector<ValueHandle> const& items)
{
    return {Value::create<DEQ_Tuple>(items)};
}

ValueHandle
ValueHandle::newStream(std::shared_ptr<InputSource> source, deq_stream_filter_e filter)
{
    if (!source) {
        throw std::logic_error("ValueHandle::newStream called with a null input source");
    }
    return {Value::create<DEQ_Stream>(std::move(source), filter)};
}

ValueHandle
ValueHandle::newDirectory(std::string const& path)
{
    return {Value::create<DEQ_Directory>(path)};
}

ValueHandle
ValueHandle::newDateTime(long long micros)
{
    return {Value::create<DEQ_DateTime>(micros)};
}

ValueHandle
ValueHandle::newDateTime(Util::CalendarTime const& time)
{
    return newDateTime(Util::calendar_time_to_micros(time));
}

ValueHandle
ValueHandle::newDateTimeOffset(long long utc_micros, int offset_minutes)
{
    if ((offset_minutes < -14 * 60) || (offset_minutes > 14 * 60)) {
        throw std::logic_error(
            "ValueHandle::newDateTimeOffset: UTC offset of " + std::to_string(offset_minutes) +
            " minutes is out of range");
    }
    return {Value::create<DEQ_DateTimeOffset>(utc_micros, offset_minutes)};
}

ValueHandle
ValueHandle::newDateTimeOffset(Util::CalendarTime const& time)
{
    return newDateTimeOffset(
        Util::calendar_time_to_micros(time) - (time.tz_delta * micros_per_minute), time.tz_delta);
}

ValueHandle
ValueHandle::newTimeSpan(std::chrono::microseconds duration)
{
    return {Value::create<DEQ_TimeSpan>(duration)};
}

ValueHandle
ValueHandle::newObject(std::shared_ptr<DomainObject> object)
{
    if (!object) {
        throw std::logic_error("ValueHandle::newObject called with a null object");
    }
    return {Value::create<DEQ_Object>(std::move(object))};
}

deq_value_type_e
ValueHandle::getTypeCode() const
{
    return obj ? obj->getTypeCode() : vt_uninitialized;
}

char const*
ValueHandle::getTypeName() const
{
    static constexpr std::array<char const*, 19> tn{
        "uninitialized",
        "null",
        "boolean",
        "integer",
        "unsigned",
        "real",
        "string",
        "char",
        "array",
        "sequence",
        "dictionary",
        "pair",
        "tuple",
        "stream",
        "directory",
        "datetime",
        "datetime-offset",
        "timespan",
        "object"};
    return tn[getTypeCode()];
}

bool
ValueHandle::isInitialized() const
{
    return static_cast<bool>(obj);
}

bool
ValueHandle::isNull() const
{
    return getTypeCode() == vt_null;
}

bool
ValueHandle::isAbsent() const
{
    return !obj || isNull();
}

bool
ValueHandle::isBool() const
{
    return getTypeCode() == vt_boolean;
}

bool
ValueHandle::isInteger() const
{
    return getTypeCode() == vt_integer;
}

bool
ValueHandle::isUnsigned() const
{
    return getTypeCode() == vt_unsigned;
}

bool
ValueHandle::isReal() const
{
    return getTypeCode() == vt_real;
}

bool
ValueHandle::isSingle() const
{
    auto real = as<DEQ_Real>();
    return real && real->single;
}

bool
ValueHandle::isNumber() const
{
    auto tc = getTypeCode();
    return (tc == vt_integer) || (tc == vt_unsigned) || (tc == vt_real);
}

bool
ValueHandle::isString() const
{
    return getTypeCode() == vt_string;
}

bool
ValueHandle::isChar() const
{
    return getTypeCode() == vt_char;
}

bool
ValueHandle::isArray() const
{
    return getTypeCode() == vt_array;
}

bool
ValueHandle::isSequence() const
{
    return getTypeCode() == vt_sequence;
}

bool
ValueHandle::isDictionary() const
{
    return getTypeCode() == vt_dictionary;
}

bool
ValueHandle::isPair() const
{
    return getTypeCode() == vt_pair;
}

bool
ValueHandle::isTuple() const
{
    return getTypeCode() == vt_tuple;
}

bool
ValueHandle::isStream() const
{
    return getTypeCode() == vt_stream;
}

bool
ValueHandle::isDirectory() const
{
    return getTypeCode() == vt_directory;
}

bool
ValueHandle::isDateTime() const
{
    return getTypeCode() == vt_datetime;
}

bool
ValueHandle::isDateTimeOffset() const
{
    return getTypeCode() == vt_datetime_offset;
}

bool
ValueHandle::isTimeSpan() const
{
    return getTypeCode() == vt_timespan;
}

bool
ValueHandle::isObject() const
{
    return getTypeCode() == vt_object;
}

bool
ValueHandle::isIterable() const
{
    switch (getTypeCode()) {
    case vt_array:
    case vt_sequence:
    case vt_dictionary:
        return true;
    case vt_object:
        return as<DEQ_Object>()->object->isEnumerable();
    default:
        return false;
    }
}

void
ValueHandle::typeError(char const* expected_type, char const* operation) const
{
    throw std::logic_error(
        std::string("operation for ") + expected_type + " attempted on value of type " +
        getTypeName() + ": " + operation);
}

bool
ValueHandle::getBoolValue() const
{
    if (auto boolean = as<DEQ_Bool>()) {
        return boolean->val;
    }
    typeError("boolean", "getBoolValue");
    return false;
}

long long
ValueHandle::getIntValue() const
{
    if (auto integer = as<DEQ_Integer>()) {
        return integer->val;
    }
    typeError("integer", "getIntValue");
    return 0;
}

unsigned long long
ValueHandle::getUIntValue() const
{
    if (auto integer = as<DEQ_Unsigned>()) {
        return integer->val;
    }
    typeError("unsigned", "getUIntValue");
    return 0;
}

int
ValueHandle::getIntBits() const
{
    if (auto integer = as<DEQ_Integer>()) {
        return integer->bits;
    }
    if (auto integer = as<DEQ_Unsigned>()) {
        return integer->bits;
    }
    typeError("integer", "getIntBits");
    return 0;
}

double
ValueHandle::getRealValue() const
{
    if (auto real = as<DEQ_Real>()) {
        return real->val;
    }
    typeError("real", "getRealValue");
    return 0.0;
}

std::string const&
ValueHandle::getStringValue() const
{
    if (auto str = as<DEQ_String>()) {
        return str->val;
    }
    typeError("string", "getStringValue");
    static std::string const empty;
    return empty;
}

unsigned long
ValueHandle::getCharValue() const
{
    if (auto ch = as<DEQ_Char>()) {
        return ch->val;
    }
    typeError("char", "getCharValue");
    return 0;
}

long long
ValueHandle::getDateTimeValue() const
{
    if (auto dt = as<DEQ_DateTime>()) {
        return dt->micros;
    }
    typeError("datetime", "getDateTimeValue");
    return 0;
}

long long
ValueHandle::getUTCInstant() const
{
    if (auto dto = as<DEQ_DateTimeOffset>()) {
        return dto->utc_micros;
    }
    typeError("datetime-offset", "getUTCInstant");
    return 0;
}

int
ValueHandle::getUTCOffset() const
{
    if (auto dto = as<DEQ_DateTimeOffset>()) {
        return dto->offset_minutes;
    }
    typeError("datetime-offset", "getUTCOffset");
    return 0;
}

std::chrono::microseconds
ValueHandle::getTimeSpanValue() const
{
    if (auto ts = as<DEQ_TimeSpan>()) {
        return ts->duration;
    }
    typeError("timespan", "getTimeSpanValue");
    return std::chrono::microseconds(0);
}

std::string const&
ValueHandle::getDirectoryPath() const
{
    if (auto dir = as<DEQ_Directory>()) {
        return dir->path;
    }
    typeError("directory", "getDirectoryPath");
    static std::string const empty;
    return empty;
}

std::shared_ptr<InputSource>
ValueHandle::getStreamSource() const
{
    if (auto stream = as<DEQ_Stream>()) {
        return stream->source;
    }
    typeError("stream", "getStreamSource");
    return nullptr;
}

deq_stream_filter_e
ValueHandle::getStreamFilter() const
{
    if (auto stream = as<DEQ_Stream>()) {
        return stream->filter;
    }
    typeError("stream", "getStreamFilter");
    return sf_none;
}

std::shared_ptr<DomainObject>
ValueHandle::getObject() const
{
    if (auto object = as<DEQ_Object>()) {
        return object->object;
    }
    typeError("object", "getObject");
    return nullptr;
}

std::vector<size_t>
ValueHandle::getDimensions() const
{
    if (auto array = as<DEQ_Array>()) {
        return array->dimensions;
    }
    if (auto seq = as<DEQ_Sequence>()) {
        return {seq->elements.size()};
    }
    if (auto tuple = as<DEQ_Tuple>()) {
        return {tuple->elements.size()};
    }
    typeError("array", "getDimensions");
    return {};
}

size_t
ValueHandle::getRank() const
{
    if (auto array = as<DEQ_Array>()) {
        return array->dimensions.size();
    }
    return getDimensions().size();
}

size_t
ValueHandle::getItemCount() const
{
    if (auto array = as<DEQ_Array>()) {
        return array->elements.size();
    }
    if (auto seq = as<DEQ_Sequence>()) {
        return seq->elements.size();
    }
    if (auto tuple = as<DEQ_Tuple>()) {
        return tuple->elements.size();
    }
    if (auto dict = as<DEQ_Dictionary>()) {
        return dict->items.size();
    }
    typeError("container", "getItemCount");
    return 0;
}

namespace
{
    std::vector<ValueHandle>*
    item_vector(DEQ_Array* array, DEQ_Sequence* seq, DEQ_Tuple* tuple)
    {
        if (array) {
            return &array->elements;
        }
        if (seq) {
            return &seq->elements;
        }
        if (tuple) {
            return &tuple->elements;
        }
        return nullptr;
    }
} // namespace

ValueHandle
ValueHandle::getItem(size_t n) const
{
    auto items = item_vector(as<DEQ_Array>(), as<DEQ_Sequence>(), as<DEQ_Tuple>());
    if (!items) {
        typeError("array", "getItem");
    }
    if (n >= items->size()) {
        throw std::logic_error(
            "ValueHandle::getItem: index " + std::to_string(n) + " out of range for " +
            getTypeName() + " with " + std::to_string(items->size()) + " items");
    }
    return items->at(n);
}

std::vector<ValueHandle>
ValueHandle::getItems() const
{
    auto items = item_vector(as<DEQ_Array>(), as<DEQ_Sequence>(), as<DEQ_Tuple>());
    if (!items) {
        typeError("array", "getItems");
    }
    return *items;
}

void
ValueHandle::setItem(size_t n, ValueHandle const& item)
{
    auto items = item_vector(as<DEQ_Array>(), as<DEQ_Sequence>(), as<DEQ_Tuple>());
    if (!items) {
        typeError("array", "setItem");
    }
    if (n >= items->size()) {
        throw std::logic_error(
            "ValueHandle::setItem: index " + std::to_string(n) + " out of range for " +
            getTypeName() + " with " + std::to_string(items->size()) + " items");
    }
    (*items)[n] = item;
}

void
ValueHandle::appendItem(ValueHandle const& item)
{
    if (auto seq = as<DEQ_Sequence>()) {
        seq->elements.push_back(item);
    } else {
        typeError("sequence", "appendItem");
    }
}

void
ValueHandle::eraseItem(size_t n)
{
    auto seq = as<DEQ_Sequence>();
    if (!seq) {
        typeError("sequence", "eraseItem");
    }
    if (n >= seq->elements.size()) {
        throw std::logic_error(
            "ValueHandle::eraseItem: index " + std::to_string(n) +
            " out of range for sequence with " + std::to_string(seq->elements.size()) + " items");
    }
    seq->elements.erase(seq->elements.begin() + IntC::convert<std::ptrdiff_t>(n));
}

void
ValueHandle::clearItems()
{
    if (auto array = as<DEQ_Array>()) {
        array->dimensions = {0};
        array->elements.clear();
    } else if (auto seq = as<DEQ_Sequence>()) {
        seq->elements.clear();
    } else if (auto tuple = as<DEQ_Tuple>()) {
        tuple->elements.clear();
    } else if (auto dict = as<DEQ_Dictionary>()) {
        dict->items.clear();
    } else if (auto pair = as<DEQ_Pair>()) {
        pair->key = ValueHandle();
        pair->value = ValueHandle();
    } else {
        typeError("container", "clearItems");
    }
}

std::vector<std::pair<ValueHandle, ValueHandle>>
ValueHandle::getDictItems() const
{
    if (auto dict = as<DEQ_Dictionary>()) {
        return dict->items;
    }
    typeError("dictionary", "getDictItems");
    return {};
}

bool
ValueHandle::hasKey(ValueHandle const& key) const
{
    return getKeyValue(key).isInitialized();
}

ValueHandle
ValueHandle::getKeyValue(ValueHandle const& key) const
{
    auto dict = as<DEQ_Dictionary>();
    if (!dict) {
        typeError("dictionary", "getKeyValue");
    }
    for (auto const& item: dict->items) {
        if (item.first.nativeEquals(key)) {
            return item.second;
        }
    }
    return {};
}

void
ValueHandle::setKey(ValueHandle const& key, ValueHandle const& value)
{
    auto dict = as<DEQ_Dictionary>();
    if (!dict) {
        typeError("dictionary", "setKey");
    }
    if (key.isAbsent()) {
        throw std::logic_error("ValueHandle::setKey: dictionary keys may not be null");
    }
    for (auto& item: dict->items) {
        if (item.first.nativeEquals(key)) {
            item.second = value;
            return;
        }
    }
    dict->items.emplace_back(key, value);
}

void
ValueHandle::removeKey(ValueHandle const& key)
{
    auto dict = as<DEQ_Dictionary>();
    if (!dict) {
        typeError("dictionary", "removeKey");
    }
    dict->items.erase(
        std::remove_if(
            dict->items.begin(),
            dict->items.end(),
            [&key](auto const& item) { return item.first.nativeEquals(key); }),
        dict->items.end());
}

ValueHandle
ValueHandle::getKey() const
{
    if (auto pair = as<DEQ_Pair>()) {
        return pair->key;
    }
    typeError("pair", "getKey");
    return {};
}

ValueHandle
ValueHandle::getValue() const
{
    if (auto pair = as<DEQ_Pair>()) {
        return pair->value;
    }
    typeError("pair", "getValue");
    return {};
}

std::vector<ValueHandle>
ValueHandle::getElements() const
{
    if (auto array = as<DEQ_Array>()) {
        return array->elements;
    }
    if (auto seq = as<DEQ_Sequence>()) {
        return seq->elements;
    }
    if (auto dict = as<DEQ_Dictionary>()) {
        std::vector<ValueHandle> result;
        result.reserve(dict->items.size());
        for (auto const& [key, value]: dict->items) {
            result.emplace_back(newPair(key, value));
        }
        return result;
    }
    if (auto object = as<DEQ_Object>()) {
        if (object->object->isEnumerable()) {
            return object->object->getElements();
        }
    }
    typeError("iterable", "getElements");
    return {};
}

bool
ValueHandle::nativeEquals(ValueHandle const& other) const
{
    if (isAbsent() || other.isAbsent()) {
        return isAbsent() && other.isAbsent();
    }
    if (obj == other.obj) {
        return true;
    }
    if (getTypeCode() != other.getTypeCode()) {
        return false;
    }
    switch (getTypeCode()) {
    case vt_boolean:
        return as<DEQ_Bool>()->val == other.as<DEQ_Bool>()->val;
    case vt_integer:
        return as<DEQ_Integer>()->val == other.as<DEQ_Integer>()->val;
    case vt_unsigned:
        return as<DEQ_Unsigned>()->val == other.as<DEQ_Unsigned>()->val;
    case vt_real:
        return (as<DEQ_Real>()->single == other.as<DEQ_Real>()->single) &&
            (as<DEQ_Real>()->val == other.as<DEQ_Real>()->val);
    case vt_string:
        return as<DEQ_String>()->val == other.as<DEQ_String>()->val;
    case vt_char:
        return as<DEQ_Char>()->val == other.as<DEQ_Char>()->val;
    case vt_datetime:
        return as<DEQ_DateTime>()->micros == other.as<DEQ_DateTime>()->micros;
    case vt_datetime_offset:
        return as<DEQ_DateTimeOffset>()->utc_micros == other.as<DEQ_DateTimeOffset>()->utc_micros;
    case vt_timespan:
        return as<DEQ_TimeSpan>()->duration == other.as<DEQ_TimeSpan>()->duration;
    case vt_object:
        return as<DEQ_Object>()->object->nativeEquals(*other.as<DEQ_Object>()->object);
    default:
        // Containers, streams and directories are equal only to themselves.
        return false;
    }
}

bool
ValueHandle::isSameObjectAs(ValueHandle const& other) const
{
    return obj && (obj == other.obj);
}

std::string
ValueHandle::unparse() const
{
    std::string result;
    std::vector<Value const*> path;
    unparseInternal(result, path);
    return result;
}

void
ValueHandle::unparseInternal(std::string& result, std::vector<Value const*>& path) const
{
    auto unparse_list = [&](std::vector<ValueHandle> const& items,
                            char const* open,
                            char const* close) {
        result += open;
        bool first = true;
        for (auto const& item: items) {
            if (!first) {
                result += ", ";
            }
            first = false;
            item.unparseInternal(result, path);
        }
        result += close;
    };

    switch (getTypeCode()) {
    case vt_uninitialized:
        result += "<uninitialized>";
        return;
    case vt_null:
        result += "null";
        return;
    case vt_boolean:
        result += as<DEQ_Bool>()->val ? "true" : "false";
        return;
    case vt_integer:
        result += std::to_string(as<DEQ_Integer>()->val);
        return;
    case vt_unsigned:
        result += std::to_string(as<DEQ_Unsigned>()->val);
        return;
    case vt_real:
        {
            auto real = as<DEQ_Real>();
            result += real->single ? unparse_single(real->val) : Util::double_to_string(real->val);
        }
        return;
    case vt_string:
        result += unparse_string(as<DEQ_String>()->val);
        return;
    case vt_char:
        result += "'" + Util::toUTF8(as<DEQ_Char>()->val) + "'";
        return;
    case vt_stream:
        result += "<stream " + as<DEQ_Stream>()->source->getName() + ">";
        return;
    case vt_directory:
        result += "<directory " + as<DEQ_Directory>()->path + ">";
        return;
    case vt_datetime:
        result += Util::calendar_time_to_iso8601(
            Util::micros_to_calendar_time(as<DEQ_DateTime>()->micros), false);
        return;
    case vt_datetime_offset:
        {
            auto dto = as<DEQ_DateTimeOffset>();
            result += Util::calendar_time_to_iso8601(
                Util::micros_to_calendar_time(
                    dto->utc_micros + (dto->offset_minutes * micros_per_minute),
                    dto->offset_minutes),
                true);
        }
        return;
    case vt_timespan:
        result += unparse_timespan(as<DEQ_TimeSpan>()->duration);
        return;
    case vt_object:
        {
            auto object = as<DEQ_Object>()->object;
            if (std::find(path.begin(), path.end(), obj.get()) != path.end()) {
                result += "...";
                return;
            }
            path.push_back(obj.get());
            result += object->unparse();
            path.pop_back();
        }
        return;
    default:
        break;
    }

    // Containers
    if (std::find(path.begin(), path.end(), obj.get()) != path.end()) {
        result += "...";
        return;
    }
    path.push_back(obj.get());
    if (auto array = as<DEQ_Array>()) {
        // Nested brackets, one level per dimension
        auto const& dims = array->dimensions;
        auto const& elements = array->elements;
        size_t rank = dims.size();
        if (elements.empty()) {
            result += std::string(rank, '[') + std::string(rank, ']');
        } else {
            std::vector<size_t> index(rank, 0);
            for (size_t flat = 0; flat < elements.size(); ++flat) {
                // Open a bracket for every trailing index that is at its start
                size_t opens = 0;
                while ((opens < rank) && (index[rank - 1 - opens] == 0)) {
                    ++opens;
                }
                if (flat > 0) {
                    result += ", ";
                }
                result += std::string(opens, '[');
                elements[flat].unparseInternal(result, path);
                // Advance the index and close brackets for every dimension that wraps
                size_t closes = 0;
                for (size_t d = rank; d > 0; --d) {
                    if (++index[d - 1] < dims[d - 1]) {
                        break;
                    }
                    index[d - 1] = 0;
                    ++closes;
                }
                result += std::string(closes, ']');
            }
        }
    } else if (auto seq = as<DEQ_Sequence>()) {
        unparse_list(seq->elements, "[", "]");
    } else if (auto tuple = as<DEQ_Tuple>()) {
        unparse_list(tuple->elements, "(", ")");
    } else if (auto dict = as<DEQ_Dictionary>()) {
        result += "{";
        bool first = true;
        for (auto const& [key, value]: dict->items) {
            if (!first) {
                result += ", ";
            }
            first = false;
            key.unparseInternal(result, path);
            result += ": ";
            value.unparseInternal(result, path);
        }
        result += "}";
    } else if (auto pair = as<DEQ_Pair>()) {
        result += "[";
        pair->key.unparseInternal(result, path);
        result += ", ";
        pair->value.unparseInternal(result, path);
        result += "]";
    }
    path.pop_back();
}
