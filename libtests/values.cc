#include <deepeq/assert_test.h>

#include <deepeq/BufferInputSource.hh>
#include <deepeq/DomainObject.hh>
#include <deepeq/ValueHandle.hh>

#include <iostream>
#include <limits>
#include <stdexcept>

using namespace deepeq;
using namespace std::chrono_literals;

typedef ValueHandle VH;

static void
test_scalars()
{
    VH none;
    assert(!none);
    assert(!none.isInitialized());
    assert(none.isAbsent() && !none.isNull());
    assert(none.getTypeCode() == vt_uninitialized);

    auto null = VH::newNull();
    assert(null && null.isNull() && null.isAbsent());
    assert(std::string(null.getTypeName()) == "null");

    auto t = VH::newBool(true);
    assert(t.isBool() && t.getBoolValue());

    auto i = VH::newInteger(-5, 8);
    assert(i.isInteger() && i.isNumber() && (i.getIntValue() == -5) && (i.getIntBits() == 8));
    auto u = VH::newUnsigned(std::numeric_limits<unsigned long long>::max(), 64);
    assert(u.isUnsigned() && (u.getUIntValue() == 18446744073709551615ULL));
    assert(VH::newInteger(-128, 8).getIntValue() == -128);
    assert(VH::newUnsigned(255, 8).getUIntValue() == 255);

    auto r = VH::newReal(2.5);
    assert(r.isReal() && !r.isSingle() && (r.getRealValue() == 2.5));
    auto s = VH::newSingle(0.1f);
    assert(s.isReal() && s.isSingle() && s.isNumber());
    assert(s.getRealValue() == static_cast<double>(0.1f));

    auto str = VH::newString("potato");
    assert(str.isString() && (str.getStringValue() == "potato"));
    auto ch = VH::newChar(0x3b1);
    assert(ch.isChar() && (ch.getCharValue() == 0x3b1));

    for (auto const& v: {t, i, u, r, s, str, ch}) {
        assert(!v.isIterable());
    }
    std::cout << "scalars done" << std::endl;
}

static void
test_validation()
{
    auto expect_logic_error = [](char const* what, auto fn) {
        try {
            fn();
            std::cout << what << ": no exception" << std::endl;
            assert(false);
        } catch (std::logic_error& e) {
            std::cout << what << ": " << e.what() << std::endl;
        }
    };

    expect_logic_error("width", [] { VH::newInteger(1, 12); });
    expect_logic_error("int8 overflow", [] { VH::newInteger(128, 8); });
    expect_logic_error("int16 underflow", [] { VH::newInteger(-32769, 16); });
    expect_logic_error("uint8 overflow", [] { VH::newUnsigned(256, 8); });
    expect_logic_error("code point", [] { VH::newChar(0x110000); });
    expect_logic_error("array rank", [] { VH::newArray({}, {}); });
    expect_logic_error("array shape", [] {
        VH::newArray({2, 2}, {VH::newInteger(1), VH::newInteger(2), VH::newInteger(3)});
    });
    expect_logic_error("null stream", [] { VH::newStream(nullptr); });
    expect_logic_error("null object", [] { VH::newObject(nullptr); });
    expect_logic_error("offset", [] { VH::newDateTimeOffset(0, 15 * 60); });
    expect_logic_error("null key", [] { VH::newDictionary({{VH::newNull(), VH::newInteger(1)}}); });

    // Accessors for the wrong type
    auto str = VH::newString("x");
    try {
        str.getDimensions();
        assert(false);
    } catch (std::logic_error& e) {
        assert(
            std::string(e.what()) ==
            "operation for array attempted on value of type string: getDimensions");
    }
    expect_logic_error("getIntValue", [&] { str.getIntValue(); });
    expect_logic_error("appendItem", [] { VH::newArray({}).appendItem(VH::newNull()); });
    expect_logic_error("getItem range", [] { VH::newSequence().getItem(0); });
    expect_logic_error("getElements", [] { VH::newTuple({}).getElements(); });
    std::cout << "validation done" << std::endl;
}

static void
test_containers()
{
    auto one = VH::newInteger(1);
    auto two = VH::newInteger(2);
    auto three = VH::newInteger(3);

    auto seq = VH::newSequence({one, two});
    assert(seq.isSequence() && seq.isIterable());
    seq.appendItem(three);
    assert(seq.getItemCount() == 3);
    assert(seq.getDimensions() == std::vector<size_t>{3});
    assert(seq.getItem(2).isSameObjectAs(three));
    seq.eraseItem(0);
    assert(seq.getItemCount() == 2);
    assert(seq.getItem(0).isSameObjectAs(two));
    seq.setItem(1, one);
    assert(seq.unparse() == "[2, 1]");

    auto matrix = VH::newArray({2, 3}, {one, two, three, three, two, one});
    assert(matrix.isArray() && (matrix.getRank() == 2));
    assert(matrix.getDimensions() == (std::vector<size_t>{2, 3}));
    assert(matrix.unparse() == "[[1, 2, 3], [3, 2, 1]]");
    assert(VH::newArray({one}).unparse() == "[1]");
    assert(VH::newArray({0, 2}, {}).unparse() == "[[]]");
    matrix.clearItems();
    assert(matrix.getDimensions() == std::vector<size_t>{0});

    auto tuple = VH::newTuple({one, VH::newString("a")});
    assert(tuple.isTuple() && !tuple.isIterable());
    assert(tuple.unparse() == "(1, \"a\")");

    auto dict = VH::newDictionary({{VH::newString("a"), one}, {VH::newString("b"), two}});
    assert(dict.isDictionary() && dict.isIterable());
    assert(dict.hasKey(VH::newString("a")));
    assert(!dict.hasKey(VH::newString("c")));
    assert(dict.getKeyValue(VH::newString("b")).isSameObjectAs(two));
    assert(!dict.getKeyValue(VH::newString("c")).isInitialized());
    dict.setKey(VH::newString("a"), three);
    assert(dict.getItemCount() == 2);
    assert(dict.getKeyValue(VH::newString("a")).isSameObjectAs(three));
    dict.setKey(VH::newString("c"), one);
    dict.removeKey(VH::newString("b"));
    assert(dict.unparse() == "{\"a\": 3, \"c\": 1}");
    auto elements = dict.getElements();
    assert(elements.size() == 2);
    assert(elements.at(0).isPair());
    assert(elements.at(0).getKey().getStringValue() == "a");
    assert(elements.at(0).getValue().isSameObjectAs(three));
    assert(elements.at(1).unparse() == "[\"c\", 1]");

    // A sequence that contains itself
    auto cyclic = VH::newSequence({one});
    cyclic.appendItem(cyclic);
    assert(cyclic.unparse() == "[1, ...]");
    cyclic.clearItems();
    std::cout << "containers done" << std::endl;
}

static void
test_other_types()
{
    auto stream = VH::newStream(std::make_shared<BufferInputSource>("buf", "data"), sf_flate);
    assert(stream.isStream() && (stream.getStreamFilter() == sf_flate));
    assert(stream.getStreamSource()->getName() == "buf");
    assert(stream.unparse() == "<stream buf>");

    auto dir = VH::newDirectory("/tmp");
    assert(dir.isDirectory() && (dir.getDirectoryPath() == "/tmp"));
    assert(dir.unparse() == "<directory /tmp>");

    auto dt = VH::newDateTime(Util::CalendarTime(2024, 3, 1, 12, 0, 0, 250));
    assert(dt.isDateTime());
    assert(dt.unparse() == "2024-03-01T12:00:00.000250");

    // 12:00 at +02:00 is 10:00 UTC
    auto dto = VH::newDateTimeOffset(Util::CalendarTime(2024, 3, 1, 12, 0, 0, 0, 120));
    assert(dto.isDateTimeOffset() && (dto.getUTCOffset() == 120));
    assert(
        dto.getUTCInstant() ==
        Util::calendar_time_to_micros(Util::CalendarTime(2024, 3, 1, 10, 0, 0)));
    assert(dto.unparse() == "2024-03-01T12:00:00+02:00");

    assert(VH::newTimeSpan(90s).unparse() == "00:01:30");
    assert(VH::newTimeSpan(-(26h + 1us)).unparse() == "-1.02:00:00.000001");
    assert(VH::newTimeSpan(0s).isTimeSpan());

    assert(VH::newReal(0.1).unparse() == "0.1");
    assert(VH::newSingle(0.1f).unparse() == "0.1");
    assert(VH::newChar('x').unparse() == "'x'");
    assert(VH::newString("a\"b\\c\n").unparse() == "\"a\\\"b\\\\c\\n\"");
    assert(VH::newBool(false).unparse() == "false");
    assert(VH::newNull().unparse() == "null");

    auto obj = VH::newObject(std::make_shared<DomainObject>());
    assert(obj.isObject() && !obj.isIterable());
    assert(obj.unparse() == "<object>");
    std::cout << "other types done" << std::endl;
}

static void
test_native_equals()
{
    assert(VH().nativeEquals(VH::newNull()));
    assert(!VH::newNull().nativeEquals(VH::newInteger(0)));
    assert(VH::newInteger(3).nativeEquals(VH::newInteger(3, 64)));
    assert(!VH::newInteger(3).nativeEquals(VH::newUnsigned(3)));
    assert(!VH::newReal(0.5).nativeEquals(VH::newSingle(0.5f)));
    assert(VH::newString("a").nativeEquals(VH::newString("a")));
    assert(!VH::newString("a").nativeEquals(VH::newString("A")));
    // Same instant, different offsets
    assert(VH::newDateTimeOffset(0, 60).nativeEquals(VH::newDateTimeOffset(0, -60)));

    auto seq = VH::newSequence();
    assert(seq.nativeEquals(seq));
    assert(!seq.nativeEquals(VH::newSequence()));
    assert(seq.isSameObjectAs(seq));
    assert(!VH().isSameObjectAs(VH()));

    auto a = std::make_shared<DomainObject>();
    auto b = std::make_shared<DomainObject>();
    assert(VH::newObject(a).nativeEquals(VH::newObject(a)));
    assert(!VH::newObject(a).nativeEquals(VH::newObject(b)));
    std::cout << "native equals done" << std::endl;
}

int
main()
{
    test_scalars();
    test_validation();
    test_containers();
    test_other_types();
    test_native_equals();
    std::cout << "values: all tests passed" << std::endl;
    return 0;
}
