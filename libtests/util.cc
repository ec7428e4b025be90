#include <deepeq/assert_test.h>

#include <deepeq/SystemError.hh>
#include <deepeq/Util.hh>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

using namespace deepeq;

static void
test_to_string()
{
    assert(Util::uint_to_string(5, 3) == "005");
    assert(Util::uint_to_string(5, -3) == "5  ");
    assert(Util::uint_to_string(1234, 2) == "1234");
    assert(Util::uint_to_string(18446744073709551615ULL) == "18446744073709551615");

    assert(Util::double_to_string(0.1) == "0.1");
    assert(Util::double_to_string(1e100) == "1e+100");
    assert(Util::double_to_string(3.14159, 2) == "3.14");
    assert(Util::double_to_string(2.5, 3) == "2.5");
    assert(Util::double_to_string(2.0, 2) == "2");
    assert(Util::double_to_string(2.0, 2, false) == "2.00");
    std::cout << "to string done" << std::endl;
}

static void
test_utf8()
{
    assert(Util::toUTF8(0x41) == "A");
    assert(Util::toUTF8(0xe9) == "\xc3\xa9");
    assert(Util::toUTF8(0x20ac) == "\xe2\x82\xac");
    assert(Util::toUTF8(0x1f600) == "\xf0\x9f\x98\x80");

    std::string s = "a\xc3\xa9\xe2\x82\xac\xff";
    size_t pos = 0;
    bool error = false;
    assert(Util::get_next_utf8_codepoint(s, pos, error) == 'a');
    assert((pos == 1) && !error);
    assert(Util::get_next_utf8_codepoint(s, pos, error) == 0xe9);
    assert((pos == 3) && !error);
    assert(Util::get_next_utf8_codepoint(s, pos, error) == 0x20ac);
    assert((pos == 6) && !error);
    assert(Util::get_next_utf8_codepoint(s, pos, error) == 0xfffd);
    assert(error);

    // Truncated sequence
    std::string t = "\xc3";
    pos = 0;
    assert(Util::get_next_utf8_codepoint(t, pos, error) == 0xfffd);
    assert(error);

    // Bad continuation byte leaves pos at the byte that could not be consumed
    std::string u = "\xc3x";
    pos = 0;
    Util::get_next_utf8_codepoint(u, pos, error);
    assert(error && (pos == 1));
    std::cout << "utf8 done" << std::endl;
}

static void
test_fold_case()
{
    assert(Util::fold_case('A') == 'a');
    assert(Util::fold_case('a') == 'a');
    assert(Util::fold_case('[') == '[');
    assert(Util::fold_case(0xc9) == 0xe9);  // E acute
    assert(Util::fold_case(0xd7) == 0xd7);  // multiplication sign
    assert(Util::fold_case(0xdf) == 0xdf);  // sharp s
    assert(Util::fold_case(0x100) == 0x101);
    assert(Util::fold_case(0x101) == 0x101);
    assert(Util::fold_case(0x130) == 'i');
    assert(Util::fold_case(0x139) == 0x13a);
    assert(Util::fold_case(0x14a) == 0x14b);
    assert(Util::fold_case(0x178) == 0xff);
    assert(Util::fold_case(0x17d) == 0x17e);
    assert(Util::fold_case(0x391) == 0x3b1);  // Alpha
    assert(Util::fold_case(0x3a3) == 0x3c3);  // Sigma
    assert(Util::fold_case(0x386) == 0x3ac);
    assert(Util::fold_case(0x38f) == 0x3ce);
    assert(Util::fold_case(0x3b1) == 0x3b1);
    assert(Util::fold_case(0x401) == 0x451);
    assert(Util::fold_case(0x410) == 0x430);
    assert(Util::fold_case(0x42f) == 0x44f);
    assert(Util::fold_case(0x460) == 0x461);
    assert(Util::fold_case(0x4c0) == 0x4cf);
    assert(Util::fold_case(0x4c1) == 0x4c2);
    assert(Util::fold_case(0x4d0) == 0x4d1);
    assert(Util::fold_case(0x10400) == 0x10400);

    std::string upper = "\xc3\x80\xc3\x89 Stra\xc3\x9f" "e \xce\x91\xce\x92 \xd0\x9f\xd0\xa0";
    std::string lower = "\xc3\xa0\xc3\xa9 stra\xc3\x9f" "e \xce\xb1\xce\xb2 \xd0\xbf\xd1\x80";
    assert(Util::utf8_fold_case(upper) == lower);
    // Invalid bytes are kept as they are
    assert(Util::utf8_fold_case("A\xff" "B\xc3") == "a\xff" "b\xc3");
    std::cout << "fold case done" << std::endl;
}

static void
test_calendar()
{
    Util::CalendarTime epoch;
    assert(Util::calendar_time_to_micros(epoch) == 0);
    assert(Util::calendar_time_to_iso8601(epoch, false) == "1970-01-01T00:00:00");
    assert(Util::calendar_time_to_iso8601(epoch, true) == "1970-01-01T00:00:00+00:00");

    Util::CalendarTime y2k(2000, 1, 1, 0, 0, 0);
    assert(Util::calendar_time_to_micros(y2k) == 946684800LL * 1000000LL);

    Util::CalendarTime leap(2024, 2, 29, 12, 30, 15, 250, -330);
    auto micros = Util::calendar_time_to_micros(leap);
    auto back = Util::micros_to_calendar_time(micros, -330);
    assert(
        (back.year == 2024) && (back.month == 2) && (back.day == 29) && (back.hour == 12) &&
        (back.minute == 30) && (back.second == 15) && (back.microsecond == 250) &&
        (back.tz_delta == -330));
    assert(Util::calendar_time_to_iso8601(back, false) == "2024-02-29T12:30:15.000250");
    assert(Util::calendar_time_to_iso8601(back, true) == "2024-02-29T12:30:15.000250-05:30");

    auto before = Util::micros_to_calendar_time(-1);
    assert(Util::calendar_time_to_iso8601(before, false) == "1969-12-31T23:59:59.999999");

    try {
        Util::calendar_time_to_micros(Util::CalendarTime(2023, 2, 29, 0, 0, 0));
        assert(false);
    } catch (std::logic_error& e) {
        std::cout << "bad date: " << e.what() << std::endl;
    }
    try {
        Util::calendar_time_to_micros(Util::CalendarTime(2023, 1, 1, 24, 0, 0));
        assert(false);
    } catch (std::logic_error&) {
    }
    std::cout << "calendar done" << std::endl;
}

static void
test_os()
{
    errno = ENOENT;
    try {
        Util::throw_system_error("fake failure");
        assert(false);
    } catch (SystemError& e) {
        assert(e.getErrno() == ENOENT);
        assert(e.getDescription() == "fake failure");
        std::cout << "system error: " << e.what() << std::endl;
    }

    FILE* f = tmpfile();
    assert(f != nullptr);
    assert(fwrite("0123456789", 1, 10, f) == 10);
    assert(Util::seek(f, 4, SEEK_SET) == 0);
    assert(Util::tell(f) == 4);
    assert(Util::seek(f, 0, SEEK_END) == 0);
    assert(Util::tell(f) == 10);
    fclose(f);

    std::string value;
    unsetenv("DEEPEQ_UTIL_TEST");
    assert(!Util::get_env("DEEPEQ_UTIL_TEST", &value));
    setenv("DEEPEQ_UTIL_TEST", "potato", 1);
    assert(Util::get_env("DEEPEQ_UTIL_TEST"));
    assert(Util::get_env("DEEPEQ_UTIL_TEST", &value) && (value == "potato"));

    assert(Util::getWhoami("/usr/local/bin/deepeq-dir-diff") == "deepeq-dir-diff");
    assert(Util::getWhoami("C:\\tools\\deepeq-dir-diff.exe") == "deepeq-dir-diff");
    assert(Util::getWhoami("plain") == "plain");
    std::cout << "os done" << std::endl;
}

int
main()
{
    test_to_string();
    test_utf8();
    test_fold_case();
    test_calendar();
    test_os();
    std::cout << "util: all tests passed" << std::endl;
    return 0;
}
