#include <deepeq/Util.hh>

#include <deepeq/IntC.hh>
#include <deepeq/SystemError.hh>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace deepeq;

namespace
{
    long long const micros_per_second = 1000000LL;
    long long const micros_per_day = 86400LL * micros_per_second;

    // Days since 1970-01-01 in the proleptic Gregorian calendar. Eras are 400-year cycles starting
    // on March 1 so the leap day falls at the end of each year of the cycle.
    long long
    days_from_civil(long long y, unsigned m, unsigned d)
    {
        y -= (m <= 2) ? 1 : 0;
        long long era = (y >= 0 ? y : y - 399) / 400;
        auto yoe = static_cast<unsigned>(y - era * 400);
        unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<long long>(doe) - 719468;
    }

    void
    civil_from_days(long long z, int& year, int& month, int& day)
    {
        z += 719468;
        long long era = (z >= 0 ? z : z - 146096) / 146097;
        auto doe = static_cast<unsigned>(z - era * 146097);
        unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        long long y = static_cast<long long>(yoe) + era * 400;
        unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        unsigned mp = (5 * doy + 2) / 153;
        unsigned d = doy - (153 * mp + 2) / 5 + 1;
        unsigned m = mp < 10 ? mp + 3 : mp - 9;
        year = IntC::to_int(y + (m <= 2 ? 1 : 0));
        month = IntC::to_int(m);
        day = IntC::to_int(d);
    }

    bool
    is_leap(int year)
    {
        return ((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0);
    }

    int
    days_in_month(int year, int month)
    {
        static int const days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if ((month == 2) && is_leap(year)) {
            return 29;
        }
        return days[month - 1];
    }
} // namespace

template <typename T>
static std::string
pad_number(T num, int length)
{
    // A negative length appends spaces and a positive length prepends zeroes.
    std::string cvt = std::to_string(num);
    std::string result;
    int str_length = IntC::to_int(cvt.length());
    if ((length > 0) && (str_length < length)) {
        result.append(IntC::to_size(length - str_length), '0');
    }
    result += cvt;
    if ((length < 0) && (str_length < -length)) {
        result.append(IntC::to_size(-length - str_length), ' ');
    }
    return result;
}

std::string
Util::uint_to_string(unsigned long long num, int length)
{
    return pad_number(num, length);
}

std::string
Util::double_to_string(double num, int decimal_places, bool trim_trailing_zeroes)
{
    if (decimal_places <= 0) {
        char buf[64];
        auto r = std::to_chars(buf, buf + sizeof(buf), num);
        if (r.ec != std::errc()) {
            throw std::logic_error("Util::double_to_string: buffer too small");
        }
        return {buf, r.ptr};
    }
    std::ostringstream buf;
    buf.imbue(std::locale::classic());
    buf << std::setprecision(decimal_places) << std::fixed << num;
    std::string result = buf.str();
    if (trim_trailing_zeroes) {
        while ((result.length() > 1) && (result.back() == '0')) {
            result.pop_back();
        }
        if ((result.length() > 1) && (result.back() == '.')) {
            result.pop_back();
        }
    }
    return result;
}

void
Util::throw_system_error(std::string const& description)
{
    throw SystemError(description, errno);
}

FILE*
Util::safe_fopen(char const* filename, char const* mode)
{
    return fopen_wrapper(std::string("open ") + filename, fopen(filename, mode));
}

FILE*
Util::fopen_wrapper(std::string const& description, FILE* f)
{
    if (f == nullptr) {
        throw_system_error(description);
    }
    return f;
}

int
Util::seek(FILE* stream, deq_offset_t offset, int whence)
{
#if defined _MSC_VER || defined __BORLANDC__
    return _fseeki64(stream, offset, whence);
#else
    return fseeko(stream, IntC::convert<off_t>(offset), whence);
#endif
}

deq_offset_t
Util::tell(FILE* stream)
{
#if defined _MSC_VER || defined __BORLANDC__
    return _ftelli64(stream);
#else
    return IntC::to_offset(ftello(stream));
#endif
}

bool
Util::get_env(std::string const& var, std::string* value)
{
    char* p = getenv(var.c_str());
    if (p == nullptr) {
        return false;
    }
    if (value) {
        *value = p;
    }
    return true;
}

std::string
Util::getWhoami(char const* argv0)
{
    std::string whoami = argv0;
    auto slash = whoami.find_last_of("/\\");
    if (slash != std::string::npos) {
        whoami.erase(0, slash + 1);
    }
    if ((whoami.length() > 4) && (whoami.compare(whoami.length() - 4, 4, ".exe") == 0)) {
        whoami.erase(whoami.length() - 4);
    }
    return whoami;
}

std::string
Util::toUTF8(unsigned long uval)
{
    std::string result;

    // A UTF-8 encoding of a Unicode value is a single byte for Unicode values <= 127. For larger
    // values, the first byte of the UTF-8 encoding has '1' as each of its n highest bits and '0'
    // for its (n+1)th highest bit where n is the total number of bytes required. Subsequent bytes
    // start with '10' and have the remaining 6 bits free for encoding.

    if (uval > 0x7fffffff) {
        throw std::runtime_error("bounds error in Util::toUTF8");
    } else if (uval < 128) {
        result += static_cast<char>(uval);
    } else {
        unsigned char bytes[7];
        bytes[6] = '\0';
        unsigned char* cur_byte = &bytes[5];

        // maximum value that will fit in the current number of bytes
        unsigned char maxval = 0x3f; // six bits

        while (uval > IntC::to_ulong(maxval)) {
            // Assign low six bits plus 10000000 to lowest unused byte position, then shift
            *cur_byte = static_cast<unsigned char>(0x80 + (uval & 0x3f));
            uval >>= 6;
            // Maximum that will fit in high byte now shrinks by one bit
            maxval = static_cast<unsigned char>(maxval >> 1);
            if (cur_byte <= bytes) {
                throw std::logic_error("Util::toUTF8: overflow error");
            }
            --cur_byte;
        }
        // If maxval is k bits long, the high (7 - k) bits of the resulting byte must be high.
        *cur_byte = static_cast<unsigned char>(IntC::to_ulong(0xff - (1 + (maxval << 1))) + uval);

        result += reinterpret_cast<char*>(cur_byte);
    }

    return result;
}

unsigned long
Util::get_next_utf8_codepoint(std::string const& utf8_val, size_t& pos, bool& error)
{
    auto o_pos = pos;
    size_t len = utf8_val.length();
    unsigned char ch = static_cast<unsigned char>(utf8_val.at(pos++));
    error = false;
    if (ch < 128) {
        return static_cast<unsigned long>(ch);
    }

    size_t bytes_needed = 0;
    unsigned bit_check = 0x40;
    unsigned char to_clear = 0x80;
    while (ch & bit_check) {
        ++bytes_needed;
        to_clear = static_cast<unsigned char>(to_clear | bit_check);
        bit_check >>= 1;
    }
    if (((bytes_needed > 5) || (bytes_needed < 1)) || ((pos + bytes_needed) > len)) {
        error = true;
        return 0xfffd;
    }

    auto codepoint = static_cast<unsigned long>(ch & ~to_clear);
    while (bytes_needed > 0) {
        --bytes_needed;
        ch = static_cast<unsigned char>(utf8_val.at(pos++));
        if ((ch & 0xc0) != 0x80) {
            --pos;
            error = true;
            return 0xfffd;
        }
        codepoint <<= 6;
        codepoint += (ch & 0x3f);
    }
    unsigned long lower_bound = 0;
    switch (pos - o_pos) {
    case 2:
        lower_bound = 1 << 7;
        break;
    case 3:
        lower_bound = 1 << 11;
        break;
    case 4:
        lower_bound = 1 << 16;
        break;
    case 5:
        lower_bound = 1 << 21;
        break;
    case 6:
        lower_bound = 1 << 26;
        break;
    default:
        lower_bound = 0;
    }

    if (lower_bound > 0 && codepoint < lower_bound) {
        // Too many bytes were used, but return whatever character was encoded.
        error = true;
    }
    return codepoint;
}

unsigned long
Util::fold_case(unsigned long c)
{
    if (c < 0x80) {
        return ((c >= 'A') && (c <= 'Z')) ? c + 0x20 : c;
    }
    if (c < 0x100) {
        // Latin-1: U+00D7 is the multiplication sign.
        return ((c >= 0xc0) && (c <= 0xde) && (c != 0xd7)) ? c + 0x20 : c;
    }
    if (c < 0x180) {
        // Latin Extended-A alternates upper and lower case with a shift of parity at U+0138 and
        // U+0179. U+0130 lowers to plain i; U+0131, U+0138 and U+017F have no upper-case pair.
        if (c == 0x130) {
            return 'i';
        }
        if (c == 0x178) {
            return 0xff;
        }
        if ((c < 0x138) || ((c >= 0x14a) && (c < 0x178))) {
            return ((c % 2) == 0) ? c + 1 : c;
        }
        if (((c > 0x138) && (c < 0x149)) || ((c >= 0x179) && (c < 0x17f))) {
            return ((c % 2) == 1) ? c + 1 : c;
        }
        return c;
    }
    if ((c >= 0x370) && (c < 0x400)) {
        if ((c >= 0x391) && (c <= 0x3ab) && (c != 0x3a2)) {
            return c + 0x20;
        }
        switch (c) {
        case 0x386:
            return 0x3ac;
        case 0x388:
        case 0x389:
        case 0x38a:
            return c + 0x25;
        case 0x38c:
            return 0x3cc;
        case 0x38e:
        case 0x38f:
            return c + 0x3f;
        default:
            return c;
        }
    }
    if ((c >= 0x400) && (c < 0x530)) {
        if (c < 0x410) {
            return c + 0x50;
        }
        if (c < 0x430) {
            return c + 0x20;
        }
        if (((c >= 0x460) && (c < 0x482)) || ((c >= 0x48a) && (c < 0x4c0)) || (c >= 0x4d0)) {
            return ((c % 2) == 0) ? c + 1 : c;
        }
        if (c == 0x4c0) {
            return 0x4cf;
        }
        if ((c > 0x4c0) && (c < 0x4cf)) {
            return ((c % 2) == 1) ? c + 1 : c;
        }
    }
    return c;
}

std::string
Util::utf8_fold_case(std::string const& utf8_val)
{
    std::string result;
    result.reserve(utf8_val.length());
    size_t pos = 0;
    size_t len = utf8_val.length();
    while (pos < len) {
        size_t start = pos;
        bool error = false;
        unsigned long codepoint = get_next_utf8_codepoint(utf8_val, pos, error);
        if (error) {
            // Keep the original bytes so that malformed input still compares bytewise.
            if (pos == start) {
                ++pos;
            }
            result.append(utf8_val, start, pos - start);
        } else {
            result += toUTF8(fold_case(codepoint));
        }
    }
    return result;
}

long long
Util::calendar_time_to_micros(CalendarTime const& t)
{
    if ((t.month < 1) || (t.month > 12) || (t.day < 1) ||
        (t.day > days_in_month(t.year, t.month)) || (t.hour < 0) || (t.hour > 23) ||
        (t.minute < 0) || (t.minute > 59) || (t.second < 0) || (t.second > 59) ||
        (t.microsecond < 0) || (t.microsecond > 999999)) {
        throw std::logic_error(
            "Util::calendar_time_to_micros: field out of range in " +
            calendar_time_to_iso8601(t, false));
    }
    long long days = days_from_civil(t.year, IntC::to_uint(t.month), IntC::to_uint(t.day));
    long long seconds = (t.hour * 3600LL) + (t.minute * 60LL) + t.second;
    return (days * micros_per_day) + (seconds * micros_per_second) + t.microsecond;
}

Util::CalendarTime
Util::micros_to_calendar_time(long long micros, int tz_delta)
{
    long long days = micros / micros_per_day;
    long long rest = micros % micros_per_day;
    if (rest < 0) {
        rest += micros_per_day;
        --days;
    }
    CalendarTime result;
    civil_from_days(days, result.year, result.month, result.day);
    long long seconds = rest / micros_per_second;
    result.microsecond = IntC::to_int(rest % micros_per_second);
    result.hour = IntC::to_int(seconds / 3600);
    result.minute = IntC::to_int((seconds / 60) % 60);
    result.second = IntC::to_int(seconds % 60);
    result.tz_delta = tz_delta;
    return result;
}

std::string
Util::calendar_time_to_iso8601(CalendarTime const& t, bool with_offset)
{
    std::string result = pad_number(t.year, 4) + "-" + pad_number(t.month, 2) + "-" +
        pad_number(t.day, 2) + "T" + pad_number(t.hour, 2) + ":" +
        pad_number(t.minute, 2) + ":" + pad_number(t.second, 2);
    if (t.microsecond != 0) {
        result += "." + pad_number(t.microsecond, 6);
    }
    if (with_offset) {
        int delta = t.tz_delta;
        result += (delta < 0 ? "-" : "+");
        if (delta < 0) {
            delta = -delta;
        }
        result += pad_number(delta / 60, 2) + ":" + pad_number(delta % 60, 2);
    }
    return result;
}
