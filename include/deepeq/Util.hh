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

#ifndef DEEPEQ_UTIL_HH
#define DEEPEQ_UTIL_HH

#include <deepeq/DLL.h>
#include <deepeq/Types.h>

#include <cstdio>
#include <string>

// Utility functions shared by the comparison engine and its I/O layer.

namespace deepeq::Util
{
    // This is a collection of useful utility functions.
    DEEPEQ_DLL
    std::string uint_to_string(unsigned long long, int length = 0);

    // Format a double using the classic locale. Zero or negative decimal_places means to use the
    // shortest representation that reads back as the same value.
    DEEPEQ_DLL
    std::string double_to_string(double, int decimal_places = 0, bool trim_trailing_zeroes = true);

    // Throw SystemError with the given description and the current value of errno.
    DEEPEQ_DLL
    void throw_system_error(std::string const& description);

    // If the open fails, throws SystemError. Otherwise, the FILE* is returned. The filename should
    // be UTF-8 encoded.
    DEEPEQ_DLL
    FILE* safe_fopen(char const* filename, char const* mode);

    // The FILE* argument is assumed to be the return of fopen. If null, throw SystemError.
    // Otherwise, return the FILE* argument.
    DEEPEQ_DLL
    FILE* fopen_wrapper(std::string const&, FILE*);

    // Wrap around off_t versions of fseek and ftell if available
    DEEPEQ_DLL
    int seek(FILE* stream, deq_offset_t offset, int whence);
    DEEPEQ_DLL
    deq_offset_t tell(FILE* stream);

    // This is a helper function for checking environment variables. If the variable is set,
    // return true and, if value is not null, store its value there.
    DEEPEQ_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);

    // Return the program name from argv[0] without its directory or a trailing ".exe".
    DEEPEQ_DLL
    std::string getWhoami(char const* argv0);

    // Return a string containing the byte representation of the UTF-8 encoding for the unicode
    // value passed in.
    DEEPEQ_DLL
    std::string toUTF8(unsigned long uval);

    // Decode the UTF-8 sequence starting at utf8_val[pos] and advance pos past it. If the sequence
    // is malformed, set error and return U+FFFD; pos is left at the first byte that could not be
    // consumed.
    DEEPEQ_DLL
    unsigned long get_next_utf8_codepoint(std::string const& utf8_val, size_t& pos, bool& error);

    // Culture-invariant simple lower-case mapping. Code points in ASCII, Latin-1, Latin
    // Extended-A, Greek and Cyrillic that have a lower-case form are mapped to it; everything
    // else is returned unchanged.
    DEEPEQ_DLL
    unsigned long fold_case(unsigned long codepoint);

    // Apply fold_case to every code point of a UTF-8 string. Bytes that don't form valid UTF-8 are
    // copied unchanged.
    DEEPEQ_DLL
    std::string utf8_fold_case(std::string const& utf8_val);

    // Broken-down civil time. tz_delta is the offset from UTC in minutes, positive east of
    // Greenwich, and is ignored by conversions that produce naive times.
    struct CalendarTime
    {
        CalendarTime() = default;
        CalendarTime(CalendarTime const&) = default;
        CalendarTime& operator=(CalendarTime const&) = default;
        CalendarTime(
            int year,
            int month,
            int day,
            int hour,
            int minute,
            int second,
            int microsecond = 0,
            int tz_delta = 0) :
            year(year),
            month(month),
            day(day),
            hour(hour),
            minute(minute),
            second(second),
            microsecond(microsecond),
            tz_delta(tz_delta)
        {
        }
        int year{1970}; // actual year, no 1900 stuff
        int month{1};   // 1--12
        int day{1};     // 1--31
        int hour{0};
        int minute{0};
        int second{0};
        int microsecond{0};
        int tz_delta{0}; // minutes east of UTC
    };

    // Convert the wall-clock fields of a CalendarTime to microseconds since 1970-01-01T00:00:00,
    // ignoring tz_delta. Throws std::logic_error if any field is out of range.
    DEEPEQ_DLL
    long long calendar_time_to_micros(CalendarTime const&);

    // Inverse of calendar_time_to_micros. tz_delta of the result is set to the given value.
    DEEPEQ_DLL
    CalendarTime micros_to_calendar_time(long long micros, int tz_delta = 0);

    // Render as ISO-8601 with microsecond precision, e.g. 2024-03-01T12:00:00.000250. When
    // with_offset is true, append the UTC offset as +hh:mm or -hh:mm.
    DEEPEQ_DLL
    std::string calendar_time_to_iso8601(CalendarTime const&, bool with_offset);
} // namespace deepeq::Util

#endif // DEEPEQ_UTIL_HH
