/* Copyright (c) 2024-2025 The deepeq authors
 *
 * This file is part of deepeq.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef DEEPEQ_CONSTANTS_H
#define DEEPEQ_CONSTANTS_H

/*
 * Keep this file 'C' compatible. New values must be added to the end of each enumeration so that
 * no constant's numerical value changes.
 */

/* Value Types */

/* Every value referenced by a ValueHandle has exactly one of these type codes. The numerical value
 * of each type code is the index of the corresponding alternative in the internal value variant,
 * so the order here must match Value_private.hh.
 */
enum deq_value_type_e {
    vt_uninitialized,
    vt_null,
    vt_boolean,
    vt_integer,
    vt_unsigned,
    vt_real,
    vt_string,
    vt_char,
    vt_array,
    vt_sequence,
    vt_dictionary,
    vt_pair,
    vt_tuple,
    vt_stream,
    vt_directory,
    vt_datetime,
    vt_datetime_offset,
    vt_timespan,
    vt_object,
};

/* Tolerance modes. See Tolerance.hh. */

enum deq_tolerance_mode_e {
    tm_exact,   /* values must be equal */
    tm_linear,  /* absolute difference within amount */
    tm_percent, /* difference within amount percent of the expected value */
    tm_ulps,    /* floating point values within amount units in the last place */
    tm_time,    /* temporal values within a duration */
};

/* Stream filters. Data of a filtered stream is decoded before it is compared. */

enum deq_stream_filter_e {
    sf_none,
    sf_flate,
};

#endif /* DEEPEQ_CONSTANTS_H */
