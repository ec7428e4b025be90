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

#ifndef DEEPEQ_TYPES_H
#define DEEPEQ_TYPES_H

/* Provide an offset type that should be as big as off_t on just about any system. If your compiler
 * doesn't support C99 (or at least the "long long" type), then you may have to modify this
 * definition.
 */

typedef long long int deq_offset_t;

#endif /* DEEPEQ_TYPES_H */
