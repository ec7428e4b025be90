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

#ifndef DEEPEQ_DLL_HH
#define DEEPEQ_DLL_HH

#define DEEPEQ_MAJOR_VERSION 1
#define DEEPEQ_MINOR_VERSION 0
#define DEEPEQ_PATCH_VERSION 0
#define DEEPEQ_VERSION "1.0.0"

/*
 * This file defines symbols that control which functions, classes, and methods are exposed to the
 * public ABI. The library is built with -fvisibility=hidden on non-Windows platforms, so anything
 * in the public API must be marked.
 *
 * Use DEEPEQ_DLL_CLASS to export classes (needed for runtime type information, which is required
 * for anything that is thrown, subclassed across the library boundary, or used with
 * dynamic_cast), DEEPEQ_DLL to export methods and functions, and DEEPEQ_DLL_PRIVATE to unexport
 * private methods in exported classes.
 */

#if defined _WIN32 || defined __CYGWIN__
# ifdef libdeepeq_EXPORTS
#  define DEEPEQ_DLL __declspec(dllexport)
# else
#  define DEEPEQ_DLL
# endif
# define DEEPEQ_DLL_PRIVATE
#elif defined __GNUC__
# define DEEPEQ_DLL __attribute__((visibility("default")))
# define DEEPEQ_DLL_PRIVATE __attribute__((visibility("hidden")))
#else
# define DEEPEQ_DLL
# define DEEPEQ_DLL_PRIVATE
#endif
#ifdef __GNUC__
# define DEEPEQ_DLL_CLASS DEEPEQ_DLL
#else
# define DEEPEQ_DLL_CLASS
#endif

#endif /* DEEPEQ_DLL_HH */
