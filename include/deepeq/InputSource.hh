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

#ifndef DEEPEQ_INPUTSOURCE_HH
#define DEEPEQ_INPUTSOURCE_HH

#include <deepeq/DLL.h>
#include <deepeq/Types.h>

#include <cstdio>
#include <memory>
#include <string>

namespace deepeq
{
    // A readable, seekable source of bytes. Stream values refer to an InputSource; comparing two
    // streams reads each from its current position to the end.
    //
    // Remember to use DEEPEQ_DLL_CLASS on anything derived from InputSource so it will work with
    // dynamic_cast across the shared object boundary.
    class DEEPEQ_DLL_CLASS InputSource
    {
      public:
        InputSource() = default;

        virtual ~InputSource() = default;

        DEEPEQ_DLL
        void setLastOffset(deq_offset_t);
        DEEPEQ_DLL
        deq_offset_t getLastOffset() const;

        // Read up to count bytes starting at offset at, or at the current position if at is
        // negative, and return them as a string.
        DEEPEQ_DLL
        std::string read(size_t count, deq_offset_t at = -1);

        virtual std::string const& getName() const = 0;
        virtual deq_offset_t tell() = 0;
        virtual void seek(deq_offset_t offset, int whence) = 0;
        virtual void rewind() = 0;
        virtual size_t read(char* buffer, size_t length) = 0;

      protected:
        deq_offset_t last_offset{0};
    };
} // namespace deepeq

#endif // DEEPEQ_INPUTSOURCE_HH
