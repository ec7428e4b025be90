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

#ifndef DEEPEQ_BUFFERINPUTSOURCE_HH
#define DEEPEQ_BUFFERINPUTSOURCE_HH

#include <deepeq/InputSource.hh>

namespace deepeq
{
    // In-memory input source. The contents are copied into the source, so the caller's string
    // need not outlive it.
    class DEEPEQ_DLL_CLASS BufferInputSource: public InputSource
    {
      public:
        DEEPEQ_DLL
        BufferInputSource(std::string const& description, std::string contents);
        DEEPEQ_DLL
        ~BufferInputSource() override;
        DEEPEQ_DLL
        std::string const& getName() const override;
        DEEPEQ_DLL
        deq_offset_t tell() override;
        DEEPEQ_DLL
        void seek(deq_offset_t offset, int whence) override;
        DEEPEQ_DLL
        void rewind() override;
        DEEPEQ_DLL
        size_t read(char* buffer, size_t length) override;

        // Direct access to the whole contents irrespective of the current position.
        DEEPEQ_DLL
        std::string const& getContents() const;

      private:
        std::string description;
        std::string contents;
        deq_offset_t cur_offset{0};
        deq_offset_t max_offset{0};
    };
} // namespace deepeq

#endif // DEEPEQ_BUFFERINPUTSOURCE_HH
