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

#ifndef DEEPEQ_FILEINPUTSOURCE_HH
#define DEEPEQ_FILEINPUTSOURCE_HH

#include <deepeq/InputSource.hh>

namespace deepeq
{
    class DEEPEQ_DLL_CLASS FileInputSource: public InputSource
    {
      public:
        FileInputSource() = default;
        DEEPEQ_DLL
        FileInputSource(char const* filename);
        DEEPEQ_DLL
        FileInputSource(char const* description, FILE* filep, bool close_file);
        DEEPEQ_DLL
        void setFilename(char const* filename);
        DEEPEQ_DLL
        void setFile(char const* description, FILE* filep, bool close_file);

        FileInputSource(FileInputSource const&) = delete;
        FileInputSource& operator=(FileInputSource const&) = delete;

        DEEPEQ_DLL
        ~FileInputSource() override;
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

      private:
        void closeFile();

        bool close_file{false};
        std::string filename;
        FILE* file{nullptr};
    };
} // namespace deepeq

#endif // DEEPEQ_FILEINPUTSOURCE_HH
