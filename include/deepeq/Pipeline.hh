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

// Generalized Pipeline interface. By convention, subclasses of Pipeline are called Pl_Something.
//
// When an instance of Pipeline is created with a pointer to a next pipeline, that pipeline writes
// its data to the next one when it finishes with it. The allocator of a pipeline is responsible for
// its destruction; one pipeline object does not manage the memory of its successor.
//
// The client is required to call finish() before destroying a Pipeline in order to avoid loss of
// data. A Pipeline class should not throw an exception in the destructor if this hasn't been done.
//
// Pipelines carry stream data that is decoded before comparison and the text written by Logger.

#ifndef DEEPEQ_PIPELINE_HH
#define DEEPEQ_PIPELINE_HH

#include <deepeq/DLL.h>

#include <memory>
#include <string>

namespace deepeq
{
    // Remember to use DEEPEQ_DLL_CLASS on anything derived from Pipeline so it will work with
    // dynamic_cast across the shared object boundary.
    class DEEPEQ_DLL_CLASS Pipeline
    {
      public:
        DEEPEQ_DLL
        Pipeline(char const* identifier, Pipeline* next);

        DEEPEQ_DLL
        virtual ~Pipeline() = default;

        // Subclasses should implement write and finish to do their jobs and then, if they are not
        // end-of-line pipelines, call next()->write or next()->finish.
        DEEPEQ_DLL
        virtual void write(unsigned char const* data, size_t len) = 0;
        DEEPEQ_DLL
        virtual void finish() = 0;
        DEEPEQ_DLL
        std::string getIdentifier() const;

        // Convenience methods for writing text. The char const* variants expect null-terminated
        // C strings and do not write the null terminators.
        DEEPEQ_DLL
        void writeCStr(char const* cstr);
        DEEPEQ_DLL
        void writeString(std::string const&);
        // This allows *p << "x" << "y" but is not intended to be a general purpose << compatible
        // with ostream.
        DEEPEQ_DLL
        Pipeline& operator<<(char const* cstr);
        DEEPEQ_DLL
        Pipeline& operator<<(std::string const&);
        DEEPEQ_DLL
        Pipeline& operator<<(int);
        DEEPEQ_DLL
        Pipeline& operator<<(long long);
        DEEPEQ_DLL
        Pipeline& operator<<(unsigned long long);
        DEEPEQ_DLL
        Pipeline& operator<<(unsigned long);

        // Overloaded write to reduce casting
        DEEPEQ_DLL
        void write(char const* data, size_t len);

      protected:
        DEEPEQ_DLL
        Pipeline* getNext(bool allow_null = false);
        Pipeline*
        next() const noexcept
        {
            return next_;
        }
        std::string identifier;

      private:
        Pipeline(Pipeline const&) = delete;
        Pipeline& operator=(Pipeline const&) = delete;

        Pipeline* next_;
    };
} // namespace deepeq

#endif // DEEPEQ_PIPELINE_HH
