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

#ifndef DEEPEQ_PL_STRING_HH
#define DEEPEQ_PL_STRING_HH

#include <deepeq/Pipeline.hh>

#include <string>

namespace deepeq
{
    // This pipeline accumulates the data passed to it into a std::string, a reference to which is
    // passed in at construction. Each subsequent use of this pipeline appends to the data
    // accumulated so far.
    //
    // For this pipeline, "next" may be null. If a next pointer is provided, this pipeline will
    // also pass the data through to it and will forward finish() to it. It is okay to not call
    // finish() on this pipeline if it has no "next".
    class DEEPEQ_DLL_CLASS Pl_String: public Pipeline
    {
      public:
        DEEPEQ_DLL
        Pl_String(char const* identifier, Pipeline* next, std::string& s);
        DEEPEQ_DLL
        ~Pl_String() override;

        DEEPEQ_DLL
        void write(unsigned char const* buf, size_t len) override;
        DEEPEQ_DLL
        void finish() override;

      private:
        std::string& s;
    };
} // namespace deepeq

#endif // DEEPEQ_PL_STRING_HH
