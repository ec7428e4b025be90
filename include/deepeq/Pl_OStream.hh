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

// End-of-line pipeline that simply writes its data to a std::ostream. The stream is externally
// maintained; this class just writes to and flushes it. This pipeline is reusable.

#ifndef DEEPEQ_PL_OSTREAM_HH
#define DEEPEQ_PL_OSTREAM_HH

#include <deepeq/Pipeline.hh>

#include <iostream>

namespace deepeq
{
    class DEEPEQ_DLL_CLASS Pl_OStream: public Pipeline
    {
      public:
        DEEPEQ_DLL
        Pl_OStream(char const* identifier, std::ostream& os);
        DEEPEQ_DLL
        ~Pl_OStream() override;

        DEEPEQ_DLL
        void write(unsigned char const* buf, size_t len) override;
        DEEPEQ_DLL
        void finish() override;

      private:
        std::ostream& os;
    };
} // namespace deepeq

#endif // DEEPEQ_PL_OSTREAM_HH
