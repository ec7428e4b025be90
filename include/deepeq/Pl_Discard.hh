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

// End-of-line pipeline that discards its output. Logger uses it to silence a channel.

#ifndef DEEPEQ_PL_DISCARD_HH
#define DEEPEQ_PL_DISCARD_HH

#include <deepeq/Pipeline.hh>

namespace deepeq
{
    class DEEPEQ_DLL_CLASS Pl_Discard: public Pipeline
    {
      public:
        DEEPEQ_DLL
        Pl_Discard();
        DEEPEQ_DLL
        ~Pl_Discard() override;
        DEEPEQ_DLL
        void write(unsigned char const*, size_t) override;
        DEEPEQ_DLL
        void finish() override;
    };
} // namespace deepeq

#endif // DEEPEQ_PL_DISCARD_HH
