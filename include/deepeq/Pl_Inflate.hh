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

#ifndef DEEPEQ_PL_INFLATE_HH
#define DEEPEQ_PL_INFLATE_HH

#include <deepeq/Pipeline.hh>

#include <functional>
#include <memory>

struct z_stream_s;

namespace deepeq
{
    // Decompress zlib (flate) data, writing the decoded bytes to the next pipeline. Stream values
    // created with sf_flate are decoded through this pipeline before their bytes are compared.
    class DEEPEQ_DLL_CLASS Pl_Inflate: public Pipeline
    {
      public:
        static size_t const def_bufsize = 65536;

        DEEPEQ_DLL
        Pl_Inflate(char const* identifier, Pipeline* next, size_t out_bufsize = def_bufsize);
        DEEPEQ_DLL
        ~Pl_Inflate() override;

        // Limit the total number of bytes any one Pl_Inflate may produce; exceeding it throws
        // std::runtime_error. 0, the default, means no limit. The setting is process-wide.
        DEEPEQ_DLL
        static unsigned long long memory_limit();
        DEEPEQ_DLL
        static void memory_limit(unsigned long long limit);

        using Pipeline::write;
        DEEPEQ_DLL
        void write(unsigned char const* data, size_t len) override;
        DEEPEQ_DLL
        void finish() override;

        // Called for conditions that don't stop decoding, such as input that ends before the
        // end of the compressed stream.
        DEEPEQ_DLL
        void setWarnCallback(std::function<void(char const*, int)> callback);

      private:
        DEEPEQ_DLL_PRIVATE
        void inflateData(unsigned char const* data, size_t len, int flush);
        DEEPEQ_DLL_PRIVATE
        void checkError(char const* operation, int error_code);

        class DEEPEQ_DLL_PRIVATE Members
        {
            friend class Pl_Inflate;

          public:
            Members(size_t out_bufsize);
            ~Members();

          private:
            Members(Members const&) = delete;

            std::unique_ptr<unsigned char[]> outbuf;
            size_t out_bufsize;
            std::unique_ptr<z_stream_s> zstream;
            bool initialized{false};
            bool finished{false};
            unsigned long long written{0};
            std::function<void(char const*, int)> callback;
        };

        std::unique_ptr<Members> m;
    };
} // namespace deepeq

#endif // DEEPEQ_PL_INFLATE_HH
