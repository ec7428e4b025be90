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

#ifndef DEEPEQ_SYSTEMERROR_HH
#define DEEPEQ_SYSTEMERROR_HH

#include <deepeq/DLL.h>

#include <stdexcept>
#include <string>

namespace deepeq
{
    // Raised when an operating system call fails while reading a stream or listing a directory.
    // what() combines the description with the text for the saved errno.
    class DEEPEQ_DLL_CLASS SystemError: public std::runtime_error
    {
      public:
        DEEPEQ_DLL
        SystemError(std::string const& description, int system_errno);
        DEEPEQ_DLL
        ~SystemError() noexcept override = default;

        // To get a complete error string, call what(), provided by std::exception. The accessors
        // below return the original values used to create the exception.

        DEEPEQ_DLL
        std::string const& getDescription() const;
        DEEPEQ_DLL
        int getErrno() const;

      private:
        DEEPEQ_DLL_PRIVATE
        static std::string createWhat(std::string const& description, int system_errno);

        std::string description;
        int system_errno;
    };
} // namespace deepeq

#endif // DEEPEQ_SYSTEMERROR_HH
