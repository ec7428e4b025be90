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

#ifndef DEEPEQ_LOGGER_HH
#define DEEPEQ_LOGGER_HH

#include <deepeq/DLL.h>
#include <deepeq/Pipeline.hh>

#include <iostream>
#include <memory>

namespace deepeq
{
    class Logger
    {
      public:
        DEEPEQ_DLL
        static std::shared_ptr<Logger> create();

        // Return the default logger. In general, you should use the default logger. A private
        // logger is useful when comparisons run on separate threads and their diagnostics should
        // go to different places, or when a library embedding deepeq doesn't want to interfere
        // with other users of the default logger.
        DEEPEQ_DLL
        static std::shared_ptr<Logger> defaultLogger();

        // Defaults:
        //
        // info -- standard output
        // warn -- whatever error points to
        // error -- standard error
        //
        // "info" is used for diagnostic and trace messages such as those produced by
        // EqualityComparer when DEEPEQ_DEBUG is set. "warn" is used for warnings, for example
        // recoverable conditions reported while decoding stream data. "error" is used for errors.
        //
        // On deletion, finish() is called for the standard output and standard error pipelines,
        // which flushes output. If you supply any custom pipelines, you must call finish() on them
        // yourself. Note that calling finish is not needed for string or ostream pipelines.

        DEEPEQ_DLL
        void info(char const*);
        DEEPEQ_DLL
        void info(std::string const&);
        DEEPEQ_DLL
        std::shared_ptr<Pipeline> getInfo(bool null_okay = false);

        DEEPEQ_DLL
        void warn(char const*);
        DEEPEQ_DLL
        void warn(std::string const&);
        DEEPEQ_DLL
        std::shared_ptr<Pipeline> getWarn(bool null_okay = false);

        DEEPEQ_DLL
        void error(char const*);
        DEEPEQ_DLL
        void error(std::string const&);
        DEEPEQ_DLL
        std::shared_ptr<Pipeline> getError(bool null_okay = false);

        DEEPEQ_DLL
        std::shared_ptr<Pipeline> standardOutput();
        DEEPEQ_DLL
        std::shared_ptr<Pipeline> standardError();
        DEEPEQ_DLL
        std::shared_ptr<Pipeline> discard();

        // Passing a null pointer resets to default
        DEEPEQ_DLL
        void setInfo(std::shared_ptr<Pipeline>);
        DEEPEQ_DLL
        void setWarn(std::shared_ptr<Pipeline>);
        DEEPEQ_DLL
        void setError(std::shared_ptr<Pipeline>);

        // Shortcut for logic to reset output to new output/error streams. out_stream is used for
        // info, err_stream is used for error, and warning is cleared so that it follows error.
        DEEPEQ_DLL
        void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

      private:
        Logger();
        std::shared_ptr<Pipeline> throwIfNull(std::shared_ptr<Pipeline>, bool null_okay);

        class Members
        {
            friend class Logger;

          public:
            DEEPEQ_DLL
            ~Members();

          private:
            Members();
            Members(Members const&) = delete;

            std::shared_ptr<Pipeline> p_discard;
            std::shared_ptr<Pipeline> p_stdout;
            std::shared_ptr<Pipeline> p_stderr;
            std::shared_ptr<Pipeline> p_info;
            std::shared_ptr<Pipeline> p_warn;
            std::shared_ptr<Pipeline> p_error;
        };
        std::shared_ptr<Members> m;
    };
} // namespace deepeq

#endif // DEEPEQ_LOGGER_HH
