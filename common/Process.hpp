#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace net_scout::common
{
    struct ProcessResult
    {
        bool launched = false;  // false when the executable could not be started
        bool timed_out = false;
        int exit_code = -1;
        std::string out;
        std::string err;

        bool Succeeded() const { return launched && !timed_out && exit_code == 0; }
    };

    class ProcessRunner
    {
    public:
        virtual ~ProcessRunner() = default;

        // argv[0] is looked up in PATH. A process still running at the deadline is killed.
        virtual ProcessResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) = 0;
    };

    class PosixProcessRunner : public ProcessRunner
    {
    public:
        ProcessResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override;
    };
}
