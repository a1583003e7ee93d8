#pragma once

#include <string>
#include "DiscoveryConfig.hpp"
#include "../common/Process.hpp"

namespace net_scout::discovery
{
    class LivenessProbe
    {
    public:
        virtual ~LivenessProbe() = default;
        virtual bool IsReachable(const std::string &ip) = 0;
    };

    // Single ICMP echo through the system ping utility.
    class PingLivenessProbe : public LivenessProbe
    {
    public:
        PingLivenessProbe(common::ProcessRunner &runner, ToolConfig tools);
        bool IsReachable(const std::string &ip) override;

    private:
        common::ProcessRunner &m_runner;
        ToolConfig m_tools;
    };
}
