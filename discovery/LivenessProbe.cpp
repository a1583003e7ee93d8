#include "LivenessProbe.hpp"

#include <iostream>
#include <utility>

namespace net_scout::discovery
{
    PingLivenessProbe::PingLivenessProbe(common::ProcessRunner &runner, ToolConfig tools)
        : m_runner(runner), m_tools(std::move(tools))
    {
    }

    bool PingLivenessProbe::IsReachable(const std::string &ip)
    {
        common::ProcessResult res = m_runner.Run({m_tools.ping, "-c", "1", "-W", "1", ip}, m_tools.ping_timeout);
        if (!res.launched)
            std::cerr << "[Liveness] " << m_tools.ping << " not available: " << res.err << "\n";
        return res.Succeeded();
    }
}
