#pragma once

#include <optional>
#include <string>
#include "DiscoveryConfig.hpp"
#include "RangeEnumerator.hpp"
#include "../common/Process.hpp"

namespace net_scout::discovery
{
    struct NetworkInfo
    {
        std::optional<std::string> gateway;
        std::optional<std::string> dns;
        std::optional<std::string> dhcp;
        std::string error;
    };

    // Gateway from the default route, first resolver from resolv.conf and the
    // DHCP server NetworkManager recorded, when it runs.
    class NetworkInfoReader
    {
    public:
        NetworkInfoReader(RangeEnumerator &ranges, common::ProcessRunner &runner, ToolConfig tools);

        NetworkInfo Read();

    private:
        std::optional<std::string> ReadDns();
        std::optional<std::string> ReadDhcpServer();

        RangeEnumerator &m_ranges;
        common::ProcessRunner &m_runner;
        ToolConfig m_tools;
    };

    // First "nameserver <addr>" line.
    std::optional<std::string> ParseResolvConf(const std::string &text);

    // "DHCP4.OPTION[4]:dhcp_server_identifier = 192.168.1.1" from `nmcli -t -f DHCP4.OPTION device show`.
    std::optional<std::string> ParseNmcliDhcpServer(const std::string &output);
}
