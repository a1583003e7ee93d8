#include "NetworkInfo.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace net_scout::discovery
{
    NetworkInfoReader::NetworkInfoReader(RangeEnumerator &ranges, common::ProcessRunner &runner, ToolConfig tools)
        : m_ranges(ranges), m_runner(runner), m_tools(std::move(tools))
    {
    }

    NetworkInfo NetworkInfoReader::Read()
    {
        NetworkInfo info;
        try
        {
            info.gateway = m_ranges.DefaultGateway();
            info.dns = ReadDns();
            info.dhcp = ReadDhcpServer();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[NetInfo] Lookup failed: " << e.what() << "\n";
            info = NetworkInfo{};
            info.error = e.what();
        }
        return info;
    }

    std::optional<std::string> NetworkInfoReader::ReadDns()
    {
        std::ifstream file(m_tools.resolv_conf_path);
        if (!file.is_open())
            return std::nullopt;

        std::stringstream buffer;
        buffer << file.rdbuf();
        return ParseResolvConf(buffer.str());
    }

    std::optional<std::string> NetworkInfoReader::ReadDhcpServer()
    {
        common::ProcessResult res = m_runner.Run({m_tools.nmcli, "-t", "-f", "DHCP4.OPTION", "device", "show"},
                                                 m_tools.network_info_timeout);
        if (!res.Succeeded())
            return std::nullopt;
        return ParseNmcliDhcpServer(res.out);
    }

    std::optional<std::string> ParseResolvConf(const std::string &text)
    {
        std::istringstream lines(text);
        std::string line;
        while (std::getline(lines, line))
        {
            if (line.rfind("nameserver", 0) != 0)
                continue;

            std::istringstream tokens(line);
            std::string keyword, address;
            if (tokens >> keyword >> address)
                return address;
        }
        return std::nullopt;
    }

    std::optional<std::string> ParseNmcliDhcpServer(const std::string &output)
    {
        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            if (line.find("dhcp_server_identifier") == std::string::npos)
                continue;

            auto eq = line.find('=');
            if (eq == std::string::npos)
                continue;

            std::istringstream value(line.substr(eq + 1));
            std::string server;
            if (value >> server)
                return server;
        }
        return std::nullopt;
    }
}
