#pragma once

#include <optional>
#include <string>
#include <vector>
#include "DiscoveryConfig.hpp"
#include "../common/Process.hpp"

namespace net_scout::discovery
{
    struct ServiceInfo
    {
        int port = 0;
        std::string state;
        std::string service;
        std::string version;
    };

    struct HostDetails
    {
        std::string ip;
        std::string mac; // empty when the neighbor entry is missing or incomplete
        std::vector<ServiceInfo> services;
        std::string error;
    };

    struct NeighborEntry
    {
        std::string ip;
        std::optional<std::string> mac; // nullopt for INCOMPLETE entries
        std::string state;
    };

    struct NeighborTable
    {
        std::vector<NeighborEntry> items;
        std::string error;
    };

    // On-demand inspection of one address: neighbor table MAC and an nmap
    // service/version scan of the top ports.
    class HostInspector
    {
    public:
        HostInspector(common::ProcessRunner &runner, ToolConfig tools);

        HostDetails Inspect(const std::string &ip);

        // Full `ip neigh show` listing.
        NeighborTable ListNeighbors();

    private:
        std::string LookupMac(const std::string &ip);

        common::ProcessRunner &m_runner;
        ToolConfig m_tools;
    };

    // "192.168.1.1 dev eth0 lladdr aa:bb:cc:dd:ee:ff REACHABLE" -> aa:bb:cc:dd:ee:ff
    std::optional<std::string> ParseIpNeighOutput(const std::string &output);

    // One entry per line with at least five fields; state is the last field.
    std::vector<NeighborEntry> ParseIpNeighTable(const std::string &output);

    // Ports from nmap greppable output (-oG). nullopt when an entry is malformed.
    std::optional<std::vector<ServiceInfo>> ParseNmapGreppable(const std::string &output);
}
