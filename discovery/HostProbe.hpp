#pragma once

#include <istream>
#include <string>
#include <vector>
#include "NetworkDevice.hpp"
#include "DiscoveryConfig.hpp"
#include "../common/Process.hpp"

namespace net_scout::discovery
{
    struct SweepResult
    {
        std::vector<NetworkDevice> devices;
        std::string error; // empty on success

        bool Failed() const { return !error.empty(); }
    };

    // One host discovery strategy over a single CIDR. Sweep() does not throw:
    // a missing tool, a failing tool or unparsable output gives an empty device
    // list and an error string.
    class HostDiscoveryProbe
    {
    public:
        virtual ~HostDiscoveryProbe() = default;
        virtual std::string Name() const = 0;
        virtual SweepResult Sweep(const std::string &cidr) = 0;
    };

    // Address-resolution sweep: arp-scan, then the neighbor table via arp -a,
    // then /proc/net/arp. Yields IP, MAC and (arp-scan only) vendor.
    class ArpSweepProbe : public HostDiscoveryProbe
    {
    public:
        ArpSweepProbe(common::ProcessRunner &runner, ToolConfig tools);

        std::string Name() const override { return "arp-sweep"; }
        SweepResult Sweep(const std::string &cidr) override;

    private:
        SweepResult SweepNeighborTable(const std::string &cidr);

        common::ProcessRunner &m_runner;
        ToolConfig m_tools;
    };

    // Reachability sweep: nmap -sn. Yields IP only.
    class PingSweepProbe : public HostDiscoveryProbe
    {
    public:
        PingSweepProbe(common::ProcessRunner &runner, ToolConfig tools);

        std::string Name() const override { return "ping-sweep"; }
        SweepResult Sweep(const std::string &cidr) override;

    private:
        common::ProcessRunner &m_runner;
        ToolConfig m_tools;
    };

    std::vector<NetworkDevice> ParseArpScanOutput(const std::string &output);
    std::vector<NetworkDevice> ParseArpTableOutput(const std::string &output);
    std::vector<NetworkDevice> ParseProcNetArp(std::istream &input);
    std::vector<NetworkDevice> ParseNmapPingOutput(const std::string &output);

    // Union by IP. An IP reported by both keeps the resolution record.
    std::vector<NetworkDevice> MergeCandidates(const std::vector<NetworkDevice> &resolution,
                                               const std::vector<NetworkDevice> &reachability);

    std::string NormalizeMac(std::string mac);
}
