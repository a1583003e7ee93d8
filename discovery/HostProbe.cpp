#include "HostProbe.hpp"
#include "RangeEnumerator.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

namespace net_scout::discovery
{
    namespace
    {
        const std::regex IPV4_LEADING(R"(^\d+\.\d+\.\d+\.\d+)");
        const std::regex ARP_TABLE_ENTRY(R"(\((\d+\.\d+\.\d+\.\d+)\) at ([a-fA-F0-9:]{17}))");
        const std::regex NMAP_PAREN_IP(R"(\((\d+\.\d+\.\d+\.\d+)\)\s*$)");
        const std::string NMAP_REPORT = "Nmap scan report for";

        std::vector<NetworkDevice> FilterToRange(std::vector<NetworkDevice> devices, const std::string &cidr)
        {
            devices.erase(std::remove_if(devices.begin(), devices.end(),
                                         [&](const NetworkDevice &d)
                                         { return !CidrContains(cidr, d.ip); }),
                          devices.end());
            return devices;
        }

        std::string FirstLine(const std::string &text)
        {
            auto end = text.find('\n');
            return text.substr(0, end);
        }

        std::string DescribeFailure(const std::string &tool, const common::ProcessResult &res)
        {
            if (!res.launched)
                return tool + " not available";
            if (res.timed_out)
                return tool + " timed out";
            std::string detail = FirstLine(res.err.empty() ? res.out : res.err);
            return tool + " exited with " + std::to_string(res.exit_code) + (detail.empty() ? "" : ": " + detail);
        }
    }

    std::string NormalizeMac(std::string mac)
    {
        std::transform(mac.begin(), mac.end(), mac.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return mac;
    }

    std::vector<NetworkDevice> ParseArpScanOutput(const std::string &output)
    {
        std::vector<NetworkDevice> devices;
        std::set<std::string> seen;
        std::stringstream ss(output);
        std::string line;

        while (std::getline(ss, line))
        {
            if (!std::regex_search(line, IPV4_LEADING))
                continue;

            std::stringstream tokens(line);
            std::string ip, mac;
            tokens >> ip >> mac;
            if (mac.empty() || !ParseIPv4(ip) || seen.count(ip))
                continue;

            std::string vendor, word;
            while (tokens >> word)
            {
                if (!vendor.empty())
                    vendor += " ";
                vendor += word;
            }
            if (vendor.rfind("(Unknown", 0) == 0)
                vendor.clear();

            NetworkDevice device;
            device.ip = ip;
            device.mac = NormalizeMac(mac);
            device.vendor = vendor;
            devices.push_back(device);
            seen.insert(ip);
        }
        return devices;
    }

    std::vector<NetworkDevice> ParseArpTableOutput(const std::string &output)
    {
        std::vector<NetworkDevice> devices;
        std::set<std::string> seen;
        std::stringstream ss(output);
        std::string line;

        while (std::getline(ss, line))
        {
            std::smatch match;
            if (!std::regex_search(line, match, ARP_TABLE_ENTRY))
                continue;

            std::string ip = match[1];
            if (seen.count(ip))
                continue;

            NetworkDevice device;
            device.ip = ip;
            device.mac = NormalizeMac(match[2]);
            devices.push_back(device);
            seen.insert(ip);
        }
        return devices;
    }

    std::vector<NetworkDevice> ParseProcNetArp(std::istream &input)
    {
        std::vector<NetworkDevice> devices;
        std::string line;
        std::getline(input, line); // header

        while (std::getline(input, line))
        {
            std::stringstream ss(line);
            std::string ip, hw_type, flags, mac, mask, dev;
            ss >> ip >> hw_type >> flags >> mac >> mask >> dev;

            if (ip.empty() || mac.empty() || mac == "00:00:00:00:00:00" || !ParseIPv4(ip))
                continue;

            NetworkDevice device;
            device.ip = ip;
            device.mac = NormalizeMac(mac);
            devices.push_back(device);
        }
        return devices;
    }

    std::vector<NetworkDevice> ParseNmapPingOutput(const std::string &output)
    {
        std::vector<NetworkDevice> devices;
        std::set<std::string> seen;
        std::stringstream ss(output);
        std::string line;

        while (std::getline(ss, line))
        {
            auto pos = line.find(NMAP_REPORT);
            if (pos == std::string::npos)
                continue;

            // "... for 10.0.0.5" or "... for name.lan (10.0.0.5)"
            std::string ip;
            std::smatch match;
            if (std::regex_search(line, match, NMAP_PAREN_IP))
            {
                ip = match[1];
            }
            else
            {
                std::stringstream tokens(line.substr(pos + NMAP_REPORT.size()));
                std::string token;
                while (tokens >> token)
                    ip = token;
            }

            if (!ParseIPv4(ip) || seen.count(ip))
                continue;

            NetworkDevice device;
            device.ip = ip;
            devices.push_back(device);
            seen.insert(ip);
        }
        return devices;
    }

    std::vector<NetworkDevice> MergeCandidates(const std::vector<NetworkDevice> &resolution,
                                               const std::vector<NetworkDevice> &reachability)
    {
        std::vector<NetworkDevice> merged;
        std::unordered_map<std::string, size_t> index;

        for (const auto &device : resolution)
        {
            if (index.count(device.ip))
                continue;
            index[device.ip] = merged.size();
            merged.push_back(device);
        }
        for (const auto &device : reachability)
        {
            if (index.count(device.ip))
                continue;
            index[device.ip] = merged.size();
            merged.push_back(device);
        }
        return merged;
    }

    ArpSweepProbe::ArpSweepProbe(common::ProcessRunner &runner, ToolConfig tools)
        : m_runner(runner), m_tools(std::move(tools))
    {
    }

    SweepResult ArpSweepProbe::Sweep(const std::string &cidr)
    {
        SweepResult result;
        try
        {
            common::ProcessResult res = m_runner.Run({m_tools.arp_scan, "-g", cidr}, m_tools.arp_scan_timeout);

            if (!res.launched)
            {
                std::cout << "[ArpSweep] " << m_tools.arp_scan << " not available, reading neighbor table\n";
                return SweepNeighborTable(cidr);
            }

            if (!res.Succeeded())
            {
                result.error = DescribeFailure(m_tools.arp_scan, res);
                std::cerr << "[ArpSweep] " << result.error << "\n";
                return result;
            }

            result.devices = ParseArpScanOutput(res.out);
        }
        catch (const std::exception &e)
        {
            result.devices.clear();
            result.error = std::string("arp sweep failed: ") + e.what();
            std::cerr << "[ArpSweep] " << result.error << "\n";
        }
        return result;
    }

    SweepResult ArpSweepProbe::SweepNeighborTable(const std::string &cidr)
    {
        SweepResult result;

        common::ProcessResult res = m_runner.Run({m_tools.arp, "-a"}, m_tools.arp_table_timeout);
        if (res.Succeeded())
        {
            result.devices = FilterToRange(ParseArpTableOutput(res.out), cidr);
            return result;
        }

        if (res.launched)
        {
            result.error = DescribeFailure(m_tools.arp, res);
            std::cerr << "[ArpSweep] " << result.error << "\n";
            return result;
        }

        std::ifstream arp_file(m_tools.proc_arp_path);
        if (!arp_file.is_open())
        {
            result.error = "no address-resolution source available";
            std::cerr << "[ArpSweep] " << result.error << "\n";
            return result;
        }

        result.devices = FilterToRange(ParseProcNetArp(arp_file), cidr);
        return result;
    }

    PingSweepProbe::PingSweepProbe(common::ProcessRunner &runner, ToolConfig tools)
        : m_runner(runner), m_tools(std::move(tools))
    {
    }

    SweepResult PingSweepProbe::Sweep(const std::string &cidr)
    {
        SweepResult result;
        try
        {
            common::ProcessResult res = m_runner.Run({m_tools.nmap, "-sn", "-n", cidr}, m_tools.ping_sweep_timeout);
            if (!res.Succeeded())
            {
                result.error = DescribeFailure(m_tools.nmap, res);
                std::cerr << "[PingSweep] " << result.error << "\n";
                return result;
            }

            result.devices = ParseNmapPingOutput(res.out);
        }
        catch (const std::exception &e)
        {
            result.devices.clear();
            result.error = std::string("ping sweep failed: ") + e.what();
            std::cerr << "[PingSweep] " << result.error << "\n";
        }
        return result;
    }
}
