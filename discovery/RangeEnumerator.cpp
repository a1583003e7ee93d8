#include "RangeEnumerator.hpp"

#include <tins/tins.h>
#include <algorithm>
#include <iostream>
#include <arpa/inet.h>

namespace net_scout::discovery
{
    std::vector<InterfaceAddress> TinsInterfaceSource::ListInterfaces()
    {
        std::vector<InterfaceAddress> result;

        for (const Tins::NetworkInterface &iface : Tins::NetworkInterface::all())
        {
            InterfaceAddress addr;
            addr.name = iface.name();
            try
            {
                Tins::NetworkInterface::Info info = iface.info();
                addr.loopback = iface.is_loopback();
                if (static_cast<uint32_t>(info.ip_addr) != 0)
                {
                    addr.ip = info.ip_addr.to_string();
                    addr.netmask = info.netmask.to_string();
                }
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Ranges] No address info for " << addr.name << ": " << e.what() << "\n";
            }
            result.push_back(addr);
        }
        return result;
    }

    std::optional<std::string> TinsInterfaceSource::DefaultGateway()
    {
        for (const Tins::Utils::RouteEntry &entry : Tins::Utils::route_entries())
        {
            if (static_cast<uint32_t>(entry.destination) == 0 &&
                static_cast<uint32_t>(entry.mask) == 0 &&
                static_cast<uint32_t>(entry.gateway) != 0)
            {
                return entry.gateway.to_string();
            }
        }
        return std::nullopt;
    }

    const std::vector<std::string> &FallbackRanges()
    {
        static const std::vector<std::string> ranges = {"192.168.1.0/24", "192.168.0.0/24", "10.0.0.0/24"};
        return ranges;
    }

    std::optional<std::uint32_t> ParseIPv4(const std::string &ip)
    {
        struct in_addr addr;
        if (inet_pton(AF_INET, ip.c_str(), &addr) != 1)
            return std::nullopt;
        return ntohl(addr.s_addr);
    }

    std::string FormatIPv4(std::uint32_t value)
    {
        struct in_addr addr;
        addr.s_addr = htonl(value);
        char buf[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf)))
            return "";
        return buf;
    }

    int PrefixLength(std::uint32_t netmask)
    {
        int bits = 0;
        while (netmask & 0x80000000u)
        {
            ++bits;
            netmask <<= 1;
        }
        return bits;
    }

    std::optional<std::string> NetworkCidr(const std::string &ip, const std::string &netmask)
    {
        auto ip_val = ParseIPv4(ip);
        auto mask_val = ParseIPv4(netmask);
        if (!ip_val || !mask_val)
            return std::nullopt;

        uint32_t network_val = *ip_val & *mask_val;
        return FormatIPv4(network_val) + "/" + std::to_string(PrefixLength(*mask_val));
    }

    bool CidrContains(const std::string &cidr, const std::string &ip)
    {
        auto slash = cidr.find('/');
        auto base = ParseIPv4(cidr.substr(0, slash));
        auto target = ParseIPv4(ip);
        if (!base || !target)
            return false;

        int prefix = 32;
        if (slash != std::string::npos)
        {
            try
            {
                prefix = std::stoi(cidr.substr(slash + 1));
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Ranges] Bad prefix in " << cidr << ": " << e.what() << "\n";
                return false;
            }
        }
        if (prefix < 0 || prefix > 32)
            return false;

        uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
        return (*base & mask) == (*target & mask);
    }

    bool IsPrivateAddress(const std::string &ip)
    {
        auto value = ParseIPv4(ip);
        if (!value)
            return false;
        return (*value & 0xFF000000u) == 0x0A000000u ||  // 10/8
               (*value & 0xFFF00000u) == 0xAC100000u ||  // 172.16/12
               (*value & 0xFFFF0000u) == 0xC0A80000u;    // 192.168/16
    }

    RangeEnumerator::RangeEnumerator(InterfaceSource &source) : m_source(source) {}

    std::vector<std::string> RangeEnumerator::LocalRanges()
    {
        std::vector<std::string> ranges;
        try
        {
            for (const auto &iface : m_source.ListInterfaces())
            {
                if (iface.ip.empty() || iface.netmask.empty())
                    continue;
                if (iface.loopback || iface.ip.rfind("127.", 0) == 0)
                    continue;

                auto cidr = NetworkCidr(iface.ip, iface.netmask);
                if (!cidr)
                {
                    std::cerr << "[Ranges] Skipping " << iface.name << ": bad address " << iface.ip << "/" << iface.netmask << "\n";
                    continue;
                }
                if (std::find(ranges.begin(), ranges.end(), *cidr) == ranges.end())
                    ranges.push_back(*cidr);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Ranges] Interface query failed: " << e.what() << ". Using fallback ranges.\n";
            return FallbackRanges();
        }
        return ranges;
    }

    std::string RangeEnumerator::PreferredRange()
    {
        std::vector<InterfaceAddress> candidates;
        try
        {
            for (const auto &iface : m_source.ListInterfaces())
            {
                if (iface.ip.empty() || iface.netmask.empty() || iface.loopback || iface.ip.rfind("127.", 0) == 0)
                    continue;
                if (!ParseIPv4(iface.ip) || !ParseIPv4(iface.netmask))
                    continue;
                candidates.push_back(iface);
            }
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Ranges] Interface query failed: " << e.what() << "\n";
        }

        auto host_cidr = [](const InterfaceAddress &iface)
        {
            return iface.ip + "/" + std::to_string(PrefixLength(*ParseIPv4(iface.netmask)));
        };

        for (const auto &iface : candidates)
        {
            if (IsPrivateAddress(iface.ip))
                return host_cidr(iface);
        }
        if (!candidates.empty())
            return host_cidr(candidates.front());

        return FallbackRanges().front();
    }

    std::optional<std::string> RangeEnumerator::DefaultGateway()
    {
        try
        {
            return m_source.DefaultGateway();
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Ranges] Default route lookup failed: " << e.what() << "\n";
        }
        return std::nullopt;
    }
}
