#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net_scout::discovery
{
    struct InterfaceAddress
    {
        std::string name;
        std::string ip;      // empty when the interface has no IPv4 address
        std::string netmask;
        bool loopback = false;
    };

    // Host interface and route introspection. Implementations may throw on platform failure.
    class InterfaceSource
    {
    public:
        virtual ~InterfaceSource() = default;
        virtual std::vector<InterfaceAddress> ListInterfaces() = 0;
        virtual std::optional<std::string> DefaultGateway() = 0;
    };

    class TinsInterfaceSource : public InterfaceSource
    {
    public:
        std::vector<InterfaceAddress> ListInterfaces() override;
        std::optional<std::string> DefaultGateway() override;
    };

    class RangeEnumerator
    {
    public:
        explicit RangeEnumerator(InterfaceSource &source);

        // Network CIDRs of every non-loopback IPv4 interface. Falls back to
        // FallbackRanges() when the interface query fails. Never throws.
        std::vector<std::string> LocalRanges();

        // Single range for one-shot sweeps, in host/prefix form (e.g. 192.168.1.23/24).
        std::string PreferredRange();

        std::optional<std::string> DefaultGateway();

    private:
        InterfaceSource &m_source;
    };

    const std::vector<std::string> &FallbackRanges();

    std::optional<std::uint32_t> ParseIPv4(const std::string &ip);
    std::string FormatIPv4(std::uint32_t value);
    int PrefixLength(std::uint32_t netmask);

    // 192.168.1.23 + 255.255.255.0 -> 192.168.1.0/24
    std::optional<std::string> NetworkCidr(const std::string &ip, const std::string &netmask);
    bool CidrContains(const std::string &cidr, const std::string &ip);
    bool IsPrivateAddress(const std::string &ip);
}
