#pragma once

#include <chrono>
#include <string>
#include <vector>
#include "NetworkDevice.hpp"
#include "PortProber.hpp"

namespace net_scout::discovery
{
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;
        // Empty when the address has no name.
        virtual std::string Resolve(const std::string &ip) = 0;
    };

    class ReverseDnsResolver : public HostnameResolver
    {
    public:
        std::string Resolve(const std::string &ip) override;
    };

    class DeviceEnricher
    {
    public:
        DeviceEnricher(PortProber &prober, HostnameResolver &resolver,
                       std::vector<int> ports, std::chrono::milliseconds port_timeout);

        // Fills hostname (if unknown), replaces open_ports and recomputes device_type.
        void Enrich(NetworkDevice &device);

    private:
        PortProber &m_prober;
        HostnameResolver &m_resolver;
        std::vector<int> m_ports;
        std::chrono::milliseconds m_port_timeout;
    };

    // Priority chain, first match wins:
    //   80/443 on a .1/.254 address -> router; 22 -> server; 135/445 -> windows_host;
    //   53 -> dns_server; hostname hints (router|gateway|fw, server|srv, printer|print);
    //   any open port -> host; otherwise unknown.
    DeviceType ClassifyDevice(const NetworkDevice &device);
}
