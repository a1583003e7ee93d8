#include "DeviceEnricher.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <utility>
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace net_scout::discovery
{
    namespace
    {
        bool HasPort(const NetworkDevice &device, int port)
        {
            return std::find(device.open_ports.begin(), device.open_ports.end(), port) != device.open_ports.end();
        }

        bool EndsWith(const std::string &text, const std::string &suffix)
        {
            return text.size() >= suffix.size() &&
                   text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
        }

        bool ContainsAny(const std::string &text, std::initializer_list<const char *> terms)
        {
            for (const char *term : terms)
            {
                if (text.find(term) != std::string::npos)
                    return true;
            }
            return false;
        }
    }

    std::string ReverseDnsResolver::Resolve(const std::string &ip)
    {
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1)
            return "";

        char host[NI_MAXHOST];
        int rc = getnameinfo(reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr),
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
        if (rc != 0)
            return "";
        return host;
    }

    DeviceType ClassifyDevice(const NetworkDevice &device)
    {
        const bool web = HasPort(device, 80) || HasPort(device, 443);
        if (web && (EndsWith(device.ip, ".1") || EndsWith(device.ip, ".254")))
            return DeviceType::Router;
        if (HasPort(device, 22))
            return DeviceType::Server;
        if (HasPort(device, 135) || HasPort(device, 445))
            return DeviceType::WindowsHost;
        if (HasPort(device, 53))
            return DeviceType::DnsServer;

        if (!device.hostname.empty())
        {
            std::string name = device.hostname;
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });

            if (ContainsAny(name, {"router", "gateway", "fw"}))
                return DeviceType::Router;
            if (ContainsAny(name, {"server", "srv"}))
                return DeviceType::Server;
            if (ContainsAny(name, {"printer", "print"}))
                return DeviceType::Printer;
        }

        return device.open_ports.empty() ? DeviceType::Unknown : DeviceType::Host;
    }

    DeviceEnricher::DeviceEnricher(PortProber &prober, HostnameResolver &resolver,
                                   std::vector<int> ports, std::chrono::milliseconds port_timeout)
        : m_prober(prober), m_resolver(resolver), m_ports(std::move(ports)), m_port_timeout(port_timeout)
    {
    }

    void DeviceEnricher::Enrich(NetworkDevice &device)
    {
        if (device.hostname.empty())
        {
            try
            {
                device.hostname = m_resolver.Resolve(device.ip);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Enricher] Reverse lookup of " << device.ip << " failed: " << e.what() << "\n";
            }
        }

        device.open_ports = m_prober.OpenPorts(device.ip, m_ports, m_port_timeout);
        device.device_type = ClassifyDevice(device);
    }
}
