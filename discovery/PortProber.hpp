#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace net_scout::discovery
{
    class PortProber
    {
    public:
        virtual ~PortProber() = default;

        // Returns the subset of ports accepting a TCP connection, in ascending order.
        virtual std::vector<int> OpenPorts(const std::string &ip, const std::vector<int> &ports,
                                           std::chrono::milliseconds timeout) = 0;
    };

    // One non-blocking connect per port, all ports probed concurrently.
    class TcpPortProber : public PortProber
    {
    public:
        std::vector<int> OpenPorts(const std::string &ip, const std::vector<int> &ports,
                                   std::chrono::milliseconds timeout) override;
    };

    bool TcpConnect(const std::string &ip, int port, std::chrono::milliseconds timeout);
}
