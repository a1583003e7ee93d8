#include "PortProber.hpp"

#include <algorithm>
#include <cerrno>
#include <future>
#include <iostream>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace net_scout::discovery
{
    bool TcpConnect(const std::string &ip, int port, std::chrono::milliseconds timeout)
    {
        struct sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) <= 0)
            return false;

        int fd = socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
            return false;

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);

        bool open = false;
        int ret = connect(fd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr));
        if (ret == 0)
        {
            open = true;
        }
        else if (errno == EINPROGRESS)
        {
            struct pollfd pfd;
            pfd.fd = fd;
            pfd.events = POLLOUT;
            pfd.revents = 0;

            int poll_ret;
            do
            {
                poll_ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
            } while (poll_ret < 0 && errno == EINTR);

            if (poll_ret > 0 && (pfd.revents & POLLOUT))
            {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0)
                    open = true;
            }
        }

        close(fd);
        return open;
    }

    std::vector<int> TcpPortProber::OpenPorts(const std::string &ip, const std::vector<int> &ports,
                                              std::chrono::milliseconds timeout)
    {
        std::vector<std::future<bool>> probes;
        probes.reserve(ports.size());
        for (int port : ports)
            probes.push_back(std::async(std::launch::async, TcpConnect, ip, port, timeout));

        std::vector<int> open_ports;
        for (size_t i = 0; i < ports.size(); ++i)
        {
            try
            {
                if (probes[i].get())
                    open_ports.push_back(ports[i]);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PortProbe] " << ip << ":" << ports[i] << " probe failed: " << e.what() << "\n";
            }
        }
        std::sort(open_ports.begin(), open_ports.end());
        return open_ports;
    }
}
