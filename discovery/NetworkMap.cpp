#include "NetworkMap.hpp"

#include <algorithm>

namespace net_scout::discovery
{
    MapNode ToMapNode(const NetworkDevice &device)
    {
        MapNode node;
        node.id = device.ip;
        node.name = device.hostname.empty() ? device.ip : device.hostname;
        node.type = ToString(device.device_type);
        node.status = ToString(device.status);
        node.ip = device.ip;
        node.mac = device.mac;
        node.vendor = device.vendor;
        node.open_ports = device.open_ports;
        return node;
    }

    NetworkMap BuildNetworkMap(const std::vector<NetworkDevice> &devices)
    {
        NetworkMap map;
        map.nodes.reserve(devices.size());
        for (const auto &device : devices)
            map.nodes.push_back(ToMapNode(device));

        auto router = std::find_if(devices.begin(), devices.end(), [](const NetworkDevice &d)
                                   { return d.device_type == DeviceType::Router; });
        if (router == devices.end())
            return map;

        for (const auto &device : devices)
        {
            if (device.device_type == DeviceType::Router)
                continue;
            map.connections.push_back({router->ip, device.ip, "direct"});
        }
        return map;
    }
}
