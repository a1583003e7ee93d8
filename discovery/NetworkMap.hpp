#pragma once

#include <string>
#include <vector>
#include "NetworkDevice.hpp"

namespace net_scout::discovery
{
    struct MapNode
    {
        std::string id;
        std::string name;
        std::string type;
        std::string status;
        std::string ip;
        std::string mac;
        std::string vendor;
        std::vector<int> open_ports;
    };

    struct MapConnection
    {
        std::string source;
        std::string target;
        std::string type = "direct";
    };

    struct NetworkMap
    {
        std::vector<MapNode> nodes;
        std::vector<MapConnection> connections;
        std::string error; // set only by the on-demand sweep path
    };

    // Star topology: every non-router device hangs off the first router in
    // snapshot order. Without a router there are no connections.
    NetworkMap BuildNetworkMap(const std::vector<NetworkDevice> &devices);

    MapNode ToMapNode(const NetworkDevice &device);
}
