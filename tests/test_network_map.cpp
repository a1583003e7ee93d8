#include <gtest/gtest.h>
#include "discovery/NetworkMap.hpp"
#include "Mocks.hpp"

using namespace net_scout::discovery;
using net_scout::test_support::Device;

namespace
{
    NetworkDevice Typed(const std::string &ip, DeviceType type, const std::string &hostname = "")
    {
        NetworkDevice device = Device(ip);
        device.device_type = type;
        device.hostname = hostname;
        return device;
    }
}

TEST(NetworkMapTest, NoRouterMeansNoConnections)
{
    NetworkMap map = BuildNetworkMap({Typed("10.0.0.2", DeviceType::Host), Typed("10.0.0.3", DeviceType::Server)});

    EXPECT_EQ(map.nodes.size(), 2u);
    EXPECT_TRUE(map.connections.empty());
    EXPECT_TRUE(map.error.empty());
}

TEST(NetworkMapTest, EveryOtherDeviceHangsOffTheRouter)
{
    NetworkMap map = BuildNetworkMap({
        Typed("10.0.0.2", DeviceType::Host),
        Typed("10.0.0.1", DeviceType::Router, "gw"),
        Typed("10.0.0.3", DeviceType::Printer),
        Typed("10.0.0.4", DeviceType::Unknown),
    });

    ASSERT_EQ(map.nodes.size(), 4u);
    ASSERT_EQ(map.connections.size(), 3u);
    for (const auto &edge : map.connections)
    {
        EXPECT_EQ(edge.source, "10.0.0.1");
        EXPECT_NE(edge.target, "10.0.0.1");
        EXPECT_EQ(edge.type, "direct");
    }
}

TEST(NetworkMapTest, OnlyTheFirstRouterIsTheHub)
{
    NetworkMap map = BuildNetworkMap({
        Typed("10.0.0.1", DeviceType::Router),
        Typed("10.0.0.254", DeviceType::Router),
        Typed("10.0.0.5", DeviceType::Host),
    });

    ASSERT_EQ(map.connections.size(), 1u);
    EXPECT_EQ(map.connections[0].source, "10.0.0.1");
    EXPECT_EQ(map.connections[0].target, "10.0.0.5");
}

TEST(NetworkMapTest, NodeNamePrefersHostname)
{
    NetworkDevice named = Typed("10.0.0.7", DeviceType::Server, "build");
    named.open_ports = {22};
    MapNode node = ToMapNode(named);

    EXPECT_EQ(node.id, "10.0.0.7");
    EXPECT_EQ(node.name, "build");
    EXPECT_EQ(node.type, "server");
    EXPECT_EQ(node.status, "online");
    EXPECT_EQ(node.open_ports, (std::vector<int>{22}));

    EXPECT_EQ(ToMapNode(Typed("10.0.0.8", DeviceType::Host)).name, "10.0.0.8");
}
