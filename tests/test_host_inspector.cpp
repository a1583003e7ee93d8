#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "discovery/HostInspector.hpp"
#include "discovery/InventoryQueries.hpp"
#include "discovery/NetworkInfo.hpp"
#include "store/SqliteDocumentStore.hpp"
#include "Mocks.hpp"

#include <cstdio>
#include <fstream>

using namespace net_scout::discovery;
using namespace net_scout::test_support;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;

namespace
{
    const char *GREPPABLE =
        "# Nmap 7.80 scan initiated Mon Jan  1 10:00:00 2024 as: nmap -sV --top-ports 100 -Pn -n -oG - 192.168.1.10\n"
        "Host: 192.168.1.10 ()\tStatus: Up\n"
        "Host: 192.168.1.10 ()\tPorts: 22/open/tcp//ssh//OpenSSH 8.9p1 Ubuntu 3ubuntu0.1 (Ubuntu Linux; protocol 2.0)/, "
        "80/open/tcp//http//nginx 1.18.0 (Ubuntu)/, 443/filtered/tcp//https///\tIgnored State: closed (97)\n"
        "# Nmap done at Mon Jan  1 10:00:12 2024 -- 1 IP address (1 host up) scanned in 12.01 seconds\n";
}

TEST(HostInspectorParserTest, ParsesNeighborMac)
{
    EXPECT_EQ(ParseIpNeighOutput("192.168.1.10 dev eth0 lladdr AA:BB:CC:DD:EE:10 REACHABLE\n"), "aa:bb:cc:dd:ee:10");
    EXPECT_FALSE(ParseIpNeighOutput("192.168.1.11 dev eth0  INCOMPLETE\n").has_value());
    EXPECT_FALSE(ParseIpNeighOutput("").has_value());
}

TEST(HostInspectorParserTest, ParsesNeighborTable)
{
    auto entries = ParseIpNeighTable(
        "192.168.1.1 dev eth0 lladdr AA:BB:CC:DD:EE:01 REACHABLE\n"
        "192.168.1.12 dev eth0 lladdr INCOMPLETE\n"
        "192.168.1.13 dev eth0  FAILED\n"
        "192.168.1.2 dev eth0 lladdr aa:bb:cc:dd:ee:02 router STALE\n");

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].ip, "192.168.1.1");
    EXPECT_EQ(entries[0].mac, std::optional<std::string>("aa:bb:cc:dd:ee:01"));
    EXPECT_EQ(entries[0].state, "REACHABLE");
    EXPECT_EQ(entries[1].ip, "192.168.1.12");
    EXPECT_FALSE(entries[1].mac.has_value());
    EXPECT_EQ(entries[2].state, "STALE");
}

TEST(HostInspectorParserTest, ParsesResolverAndDhcpServer)
{
    EXPECT_EQ(ParseResolvConf("# generated\nsearch lan\nnameserver 192.168.1.53\nnameserver 8.8.8.8\n"),
              std::optional<std::string>("192.168.1.53"));
    EXPECT_FALSE(ParseResolvConf("search lan\n").has_value());

    EXPECT_EQ(ParseNmcliDhcpServer("DHCP4.OPTION[1]:broadcast_address = 192.168.1.255\n"
                                   "DHCP4.OPTION[4]:dhcp_server_identifier = 192.168.1.1\n"),
              std::optional<std::string>("192.168.1.1"));
    EXPECT_FALSE(ParseNmcliDhcpServer("DHCP4.OPTION[1]:broadcast_address = 192.168.1.255\n").has_value());
}

TEST(HostInspectorParserTest, ParsesGreppableServices)
{
    auto services = ParseNmapGreppable(GREPPABLE);

    ASSERT_TRUE(services.has_value());
    ASSERT_EQ(services->size(), 3u);
    EXPECT_EQ((*services)[0].port, 22);
    EXPECT_EQ((*services)[0].state, "open");
    EXPECT_EQ((*services)[0].service, "ssh");
    EXPECT_EQ((*services)[0].version, "OpenSSH 8.9p1 Ubuntu 3ubuntu0.1 (Ubuntu Linux; protocol 2.0)");
    EXPECT_EQ((*services)[1].port, 80);
    EXPECT_EQ((*services)[1].version, "nginx 1.18.0 (Ubuntu)");
    EXPECT_EQ((*services)[2].state, "filtered");
    EXPECT_TRUE((*services)[2].version.empty());
}

TEST(HostInspectorParserTest, HostWithoutPortsHasNoServices)
{
    auto services = ParseNmapGreppable("Host: 192.168.1.10 ()\tStatus: Up\n");
    ASSERT_TRUE(services.has_value());
    EXPECT_TRUE(services->empty());
}

TEST(HostInspectorParserTest, MalformedPortEntryIsRejected)
{
    EXPECT_FALSE(ParseNmapGreppable("Host: 192.168.1.10 ()\tPorts: ssh/open/tcp//ssh///\n").has_value());
    EXPECT_FALSE(ParseNmapGreppable("Host: 192.168.1.10 ()\tPorts: 22/open\n").has_value());
}

class HostInspectorTest : public ::testing::Test
{
protected:
    StrictMock<MockProcessRunner> runner;
    HostInspector inspector{runner, ToolConfig{}};
};

TEST_F(HostInspectorTest, CombinesNeighborEntryAndServiceScan)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show", "192.168.1.10"), _))
        .WillOnce(Return(Exited(0, "192.168.1.10 dev eth0 lladdr aa:bb:cc:dd:ee:10 STALE\n")));
    EXPECT_CALL(runner, Run(ElementsAre("nmap", "-sV", "--top-ports", "100", "-Pn", "-n", "-oG", "-", "192.168.1.10"), _))
        .WillOnce(Return(Exited(0, GREPPABLE)));

    HostDetails details = inspector.Inspect("192.168.1.10");

    EXPECT_EQ(details.ip, "192.168.1.10");
    EXPECT_EQ(details.mac, "aa:bb:cc:dd:ee:10");
    EXPECT_EQ(details.services.size(), 3u);
    EXPECT_TRUE(details.error.empty());
}

TEST_F(HostInspectorTest, MissingNmapIsReported)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show", "192.168.1.10"), _)).WillOnce(Return(Exited(0, "")));
    EXPECT_CALL(runner, Run(ElementsAre("nmap", _, _, _, _, _, _, _, _), _)).WillOnce(Return(NotLaunched()));

    HostDetails details = inspector.Inspect("192.168.1.10");

    EXPECT_TRUE(details.mac.empty());
    EXPECT_TRUE(details.services.empty());
    EXPECT_EQ(details.error, "nmap not available");
}

TEST_F(HostInspectorTest, FailedScanCarriesStderr)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show", "192.168.1.10"), _)).WillOnce(Return(NotLaunched()));
    EXPECT_CALL(runner, Run(ElementsAre("nmap", _, _, _, _, _, _, _, _), _))
        .WillOnce(Return(Exited(1, "", "Failed to resolve \"192.168.1.10\".\n")));

    HostDetails details = inspector.Inspect("192.168.1.10");
    EXPECT_EQ(details.error, "Failed to resolve \"192.168.1.10\".");
}

TEST_F(HostInspectorTest, FailedScanWithoutStderrUsesStdout)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show", "192.168.1.10"), _)).WillOnce(Return(Exited(0, "")));
    EXPECT_CALL(runner, Run(ElementsAre("nmap", _, _, _, _, _, _, _, _), _))
        .WillOnce(Return(Exited(1, "QUITTING!\nsecond line\n")));

    EXPECT_EQ(inspector.Inspect("192.168.1.10").error, "QUITTING!");
}

TEST_F(HostInspectorTest, FailedScanWithoutStderrUsesGenericMessage)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show", "192.168.1.10"), _)).WillOnce(Return(Exited(0, "")));
    EXPECT_CALL(runner, Run(ElementsAre("nmap", _, _, _, _, _, _, _, _), _)).WillOnce(Return(Exited(2, "")));

    EXPECT_EQ(inspector.Inspect("192.168.1.10").error, "nmap failed");
}

TEST_F(HostInspectorTest, UnparsableOutputIsReported)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show", "192.168.1.10"), _)).WillOnce(Return(Exited(0, "")));
    EXPECT_CALL(runner, Run(ElementsAre("nmap", _, _, _, _, _, _, _, _), _))
        .WillOnce(Return(Exited(0, "Host: 192.168.1.10 ()\tPorts: garbage/open/tcp//x///\n")));

    EXPECT_EQ(inspector.Inspect("192.168.1.10").error, "failed to parse nmap output");
}

TEST_F(HostInspectorTest, InvalidAddressRunsNothing)
{
    HostDetails details = inspector.Inspect("192.168.1.10; rm -rf /");
    EXPECT_FALSE(details.error.empty());
    EXPECT_TRUE(details.services.empty());
}

class InventoryQueriesLookupTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(db.Open(":memory:"));
        ON_CALL(interfaces, DefaultGateway()).WillByDefault(Return(std::optional<std::string>("192.168.1.1")));
    }

    net_scout::store::SqliteDocumentStore db;
    InventoryStore inventory{db};
    NiceMock<MockInterfaceSource> interfaces;
    RangeEnumerator ranges{interfaces};
    NiceMock<MockHostDiscoveryProbe> probe;
    NiceMock<MockPortProber> prober;
    NiceMock<MockHostnameResolver> resolver;
    DeviceEnricher enricher{prober, resolver, {22}, std::chrono::milliseconds(100)};
    NiceMock<MockLivenessProbe> liveness;
    DiscoveryService service{DiscoveryConfig{}, inventory, ranges, probe, probe, enricher, liveness};
    StrictMock<MockProcessRunner> runner;
    HostInspector inspector{runner, ToolConfig{}};
    NetworkInfoReader network_info{ranges, runner, ToolConfig{}};
    FallbackMapCache fallback{ranges, probe};
    InventoryQueries queries{&service, fallback, inspector, network_info};
};

TEST_F(InventoryQueriesLookupTest, ArpTableListsNeighbors)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show"), _))
        .WillOnce(Return(Exited(0, "192.168.1.1 dev eth0 lladdr aa:bb:cc:dd:ee:01 REACHABLE\n")));

    NeighborTable table = queries.GetArpTable();

    ASSERT_EQ(table.items.size(), 1u);
    EXPECT_EQ(table.items[0].ip, "192.168.1.1");
    EXPECT_TRUE(table.error.empty());
}

TEST_F(InventoryQueriesLookupTest, ArpTableFailureIsReportedWithNoItems)
{
    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show"), _)).WillOnce(Return(NotLaunched()));

    NeighborTable table = queries.GetArpTable();

    EXPECT_TRUE(table.items.empty());
    EXPECT_EQ(table.error, "ip not available");
}

TEST_F(InventoryQueriesLookupTest, NetworkInfoCombinesRouteResolverAndDhcp)
{
    const std::string resolv = ::testing::TempDir() + "net_scout_resolv.conf";
    {
        std::ofstream file(resolv);
        file << "search lan\nnameserver 192.168.1.53\n";
    }
    ToolConfig tools;
    tools.resolv_conf_path = resolv;
    NetworkInfoReader reader(ranges, runner, tools);

    EXPECT_CALL(runner, Run(ElementsAre("nmcli", "-t", "-f", "DHCP4.OPTION", "device", "show"), _))
        .WillOnce(Return(Exited(0, "DHCP4.OPTION[4]:dhcp_server_identifier = 192.168.1.2\n")));

    NetworkInfo info = reader.Read();
    std::remove(resolv.c_str());

    EXPECT_EQ(info.gateway, std::optional<std::string>("192.168.1.1"));
    EXPECT_EQ(info.dns, std::optional<std::string>("192.168.1.53"));
    EXPECT_EQ(info.dhcp, std::optional<std::string>("192.168.1.2"));
    EXPECT_TRUE(info.error.empty());
}

TEST_F(InventoryQueriesLookupTest, NetworkInfoWithoutResolverOrNmcliKeepsGateway)
{
    ToolConfig tools;
    tools.resolv_conf_path = ::testing::TempDir() + "net_scout_missing_resolv.conf";
    NetworkInfoReader reader(ranges, runner, tools);
    InventoryQueries lookups(&service, fallback, inspector, reader);

    EXPECT_CALL(runner, Run(ElementsAre("nmcli", _, _, _, _, _), _)).WillOnce(Return(NotLaunched()));

    NetworkInfo info = lookups.GetNetworkInfo();

    EXPECT_EQ(info.gateway, std::optional<std::string>("192.168.1.1"));
    EXPECT_FALSE(info.dns.has_value());
    EXPECT_FALSE(info.dhcp.has_value());
    EXPECT_TRUE(info.error.empty());
}

TEST_F(InventoryQueriesLookupTest, UnknownDeviceIsNotFoundAndNotScanned)
{
    DeviceDetails details = queries.GetDeviceDetails("192.168.1.77");

    EXPECT_FALSE(details.found);
    EXPECT_EQ(details.host.ip, "192.168.1.77");
    EXPECT_EQ(details.host.error, "device not found");
}

TEST_F(InventoryQueriesLookupTest, KnownDeviceIsMergedWithInspection)
{
    NetworkDevice known = Device("192.168.1.10", "", "Acme");
    known.hostname = "nas";
    known.open_ports = {22, 80};
    inventory.Upsert(known, Clock::now());

    EXPECT_CALL(runner, Run(ElementsAre("ip", "neigh", "show", "192.168.1.10"), _))
        .WillOnce(Return(Exited(0, "192.168.1.10 dev eth0 lladdr aa:bb:cc:dd:ee:10 STALE\n")));
    EXPECT_CALL(runner, Run(ElementsAre("nmap", _, _, _, _, _, _, _, _), _)).WillOnce(Return(Exited(0, GREPPABLE)));

    DeviceDetails details = queries.GetDeviceDetails("192.168.1.10");

    ASSERT_TRUE(details.found);
    EXPECT_EQ(details.device.hostname, "nas");
    EXPECT_EQ(details.device.vendor, "Acme");
    EXPECT_EQ(details.device.mac, "aa:bb:cc:dd:ee:10");
    EXPECT_EQ(details.device.open_ports, (std::vector<int>{22, 80}));
    EXPECT_EQ(details.host.services.size(), 3u);
    EXPECT_TRUE(details.host.error.empty());
}
