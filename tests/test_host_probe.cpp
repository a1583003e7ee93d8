#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "discovery/HostProbe.hpp"
#include "Mocks.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

using namespace net_scout::discovery;
using namespace net_scout::test_support;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::Return;
using ::testing::StrictMock;

TEST(HostProbeParserTest, NormalizeMacLowercasesAndKeepsOtherBytes)
{
    EXPECT_EQ(NormalizeMac("AA:BB:CC:DD:EE:0F"), "aa:bb:cc:dd:ee:0f");
    EXPECT_EQ(NormalizeMac("\xc3\x89" "A"), "\xc3\x89" "a");
}

TEST(HostProbeParserTest, ParsesArpScanOutput)
{
    const std::string output =
        "Interface: eth0, type: EN10MB, MAC: 00:11:22:33:44:55, IPv4: 192.168.1.23\n"
        "Starting arp-scan 1.9.7 with 256 hosts (https://github.com/royhills/arp-scan)\n"
        "192.168.1.1\tAA:BB:CC:00:00:01\tNETGEAR\n"
        "192.168.1.20\t11:22:33:44:55:66\t(Unknown)\n"
        "192.168.1.30\tde:ad:be:ef:00:30\tRaspberry Pi Trading Ltd\n"
        "192.168.1.1\tAA:BB:CC:00:00:01\tNETGEAR (DUP: 2)\n"
        "\n"
        "3 packets received by filter, 0 packets dropped by kernel\n";

    auto devices = ParseArpScanOutput(output);

    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].ip, "192.168.1.1");
    EXPECT_EQ(devices[0].mac, "aa:bb:cc:00:00:01");
    EXPECT_EQ(devices[0].vendor, "NETGEAR");
    EXPECT_EQ(devices[1].ip, "192.168.1.20");
    EXPECT_TRUE(devices[1].vendor.empty());
    EXPECT_EQ(devices[2].vendor, "Raspberry Pi Trading Ltd");
}

TEST(HostProbeParserTest, ParsesArpTableOutput)
{
    const std::string output =
        "? (192.168.1.1) at aa:bb:cc:dd:ee:01 [ether] on eth0\n"
        "nas.lan (192.168.1.40) at AA:BB:CC:DD:EE:40 [ether] on eth0\n"
        "? (192.168.1.99) at <incomplete> on eth0\n";

    auto devices = ParseArpTableOutput(output);

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].ip, "192.168.1.1");
    EXPECT_EQ(devices[1].ip, "192.168.1.40");
    EXPECT_EQ(devices[1].mac, "aa:bb:cc:dd:ee:40");
}

TEST(HostProbeParserTest, ParsesProcNetArp)
{
    std::istringstream input(
        "IP address       HW type     Flags       HW address            Mask     Device\n"
        "192.168.1.1      0x1         0x2         aa:bb:cc:dd:ee:01     *        eth0\n"
        "192.168.1.77     0x1         0x0         00:00:00:00:00:00     *        eth0\n");

    auto devices = ParseProcNetArp(input);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].ip, "192.168.1.1");
    EXPECT_EQ(devices[0].mac, "aa:bb:cc:dd:ee:01");
}

TEST(HostProbeParserTest, ParsesNmapPingOutput)
{
    const std::string output =
        "Starting Nmap 7.80 ( https://nmap.org ) at 2024-01-01 10:00 UTC\n"
        "Nmap scan report for 192.168.1.1\n"
        "Host is up (0.0010s latency).\n"
        "Nmap scan report for nas.lan (192.168.1.40)\n"
        "Host is up (0.0020s latency).\n"
        "Nmap done: 256 IP addresses (2 hosts up) scanned in 2.50 seconds\n";

    auto devices = ParseNmapPingOutput(output);

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].ip, "192.168.1.1");
    EXPECT_EQ(devices[1].ip, "192.168.1.40");
    EXPECT_TRUE(devices[1].mac.empty());
}

TEST(HostProbeParserTest, MergeKeepsResolutionRecordAndAddsReachableOnly)
{
    auto merged = MergeCandidates({Device("192.168.1.1", "aa:aa:aa:aa:aa:01")},
                                  {Device("192.168.1.1"), Device("192.168.1.2")});

    ASSERT_EQ(merged.size(), 2u);
    EXPECT_EQ(merged[0].ip, "192.168.1.1");
    EXPECT_EQ(merged[0].mac, "aa:aa:aa:aa:aa:01");
    EXPECT_EQ(merged[1].ip, "192.168.1.2");
    EXPECT_TRUE(merged[1].mac.empty());
}

class ArpSweepProbeTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        tools.proc_arp_path = ::testing::TempDir() + "net_scout_proc_arp";
    }

    void TearDown() override
    {
        std::remove(tools.proc_arp_path.c_str());
    }

    StrictMock<MockProcessRunner> runner;
    ToolConfig tools;
};

TEST_F(ArpSweepProbeTest, UsesArpScanWhenAvailable)
{
    ArpSweepProbe probe(runner, tools);
    EXPECT_CALL(runner, Run(ElementsAre("arp-scan", "-g", "192.168.1.0/24"), _))
        .WillOnce(Return(Exited(0, "192.168.1.1\taa:bb:cc:dd:ee:01\tNETGEAR\n")));

    SweepResult result = probe.Sweep("192.168.1.0/24");

    EXPECT_FALSE(result.Failed());
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices[0].vendor, "NETGEAR");
}

TEST_F(ArpSweepProbeTest, FallsBackToNeighborTableWhenArpScanIsMissing)
{
    ArpSweepProbe probe(runner, tools);
    EXPECT_CALL(runner, Run(ElementsAre("arp-scan", "-g", "192.168.1.0/24"), _)).WillOnce(Return(NotLaunched()));
    EXPECT_CALL(runner, Run(ElementsAre("arp", "-a"), _))
        .WillOnce(Return(Exited(0,
                                "? (192.168.1.5) at aa:bb:cc:dd:ee:05 [ether] on eth0\n"
                                "? (10.8.0.1) at aa:bb:cc:dd:ee:99 [ether] on tun0\n")));

    SweepResult result = probe.Sweep("192.168.1.0/24");

    EXPECT_FALSE(result.Failed());
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices[0].ip, "192.168.1.5");
}

TEST_F(ArpSweepProbeTest, ReadsKernelTableWhenNoToolIsAvailable)
{
    {
        std::ofstream file(tools.proc_arp_path);
        file << "IP address       HW type     Flags       HW address            Mask     Device\n"
             << "192.168.1.9      0x1         0x2         aa:bb:cc:dd:ee:09     *        eth0\n";
    }

    ArpSweepProbe probe(runner, tools);
    EXPECT_CALL(runner, Run(ElementsAre("arp-scan", "-g", "192.168.1.0/24"), _)).WillOnce(Return(NotLaunched()));
    EXPECT_CALL(runner, Run(ElementsAre("arp", "-a"), _)).WillOnce(Return(NotLaunched()));

    SweepResult result = probe.Sweep("192.168.1.0/24");

    EXPECT_FALSE(result.Failed());
    ASSERT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(result.devices[0].mac, "aa:bb:cc:dd:ee:09");
}

TEST_F(ArpSweepProbeTest, ToolFailureGivesEmptyResultWithError)
{
    ArpSweepProbe probe(runner, tools);
    EXPECT_CALL(runner, Run(ElementsAre("arp-scan", "-g", "192.168.1.0/24"), _))
        .WillOnce(Return(Exited(1, "", "You need to be root to run arp-scan.\n")));

    SweepResult result = probe.Sweep("192.168.1.0/24");

    EXPECT_TRUE(result.devices.empty());
    ASSERT_TRUE(result.Failed());
    EXPECT_NE(result.error.find("root"), std::string::npos);
}

TEST(PingSweepProbeTest, ParsesReachableHosts)
{
    StrictMock<MockProcessRunner> runner;
    PingSweepProbe probe(runner, ToolConfig{});
    EXPECT_CALL(runner, Run(ElementsAre("nmap", "-sn", "-n", "10.0.0.0/24"), _))
        .WillOnce(Return(Exited(0, "Nmap scan report for 10.0.0.1\nNmap scan report for 10.0.0.9\n")));

    SweepResult result = probe.Sweep("10.0.0.0/24");

    EXPECT_FALSE(result.Failed());
    EXPECT_EQ(result.devices.size(), 2u);
}

TEST(PingSweepProbeTest, MissingNmapIsReportedNotThrown)
{
    StrictMock<MockProcessRunner> runner;
    PingSweepProbe probe(runner, ToolConfig{});
    EXPECT_CALL(runner, Run(_, _)).WillOnce(Return(NotLaunched()));

    SweepResult result = probe.Sweep("10.0.0.0/24");

    EXPECT_TRUE(result.devices.empty());
    EXPECT_EQ(result.error, "nmap not available");
}
