#include "../common/Process.hpp"
#include "../store/SqliteDocumentStore.hpp"
#include "../discovery/DeviceEnricher.hpp"
#include "../discovery/DiscoveryService.hpp"
#include "../discovery/FallbackMapCache.hpp"
#include "../discovery/HostInspector.hpp"
#include "../discovery/HostProbe.hpp"
#include "../discovery/InventoryQueries.hpp"
#include "../discovery/InventoryStore.hpp"
#include "../discovery/LivenessProbe.hpp"
#include "../discovery/NetworkInfo.hpp"
#include "../discovery/PortProber.hpp"
#include "../discovery/RangeEnumerator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

using namespace net_scout;

namespace
{
    std::atomic<bool> g_shutdown(false);

    void HandleSignal(int)
    {
        g_shutdown = true;
    }

    enum class Mode
    {
        Daemon,
        Once,
        Map,
        Host,
        Device,
        Arp,
        Info
    };

    struct Options
    {
        std::string db_path = "net_scout.db";
        Mode mode = Mode::Daemon;
        std::string host_ip;
        discovery::DiscoveryConfig config;
    };

    void PrintUsage()
    {
        std::cout << "Usage: ./net_scout [options]\n"
                  << "  --db PATH              inventory database (default $NET_SCOUT_DB or net_scout.db)\n"
                  << "  --scan-interval SEC    seconds between full discovery cycles (default 300)\n"
                  << "  --quick-interval SEC   seconds between liveness checks (default 60)\n"
                  << "  --nmap PATH            nmap executable\n"
                  << "  --arp-scan PATH        arp-scan executable\n"
                  << "  --once                 run one discovery cycle, print the inventory and exit\n"
                  << "  --map                  print the network map and exit\n"
                  << "  --host IP              print host details and exit\n"
                  << "  --device IP            print the inventory record and host details and exit\n"
                  << "  --arp                  print the neighbor table and exit\n"
                  << "  --info                 print gateway, DNS and DHCP server and exit\n"
                  << "  --help                 show this message\n";
    }

    // Returns false and prints the reason when the arguments are unusable.
    bool ParseArgs(int argc, char *argv[], Options &options, bool &show_help)
    {
        if (const char *env = std::getenv("NET_SCOUT_DB"))
            options.db_path = env;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            auto value = [&](std::string &out) -> bool
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Missing value for " << arg << "\n";
                    return false;
                }
                out = argv[++i];
                return true;
            };
            auto seconds = [&](std::chrono::milliseconds &out) -> bool
            {
                std::string text;
                if (!value(text))
                    return false;
                try
                {
                    long secs = std::stol(text);
                    if (secs <= 0)
                        throw std::out_of_range("must be positive");
                    out = std::chrono::seconds(secs);
                    return true;
                }
                catch (const std::exception &e)
                {
                    std::cerr << "Invalid value for " << arg << ": " << text << " (" << e.what() << ")\n";
                    return false;
                }
            };

            bool ok = true;
            if (arg == "--help" || arg == "-h")
            {
                show_help = true;
                return true;
            }
            else if (arg == "--db")
                ok = value(options.db_path);
            else if (arg == "--scan-interval")
                ok = seconds(options.config.scan_interval);
            else if (arg == "--quick-interval")
                ok = seconds(options.config.quick_check_interval);
            else if (arg == "--nmap")
                ok = value(options.config.tools.nmap);
            else if (arg == "--arp-scan")
                ok = value(options.config.tools.arp_scan);
            else if (arg == "--once")
                options.mode = Mode::Once;
            else if (arg == "--map")
                options.mode = Mode::Map;
            else if (arg == "--host")
            {
                options.mode = Mode::Host;
                ok = value(options.host_ip);
            }
            else if (arg == "--device")
            {
                options.mode = Mode::Device;
                ok = value(options.host_ip);
            }
            else if (arg == "--arp")
                options.mode = Mode::Arp;
            else if (arg == "--info")
                options.mode = Mode::Info;
            else
            {
                std::cerr << "Unknown argument: " << arg << "\n";
                ok = false;
            }

            if (!ok)
                return false;
        }
        return true;
    }

    void PrintDevices(const std::vector<discovery::NetworkDevice> &devices)
    {
        std::cout << "[Inventory] " << devices.size() << " device(s)\n";
        for (const auto &d : devices)
        {
            std::cout << "  " << d.ip
                      << "  " << (d.mac.empty() ? "-" : d.mac)
                      << "  " << (d.hostname.empty() ? "-" : d.hostname)
                      << "  " << (d.vendor.empty() ? "-" : d.vendor)
                      << "  " << discovery::ToString(d.device_type)
                      << "  " << discovery::ToString(d.status)
                      << "  ports=" << (d.open_ports.empty() ? "-" : discovery::JoinPorts(d.open_ports))
                      << "\n";
        }
    }

    void PrintMap(const discovery::NetworkMap &map)
    {
        if (!map.error.empty())
            std::cout << "[Map] error: " << map.error << "\n";
        std::cout << "[Map] " << map.nodes.size() << " node(s), " << map.connections.size() << " connection(s)\n";
        for (const auto &n : map.nodes)
            std::cout << "  node " << n.id << "  " << n.name << "  " << n.type << "  " << n.status << "\n";
        for (const auto &c : map.connections)
            std::cout << "  " << c.source << " -> " << c.target << "  " << c.type << "\n";
    }

    void PrintHost(const discovery::HostDetails &details)
    {
        std::cout << "[Host] " << details.ip << "  mac=" << (details.mac.empty() ? "-" : details.mac) << "\n";
        if (!details.error.empty())
            std::cout << "[Host] error: " << details.error << "\n";
        for (const auto &s : details.services)
            std::cout << "  " << s.port << "  " << s.state << "  " << s.service << "  " << s.version << "\n";
    }

    void PrintNeighbors(const discovery::NeighborTable &table)
    {
        if (!table.error.empty())
            std::cout << "[Arp] error: " << table.error << "\n";
        std::cout << "[Arp] " << table.items.size() << " neighbor(s)\n";
        for (const auto &e : table.items)
            std::cout << "  " << e.ip << "  " << e.mac.value_or("-") << "  " << e.state << "\n";
    }

    void PrintNetworkInfo(const discovery::NetworkInfo &info)
    {
        if (!info.error.empty())
            std::cout << "[Info] error: " << info.error << "\n";
        std::cout << "[Info] gateway=" << info.gateway.value_or("-")
                  << "  dns=" << info.dns.value_or("-")
                  << "  dhcp=" << info.dhcp.value_or("-") << "\n";
    }
}

int main(int argc, char *argv[])
{
    Options options;
    bool show_help = false;
    if (!ParseArgs(argc, argv, options, show_help))
    {
        PrintUsage();
        return 2;
    }
    if (show_help)
    {
        PrintUsage();
        return 0;
    }

    try
    {
        common::PosixProcessRunner runner;
        discovery::TinsInterfaceSource interfaces;
        discovery::RangeEnumerator ranges(interfaces);
        discovery::ArpSweepProbe arp_probe(runner, options.config.tools);
        discovery::PingSweepProbe ping_probe(runner, options.config.tools);
        discovery::FallbackMapCache fallback(ranges, ping_probe);
        discovery::HostInspector inspector(runner, options.config.tools);
        discovery::NetworkInfoReader network_info(ranges, runner, options.config.tools);

        if (options.mode == Mode::Host || options.mode == Mode::Arp || options.mode == Mode::Info)
        {
            discovery::InventoryQueries queries(nullptr, fallback, inspector, network_info);
            if (options.mode == Mode::Arp)
            {
                discovery::NeighborTable table = queries.GetArpTable();
                PrintNeighbors(table);
                return table.error.empty() ? 0 : 1;
            }
            if (options.mode == Mode::Info)
            {
                discovery::NetworkInfo info = queries.GetNetworkInfo();
                PrintNetworkInfo(info);
                return info.error.empty() ? 0 : 1;
            }
            discovery::HostDetails details = queries.GetHostDetails(options.host_ip);
            PrintHost(details);
            return details.error.empty() ? 0 : 1;
        }

        store::SqliteDocumentStore db;
        if (!db.Open(options.db_path))
        {
            std::cerr << "Fatal: cannot open database " << options.db_path << "\n";
            return -1;
        }

        discovery::InventoryStore inventory(db);
        discovery::TcpPortProber prober;
        discovery::ReverseDnsResolver resolver;
        discovery::DeviceEnricher enricher(prober, resolver, options.config.probe_ports, options.config.port_timeout);
        discovery::PingLivenessProbe liveness(runner, options.config.tools);

        discovery::DiscoveryService service(options.config, inventory, ranges, arp_probe, ping_probe, enricher, liveness);
        discovery::InventoryQueries queries(&service, fallback, inspector, network_info);

        if (options.mode == Mode::Map)
        {
            inventory.Load();
            PrintMap(queries.GetNetworkMap());
            return 0;
        }

        if (options.mode == Mode::Device)
        {
            inventory.Load();
            discovery::DeviceDetails details = queries.GetDeviceDetails(options.host_ip);
            if (!details.found)
            {
                std::cout << "[Device] " << options.host_ip << " not found\n";
                return 1;
            }
            PrintDevices({details.device});
            PrintHost(details.host);
            return details.host.error.empty() ? 0 : 1;
        }

        if (options.mode == Mode::Once)
        {
            inventory.Load();
            service.RunDiscoveryCycle();
            PrintDevices(queries.GetDiscoveredDevices());
            return 0;
        }

        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        service.Start();
        std::cout << "[Daemon] Running. Database " << options.db_path << ". Press Ctrl+C to stop.\n";
        while (!g_shutdown)
            std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::cout << "[Daemon] Shutting down\n";
        service.Stop();
        PrintDevices(queries.GetDiscoveredDevices());
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
