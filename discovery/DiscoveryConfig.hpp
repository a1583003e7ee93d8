#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace net_scout::discovery
{
    struct ToolConfig
    {
        std::string arp_scan = "arp-scan";
        std::string arp = "arp";
        std::string nmap = "nmap";
        std::string ping = "ping";
        std::string ip = "ip";
        std::string nmcli = "nmcli";
        std::string proc_arp_path = "/proc/net/arp";
        std::string resolv_conf_path = "/etc/resolv.conf";

        std::chrono::milliseconds arp_scan_timeout = std::chrono::seconds(60);
        std::chrono::milliseconds arp_table_timeout = std::chrono::seconds(10);
        std::chrono::milliseconds ping_sweep_timeout = std::chrono::seconds(120);
        std::chrono::milliseconds ping_timeout = std::chrono::seconds(5);
        std::chrono::milliseconds service_scan_timeout = std::chrono::seconds(300);
        std::chrono::milliseconds network_info_timeout = std::chrono::seconds(10);
    };

    struct DiscoveryConfig
    {
        std::chrono::milliseconds scan_interval = std::chrono::minutes(5);
        std::chrono::milliseconds quick_check_interval = std::chrono::minutes(1);
        std::chrono::milliseconds scan_error_backoff = std::chrono::seconds(30);
        std::chrono::milliseconds quick_check_error_backoff = std::chrono::seconds(10);

        std::chrono::milliseconds offline_after = std::chrono::minutes(10);
        std::chrono::milliseconds evict_after = std::chrono::hours(24 * 7);

        size_t quick_check_batch_size = 10;
        size_t enrich_parallelism = 8;

        std::vector<int> probe_ports = {22, 23, 53, 80, 135, 139, 443, 445, 993, 995};
        std::chrono::milliseconds port_timeout = std::chrono::seconds(1);

        ToolConfig tools;
    };
}
