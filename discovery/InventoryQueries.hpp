#pragma once

#include <string>
#include <vector>
#include "DiscoveryService.hpp"
#include "FallbackMapCache.hpp"
#include "HostInspector.hpp"
#include "NetworkInfo.hpp"

namespace net_scout::discovery
{
    struct DeviceDetails
    {
        bool found = false;
        NetworkDevice device; // inventory record, mac replaced by the neighbor table's when it has one
        HostDetails host;
    };

    // Read-side surface for callers. The orchestrator is optional; without it,
    // or while it has no devices yet, maps come from the on-demand sweep.
    class InventoryQueries
    {
    public:
        InventoryQueries(DiscoveryService *service, FallbackMapCache &fallback, HostInspector &inspector,
                         NetworkInfoReader &network_info);

        std::vector<NetworkDevice> GetDiscoveredDevices() const;
        NetworkMap GetNetworkMap();
        NetworkMap GetNetworkMapFallback();
        HostDetails GetHostDetails(const std::string &ip);

        // Known device merged with a fresh inspection. found is false, and
        // nothing is scanned, for addresses not in the inventory.
        DeviceDetails GetDeviceDetails(const std::string &ip);

        NeighborTable GetArpTable();
        NetworkInfo GetNetworkInfo();

    private:
        DiscoveryService *m_service;
        FallbackMapCache &m_fallback;
        HostInspector &m_inspector;
        NetworkInfoReader &m_network_info;
    };
}
