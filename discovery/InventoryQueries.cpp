#include "InventoryQueries.hpp"

namespace net_scout::discovery
{
    InventoryQueries::InventoryQueries(DiscoveryService *service, FallbackMapCache &fallback, HostInspector &inspector,
                                       NetworkInfoReader &network_info)
        : m_service(service), m_fallback(fallback), m_inspector(inspector), m_network_info(network_info)
    {
    }

    std::vector<NetworkDevice> InventoryQueries::GetDiscoveredDevices() const
    {
        if (!m_service)
            return {};
        return m_service->GetDiscoveredDevices();
    }

    NetworkMap InventoryQueries::GetNetworkMap()
    {
        if (m_service)
        {
            NetworkMap map = m_service->GetNetworkMap();
            if (!map.nodes.empty())
                return map;
        }
        return m_fallback.Get();
    }

    NetworkMap InventoryQueries::GetNetworkMapFallback()
    {
        return m_fallback.Get();
    }

    HostDetails InventoryQueries::GetHostDetails(const std::string &ip)
    {
        return m_inspector.Inspect(ip);
    }

    DeviceDetails InventoryQueries::GetDeviceDetails(const std::string &ip)
    {
        DeviceDetails details;
        std::optional<NetworkDevice> known;
        if (m_service)
            known = m_service->FindDevice(ip);
        if (!known)
        {
            details.host.ip = ip;
            details.host.error = "device not found";
            return details;
        }

        details.found = true;
        details.device = *known;
        details.host = m_inspector.Inspect(ip);
        if (!details.host.mac.empty())
            details.device.mac = details.host.mac;
        return details;
    }

    NeighborTable InventoryQueries::GetArpTable()
    {
        return m_inspector.ListNeighbors();
    }

    NetworkInfo InventoryQueries::GetNetworkInfo()
    {
        return m_network_info.Read();
    }
}
