#include "FallbackMapCache.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace net_scout::discovery
{
    FallbackMapCache::FallbackMapCache(RangeEnumerator &ranges, HostDiscoveryProbe &probe)
        : m_ranges(ranges), m_probe(probe), m_refreshing(false)
    {
    }

    FallbackMapCache::~FallbackMapCache()
    {
        WaitForRefresh();
    }

    NetworkMap FallbackMapCache::Get()
    {
        NetworkMap cached;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_cached)
            {
                NetworkMap map = Sweep();
                m_last_error = map.error;
                m_cached = map;
                return map;
            }
            cached = *m_cached;
        }

        StartRefresh();
        return cached;
    }

    std::string FallbackMapCache::LastError() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_error;
    }

    void FallbackMapCache::WaitForRefresh()
    {
        std::lock_guard<std::mutex> lock(m_thread_mutex);
        if (m_refresh_thread.joinable())
            m_refresh_thread.join();
    }

    void FallbackMapCache::StartRefresh()
    {
        if (m_refreshing.exchange(true))
            return;

        std::lock_guard<std::mutex> lock(m_thread_mutex);
        if (m_refresh_thread.joinable())
            m_refresh_thread.join();

        m_refresh_thread = std::thread([this]()
                                       {
            NetworkMap map = Sweep();
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_last_error = map.error;
                if (map.error.empty())
                    m_cached = std::move(map);
                else
                    std::cerr << "[MapCache] Refresh failed, keeping previous map: " << m_last_error << "\n";
            }
            m_refreshing = false; });
    }

    NetworkMap FallbackMapCache::Sweep()
    {
        NetworkMap map;
        try
        {
            std::string cidr = m_ranges.PreferredRange();
            SweepResult result = m_probe.Sweep(cidr);
            if (result.Failed())
            {
                map.error = result.error;
                return map;
            }
            map = BuildSweepMap(result.devices, m_ranges.DefaultGateway());
            std::cout << "[MapCache] Swept " << cidr << ": " << map.nodes.size() << " node(s)\n";
        }
        catch (const std::exception &e)
        {
            map = NetworkMap{};
            map.error = e.what();
        }
        return map;
    }

    NetworkMap BuildSweepMap(const std::vector<NetworkDevice> &hosts, const std::optional<std::string> &gateway)
    {
        NetworkMap map;
        for (const auto &host : hosts)
        {
            MapNode node;
            node.id = host.ip;
            node.name = host.ip;
            node.type = ToString(DeviceType::Host);
            node.status = ToString(DeviceStatus::Online);
            node.ip = host.ip;
            map.nodes.push_back(std::move(node));
        }

        if (!gateway || gateway->empty())
            return map;

        bool present = std::any_of(map.nodes.begin(), map.nodes.end(), [&](const MapNode &n)
                                   { return n.ip == *gateway; });
        if (!present)
        {
            MapNode node;
            node.id = *gateway;
            node.name = "Gateway";
            node.type = ToString(DeviceType::Router);
            node.status = ToString(DeviceStatus::Online);
            node.ip = *gateway;
            map.nodes.insert(map.nodes.begin(), std::move(node));
        }

        for (const auto &node : map.nodes)
        {
            if (node.ip != *gateway)
                map.connections.push_back({*gateway, node.ip, "direct"});
        }
        return map;
    }
}
