#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "HostProbe.hpp"
#include "NetworkMap.hpp"
#include "RangeEnumerator.hpp"

namespace net_scout::discovery
{
    // Network map built from a one-shot reachability sweep of the preferred
    // range. The first read sweeps synchronously; later reads return the cached
    // map and kick off a background refresh. At most one refresh runs at a time.
    class FallbackMapCache
    {
    public:
        FallbackMapCache(RangeEnumerator &ranges, HostDiscoveryProbe &probe);
        ~FallbackMapCache();

        FallbackMapCache(const FallbackMapCache &) = delete;
        FallbackMapCache &operator=(const FallbackMapCache &) = delete;

        NetworkMap Get();

        // Error from the most recent refresh, empty if it succeeded.
        std::string LastError() const;
        bool RefreshInFlight() const { return m_refreshing; }
        void WaitForRefresh();

    private:
        NetworkMap Sweep();
        void StartRefresh();

        RangeEnumerator &m_ranges;
        HostDiscoveryProbe &m_probe;

        mutable std::mutex m_mutex;
        std::optional<NetworkMap> m_cached;
        std::string m_last_error;

        std::mutex m_thread_mutex;
        std::atomic<bool> m_refreshing;
        std::thread m_refresh_thread;
    };

    // Host nodes for every swept address plus, when known, a gateway node
    // linked to each of them.
    NetworkMap BuildSweepMap(const std::vector<NetworkDevice> &hosts, const std::optional<std::string> &gateway);
}
