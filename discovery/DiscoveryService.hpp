#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "DiscoveryConfig.hpp"
#include "DeviceEnricher.hpp"
#include "HostProbe.hpp"
#include "InventoryStore.hpp"
#include "LivenessProbe.hpp"
#include "NetworkMap.hpp"
#include "RangeEnumerator.hpp"

namespace net_scout::discovery
{
    struct DiscoveryStatus
    {
        bool running = false;
        size_t device_count = 0;
        std::chrono::milliseconds scan_interval{};
        std::chrono::milliseconds quick_check_interval{};
        std::uint64_t completed_cycles = 0;
        std::string last_cycle_error; // last range failure of the latest cycle, or the cycle's own failure
    };

    // Runs two independent loops: full discovery (ranges -> probes -> enrich ->
    // inventory -> eviction) and a quick liveness check of known devices.
    class DiscoveryService
    {
    public:
        DiscoveryService(DiscoveryConfig config,
                         InventoryStore &inventory,
                         RangeEnumerator &ranges,
                         HostDiscoveryProbe &resolution_probe,
                         HostDiscoveryProbe &reachability_probe,
                         DeviceEnricher &enricher,
                         LivenessProbe &liveness);
        ~DiscoveryService();

        DiscoveryService(const DiscoveryService &) = delete;
        DiscoveryService &operator=(const DiscoveryService &) = delete;

        // No-op when already running.
        void Start();
        // Signals both loops and waits for them. In-flight probes finish or time out.
        void Stop();
        bool IsRunning() const { return m_running; }

        void RunDiscoveryCycle();
        void RunQuickCheck();

        std::vector<NetworkDevice> GetDiscoveredDevices() const;
        std::optional<NetworkDevice> FindDevice(const std::string &ip) const;
        NetworkMap GetNetworkMap() const;
        DiscoveryStatus Status() const;

    private:
        void DiscoveryLoop();
        void QuickCheckLoop();
        void SleepFor(std::chrono::milliseconds duration);

        void ScanRange(const std::string &cidr);
        void EnrichAndStore(std::vector<NetworkDevice> candidates);
        void RecordCycleError(const std::string &message);

        DiscoveryConfig m_config;
        InventoryStore &m_inventory;
        RangeEnumerator &m_ranges;
        HostDiscoveryProbe &m_resolution_probe;
        HostDiscoveryProbe &m_reachability_probe;
        DeviceEnricher &m_enricher;
        LivenessProbe &m_liveness;

        std::mutex m_lifecycle_mutex;
        std::atomic<bool> m_running;
        std::atomic<bool> m_stop_requested;
        std::thread m_discovery_thread;
        std::thread m_quick_check_thread;

        std::atomic<std::uint64_t> m_completed_cycles;
        mutable std::mutex m_status_mutex;
        std::string m_last_cycle_error;
    };
}
