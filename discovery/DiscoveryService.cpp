#include "DiscoveryService.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <utility>

namespace net_scout::discovery
{
    DiscoveryService::DiscoveryService(DiscoveryConfig config,
                                       InventoryStore &inventory,
                                       RangeEnumerator &ranges,
                                       HostDiscoveryProbe &resolution_probe,
                                       HostDiscoveryProbe &reachability_probe,
                                       DeviceEnricher &enricher,
                                       LivenessProbe &liveness)
        : m_config(std::move(config)),
          m_inventory(inventory),
          m_ranges(ranges),
          m_resolution_probe(resolution_probe),
          m_reachability_probe(reachability_probe),
          m_enricher(enricher),
          m_liveness(liveness),
          m_running(false),
          m_stop_requested(false),
          m_completed_cycles(0)
    {
        if (m_config.quick_check_batch_size == 0)
            m_config.quick_check_batch_size = 1;
        if (m_config.enrich_parallelism == 0)
            m_config.enrich_parallelism = 1;
    }

    DiscoveryService::~DiscoveryService()
    {
        Stop();
    }

    void DiscoveryService::Start()
    {
        std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
        if (m_running)
            return;

        size_t loaded = m_inventory.Load();
        std::cout << "[Discovery] Starting with " << loaded << " persisted device(s)\n";

        m_stop_requested = false;
        m_running = true;
        m_discovery_thread = std::thread(&DiscoveryService::DiscoveryLoop, this);
        m_quick_check_thread = std::thread(&DiscoveryService::QuickCheckLoop, this);
    }

    void DiscoveryService::Stop()
    {
        std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
        m_stop_requested = true;
        m_running = false;
        if (m_discovery_thread.joinable())
            m_discovery_thread.join();
        if (m_quick_check_thread.joinable())
            m_quick_check_thread.join();
    }

    void DiscoveryService::DiscoveryLoop()
    {
        while (m_running)
        {
            try
            {
                RunDiscoveryCycle();
                SleepFor(m_config.scan_interval);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Discovery] Cycle failed: " << e.what() << "\n";
                RecordCycleError(e.what());
                SleepFor(m_config.scan_error_backoff);
            }
        }
    }

    void DiscoveryService::QuickCheckLoop()
    {
        while (m_running)
        {
            try
            {
                RunQuickCheck();
                SleepFor(m_config.quick_check_interval);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Discovery] Quick check failed: " << e.what() << "\n";
                SleepFor(m_config.quick_check_error_backoff);
            }
        }
    }

    void DiscoveryService::SleepFor(std::chrono::milliseconds duration)
    {
        const auto step = std::chrono::milliseconds(100);
        const auto deadline = std::chrono::steady_clock::now() + duration;

        while (m_running)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                return;
            std::this_thread::sleep_for(std::min(step, remaining));
        }
    }

    void DiscoveryService::RunDiscoveryCycle()
    {
        std::vector<std::string> ranges = m_ranges.LocalRanges();
        std::cout << "[Discovery] Scanning " << ranges.size() << " range(s)\n";

        std::string cycle_error;
        for (const auto &cidr : ranges)
        {
            if (m_stop_requested)
                return;

            try
            {
                ScanRange(cidr);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[Discovery] Error scanning " << cidr << ": " << e.what() << "\n";
                cycle_error = cidr + ": " + e.what();
            }
        }

        auto cutoff = Clock::now() - m_config.evict_after;
        size_t evicted = m_inventory.EvictOlderThan(cutoff);
        if (evicted > 0)
            std::cout << "[Discovery] Evicted " << evicted << " stale device(s)\n";

        ++m_completed_cycles;
        {
            std::lock_guard<std::mutex> lock(m_status_mutex);
            m_last_cycle_error = cycle_error;
        }
        std::cout << "[Discovery] Cycle complete, " << m_inventory.Size() << " device(s) known\n";
    }

    void DiscoveryService::ScanRange(const std::string &cidr)
    {
        SweepResult resolution = m_resolution_probe.Sweep(cidr);
        if (resolution.Failed())
            std::cerr << "[Discovery] " << m_resolution_probe.Name() << " on " << cidr << ": " << resolution.error << "\n";

        SweepResult reachability = m_reachability_probe.Sweep(cidr);
        if (reachability.Failed())
            std::cerr << "[Discovery] " << m_reachability_probe.Name() << " on " << cidr << ": " << reachability.error << "\n";

        std::vector<NetworkDevice> candidates = MergeCandidates(resolution.devices, reachability.devices);
        std::cout << "[Discovery] " << cidr << ": " << resolution.devices.size() << " resolved, "
                  << reachability.devices.size() << " reachable, " << candidates.size() << " candidate(s)\n";

        EnrichAndStore(std::move(candidates));
    }

    void DiscoveryService::EnrichAndStore(std::vector<NetworkDevice> candidates)
    {
        const size_t chunk = m_config.enrich_parallelism;

        for (size_t begin = 0; begin < candidates.size(); begin += chunk)
        {
            if (m_stop_requested)
                return;

            size_t end = std::min(candidates.size(), begin + chunk);
            std::vector<std::future<NetworkDevice>> pending;
            pending.reserve(end - begin);

            for (size_t i = begin; i < end; ++i)
            {
                // Known hostnames are not resolved again.
                if (candidates[i].hostname.empty())
                {
                    if (auto known = m_inventory.Find(candidates[i].ip))
                        candidates[i].hostname = known->hostname;
                }
                pending.push_back(std::async(std::launch::async, [this, device = candidates[i]]() mutable
                                             {
                                                 m_enricher.Enrich(device);
                                                 return device; }));
            }

            for (size_t i = 0; i < pending.size(); ++i)
            {
                const std::string &ip = candidates[begin + i].ip;
                try
                {
                    NetworkDevice enriched = pending[i].get();
                    m_inventory.Upsert(enriched, Clock::now());
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Discovery] Error processing " << ip << ": " << e.what() << "\n";
                }
            }
        }
    }

    void DiscoveryService::RunQuickCheck()
    {
        std::vector<NetworkDevice> devices = m_inventory.Snapshot();
        const size_t batch = m_config.quick_check_batch_size;

        for (size_t begin = 0; begin < devices.size(); begin += batch)
        {
            if (m_stop_requested)
                return;

            size_t end = std::min(devices.size(), begin + batch);
            std::vector<std::future<bool>> pending;
            pending.reserve(end - begin);

            for (size_t i = begin; i < end; ++i)
            {
                pending.push_back(std::async(std::launch::async, [this, ip = devices[i].ip]()
                                             { return m_liveness.IsReachable(ip); }));
            }

            for (size_t i = 0; i < pending.size(); ++i)
            {
                const std::string &ip = devices[begin + i].ip;
                try
                {
                    bool reachable = pending[i].get();
                    auto updated = m_inventory.RecordProbe(ip, reachable, Clock::now(), m_config.offline_after);
                    if (updated && devices[begin + i].status == DeviceStatus::Online && updated->status == DeviceStatus::Offline)
                        std::cout << "[Discovery] " << ip << " is offline\n";
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Discovery] Liveness probe for " << ip << " failed: " << e.what() << "\n";
                }
            }
        }
    }

    void DiscoveryService::RecordCycleError(const std::string &message)
    {
        std::lock_guard<std::mutex> lock(m_status_mutex);
        m_last_cycle_error = message;
    }

    std::vector<NetworkDevice> DiscoveryService::GetDiscoveredDevices() const
    {
        return m_inventory.Snapshot();
    }

    std::optional<NetworkDevice> DiscoveryService::FindDevice(const std::string &ip) const
    {
        return m_inventory.Find(ip);
    }

    NetworkMap DiscoveryService::GetNetworkMap() const
    {
        return BuildNetworkMap(m_inventory.Snapshot());
    }

    DiscoveryStatus DiscoveryService::Status() const
    {
        DiscoveryStatus status;
        status.running = m_running;
        status.device_count = m_inventory.Size();
        status.scan_interval = m_config.scan_interval;
        status.quick_check_interval = m_config.quick_check_interval;
        status.completed_cycles = m_completed_cycles;
        {
            std::lock_guard<std::mutex> lock(m_status_mutex);
            status.last_cycle_error = m_last_cycle_error;
        }
        return status;
    }
}
