#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "NetworkDevice.hpp"
#include "../store/DocumentStore.hpp"

namespace net_scout::discovery
{
    // Canonical per-IP device records, mirrored to a document store after every
    // mutation. The in-memory copy is authoritative: a failed durable write is
    // logged and not rolled back.
    class InventoryStore
    {
    public:
        explicit InventoryStore(store::DocumentStore &store, std::string collection = DEVICES_COLLECTION);

        InventoryStore(const InventoryStore &) = delete;
        InventoryStore &operator=(const InventoryStore &) = delete;

        // Pulls persisted records into memory. Records already in memory win.
        size_t Load();

        // New IP: inserted online with first_seen = last_seen = now.
        // Known IP: marked online, last_seen advanced, mac/hostname/vendor filled
        // only where empty, open_ports and device_type replaced.
        NetworkDevice Upsert(const NetworkDevice &incoming, Clock::time_point now);

        // Applies one direct liveness probe. A failure demotes to offline only
        // once last_seen is older than offline_after. Unknown IPs are ignored.
        std::optional<NetworkDevice> RecordProbe(const std::string &ip, bool reachable, Clock::time_point now,
                                                 std::chrono::milliseconds offline_after);

        // Removes records with last_seen before cutoff, here and in the store.
        size_t EvictOlderThan(Clock::time_point cutoff);

        std::vector<NetworkDevice> Snapshot() const;
        std::optional<NetworkDevice> Find(const std::string &ip) const;
        size_t Size() const;

    private:
        void Persist(const NetworkDevice &device);
        void RebuildIndex();

        store::DocumentStore &m_store;
        std::string m_collection;

        // Orders durable writes against eviction; taken before m_mutex.
        std::mutex m_persist_mutex;
        mutable std::mutex m_mutex;
        std::vector<NetworkDevice> m_devices; // insertion order
        std::unordered_map<std::string, size_t> m_index;
    };
}
