#include "InventoryStore.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace net_scout::discovery
{
    InventoryStore::InventoryStore(store::DocumentStore &store, std::string collection)
        : m_store(store), m_collection(std::move(collection))
    {
    }

    size_t InventoryStore::Load()
    {
        std::vector<store::Document> docs;
        try
        {
            docs = m_store.Find(m_collection, {});
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Inventory] Loading persisted devices failed: " << e.what() << "\n";
            return 0;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        size_t loaded = 0;
        for (const auto &doc : docs)
        {
            auto device = DeviceFromDocument(doc);
            if (!device)
            {
                std::cerr << "[Inventory] Skipping persisted document without ip\n";
                continue;
            }
            if (m_index.count(device->ip))
                continue;

            m_index[device->ip] = m_devices.size();
            m_devices.push_back(*device);
            ++loaded;
        }
        return loaded;
    }

    NetworkDevice InventoryStore::Upsert(const NetworkDevice &incoming, Clock::time_point now)
    {
        std::lock_guard<std::mutex> persist_lock(m_persist_mutex);
        NetworkDevice updated;
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_index.find(incoming.ip);
            if (it == m_index.end())
            {
                updated = incoming;
                updated.status = DeviceStatus::Online;
                updated.first_seen = now;
                updated.last_seen = now;

                m_index[updated.ip] = m_devices.size();
                m_devices.push_back(updated);
            }
            else
            {
                NetworkDevice &existing = m_devices[it->second];
                existing.status = DeviceStatus::Online;
                existing.last_seen = std::max(existing.last_seen, now);

                if (existing.mac.empty() && !incoming.mac.empty())
                    existing.mac = incoming.mac;
                if (existing.hostname.empty() && !incoming.hostname.empty())
                    existing.hostname = incoming.hostname;
                if (existing.vendor.empty() && !incoming.vendor.empty())
                    existing.vendor = incoming.vendor;

                existing.open_ports = incoming.open_ports;
                existing.device_type = incoming.device_type;
                updated = existing;
            }
        }

        Persist(updated);
        return updated;
    }

    std::optional<NetworkDevice> InventoryStore::RecordProbe(const std::string &ip, bool reachable, Clock::time_point now,
                                                             std::chrono::milliseconds offline_after)
    {
        std::lock_guard<std::mutex> persist_lock(m_persist_mutex);
        NetworkDevice updated;
        {
            std::lock_guard<std::mutex> lock(m_mutex);

            auto it = m_index.find(ip);
            if (it == m_index.end())
                return std::nullopt;

            NetworkDevice &device = m_devices[it->second];
            if (reachable)
            {
                device.status = DeviceStatus::Online;
                device.last_seen = std::max(device.last_seen, now);
            }
            else if (now - device.last_seen > offline_after)
            {
                device.status = DeviceStatus::Offline;
            }
            updated = device;
        }

        Persist(updated);
        return updated;
    }

    size_t InventoryStore::EvictOlderThan(Clock::time_point cutoff)
    {
        std::lock_guard<std::mutex> persist_lock(m_persist_mutex);
        size_t removed = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto first_stale = std::remove_if(m_devices.begin(), m_devices.end(),
                                              [&](const NetworkDevice &d)
                                              { return d.last_seen < cutoff; });
            removed = static_cast<size_t>(std::distance(first_stale, m_devices.end()));
            m_devices.erase(first_stale, m_devices.end());
            RebuildIndex();
        }

        try
        {
            store::Filter stale = {{"last_seen", store::FilterOp::Less, ToEpochMillis(cutoff)}};
            auto deleted = m_store.DeleteMany(m_collection, stale);
            if (!deleted)
                std::cerr << "[Inventory] Durable eviction failed, will retry next cycle\n";
            else if (*deleted > 0)
                std::cout << "[Inventory] Evicted " << *deleted << " stale persisted device(s)\n";
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Inventory] Durable eviction failed: " << e.what() << "\n";
        }
        return removed;
    }

    std::vector<NetworkDevice> InventoryStore::Snapshot() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices;
    }

    std::optional<NetworkDevice> InventoryStore::Find(const std::string &ip) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_index.find(ip);
        if (it == m_index.end())
            return std::nullopt;
        return m_devices[it->second];
    }

    size_t InventoryStore::Size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_devices.size();
    }

    void InventoryStore::Persist(const NetworkDevice &device)
    {
        DeviceFields fields = DeviceToFields(device);
        try
        {
            if (!m_store.Upsert(m_collection, device.ip, fields.to_set, fields.to_set_on_insert))
                std::cerr << "[Inventory] Persisting " << device.ip << " failed, keeping in-memory state\n";
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Inventory] Persisting " << device.ip << " failed: " << e.what() << "\n";
        }
    }

    void InventoryStore::RebuildIndex()
    {
        m_index.clear();
        for (size_t i = 0; i < m_devices.size(); ++i)
            m_index[m_devices[i].ip] = i;
    }
}
