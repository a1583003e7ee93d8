#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "../store/DocumentStore.hpp"

namespace net_scout::discovery
{
    using Clock = std::chrono::system_clock;

    inline constexpr const char *DEVICES_COLLECTION = "network_devices";

    enum class DeviceType
    {
        Router,
        Server,
        WindowsHost,
        DnsServer,
        Printer,
        Host,
        Unknown
    };

    enum class DeviceStatus
    {
        Online,
        Offline
    };

    struct NetworkDevice
    {
        std::string ip;
        std::string mac;      // empty = unknown
        std::string hostname; // empty = unknown
        std::string vendor;   // empty = unknown
        DeviceType device_type = DeviceType::Unknown;
        std::vector<int> open_ports;
        DeviceStatus status = DeviceStatus::Online;
        Clock::time_point first_seen{};
        Clock::time_point last_seen{};
    };

    std::string ToString(DeviceType type);
    std::string ToString(DeviceStatus status);
    DeviceType ParseDeviceType(const std::string &text);
    DeviceStatus ParseDeviceStatus(const std::string &text);

    std::int64_t ToEpochMillis(Clock::time_point tp);
    Clock::time_point FromEpochMillis(std::int64_t ms);

    std::string JoinPorts(const std::vector<int> &ports);
    std::vector<int> SplitPorts(const std::string &text);

    // Store boundary. Volatile fields are always written; identity and sticky
    // fields only where the stored document lacks them.
    struct DeviceFields
    {
        store::Document to_set;
        store::Document to_set_on_insert;
    };

    DeviceFields DeviceToFields(const NetworkDevice &device);
    std::optional<NetworkDevice> DeviceFromDocument(const store::Document &doc);
}
