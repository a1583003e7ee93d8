#include "NetworkDevice.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace net_scout::discovery
{
    std::string ToString(DeviceType type)
    {
        switch (type)
        {
        case DeviceType::Router:
            return "router";
        case DeviceType::Server:
            return "server";
        case DeviceType::WindowsHost:
            return "windows_host";
        case DeviceType::DnsServer:
            return "dns_server";
        case DeviceType::Printer:
            return "printer";
        case DeviceType::Host:
            return "host";
        case DeviceType::Unknown:
            break;
        }
        return "unknown";
    }

    std::string ToString(DeviceStatus status)
    {
        return status == DeviceStatus::Online ? "online" : "offline";
    }

    DeviceType ParseDeviceType(const std::string &text)
    {
        if (text == "router")
            return DeviceType::Router;
        if (text == "server")
            return DeviceType::Server;
        if (text == "windows_host")
            return DeviceType::WindowsHost;
        if (text == "dns_server")
            return DeviceType::DnsServer;
        if (text == "printer")
            return DeviceType::Printer;
        if (text == "host")
            return DeviceType::Host;
        return DeviceType::Unknown;
    }

    DeviceStatus ParseDeviceStatus(const std::string &text)
    {
        return text == "offline" ? DeviceStatus::Offline : DeviceStatus::Online;
    }

    std::int64_t ToEpochMillis(Clock::time_point tp)
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    Clock::time_point FromEpochMillis(std::int64_t ms)
    {
        return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
    }

    std::string JoinPorts(const std::vector<int> &ports)
    {
        std::stringstream ss;
        for (size_t i = 0; i < ports.size(); ++i)
        {
            if (i)
                ss << ",";
            ss << ports[i];
        }
        return ss.str();
    }

    std::vector<int> SplitPorts(const std::string &text)
    {
        std::vector<int> ports;
        std::stringstream ss(text);
        std::string item;
        while (std::getline(ss, item, ','))
        {
            try
            {
                if (!item.empty())
                    ports.push_back(std::stoi(item));
            }
            catch (const std::exception &)
            {
                std::cerr << "[Device] Dropping bad port entry '" << item << "'\n";
            }
        }
        std::sort(ports.begin(), ports.end());
        return ports;
    }

    DeviceFields DeviceToFields(const NetworkDevice &device)
    {
        DeviceFields fields;

        fields.to_set["status"] = ToString(device.status);
        fields.to_set["last_seen"] = ToEpochMillis(device.last_seen);
        fields.to_set["device_type"] = ToString(device.device_type);
        fields.to_set["open_ports"] = JoinPorts(device.open_ports);

        fields.to_set_on_insert["ip"] = device.ip;
        fields.to_set_on_insert["first_seen"] = ToEpochMillis(device.first_seen);
        if (!device.mac.empty())
            fields.to_set_on_insert["mac"] = device.mac;
        if (!device.hostname.empty())
            fields.to_set_on_insert["hostname"] = device.hostname;
        if (!device.vendor.empty())
            fields.to_set_on_insert["vendor"] = device.vendor;

        return fields;
    }

    std::optional<NetworkDevice> DeviceFromDocument(const store::Document &doc)
    {
        auto ip = store::GetString(doc, "ip");
        if (!ip || ip->empty())
            return std::nullopt;

        NetworkDevice device;
        device.ip = *ip;
        device.mac = store::GetString(doc, "mac").value_or("");
        device.hostname = store::GetString(doc, "hostname").value_or("");
        device.vendor = store::GetString(doc, "vendor").value_or("");
        device.device_type = ParseDeviceType(store::GetString(doc, "device_type").value_or("unknown"));
        device.open_ports = SplitPorts(store::GetString(doc, "open_ports").value_or(""));
        device.status = ParseDeviceStatus(store::GetString(doc, "status").value_or("online"));

        auto last_seen = store::GetInt(doc, "last_seen");
        auto first_seen = store::GetInt(doc, "first_seen");
        device.last_seen = FromEpochMillis(last_seen.value_or(0));
        device.first_seen = FromEpochMillis(first_seen.value_or(last_seen.value_or(0)));
        if (device.first_seen > device.last_seen)
            device.first_seen = device.last_seen;

        return device;
    }
}
