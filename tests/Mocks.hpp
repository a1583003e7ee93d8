#pragma once

#include <gmock/gmock.h>
#include "common/Process.hpp"
#include "store/DocumentStore.hpp"
#include "discovery/DeviceEnricher.hpp"
#include "discovery/HostProbe.hpp"
#include "discovery/LivenessProbe.hpp"
#include "discovery/PortProber.hpp"
#include "discovery/RangeEnumerator.hpp"

namespace net_scout::test_support
{
    class MockProcessRunner : public common::ProcessRunner
    {
    public:
        MOCK_METHOD(common::ProcessResult, Run, (const std::vector<std::string> &argv, std::chrono::milliseconds timeout), (override));
    };

    class MockDocumentStore : public store::DocumentStore
    {
    public:
        MOCK_METHOD(bool, Upsert, (const std::string &collection, const std::string &key,
                                   const store::Document &fields_to_set, const store::Document &fields_to_set_on_insert),
                    (override));
        MOCK_METHOD(std::vector<store::Document>, Find, (const std::string &collection, const store::Filter &filter), (override));
        MOCK_METHOD(std::optional<int>, DeleteMany, (const std::string &collection, const store::Filter &filter), (override));
    };

    class MockInterfaceSource : public discovery::InterfaceSource
    {
    public:
        MOCK_METHOD(std::vector<discovery::InterfaceAddress>, ListInterfaces, (), (override));
        MOCK_METHOD(std::optional<std::string>, DefaultGateway, (), (override));
    };

    class MockHostDiscoveryProbe : public discovery::HostDiscoveryProbe
    {
    public:
        MOCK_METHOD(std::string, Name, (), (const, override));
        MOCK_METHOD(discovery::SweepResult, Sweep, (const std::string &cidr), (override));
    };

    class MockPortProber : public discovery::PortProber
    {
    public:
        MOCK_METHOD(std::vector<int>, OpenPorts, (const std::string &ip, const std::vector<int> &ports, std::chrono::milliseconds timeout), (override));
    };

    class MockHostnameResolver : public discovery::HostnameResolver
    {
    public:
        MOCK_METHOD(std::string, Resolve, (const std::string &ip), (override));
    };

    class MockLivenessProbe : public discovery::LivenessProbe
    {
    public:
        MOCK_METHOD(bool, IsReachable, (const std::string &ip), (override));
    };

    inline common::ProcessResult Exited(int code, const std::string &out, const std::string &err = "")
    {
        common::ProcessResult res;
        res.launched = true;
        res.exit_code = code;
        res.out = out;
        res.err = err;
        return res;
    }

    inline common::ProcessResult NotLaunched()
    {
        common::ProcessResult res;
        res.err = "No such file or directory";
        return res;
    }

    inline discovery::InterfaceAddress Iface(const std::string &name, const std::string &ip, const std::string &mask,
                                             bool loopback = false)
    {
        discovery::InterfaceAddress addr;
        addr.name = name;
        addr.ip = ip;
        addr.netmask = mask;
        addr.loopback = loopback;
        return addr;
    }

    inline discovery::NetworkDevice Device(const std::string &ip, const std::string &mac = "", const std::string &vendor = "")
    {
        discovery::NetworkDevice device;
        device.ip = ip;
        device.mac = mac;
        device.vendor = vendor;
        return device;
    }
}
