#include "HostInspector.hpp"
#include "HostProbe.hpp"
#include "RangeEnumerator.hpp"

#include <iostream>
#include <regex>
#include <sstream>
#include <utility>

namespace net_scout::discovery
{
    namespace
    {
        std::vector<std::string> Split(const std::string &text, char delim)
        {
            std::vector<std::string> parts;
            std::string part;
            std::istringstream stream(text);
            while (std::getline(stream, part, delim))
                parts.push_back(part);
            return parts;
        }

        std::string Trim(const std::string &text)
        {
            const auto begin = text.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
                return "";
            const auto end = text.find_last_not_of(" \t\r\n");
            return text.substr(begin, end - begin + 1);
        }

        std::string FirstLine(const std::string &text)
        {
            return Trim(text.substr(0, text.find('\n')));
        }
    }

    HostInspector::HostInspector(common::ProcessRunner &runner, ToolConfig tools)
        : m_runner(runner), m_tools(std::move(tools))
    {
    }

    HostDetails HostInspector::Inspect(const std::string &ip)
    {
        HostDetails details;
        details.ip = ip;

        if (!ParseIPv4(ip))
        {
            details.error = "invalid IPv4 address";
            return details;
        }

        details.mac = LookupMac(ip);

        common::ProcessResult res = m_runner.Run(
            {m_tools.nmap, "-sV", "--top-ports", "100", "-Pn", "-n", "-oG", "-", ip},
            m_tools.service_scan_timeout);

        if (!res.launched)
        {
            details.error = "nmap not available";
            return details;
        }
        if (res.timed_out)
        {
            details.error = "nmap timed out";
            return details;
        }
        if (res.exit_code != 0)
        {
            std::string err = FirstLine(res.err.empty() ? res.out : res.err);
            details.error = err.empty() ? "nmap failed" : err;
            std::cerr << "[Inspector] nmap on " << ip << " exited with " << res.exit_code << "\n";
            return details;
        }

        auto services = ParseNmapGreppable(res.out);
        if (!services)
        {
            details.error = "failed to parse nmap output";
            return details;
        }
        details.services = std::move(*services);
        return details;
    }

    NeighborTable HostInspector::ListNeighbors()
    {
        NeighborTable table;
        common::ProcessResult res = m_runner.Run({m_tools.ip, "neigh", "show"}, m_tools.arp_table_timeout);
        if (!res.launched)
        {
            table.error = m_tools.ip + " not available";
            return table;
        }
        if (res.timed_out)
        {
            table.error = m_tools.ip + " timed out";
            return table;
        }
        if (res.exit_code != 0)
        {
            std::string err = FirstLine(res.err.empty() ? res.out : res.err);
            table.error = err.empty() ? "ip neigh failed" : err;
            return table;
        }

        table.items = ParseIpNeighTable(res.out);
        return table;
    }

    std::string HostInspector::LookupMac(const std::string &ip)
    {
        common::ProcessResult res = m_runner.Run({m_tools.ip, "neigh", "show", ip}, m_tools.arp_table_timeout);
        if (!res.Succeeded())
            return "";
        return ParseIpNeighOutput(res.out).value_or("");
    }

    std::optional<std::string> ParseIpNeighOutput(const std::string &output)
    {
        static const std::regex mac_re("^([0-9a-fA-F]{2}:){5}[0-9a-fA-F]{2}$");

        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            std::istringstream tokens(line);
            std::vector<std::string> parts;
            std::string token;
            while (tokens >> token)
                parts.push_back(token);

            if (parts.size() < 5 || parts[4] == "INCOMPLETE")
                continue;
            if (std::regex_match(parts[4], mac_re))
                return NormalizeMac(parts[4]);
        }
        return std::nullopt;
    }

    std::vector<NeighborEntry> ParseIpNeighTable(const std::string &output)
    {
        std::vector<NeighborEntry> entries;

        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            std::istringstream tokens(line);
            std::vector<std::string> parts;
            std::string token;
            while (tokens >> token)
                parts.push_back(token);

            if (parts.size() < 5)
                continue;

            NeighborEntry entry;
            entry.ip = parts[0];
            if (parts[4] != "INCOMPLETE")
                entry.mac = NormalizeMac(parts[4]);
            entry.state = parts.back();
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::optional<std::vector<ServiceInfo>> ParseNmapGreppable(const std::string &output)
    {
        std::vector<ServiceInfo> services;

        std::istringstream lines(output);
        std::string line;
        while (std::getline(lines, line))
        {
            if (line.rfind("Host:", 0) != 0)
                continue;

            auto ports_at = line.find("Ports: ");
            if (ports_at == std::string::npos)
                continue;

            std::string ports = line.substr(ports_at + 7);
            auto tab = ports.find('\t');
            if (tab != std::string::npos)
                ports.resize(tab);

            for (const auto &raw : Split(ports, ','))
            {
                std::string entry = Trim(raw);
                if (entry.empty())
                    continue;

                // port/state/protocol/owner/service/rpc_info/version/
                std::vector<std::string> fields = Split(entry, '/');
                if (fields.size() < 5)
                    return std::nullopt;

                ServiceInfo info;
                try
                {
                    size_t used = 0;
                    info.port = std::stoi(fields[0], &used);
                    if (used != fields[0].size())
                        return std::nullopt;
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[Inspector] Bad port entry '" << entry << "': " << e.what() << "\n";
                    return std::nullopt;
                }
                info.state = fields[1];
                info.service = fields[4];
                if (fields.size() > 6)
                    info.version = fields[6];
                services.push_back(std::move(info));
            }
        }
        return services;
    }
}
