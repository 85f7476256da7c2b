#include <wrtpoll/devices.hpp>
#include <wrtpoll/parsers.hpp>
#include <wrtpoll/utils.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

bool operator==(const Device& lhs, const Device& rhs) {
    return lhs.mac == rhs.mac && lhs.ip == rhs.ip && lhs.name == rhs.name;
}

void merge(DeviceMap& into, DeviceMap&& from) {
    for (auto& [mac, device] : from) {
        into.insert_or_assign(mac, std::move(device));
    }
}

DeviceMap wireless_devices(const std::vector<std::string>& lines) {
    DeviceMap devices;
    for (const auto& record : parse_lines(lines, wireless_pattern())) {
        auto mac = canonical_mac(*record.at("mac"));
        devices[mac] = Device{mac, std::nullopt, std::nullopt};
    }
    return devices;
}

DeviceMap arp_devices(const std::vector<std::string>& lines) {
    DeviceMap devices;
    for (const auto& record : parse_lines(lines, arp_pattern())) {
        const auto& mac = record.at("mac");
        if (!mac) {
            continue;
        }
        auto key = canonical_mac(*mac);
        devices[key] = Device{key, record.at("ip"), std::nullopt};
    }
    return devices;
}

DeviceMap neighbor_devices(const std::vector<std::string>& lines, const DeviceMap& known) {
    DeviceMap devices;
    for (const auto& record : parse_lines(lines, neighbor_pattern())) {
        const auto& status = record.at("status");
        if (!status || !iequals(*status, "REACHABLE")) {
            continue;
        }
        const auto& mac = record.at("mac");
        if (!mac) {
            continue;
        }
        auto key = canonical_mac(*mac);
        auto ip = record.at("ip");
        if (!ip) {
            auto it = known.find(key);
            if (it != known.end()) {
                ip = it->second.ip;
            }
        }
        devices[key] = Device{key, std::move(ip), std::nullopt};
    }
    return devices;
}

DeviceMap lease_devices(const std::vector<std::string>& lines, const DeviceMap& known) {
    std::vector<std::string> leases;
    std::copy_if(lines.begin(), lines.end(), std::back_inserter(leases), [](const std::string& line) {
        return !starts_with(line, "duid ");
    });

    DeviceMap devices;
    for (const auto& record : parse_lines(leases, lease_pattern())) {
        auto mac = canonical_mac(*record.at("mac"));
        if (known.count(mac) == 0) {
            spdlog::trace("ignoring lease of unseen device {}", mac);
            continue;
        }
        // dnsmasq writes '*' when the client sent no hostname
        auto host = record.at("host").value_or("");
        if (host == "*") {
            host.clear();
        }
        devices[mac] = Device{mac, record.at("ip"), std::move(host)};
    }
    return devices;
}

DeviceReconciler::DeviceReconciler(Connection& connection, Mode mode, bool require_ip)
    : connection_(connection), mode_(mode), require_ip_(require_ip) {}

DeviceMap DeviceReconciler::connected_devices() {
    DeviceMap devices;
    merge(devices, wireless_devices(connection_.run(wireless_command)));
    merge(devices, arp_devices(connection_.run(arp_command)));
    merge(devices, neighbor_devices(connection_.run(neighbor_command), devices));
    if (mode_ != Mode::access_point) {
        merge(devices, lease_devices(connection_.run(lease_command), devices));
    }

    if (require_ip_) {
        for (auto it = devices.begin(); it != devices.end();) {
            if (!it->second.ip) {
                spdlog::debug("dropping {} without an ip address", it->first);
                it = devices.erase(it);
            } else {
                ++it;
            }
        }
    }
    spdlog::debug("{} connected devices", devices.size());
    return devices;
}
