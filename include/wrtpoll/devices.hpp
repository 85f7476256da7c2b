#ifndef WRTPOLL_DEVICES_HPP
#define WRTPOLL_DEVICES_HPP

#include <wrtpoll/config.hpp>
#include <wrtpoll/connection.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

constexpr const char* wireless_command = "for dev in `nvram get wl_ifnames`; do wl -i $dev assoclist; done";
constexpr const char* lease_command = "cat /var/lib/misc/dnsmasq.leases";
constexpr const char* neighbor_command = "ip neigh";
constexpr const char* arp_command = "arp -n";

struct Device {
    std::string mac;
    std::optional<std::string> ip;
    // Empty when the client offered no name, absent when no source knows.
    std::optional<std::string> name;
};

bool operator==(const Device& lhs, const Device& rhs);

// Keyed by canonical MAC address.
using DeviceMap = std::map<std::string, Device>;

DeviceMap wireless_devices(const std::vector<std::string>& lines);
DeviceMap arp_devices(const std::vector<std::string>& lines);
DeviceMap neighbor_devices(const std::vector<std::string>& lines, const DeviceMap& known);
DeviceMap lease_devices(const std::vector<std::string>& lines, const DeviceMap& known);

// Entries of from replace entries of into with the same MAC.
void merge(DeviceMap& into, DeviceMap&& from);

class DeviceReconciler {
  public:
    DeviceReconciler(Connection& connection, Mode mode, bool require_ip);

    // Superset of every source that answered, later sources taking precedence:
    // wireless clients, ARP, reachable neighbors, then DHCP leases of devices
    // already seen (router mode only).
    DeviceMap connected_devices();

  private:
    Connection& connection_;
    Mode mode_;
    bool require_ip_;
};

#endif
