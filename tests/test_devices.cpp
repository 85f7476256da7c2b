#include <wrtpoll/devices.hpp>

#include "fake_connection.hpp"

#include <gtest/gtest.h>

#include <regex>

namespace {

void load_router_output(FakeConnection& conn) {
    conn.set(wireless_command, {
        "assoclist AA:BB:CC:DD:EE:01",
        "assoclist AA:BB:CC:DD:EE:09",
    });
    conn.set(arp_command, {
        "? (192.168.1.10) at aa:bb:cc:dd:ee:01 [ether]  on br0",
        "? (192.168.1.11) at aa:bb:cc:dd:ee:02 [ether]  on br0",
    });
    conn.set(neighbor_command, {
        "192.168.1.11 dev br0 lladdr aa:bb:cc:dd:ee:02 REACHABLE",
        "192.168.1.12 dev br0 lladdr aa:bb:cc:dd:ee:03 reachable",
        "192.168.1.13 dev br0 lladdr aa:bb:cc:dd:ee:04 STALE",
        "192.168.1.14 dev br0 lladdr aa:bb:cc:dd:ee:05 FAILED",
        "192.168.1.15 dev br0  FAILED",
    });
    conn.set(lease_command, {
        "duid 00:01:00:01:2a:2b:2c:2d:aa:bb:cc:dd:ee:00",
        "1700000000 aa:bb:cc:dd:ee:01 192.168.1.10 laptop 01:aa:bb:cc:dd:ee:01",
        "1700000100 aa:bb:cc:dd:ee:03 192.168.1.12 * *",
        "1700000200 aa:bb:cc:dd:ee:07 192.168.1.17 phantom *",
    });
}

}

TEST(DeviceReconciler, MergesSourcesInPrecedenceOrder) {
    FakeConnection conn;
    load_router_output(conn);
    DeviceReconciler reconciler{conn, Mode::router, false};

    auto devices = reconciler.connected_devices();
    ASSERT_EQ(devices.size(), 4u);

    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:01"), (Device{"AA:BB:CC:DD:EE:01", "192.168.1.10", "laptop"}));
    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:02"), (Device{"AA:BB:CC:DD:EE:02", "192.168.1.11", std::nullopt}));
    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:03"), (Device{"AA:BB:CC:DD:EE:03", "192.168.1.12", ""}));
    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:09"), (Device{"AA:BB:CC:DD:EE:09", std::nullopt, std::nullopt}));

    EXPECT_EQ(conn.commands, (std::vector<std::string>{wireless_command, arp_command, neighbor_command, lease_command}));
}

TEST(DeviceReconciler, UnreachableNeighborsNeverAppear) {
    FakeConnection conn;
    load_router_output(conn);
    DeviceReconciler reconciler{conn, Mode::router, false};

    auto devices = reconciler.connected_devices();
    EXPECT_EQ(devices.count("AA:BB:CC:DD:EE:04"), 0u);
    EXPECT_EQ(devices.count("AA:BB:CC:DD:EE:05"), 0u);
}

TEST(DeviceReconciler, LeasesDoNotIntroduceDevices) {
    FakeConnection conn;
    load_router_output(conn);
    DeviceReconciler reconciler{conn, Mode::router, false};

    auto devices = reconciler.connected_devices();
    EXPECT_EQ(devices.count("AA:BB:CC:DD:EE:07"), 0u);
    for (const auto& [mac, device] : devices) {
        ASSERT_TRUE(!device.name || *device.name != "*");
    }
}

TEST(DeviceReconciler, LeasesOverrideArpAddress) {
    FakeConnection conn;
    conn.set(arp_command, {"? (192.168.1.10) at aa:bb:cc:dd:ee:01 [ether]  on br0"});
    conn.set(lease_command, {"1700000000 aa:bb:cc:dd:ee:01 192.168.1.40 laptop *"});
    DeviceReconciler reconciler{conn, Mode::router, false};

    auto devices = reconciler.connected_devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:01").ip, "192.168.1.40");
    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:01").name, "laptop");
}

TEST(DeviceReconciler, ArpReplacesKnownNames) {
    DeviceMap devices{{"AA:BB:CC:DD:EE:01", Device{"AA:BB:CC:DD:EE:01", "192.168.1.2", "old"}}};
    merge(devices, arp_devices({"? (192.168.1.10) at aa:bb:cc:dd:ee:01 [ether]  on br0"}));
    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:01"), (Device{"AA:BB:CC:DD:EE:01", "192.168.1.10", std::nullopt}));
}

TEST(DeviceReconciler, AccessPointModeSkipsLeases) {
    FakeConnection conn;
    load_router_output(conn);
    DeviceReconciler reconciler{conn, Mode::access_point, false};

    auto devices = reconciler.connected_devices();
    EXPECT_EQ(conn.calls[lease_command], 0);
    EXPECT_FALSE(devices.at("AA:BB:CC:DD:EE:01").name.has_value());
    EXPECT_FALSE(devices.at("AA:BB:CC:DD:EE:03").name.has_value());
}

TEST(DeviceReconciler, RequireIpDropsWirelessOnlyDevices) {
    FakeConnection conn;
    load_router_output(conn);

    DeviceReconciler strict{conn, Mode::router, true};
    auto devices = strict.connected_devices();
    EXPECT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices.count("AA:BB:CC:DD:EE:09"), 0u);
    for (const auto& [mac, device] : devices) {
        EXPECT_TRUE(device.ip.has_value()) << mac;
    }

    DeviceReconciler lenient{conn, Mode::router, false};
    EXPECT_EQ(lenient.connected_devices().count("AA:BB:CC:DD:EE:09"), 1u);
}

TEST(DeviceReconciler, NoOutputYieldsNoDevices) {
    FakeConnection conn;
    DeviceReconciler reconciler{conn, Mode::router, false};
    EXPECT_TRUE(reconciler.connected_devices().empty());
    EXPECT_EQ(conn.commands.size(), 4u);
}

TEST(DeviceReconciler, MacsAreCanonical) {
    FakeConnection conn;
    conn.set(wireless_command, {"assoclist AA-BB-CC-DD-EE-0A"});
    conn.set(arp_command, {"? (192.168.1.10) at aa-bb-cc-dd-ee-0b [ether]  on br0"});
    conn.set(neighbor_command, {"192.168.1.12 dev br0 lladdr aa:bb:cc:dd:ee:0c REACHABLE"});
    DeviceReconciler reconciler{conn, Mode::router, false};

    auto devices = reconciler.connected_devices();
    ASSERT_EQ(devices.size(), 3u);
    const std::regex canonical{"^([0-9A-F]{2}:){5}[0-9A-F]{2}$"};
    for (const auto& [mac, device] : devices) {
        EXPECT_TRUE(std::regex_match(mac, canonical)) << mac;
        EXPECT_EQ(mac, device.mac);
    }
}

TEST(DeviceReconciler, NeighborsOnlyWithoutOtherSources) {
    FakeConnection conn;
    conn.set(neighbor_command, {
        "192.168.1.13 dev br0 lladdr aa:bb:cc:dd:ee:04 STALE",
        "192.168.1.14 dev br0 lladdr aa:bb:cc:dd:ee:05 FAILED",
    });
    DeviceReconciler reconciler{conn, Mode::router, false};
    EXPECT_TRUE(reconciler.connected_devices().empty());
}
