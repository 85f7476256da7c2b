#include <wrtpoll/router.hpp>
#include <wrtpoll/telnet_connection.hpp>

#include "fake_connection.hpp"

#include <gtest/gtest.h>

using namespace std::chrono_literals;

TEST(Router, SharesOneConnectionBetweenQueries) {
    auto conn = std::make_unique<FakeConnection>();
    auto& fake = *conn;
    fake.set(wireless_command, {"assoclist AA:BB:CC:DD:EE:01"});
    fake.set(arp_command, {"? (192.168.1.10) at aa:bb:cc:dd:ee:01 [ether]  on br0"});
    fake.set(lease_command, {"1700000000 aa:bb:cc:dd:ee:01 192.168.1.10 nas *"});
    fake.push(counters_command, {"RX bytes:10000 (9.7 KiB)  TX bytes:20000 (19.5 KiB)"});
    fake.push(counters_command, {"RX bytes:14000 (13.6 KiB)  TX bytes:20000 (19.5 KiB)"});

    ManualClock clock;
    Config config;
    config.host = "192.168.1.1";
    Router router{config, std::move(conn), clock.clock()};
    EXPECT_EQ(&router.connection(), &fake);

    auto devices = router.connected_devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.at("AA:BB:CC:DD:EE:01").name, "nas");

    EXPECT_EQ(router.rx(), 10000u);
    EXPECT_EQ(router.tx(), 20000u);
    EXPECT_FALSE(router.current_rates());

    clock.advance(5s);
    auto rates = router.current_rates_human_readable();
    ASSERT_TRUE(rates);
    EXPECT_EQ(rates->first, "800.0 B/s");
    EXPECT_EQ(rates->second, "0B/s");

    EXPECT_EQ(fake.calls[counters_command], 2);
    EXPECT_EQ(fake.commands.size(), 6u);
}

TEST(Router, AppliesModeAndRequireIp) {
    auto conn = std::make_unique<FakeConnection>();
    auto& fake = *conn;
    fake.set(wireless_command, {"assoclist AA:BB:CC:DD:EE:01", "assoclist AA:BB:CC:DD:EE:02"});
    fake.set(arp_command, {"? (192.168.1.10) at aa:bb:cc:dd:ee:01 [ether]  on br0"});

    Config config;
    config.mode = Mode::access_point;
    config.require_ip = true;
    Router router{config, std::move(conn)};

    auto devices = router.connected_devices();
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.count("AA:BB:CC:DD:EE:01"), 1u);
    EXPECT_EQ(fake.calls[lease_command], 0);
}

TEST(Router, BuildsConnectionFromConfigLazily) {
    Config config;
    config.host = "192.0.2.1";
    config.transport = TransportKind::telnet;
    Router router{config};
    EXPECT_NE(dynamic_cast<TelnetConnection*>(&router.connection()), nullptr);
}
