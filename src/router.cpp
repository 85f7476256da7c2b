#include <wrtpoll/router.hpp>

Router::Router(const Config& config)
    : Router(config, make_connection(config)) {}

Router::Router(const Config& config, std::unique_ptr<Connection> connection, Clock clock)
    : connection_(std::move(connection)),
      devices_(*connection_, config.mode, config.require_ip),
      traffic_(*connection_, config.cache_window, std::move(clock)) {}

DeviceMap Router::connected_devices() {
    return devices_.connected_devices();
}

std::optional<Totals> Router::totals(bool use_cache) {
    return traffic_.totals(use_cache);
}

std::optional<uint64_t> Router::rx(bool use_cache) {
    return traffic_.rx(use_cache);
}

std::optional<uint64_t> Router::tx(bool use_cache) {
    return traffic_.tx(use_cache);
}

std::optional<Rates> Router::current_rates(bool use_cache) {
    return traffic_.current_rates(use_cache);
}

std::optional<std::pair<std::string, std::string>> Router::current_rates_human_readable(bool use_cache) {
    return traffic_.current_rates_human_readable(use_cache);
}

Connection& Router::connection() {
    return *connection_;
}
