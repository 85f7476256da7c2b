#ifndef WRTPOLL_ROUTER_HPP
#define WRTPOLL_ROUTER_HPP

#include <wrtpoll/config.hpp>
#include <wrtpoll/connection.hpp>
#include <wrtpoll/devices.hpp>
#include <wrtpoll/traffic.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>

// Client for one router. Every query goes through the same connection, one
// command at a time.
class Router {
  public:
    explicit Router(const Config& config);
    Router(const Config& config, std::unique_ptr<Connection> connection, Clock clock = steady_now);
    Router(const Router&) = delete;
    Router(Router&&) = delete;
    Router& operator=(const Router&) = delete;
    Router& operator=(Router&&) = delete;

    DeviceMap connected_devices();

    std::optional<Totals> totals(bool use_cache = true);
    std::optional<uint64_t> rx(bool use_cache = true);
    std::optional<uint64_t> tx(bool use_cache = true);
    std::optional<Rates> current_rates(bool use_cache = true);
    std::optional<std::pair<std::string, std::string>> current_rates_human_readable(bool use_cache = true);

    Connection& connection();

  private:
    std::unique_ptr<Connection> connection_;
    DeviceReconciler devices_;
    TrafficMonitor traffic_;
};

#endif
