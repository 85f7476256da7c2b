#ifndef WRTPOLL_TRAFFIC_HPP
#define WRTPOLL_TRAFFIC_HPP

#include <wrtpoll/connection.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

constexpr const char* counters_command = "ifconfig eth0 |grep bytes";

using Clock = std::function<std::chrono::steady_clock::time_point()>;

inline std::chrono::steady_clock::time_point steady_now() {
    return std::chrono::steady_clock::now();
}

template <typename T>
class CacheEntry {
  private:
    T value_;
    std::chrono::steady_clock::time_point stamp_;
    std::chrono::steady_clock::duration window_;

  public:
    CacheEntry(T value, std::chrono::steady_clock::time_point stamp, std::chrono::steady_clock::duration window)
        : value_(std::move(value)), stamp_(stamp), window_(window) {}

    bool is_valid(std::chrono::steady_clock::time_point now) const {
        return now - stamp_ < window_;
    }

    const T& value() const {
        return value_;
    }

    std::chrono::steady_clock::time_point timestamp() const {
        return stamp_;
    }
};

struct Totals {
    uint64_t rx{0};
    uint64_t tx{0};
};

// Bytes per second.
struct Rates {
    uint64_t rx{0};
    uint64_t tx{0};
};

// ceil(delta / seconds) per direction. A counter that went backwards reads 0.
Rates transfer_rates(const Totals& previous, const Totals& current, double seconds);

class TrafficMonitor {
  public:
    TrafficMonitor(Connection& connection, float cache_window, Clock clock = steady_now);

    // Interface byte totals. With use_cache, a read younger than the cache
    // window is returned without querying the router.
    std::optional<Totals> totals(bool use_cache = true);
    std::optional<uint64_t> rx(bool use_cache = true);
    std::optional<uint64_t> tx(bool use_cache = true);

    // Rates since the previous call. The first call only records a baseline
    // and returns nothing.
    std::optional<Rates> current_rates(bool use_cache = true);
    std::optional<std::pair<std::string, std::string>> current_rates_human_readable(bool use_cache = true);

    void reset();

  private:
    Connection& connection_;
    std::chrono::steady_clock::duration window_;
    Clock clock_;
    std::optional<CacheEntry<Totals>> cache_;
    std::optional<Totals> latest_;
    std::chrono::steady_clock::time_point latest_time_{};
};

// Binary multiples, e.g. "1.5 KB". Zero is "0B".
std::string format_size(uint64_t bytes);

#endif
