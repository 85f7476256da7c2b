#include <wrtpoll/traffic.hpp>
#include <wrtpoll/parsers.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <iterator>

TrafficMonitor::TrafficMonitor(Connection& connection, float cache_window, Clock clock)
    : connection_(connection),
      window_(std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::duration<float>(cache_window))),
      clock_(std::move(clock)) {}

std::optional<Totals> TrafficMonitor::totals(bool use_cache) {
    auto now = clock_();
    if (use_cache && cache_ && cache_->is_valid(now)) {
        return cache_->value();
    }

    auto counters = extract_counters(connection_.run(counters_command));
    if (counters.size() < 2) {
        spdlog::warn("expected rx and tx byte counters, found {} values", counters.size());
        return std::nullopt;
    }
    Totals totals{counters[0], counters[1]};
    spdlog::debug("interface totals rx={} tx={}", totals.rx, totals.tx);
    cache_.emplace(totals, now, window_);
    return totals;
}

std::optional<uint64_t> TrafficMonitor::rx(bool use_cache) {
    auto data = totals(use_cache);
    if (!data) {
        return std::nullopt;
    }
    return data->rx;
}

std::optional<uint64_t> TrafficMonitor::tx(bool use_cache) {
    auto data = totals(use_cache);
    if (!data) {
        return std::nullopt;
    }
    return data->tx;
}

static uint64_t rate(uint64_t current, uint64_t previous, double seconds) {
    if (current <= previous) {
        return 0;
    }
    return static_cast<uint64_t>(std::ceil(static_cast<double>(current - previous) / seconds));
}

Rates transfer_rates(const Totals& previous, const Totals& current, double seconds) {
    return Rates{rate(current.rx, previous.rx, seconds), rate(current.tx, previous.tx, seconds)};
}

std::optional<Rates> TrafficMonitor::current_rates(bool use_cache) {
    auto now = clock_();
    auto data = totals(use_cache);
    if (!data) {
        return std::nullopt;
    }
    if (!latest_) {
        latest_ = data;
        latest_time_ = now;
        return std::nullopt;
    }

    auto seconds = std::chrono::duration<double>(now - latest_time_).count();
    if (seconds <= 0.0) {
        return std::nullopt;
    }
    auto ret = transfer_rates(*latest_, *data, seconds);
    latest_ = data;
    latest_time_ = now;
    return ret;
}

std::optional<std::pair<std::string, std::string>> TrafficMonitor::current_rates_human_readable(bool use_cache) {
    auto rates = current_rates(use_cache);
    if (!rates) {
        return std::nullopt;
    }
    return std::make_pair(fmt::format("{}/s", format_size(rates->rx)), fmt::format("{}/s", format_size(rates->tx)));
}

void TrafficMonitor::reset() {
    cache_.reset();
    latest_.reset();
    latest_time_ = {};
}

std::string format_size(uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB", "EB"};
    if (bytes == 0) {
        return "0B";
    }
    auto value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    auto num = fmt::format("{:.2f}", value);
    while (num.back() == '0' && num[num.size() - 2] != '.') {
        num.pop_back();
    }
    return fmt::format("{} {}", num, units[unit]);
}
