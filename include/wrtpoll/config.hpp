#ifndef WRTPOLL_CONFIG_HPP
#define WRTPOLL_CONFIG_HPP

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

enum class TransportKind {
    ssh,
    telnet,
};

enum class Mode {
    router,
    access_point,
};

struct Config {
    std::string host;
    uint16_t port{0};
    TransportKind transport{TransportKind::ssh};
    std::string username;
    std::string password;
    std::string key_file;
    Mode mode{Mode::router};
    bool require_ip{false};
    float cache_window{5.0f};
    float timeout{30.0f};
    int max_retries{1};
};

// Port to connect to when none was configured.
inline uint16_t default_port(const Config& config) {
    if (config.port != 0) {
        return config.port;
    }
    return config.transport == TransportKind::telnet ? 23 : 22;
}

// Transport I/O timeout in whole milliseconds, -1 when disabled. A positive
// timeout never rounds down to zero and large values saturate.
inline int timeout_ms(const Config& config) {
    if (!(config.timeout > 0.0f)) {
        return -1;
    }
    const double ms = static_cast<double>(config.timeout) * 1000.0;
    if (ms >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    auto ret = static_cast<int>(std::lround(ms));
    return ret > 0 ? ret : 1;
}

#endif
