#include <wrtpoll/telnet_connection.hpp>
#include <wrtpoll/utils.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

static constexpr uint8_t telnet_se = 240;
static constexpr uint8_t telnet_sb = 250;
static constexpr uint8_t telnet_will = 251;
static constexpr uint8_t telnet_wont = 252;
static constexpr uint8_t telnet_do = 253;
static constexpr uint8_t telnet_dont = 254;
static constexpr uint8_t telnet_iac = 255;

TelnetConnection::TelnetConnection(const Config& config)
    : host_(config.host),
      port_(default_port(config)),
      username_(config.username),
      password_(config.password),
      timeout_ms_(timeout_ms(config)) {}

TelnetConnection::~TelnetConnection() {
    disconnect();
}

bool TelnetConnection::connected() const {
    return connected_;
}

const std::string& TelnetConnection::prompt() const {
    return prompt_;
}

std::vector<std::string> TelnetConnection::run(const std::string& command) {
    if (!connected_) {
        connect();
    }
    send(command + '\n');
    auto data = read_until(prompt_);

    // The first line is the echoed command and the last one is the prompt.
    std::vector<std::string> lines;
    size_t start = data.find('\n');
    while (start != std::string::npos) {
        auto end = data.find('\n', start + 1);
        if (end == std::string::npos) {
            break;
        }
        auto line = trim_back(std::string_view(data).substr(start + 1, end - start - 1));
        lines.emplace_back(line);
        start = end;
    }
    spdlog::trace("'{}' returned {} lines", command, lines.size());
    return lines;
}

void TelnetConnection::open_socket() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* addrs = nullptr;
    auto port = std::to_string(port_);
    auto rc = getaddrinfo(host_.c_str(), port.c_str(), &hints, &addrs);
    if (rc != 0) {
        throw TransportError(fmt::format("failed to resolve {}: {}", host_, gai_strerror(rc)));
    }
    auto guard = finally([addrs] {
        freeaddrinfo(addrs);
    });

    int err = 0;
    for (auto addr = addrs; addr != nullptr; addr = addr->ai_next) {
        auto fd = socket(addr->ai_family, addr->ai_socktype, addr->ai_protocol);
        if (fd < 0) {
            err = errno;
            continue;
        }
        if (::connect(fd, addr->ai_addr, addr->ai_addrlen) == 0) {
            fd_ = fd;
            return;
        }
        err = errno;
        close(fd);
    }
    throw TransportError(fmt::format("failed to connect to {}:{}: {}", host_, port_, strerror(err)));
}

void TelnetConnection::connect() {
    spdlog::debug("connecting to {}:{} over telnet", host_, port_);
    open_socket();
    read_until("login: ");
    send(username_ + '\n');
    read_until("Password: ");
    send(password_ + '\n');
    auto banner = read_until("#");
    auto pos = banner.rfind('\n');
    prompt_ = pos == std::string::npos ? banner : banner.substr(pos + 1);
    connected_ = true;
    spdlog::info("telnet session to {}:{} established, prompt '{}'", host_, port_, prompt_);
}

void TelnetConnection::disconnect() {
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
        spdlog::debug("telnet session to {} closed", host_);
    }
    connected_ = false;
    buf_.clear();
    state_ = State::data;
}

void TelnetConnection::send(std::string_view data) {
    while (!data.empty()) {
        auto n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto err = errno;
            disconnect();
            throw TransportError(fmt::format("failed to write to {}: {}", host_, strerror(err)));
        }
        data.remove_prefix(static_cast<size_t>(n));
    }
}

std::string TelnetConnection::read_until(std::string_view marker) {
    while (true) {
        auto pos = buf_.find(marker);
        if (pos != std::string::npos) {
            auto ret = buf_.substr(0, pos + marker.size());
            buf_.erase(0, pos + marker.size());
            return ret;
        }
        fill();
    }
}

void TelnetConnection::fill() {
    pollfd event{fd_, POLLIN, 0};
    int rc;
    do {
        rc = poll(&event, 1, timeout_ms_);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        auto err = errno;
        disconnect();
        throw TransportError(fmt::format("failed to poll {}: {}", host_, strerror(err)));
    }
    if (rc == 0) {
        disconnect();
        throw TransportError(fmt::format("timed out waiting for {}", host_));
    }

    uint8_t chunk[4096];
    ssize_t n;
    do {
        n = recv(fd_, chunk, sizeof(chunk), 0);
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        auto err = errno;
        disconnect();
        throw TransportError(fmt::format("failed to read from {}: {}", host_, strerror(err)));
    }
    if (n == 0) {
        disconnect();
        throw TransportError(fmt::format("{} closed the connection", host_));
    }
    decode(chunk, static_cast<size_t>(n));
}

// Strips telnet commands from the stream and refuses every option offered.
void TelnetConnection::decode(const uint8_t* bytes, size_t len) {
    std::string replies;
    for (size_t i = 0; i < len; ++i) {
        auto b = bytes[i];
        switch (state_) {
            case State::data:
                if (b == telnet_iac) {
                    state_ = State::iac;
                } else if (b != 0) {
                    buf_.push_back(static_cast<char>(b));
                }
                break;
            case State::iac:
                if (b == telnet_iac) {
                    buf_.push_back(static_cast<char>(b));
                    state_ = State::data;
                } else if (b >= telnet_will && b <= telnet_dont) {
                    verb_ = b;
                    state_ = State::option;
                } else if (b == telnet_sb) {
                    state_ = State::subneg;
                } else {
                    state_ = State::data;
                }
                break;
            case State::option:
                if (verb_ == telnet_do) {
                    replies += {static_cast<char>(telnet_iac), static_cast<char>(telnet_wont), static_cast<char>(b)};
                } else if (verb_ == telnet_will) {
                    replies += {static_cast<char>(telnet_iac), static_cast<char>(telnet_dont), static_cast<char>(b)};
                }
                state_ = State::data;
                break;
            case State::subneg:
                if (b == telnet_iac) {
                    state_ = State::subneg_iac;
                }
                break;
            case State::subneg_iac:
                state_ = b == telnet_se ? State::data : State::subneg;
                break;
        }
    }
    if (!replies.empty()) {
        spdlog::trace("refusing {} telnet options", replies.size() / 3);
        send(replies);
    }
}
