#include <wrtpoll/connection.hpp>
#include <wrtpoll/ssh_connection.hpp>
#include <wrtpoll/telnet_connection.hpp>
#include <wrtpoll/utils.hpp>

#include <spdlog/spdlog.h>

SessionConnection::SessionConnection(int max_retries)
    : max_retries_(max_retries < 0 ? 0 : max_retries) {}

bool SessionConnection::connected() const {
    return connected_;
}

int SessionConnection::max_retries() const {
    return max_retries_;
}

bool SessionConnection::reconnect() {
    connected_ = false;
    close_session();
    try {
        open_session();
    } catch (const TransportError& e) {
        spdlog::error("failed to reopen session: {}", e.what());
        return false;
    }
    connected_ = true;
    return true;
}

std::vector<std::string> SessionConnection::run(const std::string& command) {
    if (!connected_) {
        open_session();
        connected_ = true;
    }

    for (int attempt = 0;; ++attempt) {
        try {
            auto lines = split_lines(exec(command));
            spdlog::trace("'{}' returned {} lines", command, lines.size());
            return lines;
        } catch (const ChannelError& e) {
            if (attempt >= max_retries_) {
                spdlog::error("no connection to host: {}", e.what());
                connected_ = false;
                close_session();
                return {};
            }
            spdlog::warn("channel failure running '{}': {}, reconnecting", command, e.what());
            if (!reconnect()) {
                return {};
            }
        }
    }
}

std::unique_ptr<Connection> make_connection(const Config& config) {
    switch (config.transport) {
        case TransportKind::telnet:
            return std::make_unique<TelnetConnection>(config);
        case TransportKind::ssh:
        default:
            return std::make_unique<SshConnection>(config);
    }
}
