#include <wrtpoll/ssh_connection.hpp>
#include <wrtpoll/utils.hpp>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <libssh/libssh.h>

SshConnection::SshConnection(const Config& config)
    : SessionConnection(config.max_retries),
      host_(config.host),
      port_(default_port(config)),
      username_(config.username),
      password_(config.password),
      key_file_(config.key_file),
      timeout_ms_(timeout_ms(config)) {}

SshConnection::~SshConnection() {
    close_session();
}

void SshConnection::open_session() {
    ssh_session session = ssh_new();
    if (session == nullptr) {
        throw TransportError("failed to allocate ssh session");
    }
    auto guard = finally([&session] {
        if (session != nullptr) {
            ssh_disconnect(session);
            ssh_free(session);
        }
    });

    unsigned int port = port_;
    ssh_options_set(session, SSH_OPTIONS_HOST, host_.c_str());
    ssh_options_set(session, SSH_OPTIONS_PORT, &port);
    if (!username_.empty()) {
        ssh_options_set(session, SSH_OPTIONS_USER, username_.c_str());
    }
    if (timeout_ms_ > 0) {
        long seconds = timeout_ms_ / 1000;
        long usec = (timeout_ms_ % 1000) * 1000L;
        ssh_options_set(session, SSH_OPTIONS_TIMEOUT, &seconds);
        ssh_options_set(session, SSH_OPTIONS_TIMEOUT_USEC, &usec);
    }

    spdlog::debug("connecting to {}:{} over ssh", host_, port_);
    if (ssh_connect(session) != SSH_OK) {
        throw TransportError(fmt::format("failed to connect to {}:{}: {}", host_, port_, ssh_get_error(session)));
    }
    verify_host(session);
    authenticate(session);

    spdlog::info("ssh session to {}:{} established", host_, port_);
    std::swap(session_, session);
}

void SshConnection::verify_host(ssh_session session) {
    switch (ssh_session_is_known_server(session)) {
        case SSH_KNOWN_HOSTS_OK:
            break;
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
            spdlog::warn("host key for {} is not in known_hosts, accepting it", host_);
            break;
        case SSH_KNOWN_HOSTS_CHANGED:
            throw TransportError(fmt::format("host key for {} has changed", host_));
        case SSH_KNOWN_HOSTS_OTHER:
            throw TransportError(fmt::format("host key type for {} has changed", host_));
        case SSH_KNOWN_HOSTS_ERROR:
        default:
            throw TransportError(fmt::format("failed to verify host key for {}: {}", host_, ssh_get_error(session)));
    }
}

void SshConnection::authenticate(ssh_session session) {
    int rc = SSH_AUTH_DENIED;
    if (!key_file_.empty()) {
        ssh_key key = nullptr;
        if (ssh_pki_import_privkey_file(key_file_.c_str(), nullptr, nullptr, nullptr, &key) != SSH_OK) {
            throw TransportError(fmt::format("failed to load private key {}", key_file_));
        }
        rc = ssh_userauth_publickey(session, nullptr, key);
        ssh_key_free(key);
        if (rc != SSH_AUTH_SUCCESS) {
            spdlog::debug("public key authentication to {} was rejected", host_);
        }
    }
    if (rc != SSH_AUTH_SUCCESS && !password_.empty()) {
        rc = ssh_userauth_password(session, nullptr, password_.c_str());
    }
    if (rc != SSH_AUTH_SUCCESS) {
        throw TransportError(fmt::format("authentication to {} failed: {}", host_, ssh_get_error(session)));
    }
}

void SshConnection::close_session() {
    if (session_ != nullptr) {
        ssh_disconnect(session_);
        ssh_free(session_);
        session_ = nullptr;
        spdlog::debug("ssh session to {} closed", host_);
    }
}

std::string SshConnection::exec(const std::string& command) {
    if (session_ == nullptr) {
        throw ChannelError("session is not open");
    }
    ssh_channel channel = ssh_channel_new(session_);
    if (channel == nullptr) {
        throw ChannelError(fmt::format("failed to create channel: {}", ssh_get_error(session_)));
    }
    auto guard = finally([channel] {
        ssh_channel_free(channel);
    });

    if (ssh_channel_open_session(channel) != SSH_OK) {
        throw ChannelError(fmt::format("failed to open channel: {}", ssh_get_error(session_)));
    }
    if (ssh_channel_request_exec(channel, command.c_str()) != SSH_OK) {
        throw ChannelError(fmt::format("failed to execute '{}': {}", command, ssh_get_error(session_)));
    }

    std::string output;
    char buf[4096];
    while (true) {
        auto n = ssh_channel_read_timeout(channel, buf, sizeof(buf), 0, timeout_ms_);
        if (n == SSH_ERROR) {
            throw ChannelError(fmt::format("failed to read output of '{}': {}", command, ssh_get_error(session_)));
        }
        if (n > 0) {
            output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (ssh_channel_is_eof(channel) != 0 || ssh_channel_is_closed(channel) != 0) {
            break;
        }
        throw ChannelError(fmt::format("timed out reading output of '{}'", command));
    }

    ssh_channel_send_eof(channel);
    ssh_channel_close(channel);
    return output;
}
