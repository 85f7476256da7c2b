#ifndef WRTPOLL_SSH_CONNECTION_HPP
#define WRTPOLL_SSH_CONNECTION_HPP

#include <wrtpoll/config.hpp>
#include <wrtpoll/connection.hpp>

#include <cstdint>
#include <string>

extern "C" {
struct ssh_session_struct;
}

class SshConnection : public SessionConnection {
  public:
    explicit SshConnection(const Config& config);
    SshConnection(const SshConnection&) = delete;
    SshConnection(SshConnection&&) = delete;
    ~SshConnection() override;
    SshConnection& operator=(const SshConnection&) = delete;
    SshConnection& operator=(SshConnection&&) = delete;

  protected:
    void open_session() override;
    void close_session() override;
    std::string exec(const std::string& command) override;

  private:
    void verify_host(ssh_session_struct* session);
    void authenticate(ssh_session_struct* session);

    std::string host_;
    uint16_t port_{22};
    std::string username_;
    std::string password_;
    std::string key_file_;
    int timeout_ms_{-1};
    ssh_session_struct* session_{nullptr};
};

#endif
