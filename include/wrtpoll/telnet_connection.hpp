#ifndef WRTPOLL_TELNET_CONNECTION_HPP
#define WRTPOLL_TELNET_CONNECTION_HPP

#include <wrtpoll/config.hpp>
#include <wrtpoll/connection.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Interactive shell over telnet. Logs in once, remembers the shell prompt and
// reads each command's output up to the next prompt. Failures are not retried;
// the socket is closed and the next command logs in again.
class TelnetConnection : public Connection {
  public:
    explicit TelnetConnection(const Config& config);
    TelnetConnection(const TelnetConnection&) = delete;
    TelnetConnection(TelnetConnection&&) = delete;
    ~TelnetConnection() override;
    TelnetConnection& operator=(const TelnetConnection&) = delete;
    TelnetConnection& operator=(TelnetConnection&&) = delete;

    std::vector<std::string> run(const std::string& command) override;

    bool connected() const;
    const std::string& prompt() const;

  private:
    enum class State {
        data,
        iac,
        option,
        subneg,
        subneg_iac,
    };

    void connect();
    void disconnect();
    void open_socket();
    void send(std::string_view data);
    std::string read_until(std::string_view marker);
    void fill();
    void decode(const uint8_t* bytes, size_t len);

    std::string host_;
    uint16_t port_{23};
    std::string username_;
    std::string password_;
    int timeout_ms_{-1};
    int fd_{-1};
    bool connected_{false};
    std::string prompt_;
    std::string buf_;
    State state_{State::data};
    uint8_t verb_{0};
};

#endif
