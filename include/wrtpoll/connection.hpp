#ifndef WRTPOLL_CONNECTION_HPP
#define WRTPOLL_CONNECTION_HPP

#include <wrtpoll/config.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class TransportError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// A single command could not be executed on an otherwise established session.
class ChannelError : public TransportError {
  public:
    using TransportError::TransportError;
};

class Connection {
  public:
    virtual ~Connection() = default;

    virtual std::vector<std::string> run(const std::string& command) = 0;
};

// Connection over a session that carries one channel per command. The session
// is opened on first use. A ChannelError closes the session, reopens it and
// retries the command, at most max_retries times; once retries are exhausted
// the command yields no lines.
class SessionConnection : public Connection {
  public:
    explicit SessionConnection(int max_retries = 1);

    std::vector<std::string> run(const std::string& command) override;

    bool connected() const;
    int max_retries() const;

  protected:
    virtual void open_session() = 0;
    virtual void close_session() = 0;
    virtual std::string exec(const std::string& command) = 0;

  private:
    bool reconnect();

    int max_retries_{1};
    bool connected_{false};
};

std::unique_ptr<Connection> make_connection(const Config& config);

#endif
