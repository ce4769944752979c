#pragma once

#include <boost/asio/io_context.hpp>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace jukebox {

// One text-frame WebSocket connection to a relay. Every callback runs on the
// event loop; none fires after close() returns.
class RelayTransport {
public:
    using Completion = std::function<void(std::exception_ptr)>;

    struct Handlers {
        std::function<void(const std::string&)> on_message;
        // The connection dropped after it was open
        std::function<void(const std::string& reason)> on_close;
    };

    virtual ~RelayTransport() = default;

    // done fires once: null on handshake success, otherwise the failure
    virtual void open(const std::string& url, Handlers handlers, Completion done) = 0;
    virtual bool is_open() const = 0;
    virtual void send(const std::string& text) = 0;
    // done fires when the matching pong arrives, or with an error
    virtual void ping(Completion done) = 0;
    virtual void close() = 0;
};

using TransportFactory = std::function<std::unique_ptr<RelayTransport>()>;

// Boost.Beast client (plain ws:// only)
class BeastRelayTransport : public RelayTransport {
public:
    explicit BeastRelayTransport(boost::asio::io_context& io);
    ~BeastRelayTransport() override;

    void open(const std::string& url, Handlers handlers, Completion done) override;
    bool is_open() const override;
    void send(const std::string& text) override;
    void ping(Completion done) override;
    void close() override;

private:
    class Session;

    boost::asio::io_context& io_;
    std::shared_ptr<Session> session_;
};

} // namespace jukebox
