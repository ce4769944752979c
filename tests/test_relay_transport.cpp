#include "errors.hpp"
#include "relay/relay_transport.hpp"
#include <gtest/gtest.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

using namespace jukebox;

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ws = beast::websocket;
using tcp = asio::ip::tcp;

namespace {

// Accepts one WebSocket client on loopback and keeps a read pending so
// pings are answered
class LoopbackServer {
public:
    explicit LoopbackServer(asio::io_context& io)
        : acceptor_(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , ws_(io)
    {
        acceptor_.async_accept(beast::get_lowest_layer(ws_).socket(), [this](beast::error_code ec) {
            if (ec) return;
            ws_.async_accept([this](beast::error_code ec) {
                if (ec) return;
                read();
            });
        });
    }

    std::string url() const {
        return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/ws";
    }

    std::vector<std::string> received;

private:
    tcp::acceptor acceptor_;
    ws::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;

    void read() {
        ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
            if (ec) return;
            received.push_back(beast::buffers_to_string(buffer_.data()));
            buffer_.consume(buffer_.size());
            read();
        });
    }
};

bool run_until(asio::io_context& io, const std::function<bool()>& pred) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!pred() && std::chrono::steady_clock::now() < deadline) {
        io.run_one_for(std::chrono::milliseconds(50));
    }
    return pred();
}

} // namespace

TEST(BeastRelayTransportTest, PingsIssuedTogetherAreAnsweredInOrder) {
    asio::io_context io;
    LoopbackServer server(io);
    BeastRelayTransport transport(io);

    bool opened = false;
    transport.open(server.url(), RelayTransport::Handlers{}, [&](std::exception_ptr error) {
        opened = !error;
    });
    ASSERT_TRUE(run_until(io, [&] { return opened; }));

    // Keepalive and health check pings land in the same turn
    std::vector<int> answered;
    std::vector<std::exception_ptr> errors;
    for (int i = 1; i <= 3; ++i) {
        transport.ping([&answered, &errors, i](std::exception_ptr error) {
            if (error) {
                errors.push_back(error);
            } else {
                answered.push_back(i);
            }
        });
    }

    ASSERT_TRUE(run_until(io, [&] { return answered.size() + errors.size() == 3; }));
    EXPECT_TRUE(errors.empty());
    EXPECT_EQ(answered, (std::vector<int>{1, 2, 3}));

    transport.send("{\"event\":\"client/heartbeat\"}");
    ASSERT_TRUE(run_until(io, [&] { return !server.received.empty(); }));
    EXPECT_EQ(server.received[0], "{\"event\":\"client/heartbeat\"}");

    transport.close();
    EXPECT_FALSE(transport.is_open());
}

TEST(BeastRelayTransportTest, BadUrlFailsAfterOpenReturns) {
    asio::io_context io;
    BeastRelayTransport transport(io);

    bool done = false;
    std::exception_ptr open_error;
    transport.open("wss://relay.example.com/ws", RelayTransport::Handlers{}, [&](std::exception_ptr error) {
        done = true;
        open_error = error;
    });
    EXPECT_FALSE(done);

    ASSERT_TRUE(run_until(io, [&] { return done; }));
    ASSERT_TRUE(open_error);
    EXPECT_THROW(std::rethrow_exception(open_error), RelayProtocolError);
}

TEST(BeastRelayTransportTest, PingWithoutConnectionFails) {
    asio::io_context io;
    BeastRelayTransport transport(io);

    std::exception_ptr ping_error;
    transport.ping([&](std::exception_ptr error) { ping_error = error; });
    ASSERT_TRUE(ping_error);
    EXPECT_THROW(std::rethrow_exception(ping_error), ConnectionLostError);
}
