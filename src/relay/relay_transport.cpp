#include "relay/relay_transport.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace ws = beast::websocket;
using tcp = asio::ip::tcp;

namespace jukebox {

namespace {

struct ParsedUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

ParsedUrl parse_ws_url(const std::string& url) {
    const std::string prefix = "ws://";
    if (url.rfind("wss://", 0) == 0) {
        throw RelayProtocolError("TLS relay endpoints are not supported: " + url);
    }
    if (url.rfind(prefix, 0) != 0) {
        throw RelayProtocolError("Not a ws:// URL: " + url);
    }

    ParsedUrl result;
    std::string working = url.substr(prefix.size());

    auto slash_pos = working.find('/');
    std::string host_port = slash_pos == std::string::npos ? working : working.substr(0, slash_pos);
    if (slash_pos != std::string::npos) {
        result.target = working.substr(slash_pos);
    }

    auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        result.host = host_port.substr(0, colon_pos);
        result.port = host_port.substr(colon_pos + 1);
    } else {
        result.host = host_port;
    }

    if (result.host.empty()) {
        throw RelayProtocolError("Relay URL has no host: " + url);
    }
    return result;
}

} // namespace

// Lives as long as an async operation holds it; the owning transport only
// keeps a handle and detaches on close.
class BeastRelayTransport::Session : public std::enable_shared_from_this<BeastRelayTransport::Session> {
public:
    explicit Session(asio::io_context& io)
        : resolver_(io)
        , ws_(io)
    {}

    void start(const std::string& url, Handlers handlers, Completion done) {
        handlers_ = std::move(handlers);
        open_done_ = std::move(done);

        try {
            url_ = parse_ws_url(url);
        } catch (const RelayProtocolError&) {
            // Completions never run inside open()
            asio::post(resolver_.get_executor(), [self = shared_from_this(), error = std::current_exception()]() {
                self->fail_open(error);
            });
            return;
        }

        resolver_.async_resolve(
            url_.host, url_.port,
            beast::bind_front_handler(&Session::on_resolve, shared_from_this())
        );
    }

    bool is_open() const { return open_ && !closed_; }

    void send(const std::string& text) {
        if (!is_open()) {
            log_warning("Relay transport: dropping message, socket not open");
            return;
        }

        outbox_.push_back(std::make_shared<std::string>(text));
        if (!write_in_progress_) {
            write_in_progress_ = true;
            do_write();
        }
    }

    void ping(Completion done) {
        if (!is_open()) {
            done(std::make_exception_ptr(ConnectionLostError("Relay socket is not open")));
            return;
        }

        queued_pings_.push_back(std::move(done));
        if (!ping_in_flight_) {
            do_ping();
        }
    }

    void close() {
        if (closed_) return;
        closed_ = true;

        // Detach: nothing is reported after close()
        handlers_ = Handlers{};
        open_done_ = nullptr;
        queued_pings_.clear();
        pending_pings_.clear();
        outbox_.clear();

        resolver_.cancel();
        if (open_) {
            ws_.async_close(ws::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    log_debug("Relay transport: close handshake failed: " + ec.message());
                }
            });
        } else {
            beast::error_code ec;
            beast::get_lowest_layer(ws_).socket().close(ec);
        }
    }

private:
    tcp::resolver resolver_;
    ws::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    ParsedUrl url_;

    Handlers handlers_;
    Completion open_done_;
    // Beast allows one ping write at a time; the rest wait here
    std::deque<Completion> queued_pings_;
    // Written, waiting for their pong in order
    std::deque<Completion> pending_pings_;
    bool ping_in_flight_ = false;
    std::deque<std::shared_ptr<std::string>> outbox_;
    bool write_in_progress_ = false;
    bool open_ = false;
    bool closed_ = false;

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (closed_) return;
        if (ec) {
            on_failure(ec, "resolve");
            return;
        }

        beast::get_lowest_layer(ws_).async_connect(
            results,
            beast::bind_front_handler(&Session::on_connect, shared_from_this())
        );
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
        if (closed_) return;
        if (ec) {
            on_failure(ec, "connect");
            return;
        }

        // The websocket stream has its own timeouts
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(ws::stream_base::timeout::suggested(beast::role_type::client));
        ws_.set_option(ws::stream_base::decorator([](ws::request_type& req) {
            req.set(beast::http::field::user_agent, "jukebox-relay-client");
        }));

        ws_.control_callback([this](ws::frame_type kind, beast::string_view) {
            if (kind == ws::frame_type::pong && !pending_pings_.empty()) {
                auto done = std::move(pending_pings_.front());
                pending_pings_.pop_front();
                done(nullptr);
            }
        });

        std::string host = url_.host + ":" + std::to_string(endpoint.port());
        ws_.async_handshake(
            host, url_.target,
            beast::bind_front_handler(&Session::on_handshake, shared_from_this())
        );
    }

    void on_handshake(beast::error_code ec) {
        if (closed_) return;
        if (ec) {
            on_failure(ec, "handshake");
            return;
        }

        open_ = true;
        ws_.text(true);
        if (open_done_) {
            auto done = std::move(open_done_);
            open_done_ = nullptr;
            done(nullptr);
        }
        do_read();
    }

    void do_read() {
        ws_.async_read(
            buffer_,
            beast::bind_front_handler(&Session::on_read, shared_from_this())
        );
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (closed_) return;
        if (ec) {
            on_failure(ec, "read");
            return;
        }

        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());

        // The handler may close us and clear handlers_
        auto on_message = handlers_.on_message;
        if (on_message) {
            on_message(text);
        }

        if (!closed_) {
            do_read();
        }
    }

    void do_write() {
        if (outbox_.empty()) {
            write_in_progress_ = false;
            return;
        }

        auto msg = outbox_.front();
        ws_.async_write(
            asio::buffer(*msg),
            [self = shared_from_this(), msg](beast::error_code ec, std::size_t) {
                self->on_write(ec);
            }
        );
    }

    void on_write(beast::error_code ec) {
        if (closed_) {
            write_in_progress_ = false;
            return;
        }
        if (ec) {
            write_in_progress_ = false;
            on_failure(ec, "write");
            return;
        }

        outbox_.pop_front();
        do_write();
    }

    void do_ping() {
        if (queued_pings_.empty()) return;

        ping_in_flight_ = true;
        pending_pings_.push_back(std::move(queued_pings_.front()));
        queued_pings_.pop_front();
        ws_.async_ping({}, [self = shared_from_this()](beast::error_code ec) {
            self->ping_in_flight_ = false;
            if (self->closed_) return;
            if (ec) {
                self->on_failure(ec, "ping");
                return;
            }
            self->do_ping();
        });
    }

    void fail_open(std::exception_ptr error) {
        closed_ = true;
        handlers_ = Handlers{};
        if (open_done_) {
            auto done = std::move(open_done_);
            open_done_ = nullptr;
            done(error);
        }
    }

    void on_failure(beast::error_code ec, const char* what) {
        if (closed_) return;

        std::string reason = std::string(what) + ": " + ec.message();
        if (!open_) {
            fail_open(std::make_exception_ptr(ConnectionLostError("Relay " + reason)));
            return;
        }

        closed_ = true;
        open_ = false;

        auto pings = std::move(pending_pings_);
        pending_pings_.clear();
        for (auto& queued : queued_pings_) {
            pings.push_back(std::move(queued));
        }
        queued_pings_.clear();
        outbox_.clear();
        auto handlers = std::move(handlers_);
        handlers_ = Handlers{};

        for (auto& done : pings) {
            done(std::make_exception_ptr(ConnectionLostError("Relay " + reason)));
        }
        if (handlers.on_close) {
            handlers.on_close(ec == ws::error::closed ? "closed by server" : reason);
        }

        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }
};

BeastRelayTransport::BeastRelayTransport(asio::io_context& io) : io_(io) {}

BeastRelayTransport::~BeastRelayTransport() {
    close();
}

void BeastRelayTransport::open(const std::string& url, Handlers handlers, Completion done) {
    if (session_) {
        session_->close();
    }
    session_ = std::make_shared<Session>(io_);
    session_->start(url, std::move(handlers), std::move(done));
}

bool BeastRelayTransport::is_open() const {
    return session_ && session_->is_open();
}

void BeastRelayTransport::send(const std::string& text) {
    if (session_) {
        session_->send(text);
    }
}

void BeastRelayTransport::ping(Completion done) {
    if (!session_) {
        done(std::make_exception_ptr(ConnectionLostError("Relay socket is not open")));
        return;
    }
    session_->ping(std::move(done));
}

void BeastRelayTransport::close() {
    if (session_) {
        session_->close();
        session_.reset();
    }
}

} // namespace jukebox
