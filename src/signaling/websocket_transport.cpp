#include "peerdrop/signaling/websocket_transport.hpp"
#include "peerdrop/core/format.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>

namespace peerdrop::signaling {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(30);
constexpr auto kWriteTimeout = std::chrono::seconds(30);
constexpr auto kCloseGrace = std::chrono::seconds(2);

struct PendingWrite {
    std::string text;
    std::promise<beast::error_code> done;
};

Result<Unit, PeerDropFailure> SignalingError(std::string_view step, const beast::error_code& ec) {
    return Result<Unit, PeerDropFailure>::Err(
        PeerDropFailure::Signaling(compat::format("{}: {}", step, ec.message())));
}

} // namespace

struct WebSocketTransport::Impl {
    net::io_context io;
    ssl::context ssl_ctx{ssl::context::tls_client};
    std::unique_ptr<websocket::stream<beast::ssl_stream<beast::tcp_stream>>> ws;
    beast::flat_buffer buffer;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::thread io_thread;
    std::deque<std::shared_ptr<PendingWrite>> writes;
    TextHandler on_text;
    ClosedHandler on_closed;
    std::atomic<bool> open{false};
    std::once_flag closed_once;
    std::mutex close_mutex;

    void ReadLoop() {
        ws->async_read(buffer, [this](const beast::error_code& ec, std::size_t) {
            if (ec) {
                if (ec == websocket::error::closed || ec == net::error::operation_aborted) {
                    spdlog::debug("Signaling connection closed");
                } else {
                    spdlog::warn("Signaling connection lost: {}", ec.message());
                }
                FinishReading();
                return;
            }
            std::string text = beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            spdlog::debug("Received: {}", text);
            if (on_text) {
                on_text(std::move(text));
            }
            ReadLoop();
        });
    }

    void WriteNext() {
        ws->async_write(net::buffer(writes.front()->text),
            [this](const beast::error_code& ec, std::size_t) {
                auto finished = writes.front();
                writes.pop_front();
                finished->done.set_value(ec);
                if (ec) {
                    for (auto& pending : writes) {
                        pending->done.set_value(ec);
                    }
                    writes.clear();
                    return;
                }
                if (!writes.empty()) {
                    WriteNext();
                }
            });
    }

    void FinishReading() {
        open = false;
        std::call_once(closed_once, [this] {
            if (on_closed) {
                on_closed();
            }
        });
    }
};

WebSocketTransport::WebSocketTransport()
    : impl_(std::make_unique<Impl>()) {}

WebSocketTransport::~WebSocketTransport() {
    Close();
}

Result<Unit, PeerDropFailure> WebSocketTransport::Open(
    const interfaces::SignalingEndpoint& endpoint,
    TextHandler on_text,
    ClosedHandler on_closed) {
    auto& impl = *impl_;
    if (impl.io_thread.joinable()) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Signaling("Signaling transport already open"));
    }
    impl.on_text = std::move(on_text);
    impl.on_closed = std::move(on_closed);

    beast::error_code ec;
    impl.ssl_ctx.set_default_verify_paths(ec);
    if (ec) {
        return SignalingError("Cannot load trusted certificates", ec);
    }
    impl.ssl_ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(impl.io);
    const auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), ec);
    if (ec) {
        return SignalingError(compat::format("Cannot resolve {}", endpoint.host), ec);
    }

    impl.ws = std::make_unique<websocket::stream<beast::ssl_stream<beast::tcp_stream>>>(
        impl.io, impl.ssl_ctx);
    auto& tls = impl.ws->next_layer();
    auto& socket = beast::get_lowest_layer(*impl.ws);

    // Setup runs on the io_context before the reader thread starts, so the
    // stream and websocket timeouts bound each step.
    const auto run_step = [&impl] {
        impl.io.run();
        impl.io.restart();
    };

    socket.expires_after(kConnectTimeout);
    socket.async_connect(results, [&ec](const beast::error_code& step, const tcp::endpoint&) { ec = step; });
    run_step();
    if (ec) {
        return SignalingError(compat::format("Cannot connect to {}:{}", endpoint.host, endpoint.port), ec);
    }

    if (!SSL_set_tlsext_host_name(tls.native_handle(), endpoint.host.c_str())) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Signaling("Cannot set TLS server name"));
    }
    tls.set_verify_callback(ssl::host_name_verification(endpoint.host));
    socket.expires_after(kConnectTimeout);
    tls.async_handshake(ssl::stream_base::client, [&ec](const beast::error_code& step) { ec = step; });
    run_step();
    if (ec) {
        return SignalingError("TLS handshake failed", ec);
    }
    socket.expires_never();

    impl.ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    impl.ws->set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
        request.set(http::field::user_agent, "peerdrop");
    }));
    const std::string host_header = endpoint.port == 443
        ? endpoint.host
        : compat::format("{}:{}", endpoint.host, endpoint.port);
    impl.ws->async_handshake(host_header, endpoint.target, [&ec](const beast::error_code& step) { ec = step; });
    run_step();
    if (ec) {
        return SignalingError("WebSocket handshake failed", ec);
    }
    impl.ws->text(true);

    impl.open = true;
    impl.work.emplace(net::make_work_guard(impl.io));
    impl.ReadLoop();
    impl.io_thread = std::thread([&impl] { impl.io.run(); });
    spdlog::debug("Signaling connection established to {}", endpoint.host);
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

Result<Unit, PeerDropFailure> WebSocketTransport::SendText(const std::string& text) {
    auto& impl = *impl_;
    if (!impl.open) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Signaling("Signaling connection is closed"));
    }

    auto pending = std::make_shared<PendingWrite>();
    pending->text = text;
    auto completion = pending->done.get_future();
    net::post(impl.io, [&impl, pending] {
        if (!impl.open) {
            pending->done.set_value(net::error::not_connected);
            return;
        }
        impl.writes.push_back(pending);
        if (impl.writes.size() == 1) {
            impl.WriteNext();
        }
    });

    if (completion.wait_for(kWriteTimeout) != std::future_status::ready) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Signaling("Timed out writing to the signaling server"));
    }
    try {
        const beast::error_code ec = completion.get();
        if (ec) {
            return SignalingError("Signaling write failed", ec);
        }
    } catch (const std::future_error&) {
        return Result<Unit, PeerDropFailure>::Err(
            PeerDropFailure::Signaling("Signaling connection shut down during write"));
    }
    spdlog::debug("Sending: {}", text);
    return Result<Unit, PeerDropFailure>::Ok(unit);
}

void WebSocketTransport::Close() {
    auto& impl = *impl_;
    std::lock_guard lock(impl.close_mutex);
    if (!impl.io_thread.joinable()) {
        return;
    }

    auto closed = std::make_shared<std::promise<void>>();
    auto closed_future = closed->get_future();
    net::post(impl.io, [&impl, closed] {
        if (!impl.open) {
            closed->set_value();
            return;
        }
        impl.ws->async_close(websocket::close_code::normal, [closed](const beast::error_code&) {
            closed->set_value();
        });
    });
    impl.work.reset();
    if (closed_future.wait_for(kCloseGrace) != std::future_status::ready) {
        spdlog::debug("Signaling close handshake did not complete in time");
    }
    impl.io.stop();
    impl.io_thread.join();
    for (auto& pending : impl.writes) {
        pending->done.set_value(net::error::operation_aborted);
    }
    impl.writes.clear();
    impl.FinishReading();
}

} // namespace peerdrop::signaling
