#include "WebSocketServer.hpp"
#include "DeviceProtocol.hpp"
#include "core/DeviceStore.hpp"
#include <iostream>
#include <functional>
#include <set>
#include <vector>
// Boost.Beast / Asio for WebSocket
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace asio = boost::asio;           // from <boost/asio.hpp>
using tcp = asio::ip::tcp;              // from <boost/asio/ip/tcp.hpp>

namespace airscope {

using WsStream = websocket::stream<tcp::socket>;

struct WebSocketServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    mutable std::mutex sessions_m;
    std::set<std::shared_ptr<WsStream>> sessions;

    explicit Impl(int port): ioc(), acceptor(ioc) {
        tcp::endpoint ep(tcp::v4(), (unsigned short)port);
        acceptor.open(ep.protocol());
        acceptor.set_option(asio::socket_base::reuse_address(true));
        acceptor.bind(ep);
        acceptor.listen(asio::socket_base::max_listen_connections);
    }

    void add_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        sessions.insert(s);
        std::cerr << "WebSocketServer: client connected (count=" << sessions.size() << ")" << std::endl;
    }
    void remove_session(std::shared_ptr<WsStream> s) {
        std::lock_guard<std::mutex> lk(sessions_m);
        if (sessions.erase(s)) {
            std::cerr << "WebSocketServer: client disconnected (count=" << sessions.size() << ")" << std::endl;
        }
    }
    std::vector<std::shared_ptr<WsStream>> list_sessions() const {
        std::lock_guard<std::mutex> lk(sessions_m);
        return {sessions.begin(), sessions.end()};
    }
};

// Only called on the io_context thread, so writes to one stream never overlap.
static bool send_text(const std::shared_ptr<WsStream>& s, const std::string& payload) {
    boost::system::error_code ec;
    s->text(true);
    s->write(asio::buffer(payload), ec);
    if (ec) {
        std::cerr << "WebSocketServer: write failed: " << ec.message() << std::endl;
        return false;
    }
    return true;
}

WebSocketServer::WebSocketServer(int p, const DeviceStore& s, std::chrono::milliseconds iv)
: port(p), interval(iv), running(false), store(s), protocol(std::make_unique<DeviceProtocol>(s)) {}

WebSocketServer::~WebSocketServer() {
    stop();
}

size_t WebSocketServer::session_count() const {
    return impl ? impl->list_sessions().size() : 0;
}

void WebSocketServer::start() {
    if (running) return;
    impl = std::make_shared<Impl>(port); // throws on bind failure
    port = impl->acceptor.local_endpoint().port();
    running = true;

    event_thread = std::thread([this](){ run_event_loop(); });
    broadcast_thread = std::thread([this](){ broadcast_loop(); });
    std::cerr << "WebSocketServer: streaming snapshots on ws://0.0.0.0:" << port << "/" << std::endl;
}

void WebSocketServer::stop() {
    {
        std::lock_guard<std::mutex> lk(wake_m);
        if (!running) return;
        running = false;
    }
    wake.notify_all();
    if (broadcast_thread.joinable()) broadcast_thread.join();
    if (impl) impl->ioc.stop();
    if (event_thread.joinable()) event_thread.join();

    // io_context is stopped; drop the TCP connections without a close handshake
    if (impl) {
        boost::system::error_code ec;
        impl->acceptor.close(ec);
        for (auto& s : impl->list_sessions()) {
            s->next_layer().shutdown(tcp::socket::shutdown_both, ec);
            s->next_layer().close(ec);
            impl->remove_session(s);
        }
    }
}

void WebSocketServer::run_event_loop() {
    auto& ioc = impl->ioc;
    auto& acceptor = impl->acceptor;

    std::function<void()> do_accept;
    do_accept = [&]() {
        acceptor.async_accept([this, &do_accept](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (running) std::cerr << "WebSocketServer: accept error: " << ec.message() << std::endl;
            } else {
                auto ws = std::make_shared<WsStream>(std::move(socket));
                ws->async_accept([this, ws](boost::system::error_code ec) {
                    if (ec) {
                        std::cerr << "WebSocketServer: websocket accept failed: " << ec.message() << std::endl;
                        return;
                    }
                    impl->add_session(ws);
                    if (!send_text(ws, protocol->build_stream_message().dump())) {
                        impl->remove_session(ws);
                        return;
                    }

                    // read loop: keeps the connection alive and receives control messages
                    auto buffer = std::make_shared<beast::flat_buffer>();
                    auto do_read = std::make_shared<std::function<void()>>();
                    *do_read = [this, ws, buffer, do_read]() {
                        ws->async_read(*buffer, [this, ws, buffer, do_read](boost::system::error_code ec, std::size_t) {
                            if (ec) {
                                impl->remove_session(ws);
                                // break the self-reference so the stream can be freed
                                *do_read = nullptr;
                                return;
                            }
                            auto data = beast::buffers_to_string(buffer->data());
                            buffer->consume(buffer->size());
                            try {
                                auto reply = handle_control(nlohmann::json::parse(data));
                                if (reply) send_text(ws, reply->dump());
                            } catch (const nlohmann::json::exception& e) {
                                std::cerr << "WebSocketServer: ignoring bad control message: " << e.what() << std::endl;
                            }
                            (*do_read)();
                        });
                    };
                    (*do_read)();
                });
            }
            if (running && impl->acceptor.is_open()) do_accept();
        });
    };

    do_accept();

    try {
        ioc.run();
    } catch (const std::exception& e) {
        std::cerr << "WebSocketServer: I/O context error: " << e.what() << std::endl;
    }
}

std::optional<nlohmann::json> WebSocketServer::handle_control(const nlohmann::json& msg) {
    if (!msg.is_object() || !msg.contains("cmd") || !msg["cmd"].is_string()) {
        std::cerr << "WebSocketServer: control message without cmd" << std::endl;
        return std::nullopt;
    }
    const auto cmd = msg["cmd"].get<std::string>();
    if (cmd == "snapshot") return protocol->build_stream_message();
    if (cmd == "ping") return nlohmann::json{{"type", "pong"}};
    std::cerr << "WebSocketServer: unknown cmd '" << cmd << "'" << std::endl;
    return std::nullopt;
}

void WebSocketServer::broadcast_loop() {
    while (running) {
        {
            std::unique_lock<std::mutex> lk(wake_m);
            wake.wait_for(lk, interval, [this]() { return !running.load(); });
        }
        if (!running) break;
        try {
            auto payload = protocol->build_stream_message().dump();
            auto im = impl;
            asio::post(im->ioc, [im, payload]() {
                for (auto& s : im->list_sessions()) {
                    if (!send_text(s, payload)) im->remove_session(s);
                }
            });
        } catch (const std::exception& e) {
            std::cerr << "WebSocketServer: broadcast error: " << e.what() << std::endl;
        }
    }
}

} // namespace airscope
