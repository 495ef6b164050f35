#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>

namespace airscope {

class DeviceStore;
class DeviceProtocol;

namespace net {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

// Read-only JSON API over the device store: /api/devices, /health, and the
// static dashboard files under web_root. Sessions run on the server's
// io_context thread.
class HttpServer {
public:
    HttpServer(std::string address, int port, const DeviceStore& store, std::string web_root = {});
    ~HttpServer();

    // Binds synchronously; throws on bind/listen failure.
    void start();
    void stop();

    // Bound port, useful after start() with port 0.
    int port() const { return bound_port_; }

    http::response<http::string_body> handle_request(const http::request<http::string_body>& req);

private:
    struct Impl;
    class Session;

    void run_event_loop();
    http::response<http::string_body> serve_file(const std::string& rel_path, unsigned version);

    std::string address_;
    int port_;
    int bound_port_ = 0;
    const DeviceStore& store_;
    std::string web_root_;
    std::unique_ptr<DeviceProtocol> protocol_;

    std::atomic<bool> running_{false};
    std::thread event_thread_;
    std::shared_ptr<Impl> impl_;
};

} // namespace net
} // namespace airscope
