#include "net/HttpServer.hpp"
#include "DeviceProtocol.hpp"
#include "core/BuildInfo.hpp"
#include "core/DeviceStore.hpp"
#include "core/ErrorCatalog.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <sstream>

namespace beast = boost::beast;
namespace asio = boost::asio;
using json = nlohmann::json;

namespace airscope::net {

using Response = http::response<http::string_body>;

static void set_common_headers(Response& res) {
    res.set(http::field::server, buildinfo::server_string());
    // the dashboard may be served from elsewhere during development
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    res.keep_alive(false);
}

static Response make_json_response(http::status status, const json& body, unsigned version) {
    Response res{status, version};
    set_common_headers(res);
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

static const char* mime_type(const std::string& ext) {
    if (ext == ".html" || ext == ".htm") return "text/html; charset=utf-8";
    if (ext == ".js") return "application/javascript";
    if (ext == ".css") return "text/css";
    if (ext == ".json") return "application/json";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".png") return "image/png";
    if (ext == ".ico") return "image/x-icon";
    return "application/octet-stream";
}

struct HttpServer::Impl {
    asio::io_context ioc;
    tcp::acceptor acceptor;
    Impl() : ioc(), acceptor(ioc) {}
};

class HttpServer::Session : public std::enable_shared_from_this<HttpServer::Session> {
public:
    Session(tcp::socket socket, HttpServer& server) : stream_(std::move(socket)), server_(server) {}

    void run() {
        stream_.expires_after(std::chrono::seconds(10));
        http::async_read(stream_, buffer_, req_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->on_read(ec);
        });
    }

private:
    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) return close();
        if (ec) {
            if (ec != beast::error::timeout) std::cerr << "HttpServer: read failed: " << ec.message() << std::endl;
            return;
        }
        res_ = std::make_shared<Response>(server_.handle_request(req_));
        http::async_write(stream_, *res_, [self = shared_from_this()](beast::error_code ec, std::size_t) {
            if (ec) std::cerr << "HttpServer: write failed: " << ec.message() << std::endl;
            self->close();
        });
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<Response> res_;
    HttpServer& server_;
};

HttpServer::HttpServer(std::string address, int port, const DeviceStore& store, std::string web_root)
: address_(std::move(address)), port_(port), store_(store), web_root_(std::move(web_root)),
  protocol_(std::make_unique<DeviceProtocol>(store)) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (running_) return;
    impl_ = std::make_shared<Impl>();

    tcp::endpoint ep{asio::ip::make_address(address_), (unsigned short)port_};
    impl_->acceptor.open(ep.protocol());
    impl_->acceptor.set_option(asio::socket_base::reuse_address(true));
    impl_->acceptor.bind(ep);
    impl_->acceptor.listen(asio::socket_base::max_listen_connections);
    bound_port_ = impl_->acceptor.local_endpoint().port();

    running_ = true;
    event_thread_ = std::thread([this]() { run_event_loop(); });
    std::cerr << "HttpServer: listening on http://" << address_ << ":" << bound_port_ << std::endl;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    if (impl_) impl_->ioc.stop();
    if (event_thread_.joinable()) event_thread_.join();
    if (impl_) {
        boost::system::error_code ec;
        impl_->acceptor.close(ec);
    }
}

void HttpServer::run_event_loop() {
    auto impl = impl_;
    std::function<void()> do_accept;
    do_accept = [this, impl, &do_accept]() {
        impl->acceptor.async_accept([this, impl, &do_accept](boost::system::error_code ec, tcp::socket socket) {
            if (ec) {
                if (running_) std::cerr << "HttpServer: accept error: " << ec.message() << std::endl;
            } else {
                std::make_shared<Session>(std::move(socket), *this)->run();
            }
            if (running_ && impl->acceptor.is_open()) do_accept();
        });
    };
    do_accept();

    try {
        impl->ioc.run();
    } catch (const std::exception& e) {
        std::cerr << "HttpServer: I/O context error: " << e.what() << std::endl;
    }
}

Response HttpServer::serve_file(const std::string& rel_path, unsigned version) {
    const json not_found = {{"error", errors::D2004_NOT_FOUND}};
    if (web_root_.empty() || rel_path.find("..") != std::string::npos || rel_path.find('\\') != std::string::npos) {
        return make_json_response(http::status::not_found, not_found, version);
    }

    std::filesystem::path p = std::filesystem::path(web_root_) / rel_path;
    std::ifstream f(p, std::ios::binary);
    if (!f) return make_json_response(http::status::not_found, not_found, version);

    std::ostringstream body;
    body << f.rdbuf();

    Response res{http::status::ok, version};
    set_common_headers(res);
    res.set(http::field::content_type, mime_type(p.extension().string()));
    res.body() = body.str();
    res.prepare_payload();
    return res;
}

Response HttpServer::handle_request(const http::request<http::string_body>& req) {
    const unsigned version = req.version();

    if (req.method() == http::verb::options) {
        Response res{http::status::no_content, version};
        set_common_headers(res);
        res.prepare_payload();
        return res;
    }
    if (req.method() != http::verb::get) {
        return make_json_response(http::status::method_not_allowed, {{"error", errors::D2005_METHOD_NOT_ALLOWED}}, version);
    }

    std::string target(req.target());
    auto q = target.find('?');
    if (q != std::string::npos) target.resize(q);

    try {
        if (target == "/api/devices") {
            return make_json_response(http::status::ok, protocol_->build_devices_payload(), version);
        }
        if (target == "/health") {
            json body = {
                {"ok", true},
                {"devices", store_.size()},
                {"dropped", store_.dropped()},
                {"version", buildinfo::version()}
            };
            return make_json_response(http::status::ok, body, version);
        }
        if (target == "/" || target == "/index.html") return serve_file("index.html", version);
        if (target.rfind("/static/", 0) == 0) return serve_file(target.substr(1), version);
    } catch (const std::exception& e) {
        std::cerr << "HttpServer: " << errors::format_E2000_request_rejected(e.what()) << std::endl;
        return make_json_response(http::status::internal_server_error, {{"error", std::string(e.what())}}, version);
    }

    return make_json_response(http::status::not_found, {{"error", errors::D2004_NOT_FOUND}}, version);
}

} // namespace airscope::net
