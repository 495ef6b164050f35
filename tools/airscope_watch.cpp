#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstdlib>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using json = nlohmann::json;

struct WsUrl {
    std::string host;
    std::string port;
    std::string target;
};

static bool parse_ws_url(const std::string& url, WsUrl& out) {
    // Minimal parser for ws://host:port/path
    std::string s = url;
    const std::string prefix = "ws://";
    if (s.rfind(prefix, 0) != 0) return false;
    s = s.substr(prefix.size());

    std::string hostport;
    auto slash = s.find('/');
    if (slash == std::string::npos) {
        hostport = s;
        out.target = "/";
    } else {
        hostport = s.substr(0, slash);
        out.target = s.substr(slash);
        if (out.target.empty()) out.target = "/";
    }

    auto colon = hostport.find(':');
    if (colon == std::string::npos) {
        out.host = hostport;
        out.port = "80";
    } else {
        out.host = hostport.substr(0, colon);
        out.port = hostport.substr(colon + 1);
        if (out.port.empty()) out.port = "80";
    }

    return !out.host.empty();
}

static void print_summary(const json& msg) {
    const auto& devices = msg.value("devices", json::array());
    int wifi = 0, ble = 0;
    const json* best_wifi = nullptr;
    const json* best_ble = nullptr;
    // devices arrive sorted: first of each type is the strongest
    for (const auto& d : devices) {
        if (d.value("type", "") == "wifi") { if (!best_wifi) best_wifi = &d; ++wifi; }
        else { if (!best_ble) best_ble = &d; ++ble; }
    }
    std::cout << "t=" << msg.value("server_time", 0.0) << " wifi=" << wifi << " ble=" << ble;
    if (best_wifi) std::cout << " | wifi " << best_wifi->value("name", "") << " " << (*best_wifi)["signal_dbm"] << " dBm";
    if (best_ble) std::cout << " | ble " << best_ble->value("name", "") << " " << (*best_ble)["signal_dbm"] << " dBm";
    std::cout << std::endl;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " ws://host:port/ [count]\n";
        std::cerr << "Example:\n";
        std::cerr << "  " << argv[0] << " ws://localhost:5001/ 10\n";
        return 2;
    }

    const std::string ws_url = argv[1];
    long count = argc >= 3 ? std::strtol(argv[2], nullptr, 10) : 0;

    WsUrl u;
    if (!parse_ws_url(ws_url, u)) {
        std::cerr << "Invalid ws url (expected ws://host:port/path): " << ws_url << "\n";
        return 2;
    }

    try {
        net::io_context ioc;
        tcp::resolver resolver{ioc};
        websocket::stream<tcp::socket> ws{ioc};

        auto const results = resolver.resolve(u.host, u.port);
        net::connect(ws.next_layer(), results);
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.handshake(u.host + ":" + u.port, u.target);

        beast::flat_buffer buffer;
        for (long seen = 0; count <= 0 || seen < count;) {
            buffer.clear();
            ws.read(buffer);
            json msg;
            try {
                msg = json::parse(beast::buffers_to_string(buffer.data()));
            } catch (const json::exception& e) {
                std::cerr << "Skipping unparsable message: " << e.what() << "\n";
                continue;
            }
            if (msg.value("type", std::string{}) != "devices") continue;
            print_summary(msg);
            ++seen;
        }

        beast::error_code ec;
        ws.close(websocket::close_code::normal, ec);
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
