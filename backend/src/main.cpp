#include "WebSocketServer.hpp"
#include "core/BuildInfo.hpp"
#include "core/Config.hpp"
#include "core/DeviceStore.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/HttpVendorLookup.hpp"
#include "core/OuiDatabase.hpp"
#include "core/Recorder.hpp"
#include "core/VendorResolver.hpp"
#include "net/HttpServer.hpp"
#include "scan/BleScanner.hpp"
#include "scan/WifiScanner.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <vector>

namespace asio = boost::asio;
using namespace airscope;

static std::shared_ptr<VendorResolver> make_resolver(const AppConfig& cfg) {
    auto chain = std::make_shared<ChainedVendorLookup>();
    if (!cfg.oui_db_path.empty()) {
        auto oui = std::make_shared<OuiDatabase>();
        if (oui->load(cfg.oui_db_path)) chain->add(oui);
        else std::cerr << "Warning: OUI database '" << cfg.oui_db_path << "' unavailable" << std::endl;
    }
    if (!cfg.vendor_url.empty()) {
        chain->add(std::make_shared<HttpVendorLookup>(cfg.vendor_url, cfg.vendor_timeout_ms));
    }
    if (chain->empty()) std::cerr << "Warning: no vendor backend configured; vendors will show as Unknown" << std::endl;
    return std::make_shared<VendorResolver>(chain->empty() ? nullptr : chain,
                                            std::chrono::milliseconds(cfg.vendor_timeout_ms));
}

int main(int argc, char** argv) {
    AppConfig cfg;
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        if (!load_config(args, [](const char* name) { return std::getenv(name); }, cfg)) return 0;
    } catch (const ConfigError& e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 2;
    }

    DeviceStore store((size_t)cfg.history_capacity, make_resolver(cfg));

    std::vector<std::unique_ptr<scan::ScanSource>> sources;
    try {
        if (cfg.wifi_enabled) {
            sources.push_back(std::make_unique<scan::WifiScanner>(
                store, cfg.wifi_interface,
                std::chrono::seconds(cfg.wifi_interval_sec),
                std::chrono::milliseconds(cfg.wifi_settle_ms)));
        }
        if (cfg.ble_enabled) sources.push_back(std::make_unique<scan::BleScanner>(store, cfg.hci_index));
    } catch (const std::exception& e) {
        std::cerr << errors::format_E1000_config_invalid(e.what()) << std::endl;
        return 2;
    }
    for (auto& s : sources) {
        if (!s->start()) std::cerr << s->name() << ": not started; continuing without it" << std::endl;
    }

    net::HttpServer http(cfg.listen_address, cfg.port, store, cfg.web_root);
    std::unique_ptr<WebSocketServer> ws;
    Recorder recorder(store);
    try {
        http.start();
        if (cfg.ws_port > 0) {
            ws = std::make_unique<WebSocketServer>(cfg.ws_port, store, std::chrono::milliseconds(cfg.ws_interval_ms));
            ws->start();
        }
        if (!cfg.record_dir.empty()) recorder.start(cfg.record_dir, std::chrono::milliseconds(cfg.record_interval_ms));
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        for (auto it = sources.rbegin(); it != sources.rend(); ++it) (*it)->stop();
        return 1;
    }

    std::cout << "airscope " << buildinfo::version() << " (" << buildinfo::git_commit() << ") on http://"
              << cfg.listen_address << ":" << http.port() << " history=" << cfg.history_capacity << std::endl;

    asio::io_context ioc;
    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    asio::steady_timer status_timer(ioc);

    std::function<void()> schedule_status;
    schedule_status = [&]() {
        status_timer.expires_after(std::chrono::seconds(30));
        status_timer.async_wait([&](const boost::system::error_code& ec) {
            if (ec) return;
            std::cout << "status: devices=" << store.size() << " rejected=" << store.dropped();
            for (auto& s : sources) {
                std::cout << " " << s->name() << "=" << (s->running() ? "up" : "down")
                          << "/" << s->delivered() << "/" << s->dropped();
            }
            std::cout << std::endl;
            schedule_status();
        });
    };
    schedule_status();

    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        std::cout << "Received signal " << sig << ", shutting down" << std::endl;
        status_timer.cancel();
        ioc.stop();
    });
    ioc.run();

    recorder.stop_all();
    if (ws) ws->stop();
    http.stop();
    for (auto it = sources.rbegin(); it != sources.rend(); ++it) (*it)->stop();
    return 0;
}
