#include "scan/WifiScanner.hpp"
#include "scan/ScanParsers.hpp"
#include "core/ErrorCatalog.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <sys/wait.h>

namespace airscope::scan {

WifiScanner::WifiScanner(DeviceStore& store, std::string iface, std::chrono::seconds interval, std::chrono::milliseconds settle)
: ScanSource(store), iface_(std::move(iface)), interval_(interval), settle_(settle) {
    // iface goes into a shell command line
    bool ok = !iface_.empty() && std::all_of(iface_.begin(), iface_.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-' || c == '.';
    });
    if (!ok) throw std::invalid_argument("WifiScanner: invalid interface name '" + iface_ + "'");
}

WifiScanner::~WifiScanner() {
    stop();
}

bool WifiScanner::run_command(const std::string& cmd, std::string& output) {
    auto pipe = std::unique_ptr<FILE, decltype(&pclose)>(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) return false;

    char buf[512];
    while (fgets(buf, sizeof(buf), pipe.get())) output.append(buf);

    int status = pclose(pipe.release());
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

size_t WifiScanner::ingest_output(const std::string& text) {
    size_t accepted = 0;
    for (const auto& e : parse_iw_scan(text)) {
        auto dbm = e.signal ? quality_to_dbm(*e.signal) : std::nullopt;
        if (e.bssid.empty() || !dbm) {
            deliver(std::nullopt);
            continue;
        }
        // hidden networks broadcast an empty SSID
        std::string ssid = e.ssid.empty() ? "(hidden)" : e.ssid;
        auto obs = make_observation(DeviceType::Wifi, e.bssid, ssid, (double)*dbm);
        if (obs) ++accepted;
        deliver(obs);
    }
    return accepted;
}

void WifiScanner::run() {
    std::cout << "WifiScanner: using interface " << iface_ << std::endl;
    const std::string trigger = "iw dev " + iface_ + " scan trigger 2>/dev/null";
    const std::string dump = "iw dev " + iface_ + " scan dump 2>&1";

    int failures = 0;
    while (running_) {
        std::string ignored;
        // trigger needs CAP_NET_ADMIN; without it the dump still returns cached results
        run_command(trigger, ignored);
        if (!wait_for(settle_)) break;

        std::string out;
        if (run_command(dump, out)) {
            failures = 0;
            size_t n = ingest_output(out);
            if (n == 0) std::cerr << "WifiScanner: scan returned no networks" << std::endl;
        } else {
            ++failures;
            std::cerr << "WifiScanner: " << errors::format_E3000_scanner_failed(errors::D3001_IW_SPAWN_FAILED)
                      << ": " << out.substr(0, out.find('\n')) << std::endl;
            if (failures >= 5) {
                std::cerr << "WifiScanner: giving up after " << failures << " consecutive failures" << std::endl;
                return;
            }
        }
        if (!wait_for(std::chrono::duration_cast<std::chrono::milliseconds>(interval_))) break;
    }
}

} // namespace airscope::scan
