#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include <fstream>
#include <iostream>
#include <optional>
#include <utility>

using json = nlohmann::json;

namespace airscope {

ConfigError::ConfigError(const std::string& detail)
: std::runtime_error(errors::format_E1000_config_invalid(detail)) {}

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  -h, --help               Show this help message and exit\n"
              << "  -c, --config FILE        Load settings from a JSON file\n"
              << "  -p, --port PORT          HTTP API port (default 5000)\n"
              << "      --listen ADDR        HTTP listen address (default 0.0.0.0)\n"
              << "      --ws-port PORT       WebSocket snapshot stream port (default off)\n"
              << "      --ws-interval MS     WebSocket push interval (default 1000)\n"
              << "      --web-root DIR       Serve index.html and /static from DIR\n"
              << "      --history N          Signal samples kept per device (default 60)\n"
              << "      --no-wifi            Disable the Wi-Fi scanner\n"
              << "      --wifi-iface IFACE   Wireless interface for iw scans (default wlan0)\n"
              << "      --wifi-interval SEC  Seconds between Wi-Fi scans (default 5)\n"
              << "      --no-ble             Disable the BLE scanner\n"
              << "      --hci N              HCI adapter index (default 0)\n"
              << "      --oui-db PATH        IEEE oui.txt or Wireshark manuf file\n"
              << "      --vendor-url URL     Online vendor lookup base URL\n"
              << "      --vendor-timeout MS  Vendor lookup timeout (default 2000)\n"
              << "      --record-dir DIR     Append snapshots as JSONL under DIR\n"
              << "      --record-interval MS Snapshot recording interval (default 5000)\n"
              << std::flush;
}

static int parse_int(const std::string& name, const std::string& value) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw ConfigError(std::string(errors::D1022_NOT_A_NUMBER) + name);
    }
    if (used != value.size()) throw ConfigError(std::string(errors::D1022_NOT_A_NUMBER) + name);
    return v;
}

template <typename T>
static void read_key(const json& j, const char* key, T& field) {
    if (j.contains(key)) field = j.at(key).get<T>();
}

void apply_json(AppConfig& cfg, const json& j) {
    if (!j.is_object()) throw ConfigError(std::string(errors::D1031_CONFIG_FILE_INVALID) + "expected an object");
    try {
        read_key(j, "port", cfg.port);
        read_key(j, "listen_address", cfg.listen_address);
        read_key(j, "ws_port", cfg.ws_port);
        read_key(j, "ws_interval_ms", cfg.ws_interval_ms);
        read_key(j, "web_root", cfg.web_root);
        read_key(j, "history_capacity", cfg.history_capacity);
        read_key(j, "wifi_enabled", cfg.wifi_enabled);
        read_key(j, "wifi_interface", cfg.wifi_interface);
        read_key(j, "wifi_interval_sec", cfg.wifi_interval_sec);
        read_key(j, "wifi_settle_ms", cfg.wifi_settle_ms);
        read_key(j, "ble_enabled", cfg.ble_enabled);
        read_key(j, "hci_index", cfg.hci_index);
        read_key(j, "oui_db_path", cfg.oui_db_path);
        read_key(j, "vendor_url", cfg.vendor_url);
        read_key(j, "vendor_timeout_ms", cfg.vendor_timeout_ms);
        read_key(j, "record_dir", cfg.record_dir);
        read_key(j, "record_interval_ms", cfg.record_interval_ms);
    } catch (const json::exception& e) {
        throw ConfigError(std::string(errors::D1031_CONFIG_FILE_INVALID) + e.what());
    }
}

void apply_env(AppConfig& cfg, const EnvLookup& env) {
    auto get = [&](const char* name) -> const char* {
        const char* v = env ? env(name) : nullptr;
        return (v && *v) ? v : nullptr;
    };
    // PORT kept for parity with common PaaS launchers; AIRSCOPE_PORT wins
    if (auto v = get("PORT")) cfg.port = parse_int("PORT", v);
    if (auto v = get("AIRSCOPE_PORT")) cfg.port = parse_int("AIRSCOPE_PORT", v);
    if (auto v = get("AIRSCOPE_HISTORY")) cfg.history_capacity = parse_int("AIRSCOPE_HISTORY", v);
    if (auto v = get("AIRSCOPE_OUI_DB")) cfg.oui_db_path = v;
    if (auto v = get("AIRSCOPE_VENDOR_URL")) cfg.vendor_url = v;
    if (auto v = get("AIRSCOPE_RECORDINGS_DIR")) cfg.record_dir = v;
}

void validate(const AppConfig& cfg) {
    if (cfg.history_capacity < 1 || cfg.history_capacity > 100000) throw ConfigError(errors::D1011_HISTORY_CAPACITY_RANGE);
    if (cfg.port < 1 || cfg.port > 65535) throw ConfigError(errors::D1012_PORT_RANGE);
    if (cfg.ws_port < 0 || cfg.ws_port > 65535) throw ConfigError(errors::D1013_WS_PORT_RANGE);
    if (cfg.ws_interval_ms <= 0 || cfg.wifi_interval_sec <= 0 || cfg.wifi_settle_ms < 0 ||
        cfg.vendor_timeout_ms <= 0 || cfg.record_interval_ms <= 0) {
        throw ConfigError(errors::D1014_INTERVAL_INVALID);
    }
}

static json read_config_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw ConfigError(std::string(errors::D1030_CONFIG_FILE_UNREADABLE) + path);
    try {
        return json::parse(f);
    } catch (const json::exception& e) {
        throw ConfigError(std::string(errors::D1031_CONFIG_FILE_INVALID) + e.what());
    }
}

bool load_config(const std::vector<std::string>& args, const EnvLookup& env, AppConfig& out) {
    AppConfig cfg;

    // Split "--key=value" once so both spellings share one code path.
    std::vector<std::pair<std::string, std::optional<std::string>>> opts;
    for (const auto& a : args) {
        auto eq = a.find('=');
        if (a.rfind("--", 0) == 0 && eq != std::string::npos) opts.emplace_back(a.substr(0, eq), a.substr(eq + 1));
        else opts.emplace_back(a, std::nullopt);
    }

    for (size_t i = 0; i < opts.size(); ++i) {
        const auto& name = opts[i].first;
        if (name == "-h" || name == "--help") {
            print_usage("airscope");
            return false;
        }
        if (name == "-c" || name == "--config") {
            std::string path;
            if (opts[i].second) path = *opts[i].second;
            else if (i + 1 < opts.size()) path = opts[i + 1].first;
            else throw ConfigError(std::string(errors::D1021_MISSING_VALUE) + name);
            apply_json(cfg, read_config_file(path));
        }
    }

    apply_env(cfg, env);

    for (size_t i = 0; i < opts.size(); ++i) {
        const std::string& name = opts[i].first;
        auto value = [&]() -> std::string {
            if (opts[i].second) return *opts[i].second;
            if (i + 1 >= opts.size()) throw ConfigError(std::string(errors::D1021_MISSING_VALUE) + name);
            return opts[++i].first;
        };

        if (name == "-c" || name == "--config") { value(); }
        else if (name == "-p" || name == "--port") cfg.port = parse_int(name, value());
        else if (name == "--listen") cfg.listen_address = value();
        else if (name == "--ws-port") cfg.ws_port = parse_int(name, value());
        else if (name == "--ws-interval") cfg.ws_interval_ms = parse_int(name, value());
        else if (name == "--web-root") cfg.web_root = value();
        else if (name == "--history") cfg.history_capacity = parse_int(name, value());
        else if (name == "--no-wifi") cfg.wifi_enabled = false;
        else if (name == "--wifi-iface") cfg.wifi_interface = value();
        else if (name == "--wifi-interval") cfg.wifi_interval_sec = parse_int(name, value());
        else if (name == "--no-ble") cfg.ble_enabled = false;
        else if (name == "--hci") cfg.hci_index = parse_int(name, value());
        else if (name == "--oui-db") cfg.oui_db_path = value();
        else if (name == "--vendor-url") cfg.vendor_url = value();
        else if (name == "--vendor-timeout") cfg.vendor_timeout_ms = parse_int(name, value());
        else if (name == "--record-dir") cfg.record_dir = value();
        else if (name == "--record-interval") cfg.record_interval_ms = parse_int(name, value());
        else throw ConfigError(std::string(errors::D1020_UNKNOWN_OPTION) + name);
    }

    validate(cfg);
    out = cfg;
    return true;
}

json to_json(const AppConfig& cfg) {
    return {
        {"port", cfg.port},
        {"listen_address", cfg.listen_address},
        {"ws_port", cfg.ws_port},
        {"ws_interval_ms", cfg.ws_interval_ms},
        {"web_root", cfg.web_root},
        {"history_capacity", cfg.history_capacity},
        {"wifi_enabled", cfg.wifi_enabled},
        {"wifi_interface", cfg.wifi_interface},
        {"wifi_interval_sec", cfg.wifi_interval_sec},
        {"wifi_settle_ms", cfg.wifi_settle_ms},
        {"ble_enabled", cfg.ble_enabled},
        {"hci_index", cfg.hci_index},
        {"oui_db_path", cfg.oui_db_path},
        {"vendor_url", cfg.vendor_url},
        {"vendor_timeout_ms", cfg.vendor_timeout_ms},
        {"record_dir", cfg.record_dir},
        {"record_interval_ms", cfg.record_interval_ms}
    };
}

} // namespace airscope
