#pragma once
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace airscope {

struct AppConfig {
    // presentation
    int port = 5000;
    std::string listen_address = "0.0.0.0";
    int ws_port = 0; // 0: no WebSocket stream
    int ws_interval_ms = 1000;
    std::string web_root;

    // store
    int history_capacity = 60;

    // scan sources
    bool wifi_enabled = true;
    std::string wifi_interface = "wlan0";
    int wifi_interval_sec = 5;
    int wifi_settle_ms = 2500;
    bool ble_enabled = true;
    int hci_index = 0;

    // vendor lookup
    std::string oui_db_path = "/usr/share/ieee-data/oui.txt";
    std::string vendor_url;
    int vendor_timeout_ms = 2000;

    // snapshot recorder
    std::string record_dir;
    int record_interval_ms = 5000;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& detail);
};

using EnvLookup = std::function<const char*(const char*)>;

// Layers: defaults < JSON file (-c/--config) < environment < command line.
// Returns false when --help was requested (usage already printed).
bool load_config(const std::vector<std::string>& args, const EnvLookup& env, AppConfig& out);

void apply_json(AppConfig& cfg, const nlohmann::json& j);
void apply_env(AppConfig& cfg, const EnvLookup& env);
void validate(const AppConfig& cfg);

nlohmann::json to_json(const AppConfig& cfg);
void print_usage(const char* prog);

} // namespace airscope
