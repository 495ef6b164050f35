#include <gtest/gtest.h>
#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace airscope;

namespace {

struct FakeEnv {
    std::map<std::string, std::string> vars;
    EnvLookup lookup() const {
        return [this](const char* name) -> const char* {
            auto it = vars.find(name);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

std::string write_temp_file(const std::string& name, const std::string& text) {
    std::filesystem::path p = std::filesystem::temp_directory_path() / name;
    std::ofstream f(p);
    f << text;
    f.close();
    return p.string();
}

} // namespace

TEST(Config, DefaultsWithoutArguments) {
    AppConfig cfg;
    ASSERT_TRUE(load_config({}, nullptr, cfg));
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.history_capacity, 60);
    EXPECT_EQ(cfg.ws_port, 0);
    EXPECT_TRUE(cfg.wifi_enabled);
    EXPECT_TRUE(cfg.ble_enabled);
    EXPECT_EQ(cfg.vendor_timeout_ms, 2000);
}

TEST(Config, CommandLineOverridesEnvOverridesFile) {
    auto path = write_temp_file("airscope_cfg_layers.json",
        json{{"port", 6000}, {"history_capacity", 10}, {"wifi_interface", "wlp2s0"}, {"ws_port", 7000}}.dump());

    FakeEnv env;
    env.vars["AIRSCOPE_PORT"] = "6100";
    env.vars["AIRSCOPE_HISTORY"] = "20";

    AppConfig cfg;
    ASSERT_TRUE(load_config({"--config", path, "--history", "30", "--no-ble"}, env.lookup(), cfg));
    EXPECT_EQ(cfg.port, 6100);              // env over file
    EXPECT_EQ(cfg.history_capacity, 30);    // cli over env
    EXPECT_EQ(cfg.wifi_interface, "wlp2s0"); // file over default
    EXPECT_EQ(cfg.ws_port, 7000);
    EXPECT_FALSE(cfg.ble_enabled);
    std::filesystem::remove(path);
}

TEST(Config, PortEnvPrecedence) {
    FakeEnv env;
    env.vars["PORT"] = "8080";
    AppConfig cfg;
    ASSERT_TRUE(load_config({}, env.lookup(), cfg));
    EXPECT_EQ(cfg.port, 8080);

    env.vars["AIRSCOPE_PORT"] = "9090";
    ASSERT_TRUE(load_config({}, env.lookup(), cfg));
    EXPECT_EQ(cfg.port, 9090);

    env.vars["AIRSCOPE_PORT"] = "";
    ASSERT_TRUE(load_config({}, env.lookup(), cfg));
    EXPECT_EQ(cfg.port, 8080);
}

TEST(Config, EqualsSyntax) {
    AppConfig cfg;
    ASSERT_TRUE(load_config({"--port=5050", "--vendor-url=https://api.macvendors.com", "--record-dir=/tmp/rec"}, nullptr, cfg));
    EXPECT_EQ(cfg.port, 5050);
    EXPECT_EQ(cfg.vendor_url, "https://api.macvendors.com");
    EXPECT_EQ(cfg.record_dir, "/tmp/rec");
}

TEST(Config, RejectsBadInput) {
    AppConfig cfg;
    EXPECT_THROW(load_config({"--history", "0"}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"--port", "70000"}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"--port", "12ab"}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"--port"}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"--bogus"}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"--ws-interval", "0"}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"-c", "/nonexistent/airscope.json"}, nullptr, cfg), ConfigError);

    FakeEnv env;
    env.vars["AIRSCOPE_HISTORY"] = "lots";
    EXPECT_THROW(load_config({}, env.lookup(), cfg), ConfigError);
}

TEST(Config, ErrorsCarryCatalogCode) {
    AppConfig cfg;
    try {
        load_config({"--history", "0"}, nullptr, cfg);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("Error 1000: Invalid configuration: "), std::string::npos);
    }
}

TEST(Config, MalformedFileIsRejected) {
    auto bad_syntax = write_temp_file("airscope_cfg_bad.json", "{ not json");
    auto bad_type = write_temp_file("airscope_cfg_type.json", json{{"port", "five thousand"}}.dump());
    auto not_object = write_temp_file("airscope_cfg_arr.json", "[1,2,3]");

    AppConfig cfg;
    EXPECT_THROW(load_config({"-c", bad_syntax}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"-c", bad_type}, nullptr, cfg), ConfigError);
    EXPECT_THROW(load_config({"-c", not_object}, nullptr, cfg), ConfigError);

    std::filesystem::remove(bad_syntax);
    std::filesystem::remove(bad_type);
    std::filesystem::remove(not_object);
}

TEST(Config, HelpStopsLoading) {
    AppConfig cfg;
    cfg.port = 1234;
    EXPECT_FALSE(load_config({"--port", "80", "--help"}, nullptr, cfg));
    EXPECT_EQ(cfg.port, 1234); // untouched
}

TEST(Config, FailedLoadLeavesOutputUntouched) {
    AppConfig cfg;
    cfg.port = 4321;
    EXPECT_THROW(load_config({"--port", "7000", "--history", "-1"}, nullptr, cfg), ConfigError);
    EXPECT_EQ(cfg.port, 4321);
}

TEST(Config, JsonViewCoversEveryField) {
    AppConfig cfg;
    json j = to_json(cfg);
    EXPECT_EQ(j["port"], 5000);
    EXPECT_EQ(j["oui_db_path"], "/usr/share/ieee-data/oui.txt");

    AppConfig copy;
    copy.port = 1;
    apply_json(copy, j);
    EXPECT_EQ(to_json(copy), j);
}

TEST(ErrorCatalog, FormatsWithFallbackDetail) {
    EXPECT_EQ(errors::format_E1000_config_invalid(""), "Error 1000: Invalid configuration: invalid configuration");
    EXPECT_EQ(errors::format_E3000_scanner_failed(errors::D3001_IW_SPAWN_FAILED), "Error 3000: Scanner failed: failed to run iw");
    EXPECT_EQ(errors::format_E4000_recorder_failed(""), "Error 4000: Recorder failed: failed to open recording file");
}
