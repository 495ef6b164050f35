// Command-line view of a running airscope daemon using libcurl + nlohmann::json
// Usage: ./airscope_ctl [base_url] [--json] [--watch SECONDS]
// Example: ./airscope_ctl http://localhost:5000

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>
#include <thread>

using json = nlohmann::json;

static size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

struct HttpResult { long code; std::string body; std::string error; };

static HttpResult http_get(const std::string& url) {
    CURL* curl = curl_easy_init();
    if (!curl) return {0, "", "curl_easy_init failed"};
    std::string response;
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, 5000L);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    std::string err;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    else err = curl_easy_strerror(res);
    curl_easy_cleanup(curl);
    return {code, response, err};
}

static std::string fit(std::string s, size_t width) {
    if (s.size() > width) s = s.substr(0, width - 1) + "~";
    return s;
}

static void print_table(const json& payload) {
    const auto& devices = payload.value("devices", json::array());
    std::printf("%-5s %6s  %-17s  %-24s  %s\n", "TYPE", "dBm", "MAC", "VENDOR", "NAME");
    for (const auto& d : devices) {
        std::string sig = d["signal_dbm"].is_number() ? std::to_string(d["signal_dbm"].get<int>()) : "-";
        std::printf("%-5s %6s  %-17s  %-24s  %s\n",
                    d.value("type", "?").c_str(),
                    sig.c_str(),
                    d.value("mac", "").c_str(),
                    fit(d.value("vendor", "Unknown"), 24).c_str(),
                    d.value("name", "(unknown)").c_str());
    }
    std::printf("%zu device(s)\n", devices.size());
}

int main(int argc, char** argv) {
    std::string base = "http://localhost:5000";
    bool raw_json = false;
    int watch_sec = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--json") raw_json = true;
        else if (a == "--watch" && i + 1 < argc) watch_sec = std::stoi(argv[++i]);
        else if (a == "-h" || a == "--help") {
            std::cerr << "Usage: " << argv[0] << " [base_url] [--json] [--watch SECONDS]\n";
            return 0;
        }
        else base = a;
    }
    while (!base.empty() && base.back() == '/') base.pop_back();

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "curl_global_init failed" << std::endl;
        return 1;
    }
    int rc = 0;
    do {
        auto res = http_get(base + "/api/devices");
        if (res.code != 200) {
            std::cerr << "GET /api/devices failed (" << res.code << "): "
                      << (res.error.empty() ? res.body : res.error) << std::endl;
            rc = 2;
            break;
        }
        try {
            auto payload = json::parse(res.body);
            if (raw_json) std::cout << payload.dump(2) << std::endl;
            else print_table(payload);
        } catch (const json::exception& e) {
            std::cerr << "Invalid response: " << e.what() << std::endl;
            rc = 3;
            break;
        }
        if (watch_sec > 0) std::this_thread::sleep_for(std::chrono::seconds(watch_sec));
    } while (watch_sec > 0);

    curl_global_cleanup();
    return rc;
}
