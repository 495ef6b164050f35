#include "core/HttpVendorLookup.hpp"
#include "core/MacAddress.hpp"
#include <curl/curl.h>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace airscope {

static size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

HttpVendorLookup::HttpVendorLookup(std::string base_url, long timeout_ms)
: base_url_(std::move(base_url)), timeout_ms_(timeout_ms) {
    static std::once_flag curl_init;
    std::call_once(curl_init, []() {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) std::cerr << "HttpVendorLookup: curl_global_init failed" << std::endl;
    });
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::optional<std::string> HttpVendorLookup::lookup(const std::string& mac) {
    std::string normalized = normalize_mac(mac);
    if (normalized.empty()) return std::nullopt;

    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    std::string url = base_url_ + "/" + normalized;
    std::string response;
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    long code = 0;
    if (res == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) throw std::runtime_error(curl_easy_strerror(res));
    if (code != 200) return std::nullopt;

    size_t b = 0, e = response.size();
    while (b < e && std::isspace((unsigned char)response[b])) ++b;
    while (e > b && std::isspace((unsigned char)response[e - 1])) --e;
    if (b == e) return std::nullopt;
    return response.substr(b, e - b);
}

} // namespace airscope
