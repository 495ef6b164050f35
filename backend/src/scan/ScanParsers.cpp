#include "scan/ScanParsers.hpp"
#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>

namespace airscope::scan {

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

static bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::vector<WifiScanEntry> parse_iw_scan(const std::string& text) {
    std::vector<WifiScanEntry> out;
    std::istringstream in(text);
    std::string raw;
    WifiScanEntry* cur = nullptr;

    while (std::getline(in, raw)) {
        // A block header is the only unindented "BSS " line; "\tBSS Load:" is a field.
        if (starts_with(raw, "BSS ")) {
            std::string rest = raw.substr(4);
            size_t end = rest.find_first_of("( \t");
            out.push_back(WifiScanEntry{});
            cur = &out.back();
            cur->bssid = rest.substr(0, end);
            continue;
        }
        if (!cur) continue;

        std::string line = trim(raw);
        if (starts_with(line, "SSID:")) {
            cur->ssid = trim(line.substr(5));
        } else if (starts_with(line, "signal:")) {
            try {
                cur->signal = std::stod(line.substr(7));
            } catch (const std::exception&) {
                cur->signal.reset();
            }
        } else if (starts_with(line, "freq:")) {
            try {
                cur->freq_mhz = (int)std::stod(line.substr(5));
            } catch (const std::exception&) {
                cur->freq_mhz.reset();
            }
        }
    }
    return out;
}

std::optional<int> quality_to_dbm(double x) {
    if (!std::isfinite(x)) return std::nullopt;
    if (x >= 0.0 && x <= 100.0) return (int)std::lround(x / 2.0 - 100.0);
    double whole = std::trunc(x);
    if (whole < (double)std::numeric_limits<int>::min() || whole > (double)std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return (int)whole;
}

std::optional<std::string> parse_ad_name(const uint8_t* data, size_t len) {
    std::optional<std::string> shortened;
    size_t i = 0;
    while (i < len) {
        uint8_t field_len = data[i];
        if (field_len == 0) break;
        if (i + 1 + field_len > len) break;
        uint8_t type = data[i + 1];
        const char* value = reinterpret_cast<const char*>(data + i + 2);
        std::string s(value, field_len - 1);
        while (!s.empty() && s.back() == '\0') s.pop_back();

        if (type == 0x09 && !s.empty()) return s;
        if (type == 0x08 && !s.empty() && !shortened) shortened = s;
        i += 1 + field_len;
    }
    return shortened;
}

} // namespace airscope::scan
