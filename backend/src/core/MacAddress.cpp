#include "core/MacAddress.hpp"
#include <algorithm>
#include <cctype>

namespace airscope {

static std::string_view trim(std::string_view s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool is_hex_string(std::string_view s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isxdigit(c) != 0; });
}

std::string normalize_mac(std::string_view raw) {
    auto t = trim(raw);
    std::string mac;
    mac.reserve(17);
    for (unsigned char c : t) {
        if (c == '-') mac.push_back(':');
        else mac.push_back((char)std::toupper(c));
    }

    if (mac.find(':') == std::string::npos && mac.size() == 12 && is_hex_string(mac)) {
        std::string out;
        out.reserve(17);
        for (size_t i = 0; i < 12; i += 2) {
            if (i) out.push_back(':');
            out.append(mac, i, 2);
        }
        return out;
    }
    return mac;
}

std::string vendor_prefix(std::string_view normalized) {
    if (normalized.empty()) return {};
    size_t pos = 0;
    for (int groups = 0; groups < 3; ++groups) {
        auto next = normalized.find(':', pos);
        if (next == std::string_view::npos) return std::string(normalized);
        pos = next + 1;
    }
    // pos sits one past the third separator
    return std::string(normalized.substr(0, pos - 1));
}

} // namespace airscope
