#include "core/OuiDatabase.hpp"
#include "core/MacAddress.hpp"
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace airscope {

static std::string trimmed(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

static std::string strip_separators(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == ':' || c == '-' || c == '.') continue;
        out.push_back((char)std::toupper((unsigned char)c));
    }
    return out;
}

std::optional<std::pair<std::string, std::string>> OuiDatabase::parse_line(const std::string& raw) {
    std::string line = trimmed(raw);
    if (line.empty() || line[0] == '#') return std::nullopt;

    // IEEE: "00-00-0C   (hex)\t\tCisco Systems, Inc"
    auto hex_pos = line.find("(hex)");
    if (hex_pos != std::string::npos) {
        std::string key = strip_separators(trimmed(line.substr(0, hex_pos)));
        std::string vendor = trimmed(line.substr(hex_pos + 5));
        if (key.size() != 6 || !is_hex_string(key) || vendor.empty()) return std::nullopt;
        return std::make_pair(key, vendor);
    }

    // manuf: "00:00:0C\tCisco\tCisco Systems, Inc"
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string f;
    while (std::getline(ss, f, '\t')) {
        f = trimmed(f);
        if (!f.empty()) fields.push_back(f);
    }
    if (fields.size() < 2) return std::nullopt;
    if (fields[0].find('/') != std::string::npos) return std::nullopt; // sub-block ranges
    std::string key = strip_separators(fields[0]);
    if (key.size() != 6 || !is_hex_string(key)) return std::nullopt;
    std::string vendor = fields.size() >= 3 ? fields[2] : fields[1];
    return std::make_pair(key, vendor);
}

size_t OuiDatabase::load_stream(std::istream& in) {
    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        auto entry = parse_line(line);
        if (!entry) continue;
        vendors_[entry->first] = entry->second;
        ++n;
    }
    return n;
}

bool OuiDatabase::load(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        std::cerr << "OuiDatabase: unable to open " << path << std::endl;
        return false;
    }
    size_t n = load_stream(f);
    std::cout << "OuiDatabase: loaded " << n << " prefixes from " << path << std::endl;
    return n > 0;
}

std::optional<std::string> OuiDatabase::lookup(const std::string& mac) {
    std::string key = strip_separators(normalize_mac(mac));
    if (key.size() < 6) return std::nullopt;
    key.resize(6);
    auto it = vendors_.find(key);
    if (it == vendors_.end()) return std::nullopt;
    return it->second;
}

} // namespace airscope
