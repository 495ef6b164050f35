#pragma once
#include "core/VendorResolver.hpp"
#include <istream>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace airscope {

// Local OUI registry loaded from an IEEE oui.txt or a Wireshark manuf file.
// Load before sharing; lookups are read-only afterwards.
class OuiDatabase : public IVendorLookup {
public:
    bool load(const std::string& path);
    size_t load_stream(std::istream& in);

    std::optional<std::string> lookup(const std::string& mac) override;
    size_t size() const { return vendors_.size(); }

    // -> {"AABBCC", "Vendor"} for a registry line, nullopt for anything else
    static std::optional<std::pair<std::string, std::string>> parse_line(const std::string& line);

private:
    std::unordered_map<std::string, std::string> vendors_;
};

} // namespace airscope
