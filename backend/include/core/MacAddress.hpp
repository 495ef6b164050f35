#pragma once
#include <string>
#include <string_view>

namespace airscope {

// Canonical form is "AA:BB:CC:DD:EE:FF". Input that cannot be brought into that
// shape is returned trimmed and uppercased but otherwise untouched; an empty
// result means the caller has no usable identity.
std::string normalize_mac(std::string_view raw);

// First three octets of a normalized address ("AA:BB:CC"), used as vendor key.
std::string vendor_prefix(std::string_view normalized);

bool is_hex_string(std::string_view s);

} // namespace airscope
