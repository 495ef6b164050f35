#pragma once
#include "core/VendorResolver.hpp"
#include <string>

namespace airscope {

// Online lookup: GET <base_url>/<MAC>, body is the vendor name (macvendors.com style).
class HttpVendorLookup : public IVendorLookup {
public:
    HttpVendorLookup(std::string base_url, long timeout_ms);

    std::optional<std::string> lookup(const std::string& mac) override;

private:
    std::string base_url_;
    long timeout_ms_;
};

} // namespace airscope
