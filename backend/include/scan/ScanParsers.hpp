#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace airscope::scan {

// One BSS block from `iw dev <iface> scan` output.
struct WifiScanEntry {
    std::string bssid;
    std::string ssid;
    std::optional<double> signal; // dBm as printed by iw
    std::optional<int> freq_mhz;
};

std::vector<WifiScanEntry> parse_iw_scan(const std::string& text);

// Some drivers report 0..100 link quality instead of dBm.
// 0 -> -100 dBm, 100 -> -50 dBm; anything else is taken as dBm already.
// nullopt for values that are not finite or do not fit an int.
std::optional<int> quality_to_dbm(double x);

// Local name from BLE advertising data: Complete (0x09) preferred over
// Shortened (0x08). nullopt if neither is present or the AD is truncated.
std::optional<std::string> parse_ad_name(const uint8_t* data, size_t len);

} // namespace airscope::scan
