#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace airscope {

enum class DeviceType { Wifi, Ble };

const char* to_string(DeviceType t);
std::optional<DeviceType> device_type_from_string(std::string_view s);

// A Wi-Fi access point sighting. `mac` is always normalized and non-empty.
struct WifiObservation {
    std::string mac;
    std::optional<std::string> ssid;
    int signal_dbm = 0;
};

// A BLE advertisement sighting. `mac` is always normalized and non-empty.
struct BleObservation {
    std::string mac;
    std::optional<std::string> name;
    int signal_dbm = 0;
};

using Observation = std::variant<WifiObservation, BleObservation>;

/**
 * @brief Build a typed observation from loosely-typed scanner output.
 *
 * Returns nullopt when the address does not normalize to anything or the
 * signal is missing, not finite, or outside the range of int. For Wi-Fi the SSID is taken from `source_ssid` when given,
 * otherwise from `display_name`. The signal is truncated toward zero.
 */
std::optional<Observation> make_observation(DeviceType type,
                                            std::string_view raw_address,
                                            const std::optional<std::string>& display_name,
                                            std::optional<double> signal,
                                            const std::optional<std::string>& source_ssid = std::nullopt);

DeviceType observation_type(const Observation& obs);
const std::string& observation_mac(const Observation& obs);
int observation_signal(const Observation& obs);

} // namespace airscope
