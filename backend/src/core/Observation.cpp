#include "core/Observation.hpp"
#include "core/MacAddress.hpp"
#include <cmath>
#include <limits>

namespace airscope {

const char* to_string(DeviceType t) {
    switch (t) {
        case DeviceType::Wifi: return "wifi";
        case DeviceType::Ble: return "ble";
    }
    return "unknown";
}

std::optional<DeviceType> device_type_from_string(std::string_view s) {
    if (s == "wifi") return DeviceType::Wifi;
    if (s == "ble") return DeviceType::Ble;
    return std::nullopt;
}

std::optional<Observation> make_observation(DeviceType type,
                                            std::string_view raw_address,
                                            const std::optional<std::string>& display_name,
                                            std::optional<double> signal,
                                            const std::optional<std::string>& source_ssid) {
    std::string mac = normalize_mac(raw_address);
    if (mac.empty() || !signal || !std::isfinite(*signal)) return std::nullopt;
    double whole = std::trunc(*signal);
    if (whole < (double)std::numeric_limits<int>::min() || whole > (double)std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    int dbm = (int)whole;

    if (type == DeviceType::Wifi) {
        WifiObservation w;
        w.mac = std::move(mac);
        w.ssid = source_ssid ? source_ssid : display_name;
        w.signal_dbm = dbm;
        return Observation{std::move(w)};
    }
    BleObservation b;
    b.mac = std::move(mac);
    b.name = display_name;
    b.signal_dbm = dbm;
    return Observation{std::move(b)};
}

DeviceType observation_type(const Observation& obs) {
    return std::holds_alternative<WifiObservation>(obs) ? DeviceType::Wifi : DeviceType::Ble;
}

const std::string& observation_mac(const Observation& obs) {
    return std::visit([](const auto& o) -> const std::string& { return o.mac; }, obs);
}

int observation_signal(const Observation& obs) {
    return std::visit([](const auto& o) { return o.signal_dbm; }, obs);
}

} // namespace airscope
