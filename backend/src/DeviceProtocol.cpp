#include "DeviceProtocol.hpp"
#include "core/DeviceStore.hpp"
#include <cmath>
#include <ctime>
#include <cstdio>

using json = nlohmann::json;

namespace airscope {

DeviceProtocol::DeviceProtocol(const DeviceStore& s)
: store(s) {}

json DeviceProtocol::build_devices_payload() {
    return devices_payload(store.snapshot(), DeviceStore::wall_clock_seconds());
}

json DeviceProtocol::build_stream_message() {
    json msg = build_devices_payload();
    msg["type"] = "devices";
    return msg;
}

json DeviceProtocol::device_to_json(const DeviceView& v) {
    return {
        {"type", to_string(v.type)},
        {"name", v.display_name()},
        {"mac", v.mac},
        {"vendor", v.vendor_label()},
        {"first_seen", v.first_seen},
        {"last_seen", v.last_seen},
        {"last_seen_iso", iso8601_local(v.last_seen)},
        {"signal_dbm", v.signal_dbm ? json(*v.signal_dbm) : json(nullptr)},
        {"history", v.history}
    };
}

json DeviceProtocol::devices_payload(const std::vector<DeviceView>& snapshot, double server_time) {
    json devices = json::array();
    for (const auto& v : snapshot) devices.push_back(device_to_json(v));
    return {
        {"devices", devices},
        {"server_time", server_time}
    };
}

std::string DeviceProtocol::iso8601_local(double epoch_seconds) {
    double whole = std::floor(epoch_seconds);
    std::time_t tt = (std::time_t)whole;
    int micros = (int)std::lround((epoch_seconds - whole) * 1e6);
    if (micros >= 1000000) { tt += 1; micros -= 1000000; }

    std::tm tm{};
    localtime_r(&tt, &tm);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char zone[8];
    std::strftime(zone, sizeof(zone), "%z", &tm);

    // %z gives +hhmm; ISO 8601 wants +hh:mm
    std::string z(zone);
    if (z.size() == 5) z.insert(3, ":");

    char frac[16];
    std::snprintf(frac, sizeof(frac), ".%06d", micros);
    return std::string(date) + frac + z;
}

} // namespace airscope
