#include "core/DeviceRecord.hpp"
#include "core/VendorResolver.hpp"
#include <algorithm>

namespace airscope {

DeviceRecord::DeviceRecord(DeviceType t, std::string address, size_t history_capacity)
: type(t), mac(std::move(address)), history(history_capacity) {}

void DeviceRecord::apply(const Observation& obs, const std::optional<std::string>& resolved, double now) {
    type = observation_type(obs);
    if (auto w = std::get_if<WifiObservation>(&obs)) {
        ssid = w->ssid;
        name.reset();
    } else {
        const auto& b = std::get<BleObservation>(obs);
        name = b.name;
        ssid.reset();
    }

    if (vendor.empty() && resolved) vendor = *resolved;

    int dbm = observation_signal(obs);
    signal_dbm = dbm;
    last_seen = std::max(now, first_seen);
    history.push_back(dbm);
}

std::string DeviceView::display_name() const {
    if (name && !name->empty()) return *name;
    if (ssid && !ssid->empty()) return *ssid;
    return "(unknown)";
}

std::string DeviceView::vendor_label() const {
    return vendor.empty() ? std::string(VendorResolver::kUnknown) : vendor;
}

DeviceView DeviceView::from_record(const DeviceRecord& r) {
    DeviceView v;
    v.type = r.type;
    v.mac = r.mac;
    v.name = r.name;
    v.ssid = r.ssid;
    v.vendor = r.vendor;
    v.signal_dbm = r.signal_dbm;
    v.first_seen = r.first_seen;
    v.last_seen = r.last_seen;
    v.history.assign(r.history.begin(), r.history.end());
    return v;
}

bool snapshot_order(const DeviceView& a, const DeviceView& b) {
    if (a.type != b.type) return a.type == DeviceType::Wifi;
    if (a.signal_dbm.has_value() != b.signal_dbm.has_value()) return a.signal_dbm.has_value();
    if (a.signal_dbm && *a.signal_dbm != *b.signal_dbm) return *a.signal_dbm > *b.signal_dbm;
    return a.mac < b.mac;
}

} // namespace airscope
