#pragma once
#include "core/Observation.hpp"
#include <boost/circular_buffer.hpp>
#include <optional>
#include <string>
#include <vector>

namespace airscope {

// Aggregate state for one normalized address. Owned by DeviceStore and only
// touched under its lock.
struct DeviceRecord {
    DeviceRecord(DeviceType t, std::string address, size_t history_capacity);

    // Fold one observation in; `vendor` is only used while the field is empty.
    void apply(const Observation& obs, const std::optional<std::string>& vendor, double now);

    DeviceType type;
    std::string mac;
    std::optional<std::string> name; // BLE advertised name
    std::optional<std::string> ssid; // Wi-Fi network name
    std::string vendor;
    std::optional<int> signal_dbm;
    double first_seen = 0.0;
    double last_seen = 0.0;
    boost::circular_buffer<int> history; // oldest first
};

struct DeviceView {
    DeviceType type = DeviceType::Wifi;
    std::string mac;
    std::optional<std::string> name;
    std::optional<std::string> ssid;
    std::string vendor;
    std::optional<int> signal_dbm;
    double first_seen = 0.0;
    double last_seen = 0.0;
    std::vector<int> history;

    /** @brief BLE name, else SSID, else "(unknown)" */
    std::string display_name() const;
    /** @brief Vendor label, "Unknown" when unresolved */
    std::string vendor_label() const;

    static DeviceView from_record(const DeviceRecord& r);
};

// Snapshot ordering: wifi before ble, strongest signal first, records without a
// signal last within their type, then address.
bool snapshot_order(const DeviceView& a, const DeviceView& b);

} // namespace airscope
