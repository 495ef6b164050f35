#pragma once
#include "core/DeviceRecord.hpp"
#include "core/Observation.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace airscope {

class VendorResolver;

/**
 * @brief Concurrent map of normalized address -> DeviceRecord.
 *
 * Scan sources call update()/ingest() from their own threads; presentation
 * code calls snapshot(). Both are serialized by one mutex. Vendor resolution
 * happens before that mutex is taken.
 */
class DeviceStore {
public:
    // seconds since epoch
    using Clock = std::function<double()>;

    explicit DeviceStore(size_t history_capacity = 60,
                         std::shared_ptr<VendorResolver> resolver = nullptr,
                         Clock clock = nullptr);

    // Incomplete observations (no usable address, no signal) are dropped.
    void update(DeviceType type,
                std::string_view raw_address,
                const std::optional<std::string>& display_name,
                std::optional<double> signal,
                const std::optional<std::string>& source_ssid = std::nullopt);

    void ingest(const Observation& obs);

    // Ordered point-in-time copy; see snapshot_order().
    std::vector<DeviceView> snapshot() const;

    size_t size() const;
    size_t history_capacity() const { return history_capacity_; }
    uint64_t dropped() const { return dropped_.load(); }

    static double wall_clock_seconds();

private:
    size_t history_capacity_;
    std::shared_ptr<VendorResolver> resolver_;
    Clock clock_;

    mutable std::mutex store_m_;
    std::unordered_map<std::string, DeviceRecord> records_;
    std::atomic<uint64_t> dropped_{0};
};

} // namespace airscope
