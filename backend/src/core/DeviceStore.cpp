#include "core/DeviceStore.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/VendorResolver.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace airscope {

DeviceStore::DeviceStore(size_t history_capacity, std::shared_ptr<VendorResolver> resolver, Clock clock)
: history_capacity_(history_capacity), resolver_(std::move(resolver)), clock_(std::move(clock)) {
    if (history_capacity_ == 0) throw std::invalid_argument(errors::D1010_HISTORY_CAPACITY_ZERO);
    if (!clock_) clock_ = &DeviceStore::wall_clock_seconds;
}

double DeviceStore::wall_clock_seconds() {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

void DeviceStore::update(DeviceType type,
                         std::string_view raw_address,
                         const std::optional<std::string>& display_name,
                         std::optional<double> signal,
                         const std::optional<std::string>& source_ssid) {
    auto obs = make_observation(type, raw_address, display_name, signal, source_ssid);
    if (!obs) {
        dropped_.fetch_add(1);
        return;
    }
    ingest(*obs);
}

void DeviceStore::ingest(const Observation& obs) {
    const std::string& mac = observation_mac(obs);
    if (mac.empty()) {
        dropped_.fetch_add(1);
        return;
    }

    bool need_vendor = true;
    {
        std::lock_guard<std::mutex> lk(store_m_);
        auto it = records_.find(mac);
        if (it != records_.end()) need_vendor = it->second.vendor.empty();
    }

    // may hit the network; never under store_m_
    std::optional<std::string> vendor;
    if (need_vendor && resolver_) vendor = resolver_->resolve(mac);

    std::lock_guard<std::mutex> lk(store_m_);
    double now = clock_();
    auto it = records_.find(mac);
    if (it == records_.end()) {
        it = records_.emplace(mac, DeviceRecord(observation_type(obs), mac, history_capacity_)).first;
        it->second.first_seen = now;
    }
    it->second.apply(obs, vendor, now);
}

std::vector<DeviceView> DeviceStore::snapshot() const {
    std::vector<DeviceView> out;
    {
        std::lock_guard<std::mutex> lk(store_m_);
        out.reserve(records_.size());
        for (const auto& [mac, rec] : records_) out.push_back(DeviceView::from_record(rec));
    }
    std::sort(out.begin(), out.end(), snapshot_order);
    return out;
}

size_t DeviceStore::size() const {
    std::lock_guard<std::mutex> lk(store_m_);
    return records_.size();
}

} // namespace airscope
