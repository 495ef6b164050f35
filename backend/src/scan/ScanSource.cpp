#include "scan/ScanSource.hpp"
#include "core/DeviceStore.hpp"
#include <iostream>

namespace airscope::scan {

ScanSource::ScanSource(DeviceStore& store) : store_(store) {}

ScanSource::~ScanSource() {
    // teardown() is already gone at this point; derived destructors stop first
    running_ = false;
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

bool ScanSource::start() {
    if (running_) return false;
    // a worker that gave up on its own is still joinable
    if (worker_.joinable()) {
        worker_.join();
        teardown();
    }
    if (!setup()) return false;
    running_ = true;
    worker_ = std::thread([this]() {
        try {
            run();
        } catch (const std::exception& e) {
            std::cerr << name() << ": fatal: " << e.what() << std::endl;
        }
        running_ = false;
    });
    std::cout << name() << ": started" << std::endl;
    return true;
}

void ScanSource::stop() {
    bool had_worker = worker_.joinable();
    {
        std::lock_guard<std::mutex> lk(wake_m_);
        running_ = false;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
    if (had_worker) {
        teardown();
        std::cout << name() << ": stopped (delivered=" << delivered() << ", dropped=" << dropped() << ")" << std::endl;
    }
}

bool ScanSource::wait_for(std::chrono::milliseconds d) {
    std::unique_lock<std::mutex> lk(wake_m_);
    wake_.wait_for(lk, d, [this]() { return !running_.load(); });
    return running_.load();
}

void ScanSource::deliver(const std::optional<Observation>& obs) {
    if (!obs) {
        dropped_.fetch_add(1);
        return;
    }
    store_.ingest(*obs);
    delivered_.fetch_add(1);
}

} // namespace airscope::scan
