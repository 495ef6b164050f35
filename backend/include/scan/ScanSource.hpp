#pragma once
#include "core/Observation.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace airscope {
class DeviceStore;
}

namespace airscope::scan {

/**
 * @brief Background producer feeding observations into a DeviceStore.
 *
 * start() runs setup() on the caller's thread and then run() on a worker;
 * stop() wakes the worker, joins it and runs teardown(). Derived classes must
 * call stop() from their own destructor.
 */
class ScanSource {
public:
    explicit ScanSource(DeviceStore& store);
    virtual ~ScanSource();

    ScanSource(const ScanSource&) = delete;
    ScanSource& operator=(const ScanSource&) = delete;

    virtual std::string name() const = 0;

    bool start();
    void stop();
    bool running() const { return running_.load(); }

    uint64_t delivered() const { return delivered_.load(); }
    uint64_t dropped() const { return dropped_.load(); }

protected:
    virtual bool setup() { return true; }
    virtual void run() = 0;
    virtual void teardown() {}

    // Sleep for up to `d`; false once stop() has been requested.
    bool wait_for(std::chrono::milliseconds d);

    void deliver(const std::optional<Observation>& obs);

    std::atomic<bool> running_{false};

private:
    DeviceStore& store_;
    std::thread worker_;
    std::mutex wake_m_;
    std::condition_variable wake_;
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> dropped_{0};
};

} // namespace airscope::scan
