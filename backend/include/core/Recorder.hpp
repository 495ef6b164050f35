#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace airscope {

class DeviceStore;

struct RecordStartResult {
    std::string recording_id;
    std::string path;
};

struct RecordStopResult {
    std::string recording_id;
    std::string path;
    int64_t samples_written = 0;
    int64_t started_ts_ms = 0;
    int64_t stopped_ts_ms = 0;
};

// Appends periodic store snapshots to <dir>/YYYY-MM-DD/<base>_<id>.jsonl.
class Recorder {
public:
    explicit Recorder(const DeviceStore& store);
    ~Recorder();

    RecordStartResult start(const std::string& dir,
                            std::chrono::milliseconds interval,
                            const std::string& file_base = "snapshots");
    std::optional<RecordStopResult> stop(const std::string& recording_id);
    void stop_all();

private:
    struct Session {
        std::string id;
        std::string path;
        int64_t started_ts_ms = 0;
        std::chrono::milliseconds interval{5000};

        std::atomic<bool> running{false};
        std::mutex wake_m;
        std::condition_variable wake;
        std::thread worker;

        std::mutex file_m;
        std::ofstream file;
        int64_t samples_written = 0;
        int64_t stopped_ts_ms = 0;
    };

    const DeviceStore& store_;

    std::mutex sessions_m_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;

    static std::string random_id();
    static int64_t now_ms();
    static std::string sanitize_base(std::string base);

    void write_sample(Session& s);
    void run_session(const std::shared_ptr<Session>& s);
};

} // namespace airscope
