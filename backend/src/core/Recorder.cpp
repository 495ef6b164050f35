#include "core/Recorder.hpp"

#include "DeviceProtocol.hpp"
#include "core/BuildInfo.hpp"
#include "core/DeviceStore.hpp"
#include "core/ErrorCatalog.hpp"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

using json = nlohmann::json;

namespace airscope {

Recorder::Recorder(const DeviceStore& store) : store_(store) {}

Recorder::~Recorder() {
    stop_all();
}

int64_t Recorder::now_ms() {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Recorder::random_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(16);
    for (int i = 0; i < 16; ++i) out.push_back(hex[(rng() >> ((i % 8) * 8)) & 0xF]);
    return out;
}

std::string Recorder::sanitize_base(std::string base) {
    for (char& c : base) {
        if (!(std::isalnum((unsigned char)c) || c == '_' || c == '-' || c == '.')) c = '_';
    }
    if (base.empty()) base = "snapshots";
    return base;
}

RecordStartResult Recorder::start(const std::string& dir, std::chrono::milliseconds interval, const std::string& file_base) {
    if (interval.count() <= 0) throw std::invalid_argument(errors::D1014_INTERVAL_INVALID);

    auto session = std::make_shared<Session>();
    session->id = random_id();
    session->interval = interval;
    session->started_ts_ms = now_ms();

    // Place recordings under YYYY-MM-DD/
    std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream day;
    day << std::setfill('0') << std::setw(4) << (tm.tm_year + 1900) << "-" << std::setw(2) << (tm.tm_mon + 1) << "-" << std::setw(2) << tm.tm_mday;

    std::filesystem::path day_dir = std::filesystem::path(dir) / day.str();
    std::error_code ec;
    std::filesystem::create_directories(day_dir, ec);
    if (ec) throw std::runtime_error(errors::format_E4000_recorder_failed(ec.message()));

    std::filesystem::path path = day_dir / (sanitize_base(file_base) + "_" + session->id + ".jsonl");
    session->path = path.string();

    session->file.open(session->path, std::ios::out | std::ios::trunc);
    if (!session->file) throw std::runtime_error(errors::format_E4000_recorder_failed(errors::D4001_OPEN_FILE_FAILED));

    json header = {
        {"type", "airscope_recording"},
        {"schema_version", 1},
        {"recording_id", session->id},
        {"started_ts_ms", session->started_ts_ms},
        {"interval_ms", (int64_t)interval.count()},
        {"meta", {
            {"history_capacity", store_.history_capacity()},
            {"backend", {
                {"version", buildinfo::version()},
                {"git_commit", buildinfo::git_commit()},
                {"build_time", buildinfo::build_time_utc_approx()}
            }}
        }}
    };

    {
        std::lock_guard<std::mutex> lk(session->file_m);
        session->file << header.dump() << "\n";
        session->file.flush();
    }

    session->running.store(true);
    session->worker = std::thread([this, session]() { run_session(session); });

    {
        std::lock_guard<std::mutex> lk(sessions_m_);
        sessions_[session->id] = session;
    }

    std::cout << "Recorder: writing snapshots to " << session->path << std::endl;
    return { session->id, session->path };
}

void Recorder::write_sample(Session& s) {
    int64_t ts = now_ms();
    json line = {
        {"type", "snapshot"},
        {"ts_ms", ts},
        {"devices", DeviceProtocol::devices_payload(store_.snapshot(), ts / 1000.0)["devices"]}
    };

    std::lock_guard<std::mutex> lk(s.file_m);
    if (!s.file) return;
    s.file << line.dump() << "\n";
    s.file.flush();
    if (!s.file) {
        std::cerr << "Recorder: write failed for " << s.path << std::endl;
        return;
    }
    s.samples_written += 1;
}

void Recorder::run_session(const std::shared_ptr<Session>& s) {
    while (s->running.load()) {
        write_sample(*s);
        std::unique_lock<std::mutex> lk(s->wake_m);
        s->wake.wait_for(lk, s->interval, [&]() { return !s->running.load(); });
    }

    std::lock_guard<std::mutex> lk(s->file_m);
    s->stopped_ts_ms = now_ms();
    if (s->file) {
        json footer = {
            {"type", "stop"},
            {"recording_id", s->id},
            {"stopped_ts_ms", s->stopped_ts_ms},
            {"samples_written", s->samples_written}
        };
        s->file << footer.dump() << "\n";
        s->file.flush();
        s->file.close();
    }
}

std::optional<RecordStopResult> Recorder::stop(const std::string& recording_id) {
    std::shared_ptr<Session> s;
    {
        std::lock_guard<std::mutex> lk(sessions_m_);
        auto it = sessions_.find(recording_id);
        if (it == sessions_.end()) return std::nullopt;
        s = it->second;
        sessions_.erase(it);
    }

    {
        std::lock_guard<std::mutex> lk(s->wake_m);
        s->running.store(false);
    }
    s->wake.notify_all();
    if (s->worker.joinable()) s->worker.join();

    RecordStopResult out;
    out.recording_id = s->id;
    out.path = s->path;
    {
        std::lock_guard<std::mutex> lk(s->file_m);
        out.samples_written = s->samples_written;
        out.stopped_ts_ms = s->stopped_ts_ms ? s->stopped_ts_ms : now_ms();
    }
    out.started_ts_ms = s->started_ts_ms;
    return out;
}

void Recorder::stop_all() {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lk(sessions_m_);
        for (const auto& [id, _] : sessions_) ids.push_back(id);
    }
    for (const auto& id : ids) stop(id);
}

} // namespace airscope
