#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace airscope {

class DeviceProtocol;
class DeviceStore;

// Streams device snapshots to every connected WebSocket client.
class WebSocketServer {
public:
    WebSocketServer(int port, const DeviceStore& store,
                    std::chrono::milliseconds interval = std::chrono::milliseconds(1000));
    ~WebSocketServer();

    void start();
    void stop();

    int bound_port() const { return port; }
    size_t session_count() const;

    // Handle a control message from a client; returns the reply, if any.
    std::optional<nlohmann::json> handle_control(const nlohmann::json& msg);

private:
    struct Impl;

    void run_event_loop();
    void broadcast_loop();

    int port;
    std::chrono::milliseconds interval;
    std::atomic<bool> running;
    std::thread event_thread;
    std::thread broadcast_thread;
    std::mutex wake_m;
    std::condition_variable wake;

    const DeviceStore& store;
    std::unique_ptr<DeviceProtocol> protocol;
    std::shared_ptr<Impl> impl;
};

} // namespace airscope
