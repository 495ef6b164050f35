#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace airscope {

class DeviceStore;
struct DeviceView;

// JSON shapes shared by the HTTP API, the WebSocket stream and the recorder.
class DeviceProtocol {
public:
    explicit DeviceProtocol(const DeviceStore& store);

    // {"devices": [...], "server_time": t}
    nlohmann::json build_devices_payload();
    // devices payload tagged with "type": "devices"
    nlohmann::json build_stream_message();

    static nlohmann::json device_to_json(const DeviceView& v);
    static nlohmann::json devices_payload(const std::vector<DeviceView>& snapshot, double server_time);
    static std::string iso8601_local(double epoch_seconds);

private:
    const DeviceStore& store;
};

} // namespace airscope
