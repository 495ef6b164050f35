#pragma once

#include <string>
#include <string_view>

namespace airscope::errors {

// 1000-1099: configuration errors (fatal at startup)
// 2000-2099: HTTP / WebSocket presentation errors
// 3000-3099: scan source errors (end that source only)
// 4000-4099: snapshot recorder errors

inline constexpr const char* MSG_E1000_CONFIG_INVALID_PREFIX = "Error 1000: Invalid configuration: ";
inline constexpr const char* MSG_E2000_REQUEST_REJECTED_PREFIX = "Error 2000: Request rejected: ";
inline constexpr const char* MSG_E3000_SCANNER_FAILED_PREFIX = "Error 3000: Scanner failed: ";
inline constexpr const char* MSG_E4000_RECORDER_FAILED_PREFIX = "Error 4000: Recorder failed: ";

inline constexpr const char* D1000_INVALID = "invalid configuration";
inline constexpr const char* D1010_HISTORY_CAPACITY_ZERO = "history_capacity must be > 0";
inline constexpr const char* D1011_HISTORY_CAPACITY_RANGE = "history_capacity must be between 1 and 100000";
inline constexpr const char* D1012_PORT_RANGE = "port must be between 1 and 65535";
inline constexpr const char* D1013_WS_PORT_RANGE = "ws_port must be between 0 and 65535";
inline constexpr const char* D1014_INTERVAL_INVALID = "intervals and timeouts must be > 0";
inline constexpr const char* D1020_UNKNOWN_OPTION = "unknown option ";
inline constexpr const char* D1021_MISSING_VALUE = "missing value for ";
inline constexpr const char* D1022_NOT_A_NUMBER = "expected an integer for ";
inline constexpr const char* D1030_CONFIG_FILE_UNREADABLE = "unable to open config file ";
inline constexpr const char* D1031_CONFIG_FILE_INVALID = "config file is not valid: ";

inline constexpr const char* D2004_NOT_FOUND = "not found";
inline constexpr const char* D2005_METHOD_NOT_ALLOWED = "method not allowed";

inline constexpr const char* D3001_IW_SPAWN_FAILED = "failed to run iw";
inline constexpr const char* D3010_HCI_NO_ADAPTER = "no bluetooth adapter";
inline constexpr const char* D3011_HCI_OPEN_FAILED = "hci_open_dev failed";
inline constexpr const char* D3012_HCI_SCAN_PARAMS_FAILED = "LE set scan parameters failed";
inline constexpr const char* D3013_HCI_SCAN_ENABLE_FAILED = "LE set scan enable failed";

inline constexpr const char* D4001_OPEN_FILE_FAILED = "failed to open recording file";

inline std::string with_prefix(const char* prefix, std::string_view detail, const char* fallback) {
    std::string out(prefix);
    if (detail.empty()) out.append(fallback);
    else out.append(detail.data(), detail.size());
    return out;
}

inline std::string format_E1000_config_invalid(std::string_view detail) {
    return with_prefix(MSG_E1000_CONFIG_INVALID_PREFIX, detail, D1000_INVALID);
}

inline std::string format_E2000_request_rejected(std::string_view detail) {
    return with_prefix(MSG_E2000_REQUEST_REJECTED_PREFIX, detail, D2004_NOT_FOUND);
}

inline std::string format_E3000_scanner_failed(std::string_view detail) {
    return with_prefix(MSG_E3000_SCANNER_FAILED_PREFIX, detail, "unknown error");
}

inline std::string format_E4000_recorder_failed(std::string_view detail) {
    return with_prefix(MSG_E4000_RECORDER_FAILED_PREFIX, detail, D4001_OPEN_FILE_FAILED);
}

} // namespace airscope::errors
