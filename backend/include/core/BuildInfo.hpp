#pragma once

#include <string>

namespace airscope::buildinfo {

inline std::string version() {
#ifdef AIRSCOPE_VERSION
    return std::string(AIRSCOPE_VERSION);
#else
    return "0.0.0";
#endif
}

inline std::string git_commit() {
#ifdef AIRSCOPE_GIT_COMMIT
    return std::string(AIRSCOPE_GIT_COMMIT);
#else
    return "unknown";
#endif
}

inline std::string build_time_utc_approx() {
    // Compiler local time, good enough for provenance headers.
    return std::string(__DATE__) + " " + std::string(__TIME__);
}

// HTTP Server header value
inline std::string server_string() {
    return "airscope/" + version();
}

} // namespace airscope::buildinfo
