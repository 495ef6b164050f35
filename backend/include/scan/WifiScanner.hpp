#pragma once
#include "scan/ScanSource.hpp"
#include <chrono>
#include <string>

namespace airscope::scan {

// Polls `iw dev <iface> scan` every interval.
class WifiScanner : public ScanSource {
public:
    WifiScanner(DeviceStore& store,
                std::string iface,
                std::chrono::seconds interval = std::chrono::seconds(5),
                std::chrono::milliseconds settle = std::chrono::milliseconds(2500));
    ~WifiScanner() override;

    std::string name() const override { return "WifiScanner"; }

    // Feed one block of iw output into the store; returns entries accepted.
    size_t ingest_output(const std::string& text);

protected:
    void run() override;

private:
    bool run_command(const std::string& cmd, std::string& output);

    std::string iface_;
    std::chrono::seconds interval_;
    std::chrono::milliseconds settle_;
};

} // namespace airscope::scan
