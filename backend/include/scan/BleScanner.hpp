#pragma once
#include "scan/ScanSource.hpp"
#include <cstdint>
#include <string>

namespace airscope::scan {

/**
 * BleScanner
 * - Receives LE advertising reports straight from a BlueZ HCI raw socket.
 * - Passive scan, duplicate filtering off so every advertisement refreshes RSSI.
 * - Needs CAP_NET_RAW / CAP_NET_ADMIN; no bluetoothd or D-Bus required.
 */
class BleScanner : public ScanSource {
public:
    // hci_index < 0 picks the first available adapter
    BleScanner(DeviceStore& store, int hci_index = 0);
    ~BleScanner() override;

    std::string name() const override { return "BleScanner"; }

    // Walk one HCI LE meta event buffer; returns reports delivered.
    size_t handle_event(const uint8_t* buf, size_t len);

protected:
    bool setup() override;
    void run() override;
    void teardown() override;

private:
    int hci_index_;
    int dev_ = -1; ///< HCI raw socket fd
    bool filter_saved_ = false;
    unsigned char old_filter_[16] = {}; ///< struct hci_filter, restored on teardown
};

} // namespace airscope::scan
