#include "scan/BleScanner.hpp"
#include "scan/ScanParsers.hpp"
#include "core/ErrorCatalog.hpp"

#include <bluetooth/bluetooth.h>
#include <bluetooth/hci.h>
#include <bluetooth/hci_lib.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace airscope::scan {

static_assert(sizeof(hci_filter) <= 16, "hci_filter no longer fits the saved buffer");

BleScanner::BleScanner(DeviceStore& store, int hci_index)
: ScanSource(store), hci_index_(hci_index) {}

BleScanner::~BleScanner() {
    stop();
}

bool BleScanner::setup() {
    int dev_id = hci_index_ >= 0 ? hci_index_ : hci_get_route(nullptr);
    if (dev_id < 0) {
        std::cerr << "BleScanner: " << errors::format_E3000_scanner_failed(errors::D3010_HCI_NO_ADAPTER) << std::endl;
        return false;
    }
    dev_ = hci_open_dev(dev_id);
    if (dev_ < 0) {
        std::cerr << "BleScanner: " << errors::format_E3000_scanner_failed(errors::D3011_HCI_OPEN_FAILED)
                  << " (hci" << dev_id << "): " << std::strerror(errno) << std::endl;
        return false;
    }

    le_set_scan_parameters_cp scan_params{};
    scan_params.type = 0x00; // passive
    scan_params.interval = htobs(0x0010);
    scan_params.window = htobs(0x0010);
    scan_params.own_bdaddr_type = 0x00; // public
    scan_params.filter = 0x00; // accept all
    if (hci_send_cmd(dev_, OGF_LE_CTL, OCF_LE_SET_SCAN_PARAMETERS,
                     LE_SET_SCAN_PARAMETERS_CP_SIZE, &scan_params) < 0) {
        std::cerr << "BleScanner: " << errors::format_E3000_scanner_failed(errors::D3012_HCI_SCAN_PARAMS_FAILED) << std::endl;
        hci_close_dev(dev_);
        dev_ = -1;
        return false;
    }

    le_set_scan_enable_cp enable_cp{};
    enable_cp.enable = 0x01;
    enable_cp.filter_dup = 0x00;
    if (hci_send_cmd(dev_, OGF_LE_CTL, OCF_LE_SET_SCAN_ENABLE,
                     LE_SET_SCAN_ENABLE_CP_SIZE, &enable_cp) < 0) {
        std::cerr << "BleScanner: " << errors::format_E3000_scanner_failed(errors::D3013_HCI_SCAN_ENABLE_FAILED) << std::endl;
        hci_close_dev(dev_);
        dev_ = -1;
        return false;
    }

    // only LE meta events on this socket
    socklen_t olen = sizeof(hci_filter);
    filter_saved_ = getsockopt(dev_, SOL_HCI, HCI_FILTER, old_filter_, &olen) == 0;

    struct hci_filter nf;
    hci_filter_clear(&nf);
    hci_filter_set_ptype(HCI_EVENT_PKT, &nf);
    hci_filter_set_event(EVT_LE_META_EVENT, &nf);
    if (setsockopt(dev_, SOL_HCI, HCI_FILTER, &nf, sizeof(nf)) < 0) {
        std::cerr << "BleScanner: setsockopt(HCI_FILTER) failed: " << std::strerror(errno) << std::endl;
    }
    std::cout << "BleScanner: scanning on hci" << dev_id << std::endl;
    return true;
}

void BleScanner::teardown() {
    if (dev_ < 0) return;
    le_set_scan_enable_cp disable{};
    disable.enable = 0x00;
    disable.filter_dup = 0x00;
    if (hci_send_cmd(dev_, OGF_LE_CTL, OCF_LE_SET_SCAN_ENABLE, LE_SET_SCAN_ENABLE_CP_SIZE, &disable) < 0) {
        std::cerr << "BleScanner: LE scan disable failed: " << std::strerror(errno) << std::endl;
    }
    if (filter_saved_ && setsockopt(dev_, SOL_HCI, HCI_FILTER, old_filter_, sizeof(hci_filter)) < 0) {
        std::cerr << "BleScanner: restoring HCI filter failed: " << std::strerror(errno) << std::endl;
    }
    hci_close_dev(dev_);
    dev_ = -1;
}

size_t BleScanner::handle_event(const uint8_t* buf, size_t len) {
    const size_t meta_off = 1 + HCI_EVENT_HDR_SIZE;
    if (len < meta_off + 2) return 0;
    const evt_le_meta_event* me = reinterpret_cast<const evt_le_meta_event*>(buf + meta_off);
    if (me->subevent != EVT_LE_ADVERTISING_REPORT) return 0;

    const uint8_t* p = me->data + 1;
    const uint8_t* end = buf + len;
    size_t delivered = 0;
    for (int i = 0; i < me->data[0]; ++i) {
        if (p + sizeof(le_advertising_info) > end) break;
        const le_advertising_info* info = reinterpret_cast<const le_advertising_info*>(p);
        // AD payload followed by one RSSI byte
        if (p + sizeof(le_advertising_info) + info->length + 1 > end) break;

        char addr[18];
        ba2str(&info->bdaddr, addr);
        int8_t rssi = (int8_t)info->data[info->length];
        auto name = parse_ad_name(info->data, info->length);
        // 127: controller has no RSSI for this report
        std::optional<double> signal;
        if (rssi != 127) signal = (double)rssi;

        auto obs = make_observation(DeviceType::Ble, addr, name.value_or("(unknown)"), signal);
        if (obs) ++delivered;
        deliver(obs);

        p += sizeof(le_advertising_info) + info->length + 1;
    }
    return delivered;
}

void BleScanner::run() {
    uint8_t buf[HCI_MAX_EVENT_SIZE];
    while (running_) {
        struct pollfd pfd{dev_, POLLIN, 0};
        int r = poll(&pfd, 1, 1000);
        if (r < 0) {
            if (errno == EINTR) continue;
            std::cerr << "BleScanner: poll failed: " << std::strerror(errno) << std::endl;
            return;
        }
        if (r == 0) continue;

        ssize_t n = read(dev_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            std::cerr << "BleScanner: read failed: " << std::strerror(errno) << std::endl;
            return;
        }
        handle_event(buf, (size_t)n);
    }
}

} // namespace airscope::scan
