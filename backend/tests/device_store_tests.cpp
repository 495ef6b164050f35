#include <gtest/gtest.h>
#include "core/DeviceStore.hpp"
#include "core/VendorResolver.hpp"
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace airscope;

namespace {

// Deterministic clock: each call advances by one second.
DeviceStore::Clock stepping_clock(double start) {
    auto t = std::make_shared<double>(start);
    return [t]() { double now = *t; *t += 1.0; return now; };
}

class FixedLookup : public IVendorLookup {
public:
    std::optional<std::string> lookup(const std::string&) override {
        calls.fetch_add(1);
        return std::string("Acme");
    }
    std::atomic<int> calls{0};
};

DeviceView view(DeviceType t, const std::string& mac, std::optional<int> signal) {
    DeviceView v;
    v.type = t;
    v.mac = mac;
    v.signal_dbm = signal;
    return v;
}

} // namespace

TEST(DeviceStore, HistoryKeepsLastSamplesAcrossSpellings) {
    DeviceStore store(3, nullptr, stepping_clock(1000.0));
    store.update(DeviceType::Wifi, "AA:BB:CC:11:22:33", std::string("HomeNet"), -40.0);
    store.update(DeviceType::Wifi, "aabbcc112233", std::string("HomeNet"), -45.0);
    store.update(DeviceType::Wifi, "AA-BB-CC-11-22-33", std::string("HomeNet"), -38.0);
    store.update(DeviceType::Wifi, "AA:BB:CC:11:22:33", std::string("HomeNet"), -50.0);

    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 1u);
    const auto& d = snap[0];
    EXPECT_EQ(d.mac, "AA:BB:CC:11:22:33");
    EXPECT_EQ(d.history, (std::vector<int>{-45, -38, -50}));
    EXPECT_EQ(d.signal_dbm, std::optional<int>(-50));
    EXPECT_DOUBLE_EQ(d.first_seen, 1000.0);
    EXPECT_DOUBLE_EQ(d.last_seen, 1003.0);
    EXPECT_EQ(d.display_name(), "HomeNet");
}

TEST(DeviceStore, SnapshotListsWifiBeforeBle) {
    DeviceStore store;
    store.update(DeviceType::Ble, "11:22:33:44:55:66", std::string("Tag"), -70.0);
    store.update(DeviceType::Wifi, "77:88:99:AA:BB:CC", std::string("Cafe"), -30.0);

    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_EQ(snap[0].type, DeviceType::Wifi);
    EXPECT_EQ(snap[0].signal_dbm, std::optional<int>(-30));
    EXPECT_EQ(snap[1].type, DeviceType::Ble);
    EXPECT_EQ(snap[1].signal_dbm, std::optional<int>(-70));
}

TEST(DeviceStore, SnapshotSortsBySignalWithinType) {
    DeviceStore store;
    store.update(DeviceType::Wifi, "00:00:00:00:00:01", std::string("a"), -80.0);
    store.update(DeviceType::Wifi, "00:00:00:00:00:02", std::string("b"), -20.0);
    store.update(DeviceType::Ble, "00:00:00:00:00:03", std::string("c"), -90.0);
    store.update(DeviceType::Ble, "00:00:00:00:00:04", std::string("d"), -10.0);
    store.update(DeviceType::Wifi, "00:00:00:00:00:05", std::string("e"), -50.0);

    auto snap = store.snapshot();
    std::vector<std::string> order;
    for (const auto& d : snap) order.push_back(d.mac.substr(15));
    EXPECT_EQ(order, (std::vector<std::string>{"02", "05", "01", "04", "03"}));
}

TEST(DeviceStore, SnapshotOrderPutsMissingSignalLast) {
    std::vector<DeviceView> v{
        view(DeviceType::Ble, "B1", -60),
        view(DeviceType::Wifi, "W2", std::nullopt),
        view(DeviceType::Wifi, "W1", -90),
        view(DeviceType::Ble, "B0", std::nullopt),
        view(DeviceType::Wifi, "W0", -90),
    };
    std::sort(v.begin(), v.end(), snapshot_order);
    std::vector<std::string> macs;
    for (const auto& d : v) macs.push_back(d.mac);
    EXPECT_EQ(macs, (std::vector<std::string>{"W0", "W1", "W2", "B1", "B0"}));
}

TEST(DeviceStore, DropsIncompleteObservations) {
    DeviceStore store;
    store.update(DeviceType::Wifi, "", std::string("x"), -40.0);
    store.update(DeviceType::Ble, "11:22:33:44:55:66", std::nullopt, std::nullopt);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.dropped(), 2u);
    EXPECT_TRUE(store.snapshot().empty());
}

TEST(DeviceStore, MalformedUpdateLeavesExistingRecordUntouched) {
    DeviceStore store(5, nullptr, stepping_clock(500.0));
    store.update(DeviceType::Ble, "11:22:33:44:55:66", std::string("Tag"), -60.0);
    auto before = store.snapshot();
    ASSERT_EQ(before.size(), 1u);

    store.update(DeviceType::Wifi, "11:22:33:44:55:66", std::string("Other"), std::nullopt);
    store.update(DeviceType::Wifi, "11-22-33-44-55-66", std::string("Other"), 1e12);

    auto after = store.snapshot();
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].type, DeviceType::Ble);
    EXPECT_EQ(after[0].name, std::optional<std::string>("Tag"));
    EXPECT_FALSE(after[0].ssid.has_value());
    EXPECT_EQ(after[0].history, before[0].history);
    EXPECT_EQ(after[0].signal_dbm, std::optional<int>(-60));
    EXPECT_DOUBLE_EQ(after[0].last_seen, before[0].last_seen);
    EXPECT_DOUBLE_EQ(after[0].first_seen, before[0].first_seen);
    EXPECT_EQ(store.dropped(), 2u);
}

TEST(DeviceStore, LatestTypeWinsAndNameFieldsAreExclusive) {
    DeviceStore store;
    store.update(DeviceType::Wifi, "AA:AA:AA:AA:AA:AA", std::string("Net"), -40.0);
    store.update(DeviceType::Ble, "aa:aa:aa:aa:aa:aa", std::string("Beacon"), -70.0);

    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].type, DeviceType::Ble);
    EXPECT_EQ(snap[0].name, std::optional<std::string>("Beacon"));
    EXPECT_FALSE(snap[0].ssid.has_value());
    EXPECT_EQ(snap[0].history, (std::vector<int>{-40, -70}));

    store.update(DeviceType::Wifi, "AA:AA:AA:AA:AA:AA", std::nullopt, -41.0, std::string("Net2"));
    snap = store.snapshot();
    EXPECT_EQ(snap[0].type, DeviceType::Wifi);
    EXPECT_EQ(snap[0].ssid, std::optional<std::string>("Net2"));
    EXPECT_FALSE(snap[0].name.has_value());
}

TEST(DeviceStore, UnnamedDeviceShowsPlaceholders) {
    DeviceStore store;
    store.update(DeviceType::Ble, "11:22:33:44:55:66", std::nullopt, -60.0);
    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].display_name(), "(unknown)");
    EXPECT_EQ(snap[0].vendor_label(), "Unknown");
}

TEST(DeviceStore, VendorResolvedOncePerRecord) {
    auto backend = std::make_shared<FixedLookup>();
    auto resolver = std::make_shared<VendorResolver>(backend);
    DeviceStore store(60, resolver);

    for (int i = 0; i < 5; ++i) store.update(DeviceType::Wifi, "AA:BB:CC:00:00:01", std::string("n"), -40.0 - i);
    store.update(DeviceType::Wifi, "AA:BB:CC:00:00:02", std::string("m"), -40.0);

    auto snap = store.snapshot();
    ASSERT_EQ(snap.size(), 2u);
    for (const auto& d : snap) EXPECT_EQ(d.vendor, "Acme");
    EXPECT_EQ(backend->calls.load(), 1);
    EXPECT_EQ(resolver->cache_size(), 1u);
}

TEST(DeviceStore, ZeroCapacityIsRejected) {
    EXPECT_THROW(DeviceStore(0), std::invalid_argument);
}

TEST(DeviceStore, SnapshotIsIndependentCopy) {
    DeviceStore store(5);
    store.update(DeviceType::Wifi, "AA:BB:CC:DD:EE:01", std::string("x"), -40.0);
    auto before = store.snapshot();
    store.update(DeviceType::Wifi, "AA:BB:CC:DD:EE:01", std::string("x"), -41.0);
    store.update(DeviceType::Wifi, "AA:BB:CC:DD:EE:02", std::string("y"), -42.0);

    ASSERT_EQ(before.size(), 1u);
    EXPECT_EQ(before[0].history, (std::vector<int>{-40}));
    EXPECT_EQ(store.snapshot().size(), 2u);
}

TEST(DeviceStore, ConcurrentWritersAndReaders) {
    DeviceStore store(10);
    std::atomic<bool> done{false};
    std::atomic<int> bad_snapshots{0};

    std::thread reader([&]() {
        while (!done.load()) {
            auto snap = store.snapshot();
            for (size_t i = 1; i < snap.size(); ++i) {
                if (snapshot_order(snap[i], snap[i - 1])) bad_snapshots.fetch_add(1);
            }
            for (const auto& d : snap) {
                if (d.history.size() > 10) bad_snapshots.fetch_add(1);
            }
        }
    });

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&store, w]() {
            DeviceType t = (w % 2 == 0) ? DeviceType::Wifi : DeviceType::Ble;
            for (int i = 0; i < 500; ++i) {
                char mac[18];
                std::snprintf(mac, sizeof(mac), "02:00:00:00:%02X:%02X", w, i % 20);
                store.update(t, mac, std::string("dev"), -30.0 - (i % 60));
            }
        });
    }
    for (auto& t : writers) t.join();
    done.store(true);
    reader.join();

    EXPECT_EQ(bad_snapshots.load(), 0);
    EXPECT_EQ(store.size(), 80u);
    for (const auto& d : store.snapshot()) {
        EXPECT_EQ(d.history.size(), 10u);
        EXPECT_GE(d.last_seen, d.first_seen);
    }
}
