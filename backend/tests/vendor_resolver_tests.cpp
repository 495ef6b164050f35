#include <gtest/gtest.h>
#include "core/VendorResolver.hpp"
#include "core/DeviceStore.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace airscope;

namespace {

class CountingLookup : public IVendorLookup {
public:
    explicit CountingLookup(std::optional<std::string> answer, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
    : answer_(std::move(answer)), delay_(delay) {}

    std::optional<std::string> lookup(const std::string&) override {
        calls.fetch_add(1);
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        return answer_;
    }

    std::atomic<int> calls{0};

private:
    std::optional<std::string> answer_;
    std::chrono::milliseconds delay_;
};

class ThrowingLookup : public IVendorLookup {
public:
    std::optional<std::string> lookup(const std::string&) override {
        throw std::runtime_error("backend down");
    }
};

struct BackendFault {};

class FaultingLookup : public IVendorLookup {
public:
    std::optional<std::string> lookup(const std::string&) override {
        calls.fetch_add(1);
        throw BackendFault{};
    }
    std::atomic<int> calls{0};
};

} // namespace

TEST(VendorResolver, CachesPerPrefix) {
    auto backend = std::make_shared<CountingLookup>(std::string("Acme Corp"));
    VendorResolver resolver(backend);

    EXPECT_EQ(resolver.resolve("aa:bb:cc:00:00:01"), std::optional<std::string>("Acme Corp"));
    EXPECT_EQ(resolver.resolve("AA-BB-CC-99-99-99"), std::optional<std::string>("Acme Corp"));
    EXPECT_EQ(backend->calls.load(), 1);
    EXPECT_EQ(resolver.cache_size(), 1u);

    resolver.resolve("11:22:33:44:55:66");
    EXPECT_EQ(backend->calls.load(), 2);
    EXPECT_EQ(resolver.cache_size(), 2u);
}

TEST(VendorResolver, ConcurrentCallersShareOneLookup) {
    auto backend = std::make_shared<CountingLookup>(std::string("Slow Inc"), std::chrono::milliseconds(100));
    VendorResolver resolver(backend);

    std::vector<std::thread> threads;
    std::atomic<int> matches{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            auto v = resolver.resolve("DE:AD:BE:00:00:0" + std::to_string(i));
            if (v && *v == "Slow Inc") matches.fetch_add(1);
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(backend->calls.load(), 1);
    EXPECT_EQ(matches.load(), 8);
}

TEST(VendorResolver, BackendFailureCachesUnknown) {
    VendorResolver resolver(std::make_shared<ThrowingLookup>());
    EXPECT_EQ(resolver.resolve("AA:BB:CC:DD:EE:FF"), std::optional<std::string>(VendorResolver::kUnknown));
    EXPECT_EQ(resolver.cache_size(), 1u);
}

TEST(VendorResolver, MissingAnswerIsUnknown) {
    auto backend = std::make_shared<CountingLookup>(std::nullopt);
    VendorResolver resolver(backend);
    EXPECT_EQ(resolver.resolve("AA:BB:CC:DD:EE:FF"), std::optional<std::string>("Unknown"));
    EXPECT_EQ(resolver.resolve("AA:BB:CC:11:22:33"), std::optional<std::string>("Unknown"));
    EXPECT_EQ(backend->calls.load(), 1);
}

TEST(VendorResolver, NoBackendIsUnknown) {
    VendorResolver resolver;
    EXPECT_FALSE(resolver.has_backend());
    EXPECT_EQ(resolver.resolve("AA:BB:CC:DD:EE:FF"), std::optional<std::string>("Unknown"));
}

TEST(VendorResolver, SlowBackendTimesOut) {
    auto backend = std::make_shared<CountingLookup>(std::string("Too Late"), std::chrono::milliseconds(500));
    VendorResolver resolver(backend, std::chrono::milliseconds(50));

    auto t0 = std::chrono::steady_clock::now();
    auto v = resolver.resolve("AA:BB:CC:DD:EE:FF");
    auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(v, std::optional<std::string>("Unknown"));
    EXPECT_LT(elapsed, std::chrono::milliseconds(400));
    // the timeout result is cached too
    EXPECT_EQ(resolver.resolve("AA:BB:CC:00:00:00"), std::optional<std::string>("Unknown"));
    // the abandoned lookup still runs to completion, once
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(backend->calls.load(), 1);
}

TEST(VendorResolver, EmptyAddressHasNoVendor) {
    VendorResolver resolver;
    EXPECT_FALSE(resolver.resolve("").has_value());
    EXPECT_EQ(resolver.cache_size(), 0u);
}

TEST(ChainedVendorLookup, FallsThroughFailures) {
    ChainedVendorLookup chain;
    EXPECT_TRUE(chain.empty());
    chain.add(std::make_shared<ThrowingLookup>());
    chain.add(std::make_shared<CountingLookup>(std::nullopt));
    chain.add(std::make_shared<CountingLookup>(std::string("Third")));
    chain.add(nullptr);
    EXPECT_FALSE(chain.empty());
    EXPECT_EQ(chain.lookup("AA:BB:CC:DD:EE:FF"), std::optional<std::string>("Third"));
}

TEST(VendorResolver, NonStandardExceptionCachesUnknown) {
    auto backend = std::make_shared<FaultingLookup>();
    VendorResolver resolver(backend);

    std::optional<std::string> first;
    EXPECT_NO_THROW(first = resolver.resolve("AA:BB:CC:00:00:01"));
    EXPECT_EQ(first, std::optional<std::string>("Unknown"));

    // same prefix again: served from the cache, not a broken future
    std::optional<std::string> second;
    EXPECT_NO_THROW(second = resolver.resolve("AA:BB:CC:00:00:02"));
    EXPECT_EQ(second, std::optional<std::string>("Unknown"));
    EXPECT_EQ(backend->calls.load(), 1);
}

TEST(VendorResolver, FaultingBackendNeverBreaksStoreUpdates) {
    auto resolver = std::make_shared<VendorResolver>(std::make_shared<FaultingLookup>());
    DeviceStore store(5, resolver);
    for (int i = 0; i < 3; ++i) {
        EXPECT_NO_THROW(store.update(DeviceType::Wifi, "AA:BB:CC:00:00:0" + std::to_string(i),
                                     std::string("net"), -40.0));
    }
    EXPECT_EQ(store.size(), 3u);
    EXPECT_EQ(resolver->cache_size(), 1u);
    for (const auto& d : store.snapshot()) EXPECT_EQ(d.vendor, "Unknown");
}

TEST(ChainedVendorLookup, SkipsNonStandardExceptions) {
    ChainedVendorLookup chain;
    chain.add(std::make_shared<FaultingLookup>());
    chain.add(std::make_shared<CountingLookup>(std::string("Second")));
    EXPECT_EQ(chain.lookup("AA:BB:CC:DD:EE:FF"), std::optional<std::string>("Second"));
}
