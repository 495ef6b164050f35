#pragma once
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace airscope {

/**
 * @brief Backing source for organisation names keyed by hardware address.
 *
 * Implementations may block, may return nullopt for unknown addresses and may
 * throw on backend failure. The resolver bounds and caches every call.
 */
class IVendorLookup {
public:
    virtual ~IVendorLookup() = default;
    virtual std::optional<std::string> lookup(const std::string& mac) = 0;
};

// Tries each backend in order and returns the first label found.
class ChainedVendorLookup : public IVendorLookup {
public:
    void add(std::shared_ptr<IVendorLookup> backend);
    bool empty() const { return backends_.empty(); }
    std::optional<std::string> lookup(const std::string& mac) override;

private:
    std::vector<std::shared_ptr<IVendorLookup>> backends_;
};

/**
 * @brief Prefix-keyed vendor cache in front of an optional IVendorLookup.
 *
 * Each three-octet prefix reaches the backend at most once per resolver
 * lifetime; failures, timeouts and a missing backend all cache "Unknown".
 * Callers racing on the same unresolved prefix share the in-flight result.
 */
class VendorResolver {
public:
    static constexpr const char* kUnknown = "Unknown";

    explicit VendorResolver(std::shared_ptr<IVendorLookup> backend = nullptr,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    // nullopt only when `address` has no usable identity
    std::optional<std::string> resolve(std::string_view address);

    size_t cache_size() const;
    bool has_backend() const { return backend_ != nullptr; }

private:
    std::string query_backend(const std::string& mac);

    std::shared_ptr<IVendorLookup> backend_;
    std::chrono::milliseconds timeout_;

    mutable std::mutex cache_m_;
    std::unordered_map<std::string, std::shared_future<std::string>> cache_;
};

} // namespace airscope
