/*
src/core/VendorResolver.cpp
Vendor label cache. Lookups against the backend run on a detached worker so a
slow or hung backend costs the caller at most `timeout_`.
*/
#include "core/VendorResolver.hpp"
#include "core/MacAddress.hpp"
#include <iostream>
#include <system_error>
#include <thread>

namespace airscope {

void ChainedVendorLookup::add(std::shared_ptr<IVendorLookup> backend) {
    if (backend) backends_.push_back(std::move(backend));
}

std::optional<std::string> ChainedVendorLookup::lookup(const std::string& mac) {
    for (auto& b : backends_) {
        try {
            auto v = b->lookup(mac);
            if (v && !v->empty()) return v;
        } catch (const std::exception& e) {
            std::cerr << "VendorResolver: backend error for " << mac << ": " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "VendorResolver: backend error for " << mac << ": non-standard exception" << std::endl;
        }
    }
    return std::nullopt;
}

VendorResolver::VendorResolver(std::shared_ptr<IVendorLookup> backend, std::chrono::milliseconds timeout)
: backend_(std::move(backend)), timeout_(timeout) {}

std::optional<std::string> VendorResolver::resolve(std::string_view address) {
    std::string mac = normalize_mac(address);
    if (mac.empty()) return std::nullopt;
    std::string prefix = vendor_prefix(mac);

    std::promise<std::string> promise;
    std::shared_future<std::string> entry;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lk(cache_m_);
        auto it = cache_.find(prefix);
        if (it != cache_.end()) {
            entry = it->second;
        } else {
            entry = promise.get_future().share();
            cache_.emplace(prefix, entry);
            owner = true;
        }
    }

    if (owner) {
        // the cached future must always be satisfied, or the prefix is lost for good
        std::string label = kUnknown;
        try {
            label = query_backend(mac);
        } catch (const std::exception& e) {
            std::cerr << "VendorResolver: lookup for " << mac << " failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "VendorResolver: lookup for " << mac << " failed with a non-standard exception" << std::endl;
        }
        promise.set_value(label);
    }
    return entry.get();
}

size_t VendorResolver::cache_size() const {
    std::lock_guard<std::mutex> lk(cache_m_);
    return cache_.size();
}

std::string VendorResolver::query_backend(const std::string& mac) {
    if (!backend_) return kUnknown;

    auto backend = backend_;
    auto task = std::make_shared<std::packaged_task<std::optional<std::string>()>>(
        [backend, mac]() { return backend->lookup(mac); });
    auto result = task->get_future();
    try {
        std::thread([task]() { (*task)(); }).detach();
    } catch (const std::system_error& e) {
        std::cerr << "VendorResolver: unable to start lookup for " << mac << ": " << e.what() << std::endl;
        return kUnknown;
    }

    if (result.wait_for(timeout_) != std::future_status::ready) {
        std::cerr << "VendorResolver: lookup for " << mac << " timed out after "
                  << timeout_.count() << " ms" << std::endl;
        return kUnknown;
    }
    try {
        auto v = result.get();
        if (v && !v->empty()) return *v;
    } catch (const std::exception& e) {
        std::cerr << "VendorResolver: lookup for " << mac << " failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "VendorResolver: lookup for " << mac << " failed with a non-standard exception" << std::endl;
    }
    return kUnknown;
}

} // namespace airscope
