#pragma once

#include <atomic>
#include <functional>
#include <optional>

#include <cstddef>

namespace darian::detail {

/// Mix the hash of v into seed (boost::hash_combine)
template <class T, typename Hash = std::hash<T>>
inline void hash_combine(std::size_t& seed, const T& v, const Hash& hash = Hash()) noexcept {
    seed ^= hash(v) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
}

/**
 * Write-once hash memo for immutable value types.
 *
 * The stored hash is a pure function of the owner's fields, so concurrent
 * first computations store the same value and relaxed ordering is enough.
 * Zero marks "not computed"; a computed hash of zero is stored as one.
 */
class HashCache {
public:
    HashCache() noexcept = default;

    HashCache(const HashCache& other) noexcept
        : value_(other.value_.load(std::memory_order_relaxed)) {}

    HashCache& operator=(const HashCache& other) noexcept {
        value_.store(other.value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
        return *this;
    }

    std::optional<std::size_t> load() const noexcept {
        std::size_t v = value_.load(std::memory_order_relaxed);
        if (v == 0) {
            return std::nullopt;
        }
        return v;
    }

    std::size_t store(std::size_t h) const noexcept {
        if (h == 0) {
            h = 1;
        }
        value_.store(h, std::memory_order_relaxed);
        return h;
    }

    /// Return the memoized hash, computing it with fn() on first use
    template <typename Fn>
    std::size_t get_or_compute(Fn&& fn) const noexcept(noexcept(fn())) {
        if (auto cached = load()) {
            return *cached;
        }
        return store(fn());
    }

private:
    mutable std::atomic<std::size_t> value_{0};
};

} // namespace darian::detail
