#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing counter, safe to bump from any thread
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    counter() = default;

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
};
using counter32 = counter<uint32_t>;
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>);

// ---------------------------------------------------------------------------
// gauge - last observed value plus high-water mark
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) gauge {
    gauge() = default;

    gauge(const gauge&) = delete;
    gauge& operator=(const gauge&) = delete;

    inline void set(T v) noexcept {
        value_.store(v, std::memory_order_relaxed);
        T seen = max_.load(std::memory_order_relaxed);
        while (v > seen && !max_.compare_exchange_weak(seen, v, std::memory_order_relaxed)) {
        }
    }

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline T max() const noexcept { return max_.load(std::memory_order_relaxed); }

private:
    std::atomic<T> value_{0};
    std::atomic<T> max_{0};
};
using gauge32 = gauge<uint32_t>;

} // namespace atomic
} // namespace metrics
} // namespace lcr
