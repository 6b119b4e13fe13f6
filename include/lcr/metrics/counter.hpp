#pragma once

#include <ostream>
#include <type_traits>
#include <cstdint>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// Plain (non-atomic) aggregation metrics.
//
// Owned by one thread at a time. Parallel producers keep their own instances
// and fold them together with merge_from() after joining.
// ---------------------------------------------------------------------------

// counter: monotonically increasing total
template<typename T = uint64_t>
struct counter {
    static_assert(std::is_unsigned_v<T>, "counter requires an unsigned type");

    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    [[nodiscard]] constexpr T load() const noexcept { return value_; }

    constexpr void inc(T n = 1) noexcept { value_ += n; }
    constexpr void merge_from(const counter& other) noexcept { value_ += other.value_; }
    constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

// peak: largest value observed so far
template<typename T = uint64_t>
struct peak {
    constexpr peak() noexcept = default;

    peak(const peak&) = delete;
    peak& operator=(const peak&) = delete;

    [[nodiscard]] constexpr T load() const noexcept { return value_; }

    constexpr void observe(T v) noexcept {
        if (v > value_) {
            value_ = v;
        }
    }
    constexpr void merge_from(const peak& other) noexcept { observe(other.value_); }
    constexpr void reset() noexcept { value_ = T{}; }

private:
    T value_{};
};

using counter64 = counter<uint64_t>;
using peak64 = peak<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

template<typename T>
inline std::ostream& operator<<(std::ostream& os, const counter<T>& c) {
    return os << c.load();
}

template<typename T>
inline std::ostream& operator<<(std::ostream& os, const peak<T>& p) {
    return os << p.load();
}

} // namespace metrics
} // namespace lcr
