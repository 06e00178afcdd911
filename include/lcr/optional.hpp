#pragma once

#include <cassert>
#include <utility>


namespace lcr {

// Value-or-absent holder for optional wire fields.
// T must be default constructible; an absent field keeps T{}.
template <typename T>
class optional {
public:
    optional() = default;
    optional(const T& v) : value_(v), present_(true) {}
    optional(T&& v) : value_(std::move(v)), present_(true) {}

    optional& operator=(const T& v) {
        value_ = v;
        present_ = true;
        return *this;
    }

    optional& operator=(T&& v) {
        value_ = std::move(v);
        present_ = true;
        return *this;
    }

    [[nodiscard]] bool has() const noexcept { return present_; }

    [[nodiscard]] const T& value() const {
        assert(present_ && "lcr::optional: no value");
        return value_;
    }

    [[nodiscard]] T value_or(const T& fallback) const {
        return present_ ? value_ : fallback;
    }

    // Moves the value out and leaves the optional empty
    [[nodiscard]] T take() {
        assert(present_ && "lcr::optional: no value");
        T out = std::move(value_);
        reset();
        return out;
    }

    void reset() {
        value_ = T{};
        present_ = false;
    }

private:
    T value_{};
    bool present_{false};
};

} // namespace lcr
