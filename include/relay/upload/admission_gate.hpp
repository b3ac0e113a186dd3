#pragma once

#include <atomic>
#include <cstddef>

namespace relay::upload {

/**
 * @brief Counting gate bounding simultaneously in-flight parts
 *
 * THREAD SAFETY:
 * - try_acquire/release may be called from any thread
 * - The counter never exceeds capacity()
 */
class AdmissionGate {
public:
    explicit AdmissionGate(std::size_t capacity) : capacity_(capacity) {}

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    bool try_acquire() noexcept {
        std::size_t current = in_flight_.load(std::memory_order_relaxed);
        while (current < capacity_) {
            if (in_flight_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel)) {
                return true;
            }
        }
        return false;
    }

    void release() noexcept {
        in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    }

    std::size_t in_flight() const noexcept { return in_flight_.load(std::memory_order_acquire); }
    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    std::atomic<std::size_t> in_flight_{0};
};

} // namespace relay::upload
