/**
 * @file execution_gate.hpp
 * @brief FIFO-fair bound on concurrent executions
 *
 * @date 2025
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>

namespace sentrybox {
namespace core {

/**
 * @class ExecutionGate
 * @brief Counting semaphore that admits waiters strictly in arrival order
 *
 * Excess callers queue instead of being rejected. A waiter that gives up
 * (its cancel flag is raised) leaves the queue without blocking the ones
 * behind it.
 *
 * **Usage Example**:
 * @code
 * ExecutionGate gate(4);
 * auto permit = gate.Acquire();
 * // at most 4 threads are here at once
 * @endcode
 */
class ExecutionGate {
public:
    /**
     * @class Permit
     * @brief Move-only admission; releases its slot on destruction
     */
    class Permit {
    public:
        Permit() = default;
        explicit Permit(ExecutionGate* gate) : gate_(gate) {}
        ~Permit() { Release(); }

        Permit(Permit&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit& operator=(Permit&& other) noexcept {
            if (this != &other) {
                Release();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

        bool Valid() const { return gate_ != nullptr; }

        void Release() {
            if (gate_) {
                gate_->Release();
                gate_ = nullptr;
            }
        }

    private:
        ExecutionGate* gate_{nullptr};
    };

    explicit ExecutionGate(std::size_t capacity);

    ExecutionGate(const ExecutionGate&) = delete;
    ExecutionGate& operator=(const ExecutionGate&) = delete;

    /// Block until admitted
    Permit Acquire();

    /**
     * @brief Block until admitted or @p cancelled becomes true
     *
     * Callers that raise the flag must call Wake() so the waiter notices.
     *
     * @return Empty when cancelled while queued
     */
    std::optional<Permit> Acquire(const std::atomic<bool>& cancelled);

    /// Wake all waiters so they re-check their cancel flags
    void Wake();

    std::size_t Capacity() const { return capacity_; }
    std::size_t InFlight() const;
    std::size_t Waiting() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t in_flight_{0};
    std::uint64_t next_ticket_{0};
    std::uint64_t serving_{0};
    std::set<std::uint64_t> abandoned_;

    void Release();
    void SkipAbandoned();
};

} // namespace core
} // namespace sentrybox
