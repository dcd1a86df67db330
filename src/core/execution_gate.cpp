/**
 * @file execution_gate.cpp
 * @brief Ticket-based FIFO semaphore
 *
 * @date 2025
 */

#include "sentrybox/core/execution_gate.hpp"

#include <stdexcept>

namespace sentrybox {
namespace core {

ExecutionGate::ExecutionGate(std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("ExecutionGate capacity must be positive");
    }
}

ExecutionGate::Permit ExecutionGate::Acquire() {
    std::atomic<bool> never{false};
    return std::move(*Acquire(never));
}

std::optional<ExecutionGate::Permit> ExecutionGate::Acquire(const std::atomic<bool>& cancelled) {
    std::unique_lock<std::mutex> lock(mutex_);
    const std::uint64_t ticket = next_ticket_++;

    cv_.wait(lock, [&] {
        return cancelled.load() || (ticket == serving_ && in_flight_ < capacity_);
    });

    if (ticket != serving_ || in_flight_ >= capacity_) {
        // Cancelled while still queued
        abandoned_.insert(ticket);
        SkipAbandoned();
        cv_.notify_all();
        return std::nullopt;
    }

    ++serving_;
    ++in_flight_;
    SkipAbandoned();
    cv_.notify_all();
    return Permit(this);
}

void ExecutionGate::Wake() {
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

std::size_t ExecutionGate::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::size_t ExecutionGate::Waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(next_ticket_ - serving_) - abandoned_.size();
}

void ExecutionGate::Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    --in_flight_;
    cv_.notify_all();
}

void ExecutionGate::SkipAbandoned() {
    auto it = abandoned_.find(serving_);
    while (it != abandoned_.end()) {
        abandoned_.erase(it);
        ++serving_;
        it = abandoned_.find(serving_);
    }
}

} // namespace core
} // namespace sentrybox
