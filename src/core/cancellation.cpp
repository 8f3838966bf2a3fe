// EN: Cooperative cancellation implementation
// FR: Implémentation de l'annulation coopérative

#include "core/cancellation.hpp"

#include <algorithm>
#include <thread>

namespace FGL {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::cancel(const std::string& reason) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->cancelled.load()) {
        state_->reason = reason;
        state_->cancelled.store(true);
    }
}

bool CancellationToken::isCancelled() const {
    for (auto state = state_; state; state = state->parent) {
        if (state->cancelled.load()) {
            return true;
        }
        if (state->deadline && Clock::now() >= *state->deadline) {
            return true;
        }
    }
    return false;
}

bool CancellationToken::deadlineExceeded() const {
    for (auto state = state_; state; state = state->parent) {
        if (state->cancelled.load()) {
            return false;
        }
        if (state->deadline && Clock::now() >= *state->deadline) {
            return true;
        }
    }
    return false;
}

std::string CancellationToken::reason() const {
    for (auto state = state_; state; state = state->parent) {
        if (state->cancelled.load()) {
            std::lock_guard<std::mutex> lock(state->mutex);
            return state->reason;
        }
        if (state->deadline && Clock::now() >= *state->deadline) {
            return "deadline exceeded";
        }
    }
    return "";
}

std::optional<std::chrono::milliseconds> CancellationToken::remaining() const {
    std::optional<Clock::time_point> nearest;
    for (auto state = state_; state; state = state->parent) {
        if (state->deadline && (!nearest || *state->deadline < *nearest)) {
            nearest = state->deadline;
        }
    }
    if (!nearest) {
        return std::nullopt;
    }
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*nearest - Clock::now());
    return std::max(left, std::chrono::milliseconds::zero());
}

CancellationToken CancellationToken::withDeadline(std::chrono::milliseconds timeout) const {
    auto child = std::make_shared<State>();
    child->parent = state_;
    child->deadline = Clock::now() + timeout;
    return CancellationToken(child);
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) const {
    // EN: Sleep in small increments to allow interruption
    // FR: Dort par petits incréments pour permettre l'interruption
    const auto sleep_increment = std::chrono::milliseconds(20);
    auto remaining = duration;

    while (remaining > std::chrono::milliseconds(0)) {
        if (isCancelled()) {
            return false;
        }
        auto sleep_time = std::min(remaining, sleep_increment);
        std::this_thread::sleep_for(sleep_time);
        remaining -= sleep_time;
    }
    return !isCancelled();
}

} // namespace FGL
