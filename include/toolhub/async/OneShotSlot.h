//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: OneShotSlot.h
// Purpose: Single-assignment result cell with resolve, reject and expire as exclusive terminal states
//==========================================================================================================

#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace toolhub {
namespace async {

enum class SlotState {
    Pending,
    Resolved,
    Rejected,
    Expired
};

//==========================================================================================================
// OneShotSlot
// Purpose: Condition-variable-guarded cell completed at most once. The first of resolve(), reject() or an
//          elapsed deadline in waitUntil() wins; every later completion attempt returns false.
//==========================================================================================================
template <typename T>
class OneShotSlot {
public:
    bool resolve(T v) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state != SlotState::Pending) {
                return false;
            }
            value.emplace(std::move(v));
            state = SlotState::Resolved;
        }
        cv.notify_all();
        return true;
    }

    bool reject(std::exception_ptr e) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (state != SlotState::Pending) {
                return false;
            }
            error = std::move(e);
            state = SlotState::Rejected;
        }
        cv.notify_all();
        return true;
    }

    //==========================================================================================================
    // Blocks until the slot leaves Pending or the deadline passes. A slot still pending at the deadline
    // becomes Expired under the same lock, so a racing resolve() cannot also succeed.
    // Returns:
    //   The terminal state.
    //==========================================================================================================
    SlotState waitUntil(std::chrono::steady_clock::time_point deadline) {
        std::unique_lock<std::mutex> lock(mutex);
        if (!cv.wait_until(lock, deadline, [this]() { return state != SlotState::Pending; })) {
            state = SlotState::Expired;
        }
        return state;
    }

    // Waits until the slot leaves Pending or `until` passes, without expiring it. Returns true once settled.
    bool waitSettled(std::chrono::steady_clock::time_point until) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_until(lock, until, [this]() { return state != SlotState::Pending; });
    }

    SlotState current() const {
        std::lock_guard<std::mutex> lock(mutex);
        return state;
    }

    // Moves the value out of a Resolved slot, rethrows the error of a Rejected one.
    T take() {
        std::lock_guard<std::mutex> lock(mutex);
        if (state == SlotState::Rejected) {
            std::rethrow_exception(error);
        }
        if (state != SlotState::Resolved || !value.has_value()) {
            throw std::logic_error("OneShotSlot::take on a slot without a value");
        }
        T out = std::move(*value);
        value.reset();
        return out;
    }

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    SlotState state = SlotState::Pending;
    std::optional<T> value;
    std::exception_ptr error;
};

} // namespace async
} // namespace toolhub
