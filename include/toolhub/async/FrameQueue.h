//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameQueue.h
// Purpose: Closable blocking FIFO of frames shared between a transport's producer and its reader
//==========================================================================================================

#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace toolhub {
namespace async {

class FrameQueue {
public:
    // Returns false when the queue is already closed; the frame is dropped.
    bool push(std::string frame) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) {
                return false;
            }
            frames.push(std::move(frame));
        }
        cv.notify_one();
        return true;
    }

    // Blocks for the next frame. Frames queued before close() are still delivered.
    std::optional<std::string> pop() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this]() { return !frames.empty() || closed; });
        if (frames.empty()) {
            return std::nullopt;
        }
        std::string frame = std::move(frames.front());
        frames.pop();
        return frame;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

private:
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::queue<std::string> frames;
    bool closed = false;
};

} // namespace async
} // namespace toolhub
