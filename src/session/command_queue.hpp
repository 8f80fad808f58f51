#pragma once

#include "hubdrive/types.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace hubdrive {
namespace session {

// FIFO of drive commands between the caller thread and the session thread.
//
// Producers push without blocking; only the session thread pops. The queue
// starts closed: pushes are rejected until open() is called, so input that
// arrives while connecting or disconnecting is dropped instead of piling up.
// Closing only stops new pushes; commands already accepted stay poppable.
class CommandQueue {
public:
    CommandQueue() = default;

    // Non-copyable
    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    // Returns false if the queue is closed (command dropped)
    bool push(DriveCommand cmd);

    // Blocks until a command is available or the queue is closed.
    // Returns nullopt once the queue is closed and empty.
    std::optional<DriveCommand> pop();

    // Non-blocking variant of pop()
    std::optional<DriveCommand> tryPop();

    void open();

    // Rejects further pushes and wakes a blocked pop(). Accepted commands
    // remain until popped or reset().
    void close();

    // Drops everything still queued. Returns how many commands were discarded.
    size_t reset();

    bool isOpen() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<DriveCommand> pending_;
    bool open_ = false;
};

} // namespace session
} // namespace hubdrive
