#include "command_queue.hpp"

namespace hubdrive {
namespace session {

bool CommandQueue::push(DriveCommand cmd) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            return false;
        }
        pending_.push_back(cmd);
    }
    cv_.notify_one();
    return true;
}

std::optional<DriveCommand> CommandQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !open_ || !pending_.empty(); });

    if (pending_.empty()) {
        return std::nullopt;
    }

    DriveCommand cmd = pending_.front();
    pending_.pop_front();
    return cmd;
}

std::optional<DriveCommand> CommandQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) {
        return std::nullopt;
    }

    DriveCommand cmd = pending_.front();
    pending_.pop_front();
    return cmd;
}

void CommandQueue::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
}

void CommandQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }
    cv_.notify_all();
}

size_t CommandQueue::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = pending_.size();
    pending_.clear();
    return dropped;
}

bool CommandQueue::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t CommandQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

} // namespace session
} // namespace hubdrive
