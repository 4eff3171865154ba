#include "protocol/ReplyGate.hpp"

namespace urdash::protocol {

std::uint64_t ReplyGate::publish(const std::string& text) {
    std::uint64_t seq = 0;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        lastReply_ = text;
        seq = ++sequence_;
    }
    cv_.notify_all();
    return seq;
}

std::uint64_t ReplyGate::sequence() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return sequence_;
}

ReplySnapshot ReplyGate::last() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return {lastReply_, sequence_, false};
}

ReplySnapshot ReplyGate::waitNewerThan(std::uint64_t sequence, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mtx_);
    bool fresh = cv_.wait_for(lk, timeout, [this, sequence]() {
        return sequence_ > sequence || closed_;
    });
    // closed_ alone wakes the waiter but does not make the value fresh
    fresh = fresh && sequence_ > sequence;
    return {lastReply_, sequence_, fresh};
}

void ReplyGate::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ReplyGate::isClosed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

} // namespace urdash::protocol
