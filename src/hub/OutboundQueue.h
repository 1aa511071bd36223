#pragma once

#include "hub/Envelope.h"

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace consulthub::hub {

// Bounded send queue between the hub (producer) and one connection's
// write loop (consumer). Enqueue never blocks: a full or closed queue
// rejects the envelope and the caller decides what to do with the
// connection.
class OutboundQueue {
public:
    using Notify = std::function<void()>;

    explicit OutboundQueue(std::size_t capacity);

    OutboundQueue(const OutboundQueue&) = delete;
    OutboundQueue& operator=(const OutboundQueue&) = delete;

    bool try_push(Envelope env);
    std::optional<Envelope> try_pop();

    // Returns true only for the call that actually closed the queue.
    // Already queued envelopes stay poppable after close.
    bool close();

    bool closed() const;
    bool empty() const;
    std::size_t size() const;
    std::size_t capacity() const noexcept { return capacity_; }

    // Called (outside the lock) after each accepted push and on close.
    void set_notify(Notify cb);

private:
    void notify();

    const std::size_t capacity_;

    mutable std::mutex mu_;
    std::deque<Envelope> items_;
    bool closed_ = false;
    Notify notify_;
};

} // namespace consulthub::hub
