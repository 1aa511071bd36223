#include "hub/OutboundQueue.h"

#include <utility>

namespace consulthub::hub {

OutboundQueue::OutboundQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool OutboundQueue::try_push(Envelope env) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_ || items_.size() >= capacity_) return false;
        items_.push_back(std::move(env));
    }
    notify();
    return true;
}

std::optional<Envelope> OutboundQueue::try_pop() {
    std::lock_guard<std::mutex> lk(mu_);
    if (items_.empty()) return std::nullopt;
    Envelope env = std::move(items_.front());
    items_.pop_front();
    return env;
}

bool OutboundQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_) return false;
        closed_ = true;
    }
    notify();
    return true;
}

bool OutboundQueue::closed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

bool OutboundQueue::empty() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.empty();
}

std::size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_.size();
}

void OutboundQueue::set_notify(Notify cb) {
    std::lock_guard<std::mutex> lk(mu_);
    notify_ = std::move(cb);
}

void OutboundQueue::notify() {
    Notify cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        cb = notify_;
    }
    if (cb) cb();
}

} // namespace consulthub::hub
