#include "qf/concurrency.hpp"

namespace qf {

std::uint16_t TxIdAllocator::next()
{
    std::lock_guard<std::mutex> lk(mtx_);
    const std::uint16_t id = next_;
    next_ = static_cast<std::uint16_t>(next_ + 1);
    return id;
}

// ---------------------- EventChannel implementation ----------------------

void EventChannel::push(const StatusEvent& ev)
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        q_.push_back(ev);
    }
    cv_.notify_one();
}

StatusEvent EventChannel::pop()
{
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [&]{ return !q_.empty(); });
    StatusEvent ev = q_.front();
    q_.pop_front();
    return ev;
}

std::optional<StatusEvent> EventChannel::try_pop()
{
    std::lock_guard<std::mutex> lk(mtx_);
    if (q_.empty()) return std::nullopt;
    StatusEvent ev = q_.front();
    q_.pop_front();
    return ev;
}

std::size_t EventChannel::size() const
{
    std::lock_guard<std::mutex> lk(mtx_);
    return q_.size();
}

} // namespace qf
