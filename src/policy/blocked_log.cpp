#include "policy/blocked_log.hpp"

BlockedRequestLog::BlockedRequestLog(std::size_t capacity)
    : capacity_{capacity == 0 ? 1 : capacity}
{}

void BlockedRequestLog::record(BlockedRequest entry)
{
    std::lock_guard lock{mutex_};
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(std::move(entry));
}

std::vector<BlockedRequest> BlockedRequestLog::recent() const
{
    std::lock_guard lock{mutex_};
    return {entries_.begin(), entries_.end()};
}

std::size_t BlockedRequestLog::size() const
{
    std::lock_guard lock{mutex_};
    return entries_.size();
}
