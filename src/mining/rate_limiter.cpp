/**
 * @file rate_limiter.cpp
 * @brief Реализация скользящих окон и strike-политики
 */

#include "rate_limiter.hpp"

namespace xmrweb::mining {

// =============================================================================
// SlidingWindow
// =============================================================================

SlidingWindow::SlidingWindow(uint32_t limit, std::chrono::milliseconds window)
    : limit_(limit)
    , window_(window)
{
}

void SlidingWindow::prune(TimePoint now) {
    while (!events_.empty() && now - events_.front() >= window_) {
        events_.pop_front();
    }
}

bool SlidingWindow::check(TimePoint now) {
    prune(now);
    if (events_.size() >= limit_) {
        return false;
    }
    events_.push_back(now);
    return true;
}

bool SlidingWindow::has_capacity(TimePoint now) {
    prune(now);
    return events_.size() < limit_;
}

uint32_t SlidingWindow::remaining(TimePoint now) {
    prune(now);
    if (events_.size() >= limit_) {
        return 0;
    }
    return limit_ - static_cast<uint32_t>(events_.size());
}

// =============================================================================
// RateLimiter
// =============================================================================

RateLimiter::RateLimiter(const LimitsConfig& config)
    : config_(config)
    , messages_(config.messages_per_second, std::chrono::seconds(1))
    , submits_(config.submits_per_minute, std::chrono::minutes(1))
    , shares_(config.shares_per_minute, std::chrono::minutes(1))
{
}

Verdict RateLimiter::strike(Quota quota) {
    violated_ = quota;
    ++strikes_;
    if (strikes_ > config_.max_strikes) {
        return Verdict::Close;
    }
    return Verdict::Drop;
}

bool RateLimiter::violated_window_has_capacity(TimePoint now) {
    if (!violated_) {
        return true;
    }
    switch (*violated_) {
        case Quota::Messages: return messages_.has_capacity(now);
        case Quota::Submits:  return submits_.has_capacity(now);
        case Quota::Shares:   return shares_.has_capacity(now);
    }
    return true;
}

Verdict RateLimiter::admit_message(TimePoint now) {
    if (!violated_window_has_capacity(now)) {
        return strike(*violated_);
    }
    if (!messages_.check(now)) {
        return strike(Quota::Messages);
    }

    // Окно освободилось: сессия снова активна
    violated_.reset();
    return Verdict::Allow;
}

Verdict RateLimiter::admit_submit(TimePoint now) {
    if (!violated_window_has_capacity(now)) {
        return strike(*violated_);
    }
    if (!messages_.has_capacity(now)) {
        return strike(Quota::Messages);
    }
    if (!submits_.has_capacity(now)) {
        return strike(Quota::Submits);
    }

    messages_.check(now);
    submits_.check(now);
    violated_.reset();
    return Verdict::Allow;
}

Verdict RateLimiter::record_share(TimePoint now) {
    if (!shares_.check(now)) {
        return strike(Quota::Shares);
    }
    return Verdict::Allow;
}

} // namespace xmrweb::mining
