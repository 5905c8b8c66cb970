/**
 * @file block_forwarder.cpp
 * @brief Реализация Block Forwarder
 */

#include "block_forwarder.hpp"
#include "../core/hex.hpp"
#include "../monitoring/alerter.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

namespace xmrweb::mining {

struct BlockForwarder::Impl {
    monero::IDaemonClient& daemon;
    ForwarderConfig config;
    RefreshRequest refresh;
    monitoring::EventHub* events;

    using Key = std::pair<uint64_t, Bytes>;

    // (height, blob) -> момент резервирования
    mutable std::mutex mutex;
    std::map<Key, TimePoint> recent;

    // Статистика
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> failures{0};
    std::atomic<uint64_t> rpc_calls{0};

    Impl(monero::IDaemonClient& d, const ForwarderConfig& c, RefreshRequest r,
         monitoring::EventHub* e)
        : daemon(d), config(c), refresh(std::move(r)), events(e) {}

    /**
     * @brief Зарезервировать ключ
     *
     * @return false если ключ уже занят
     */
    bool reserve(const BlockCandidate& c, TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex);

        auto window = std::chrono::milliseconds(config.dedup_window_ms);
        for (auto it = recent.begin(); it != recent.end();) {
            if (now - it->second > window) {
                it = recent.erase(it);
            } else {
                ++it;
            }
        }

        auto [_, inserted] = recent.emplace(Key{c.height, c.blob}, now);
        return inserted;
    }

    void unreserve(const BlockCandidate& c) {
        std::lock_guard<std::mutex> lock(mutex);
        recent.erase(Key{c.height, c.blob});
    }

    void emit(monitoring::EventType type, std::string message, const BlockCandidate& c) {
        if (events) {
            events->emit(type, std::move(message), c.session_id, c.job_id, c.generation, c.height);
        }
    }

    void request_refresh() {
        if (refresh) {
            refresh();
        }
    }

    /**
     * @brief submit_block с повторами
     */
    Result<monero::SubmitReply> submit_with_retry(const std::string& blob_hex) {
        auto backoff = std::chrono::milliseconds(config.retry_backoff_ms);
        Result<monero::SubmitReply> reply = Err<monero::SubmitReply>(ErrorCode::RpcConnectionFailed);

        for (uint32_t attempt = 0; attempt <= config.max_retries; ++attempt) {
            if (attempt > 0) {
                std::this_thread::sleep_for(backoff);
                backoff *= 2;
            }

            rpc_calls.fetch_add(1, std::memory_order_relaxed);
            reply = daemon.submit_block(blob_hex);
            if (reply) {
                return reply;
            }

            if (events) {
                events->emit(monitoring::EventType::RpcFailure,
                             "submit_block попытка " + std::to_string(attempt + 1) + ": " +
                                 reply.error().message);
            }
        }
        return reply;
    }
};

BlockForwarder::BlockForwarder(
    monero::IDaemonClient& daemon,
    const ForwarderConfig& config,
    RefreshRequest refresh,
    monitoring::EventHub* events
)
    : impl_(std::make_unique<Impl>(daemon, config, std::move(refresh), events))
{
}

BlockForwarder::~BlockForwarder() = default;

Result<ForwardOutcome> BlockForwarder::forward(const BlockCandidate& candidate) {
    if (!impl_->reserve(candidate, Clock::now())) {
        impl_->duplicates.fetch_add(1, std::memory_order_relaxed);
        return ForwardOutcome{Duplicate{candidate.height, candidate.nonce}};
    }

    impl_->forwarded.fetch_add(1, std::memory_order_relaxed);
    std::string blob_hex = to_hex(candidate.blob);

    // Сетевой вызов без блокировок
    auto reply = impl_->submit_with_retry(blob_hex);

    if (!reply) {
        impl_->failures.fetch_add(1, std::memory_order_relaxed);
        impl_->unreserve(candidate);

        monitoring::Alerter::instance().alert_forward_failed(
            candidate.height, reply.error().message, blob_hex
        );
        impl_->emit(monitoring::EventType::BlockForwardFailed, reply.error().message, candidate);
        impl_->request_refresh();
        return std::unexpected(reply.error());
    }

    impl_->request_refresh();

    if (!reply->accepted) {
        // Отклонённый blob не закрывает ключ для исправленного решения
        impl_->unreserve(candidate);
        impl_->rejected.fetch_add(1, std::memory_order_relaxed);
        impl_->emit(monitoring::EventType::BlockRejected, reply->reason, candidate);
        return ForwardOutcome{DaemonRejected{reply->reason}};
    }

    impl_->accepted.fetch_add(1, std::memory_order_relaxed);
    impl_->emit(monitoring::EventType::BlockForwarded,
                "hash " + to_hex(candidate.hash), candidate);
    return ForwardOutcome{ForwardAccepted{candidate.height}};
}

bool BlockForwarder::seen(const BlockCandidate& candidate) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->recent.contains(Impl::Key{candidate.height, candidate.blob});
}

ForwarderStats BlockForwarder::stats() const {
    ForwarderStats s;
    s.forwarded = impl_->forwarded.load(std::memory_order_relaxed);
    s.accepted = impl_->accepted.load(std::memory_order_relaxed);
    s.rejected = impl_->rejected.load(std::memory_order_relaxed);
    s.duplicates = impl_->duplicates.load(std::memory_order_relaxed);
    s.failures = impl_->failures.load(std::memory_order_relaxed);
    s.rpc_calls = impl_->rpc_calls.load(std::memory_order_relaxed);
    return s;
}

} // namespace xmrweb::mining
