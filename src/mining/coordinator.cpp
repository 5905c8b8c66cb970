/**
 * @file coordinator.cpp
 * @brief Реализация фасада координатора
 */

#include "coordinator.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"
#include "../monero/difficulty.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <variant>

namespace xmrweb::mining {

// =============================================================================
// Транспортная граница
// =============================================================================

JobNotice make_job_notice(const Job& job) {
    JobNotice notice;
    notice.job_id = format_job_id(job.job_id);
    notice.blob = to_hex(job.blob);
    if (job.block_template) {
        notice.seed_hash = job.block_template->seed_hash;
    }
    notice.nonce_range = job.nonce_range;
    notice.reserved_value = to_hex(job.reserved_value);
    notice.share_target = monero::target_to_hex(job.share_target);
    notice.share_difficulty = job.share_difficulty;
    notice.ttl_ms = static_cast<uint64_t>(job.ttl.count());
    notice.height = job.height;
    return notice;
}

Result<Candidate> parse_submit(const SubmitRequest& request) {
    if (request.job_id.empty() || request.job_id.size() > 16) {
        return Err<Candidate>(ErrorCode::TransportMalformedMessage, "Некорректный job_id");
    }

    Candidate candidate;
    try {
        std::size_t pos = 0;
        candidate.job_id = std::stoull(request.job_id, &pos, 16);
        if (pos != request.job_id.size()) {
            return Err<Candidate>(ErrorCode::TransportMalformedMessage, "Некорректный job_id");
        }
    } catch (const std::invalid_argument&) {
        return Err<Candidate>(ErrorCode::TransportMalformedMessage, "Некорректный job_id");
    } catch (const std::out_of_range&) {
        return Err<Candidate>(ErrorCode::TransportMalformedMessage, "job_id вне диапазона");
    }

    auto hash = hash_from_hex(request.result);
    if (!hash) {
        return Err<Candidate>(ErrorCode::TransportMalformedMessage, "result: " + hash.error().message);
    }
    candidate.result_hash = *hash;
    candidate.nonce = request.nonce;

    if (!request.blob.empty()) {
        auto blob = from_hex(request.blob);
        if (!blob) {
            return Err<Candidate>(ErrorCode::TransportMalformedMessage, "blob: " + blob.error().message);
        }
        candidate.blob = std::move(*blob);
    }

    return candidate;
}

Result<void> check_hello(const HelloRequest& request) {
    if (request.version != constants::PROTOCOL_VERSION) {
        return Err<void>(ErrorCode::TransportMalformedMessage,
                         "Неподдерживаемая версия протокола: " + std::to_string(request.version));
    }
    if (request.threads == 0 || request.threads > constants::MAX_CLIENT_THREADS) {
        return Err<void>(ErrorCode::TransportMalformedMessage,
                         "Некорректное число потоков: " + std::to_string(request.threads));
    }
    if (request.client_version.size() > constants::MAX_CLIENT_VERSION_LENGTH) {
        return Err<void>(ErrorCode::TransportMalformedMessage, "Слишком длинная версия клиента");
    }
    return {};
}

namespace {

/**
 * @brief Записать исход пересылки в результат для воркера
 */
void apply_forward(AcceptedBlock& block, const Result<ForwardOutcome>& forwarded) {
    if (!forwarded) {
        block.forward = ForwardStatus::Failed;
        block.forward_detail = forwarded.error().message;
        return;
    }

    std::visit([&](const auto& outcome) {
        using O = std::decay_t<decltype(outcome)>;

        if constexpr (std::is_same_v<O, ForwardAccepted>) {
            block.forward = ForwardStatus::Submitted;
        } else if constexpr (std::is_same_v<O, DaemonRejected>) {
            block.forward = ForwardStatus::DaemonRejected;
            block.forward_detail = outcome.reason;
        } else if constexpr (std::is_same_v<O, Duplicate>) {
            block.forward = ForwardStatus::Duplicate;
        }
    }, *forwarded);
}

} // anonymous namespace

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct Coordinator::Impl {
    Config config;
    ITransportSink& sink;
    monitoring::EventHub* events;

    NonceAllocator allocator;
    TemplateStore store;
    SessionRegistry registry;
    SubmissionValidator validator;
    BlockForwarder forwarder;

    // Поток обслуживания
    std::atomic<bool> running{false};
    std::thread maintenance_thread;
    std::mutex wait_mutex;
    std::condition_variable wait_cv;

    Impl(const Config& cfg, monero::IDaemonClient& daemon, IPowVerifier& verifier,
         ITransportSink& s, monitoring::EventHub* e)
        : config(cfg)
        , sink(s)
        , events(e)
        , allocator(NonceAllocatorConfig{
              cfg.jobs.slice_width, cfg.jobs.min_slice_width, cfg.jobs.shrink_on_pressure})
        , store(daemon, allocator, cfg.monerod, cfg.jobs, e)
        , registry(cfg.server, cfg.jobs, cfg.limits, store, allocator, e)
        , validator(registry, store, verifier, e)
        , forwarder(daemon, cfg.forwarder, [this] { after_forward(); }, e)
    {
        store.set_publish_callback([this](const TemplatePtr&) {
            reissue_all();
        });
    }

    /**
     * @brief Обновить шаблон после отправки блока
     *
     * Если фоновый поток запущен, будим его; иначе обновляем синхронно.
     */
    void after_forward() {
        if (store.is_running()) {
            store.request_refresh();
            return;
        }
        // Ошибка учтена Template Store и опубликована как событие
        auto refreshed = store.refresh();
        (void)refreshed;
    }

    Result<Job> issue(SessionId session_id) {
        auto job = registry.assign_job(session_id);
        if (job) {
            sink.send_job(session_id, make_job_notice(*job));
        }
        return job;
    }

    void reissue_all() {
        for (SessionId id : registry.session_ids()) {
            // Сессии без задания остаются ждать следующего поколения
            auto job = issue(id);
            (void)job;
        }
    }

    void close(SessionId session_id, CloseReason reason) {
        if (registry.close(session_id, reason)) {
            sink.close_session(session_id, reason);
        }
    }

    /**
     * @brief Заявлен ли хеш как решение уровня сети
     *
     * Проверяется до лимитера: такие отправки не отбрасываются.
     */
    bool claims_block(SessionId session_id, const Result<Candidate>& candidate) const {
        if (!candidate) {
            return false;
        }
        auto job = registry.find_job(session_id, candidate->job_id);
        if (!job || !job->block_template) {
            return false;
        }
        return monero::meets_target(candidate->result_hash, job->block_template->network_target);
    }

    void maintenance_loop() {
        auto interval = std::chrono::milliseconds(config.jobs.maintenance_interval_ms);

        while (running.load(std::memory_order_relaxed)) {
            {
                std::unique_lock<std::mutex> lock(wait_mutex);
                wait_cv.wait_for(lock, interval, [this] {
                    return !running.load(std::memory_order_relaxed);
                });
            }
            if (!running.load(std::memory_order_relaxed)) break;

            maintain(Clock::now());
        }
    }

    MaintenanceReport maintain(TimePoint now) {
        MaintenanceReport report;

        for (SessionId id : registry.sweep_idle(now)) {
            sink.close_session(id, CloseReason::IdleTimeout);
            ++report.idle_closed;
        }

        for (SessionId id : registry.expire_jobs(now)) {
            if (issue(id)) {
                ++report.jobs_reissued;
            }
        }

        report.generations_retired = store.retire_expired(now);
        return report;
    }
};

Coordinator::Coordinator(
    const Config& config,
    monero::IDaemonClient& daemon,
    IPowVerifier& verifier,
    ITransportSink& sink,
    monitoring::EventHub* events
)
    : impl_(std::make_unique<Impl>(config, daemon, verifier, sink, events))
{
}

Coordinator::~Coordinator() {
    stop();
}

// =============================================================================
// События транспорта
// =============================================================================

Result<SessionId> Coordinator::on_connected(std::string_view remote_address) {
    auto session_id = impl_->registry.register_session(remote_address);
    if (!session_id) {
        return session_id;
    }

    if (impl_->store.issuance_allowed()) {
        // Без задания сессия получит его при следующей публикации шаблона
        auto job = impl_->issue(*session_id);
        (void)job;
    }
    return session_id;
}

Result<Verdict> Coordinator::on_hello(SessionId session_id, const HelloRequest& request,
                                      TimePoint now) {
    auto verdict = impl_->registry.admit(session_id, MessageKind::Keepalive, now);
    if (!verdict || *verdict != Verdict::Allow) {
        if (verdict && *verdict == Verdict::Close) {
            impl_->close(session_id, CloseReason::RateLimited);
        }
        return verdict;
    }

    auto checked = check_hello(request);
    if (!checked) {
        return std::unexpected(checked.error());
    }

    auto recorded = impl_->registry.record_hello(session_id, request.client_version, request.threads);
    if (!recorded) {
        return std::unexpected(recorded.error());
    }

    StatsNotice notice;
    notice.session_id = session_id;
    notice.submits_per_minute = impl_->config.limits.submits_per_minute;
    notice.messages_per_second = impl_->config.limits.messages_per_second;
    impl_->sink.send_stats(session_id, notice);
    return verdict;
}

void Coordinator::on_disconnected(SessionId session_id) {
    impl_->registry.close(session_id, CloseReason::ClientDisconnect);
}

Result<Verdict> Coordinator::on_keepalive(SessionId session_id, TimePoint now) {
    auto verdict = impl_->registry.admit(session_id, MessageKind::Keepalive, now);
    if (verdict && *verdict == Verdict::Close) {
        impl_->close(session_id, CloseReason::RateLimited);
    }
    return verdict;
}

SubmissionResult Coordinator::on_submit(
    SessionId session_id,
    const SubmitRequest& request,
    TimePoint now
) {
    auto candidate = parse_submit(request);

    // 1. Лимиты (решения уровня сети не ограничиваются)
    auto verdict = impl_->registry.admit(session_id, MessageKind::Submit, now);
    if (!verdict) {
        return Rejected{RejectReason::UnknownJob, verdict.error().message};
    }

    if (*verdict != Verdict::Allow && !impl_->claims_block(session_id, candidate)) {
        if (*verdict == Verdict::Close) {
            impl_->close(session_id, CloseReason::RateLimited);
        }
        return Rejected{RejectReason::RateLimited, "лимит отправок превышен"};
    }

    // 2. Проверка
    SubmissionResult result = candidate
        ? impl_->validator.validate(session_id, *candidate, now)
        : SubmissionResult{Rejected{RejectReason::Malformed, candidate.error().message}};

    // 3. Последствия
    std::visit([&](auto& r) {
        using T = std::decay_t<decltype(r)>;

        if constexpr (std::is_same_v<T, Accepted> || std::is_same_v<T, Stale>) {
            auto share = impl_->registry.record_share(session_id, now);
            if (share && *share == Verdict::Close) {
                impl_->close(session_id, CloseReason::RateLimited);
            }
        } else if constexpr (std::is_same_v<T, AcceptedBlock>) {
            apply_forward(r, impl_->forwarder.forward(r.candidate));
        } else if constexpr (std::is_same_v<T, Rejected>) {
            if (impl_->registry.record_rejection(session_id)) {
                impl_->close(session_id, CloseReason::TooManyInvalid);
            } else if (r.reason == RejectReason::Stale) {
                auto job = impl_->issue(session_id);
                (void)job;
            }
        }
    }, result);

    // Сессия закрыта лимитером после проверки решения блока
    if (*verdict == Verdict::Close) {
        impl_->close(session_id, CloseReason::RateLimited);
    }

    return result;
}

// =============================================================================
// Обслуживание
// =============================================================================

Result<TemplatePtr> Coordinator::refresh_template() {
    return impl_->store.refresh();
}

Result<Job> Coordinator::issue_job(SessionId session_id) {
    return impl_->issue(session_id);
}

MaintenanceReport Coordinator::maintain(TimePoint now) {
    return impl_->maintain(now);
}

void Coordinator::start() {
    impl_->store.start();

    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->maintenance_thread = std::thread([this] {
        impl_->maintenance_loop();
    });
}

void Coordinator::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        impl_->running.store(false, std::memory_order_relaxed);
    }
    impl_->wait_cv.notify_all();
    if (impl_->maintenance_thread.joinable()) {
        impl_->maintenance_thread.join();
    }

    impl_->store.stop();
}

void Coordinator::shutdown() {
    for (SessionId id : impl_->registry.close_all(CloseReason::Shutdown)) {
        impl_->sink.close_session(id, CloseReason::Shutdown);
    }
}

// =============================================================================
// Компоненты
// =============================================================================

TemplateStore& Coordinator::store() noexcept {
    return impl_->store;
}

NonceAllocator& Coordinator::allocator() noexcept {
    return impl_->allocator;
}

SessionRegistry& Coordinator::registry() noexcept {
    return impl_->registry;
}

SubmissionValidator& Coordinator::validator() noexcept {
    return impl_->validator;
}

BlockForwarder& Coordinator::forwarder() noexcept {
    return impl_->forwarder;
}

} // namespace xmrweb::mining
