/**
 * @file session_registry.cpp
 * @brief Реализация реестра сессий
 */

#include "session_registry.hpp"
#include "../core/constants.hpp"
#include "../monero/difficulty.hpp"

#include <algorithm>
#include <atomic>
#include <deque>
#include <mutex>
#include <unordered_map>

namespace xmrweb::mining {

namespace {

/**
 * @brief Запись сессии
 */
struct SessionEntry {
    std::mutex mutex;

    SessionId session_id = 0;
    std::string remote_address;
    TimePoint connected_at{};
    TimePoint last_seen{};
    SessionState state = SessionState::Connecting;

    std::optional<Job> current_job;
    std::deque<Job> grace_jobs;
    Generation last_generation = 0;

    RateLimiter limiter;
    uint32_t invalid_submissions = 0;
    uint64_t shares = 0;

    bool hello_received = false;
    std::string client_version;
    uint32_t threads = 0;

    explicit SessionEntry(const LimitsConfig& limits) : limiter(limits) {}
};

} // anonymous namespace

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct SessionRegistry::Impl {
    ServerConfig server;
    JobsConfig jobs;
    LimitsConfig limits;
    TemplateStore& store;
    NonceAllocator& allocator;
    monitoring::EventHub* events;

    mutable std::mutex map_mutex;
    std::unordered_map<SessionId, std::shared_ptr<SessionEntry>> sessions;
    std::unordered_map<std::string, std::size_t> per_address;

    std::atomic<SessionId> next_session_id{1};
    std::atomic<JobId> next_job_id{1};

    Impl(const ServerConfig& s, const JobsConfig& j, const LimitsConfig& l,
         TemplateStore& st, NonceAllocator& a, monitoring::EventHub* e)
        : server(s), jobs(j), limits(l), store(st), allocator(a), events(e) {}

    std::shared_ptr<SessionEntry> find(SessionId session_id) const {
        std::lock_guard<std::mutex> lock(map_mutex);
        auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            return nullptr;
        }
        return it->second;
    }

    std::vector<std::shared_ptr<SessionEntry>> all() const {
        std::lock_guard<std::mutex> lock(map_mutex);
        std::vector<std::shared_ptr<SessionEntry>> result;
        result.reserve(sessions.size());
        for (const auto& [id, entry] : sessions) {
            result.push_back(entry);
        }
        return result;
    }

    void emit(monitoring::EventType type, std::string message, SessionId session_id,
              const Job* job = nullptr) {
        if (!events) {
            return;
        }
        if (job) {
            events->emit(type, std::move(message), session_id, job->job_id,
                         job->generation, job->height);
        } else {
            events->emit(type, std::move(message), session_id);
        }
    }

    /**
     * @brief Освободить все срезы сессии (под мьютексом сессии)
     */
    void release_all(SessionEntry& entry) {
        if (entry.current_job) {
            allocator.release(entry.current_job->generation, entry.current_job->nonce_range);
            entry.current_job.reset();
        }
        for (const auto& job : entry.grace_jobs) {
            allocator.release(job.generation, job.nonce_range);
        }
        entry.grace_jobs.clear();
    }

    /**
     * @brief Убрать текущее задание при выдаче нового
     */
    void retire_current(SessionEntry& entry, Generation new_generation) {
        if (!entry.current_job) {
            return;
        }

        Job old = std::move(*entry.current_job);
        entry.current_job.reset();

        if (old.generation == new_generation) {
            allocator.release(old.generation, old.nonce_range);
            return;
        }

        // Вытесненное поколение: shares по нему ещё принимаются в grace окне
        entry.grace_jobs.push_back(std::move(old));
        while (entry.grace_jobs.size() > constants::MAX_GRACE_JOBS) {
            const auto& dropped = entry.grace_jobs.front();
            allocator.release(dropped.generation, dropped.nonce_range);
            entry.grace_jobs.pop_front();
        }
    }

    Result<NonceRange> allocate_for(SessionEntry& entry, TemplatePtr& tmpl) {
        auto range = allocator.allocate(tmpl->generation);

        // Поколение вытеснено между чтением снимка и выдачей
        if (!range && range.error().code == ErrorCode::MiningStaleJob) {
            auto latest = store.current();
            if (latest && latest->generation > tmpl->generation) {
                tmpl = latest;
                range = allocator.allocate(tmpl->generation);
            }
        }

        // Область исчерпана: освобождаем собственный срез того же поколения
        if (!range && range.error().code == ErrorCode::CapacityNonceExhausted &&
            entry.current_job && entry.current_job->generation == tmpl->generation) {
            allocator.release(entry.current_job->generation, entry.current_job->nonce_range);
            entry.current_job.reset();
            range = allocator.allocate(tmpl->generation);
        }

        return range;
    }
};

SessionRegistry::SessionRegistry(
    const ServerConfig& server,
    const JobsConfig& jobs,
    const LimitsConfig& limits,
    TemplateStore& store,
    NonceAllocator& allocator,
    monitoring::EventHub* events
)
    : impl_(std::make_unique<Impl>(server, jobs, limits, store, allocator, events))
{
}

SessionRegistry::~SessionRegistry() = default;

// =============================================================================
// Жизненный цикл
// =============================================================================

Result<SessionId> SessionRegistry::register_session(std::string_view remote_address) {
    auto now = Clock::now();
    std::string address(remote_address);

    std::shared_ptr<SessionEntry> entry;
    {
        std::lock_guard<std::mutex> lock(impl_->map_mutex);

        if (impl_->sessions.size() >= impl_->server.max_connections) {
            return Err<SessionId>(
                ErrorCode::CapacityLimitExceeded,
                "Достигнут лимит сессий: " + std::to_string(impl_->server.max_connections)
            );
        }

        auto& per_address = impl_->per_address[address];
        if (per_address >= impl_->server.max_connections_per_ip) {
            return Err<SessionId>(
                ErrorCode::CapacityLimitExceeded,
                "Достигнут лимит сессий для " + address
            );
        }

        entry = std::make_shared<SessionEntry>(impl_->limits);
        entry->session_id = impl_->next_session_id.fetch_add(1, std::memory_order_relaxed);
        entry->remote_address = address;
        entry->connected_at = now;
        entry->last_seen = now;

        impl_->sessions.emplace(entry->session_id, entry);
        ++per_address;
    }

    impl_->emit(monitoring::EventType::SessionOpened, address, entry->session_id);
    return entry->session_id;
}

Result<Job> SessionRegistry::assign_job(SessionId session_id) {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return Err<Job>(ErrorCode::TransportUnknownSession);
    }

    auto tmpl = impl_->store.current();
    if (!tmpl || !impl_->store.issuance_allowed()) {
        return Err<Job>(ErrorCode::CapacityNoTemplate);
    }

    std::lock_guard<std::mutex> lock(entry->mutex);

    if (entry->state == SessionState::Closing || entry->state == SessionState::Closed) {
        return Err<Job>(ErrorCode::TransportSessionClosed);
    }

    // Сессия уже видела более новое поколение: перечитываем снимок
    if (tmpl->generation < entry->last_generation) {
        tmpl = impl_->store.current();
        if (!tmpl || tmpl->generation < entry->last_generation) {
            return Err<Job>(ErrorCode::MiningStaleJob, "Поколение шаблона устарело");
        }
    }

    auto range = impl_->allocate_for(*entry, tmpl);
    if (!range) {
        return std::unexpected(range.error());
    }

    impl_->retire_current(*entry, tmpl->generation);

    Job job;
    job.job_id = impl_->next_job_id.fetch_add(1, std::memory_order_relaxed);
    job.session_id = session_id;
    job.generation = tmpl->generation;
    job.height = tmpl->height;
    job.nonce_range = *range;
    // Share target не может быть строже сетевого
    job.share_difficulty = std::min(impl_->jobs.share_difficulty, tmpl->difficulty);
    job.share_target = monero::difficulty_to_target(job.share_difficulty);
    job.issued_at = Clock::now();
    job.ttl = std::chrono::milliseconds(impl_->jobs.job_ttl_ms);
    job.block_template = tmpl;
    job.reserved_value = make_reserved_value(job.nonce_range, job.job_id);
    job.blob = stamp_job_blob(*tmpl, job.nonce_range, job.reserved_value);

    entry->current_job = job;
    entry->last_generation = tmpl->generation;
    if (entry->state == SessionState::Connecting) {
        entry->state = SessionState::Active;
    }

    impl_->emit(monitoring::EventType::JobIssued,
                "range [" + std::to_string(job.nonce_range.start) + ", " +
                    std::to_string(job.nonce_range.end) + ")",
                session_id, &job);
    return job;
}

bool SessionRegistry::close(SessionId session_id, CloseReason reason) {
    std::shared_ptr<SessionEntry> entry;
    {
        std::lock_guard<std::mutex> lock(impl_->map_mutex);
        auto it = impl_->sessions.find(session_id);
        if (it == impl_->sessions.end()) {
            return false;
        }
        entry = it->second;
        impl_->sessions.erase(it);

        auto address = impl_->per_address.find(entry->remote_address);
        if (address != impl_->per_address.end()) {
            if (--address->second == 0) {
                impl_->per_address.erase(address);
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        entry->state = SessionState::Closing;
        impl_->release_all(*entry);
        entry->state = SessionState::Closed;
    }

    impl_->emit(monitoring::EventType::SessionClosed, std::string(to_string(reason)), session_id);
    return true;
}

std::vector<SessionId> SessionRegistry::close_all(CloseReason reason) {
    std::vector<SessionId> closed;
    for (SessionId id : session_ids()) {
        if (close(id, reason)) {
            closed.push_back(id);
        }
    }
    return closed;
}

// =============================================================================
// Сообщения
// =============================================================================

Result<void> SessionRegistry::record_hello(SessionId session_id, std::string_view client_version,
                                          uint32_t threads) {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return Err<void>(ErrorCode::TransportUnknownSession);
    }

    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->state == SessionState::Closing || entry->state == SessionState::Closed) {
            return Err<void>(ErrorCode::TransportSessionClosed);
        }
        entry->hello_received = true;
        entry->client_version = std::string(client_version);
        entry->threads = threads;
    }

    impl_->emit(monitoring::EventType::SessionReady,
                std::string(client_version) + ", threads " + std::to_string(threads), session_id);
    return {};
}

void SessionRegistry::touch(SessionId session_id, TimePoint now) {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->last_seen = std::max(entry->last_seen, now);
}

Result<Verdict> SessionRegistry::admit(SessionId session_id, MessageKind kind, TimePoint now) {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return Err<Verdict>(ErrorCode::TransportUnknownSession);
    }

    Verdict verdict;
    std::optional<Quota> violated;
    uint32_t strikes = 0;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->state == SessionState::Closing || entry->state == SessionState::Closed) {
            return Err<Verdict>(ErrorCode::TransportSessionClosed);
        }

        entry->last_seen = std::max(entry->last_seen, now);

        verdict = (kind == MessageKind::Submit)
            ? entry->limiter.admit_submit(now)
            : entry->limiter.admit_message(now);

        if (entry->limiter.limited()) {
            entry->state = SessionState::RateLimited;
        } else if (entry->state == SessionState::RateLimited) {
            entry->state = entry->current_job ? SessionState::Active : SessionState::Connecting;
        }
        violated = entry->limiter.violated();
        strikes = entry->limiter.strikes();
    }

    if (verdict != Verdict::Allow && violated) {
        impl_->emit(monitoring::EventType::RateLimitViolation,
                    std::string(to_string(*violated)) + ", strikes " + std::to_string(strikes),
                    session_id);
    }
    return verdict;
}

Result<Verdict> SessionRegistry::record_share(SessionId session_id, TimePoint now) {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return Err<Verdict>(ErrorCode::TransportUnknownSession);
    }

    Verdict verdict;
    uint32_t strikes = 0;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ++entry->shares;
        verdict = entry->limiter.record_share(now);
        if (entry->limiter.limited()) {
            entry->state = SessionState::RateLimited;
        }
        strikes = entry->limiter.strikes();
    }

    if (verdict != Verdict::Allow) {
        impl_->emit(monitoring::EventType::RateLimitViolation,
                    std::string(to_string(Quota::Shares)) + ", strikes " + std::to_string(strikes),
                    session_id);
    }
    return verdict;
}

bool SessionRegistry::record_rejection(SessionId session_id) {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return false;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    ++entry->invalid_submissions;
    return entry->invalid_submissions > impl_->limits.max_invalid_submissions;
}

std::optional<Job> SessionRegistry::find_job(SessionId session_id, JobId job_id) const {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->current_job && entry->current_job->job_id == job_id) {
        return entry->current_job;
    }
    for (const auto& job : entry->grace_jobs) {
        if (job.job_id == job_id) {
            return job;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Обслуживание
// =============================================================================

std::vector<SessionId> SessionRegistry::sweep_idle(TimePoint now) {
    auto timeout = std::chrono::milliseconds(impl_->server.idle_timeout_ms);

    std::vector<SessionId> idle;
    for (const auto& entry : impl_->all()) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (now - entry->last_seen > timeout) {
            idle.push_back(entry->session_id);
        }
    }

    std::vector<SessionId> closed;
    for (SessionId id : idle) {
        if (close(id, CloseReason::IdleTimeout)) {
            closed.push_back(id);
        }
    }
    return closed;
}

std::vector<SessionId> SessionRegistry::expire_jobs(TimePoint now) {
    std::vector<SessionId> expired;

    for (const auto& entry : impl_->all()) {
        std::optional<Job> dropped;
        {
            std::lock_guard<std::mutex> lock(entry->mutex);

            if (entry->current_job && entry->current_job->expired(now)) {
                dropped = std::move(*entry->current_job);
                entry->current_job.reset();
                impl_->allocator.release(dropped->generation, dropped->nonce_range);
            }

            // Grace задания: истёк ttl или поколение вне grace окна
            std::erase_if(entry->grace_jobs, [&](const Job& job) {
                if (job.expired(now) || !impl_->store.within_grace(job.generation, now)) {
                    impl_->allocator.release(job.generation, job.nonce_range);
                    return true;
                }
                return false;
            });
        }

        if (dropped) {
            impl_->emit(monitoring::EventType::JobExpired, "ttl", entry->session_id, &*dropped);
            expired.push_back(entry->session_id);
        }
    }

    return expired;
}

// =============================================================================
// Статистика
// =============================================================================

std::optional<SessionSnapshot> SessionRegistry::snapshot(SessionId session_id) const {
    auto entry = impl_->find(session_id);
    if (!entry) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    SessionSnapshot snap;
    snap.session_id = entry->session_id;
    snap.remote_address = entry->remote_address;
    snap.connected_at = entry->connected_at;
    snap.last_seen = entry->last_seen;
    snap.state = entry->state;
    snap.current_job = entry->current_job;
    snap.grace_jobs = entry->grace_jobs.size();
    snap.last_generation = entry->last_generation;
    snap.rate_strikes = entry->limiter.strikes();
    snap.invalid_submissions = entry->invalid_submissions;
    snap.shares = entry->shares;
    snap.hello_received = entry->hello_received;
    snap.client_version = entry->client_version;
    snap.threads = entry->threads;
    return snap;
}

std::size_t SessionRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(impl_->map_mutex);
    return impl_->sessions.size();
}

std::size_t SessionRegistry::count_for_address(std::string_view remote_address) const {
    std::lock_guard<std::mutex> lock(impl_->map_mutex);
    auto it = impl_->per_address.find(std::string(remote_address));
    return it == impl_->per_address.end() ? 0 : it->second;
}

std::vector<SessionId> SessionRegistry::session_ids() const {
    std::lock_guard<std::mutex> lock(impl_->map_mutex);
    std::vector<SessionId> ids;
    ids.reserve(impl_->sessions.size());
    for (const auto& [id, entry] : impl_->sessions) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace xmrweb::mining
