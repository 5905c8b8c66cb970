/**
 * @file submission_validator.cpp
 * @brief Реализация валидатора отправок
 */

#include "submission_validator.hpp"
#include "../core/hex.hpp"
#include "../monero/difficulty.hpp"

#include <atomic>

namespace xmrweb::mining {

bool matches_job_blob(const Bytes& job_blob, const Bytes& blob) noexcept {
    if (job_blob.size() != blob.size()) {
        return false;
    }
    for (std::size_t i = 0; i < blob.size(); ++i) {
        if (blob[i] == job_blob[i]) {
            continue;
        }
        bool header_nonce = i >= HEADER_NONCE_OFFSET && i < HEADER_NONCE_OFFSET + HEADER_NONCE_SIZE;
        if (!header_nonce) {
            return false;
        }
    }
    return true;
}

struct SubmissionValidator::Impl {
    SessionRegistry& registry;
    TemplateStore& store;
    IPowVerifier& verifier;
    monitoring::EventHub* events;

    // Статистика
    std::atomic<uint64_t> submitted{0};
    std::atomic<uint64_t> accepted{0};
    std::atomic<uint64_t> blocks{0};
    std::atomic<uint64_t> stale{0};
    std::atomic<uint64_t> rejected{0};
    std::atomic<uint64_t> verifier_calls{0};

    Impl(SessionRegistry& r, TemplateStore& s, IPowVerifier& v, monitoring::EventHub* e)
        : registry(r), store(s), verifier(v), events(e) {}

    SubmissionResult reject(SessionId session_id, JobId job_id, const Job* job,
                            RejectReason reason, std::string detail) {
        rejected.fetch_add(1, std::memory_order_relaxed);
        if (reason == RejectReason::Stale) {
            stale.fetch_add(1, std::memory_order_relaxed);
        }
        if (events) {
            events->emit(monitoring::EventType::SubmissionRejected,
                         std::string(to_string(reason)) + ": " + detail,
                         session_id, job_id,
                         job ? job->generation : 0, job ? job->height : 0);
        }
        return Rejected{reason, std::move(detail)};
    }
};

SubmissionValidator::SubmissionValidator(
    SessionRegistry& registry,
    TemplateStore& store,
    IPowVerifier& verifier,
    monitoring::EventHub* events
)
    : impl_(std::make_unique<Impl>(registry, store, verifier, events))
{
}

SubmissionValidator::~SubmissionValidator() = default;

SubmissionResult SubmissionValidator::validate(
    SessionId session_id,
    const Candidate& candidate,
    TimePoint now
) {
    impl_->submitted.fetch_add(1, std::memory_order_relaxed);

    // 1. Задание сессии
    auto job_opt = impl_->registry.find_job(session_id, candidate.job_id);
    if (!job_opt) {
        return impl_->reject(session_id, candidate.job_id, nullptr, RejectReason::UnknownJob,
                             "job " + format_job_id(candidate.job_id));
    }
    const Job& job = *job_opt;

    // 2. ttl и grace окно поколения
    if (job.expired(now)) {
        return impl_->reject(session_id, job.job_id, &job, RejectReason::Stale, "ttl истёк");
    }
    if (!impl_->store.within_grace(job.generation, now)) {
        return impl_->reject(session_id, job.job_id, &job, RejectReason::Stale,
                             "поколение " + std::to_string(job.generation) + " вытеснено");
    }

    // 3. blob несёт печать среза задания
    const auto& tmpl = job.block_template;
    if (!tmpl || job.blob.empty()) {
        return impl_->reject(session_id, job.job_id, &job, RejectReason::Malformed,
                             "задание без blob");
    }

    Bytes blob;
    if (candidate.blob.empty()) {
        blob = job.blob;
        write_header_nonce(blob, candidate.nonce);
    } else {
        if (candidate.blob.size() != job.blob.size()) {
            return impl_->reject(session_id, job.job_id, &job, RejectReason::Malformed,
                                 "длина blob " + std::to_string(candidate.blob.size()));
        }

        auto coordinate = reserved_coordinate(*tmpl, candidate.blob);
        if (!coordinate || !job.nonce_range.contains(*coordinate)) {
            return impl_->reject(session_id, job.job_id, &job, RejectReason::OutOfRange,
                                 "координата " +
                                     (coordinate ? std::to_string(*coordinate) : std::string("нет")) +
                                     " вне [" + std::to_string(job.nonce_range.start) + ", " +
                                     std::to_string(job.nonce_range.end) + ")");
        }
        if (!matches_job_blob(job.blob, candidate.blob)) {
            return impl_->reject(session_id, job.job_id, &job, RejectReason::OutOfRange,
                                 "печать среза или blob не совпадают с заданием");
        }
        if (read_header_nonce(candidate.blob) != candidate.nonce) {
            return impl_->reject(session_id, job.job_id, &job, RejectReason::Malformed,
                                 "nonce не совпадает с blob");
        }
        blob = candidate.blob;
    }

    // 4. Share target
    Candidate resolved = candidate;
    resolved.blob = blob;

    impl_->verifier_calls.fetch_add(1, std::memory_order_relaxed);
    auto hash = impl_->verifier.compute(job, resolved);
    if (!hash) {
        return impl_->reject(session_id, job.job_id, &job, RejectReason::InvalidProof,
                             hash.error().message);
    }
    if (!monero::meets_target(*hash, job.share_target)) {
        return impl_->reject(session_id, job.job_id, &job, RejectReason::InvalidProof,
                             "хеш не удовлетворяет share target");
    }

    // 5. Сетевой target
    if (monero::meets_target(*hash, tmpl->network_target)) {
        auto latest = impl_->store.current();
        if (!latest || latest->generation != job.generation) {
            impl_->stale.fetch_add(1, std::memory_order_relaxed);
            if (impl_->events) {
                impl_->events->emit(monitoring::EventType::SubmissionRejected,
                                    "stale block-level work, height " + std::to_string(job.height),
                                    session_id, job.job_id, job.generation, job.height);
            }
            return Stale{job.job_id};
        }

        impl_->blocks.fetch_add(1, std::memory_order_relaxed);

        BlockCandidate block;
        block.session_id = session_id;
        block.job_id = job.job_id;
        block.generation = job.generation;
        block.height = job.height;
        block.nonce = candidate.nonce;
        block.hash = *hash;
        block.blob = std::move(blob);

        if (impl_->events) {
            impl_->events->emit(monitoring::EventType::BlockCandidate,
                                "hash " + to_hex(*hash), session_id, job.job_id,
                                job.generation, job.height);
        }
        return AcceptedBlock{std::move(block)};
    }

    impl_->accepted.fetch_add(1, std::memory_order_relaxed);
    uint64_t difficulty = monero::hash_difficulty(*hash);
    if (impl_->events) {
        impl_->events->emit(monitoring::EventType::ShareAccepted,
                            "difficulty " + monero::format_difficulty(difficulty),
                            session_id, job.job_id, job.generation, job.height);
    }
    return Accepted{job.job_id, difficulty};
}

ValidatorStats SubmissionValidator::stats() const {
    ValidatorStats s;
    s.submitted = impl_->submitted.load(std::memory_order_relaxed);
    s.accepted = impl_->accepted.load(std::memory_order_relaxed);
    s.blocks = impl_->blocks.load(std::memory_order_relaxed);
    s.stale = impl_->stale.load(std::memory_order_relaxed);
    s.rejected = impl_->rejected.load(std::memory_order_relaxed);
    s.verifier_calls = impl_->verifier_calls.load(std::memory_order_relaxed);
    return s;
}

void SubmissionValidator::reset_stats() {
    impl_->submitted.store(0, std::memory_order_relaxed);
    impl_->accepted.store(0, std::memory_order_relaxed);
    impl_->blocks.store(0, std::memory_order_relaxed);
    impl_->stale.store(0, std::memory_order_relaxed);
    impl_->rejected.store(0, std::memory_order_relaxed);
    impl_->verifier_calls.store(0, std::memory_order_relaxed);
}

} // namespace xmrweb::mining
