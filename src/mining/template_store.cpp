/**
 * @file template_store.cpp
 * @brief Реализация Template Store
 */

#include "template_store.hpp"
#include "../core/constants.hpp"
#include "../core/hex.hpp"
#include "../monero/difficulty.hpp"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace xmrweb::mining {

struct TemplateStore::Impl {
    monero::IDaemonClient& daemon;
    NonceAllocator& allocator;
    MonerodConfig monerod;
    JobsConfig jobs;
    monitoring::EventHub* events;

    std::atomic<std::shared_ptr<const Template>> snapshot;

    // Последовательность refresh
    std::mutex refresh_mutex;
    Generation last_generation = 0;

    std::atomic<uint32_t> failures{0};
    std::atomic<bool> degraded{false};

    // Отметки вытеснения поколений
    mutable std::mutex history_mutex;
    std::map<Generation, TimePoint> superseded;

    std::mutex callback_mutex;
    PublishCallback publish_callback;

    // Фоновый поток
    std::atomic<bool> running{false};
    std::thread worker;
    std::mutex loop_mutex;
    std::condition_variable loop_cv;
    bool refresh_requested = false;

    Impl(monero::IDaemonClient& d, NonceAllocator& a, const MonerodConfig& m,
         const JobsConfig& j, monitoring::EventHub* e)
        : daemon(d), allocator(a), monerod(m), jobs(j), events(e) {}

    void emit(monitoring::EventType type, std::string message,
              Generation generation = 0, uint64_t height = 0) {
        if (events) {
            events->emit(type, std::move(message), 0, 0, generation, height);
        }
    }

    /**
     * @brief Учесть неудачный запрос
     */
    void record_failure(const Error& error) {
        uint32_t count = failures.fetch_add(1, std::memory_order_relaxed) + 1;
        emit(monitoring::EventType::RpcFailure,
             "get_block_template: " + error.message);

        if (count >= jobs.degraded_after_failures &&
            !degraded.exchange(true, std::memory_order_relaxed)) {
            emit(monitoring::EventType::StoreDegraded,
                 std::to_string(count) + " неудачных запросов подряд, выдача заданий приостановлена");
        }
    }

    void record_success() {
        failures.store(0, std::memory_order_relaxed);
        if (degraded.exchange(false, std::memory_order_relaxed)) {
            emit(monitoring::EventType::StoreRecovered, "Шаблон снова доступен");
        }
    }

    /**
     * @brief Построить снимок из ответа демона
     */
    Result<std::shared_ptr<Template>> build(const monero::BlockTemplateResponse& response) {
        auto blob = from_hex(response.blocktemplate_blob);
        if (!blob) {
            return Err<std::shared_ptr<Template>>(
                ErrorCode::RpcParseError,
                "blocktemplate_blob: " + blob.error().message
            );
        }
        if (blob->size() < constants::MIN_BLOB_SIZE) {
            return Err<std::shared_ptr<Template>>(
                ErrorCode::RpcParseError,
                "blocktemplate_blob слишком короткий: " + std::to_string(blob->size())
            );
        }

        uint64_t region_end = static_cast<uint64_t>(response.reserved_offset) + monerod.reserve_size;
        // Область не должна пересекаться с заголовком: nonce заголовка меняет воркер
        if (response.reserved_offset < HEADER_NONCE_OFFSET + HEADER_NONCE_SIZE ||
            region_end > blob->size()) {
            return Err<std::shared_ptr<Template>>(
                ErrorCode::RpcParseError,
                "Зарезервированная область [" + std::to_string(response.reserved_offset) + ", " +
                    std::to_string(region_end) + ") вне blob размером " +
                    std::to_string(blob->size())
            );
        }

        auto hashing_blob = from_hex(response.blockhashing_blob);

        auto tmpl = std::make_shared<Template>();
        tmpl->height = response.height;
        tmpl->prev_hash = response.prev_hash;
        tmpl->blob = std::move(*blob);
        if (hashing_blob) {
            tmpl->hashing_blob = std::move(*hashing_blob);
        }
        tmpl->difficulty = response.difficulty;
        tmpl->network_target = monero::difficulty_to_target(response.difficulty);
        tmpl->reserved_offset = response.reserved_offset;
        tmpl->reserved_size = monerod.reserve_size;
        tmpl->seed_hash = response.seed_hash;
        tmpl->expected_reward = response.expected_reward;
        tmpl->fetched_at = Clock::now();
        return tmpl;
    }

    Result<TemplatePtr> refresh() {
        std::lock_guard<std::mutex> lock(refresh_mutex);

        // Сетевой запрос без блокировок аллокатора и реестра
        auto response = daemon.get_block_template(monerod.wallet_address, monerod.reserve_size);
        if (!response) {
            record_failure(response.error());
            return std::unexpected(response.error());
        }

        auto built = build(*response);
        if (!built) {
            record_failure(built.error());
            return std::unexpected(built.error());
        }

        record_success();

        auto previous = snapshot.load();
        if (previous && previous->height == (*built)->height &&
            previous->prev_hash == (*built)->prev_hash) {
            return previous;
        }

        auto& fresh = *built;
        fresh->generation = ++last_generation;

        auto opened = allocator.open_generation(
            fresh->generation, fresh->reserved_offset, fresh->reserved_size
        );
        if (!opened) {
            return std::unexpected(opened.error());
        }

        if (previous) {
            allocator.close_generation(previous->generation);

            std::lock_guard<std::mutex> history_lock(history_mutex);
            superseded[previous->generation] = fresh->fetched_at;
            while (superseded.size() > constants::MAX_GENERATION_HISTORY) {
                superseded.erase(superseded.begin());
            }
        }

        TemplatePtr published = fresh;
        snapshot.store(published);

        emit(monitoring::EventType::TemplateRefreshed,
             "height " + std::to_string(published->height) + ", difficulty " +
                 monero::format_difficulty(published->difficulty),
             published->generation, published->height);

        PublishCallback callback;
        {
            std::lock_guard<std::mutex> callback_lock(callback_mutex);
            callback = publish_callback;
        }
        if (callback) {
            callback(published);
        }

        return published;
    }

    void loop() {
        auto interval = std::chrono::milliseconds(jobs.template_refresh_interval_ms);

        while (running.load(std::memory_order_relaxed)) {
            // Ошибка уже учтена в record_failure и опубликована как событие
            auto result = refresh();
            (void)result;

            std::unique_lock<std::mutex> lock(loop_mutex);
            loop_cv.wait_for(lock, interval, [this] {
                return refresh_requested || !running.load(std::memory_order_relaxed);
            });
            refresh_requested = false;
        }
    }
};

// =============================================================================
// TemplateStore
// =============================================================================

TemplateStore::TemplateStore(
    monero::IDaemonClient& daemon,
    NonceAllocator& allocator,
    const MonerodConfig& monerod,
    const JobsConfig& jobs,
    monitoring::EventHub* events
)
    : impl_(std::make_unique<Impl>(daemon, allocator, monerod, jobs, events))
{
}

TemplateStore::~TemplateStore() {
    stop();
}

TemplatePtr TemplateStore::current() const {
    return impl_->snapshot.load();
}

Result<TemplatePtr> TemplateStore::refresh() {
    return impl_->refresh();
}

bool TemplateStore::issuance_allowed() const {
    return !impl_->degraded.load(std::memory_order_relaxed) && impl_->snapshot.load() != nullptr;
}

bool TemplateStore::degraded() const noexcept {
    return impl_->degraded.load(std::memory_order_relaxed);
}

uint32_t TemplateStore::consecutive_failures() const noexcept {
    return impl_->failures.load(std::memory_order_relaxed);
}

std::optional<TimePoint> TemplateStore::superseded_at(Generation generation) const {
    std::lock_guard<std::mutex> lock(impl_->history_mutex);
    auto it = impl_->superseded.find(generation);
    if (it == impl_->superseded.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TemplateStore::within_grace(Generation generation, TimePoint now) const {
    auto snapshot = impl_->snapshot.load();
    if (snapshot && snapshot->generation == generation) {
        return true;
    }

    auto at = superseded_at(generation);
    if (!at) {
        return false;
    }
    return now - *at <= std::chrono::milliseconds(impl_->jobs.stale_job_grace_ms);
}

std::size_t TemplateStore::retire_expired(TimePoint now) {
    auto grace = std::chrono::milliseconds(impl_->jobs.stale_job_grace_ms);

    std::vector<Generation> expired;
    {
        std::lock_guard<std::mutex> lock(impl_->history_mutex);
        for (const auto& [generation, at] : impl_->superseded) {
            if (now - at > grace) {
                expired.push_back(generation);
            }
        }
    }

    std::size_t retired = 0;
    for (Generation generation : expired) {
        if (impl_->allocator.retire(generation)) {
            ++retired;
        }
    }
    return retired;
}

void TemplateStore::set_publish_callback(PublishCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->publish_callback = std::move(callback);
}

void TemplateStore::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->worker = std::thread([this] {
        impl_->loop();
    });
}

void TemplateStore::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->loop_mutex);
        impl_->running.store(false, std::memory_order_relaxed);
    }
    impl_->loop_cv.notify_all();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

void TemplateStore::request_refresh() {
    {
        std::lock_guard<std::mutex> lock(impl_->loop_mutex);
        impl_->refresh_requested = true;
    }
    impl_->loop_cv.notify_all();
}

bool TemplateStore::is_running() const noexcept {
    return impl_->running.load(std::memory_order_relaxed);
}

} // namespace xmrweb::mining
