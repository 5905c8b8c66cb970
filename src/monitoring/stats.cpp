/**
 * @file stats.cpp
 * @brief Реализация сборщика статистики
 */

#include "stats.hpp"

#include <condition_variable>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <atomic>

namespace xmrweb::monitoring {

// =============================================================================
// Форматирование
// =============================================================================

std::string format_duration(std::chrono::seconds seconds) {
    auto count = seconds.count();

    if (count < 60) {
        return std::to_string(count) + "s";
    }

    auto minutes = count / 60;
    auto secs = count % 60;

    if (minutes < 60) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }

    auto hours = minutes / 60;
    minutes %= 60;

    if (hours < 24) {
        return std::to_string(hours) + "h " + std::to_string(minutes) + "m";
    }

    auto days = hours / 24;
    hours %= 24;

    return std::to_string(days) + "d " + std::to_string(hours) + "h " +
           std::to_string(minutes) + "m";
}

namespace {

/// @brief Строка таблицы: метка слева, значение справа
template<typename T>
void row(std::ostringstream& ss, std::string_view label, const T& value) {
    ss << "║ " << std::left << std::setw(22) << label
       << std::right << std::setw(38) << value << " ║\n";
}

} // anonymous namespace

// =============================================================================
// StatsCollector реализация
// =============================================================================

struct StatsCollector::Impl {
    LoggingConfig config;
    EventHub& hub;
    uint64_t subscription_id = 0;

    mutable std::mutex mutex;
    CoordinatorStats stats;

    std::atomic<bool> running{false};
    std::thread output_thread;
    std::mutex wait_mutex;
    std::condition_variable wait_cv;

    Impl(const LoggingConfig& cfg, EventHub& h) : config(cfg), hub(h) {
        stats.start_time = std::chrono::steady_clock::now();
    }

    ~Impl() {
        stop_output();
    }

    void stop_output() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex);
            running.store(false, std::memory_order_relaxed);
        }
        wait_cv.notify_all();
        if (output_thread.joinable()) {
            output_thread.join();
        }
    }

    void output_loop() {
        auto interval = std::chrono::seconds(config.stats_interval);

        while (running.load(std::memory_order_relaxed)) {
            {
                std::unique_lock<std::mutex> lock(wait_mutex);
                wait_cv.wait_for(lock, interval, [this] {
                    return !running.load(std::memory_order_relaxed);
                });
            }

            if (!running.load(std::memory_order_relaxed)) break;

            // Выводим статистику
            std::cout << format_stats_internal() << std::endl;
        }
    }

    std::string format_stats_internal() const {
        std::lock_guard<std::mutex> lock(mutex);

        auto now = std::chrono::steady_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            now - stats.start_time
        );

        std::ostringstream ss;
        ss << "╔══════════════════════════════════════════════════════════════╗\n";
        ss << "║               XMRWEB COORDINATOR STATISTICS                  ║\n";
        ss << "╠══════════════════════════════════════════════════════════════╣\n";

        row(ss, "Uptime:", format_duration(uptime));
        row(ss, "Block Height:", stats.current_height);
        row(ss, "Generation:", stats.current_generation);
        row(ss, "Template:", stats.degraded ? "DEGRADED" : "ok");

        ss << "╠══════════════════════════════════════════════════════════════╣\n";

        row(ss, "Sessions Active:", stats.active_sessions);
        row(ss, "Sessions Total:", stats.sessions_opened);
        row(ss, "Jobs Issued:", stats.jobs_issued);
        row(ss, "Jobs Expired:", stats.jobs_expired);

        ss << "╠══════════════════════════════════════════════════════════════╣\n";

        row(ss, "Shares Accepted:", stats.shares_accepted);
        row(ss, "Submissions Rejected:", stats.submissions_rejected);
        row(ss, "Rate Limit Hits:", stats.rate_limit_violations);

        ss << "╠══════════════════════════════════════════════════════════════╣\n";

        row(ss, "Blocks Found:", stats.blocks_found);
        row(ss, "Blocks Accepted:", stats.blocks_accepted);
        row(ss, "Blocks Rejected:", stats.blocks_rejected);
        row(ss, "Forward Failures:", stats.forward_failures);
        row(ss, "RPC Failures:", stats.rpc_failures);

        ss << "╚══════════════════════════════════════════════════════════════╝";

        return ss.str();
    }
};

// =============================================================================
// StatsCollector
// =============================================================================

StatsCollector::StatsCollector(const LoggingConfig& config, EventHub& hub)
    : impl_(std::make_unique<Impl>(config, hub))
{
    impl_->subscription_id = hub.subscribe([this](const Event& event) {
        record(event);
    });
}

StatsCollector::~StatsCollector() {
    impl_->hub.unsubscribe(impl_->subscription_id);
    impl_->stop_output();
}

void StatsCollector::record(const Event& event) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto& s = impl_->stats;

    switch (event.type) {
        case EventType::TemplateRefreshed:
            s.current_height = event.height;
            s.current_generation = event.generation;
            break;
        case EventType::JobIssued:
            s.jobs_issued++;
            break;
        case EventType::JobExpired:
            s.jobs_expired++;
            break;
        case EventType::ShareAccepted:
            s.shares_accepted++;
            break;
        case EventType::SubmissionRejected:
            s.submissions_rejected++;
            break;
        case EventType::BlockCandidate:
            s.blocks_found++;
            break;
        case EventType::BlockForwarded:
            s.blocks_accepted++;
            break;
        case EventType::BlockRejected:
            s.blocks_rejected++;
            break;
        case EventType::BlockForwardFailed:
            s.forward_failures++;
            break;
        case EventType::RateLimitViolation:
            s.rate_limit_violations++;
            break;
        case EventType::RpcFailure:
            s.rpc_failures++;
            break;
        case EventType::StoreDegraded:
            s.degraded = true;
            break;
        case EventType::StoreRecovered:
            s.degraded = false;
            break;
        case EventType::SessionOpened:
            s.sessions_opened++;
            s.active_sessions++;
            break;
        case EventType::SessionClosed:
            s.sessions_closed++;
            if (s.active_sessions > 0) {
                s.active_sessions--;
            }
            break;
        case EventType::SessionReady:
            break;
    }
}

CoordinatorStats StatsCollector::get_stats() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto stats = impl_->stats;
    auto now = std::chrono::steady_clock::now();
    stats.uptime = std::chrono::duration_cast<std::chrono::seconds>(
        now - stats.start_time
    );

    return stats;
}

std::string StatsCollector::format_stats() const {
    return impl_->format_stats_internal();
}

std::string StatsCollector::format_summary() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        now - impl_->stats.start_time
    );

    std::ostringstream ss;
    ss << "[" << format_duration(uptime) << "]"
       << " Height: " << impl_->stats.current_height
       << " | Sessions: " << impl_->stats.active_sessions
       << " | Shares: " << impl_->stats.shares_accepted
       << " | Rejected: " << impl_->stats.submissions_rejected
       << " | Blocks: " << impl_->stats.blocks_found;
    return ss.str();
}

void StatsCollector::start_periodic_output() {
    if (impl_->config.stats_interval == 0) {
        return;
    }
    if (impl_->running.exchange(true)) {
        return;
    }

    impl_->output_thread = std::thread([this] {
        impl_->output_loop();
    });
}

void StatsCollector::stop_periodic_output() {
    impl_->stop_output();
}

} // namespace xmrweb::monitoring
