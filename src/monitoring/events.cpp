/**
 * @file events.cpp
 * @brief Реализация EventHub
 */

#include "events.hpp"

#include <atomic>
#include <mutex>
#include <utility>
#include <vector>

namespace xmrweb::monitoring {

struct EventHub::Impl {
    mutable std::mutex mutex;
    std::vector<std::pair<uint64_t, std::shared_ptr<EventCallback>>> subscribers;
    uint64_t next_id = 1;
    std::atomic<uint64_t> emitted{0};
};

EventHub::EventHub()
    : impl_(std::make_unique<Impl>())
{
}

EventHub::~EventHub() = default;

uint64_t EventHub::subscribe(EventCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    uint64_t id = impl_->next_id++;
    impl_->subscribers.emplace_back(id, std::make_shared<EventCallback>(std::move(callback)));
    return id;
}

void EventHub::unsubscribe(uint64_t subscription_id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::erase_if(impl_->subscribers, [subscription_id](const auto& entry) {
        return entry.first == subscription_id;
    });
}

void EventHub::emit(Event event) {
    if (event.timestamp == TimePoint{}) {
        event.timestamp = Clock::now();
    }

    // Копируем список, чтобы не держать мьютекс во время вызова подписчиков
    std::vector<std::shared_ptr<EventCallback>> targets;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        targets.reserve(impl_->subscribers.size());
        for (const auto& [id, callback] : impl_->subscribers) {
            targets.push_back(callback);
        }
    }

    impl_->emitted.fetch_add(1, std::memory_order_relaxed);

    for (const auto& callback : targets) {
        (*callback)(event);
    }
}

void EventHub::emit(EventType type, std::string message, uint64_t session_id,
                    uint64_t job_id, uint64_t generation, uint64_t height) {
    Event event{type};
    event.message = std::move(message);
    event.session_id = session_id;
    event.job_id = job_id;
    event.generation = generation;
    event.height = height;
    emit(std::move(event));
}

uint64_t EventHub::emitted_count() const noexcept {
    return impl_->emitted.load(std::memory_order_relaxed);
}

} // namespace xmrweb::monitoring
