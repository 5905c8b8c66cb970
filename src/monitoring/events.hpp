/**
 * @file events.hpp
 * @brief Структурированные события координатора
 *
 * Компоненты публикуют события в EventHub, подписчики (логирование,
 * статистика, внешний экспорт) получают их синхронно в потоке издателя.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace xmrweb::monitoring {

// =============================================================================
// Типы событий
// =============================================================================

enum class EventType {
    TemplateRefreshed,      ///< Опубликовано новое поколение шаблона
    JobIssued,              ///< Сессия получила задание
    JobExpired,             ///< Задание истекло по ttl
    ShareAccepted,          ///< Принят share
    SubmissionRejected,     ///< Отправка отклонена
    BlockCandidate,         ///< Найдено решение уровня сети
    BlockForwarded,         ///< Демон принял блок
    BlockRejected,          ///< Демон отклонил блок
    BlockForwardFailed,     ///< Блок не доставлен после всех повторов
    RateLimitViolation,     ///< Сессия превысила лимит
    RpcFailure,             ///< Ошибка RPC демона
    StoreDegraded,          ///< Template Store перешёл в degraded
    StoreRecovered,         ///< Template Store восстановился
    SessionOpened,
    SessionReady,           ///< Воркер прислал приветствие
    SessionClosed
};

[[nodiscard]] constexpr std::string_view to_string(EventType type) noexcept {
    switch (type) {
        case EventType::TemplateRefreshed:  return "TEMPLATE";
        case EventType::JobIssued:          return "JOB";
        case EventType::JobExpired:         return "JOB_EXPIRED";
        case EventType::ShareAccepted:      return "SHARE";
        case EventType::SubmissionRejected: return "REJECT";
        case EventType::BlockCandidate:     return "BLOCK_FOUND";
        case EventType::BlockForwarded:     return "BLOCK_OK";
        case EventType::BlockRejected:      return "BLOCK_REJECTED";
        case EventType::BlockForwardFailed: return "BLOCK_FAILED";
        case EventType::RateLimitViolation: return "RATE_LIMIT";
        case EventType::RpcFailure:         return "RPC_FAIL";
        case EventType::StoreDegraded:      return "DEGRADED";
        case EventType::StoreRecovered:     return "RECOVERED";
        case EventType::SessionOpened:      return "SESSION_OPEN";
        case EventType::SessionReady:       return "SESSION_READY";
        case EventType::SessionClosed:      return "SESSION_CLOSE";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Запись события
 *
 * Поля, не относящиеся к типу события, остаются нулевыми.
 */
struct Event {
    EventType type;
    TimePoint timestamp{};
    uint64_t session_id = 0;
    uint64_t job_id = 0;
    uint64_t generation = 0;
    uint64_t height = 0;
    std::string message;
};

using EventCallback = std::function<void(const Event& event)>;

// =============================================================================
// EventHub
// =============================================================================

/**
 * @brief Рассылка событий подписчикам
 *
 * Потокобезопасен. Подписчики вызываются вне внутренней блокировки,
 * поэтому могут публиковать события сами.
 */
class EventHub {
public:
    EventHub();
    ~EventHub();

    EventHub(const EventHub&) = delete;
    EventHub& operator=(const EventHub&) = delete;

    /**
     * @brief Подписаться на все события
     *
     * @return Идентификатор подписки для unsubscribe
     */
    uint64_t subscribe(EventCallback callback);

    void unsubscribe(uint64_t subscription_id);

    /**
     * @brief Опубликовать событие
     *
     * timestamp заполняется, если не задан.
     */
    void emit(Event event);

    /**
     * @brief Короткая форма emit
     */
    void emit(EventType type, std::string message, uint64_t session_id = 0,
              uint64_t job_id = 0, uint64_t generation = 0, uint64_t height = 0);

    [[nodiscard]] uint64_t emitted_count() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xmrweb::monitoring
