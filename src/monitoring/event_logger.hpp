/**
 * @file event_logger.hpp
 * @brief Вывод событий координатора через Alerter
 *
 * Critical: найден блок, шаблон недоступен.
 * Warning: ошибки RPC, лимиты, отказ демона принять блок.
 * Остальное: Info или Debug (задания, shares).
 */

#pragma once

#include "events.hpp"

namespace xmrweb::monitoring {

class EventLogger {
public:
    /**
     * @brief Подписаться на hub
     */
    explicit EventLogger(EventHub& hub);

    /**
     * @brief Отписаться от hub
     */
    ~EventLogger();

    EventLogger(const EventLogger&) = delete;
    EventLogger& operator=(const EventLogger&) = delete;

    /**
     * @brief Вывести одно событие
     */
    static void log(const Event& event);

private:
    EventHub& hub_;
    uint64_t subscription_id_ = 0;
};

} // namespace xmrweb::monitoring
