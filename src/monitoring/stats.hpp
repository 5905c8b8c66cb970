/**
 * @file stats.hpp
 * @brief Статистика координатора
 *
 * Собирает счётчики из событий EventHub и периодически выводит их:
 * - Сессии и выданные задания
 * - Принятые и отклонённые shares
 * - Найденные и отправленные блоки
 * - Текущий шаблон и время безотказной работы
 */

#pragma once

#include "events.hpp"
#include "../core/config.hpp"

#include <memory>
#include <chrono>
#include <string>

namespace xmrweb::monitoring {

// =============================================================================
// Статистика координатора
// =============================================================================

/**
 * @brief Общая статистика координатора
 */
struct CoordinatorStats {
    // Сессии
    uint64_t sessions_opened = 0;
    uint64_t sessions_closed = 0;
    uint64_t active_sessions = 0;

    // Задания
    uint64_t jobs_issued = 0;
    uint64_t jobs_expired = 0;

    // Shares
    uint64_t shares_accepted = 0;
    uint64_t submissions_rejected = 0;
    uint64_t rate_limit_violations = 0;

    // Блоки
    uint64_t blocks_found = 0;        ///< Решений уровня сети
    uint64_t blocks_accepted = 0;     ///< Принятых демоном
    uint64_t blocks_rejected = 0;     ///< Отклонённых демоном
    uint64_t forward_failures = 0;    ///< Не доставленных

    // Демон
    uint64_t rpc_failures = 0;
    bool degraded = false;

    // Время
    std::chrono::steady_clock::time_point start_time;
    std::chrono::seconds uptime{0};

    // Текущий шаблон
    uint64_t current_height = 0;
    uint64_t current_generation = 0;
};

// =============================================================================
// Stats Collector
// =============================================================================

/**
 * @brief Сборщик и агрегатор статистики
 */
class StatsCollector {
public:
    /**
     * @brief Создать сборщик и подписать его на hub
     *
     * @param config Секция [logging] (stats_interval)
     * @param hub Источник событий
     */
    StatsCollector(const LoggingConfig& config, EventHub& hub);

    ~StatsCollector();

    // Запрещаем копирование
    StatsCollector(const StatsCollector&) = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;

    /**
     * @brief Учесть событие
     */
    void record(const Event& event);

    // =========================================================================
    // Получение статистики
    // =========================================================================

    /**
     * @brief Получить текущую статистику
     */
    [[nodiscard]] CoordinatorStats get_stats() const;

    /**
     * @brief Получить форматированную статистику для вывода
     */
    [[nodiscard]] std::string format_stats() const;

    /**
     * @brief Получить краткую строку статистики
     */
    [[nodiscard]] std::string format_summary() const;

    // =========================================================================
    // Периодический вывод
    // =========================================================================

    /**
     * @brief Запустить периодический вывод статистики
     *
     * Ничего не делает при stats_interval = 0.
     */
    void start_periodic_output();

    /**
     * @brief Остановить периодический вывод
     */
    void stop_periodic_output();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Форматирование
// =============================================================================

/**
 * @brief Форматировать время для отображения
 *
 * @param seconds Время в секундах
 * @return std::string Форматированная строка (например, "1d 2h 30m")
 */
[[nodiscard]] std::string format_duration(std::chrono::seconds seconds);

} // namespace xmrweb::monitoring
