/**
 * @file rate_limiter.hpp
 * @brief Скользящие окна лимитов сессии
 *
 * Каждая сессия имеет три окна:
 * - сообщения в секунду
 * - submit в минуту
 * - принятые shares в минуту
 *
 * Превышение любого окна переводит сессию в состояние limited: следующие
 * сообщения (кроме кандидатов блока) отбрасываются, пока нарушенное окно
 * не освободится. Каждое отброшенное сообщение - strike; при превышении
 * max_strikes сессия закрывается.
 *
 * @note RateLimiter не потокобезопасен: он принадлежит записи сессии и
 *       используется под её мьютексом.
 */

#pragma once

#include "../core/config.hpp"
#include "../core/types.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string_view>

namespace xmrweb::mining {

// =============================================================================
// Скользящее окно
// =============================================================================

/**
 * @brief Счётчик событий в скользящем окне
 */
class SlidingWindow {
public:
    SlidingWindow(uint32_t limit, std::chrono::milliseconds window);

    /**
     * @brief Учесть событие, если в окне есть место
     *
     * @return true если событие учтено
     */
    bool check(TimePoint now);

    /**
     * @brief Есть ли место в окне (без учёта события)
     */
    [[nodiscard]] bool has_capacity(TimePoint now);

    /**
     * @brief Сколько событий ещё допускается
     */
    [[nodiscard]] uint32_t remaining(TimePoint now);

    [[nodiscard]] uint32_t limit() const noexcept { return limit_; }

private:
    void prune(TimePoint now);

    uint32_t limit_;
    std::chrono::milliseconds window_;
    std::deque<TimePoint> events_;
};

// =============================================================================
// Лимитер сессии
// =============================================================================

/**
 * @brief Вид лимита
 */
enum class Quota {
    Messages,
    Submits,
    Shares
};

[[nodiscard]] constexpr std::string_view to_string(Quota quota) noexcept {
    switch (quota) {
        case Quota::Messages: return "messages_per_second";
        case Quota::Submits:  return "submits_per_minute";
        case Quota::Shares:   return "shares_per_minute";
        default: return "unknown";
    }
}

/**
 * @brief Решение по входящему сообщению
 */
enum class Verdict {
    Allow,    ///< Обработать
    Drop,     ///< Отбросить без обработки (strike учтён)
    Close     ///< Strikes исчерпаны, сессию нужно закрыть
};

class RateLimiter {
public:
    explicit RateLimiter(const LimitsConfig& config);

    /**
     * @brief Допустить служебное сообщение (keepalive)
     */
    Verdict admit_message(TimePoint now);

    /**
     * @brief Допустить отправку результата
     */
    Verdict admit_submit(TimePoint now);

    /**
     * @brief Учесть принятый share
     *
     * Share уже принят; переполнение окна переводит сессию в limited
     * для последующих сообщений.
     */
    Verdict record_share(TimePoint now);

    [[nodiscard]] bool limited() const noexcept { return violated_.has_value(); }

    [[nodiscard]] std::optional<Quota> violated() const noexcept { return violated_; }

    [[nodiscard]] uint32_t strikes() const noexcept { return strikes_; }

private:
    /**
     * @brief Зафиксировать нарушение
     */
    Verdict strike(Quota quota);

    /**
     * @brief Освободилось ли ранее нарушенное окно
     */
    bool violated_window_has_capacity(TimePoint now);

    LimitsConfig config_;
    SlidingWindow messages_;
    SlidingWindow submits_;
    SlidingWindow shares_;

    std::optional<Quota> violated_;
    uint32_t strikes_ = 0;
};

} // namespace xmrweb::mining
