/**
 * @file alerter.hpp
 * @brief Система алертинга координатора
 *
 * Предоставляет:
 * - Предопределённые алерты для типичных ситуаций (демон, блоки, лимиты)
 * - Callback для внешних систем
 * - Вывод в консоль с фильтром по уровню
 */

#pragma once

#include "../core/types.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <string_view>

namespace xmrweb::monitoring {

// =============================================================================
// Уровни алертов
// =============================================================================

/**
 * @brief Уровень алерта
 */
enum class AlertLevel {
    Debug,     ///< Отладочное сообщение
    Info,      ///< Информационное сообщение
    Warning,   ///< Предупреждение
    Critical   ///< Критическая ситуация
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view alert_level_to_string(AlertLevel level) noexcept {
    switch (level) {
        case AlertLevel::Debug:    return "DEBUG";
        case AlertLevel::Info:     return "INFO";
        case AlertLevel::Warning:  return "WARNING";
        case AlertLevel::Critical: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Уровень из значения logging.level
 *
 * "error" -> Critical, "warn" -> Warning, "debug" -> Debug, иначе Info.
 */
[[nodiscard]] AlertLevel alert_level_from_string(std::string_view level) noexcept;

// =============================================================================
// Callback для внешних систем
// =============================================================================

/**
 * @brief Callback для обработки алертов
 *
 * @param level Уровень алерта
 * @param message Сообщение
 */
using AlertCallback = std::function<void(AlertLevel level, std::string_view message)>;

// =============================================================================
// Alerter
// =============================================================================

/**
 * @brief Конфигурация Alerter
 */
struct AlerterConfig {
    /// @brief Минимальный уровень для вывода
    AlertLevel log_level{AlertLevel::Info};

    /// @brief Включить вывод в консоль
    bool console_output{true};

    /// @brief ANSI цвета
    bool color{true};

    /// @brief Минимальный интервал между одинаковыми алертами (секунды)
    uint32_t dedup_interval_seconds{60};
};

/**
 * @brief Система алертинга
 *
 * Централизованная обработка алертов с дедупликацией и внешними уведомлениями.
 */
class Alerter {
public:
    /**
     * @brief Получить единственный экземпляр
     */
    static Alerter& instance();

    // Запрещаем копирование
    Alerter(const Alerter&) = delete;
    Alerter& operator=(const Alerter&) = delete;

    // =========================================================================
    // Конфигурация
    // =========================================================================

    /**
     * @brief Установить конфигурацию
     */
    void configure(const AlerterConfig& config);

    /**
     * @brief Установить callback для внешних систем
     */
    void set_callback(AlertCallback callback);

    // =========================================================================
    // Общие алерты
    // =========================================================================

    /**
     * @brief Отправить алерт
     *
     * @param level Уровень
     * @param message Сообщение
     */
    void alert(AlertLevel level, std::string_view message);

    // =========================================================================
    // Предопределённые алерты
    // =========================================================================

    /**
     * @brief monerod ответил на get_info
     */
    void alert_daemon_connected(uint64_t height);

    /**
     * @brief Ошибка RPC демона
     *
     * @param method Метод JSON-RPC
     * @param error Описание ошибки
     */
    void alert_rpc_failure(std::string_view method, std::string_view error);

    /**
     * @brief Template Store перешёл в degraded
     */
    void alert_store_degraded(std::string_view details);

    /**
     * @brief Template Store восстановился
     */
    void alert_store_recovered();

    /**
     * @brief Найдено решение уровня сети
     */
    void alert_block_found(uint64_t height, std::string_view hash_hex);

    /**
     * @brief Демон принял блок
     */
    void alert_block_accepted(uint64_t height);

    /**
     * @brief Демон отклонил блок
     */
    void alert_block_rejected(uint64_t height, std::string_view reason);

    /**
     * @brief Блок не доставлен после всех повторов
     *
     * Сообщение содержит полный blob для ручной отправки.
     */
    void alert_forward_failed(uint64_t height, std::string_view error, std::string_view blob_hex);

    /**
     * @brief Сессия превысила лимит
     */
    void alert_rate_limit(uint64_t session_id, std::string_view details);

    // =========================================================================
    // Статистика
    // =========================================================================

    /**
     * @brief Получить количество отправленных алертов
     */
    [[nodiscard]] uint64_t get_alerts_count() const noexcept;

    /**
     * @brief Получить количество critical алертов
     */
    [[nodiscard]] uint64_t get_critical_count() const noexcept;

    /**
     * @brief Количество ключей дедупликации, ещё не вышедших из интервала
     */
    [[nodiscard]] std::size_t get_dedup_entries() const;

    /**
     * @brief Сбросить статистику
     */
    void reset_stats();

private:
    Alerter();
    ~Alerter() = default;

    /**
     * @brief Проверка дедупликации
     *
     * Ключи старше dedup_interval_seconds удаляются при каждом вызове.
     *
     * @param key Ключ алерта
     * @return true если алерт можно отправить
     */
    bool should_send(const std::string& key);

    /**
     * @brief Вывод в консоль
     */
    void log_to_console(AlertLevel level, std::string_view message, bool color);

    // Конфигурация
    AlerterConfig config_;

    // Callback
    AlertCallback callback_;

    // Дедупликация
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_alerts_;
    mutable std::mutex mutex_;

    // Статистика
    std::atomic<uint64_t> alerts_count_{0};
    std::atomic<uint64_t> critical_count_{0};
};

} // namespace xmrweb::monitoring
