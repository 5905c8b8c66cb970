/**
 * @file config.hpp
 * @brief Конфигурация xmrweb coordinator
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 * Поддерживает настройки сессий, monerod RPC, заданий, лимитов,
 * отправки блоков и логирования.
 *
 * Пример конфигурации (xmrweb.toml):
 * @code
 * [server]
 * max_connections = 1024
 * max_connections_per_ip = 8
 * idle_timeout_ms = 120000
 *
 * [monerod]
 * rpc_url = "http://127.0.0.1:18081"
 * wallet_address = "4..."
 * reserve_size = 8
 * rpc_timeout_ms = 10000
 *
 * [jobs]
 * job_ttl_ms = 60000
 * template_refresh_interval_ms = 5000
 * stale_job_grace_ms = 5000
 * share_difficulty = 5000
 * slice_width = 1
 *
 * [limits]
 * messages_per_second = 20
 * shares_per_minute = 60
 * submits_per_minute = 120
 *
 * [forwarder]
 * max_retries = 3
 *
 * [logging]
 * level = "info"
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <optional>

namespace xmrweb {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки приёма сессий воркеров
 */
struct ServerConfig {
    /// @brief Максимальное количество одновременных сессий
    std::size_t max_connections = constants::DEFAULT_MAX_CONNECTIONS;

    /// @brief Максимальное количество сессий с одного адреса
    std::size_t max_connections_per_ip = constants::DEFAULT_MAX_CONNECTIONS_PER_IP;

    /// @brief Сессия без сообщений дольше этого времени закрывается (мс)
    uint32_t idle_timeout_ms = constants::DEFAULT_IDLE_TIMEOUT_MS;
};

/**
 * @brief Настройки подключения к monerod
 */
struct MonerodConfig {
    /// @brief Базовый URL RPC (без /json_rpc)
    std::string rpc_url = constants::DEFAULT_RPC_URL;

    /// @brief Адрес кошелька для награды
    std::string wallet_address;

    /// @brief Размер зарезервированной области в blob (байт)
    uint32_t reserve_size = constants::DEFAULT_RESERVE_SIZE;

    /// @brief Таймаут одного RPC запроса (мс)
    uint32_t rpc_timeout_ms = constants::DEFAULT_RPC_TIMEOUT_MS;

    /**
     * @brief Получить URL JSON-RPC endpoint
     * @return URL в формате "http://host:port/json_rpc"
     */
    [[nodiscard]] std::string get_json_rpc_url() const;
};

/**
 * @brief Настройки заданий и шаблонов
 */
struct JobsConfig {
    /// @brief Время жизни задания (мс)
    uint32_t job_ttl_ms = constants::DEFAULT_JOB_TTL_MS;

    /// @brief Интервал опроса get_block_template (мс)
    uint32_t template_refresh_interval_ms = constants::DEFAULT_TEMPLATE_REFRESH_MS;

    /// @brief Grace окно для заданий вытесненного поколения (мс)
    uint32_t stale_job_grace_ms = constants::DEFAULT_STALE_GRACE_MS;

    /// @brief Сложность share (задаётся независимо от сложности сети)
    uint64_t share_difficulty = constants::DEFAULT_SHARE_DIFFICULTY;

    /// @brief Ширина среза зарезервированной области на одно задание
    uint32_t slice_width = constants::DEFAULT_SLICE_WIDTH;

    /// @brief Нижняя граница ширины при сжатии
    uint32_t min_slice_width = constants::DEFAULT_MIN_SLICE_WIDTH;

    /// @brief Уменьшать ширину среза вдвое при исчерпании (один раз на поколение)
    bool shrink_on_pressure = true;

    /// @brief Количество подряд неудачных обновлений шаблона до degraded
    uint32_t degraded_after_failures = constants::DEFAULT_DEGRADED_AFTER_FAILURES;

    /// @brief Интервал служебного цикла (мс)
    uint32_t maintenance_interval_ms = constants::DEFAULT_MAINTENANCE_INTERVAL_MS;
};

/**
 * @brief Лимиты на сессию
 */
struct LimitsConfig {
    uint32_t messages_per_second = constants::DEFAULT_MESSAGES_PER_SECOND;
    uint32_t shares_per_minute = constants::DEFAULT_SHARES_PER_MINUTE;
    uint32_t submits_per_minute = constants::DEFAULT_SUBMITS_PER_MINUTE;

    /// @brief Нарушений лимита до закрытия сессии
    uint32_t max_strikes = constants::DEFAULT_MAX_STRIKES;

    /// @brief Отклонённых отправок до закрытия сессии
    uint32_t max_invalid_submissions = constants::DEFAULT_MAX_INVALID_SUBMISSIONS;
};

/**
 * @brief Настройки отправки найденных блоков
 */
struct ForwarderConfig {
    /// @brief Повторов submit_block при ошибке RPC
    uint32_t max_retries = constants::DEFAULT_FORWARD_RETRIES;

    /// @brief Начальная пауза между повторами (мс)
    uint32_t retry_backoff_ms = constants::DEFAULT_FORWARD_BACKOFF_MS;

    /// @brief Сколько помнить отправленный (height, blob) (мс)
    uint32_t dedup_window_ms = constants::DEFAULT_DEDUP_WINDOW_MS;
};

/**
 * @brief Настройки логирования и терминального вывода
 */
struct LoggingConfig {
    /// @brief Уровень логирования: "error", "warn", "info", "debug"
    std::string level = "info";

    /// @brief Включить ANSI цвета в терминале
    bool color = true;

    /// @brief Интервал вывода статистики (секунды, 0 = отключено)
    uint32_t stats_interval = 60;
};

/**
 * @brief Полная конфигурация координатора
 */
struct Config {
    ServerConfig server;
    MonerodConfig monerod;
    JobsConfig jobs;
    LimitsConfig limits;
    ForwarderConfig forwarder;
    LoggingConfig logging;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Разобрать конфигурацию из TOML текста
     *
     * Отсутствующие ключи получают значения по умолчанию.
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. $XMRWEB_CONFIG
     * 3. ./xmrweb.toml
     * 4. /etc/xmrweb/xmrweb.toml
     * 5. ~/.config/xmrweb/xmrweb.toml
     *
     * @param path Опциональный путь к файлу
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path = std::nullopt
    );

    /**
     * @brief Валидация конфигурации
     *
     * Проверяет:
     * - Формат адреса кошелька и URL демона
     * - Согласованность reserve_size и ширины срезов
     * - Ненулевые лимиты и интервалы
     *
     * @return Result<void> Успех или ошибка валидации
     */
    [[nodiscard]] Result<void> validate() const;
};

} // namespace xmrweb
