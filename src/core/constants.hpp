/**
 * @file constants.hpp
 * @brief Константы Monero и xmrweb coordinator
 *
 * Значения по умолчанию для конфигурации и размеры структур.
 *
 * @note Все константы определены как constexpr для compile-time вычислений.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace xmrweb::constants {

// =============================================================================
// Размеры структур Monero
// =============================================================================

/// @brief Размер PoW хеша (RandomX) в байтах
inline constexpr std::size_t HASH_SIZE = 32;

/// @brief Минимальная длина blob блока: версия, timestamp, prev_id, nonce
inline constexpr std::size_t MIN_BLOB_SIZE = 76;

/// @brief Максимальный размер зарезервированной области в get_block_template
inline constexpr std::size_t MAX_RESERVE_SIZE = 255;

// =============================================================================
// Daemon RPC
// =============================================================================

/// @brief URL monerod RPC по умолчанию (mainnet)
inline constexpr const char* DEFAULT_RPC_URL = "http://127.0.0.1:18081";

/// @brief Путь JSON-RPC endpoint
inline constexpr const char* JSON_RPC_PATH = "/json_rpc";

/// @brief Таймаут RPC по умолчанию (мс)
inline constexpr uint32_t DEFAULT_RPC_TIMEOUT_MS = 10'000;

/// @brief Размер зарезервированной области по умолчанию (байт)
inline constexpr uint32_t DEFAULT_RESERVE_SIZE = 8;

// =============================================================================
// Подключения
// =============================================================================

/// @brief Максимальное количество сессий
inline constexpr std::size_t DEFAULT_MAX_CONNECTIONS = 1024;

/// @brief Максимальное количество сессий с одного адреса
inline constexpr std::size_t DEFAULT_MAX_CONNECTIONS_PER_IP = 8;

/// @brief Таймаут неактивной сессии (мс)
inline constexpr uint32_t DEFAULT_IDLE_TIMEOUT_MS = 120'000;

/// @brief Версия протокола в приветствии воркера
inline constexpr uint32_t PROTOCOL_VERSION = 1;

/// @brief Максимальное число потоков, заявляемое воркером
inline constexpr uint32_t MAX_CLIENT_THREADS = 256;

/// @brief Максимальная длина client_version
inline constexpr std::size_t MAX_CLIENT_VERSION_LENGTH = 64;

// =============================================================================
// Задания и шаблоны
// =============================================================================

/// @brief Время жизни задания (мс)
inline constexpr uint32_t DEFAULT_JOB_TTL_MS = 60'000;

/// @brief Интервал обновления шаблона (мс)
inline constexpr uint32_t DEFAULT_TEMPLATE_REFRESH_MS = 5'000;

/// @brief Окно, в течение которого задания старого поколения принимаются как shares (мс)
inline constexpr uint32_t DEFAULT_STALE_GRACE_MS = 5'000;

/// @brief Сложность share по умолчанию
inline constexpr uint64_t DEFAULT_SHARE_DIFFICULTY = 5'000;

/// @brief Ширина среза зарезервированной области (байт)
inline constexpr uint32_t DEFAULT_SLICE_WIDTH = 1;

/// @brief Минимальная ширина среза при сжатии
inline constexpr uint32_t DEFAULT_MIN_SLICE_WIDTH = 1;

/// @brief Количество подряд неудачных обновлений до degraded
inline constexpr uint32_t DEFAULT_DEGRADED_AFTER_FAILURES = 3;

/// @brief Интервал служебного цикла координатора (мс)
inline constexpr uint32_t DEFAULT_MAINTENANCE_INTERVAL_MS = 1'000;

/// @brief Сколько заданий старых поколений сессия хранит в пределах grace окна
inline constexpr std::size_t MAX_GRACE_JOBS = 4;

/// @brief Сколько отметок смены поколения хранит Template Store
inline constexpr std::size_t MAX_GENERATION_HISTORY = 64;

// =============================================================================
// Лимиты
// =============================================================================

/// @brief Сообщений в секунду на сессию
inline constexpr uint32_t DEFAULT_MESSAGES_PER_SECOND = 20;

/// @brief Shares в минуту на сессию
inline constexpr uint32_t DEFAULT_SHARES_PER_MINUTE = 60;

/// @brief Submit в минуту на сессию
inline constexpr uint32_t DEFAULT_SUBMITS_PER_MINUTE = 120;

/// @brief Нарушений лимита до закрытия сессии
inline constexpr uint32_t DEFAULT_MAX_STRIKES = 10;

/// @brief Невалидных отправок до закрытия сессии
inline constexpr uint32_t DEFAULT_MAX_INVALID_SUBMISSIONS = 25;

// =============================================================================
// Block Forwarder
// =============================================================================

/// @brief Количество повторов submit_block при ошибке RPC
inline constexpr uint32_t DEFAULT_FORWARD_RETRIES = 3;

/// @brief Начальная пауза между повторами (мс), удваивается
inline constexpr uint32_t DEFAULT_FORWARD_BACKOFF_MS = 200;

/// @brief Окно дедупликации отправленных блоков (мс)
inline constexpr uint32_t DEFAULT_DEDUP_WINDOW_MS = 600'000;

} // namespace xmrweb::constants
