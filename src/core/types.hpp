/**
 * @file types.hpp
 * @brief Базовые типы для xmrweb coordinator
 *
 * Определяет основные типы данных, используемые во всём проекте:
 * - Hash256: 32-байтный хеш (PoW результат, target)
 * - Bytes: динамический массив байт (blob шаблона)
 * - Result<T>: обёртка std::expected для обработки ошибок
 *
 * @note Ошибки передаются как значения. Исключения перехватываются только
 *       на границе библиотек, которые их бросают (toml++, std::stoull).
 */

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xmrweb {

// =============================================================================
// Базовые типы данных
// =============================================================================

/**
 * @brief 256-битный хеш (32 байта)
 *
 * Используется для:
 * - PoW хеша, присланного воркером
 * - Share target и network target
 * - prev_hash шаблона
 *
 * Хранится в little-endian формате (как в Monero / CryptoNote).
 */
using Hash256 = std::array<uint8_t, 32>;

/**
 * @brief Динамический массив байт
 *
 * Используется для blob шаблона блока и кандидатов от воркеров.
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Представление (view) на массив байт без владения
 */
using ByteSpan = std::span<const uint8_t>;

/// @brief Монотонные часы, используемые для всех таймаутов и окон
using Clock = std::chrono::steady_clock;

/// @brief Момент времени монотонных часов
using TimePoint = Clock::time_point;

// =============================================================================
// Коды ошибок
// =============================================================================

/**
 * @brief Перечисление кодов ошибок
 *
 * Группы соответствуют таксономии ошибок координатора:
 * конфигурация, транспорт, RPC демона, валидация, ёмкость.
 */
enum class ErrorCode {
    Success = 0,

    // Ошибки конфигурации (100-199)
    ConfigNotFound = 100,
    ConfigParseError = 101,
    ConfigInvalidValue = 102,

    // Ошибки транспорта (200-299)
    TransportSessionClosed = 200,
    TransportUnknownSession = 201,
    TransportMalformedMessage = 202,

    // Ошибки RPC демона (300-399)
    RpcConnectionFailed = 300,
    RpcTimeout = 301,
    RpcParseError = 302,
    RpcHttpError = 303,
    RpcDaemonError = 304,
    RpcBusy = 305,

    // Ошибки майнинга и валидации (500-599)
    MiningUnknownJob = 500,
    MiningOutOfRange = 501,
    MiningStaleJob = 502,
    MiningInvalidProof = 503,
    MiningMalformedCandidate = 504,
    MiningBlockRejected = 505,
    MiningDuplicateBlock = 506,
    MiningRateLimited = 507,

    // Ошибки ёмкости (600-699)
    CapacityLimitExceeded = 600,
    CapacityNonceExhausted = 601,
    CapacityNoTemplate = 602,

    // Системные ошибки (800-899)
    SystemIOError = 801,
};

/**
 * @brief Преобразование кода ошибки в строку
 */
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::ConfigNotFound: return "Файл конфигурации не найден";
        case ErrorCode::ConfigParseError: return "Ошибка парсинга конфигурации";
        case ErrorCode::ConfigInvalidValue: return "Некорректное значение в конфигурации";
        case ErrorCode::TransportSessionClosed: return "Сессия закрыта";
        case ErrorCode::TransportUnknownSession: return "Неизвестная сессия";
        case ErrorCode::TransportMalformedMessage: return "Некорректное сообщение";
        case ErrorCode::RpcConnectionFailed: return "Ошибка подключения к демону";
        case ErrorCode::RpcTimeout: return "Таймаут RPC";
        case ErrorCode::RpcParseError: return "Ошибка парсинга ответа RPC";
        case ErrorCode::RpcHttpError: return "HTTP ошибка RPC";
        case ErrorCode::RpcDaemonError: return "Демон вернул ошибку";
        case ErrorCode::RpcBusy: return "Демон занят (синхронизация)";
        case ErrorCode::MiningUnknownJob: return "Неизвестное задание";
        case ErrorCode::MiningOutOfRange: return "Nonce вне выделенного диапазона";
        case ErrorCode::MiningStaleJob: return "Устаревшее задание";
        case ErrorCode::MiningInvalidProof: return "Хеш не соответствует target";
        case ErrorCode::MiningMalformedCandidate: return "Некорректный кандидат";
        case ErrorCode::MiningBlockRejected: return "Блок отклонён демоном";
        case ErrorCode::MiningDuplicateBlock: return "Блок уже отправлен";
        case ErrorCode::MiningRateLimited: return "Превышен лимит сообщений";
        case ErrorCode::CapacityLimitExceeded: return "Превышен лимит подключений";
        case ErrorCode::CapacityNonceExhausted: return "Пространство nonce исчерпано";
        case ErrorCode::CapacityNoTemplate: return "Нет актуального шаблона блока";
        case ErrorCode::SystemIOError: return "Ошибка ввода/вывода";
        default: return "Неизвестная ошибка";
    }
}

/**
 * @brief Ошибка RPC демона (группа 300-399)
 */
[[nodiscard]] constexpr bool is_rpc_error(ErrorCode code) noexcept {
    auto value = static_cast<int>(code);
    return value >= 300 && value < 400;
}

/**
 * @brief Ошибка ёмкости (группа 600-699)
 */
[[nodiscard]] constexpr bool is_capacity_error(ErrorCode code) noexcept {
    auto value = static_cast<int>(code);
    return value >= 600 && value < 700;
}

// =============================================================================
// Result тип (std::expected wrapper)
// =============================================================================

/**
 * @brief Ошибка с кодом и опциональным сообщением
 *
 * Используется как error type в std::expected.
 */
struct Error {
    ErrorCode code;
    std::string message;

    /**
     * @brief Создать ошибку только с кодом
     */
    constexpr explicit Error(ErrorCode c) noexcept
        : code(c), message(std::string(to_string(c))) {}

    /**
     * @brief Создать ошибку с кодом и сообщением
     */
    Error(ErrorCode c, std::string msg) noexcept
        : code(c), message(std::move(msg)) {}

    [[nodiscard]] bool operator==(const Error& other) const noexcept {
        return code == other.code;
    }
};

/**
 * @brief Результат операции: значение или ошибка
 *
 * @tparam T Тип возвращаемого значения
 *
 * Пример использования:
 * @code
 * auto range = allocator.allocate(generation);
 * if (!range) {
 *     std::cerr << range.error().message << std::endl;
 * }
 * @endcode
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Создать успешный результат
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T&& value) {
    return Result<T>(std::forward<T>(value));
}

/**
 * @brief Создать результат с ошибкой
 */
template<typename T>
[[nodiscard]] constexpr Result<T> Err(ErrorCode code) {
    return std::unexpected(Error{code});
}

/**
 * @brief Создать результат с ошибкой и сообщением
 */
template<typename T>
[[nodiscard]] Result<T> Err(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

} // namespace xmrweb
