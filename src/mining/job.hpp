/**
 * @file job.hpp
 * @brief Структуры шаблона, задания и результатов проверки
 *
 * Определяет:
 * - Template: неизменяемый снимок шаблона блока одного поколения
 * - NonceRange: срез зарезервированной области [start, end)
 * - Job: задание, выданное одной сессии, и его blob с печатью среза
 * - Candidate: результат, присланный воркером
 * - SubmissionResult: типизированный итог проверки
 */

#pragma once

#include "../core/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace xmrweb::mining {

using SessionId = uint64_t;
using JobId = uint64_t;
using Generation = uint64_t;

/// @brief Смещение 4-байтного nonce заголовка в blob блока Monero
inline constexpr std::size_t HEADER_NONCE_OFFSET = 39;

/// @brief Размер nonce заголовка
inline constexpr std::size_t HEADER_NONCE_SIZE = 4;

// =============================================================================
// Шаблон блока
// =============================================================================

/**
 * @brief Снимок шаблона блока
 *
 * Публикуется Template Store один раз и больше не изменяется.
 * Новое поколение вытесняет старое, но не модифицирует его.
 */
struct Template {
    Generation generation = 0;
    uint64_t height = 0;
    std::string prev_hash;           ///< hex
    Bytes blob;                      ///< blocktemplate_blob
    Bytes hashing_blob;              ///< blockhashing_blob
    uint64_t difficulty = 0;         ///< Сложность сети
    Hash256 network_target{};        ///< floor((2^256-1) / difficulty)
    uint32_t reserved_offset = 0;
    uint32_t reserved_size = 0;
    std::string seed_hash;           ///< hex
    uint64_t expected_reward = 0;
    TimePoint fetched_at{};
};

using TemplatePtr = std::shared_ptr<const Template>;

// =============================================================================
// Диапазон зарезервированной области
// =============================================================================

/**
 * @brief Срез зарезервированной области [start, end)
 *
 * Координаты совпадают со смещениями байт в blob шаблона. В blob
 * задания байты среза несут печать задания, остальная часть
 * зарезервированной области нулевая, поэтому blob разных сессий
 * различаются при любом значении nonce заголовка.
 */
struct NonceRange {
    uint32_t start = 0;
    uint32_t end = 0;

    [[nodiscard]] uint32_t width() const noexcept {
        return end - start;
    }

    [[nodiscard]] bool contains(uint64_t position) const noexcept {
        return position >= start && position < end;
    }

    [[nodiscard]] bool overlaps(const NonceRange& other) const noexcept {
        return start < other.end && other.start < end;
    }

    [[nodiscard]] bool operator==(const NonceRange& other) const noexcept = default;
};

// =============================================================================
// Задание
// =============================================================================

/**
 * @brief Задание сессии
 *
 * Принадлежит ровно одной сессии. Становится stale, когда истёк ttl
 * или когда его поколение вытеснено дольше grace окна. Воркер меняет
 * только nonce заголовка в blob задания.
 */
struct Job {
    JobId job_id = 0;
    SessionId session_id = 0;
    Generation generation = 0;
    uint64_t height = 0;
    NonceRange nonce_range;
    uint64_t share_difficulty = 0;
    Hash256 share_target{};
    TimePoint issued_at{};
    std::chrono::milliseconds ttl{0};
    TemplatePtr block_template;
    Bytes reserved_value;            ///< Печать в байтах среза
    Bytes blob;                      ///< blob шаблона с печатью

    [[nodiscard]] bool expired(TimePoint now) const noexcept {
        return now > issued_at + ttl;
    }
};

/**
 * @brief job_id в формате, видимом воркеру (16 hex символов)
 */
[[nodiscard]] std::string format_job_id(JobId job_id);

/**
 * @brief Печать задания для среза
 *
 * width байт: первый байт (job_id mod 255) + 1 и поэтому не нулевой,
 * далее младшие байты job_id.
 */
[[nodiscard]] Bytes make_reserved_value(const NonceRange& range, JobId job_id);

/**
 * @brief blob задания: зарезервированная область обнулена, в срез
 *        записана печать
 */
[[nodiscard]] Bytes stamp_job_blob(const Template& tmpl, const NonceRange& range,
                                   const Bytes& reserved_value);

/**
 * @brief Координата среза по содержимому blob
 *
 * @return Смещение первого ненулевого байта зарезервированной области
 *         или nullopt, если область нулевая или не помещается в blob
 */
[[nodiscard]] std::optional<uint32_t> reserved_coordinate(const Template& tmpl,
                                                          const Bytes& blob) noexcept;

/// @brief nonce заголовка (little-endian), 0 для короткого blob
[[nodiscard]] uint32_t read_header_nonce(const Bytes& blob) noexcept;

/// @brief Записать nonce заголовка (little-endian)
void write_header_nonce(Bytes& blob, uint32_t nonce) noexcept;

// =============================================================================
// Кандидат от воркера
// =============================================================================

/**
 * @brief Результат, присланный воркером
 *
 * nonce - значение nonce заголовка. Если blob пуст, он
 * восстанавливается из blob задания и nonce; присланный blob должен
 * нести печать среза задания.
 */
struct Candidate {
    JobId job_id = 0;
    uint32_t nonce = 0;
    Hash256 result_hash{};
    Bytes blob;
};

/**
 * @brief Проверенное решение уровня сети
 */
struct BlockCandidate {
    SessionId session_id = 0;
    JobId job_id = 0;
    Generation generation = 0;
    uint64_t height = 0;
    uint32_t nonce = 0;              ///< nonce заголовка
    Hash256 hash{};
    Bytes blob;                      ///< Полный blob блока
};

// =============================================================================
// Результат проверки
// =============================================================================

/**
 * @brief Причина отклонения
 */
enum class RejectReason {
    UnknownJob,     ///< Задание не принадлежит сессии
    Stale,          ///< ttl истёк или поколение вне grace окна
    OutOfRange,     ///< Печать среза не совпадает с заданием
    InvalidProof,   ///< Хеш не удовлетворяет share target
    Malformed,      ///< Некорректный blob
    RateLimited     ///< Отброшено лимитом сообщений
};

[[nodiscard]] constexpr std::string_view to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::UnknownJob:   return "unknown-job";
        case RejectReason::Stale:        return "stale";
        case RejectReason::OutOfRange:   return "out-of-range";
        case RejectReason::InvalidProof: return "invalid-proof";
        case RejectReason::Malformed:    return "malformed";
        case RejectReason::RateLimited:  return "rate-limited";
        default: return "unknown";
    }
}

/// @brief Share принят
struct Accepted {
    JobId job_id = 0;
    uint64_t hash_difficulty = 0;
};

/**
 * @brief Исход пересылки решения в monerod
 */
enum class ForwardStatus {
    Pending,        ///< Ещё не пересылалось
    Submitted,      ///< Демон принял блок
    Duplicate,      ///< Это решение уже переслано
    DaemonRejected, ///< Демон отклонил блок
    Failed          ///< monerod недоступен после всех повторов
};

[[nodiscard]] constexpr std::string_view to_string(ForwardStatus status) noexcept {
    switch (status) {
        case ForwardStatus::Pending:        return "pending";
        case ForwardStatus::Submitted:      return "submitted";
        case ForwardStatus::Duplicate:      return "duplicate";
        case ForwardStatus::DaemonRejected: return "daemon-rejected";
        case ForwardStatus::Failed:         return "failed";
        default: return "unknown";
    }
}

/// @brief Решение уровня сети
struct AcceptedBlock {
    BlockCandidate candidate;
    ForwardStatus forward = ForwardStatus::Pending;
    std::string forward_detail;      ///< Причина отказа демона или ошибка RPC
};

/// @brief Отклонено
struct Rejected {
    RejectReason reason;
    std::string detail;
};

/// @brief Работа по вытесненному поколению, достаточная для блока
struct Stale {
    JobId job_id = 0;
};

using SubmissionResult = std::variant<Accepted, AcceptedBlock, Rejected, Stale>;

} // namespace xmrweb::mining
