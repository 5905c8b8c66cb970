/**
 * @file difficulty.hpp
 * @brief Работа с Monero difficulty и target
 *
 * В Monero блок валиден, если hash * difficulty < 2^256, где hash
 * читается как 256-битное little-endian число. Эквивалентная форма,
 * используемая здесь: hash <= floor((2^256 - 1) / difficulty).
 *
 * Target хранится как Hash256 в little-endian порядке, поэтому сравнение
 * идёт от старшего байта [31] к младшему [0].
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string>

namespace xmrweb::monero {

// =============================================================================
// difficulty <-> target
// =============================================================================

/**
 * @brief Преобразовать difficulty в 256-битный target
 *
 * @param difficulty Сложность (0 трактуется как 1)
 * @return Hash256 floor((2^256 - 1) / difficulty), little-endian
 */
[[nodiscard]] Hash256 difficulty_to_target(uint64_t difficulty) noexcept;

/**
 * @brief Оценить сложность хеша (старшие 64 бита)
 *
 * Используется только для логов и статистики.
 */
[[nodiscard]] uint64_t hash_difficulty(const Hash256& hash) noexcept;

// =============================================================================
// Проверки
// =============================================================================

/**
 * @brief Проверить, что хеш удовлетворяет target
 *
 * @param hash PoW хеш
 * @param target 256-битный target
 * @return true если hash <= target
 */
[[nodiscard]] bool meets_target(const Hash256& hash, const Hash256& target) noexcept;

/**
 * @brief Проверить, что хеш удовлетворяет difficulty
 */
[[nodiscard]] bool meets_difficulty(const Hash256& hash, uint64_t difficulty) noexcept;

// =============================================================================
// Утилиты
// =============================================================================

/**
 * @brief Target в hex для отправки воркеру (64 символа, little-endian)
 */
[[nodiscard]] std::string target_to_hex(const Hash256& target);

/**
 * @brief Форматировать difficulty для отображения
 *
 * @return std::string Например "312.45 G"
 */
[[nodiscard]] std::string format_difficulty(uint64_t difficulty);

} // namespace xmrweb::monero
