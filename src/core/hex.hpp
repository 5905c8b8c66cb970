/**
 * @file hex.hpp
 * @brief Hex кодирование blob и хешей
 *
 * В отличие от Bitcoin, Monero отображает хеши и blob в исходном порядке
 * байт, поэтому переворот при кодировании не выполняется.
 */

#pragma once

#include "types.hpp"

#include <string>
#include <string_view>

namespace xmrweb {

/**
 * @brief Закодировать байты в hex (нижний регистр)
 */
[[nodiscard]] std::string to_hex(ByteSpan data);

/**
 * @brief Закодировать 32-байтный хеш в hex
 */
[[nodiscard]] std::string to_hex(const Hash256& hash);

/**
 * @brief Декодировать hex строку
 *
 * @param hex Строка чётной длины из [0-9a-fA-F]
 * @return Result<Bytes> Байты или ErrorCode::TransportMalformedMessage
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

/**
 * @brief Декодировать hex строку ровно в 32 байта
 */
[[nodiscard]] Result<Hash256> hash_from_hex(std::string_view hex);

} // namespace xmrweb
