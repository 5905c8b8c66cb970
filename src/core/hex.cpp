/**
 * @file hex.cpp
 * @brief Реализация hex кодирования
 */

#include "hex.hpp"

#include <algorithm>

namespace xmrweb {

namespace {

constexpr const char* HEX_DIGITS = "0123456789abcdef";

/// @brief Значение hex символа или -1
int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

std::string to_hex(ByteSpan data) {
    std::string hex;
    hex.reserve(data.size() * 2);

    for (uint8_t byte : data) {
        hex.push_back(HEX_DIGITS[byte >> 4]);
        hex.push_back(HEX_DIGITS[byte & 0x0F]);
    }

    return hex;
}

std::string to_hex(const Hash256& hash) {
    return to_hex(ByteSpan(hash.data(), hash.size()));
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Err<Bytes>(
            ErrorCode::TransportMalformedMessage,
            "Нечётная длина hex строки: " + std::to_string(hex.size())
        );
    }

    Bytes out;
    out.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Bytes>(
                ErrorCode::TransportMalformedMessage,
                "Неверный символ в hex строке на позиции " + std::to_string(i)
            );
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }

    return out;
}

Result<Hash256> hash_from_hex(std::string_view hex) {
    if (hex.size() != 64) {
        return Err<Hash256>(
            ErrorCode::TransportMalformedMessage,
            "Неверная длина хеша: " + std::to_string(hex.size()) + " (ожидается 64)"
        );
    }

    auto bytes = from_hex(hex);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    Hash256 hash{};
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

} // namespace xmrweb
