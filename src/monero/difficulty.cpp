/**
 * @file difficulty.cpp
 * @brief Реализация работы с difficulty и target
 */

#include "difficulty.hpp"
#include "../core/hex.hpp"

#include <iomanip>
#include <sstream>

namespace xmrweb::monero {

// =============================================================================
// difficulty <-> target
// =============================================================================

Hash256 difficulty_to_target(uint64_t difficulty) noexcept {
    if (difficulty == 0) {
        difficulty = 1;
    }

    // Делим (2^256 - 1) на difficulty по 64-битным лимбам,
    // от старшего к младшему, с остатком в 128 битах.
    Hash256 target{};
    unsigned __int128 remainder = 0;

    for (int limb = 3; limb >= 0; --limb) {
        unsigned __int128 dividend = (remainder << 64) | UINT64_MAX;
        uint64_t quotient = static_cast<uint64_t>(dividend / difficulty);
        remainder = dividend % difficulty;

        for (int b = 0; b < 8; ++b) {
            target[static_cast<std::size_t>(limb * 8 + b)] =
                static_cast<uint8_t>((quotient >> (8 * b)) & 0xFF);
        }
    }

    return target;
}

uint64_t hash_difficulty(const Hash256& hash) noexcept {
    // Старшие 64 бита хеша
    uint64_t high = 0;
    for (int i = 31; i >= 24; --i) {
        high = (high << 8) | hash[static_cast<std::size_t>(i)];
    }

    if (high == 0) {
        return UINT64_MAX;
    }
    return UINT64_MAX / high;
}

// =============================================================================
// Проверки
// =============================================================================

bool meets_target(const Hash256& hash, const Hash256& target) noexcept {
    // Сравниваем от старших байт к младшим
    for (int i = 31; i >= 0; --i) {
        auto idx = static_cast<std::size_t>(i);
        if (hash[idx] < target[idx]) {
            return true;
        }
        if (hash[idx] > target[idx]) {
            return false;
        }
    }

    // hash == target
    return true;
}

bool meets_difficulty(const Hash256& hash, uint64_t difficulty) noexcept {
    return meets_target(hash, difficulty_to_target(difficulty));
}

// =============================================================================
// Утилиты
// =============================================================================

std::string target_to_hex(const Hash256& target) {
    return to_hex(target);
}

std::string format_difficulty(uint64_t difficulty) {
    const char* suffixes[] = {"", " K", " M", " G", " T", " P", " E"};
    int suffix_idx = 0;
    double value = static_cast<double>(difficulty);

    while (value >= 1000.0 && suffix_idx < 6) {
        value /= 1000.0;
        ++suffix_idx;
    }

    std::ostringstream ss;
    if (suffix_idx == 0) {
        ss << difficulty;
    } else {
        ss << std::fixed << std::setprecision(2) << value << suffixes[suffix_idx];
    }
    return ss.str();
}

} // namespace xmrweb::monero
