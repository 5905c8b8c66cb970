/**
 * @file pow_verifier.cpp
 * @brief Реализация ReportedHashVerifier
 */

#include "pow_verifier.hpp"

#include <algorithm>

namespace xmrweb::mining {

Result<Hash256> ReportedHashVerifier::compute(const Job& /*job*/, const Candidate& candidate) {
    // Нулевой хеш удовлетворяет любому target: воркер его не прислал
    bool empty = std::all_of(candidate.result_hash.begin(), candidate.result_hash.end(),
                             [](uint8_t b) { return b == 0; });
    if (empty) {
        return Err<Hash256>(ErrorCode::MiningMalformedCandidate, "Пустой result hash");
    }
    return candidate.result_hash;
}

} // namespace xmrweb::mining
