/**
 * @file job.cpp
 * @brief Идентификаторы заданий и печать среза в blob
 */

#include "job.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace xmrweb::mining {

std::string format_job_id(JobId job_id) {
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << job_id;
    return ss.str();
}

Bytes make_reserved_value(const NonceRange& range, JobId job_id) {
    Bytes value(range.width(), 0);
    if (value.empty()) {
        return value;
    }

    value[0] = static_cast<uint8_t>(job_id % 0xFF + 1);
    for (std::size_t i = 1; i < value.size() && i <= sizeof(JobId); ++i) {
        value[i] = static_cast<uint8_t>((job_id >> (8 * (i - 1))) & 0xFF);
    }
    return value;
}

Bytes stamp_job_blob(const Template& tmpl, const NonceRange& range,
                     const Bytes& reserved_value) {
    Bytes blob = tmpl.blob;

    std::size_t region_end = std::min<std::size_t>(
        static_cast<std::size_t>(tmpl.reserved_offset) + tmpl.reserved_size, blob.size());
    for (std::size_t i = tmpl.reserved_offset; i < region_end; ++i) {
        blob[i] = 0;
    }

    for (std::size_t i = 0; i < reserved_value.size(); ++i) {
        std::size_t pos = static_cast<std::size_t>(range.start) + i;
        if (pos >= region_end) {
            break;
        }
        blob[pos] = reserved_value[i];
    }
    return blob;
}

std::optional<uint32_t> reserved_coordinate(const Template& tmpl, const Bytes& blob) noexcept {
    std::size_t region_end = static_cast<std::size_t>(tmpl.reserved_offset) + tmpl.reserved_size;
    if (region_end > blob.size()) {
        return std::nullopt;
    }
    for (std::size_t i = tmpl.reserved_offset; i < region_end; ++i) {
        if (blob[i] != 0) {
            return static_cast<uint32_t>(i);
        }
    }
    return std::nullopt;
}

uint32_t read_header_nonce(const Bytes& blob) noexcept {
    if (blob.size() < HEADER_NONCE_OFFSET + HEADER_NONCE_SIZE) {
        return 0;
    }
    uint32_t nonce = 0;
    for (std::size_t i = 0; i < HEADER_NONCE_SIZE; ++i) {
        nonce |= static_cast<uint32_t>(blob[HEADER_NONCE_OFFSET + i]) << (8 * i);
    }
    return nonce;
}

void write_header_nonce(Bytes& blob, uint32_t nonce) noexcept {
    if (blob.size() < HEADER_NONCE_OFFSET + HEADER_NONCE_SIZE) {
        return;
    }
    for (std::size_t i = 0; i < HEADER_NONCE_SIZE; ++i) {
        blob[HEADER_NONCE_OFFSET + i] = static_cast<uint8_t>((nonce >> (8 * i)) & 0xFF);
    }
}

} // namespace xmrweb::mining
