/**
 * @file nonce_allocator.cpp
 * @brief Реализация аллокатора срезов
 */

#include "nonce_allocator.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace xmrweb::mining {

namespace {

/**
 * @brief Пул одного поколения
 */
struct GenerationPool {
    std::mutex mutex;

    uint32_t region_start = 0;
    uint32_t region_end = 0;
    uint32_t cursor = 0;          ///< Начало ещё не нарезанного остатка
    uint32_t width = 1;
    bool shrunk = false;
    bool closed = false;

    std::vector<NonceRange> free_list;
    std::map<uint32_t, uint32_t> live;  ///< start -> end

    /**
     * @brief Взять срез из free-list или нарезать новый
     */
    std::optional<NonceRange> take() {
        if (!free_list.empty()) {
            NonceRange range = free_list.back();
            free_list.pop_back();

            // После сжатия широкий возвращённый срез делится
            if (range.width() > width) {
                free_list.push_back(NonceRange{range.start + width, range.end});
                range.end = range.start + width;
            }
            return range;
        }

        if (cursor < region_end) {
            uint32_t end = std::min(cursor + width, region_end);
            NonceRange range{cursor, end};
            cursor = end;
            return range;
        }

        return std::nullopt;
    }

    uint64_t free_width() const {
        uint64_t total = 0;
        for (const auto& range : free_list) {
            total += range.width();
        }
        return total;
    }

    uint64_t issued_width() const {
        uint64_t total = 0;
        for (const auto& [start, end] : live) {
            total += end - start;
        }
        return total;
    }
};

} // anonymous namespace

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct NonceAllocator::Impl {
    NonceAllocatorConfig config;

    mutable std::mutex map_mutex;
    std::map<Generation, std::shared_ptr<GenerationPool>> pools;

    explicit Impl(const NonceAllocatorConfig& cfg) : config(cfg) {
        if (config.slice_width == 0) config.slice_width = 1;
        if (config.min_slice_width == 0) config.min_slice_width = 1;
        if (config.min_slice_width > config.slice_width) {
            config.min_slice_width = config.slice_width;
        }
    }

    std::shared_ptr<GenerationPool> find(Generation generation) const {
        std::lock_guard<std::mutex> lock(map_mutex);
        auto it = pools.find(generation);
        if (it == pools.end()) {
            return nullptr;
        }
        return it->second;
    }
};

NonceAllocator::NonceAllocator(const NonceAllocatorConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

NonceAllocator::~NonceAllocator() = default;

// =============================================================================
// Поколения
// =============================================================================

Result<void> NonceAllocator::open_generation(
    Generation generation,
    uint32_t region_start,
    uint32_t region_size
) {
    if (region_size == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "Пустая зарезервированная область");
    }

    auto pool = std::make_shared<GenerationPool>();
    pool->region_start = region_start;
    pool->region_end = region_start + region_size;
    pool->cursor = region_start;
    pool->width = std::min(impl_->config.slice_width, region_size);

    std::lock_guard<std::mutex> lock(impl_->map_mutex);
    auto [it, inserted] = impl_->pools.emplace(generation, std::move(pool));
    if (!inserted) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Поколение " + std::to_string(generation) + " уже открыто"
        );
    }
    return {};
}

void NonceAllocator::close_generation(Generation generation) {
    auto pool = impl_->find(generation);
    if (!pool) {
        return;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    pool->closed = true;
    pool->free_list.clear();
}

std::size_t NonceAllocator::retire_before(Generation generation) {
    std::lock_guard<std::mutex> lock(impl_->map_mutex);

    std::size_t removed = 0;
    auto it = impl_->pools.begin();
    while (it != impl_->pools.end() && it->first < generation) {
        it = impl_->pools.erase(it);
        ++removed;
    }
    return removed;
}

bool NonceAllocator::retire(Generation generation) {
    std::lock_guard<std::mutex> lock(impl_->map_mutex);
    return impl_->pools.erase(generation) > 0;
}

// =============================================================================
// Выдача и возврат
// =============================================================================

Result<NonceRange> NonceAllocator::allocate(Generation generation) {
    auto pool = impl_->find(generation);
    if (!pool) {
        return Err<NonceRange>(
            ErrorCode::CapacityNoTemplate,
            "Поколение " + std::to_string(generation) + " не открыто"
        );
    }

    std::lock_guard<std::mutex> lock(pool->mutex);

    if (pool->closed) {
        return Err<NonceRange>(
            ErrorCode::MiningStaleJob,
            "Поколение " + std::to_string(generation) + " вытеснено"
        );
    }

    auto range = pool->take();
    if (!range) {
        // Сжатие: один раз на поколение, не ниже минимальной ширины
        if (impl_->config.shrink_on_pressure && !pool->shrunk &&
            pool->width / 2 >= impl_->config.min_slice_width) {
            pool->width /= 2;
            pool->shrunk = true;
        }
        return Err<NonceRange>(
            ErrorCode::CapacityNonceExhausted,
            "Зарезервированная область поколения " + std::to_string(generation) + " исчерпана"
        );
    }

    pool->live.emplace(range->start, range->end);
    return *range;
}

bool NonceAllocator::release(Generation generation, const NonceRange& range) {
    auto pool = impl_->find(generation);
    if (!pool) {
        // Поколение удалено: срез отбрасывается
        return false;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);

    auto it = pool->live.find(range.start);
    if (it == pool->live.end() || it->second != range.end) {
        return false;
    }

    pool->live.erase(it);
    if (!pool->closed) {
        pool->free_list.push_back(range);
    }
    return true;
}

// =============================================================================
// Статистика
// =============================================================================

bool NonceAllocator::has_generation(Generation generation) const {
    return impl_->find(generation) != nullptr;
}

PoolStats NonceAllocator::stats(Generation generation) const {
    PoolStats result;
    auto pool = impl_->find(generation);
    if (!pool) {
        return result;
    }

    std::lock_guard<std::mutex> lock(pool->mutex);
    result.region_size = pool->region_end - pool->region_start;
    result.slice_width = pool->width;
    result.issued_width = pool->issued_width();
    result.free_width = pool->free_width();
    result.uncarved_width = pool->region_end - pool->cursor;
    result.live_count = pool->live.size();
    result.shrunk = pool->shrunk;
    result.closed = pool->closed;
    return result;
}

std::size_t NonceAllocator::live_count(Generation generation) const {
    return stats(generation).live_count;
}

uint32_t NonceAllocator::slice_width(Generation generation) const {
    return stats(generation).slice_width;
}

std::size_t NonceAllocator::generation_count() const {
    std::lock_guard<std::mutex> lock(impl_->map_mutex);
    return impl_->pools.size();
}

} // namespace xmrweb::mining
