/**
 * @file test_nonce_allocator.cpp
 * @brief Тесты Nonce Allocator (срезы зарезервированной области)
 */

#include <gtest/gtest.h>

#include "mining/nonce_allocator.hpp"

#include <atomic>
#include <random>
#include <thread>
#include <vector>

namespace xmrweb::tests {

class NonceAllocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.slice_width = 2;
        config_.min_slice_width = 1;
        config_.shrink_on_pressure = false;
    }

    mining::NonceAllocatorConfig config_;
};

/**
 * @brief Тест: reserved_offset=40, reserved_size=8, ширина 2
 */
TEST_F(NonceAllocatorTest, CarvesRegionAndReusesReleasedRange) {
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 40, 8));

    std::vector<mining::NonceRange> expected = {{40, 42}, {42, 44}, {44, 46}, {46, 48}};
    for (const auto& range : expected) {
        auto allocated = allocator.allocate(1);
        ASSERT_TRUE(allocated);
        EXPECT_EQ(*allocated, range);
    }

    // Пятый запрос: область исчерпана
    auto exhausted = allocator.allocate(1);
    ASSERT_FALSE(exhausted);
    EXPECT_EQ(exhausted.error().code, ErrorCode::CapacityNonceExhausted);

    // Возврат [42,44) делает его доступным снова
    EXPECT_TRUE(allocator.release(1, {42, 44}));
    auto reused = allocator.allocate(1);
    ASSERT_TRUE(reused);
    EXPECT_EQ(*reused, (mining::NonceRange{42, 44}));
}

/**
 * @brief Тест: выданная ширина равна размеру области
 */
TEST_F(NonceAllocatorTest, ExhaustiveAllocationCoversRegion) {
    config_.slice_width = 3;
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 10, 8));

    uint64_t total = 0;
    while (auto range = allocator.allocate(1)) {
        total += range->width();
    }

    EXPECT_EQ(total, 8u);
    auto stats = allocator.stats(1);
    EXPECT_EQ(stats.issued_width, 8u);
    EXPECT_EQ(stats.uncarved_width, 0u);
    EXPECT_EQ(stats.live_count, 3u);
}

/**
 * @brief Тест: повторный и чужой возврат игнорируются
 */
TEST_F(NonceAllocatorTest, ReleaseRequiresExactLiveRange) {
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 40, 8));

    auto range = allocator.allocate(1);
    ASSERT_TRUE(range);

    EXPECT_FALSE(allocator.release(1, {40, 41}));
    EXPECT_FALSE(allocator.release(2, *range));
    EXPECT_TRUE(allocator.release(1, *range));
    EXPECT_FALSE(allocator.release(1, *range));

    EXPECT_EQ(allocator.stats(1).free_width, 2u);
}

/**
 * @brief Тест: поколения не делят срезы
 */
TEST_F(NonceAllocatorTest, GenerationsAreIndependent) {
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 40, 8));
    ASSERT_TRUE(allocator.open_generation(2, 40, 8));

    auto a = allocator.allocate(1);
    auto b = allocator.allocate(2);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(*a, *b);

    // Возврат в чужое поколение не принимается
    EXPECT_FALSE(allocator.release(2, {42, 44}));
    EXPECT_EQ(allocator.live_count(1), 1u);
    EXPECT_EQ(allocator.live_count(2), 1u);
}

/**
 * @brief Тест: закрытое поколение не выдаёт и не перерабатывает срезы
 */
TEST_F(NonceAllocatorTest, ClosedGenerationStopsAllocation) {
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 40, 8));

    auto range = allocator.allocate(1);
    ASSERT_TRUE(range);

    allocator.close_generation(1);

    auto denied = allocator.allocate(1);
    ASSERT_FALSE(denied);
    EXPECT_EQ(denied.error().code, ErrorCode::MiningStaleJob);

    EXPECT_TRUE(allocator.release(1, *range));
    EXPECT_EQ(allocator.stats(1).free_width, 0u);
    EXPECT_TRUE(allocator.stats(1).closed);
}

/**
 * @brief Тест: удаление старых поколений
 */
TEST_F(NonceAllocatorTest, RetireDropsPools) {
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 40, 8));
    ASSERT_TRUE(allocator.open_generation(2, 40, 8));
    ASSERT_TRUE(allocator.open_generation(3, 40, 8));

    auto old_range = allocator.allocate(1);
    ASSERT_TRUE(old_range);

    EXPECT_EQ(allocator.retire_before(3), 2u);
    EXPECT_FALSE(allocator.has_generation(1));
    EXPECT_TRUE(allocator.has_generation(3));
    EXPECT_EQ(allocator.generation_count(), 1u);

    // Срез удалённого поколения отбрасывается
    EXPECT_FALSE(allocator.release(1, *old_range));

    auto unknown = allocator.allocate(1);
    ASSERT_FALSE(unknown);
    EXPECT_EQ(unknown.error().code, ErrorCode::CapacityNoTemplate);
}

/**
 * @brief Тест: ошибки open_generation
 */
TEST_F(NonceAllocatorTest, OpenGenerationRejectsEmptyAndDuplicate) {
    mining::NonceAllocator allocator(config_);

    EXPECT_FALSE(allocator.open_generation(1, 40, 0));
    ASSERT_TRUE(allocator.open_generation(1, 40, 8));

    auto duplicate = allocator.open_generation(1, 40, 8);
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::ConfigInvalidValue);
}

/**
 * @brief Тест: сжатие при исчерпании, один раз на поколение
 */
TEST_F(NonceAllocatorTest, ShrinkOnPressureHalvesWidthOnce) {
    config_.slice_width = 4;
    config_.min_slice_width = 1;
    config_.shrink_on_pressure = true;
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 40, 8));

    auto first = allocator.allocate(1);
    auto second = allocator.allocate(1);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->width(), 4u);

    EXPECT_FALSE(allocator.allocate(1));
    EXPECT_EQ(allocator.slice_width(1), 2u);
    EXPECT_TRUE(allocator.stats(1).shrunk);

    // Возвращённый широкий срез делится на два узких
    EXPECT_TRUE(allocator.release(1, *first));
    auto a = allocator.allocate(1);
    auto b = allocator.allocate(1);
    ASSERT_TRUE(a);
    ASSERT_TRUE(b);
    EXPECT_EQ(a->width(), 2u);
    EXPECT_EQ(b->width(), 2u);
    EXPECT_FALSE(a->overlaps(*b));

    // Повторное исчерпание не сжимает дальше
    EXPECT_FALSE(allocator.allocate(1));
    EXPECT_EQ(allocator.slice_width(1), 2u);
}

/**
 * @brief Тест: сжатие не опускается ниже минимальной ширины
 */
TEST_F(NonceAllocatorTest, ShrinkRespectsMinimumWidth) {
    config_.slice_width = 2;
    config_.min_slice_width = 2;
    config_.shrink_on_pressure = true;
    mining::NonceAllocator allocator(config_);
    ASSERT_TRUE(allocator.open_generation(1, 40, 2));

    ASSERT_TRUE(allocator.allocate(1));
    EXPECT_FALSE(allocator.allocate(1));
    EXPECT_EQ(allocator.slice_width(1), 2u);
    EXPECT_FALSE(allocator.stats(1).shrunk);
}

/**
 * @brief Тест: живые срезы не пересекаются при конкурентной работе
 */
TEST_F(NonceAllocatorTest, ConcurrentAllocateReleaseNeverOverlaps) {
    config_.slice_width = 1;
    mining::NonceAllocator allocator(config_);
    constexpr uint32_t REGION = 64;
    ASSERT_TRUE(allocator.open_generation(1, 0, REGION));

    // Владелец каждого байта области
    std::vector<std::atomic<int>> owner(REGION);
    for (auto& o : owner) {
        o.store(-1);
    }
    std::atomic<int> overlaps{0};

    auto worker = [&](int id) {
        std::mt19937 rng(static_cast<unsigned>(id));
        std::vector<mining::NonceRange> held;

        for (int i = 0; i < 2000; ++i) {
            if (held.empty() || (rng() % 2 == 0)) {
                auto range = allocator.allocate(1);
                if (!range) {
                    continue;
                }
                for (uint32_t p = range->start; p < range->end; ++p) {
                    int expected = -1;
                    if (!owner[p].compare_exchange_strong(expected, id)) {
                        overlaps.fetch_add(1);
                    }
                }
                held.push_back(*range);
            } else {
                auto idx = rng() % held.size();
                auto range = held[idx];
                held.erase(held.begin() + static_cast<std::ptrdiff_t>(idx));
                for (uint32_t p = range.start; p < range.end; ++p) {
                    owner[p].store(-1);
                }
                EXPECT_TRUE(allocator.release(1, range));
            }
        }

        for (const auto& range : held) {
            for (uint32_t p = range.start; p < range.end; ++p) {
                owner[p].store(-1);
            }
            EXPECT_TRUE(allocator.release(1, range));
        }
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back(worker, t);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(overlaps.load(), 0);
    EXPECT_EQ(allocator.live_count(1), 0u);
    EXPECT_EQ(allocator.stats(1).free_width + allocator.stats(1).uncarved_width, REGION);
}

} // namespace xmrweb::tests
