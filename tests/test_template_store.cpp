/**
 * @file test_template_store.cpp
 * @brief Тесты Template Store
 */

#include <gtest/gtest.h>

#include "mock_daemon.hpp"
#include "mining/template_store.hpp"
#include "monitoring/events.hpp"

#include <thread>
#include <vector>

namespace xmrweb::tests {

class TemplateStoreTest : public ::testing::Test {
protected:
    TemplateStoreTest()
        : config_(make_test_config())
        , allocator_(mining::NonceAllocatorConfig{
              config_.jobs.slice_width, config_.jobs.min_slice_width, false})
        , store_(daemon_, allocator_, config_.monerod, config_.jobs, &events_)
    {
        events_.subscribe([this](const monitoring::Event& event) {
            types_.push_back(event.type);
        });
    }

    [[nodiscard]] bool saw(monitoring::EventType type) const {
        for (auto t : types_) {
            if (t == type) return true;
        }
        return false;
    }

    Config config_;
    MockDaemon daemon_;
    monitoring::EventHub events_;
    std::vector<monitoring::EventType> types_;
    mining::NonceAllocator allocator_;
    mining::TemplateStore store_;
};

/**
 * @brief Тест: до первого запроса снимка нет
 */
TEST_F(TemplateStoreTest, EmptyBeforeFirstRefresh) {
    EXPECT_EQ(store_.current(), nullptr);
    EXPECT_FALSE(store_.issuance_allowed());
    EXPECT_FALSE(store_.degraded());
}

/**
 * @brief Тест: первый запрос публикует поколение 1
 */
TEST_F(TemplateStoreTest, FirstRefreshPublishesGeneration) {
    auto published = store_.refresh();
    ASSERT_TRUE(published) << published.error().message;

    auto tmpl = store_.current();
    ASSERT_NE(tmpl, nullptr);
    EXPECT_EQ(tmpl->generation, 1u);
    EXPECT_EQ(tmpl->height, 100u);
    EXPECT_EQ(tmpl->blob, make_blob(100));
    EXPECT_EQ(tmpl->reserved_offset, TEST_RESERVED_OFFSET);
    EXPECT_EQ(tmpl->reserved_size, 8u);
    EXPECT_EQ(tmpl->difficulty, TEST_NETWORK_DIFFICULTY);

    EXPECT_TRUE(store_.issuance_allowed());
    EXPECT_TRUE(allocator_.has_generation(1));
    EXPECT_TRUE(saw(monitoring::EventType::TemplateRefreshed));
}

/**
 * @brief Тест: тот же height и prev_hash не создают поколение
 */
TEST_F(TemplateStoreTest, UnchangedTemplateKeepsGeneration) {
    ASSERT_TRUE(store_.refresh());
    auto first = store_.current();

    ASSERT_TRUE(store_.refresh());
    EXPECT_EQ(store_.current(), first);
    EXPECT_EQ(store_.current()->generation, 1u);
    EXPECT_EQ(daemon_.template_calls.load(), 2);
    EXPECT_EQ(allocator_.generation_count(), 1u);
}

/**
 * @brief Тест: новая высота вытесняет поколение и закрывает его пул
 */
TEST_F(TemplateStoreTest, NewHeightSupersedesGeneration) {
    ASSERT_TRUE(store_.refresh());
    auto old = store_.current();

    daemon_.set_height(101);
    ASSERT_TRUE(store_.refresh());

    auto fresh = store_.current();
    EXPECT_EQ(fresh->generation, 2u);
    EXPECT_EQ(fresh->height, 101u);

    // Старый снимок не изменился
    EXPECT_EQ(old->generation, 1u);
    EXPECT_EQ(old->height, 100u);

    EXPECT_TRUE(allocator_.stats(1).closed);
    EXPECT_FALSE(allocator_.stats(2).closed);
    EXPECT_TRUE(store_.superseded_at(1).has_value());
    EXPECT_FALSE(store_.superseded_at(2).has_value());

    auto stale = allocator_.allocate(1);
    ASSERT_FALSE(stale);
    EXPECT_EQ(stale.error().code, ErrorCode::MiningStaleJob);
}

/**
 * @brief Тест: callback публикации вызывается только для нового поколения
 */
TEST_F(TemplateStoreTest, PublishCallbackOnNewGenerationOnly) {
    std::vector<mining::Generation> published;
    store_.set_publish_callback([&](const mining::TemplatePtr& tmpl) {
        published.push_back(tmpl->generation);
    });

    ASSERT_TRUE(store_.refresh());
    ASSERT_TRUE(store_.refresh());
    daemon_.set_height(101);
    ASSERT_TRUE(store_.refresh());

    EXPECT_EQ(published, (std::vector<mining::Generation>{1, 2}));
}

/**
 * @brief Тест: degraded после N неудач подряд и восстановление
 */
TEST_F(TemplateStoreTest, DegradedAfterConsecutiveFailures) {
    ASSERT_TRUE(store_.refresh());
    daemon_.fail_templates(3);

    EXPECT_FALSE(store_.refresh());
    EXPECT_FALSE(store_.refresh());
    EXPECT_FALSE(store_.degraded());
    EXPECT_TRUE(store_.issuance_allowed());

    auto third = store_.refresh();
    ASSERT_FALSE(third);
    EXPECT_EQ(third.error().code, ErrorCode::RpcConnectionFailed);
    EXPECT_TRUE(store_.degraded());
    EXPECT_FALSE(store_.issuance_allowed());
    EXPECT_EQ(store_.consecutive_failures(), 3u);
    EXPECT_TRUE(saw(monitoring::EventType::StoreDegraded));

    // Снимок остаётся прежним
    ASSERT_NE(store_.current(), nullptr);
    EXPECT_EQ(store_.current()->generation, 1u);

    ASSERT_TRUE(store_.refresh());
    EXPECT_FALSE(store_.degraded());
    EXPECT_TRUE(store_.issuance_allowed());
    EXPECT_EQ(store_.consecutive_failures(), 0u);
    EXPECT_TRUE(saw(monitoring::EventType::StoreRecovered));
}

/**
 * @brief Тест: зарезервированная область за пределами blob
 */
TEST_F(TemplateStoreTest, RejectsReservedRegionOutsideBlob) {
    daemon_.set_reserved_offset(96);

    auto result = store_.refresh();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::RpcParseError);
    EXPECT_EQ(store_.current(), nullptr);
    EXPECT_EQ(store_.consecutive_failures(), 1u);
}

/**
 * @brief Тест: нулевое смещение зарезервированной области
 */
TEST_F(TemplateStoreTest, RejectsZeroReservedOffset) {
    daemon_.set_reserved_offset(0);

    auto result = store_.refresh();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::RpcParseError);
}

/**
 * @brief Тест: зарезервированная область пересекается с nonce заголовка
 */
TEST_F(TemplateStoreTest, RejectsReservedRegionOverlappingHeaderNonce) {
    daemon_.set_reserved_offset(40);

    auto result = store_.refresh();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::RpcParseError);
    EXPECT_EQ(store_.current(), nullptr);
}

/**
 * @brief Тест: слишком короткий blob
 */
TEST_F(TemplateStoreTest, RejectsShortBlob) {
    daemon_.set_blob_hex("0e0e");

    auto result = store_.refresh();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::RpcParseError);
}

/**
 * @brief Тест: grace окно и удаление пулов вытесненных поколений
 */
TEST_F(TemplateStoreTest, GraceWindowAndRetirement) {
    ASSERT_TRUE(store_.refresh());
    daemon_.set_height(101);
    ASSERT_TRUE(store_.refresh());

    auto at = store_.superseded_at(1);
    ASSERT_TRUE(at.has_value());
    auto grace = std::chrono::milliseconds(config_.jobs.stale_job_grace_ms);

    EXPECT_TRUE(store_.within_grace(2, *at + std::chrono::hours(1)));
    EXPECT_TRUE(store_.within_grace(1, *at));
    EXPECT_TRUE(store_.within_grace(1, *at + grace));
    EXPECT_FALSE(store_.within_grace(1, *at + grace + std::chrono::milliseconds(1)));
    EXPECT_FALSE(store_.within_grace(42, *at));

    EXPECT_EQ(store_.retire_expired(*at), 0u);
    EXPECT_TRUE(allocator_.has_generation(1));

    EXPECT_EQ(store_.retire_expired(*at + grace + std::chrono::milliseconds(1)), 1u);
    EXPECT_FALSE(allocator_.has_generation(1));
    EXPECT_TRUE(allocator_.has_generation(2));
}

/**
 * @brief Тест: фоновое обновление
 */
TEST_F(TemplateStoreTest, BackgroundRefresh) {
    store_.start();
    EXPECT_TRUE(store_.is_running());

    for (int i = 0; i < 200 && !store_.current(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_NE(store_.current(), nullptr);

    daemon_.set_height(105);
    store_.request_refresh();
    for (int i = 0; i < 200 && store_.current()->height != 105; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(store_.current()->height, 105u);
    EXPECT_EQ(store_.current()->generation, 2u);

    store_.stop();
    EXPECT_FALSE(store_.is_running());
}

} // namespace xmrweb::tests
