/**
 * @file test_config.cpp
 * @brief Тесты загрузки и валидации конфигурации
 */

#include <gtest/gtest.h>

#include "core/config.hpp"

#include <string>

namespace xmrweb::tests {

namespace {

const std::string WALLET(95, '4');

std::string minimal_toml() {
    return "[monerod]\nwallet_address = \"" + WALLET + "\"\n";
}

} // anonymous namespace

/**
 * @brief Тест: значения по умолчанию
 */
TEST(ConfigTest, DefaultsForMissingKeys) {
    auto config = Config::parse(minimal_toml());
    ASSERT_TRUE(config) << config.error().message;

    EXPECT_EQ(config->monerod.rpc_url, "http://127.0.0.1:18081");
    EXPECT_EQ(config->monerod.reserve_size, 8u);
    EXPECT_EQ(config->jobs.job_ttl_ms, 60000u);
    EXPECT_EQ(config->jobs.share_difficulty, 5000u);
    EXPECT_TRUE(config->jobs.shrink_on_pressure);
    EXPECT_EQ(config->limits.max_strikes, 10u);
    EXPECT_EQ(config->forwarder.max_retries, 3u);
    EXPECT_EQ(config->logging.level, "info");

    EXPECT_TRUE(config->validate());
}

/**
 * @brief Тест: разбор всех секций
 */
TEST(ConfigTest, ParsesAllSections) {
    std::string text = minimal_toml() + R"(
rpc_url = "http://node:28081/"
reserve_size = 16

[server]
max_connections = 50
max_connections_per_ip = 2
idle_timeout_ms = 3000

[jobs]
job_ttl_ms = 1000
stale_job_grace_ms = 250
share_difficulty = 1234
slice_width = 4
min_slice_width = 2
shrink_on_pressure = false

[limits]
submits_per_minute = 7
max_invalid_submissions = 3

[forwarder]
max_retries = 5
dedup_window_ms = 100

[logging]
level = "debug"
color = false
stats_interval = 0
)";

    auto config = Config::parse(text);
    ASSERT_TRUE(config) << config.error().message;

    EXPECT_EQ(config->monerod.get_json_rpc_url(), "http://node:28081/json_rpc");
    EXPECT_EQ(config->monerod.reserve_size, 16u);
    EXPECT_EQ(config->server.max_connections, 50u);
    EXPECT_EQ(config->server.max_connections_per_ip, 2u);
    EXPECT_EQ(config->server.idle_timeout_ms, 3000u);
    EXPECT_EQ(config->jobs.stale_job_grace_ms, 250u);
    EXPECT_EQ(config->jobs.share_difficulty, 1234u);
    EXPECT_EQ(config->jobs.slice_width, 4u);
    EXPECT_EQ(config->jobs.min_slice_width, 2u);
    EXPECT_FALSE(config->jobs.shrink_on_pressure);
    EXPECT_EQ(config->limits.submits_per_minute, 7u);
    EXPECT_EQ(config->limits.max_invalid_submissions, 3u);
    EXPECT_EQ(config->forwarder.max_retries, 5u);
    EXPECT_EQ(config->forwarder.dedup_window_ms, 100u);
    EXPECT_EQ(config->logging.level, "debug");
    EXPECT_FALSE(config->logging.color);
    EXPECT_EQ(config->logging.stats_interval, 0u);

    EXPECT_TRUE(config->validate());
}

/**
 * @brief Тест: синтаксическая ошибка TOML
 */
TEST(ConfigTest, ParseErrorIsReported) {
    auto config = Config::parse("[monerod\nwallet_address = ");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigParseError);
}

/**
 * @brief Тест: отсутствующий файл
 */
TEST(ConfigTest, MissingFile) {
    auto config = Config::load("/nonexistent/xmrweb.toml");
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, ErrorCode::ConfigNotFound);
}

/**
 * @brief Тест: валидация отклоняет некорректные значения
 */
TEST(ConfigTest, ValidationRejectsInvalidValues) {
    auto base = Config::parse(minimal_toml());
    ASSERT_TRUE(base);

    {
        Config config = *base;
        config.monerod.wallet_address = "short";
        EXPECT_FALSE(config.validate());
    }
    {
        Config config = *base;
        config.monerod.rpc_url = "127.0.0.1:18081";
        EXPECT_FALSE(config.validate());
    }
    {
        Config config = *base;
        config.jobs.slice_width = config.monerod.reserve_size + 1;
        EXPECT_FALSE(config.validate());
    }
    {
        Config config = *base;
        config.jobs.min_slice_width = config.jobs.slice_width + 1;
        EXPECT_FALSE(config.validate());
    }
    {
        Config config = *base;
        config.server.max_connections_per_ip = config.server.max_connections + 1;
        EXPECT_FALSE(config.validate());
    }
    {
        Config config = *base;
        config.limits.submits_per_minute = 0;
        EXPECT_FALSE(config.validate());
    }
    {
        Config config = *base;
        config.logging.level = "verbose";
        auto result = config.validate();
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, ErrorCode::ConfigInvalidValue);
    }
}

/**
 * @brief Тест: интегрированный адрес (106 символов) допустим
 */
TEST(ConfigTest, IntegratedAddressAccepted) {
    auto config = Config::parse(minimal_toml());
    ASSERT_TRUE(config);
    config->monerod.wallet_address = std::string(106, '4');
    EXPECT_TRUE(config->validate());
}

} // namespace xmrweb::tests
