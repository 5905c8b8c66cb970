/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>
#include <cstdlib>
#include <vector>

namespace xmrweb {

namespace {

/**
 * @brief Заполнить конфигурацию из разобранной TOML таблицы
 */
Config from_table(const toml::table& table) {
    Config config;

    // === Секция [server] ===
    if (auto server = table["server"].as_table()) {
        if (auto val = (*server)["max_connections"].value<int64_t>()) {
            config.server.max_connections = static_cast<std::size_t>(*val);
        }
        if (auto val = (*server)["max_connections_per_ip"].value<int64_t>()) {
            config.server.max_connections_per_ip = static_cast<std::size_t>(*val);
        }
        if (auto val = (*server)["idle_timeout_ms"].value<int64_t>()) {
            config.server.idle_timeout_ms = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [monerod] ===
    if (auto monerod = table["monerod"].as_table()) {
        if (auto val = (*monerod)["rpc_url"].value<std::string>()) {
            config.monerod.rpc_url = *val;
        }
        if (auto val = (*monerod)["wallet_address"].value<std::string>()) {
            config.monerod.wallet_address = *val;
        }
        if (auto val = (*monerod)["reserve_size"].value<int64_t>()) {
            config.monerod.reserve_size = static_cast<uint32_t>(*val);
        }
        if (auto val = (*monerod)["rpc_timeout_ms"].value<int64_t>()) {
            config.monerod.rpc_timeout_ms = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [jobs] ===
    if (auto jobs = table["jobs"].as_table()) {
        if (auto val = (*jobs)["job_ttl_ms"].value<int64_t>()) {
            config.jobs.job_ttl_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["template_refresh_interval_ms"].value<int64_t>()) {
            config.jobs.template_refresh_interval_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["stale_job_grace_ms"].value<int64_t>()) {
            config.jobs.stale_job_grace_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["share_difficulty"].value<int64_t>()) {
            config.jobs.share_difficulty = static_cast<uint64_t>(*val);
        }
        if (auto val = (*jobs)["slice_width"].value<int64_t>()) {
            config.jobs.slice_width = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["min_slice_width"].value<int64_t>()) {
            config.jobs.min_slice_width = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["shrink_on_pressure"].value<bool>()) {
            config.jobs.shrink_on_pressure = *val;
        }
        if (auto val = (*jobs)["degraded_after_failures"].value<int64_t>()) {
            config.jobs.degraded_after_failures = static_cast<uint32_t>(*val);
        }
        if (auto val = (*jobs)["maintenance_interval_ms"].value<int64_t>()) {
            config.jobs.maintenance_interval_ms = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [limits] ===
    if (auto limits = table["limits"].as_table()) {
        if (auto val = (*limits)["messages_per_second"].value<int64_t>()) {
            config.limits.messages_per_second = static_cast<uint32_t>(*val);
        }
        if (auto val = (*limits)["shares_per_minute"].value<int64_t>()) {
            config.limits.shares_per_minute = static_cast<uint32_t>(*val);
        }
        if (auto val = (*limits)["submits_per_minute"].value<int64_t>()) {
            config.limits.submits_per_minute = static_cast<uint32_t>(*val);
        }
        if (auto val = (*limits)["max_strikes"].value<int64_t>()) {
            config.limits.max_strikes = static_cast<uint32_t>(*val);
        }
        if (auto val = (*limits)["max_invalid_submissions"].value<int64_t>()) {
            config.limits.max_invalid_submissions = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [forwarder] ===
    if (auto forwarder = table["forwarder"].as_table()) {
        if (auto val = (*forwarder)["max_retries"].value<int64_t>()) {
            config.forwarder.max_retries = static_cast<uint32_t>(*val);
        }
        if (auto val = (*forwarder)["retry_backoff_ms"].value<int64_t>()) {
            config.forwarder.retry_backoff_ms = static_cast<uint32_t>(*val);
        }
        if (auto val = (*forwarder)["dedup_window_ms"].value<int64_t>()) {
            config.forwarder.dedup_window_ms = static_cast<uint32_t>(*val);
        }
    }

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["level"].value<std::string>()) {
            config.logging.level = *val;
        }
        if (auto val = (*logging)["color"].value<bool>()) {
            config.logging.color = *val;
        }
        if (auto val = (*logging)["stats_interval"].value<int64_t>()) {
            config.logging.stats_interval = static_cast<uint32_t>(*val);
        }
    }

    return config;
}

} // anonymous namespace

// =============================================================================
// MonerodConfig
// =============================================================================

std::string MonerodConfig::get_json_rpc_url() const {
    std::string base = rpc_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + constants::JSON_RPC_PATH;
}

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            "Файл конфигурации не найден: " + path.string()
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::string("Ошибка парсинга TOML: ") + e.what()
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::string("Ошибка парсинга TOML: ") + e.what()
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path
) {
    std::vector<std::filesystem::path> search_paths;

    if (path.has_value()) {
        search_paths.push_back(path.value());
    }

    if (const char* env = std::getenv("XMRWEB_CONFIG")) {
        search_paths.push_back(env);
    }

    // Стандартные пути
    search_paths.push_back("xmrweb.toml");
    search_paths.push_back("/etc/xmrweb/xmrweb.toml");

    if (const char* home = std::getenv("HOME")) {
        search_paths.push_back(
            std::filesystem::path(home) / ".config" / "xmrweb" / "xmrweb.toml"
        );
    }

    for (const auto& search_path : search_paths) {
        if (std::filesystem::exists(search_path)) {
            return load(search_path);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        "Файл конфигурации не найден в стандартных путях"
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    // Адрес кошелька: стандартный (95) или интегрированный (106) base58
    if (monerod.wallet_address.empty()) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Адрес кошелька не указан (monerod.wallet_address)"
        );
    }
    if (monerod.wallet_address.size() != 95 && monerod.wallet_address.size() != 106) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Некорректная длина адреса кошелька: " +
                std::to_string(monerod.wallet_address.size())
        );
    }

    if (!monerod.rpc_url.starts_with("http://") &&
        !monerod.rpc_url.starts_with("https://")) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "monerod.rpc_url должен начинаться с http:// или https://"
        );
    }

    if (monerod.reserve_size < 1 || monerod.reserve_size > constants::MAX_RESERVE_SIZE) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "monerod.reserve_size должен быть от 1 до 255 байт"
        );
    }

    if (monerod.rpc_timeout_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "monerod.rpc_timeout_ms не может быть 0");
    }

    // Срезы зарезервированной области
    if (jobs.slice_width == 0 || jobs.slice_width > monerod.reserve_size) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "jobs.slice_width должен быть от 1 до monerod.reserve_size"
        );
    }
    if (jobs.min_slice_width == 0 || jobs.min_slice_width > jobs.slice_width) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "jobs.min_slice_width должен быть от 1 до jobs.slice_width"
        );
    }

    if (jobs.job_ttl_ms == 0 || jobs.template_refresh_interval_ms == 0 ||
        jobs.maintenance_interval_ms == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Интервалы в секции [jobs] не могут быть 0"
        );
    }

    if (jobs.share_difficulty == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "jobs.share_difficulty не может быть 0");
    }

    if (jobs.degraded_after_failures == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "jobs.degraded_after_failures не может быть 0"
        );
    }

    // Подключения
    if (server.max_connections == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue, "server.max_connections не может быть 0");
    }
    if (server.max_connections_per_ip == 0 ||
        server.max_connections_per_ip > server.max_connections) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "server.max_connections_per_ip должен быть от 1 до server.max_connections"
        );
    }

    // Лимиты
    if (limits.messages_per_second == 0 || limits.shares_per_minute == 0 ||
        limits.submits_per_minute == 0) {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "Лимиты в секции [limits] не могут быть 0"
        );
    }

    if (logging.level != "error" && logging.level != "warn" &&
        logging.level != "info" && logging.level != "debug") {
        return Err<void>(
            ErrorCode::ConfigInvalidValue,
            "logging.level должен быть 'error', 'warn', 'info' или 'debug'"
        );
    }

    return {};
}

} // namespace xmrweb
