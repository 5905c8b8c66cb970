/**
 * @file alerter.cpp
 * @brief Реализация системы алертинга
 */

#include "alerter.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace xmrweb::monitoring {

AlertLevel alert_level_from_string(std::string_view level) noexcept {
    if (level == "error") return AlertLevel::Critical;
    if (level == "warn") return AlertLevel::Warning;
    if (level == "debug") return AlertLevel::Debug;
    return AlertLevel::Info;
}

// =============================================================================
// Singleton
// =============================================================================

Alerter& Alerter::instance() {
    static Alerter instance;
    return instance;
}

Alerter::Alerter() = default;

// =============================================================================
// Конфигурация
// =============================================================================

void Alerter::configure(const AlerterConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
}

void Alerter::set_callback(AlertCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

// =============================================================================
// Общие алерты
// =============================================================================

void Alerter::alert(AlertLevel level, std::string_view message) {
    AlerterConfig config;
    AlertCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        config = config_;
        callback = callback_;
    }

    // Проверяем уровень
    if (level < config.log_level) {
        return;
    }

    // Увеличиваем счётчики
    alerts_count_++;
    if (level == AlertLevel::Critical) {
        critical_count_++;
    }

    // Выводим в консоль
    if (config.console_output) {
        log_to_console(level, message, config.color);
    }

    if (callback) {
        callback(level, message);
    }
}

// =============================================================================
// Предопределённые алерты
// =============================================================================

void Alerter::alert_daemon_connected(uint64_t height) {
    if (!should_send("daemon_connected")) return;

    std::ostringstream ss;
    ss << "monerod подключён, высота " << height;
    alert(AlertLevel::Info, ss.str());
}

void Alerter::alert_rpc_failure(std::string_view method, std::string_view error) {
    std::string key = "rpc_failure_" + std::string(method);
    if (!should_send(key)) return;

    std::ostringstream ss;
    ss << "Ошибка RPC " << method << ": " << error;
    alert(AlertLevel::Warning, ss.str());
}

void Alerter::alert_store_degraded(std::string_view details) {
    std::ostringstream ss;
    ss << "Шаблон недоступен: " << details;
    alert(AlertLevel::Critical, ss.str());
}

void Alerter::alert_store_recovered() {
    alert(AlertLevel::Info, "Шаблон снова доступен, выдача заданий возобновлена");
}

void Alerter::alert_block_found(uint64_t height, std::string_view hash_hex) {
    // Блок найден - всегда отправляем (без дедупликации)
    std::ostringstream ss;
    ss << "БЛОК НАЙДЕН! Высота: " << height << ", хеш: " << hash_hex;
    alert(AlertLevel::Critical, ss.str());
}

void Alerter::alert_block_accepted(uint64_t height) {
    std::ostringstream ss;
    ss << "Блок на высоте " << height << " принят демоном";
    alert(AlertLevel::Info, ss.str());
}

void Alerter::alert_block_rejected(uint64_t height, std::string_view reason) {
    std::ostringstream ss;
    ss << "Блок на высоте " << height << " отклонён демоном: " << reason;
    alert(AlertLevel::Warning, ss.str());
}

void Alerter::alert_forward_failed(uint64_t height, std::string_view error,
                                   std::string_view blob_hex) {
    std::ostringstream ss;
    ss << "Блок на высоте " << height << " НЕ ДОСТАВЛЕН (" << error
       << "). Отправьте вручную: submit_block [\"" << blob_hex << "\"]";
    alert(AlertLevel::Critical, ss.str());
}

void Alerter::alert_rate_limit(uint64_t session_id, std::string_view details) {
    std::string key = "rate_limit_" + std::to_string(session_id);
    if (!should_send(key)) return;

    std::ostringstream ss;
    ss << "Сессия " << session_id << " превысила лимит: " << details;
    alert(AlertLevel::Warning, ss.str());
}

// =============================================================================
// Статистика
// =============================================================================

uint64_t Alerter::get_alerts_count() const noexcept {
    return alerts_count_;
}

uint64_t Alerter::get_critical_count() const noexcept {
    return critical_count_;
}

std::size_t Alerter::get_dedup_entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_alerts_.size();
}

void Alerter::reset_stats() {
    alerts_count_ = 0;
    critical_count_ = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    last_alerts_.clear();
}

// =============================================================================
// Приватные методы
// =============================================================================

bool Alerter::should_send(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto now = std::chrono::steady_clock::now();
    auto interval = std::chrono::seconds(config_.dedup_interval_seconds);

    // Ключи закрытых сессий не должны копиться
    std::erase_if(last_alerts_, [&](const auto& entry) {
        return now - entry.second >= interval;
    });

    if (last_alerts_.contains(key)) {
        return false;
    }

    last_alerts_[key] = now;
    return true;
}

void Alerter::log_to_console(AlertLevel level, std::string_view message, bool color) {
    // Получаем текущее время
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);

    // Формируем вывод
    std::ostringstream ss;
    ss << "[" << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "] ";
    ss << "[" << alert_level_to_string(level) << "] ";
    ss << message;

    if (!color) {
        auto& out = (level == AlertLevel::Critical) ? std::cerr : std::cout;
        out << ss.str() << std::endl;
        return;
    }

    // Выводим с цветом в зависимости от уровня
    switch (level) {
        case AlertLevel::Debug:
            std::cout << "\033[90m" << ss.str() << "\033[0m" << std::endl;
            break;
        case AlertLevel::Info:
            std::cout << "\033[32m" << ss.str() << "\033[0m" << std::endl;
            break;
        case AlertLevel::Warning:
            std::cout << "\033[33m" << ss.str() << "\033[0m" << std::endl;
            break;
        case AlertLevel::Critical:
            std::cerr << "\033[31m" << ss.str() << "\033[0m" << std::endl;
            break;
    }
}

} // namespace xmrweb::monitoring
