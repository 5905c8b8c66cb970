/**
 * @file main.cpp
 * @brief Точка входа xmrweb coordinator
 *
 * xmrweb coordinator - ядро соло-майнинга Monero для браузерных воркеров.
 *
 * Основные компоненты:
 * 1. RPC Client - связь с monerod
 * 2. Template Store - кеш шаблона блока и поколения
 * 3. Nonce Allocator - непересекающиеся срезы зарезервированной области
 * 4. Session Registry - сессии воркеров и их задания
 * 5. Submission Validator / Block Forwarder - проверка и отправка решений
 * 6. Stats Collector - мониторинг и статистика
 *
 * Использование:
 *   xmrweb-coordinator [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "monero/difficulty.hpp"
#include "monero/rpc_client.hpp"
#include "mining/coordinator.hpp"
#include "mining/pow_verifier.hpp"
#include "monitoring/alerter.hpp"
#include "monitoring/event_logger.hpp"
#include "monitoring/events.hpp"
#include "monitoring/stats.hpp"

#include <iostream>
#include <csignal>
#include <atomic>
#include <optional>
#include <thread>

namespace {

/// @brief Версия программы
constexpr std::string_view VERSION = "1.0.0";

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
xmrweb coordinator v)" << VERSION << R"(
Соло-майнинг Monero для браузерных воркеров

ИСПОЛЬЗОВАНИЕ:
    xmrweb-coordinator [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (xmrweb.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти
    --test-rpc           Проверить подключение к monerod

ПРИМЕРЫ:
    xmrweb-coordinator -c /etc/xmrweb/xmrweb.toml
    xmrweb-coordinator --test-rpc

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "xmrweb coordinator v" << VERSION << std::endl;
}

/**
 * @brief Вывести баннер при запуске
 */
void print_banner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════════╗
║                                                                   ║
║                 XMRWEB  SOLO MINING COORDINATOR                   ║
║                        v)" << VERSION << R"(                                  ║
║                                                                   ║
╚═══════════════════════════════════════════════════════════════════╝
)";
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    bool test_rpc = false;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if (arg == "--test-rpc") {
            args.test_rpc = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        }
    }

    return args;
}

/**
 * @brief Транспорт без сети: пишет исходящие сообщения в лог
 *
 * Реальный фронтенд (WebSocket) реализует ITransportSink сам.
 */
class LoggingTransportSink final : public xmrweb::mining::ITransportSink {
public:
    void send_job(xmrweb::mining::SessionId session_id,
                  const xmrweb::mining::JobNotice& notice) override {
        xmrweb::monitoring::Alerter::instance().alert(
            xmrweb::monitoring::AlertLevel::Debug,
            "job " + notice.job_id + " -> session " + std::to_string(session_id) +
                ", height " + std::to_string(notice.height)
        );
    }

    void send_stats(xmrweb::mining::SessionId session_id,
                    const xmrweb::mining::StatsNotice& notice) override {
        xmrweb::monitoring::Alerter::instance().alert(
            xmrweb::monitoring::AlertLevel::Debug,
            "stats -> session " + std::to_string(session_id) + ": submits/min " +
                std::to_string(notice.submits_per_minute) + ", msgs/s " +
                std::to_string(notice.messages_per_second)
        );
    }

    void close_session(xmrweb::mining::SessionId session_id,
                       xmrweb::mining::CloseReason reason) override {
        xmrweb::monitoring::Alerter::instance().alert(
            xmrweb::monitoring::AlertLevel::Info,
            "session " + std::to_string(session_id) + " closed: " +
                std::string(xmrweb::mining::to_string(reason))
        );
    }
};

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace xmrweb;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Выводим баннер
    print_banner();

    // Загружаем конфигурацию
    std::cout << "[INFO] Загрузка конфигурации..." << std::endl;

    auto config_result = args.config_path
        ? Config::load(*args.config_path)
        : Config::load_with_search();

    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = *config_result;

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    std::cout << "[INFO] Конфигурация загружена успешно" << std::endl;

    if (args.test_config) {
        std::cout << "[INFO] Конфигурация валидна" << std::endl;
        return 0;
    }

    // Логирование
    monitoring::AlerterConfig alerter_config;
    alerter_config.log_level = monitoring::alert_level_from_string(config.logging.level);
    alerter_config.color = config.logging.color;
    monitoring::Alerter::instance().configure(alerter_config);

    // Проверяем подключение к monerod
    std::cout << "[INFO] Подключение к monerod " << config.monerod.rpc_url << "..." << std::endl;

    monero::RpcClient rpc_client(config.monerod);

    auto info = rpc_client.get_info();
    if (!info) {
        std::cerr << "[ERROR] Не удалось подключиться к monerod: "
                  << info.error().message << std::endl;
        return 1;
    }

    std::cout << "[INFO] Подключено к monerod " << info->version << std::endl;
    std::cout << "[INFO] Высота блока: " << info->height << std::endl;

    if (!info->synchronized) {
        std::cerr << "[WARNING] monerod синхронизируется, "
                  << "шаблоны могут быть устаревшими" << std::endl;
    }

    if (args.test_rpc) {
        std::cout << "[INFO] Подключение к monerod успешно" << std::endl;
        return 0;
    }

    monitoring::Alerter::instance().alert_daemon_connected(info->height);

    // События и статистика
    monitoring::EventHub events;
    monitoring::EventLogger event_logger(events);
    monitoring::StatsCollector stats(config.logging, events);

    // Ядро
    mining::ReportedHashVerifier verifier;
    LoggingTransportSink sink;
    mining::Coordinator coordinator(config, rpc_client, verifier, sink, &events);

    std::cout << "[INFO] Адрес выплаты: " << config.monerod.wallet_address << std::endl;
    std::cout << "[INFO] Share difficulty: "
              << monero::format_difficulty(config.jobs.share_difficulty) << std::endl;
    std::cout << "[INFO] Проверка хеша: " << verifier.name() << std::endl;

    // Первый шаблон синхронно, чтобы сразу сообщить об ошибке
    auto first = coordinator.refresh_template();
    if (!first) {
        std::cerr << "[WARNING] Шаблон не получен: " << first.error().message
                  << ", повтор через " << config.jobs.template_refresh_interval_ms << " мс"
                  << std::endl;
    }

    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    coordinator.start();
    stats.start_periodic_output();

    std::cout << "[INFO] Координатор запущен" << std::endl;

    // Основной цикл
    while (g_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // Graceful shutdown
    std::cout << "\n[INFO] Получен сигнал завершения, останавливаем..." << std::endl;

    stats.stop_periodic_output();
    coordinator.shutdown();
    coordinator.stop();

    std::cout << "[INFO] xmrweb coordinator остановлен" << std::endl;

    // Выводим финальную статистику
    std::cout << stats.format_stats() << std::endl;

    return 0;
}
