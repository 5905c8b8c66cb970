/**
 * @file coordinator.hpp
 * @brief Фасад ядра координатора
 *
 * Связывает компоненты:
 *
 *   TemplateStore -> NonceAllocator -> SessionRegistry -> ITransportSink
 *        ^                                   |
 *        |                         SubmissionValidator
 *        |                                   |
 *        +------ refresh <------ BlockForwarder -> monerod
 *
 * Транспорт (WebSocket и т.п.) вызывает on_connected / on_hello /
 * on_disconnected / on_keepalive / on_submit из своих потоков и
 * получает задания, квоты и закрытия через ITransportSink.
 */

#pragma once

#include "block_forwarder.hpp"
#include "job.hpp"
#include "nonce_allocator.hpp"
#include "pow_verifier.hpp"
#include "session_registry.hpp"
#include "submission_validator.hpp"
#include "template_store.hpp"
#include "../core/config.hpp"
#include "../monero/daemon_client.hpp"
#include "../monitoring/events.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace xmrweb::mining {

// =============================================================================
// Транспортная граница
// =============================================================================

/**
 * @brief Задание в виде, отправляемом воркеру
 */
struct JobNotice {
    std::string job_id;           ///< 16 hex символов
    std::string blob;             ///< blob задания с печатью (hex)
    NonceRange nonce_range;       ///< Выделенные байты [start, end) в blob
    std::string reserved_value;   ///< Печать в байтах среза (hex)
    std::string share_target;     ///< 32 байта little-endian (hex)
    uint64_t share_difficulty = 0;
    uint64_t ttl_ms = 0;
    uint64_t height = 0;
    std::string seed_hash;
};

/**
 * @brief Отправка результата от воркера
 */
struct SubmitRequest {
    std::string job_id;           ///< hex
    uint32_t nonce = 0;           ///< nonce заголовка
    std::string result;           ///< Хеш (64 hex символа)
    std::string blob;             ///< blob с nonce (hex, может быть пустым)
};

/**
 * @brief Приветствие воркера
 */
struct HelloRequest {
    uint32_t version = 0;         ///< Версия протокола
    std::string client_version;
    uint32_t threads = 0;
};

/**
 * @brief Квоты сессии, сообщаемые воркеру в ответ на приветствие
 */
struct StatsNotice {
    SessionId session_id = 0;
    uint32_t submits_per_minute = 0;
    uint32_t messages_per_second = 0;
};

/**
 * @brief Исходящие сообщения сессиям
 */
class ITransportSink {
public:
    virtual ~ITransportSink() = default;

    virtual void send_job(SessionId session_id, const JobNotice& notice) = 0;

    virtual void send_stats(SessionId session_id, const StatsNotice& notice) = 0;

    virtual void close_session(SessionId session_id, CloseReason reason) = 0;
};

/**
 * @brief Собрать JobNotice из задания
 */
[[nodiscard]] JobNotice make_job_notice(const Job& job);

/**
 * @brief Разобрать SubmitRequest в Candidate
 *
 * @return Candidate или TransportMalformedMessage
 */
[[nodiscard]] Result<Candidate> parse_submit(const SubmitRequest& request);

/**
 * @brief Проверить приветствие
 *
 * @return TransportMalformedMessage при чужой версии протокола, числе
 *         потоков вне [1, 256] или слишком длинной версии клиента
 */
[[nodiscard]] Result<void> check_hello(const HelloRequest& request);

/**
 * @brief Итог одного прохода обслуживания
 */
struct MaintenanceReport {
    std::size_t idle_closed = 0;
    std::size_t jobs_reissued = 0;
    std::size_t generations_retired = 0;
};

// =============================================================================
// Coordinator
// =============================================================================

class Coordinator {
public:
    /**
     * @brief Создать координатор
     *
     * @param config Проверенная конфигурация
     * @param daemon Клиент monerod
     * @param verifier Примитив вычисления хеша
     * @param sink Исходящие сообщения транспорта
     * @param events Получатель событий (может быть nullptr)
     */
    Coordinator(
        const Config& config,
        monero::IDaemonClient& daemon,
        IPowVerifier& verifier,
        ITransportSink& sink,
        monitoring::EventHub* events = nullptr
    );

    ~Coordinator();

    // Запрещаем копирование
    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    // =========================================================================
    // События транспорта
    // =========================================================================

    /**
     * @brief Новое подключение
     *
     * Регистрирует сессию и, если шаблон доступен, сразу выдаёт задание.
     *
     * @return SessionId или CapacityLimitExceeded
     */
    [[nodiscard]] Result<SessionId> on_connected(std::string_view remote_address);

    /**
     * @brief Приветствие воркера
     *
     * Записывает версию клиента и число потоков в сессию и отправляет
     * воркеру его квоты. Сообщение проходит лимит сообщений.
     *
     * @return Verdict лимитера или TransportMalformedMessage,
     *         TransportUnknownSession
     */
    [[nodiscard]] Result<Verdict> on_hello(SessionId session_id, const HelloRequest& request,
                                           TimePoint now);

    /**
     * @brief Транспорт закрыл соединение
     */
    void on_disconnected(SessionId session_id);

    /**
     * @brief Keepalive от воркера
     */
    [[nodiscard]] Result<Verdict> on_keepalive(SessionId session_id, TimePoint now);

    /**
     * @brief Результат от воркера
     *
     * Решение уровня сети отправляется в monerod до возврата; исход
     * пересылки записывается в AcceptedBlock::forward.
     */
    [[nodiscard]] SubmissionResult on_submit(
        SessionId session_id,
        const SubmitRequest& request,
        TimePoint now
    );

    [[nodiscard]] SubmissionResult on_submit(SessionId session_id, const SubmitRequest& request) {
        return on_submit(session_id, request, Clock::now());
    }

    // =========================================================================
    // Обслуживание
    // =========================================================================

    /**
     * @brief Синхронно обновить шаблон
     */
    [[nodiscard]] Result<TemplatePtr> refresh_template();

    /**
     * @brief Выдать сессии новое задание и отправить его
     */
    [[nodiscard]] Result<Job> issue_job(SessionId session_id);

    /**
     * @brief Один проход: idle сессии, ttl заданий, старые поколения
     */
    MaintenanceReport maintain(TimePoint now);

    /**
     * @brief Запустить обновление шаблона и поток обслуживания
     */
    void start();

    /**
     * @brief Остановить фоновые потоки
     */
    void stop();

    /**
     * @brief Закрыть все сессии (Shutdown)
     */
    void shutdown();

    // =========================================================================
    // Компоненты
    // =========================================================================

    [[nodiscard]] TemplateStore& store() noexcept;
    [[nodiscard]] NonceAllocator& allocator() noexcept;
    [[nodiscard]] SessionRegistry& registry() noexcept;
    [[nodiscard]] SubmissionValidator& validator() noexcept;
    [[nodiscard]] BlockForwarder& forwarder() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xmrweb::mining
