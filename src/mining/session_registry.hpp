/**
 * @file session_registry.hpp
 * @brief Реестр сессий воркеров
 *
 * Хранит для каждой сессии:
 * - адрес источника и время подключения/последнего сообщения
 * - версию клиента и число потоков из приветствия
 * - текущее задание (не более одного) и задания вытесненных поколений,
 *   ещё находящиеся в grace окне
 * - лимитер сообщений и счётчик отклонённых отправок
 * - состояние Connecting -> Active -> RateLimited -> Closing -> Closed
 *
 * Мьютекс карты держится только на время поиска/вставки/удаления,
 * каждая сессия защищена собственным мьютексом.
 */

#pragma once

#include "job.hpp"
#include "nonce_allocator.hpp"
#include "rate_limiter.hpp"
#include "template_store.hpp"
#include "../core/config.hpp"
#include "../monitoring/events.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmrweb::mining {

// =============================================================================
// Состояние сессии
// =============================================================================

enum class SessionState {
    Connecting,     ///< Зарегистрирована, задание ещё не выдано
    Active,
    RateLimited,    ///< Сообщения отбрасываются до освобождения окна
    Closing,
    Closed
};

[[nodiscard]] constexpr std::string_view to_string(SessionState state) noexcept {
    switch (state) {
        case SessionState::Connecting:  return "connecting";
        case SessionState::Active:      return "active";
        case SessionState::RateLimited: return "rate-limited";
        case SessionState::Closing:     return "closing";
        case SessionState::Closed:      return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Причина закрытия, видимая воркеру
 */
enum class CloseReason {
    ClientDisconnect,
    IdleTimeout,
    RateLimited,
    TooManyInvalid,
    TransportError,
    Shutdown
};

[[nodiscard]] constexpr std::string_view to_string(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::ClientDisconnect: return "client-disconnect";
        case CloseReason::IdleTimeout:      return "idle-timeout";
        case CloseReason::RateLimited:      return "rate-limited";
        case CloseReason::TooManyInvalid:   return "too-many-invalid";
        case CloseReason::TransportError:   return "transport-error";
        case CloseReason::Shutdown:         return "shutdown";
        default: return "unknown";
    }
}

/**
 * @brief Вид входящего сообщения для лимитера
 */
enum class MessageKind {
    Keepalive,
    Submit
};

/**
 * @brief Копия состояния сессии для чтения снаружи
 */
struct SessionSnapshot {
    SessionId session_id = 0;
    std::string remote_address;
    TimePoint connected_at{};
    TimePoint last_seen{};
    SessionState state = SessionState::Connecting;
    std::optional<Job> current_job;
    std::size_t grace_jobs = 0;
    Generation last_generation = 0;
    uint32_t rate_strikes = 0;
    uint32_t invalid_submissions = 0;
    uint64_t shares = 0;
    bool hello_received = false;
    std::string client_version;
    uint32_t threads = 0;
};

// =============================================================================
// Session Registry
// =============================================================================

class SessionRegistry {
public:
    SessionRegistry(
        const ServerConfig& server,
        const JobsConfig& jobs,
        const LimitsConfig& limits,
        TemplateStore& store,
        NonceAllocator& allocator,
        monitoring::EventHub* events = nullptr
    );

    ~SessionRegistry();

    // Запрещаем копирование
    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // =========================================================================
    // Жизненный цикл
    // =========================================================================

    /**
     * @brief Зарегистрировать сессию
     *
     * @return SessionId или CapacityLimitExceeded при превышении
     *         глобального лимита или лимита на адрес
     */
    [[nodiscard]] Result<SessionId> register_session(std::string_view remote_address);

    /**
     * @brief Выдать сессии новое задание
     *
     * Предыдущее задание того же поколения освобождает свой срез;
     * задание вытесненного поколения переходит в grace список.
     *
     * @return Job или CapacityNoTemplate, CapacityNonceExhausted,
     *         TransportUnknownSession, TransportSessionClosed
     */
    [[nodiscard]] Result<Job> assign_job(SessionId session_id);

    /**
     * @brief Закрыть сессию
     *
     * Синхронно освобождает срезы и удаляет сессию. Идемпотентно.
     *
     * @return true если сессия закрыта этим вызовом
     */
    bool close(SessionId session_id, CloseReason reason);

    /**
     * @brief Закрыть все сессии
     */
    std::vector<SessionId> close_all(CloseReason reason);

    // =========================================================================
    // Сообщения
    // =========================================================================

    /**
     * @brief Записать приветствие воркера
     *
     * Повторное приветствие перезаписывает данные.
     *
     * @return TransportUnknownSession, TransportSessionClosed
     */
    [[nodiscard]] Result<void> record_hello(SessionId session_id, std::string_view client_version,
                                            uint32_t threads);

    /**
     * @brief Обновить last_seen
     */
    void touch(SessionId session_id, TimePoint now);

    /**
     * @brief Проверить сообщение лимитером
     *
     * Обновляет last_seen и состояние Active/RateLimited.
     */
    [[nodiscard]] Result<Verdict> admit(SessionId session_id, MessageKind kind, TimePoint now);

    /**
     * @brief Учесть принятый share в окне shares/minute
     *
     * Засчитывает и работу уровня сети по вытесненному поколению.
     */
    [[nodiscard]] Result<Verdict> record_share(SessionId session_id, TimePoint now);

    /**
     * @brief Учесть отклонённую отправку
     *
     * @return true если превышен max_invalid_submissions
     */
    [[nodiscard]] bool record_rejection(SessionId session_id);

    /**
     * @brief Найти задание сессии (текущее или из grace списка)
     */
    [[nodiscard]] std::optional<Job> find_job(SessionId session_id, JobId job_id) const;

    // =========================================================================
    // Обслуживание
    // =========================================================================

    /**
     * @brief Закрыть сессии без сообщений дольше idle_timeout
     *
     * @return Закрытые сессии
     */
    std::vector<SessionId> sweep_idle(TimePoint now);

    /**
     * @brief Снять задания с истёкшим ttl и вытесненные вне grace окна
     *
     * @return Сессии, у которых истекло текущее задание
     */
    std::vector<SessionId> expire_jobs(TimePoint now);

    // =========================================================================
    // Статистика
    // =========================================================================

    [[nodiscard]] std::optional<SessionSnapshot> snapshot(SessionId session_id) const;

    [[nodiscard]] std::size_t active_count() const;

    [[nodiscard]] std::size_t count_for_address(std::string_view remote_address) const;

    [[nodiscard]] std::vector<SessionId> session_ids() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xmrweb::mining
