/**
 * @file submission_validator.hpp
 * @brief Проверка результатов, присланных воркерами
 *
 * Порядок проверок:
 * 1. Задание принадлежит сессии (иначе UnknownJob)
 * 2. Задание не истекло и его поколение в grace окне (иначе Stale)
 * 3. Присланный blob: координата первого ненулевого байта
 *    зарезервированной области лежит в срезе задания, blob совпадает с
 *    blob задания везде, кроме nonce заголовка (иначе OutOfRange; при
 *    неверной длине или чужом nonce Malformed). Без blob он
 *    восстанавливается из blob задания и nonce.
 * 4. Хеш удовлетворяет share target (иначе InvalidProof)
 * 5. Хеш удовлетворяет сетевому target: AcceptedBlock для текущего
 *    поколения, Stale для вытесненного
 */

#pragma once

#include "job.hpp"
#include "pow_verifier.hpp"
#include "session_registry.hpp"
#include "template_store.hpp"
#include "../monitoring/events.hpp"

#include <memory>

namespace xmrweb::mining {

/**
 * @brief Счётчики валидатора
 */
struct ValidatorStats {
    uint64_t submitted = 0;
    uint64_t accepted = 0;
    uint64_t blocks = 0;
    uint64_t stale = 0;
    uint64_t rejected = 0;
    uint64_t verifier_calls = 0;
};

class SubmissionValidator {
public:
    /**
     * @brief Создать валидатор
     *
     * @param registry Реестр сессий (поиск заданий)
     * @param store Template Store (grace окно и текущее поколение)
     * @param verifier Примитив вычисления хеша
     * @param events Получатель событий (может быть nullptr)
     */
    SubmissionValidator(
        SessionRegistry& registry,
        TemplateStore& store,
        IPowVerifier& verifier,
        monitoring::EventHub* events = nullptr
    );

    ~SubmissionValidator();

    // Запрещаем копирование
    SubmissionValidator(const SubmissionValidator&) = delete;
    SubmissionValidator& operator=(const SubmissionValidator&) = delete;

    /**
     * @brief Проверить кандидата
     *
     * Не изменяет счётчики сессии: учёт shares и отклонений выполняет
     * вызывающая сторона.
     */
    [[nodiscard]] SubmissionResult validate(
        SessionId session_id,
        const Candidate& candidate,
        TimePoint now
    );

    [[nodiscard]] SubmissionResult validate(SessionId session_id, const Candidate& candidate) {
        return validate(session_id, candidate, Clock::now());
    }

    [[nodiscard]] ValidatorStats stats() const;

    void reset_stats();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * @brief Совпадает ли blob с blob задания вне nonce заголовка
 *
 * Печать среза входит в сравнение, поэтому blob с чужой или
 * изменённой печатью не совпадает.
 */
[[nodiscard]] bool matches_job_blob(const Bytes& job_blob, const Bytes& blob) noexcept;

} // namespace xmrweb::mining
