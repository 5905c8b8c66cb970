/**
 * @file pow_verifier.hpp
 * @brief Интерфейс вычисления хеша proof-of-work
 *
 * Координатор не хеширует RandomX сам. Хеш кандидата вычисляет
 * внешний примитив, подключаемый через IPowVerifier.
 */

#pragma once

#include "job.hpp"

namespace xmrweb::mining {

/**
 * @brief Примитив вычисления хеша
 */
class IPowVerifier {
public:
    virtual ~IPowVerifier() = default;

    /**
     * @brief Вычислить хеш кандидата
     *
     * @param job Задание (шаблон, seed_hash, диапазон)
     * @param candidate Кандидат воркера с полным blob и nonce заголовка
     * @return Хеш или ошибка MiningMalformedCandidate
     */
    [[nodiscard]] virtual Result<Hash256> compute(const Job& job, const Candidate& candidate) = 0;

    /// @brief Имя для логов
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/**
 * @brief Доверяет хешу, присланному воркером
 *
 * Подходит, когда monerod отвергает неверный блок сам, а неверные
 * shares ничего не стоят. Для проверки RandomX подключается своя реализация.
 */
class ReportedHashVerifier final : public IPowVerifier {
public:
    [[nodiscard]] Result<Hash256> compute(const Job& job, const Candidate& candidate) override;

    [[nodiscard]] std::string_view name() const noexcept override {
        return "reported-hash";
    }
};

} // namespace xmrweb::mining
