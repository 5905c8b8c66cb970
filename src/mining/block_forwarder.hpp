/**
 * @file block_forwarder.hpp
 * @brief Отправка найденных блоков в monerod
 *
 * Гарантирует ровно один вызов submit_block на (height, blob): blob
 * включает печать среза и nonce заголовка, поэтому ключ однозначно
 * определяет решение. Ключ резервируется до сетевого запроса, и гонка
 * двух одинаковых кандидатов даёт один вызов и один Duplicate. Отказ
 * демона или ошибка RPC освобождают ключ.
 */

#pragma once

#include "job.hpp"
#include "../core/config.hpp"
#include "../monero/daemon_client.hpp"
#include "../monitoring/events.hpp"

#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace xmrweb::mining {

// =============================================================================
// Результат отправки
// =============================================================================

/// @brief Демон принял блок
struct ForwardAccepted {
    uint64_t height = 0;
};

/// @brief Демон отклонил блок (не повторяется)
struct DaemonRejected {
    std::string reason;
};

/// @brief Кандидат уже отправлен или отправляется
struct Duplicate {
    uint64_t height = 0;
    uint32_t nonce = 0;
};

using ForwardOutcome = std::variant<ForwardAccepted, DaemonRejected, Duplicate>;

/**
 * @brief Запрос немедленного обновления шаблона
 */
using RefreshRequest = std::function<void()>;

/**
 * @brief Счётчики форвардера
 */
struct ForwarderStats {
    uint64_t forwarded = 0;
    uint64_t accepted = 0;
    uint64_t rejected = 0;
    uint64_t duplicates = 0;
    uint64_t failures = 0;
    uint64_t rpc_calls = 0;
};

// =============================================================================
// Block Forwarder
// =============================================================================

class BlockForwarder {
public:
    /**
     * @brief Создать форвардер
     *
     * @param daemon Клиент monerod
     * @param config Секция [forwarder]
     * @param refresh Запрос обновления шаблона после отправки
     * @param events Получатель событий (может быть nullptr)
     */
    BlockForwarder(
        monero::IDaemonClient& daemon,
        const ForwarderConfig& config,
        RefreshRequest refresh = {},
        monitoring::EventHub* events = nullptr
    );

    ~BlockForwarder();

    // Запрещаем копирование
    BlockForwarder(const BlockForwarder&) = delete;
    BlockForwarder& operator=(const BlockForwarder&) = delete;

    /**
     * @brief Отправить кандидата
     *
     * Транзиентные ошибки RPC повторяются до max_retries раз с
     * удвоением паузы. Если все попытки неудачны, возвращается ошибка,
     * ключ дедупликации освобождается, blob пишется в critical алерт.
     * При отказе демона ключ также освобождается.
     *
     * @return ForwardOutcome или ошибка RPC
     */
    [[nodiscard]] Result<ForwardOutcome> forward(const BlockCandidate& candidate);

    /**
     * @brief Был ли кандидат уже отправлен (в окне дедупликации)
     */
    [[nodiscard]] bool seen(const BlockCandidate& candidate) const;

    [[nodiscard]] ForwarderStats stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xmrweb::mining
