/**
 * @file daemon_client.hpp
 * @brief Интерфейс клиента monerod
 *
 * Координатор обращается к демону только через IDaemonClient:
 * production реализация - RpcClient (libcurl), в тестах - mock демон.
 */

#pragma once

#include "../core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace xmrweb::monero {

// =============================================================================
// Структуры данных RPC
// =============================================================================

/**
 * @brief Ответ get_block_template
 *
 * Blob-ы и хеши хранятся в hex, как их вернул демон.
 */
struct BlockTemplateResponse {
    std::string blocktemplate_blob;   ///< Полный blob блока (hex)
    std::string blockhashing_blob;    ///< Blob для хеширования (hex)
    uint64_t difficulty = 0;          ///< Сложность сети
    uint64_t expected_reward = 0;     ///< Награда (атомарные единицы)
    uint64_t height = 0;              ///< Высота блока
    std::string prev_hash;            ///< Хеш предыдущего блока (hex)
    uint32_t reserved_offset = 0;     ///< Смещение зарезервированной области
    std::string seed_hash;            ///< RandomX seed (hex)
    std::string status;               ///< "OK" при успехе
};

/**
 * @brief Ответ submit_block
 *
 * Отказ демона принять блок - не ошибка транспорта, а результат.
 */
struct SubmitReply {
    bool accepted = false;
    std::string reason;               ///< Причина отказа или статус
};

/**
 * @brief Ответ get_info
 */
struct DaemonInfo {
    uint64_t height = 0;
    std::string top_block_hash;
    std::string status;
    std::string version;
    bool synchronized = false;
};

// =============================================================================
// Интерфейс демона
// =============================================================================

/**
 * @brief Синхронный клиент monerod
 *
 * Все методы блокируют вызывающий поток на время RPC.
 * Ошибки RPC (группа 300-399) означают, что ответ демона не получен
 * или не разобран.
 */
class IDaemonClient {
public:
    virtual ~IDaemonClient() = default;

    /**
     * @brief Получить шаблон блока
     *
     * @param wallet_address Адрес для награды
     * @param reserve_size Размер зарезервированной области (байт)
     */
    [[nodiscard]] virtual Result<BlockTemplateResponse> get_block_template(
        std::string_view wallet_address,
        uint32_t reserve_size
    ) = 0;

    /**
     * @brief Отправить блок
     *
     * @param blob_hex Полный blob блока в hex
     * @return SubmitReply (accepted или отказ) либо ошибка RPC
     */
    [[nodiscard]] virtual Result<SubmitReply> submit_block(std::string_view blob_hex) = 0;

    /**
     * @brief Получить состояние демона
     */
    [[nodiscard]] virtual Result<DaemonInfo> get_info() = 0;
};

} // namespace xmrweb::monero
