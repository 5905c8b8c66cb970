/**
 * @file rpc_client.hpp
 * @brief HTTP клиент для monerod JSON-RPC
 *
 * Использует libcurl для HTTP POST запросов на <rpc_url>/json_rpc.
 *
 * Поддерживаемые методы:
 * - get_block_template: получение шаблона блока для майнинга
 * - submit_block: отправка найденного блока
 * - get_info: состояние демона
 */

#pragma once

#include "daemon_client.hpp"
#include "../core/config.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace xmrweb::monero {

// =============================================================================
// Разбор ответов
// =============================================================================

/**
 * @brief Разобрать ответ get_block_template
 *
 * @param response Тело HTTP ответа (JSON-RPC 2.0)
 * @return Шаблон, RpcDaemonError для объекта error, RpcBusy для статуса BUSY
 *         или RpcParseError
 */
[[nodiscard]] Result<BlockTemplateResponse> parse_block_template_response(
    const std::string& response
);

/**
 * @brief Разобрать ответ submit_block
 *
 * Объект error в ответе означает отказ демона принять блок
 * (accepted = false), а не ошибку RPC.
 */
[[nodiscard]] Result<SubmitReply> parse_submit_response(const std::string& response);

/**
 * @brief Разобрать ответ get_info
 */
[[nodiscard]] Result<DaemonInfo> parse_info_response(const std::string& response);

namespace json {

/**
 * @brief Простой парсер JSON для извлечения значения по ключу
 *
 * Минималистичный парсер, не использует внешние библиотеки.
 * Возвращает строку без кавычек, вложенный объект/массив целиком
 * или литерал (число, bool, null). Пустая строка - ключ не найден.
 */
[[nodiscard]] std::string extract_string(const std::string& json, std::string_view key);

/**
 * @brief Извлечь беззнаковое целое по ключу
 */
[[nodiscard]] std::optional<uint64_t> extract_uint(const std::string& json, std::string_view key);

/**
 * @brief Извлечь bool по ключу
 */
[[nodiscard]] bool extract_bool(const std::string& json, std::string_view key);

} // namespace json

// =============================================================================
// RPC Client
// =============================================================================

/**
 * @brief JSON-RPC клиент monerod
 *
 * Один CURL handle защищён мьютексом: Template Store и Block Forwarder
 * могут вызывать клиент из разных потоков.
 */
class RpcClient : public IDaemonClient {
public:
    /**
     * @brief Создать клиент с конфигурацией
     *
     * @param config Секция [monerod]
     */
    explicit RpcClient(const MonerodConfig& config);

    ~RpcClient() override;

    // Запрещаем копирование
    RpcClient(const RpcClient&) = delete;
    RpcClient& operator=(const RpcClient&) = delete;

    [[nodiscard]] Result<BlockTemplateResponse> get_block_template(
        std::string_view wallet_address,
        uint32_t reserve_size
    ) override;

    [[nodiscard]] Result<SubmitReply> submit_block(std::string_view blob_hex) override;

    [[nodiscard]] Result<DaemonInfo> get_info() override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xmrweb::monero
