/**
 * @file rpc_client.cpp
 * @brief Реализация HTTP клиента для monerod RPC
 *
 * Использует libcurl для HTTP POST запросов.
 * JSON-RPC 2.0 протокол.
 */

#include "rpc_client.hpp"

#include <curl/curl.h>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace xmrweb::monero {

// =============================================================================
// JSON утилиты
// =============================================================================

namespace json {

std::string extract_string(const std::string& json, std::string_view key) {
    std::string search = "\"" + std::string(key) + "\":";
    auto pos = json.find(search);
    if (pos == std::string::npos) return "";

    pos += search.size();

    // Пропускаем пробелы
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;

    if (pos >= json.size()) return "";

    if (json[pos] == '"') {
        // Строковое значение
        ++pos;
        auto end = json.find('"', pos);
        if (end == std::string::npos) return "";
        return json.substr(pos, end - pos);
    } else if (json[pos] == '{' || json[pos] == '[') {
        // Объект или массив - ищем соответствующую закрывающую скобку
        char open = json[pos];
        char close = (open == '{') ? '}' : ']';
        int depth = 1;
        auto start = pos;
        ++pos;
        while (pos < json.size() && depth > 0) {
            if (json[pos] == open) ++depth;
            else if (json[pos] == close) --depth;
            else if (json[pos] == '"') {
                // Пропускаем строки
                ++pos;
                while (pos < json.size() && json[pos] != '"') {
                    if (json[pos] == '\\') ++pos;
                    ++pos;
                }
            }
            ++pos;
        }
        return json.substr(start, pos - start);
    } else {
        // Число, bool или null
        auto end = json.find_first_of(",}]", pos);
        if (end == std::string::npos) end = json.size();
        auto result = json.substr(pos, end - pos);
        while (!result.empty() && std::isspace(static_cast<unsigned char>(result.back()))) {
            result.pop_back();
        }
        return result;
    }
}

std::optional<uint64_t> extract_uint(const std::string& json, std::string_view key) {
    auto str = extract_string(json, key);
    if (str.empty() || str.front() == '-') return std::nullopt;
    try {
        std::size_t consumed = 0;
        auto value = std::stoull(str, &consumed);
        if (consumed != str.size()) return std::nullopt;
        return static_cast<uint64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

bool extract_bool(const std::string& json, std::string_view key) {
    return extract_string(json, key) == "true";
}

} // namespace json

// =============================================================================
// Разбор ответов
// =============================================================================

namespace {

/**
 * @brief Извлечь объект result или сформировать ошибку из объекта error
 */
Result<std::string> unwrap_result(const std::string& response) {
    auto error = json::extract_string(response, "error");
    if (!error.empty() && error != "null") {
        auto message = json::extract_string(error, "message");
        auto code = json::extract_string(error, "code");
        return Err<std::string>(
            ErrorCode::RpcDaemonError,
            "monerod error " + code + ": " + message
        );
    }

    auto result = json::extract_string(response, "result");
    if (result.empty() || result.front() != '{') {
        return Err<std::string>(ErrorCode::RpcParseError, "Ответ без объекта result");
    }
    return result;
}

} // anonymous namespace

Result<BlockTemplateResponse> parse_block_template_response(const std::string& response) {
    auto result = unwrap_result(response);
    if (!result) {
        return std::unexpected(result.error());
    }

    BlockTemplateResponse data;
    data.status = json::extract_string(*result, "status");
    if (data.status == "BUSY") {
        return Err<BlockTemplateResponse>(ErrorCode::RpcBusy, "monerod занят (BUSY)");
    }
    if (data.status != "OK") {
        return Err<BlockTemplateResponse>(
            ErrorCode::RpcDaemonError,
            "get_block_template статус: " + data.status
        );
    }

    data.blocktemplate_blob = json::extract_string(*result, "blocktemplate_blob");
    data.blockhashing_blob = json::extract_string(*result, "blockhashing_blob");
    data.prev_hash = json::extract_string(*result, "prev_hash");
    data.seed_hash = json::extract_string(*result, "seed_hash");

    auto difficulty = json::extract_uint(*result, "difficulty");
    auto height = json::extract_uint(*result, "height");
    auto reserved_offset = json::extract_uint(*result, "reserved_offset");

    if (data.blocktemplate_blob.empty() || !difficulty || !height || !reserved_offset) {
        return Err<BlockTemplateResponse>(
            ErrorCode::RpcParseError,
            "get_block_template: отсутствуют обязательные поля"
        );
    }

    data.difficulty = *difficulty;
    data.height = *height;
    data.reserved_offset = static_cast<uint32_t>(*reserved_offset);
    data.expected_reward = json::extract_uint(*result, "expected_reward").value_or(0);

    return data;
}

Result<SubmitReply> parse_submit_response(const std::string& response) {
    SubmitReply reply;

    auto error = json::extract_string(response, "error");
    if (!error.empty() && error != "null") {
        reply.accepted = false;
        reply.reason = json::extract_string(error, "message");
        if (reply.reason.empty()) {
            reply.reason = "rejected";
        }
        return reply;
    }

    auto result = json::extract_string(response, "result");
    if (result.empty()) {
        return Err<SubmitReply>(ErrorCode::RpcParseError, "submit_block: ответ без result");
    }

    auto status = json::extract_string(result, "status");
    if (status == "BUSY") {
        return Err<SubmitReply>(ErrorCode::RpcBusy, "monerod занят (BUSY)");
    }

    reply.accepted = (status == "OK");
    reply.reason = status;
    return reply;
}

Result<DaemonInfo> parse_info_response(const std::string& response) {
    auto result = unwrap_result(response);
    if (!result) {
        return std::unexpected(result.error());
    }

    DaemonInfo info;
    auto height = json::extract_uint(*result, "height");
    if (!height) {
        return Err<DaemonInfo>(ErrorCode::RpcParseError, "get_info: нет поля height");
    }
    info.height = *height;
    info.top_block_hash = json::extract_string(*result, "top_block_hash");
    info.status = json::extract_string(*result, "status");
    info.version = json::extract_string(*result, "version");
    info.synchronized = json::extract_bool(*result, "synchronized");

    return info;
}

// =============================================================================
// Реализация (PIMPL)
// =============================================================================

struct RpcClient::Impl {
    std::string url;
    long timeout_ms;
    CURL* curl = nullptr;
    std::mutex mutex;

    explicit Impl(const MonerodConfig& config)
        : url(config.get_json_rpc_url())
        , timeout_ms(static_cast<long>(config.rpc_timeout_ms))
    {
        curl = curl_easy_init();
        if (curl) {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
            curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
            curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        }
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }

    /**
     * @brief Callback для записи ответа
     */
    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }

    /**
     * @brief Выполнить RPC запрос
     */
    Result<std::string> call(std::string_view method, std::string_view params) {
        std::lock_guard<std::mutex> lock(mutex);

        if (!curl) {
            return Err<std::string>(ErrorCode::RpcConnectionFailed, "CURL не инициализирован");
        }

        std::string request =
            R"({"jsonrpc":"2.0","id":"0","method":")" + std::string(method) +
            R"(","params":)" + std::string(params) + "}";

        struct curl_slist* headers = nullptr;
        headers = curl_slist_append(headers, "Content-Type: application/json");

        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.size()));

        std::string response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);

        CURLcode res = curl_easy_perform(curl);
        curl_slist_free_all(headers);

        if (res == CURLE_OPERATION_TIMEDOUT) {
            return Err<std::string>(
                ErrorCode::RpcTimeout,
                "Таймаут RPC " + std::string(method) + " (" + std::to_string(timeout_ms) + " мс)"
            );
        }
        if (res != CURLE_OK) {
            return Err<std::string>(
                ErrorCode::RpcConnectionFailed,
                std::string("CURL ошибка: ") + curl_easy_strerror(res)
            );
        }

        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

        if (http_code != 200) {
            return Err<std::string>(
                ErrorCode::RpcHttpError,
                "HTTP ошибка: " + std::to_string(http_code)
            );
        }

        return response;
    }
};

// =============================================================================
// RpcClient
// =============================================================================

RpcClient::RpcClient(const MonerodConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

RpcClient::~RpcClient() = default;

Result<BlockTemplateResponse> RpcClient::get_block_template(
    std::string_view wallet_address,
    uint32_t reserve_size
) {
    std::string params =
        R"({"wallet_address":")" + std::string(wallet_address) +
        R"(","reserve_size":)" + std::to_string(reserve_size) + "}";

    auto response = impl_->call("get_block_template", params);
    if (!response) {
        return std::unexpected(response.error());
    }

    return parse_block_template_response(*response);
}

Result<SubmitReply> RpcClient::submit_block(std::string_view blob_hex) {
    std::string params = "[\"" + std::string(blob_hex) + "\"]";

    auto response = impl_->call("submit_block", params);
    if (!response) {
        return std::unexpected(response.error());
    }

    return parse_submit_response(*response);
}

Result<DaemonInfo> RpcClient::get_info() {
    auto response = impl_->call("get_info", "{}");
    if (!response) {
        return std::unexpected(response.error());
    }

    return parse_info_response(*response);
}

} // namespace xmrweb::monero
