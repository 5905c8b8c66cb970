/**
 * @file template_store.hpp
 * @brief Кеш текущего шаблона блока monerod
 *
 * Template Store:
 * - периодически запрашивает get_block_template
 * - публикует новое поколение только при смене height или prev_hash
 * - хранит снимок как неизменяемый shared_ptr, заменяемый атомарно
 * - открывает пул аллокатора для нового поколения и закрывает старый
 * - после grace окна удаляет пулы вытесненных поколений
 * - после degraded_after_failures подряд неудачных запросов переходит
 *   в degraded и запрещает выдачу новых заданий
 *
 * current() никогда не блокируется на сетевом вводе-выводе.
 */

#pragma once

#include "job.hpp"
#include "nonce_allocator.hpp"
#include "../core/config.hpp"
#include "../monero/daemon_client.hpp"
#include "../monitoring/events.hpp"

#include <functional>
#include <memory>
#include <optional>

namespace xmrweb::mining {

/**
 * @brief Callback публикации нового поколения
 *
 * Вызывается в потоке, выполнившем refresh.
 */
using PublishCallback = std::function<void(const TemplatePtr& published)>;

class TemplateStore {
public:
    /**
     * @brief Создать store
     *
     * @param daemon Клиент monerod
     * @param allocator Аллокатор срезов (пулы поколений)
     * @param monerod Секция [monerod]
     * @param jobs Секция [jobs]
     * @param events Получатель событий (может быть nullptr)
     */
    TemplateStore(
        monero::IDaemonClient& daemon,
        NonceAllocator& allocator,
        const MonerodConfig& monerod,
        const JobsConfig& jobs,
        monitoring::EventHub* events = nullptr
    );

    ~TemplateStore();

    // Запрещаем копирование
    TemplateStore(const TemplateStore&) = delete;
    TemplateStore& operator=(const TemplateStore&) = delete;

    // =========================================================================
    // Снимок
    // =========================================================================

    /**
     * @brief Текущий снимок (nullptr до первого успешного запроса)
     */
    [[nodiscard]] TemplatePtr current() const;

    /**
     * @brief Синхронно запросить шаблон у демона
     *
     * При ошибке предыдущий снимок остаётся в силе.
     *
     * @return Актуальный снимок (новый или прежний) или ошибка RPC
     */
    [[nodiscard]] Result<TemplatePtr> refresh();

    // =========================================================================
    // Состояние
    // =========================================================================

    /**
     * @brief Разрешена ли выдача новых заданий
     *
     * false до первого шаблона и в состоянии degraded.
     */
    [[nodiscard]] bool issuance_allowed() const;

    [[nodiscard]] bool degraded() const noexcept;

    [[nodiscard]] uint32_t consecutive_failures() const noexcept;

    /**
     * @brief Когда поколение было вытеснено
     *
     * nullopt для текущего поколения и для поколений старше истории.
     */
    [[nodiscard]] std::optional<TimePoint> superseded_at(Generation generation) const;

    /**
     * @brief Поколение текущее или вытеснено не дольше grace окна
     */
    [[nodiscard]] bool within_grace(Generation generation, TimePoint now) const;

    /**
     * @brief Удалить пулы поколений, вытесненных дольше grace окна
     *
     * @return Количество удалённых пулов
     */
    std::size_t retire_expired(TimePoint now);

    void set_publish_callback(PublishCallback callback);

    // =========================================================================
    // Фоновое обновление
    // =========================================================================

    /**
     * @brief Запустить периодическое обновление
     */
    void start();

    /**
     * @brief Остановить периодическое обновление
     */
    void stop();

    /**
     * @brief Разбудить фоновый поток для немедленного обновления
     */
    void request_refresh();

    [[nodiscard]] bool is_running() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xmrweb::mining
