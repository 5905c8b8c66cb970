/**
 * @file nonce_allocator.hpp
 * @brief Распределение зарезервированной области шаблона между заданиями
 *
 * Для каждого живого поколения шаблона хранится отдельный пул:
 * - курсор нарезки свежих срезов [cursor, cursor + width)
 * - free-list возвращённых срезов (LIFO)
 * - множество выданных срезов (start -> end)
 *
 * Гарантии:
 * - два живых задания одного поколения никогда не получают пересекающиеся срезы
 * - сумма (выдано + свободно + не нарезано) всегда равна размеру области
 * - срез возвращается только в своё поколение; срезы закрытых и
 *   удалённых поколений отбрасываются
 *
 * Блокировки: мьютекс карты поколений держится только на время поиска,
 * каждый пул защищён собственным мьютексом.
 */

#pragma once

#include "job.hpp"

#include <cstdint>
#include <memory>

namespace xmrweb::mining {

/**
 * @brief Параметры нарезки
 */
struct NonceAllocatorConfig {
    /// @brief Ширина среза (байт зарезервированной области)
    uint32_t slice_width = 1;

    /// @brief Нижняя граница ширины при сжатии
    uint32_t min_slice_width = 1;

    /// @brief Уменьшить ширину вдвое при первом исчерпании поколения
    bool shrink_on_pressure = true;
};

/**
 * @brief Снимок состояния пула поколения
 */
struct PoolStats {
    uint32_t region_size = 0;
    uint32_t slice_width = 0;
    uint64_t issued_width = 0;   ///< Суммарная ширина выданных срезов
    uint64_t free_width = 0;     ///< Суммарная ширина free-list
    uint64_t uncarved_width = 0; ///< Ещё не нарезанный остаток
    std::size_t live_count = 0;
    bool shrunk = false;
    bool closed = false;
};

/**
 * @brief Аллокатор срезов зарезервированной области
 */
class NonceAllocator {
public:
    explicit NonceAllocator(const NonceAllocatorConfig& config);

    ~NonceAllocator();

    // Запрещаем копирование
    NonceAllocator(const NonceAllocator&) = delete;
    NonceAllocator& operator=(const NonceAllocator&) = delete;

    // =========================================================================
    // Поколения
    // =========================================================================

    /**
     * @brief Создать пул для нового поколения
     *
     * @param generation Поколение шаблона
     * @param region_start Смещение зарезервированной области в blob
     * @param region_size Размер области (байт)
     * @return Ошибка ConfigInvalidValue для пустой области или повторного поколения
     */
    [[nodiscard]] Result<void> open_generation(
        Generation generation,
        uint32_t region_start,
        uint32_t region_size
    );

    /**
     * @brief Запретить новые выдачи из поколения
     *
     * Выданные срезы остаются учтёнными до retire.
     */
    void close_generation(Generation generation);

    /**
     * @brief Удалить пулы всех поколений строго меньше заданного
     *
     * @return Количество удалённых пулов
     */
    std::size_t retire_before(Generation generation);

    /**
     * @brief Удалить пул одного поколения
     */
    bool retire(Generation generation);

    // =========================================================================
    // Выдача и возврат
    // =========================================================================

    /**
     * @brief Выдать срез для поколения
     *
     * @return NonceRange, CapacityNonceExhausted если свободных срезов нет,
     *         CapacityNoTemplate если поколение неизвестно,
     *         MiningStaleJob если поколение закрыто
     */
    [[nodiscard]] Result<NonceRange> allocate(Generation generation);

    /**
     * @brief Вернуть срез в его поколение
     *
     * Принимается только точное совпадение с выданным срезом.
     *
     * @return true если срез был выдан и теперь освобождён
     */
    bool release(Generation generation, const NonceRange& range);

    // =========================================================================
    // Статистика
    // =========================================================================

    [[nodiscard]] bool has_generation(Generation generation) const;

    [[nodiscard]] PoolStats stats(Generation generation) const;

    [[nodiscard]] std::size_t live_count(Generation generation) const;

    [[nodiscard]] uint32_t slice_width(Generation generation) const;

    /// @brief Количество живых пулов
    [[nodiscard]] std::size_t generation_count() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace xmrweb::mining
