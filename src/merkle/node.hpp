/**
 * @file node.hpp
 * @brief Chunk, узел Merkle дерева и кодирование note
 *
 * Note - 32-байтное big-endian представление смещения, дополненное
 * нулями слева. Используется внутри хешируемых кортежей и как поле
 * фиксированной длины в бинарном формате доказательств.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"
#include "../core/byte_order.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace weavekit::merkle {

// =============================================================================
// Note
// =============================================================================

/// @brief 32-байтное big-endian число
using Note = std::array<uint8_t, constants::NOTE_SIZE>;

/**
 * @brief Закодировать смещение в note
 */
[[nodiscard]] constexpr Note to_note(uint64_t value) noexcept {
    Note note{};
    write_be64(note.data() + constants::NOTE_SIZE - sizeof(uint64_t), value);
    return note;
}

/**
 * @brief Декодировать note
 *
 * Значения, не помещающиеся в 64 бита (ненулевые старшие 24 байта),
 * не могут быть смещением и отвергаются.
 *
 * @param note Ровно NOTE_SIZE байт
 * @return std::nullopt если старшие байты не нулевые
 */
[[nodiscard]] constexpr std::optional<uint64_t> from_note(const uint8_t* note) noexcept {
    for (std::size_t i = 0; i < constants::NOTE_SIZE - sizeof(uint64_t); ++i) {
        if (note[i] != 0) {
            return std::nullopt;
        }
    }
    return read_be64(note + constants::NOTE_SIZE - sizeof(uint64_t));
}

// =============================================================================
// Chunk
// =============================================================================

/**
 * @brief Непрерывный диапазон байт исходных данных
 *
 * Создаётся один раз при разбиении и больше не меняется.
 * Диапазон полуоткрытый: [min_byte_range, max_byte_range).
 */
struct Chunk {
    /// @brief Байты chunk
    Bytes data;

    /// @brief Смещение первого байта
    uint64_t min_byte_range{0};

    /// @brief Смещение за последним байтом
    uint64_t max_byte_range{0};

    /// @brief SHA256(data)
    Hash256 data_hash{};

    [[nodiscard]] uint64_t size() const noexcept { return max_byte_range - min_byte_range; }
    [[nodiscard]] bool empty() const noexcept { return max_byte_range == min_byte_range; }
};

// =============================================================================
// Node
// =============================================================================

/// @brief Индекс узла в арене MerkleTree
using NodeHandle = std::size_t;

/**
 * @brief Узел Merkle дерева
 *
 * Лист: есть data_hash, нет детей.
 * Ветвь: нет data_hash, ровно два ребёнка.
 * Любая другая комбинация нарушает инвариант дерева.
 */
struct Node {
    Hash256 id{};
    std::optional<Hash256> data_hash;
    uint64_t min_byte_range{0};
    uint64_t max_byte_range{0};
    std::optional<NodeHandle> left;
    std::optional<NodeHandle> right;

    [[nodiscard]] bool is_leaf() const noexcept {
        return data_hash.has_value() && !left && !right;
    }

    [[nodiscard]] bool is_branch() const noexcept {
        return !data_hash.has_value() && left && right;
    }
};

} // namespace weavekit::merkle
