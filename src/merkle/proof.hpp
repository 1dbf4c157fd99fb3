/**
 * @file proof.hpp
 * @brief Доказательства включения chunk и их проверка
 *
 * Бинарный формат доказательства (все поля фиксированной длины):
 * @code
 * (left_id[32] || right_id[32] || note[32]) * k   -- ветви от корня к листу
 * data_hash[32] || note[32]                       -- лист
 * @endcode
 *
 * Проверка - граница доверия для любого chunk, полученного из сети:
 * всё, что не пересчитано из байт, считается недостоверным.
 */

#pragma once

#include "node.hpp"

#include <vector>

namespace weavekit::merkle {

/**
 * @brief Доказательство включения одного листа
 */
struct Proof {
    /// @brief Смещение последнего байта chunk (max_byte_range - 1)
    uint64_t offset{0};

    /// @brief Сериализованные записи ветвей и листа
    Bytes proof;

    [[nodiscard]] bool operator==(const Proof& other) const noexcept = default;
};

/**
 * @brief Запись ветви из доказательства
 */
struct BranchRecord {
    Hash256 left_id{};
    Hash256 right_id{};
    /// @brief max_byte_range левого ребёнка
    uint64_t offset{0};
};

/**
 * @brief Запись листа из доказательства
 */
struct LeafRecord {
    Hash256 data_hash{};
    uint64_t max_byte_range{0};
};

/**
 * @brief Разобранное доказательство
 */
struct ParsedProof {
    std::vector<BranchRecord> branches;
    LeafRecord leaf;
};

/**
 * @brief Ожидаемая длина доказательства с заданным количеством ветвей
 */
[[nodiscard]] constexpr std::size_t proof_size(std::size_t branches) noexcept {
    return branches * constants::BRANCH_RECORD_SIZE + constants::LEAF_RECORD_SIZE;
}

/**
 * @brief Разобрать бинарное доказательство
 *
 * @return ParsedProof или MerkleInvalidProof при неверной длине или note
 */
[[nodiscard]] Result<ParsedProof> parse_proof(ByteSpan proof);

/**
 * @brief Проверить доказательство по хешу данных
 *
 * Проходит записи ветвей от корня: пересчитывает id ветви и сравнивает с
 * ожидаемым, затем спускается вправо если max_byte_range > offset ветви
 * (пустой chunk на границе тоже уходит вправо), иначе влево. На листе
 * пересчитывает id из data_hash и max_byte_range.
 *
 * @param root_id Ожидаемый data root
 * @param data_hash SHA256 данных chunk
 * @param min_byte_range Начало chunk
 * @param max_byte_range Конец chunk
 * @param proof Бинарное доказательство
 * @return Успех или MerkleInvalidProof
 */
[[nodiscard]] Result<void> validate_proof(
    const Hash256& root_id,
    const Hash256& data_hash,
    uint64_t min_byte_range,
    uint64_t max_byte_range,
    ByteSpan proof
);

/**
 * @brief Проверить chunk по доказательству
 *
 * data_hash пересчитывается из байт chunk, сохранённому значению не
 * доверяем. Длина байт должна совпадать с диапазоном.
 */
[[nodiscard]] Result<void> validate_chunk(
    const Hash256& root_id,
    const Chunk& chunk,
    const Proof& proof
);

} // namespace weavekit::merkle
