/**
 * @file data_payload.hpp
 * @brief Подготовка данных к загрузке
 *
 * Объединяет разбиение, построение дерева и сбор доказательств:
 * результат содержит всё необходимое для выгрузки chunks на узлы.
 */

#pragma once

#include "node.hpp"
#include "proof.hpp"

#include <vector>

namespace weavekit::merkle {

/**
 * @brief Chunk вместе с доказательством в том виде, в котором он уходит в сеть
 */
struct ChunkEnvelope {
    Hash256 data_root{};
    uint64_t data_size{0};
    Bytes data_path;
    uint64_t offset{0};
    Bytes chunk;
};

/**
 * @brief Подготовленные данные
 *
 * chunks[i] и proofs[i] относятся к одному листу.
 */
struct PreparedData {
    Hash256 data_root{};
    uint64_t data_size{0};
    std::vector<Chunk> chunks;
    std::vector<Proof> proofs;

    [[nodiscard]] bool empty() const noexcept { return chunks.empty(); }

    /**
     * @brief Собрать конверты для выгрузки
     */
    [[nodiscard]] std::vector<ChunkEnvelope> envelopes() const;
};

/**
 * @brief Разбить данные, построить дерево и доказательства
 *
 * Пустые данные дают нулевой data root и ни одного chunk.
 *
 * @param data Исходные данные
 * @return PreparedData или ошибка построения дерева
 */
[[nodiscard]] Result<PreparedData> prepare_data(ByteSpan data);

} // namespace weavekit::merkle
