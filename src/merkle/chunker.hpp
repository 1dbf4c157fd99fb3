/**
 * @file chunker.hpp
 * @brief Разбиение данных на chunks фиксированного размера
 *
 * Правила разбиения:
 * 1. Данные режутся на куски по MAX_CHUNK_SIZE (256 KiB)
 * 2. Если последний кусок меньше MIN_CHUNK_SIZE (32 KiB) и кусков больше
 *    одного, два последних склеиваются и делятся пополам (первая половина
 *    на байт длиннее при нечётной сумме)
 * 3. Если последний кусок ровно MAX_CHUNK_SIZE, добавляется пустой chunk
 *
 * Листовой id: hash_all(data_hash, note(max_byte_range)).
 */

#pragma once

#include "node.hpp"

#include <vector>

namespace weavekit::merkle {

/**
 * @brief Разбить данные на chunks
 *
 * @param data Непустые данные
 * @return Result<std::vector<Chunk>> Chunks в порядке байт или ChunkEmptyInput
 */
[[nodiscard]] Result<std::vector<Chunk>> split(ByteSpan data);

/**
 * @brief Вычислить id листа
 */
[[nodiscard]] Hash256 leaf_id(const Hash256& data_hash, uint64_t max_byte_range) noexcept;

/**
 * @brief Построить листья Merkle дерева из chunks
 *
 * @param chunks Chunks в порядке байт
 * @return Листовые узлы в том же порядке
 */
[[nodiscard]] std::vector<Node> generate_leaves(const std::vector<Chunk>& chunks);

} // namespace weavekit::merkle
