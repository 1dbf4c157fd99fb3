/**
 * @file chunker.cpp
 * @brief Реализация разбиения данных на chunks
 */

#include "chunker.hpp"
#include "../crypto/sha256.hpp"

#include <algorithm>

namespace weavekit::merkle {

namespace {

/**
 * @brief Вычислить размеры chunks для данных длины total
 */
std::vector<std::size_t> chunk_sizes(std::size_t total) {
    std::vector<std::size_t> sizes;
    sizes.reserve(total / constants::MAX_CHUNK_SIZE + 2);

    std::size_t rest = total;
    while (rest > 0) {
        const std::size_t size = std::min(rest, constants::MAX_CHUNK_SIZE);
        sizes.push_back(size);
        rest -= size;
    }

    // Маленький хвост: склеиваем два последних и делим пополам с округлением вверх
    if (sizes.size() > 1 && sizes.back() < constants::MIN_CHUNK_SIZE) {
        const std::size_t merged = sizes[sizes.size() - 2] + sizes.back();
        const std::size_t first = merged / 2 + merged % 2;
        sizes[sizes.size() - 2] = first;
        sizes.back() = merged - first;
    }

    if (sizes.back() == constants::MAX_CHUNK_SIZE) {
        sizes.push_back(0);
    }

    return sizes;
}

} // anonymous namespace

Hash256 leaf_id(const Hash256& data_hash, uint64_t max_byte_range) noexcept {
    const Note note = to_note(max_byte_range);
    return crypto::hash_all({data_hash, note});
}

Result<std::vector<Chunk>> split(ByteSpan data) {
    if (data.empty()) {
        return Err<std::vector<Chunk>>(ErrorCode::ChunkEmptyInput);
    }

    const auto sizes = chunk_sizes(data.size());

    std::vector<Chunk> chunks;
    chunks.reserve(sizes.size());

    uint64_t cursor = 0;
    for (std::size_t size : sizes) {
        Chunk chunk;
        auto bytes = data.subspan(static_cast<std::size_t>(cursor), size);
        chunk.data.assign(bytes.begin(), bytes.end());
        chunk.min_byte_range = cursor;
        chunk.max_byte_range = cursor + size;
        chunk.data_hash = crypto::sha256(bytes);
        chunks.push_back(std::move(chunk));
        cursor += size;
    }

    return chunks;
}

std::vector<Node> generate_leaves(const std::vector<Chunk>& chunks) {
    std::vector<Node> leaves;
    leaves.reserve(chunks.size());

    for (const auto& chunk : chunks) {
        Node leaf;
        leaf.id = leaf_id(chunk.data_hash, chunk.max_byte_range);
        leaf.data_hash = chunk.data_hash;
        leaf.min_byte_range = chunk.min_byte_range;
        leaf.max_byte_range = chunk.max_byte_range;
        leaves.push_back(leaf);
    }

    return leaves;
}

} // namespace weavekit::merkle
