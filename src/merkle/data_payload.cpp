/**
 * @file data_payload.cpp
 * @brief Реализация подготовки данных
 */

#include "data_payload.hpp"
#include "chunker.hpp"
#include "merkle_tree.hpp"

namespace weavekit::merkle {

std::vector<ChunkEnvelope> PreparedData::envelopes() const {
    std::vector<ChunkEnvelope> result;
    result.reserve(chunks.size());

    for (std::size_t i = 0; i < chunks.size() && i < proofs.size(); ++i) {
        ChunkEnvelope envelope;
        envelope.data_root = data_root;
        envelope.data_size = data_size;
        envelope.data_path = proofs[i].proof;
        envelope.offset = proofs[i].offset;
        envelope.chunk = chunks[i].data;
        result.push_back(std::move(envelope));
    }

    return result;
}

Result<PreparedData> prepare_data(ByteSpan data) {
    PreparedData prepared;
    prepared.data_size = data.size();

    if (data.empty()) {
        return prepared;
    }

    auto chunks = split(data);
    if (!chunks) {
        return std::unexpected(chunks.error());
    }

    auto tree = MerkleTree::build(generate_leaves(*chunks));
    if (!tree) {
        return std::unexpected(tree.error());
    }

    auto proofs = tree->resolve_proofs();
    if (!proofs) {
        return std::unexpected(proofs.error());
    }

    prepared.data_root = tree->root_id();
    prepared.chunks = std::move(*chunks);
    prepared.proofs = std::move(*proofs);

    return prepared;
}

} // namespace weavekit::merkle
