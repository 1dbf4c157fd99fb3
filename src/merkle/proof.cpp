/**
 * @file proof.cpp
 * @brief Разбор и проверка доказательств включения
 */

#include "proof.hpp"
#include "chunker.hpp"
#include "../crypto/sha256.hpp"

#include <cstring>

namespace weavekit::merkle {

namespace {

Hash256 read_hash(const uint8_t* src) noexcept {
    Hash256 hash;
    std::memcpy(hash.data(), src, hash.size());
    return hash;
}

Hash256 branch_id(const BranchRecord& branch) noexcept {
    const Note note = to_note(branch.offset);
    return crypto::hash_all({branch.left_id, branch.right_id, note});
}

} // anonymous namespace

Result<ParsedProof> parse_proof(ByteSpan proof) {
    using constants::BRANCH_RECORD_SIZE;
    using constants::HASH_SIZE;
    using constants::LEAF_RECORD_SIZE;

    if (proof.size() < LEAF_RECORD_SIZE ||
        (proof.size() - LEAF_RECORD_SIZE) % BRANCH_RECORD_SIZE != 0) {
        return Err<ParsedProof>(
            ErrorCode::MerkleInvalidProof,
            "Некорректная длина доказательства: " + std::to_string(proof.size())
        );
    }

    const std::size_t branch_count = (proof.size() - LEAF_RECORD_SIZE) / BRANCH_RECORD_SIZE;

    ParsedProof parsed;
    parsed.branches.reserve(branch_count);

    const uint8_t* ptr = proof.data();
    for (std::size_t i = 0; i < branch_count; ++i) {
        BranchRecord branch;
        branch.left_id = read_hash(ptr);
        branch.right_id = read_hash(ptr + HASH_SIZE);
        auto offset = from_note(ptr + 2 * HASH_SIZE);
        if (!offset) {
            return Err<ParsedProof>(
                ErrorCode::MerkleInvalidProof,
                "Note ветви " + std::to_string(i) + " не помещается в 64 бита"
            );
        }
        branch.offset = *offset;
        parsed.branches.push_back(branch);
        ptr += BRANCH_RECORD_SIZE;
    }

    parsed.leaf.data_hash = read_hash(ptr);
    auto max_byte_range = from_note(ptr + HASH_SIZE);
    if (!max_byte_range) {
        return Err<ParsedProof>(ErrorCode::MerkleInvalidProof,
                                "Note листа не помещается в 64 бита");
    }
    parsed.leaf.max_byte_range = *max_byte_range;

    return parsed;
}

Result<void> validate_proof(
    const Hash256& root_id,
    const Hash256& data_hash,
    uint64_t min_byte_range,
    uint64_t max_byte_range,
    ByteSpan proof
) {
    auto parsed = parse_proof(proof);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    if (min_byte_range > max_byte_range) {
        return Err<void>(ErrorCode::MerkleInvalidProof, "Некорректный диапазон chunk");
    }
    const bool empty_chunk = min_byte_range == max_byte_range;

    Hash256 expected = root_id;
    for (std::size_t depth = 0; depth < parsed->branches.size(); ++depth) {
        const auto& branch = parsed->branches[depth];

        if (branch_id(branch) != expected) {
            return Err<void>(
                ErrorCode::MerkleInvalidProof,
                "Id ветви на глубине " + std::to_string(depth) + " не совпадает"
            );
        }

        // offset ветви - конец левого поддерева; пустой chunk в конце данных
        // лежит ровно на этой границе, но принадлежит правому поддереву
        const bool go_right = max_byte_range > branch.offset ||
                              (empty_chunk && max_byte_range == branch.offset);
        expected = go_right ? branch.right_id : branch.left_id;
    }

    if (parsed->leaf.data_hash != data_hash) {
        return Err<void>(ErrorCode::MerkleInvalidProof, "data_hash листа не совпадает с chunk");
    }
    if (parsed->leaf.max_byte_range != max_byte_range) {
        return Err<void>(ErrorCode::MerkleInvalidProof, "Note листа не совпадает с chunk");
    }
    if (leaf_id(data_hash, max_byte_range) != expected) {
        return Err<void>(ErrorCode::MerkleInvalidProof, "Id листа не совпадает");
    }

    return {};
}

Result<void> validate_chunk(const Hash256& root_id, const Chunk& chunk, const Proof& proof) {
    if (chunk.max_byte_range < chunk.min_byte_range ||
        chunk.data.size() != chunk.max_byte_range - chunk.min_byte_range) {
        return Err<void>(
            ErrorCode::MerkleInvalidProof,
            "Длина chunk " + std::to_string(chunk.data.size()) + " не совпадает с диапазоном"
        );
    }

    const Hash256 data_hash = crypto::sha256(chunk.data);
    return validate_proof(root_id, data_hash, chunk.min_byte_range,
                          chunk.max_byte_range, proof.proof);
}

} // namespace weavekit::merkle
