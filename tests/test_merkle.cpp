/**
 * @file test_merkle.cpp
 * @brief Тесты построения Merkle дерева и сбора доказательств
 *
 * Эталонные корни вычислены для данных make_fixture(size).
 */

#include <gtest/gtest.h>
#include <vector>

#include "merkle/chunker.hpp"
#include "merkle/data_payload.hpp"
#include "merkle/merkle_tree.hpp"
#include "core/encoding.hpp"
#include "crypto/sha256.hpp"
#include "test_helpers.hpp"

namespace weavekit::tests {

using merkle::MerkleTree;

class MerkleTreeTest : public ::testing::Test {
protected:
    static MerkleTree build_tree(ByteSpan data) {
        auto chunks = merkle::split(data);
        EXPECT_TRUE(chunks.has_value());
        auto tree = MerkleTree::build(merkle::generate_leaves(*chunks));
        EXPECT_TRUE(tree.has_value());
        return std::move(*tree);
    }

    static std::vector<std::size_t> proof_lengths(const std::vector<merkle::Proof>& proofs) {
        std::vector<std::size_t> lengths;
        for (const auto& proof : proofs) {
            lengths.push_back(proof.proof.size());
        }
        return lengths;
    }

    static constexpr std::size_t MAX = constants::MAX_CHUNK_SIZE;
};

/**
 * @brief Тест: эталонный корень для 1 000 000 байт
 */
TEST_F(MerkleTreeTest, GoldenRootOneMegabyte) {
    const auto data = make_fixture(1'000'000);
    auto tree = build_tree(data);

    EXPECT_EQ(tree.leaf_count(), 4u);
    EXPECT_EQ(tree.root_id(), hash_from_hex(
        "ba5775248f1cea8b4c82c7268f93fa0eb3aedd36a3e87fc794734a456c3423b0"));
    EXPECT_EQ(tree.root().min_byte_range, 0u);
    EXPECT_EQ(tree.root().max_byte_range, 1'000'000u);
}

/**
 * @brief Тест: эталонные корни на границах разбиения
 */
TEST_F(MerkleTreeTest, GoldenRootsAtBoundaries) {
    EXPECT_EQ(build_tree(make_fixture(4 * MAX)).root_id(), hash_from_hex(
        "bc4923809198a1a24e852b79fe0f09cb7189653c351fb92e727601c11abdf515"));
    EXPECT_EQ(build_tree(make_fixture(2 * MAX + 100)).root_id(), hash_from_hex(
        "aa80868df93f87e51f5acf07d325590fb39158ff161234ba5e826dda564ee4f4"));
    EXPECT_EQ(build_tree(make_fixture(MAX)).root_id(), hash_from_hex(
        "569c3cadd9da27e9da4b1c38ba05343da35ad646d5601279277b670e8dca3158"));
}

/**
 * @brief Тест: корень нулевых данных совпадает с эталонным клиентом
 */
TEST_F(MerkleTreeTest, ZeroFilledRoot) {
    const Bytes zeros(MAX + 1, 0);
    auto tree = build_tree(zeros);

    EXPECT_EQ(encoding::base64url_encode(tree.root_id()),
              "br1Vtl3TS_NGWdHmYqBh3-MxrlckoluHCZGmUZk-dJc");
}

/**
 * @brief Тест: корень одного листа - сам лист
 */
TEST_F(MerkleTreeTest, SingleLeafRoot) {
    const auto data = make_fixture(100);
    auto tree = build_tree(data);

    EXPECT_EQ(tree.leaf_count(), 1u);
    EXPECT_EQ(tree.node_count(), 1u);
    EXPECT_TRUE(tree.root().is_leaf());
    EXPECT_EQ(tree.root_id(), merkle::leaf_id(crypto::sha256(data), 100));
}

/**
 * @brief Тест: непарный узел поднимается без изменений
 */
TEST_F(MerkleTreeTest, OddNodePromoted) {
    const auto data = make_fixture(2 * MAX + 100);
    auto chunks = merkle::split(data);
    ASSERT_TRUE(chunks.has_value());
    const auto leaves = merkle::generate_leaves(*chunks);

    auto tree = MerkleTree::build(leaves);
    ASSERT_TRUE(tree.has_value());

    // 3 листа + 1 ветвь нижнего слоя + корень
    EXPECT_EQ(tree->node_count(), 5u);

    const auto& root = tree->root();
    ASSERT_TRUE(root.is_branch());
    EXPECT_EQ(tree->node(*root.right).id, leaves[2].id);

    const auto& left = tree->node(*root.left);
    const auto expected_left = crypto::hash_all(
        {leaves[0].id, leaves[1].id, merkle::to_note(leaves[0].max_byte_range)});
    EXPECT_EQ(left.id, expected_left);
    EXPECT_EQ(left.min_byte_range, 0u);
    EXPECT_EQ(left.max_byte_range, leaves[1].max_byte_range);
}

/**
 * @brief Тест: пустой список листьев
 */
TEST_F(MerkleTreeTest, EmptyTree) {
    auto tree = MerkleTree::build({});
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, ErrorCode::MerkleEmptyTree);
}

/**
 * @brief Тест: узел без data_hash вместо листа
 */
TEST_F(MerkleTreeTest, RejectsMalformedLeaf) {
    merkle::Node broken;
    broken.max_byte_range = 10;

    auto tree = MerkleTree::build({broken});
    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, ErrorCode::MerkleInvalidNode);
}

/**
 * @brief Тест: длины и смещения доказательств
 */
TEST_F(MerkleTreeTest, ProofLayout) {
    auto tree = build_tree(make_fixture(1'000'000));
    auto proofs = tree.resolve_proofs();
    ASSERT_TRUE(proofs.has_value());

    EXPECT_EQ(proof_lengths(*proofs), (std::vector<std::size_t>{256, 256, 256, 256}));

    std::vector<uint64_t> offsets;
    for (const auto& proof : *proofs) {
        offsets.push_back(proof.offset);
    }
    EXPECT_EQ(offsets, (std::vector<uint64_t>{262143, 524287, 786431, 999999}));
}

/**
 * @brief Тест: пустой последний chunk получает собственное доказательство
 */
TEST_F(MerkleTreeTest, ProofsWithEmptyChunk) {
    auto tree = build_tree(make_fixture(4 * MAX));
    auto proofs = tree.resolve_proofs();
    ASSERT_TRUE(proofs.has_value());

    EXPECT_EQ(proof_lengths(*proofs), (std::vector<std::size_t>{352, 352, 352, 352, 160}));
    EXPECT_EQ((*proofs)[3].offset, 4 * MAX - 1);
    EXPECT_EQ((*proofs)[4].offset, 4 * MAX - 1);
}

/**
 * @brief Тест: доказательство одного chunk - одна запись листа
 */
TEST_F(MerkleTreeTest, SingleChunkProofIsLeafRecord) {
    const auto data = make_fixture(100);
    auto tree = build_tree(data);
    auto proofs = tree.resolve_proofs();
    ASSERT_TRUE(proofs.has_value());
    ASSERT_EQ(proofs->size(), 1u);

    const auto& proof = proofs->front();
    EXPECT_EQ(proof.offset, 99u);
    ASSERT_EQ(proof.proof.size(), constants::LEAF_RECORD_SIZE);

    const auto data_hash = crypto::sha256(data);
    EXPECT_TRUE(std::equal(data_hash.begin(), data_hash.end(), proof.proof.begin()));
    EXPECT_EQ(proof.proof.back(), 100);
}

/**
 * @brief Тест: записи ветвей идут от корня
 */
TEST_F(MerkleTreeTest, ProofStartsAtRoot) {
    auto tree = build_tree(make_fixture(1'000'000));
    auto proofs = tree.resolve_proofs();
    ASSERT_TRUE(proofs.has_value());

    const auto& root = tree.root();
    const auto& left = tree.node(*root.left);
    const auto& right = tree.node(*root.right);

    for (const auto& proof : *proofs) {
        EXPECT_TRUE(std::equal(left.id.begin(), left.id.end(), proof.proof.begin()));
        EXPECT_TRUE(std::equal(right.id.begin(), right.id.end(), proof.proof.begin() + 32));
    }
}

/**
 * @brief Тест: prepare_data
 */
TEST_F(MerkleTreeTest, PrepareData) {
    const auto data = make_fixture(1'000'000);
    auto prepared = merkle::prepare_data(data);
    ASSERT_TRUE(prepared.has_value());

    EXPECT_EQ(prepared->data_size, 1'000'000u);
    EXPECT_EQ(prepared->data_root, hash_from_hex(
        "ba5775248f1cea8b4c82c7268f93fa0eb3aedd36a3e87fc794734a456c3423b0"));
    ASSERT_EQ(prepared->chunks.size(), 4u);
    ASSERT_EQ(prepared->proofs.size(), 4u);

    const auto envelopes = prepared->envelopes();
    ASSERT_EQ(envelopes.size(), 4u);
    EXPECT_EQ(envelopes[3].offset, 999'999u);
    EXPECT_EQ(envelopes[3].chunk, prepared->chunks[3].data);
    EXPECT_EQ(envelopes[3].data_path, prepared->proofs[3].proof);
    EXPECT_EQ(envelopes[3].data_root, prepared->data_root);
}

/**
 * @brief Тест: пустые данные дают нулевой корень
 */
TEST_F(MerkleTreeTest, PrepareEmptyData) {
    auto prepared = merkle::prepare_data(ByteSpan{});
    ASSERT_TRUE(prepared.has_value());

    EXPECT_TRUE(prepared->empty());
    EXPECT_EQ(prepared->data_size, 0u);
    EXPECT_EQ(prepared->data_root, Hash256{});
    EXPECT_TRUE(prepared->envelopes().empty());
}

} // namespace weavekit::tests
