/**
 * @file merkle_tree.cpp
 * @brief Построение Merkle дерева и сбор доказательств
 */

#include "merkle_tree.hpp"
#include "../crypto/sha256.hpp"

#include <string>

namespace weavekit::merkle {

// =============================================================================
// Построение
// =============================================================================

Result<MerkleTree> MerkleTree::build(std::vector<Node> leaves) {
    if (leaves.empty()) {
        return Err<MerkleTree>(ErrorCode::MerkleEmptyTree);
    }

    MerkleTree tree;
    tree.leaf_count_ = leaves.size();
    tree.nodes_.reserve(leaves.size() * 2);

    std::vector<NodeHandle> layer;
    layer.reserve(leaves.size());
    for (auto& leaf : leaves) {
        if (!leaf.is_leaf()) {
            return Err<MerkleTree>(ErrorCode::MerkleInvalidNode, "Ожидался лист");
        }
        layer.push_back(tree.add_node(std::move(leaf)));
    }

    auto root = tree.generate_root(std::move(layer));
    if (!root) {
        return std::unexpected(root.error());
    }
    tree.root_ = *root;

    return tree;
}

NodeHandle MerkleTree::add_node(Node node) {
    nodes_.push_back(std::move(node));
    return nodes_.size() - 1;
}

NodeHandle MerkleTree::hash_branch(NodeHandle left, NodeHandle right) {
    const Node& l = nodes_[left];
    const Node& r = nodes_[right];

    const Note note = to_note(l.max_byte_range);

    Node branch;
    branch.id = crypto::hash_all({l.id, r.id, note});
    branch.min_byte_range = l.min_byte_range;
    branch.max_byte_range = r.max_byte_range;
    branch.left = left;
    branch.right = right;

    return add_node(std::move(branch));
}

std::vector<NodeHandle> MerkleTree::build_layer(std::span<const NodeHandle> layer) {
    std::vector<NodeHandle> next;
    next.reserve((layer.size() + 1) / 2);

    std::size_t i = 0;
    for (; i + 1 < layer.size(); i += 2) {
        next.push_back(hash_branch(layer[i], layer[i + 1]));
    }
    // Непарный узел поднимается как есть
    if (i < layer.size()) {
        next.push_back(layer[i]);
    }

    return next;
}

Result<NodeHandle> MerkleTree::generate_root(std::vector<NodeHandle> layer) {
    if (layer.empty()) {
        return Err<NodeHandle>(ErrorCode::MerkleEmptyTree);
    }

    while (layer.size() > 1) {
        layer = build_layer(layer);
    }

    return layer.front();
}

// =============================================================================
// Доказательства
// =============================================================================

Result<std::vector<Proof>> MerkleTree::resolve_proofs() const {
    std::vector<Proof> proofs;
    proofs.reserve(leaf_count_);

    struct Frame {
        NodeHandle handle;
        Bytes prefix;
    };

    std::vector<Frame> stack;
    stack.push_back(Frame{root_, {}});

    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();

        const Node& node = nodes_[frame.handle];

        if (node.is_leaf()) {
            const Note note = to_note(node.max_byte_range);

            Proof proof;
            proof.offset = node.max_byte_range == 0 ? 0 : node.max_byte_range - 1;
            proof.proof = std::move(frame.prefix);
            proof.proof.insert(proof.proof.end(), node.data_hash->begin(), node.data_hash->end());
            proof.proof.insert(proof.proof.end(), note.begin(), note.end());
            proofs.push_back(std::move(proof));
            continue;
        }

        if (!node.is_branch()) {
            return Err<std::vector<Proof>>(
                ErrorCode::MerkleInvalidNode,
                "Узел " + std::to_string(frame.handle) + " не лист и не ветвь"
            );
        }

        const Node& left = nodes_[*node.left];
        const Node& right = nodes_[*node.right];
        const Note note = to_note(left.max_byte_range);

        Bytes record = std::move(frame.prefix);
        record.reserve(record.size() + constants::BRANCH_RECORD_SIZE);
        record.insert(record.end(), left.id.begin(), left.id.end());
        record.insert(record.end(), right.id.begin(), right.id.end());
        record.insert(record.end(), note.begin(), note.end());

        // Правый кладётся первым, чтобы левое поддерево обошлось раньше
        stack.push_back(Frame{*node.right, record});
        stack.push_back(Frame{*node.left, std::move(record)});
    }

    return proofs;
}

} // namespace weavekit::merkle
