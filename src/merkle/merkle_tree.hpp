/**
 * @file merkle_tree.hpp
 * @brief Merkle дерево над chunks
 *
 * Узлы хранятся в арене (std::vector<Node>), дети адресуются индексами.
 * Дерево строится снизу вверх попарным объединением: непарный последний
 * узел слоя переносится на следующий слой без изменений.
 *
 * Id ветви: hash_all(left.id, right.id, note(left.max_byte_range)).
 */

#pragma once

#include "node.hpp"
#include "proof.hpp"

#include <span>
#include <vector>

namespace weavekit::merkle {

/**
 * @brief Merkle дерево с доступом к доказательствам
 */
class MerkleTree {
public:
    MerkleTree() = default;

    /**
     * @brief Построить дерево из листьев
     *
     * @param leaves Листья в порядке байт (результат generate_leaves)
     * @return Дерево или MerkleEmptyTree для пустого списка
     */
    [[nodiscard]] static Result<MerkleTree> build(std::vector<Node> leaves);

    /// @brief Id корня (data root)
    [[nodiscard]] const Hash256& root_id() const noexcept { return nodes_[root_].id; }

    /// @brief Корневой узел
    [[nodiscard]] const Node& root() const noexcept { return nodes_[root_]; }

    /// @brief Узел по индексу арены
    [[nodiscard]] const Node& node(NodeHandle handle) const noexcept { return nodes_[handle]; }

    /// @brief Количество листьев
    [[nodiscard]] std::size_t leaf_count() const noexcept { return leaf_count_; }

    /// @brief Общее количество узлов
    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }

    /**
     * @brief Собрать доказательства для всех листьев
     *
     * Обход в глубину слева направо, поэтому доказательства идут в порядке
     * листьев. Записи ветвей в каждом доказательстве упорядочены от корня.
     *
     * @return Доказательства или MerkleInvalidNode при нарушении формы узла
     */
    [[nodiscard]] Result<std::vector<Proof>> resolve_proofs() const;

private:
    NodeHandle add_node(Node node);
    NodeHandle hash_branch(NodeHandle left, NodeHandle right);
    std::vector<NodeHandle> build_layer(std::span<const NodeHandle> layer);
    Result<NodeHandle> generate_root(std::vector<NodeHandle> layer);

    std::vector<Node> nodes_;
    NodeHandle root_{0};
    std::size_t leaf_count_{0};
};

} // namespace weavekit::merkle
