#pragma once

/**
 * @file bvh.hpp
 * @brief Dynamic AABB tree for broad-phase queries.
 *
 * Features:
 * - Dynamic insert/remove/update, leaves carry an integer item
 * - Fattened AABBs for movement tolerance (reduces tree updates)
 * - SAH (Surface Area Heuristic) sibling search on insertion
 * - AVL-style rotations keep the tree shallow
 * - Queries don't allocate
 */

#include "../geom/aabb.hpp"
#include "../config.hpp"
#include <vector>
#include <array>
#include <algorithm>
#include <limits>
#include <utility>
#include <cstdint>

namespace probe {
namespace collision {

/**
 * BVH tree node.
 * Internal nodes have two children, leaf nodes carry an item.
 */
struct BVHNode {
    AABB bounds;
    int32_t parent = BVH_NULL_NODE;  // next free node while on the free list
    int32_t left = BVH_NULL_NODE;
    int32_t right = BVH_NULL_NODE;
    int32_t item = -1;               // only valid for leaves
    int32_t height = 0;              // leaves = 0

    bool is_leaf() const { return left == BVH_NULL_NODE; }
};

class BVH {
public:
    BVH() = default;

    // ==================== Core operations ====================

    /**
     * Insert an item with its tight AABB.
     * Returns the leaf (proxy) index used by update/remove.
     */
    int32_t insert(int32_t item, const AABB& aabb) {
        int32_t leaf = allocate_node();
        nodes_[leaf].bounds = aabb.expanded(BVH_AABB_MARGIN);
        nodes_[leaf].item = item;
        insert_leaf(leaf);
        ++leaf_count_;
        return leaf;
    }

    void remove(int32_t proxy) {
        remove_leaf(proxy);
        free_node(proxy);
        --leaf_count_;
    }

    /**
     * Move a leaf to a new tight AABB.
     * Returns true if the tree was restructured.
     */
    bool update(int32_t proxy, const AABB& aabb) {
        if (nodes_[proxy].bounds.contains(aabb)) {
            return false;
        }
        remove_leaf(proxy);
        nodes_[proxy].bounds = aabb.expanded(BVH_AABB_MARGIN);
        insert_leaf(proxy);
        return true;
    }

    // ==================== Queries ====================

    /**
     * Calls callback(item) for every leaf whose fattened AABB overlaps aabb.
     */
    template<typename Callback>
    void query_aabb(const AABB& aabb, Callback&& callback) const {
        if (root_ == BVH_NULL_NODE) return;
        query_subtree(root_, aabb, callback);
    }

    // ==================== Accessors ====================

    int32_t root() const { return root_; }
    bool empty() const { return root_ == BVH_NULL_NODE; }
    size_t leaf_count() const { return leaf_count_; }
    const BVHNode& node(int32_t index) const { return nodes_[index]; }

    int32_t compute_height() const {
        return compute_height(root_);
    }

    /**
     * Проверка структуры дерева (для тестов).
     */
    bool validate() const {
        return validate_structure(root_);
    }

private:
    std::vector<BVHNode> nodes_;
    int32_t root_ = BVH_NULL_NODE;
    int32_t free_list_ = BVH_NULL_NODE;
    size_t leaf_count_ = 0;

    template<typename Callback>
    void query_subtree(int32_t start, const AABB& aabb, Callback& callback) const {
        std::array<int32_t, BVH_QUERY_STACK_SIZE> stack;
        int top = 0;
        stack[top++] = start;

        while (top > 0) {
            const BVHNode& node = nodes_[stack[--top]];
            if (!node.bounds.intersects(aabb)) continue;

            if (node.is_leaf()) {
                callback(node.item);
            } else if (top + 2 > BVH_QUERY_STACK_SIZE) {
                query_subtree(node.left, aabb, callback);
                query_subtree(node.right, aabb, callback);
            } else {
                stack[top++] = node.right;
                stack[top++] = node.left;
            }
        }
    }

    // ==================== Node allocation ====================

    int32_t allocate_node() {
        if (free_list_ != BVH_NULL_NODE) {
            int32_t index = free_list_;
            free_list_ = nodes_[index].parent;
            nodes_[index] = BVHNode{};
            return index;
        }
        nodes_.push_back(BVHNode{});
        return static_cast<int32_t>(nodes_.size() - 1);
    }

    void free_node(int32_t index) {
        nodes_[index] = BVHNode{};
        nodes_[index].parent = free_list_;
        free_list_ = index;
    }

    // ==================== Tree operations ====================

    void replace_child(int32_t parent, int32_t old_child, int32_t new_child) {
        if (parent == BVH_NULL_NODE) {
            root_ = new_child;
        } else if (nodes_[parent].left == old_child) {
            nodes_[parent].left = new_child;
        } else {
            nodes_[parent].right = new_child;
        }
    }

    void insert_leaf(int32_t leaf) {
        if (root_ == BVH_NULL_NODE) {
            root_ = leaf;
            nodes_[leaf].parent = BVH_NULL_NODE;
            return;
        }

        AABB leaf_aabb = nodes_[leaf].bounds;
        int32_t sibling = find_best_sibling(leaf_aabb);

        int32_t old_parent = nodes_[sibling].parent;
        int32_t new_parent = allocate_node();
        nodes_[new_parent].parent = old_parent;
        nodes_[new_parent].bounds = leaf_aabb.merge(nodes_[sibling].bounds);
        nodes_[new_parent].height = nodes_[sibling].height + 1;
        nodes_[new_parent].left = sibling;
        nodes_[new_parent].right = leaf;
        replace_child(old_parent, sibling, new_parent);

        nodes_[sibling].parent = new_parent;
        nodes_[leaf].parent = new_parent;

        refit_ancestors(new_parent);
    }

    void remove_leaf(int32_t leaf) {
        if (leaf == root_) {
            root_ = BVH_NULL_NODE;
            return;
        }

        int32_t parent = nodes_[leaf].parent;
        int32_t grandparent = nodes_[parent].parent;
        int32_t sibling = nodes_[parent].left == leaf ? nodes_[parent].right : nodes_[parent].left;

        replace_child(grandparent, parent, sibling);
        nodes_[sibling].parent = grandparent;
        free_node(parent);

        if (grandparent != BVH_NULL_NODE) {
            refit_ancestors(grandparent);
        }
    }

    // Branch and bound over (node, inherited cost)
    int32_t find_best_sibling(const AABB& leaf_aabb) const {
        int32_t best = root_;
        float best_cost = std::numeric_limits<float>::max();
        float leaf_area = leaf_aabb.surface_area();

        std::vector<std::pair<int32_t, float>> stack;
        stack.reserve(64);
        stack.push_back({root_, 0.0f});

        while (!stack.empty()) {
            int32_t index = stack.back().first;
            float inherited = stack.back().second;
            stack.pop_back();

            const BVHNode& node = nodes_[index];
            float combined_area = leaf_aabb.merge(node.bounds).surface_area();

            float cost = combined_area + inherited;
            if (cost < best_cost) {
                best_cost = cost;
                best = index;
            }

            float child_inherited = inherited + combined_area - node.bounds.surface_area();
            if (leaf_area + child_inherited >= best_cost) continue;

            if (!node.is_leaf()) {
                stack.push_back({node.left, child_inherited});
                stack.push_back({node.right, child_inherited});
            }
        }
        return best;
    }

    void refit_ancestors(int32_t index) {
        while (index != BVH_NULL_NODE) {
            index = balance(index);
            BVHNode& node = nodes_[index];
            node.bounds = nodes_[node.left].bounds.merge(nodes_[node.right].bounds);
            node.height = 1 + std::max(nodes_[node.left].height, nodes_[node.right].height);
            index = node.parent;
        }
    }

    /**
     * Поднимает более высокого ребёнка узла a на место a.
     * Возвращает новый корень поддерева.
     */
    int32_t balance(int32_t a) {
        BVHNode& A = nodes_[a];
        if (A.is_leaf() || A.height < 2) {
            return a;
        }

        int32_t diff = nodes_[A.right].height - nodes_[A.left].height;
        if (diff > 1) return rotate_up(a, true);
        if (diff < -1) return rotate_up(a, false);
        return a;
    }

    int32_t rotate_up(int32_t a, bool right_child) {
        int32_t up = right_child ? nodes_[a].right : nodes_[a].left;
        int32_t stay = right_child ? nodes_[a].left : nodes_[a].right;
        int32_t f = nodes_[up].left;
        int32_t g = nodes_[up].right;

        // up занимает место a, a становится его левым ребёнком
        nodes_[up].left = a;
        nodes_[up].parent = nodes_[a].parent;
        nodes_[a].parent = up;
        replace_child(nodes_[up].parent, a, up);

        // Более высокий внук остаётся под up, другой переходит к a
        int32_t keep = nodes_[f].height > nodes_[g].height ? f : g;
        int32_t move = keep == f ? g : f;
        nodes_[up].right = keep;
        if (right_child) {
            nodes_[a].right = move;
        } else {
            nodes_[a].left = move;
        }
        nodes_[move].parent = a;

        BVHNode& A = nodes_[a];
        A.bounds = nodes_[stay].bounds.merge(nodes_[move].bounds);
        A.height = 1 + std::max(nodes_[stay].height, nodes_[move].height);
        BVHNode& U = nodes_[up];
        U.bounds = A.bounds.merge(nodes_[keep].bounds);
        U.height = 1 + std::max(A.height, nodes_[keep].height);
        return up;
    }

    int32_t compute_height(int32_t index) const {
        if (index == BVH_NULL_NODE) return 0;
        const BVHNode& node = nodes_[index];
        if (node.is_leaf()) return 0;
        return 1 + std::max(compute_height(node.left), compute_height(node.right));
    }

    bool validate_structure(int32_t index) const {
        if (index == BVH_NULL_NODE) return true;
        const BVHNode& node = nodes_[index];

        if (node.is_leaf()) {
            return node.item >= 0 && node.right == BVH_NULL_NODE;
        }
        if (node.right == BVH_NULL_NODE) return false;
        if (nodes_[node.left].parent != index) return false;
        if (nodes_[node.right].parent != index) return false;
        if (!node.bounds.contains(nodes_[node.left].bounds.merge(nodes_[node.right].bounds))) return false;

        return validate_structure(node.left) && validate_structure(node.right);
    }
};

} // namespace collision
} // namespace probe
