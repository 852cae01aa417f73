#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "face.hpp"

/**
 * Static three-dimensional partition tree over a bounded face set.
 *
 * Built once by recursive median splits and never mutated; inserting a face
 * means building a new tree.
 */
class KDTree {
public:
    // Minimum number of points on each side of a split.
    static constexpr size_t MIN_POINTS = 4;

    struct Node {
        Face pivot;
        size_t split_axis;
        std::unique_ptr<Node> left;
        std::unique_ptr<Node> right;
        // Only populated on leaves; includes the pivot itself.
        std::vector<Face> leaf_points;

        Node(const Face& face, size_t axis);
        bool isLeaf() const { return !left && !right; }
    };

    // Smallest input that gets a tree: a root plus two leaves of MIN_POINTS+1.
    static constexpr size_t minimumBuildSize() { return MIN_POINTS * 2 + 3; }

    // Returns nullptr when points.size() < minimumBuildSize().
    static std::unique_ptr<KDTree> build(std::vector<Face> points);

    const Node* root() const { return root_node.get(); }
    size_t size() const { return point_count; }
    size_t nodeCount() const;
    size_t leafCount() const;
    size_t height() const;

private:
    std::unique_ptr<Node> root_node;
    size_t point_count;

    explicit KDTree(size_t point_count);

    std::unique_ptr<Node> buildRecursive(std::vector<Face>& points, size_t axis,
                                         std::ptrdiff_t left, std::ptrdiff_t right);
    static void quickSort(std::vector<Face>& points, std::ptrdiff_t left,
                          std::ptrdiff_t right, size_t axis);
};
