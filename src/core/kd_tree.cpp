#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include "kd_tree.hpp"

namespace {
// round((left + right) / 2) with halves rounded up.
inline std::ptrdiff_t midpoint(std::ptrdiff_t left, std::ptrdiff_t right) {
    return (left + right + 1) / 2;
}
} // namespace

KDTree::Node::Node(const Face& face, size_t axis) : pivot(face), split_axis(axis) {}

KDTree::KDTree(size_t count) : point_count(count) {}

std::unique_ptr<KDTree> KDTree::build(std::vector<Face> points) {
    // Not enough for a root and two leaves: callers scan the flat set instead.
    if (points.size() < minimumBuildSize()) {
        return nullptr;
    }

    std::unique_ptr<KDTree> tree(new KDTree(points.size()));
    tree->root_node = tree->buildRecursive(points, 0, 0,
                                           static_cast<std::ptrdiff_t>(points.size()) - 1);
    return tree;
}

std::unique_ptr<KDTree::Node> KDTree::buildRecursive(std::vector<Face>& points, size_t axis,
                                                     std::ptrdiff_t left, std::ptrdiff_t right) {
    quickSort(points, left, right, axis);

    // Move the split to the start of a run of equal values so ties always
    // land on the right side.
    std::ptrdiff_t mid = midpoint(left, right);
    while (mid > left && points[mid][axis] == points[mid - 1][axis]) {
        mid--;
    }

    auto node = std::make_unique<Node>(points[mid], axis);
    size_t next_axis = (axis + 1) % Face::DIM_COUNT;

    const auto min_points = static_cast<std::ptrdiff_t>(MIN_POINTS);
    if ((mid - left) > min_points && (right - mid) > min_points) {
        node->left = buildRecursive(points, next_axis, left, mid - 1);
        node->right = buildRecursive(points, next_axis, mid + 1, right);
    } else {
        node->leaf_points.assign(points.begin() + left, points.begin() + right + 1);
    }
    return node;
}

void KDTree::quickSort(std::vector<Face>& points, std::ptrdiff_t left,
                       std::ptrdiff_t right, size_t axis) {
    std::ptrdiff_t l = left;
    std::ptrdiff_t r = right;
    const int center = points[midpoint(left, right)][axis];

    do {
        while (points[r][axis] > center) {
            r--;
        }
        while (points[l][axis] < center) {
            l++;
        }
        if (l <= r) {
            std::swap(points[l], points[r]);
            l++;
            r--;
        }
    } while (l <= r);

    if (r > left) {
        quickSort(points, left, r, axis);
    }
    if (l < right) {
        quickSort(points, l, right, axis);
    }
}

namespace {
size_t countNodes(const KDTree::Node* node) {
    if (!node) return 0;
    return 1 + countNodes(node->left.get()) + countNodes(node->right.get());
}

size_t countLeaves(const KDTree::Node* node) {
    if (!node) return 0;
    if (node->isLeaf()) return 1;
    return countLeaves(node->left.get()) + countLeaves(node->right.get());
}

size_t measureHeight(const KDTree::Node* node) {
    if (!node) return 0;
    return 1 + std::max(measureHeight(node->left.get()), measureHeight(node->right.get()));
}
} // namespace

size_t KDTree::nodeCount() const {
    return countNodes(root_node.get());
}

size_t KDTree::leafCount() const {
    return countLeaves(root_node.get());
}

size_t KDTree::height() const {
    return measureHeight(root_node.get());
}
