#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "nearest_neighbor.hpp"
#include "../utils/distance_metrics.hpp"

// -------------------- BestCandidates --------------------

void NearestNeighborSearch::BestCandidates::offer(const Candidate& candidate) {
    if (heap.size() < RESULT_COUNT) {
        heap.push(candidate);
    } else if (candidate < heap.top()) {
        heap.pop();
        heap.push(candidate);
    }
}

std::vector<NearestNeighborSearch::Candidate>
NearestNeighborSearch::BestCandidates::drainWorstFirst() {
    std::vector<Candidate> drained;
    drained.reserve(heap.size());
    while (!heap.empty()) {
        drained.push_back(heap.top());
        heap.pop();
    }
    return drained;
}

// -------------------- search --------------------

std::vector<Neighbor> NearestNeighborSearch::search(const Face& query, const KDTree* tree,
                                                    const std::vector<Face>& all_points,
                                                    SearchTrace* trace) const {
    SearchContext ctx(query);

    if (tree && tree->root()) {
        ctx.trace.used_tree = true;
        searchRecursive(tree->root(), ctx);
    } else {
        linearScan(all_points, ctx);
    }

    std::vector<Neighbor> result = collect(ctx);
    if (result.empty()) {
        throw std::logic_error("Nearest neighbor search produced no results");
    }
    if (trace) {
        *trace = ctx.trace;
    }
    return result;
}

void NearestNeighborSearch::linearScan(const std::vector<Face>& points, SearchContext& ctx) const {
    for (const auto& face : points) {
        ctx.best.offer(Candidate{squaredDistance(ctx.query, face), face});
    }
    ctx.trace.points_examined += points.size();
}

void NearestNeighborSearch::searchRecursive(const KDTree::Node* node, SearchContext& ctx) const {
    ctx.trace.nodes_visited++;
    if (node->isLeaf()) {
        visitLeaf(node, ctx);
        return;
    }

    const size_t axis = node->split_axis;
    const bool query_right = ctx.query[axis] >= node->pivot[axis];
    const KDTree::Node* first = query_right ? node->right.get() : node->left.get();
    const KDTree::Node* second = query_right ? node->left.get() : node->right.get();

    searchRecursive(first, ctx);

    // The far side can only be skipped once an outer radius exists and the
    // splitting plane lies outside it.
    int64_t plane_distance = axisDistance(ctx.query, node->pivot, axis);
    if (!ctx.outer || plane_distance < ctx.outer->distance) {
        // Internal pivots belong to neither child range; the next leaf scans it.
        ctx.last_pivot = node->pivot;
        searchRecursive(second, ctx);
    }
}

void NearestNeighborSearch::visitLeaf(const KDTree::Node* node, SearchContext& ctx) const {
    ctx.trace.leaves_visited++;

    std::vector<Candidate> candidates;
    candidates.reserve(node->leaf_points.size() + 1);
    for (const auto& face : node->leaf_points) {
        candidates.push_back(Candidate{squaredDistance(ctx.query, face), face});
    }
    if (ctx.last_pivot) {
        candidates.push_back(Candidate{squaredDistance(ctx.query, *ctx.last_pivot), *ctx.last_pivot});
        ctx.last_pivot.reset();
    }
    ctx.trace.points_examined += candidates.size();

    if (!ctx.outer) {
        establishBounds(candidates, ctx);
    } else {
        refineBounds(candidates, ctx);
    }
}

void NearestNeighborSearch::establishBounds(const std::vector<Candidate>& candidates,
                                            SearchContext& ctx) const {
    for (const auto& candidate : candidates) {
        ctx.best.offer(candidate);
        ctx.backlog.push(candidate);
    }

    std::optional<Candidate> boundary;
    while (ctx.backlog.size() > KDTree::MIN_POINTS) {
        boundary = ctx.backlog.top();
        ctx.backlog.pop();
    }
    if (!boundary) {
        // Fewer than RESULT_COUNT points so far; keep accumulating.
        return;
    }

    ctx.outer = boundary;
    ctx.inner = ctx.backlog.top();
    ctx.backlog.pop();
}

void NearestNeighborSearch::refineBounds(const std::vector<Candidate>& candidates,
                                         SearchContext& ctx) const {
    for (const auto& candidate : candidates) {
        if (candidate.distance >= ctx.outer->distance) {
            continue;
        }
        ctx.best.offer(candidate);
        if (ctx.inner) {
            ctx.pending.push(candidate);
        } else {
            ctx.backlog.push(candidate);
        }
    }

    if (ctx.inner) {
        processPending(ctx);
    }
    if (!ctx.inner && ctx.backlog.size() >= KDTree::MIN_POINTS) {
        establishInner(ctx);
    }
}

void NearestNeighborSearch::processPending(SearchContext& ctx) const {
    while (!ctx.pending.empty()) {
        Candidate candidate = ctx.pending.top();
        ctx.pending.pop();

        if (!ctx.inner) {
            ctx.backlog.push(candidate);
            continue;
        }
        if (candidate.distance >= ctx.outer->distance) {
            continue;
        }
        if (candidate.distance >= ctx.inner->distance) {
            ctx.outer = candidate;
            continue;
        }

        // Inside the inner radius: inner becomes the k-th best, and the new
        // inner bound is the farther of this point and the backlog's top.
        ctx.outer = ctx.inner;
        if (ctx.backlog.empty()) {
            ctx.inner.reset();
            ctx.backlog.push(candidate);
            continue;
        }
        if (ctx.backlog.top().distance > candidate.distance) {
            ctx.inner = ctx.backlog.top();
            ctx.backlog.pop();
            ctx.backlog.push(candidate);
        } else {
            ctx.inner = candidate;
        }
    }
}

void NearestNeighborSearch::establishInner(SearchContext& ctx) const {
    // Every backlog entry is strictly inside the outer radius.
    while (ctx.backlog.size() > KDTree::MIN_POINTS) {
        ctx.outer = ctx.backlog.top();
        ctx.backlog.pop();
    }
    ctx.inner = ctx.backlog.top();
    ctx.backlog.pop();
}

std::vector<Neighbor> NearestNeighborSearch::collect(SearchContext& ctx) const {
    std::vector<Candidate> ordered = ctx.best.drainWorstFirst();

    // The query always heads the result, whether it was stored or not.
    const Face& query = ctx.query;
    if (query.id() != 0) {
        ordered.erase(std::remove_if(ordered.begin(), ordered.end(),
                                     [&query](const Candidate& c) {
                                         return c.face.id() == query.id();
                                     }),
                      ordered.end());
    }
    ordered.push_back(Candidate{0, query});

    const auto count = static_cast<std::ptrdiff_t>(std::min(ordered.size(), RESULT_COUNT));
    std::vector<Neighbor> result;
    result.reserve(static_cast<size_t>(count));
    for (auto it = ordered.rbegin(); it != ordered.rbegin() + count; ++it) {
        result.push_back(Neighbor{it->face, it->distance});
    }
    return result;
}
