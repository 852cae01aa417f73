// src/algorithms/nearest_neighbor.hpp

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <queue>
#include <vector>

#include "../core/face.hpp"
#include "../core/kd_tree.hpp"

struct Neighbor {
    Face face;
    int64_t distance;
};

// Work counters for one search, filled when the caller asks for them.
struct SearchTrace {
    size_t nodes_visited{0};
    size_t leaves_visited{0};
    size_t points_examined{0};
    bool used_tree{false};
};

/**
 * k-nearest-neighbor search over a KDTree, falling back to a linear scan
 * when no tree was built.
 *
 * The k-th best distance ("outer radius") is refined across leaf visits with
 * the help of the (k-1)-th best ("inner radius") and a backlog holding the
 * remaining k-2 best, so a leaf visit costs a few heap operations instead of
 * a re-sort of every candidate.
 *
 * All traversal state lives in a SearchContext owned by the call, so one
 * instance can serve concurrent searches against the same tree.
 */
class NearestNeighborSearch {
public:
    static constexpr size_t RESULT_COUNT = KDTree::MIN_POINTS + 1;

    // Results are ordered closest first; the query is always the first entry.
    std::vector<Neighbor> search(const Face& query, const KDTree* tree,
                                 const std::vector<Face>& all_points,
                                 SearchTrace* trace = nullptr) const;

private:
    // Max-heap element: the worst candidate is on top. Ties are broken by id
    // so equal distances rank deterministically.
    struct Candidate {
        int64_t distance;
        Face face;
        bool operator<(const Candidate& other) const {
            if (distance != other.distance) {
                return distance < other.distance;
            }
            return face.id() < other.face.id();
        }
    };

    using CandidateQueue = std::priority_queue<Candidate>;

    // Keeps the RESULT_COUNT best candidates offered to it.
    class BestCandidates {
    public:
        void offer(const Candidate& candidate);
        std::vector<Candidate> drainWorstFirst();
        size_t size() const { return heap.size(); }
    private:
        CandidateQueue heap;
    };

    struct SearchContext {
        explicit SearchContext(const Face& q) : query(q) {}

        const Face& query;
        BestCandidates best;
        CandidateQueue backlog;
        CandidateQueue pending;
        std::optional<Candidate> outer;
        std::optional<Candidate> inner;
        std::optional<Face> last_pivot;
        SearchTrace trace;
    };

    void linearScan(const std::vector<Face>& points, SearchContext& ctx) const;
    void searchRecursive(const KDTree::Node* node, SearchContext& ctx) const;
    void visitLeaf(const KDTree::Node* node, SearchContext& ctx) const;
    void establishBounds(const std::vector<Candidate>& candidates, SearchContext& ctx) const;
    void refineBounds(const std::vector<Candidate>& candidates, SearchContext& ctx) const;
    void processPending(SearchContext& ctx) const;
    void establishInner(SearchContext& ctx) const;
    std::vector<Neighbor> collect(SearchContext& ctx) const;
};
