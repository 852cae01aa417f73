// Copyright [year] <Copyright Owner>
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "face.hpp"
#include "kd_tree.hpp"
#include "../algorithms/nearest_neighbor.hpp"
#include "../features/dataset_cache.hpp"
#include "../features/face_store.hpp"
#include "../features/finder_config.hpp"

/**
 * Face Finder
 *
 * Resolves a face to its most similar stored faces, storing it first when it
 * is new. Keeps a bounded working set of the newest faces in memory and
 * rebuilds the partition tree over it after every insert.
 */
class FaceFinder {
public:
    struct Statistics {
        uint64_t total_resolves;
        uint64_t total_inserts;
        uint64_t total_flushes;
        uint64_t total_rebuilds;
        bool tree_built;
        size_t tree_nodes;
        size_t tree_leaves;
        size_t tree_height;
        DatasetCache::Statistics cache_stats;
    };

private:
    // Core
    std::shared_ptr<FaceStore> store;
    FinderConfig config;
    DatasetCache cache;
    std::unique_ptr<KDTree> tree;
    NearestNeighborSearch searcher;
    mutable std::mutex finder_mutex;

    // Stats
    std::atomic<uint64_t> total_resolves{0};
    std::atomic<uint64_t> total_inserts{0};
    std::atomic<uint64_t> total_flushes{0};
    std::atomic<uint64_t> total_rebuilds{0};

    // Private
    void rebuildTree();

public:
    explicit FaceFinder(std::shared_ptr<FaceStore> store,
                        const FinderConfig& config = FinderConfig{});

    FaceFinder(const FaceFinder&) = delete;
    FaceFinder& operator=(const FaceFinder&) = delete;

    /**
     * Finds the most similar faces. A face with id 0 is stored first and
     * gets its id assigned.
     * @return Up to five faces, closest first; the resolved face is always
     *         the first entry.
     */
    std::vector<Face> resolve(const Face& face);

    // Same as resolve() but keeps the squared distances.
    std::vector<Neighbor> resolveWithDistances(const Face& face, SearchTrace* trace = nullptr);

    // Removes every face from the store and the in-memory index.
    void flush();

    // Re-reads the newest faces from the store and rebuilds the tree.
    size_t reload();

    size_t size() const;
    bool hasTree() const;
    const FinderConfig& getConfig() const { return config; }

    Statistics getStatistics() const;
};

inline void to_json(json& j, const FaceFinder::Statistics& s) {
    j = json{
        {"total_resolves", s.total_resolves},
        {"total_inserts", s.total_inserts},
        {"total_flushes", s.total_flushes},
        {"total_rebuilds", s.total_rebuilds},
        {"tree", {
            {"built",  s.tree_built},
            {"nodes",  s.tree_nodes},
            {"leaves", s.tree_leaves},
            {"height", s.tree_height}
        }},
        {"cache", s.cache_stats}
    };
}
