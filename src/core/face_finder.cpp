#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "face_finder.hpp"

// -------------------- ctor --------------------

FaceFinder::FaceFinder(std::shared_ptr<FaceStore> face_store, const FinderConfig& cfg)
    : store(std::move(face_store)),
      config(cfg),
      cache(cfg.cache_limit) {
    config.validate();
    if (!store) {
        throw std::invalid_argument("FaceFinder requires a face store");
    }

    std::lock_guard<std::mutex> lock(finder_mutex);
    cache.load(*store);
    rebuildTree();

    if (config.verbose) {
        std::cout << "[finder] Loaded " << cache.size() << " faces, tree "
                  << (tree ? "built" : "skipped (too few faces)") << std::endl;
    }
}

// -------------------- operations --------------------

std::vector<Face> FaceFinder::resolve(const Face& face) {
    std::vector<Neighbor> neighbors = resolveWithDistances(face);
    std::vector<Face> result;
    result.reserve(neighbors.size());
    for (const auto& neighbor : neighbors) {
        result.push_back(neighbor.face);
    }
    return result;
}

std::vector<Neighbor> FaceFinder::resolveWithDistances(const Face& face, SearchTrace* trace) {
    // Own copy; the constructor re-validates every attribute.
    Face query(face.race(), face.emotion(), face.oldness(), face.id());

    std::lock_guard<std::mutex> lock(finder_mutex);

    if (query.id() == 0) {
        // persist -> cache -> rebuild; a store failure leaves the index untouched
        query.assignId(store->insert(query.race(), query.emotion(), query.oldness()));
        cache.push(query);
        tree.reset();
        rebuildTree();
        total_inserts.fetch_add(1);
    }

    total_resolves.fetch_add(1);
    return searcher.search(query, tree.get(), cache.faces(), trace);
}

void FaceFinder::flush() {
    std::lock_guard<std::mutex> lock(finder_mutex);

    store->truncate();
    cache.clear();
    tree.reset();

    total_flushes.fetch_add(1);
    if (config.verbose) {
        std::cout << "[finder] Flushed all faces" << std::endl;
    }
}

size_t FaceFinder::reload() {
    std::lock_guard<std::mutex> lock(finder_mutex);

    size_t loaded = cache.load(*store);
    tree.reset();
    rebuildTree();

    if (config.verbose) {
        std::cout << "[finder] Reloaded " << loaded << " faces" << std::endl;
    }
    return loaded;
}

void FaceFinder::rebuildTree() {
    tree = KDTree::build(cache.faces());
    if (tree) {
        total_rebuilds.fetch_add(1);
    }
}

// -------------------- introspection --------------------

size_t FaceFinder::size() const {
    std::lock_guard<std::mutex> lock(finder_mutex);
    return cache.size();
}

bool FaceFinder::hasTree() const {
    std::lock_guard<std::mutex> lock(finder_mutex);
    return tree != nullptr;
}

FaceFinder::Statistics FaceFinder::getStatistics() const {
    std::lock_guard<std::mutex> lock(finder_mutex);

    Statistics stats{};
    stats.total_resolves = total_resolves.load();
    stats.total_inserts = total_inserts.load();
    stats.total_flushes = total_flushes.load();
    stats.total_rebuilds = total_rebuilds.load();
    stats.tree_built = tree != nullptr;
    stats.tree_nodes = tree ? tree->nodeCount() : 0;
    stats.tree_leaves = tree ? tree->leafCount() : 0;
    stats.tree_height = tree ? tree->height() : 0;
    stats.cache_stats = cache.getStatistics();
    return stats;
}
