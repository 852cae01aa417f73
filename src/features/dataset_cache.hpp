#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../core/face.hpp"
#include "face_store.hpp"

/**
 * In-memory working set of faces eligible for indexing.
 *
 * Holds at most `capacity` faces. When full, the face with the smallest id
 * is overwritten by the incoming one.
 */
class DatasetCache {
public:
    struct Statistics {
        size_t current_size{0};
        size_t capacity{0};
        uint64_t pushes{0};
        uint64_t evictions{0};
    };

    explicit DatasetCache(size_t capacity);

    void push(const Face& face);
    void clear();
    // Replaces the contents with the store's newest faces; returns how many.
    size_t load(const FaceStore& store);

    const std::vector<Face>& faces() const { return data; }
    size_t size() const { return data.size(); }
    size_t capacity() const { return limit; }
    bool contains(int64_t id) const;

    Statistics getStatistics() const;

private:
    std::vector<Face> data;
    size_t limit;

    uint64_t pushes{0};
    uint64_t evictions{0};
};

inline void to_json(nlohmann::json& j, const DatasetCache::Statistics& s) {
    j = nlohmann::json{
        {"current_size", s.current_size},
        {"capacity", s.capacity},
        {"pushes", s.pushes},
        {"evictions", s.evictions}
    };
}
