#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "dataset_cache.hpp"

DatasetCache::DatasetCache(size_t capacity) : limit(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("Dataset cache capacity must be positive");
    }
}

void DatasetCache::push(const Face& face) {
    pushes++;
    if (data.size() < limit) {
        data.push_back(face);
        return;
    }

    // Full: sort ascending by id so the oldest face sits at index 0, then
    // overwrite it.
    std::sort(data.begin(), data.end(), [](const Face& a, const Face& b) {
        return a.id() < b.id();
    });
    data[0] = face;
    evictions++;
}

void DatasetCache::clear() {
    data.clear();
}

size_t DatasetCache::load(const FaceStore& store) {
    data = store.loadRecent(limit);
    if (data.size() > limit) {
        data.erase(data.begin() + static_cast<std::ptrdiff_t>(limit), data.end());
    }
    return data.size();
}

bool DatasetCache::contains(int64_t id) const {
    return std::any_of(data.begin(), data.end(), [id](const Face& f) { return f.id() == id; });
}

DatasetCache::Statistics DatasetCache::getStatistics() const {
    Statistics stats;
    stats.current_size = data.size();
    stats.capacity = limit;
    stats.pushes = pushes;
    stats.evictions = evictions;
    return stats;
}
