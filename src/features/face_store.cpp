#include <algorithm>
#include <mutex>
#include <vector>

#include "face_store.hpp"

int64_t InMemoryFaceStore::insert(int race, int emotion, int oldness) {
    std::lock_guard<std::mutex> lock(store_mutex);
    // Validate before the id is consumed.
    Face face(race, emotion, oldness, next_id);
    faces.emplace(face.id(), face);
    return next_id++;
}

std::vector<Face> InMemoryFaceStore::loadRecent(size_t limit) const {
    std::lock_guard<std::mutex> lock(store_mutex);
    std::vector<Face> recent;
    recent.reserve(std::min(limit, faces.size()));
    for (auto it = faces.rbegin(); it != faces.rend() && recent.size() < limit; ++it) {
        recent.push_back(it->second);
    }
    return recent;
}

void InMemoryFaceStore::truncate() {
    std::lock_guard<std::mutex> lock(store_mutex);
    faces.clear();
    next_id = 1;
}

size_t InMemoryFaceStore::count() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return faces.size();
}
