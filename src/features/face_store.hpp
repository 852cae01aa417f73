// src/features/face_store.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

#include "../core/face.hpp"

/**
 * Persistence collaborator for FaceFinder.
 *
 * Implementations report failures by throwing; FaceFinder never retries and
 * lets the exception reach its caller.
 */
class FaceStore {
public:
    virtual ~FaceStore() = default;

    // Stores a new face and returns its id: strictly positive, never used
    // before (since the last truncate).
    virtual int64_t insert(int race, int emotion, int oldness) = 0;

    // At most `limit` faces, newest id first.
    virtual std::vector<Face> loadRecent(size_t limit) const = 0;

    // Deletes every stored face.
    virtual void truncate() = 0;

    virtual size_t count() const = 0;
};

// Volatile store used by tests and demos. Ids restart at 1 after truncate.
class InMemoryFaceStore : public FaceStore {
public:
    InMemoryFaceStore() = default;

    int64_t insert(int race, int emotion, int oldness) override;
    std::vector<Face> loadRecent(size_t limit) const override;
    void truncate() override;
    size_t count() const override;

private:
    std::map<int64_t, Face> faces;
    int64_t next_id{1};
    mutable std::mutex store_mutex;
};
