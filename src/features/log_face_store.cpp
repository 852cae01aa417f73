// src/features/log_face_store.cpp

#include "log_face_store.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <vector>

LogFaceStore::LogFaceStore(const FinderConfig& cfg)
    : config_(cfg) {
    config_.validate();
    std::lock_guard<std::mutex> lk(mtx_);
    log_ = std::make_unique<CommitLog>(config_.log_directory, config_.log_rotation_size);
    replay();
}

LogFaceStore::~LogFaceStore() {
    std::lock_guard<std::mutex> lk(mtx_);
    if (log_) {
        log_->flush();
    }
}

int64_t LogFaceStore::insert(int race, int emotion, int oldness) {
    std::lock_guard<std::mutex> lk(mtx_);
    Face face(race, emotion, oldness, next_id_);

    // durable first; a failed write throws and the id is not consumed
    log_->logInsert(face);
    faces_.emplace(face.id(), face);
    return next_id_++;
}

std::vector<Face> LogFaceStore::loadRecent(size_t limit) const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<Face> recent;
    recent.reserve(std::min(limit, faces_.size()));
    for (auto it = faces_.rbegin(); it != faces_.rend() && recent.size() < limit; ++it) {
        recent.push_back(it->second);
    }
    return recent;
}

void LogFaceStore::truncate() {
    std::lock_guard<std::mutex> lk(mtx_);
    // The marker makes replay drop everything even if deleting files fails
    // halfway through reset().
    log_->logTruncate();
    log_->reset();
    faces_.clear();
    next_id_ = 1;

    if (config_.verbose) {
        std::cout << "[commit-log] Store truncated in " << config_.log_directory << std::endl;
    }
}

size_t LogFaceStore::count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return faces_.size();
}

CommitLog::Statistics LogFaceStore::getLogStatistics() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return log_->getStatistics();
}

void LogFaceStore::replay() {
    faces_.clear();
    next_id_ = 1;

    size_t applied = 0;
    for (const auto& entry : log_->readAllEntries()) {
        switch (entry.type) {
            case LogEntryType::INSERT: {
                InsertOperation op = InsertOperation::deserialize(entry.data);
                if (op.id <= 0) {
                    std::cerr << "[commit-log] Warning: undecodable insert at seq "
                              << entry.sequence_number << std::endl;
                    continue;
                }
                Face face(op.race, op.emotion, op.oldness, op.id);
                faces_.insert_or_assign(face.id(), face);
                next_id_ = std::max(next_id_, face.id() + 1);
                applied++;
                break;
            }
            case LogEntryType::TRUNCATE:
                faces_.clear();
                next_id_ = 1;
                applied++;
                break;
            default:
                std::cerr << "[commit-log] Warning: unknown entry type at seq "
                          << entry.sequence_number << std::endl;
                break;
        }
    }

    if (config_.verbose) {
        std::cout << "[commit-log] Replayed " << applied << " entries, "
                  << faces_.size() << " faces in store" << std::endl;
    }
}
