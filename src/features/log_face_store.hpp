// Copyright
#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include "../core/face.hpp"
#include "commit_log.hpp"
#include "face_store.hpp"
#include "finder_config.hpp"

// ========================== LogFaceStore ==========================
// Durable FaceStore: every insert is appended to a CommitLog before the id is
// handed out, and the log is replayed when the store is opened.
class LogFaceStore : public FaceStore {
public:
    explicit LogFaceStore(const FinderConfig& cfg = FinderConfig{});
    ~LogFaceStore() override;

    int64_t insert(int race, int emotion, int oldness) override;
    std::vector<Face> loadRecent(size_t limit) const override;
    void truncate() override;
    size_t count() const override;

    CommitLog::Statistics getLogStatistics() const;

private:
    void replay();

    FinderConfig                      config_;
    std::unique_ptr<CommitLog>        log_;
    std::map<int64_t, Face>           faces_;
    int64_t                           next_id_{1};
    mutable std::mutex                mtx_;
};

inline void to_json(json& j, const CommitLog::Statistics& s) {
    j = json{
        {"total_entries",      s.total_entries},
        {"total_bytes",        s.total_bytes},
        {"next_sequence",      s.next_sequence},
        {"current_log_size",   s.current_log_size},
        {"current_file_index", s.current_file_index}
    };
}
