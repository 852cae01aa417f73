#pragma once

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include "../core/face.hpp"

enum class LogEntryType : uint32_t {
    INSERT   = 1,
    TRUNCATE = 2
};

struct LogEntry {
    uint64_t timestamp{0};         // wall clock (us)
    LogEntryType type{LogEntryType::TRUNCATE};
    uint64_t sequence_number{0};
    uint32_t checksum{0};
    uint32_t data_length{0};
    std::vector<uint8_t> data;

    LogEntry() = default;
    LogEntry(LogEntryType t, uint64_t seq, const std::vector<uint8_t>& d);

    std::vector<uint8_t> serialize() const;
    static LogEntry deserialize(const std::vector<uint8_t>& buffer);

    // timestamp + type + sequence + checksum + data_length
    static constexpr size_t HEADER_SIZE = sizeof(uint64_t) + sizeof(uint32_t) +
                                          sizeof(uint64_t) + sizeof(uint32_t) + sizeof(uint32_t);

    bool isValid() const;
private:
    uint32_t calculateChecksum() const;
};

// Payload of an INSERT entry. id == 0 marks a payload that failed to decode.
struct InsertOperation {
    int64_t id{0};
    int32_t race{0};
    int32_t emotion{0};
    int32_t oldness{0};

    std::vector<uint8_t> serialize() const;
    static InsertOperation deserialize(const std::vector<uint8_t>& data);
};

// ---------------------------- CommitLog -----------------------------------
// Append-only binary log split into numbered files (commit.log.000001, ...).
class CommitLog {
public:
    struct Statistics {
        uint64_t total_entries{0};
        uint64_t total_bytes{0};
        uint64_t next_sequence{1};
        uint64_t current_log_size{0};
        uint64_t current_file_index{1};
    };

    CommitLog(const std::string& log_directory, size_t max_size);
    ~CommitLog();

    CommitLog(const CommitLog&) = delete;
    CommitLog& operator=(const CommitLog&) = delete;

    void logInsert(const Face& face);
    void logTruncate();

    void flush();
    Statistics getStatistics() const;

    // All valid entries across every log file, in sequence order.
    std::vector<LogEntry> readAllEntries() const;

    // hard reset (delete all log files and reopen as 000001)
    void reset();

    // Start a new log file (sequence numbering continues)
    void rotateLog();

private:
    std::string log_dir;
    std::string log_filename;
    size_t      max_log_size;

    std::ofstream log_file;
    uint64_t   next_sequence_number;
    uint64_t   current_file_index;
    uint64_t   current_log_size;
    uint64_t   total_entries_written;
    uint64_t   total_bytes_written;

    std::string generateLogFilename(uint64_t index) const;
    std::vector<std::string> listLogFiles() const;
    void openLogFile();
    void writeEntry(const LogEntry& entry);
};
