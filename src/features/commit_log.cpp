// src/features/commit_log.cpp
#include "commit_log.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

// Helper function for timestamp
namespace {
inline uint64_t now_us() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

const char* const LOG_PREFIX = "commit.log.";
} // namespace


LogEntry::LogEntry(LogEntryType t, uint64_t seq, const std::vector<uint8_t>& d)
    : timestamp(now_us()), type(t), sequence_number(seq), data_length(static_cast<uint32_t>(d.size())), data(d) {
    checksum = calculateChecksum();
}

uint32_t LogEntry::calculateChecksum() const {
    uint32_t crc = 0;
    crc ^= static_cast<uint32_t>(timestamp);
    crc ^= static_cast<uint32_t>(type);
    crc ^= static_cast<uint32_t>(sequence_number);
    crc ^= data_length;
    for (uint8_t byte : data) {
        crc = (crc << 5) ^ (crc >> 27) ^ byte;
    }
    return crc;
}

bool LogEntry::isValid() const {
    return data_length == data.size() && checksum == calculateChecksum();
}

std::vector<uint8_t> LogEntry::serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(HEADER_SIZE + data.size());

    auto append = [&buffer](const void* ptr, size_t size) {
        const uint8_t* bytes = static_cast<const uint8_t*>(ptr);
        buffer.insert(buffer.end(), bytes, bytes + size);
    };

    append(&timestamp, sizeof(timestamp));
    append(&type, sizeof(type));
    append(&sequence_number, sizeof(sequence_number));
    append(&checksum, sizeof(checksum));
    append(&data_length, sizeof(data_length));
    append(data.data(), data.size());

    return buffer;
}

LogEntry LogEntry::deserialize(const std::vector<uint8_t>& buffer) {
    LogEntry entry;
    size_t offset = 0;

    auto read = [&buffer, &offset](void* dest, size_t size) -> bool {
        if (offset + size > buffer.size()) return false;
        std::memcpy(dest, buffer.data() + offset, size);
        offset += size;
        return true;
    };

    if (!read(&entry.timestamp, sizeof(entry.timestamp)) ||
        !read(&entry.type, sizeof(entry.type)) ||
        !read(&entry.sequence_number, sizeof(entry.sequence_number)) ||
        !read(&entry.checksum, sizeof(entry.checksum)) ||
        !read(&entry.data_length, sizeof(entry.data_length))) {
        return LogEntry(); // Invalid entry
    }

    if (entry.data_length > 0) {
        entry.data.resize(entry.data_length);
        if (!read(entry.data.data(), entry.data_length)) {
            return LogEntry(); // Invalid entry
        }
    }

    return entry;
}

// ========================== Operation Serialization ==========================

std::vector<uint8_t> InsertOperation::serialize() const {
    std::vector<uint8_t> buffer;

    auto append = [&buffer](const void* ptr, size_t size) {
        const uint8_t* bytes = static_cast<const uint8_t*>(ptr);
        buffer.insert(buffer.end(), bytes, bytes + size);
    };

    append(&id, sizeof(id));
    append(&race, sizeof(race));
    append(&emotion, sizeof(emotion));
    append(&oldness, sizeof(oldness));

    return buffer;
}

InsertOperation InsertOperation::deserialize(const std::vector<uint8_t>& data) {
    InsertOperation op;
    if (data.size() != sizeof(op.id) + 3 * sizeof(int32_t)) {
        return InsertOperation(); // Invalid
    }

    size_t offset = 0;
    std::memcpy(&op.id, data.data() + offset, sizeof(op.id));
    offset += sizeof(op.id);
    std::memcpy(&op.race, data.data() + offset, sizeof(op.race));
    offset += sizeof(op.race);
    std::memcpy(&op.emotion, data.data() + offset, sizeof(op.emotion));
    offset += sizeof(op.emotion);
    std::memcpy(&op.oldness, data.data() + offset, sizeof(op.oldness));

    return op;
}

// ========================== CommitLog Implementation ==========================

CommitLog::CommitLog(const std::string& log_directory, size_t max_size)
    : log_dir(log_directory), max_log_size(max_size),
      next_sequence_number(1), current_file_index(1), current_log_size(0),
      total_entries_written(0), total_bytes_written(0) {

    // Create log directory if it doesn't exist
    std::filesystem::create_directories(log_dir);

    // Continue after whatever an earlier process left behind
    auto files = listLogFiles();
    if (!files.empty()) {
        std::string last = std::filesystem::path(files.back()).filename().string();
        current_file_index = std::stoull(last.substr(std::strlen(LOG_PREFIX)));
    }
    auto entries = readAllEntries();
    if (!entries.empty()) {
        next_sequence_number = entries.back().sequence_number + 1;
    }

    openLogFile();
}

CommitLog::~CommitLog() {
    if (log_file.is_open()) {
        log_file.close();
    }
}

std::string CommitLog::generateLogFilename(uint64_t index) const {
    std::ostringstream oss;
    oss << log_dir << "/" << LOG_PREFIX << std::setfill('0') << std::setw(6) << index;
    return oss.str();
}

std::vector<std::string> CommitLog::listLogFiles() const {
    std::vector<std::string> log_files;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        if (entry.is_regular_file()) {
            std::string filename = entry.path().filename().string();
            if (filename.find(LOG_PREFIX) == 0) {
                log_files.push_back(entry.path().string());
            }
        }
    }
    // Zero-padded indices sort lexicographically
    std::sort(log_files.begin(), log_files.end());
    return log_files;
}

void CommitLog::openLogFile() {
    log_filename = generateLogFilename(current_file_index);
    log_file.open(log_filename, std::ios::binary | std::ios::app);
    if (!log_file.is_open()) {
        throw std::runtime_error("Cannot open log file: " + log_filename);
    }

    // Get current file size
    log_file.seekp(0, std::ios::end);
    current_log_size = static_cast<uint64_t>(log_file.tellp());
}

void CommitLog::writeEntry(const LogEntry& entry) {
    auto serialized = entry.serialize();

    log_file.write(reinterpret_cast<const char*>(serialized.data()), serialized.size());
    log_file.flush();
    if (!log_file) {
        throw std::runtime_error("Failed to write log entry to " + log_filename);
    }

    current_log_size += serialized.size();
    total_entries_written++;
    total_bytes_written += serialized.size();

    if (current_log_size >= max_log_size) {
        rotateLog();
    }
}

void CommitLog::rotateLog() {
    log_file.close();
    current_file_index++;
    openLogFile();
}

void CommitLog::logInsert(const Face& face) {
    InsertOperation op{face.id(), face.race(), face.emotion(), face.oldness()};
    LogEntry entry(LogEntryType::INSERT, next_sequence_number++, op.serialize());
    writeEntry(entry);
}

void CommitLog::logTruncate() {
    LogEntry entry(LogEntryType::TRUNCATE, next_sequence_number++, std::vector<uint8_t>());
    writeEntry(entry);
}

void CommitLog::flush() {
    if (log_file.is_open()) {
        log_file.flush();
    }
}

CommitLog::Statistics CommitLog::getStatistics() const {
    Statistics stats;
    stats.total_entries = total_entries_written;
    stats.total_bytes = total_bytes_written;
    stats.next_sequence = next_sequence_number;
    stats.current_log_size = current_log_size;
    stats.current_file_index = current_file_index;
    return stats;
}

std::vector<LogEntry> CommitLog::readAllEntries() const {
    std::vector<LogEntry> entries;

    for (const auto& file_path : listLogFiles()) {
        std::ifstream file(file_path, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open log file for reading: " + file_path);
        }

        std::vector<uint8_t> buffer((std::istreambuf_iterator<char>(file)),
                                    std::istreambuf_iterator<char>());

        size_t offset = 0;
        while (offset < buffer.size()) {
            if (offset + LogEntry::HEADER_SIZE > buffer.size()) {
                std::cerr << "[commit-log] Warning: truncated entry header in "
                          << file_path << " at offset " << offset << std::endl;
                break;
            }

            uint32_t data_length;
            std::memcpy(&data_length, buffer.data() + offset + LogEntry::HEADER_SIZE - sizeof(uint32_t),
                        sizeof(data_length));

            size_t entry_size = LogEntry::HEADER_SIZE + data_length;
            if (offset + entry_size > buffer.size()) {
                std::cerr << "[commit-log] Warning: truncated entry in "
                          << file_path << " at offset " << offset << std::endl;
                break;
            }

            std::vector<uint8_t> entry_data(buffer.begin() + offset, buffer.begin() + offset + entry_size);
            LogEntry entry = LogEntry::deserialize(entry_data);
            if (entry.isValid()) {
                entries.push_back(entry);
            } else {
                std::cerr << "[commit-log] Warning: skipping corrupt entry in "
                          << file_path << " at offset " << offset << std::endl;
            }

            offset += entry_size;
        }
    }

    return entries;
}

void CommitLog::reset() {
    if (log_file.is_open()) {
        log_file.close();
    }

    for (const auto& file_path : listLogFiles()) {
        std::filesystem::remove(file_path);
    }

    next_sequence_number = 1;
    current_file_index = 1;
    current_log_size = 0;
    total_entries_written = 0;
    total_bytes_written = 0;

    openLogFile();
}
