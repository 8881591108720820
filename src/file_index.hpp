#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

class Logger;

struct FileRecord {
    std::string name;
    std::string hash; // hex
    uint64_t size = 0;
};

using FileMap = std::map<std::string, FileRecord>; // name -> record

// Cached name -> (hash, size) snapshot of the regular files directly inside the
// shared directory. A snapshot younger than scan_interval is returned as is;
// an older one is replaced by a full rescan. Staging files are never listed.
class FileIndex {
public:
    FileIndex(std::filesystem::path directory,
              std::size_t block_size,
              std::chrono::milliseconds scan_interval,
              std::shared_ptr<Logger> logger = nullptr);

    FileMap snapshot();

    // Forces the next snapshot() to rescan (after a local file was installed).
    void invalidate();

    const std::filesystem::path& directory() const { return directory_; }
    std::size_t block_size() const { return block_size_; }
    uint64_t scan_count() const;

private:
    bool fresh_locked(std::chrono::steady_clock::time_point now) const;
    FileMap scan() const;

    std::filesystem::path directory_;
    std::size_t block_size_;
    std::chrono::milliseconds scan_interval_;
    std::shared_ptr<Logger> logger_;

    std::mutex scan_m_; // one scan at a time
    mutable std::mutex m_;
    FileMap files_;
    bool scanned_ = false;
    std::chrono::steady_clock::time_point last_scan_at_;
    uint64_t scan_count_ = 0;
};
