#include "file_index.hpp"

#include <system_error>

#include "content_hasher.hpp"
#include "log.hpp"
#include "protocol.hpp"

FileIndex::FileIndex(std::filesystem::path directory,
                     std::size_t block_size,
                     std::chrono::milliseconds scan_interval,
                     std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)),
      block_size_(block_size),
      scan_interval_(scan_interval),
      logger_(std::move(logger))
{
}

bool FileIndex::fresh_locked(std::chrono::steady_clock::time_point now) const {
    return scanned_ && now - last_scan_at_ < scan_interval_;
}

FileMap FileIndex::snapshot(){
    {
        std::lock_guard lg(m_);
        if(fresh_locked(std::chrono::steady_clock::now())) return files_;
    }

    std::lock_guard scan_lock(scan_m_);
    {
        // another caller may have finished a scan while we waited
        std::lock_guard lg(m_);
        if(fresh_locked(std::chrono::steady_clock::now())) return files_;
    }

    auto started = std::chrono::steady_clock::now();
    try {
        FileMap fresh = scan();
        std::lock_guard lg(m_);
        files_ = std::move(fresh);
        scanned_ = true;
        last_scan_at_ = started;
        ++scan_count_;
        return files_;
    } catch(const std::exception& e) {
        log_error(logger_.get(), "Cannot scan {}: {}", directory_.string(), e.what());
        std::lock_guard lg(m_);
        scanned_ = true;
        last_scan_at_ = started;
        return files_;
    }
}

void FileIndex::invalidate(){
    std::lock_guard lg(m_);
    scanned_ = false;
}

uint64_t FileIndex::scan_count() const {
    std::lock_guard lg(m_);
    return scan_count_;
}

FileMap FileIndex::scan() const {
    FileMap out;
    for(const auto& entry : std::filesystem::directory_iterator(directory_)){
        std::error_code ec;
        if(!entry.is_regular_file(ec) || ec) continue;

        auto name = entry.path().filename().string();
        if(!is_transferable_name(name)) continue;

        auto size = entry.file_size(ec);
        if(ec){
            log_debug(logger_.get(), "Skipping {}: {}", name, ec.message());
            continue;
        }
        std::string hash;
        try {
            hash = hash_file(entry.path(), block_size_);
        } catch(const std::exception& e) {
            log_warn(logger_.get(), "Skipping {}: {}", name, e.what());
            continue;
        }
        if(hash.empty()) continue; // vanished or unreadable

        FileRecord record;
        record.name = name;
        record.hash = std::move(hash);
        record.size = size;
        out.emplace(name, std::move(record));
    }
    log_debug(logger_.get(), "Indexed {} file(s) in {}", out.size(), directory_.string());
    return out;
}
