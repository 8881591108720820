#include "staging_file.hpp"

#include <system_error>

#include "errors.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "utils.hpp"

StagingFile::StagingFile(const std::filesystem::path& directory,
                         const std::string& final_name,
                         std::shared_ptr<Logger> logger)
  : staging_path_(directory / (std::string(kStagingPrefix) + random_hex(8))),
    final_path_(directory / final_name),
    logger_(std::move(logger)) {
  out_.open(staging_path_, std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc);
  if(!out_) {
    throw FilesystemError("cannot create staging file " + staging_path_.string());
  }
}

StagingFile::~StagingFile() {
  if(!committed_) discard();
}

void StagingFile::append(const char* data, std::size_t size) {
  write_at(bytes_written_, data, size);
}

void StagingFile::write_at(uint64_t offset, const char* data, std::size_t size) {
  if(committed_ || discarded_) {
    throw FilesystemError("staging file " + staging_path_.string() + " is closed");
  }
  out_.seekp(static_cast<std::streamoff>(offset));
  out_.write(data, static_cast<std::streamsize>(size));
  if(!out_) {
    throw FilesystemError("write failed on " + staging_path_.string());
  }
  if(offset + size > bytes_written_) bytes_written_ = offset + size;
}

void StagingFile::flush() {
  out_.flush();
  if(!out_) {
    throw FilesystemError("flush failed on " + staging_path_.string());
  }
}

void StagingFile::commit() {
  if(committed_) return;
  if(discarded_) {
    throw FilesystemError("staging file " + staging_path_.string() + " was discarded");
  }
  out_.flush();
  bool ok = static_cast<bool>(out_);
  out_.close();
  if(!ok) {
    discard();
    throw FilesystemError("flush failed on " + staging_path_.string());
  }

  std::error_code ec;
  std::filesystem::rename(staging_path_, final_path_, ec);
  if(ec) {
    discard();
    throw FilesystemError("cannot install " + final_path_.filename().string() + ": " + ec.message());
  }
  committed_ = true;
}

void StagingFile::discard() {
  if(discarded_ || committed_) return;
  discarded_ = true;
  if(out_.is_open()) out_.close();
  std::error_code ec;
  std::filesystem::remove(staging_path_, ec);
  if(ec) {
    log_warn(logger_.get(), "Unable to remove staging file {}: {}", staging_path_.string(), ec.message());
  }
}

std::size_t purge_staging_files(const std::filesystem::path& directory, Logger* logger) {
  std::size_t removed = 0;
  std::error_code ec;
  std::filesystem::directory_iterator it(directory, ec);
  if(ec) return 0;
  for(const auto& entry : it) {
    auto name = entry.path().filename().string();
    if(!is_staging_name(name)) continue;
    std::error_code rm_ec;
    if(std::filesystem::remove(entry.path(), rm_ec)) {
      ++removed;
    } else if(rm_ec) {
      log_warn(logger, "Unable to remove stale staging file {}: {}", name, rm_ec.message());
    }
  }
  if(removed > 0) {
    log_info(logger, "Removed {} stale staging file(s)", removed);
  }
  return removed;
}
