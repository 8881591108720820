#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

class Logger;

// In-progress transfer destination inside the shared directory, named
// ".tmp.<random>" so the index never lists it and any name that fits NAME_MAX
// can be staged. commit() renames it onto the final name; a StagingFile
// destroyed without commit() removes its file.
class StagingFile {
public:
  StagingFile(const std::filesystem::path& directory,
              const std::string& final_name,
              std::shared_ptr<Logger> logger = nullptr);
  ~StagingFile();

  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;

  void append(const char* data, std::size_t size);
  void write_at(uint64_t offset, const char* data, std::size_t size);

  // Makes everything written so far visible to readers of path().
  void flush();
  // Flushes, closes and renames over the final name (overwriting it).
  void commit();
  void discard();

  uint64_t bytes_written() const { return bytes_written_; }
  const std::filesystem::path& path() const { return staging_path_; }
  const std::filesystem::path& final_path() const { return final_path_; }
  bool committed() const { return committed_; }

private:
  std::filesystem::path staging_path_;
  std::filesystem::path final_path_;
  std::fstream out_;
  uint64_t bytes_written_ = 0;
  bool committed_ = false;
  bool discarded_ = false;
  std::shared_ptr<Logger> logger_;
};

// Removes staging files left behind by an earlier run. Returns the number removed.
std::size_t purge_staging_files(const std::filesystem::path& directory, Logger* logger = nullptr);
