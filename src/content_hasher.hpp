#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

// Lowercase hex SHA-256 of a file's bytes, read sequentially in blocks of
// block_size. Returns "" if the file cannot be opened; callers treat the empty
// hash as "absent". Throws FilesystemError if reading fails part-way.
std::string hash_file(const std::filesystem::path& path, std::size_t block_size);

// SHA-256 of an in-memory buffer, same encoding as hash_file.
std::string hash_bytes(const std::string& data);
