#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include "file_index.hpp"

using json = nlohmann::json;

// protocol.hpp
// One request line per TCP connection:
//   LIST
//   PREPARE:<name>:<size>      -> READY | ERROR:<reason>, <size raw bytes>, DONE
//   CHUNK:<name>:<index>       -> raw block bytes, then close
inline constexpr const char* kBeaconPayload = "DISCOVER";
inline constexpr const char* kStagingPrefix = ".tmp.";
inline constexpr const char* kReadyToken = "READY";
inline constexpr const char* kDoneToken = "DONE";
inline constexpr const char* kErrorPrefix = "ERROR:";
inline constexpr std::size_t kMaxRequestLine = 4096;

struct Request {
  enum class Verb { List, Prepare, Chunk };

  Verb verb = Verb::List;
  std::string filename;
  uint64_t size = 0;         // PREPARE
  uint64_t block_index = 0;  // CHUNK
};

std::string format_list_request();
std::string format_prepare_request(const std::string& filename, uint64_t size);
std::string format_chunk_request(const std::string& filename, uint64_t block_index);

// Throws ProtocolError on an unknown verb, missing arguments, a bad number or
// a file name that is not transferable.
Request parse_request(const std::string& line);

std::string encode_listing(const FileMap& files);
// Entries whose name is not transferable are dropped; anything else that does
// not match {"name": {"hash": str, "size": uint}} throws ProtocolError.
FileMap decode_listing(const std::string& body);

bool is_staging_name(const std::string& name);
// nullopt when name is a plain file name that may cross the wire.
std::optional<std::string> name_rejection_reason(const std::string& name);
inline bool is_transferable_name(const std::string& name) { return !name_rejection_reason(name); }

uint64_t block_count(uint64_t size, uint64_t block_size);
// Length of block `index` of a file of `size` bytes; 0 past the end.
uint64_t block_length(uint64_t size, uint64_t block_size, uint64_t index);
