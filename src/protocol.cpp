#include "protocol.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <tuple>

#include "errors.hpp"

namespace {

uint64_t parse_number(const std::string& text, const char* what) {
  if(text.empty() || text.size() > 20 ||
     !std::all_of(text.begin(), text.end(), [](unsigned char ch){ return std::isdigit(ch); })) {
    throw ProtocolError(std::string("invalid ") + what + " '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch(const std::out_of_range&) {
    throw ProtocolError(std::string(what) + " out of range '" + text + "'");
  }
}

// "<verb>:<name>:<number>" with the name allowed to contain ':'.
std::pair<std::string, uint64_t> split_name_and_number(const std::string& args,
                                                       const std::string& verb,
                                                       const char* what) {
  auto last = args.rfind(':');
  if(last == std::string::npos) {
    throw ProtocolError(verb + " expects <name>:<" + what + ">");
  }
  std::string name = args.substr(0, last);
  if(auto reason = name_rejection_reason(name)) {
    throw ProtocolError(verb + " rejected file name '" + name + "': " + *reason);
  }
  return {name, parse_number(args.substr(last + 1), what)};
}

} // namespace

std::string format_list_request() {
  return "LIST";
}

std::string format_prepare_request(const std::string& filename, uint64_t size) {
  return "PREPARE:" + filename + ":" + std::to_string(size);
}

std::string format_chunk_request(const std::string& filename, uint64_t block_index) {
  return "CHUNK:" + filename + ":" + std::to_string(block_index);
}

Request parse_request(const std::string& line) {
  Request req;
  auto colon = line.find(':');
  std::string verb = line.substr(0, colon);
  std::string args = colon == std::string::npos ? std::string() : line.substr(colon + 1);

  if(verb == "LIST") {
    req.verb = Request::Verb::List;
  } else if(verb == "PREPARE") {
    req.verb = Request::Verb::Prepare;
    std::tie(req.filename, req.size) = split_name_and_number(args, verb, "size");
  } else if(verb == "CHUNK") {
    req.verb = Request::Verb::Chunk;
    std::tie(req.filename, req.block_index) = split_name_and_number(args, verb, "block index");
  } else {
    throw ProtocolError("unknown request verb '" + verb.substr(0, 32) + "'");
  }
  return req;
}

std::string encode_listing(const FileMap& files) {
  json doc = json::object();
  for(const auto& [name, record] : files) {
    doc[name] = {{"hash", record.hash}, {"size", record.size}};
  }
  return doc.dump();
}

FileMap decode_listing(const std::string& body) {
  json doc;
  try {
    doc = json::parse(body);
  } catch(const json::parse_error& e) {
    throw ProtocolError(std::string("malformed listing: ") + e.what());
  }
  if(!doc.is_object()) {
    throw ProtocolError("malformed listing: expected an object");
  }

  FileMap files;
  for(const auto& item : doc.items()) {
    const auto& entry = item.value();
    if(!entry.is_object() || !entry.contains("hash") || !entry.contains("size") ||
       !entry["hash"].is_string() || !entry["size"].is_number_unsigned()) {
      throw ProtocolError("malformed listing entry for '" + item.key() + "'");
    }
    if(!is_transferable_name(item.key())) continue;
    FileRecord record;
    record.name = item.key();
    record.hash = entry["hash"].get<std::string>();
    record.size = entry["size"].get<uint64_t>();
    files.emplace(record.name, std::move(record));
  }
  return files;
}

bool is_staging_name(const std::string& name) {
  return name.rfind(kStagingPrefix, 0) == 0;
}

std::optional<std::string> name_rejection_reason(const std::string& name) {
  if(name.empty()) return std::string("empty name");
  if(name == "." || name == "..") return std::string("reserved name");
  if(name.find_first_of(std::string("/\\\n\r\0", 5)) != std::string::npos) {
    return std::string("name must be a plain file name");
  }
  if(is_staging_name(name)) return std::string("staging names are private");
  return std::nullopt;
}

uint64_t block_count(uint64_t size, uint64_t block_size) {
  if(block_size == 0) return 0;
  return size / block_size + (size % block_size != 0 ? 1 : 0);
}

uint64_t block_length(uint64_t size, uint64_t block_size, uint64_t index) {
  if(block_size == 0 || index >= block_count(size, block_size)) return 0;
  uint64_t offset = index * block_size;
  return std::min<uint64_t>(block_size, size - offset);
}
