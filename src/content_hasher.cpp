#include "content_hasher.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <memory>
#include <vector>

#include "errors.hpp"
#include "utils.hpp"

namespace {

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using DigestContext = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

class Sha256 {
public:
  Sha256() : ctx_(EVP_MD_CTX_new()) {
    if(!ctx_ || EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("SHA-256 initialisation failed");
    }
  }

  void update(const char* data, std::size_t size) {
    if(EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
      throw std::runtime_error("SHA-256 update failed");
    }
  }

  std::string hex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if(EVP_DigestFinal_ex(ctx_.get(), digest, &length) != 1) {
      throw std::runtime_error("SHA-256 finalisation failed");
    }
    return hex_from_bytes(digest, length);
  }

private:
  DigestContext ctx_;
};

} // namespace

std::string hash_file(const std::filesystem::path& path, std::size_t block_size) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return "";

  Sha256 sha;
  std::vector<char> buffer(block_size > 0 ? block_size : 8192);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = in.gcount();
    if(read > 0) {
      sha.update(buffer.data(), static_cast<std::size_t>(read));
    }
  }
  if(in.bad()) {
    throw FilesystemError("read failed while hashing " + path.string());
  }
  return sha.hex();
}

std::string hash_bytes(const std::string& data) {
  Sha256 sha;
  sha.update(data.data(), data.size());
  return sha.hex();
}
