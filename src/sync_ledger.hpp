#pragma once
#include <mutex>
#include <set>
#include <string>
#include <tuple>

// (peer, file name, content hash) triples that were already reconciled. Keyed
// by hash, so new content under the same name is never suppressed.
class SyncLedger {
public:
  bool contains(const std::string& peer, const std::string& filename, const std::string& hash) const;
  // Returns false if the triple was already present.
  bool record(const std::string& peer, const std::string& filename, const std::string& hash);
  std::size_t size() const;

private:
  using Entry = std::tuple<std::string, std::string, std::string>;

  mutable std::mutex m_;
  std::set<Entry> entries_;
};
