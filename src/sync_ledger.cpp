#include "sync_ledger.hpp"

bool SyncLedger::contains(const std::string& peer, const std::string& filename, const std::string& hash) const {
  std::lock_guard lg(m_);
  return entries_.count(Entry{peer, filename, hash}) > 0;
}

bool SyncLedger::record(const std::string& peer, const std::string& filename, const std::string& hash) {
  std::lock_guard lg(m_);
  return entries_.emplace(peer, filename, hash).second;
}

std::size_t SyncLedger::size() const {
  std::lock_guard lg(m_);
  return entries_.size();
}
