#include "reconciler.hpp"

#include <algorithm>

#include "errors.hpp"

namespace {
// Upper bound on one wait so a missed wake-up never stalls shutdown.
constexpr std::chrono::milliseconds kMaxIdleWait{250};
}

Reconciler::Reconciler(FileIndex& index,
                       PeerRegistry& registry,
                       SyncLedger& ledger,
                       TransferClient& client,
                       ActiveFlag& active,
                       std::chrono::milliseconds interval,
                       std::shared_ptr<Logger> logger)
  : index_(index),
    registry_(registry),
    ledger_(ledger),
    client_(client),
    active_(active),
    interval_(interval),
    logger_(std::move(logger)) {
}

Reconciler::~Reconciler() {
  stop();
}

std::vector<SyncAction> Reconciler::plan(const std::string& peer,
                                         const FileMap& local,
                                         const FileMap& remote,
                                         const SyncLedger& ledger,
                                         std::size_t* skipped) {
  std::vector<SyncAction> actions;
  std::size_t suppressed = 0;

  auto add = [&](SyncAction::Kind kind, const FileRecord& record) {
    if(ledger.contains(peer, record.name, record.hash)) {
      ++suppressed;
      return;
    }
    SyncAction action;
    action.kind = kind;
    action.filename = record.name;
    action.hash = record.hash;
    action.size = record.size;
    actions.push_back(std::move(action));
  };

  for(const auto& [name, theirs] : remote) {
    auto it = local.find(name);
    if(it == local.end()) {
      add(SyncAction::Kind::Pull, theirs);
    } else if(it->second.hash != theirs.hash) {
      if(theirs.hash > it->second.hash) {
        add(SyncAction::Kind::Pull, theirs);
      } else {
        add(SyncAction::Kind::Push, it->second);
      }
    }
  }
  for(const auto& [name, ours] : local) {
    if(remote.find(name) == remote.end()) {
      add(SyncAction::Kind::Push, ours);
    }
  }

  if(skipped) *skipped = suppressed;
  return actions;
}

SyncReport Reconciler::sync_peer(const PeerAddress& peer) {
  std::lock_guard lg(sync_m_);
  SyncReport report;
  const std::string key = peer.str();
  ++peer_syncs_;

  try {
    auto remote = client_.fetch_listing(peer);
    auto local = index_.snapshot();
    auto actions = plan(key, local, remote, ledger_, &report.skipped);
    skipped_ += report.skipped;
    if(!actions.empty()) {
      log_info(logger_.get(), "{}: {} transfer(s) planned", key, actions.size());
    }

    for(const auto& action : actions) {
      if(!active_.active()) throw NetworkError("node is shutting down");
      if(action.kind == SyncAction::Kind::Pull) {
        client_.pull(peer, action.filename, action.size, action.hash);
        index_.invalidate();
        ++report.pulled;
        ++files_pulled_;
      } else {
        client_.push(peer, action.filename);
        ++report.pushed;
        ++files_pushed_;
      }
      ledger_.record(key, action.filename, action.hash);
    }
  } catch(const SyncError& e) {
    report.failed = true;
    report.error = e.what();
    ++peer_failures_;
    log_warn(logger_.get(), "Sync with {} abandoned: {}", key, e.what());
  } catch(const std::exception& e) {
    report.failed = true;
    report.error = e.what();
    ++peer_failures_;
    log_error(logger_.get(), "Sync with {} failed unexpectedly: {}", key, e.what());
  }
  return report;
}

void Reconciler::run_cycle() {
  ++cycles_;
  for(const auto& peer : registry_.snapshot()) {
    if(!active_.active()) break;
    sync_peer(peer);
  }
}

void Reconciler::request_sync(const PeerAddress& peer) {
  {
    std::lock_guard lg(pending_m_);
    if(std::find(pending_.begin(), pending_.end(), peer) != pending_.end()) return;
    pending_.push_back(peer);
  }
  pending_cv_.notify_all();
}

bool Reconciler::pop_pending(PeerAddress& peer) {
  std::lock_guard lg(pending_m_);
  if(pending_.empty()) return false;
  peer = pending_.front();
  pending_.pop_front();
  return true;
}

void Reconciler::start() {
  if(thread_.joinable()) return;
  thread_ = std::thread([this](){ loop(); });
}

void Reconciler::stop() {
  pending_cv_.notify_all();
  if(thread_.joinable()) thread_.join();
}

Reconciler::Stats Reconciler::stats() const {
  Stats s;
  s.cycles = cycles_.load();
  s.peer_syncs = peer_syncs_.load();
  s.peer_failures = peer_failures_.load();
  s.files_pulled = files_pulled_.load();
  s.files_pushed = files_pushed_.load();
  s.skipped = skipped_.load();
  return s;
}

void Reconciler::loop() {
  auto next_cycle = std::chrono::steady_clock::now();
  while(active_.active()) {
    PeerAddress peer;
    while(active_.active() && pop_pending(peer)) {
      log_debug(logger_.get(), "Immediate sync with new peer {}", peer.str());
      sync_peer(peer);
    }
    if(!active_.active()) break;

    auto now = std::chrono::steady_clock::now();
    if(now >= next_cycle) {
      run_cycle();
      next_cycle = std::chrono::steady_clock::now() + interval_;
      continue;
    }

    std::unique_lock lock(pending_m_);
    auto wake = std::min(next_cycle, now + kMaxIdleWait);
    pending_cv_.wait_until(lock, wake, [this]{
      return !pending_.empty() || !active_.active();
    });
  }
  log_debug(logger_.get(), "Reconciliation loop finished");
}
