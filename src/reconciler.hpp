#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "active_flag.hpp"
#include "file_index.hpp"
#include "log.hpp"
#include "peer_registry.hpp"
#include "sync_ledger.hpp"
#include "transfer_client.hpp"

struct SyncAction {
  enum class Kind { Pull, Push };

  Kind kind = Kind::Pull;
  std::string filename;
  std::string hash;   // content that ends up on both sides
  uint64_t size = 0;
};

struct SyncReport {
  std::size_t pulled = 0;
  std::size_t pushed = 0;
  std::size_t skipped = 0;  // already in the ledger
  bool failed = false;
  std::string error;
};

// Periodically diffs the local snapshot against every known peer's listing and
// resolves each difference with one pull or one push. When both sides hold a
// file under the same name the lexicographically greater hash wins.
class Reconciler {
public:
  struct Stats {
    uint64_t cycles = 0;
    uint64_t peer_syncs = 0;
    uint64_t peer_failures = 0;
    uint64_t files_pulled = 0;
    uint64_t files_pushed = 0;
    uint64_t skipped = 0;
  };

  Reconciler(FileIndex& index,
             PeerRegistry& registry,
             SyncLedger& ledger,
             TransferClient& client,
             ActiveFlag& active,
             std::chrono::milliseconds interval,
             std::shared_ptr<Logger> logger = nullptr);
  ~Reconciler();

  // Transfers needed to bring `peer` and the local directory together.
  // Actions whose (peer, name, hash) triple is already in the ledger are left
  // out and counted in *skipped when given.
  static std::vector<SyncAction> plan(const std::string& peer,
                                      const FileMap& local,
                                      const FileMap& remote,
                                      const SyncLedger& ledger,
                                      std::size_t* skipped = nullptr);

  // One synchronous reconciliation against `peer`. Errors are caught, logged
  // and reported; the rest of that peer's plan is abandoned.
  SyncReport sync_peer(const PeerAddress& peer);

  // Every peer in a registry snapshot, one after another.
  void run_cycle();

  // Queues an out-of-cycle reconciliation (used when a peer is first admitted).
  void request_sync(const PeerAddress& peer);

  void start();
  // Wakes and joins the loop; the caller clears the ActiveFlag first.
  void stop();

  Stats stats() const;

private:
  void loop();
  bool pop_pending(PeerAddress& peer);

  FileIndex& index_;
  PeerRegistry& registry_;
  SyncLedger& ledger_;
  TransferClient& client_;
  ActiveFlag& active_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<Logger> logger_;

  std::mutex sync_m_; // one peer reconciliation at a time

  std::mutex pending_m_;
  std::condition_variable pending_cv_;
  std::deque<PeerAddress> pending_;

  std::thread thread_;

  std::atomic<uint64_t> cycles_{0};
  std::atomic<uint64_t> peer_syncs_{0};
  std::atomic<uint64_t> peer_failures_{0};
  std::atomic<uint64_t> files_pulled_{0};
  std::atomic<uint64_t> files_pushed_{0};
  std::atomic<uint64_t> skipped_{0};
};
