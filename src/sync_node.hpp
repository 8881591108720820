#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "active_flag.hpp"
#include "discovery.hpp"
#include "log.hpp"
#include "peer_registry.hpp"
#include "reconciler.hpp"
#include "transfer_server.hpp"

class SettingsManager;

class SyncNode {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    // Address used to recognise our own beacons; detected when empty.
    std::string local_ip;
  };

  SyncNode(std::shared_ptr<SettingsManager> settings, Options options);
  ~SyncNode();

  // Validates the settings, prepares the shared directory, binds the transfer
  // server and starts every background loop. Throws on a startup error.
  void start();
  // Blocks until request_stop() or stop().
  void run();
  // Safe from any thread, including a signal handler's completion.
  void request_stop();
  // Clears the active flag and joins every thread.
  void stop();

  // One reconciliation with `peer` on the calling thread.
  SyncReport sync_now(const PeerAddress& peer);

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t ledger_entries = 0;
    TransferServer::Stats server;
    TransferClient::Stats client;
    Reconciler::Stats reconciler;
  };

  Stats stats() const;

  bool running() const { return started_ && active_.active(); }
  uint16_t listen_port() const { return listen_port_; }
  PeerAddress self_address() const;
  const std::filesystem::path& shared_dir() const { return shared_dir_; }

  FileIndex& index() { return *index_; }
  PeerRegistry& registry() { return *registry_; }
  SyncLedger& ledger() { return *ledger_; }
  Reconciler& reconciler() { return *reconciler_; }
  TransferServer& server() { return *server_; }
  TransferClient& client() { return *client_; }
  Discovery* discovery() { return discovery_.get(); }

private:
  void ensure_shared_dir();
  void admit_static_peers(uint16_t default_port);
  void start_discovery_locked(const Discovery::Options& discovery_options);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  ActiveFlag active_;
  std::mutex lifecycle_m_;
  bool started_ = false;

  std::filesystem::path shared_dir_;
  uint16_t listen_port_ = 0;

  std::unique_ptr<FileIndex> index_;
  std::unique_ptr<PeerRegistry> registry_;
  std::unique_ptr<SyncLedger> ledger_;
  std::unique_ptr<TransferServer> server_;
  std::unique_ptr<TransferClient> client_;
  std::unique_ptr<Reconciler> reconciler_;
  std::unique_ptr<Discovery> discovery_;
};
