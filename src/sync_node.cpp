#include "sync_node.hpp"

#include <stdexcept>

#include "discovery.hpp"
#include "file_index.hpp"
#include "settings_manager.hpp"
#include "staging_file.hpp"
#include "sync_ledger.hpp"
#include "transfer_client.hpp"
#include "utils.hpp"

namespace {

constexpr uint16_t kDefaultPeerPort = 5005;
constexpr std::chrono::milliseconds kRunPoll{1000};

std::chrono::milliseconds seconds_setting(int value) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(value));
}

} // namespace

SyncNode::SyncNode(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("lansync")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

SyncNode::~SyncNode() {
  stop();
}

void SyncNode::ensure_shared_dir() {
  std::filesystem::path configured = settings_->get<std::string>("shared_dir");
  if(configured.empty()) {
    throw std::runtime_error("Invalid shared_dir (empty)");
  }
  shared_dir_ = configured.is_absolute() ? configured : options_.workspace_root / configured;

  std::error_code ec;
  std::filesystem::create_directories(shared_dir_, ec);
  if(ec || !std::filesystem::is_directory(shared_dir_)) {
    logger_->error("Unable to create shared directory {}: {}", shared_dir_.string(), ec.message());
    throw std::runtime_error("Unable to create shared directory " + shared_dir_.string());
  }
  purge_staging_files(shared_dir_, logger_.get());
}

void SyncNode::start() {
  std::lock_guard lg(lifecycle_m_);
  if(started_) return;

  init(settings_->get<bool>("verbose"));

  const int block_size = settings_->get<int>("block_size");
  const int peer_port = settings_->get<int>("peer_port");
  const int multicast_port = settings_->get<int>("multicast_port");
  const auto sync_interval = seconds_setting(settings_->get<int>("sync_interval"));
  const auto scan_interval = seconds_setting(settings_->get<int>("scan_interval"));
  const auto beacon_interval = seconds_setting(settings_->get<int>("beacon_interval"));
  const auto connect_timeout = seconds_setting(settings_->get<int>("connect_timeout"));
  const auto transfer_timeout = seconds_setting(settings_->get<int>("transfer_timeout"));
  const uint16_t default_peer_port = peer_port != 0 ? static_cast<uint16_t>(peer_port) : kDefaultPeerPort;

  ensure_shared_dir();
  active_.reset();

  try {
    index_ = std::make_unique<FileIndex>(shared_dir_, static_cast<std::size_t>(block_size), scan_interval, logger_);
    registry_ = std::make_unique<PeerRegistry>(logger_);
    ledger_ = std::make_unique<SyncLedger>();

    TransferServer::Options server_options;
    server_options.listen_ip = settings_->get<std::string>("listen_ip");
    server_options.port = static_cast<uint16_t>(peer_port);
    server_options.block_size = static_cast<std::size_t>(block_size);
    server_options.io_timeout = transfer_timeout;
    server_options.admit_inbound_peers = settings_->get<bool>("admit_inbound_peers");
    server_options.inbound_peer_port = default_peer_port;
    server_ = std::make_unique<TransferServer>(*index_, active_, server_options, logger_, registry_.get());
    server_->start();
    listen_port_ = server_->port();
    logger_->set_name("node@" + std::to_string(listen_port_));

    TransferClient::Options client_options;
    client_options.block_size = static_cast<std::size_t>(block_size);
    client_options.connect_timeout = connect_timeout;
    client_options.io_timeout = transfer_timeout;
    client_ = std::make_unique<TransferClient>(shared_dir_, client_options, logger_, &active_);

    reconciler_ = std::make_unique<Reconciler>(*index_, *registry_, *ledger_, *client_,
                                               active_, sync_interval, logger_);
    registry_->set_admit_callback([this](const PeerAddress& peer){
      reconciler_->request_sync(peer);
    });

    admit_static_peers(default_peer_port);

    if(settings_->get<bool>("discovery")) {
      Discovery::Options discovery_options;
      discovery_options.group = settings_->get<std::string>("multicast_group");
      discovery_options.port = static_cast<uint16_t>(multicast_port);
      discovery_options.peer_port = listen_port_;
      discovery_options.beacon_interval = beacon_interval;
      discovery_options.local_ip = options_.local_ip;
      // a server bound to one IPv4 interface announces on that interface only
      auto listen_ip = settings_->get<std::string>("listen_ip");
      std::error_code ec;
      auto bound = asio::ip::make_address(listen_ip, ec);
      if(!ec && bound.is_v4() && !bound.is_unspecified()) {
        discovery_options.interface_ip = listen_ip;
      }
      start_discovery_locked(discovery_options);
    }

    reconciler_->start();
  } catch(...) {
    // unwind whatever was already running before reporting the failure
    active_.stop();
    if(reconciler_) reconciler_->stop();
    if(discovery_) discovery_->stop();
    if(server_) server_->stop();
    throw;
  }
  started_ = true;
  logger_->info("Sharing {} on port {} (block size {} bytes)", shared_dir_.string(), listen_port_, block_size);
}

void SyncNode::start_discovery_locked(const Discovery::Options& discovery_options) {
  discovery_ = std::make_unique<Discovery>(*registry_, active_, discovery_options, logger_);
  try {
    discovery_->start();
  } catch(const std::exception& e) {
    // the node still syncs with static and inbound peers
    logger_->error("Discovery unavailable: {}", e.what());
    discovery_.reset();
  }
}

void SyncNode::admit_static_peers(uint16_t default_port) {
  for(const auto& entry : split_list(settings_->get<std::string>("peers"), ',')) {
    auto peer = parse_peer_address(entry, default_port);
    if(!peer) {
      logger_->error("Ignoring invalid peer '{}' (expected host[:port])", entry);
      continue;
    }
    if(registry_->admit(*peer)) {
      logger_->info("Static peer {}", peer->str());
    }
  }
}

void SyncNode::run() {
  if(!started_) start();
  while(active_.active()) {
    active_.sleep_for(kRunPoll);
  }
}

void SyncNode::request_stop() {
  active_.stop();
}

void SyncNode::stop() {
  std::lock_guard lg(lifecycle_m_);
  if(!started_) return;
  started_ = false;

  active_.stop();
  if(reconciler_) reconciler_->stop();
  if(discovery_) discovery_->stop();
  if(server_) server_->stop();
  logger_->info("Stopped");
}

SyncReport SyncNode::sync_now(const PeerAddress& peer) {
  if(!reconciler_) {
    throw std::logic_error("sync_now() before start()");
  }
  return reconciler_->sync_peer(peer);
}

PeerAddress SyncNode::self_address() const {
  return PeerAddress{"127.0.0.1", listen_port_};
}

SyncNode::Stats SyncNode::stats() const {
  Stats s;
  if(registry_) s.known_peers = registry_->size();
  if(ledger_) s.ledger_entries = ledger_->size();
  if(server_) s.server = server_->stats();
  if(client_) s.client = client_->stats();
  if(reconciler_) s.reconciler = reconciler_->stats();
  return s;
}
