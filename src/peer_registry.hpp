#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "log.hpp"

struct PeerAddress {
  std::string host;
  uint16_t port = 0;

  // "host:port", with IPv6 hosts bracketed
  std::string str() const;

  bool operator==(const PeerAddress& other) const { return host == other.host && port == other.port; }
  bool operator!=(const PeerAddress& other) const { return !(*this == other); }
  bool operator<(const PeerAddress& other) const {
    return host != other.host ? host < other.host : port < other.port;
  }
};

// Accepts "host", "host:port" and "[v6]:port"; the port defaults to default_port.
std::optional<PeerAddress> parse_peer_address(const std::string& text, uint16_t default_port);

// Set of every peer seen during the process lifetime. Peers are never evicted.
class PeerRegistry {
public:
  using AdmitCallback = std::function<void(const PeerAddress&)>;

  explicit PeerRegistry(std::shared_ptr<Logger> logger = nullptr);

  // Idempotent. Returns true and fires the admit callback (outside the lock)
  // only for a peer not seen before.
  bool admit(const PeerAddress& peer);

  bool contains(const PeerAddress& peer) const;
  std::vector<PeerAddress> snapshot() const;
  std::size_t size() const;

  void set_admit_callback(AdmitCallback cb);

private:
  mutable std::mutex m_;
  std::set<PeerAddress> peers_;
  AdmitCallback on_admit_;
  std::shared_ptr<Logger> logger_;
};
