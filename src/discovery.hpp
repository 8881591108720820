#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "active_flag.hpp"
#include "log.hpp"

class PeerRegistry;

// Multicast presence: a beacon thread announcing this node and a listener
// thread admitting every other node it hears into the PeerRegistry.
class Discovery {
public:
  struct Options {
    std::string group = "239.255.255.250";
    uint16_t port = 5007;
    uint16_t peer_port = 5005;        // TCP port recorded for discovered peers
    std::chrono::milliseconds beacon_interval{5000};
    int hops = 2;
    std::string local_ip;             // own beacons are ignored; detected when empty
    std::string interface_ip;         // IPv4 interface to send and join on; routing table when empty
  };

  struct Stats {
    uint64_t beacons_sent = 0;
    uint64_t datagrams_received = 0;
    uint64_t datagrams_ignored = 0;
  };

  Discovery(PeerRegistry& registry,
            ActiveFlag& active,
            Options options,
            std::shared_ptr<Logger> logger = nullptr);
  ~Discovery();

  // Opens both sockets (throws on failure) and starts the two threads.
  void start();
  // Joins the threads; the caller clears the ActiveFlag first.
  void stop();

  // Admits the sender when the payload is the beacon literal and the sender
  // is not this host. Returns true if the datagram was a foreign beacon.
  bool handle_datagram(const std::string& payload, const std::string& sender_ip);

  const std::string& local_ip() const { return options_.local_ip; }
  Stats stats() const;

private:
  using udp = asio::ip::udp;

  void beacon_loop();
  void listen_loop();

  PeerRegistry& registry_;
  ActiveFlag& active_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context send_io_;
  asio::io_context recv_io_;
  std::unique_ptr<udp::socket> send_socket_;
  std::unique_ptr<udp::socket> recv_socket_;
  udp::endpoint group_endpoint_;
  std::thread beacon_thread_;
  std::thread listen_thread_;

  std::atomic<uint64_t> beacons_sent_{0};
  std::atomic<uint64_t> datagrams_received_{0};
  std::atomic<uint64_t> datagrams_ignored_{0};
};
