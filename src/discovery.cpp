#include "discovery.hpp"

#include <array>

#include "peer_registry.hpp"
#include "protocol.hpp"
#include "utils.hpp"

namespace {
constexpr std::chrono::milliseconds kReceivePoll{250};
constexpr std::size_t kMaxDatagram = 1024;
}

Discovery::Discovery(PeerRegistry& registry,
                     ActiveFlag& active,
                     Options options,
                     std::shared_ptr<Logger> logger)
  : registry_(registry),
    active_(active),
    options_(std::move(options)),
    logger_(std::move(logger)) {
  if(options_.local_ip.empty()) {
    options_.local_ip = detect_local_ip();
  }
}

Discovery::~Discovery() {
  stop();
}

void Discovery::start() {
  if(send_socket_) return;

  auto group = asio::ip::make_address(options_.group);
  group_endpoint_ = udp::endpoint(group, options_.port);

  send_socket_ = std::make_unique<udp::socket>(send_io_, udp::endpoint(group.is_v6() ? udp::v6() : udp::v4(), 0));
  send_socket_->set_option(asio::ip::multicast::hops(options_.hops));
  send_socket_->set_option(asio::ip::multicast::enable_loopback(true));

  recv_socket_ = std::make_unique<udp::socket>(recv_io_);
  udp::endpoint listen_endpoint(group.is_v6() ? udp::v6() : udp::v4(), options_.port);
  recv_socket_->open(listen_endpoint.protocol());
  recv_socket_->set_option(udp::socket::reuse_address(true));
  recv_socket_->bind(listen_endpoint);

  if(options_.interface_ip.empty()) {
    recv_socket_->set_option(asio::ip::multicast::join_group(group));
  } else {
    auto iface = asio::ip::make_address_v4(options_.interface_ip);
    send_socket_->set_option(asio::ip::multicast::outbound_interface(iface));
    recv_socket_->set_option(asio::ip::multicast::join_group(group.to_v4(), iface));
  }

  log_info(logger_.get(), "Discovery on {}:{} via {} (local address {})",
           options_.group, options_.port,
           options_.interface_ip.empty() ? std::string("default route") : options_.interface_ip,
           options_.local_ip);

  beacon_thread_ = std::thread([this](){ beacon_loop(); });
  listen_thread_ = std::thread([this](){ listen_loop(); });
}

void Discovery::stop() {
  if(beacon_thread_.joinable()) beacon_thread_.join();
  if(listen_thread_.joinable()) listen_thread_.join();

  std::error_code ignored;
  if(recv_socket_) {
    recv_socket_->close(ignored);
    recv_socket_.reset();
  }
  if(send_socket_) {
    send_socket_->close(ignored);
    send_socket_.reset();
  }
}

Discovery::Stats Discovery::stats() const {
  Stats s;
  s.beacons_sent = beacons_sent_.load();
  s.datagrams_received = datagrams_received_.load();
  s.datagrams_ignored = datagrams_ignored_.load();
  return s;
}

bool Discovery::handle_datagram(const std::string& payload, const std::string& sender_ip) {
  ++datagrams_received_;
  if(payload != kBeaconPayload || sender_ip.empty() || sender_ip == options_.local_ip) {
    ++datagrams_ignored_;
    return false;
  }
  if(registry_.admit(PeerAddress{sender_ip, options_.peer_port})) {
    log_info(logger_.get(), "Discovered peer {}:{}", sender_ip, options_.peer_port);
  }
  return true;
}

void Discovery::beacon_loop() {
  const std::string payload = kBeaconPayload;
  while(active_.active()) {
    std::error_code ec;
    send_socket_->send_to(asio::buffer(payload), group_endpoint_, 0, ec);
    if(ec) {
      log_warn(logger_.get(), "Beacon send failed: {}", ec.message());
    } else {
      ++beacons_sent_;
    }
    active_.sleep_for(options_.beacon_interval);
  }
  log_debug(logger_.get(), "Beacon loop finished");
}

void Discovery::listen_loop() {
  std::array<char, kMaxDatagram> buffer{};
  while(active_.active()) {
    udp::endpoint sender;
    std::error_code recv_ec = asio::error::would_block;
    std::size_t length = 0;
    recv_socket_->async_receive_from(asio::buffer(buffer), sender,
      [&](const std::error_code& ec, std::size_t n){
        recv_ec = ec;
        length = n;
      });

    recv_io_.restart();
    recv_io_.run_for(kReceivePoll);
    if(!recv_io_.stopped()) {
      std::error_code ignored;
      recv_socket_->cancel(ignored);
      recv_io_.restart();
      recv_io_.run();
    }

    if(recv_ec == asio::error::operation_aborted || recv_ec == asio::error::would_block) {
      continue;
    }
    if(recv_ec) {
      log_warn(logger_.get(), "Discovery receive failed: {}", recv_ec.message());
      active_.sleep_for(kReceivePoll);
      continue;
    }

    try {
      handle_datagram(std::string(buffer.data(), length), sender.address().to_string());
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Discovery datagram from {} not handled: {}",
               sender.address().to_string(), e.what());
    }
  }
  log_debug(logger_.get(), "Listen loop finished");
}
