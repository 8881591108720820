#include "peer_registry.hpp"

#include <algorithm>
#include <cctype>
#include <exception>

#include "utils.hpp"

std::string PeerAddress::str() const {
  if(host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

std::optional<PeerAddress> parse_peer_address(const std::string& text, uint16_t default_port) {
  auto clean = trim_copy(text);
  if(clean.empty()) return std::nullopt;

  PeerAddress out;
  out.port = default_port;
  std::string port_text;

  if(clean.front() == '[') {
    auto close = clean.find(']');
    if(close == std::string::npos || close == 1) return std::nullopt;
    out.host = clean.substr(1, close - 1);
    auto rest = clean.substr(close + 1);
    if(!rest.empty()) {
      if(rest.front() != ':') return std::nullopt;
      port_text = rest.substr(1);
    }
  } else {
    auto colon = clean.find(':');
    if(colon != std::string::npos && clean.find(':', colon + 1) != std::string::npos) {
      out.host = clean; // bare IPv6 literal
    } else if(colon != std::string::npos) {
      out.host = clean.substr(0, colon);
      port_text = clean.substr(colon + 1);
    } else {
      out.host = clean;
    }
  }
  if(out.host.empty()) return std::nullopt;

  if(!port_text.empty()) {
    if(port_text.size() > 5 ||
       !std::all_of(port_text.begin(), port_text.end(), [](unsigned char ch){ return std::isdigit(ch); })) {
      return std::nullopt;
    }
    int value = std::stoi(port_text);
    if(value <= 0 || value > 65535) return std::nullopt;
    out.port = static_cast<uint16_t>(value);
  }
  if(out.port == 0) return std::nullopt;
  return out;
}

PeerRegistry::PeerRegistry(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {}

bool PeerRegistry::admit(const PeerAddress& peer) {
  AdmitCallback cb;
  {
    std::lock_guard lg(m_);
    if(!peers_.insert(peer).second) return false;
    cb = on_admit_;
  }
  log_info(logger_.get(), "New peer {}", peer.str());
  if(cb) {
    try {
      cb(peer);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Admission hook for {} failed: {}", peer.str(), e.what());
    }
  }
  return true;
}

bool PeerRegistry::contains(const PeerAddress& peer) const {
  std::lock_guard lg(m_);
  return peers_.count(peer) > 0;
}

std::vector<PeerAddress> PeerRegistry::snapshot() const {
  std::lock_guard lg(m_);
  return std::vector<PeerAddress>(peers_.begin(), peers_.end());
}

std::size_t PeerRegistry::size() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

void PeerRegistry::set_admit_callback(AdmitCallback cb) {
  std::lock_guard lg(m_);
  on_admit_ = std::move(cb);
}
