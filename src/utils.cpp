#include "utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
  std::ostringstream oss;
  for(std::size_t i = 0; i < size; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string hex_from_bytes(const std::vector<unsigned char>& b){
  return hex_from_bytes(b.data(), b.size());
}

std::string random_hex(std::size_t bytes){
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<unsigned int> dist(0, 255);
  std::vector<unsigned char> raw(bytes);
  for(auto& b : raw) b = static_cast<unsigned char>(dist(rng));
  return hex_from_bytes(raw);
}

std::string trim_copy(std::string value){
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

std::vector<std::string> split_list(const std::string& value, char separator){
  std::vector<std::string> out;
  std::string item;
  std::istringstream in(value);
  while(std::getline(in, item, separator)) {
    item = trim_copy(item);
    if(!item.empty()) out.push_back(item);
  }
  return out;
}

std::string detect_local_ip(){
  asio::io_context io;
  std::error_code ec;
  {
    // No datagram is sent; connect() only selects the outgoing interface.
    asio::ip::udp::socket route_socket(io);
    route_socket.open(asio::ip::udp::v4(), ec);
    if(!ec) {
      route_socket.connect(asio::ip::udp::endpoint(asio::ip::make_address_v4("10.255.255.255"), 1), ec);
    }
    if(!ec) {
      auto local = route_socket.local_endpoint(ec);
      if(!ec && !local.address().is_unspecified()) {
        return local.address().to_string();
      }
    }
  }

  ec.clear();
  auto host = asio::ip::host_name(ec);
  if(!ec) {
    asio::ip::tcp::resolver resolver(io);
    auto results = resolver.resolve(asio::ip::tcp::v4(), host, "", ec);
    if(!ec && !results.empty()) {
      return results.begin()->endpoint().address().to_string();
    }
  }
  return "127.0.0.1";
}
