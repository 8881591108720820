#pragma once
#include <cstddef>
#include <string>
#include <vector>

std::string hex_from_bytes(const unsigned char* data, std::size_t size);
std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string random_hex(std::size_t bytes);

std::string trim_copy(std::string value);
std::vector<std::string> split_list(const std::string& value, char separator);

// LAN address of this host as seen by its peers; "127.0.0.1" if none can be found.
std::string detect_local_ip();
