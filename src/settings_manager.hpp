#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every recognised setting. "min"/"max" bound int settings; values outside the
// range are rejected wherever they come from (file, command line, code).
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","shared_dir"},          {"aliases", {"dir","d"}},     {"type","string"}, {"default","shared"},          {"description","Directory to synchronize"}},
  {{"key","block_size"},          {"aliases", {"bs"}},          {"type","int"},    {"default",1048576},           {"min",1}, {"max",1073741824}, {"description","Transfer and hashing block size in bytes"}},
  {{"key","multicast_group"},     {"aliases", {"group","mg"}},  {"type","string"}, {"default","239.255.255.250"}, {"description","Discovery multicast group"}},
  {{"key","multicast_port"},      {"aliases", {"mp"}},          {"type","int"},    {"default",5007},              {"min",1}, {"max",65535}, {"description","Discovery multicast port"}},
  {{"key","peer_port"},           {"aliases", {"port","p"}},    {"type","int"},    {"default",5005},              {"min",0}, {"max",65535}, {"description","TCP port of the transfer server (0 = any)"}},
  {{"key","listen_ip"},           {"aliases", {"li"}},          {"type","string"}, {"default","0.0.0.0"},         {"description","Interface/IP the transfer server binds"}},
  {{"key","sync_interval"},       {"aliases", {"si"}},          {"type","int"},    {"default",10},                {"min",1}, {"max",86400}, {"description","Seconds between reconciliation cycles"}},
  {{"key","scan_interval"},       {"aliases", {"scan"}},        {"type","int"},    {"default",5},                 {"min",1}, {"max",86400}, {"description","Seconds a directory snapshot stays fresh"}},
  {{"key","beacon_interval"},     {"aliases", {"bi"}},          {"type","int"},    {"default",5},                 {"min",1}, {"max",86400}, {"description","Seconds between discovery beacons"}},
  {{"key","connect_timeout"},     {"aliases", {"ct"}},          {"type","int"},    {"default",5},                 {"min",1}, {"max",3600},  {"description","Seconds allowed to connect to a peer"}},
  {{"key","transfer_timeout"},    {"aliases", {"tt"}},          {"type","int"},    {"default",15},                {"min",1}, {"max",3600},  {"description","Seconds allowed for a single read or write"}},
  {{"key","discovery"},           {"aliases", {"multicast"}},   {"type","bool"},   {"default",true},              {"description","Announce and discover peers over multicast"}},
  {{"key","peers"},               {"aliases", {"peer"}},        {"type","string"}, {"default",""},                {"description","Static peers, comma separated host[:port]"}},
  {{"key","admit_inbound_peers"}, {"aliases", {"inbound"}},     {"type","bool"},   {"default",false},             {"description","Admit the host of every inbound connection as a peer"}},
  {{"key","verbose"},             {"aliases", {"v"}},           {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}},
  {{"key","help"},                {"aliases", {"h","?"}},       {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},     {"type","bool"},   {"default",false},             {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed key/value table driven by a JSON specification, loadable from and
// savable to a JSON settings file.
class SettingsManager {
public:
  enum class Type { Bool, Int, String };

  struct Setting {
    std::string key;
    std::vector<std::string> aliases; // lowercase
    Type type = Type::String;
    nlohmann::json default_value;
    std::optional<int> min_value;
    std::optional<int> max_value;
    std::string description;
    bool persistent = true;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!settings_.contains(key)) {
      throw std::out_of_range("Unknown setting: " + key);
    }
    return settings_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return settings_.contains(key); }

  // Both return false and describe the problem in `error` when the key is
  // unknown or the value has the wrong type or range; the old value is kept.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  const std::vector<Setting>& definitions() const { return definitions_; }
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static bool is_bool_literal(const std::string& value);
  static std::string type_name(Type type);

private:
  static std::vector<Setting> parse_specification(const nlohmann::json& specification);

  const Setting* find(const std::string& token) const;
  void merge_from_json(const nlohmann::json& doc);
  bool store(const Setting& setting, const nlohmann::json& value, std::string& error);

  nlohmann::json settings_;
  std::vector<Setting> definitions_;
  std::filesystem::path settings_path_override_;
};
