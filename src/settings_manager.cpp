#include "settings_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include "log.hpp"
#include "utils.hpp"

namespace {

SettingsManager::Type parse_type(const std::string& name) {
  if(name == "bool") return SettingsManager::Type::Bool;
  if(name == "int") return SettingsManager::Type::Int;
  if(name == "string") return SettingsManager::Type::String;
  throw std::invalid_argument("unsupported setting type '" + name + "'");
}

std::optional<bool> parse_bool(const std::string& text) {
  auto v = SettingsManager::to_lower(trim_copy(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

} // namespace

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : settings_(nlohmann::json::object()),
    definitions_(parse_specification(specification)) {
  for(const auto& setting : definitions_) {
    settings_[setting.key] = setting.default_value;
  }
}

std::vector<SettingsManager::Setting> SettingsManager::parse_specification(const nlohmann::json& specification) {
  std::vector<Setting> result;
  for(const auto& entry : specification) {
    Setting setting;
    setting.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      setting.aliases.push_back(to_lower(alias));
    }
    setting.type = parse_type(entry.at("type").get<std::string>());
    setting.default_value = entry.at("default");
    if(entry.contains("min")) setting.min_value = entry.at("min").get<int>();
    if(entry.contains("max")) setting.max_value = entry.at("max").get<int>();
    setting.description = entry.value("description", "");
    setting.persistent = entry.value("persistent", true);
    result.push_back(std::move(setting));
  }
  return result;
}

const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& setting : definitions_) {
    if(lowered == to_lower(setting.key)) return &setting;
    if(std::find(setting.aliases.begin(), setting.aliases.end(), lowered) != setting.aliases.end()) {
      return &setting;
    }
  }
  return nullptr;
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* setting = find(token)) return setting->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* setting = find(key);
  return setting && setting->type == Type::Bool;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

bool SettingsManager::store(const Setting& setting, const nlohmann::json& value, std::string& error) {
  switch(setting.type) {
    case Type::Bool:
      if(value.is_boolean()) {
        settings_[setting.key] = value.get<bool>();
        return true;
      }
      if(value.is_number_integer()) {
        settings_[setting.key] = value.get<int64_t>() != 0;
        return true;
      }
      error = "expected boolean";
      return false;
    case Type::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto number = value.get<int64_t>();
      if((setting.min_value && number < *setting.min_value) ||
         (setting.max_value && number > *setting.max_value)) {
        error = fmt::format("{} is outside {}..{}", number,
                            setting.min_value ? std::to_string(*setting.min_value) : std::string("*"),
                            setting.max_value ? std::to_string(*setting.max_value) : std::string("*"));
        return false;
      }
      settings_[setting.key] = static_cast<int>(number);
      return true;
    }
    case Type::String:
      if(value.is_string()) {
        settings_[setting.key] = value.get<std::string>();
        return true;
      }
      error = "expected string";
      return false;
  }
  error = "unknown type";
  return false;
}

bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  return store(*setting, value, error);
}

bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  std::string clean = trim_copy(value);
  switch(setting->type) {
    case Type::Bool: {
      auto parsed = parse_bool(clean);
      if(!parsed) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*setting, *parsed, error);
    }
    case Type::Int: {
      std::size_t consumed = 0;
      long long parsed = 0;
      try {
        parsed = std::stoll(clean, &consumed);
      } catch(const std::exception&) {
        error = "expected integer, got '" + clean + "'";
        return false;
      }
      if(consumed != clean.size()) {
        error = "expected integer, got '" + clean + "'";
        return false;
      }
      return store(*setting, static_cast<int64_t>(parsed), error);
    }
    case Type::String:
      return store(*setting, clean, error);
  }
  error = "unknown type";
  return false;
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err("Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err("Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* setting = find(item.key());
    if(!setting) continue;
    std::string error;
    if(!store(*setting, item.value(), error)) {
      print_err("Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& setting : definitions_) {
    if(persistent_only && !setting.persistent) continue;
    doc[setting.key] = settings_.at(setting.key);
  }
  return doc;
}

std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool SettingsManager::is_bool_literal(const std::string& value) {
  return parse_bool(value).has_value();
}

std::string SettingsManager::type_name(Type type) {
  switch(type) {
    case Type::Bool: return "bool";
    case Type::Int: return "int";
    case Type::String: return "string";
  }
  return "?";
}
