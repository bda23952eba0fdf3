#include "pxid/config/config.hpp"

#include <charconv>
#include <sstream>

#include <toml++/toml.hpp>

#include "pxid/core/identifier.hpp"
#include "pxid/util/filesystem.hpp"
#include "pxid/util/logging.hpp"
#include "pxid/util/xdg.hpp"

namespace pxid::config {

Result<Config> Config::loadOrDefault(const std::filesystem::path& config_path) {
  Config config;
  config.config_path_ = config_path;

  std::error_code ec;
  if (!std::filesystem::exists(config_path, ec)) {
    util::logger()->debug("No config file at {}, using defaults", config_path.string());
    return config;
  }

  if (auto result = config.load(config_path); !result.has_value()) {
    return std::unexpected(result.error());
  }
  if (auto result = config.validate(); !result.has_value()) {
    return std::unexpected(result.error());
  }
  return config;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["prefix"].value<std::string>()) {
      prefix = *value;
    }
    if (auto value = config_data["count"].value<int>()) {
      count = *value;
    }
    if (auto value = config_data["log_level"].value<std::string>()) {
      log_level = *value;
    }

    if (auto identity_table = config_data["identity"].as_table()) {
      if (auto value = (*identity_table)["host_id"].value<std::string>()) {
        identity.host_id = *value;
      }
      if (auto value = (*identity_table)["machine_id_file"].value<std::string>()) {
        identity.machine_id_file = *value;
      }
    }

    util::logger()->debug("Loaded config from {}", config_path.string());
    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

std::string Config::toToml() const {
  toml::table config_data;

  config_data.insert_or_assign("prefix", prefix);
  config_data.insert_or_assign("count", count);
  config_data.insert_or_assign("log_level", log_level);

  auto identity_table = toml::table{};
  identity_table.insert_or_assign("host_id", identity.host_id);
  identity_table.insert_or_assign("machine_id_file", identity.machine_id_file);
  config_data.insert_or_assign("identity", identity_table);

  std::stringstream ss;
  ss << config_data << "\n";
  return ss.str();
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  auto write_result = util::FileSystem::writeFileAtomic(save_path, toToml());
  if (!write_result.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Cannot write config file: " + write_result.error().message()));
  }

  return {};
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

Result<void> Config::validate() const {
  if (auto valid = core::Identifier::validatePrefix(prefix); !valid.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid prefix: " + valid.error().message()));
  }

  if (count < 1) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "count must be at least 1, got " + std::to_string(count)));
  }

  if (auto level = util::parseLogLevel(log_level); !level.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, level.error().message()));
  }

  return {};
}

core::SystemIdentitySource::Options Config::identityOptions() const {
  core::SystemIdentitySource::Options options;
  options.host_id = identity.host_id;
  options.machine_id_file = identity.machine_id_file;
  return options;
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

const std::vector<std::string>& Config::keys() {
  static const std::vector<std::string> kKeys = {
      "prefix", "count", "log_level", "identity.host_id", "identity.machine_id_file",
  };
  return kKeys;
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "prefix") return prefix;
    if (key == "count") return std::to_string(count);
    if (key == "log_level") return log_level;
  } else if (path.size() == 2) {
    if (path[0] == "identity") {
      if (path[1] == "host_id") return identity.host_id;
      if (path[1] == "machine_id_file") return identity.machine_id_file;
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "prefix") { prefix = value; return {}; }
    if (key == "log_level") { log_level = value; return {}; }
    if (key == "count") {
      int parsed = 0;
      auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
      if (ec != std::errc{} || end != value.data() + value.size()) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "count must be an integer, got '" + value + "'"));
      }
      count = parsed;
      return {};
    }
  } else if (path.size() == 2) {
    if (path[0] == "identity") {
      if (path[1] == "host_id") { identity.host_id = value; return {}; }
      if (path[1] == "machine_id_file") { identity.machine_id_file = value; return {}; }
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace pxid::config
