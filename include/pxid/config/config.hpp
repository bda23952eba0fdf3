#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "pxid/common.hpp"
#include "pxid/core/identity_source.hpp"

namespace pxid::config {

// Configuration for the pxid command line tool
class Config {
 public:
  // Defaults only, nothing is read from disk
  Config() = default;

  // Load from a file if it exists, otherwise keep defaults. The result is validated.
  static Result<Config> loadOrDefault(const std::filesystem::path& config_path);

  // Default prefix for `pxid generate`
  std::string prefix;

  // Default number of identifiers per `pxid generate`
  int count = 1;

  // trace|debug|info|warn|error|critical|off
  std::string log_level = "warn";

  // Host identity overrides
  struct IdentityConfig {
    std::string host_id;          // Hashed in place of the platform host id
    std::string machine_id_file;  // File holding the host id
  };
  IdentityConfig identity;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Save configuration to file; an empty path means the path last loaded
  // from, or the default location
  Result<void> save(const std::filesystem::path& config_path = {}) const;

  // Get/set configuration values using dot notation (e.g. "identity.host_id")
  Result<std::string> get(const std::string& key) const;
  Result<void> set(const std::string& key, const std::string& value);

  // Validate configuration
  Result<void> validate() const;

  // Serialized TOML document
  std::string toToml() const;

  // Options for SystemIdentitySource built from the [identity] table
  core::SystemIdentitySource::Options identityOptions() const;

  const std::filesystem::path& path() const { return config_path_; }

  // Get default configuration file path
  static std::filesystem::path defaultConfigPath();

  // Every key accepted by get/set
  static const std::vector<std::string>& keys();

 private:
  std::filesystem::path config_path_;

  // Dot notation helpers
  Result<std::string> getValueByPath(const std::vector<std::string>& path) const;
  Result<void> setValueByPath(const std::vector<std::string>& path, const std::string& value);

  std::vector<std::string> splitPath(const std::string& path) const;
};

}  // namespace pxid::config
