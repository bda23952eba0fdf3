#include "pxid/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

namespace pxid::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto show_cmd = cmd->add_subcommand("show", "Show the effective configuration");
  show_cmd->callback([this]() { show_mode_ = true; });

  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  // Require exactly one subcommand
  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (path_mode_) {
    return executePath(options);
  } else if (show_mode_) {
    return executeShow(options);
  } else if (get_mode_) {
    return executeGet(options);
  } else if (set_mode_) {
    return executeSet(options);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  auto config_path = app_.configPath();
  std::error_code ec;
  bool exists = std::filesystem::exists(config_path, ec);

  if (options.json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << config_path.string() << "\n";
    if (!exists && !options.quiet) {
      std::cerr << "(file not found, using defaults)\n";
    }
  }

  return 0;
}

Result<int> ConfigCommand::executeShow(const GlobalOptions& options) {
  const auto& config = app_.config();

  if (options.json) {
    nlohmann::json output;
    for (const auto& key : config::Config::keys()) {
      auto value = config.get(key);
      if (!value.has_value()) {
        return std::unexpected(value.error());
      }
      output[key] = *value;
    }
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << config.toToml();
  }

  return 0;
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto value = app_.config().get(key_);
  if (!value.has_value()) {
    return std::unexpected(value.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *value;
    std::cout << output.dump(2) << "\n";
  } else {
    std::cout << *value << "\n";
  }

  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  // Work on a copy so a rejected value never reaches disk
  auto updated = app_.config();

  if (auto result = updated.set(key_, value_); !result.has_value()) {
    return std::unexpected(result.error());
  }
  if (auto result = updated.validate(); !result.has_value()) {
    return std::unexpected(result.error());
  }
  if (auto result = updated.save(app_.configPath()); !result.has_value()) {
    return std::unexpected(result.error());
  }

  app_.config() = std::move(updated);

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    std::cout << output.dump(2) << "\n";
  } else if (!options.quiet) {
    std::cout << "Configuration updated: " << key_ << " = " << value_ << "\n";
  }

  return 0;
}

}  // namespace pxid::cli
