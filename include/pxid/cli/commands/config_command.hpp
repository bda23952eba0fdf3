#pragma once

#include "pxid/cli/application.hpp"
#include "pxid/common.hpp"

namespace pxid::cli {

/**
 * Command for managing configuration
 *
 * Subcommands:
 * - path: Show configuration file path
 * - show: Print the effective configuration
 * - get <key>: Get configuration value
 * - set <key> <value>: Set configuration value and save
 */
class ConfigCommand : public Command {
public:
  explicit ConfigCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "config";
  std::string description_ = "Manage configuration settings";

  // Subcommand flags
  bool path_mode_ = false;
  bool show_mode_ = false;
  bool get_mode_ = false;
  bool set_mode_ = false;

  // Command arguments
  std::string key_;
  std::string value_;

  // Command execution methods
  Result<int> executePath(const GlobalOptions& options);
  Result<int> executeShow(const GlobalOptions& options);
  Result<int> executeGet(const GlobalOptions& options);
  Result<int> executeSet(const GlobalOptions& options);
};

}  // namespace pxid::cli
