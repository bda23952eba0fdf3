#pragma once

#include "pxid/cli/application.hpp"
#include "pxid/common.hpp"

namespace pxid::cli {

/**
 * Command for generating new identifiers
 *
 * Prints one identifier per line, or a JSON array with --json.
 */
class GenerateCommand : public Command {
public:
  explicit GenerateCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "generate";
  std::string description_ = "Generate new identifiers";

  // Command arguments
  std::string prefix_;
  CLI::Option* prefix_option_ = nullptr;
  int count_ = 0;
};

}  // namespace pxid::cli
