#pragma once

#include <vector>

#include "pxid/cli/application.hpp"
#include "pxid/common.hpp"
#include "pxid/core/identifier.hpp"

namespace pxid::cli {

/**
 * Command for decoding identifiers into their fields
 *
 * Exits with 1 if any argument fails to parse; the others are still printed.
 */
class InspectCommand : public Command {
public:
  explicit InspectCommand(Application& app);

  void setupCommand(CLI::App* cmd) override;
  Result<int> execute(const GlobalOptions& options) override;

  std::string name() const override { return name_; }
  std::string description() const override { return description_; }

private:
  Application& app_;
  std::string name_ = "inspect";
  std::string description_ = "Decode identifiers and show their fields";

  // Command arguments
  std::vector<std::string> ids_;

  void printIdentifier(const core::Identifier& id) const;
};

}  // namespace pxid::cli
