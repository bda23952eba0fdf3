#include "pxid/cli/commands/generate_command.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "pxid/interop/identifier_json.hpp"
#include "pxid/util/logging.hpp"

namespace pxid::cli {

GenerateCommand::GenerateCommand(Application& app) : app_(app) {}

void GenerateCommand::setupCommand(CLI::App* cmd) {
  prefix_option_ = cmd->add_option("-p,--prefix", prefix_,
                                   "Prefix of up to 4 bytes (defaults to the configured prefix)");
  cmd->add_option("-n,--count", count_, "Number of identifiers to generate")
      ->check(CLI::PositiveNumber);
}

Result<int> GenerateCommand::execute(const GlobalOptions& options) {
  const auto& config = app_.config();

  std::string prefix = prefix_option_->count() > 0 ? prefix_ : config.prefix;
  int count = count_ > 0 ? count_ : config.count;

  auto factory = app_.createFactory(prefix);
  if (!factory.has_value()) {
    return std::unexpected(factory.error());
  }

  util::logger()->debug("Generating {} identifier(s) with prefix '{}'", count, prefix);

  if (options.json) {
    nlohmann::json output = nlohmann::json::array();
    for (int i = 0; i < count; ++i) {
      output.push_back(nlohmann::json(factory->generate()));
    }
    std::cout << output.dump(2) << "\n";
  } else {
    for (int i = 0; i < count; ++i) {
      std::cout << factory->generate().toString() << "\n";
    }
  }

  return 0;
}

}  // namespace pxid::cli
