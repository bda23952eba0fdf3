#include "pxid/cli/commands/inspect_command.hpp"

#include <iomanip>
#include <iostream>

#include <nlohmann/json.hpp>

#include "pxid/interop/identifier_json.hpp"
#include "pxid/util/clock.hpp"

namespace pxid::cli {

InspectCommand::InspectCommand(Application& app) : app_(app) {}

void InspectCommand::setupCommand(CLI::App* cmd) {
  cmd->add_option("ids", ids_, "Identifiers to decode")->required();
}

Result<int> InspectCommand::execute(const GlobalOptions& options) {
  bool failed = false;
  nlohmann::json output = nlohmann::json::array();

  for (size_t i = 0; i < ids_.size(); ++i) {
    const auto& text = ids_[i];
    auto id = core::Identifier::parse(text);

    if (!id.has_value()) {
      failed = true;
      if (options.json) {
        nlohmann::json entry;
        entry["input"] = text;
        entry["error"] = id.error().message();
        entry["kind"] = std::string(errorCodeToString(id.error().code()));
        output.push_back(entry);
      } else {
        std::cerr << "Error: " << text << ": " << id.error().describe() << "\n";
      }
      continue;
    }

    if (options.json) {
      output.push_back(interop::identifierToJson(*id));
    } else {
      if (i > 0) {
        std::cout << "\n";
      }
      printIdentifier(*id);
    }
  }

  if (options.json) {
    std::cout << output.dump(2) << "\n";
  }

  return failed ? 1 : 0;
}

void InspectCommand::printIdentifier(const core::Identifier& id) const {
  const auto machine_id = id.machineId();

  std::cout << "id:         " << id.toString() << "\n";
  std::cout << "prefix:     " << id.prefix() << "\n";
  std::cout << "timestamp:  " << id.timestamp() << " (" << util::Time::toRfc3339(id.time())
            << ")\n";
  std::cout << "machine_id: " << std::hex << std::setfill('0');
  for (auto byte : machine_id) {
    std::cout << std::setw(2) << static_cast<int>(byte);
  }
  std::cout << std::dec << std::setfill(' ') << "\n";
  std::cout << "process_id: " << id.processId() << "\n";
  std::cout << "counter:    " << id.counter() << "\n";
}

}  // namespace pxid::cli
