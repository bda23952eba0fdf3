#include "pxid/cli/application.hpp"

#include <iostream>

#include <nlohmann/json.hpp>

#include "pxid/util/logging.hpp"

// Command includes
#include "pxid/cli/commands/config_command.hpp"
#include "pxid/cli/commands/generate_command.hpp"
#include "pxid/cli/commands/inspect_command.hpp"

namespace pxid::cli {

Application::Application() : Application(nullptr, nullptr) {}

Application::Application(std::shared_ptr<core::IdentitySource> identity_source,
                         std::shared_ptr<util::Clock> clock)
    : app_("pxid", "Generate and inspect prefixed, sortable unique identifiers")
    , identity_source_(std::move(identity_source))
    , clock_(std::move(clock)) {

  // Set up the application
  app_.set_version_flag("--version", pxid::getVersion().toString());
  app_.require_subcommand(1);
  app_.fallthrough();

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (repeat for more)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress confirmations");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<GenerateCommand>(*this));
  registerCommand(std::make_unique<InspectCommand>(*this));
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  pxid generate --prefix acct
  pxid generate -n 5 --json
  pxid inspect acct_9m4e2mr0ui3e8a215n4g
  pxid config set prefix user

For more information on a specific command, run:
  pxid <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  auto loaded = config::Config::loadOrDefault(configPath());
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }
  config_ = std::move(*loaded);

  auto level = util::parseLogLevel(config_.log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }
  util::Logging::instance().initialize(util::raiseVerbosity(*level, global_options_.verbose));

  services_initialized_ = true;
  return {};
}

void Application::reportError(const Error& error) const {
  util::logger()->debug("Command failed: {}", error.describe());

  if (global_options_.json) {
    nlohmann::json output;
    output["error"] = error.message();
    output["code"] = static_cast<int>(error.code());
    output["kind"] = std::string(errorCodeToString(error.code()));
    std::cout << output.dump() << "\n";
  } else {
    std::cerr << "Error: " << error.message() << "\n";
  }
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!services_initialized_) {
    throw std::runtime_error("Services not initialized");
  }
  return config_;
}

std::filesystem::path Application::configPath() const {
  if (!global_options_.config_file.empty()) {
    return global_options_.config_file;
  }
  return config::Config::defaultConfigPath();
}

Result<core::Factory> Application::createFactory(std::string_view prefix) const {
  if (identity_source_) {
    return core::Factory::create(prefix, *identity_source_, clock_);
  }

  core::SystemIdentitySource source(config_.identityOptions());
  return core::Factory::create(prefix, source, clock_);
}

} // namespace pxid::cli
