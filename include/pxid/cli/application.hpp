#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "pxid/common.hpp"
#include "pxid/config/config.hpp"
#include "pxid/core/factory.hpp"
#include "pxid/core/identity_source.hpp"
#include "pxid/util/clock.hpp"

namespace pxid::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;        // --json: Output in JSON format
  int verbose = 0;          // --verbose: Lower the log level (can be repeated: -v, -vv)
  bool quiet = false;       // --quiet: Suppress confirmations
  std::string config_file;  // --config: Path to config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  /**
   * @brief Get the command name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Get the command description
   */
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();

  /**
   * @brief Application with an injected identity and clock
   *
   * Either may be null, in which case the configured system identity or the
   * system clock is used.
   */
  Application(std::shared_ptr<core::IdentitySource> identity_source,
              std::shared_ptr<util::Clock> clock);
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @param argc Argument count
   * @param argv Argument vector
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  // Accessors for commands
  const GlobalOptions& globalOptions() const;
  config::Config& config();
  std::filesystem::path configPath() const;

  /**
   * @brief Build a factory from the configured identity and clock
   */
  Result<core::Factory> createFactory(std::string_view prefix) const;

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Load config and install the logger
  Result<void> initializeServices();

  void reportError(const Error& error) const;

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  config::Config config_;
  bool services_initialized_ = false;

  std::shared_ptr<core::IdentitySource> identity_source_;
  std::shared_ptr<util::Clock> clock_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace pxid::cli
