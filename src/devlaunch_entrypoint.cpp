#include <boost/program_options.hpp>

#include "conf/launcher_config.hpp"
#include "customio/console_output.hpp"
#include "devlaunch_common.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/info_handler.hpp"
#include "handlers/launch_handler.hpp"
#include "handlers/reset_handler.hpp"
#include "handlers/resolve_id_handler.hpp"
#include "identity/identifier_resolver.hpp"
#include "identity/identifier_store.hpp"
#include "identity/identity_provider.hpp"
#include "launch/first_run_launcher.hpp"
#include "launch/operator_prompt.hpp"
#include "launch/process_runner.hpp"
#include "launch_error.hpp"
#include "util/my_logging.hpp"
#include "version.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <system_error>
#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace {

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// Directory holding the running executable; empty when it cannot be found.
fs::path executable_dir(const char *argv0) {
  std::error_code ec;
#if defined(_WIN32)
  std::wstring buffer(MAX_PATH, L'\0');
  for (;;) {
    DWORD len = ::GetModuleFileNameW(nullptr, buffer.data(),
                                     static_cast<DWORD>(buffer.size()));
    if (len == 0) {
      break;
    }
    if (len < buffer.size()) {
      buffer.resize(len);
      return fs::path(buffer).parent_path();
    }
    buffer.resize(buffer.size() * 2);
  }
#else
  auto self = fs::read_symlink("/proc/self/exe", ec);
  if (!ec && !self.empty()) {
    return self.parent_path();
  }
#endif
  if (argv0 && *argv0) {
    auto resolved = fs::weakly_canonical(fs::absolute(argv0, ec), ec);
    if (!ec) {
      return resolved.parent_path();
    }
  }
  return {};
}

// Base directory precedence (highest to lowest):
// 1. --base-dir
// 2. DEVLAUNCH_HOME
// 3. directory of the launcher executable
// 4. current working directory
fs::path resolve_base_dir(const devlaunch::CliParams &params,
                          const char *argv0) {
  if (!params.base_dir.empty()) {
    return fs::absolute(params.base_dir);
  }
  if (auto home = get_env_path("DEVLAUNCH_HOME"); !home.empty()) {
    return fs::absolute(home);
  }
  if (auto exe_dir = executable_dir(argv0); !exe_dir.empty()) {
    return exe_dir;
  }
  return fs::current_path();
}

} // namespace

int RunDevLaunchApplication(int argc, char *argv[]) {
  auto [own_args, passthrough] = devlaunch::split_passthrough(argc, argv);

  // Early version check - handle version requests before any initialization
  for (size_t i = 1; i < own_args.size(); ++i) {
    if (own_args[i] == "-v" || own_args[i] == "--version" ||
        own_args[i] == "version") {
      std::cout << MYAPP_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("devlaunch, first-run launcher for "
                                          "bundled applications");

    devlaunch::CliParams cli_params;
    std::string base_dir_arg;

    generic_desc.add_options() //
        ("base-dir,b", po::value<std::string>(&base_dir_arg),
         "installation directory; defaults to DEVLAUNCH_HOME or the "
         "launcher's own directory.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all console output except the identifier; implies "
         "--no-pause.") //
        ("no-pause",
         po::bool_switch(&cli_params.no_pause)->default_value(false),
         "do not wait for Enter before exiting.") //
        ("force", po::bool_switch(&cli_params.force)->default_value(false),
         "resolve-id: re-query the providers and overwrite the stored "
         "identifier.") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    std::vector<std::string> parse_args;
    if (own_args.size() > 1) {
      parse_args.assign(own_args.begin() + 1, own_args.end());
    }
    po::parsed_options parsed = po::command_line_parser(parse_args)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    cli_params.subcmd = positionals.empty() ? devlaunch::kDefaultSubcommand
                                            : positionals.front();
    if (positionals.empty()) {
      positionals.push_back(cli_params.subcmd);
    }
    cli_params.passthrough = std::move(passthrough);
    if (!base_dir_arg.empty()) {
      cli_params.base_dir = base_dir_arg;
    }

    auto showUsage = [&]() {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl;
      std::cerr << "  launch           Initialize on first run, then start "
                   "the application (default)."
                << std::endl
                << "  resolve-id       Print the device identifier, resolving "
                   "it if needed."
                << std::endl
                << "  info             Show installation and first-run state."
                << std::endl
                << "  reset <what>     Remove first-run state: marker, "
                   "device-id or all."
                << std::endl
                << std::endl;
      std::cerr << "Arguments after '--' are passed to the application."
                << std::endl;
    };

    if (vm.count("help")) {
      showUsage();
      return EXIT_SUCCESS;
    }

    if (!devlaunch::is_known_subcommand(cli_params.subcmd)) {
      std::cerr << "Unknown subcommand '" << cli_params.subcmd << "'"
                << std::endl;
      showUsage();
      return EXIT_FAILURE;
    }

    const fs::path base_dir = resolve_base_dir(cli_params, argv[0]);
    cli_params.base_dir = base_dir;

    std::unique_ptr<devlaunch::LauncherConfigProviderFile> config_provider;
    try {
      config_provider =
          std::make_unique<devlaunch::LauncherConfigProviderFile>(base_dir);
    } catch (const std::exception &ex) {
      customio::ColorPrinter printer;
      if (cli_params.silent) {
        printer.mute();
      }
      printer.red(std::string("Invalid launcher configuration: ") + ex.what());
      if (!cli_params.no_pause && !cli_params.silent) {
        devlaunch::launch::ConsolePrompt prompt;
        prompt.acknowledge(devlaunch::launch::kPauseMessage);
      }
      return devlaunch::exit_status::CONFIG_ERROR;
    }
    const auto &config = config_provider->get();

    {
      devlaunch::LoggingConfig logging_config = config.log;
      logging_config.log_dir = config.log_dir_path().string();
      std::error_code ec;
      fs::create_directories(logging_config.log_dir, ec);
      if (ec && !fs::exists(logging_config.log_dir)) {
        std::cerr << "Warning: unable to create log directory '"
                  << logging_config.log_dir << "': " << ec.message()
                  << std::endl;
      } else {
        devlaunch::init_my_log(logging_config);
      }
    }

    static devlaunch::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                     std::move(cli_params));

    customio::ConsoleLogOutput log_output(cli_ctx.verbosity_level());
    customio::ConsoleOutput output_hub(log_output);
    log_output.debug() << "Base directory: " << base_dir.string()
                       << (config_provider->loaded_from_file()
                               ? ""
                               : " (no launcher.json, using defaults)")
                       << std::endl;

    std::unique_ptr<devlaunch::launch::IOperatorPrompt> prompt;
    if (cli_ctx.params.no_pause || cli_ctx.params.silent ||
        !config.pause_on_exit ||
        cli_ctx.params.subcmd != devlaunch::kDefaultSubcommand) {
      prompt = std::make_unique<devlaunch::launch::NoPausePrompt>();
    } else {
      prompt = std::make_unique<devlaunch::launch::ConsolePrompt>();
    }

    devlaunch::launch::SystemProcessRunner runner;
    auto chain =
        devlaunch::identity::make_provider_chain(config.identity_providers,
                                                 runner);
    if (chain.error) {
      output_hub.printer().red("Invalid launcher configuration: " +
                               chain.error->what);
      log_output.error() << *chain.error << std::endl;
      prompt->acknowledge(devlaunch::launch::kPauseMessage);
      return devlaunch::exit_status::CONFIG_ERROR;
    }

    devlaunch::identity::IdentifierResolver resolver(
        std::move(chain.providers),
        devlaunch::identity::DeviceIdentifierStore(config.device_id_path()),
        output_hub);

    devlaunch::HandlerFactoryImpl factory(
        [&](const std::string &subcmd) -> std::shared_ptr<devlaunch::IHandler> {
          if (subcmd == "launch") {
            return std::make_shared<devlaunch::LaunchHandler>(
                *config_provider, output_hub, cli_ctx, resolver, runner,
                *prompt);
          } else if (subcmd == "resolve-id") {
            return std::make_shared<devlaunch::ResolveIdHandler>(
                output_hub, cli_ctx, resolver);
          } else if (subcmd == "info") {
            return std::make_shared<devlaunch::InfoHandler>(
                *config_provider, output_hub, resolver);
          } else if (subcmd == "reset") {
            return std::make_shared<devlaunch::ResetHandler>(
                *config_provider, output_hub, cli_ctx);
          }
          return nullptr;
        });

    devlaunch::HandlerDispatcher dispatcher(log_output, factory);
    auto status = dispatcher.dispatch_run(cli_ctx.params.subcmd);
    if (!status) {
      std::cerr << "Unsupported subcommand: " << cli_ctx.params.subcmd
                << std::endl;
      return EXIT_FAILURE;
    }
    return *status;
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunDevLaunchApplication(argc, argv); }
