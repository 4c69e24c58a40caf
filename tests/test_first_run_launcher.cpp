#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "identity/identifier_resolver.hpp"
#include "launch/first_run_launcher.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;
using namespace devlaunch;
using launch::ProcessResult;
using launch::ProcessSpec;

class RecordingPrompt : public launch::IOperatorPrompt {
public:
  int acknowledged{0};
  void acknowledge(const std::string &) override { ++acknowledged; }
};

class FirstRunLauncherTest : public ::testing::Test {
protected:
  testinfra::TempDir base_;
  testinfra::TestOutput iout_;
  customio::ConsoleOutput output_{iout_, false};
  RecordingPrompt prompt_;

  std::vector<ProcessSpec> calls_;
  int setup_exit_{0};
  int app_exit_{0};
  bool app_spawn_fails_{false};
  int provider_calls_{0};
  std::optional<std::string> provider_value_{"HW-UUID-1"};

  launch::FunctionProcessRunner runner_{[this](const ProcessSpec &spec) {
    calls_.push_back(spec);
    ProcessResult result;
    if (is_setup(spec)) {
      result.exit_code = setup_exit_;
    } else if (app_spawn_fails_) {
      result.error = make_error(my_errors::LAUNCH::SPAWN_FAILED,
                                "execvp failed: No such file or directory");
    } else {
      result.exit_code = app_exit_;
    }
    return result;
  }};

  LauncherConfig make_config() const {
    LauncherConfig config;
    config.base_dir = base_.path();
    config.interpreter = "runtime/python";
    config.unpack.command = {"runtime/unpack", "--quiet"};
    config.target_entry = "main.py";
    return config;
  }

  void install_assets() const {
    testinfra::write_file(base_ / "runtime" / "python", "#!interpreter\n");
    testinfra::write_file(base_ / "main.py", "print('hi')\n");
  }

  bool is_setup(const ProcessSpec &spec) const {
    return !spec.argv.empty() &&
           fs::path(spec.argv[0]).filename() == "unpack";
  }

  identity::IdentifierResolver make_resolver(const LauncherConfig &config) {
    std::vector<identity::IIdentityProvider::Ptr> chain{
        std::make_shared<identity::FunctionIdentityProvider>(
            "product_uuid", [this]() {
              ++provider_calls_;
              return provider_value_;
            })};
    return identity::IdentifierResolver(
        std::move(chain),
        identity::DeviceIdentifierStore(config.device_id_path()), output_);
  }

  launch::LaunchOutcome run(const LauncherConfig &config,
                            const std::vector<std::string> &extra = {}) {
    StaticLauncherConfigProvider provider(config);
    auto resolver = make_resolver(provider.get());
    launch::FirstRunLauncher launcher(provider, output_, resolver, runner_,
                                      prompt_);
    return launcher.ensure_initialized_and_launch(extra);
  }
};

TEST_F(FirstRunLauncherTest, FirstRunResolvesIdentifierRunsSetupThenLaunches) {
  install_assets();
  auto config = make_config();

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, exit_status::OK);
  EXPECT_FALSE(outcome.error.has_value());
  EXPECT_TRUE(outcome.application_ran);
  EXPECT_EQ(outcome.final_state, launch::LaunchState::Ready);
  EXPECT_EQ(outcome.identifier, "HW-UUID-1");
  EXPECT_EQ(testinfra::read_file(config.device_id_path()), "HW-UUID-1\n");
  EXPECT_TRUE(fs::exists(config.marker_path()));

  ASSERT_EQ(calls_.size(), 2u);
  EXPECT_TRUE(is_setup(calls_[0]));
  EXPECT_EQ(calls_[0].argv,
            (std::vector<std::string>{(base_ / "runtime" / "unpack").string(),
                                      "--quiet"}));
  EXPECT_EQ(calls_[0].working_dir, base_.path());
  EXPECT_EQ(calls_[1].argv,
            (std::vector<std::string>{(base_ / "runtime" / "python").string(),
                                      (base_ / "main.py").string()}));
  EXPECT_EQ(calls_[1].working_dir, base_.path());
  EXPECT_EQ(prompt_.acknowledged, 1);
}

TEST_F(FirstRunLauncherTest, LaterRunsOnlyLaunch) {
  install_assets();
  auto config = make_config();
  testinfra::write_file(config.device_id_path(), "PERSISTED\n");
  testinfra::write_file(config.marker_path(), "");
  // Would fail if it ran.
  setup_exit_ = 1;

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_EQ(outcome.identifier, "PERSISTED");
  EXPECT_EQ(provider_calls_, 0);
  ASSERT_EQ(calls_.size(), 1u);
  EXPECT_FALSE(is_setup(calls_[0]));
  EXPECT_EQ(testinfra::read_file(config.device_id_path()), "PERSISTED\n");
}

TEST_F(FirstRunLauncherTest, RepeatedRunsKeepTheFirstIdentifier) {
  install_assets();
  auto config = make_config();

  run(config);
  provider_value_ = "HW-UUID-CHANGED";
  auto second = run(config);

  EXPECT_EQ(second.identifier, "HW-UUID-1");
  EXPECT_EQ(provider_calls_, 1);
  // Setup ran once, the application twice.
  ASSERT_EQ(calls_.size(), 3u);
  EXPECT_TRUE(is_setup(calls_[0]));
  EXPECT_FALSE(is_setup(calls_[1]));
  EXPECT_FALSE(is_setup(calls_[2]));
}

TEST_F(FirstRunLauncherTest, SilentConsoleWritesNoHeadlines) {
  install_assets();
  auto config = make_config();
  app_exit_ = 5;
  std::ostringstream headlines;
  testinfra::TestOutput quiet;
  quiet.verbosity_level = 0;
  customio::ConsoleOutput silent_output(
      quiet, customio::ColorPrinter(headlines, false));

  StaticLauncherConfigProvider provider(config);
  identity::IdentifierResolver resolver(
      {std::make_shared<identity::FunctionIdentityProvider>(
          "product_uuid", []() { return std::optional<std::string>("HW-1"); })},
      identity::DeviceIdentifierStore(config.device_id_path()), silent_output);
  launch::FirstRunLauncher launcher(provider, silent_output, resolver, runner_,
                                    prompt_);
  auto outcome = launcher.ensure_initialized_and_launch({});

  EXPECT_EQ(outcome.exit_code, 5);
  ASSERT_EQ(calls_.size(), 2u);
  EXPECT_TRUE(silent_output.printer().muted());
  EXPECT_TRUE(headlines.str().empty()) << headlines.str();
  EXPECT_EQ(quiet.std_out.str(), "HW-1\n");
}

TEST_F(FirstRunLauncherTest, HeadlinesReachThePrinterStream) {
  install_assets();
  auto config = make_config();
  app_exit_ = 5;
  std::ostringstream headlines;
  customio::ConsoleOutput loud_output(
      iout_, customio::ColorPrinter(headlines, false));

  StaticLauncherConfigProvider provider(config);
  auto resolver = make_resolver(config);
  launch::FirstRunLauncher launcher(provider, loud_output, resolver, runner_,
                                    prompt_);
  launcher.ensure_initialized_and_launch({});

  EXPECT_FALSE(loud_output.printer().muted());
  EXPECT_NE(headlines.str().find("First run"), std::string::npos);
  EXPECT_NE(headlines.str().find("status 5"), std::string::npos);
}

TEST_F(FirstRunLauncherTest, FailedSetupLeavesNoMarkerAndIsRetried) {
  install_assets();
  auto config = make_config();
  setup_exit_ = 2;

  auto failed = run(config);

  EXPECT_EQ(failed.exit_code, exit_status::SETUP_FAILED);
  ASSERT_TRUE(failed.error.has_value());
  EXPECT_EQ(failed.error->code, my_errors::LAUNCH::SETUP_STEP_FAILED);
  EXPECT_FALSE(failed.application_ran);
  EXPECT_EQ(failed.final_state, launch::LaunchState::NeedsUnpack);
  EXPECT_FALSE(fs::exists(config.marker_path()));
  ASSERT_EQ(calls_.size(), 1u);
  EXPECT_EQ(prompt_.acknowledged, 1);

  setup_exit_ = 0;
  calls_.clear();
  auto retried = run(config);

  EXPECT_EQ(retried.exit_code, 0);
  ASSERT_EQ(calls_.size(), 2u);
  EXPECT_TRUE(is_setup(calls_[0]));
  EXPECT_TRUE(fs::exists(config.marker_path()));
}

TEST_F(FirstRunLauncherTest, MissingRuntimeFailsBeforeAnySideEffect) {
  testinfra::write_file(base_ / "main.py", "print('hi')\n");
  auto config = make_config();

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, exit_status::MISSING_ASSET);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->code, my_errors::LAUNCH::MISSING_ASSET);
  EXPECT_NE(outcome.error->what.find("runtime"), std::string::npos);
  EXPECT_TRUE(calls_.empty());
  EXPECT_EQ(provider_calls_, 0);
  EXPECT_FALSE(fs::exists(config.device_id_path()));
  EXPECT_FALSE(fs::exists(config.marker_path()));
  EXPECT_EQ(prompt_.acknowledged, 1);
}

TEST_F(FirstRunLauncherTest, MissingEntryPointIsReported) {
  testinfra::write_file(base_ / "runtime" / "python", "");
  auto config = make_config();

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, exit_status::MISSING_ASSET);
  EXPECT_TRUE(calls_.empty());
  EXPECT_FALSE(fs::exists(config.device_id_path()));
}

TEST_F(FirstRunLauncherTest, ApplicationExitStatusIsPropagated) {
  install_assets();
  auto config = make_config();
  app_exit_ = 7;

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, 7);
  EXPECT_TRUE(outcome.application_ran);
  EXPECT_FALSE(outcome.error.has_value());
  EXPECT_NE(iout_.err.str().find("exited with code 7"), std::string::npos);
}

TEST_F(FirstRunLauncherTest, SpawnFailureReportsLaunchFailed) {
  install_assets();
  auto config = make_config();
  app_spawn_fails_ = true;

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, exit_status::LAUNCH_FAILED);
  ASSERT_TRUE(outcome.error.has_value());
  EXPECT_EQ(outcome.error->code, my_errors::LAUNCH::SPAWN_FAILED);
  EXPECT_FALSE(outcome.application_ran);
  // Initialization already completed and stays recorded.
  EXPECT_TRUE(fs::exists(config.marker_path()));
}

TEST_F(FirstRunLauncherTest, DisabledGateSkipsSetupAndMarker) {
  install_assets();
  auto config = make_config();
  config.unpack.enabled = false;

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, 0);
  ASSERT_EQ(calls_.size(), 1u);
  EXPECT_FALSE(is_setup(calls_[0]));
  EXPECT_FALSE(fs::exists(config.marker_path()));
  EXPECT_TRUE(fs::exists(config.device_id_path()));
}

TEST_F(FirstRunLauncherTest, ConfiguredAndExtraArgumentsAreAppended) {
  install_assets();
  auto config = make_config();
  config.unpack.enabled = false;
  config.target_args = {"--mode", "kiosk"};

  run(config, {"--file", "my report.pdf"});

  ASSERT_EQ(calls_.size(), 1u);
  EXPECT_EQ(calls_[0].argv,
            (std::vector<std::string>{(base_ / "runtime" / "python").string(),
                                      (base_ / "main.py").string(), "--mode",
                                      "kiosk", "--file", "my report.pdf"}));
}

TEST_F(FirstRunLauncherTest, EmptySetupCommandIsAConfigurationError) {
  install_assets();
  auto config = make_config();
  config.unpack.command.clear();

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, exit_status::CONFIG_ERROR);
  EXPECT_TRUE(calls_.empty());
  EXPECT_FALSE(fs::exists(config.marker_path()));
}

TEST_F(FirstRunLauncherTest, MarkerWriteFailureDoesNotBlockLaunch) {
  install_assets();
  auto config = make_config();
  // A regular file where the marker's directory should be.
  testinfra::write_file(base_ / "blocked", "");
  config.unpack.marker_file = "blocked/.unpacked";

  auto outcome = run(config);

  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_TRUE(outcome.application_ran);
  ASSERT_EQ(calls_.size(), 2u);
  EXPECT_NE(iout_.err.str().find("Could not record setup completion"),
            std::string::npos);
}

TEST_F(FirstRunLauncherTest, BareSetupProgramIsLeftForPathLookup) {
  auto config = make_config();
  config.unpack.command = {"conda-unpack"};
  StaticLauncherConfigProvider provider(config);
  auto resolver = make_resolver(provider.get());
  launch::FirstRunLauncher launcher(provider, output_, resolver, runner_,
                                    prompt_);

  EXPECT_EQ(launcher.setup_argv(),
            (std::vector<std::string>{"conda-unpack"}));
}

} // namespace
