#include <gtest/gtest.h>

#include <boost/json.hpp>

#include <stdexcept>
#include <string>

#include "conf/launcher_config.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using devlaunch::LauncherConfig;
using devlaunch::LauncherConfigProviderFile;
using devlaunch::parse_launcher_config;
namespace json = boost::json;

TEST(LauncherConfigTest, EmptyObjectYieldsDefaults) {
  auto config = parse_launcher_config("{}", "/opt/app");

  EXPECT_EQ(config.base_dir, fs::path("/opt/app"));
  EXPECT_EQ(config.device_id_file, "device_id.txt");
  EXPECT_EQ(config.interpreter, devlaunch::kDefaultInterpreter);
  EXPECT_TRUE(config.unpack.enabled);
  EXPECT_EQ(config.unpack.marker_file, ".unpacked");
  EXPECT_EQ(config.unpack.command,
            std::vector<std::string>{devlaunch::kDefaultUnpackTool});
  EXPECT_EQ(config.target_entry, "main.py");
  EXPECT_TRUE(config.target_args.empty());
  EXPECT_EQ(config.identity_providers,
            (std::vector<std::string>{"product_uuid", "bios_serial",
                                      "mac_address"}));
  EXPECT_TRUE(config.pause_on_exit);
  EXPECT_EQ(config.log.level, "info");
  EXPECT_EQ(config.log.log_dir, "log");
}

TEST(LauncherConfigTest, ParsesEveryKey) {
  const std::string content = R"({
    "device_id_file": "state/id.txt",
    "runtime": {"interpreter": "env/bin/python3"},
    "unpack": {"enabled": false, "marker_file": "state/.ready",
               "command": ["env/bin/fixup", "--all"], "timeout_ms": 60000},
    "target": {"entry": "app/run.py", "args": ["--kiosk"]},
    "identity": {"providers": ["mac_address"]},
    "pause_on_exit": false,
    "log": {"level": "debug", "log_dir": "logs", "log_file": "launcher",
            "rotation_size": 1024}
  })";

  auto config = parse_launcher_config(content, "/srv/app");

  EXPECT_EQ(config.device_id_path(), fs::path("/srv/app/state/id.txt"));
  EXPECT_EQ(config.interpreter_path(), fs::path("/srv/app/env/bin/python3"));
  EXPECT_FALSE(config.unpack.enabled);
  EXPECT_EQ(config.marker_path(), fs::path("/srv/app/state/.ready"));
  EXPECT_EQ(config.unpack.command,
            (std::vector<std::string>{"env/bin/fixup", "--all"}));
  EXPECT_EQ(config.unpack.timeout_ms, 60000u);
  EXPECT_EQ(config.target_entry_path(), fs::path("/srv/app/app/run.py"));
  EXPECT_EQ(config.target_args, std::vector<std::string>{"--kiosk"});
  EXPECT_EQ(config.identity_providers,
            std::vector<std::string>{"mac_address"});
  EXPECT_FALSE(config.pause_on_exit);
  EXPECT_EQ(config.log.level, "debug");
  EXPECT_EQ(config.log_dir_path(), fs::path("/srv/app/logs"));
  EXPECT_EQ(config.log.log_file, "launcher");
  EXPECT_EQ(config.log.rotation_size, 1024u);
}

TEST(LauncherConfigTest, AbsolutePathsAreKept) {
  auto config = parse_launcher_config(
      R"({"runtime": {"interpreter": "/usr/bin/python3"}})", "/srv/app");
  EXPECT_EQ(config.interpreter_path(), fs::path("/usr/bin/python3"));
}

TEST(LauncherConfigTest, MalformedJsonThrows) {
  EXPECT_THROW(parse_launcher_config("{\"runtime\": ", "/srv/app"),
               std::runtime_error);
}

TEST(LauncherConfigTest, WrongTypesThrow) {
  EXPECT_THROW(parse_launcher_config(R"({"device_id_file": 5})", "/a"),
               std::runtime_error);
  EXPECT_THROW(parse_launcher_config(R"({"target": "main.py"})", "/a"),
               std::runtime_error);
  EXPECT_THROW(
      parse_launcher_config(R"({"identity": {"providers": "mac"}})", "/a"),
      std::runtime_error);
  EXPECT_THROW(parse_launcher_config(R"({"pause_on_exit": "yes"})", "/a"),
               std::runtime_error);
  EXPECT_THROW(parse_launcher_config("[]", "/a"), std::runtime_error);
}

TEST(LauncherConfigTest, SerializedDefaultsParseBackToDefaults) {
  LauncherConfig defaults;
  auto text = json::serialize(json::value_from(defaults));

  auto config = parse_launcher_config(text, "/x");

  EXPECT_EQ(config.device_id_file, defaults.device_id_file);
  EXPECT_EQ(config.unpack.command, defaults.unpack.command);
  EXPECT_EQ(config.identity_providers, defaults.identity_providers);
  EXPECT_EQ(config.log.rotation_size, defaults.log.rotation_size);
}

TEST(LauncherConfigProviderFileTest, MissingFileWritesDefaults) {
  testinfra::TempDir base;

  LauncherConfigProviderFile provider(base.path());

  EXPECT_FALSE(provider.loaded_from_file());
  EXPECT_EQ(provider.get().base_dir, base.path());
  EXPECT_EQ(provider.config_file(), base / "launcher.json");
  ASSERT_TRUE(fs::exists(provider.config_file()));
  auto written = json::parse(testinfra::read_file(provider.config_file()));
  EXPECT_TRUE(written.as_object().contains("unpack"));
}

TEST(LauncherConfigProviderFileTest, ExistingFileIsLoaded) {
  testinfra::TempDir base;
  testinfra::write_file(base / "launcher.json",
                        R"({"target": {"entry": "gui.py"}})");

  LauncherConfigProviderFile provider(base.path());

  EXPECT_TRUE(provider.loaded_from_file());
  EXPECT_EQ(provider.get().target_entry, "gui.py");
  EXPECT_EQ(provider.get().target_entry_path(), base / "gui.py");
}

TEST(LauncherConfigProviderFileTest, BrokenFileThrows) {
  testinfra::TempDir base;
  testinfra::write_file(base / "launcher.json", "{not json");
  EXPECT_THROW(LauncherConfigProviderFile provider(base.path()),
               std::runtime_error);
}

} // namespace
