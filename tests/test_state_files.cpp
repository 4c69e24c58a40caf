#include <gtest/gtest.h>

#include <string>

#include "identity/identifier_store.hpp"
#include "launch/marker_file.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;
using devlaunch::identity::DeviceIdentifierStore;
using devlaunch::launch::MarkerFile;

TEST(DeviceIdentifierStoreTest, MissingFileLoadsNothing) {
  testinfra::TempDir dir;
  DeviceIdentifierStore store(dir / "device_id.txt");
  EXPECT_FALSE(store.exists());
  EXPECT_FALSE(store.load().has_value());
}

TEST(DeviceIdentifierStoreTest, SaveWritesSingleLineAndLeavesNoTempFiles) {
  testinfra::TempDir dir;
  DeviceIdentifierStore store(dir / "state" / "device_id.txt");

  ASSERT_FALSE(store.save("  4C4C4544-0042 \n").has_value());

  EXPECT_EQ(testinfra::read_file(store.path()), "4C4C4544-0042\n");
  ASSERT_TRUE(store.load().has_value());
  EXPECT_EQ(*store.load(), "4C4C4544-0042");

  int entries = 0;
  for (const auto &entry : fs::directory_iterator(dir / "state")) {
    (void)entry;
    ++entries;
  }
  EXPECT_EQ(entries, 1);
}

TEST(DeviceIdentifierStoreTest, SaveOverwritesExistingValue) {
  testinfra::TempDir dir;
  DeviceIdentifierStore store(dir / "device_id.txt");
  testinfra::write_file(store.path(), "OLD\nsecond line\n");

  ASSERT_FALSE(store.save("NEW").has_value());

  EXPECT_EQ(testinfra::read_file(store.path()), "NEW\n");
}

TEST(DeviceIdentifierStoreTest, EmptyIdentifierIsRejected) {
  testinfra::TempDir dir;
  DeviceIdentifierStore store(dir / "device_id.txt");

  auto err = store.save("   ");

  ASSERT_TRUE(err.has_value());
  EXPECT_EQ(err->code, my_errors::GENERAL::INVALID_ARGUMENT);
  EXPECT_FALSE(store.exists());
}

TEST(DeviceIdentifierStoreTest, LoadReadsOnlyTheFirstLine) {
  testinfra::TempDir dir;
  DeviceIdentifierStore store(dir / "device_id.txt");
  testinfra::write_file(store.path(), "\tABC \r\nignored\n");
  ASSERT_TRUE(store.load().has_value());
  EXPECT_EQ(*store.load(), "ABC");
}

TEST(DeviceIdentifierStoreTest, RemoveIsQuietWhenAbsent) {
  testinfra::TempDir dir;
  DeviceIdentifierStore store(dir / "device_id.txt");
  EXPECT_FALSE(store.remove().has_value());
  testinfra::write_file(store.path(), "X\n");
  EXPECT_FALSE(store.remove().has_value());
  EXPECT_FALSE(store.exists());
}

TEST(MarkerFileTest, CreateIsIdempotent) {
  testinfra::TempDir dir;
  MarkerFile marker(dir / ".unpacked");
  EXPECT_FALSE(marker.exists());

  ASSERT_FALSE(marker.create().has_value());
  EXPECT_TRUE(marker.exists());
  ASSERT_FALSE(marker.create().has_value());
  EXPECT_TRUE(marker.exists());
}

TEST(MarkerFileTest, ExistingContentIsLeftAlone) {
  testinfra::TempDir dir;
  MarkerFile marker(dir / ".unpacked");
  testinfra::write_file(marker.path(), "written by an older launcher");

  ASSERT_FALSE(marker.create().has_value());
  EXPECT_EQ(testinfra::read_file(marker.path()),
            "written by an older launcher");
}

TEST(MarkerFileTest, CreatesParentDirectories) {
  testinfra::TempDir dir;
  MarkerFile marker(dir / "state" / "nested" / ".unpacked");
  ASSERT_FALSE(marker.create().has_value());
  EXPECT_TRUE(fs::is_regular_file(marker.path()));
}

TEST(MarkerFileTest, RemoveClearsTheMarker) {
  testinfra::TempDir dir;
  MarkerFile marker(dir / ".unpacked");
  ASSERT_FALSE(marker.create().has_value());
  ASSERT_FALSE(marker.remove().has_value());
  EXPECT_FALSE(marker.exists());
}

} // namespace
