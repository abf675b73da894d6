#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <libvireo/editor/settings.hpp>
#include <string>

using namespace vireo::editor;  // NOLINT

class SettingsTest : public testing::Test {
 protected:
  SettingsTest() : path_(std::filesystem::temp_directory_path() / "vireo_settings_test.json") {
    std::filesystem::remove(path_);
  }
  ~SettingsTest() override { std::filesystem::remove(path_); }

  void write(const std::string& content) {
    auto file = std::ofstream(path_, std::ios::trunc);
    file << content;
  }

  std::filesystem::path path_;
};

TEST_F(SettingsTest, MissingFileIsReported) {
  // when
  auto settings = EditorSettings::load(path_);

  // then
  ASSERT_FALSE(settings.has_value());
  EXPECT_EQ(settings.error().code, SettingsErrorCode::FileNotFound);
}

TEST_F(SettingsTest, MissingKeysKeepDefaults) {
  // given
  write(R"({"max_history": 16})");

  // when
  auto settings = EditorSettings::load(path_);

  // then
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->max_history, 16);
  EXPECT_EQ(settings->log_file.generic_string(), "vireo.log");
  EXPECT_EQ(settings->verbosity, vireo::util::LogLevel::Info);
}

TEST_F(SettingsTest, SavedSettingsAreLoadedBack) {
  // given
  auto settings        = EditorSettings();
  settings.max_history = 8;
  settings.log_file    = "logs/editor.log";
  settings.verbosity   = vireo::util::LogLevel::Warn;

  // when
  ASSERT_TRUE(settings.save(path_).has_value());
  auto loaded = EditorSettings::load(path_);

  // then
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->max_history, 8);
  EXPECT_EQ(loaded->log_file.generic_string(), "logs/editor.log");
  EXPECT_EQ(loaded->verbosity, vireo::util::LogLevel::Warn);
}

TEST_F(SettingsTest, MalformedJsonIsIncorrectFormat) {
  write("{ max_history: ");

  auto settings = EditorSettings::load(path_);

  ASSERT_FALSE(settings.has_value());
  EXPECT_EQ(settings.error().code, SettingsErrorCode::IncorrectFormat);
}

TEST_F(SettingsTest, ZeroHistoryIsRejected) {
  write(R"({"max_history": 0})");

  auto settings = EditorSettings::load(path_);

  ASSERT_FALSE(settings.has_value());
  EXPECT_EQ(settings.error().code, SettingsErrorCode::IncorrectFormat);
}

TEST_F(SettingsTest, UnknownVerbosityIsRejected) {
  write(R"({"verbosity": "LOUD"})");

  auto settings = EditorSettings::load(path_);

  ASSERT_FALSE(settings.has_value());
  EXPECT_EQ(settings.error().code, SettingsErrorCode::InvalidVerbosity);
}

TEST(MakeLoggerTest, UsesConfiguredVerbosity) {
  // given
  auto settings      = EditorSettings();
  settings.log_file  = "";
  settings.verbosity = vireo::util::LogLevel::Err;

  // when
  auto logger = make_logger(settings);

  // then
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->verbosity(), vireo::util::LogLevel::Err);
}
