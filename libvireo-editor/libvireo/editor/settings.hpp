#pragma once

#include <cstddef>
#include <filesystem>
#include <libvireo/editor/error.hpp>
#include <libvireo/util/logger.hpp>
#include <memory>

namespace vireo::editor {

struct EditorSettings {
  static constexpr size_t kDefaultMaxHistory = 512;

  /**
   * @brief Capacity of the undo/redo history.
   *
   */
  size_t max_history = kDefaultMaxHistory;

  std::filesystem::path log_file = "vireo.log";
  util::LogLevel verbosity       = util::LogLevel::Info;

  /**
   * @brief Reads settings from a JSON file. Keys missing in the file keep their default values.
   *
   */
  static Result<EditorSettings, SettingsError> load(const std::filesystem::path& path);

  Result<void, SettingsError> save(const std::filesystem::path& path) const;
};

/**
 * @brief Creates a logger writing to the terminal and to the configured log file.
 *
 */
std::unique_ptr<util::Logger> make_logger(const EditorSettings& settings);

}  // namespace vireo::editor
