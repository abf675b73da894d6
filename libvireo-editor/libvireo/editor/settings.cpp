#include <fstream>
#include <libvireo/editor/settings.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace vireo::editor {

Result<EditorSettings, SettingsError> EditorSettings::load(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return std::unexpected(SettingsError{
        .path = path,
        .msg  = "Settings file does not exist.",
        .code = SettingsErrorCode::FileNotFound,
    });
  }

  auto file = std::ifstream(path);
  if (!file) {
    return std::unexpected(SettingsError{
        .path = path,
        .msg  = "Could not open the settings file.",
        .code = SettingsErrorCode::ReadFailure,
    });
  }

  auto document = nlohmann::json::parse(file, nullptr, false);
  if (document.is_discarded() || !document.is_object()) {
    return std::unexpected(SettingsError{
        .path = path,
        .msg  = "Settings file is not a valid JSON object.",
        .code = SettingsErrorCode::IncorrectFormat,
    });
  }

  auto settings = EditorSettings();
  if (document.contains("max_history")) {
    const auto& value = document["max_history"];
    if (!value.is_number_unsigned() || value.get<size_t>() == 0) {
      return std::unexpected(SettingsError{
          .path = path,
          .msg  = "max_history must be a positive integer.",
          .code = SettingsErrorCode::IncorrectFormat,
      });
    }
    settings.max_history = value.get<size_t>();
  }

  if (document.contains("log_file")) {
    const auto& value = document["log_file"];
    if (!value.is_string()) {
      return std::unexpected(SettingsError{
          .path = path,
          .msg  = "log_file must be a string.",
          .code = SettingsErrorCode::IncorrectFormat,
      });
    }
    settings.log_file = value.get<std::string>();
  }

  if (document.contains("verbosity")) {
    const auto& value = document["verbosity"];
    auto level        = value.is_string() ? util::log_level_from_string(value.get<std::string>()) : std::nullopt;
    if (!level) {
      return std::unexpected(SettingsError{
          .path = path,
          .msg  = "verbosity must be one of ERROR, WARN or INFO.",
          .code = SettingsErrorCode::InvalidVerbosity,
      });
    }
    settings.verbosity = *level;
  }

  return settings;
}

Result<void, SettingsError> EditorSettings::save(const std::filesystem::path& path) const {
  auto file = std::ofstream(path, std::ios::trunc);
  if (!file) {
    return std::unexpected(SettingsError{
        .path = path,
        .msg  = "Could not open the settings file for writing.",
        .code = SettingsErrorCode::WriteFailure,
    });
  }

  const auto document = nlohmann::json{
      {"max_history", max_history},
      {"log_file", log_file.generic_string()},
      {"verbosity", std::string(util::log_prefix(verbosity))},
  };
  file << document.dump(2) << '\n';
  return {};
}

std::unique_ptr<util::Logger> make_logger(const EditorSettings& settings) {
  auto logger = std::make_unique<util::Logger>(settings.verbosity);
  logger->add_scribe(std::make_unique<util::TerminalLoggerScribe>());
  if (!settings.log_file.empty()) {
    auto file_scribe = std::make_unique<util::FileLoggerScribe>(settings.log_file);
    if (!file_scribe->is_open()) {
      logger->warn(R"(Could not open log file "{}".)", settings.log_file.string());
    } else {
      logger->add_scribe(std::move(file_scribe));
    }
  }
  return logger;
}

}  // namespace vireo::editor
