#pragma once

#include <cstdint>
#include <filesystem>
#include <libvireo/scene/error.hpp>
#include <libvireo/util/result.hpp>
#include <string>
#include <variant>

namespace vireo::editor {

class CommandErrorCode {
 public:
  struct InvalidHandle {};
  struct InvalidIndex {
    size_t index;
    size_t size;
  };
  struct InvalidState {};
  struct MissingScript {};
  struct PayloadMismatch {};
  struct NodeHasChildren {};
  struct CyclicLink {};
  struct Serialization {
    scene::SerializationError error;
  };

  using Enum = std::variant<  //
      InvalidHandle,          //
      InvalidIndex,           //
      InvalidState,           //
      MissingScript,          //
      PayloadMismatch,        //
      NodeHasChildren,        //
      CyclicLink,             //
      Serialization           //
      >;
};

struct CommandError {
  /**
   * @brief Short error summary.
   *
   */
  std::string msg;

  /**
   * @brief Error code with optional context info.
   *
   */
  CommandErrorCode::Enum code;

  template <typename TErrorCode>
  bool has_code() const {
    return std::holds_alternative<TErrorCode>(code);
  }

  template <typename TErrorCode>
  const TErrorCode& get_code() const {
    return std::get<TErrorCode>(code);
  }
};

enum class SettingsErrorCode : uint8_t {
  FileNotFound     = 0,
  ReadFailure      = 1,
  WriteFailure     = 2,
  IncorrectFormat  = 3,
  InvalidVerbosity = 4,
};

struct SettingsError {
  std::filesystem::path path;
  std::string msg;
  SettingsErrorCode code;
};

template <typename TType, typename TError>
using Result = util::Result<TType, TError>;

}  // namespace vireo::editor
