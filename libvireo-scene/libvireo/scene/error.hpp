#pragma once

#include <filesystem>
#include <libvireo/util/result.hpp>
#include <string>
#include <variant>

namespace vireo::scene {

enum class ResourceErrorCode : uint8_t {
  NotFound        = 0,
  NotAFile        = 1,
  ReadFailure     = 2,
  IncorrectFormat = 3,
};

struct ResourceError {
  std::filesystem::path path;
  std::string msg;
  ResourceErrorCode code;
};

class SerializationErrorCode {
 public:
  struct MalformedData {};
  struct UnknownScriptType {
    std::string type_name;
  };
  struct InvalidField {
    std::string field;
  };

  using Enum = std::variant<  //
      MalformedData,          //
      UnknownScriptType,      //
      InvalidField            //
      >;
};

struct SerializationError {
  /**
   * @brief Short error summary.
   *
   */
  std::string msg;

  /**
   * @brief Error code with optional context info.
   *
   */
  SerializationErrorCode::Enum code;

  template <typename TErrorCode>
  bool has_code() const {
    return std::holds_alternative<TErrorCode>(code);
  }

  template <typename TErrorCode>
  const TErrorCode& get_code() const {
    return std::get<TErrorCode>(code);
  }
};

class InstantiationErrorCode {
 public:
  struct MissingTargetNode {
    std::string node_name;
  };
  struct InvalidTrack {
    size_t track_index;
  };
  struct EmptyPrototype {};

  using Enum = std::variant<  //
      MissingTargetNode,      //
      InvalidTrack,           //
      EmptyPrototype          //
      >;
};

struct InstantiationError {
  std::string msg;
  InstantiationErrorCode::Enum code;

  template <typename TErrorCode>
  bool has_code() const {
    return std::holds_alternative<TErrorCode>(code);
  }

  template <typename TErrorCode>
  const TErrorCode& get_code() const {
    return std::get<TErrorCode>(code);
  }
};

class MachineInstantiationErrorCode {
 public:
  struct ResourceLoad {
    ResourceError error;
  };
  struct Deserialization {
    SerializationError error;
  };
  struct Retargeting {
    std::string state;
    InstantiationError error;
  };
  struct MissingAnimation {
    std::string animation;
  };
  struct InvalidDefinition {};

  using Enum = std::variant<  //
      ResourceLoad,           //
      Deserialization,        //
      Retargeting,            //
      MissingAnimation,       //
      InvalidDefinition       //
      >;
};

struct MachineInstantiationError {
  std::string msg;
  MachineInstantiationErrorCode::Enum code;

  template <typename TErrorCode>
  bool has_code() const {
    return std::holds_alternative<TErrorCode>(code);
  }

  template <typename TErrorCode>
  const TErrorCode& get_code() const {
    return std::get<TErrorCode>(code);
  }
};

template <typename TType, typename TError>
using Result = util::Result<TType, TError>;

}  // namespace vireo::scene
