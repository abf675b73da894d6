#include <fmt/format.h>

#include <libvireo/editor/commands/node.hpp>

namespace vireo::editor::field {

CommandError payload_mismatch(std::string_view expected) {
  return CommandError{
      .msg  = fmt::format("Node is not a {}", expected),
      .code = CommandErrorCode::PayloadMismatch{},
  };
}

}  // namespace vireo::editor::field
