#pragma once

#include <cstddef>
#include <filesystem>
#include <libvireo/scene/animation.hpp>
#include <libvireo/scene/graph.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace vireo::scene {

struct MachineState {
  std::string name;
  AnimationHandle animation;
};

struct MachineTransition {
  std::string name;
  size_t source{};
  size_t dest{};
  float duration{};

  /**
   * @brief Name of the boolean parameter that enables the transition.
   *
   */
  std::string rule;
};

class Machine;
using MachineHandle = Handle<Machine>;

/**
 * @brief Animation blending state machine instance. Every state plays one animation of the scene, transitions switch
 * the active state when their rule parameter is set.
 *
 */
class Machine {
 public:
  Machine(NodeHandle root, std::vector<MachineState> states, std::vector<MachineTransition> transitions,
          size_t entry_state);

  NodeHandle root() const { return root_; }
  const std::vector<MachineState>& states() const { return states_; }
  const std::vector<MachineTransition>& transitions() const { return transitions_; }

  size_t active_state_index() const { return active_state_; }
  const MachineState& active_state() const { return states_[active_state_]; }

  void set_parameter(const std::string& rule, bool value) { parameters_[rule] = value; }
  [[nodiscard]] bool parameter(const std::string& rule) const;

  /**
   * @brief Takes the first transition leaving the active state whose rule is set. Returns true if the active state
   * changed.
   *
   */
  bool evaluate();

  [[nodiscard]] std::vector<AnimationHandle> animations() const;

  /**
   * @brief Path of the resource the machine was instantiated from, empty for machines built in code.
   *
   */
  const std::filesystem::path& resource() const { return resource_; }
  void set_resource(std::filesystem::path resource) { resource_ = std::move(resource); }

 private:
  NodeHandle root_;
  std::vector<MachineState> states_;
  std::vector<MachineTransition> transitions_;
  size_t active_state_;
  std::unordered_map<std::string, bool> parameters_;
  std::filesystem::path resource_;
};

}  // namespace vireo::scene
