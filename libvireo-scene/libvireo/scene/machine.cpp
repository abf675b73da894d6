#include <cassert>
#include <libvireo/scene/machine.hpp>

namespace vireo::scene {

Machine::Machine(NodeHandle root, std::vector<MachineState> states, std::vector<MachineTransition> transitions,
                 size_t entry_state)
    : root_(root), states_(std::move(states)), transitions_(std::move(transitions)), active_state_(entry_state) {
  assert(active_state_ < states_.size() && "Entry state must be one of the machine states");
}

bool Machine::parameter(const std::string& rule) const {
  auto it = parameters_.find(rule);
  return it != parameters_.end() && it->second;
}

bool Machine::evaluate() {
  for (const auto& transition : transitions_) {
    if (transition.source == active_state_ && parameter(transition.rule)) {
      active_state_ = transition.dest;
      return true;
    }
  }
  return false;
}

std::vector<AnimationHandle> Machine::animations() const {
  auto result = std::vector<AnimationHandle>();
  result.reserve(states_.size());
  for (const auto& state : states_) {
    result.push_back(state.animation);
  }
  return result;
}

}  // namespace vireo::scene
