#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <libvireo/scene/absm.hpp>
#include <libvireo/util/try.hpp>
#include <optional>

namespace vireo::scene {

namespace {

constexpr auto kMachineKey = "machine";

MachineInstantiationError invalid_definition(std::string msg) {
  return MachineInstantiationError{
      .msg  = std::move(msg),
      .code = MachineInstantiationErrorCode::InvalidDefinition{},
  };
}

std::optional<std::string> read_string(const nlohmann::json& object, const char* key) {
  if (!object.contains(key) || !object[key].is_string()) {
    return std::nullopt;
  }
  return object[key].get<std::string>();
}

std::optional<size_t> find_state(const MachineDefinition& definition, std::string_view name) {
  auto it = std::ranges::find(definition.states, name, &StateDefinition::name);
  if (it == definition.states.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::distance(definition.states.begin(), it));
}

}  // namespace

nlohmann::json MachineDefinition::save() const {
  auto states_json = nlohmann::json::array();
  for (const auto& state : states) {
    states_json.push_back({
        {"name", state.name},
        {"model", state.model.generic_string()},
        {"animation", state.animation},
    });
  }

  auto transitions_json = nlohmann::json::array();
  for (const auto& transition : transitions) {
    transitions_json.push_back({
        {"name", transition.name},
        {"source", transition.source},
        {"dest", transition.dest},
        {"duration", transition.duration},
        {"rule", transition.rule},
    });
  }

  return {
      {"states", std::move(states_json)},
      {"transitions", std::move(transitions_json)},
      {"entry_state", entry_state},
  };
}

Result<MachineDefinition, MachineInstantiationError> MachineDefinition::load(const nlohmann::json& data) {
  if (!data.is_object() || !data.contains("states") || !data["states"].is_array()) {
    return std::unexpected(invalid_definition("Machine definition has no states"));
  }

  auto definition = MachineDefinition();
  for (const auto& state : data["states"]) {
    auto name      = read_string(state, "name");
    auto model     = read_string(state, "model");
    auto animation = read_string(state, "animation");
    if (!name || !model || !animation) {
      return std::unexpected(invalid_definition("State definition lacks a name, a model or an animation"));
    }
    definition.states.push_back(StateDefinition{.name = *name, .model = *model, .animation = *animation});
  }

  if (data.contains("transitions")) {
    if (!data["transitions"].is_array()) {
      return std::unexpected(invalid_definition("Machine transitions must be an array"));
    }
    for (const auto& transition : data["transitions"]) {
      auto name   = read_string(transition, "name");
      auto source = read_string(transition, "source");
      auto dest   = read_string(transition, "dest");
      auto rule   = read_string(transition, "rule");
      if (!name || !source || !dest || !rule || !transition.contains("duration") ||
          !transition["duration"].is_number()) {
        return std::unexpected(invalid_definition("Transition definition is incomplete"));
      }
      definition.transitions.push_back(TransitionDefinition{
          .name     = *name,
          .source   = *source,
          .dest     = *dest,
          .duration = transition["duration"].get<float>(),
          .rule     = *rule,
      });
    }
  }

  auto entry = read_string(data, "entry_state");
  if (!entry) {
    return std::unexpected(invalid_definition("Machine definition has no entry state"));
  }
  definition.entry_state = *entry;

  return definition;
}

Result<AbsmResource, MachineInstantiationError> AbsmResource::from_memory(std::span<const uint8_t> data,
                                                                          std::filesystem::path path) {
  auto document = nlohmann::json::from_cbor(data.begin(), data.end(), true, false);
  if (document.is_discarded() || !document.is_object() || !document.contains(kMachineKey)) {
    return std::unexpected(MachineInstantiationError{
        .msg  = "Machine resource is not a valid CBOR document",
        .code =
            MachineInstantiationErrorCode::Deserialization{
                .error =
                    SerializationError{
                        .msg  = "Malformed CBOR document",
                        .code = SerializationErrorCode::MalformedData{},
                    },
            },
    });
  }

  TRY_UNWRAP_DEFINE(definition, MachineDefinition::load(document[kMachineKey]));

  return AbsmResource(std::move(path), std::move(definition));
}

Result<AbsmResource, MachineInstantiationError> AbsmResource::from_file(const std::filesystem::path& path) {
  auto resource_load_error = [&path](std::string msg, ResourceErrorCode code) {
    return MachineInstantiationError{
        .msg  = msg,
        .code = MachineInstantiationErrorCode::ResourceLoad{
            .error = ResourceError{.path = path, .msg = msg, .code = code},
        },
    };
  };

  if (!std::filesystem::exists(path)) {
    return std::unexpected(resource_load_error("File does not exist.", ResourceErrorCode::NotFound));
  }
  if (std::filesystem::is_directory(path)) {
    return std::unexpected(resource_load_error("Path is a directory, not a file.", ResourceErrorCode::NotAFile));
  }

  auto file = std::ifstream(path, std::ios::binary);
  if (!file) {
    return std::unexpected(resource_load_error("Could not open the file.", ResourceErrorCode::ReadFailure));
  }
  auto bytes = std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

  return from_memory(bytes, path);
}

std::vector<uint8_t> AbsmResource::to_memory() const {
  auto document         = nlohmann::json::object();
  document[kMachineKey] = definition_.save();
  return nlohmann::json::to_cbor(document);
}

Result<void, ResourceError> AbsmResource::save(const std::filesystem::path& path) const {
  auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    return std::unexpected(ResourceError{
        .path = path,
        .msg  = "Could not open the file for writing.",
        .code = ResourceErrorCode::ReadFailure,
    });
  }

  const auto bytes = to_memory();
  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));  // NOLINT
  return {};
}

Result<MachineHandle, MachineInstantiationError> AbsmResource::instantiate(
    NodeHandle root, Scene& scene, const ResourceManager& resource_manager) const {
  auto entry = find_state(definition_, definition_.entry_state);
  if (!entry) {
    return std::unexpected(
        invalid_definition(fmt::format("Entry state \"{}\" is not defined", definition_.entry_state)));
  }

  auto transitions = std::vector<MachineTransition>();
  transitions.reserve(definition_.transitions.size());
  for (const auto& transition : definition_.transitions) {
    auto source = find_state(definition_, transition.source);
    auto dest   = find_state(definition_, transition.dest);
    if (!source || !dest) {
      return std::unexpected(
          invalid_definition(fmt::format("Transition \"{}\" connects unknown states", transition.name)));
    }
    transitions.push_back(MachineTransition{
        .name     = transition.name,
        .source   = *source,
        .dest     = *dest,
        .duration = transition.duration,
        .rule     = transition.rule,
    });
  }

  // Every animation is retargeted before anything is added, so a single failure leaves the scene untouched.
  auto animations = std::vector<Animation>();
  animations.reserve(definition_.states.size());
  for (const auto& state : definition_.states) {
    auto model = resource_manager.request_model(state.model);
    if (!model) {
      return std::unexpected(MachineInstantiationError{
          .msg  = fmt::format("Model of state \"{}\" could not be loaded", state.name),
          .code = MachineInstantiationErrorCode::ResourceLoad{.error = std::move(model.error())},
      });
    }

    const auto* animation = (*model)->find_animation(state.animation);
    if (animation == nullptr) {
      return std::unexpected(MachineInstantiationError{
          .msg  = fmt::format("Animation \"{}\" of state \"{}\" does not exist", state.animation, state.name),
          .code = MachineInstantiationErrorCode::MissingAnimation{.animation = state.animation},
      });
    }

    auto retargeted = animation->retarget((*model)->graph(), scene.graph, root);
    if (!retargeted) {
      return std::unexpected(MachineInstantiationError{
          .msg  = fmt::format("Animation of state \"{}\" could not be retargeted", state.name),
          .code = MachineInstantiationErrorCode::Retargeting{.state = state.name, .error = retargeted.error()},
      });
    }
    animations.push_back(std::move(*retargeted));
  }

  auto states = std::vector<MachineState>();
  states.reserve(definition_.states.size());
  for (size_t i = 0; i < definition_.states.size(); ++i) {
    states.push_back(MachineState{
        .name      = definition_.states[i].name,
        .animation = scene.animations.spawn(std::move(animations[i])),
    });
  }

  auto machine = Machine(root, std::move(states), std::move(transitions), *entry);
  machine.set_resource(path_);
  return scene.animation_machines.spawn(std::move(machine));
}

}  // namespace vireo::scene
