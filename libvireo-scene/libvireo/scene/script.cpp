#include <libvireo/scene/script.hpp>
#include <libvireo/util/try.hpp>
#include <utility>

namespace vireo::scene {

namespace {

constexpr auto kScriptKey = "script";
constexpr auto kTypeKey   = "type";
constexpr auto kDataKey   = "data";

}  // namespace

void ScriptRegistry::add(std::string type_name, Factory factory) {
  factories_.insert_or_assign(std::move(type_name), std::move(factory));
}

bool ScriptRegistry::contains(std::string_view type_name) const { return factories_.find(type_name) != factories_.end(); }

std::unique_ptr<Script> ScriptRegistry::create(std::string_view type_name) const {
  if (auto it = factories_.find(type_name); it != factories_.end()) {
    return it->second();
  }
  return nullptr;
}

Result<ScriptBlob, SerializationError> serialize_script(const Script* script, const SerializationContext& ctx) {
  auto document = nlohmann::json::object();
  if (script == nullptr) {
    document[kScriptKey] = nullptr;
    return nlohmann::json::to_cbor(document);
  }

  if (!ctx.script_registry.contains(script->type_name())) {
    return std::unexpected(SerializationError{
        .msg  = "Script type is not registered in the serialization context",
        .code = SerializationErrorCode::UnknownScriptType{.type_name = std::string(script->type_name())},
    });
  }

  document[kScriptKey] = {
      {kTypeKey, std::string(script->type_name())},
      {kDataKey, script->save()},
  };
  return nlohmann::json::to_cbor(document);
}

Result<std::unique_ptr<Script>, SerializationError> deserialize_script(std::span<const uint8_t> blob,
                                                                       const SerializationContext& ctx) {
  auto document = nlohmann::json::from_cbor(blob.begin(), blob.end(), true, false);
  if (document.is_discarded() || !document.is_object() || !document.contains(kScriptKey)) {
    return std::unexpected(SerializationError{
        .msg  = "Script blob is not a valid CBOR document",
        .code = SerializationErrorCode::MalformedData{},
    });
  }

  const auto& entry = document[kScriptKey];
  if (entry.is_null()) {
    return std::unique_ptr<Script>();
  }

  if (!entry.is_object() || !entry.contains(kTypeKey) || !entry[kTypeKey].is_string() || !entry.contains(kDataKey)) {
    return std::unexpected(SerializationError{
        .msg  = "Script entry lacks a type name or data",
        .code = SerializationErrorCode::MalformedData{},
    });
  }

  const auto type_name = entry[kTypeKey].get<std::string>();
  auto script          = ctx.script_registry.create(type_name);
  if (!script) {
    return std::unexpected(SerializationError{
        .msg  = "Script type is not registered in the serialization context",
        .code = SerializationErrorCode::UnknownScriptType{.type_name = type_name},
    });
  }

  TRY(script->load(entry[kDataKey]));

  return script;
}

}  // namespace vireo::scene
