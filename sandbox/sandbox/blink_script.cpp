#include <libvireo/scene/resource_manager.hpp>
#include <sandbox/blink_script.hpp>

namespace vireo::sandbox {

BlinkScript::BlinkScript(float period, std::filesystem::path cookie) : period_(period) {
  cookie_.path = std::move(cookie);
}

std::unique_ptr<scene::Script> BlinkScript::clone() const {
  auto copy     = std::make_unique<BlinkScript>();
  copy->period_ = period_;
  copy->cookie_ = cookie_;
  return copy;
}

nlohmann::json BlinkScript::save() const {
  return {
      {"period", period_},
      {"cookie", cookie_.path.generic_string()},
  };
}

scene::Result<void, scene::SerializationError> BlinkScript::load(const nlohmann::json& data) {
  if (!data.is_object() || !data.contains("period") || !data["period"].is_number()) {
    return std::unexpected(scene::SerializationError{
        .msg  = "BlinkScript requires a numeric period",
        .code = scene::SerializationErrorCode::InvalidField{.field = "period"},
    });
  }
  period_ = data["period"].get<float>();

  if (data.contains("cookie") && data["cookie"].is_string()) {
    cookie_.path = data["cookie"].get<std::string>();
  }
  cookie_.data = nullptr;
  return {};
}

void BlinkScript::restore_resources(scene::ResourceManager& resource_manager) { resource_manager.resolve(cookie_); }

}  // namespace vireo::sandbox
