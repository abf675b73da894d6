#pragma once

#include <filesystem>
#include <libvireo/scene/script.hpp>
#include <libvireo/scene/texture.hpp>
#include <memory>
#include <string_view>

namespace vireo::sandbox {

/**
 * @brief Toggles the visibility of its node with a fixed period and swaps the light cookie.
 *
 */
class BlinkScript : public scene::Script {
 public:
  static constexpr std::string_view kTypeName = "BlinkScript";

  BlinkScript() = default;
  BlinkScript(float period, std::filesystem::path cookie);

  std::string_view type_name() const override { return kTypeName; }
  std::unique_ptr<scene::Script> clone() const override;
  nlohmann::json save() const override;
  scene::Result<void, scene::SerializationError> load(const nlohmann::json& data) override;
  void restore_resources(scene::ResourceManager& resource_manager) override;

  float period() const { return period_; }
  void set_period(float period) { period_ = period; }

  const scene::TextureRef& cookie() const { return cookie_; }

 private:
  float period_{1.F};
  scene::TextureRef cookie_;
};

}  // namespace vireo::sandbox
