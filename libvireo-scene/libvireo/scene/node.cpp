#include <algorithm>
#include <cmath>
#include <libvireo/scene/node.hpp>
#include <libvireo/util/match.hpp>

namespace vireo::scene {

Node::Node(std::string name, NodeKind kind) : name_(std::move(name)), kind_(std::move(kind)) {}

Node::~Node()                          = default;
Node::Node(Node&&) noexcept            = default;
Node& Node::operator=(Node&&) noexcept = default;

Node Node::clone() const {
  auto copy             = Node(name_, kind_);
  copy.tag_             = tag_;
  copy.visibility_      = visibility_;
  copy.frustum_culling_ = frustum_culling_;
  copy.mobility_        = mobility_;
  copy.depth_offset_    = depth_offset_;
  copy.cast_shadows_    = cast_shadows_;
  copy.transform_       = transform_;
  copy.properties_      = properties_;
  if (script_) {
    copy.script_ = script_->clone();
  }
  return copy;
}

void Node::set_depth_offset_factor(float factor) { depth_offset_ = std::clamp(std::abs(factor), 0.F, 1.F); }

BaseLight* Node::base_light() {
  return std::visit(util::match{
                        [](PointLight& light) -> BaseLight* { return &light.base; },
                        [](DirectionalLight& light) -> BaseLight* { return &light.base; },
                        [](auto&) -> BaseLight* { return nullptr; },
                    },
                    kind_);
}

const BaseLight* Node::base_light() const { return const_cast<Node*>(this)->base_light(); }  // NOLINT

}  // namespace vireo::scene
