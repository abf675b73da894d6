#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <libvireo/scene/animation.hpp>

namespace vireo::scene {

namespace {

math::Vec3f sample(const std::vector<KeyFrame>& keyframes, float time) {
  if (keyframes.empty()) {
    return math::Vec3f::zeros();
  }
  if (time <= keyframes.front().time) {
    return keyframes.front().position;
  }
  if (time >= keyframes.back().time) {
    return keyframes.back().position;
  }

  auto next = std::ranges::upper_bound(keyframes, time, {}, &KeyFrame::time);
  auto prev = std::prev(next);

  const float span = next->time - prev->time;
  const float t    = span > 0.F ? (time - prev->time) / span : 0.F;
  return prev->position * (1.F - t) + next->position * t;
}

}  // namespace

float Animation::length() const {
  float result = 0.F;
  for (const auto& track : tracks_) {
    if (!track.keyframes.empty()) {
      result = std::max(result, track.keyframes.back().time);
    }
  }
  return result;
}

Animation Animation::clone_with_tracks(std::vector<Track> tracks) const {
  auto result           = Animation(name_);
  result.tracks_        = std::move(tracks);
  result.speed_         = speed_;
  result.looped_        = looped_;
  result.enabled_       = enabled_;
  result.time_position_ = time_position_;
  return result;
}

Result<Animation, InstantiationError> Animation::retarget(const Graph& src, const Graph& dst,
                                                          NodeHandle dst_root) const {
  auto tracks = std::vector<Track>();
  tracks.reserve(tracks_.size());

  for (size_t i = 0; i < tracks_.size(); ++i) {
    const auto& track = tracks_[i];
    const auto* node  = src.try_get(track.node);
    if (node == nullptr) {
      return std::unexpected(InstantiationError{
          .msg  = "Animation track refers to a node that does not exist in the source graph",
          .code = InstantiationErrorCode::InvalidTrack{.track_index = i},
      });
    }

    auto target = dst.find_by_name(dst_root, node->name());
    if (target.is_none()) {
      return std::unexpected(InstantiationError{
          .msg  = fmt::format("Node \"{}\" animated by \"{}\" is missing in the target hierarchy", node->name(), name_),
          .code = InstantiationErrorCode::MissingTargetNode{.node_name = node->name()},
      });
    }

    tracks.push_back(Track{.node = target, .keyframes = track.keyframes, .enabled = track.enabled});
  }

  return clone_with_tracks(std::move(tracks));
}

Result<Animation, InstantiationError> Animation::remap(
    const std::unordered_map<NodeHandle, NodeHandle>& mapping) const {
  auto tracks = std::vector<Track>();
  tracks.reserve(tracks_.size());

  for (size_t i = 0; i < tracks_.size(); ++i) {
    const auto& track = tracks_[i];
    auto it           = mapping.find(track.node);
    if (it == mapping.end()) {
      return std::unexpected(InstantiationError{
          .msg  = fmt::format("Track {} of animation \"{}\" drives a node outside of the instantiated tree", i, name_),
          .code = InstantiationErrorCode::InvalidTrack{.track_index = i},
      });
    }
    tracks.push_back(Track{.node = it->second, .keyframes = track.keyframes, .enabled = track.enabled});
  }

  return clone_with_tracks(std::move(tracks));
}

void Animation::apply(Graph& graph) const {
  if (!enabled_) {
    return;
  }

  for (const auto& track : tracks_) {
    if (!track.enabled) {
      continue;
    }
    if (auto* node = graph.try_get(track.node)) {
      node->local_transform().set_position(sample(track.keyframes, time_position_));
    }
  }
}

void Animation::tick(float dt) {
  if (!enabled_) {
    return;
  }

  time_position_ += dt * speed_;

  const float len = length();
  if (len <= 0.F) {
    time_position_ = 0.F;
    return;
  }

  if (looped_) {
    time_position_ = std::fmod(time_position_, len);
    if (time_position_ < 0.F) {
      time_position_ += len;
    }
  } else {
    time_position_ = std::clamp(time_position_, 0.F, len);
  }
}

}  // namespace vireo::scene
