#pragma once

#include <libvireo/math/vec.hpp>
#include <libvireo/scene/error.hpp>
#include <libvireo/scene/graph.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace vireo::scene {

struct KeyFrame {
  float time{};
  math::Vec3f position;

  friend bool operator==(const KeyFrame&, const KeyFrame&) = default;
};

struct Track {
  NodeHandle node;
  std::vector<KeyFrame> keyframes;
  bool enabled{true};
};

class Animation;
using AnimationHandle = Handle<Animation>;

/**
 * @brief Keyframed node animation. Every track drives the position of one node of a graph.
 *
 */
class Animation {
 public:
  Animation() = default;
  explicit Animation(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }
  void set_name(std::string name) { name_ = std::move(name); }

  std::vector<Track>& tracks() { return tracks_; }
  const std::vector<Track>& tracks() const { return tracks_; }
  void add_track(Track track) { tracks_.push_back(std::move(track)); }

  float speed() const { return speed_; }
  void set_speed(float speed) { speed_ = speed; }

  bool is_looped() const { return looped_; }
  void set_looped(bool looped) { looped_ = looped; }

  bool is_enabled() const { return enabled_; }
  void set_enabled(bool enabled) { enabled_ = enabled; }

  float time_position() const { return time_position_; }
  void set_time_position(float time) { time_position_ = time; }

  /**
   * @brief Length of the longest track.
   *
   */
  [[nodiscard]] float length() const;

  /**
   * @brief Creates a copy whose tracks drive the nodes of the hierarchy starting at `dst_root` in `dst`. The target
   * nodes are matched by name of the nodes the tracks drive in `src`.
   *
   */
  [[nodiscard]] Result<Animation, InstantiationError> retarget(const Graph& src, const Graph& dst,
                                                               NodeHandle dst_root) const;

  /**
   * @brief Creates a copy whose tracks drive the nodes `mapping` assigns to the current ones.
   *
   */
  [[nodiscard]] Result<Animation, InstantiationError> remap(
      const std::unordered_map<NodeHandle, NodeHandle>& mapping) const;

  /**
   * @brief Samples every enabled track at the current time position and writes the positions to the graph.
   *
   */
  void apply(Graph& graph) const;

  /**
   * @brief Advances the time position by `dt` scaled by the speed. Looped animations wrap around.
   *
   */
  void tick(float dt);

 private:
  Animation clone_with_tracks(std::vector<Track> tracks) const;

  std::string name_;
  std::vector<Track> tracks_;
  float speed_{1.F};
  bool looped_{true};
  bool enabled_{true};
  float time_position_{};
};

}  // namespace vireo::scene
