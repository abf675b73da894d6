#pragma once

#include <cassert>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <libvireo/util/ruleof.hpp>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace vireo::scene {

/**
 * @brief Generational index of an object stored in a `Pool<T>`. A handle stays valid for as long as the object lives
 * in its slot, slot reuse bumps the generation so stale handles never resolve to new objects.
 *
 */
template <typename T>
struct Handle {
  using Object = T;

  static constexpr uint64_t kNullValue = std::numeric_limits<uint64_t>::max();

  /**
   * @brief LSB 32 bits store slot index and the rest of the 32 bits store the slot generation.
   *
   */
  uint64_t value{kNullValue};

  constexpr Handle() = default;
  constexpr explicit Handle(uint64_t v) : value(v) {}

  [[nodiscard]] static constexpr Handle compose(size_t index, uint32_t generation) {
    return Handle{(static_cast<uint64_t>(generation) << 32) | static_cast<uint64_t>(index)};
  }

  [[nodiscard]] static constexpr Handle none() { return Handle(); }

  [[nodiscard]] constexpr size_t index() const { return static_cast<size_t>(value & 0xFFFFFFFF); }
  [[nodiscard]] constexpr uint32_t generation() const { return static_cast<uint32_t>(value >> 32); }

  [[nodiscard]] constexpr bool is_none() const { return value == kNullValue; }
  [[nodiscard]] constexpr bool is_some() const { return value != kNullValue; }

  constexpr auto operator<=>(const Handle&) const = default;
};

/**
 * @brief Proof that the slot of `handle()` has been provisionally vacated by `Pool::take_reserve`. The ticket must be
 * consumed exactly once, either by `Pool::put_back` or by `Pool::forget_ticket`.
 *
 */
template <typename T>
class Ticket {
 public:
  VIREO_DELETE_COPY(Ticket)

  Ticket(Ticket&& other) noexcept : handle_(std::exchange(other.handle_, Handle<T>::none())) {}
  Ticket& operator=(Ticket&& other) noexcept {
    handle_ = std::exchange(other.handle_, Handle<T>::none());
    return *this;
  }
  ~Ticket() = default;

  [[nodiscard]] Handle<T> handle() const { return handle_; }

 private:
  template <typename U>
  friend class Pool;

  explicit Ticket(Handle<T> handle) : handle_(handle) {}

  Handle<T> handle_;
};

template <typename T>
class Pool {
 public:
  Pool() = default;

  VIREO_DELETE_COPY(Pool)
  VIREO_DEFAULT_MOVE(Pool)

  /**
   * @brief Moves `payload` into the most recently freed slot or into a new one.
   *
   */
  [[nodiscard]] Handle<T> spawn(T payload) {
    size_t index = 0;
    if (free_.empty()) {
      index = slots_.size();
      slots_.emplace_back();
    } else {
      index = free_.back();
      free_.pop_back();
    }

    auto& slot = slots_[index];
    slot.payload.emplace(std::move(payload));
    ++alive_count_;

    return Handle<T>::compose(index, slot.generation);
  }

  [[nodiscard]] bool is_valid_handle(Handle<T> handle) const {
    if (handle.is_none() || handle.index() >= slots_.size()) {
      return false;
    }
    const auto& slot = slots_[handle.index()];
    return slot.payload.has_value() && slot.generation == handle.generation();
  }

  [[nodiscard]] T* try_borrow(Handle<T> handle) {
    return is_valid_handle(handle) ? &*slots_[handle.index()].payload : nullptr;
  }

  [[nodiscard]] const T* try_borrow(Handle<T> handle) const {
    return is_valid_handle(handle) ? &*slots_[handle.index()].payload : nullptr;
  }

  T& operator[](Handle<T> handle) {
    assert(is_valid_handle(handle) && "Handle must be valid");
    return *slots_[handle.index()].payload;
  }

  const T& operator[](Handle<T> handle) const {
    assert(is_valid_handle(handle) && "Handle must be valid");
    return *slots_[handle.index()].payload;
  }

  /**
   * @brief Destroys the slot contents and returns the object. The slot becomes reusable.
   *
   */
  T free(Handle<T> handle) {
    assert(is_valid_handle(handle) && "Handle must be valid");

    auto& slot    = slots_[handle.index()];
    auto payload  = std::move(*slot.payload);
    slot.payload.reset();
    release_slot(handle.index());
    --alive_count_;

    return payload;
  }

  /**
   * @brief Moves the object out of its slot and reserves the slot. Until the returned ticket is consumed the slot is
   * neither alive nor reusable.
   *
   */
  [[nodiscard]] std::pair<Ticket<T>, T> take_reserve(Handle<T> handle) {
    assert(is_valid_handle(handle) && "Handle must be valid");

    auto& slot   = slots_[handle.index()];
    auto payload = std::move(*slot.payload);
    slot.payload.reset();
    slot.reserved = true;
    --alive_count_;

    return {Ticket<T>(handle), std::move(payload)};
  }

  /**
   * @brief Puts the object back into the slot reserved by `ticket`. Returns the same handle the ticket was issued for.
   *
   */
  Handle<T> put_back(Ticket<T> ticket, T payload) {
    auto handle = ticket.handle();
    assert(handle.is_some() && "Ticket has already been consumed");

    auto& slot = slots_[handle.index()];
    assert(slot.reserved && slot.generation == handle.generation() && "Ticket does not match a reserved slot");

    slot.payload.emplace(std::move(payload));
    slot.reserved = false;
    ++alive_count_;

    return Handle<T>::compose(handle.index(), slot.generation);
  }

  /**
   * @brief Permanently releases the slot reserved by `ticket`. The slot may be reused by a subsequent `spawn`.
   *
   */
  void forget_ticket(Ticket<T> ticket) {
    auto handle = ticket.handle();
    assert(handle.is_some() && "Ticket has already been consumed");

    auto& slot = slots_[handle.index()];
    assert(slot.reserved && slot.generation == handle.generation() && "Ticket does not match a reserved slot");

    slot.reserved = false;
    release_slot(handle.index());
  }

  [[nodiscard]] bool is_reserved(Handle<T> handle) const {
    return handle.is_some() && handle.index() < slots_.size() && slots_[handle.index()].reserved &&
           slots_[handle.index()].generation == handle.generation();
  }

  [[nodiscard]] size_t alive_count() const { return alive_count_; }
  [[nodiscard]] size_t slot_count() const { return slots_.size(); }

  /**
   * @brief Returns handles of all alive objects in slot order.
   *
   */
  [[nodiscard]] std::vector<Handle<T>> handles() const {
    auto result = std::vector<Handle<T>>();
    result.reserve(alive_count_);
    for (size_t i = 0; i < slots_.size(); ++i) {
      if (slots_[i].payload.has_value()) {
        result.push_back(Handle<T>::compose(i, slots_[i].generation));
      }
    }
    return result;
  }

 private:
  struct Slot {
    uint32_t generation{1};
    std::optional<T> payload;
    bool reserved{false};
  };

  void release_slot(size_t index) {
    ++slots_[index].generation;
    free_.push_back(index);
  }

  std::vector<Slot> slots_;
  std::vector<size_t> free_;
  size_t alive_count_{};
};

}  // namespace vireo::scene

// == Handle Hash ======================================================================================================

namespace std {
template <typename T>
struct hash<vireo::scene::Handle<T>> {
  size_t operator()(vireo::scene::Handle<T> handle) const noexcept { return std::hash<uint64_t>()(handle.value); }
};
}  // namespace std
