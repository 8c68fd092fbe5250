#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

enum class Slot : std::uint8_t { First = 0, Second = 1 };

inline constexpr std::array<Slot, 2> kSlots{Slot::First, Slot::Second};

constexpr std::size_t slot_index(Slot s) noexcept {
  return static_cast<std::size_t>(s);
}

constexpr Slot other_slot(Slot s) noexcept {
  return s == Slot::First ? Slot::Second : Slot::First;
}

enum class Direction : std::uint8_t { Up, Down, Left, Right };

constexpr Direction opposite(Direction d) noexcept {
  switch (d) {
  case Direction::Up:
    return Direction::Down;
  case Direction::Down:
    return Direction::Up;
  case Direction::Left:
    return Direction::Right;
  case Direction::Right:
    return Direction::Left;
  }
  return d;
}

enum class SimStatus : std::uint8_t { Idle, Ready, Running, Finished };

struct Cell {
  std::int32_t x = 0;
  std::int32_t y = 0;

  bool operator==(const Cell &) const = default;
};

constexpr Cell step(Cell c, Direction d) noexcept {
  switch (d) {
  case Direction::Up:
    return {c.x, c.y - 1};
  case Direction::Down:
    return {c.x, c.y + 1};
  case Direction::Left:
    return {c.x - 1, c.y};
  case Direction::Right:
    return {c.x + 1, c.y};
  }
  return c;
}

struct ActorState {
  Slot slot = Slot::First;
  Direction heading = Direction::Right;
  std::optional<Direction> pending_heading;
  std::vector<Cell> body; // head first, never empty once placed
  std::uint32_t score = 0;
  bool alive = true;
  bool ready = false;
  std::uint32_t respawn_cooldown = 0;

  [[nodiscard]] const Cell &head() const { return body.front(); }

  bool operator==(const ActorState &) const = default;
};

struct SimulationState {
  SimStatus status = SimStatus::Idle;
  std::int32_t width = 0;
  std::int32_t height = 0;
  Cell fruit;
  std::uint32_t target_score = 0;
  std::array<ActorState, 2> actors{};
  std::optional<Slot> winner;
  std::uint32_t tick_interval_ms = 0;

  [[nodiscard]] const ActorState &actor(Slot s) const {
    return actors[slot_index(s)];
  }
  ActorState &actor(Slot s) { return actors[slot_index(s)]; }

  bool operator==(const SimulationState &) const = default;
};

std::string_view to_string(Slot s) noexcept;
std::string_view to_string(Direction d) noexcept;
std::string_view to_string(SimStatus s) noexcept;

std::optional<Slot> parse_slot(std::string_view text) noexcept;
std::optional<Direction> parse_direction(std::string_view text) noexcept;
std::optional<SimStatus> parse_status(std::string_view text) noexcept;
