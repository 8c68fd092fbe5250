#include "sim/types.hpp"

std::string_view to_string(Slot s) noexcept {
  return s == Slot::First ? "first" : "second";
}

std::string_view to_string(Direction d) noexcept {
  switch (d) {
  case Direction::Up:
    return "up";
  case Direction::Down:
    return "down";
  case Direction::Left:
    return "left";
  case Direction::Right:
    return "right";
  }
  return "right";
}

std::string_view to_string(SimStatus s) noexcept {
  switch (s) {
  case SimStatus::Idle:
    return "idle";
  case SimStatus::Ready:
    return "ready";
  case SimStatus::Running:
    return "running";
  case SimStatus::Finished:
    return "finished";
  }
  return "idle";
}

std::optional<Slot> parse_slot(std::string_view text) noexcept {
  if (text == "first") {
    return Slot::First;
  }
  if (text == "second") {
    return Slot::Second;
  }
  return std::nullopt;
}

std::optional<Direction> parse_direction(std::string_view text) noexcept {
  if (text == "up") {
    return Direction::Up;
  }
  if (text == "down") {
    return Direction::Down;
  }
  if (text == "left") {
    return Direction::Left;
  }
  if (text == "right") {
    return Direction::Right;
  }
  return std::nullopt;
}

std::optional<SimStatus> parse_status(std::string_view text) noexcept {
  if (text == "idle") {
    return SimStatus::Idle;
  }
  if (text == "ready") {
    return SimStatus::Ready;
  }
  if (text == "running") {
    return SimStatus::Running;
  }
  if (text == "finished") {
    return SimStatus::Finished;
  }
  return std::nullopt;
}
