#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "sim/rng.hpp"
#include "sim/types.hpp"

struct EngineOptions {
  std::int32_t width = 40;
  std::int32_t height = 30;
  std::uint32_t target_score = 10;
  std::uint32_t tick_interval_ms = 120;
  std::string seed = "duel-snake";
  // Overrides the seeded generator when set; must return values in [0, 1].
  RandomSource random;
};

// Deterministic two-actor snake duel. Pure function of (state, intents): the
// only randomness comes from the seeded generator.
class Engine {
public:
  static constexpr std::uint32_t kRespawnCooldownTicks = 3;
  static constexpr std::int32_t kRespawnMargin = 3;
  static constexpr std::size_t kRespawnLength = 3;

  explicit Engine(EngineOptions opts = {});

  void ready(Slot slot);
  void start();
  void queue_intent(Slot slot, Direction dir);
  SimulationState tick();

  [[nodiscard]] SimulationState snapshot() const { return state_; }
  [[nodiscard]] SimStatus status() const noexcept { return state_.status; }

  // Places the fruit on `cell` if it is free, otherwise re-rolls it.
  void place_fruit(Cell cell);

private:
  enum class Move : std::uint8_t { Stay, Normal, Grow, Collide };

  struct Plan {
    Move move = Move::Stay;
    Cell next;
  };

  struct Placement {
    Cell head;
    Direction heading;
  };

  [[nodiscard]] bool in_bounds(Cell c) const noexcept;
  [[nodiscard]] bool occupied(Cell c) const noexcept;
  [[nodiscard]] static std::vector<Cell> build_body(Cell head,
                                                    Direction heading);
  [[nodiscard]] std::vector<Cell> corner_body(Slot slot) const;

  Plan plan_move(ActorState &actor, const std::vector<Cell> &frozen);
  void respawn(Slot slot);
  Cell spawn_fruit();

  SimulationState state_;
  RandomSource random_;
};
