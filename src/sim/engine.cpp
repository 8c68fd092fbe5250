#include "sim/engine.hpp"

#include <algorithm>
#include <array>
#include <utility>

static bool contains(const std::vector<Cell> &cells, Cell c) {
  return std::find(cells.begin(), cells.end(), c) != cells.end();
}

Engine::Engine(EngineOptions opts) : random_(std::move(opts.random)) {
  if (!random_) {
    random_ = [rng = SeededRandom(opts.seed)]() mutable { return rng.next(); };
  }

  state_.width = opts.width;
  state_.height = opts.height;
  state_.target_score = opts.target_score;
  state_.tick_interval_ms = opts.tick_interval_ms;

  auto &first = state_.actor(Slot::First);
  first.slot = Slot::First;
  first.heading = Direction::Right;
  first.body = corner_body(Slot::First);

  auto &second = state_.actor(Slot::Second);
  second.slot = Slot::Second;
  second.heading = Direction::Left;
  second.body = corner_body(Slot::Second);

  state_.fruit = spawn_fruit();
}

void Engine::ready(Slot slot) {
  if (state_.status == SimStatus::Finished) {
    return;
  }
  state_.actor(slot).ready = true;
  if (state_.status == SimStatus::Idle && state_.actors[0].ready &&
      state_.actors[1].ready) {
    state_.status = SimStatus::Ready;
  }
}

void Engine::start() {
  if (state_.status == SimStatus::Ready) {
    state_.status = SimStatus::Running;
  }
}

void Engine::queue_intent(Slot slot, Direction dir) {
  auto &actor = state_.actor(slot);
  if (actor.respawn_cooldown > 0) {
    return;
  }
  if (dir == opposite(actor.heading)) {
    return;
  }
  actor.pending_heading = dir;
}

SimulationState Engine::tick() {
  if (state_.status != SimStatus::Running) {
    return state_;
  }
  if (state_.winner) {
    state_.status = SimStatus::Finished;
    return state_;
  }

  // Phase 1: plan both moves against the same frozen bodies.
  std::vector<Cell> frozen;
  for (const auto &a : state_.actors) {
    frozen.insert(frozen.end(), a.body.begin(), a.body.end());
  }

  std::array<Plan, 2> plans{};
  for (const auto slot : kSlots) {
    plans[slot_index(slot)] = plan_move(state_.actor(slot), frozen);
  }

  // Phase 2: apply.
  bool fruit_eaten = false;
  for (const auto slot : kSlots) {
    const auto &plan = plans[slot_index(slot)];
    auto &actor = state_.actor(slot);

    switch (plan.move) {
    case Move::Stay:
      break;
    case Move::Collide:
      respawn(slot);
      break;
    case Move::Normal:
      actor.body.insert(actor.body.begin(), plan.next);
      actor.body.pop_back();
      break;
    case Move::Grow:
      actor.body.insert(actor.body.begin(), plan.next);
      ++actor.score;
      fruit_eaten = true;
      if (actor.score >= state_.target_score && !state_.winner) {
        state_.winner = slot;
        state_.status = SimStatus::Finished;
      }
      break;
    }
  }

  // Placed after both moves so it lands on a cell that is free now.
  if (fruit_eaten) {
    state_.fruit = spawn_fruit();
  }

  return state_;
}

void Engine::place_fruit(Cell cell) {
  if (!in_bounds(cell) || occupied(cell)) {
    state_.fruit = spawn_fruit();
    return;
  }
  state_.fruit = cell;
}

bool Engine::in_bounds(Cell c) const noexcept {
  return c.x >= 0 && c.x < state_.width && c.y >= 0 && c.y < state_.height;
}

bool Engine::occupied(Cell c) const noexcept {
  for (const auto &a : state_.actors) {
    if (contains(a.body, c)) {
      return true;
    }
  }
  return false;
}

std::vector<Cell> Engine::build_body(Cell head, Direction heading) {
  const auto back = opposite(heading);
  std::vector<Cell> body;
  body.reserve(kRespawnLength);
  body.push_back(head);
  while (body.size() < kRespawnLength) {
    body.push_back(step(body.back(), back));
  }
  return body;
}

std::vector<Cell> Engine::corner_body(Slot slot) const {
  if (slot == Slot::First) {
    return build_body({2, 1}, Direction::Right);
  }
  return build_body({state_.width - 3, state_.height - 2}, Direction::Left);
}

Engine::Plan Engine::plan_move(ActorState &actor,
                               const std::vector<Cell> &frozen) {
  if (actor.respawn_cooldown > 0) {
    --actor.respawn_cooldown;
    return {Move::Stay, actor.head()};
  }
  if (!actor.alive) {
    return {Move::Collide, actor.head()};
  }

  if (actor.pending_heading &&
      *actor.pending_heading != opposite(actor.heading)) {
    actor.heading = *actor.pending_heading;
  }
  actor.pending_heading.reset();

  const auto next = step(actor.head(), actor.heading);
  if (!in_bounds(next) || contains(frozen, next)) {
    return {Move::Collide, next};
  }
  if (next == state_.fruit) {
    return {Move::Grow, next};
  }
  return {Move::Normal, next};
}

void Engine::respawn(Slot slot) {
  auto &actor = state_.actor(slot);

  std::vector<Cell> blocked;
  for (const auto &c : state_.actor(other_slot(slot)).body) {
    if (!contains(actor.body, c)) {
      blocked.push_back(c);
    }
  }
  auto body_free = [&](const std::vector<Cell> &body) {
    return std::none_of(body.begin(), body.end(),
                        [&](Cell c) { return contains(blocked, c); });
  };

  static constexpr std::array<Direction, 4> kHeadings{
      Direction::Up, Direction::Down, Direction::Left, Direction::Right};

  std::vector<Placement> candidates;
  for (std::int32_t x = kRespawnMargin; x < state_.width - kRespawnMargin;
       ++x) {
    for (std::int32_t y = kRespawnMargin; y < state_.height - kRespawnMargin;
         ++y) {
      for (const auto heading : kHeadings) {
        // Never come back facing the way the actor just came from.
        if (heading == opposite(actor.heading)) {
          continue;
        }
        const Cell head{x, y};
        if (!body_free(build_body(head, heading))) {
          continue;
        }
        const auto ahead = step(head, heading);
        if (in_bounds(ahead) && !contains(blocked, ahead)) {
          candidates.push_back({head, heading});
        }
      }
    }
  }

  const std::array<Placement, 4> corners{{
      {{2, 2}, Direction::Right},
      {{state_.width - 3, 2}, Direction::Left},
      {{2, state_.height - 3}, Direction::Right},
      {{state_.width - 3, state_.height - 3}, Direction::Left},
  }};

  // Corners facing back the way the actor came are never used.
  std::vector<Placement> allowed_corners;
  for (const auto &corner : corners) {
    if (corner.heading != opposite(actor.heading)) {
      allowed_corners.push_back(corner);
    }
  }

  if (candidates.empty()) {
    for (const auto &corner : allowed_corners) {
      if (body_free(build_body(corner.head, corner.heading))) {
        candidates.push_back(corner);
      }
    }
  }

  // Last resort: the first allowed corner even if it overlaps.
  const auto chosen =
      candidates.empty()
          ? allowed_corners.front()
          : candidates[pick_index(random_(), candidates.size())];

  actor.body = build_body(chosen.head, chosen.heading);
  actor.heading = chosen.heading;
  actor.pending_heading.reset();
  actor.alive = true;
  actor.score = 0;
  actor.respawn_cooldown = kRespawnCooldownTicks;
}

Cell Engine::spawn_fruit() {
  std::vector<Cell> free_cells;
  for (std::int32_t x = 0; x < state_.width; ++x) {
    for (std::int32_t y = 0; y < state_.height; ++y) {
      const Cell c{x, y};
      if (!occupied(c)) {
        free_cells.push_back(c);
      }
    }
  }
  if (free_cells.empty()) {
    return {0, 0};
  }
  return free_cells[pick_index(random_(), free_cells.size())];
}
