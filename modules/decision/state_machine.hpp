#pragma once

#include <rex/decision/decision.hpp>

#include <optional>

namespace rex::decision {
/** @brief First layer, a pure table lookup.
 *
 * Knows every valid lifecycle transition and the two trivial eligibility
 * answers. Everything else is declined.
 */
class StateMachine {
  public:
  StateMachine();

  std::optional<Decision> resolve(const Request& request) const;

  /// Lookup only. REX_MISSION_STATE_COUNT marks a missing edge.
  rex_mission_state next(rex_mission_state state,
                         rex_mission_event event) const;

  private:
  rex_mission_state m_table[REX_MISSION_STATE_COUNT][REX_MISSION_EVENT_COUNT];
};
}
