#include "state_machine.hpp"

namespace rex::decision {
StateMachine::StateMachine() {
  for(auto& row : m_table)
    for(auto& cell : row)
      cell = REX_MISSION_STATE_COUNT;

  auto edge = [this](rex_mission_state from,
                     rex_mission_event event,
                     rex_mission_state to) { m_table[from][event] = to; };

  edge(REX_QUEUED, REX_EV_DISPATCH, REX_ASSIGNED);
  edge(REX_QUEUED, REX_EV_CANCEL, REX_CANCELLED);
  edge(REX_QUEUED, REX_EV_INVARIANT_VIOLATION, REX_FAILED);
  edge(REX_QUEUED, REX_EV_DEPENDENCY_FAILED, REX_FAILED);

  edge(REX_ASSIGNED, REX_EV_START, REX_RUNNING);
  edge(REX_ASSIGNED, REX_EV_CANCEL, REX_CANCELLED);
  edge(REX_ASSIGNED, REX_EV_INVARIANT_VIOLATION, REX_FAILED);

  edge(REX_RUNNING, REX_EV_COMPLETE, REX_COMPLETED);
  edge(REX_RUNNING, REX_EV_RECOVERABLE_FAILURE, REX_RETRY_PENDING);
  edge(REX_RUNNING, REX_EV_TIMEOUT_RETRY, REX_RETRY_PENDING);
  edge(REX_RUNNING, REX_EV_TERMINAL_FAILURE, REX_FAILED);
  edge(REX_RUNNING, REX_EV_TIMEOUT_EXHAUSTED, REX_FAILED);
  edge(REX_RUNNING, REX_EV_CANCEL, REX_CANCELLED);
  edge(REX_RUNNING, REX_EV_INVARIANT_VIOLATION, REX_FAILED);

  edge(REX_RETRY_PENDING, REX_EV_BACKOFF_ELAPSED, REX_QUEUED);
  edge(REX_RETRY_PENDING, REX_EV_RETRIES_EXHAUSTED, REX_FAILED);
  edge(REX_RETRY_PENDING, REX_EV_CANCEL, REX_CANCELLED);
}

rex_mission_state
StateMachine::next(rex_mission_state state, rex_mission_event event) const {
  if(state >= REX_MISSION_STATE_COUNT || event >= REX_MISSION_EVENT_COUNT)
    return REX_MISSION_STATE_COUNT;
  return m_table[state][event];
}

std::optional<Decision>
StateMachine::resolve(const Request& request) const {
  if(auto t = std::get_if<StateTransitionContext>(&request.context)) {
    rex_mission_state to = next(t->state, t->event);
    if(to == REX_MISSION_STATE_COUNT)
      return std::nullopt;

    Decision d;
    d.verdict = Transition;
    d.layer = StateMachineLayer;
    d.target = to;
    d.reason = "transition table";
    return d;
  }

  if(auto e = std::get_if<EligibilityContext>(&request.context)) {
    if(e->state != REX_QUEUED)
      return std::nullopt;

    Decision d;
    d.layer = StateMachineLayer;
    d.verdict = e->leaseHeld ? Deny : Allow;
    d.reason = e->leaseHeld ? "lease already held" : "queued without lease";
    return d;
  }

  return std::nullopt;
}
}
