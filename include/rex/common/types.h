#ifndef REX_COMMON_TYPES_H
#define REX_COMMON_TYPES_H

#include <cstdint>
#include <ostream>
#include <string_view>

typedef uint64_t rex_id;

enum rex_mission_type {
  REX_LEAD_REACTIVATION,
  REX_CAMPAIGN_EXECUTION,
  REX_ICP_EXTRACTION,
  REX_DOMAIN_ROTATION,
  REX_PERFORMANCE_OPTIMIZATION,
  REX_ERROR_RECOVERY,
  REX_MISSION_TYPE_COUNT
};

enum rex_mission_state {
  REX_QUEUED,
  REX_ASSIGNED,
  REX_RUNNING,
  REX_RETRY_PENDING,
  REX_COMPLETED,
  REX_FAILED,
  REX_CANCELLED,
  REX_MISSION_STATE_COUNT
};

/// Events that drive a mission through its lifecycle.
enum rex_mission_event {
  REX_EV_DISPATCH,
  REX_EV_START,
  REX_EV_COMPLETE,
  REX_EV_RECOVERABLE_FAILURE,
  REX_EV_TERMINAL_FAILURE,
  REX_EV_TIMEOUT_RETRY,
  REX_EV_TIMEOUT_EXHAUSTED,
  REX_EV_BACKOFF_ELAPSED,
  REX_EV_RETRIES_EXHAUSTED,
  REX_EV_CANCEL,
  REX_EV_INVARIANT_VIOLATION,
  REX_EV_DEPENDENCY_FAILED,
  REX_MISSION_EVENT_COUNT
};

enum rex_error_kind {
  REX_ERR_VALIDATION,
  REX_ERR_PROVIDER_TIMEOUT,
  REX_ERR_PROVIDER_ERROR,
  REX_ERR_RATE_LIMITED,
  REX_ERR_TIMEOUT,
  REX_ERR_INVARIANT,
  REX_ERR_CANCELLED,
  REX_ERR_UNKNOWN,
  REX_ERROR_KIND_COUNT
};

const char*
rex_mission_type_to_str(rex_mission_type type);

const char*
rex_mission_state_to_str(rex_mission_state state);

const char*
rex_mission_event_to_str(rex_mission_event event);

const char*
rex_error_kind_to_str(rex_error_kind kind);

bool
rex_mission_type_from_str(std::string_view str, rex_mission_type* type);

bool
rex_error_kind_from_str(std::string_view str, rex_error_kind* kind);

inline bool
rex_mission_state_is_terminal(rex_mission_state state) {
  return state == REX_COMPLETED || state == REX_FAILED ||
         state == REX_CANCELLED;
}

inline std::ostream&
operator<<(std::ostream& o, rex_mission_type type) {
  return o << rex_mission_type_to_str(type);
}
inline std::ostream&
operator<<(std::ostream& o, rex_mission_state state) {
  return o << rex_mission_state_to_str(state);
}
inline std::ostream&
operator<<(std::ostream& o, rex_mission_event event) {
  return o << rex_mission_event_to_str(event);
}
inline std::ostream&
operator<<(std::ostream& o, rex_error_kind kind) {
  return o << rex_error_kind_to_str(kind);
}

#endif
