#include <rex/common/status.h>
#include <rex/common/types.h>

#include <boost/algorithm/string/predicate.hpp>

const char*
rex_status_to_str(rex_status status) {
  switch(status) {
    case REX_OK:
      return "ok";
    case REX_PENDING:
      return "pending";
    case REX_DENIED:
      return "denied";
    case REX_MISSION_NOT_FOUND:
      return "mission not found";
    case REX_LEASE_NOT_FOUND:
      return "lease not found";
    case REX_DOMAIN_NOT_FOUND:
      return "domain not found";
    case REX_RULE_NOT_FOUND:
      return "rule not found";
    case REX_ALREADY_TERMINAL:
      return "already terminal";
    case REX_INVALID_TRANSITION:
      return "invalid transition";
    case REX_INVALID_ARGUMENT:
      return "invalid argument";
    case REX_TIMEOUT:
      return "timeout";
    case REX_UNAVAILABLE:
      return "unavailable";
    case REX_MALFORMED_RESPONSE:
      return "malformed response";
    case REX_PARSE_ERROR:
      return "parse error";
    case REX_FILE_NOT_FOUND_ERROR:
      return "file not found";
    case REX_INVARIANT_VIOLATION:
      return "invariant violation";
    case REX_GENERIC_ERROR:
      return "generic error";
  }
  return "!";
}

const char*
rex_mission_type_to_str(rex_mission_type type) {
  switch(type) {
    case REX_LEAD_REACTIVATION:
      return "lead_reactivation";
    case REX_CAMPAIGN_EXECUTION:
      return "campaign_execution";
    case REX_ICP_EXTRACTION:
      return "icp_extraction";
    case REX_DOMAIN_ROTATION:
      return "domain_rotation";
    case REX_PERFORMANCE_OPTIMIZATION:
      return "performance_optimization";
    case REX_ERROR_RECOVERY:
      return "error_recovery";
    case REX_MISSION_TYPE_COUNT:
      break;
  }
  return "!";
}

const char*
rex_mission_state_to_str(rex_mission_state state) {
  switch(state) {
    case REX_QUEUED:
      return "QUEUED";
    case REX_ASSIGNED:
      return "ASSIGNED";
    case REX_RUNNING:
      return "RUNNING";
    case REX_RETRY_PENDING:
      return "RETRY_PENDING";
    case REX_COMPLETED:
      return "COMPLETED";
    case REX_FAILED:
      return "FAILED";
    case REX_CANCELLED:
      return "CANCELLED";
    case REX_MISSION_STATE_COUNT:
      break;
  }
  return "!";
}

const char*
rex_mission_event_to_str(rex_mission_event event) {
  switch(event) {
    case REX_EV_DISPATCH:
      return "dispatch";
    case REX_EV_START:
      return "start";
    case REX_EV_COMPLETE:
      return "complete";
    case REX_EV_RECOVERABLE_FAILURE:
      return "recoverable_failure";
    case REX_EV_TERMINAL_FAILURE:
      return "terminal_failure";
    case REX_EV_TIMEOUT_RETRY:
      return "timeout_retry";
    case REX_EV_TIMEOUT_EXHAUSTED:
      return "timeout_exhausted";
    case REX_EV_BACKOFF_ELAPSED:
      return "backoff_elapsed";
    case REX_EV_RETRIES_EXHAUSTED:
      return "retries_exhausted";
    case REX_EV_CANCEL:
      return "cancel";
    case REX_EV_INVARIANT_VIOLATION:
      return "invariant_violation";
    case REX_EV_DEPENDENCY_FAILED:
      return "dependency_failed";
    case REX_MISSION_EVENT_COUNT:
      break;
  }
  return "!";
}

const char*
rex_error_kind_to_str(rex_error_kind kind) {
  switch(kind) {
    case REX_ERR_VALIDATION:
      return "validation";
    case REX_ERR_PROVIDER_TIMEOUT:
      return "provider_timeout";
    case REX_ERR_PROVIDER_ERROR:
      return "provider_error";
    case REX_ERR_RATE_LIMITED:
      return "rate_limited";
    case REX_ERR_TIMEOUT:
      return "timeout";
    case REX_ERR_INVARIANT:
      return "invariant";
    case REX_ERR_CANCELLED:
      return "cancelled";
    case REX_ERR_UNKNOWN:
      return "unknown";
    case REX_ERROR_KIND_COUNT:
      break;
  }
  return "!";
}

bool
rex_mission_type_from_str(std::string_view str, rex_mission_type* type) {
  for(int i = 0; i < REX_MISSION_TYPE_COUNT; ++i) {
    auto t = static_cast<rex_mission_type>(i);
    if(boost::algorithm::iequals(str, rex_mission_type_to_str(t))) {
      *type = t;
      return true;
    }
  }
  return false;
}

bool
rex_error_kind_from_str(std::string_view str, rex_error_kind* kind) {
  for(int i = 0; i < REX_ERROR_KIND_COUNT; ++i) {
    auto k = static_cast<rex_error_kind>(i);
    if(boost::algorithm::iequals(str, rex_error_kind_to_str(k))) {
      *kind = k;
      return true;
    }
  }
  return false;
}
