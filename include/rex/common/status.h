#ifndef REX_COMMON_STATUS_H
#define REX_COMMON_STATUS_H

typedef enum rex_status {
  REX_OK,
  REX_PENDING,
  REX_DENIED,
  REX_MISSION_NOT_FOUND,
  REX_LEASE_NOT_FOUND,
  REX_DOMAIN_NOT_FOUND,
  REX_RULE_NOT_FOUND,
  REX_ALREADY_TERMINAL,
  REX_INVALID_TRANSITION,
  REX_INVALID_ARGUMENT,
  REX_TIMEOUT,
  REX_UNAVAILABLE,
  REX_MALFORMED_RESPONSE,
  REX_PARSE_ERROR,
  REX_FILE_NOT_FOUND_ERROR,
  REX_INVARIANT_VIOLATION,
  REX_GENERIC_ERROR
} rex_status;

const char*
rex_status_to_str(rex_status status);

#include <ostream>

inline std::ostream&
operator<<(std::ostream& o, rex_status status) {
  return o << rex_status_to_str(status);
}

#endif
