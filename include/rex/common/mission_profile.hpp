#pragma once

#include <rex/common/types.h>

#include <cstddef>
#include <cstdint>

namespace rex {
/// Static properties of a mission type: which crew runs it, whether it sends
/// messages (and therefore needs a domain) and how many API calls it is
/// expected to spend per provider.
struct MissionProfile {
  const char* crew;
  bool sendsMessages;
  uint32_t llmCalls;
  uint32_t emailCalls;
  uint32_t smsCalls;
};

const MissionProfile&
GetMissionProfile(rex_mission_type type);

/// Distinct crew names, each listed once.
const char* const*
GetCrewNames(size_t* count);
}
