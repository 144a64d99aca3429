#include <rex/common/mission_profile.hpp>

namespace rex {
static const MissionProfile profiles[REX_MISSION_TYPE_COUNT] = {
  { "dead_lead_crew", true, 100, 50, 10 },
  { "campaign_crew", true, 200, 100, 20 },
  { "auto_icp_crew", false, 50, 0, 0 },
  { "domain_health_monitor", false, 0, 0, 0 },
  { "special_forces_coordinator", false, 30, 0, 0 },
  { "special_forces_coordinator", false, 10, 0, 0 },
};

static const char* const crews[] = { "dead_lead_crew",
                                     "campaign_crew",
                                     "auto_icp_crew",
                                     "domain_health_monitor",
                                     "special_forces_coordinator" };

const MissionProfile&
GetMissionProfile(rex_mission_type type) {
  if(type >= REX_MISSION_TYPE_COUNT)
    return profiles[REX_ERROR_RECOVERY];
  return profiles[type];
}

const char* const*
GetCrewNames(size_t* count) {
  *count = sizeof(crews) / sizeof(crews[0]);
  return crews;
}
}
