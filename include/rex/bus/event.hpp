#pragma once

#include <rex/common/clock.hpp>
#include <rex/common/types.h>

#include <ostream>
#include <string>

namespace rex::bus {
enum Topic {
  MissionCreated,
  MissionStateChanged,
  MissionAssigned,
  MissionCompleted,
  MissionFailed,
  ResourceLeaseGranted,
  ResourceLeaseReleased,
  ResourcePoolExhausted,
  DecisionResolved,
  _TOPIC_COUNT
};

const char*
TopicToStr(Topic topic);

/** @brief One notification on the bus.
 *
 * The meaning of subject and detail depends on the topic:
 *  - mission.*: subject is the mission type, detail the new state or error.
 *  - mission.assigned: subject is the crew, detail the dispatch payload.
 *  - resource.*: subject is the resource id, detail the lease kind.
 *  - decision.resolved: subject is the request type, detail the layer and
 *    outcome.
 */
struct Event {
  Topic topic = MissionCreated;
  rex_id missionId = 0;
  std::string subject;
  std::string detail;
  TimePoint time;
};

inline std::ostream&
operator<<(std::ostream& o, Topic topic) {
  return o << TopicToStr(topic);
}
}
