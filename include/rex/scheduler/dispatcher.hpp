#pragma once

#include <rex/common/status.h>
#include <rex/common/types.h>

#include <optional>
#include <string>

namespace rex {
class Clock;

namespace bus {
class MessageBus;
}
}

namespace rex::scheduler {
struct DispatchOrder {
  rex_id missionId = 0;
  rex_mission_type type = REX_CAMPAIGN_EXECUTION;
  int32_t priority = 0;
  uint32_t attempt = 0;
  std::string crew;
  std::optional<std::string> domain;
  std::string payload;
};

/** @brief Hands missions that hold all their leases to the crews.
 *
 * Called without any scheduler lock held. Crews report back through the
 * worker feedback calls of the orchestrator.
 */
class MissionDispatcher {
  public:
  virtual ~MissionDispatcher() = default;
  virtual rex_status dispatch(const DispatchOrder& order) = 0;
};

/// Announces every order as mission.assigned on the bus.
class BusDispatcher : public MissionDispatcher {
  public:
  BusDispatcher(bus::MessageBus& bus, const Clock& clock);

  rex_status dispatch(const DispatchOrder& order) override;

  private:
  bus::MessageBus& m_bus;
  const Clock& m_clock;
};
}
