#pragma once

#include <rex/common/clock.hpp>
#include <rex/common/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rex::scheduler {
struct ErrorDetail {
  std::string code;
  std::string message;
  rex_error_kind kind = REX_ERR_UNKNOWN;
  bool escalated = false;
};

/// What a submitter hands in besides type and priority. The body is passed
/// to the crew unchanged.
struct MissionPayload {
  std::optional<std::string> campaignId;
  std::optional<std::string> dedicatedDomain;
  std::string body;

  /// Missions that must be COMPLETED before this one may run.
  std::vector<rex_id> dependencies;

  /// Earliest time the mission may be dispatched.
  std::optional<TimePoint> notBefore;
};

/// Read-only view of one mission.
struct MissionStatus {
  rex_id id = 0;
  rex_mission_type type = REX_CAMPAIGN_EXECUTION;
  int32_t priority = 0;
  rex_mission_state state = REX_QUEUED;
  std::string crew;
  std::optional<std::string> domain;
  uint32_t retryCount = 0;
  uint32_t maxRetries = 0;
  float progress = 0;

  TimePoint createdAt;
  std::optional<TimePoint> startedAt;
  std::optional<TimePoint> completedAt;
  TimePoint lastProgressAt;
  std::optional<TimePoint> notBefore;
  std::vector<rex_id> dependencies;

  std::optional<std::string> result;
  std::optional<ErrorDetail> error;
};
}
