#pragma once

#include <rex/common/types.h>

#include <cstdint>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>

namespace rex::decision {
struct DecisionRecord {
  uint64_t sequence = 0;
  rex_id missionId = 0;
  std::string requestType;
  std::string layer;
  std::vector<std::pair<std::string, std::string>> inputs;
  std::string output;
  float confidence = 0;
  int64_t latencyUs = 0;
  int64_t timestampMs = 0;
  std::string reason;

  template<class Archive>
  void serialize(Archive& ar) {
    ar(CEREAL_NVP(sequence),
       CEREAL_NVP(missionId),
       CEREAL_NVP(requestType),
       CEREAL_NVP(layer),
       CEREAL_NVP(inputs),
       CEREAL_NVP(output),
       CEREAL_NVP(confidence),
       CEREAL_NVP(latencyUs),
       CEREAL_NVP(timestampMs),
       CEREAL_NVP(reason));
  }
};

/** @brief Append-only record of every resolved decision.
 *
 * Keeps the most recent records in memory and, if a file is given, writes
 * each record as one JSON object per line. Nothing in the decision logic
 * reads it back.
 */
class AuditTrail {
  public:
  explicit AuditTrail(std::string path = "", size_t keepInMemory = 100000);
  ~AuditTrail();

  /// Assigns the sequence number and stores the record.
  uint64_t append(DecisionRecord record);

  /// Number of records appended since construction.
  uint64_t size() const;

  std::vector<DecisionRecord> records() const;

  /** @brief The most recent decisions still held in memory.
   *
   * @param limit Maximum number of records returned, oldest first.
   * @param missionId Only decisions about this mission, 0 for all.
   */
  std::vector<DecisionRecord> history(size_t limit = 50,
                                      rex_id missionId = 0) const;

  static std::string toJson(const DecisionRecord& record);

  private:
  mutable std::mutex m_mutex;
  std::string m_path;
  std::ofstream m_file;
  size_t m_keepInMemory;
  std::deque<DecisionRecord> m_records;
  uint64_t m_nextSequence = 1;
};
}
