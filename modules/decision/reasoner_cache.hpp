#pragma once

#include <rex/common/clock.hpp>
#include <rex/decision/decision.hpp>

#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace rex::decision {
/** @brief Memo of successful reasoner answers.
 *
 * Bounded by age and by entry count, the least recently used entry is
 * evicted first.
 */
class ReasonerCache {
  public:
  struct Answer {
    Verdict verdict;
    float confidence;
  };

  ReasonerCache(Duration ttl, size_t maxEntries);

  std::optional<Answer> get(const std::string& key, TimePoint now);
  void put(const std::string& key, Answer answer, TimePoint now);

  size_t size() const;

  /// Cache key of a request: type plus the stable context fields.
  static std::string key(RequestType type, const ContextFields& fields);

  private:
  struct Entry {
    std::string key;
    Answer answer;
    TimePoint storedAt;
  };
  using EntryList = std::list<Entry>;

  mutable std::mutex m_mutex;
  Duration m_ttl;
  size_t m_maxEntries;
  EntryList m_entries;
  std::unordered_map<std::string, EntryList::iterator> m_index;
};
}
