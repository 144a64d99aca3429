#pragma once

#include <rex/common/clock.hpp>
#include <rex/common/types.h>

#include <algorithm>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

namespace rex::scheduler {
struct QueueEntry {
  rex_id id;
  int32_t priority;
  TimePoint createdAt;

  /// Higher priority first, ties by creation time, then by id.
  bool operator<(const QueueEntry& o) const {
    if(priority != o.priority)
      return priority > o.priority;
    if(createdAt != o.createdAt)
      return createdAt < o.createdAt;
    return id < o.id;
  }
};

/// Sorted queue of missions waiting for resources.
class MissionQueue {
  public:
  void pushNoLock(QueueEntry e) {
    auto pos = std::upper_bound(m_queue.begin(), m_queue.end(), e);
    m_queue.insert(pos, std::move(e));
  }

  void push(QueueEntry e) {
    std::unique_lock lock(m_mutex);
    pushNoLock(std::move(e));
  }

  template<class Predicate>
  void removeMatchingNoLock(Predicate p) {
    auto toBeRemoved = std::remove_if(m_queue.begin(), m_queue.end(), p);
    m_queue.erase(toBeRemoved, m_queue.end());
  }

  template<class Predicate>
  void removeMatching(Predicate p) {
    std::unique_lock lock(m_mutex);
    removeMatchingNoLock(p);
  }

  void remove(rex_id id) {
    removeMatching([id](const QueueEntry& e) { return e.id == id; });
  }

  void reprioritize(rex_id id, int32_t priority) {
    std::unique_lock lock(m_mutex);
    auto it = std::find_if(m_queue.begin(),
                           m_queue.end(),
                           [id](const QueueEntry& e) { return e.id == id; });
    if(it == m_queue.end())
      return;
    QueueEntry e = *it;
    m_queue.erase(it);
    e.priority = priority;
    pushNoLock(e);
  }

  /// Copy of the queue in dispatch order.
  std::vector<QueueEntry> snapshot() const {
    std::unique_lock lock(m_mutex);
    return std::vector<QueueEntry>(m_queue.begin(), m_queue.end());
  }

  inline bool empty() const {
    std::unique_lock lock(m_mutex);
    return m_queue.empty();
  }

  inline size_t size() const {
    std::unique_lock lock(m_mutex);
    return m_queue.size();
  }

  private:
  std::deque<QueueEntry> m_queue;
  mutable std::mutex m_mutex;
};
}
