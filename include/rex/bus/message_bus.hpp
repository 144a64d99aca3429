#pragma once

#include <rex/bus/event.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <boost/signals2/connection.hpp>

namespace rex::bus {
/** @brief Topic based publish/subscribe fabric for external observers.
 *
 * Delivery is synchronous on the publishing thread. A subscriber that throws
 * is logged and counted, remaining subscribers still receive the event and
 * the publisher never sees the exception.
 *
 * Code that publishes while holding a lock a handler might need wraps the
 * locked section into a Deferral.
 */
class MessageBus {
  public:
  using Handler = std::function<void(const Event&)>;

  /** @brief Holds back events published on this thread.
   *
   * While alive, every event the constructing thread publishes on the bus is
   * buffered. Destruction delivers the buffered events in publication order,
   * or hands them to an enclosing Deferral of the same bus. Construct it
   * before taking the lock, so it is destroyed after the lock is released.
   */
  class Deferral {
    public:
    explicit Deferral(MessageBus& bus);
    ~Deferral();

    Deferral(const Deferral&) = delete;
    Deferral& operator=(const Deferral&) = delete;

    private:
    friend class MessageBus;

    MessageBus& m_bus;
    Deferral* m_enclosing;
    std::vector<Event> m_events;
  };

  struct Stats {
    uint64_t published = 0;
    uint64_t delivered = 0;
    uint64_t failed = 0;
  };

  MessageBus();
  ~MessageBus();

  boost::signals2::connection subscribe(Topic topic, Handler handler);
  boost::signals2::connection subscribeAll(Handler handler);

  void publish(Event e);

  size_t subscriberCount(Topic topic) const;

  Stats stats() const;

  private:
  struct Internal;
  std::unique_ptr<Internal> m_internal;

  Handler guard(Handler handler);
};
}
