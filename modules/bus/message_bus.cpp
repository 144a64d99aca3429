#include <rex/bus/message_bus.hpp>
#include <rex/common/log.h>

#include <array>

#include <boost/signals2/signal.hpp>

namespace rex::bus {
const char*
TopicToStr(Topic topic) {
  switch(topic) {
    case MissionCreated:
      return "mission.created";
    case MissionStateChanged:
      return "mission.stateChanged";
    case MissionAssigned:
      return "mission.assigned";
    case MissionCompleted:
      return "mission.completed";
    case MissionFailed:
      return "mission.failed";
    case ResourceLeaseGranted:
      return "resource.leaseGranted";
    case ResourceLeaseReleased:
      return "resource.leaseReleased";
    case ResourcePoolExhausted:
      return "resource.poolExhausted";
    case DecisionResolved:
      return "decision.resolved";
    case _TOPIC_COUNT:
      break;
  }
  return "!";
}

// Innermost deferral of the current thread, enclosing ones are chained.
static thread_local MessageBus::Deferral* CurrentDeferral = nullptr;

struct MessageBus::Internal {
  using Signal = boost::signals2::signal<void(const Event&)>;

  std::array<Signal, _TOPIC_COUNT> topics;
  Signal all;

  std::atomic_uint64_t published = 0;
  std::atomic_uint64_t delivered = 0;
  std::atomic_uint64_t failed = 0;
};

MessageBus::MessageBus()
  : m_internal(std::make_unique<Internal>()) {}
MessageBus::~MessageBus() {}

MessageBus::Deferral::Deferral(MessageBus& bus)
  : m_bus(bus)
  , m_enclosing(CurrentDeferral) {
  CurrentDeferral = this;
}

MessageBus::Deferral::~Deferral() {
  CurrentDeferral = m_enclosing;
  for(auto& e : m_events)
    m_bus.publish(std::move(e));
}

MessageBus::Handler
MessageBus::guard(Handler handler) {
  Internal* internal = m_internal.get();
  return [internal, handler](const Event& e) {
    try {
      handler(e);
      ++internal->delivered;
    } catch(const std::exception& ex) {
      ++internal->failed;
      rex_log(REX_BUS,
              REX_LOCALERROR,
              "Subscriber of {} for mission {} threw: {}",
              TopicToStr(e.topic),
              e.missionId,
              ex.what());
    }
  };
}

boost::signals2::connection
MessageBus::subscribe(Topic topic, Handler handler) {
  if(topic >= _TOPIC_COUNT) {
    rex_log(REX_BUS, REX_LOCALERROR, "Cannot subscribe to invalid topic!");
    return boost::signals2::connection();
  }
  return m_internal->topics[topic].connect(guard(std::move(handler)));
}

boost::signals2::connection
MessageBus::subscribeAll(Handler handler) {
  return m_internal->all.connect(guard(std::move(handler)));
}

void
MessageBus::publish(Event e) {
  if(e.topic >= _TOPIC_COUNT)
    return;

  for(Deferral* d = CurrentDeferral; d; d = d->m_enclosing) {
    if(&d->m_bus == this) {
      d->m_events.push_back(std::move(e));
      return;
    }
  }

  ++m_internal->published;

  rex_log(REX_BUS,
          REX_TRACE,
          "Publish {} (mission {}, subject {}, detail {})",
          TopicToStr(e.topic),
          e.missionId,
          e.subject,
          e.detail);

  m_internal->topics[e.topic](e);
  m_internal->all(e);
}

size_t
MessageBus::subscriberCount(Topic topic) const {
  if(topic >= _TOPIC_COUNT)
    return 0;
  return m_internal->topics[topic].num_slots();
}

MessageBus::Stats
MessageBus::stats() const {
  Stats s;
  s.published = m_internal->published;
  s.delivered = m_internal->delivered;
  s.failed = m_internal->failed;
  return s;
}
}
