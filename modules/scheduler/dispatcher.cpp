#include <rex/bus/message_bus.hpp>
#include <rex/common/clock.hpp>
#include <rex/scheduler/dispatcher.hpp>

namespace rex::scheduler {
BusDispatcher::BusDispatcher(bus::MessageBus& bus, const Clock& clock)
  : m_bus(bus)
  , m_clock(clock) {}

rex_status
BusDispatcher::dispatch(const DispatchOrder& order) {
  std::string detail = order.payload;
  if(order.domain)
    detail = "domain=" + *order.domain + " " + detail;

  m_bus.publish(bus::Event{ bus::MissionAssigned,
                            order.missionId,
                            order.crew,
                            std::move(detail),
                            m_clock.now() });
  return REX_OK;
}
}
