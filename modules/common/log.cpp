#include <rex/common/log.h>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/expressions/predicates/has_attr.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <array>
#include <atomic>
#include <cstdlib>
#include <iostream>
#include <string>

using LoggerMT =
  boost::log::sources::severity_channel_logger_mt<rex_log_severity,
                                                  rex_log_channel>;

static boost::shared_ptr<boost::log::sinks::synchronous_sink<
  boost::log::sinks::basic_text_ostream_backend<char>>>
  global_console_sink;

static LoggerMT global_logger(boost::log::keywords::channel = REX_GENERAL);

static std::atomic<rex_log_severity> global_severity = REX_INFO;
static std::array<std::atomic_bool, REX_CHANNEL_COUNT> global_channels;

static std::string local_name = "rex";

using namespace boost::log;

BOOST_LOG_ATTRIBUTE_KEYWORD(rex_logger_timestamp,
                            "TimeStamp",
                            boost::posix_time::ptime)

rex_status
rex_log_init() {
  static bool initialized = false;

  try {
    if(!initialized) {
      for(auto& c : global_channels)
        c = true;

      add_common_attributes();

      global_console_sink = add_console_log(std::clog);
      global_console_sink->set_formatter(
        expressions::stream
        << "c ["
        << expressions::if_(expressions::has_attr<std::string>(
             "LocalName"))[expressions::stream
                           << expressions::attr<std::string>("LocalName")]
        << "] [" << rex_logger_timestamp << "] ["
        << expressions::attr<rex_log_severity>("Severity") << "] ["
        << expressions::attr<rex_log_channel>("Channel") << " @ T"
        << expressions::attr<attributes::current_thread_id::value_type>(
             "ThreadID")
        << "] " << expressions::smessage);
      boost::log::core::get()->add_sink(global_console_sink);
    }
  } catch(std::exception& e) {
    std::cerr << "> Exception during log setup! Message: " << e.what()
              << std::endl;
    return REX_GENERIC_ERROR;
  }

  if(std::getenv("REX_LOG_DEBUG")) {
    rex_log_set_severity(REX_DEBUG);
  }
  if(std::getenv("REX_LOG_TRACE")) {
    rex_log_set_severity(REX_TRACE);
  }

  initialized = true;

  return REX_OK;
}

void
rex_log_set_severity(rex_log_severity severity) {
  global_severity = severity;
}

rex_log_severity
rex_log_get_severity() {
  return global_severity;
}

void
rex_log_set_channel_active(rex_log_channel channel, bool active) {
  if(channel < REX_CHANNEL_COUNT)
    global_channels[channel] = active;
}

void
rex_log_set_local_name(const char* name) {
  local_name = name;
  if(local_name.size() > 0) {
    global_logger.add_attribute("LocalName",
                                attributes::make_constant(local_name));
  }
}

void
rex_log(rex_log_channel channel, rex_log_severity severity, const char* msg) {
  rex_log(channel, severity, std::string_view(msg));
}

void
rex_log(rex_log_channel channel,
        rex_log_severity severity,
        std::string_view msg) {
  if(rex_log_enabled(channel, severity)) {
    try {
      BOOST_LOG_CHANNEL_SEV(global_logger, channel, severity) << msg;
    } catch(std::exception& e) {
      std::cerr
        << "!! Could not print log entry because of exception! Message: "
        << e.what() << std::endl;
    }
  }
}

bool
rex_log_enabled(rex_log_channel channel, rex_log_severity severity) {
  return severity >= global_severity && channel < REX_CHANNEL_COUNT &&
         global_channels[channel];
}

const char*
rex_log_severity_to_str(rex_log_severity severity) {
  switch(severity) {
    case REX_TRACE:
      return "TRCE";
    case REX_DEBUG:
      return "DEBG";
    case REX_INFO:
      return "INFO";
    case REX_LOCALWARNING:
      return "LWRN";
    case REX_LOCALERROR:
      return "LERR";
    case REX_GLOBALWARNING:
      return "GWRN";
    case REX_GLOBALERROR:
      return "GERR";
    case REX_FATAL:
      return "FTAL";

    case REX_SEVERITY_COUNT:
      break;
  }
  return "!!!!";
}

const char*
rex_log_channel_to_str(rex_log_channel channel) {
  switch(channel) {
    case REX_GENERAL:
      return "General";
    case REX_BUS:
      return "Bus";
    case REX_ALLOCATOR:
      return "Allocator";
    case REX_DECISION:
      return "Decision";
    case REX_REASONER:
      return "Reasoner";
    case REX_SCHEDULER:
      return "Scheduler";
    case REX_DAEMON:
      return "Daemon";
    case REX_CHANNEL_COUNT:
      break;
  }
  return "!";
}

bool
rex_log_channel_from_str(std::string_view name, rex_log_channel* channel) {
  for(int i = 0; i < REX_CHANNEL_COUNT; ++i) {
    auto c = static_cast<rex_log_channel>(i);
    if(boost::algorithm::iequals(name, rex_log_channel_to_str(c))) {
      *channel = c;
      return true;
    }
  }
  return false;
}
