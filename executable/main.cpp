#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <locale>
#include <memory>

#include <rex/bus/message_bus.hpp>
#include <rex/common/config.hpp>
#include <rex/common/log.h>
#include <rex/decision/audit_trail.hpp>
#include <rex/decision/decision_engine.hpp>
#include <rex/decision/reasoner.hpp>
#include <rex/orchestrator/orchestrator.hpp>
#include <rex/scheduler/mission_scheduler.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "CLI.hpp"

using namespace rex;

struct ProgramRuntimeHelper {
  ProgramRuntimeHelper() {}
  ~ProgramRuntimeHelper() {
    // Printing inspired from https://stackoverflow.com/a/22069038
    using namespace std::chrono;
    using day_t = duration<long, std::ratio<3600 * 24>>;

    auto end = steady_clock::now();

    auto dur = end - start;
    auto d = duration_cast<day_t>(dur);
    auto h = duration_cast<hours>(dur -= d);
    auto m = duration_cast<minutes>(dur -= h);
    auto s = duration_cast<seconds>(dur -= m);

    auto totalSeconds = duration_cast<duration<float>>(end - start);

    rex_log(REX_DAEMON,
            REX_DEBUG,
            "Wall-clock runtime: {}s ({}d, {}h, {}min, {}s)",
            totalSeconds.count(),
            d.count(),
            h.count(),
            m.count(),
            s.count());
  }

  std::chrono::steady_clock::time_point start =
    std::chrono::steady_clock::now();
};

static void
PrintStatistics(Orchestrator& orchestrator) {
  auto s = orchestrator.missionScheduler().stats();
  auto d = orchestrator.decisionEngine().stats();
  auto b = orchestrator.messageBus().stats();

  std::cout << "missions: submitted " << s.submitted << ", scheduled "
            << s.scheduled << ", completed " << s.completed << ", failed "
            << s.failed << " (escalated " << s.escalated << "), timed out "
            << s.timedOut << ", retried " << s.retried << ", cancelled "
            << s.cancelled << ", dispatch errors " << s.dispatchErrors
            << std::endl;

  std::cout << "decisions:";
  for(int l = 0; l < decision::_LAYER_COUNT; ++l) {
    std::cout << " " << decision::LayerToStr(static_cast<decision::Layer>(l))
              << " " << d.byLayer[l];
  }
  std::cout << ", cache hits " << d.cacheHits << ", fallbacks "
            << d.fallbacks << ", invalid " << d.invalidRequests
            << ", mean latency " << d.meanLatencyUs << "us" << std::endl;

  std::cout << "bus: published " << b.published << ", delivered "
            << b.delivered << ", failed " << b.failed << std::endl;
  std::cout << "audit records: " << orchestrator.auditTrail().size()
            << std::endl;
}

int
main(int argc, char* argv[]) {
  // Workaround for wonky locales.
  try {
    std::locale loc("");
  } catch(const std::exception& e) {
    setenv("LC_ALL", "C", 1);
  }

  ProgramRuntimeHelper runtimeHelper;

  if(rex_log_init() != REX_OK) {
    return EXIT_FAILURE;
  }

  Config config;
  CLI cli(config);

  if(!cli.parseArgs(argc, argv)) {
    return cli.helpRequested() ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  std::shared_ptr<decision::Reasoner> reasoner;
  std::string endpoint(config.getString(Config::ReasonerEndpoint));
  if(!endpoint.empty()) {
    std::string host, port, target;
    if(!decision::HttpReasoner::parseEndpoint(endpoint, host, port, target)) {
      rex_log(REX_DAEMON,
              REX_FATAL,
              "Reasoner endpoint \"{}\" is not of the form "
              "http://host[:port][/path]!",
              endpoint);
      return EXIT_FAILURE;
    }
    reasoner = std::make_shared<decision::HttpReasoner>(
      endpoint, config.getMilliseconds(Config::ReasonerTimeoutMs));
  } else {
    rex_log(REX_DAEMON,
            REX_INFO,
            "No reasoner endpoint configured, ambiguous decisions fall back "
            "to conservative defaults.");
  }

  // Sigpipe would exit the whole application! Don't do that. Errors are handled
  // by the reasoner directly.
  signal(SIGPIPE, SIG_IGN);

  Orchestrator orchestrator(config, reasoner);

  auto busLogger = orchestrator.messageBus().subscribeAll(
    [](const bus::Event& e) {
      if(e.topic == bus::DecisionResolved &&
         !rex_log_enabled(REX_DAEMON, REX_TRACE))
        return;
      rex_log(REX_DAEMON,
              REX_DEBUG,
              "{} mission {} [{}] {}",
              bus::TopicToStr(e.topic),
              e.missionId,
              e.subject,
              e.detail);
    });

  boost::asio::io_context signalContext;
  boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
  signals.async_wait(
    [&signalContext](const boost::system::error_code& ec, int number) {
      if(ec)
        return;
      rex_log(REX_DAEMON,
              REX_INFO,
              "Received signal {}, shutting down.",
              number);
      signalContext.stop();
    });

  orchestrator.start();
  rex_log(REX_DAEMON,
          REX_INFO,
          "Orchestrator {} running. Stop with SIGINT or SIGTERM.",
          config.getString(Config::LocalName));

  signalContext.run();

  orchestrator.stop();
  busLogger.disconnect();

  PrintStatistics(orchestrator);

  rex_log(REX_DAEMON, REX_DEBUG, "Orchestrator stopped, ending rexd.");
  return EXIT_SUCCESS;
}
