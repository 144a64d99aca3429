#include <rex/common/config.hpp>
#include <rex/common/log.h>

#include <boost/algorithm/string/join.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <thread>

#include <unistd.h>

namespace po = boost::program_options;

namespace rex {
Config::Config()
  : m_options("Orchestrator Options") {
  std::string generatedLocalName =
    boost::asio::ip::host_name() + "_" + std::to_string(getpid());
  uint32_t workerThreads =
    std::max(2u, std::min(4u, std::thread::hardware_concurrency()));

  set(LocalName, generatedLocalName);
  set(WorkerThreads, workerThreads);

  set(ScheduleIntervalMs, uint64_t(1000));
  set(MonitorIntervalMs, uint64_t(30000));
  set(RecoveryIntervalMs, uint64_t(1000));
  set(MissionTimeoutS, uint64_t(2 * 60 * 60));
  set(MaxRetries, uint32_t(3));
  set(BackoffBaseMs, uint64_t(1000));
  set(BackoffCapMs, uint64_t(300000));
  set(DispatchBatch, uint32_t(16));
  set(KeepFinishedMissions, uint32_t(10000));

  set(CrewMaxSlots, uint32_t(3));
  set(CustomFloor, 0.7f);
  set(PrewarmedFloor, 0.8f);
  set(RetireAfterReadings, uint32_t(5));
  set(WarmupDays, uint32_t(14));
  set(ReputationEmaAlpha, 0.1f);
  set(DomainLeaseTtlS, uint64_t(4 * 60 * 60));
  set(QuotaRefillIntervalS, uint64_t(60));
  set(LLMQuota, uint32_t(10000));
  set(EmailQuota, uint32_t(100));
  set(SMSQuota, uint32_t(50));
  set(Domains, StringVector());

  set(ReasonerEndpoint, std::string());
  set(ReasonerTimeoutMs, uint64_t(5000));
  set(ReasonerCacheTtlS, uint64_t(3600));
  set(ReasonerCacheSize, uint32_t(1024));
  set(RuleBudgetMs, uint64_t(50));
  set(EscalationPriority, int32_t(50));
  set(PriorityBoostAfterS, uint64_t(24 * 60 * 60));
  set(AuditFile, std::string());

  // clang-format off
  m_options.add_options()
    (GetConfigNameFromEnum(LocalName),
     po::value<std::string>()->default_value(generatedLocalName)->value_name("string"), "local name of this orchestrator instance")
    (GetConfigNameFromEnum(WorkerThreads),
     po::value<uint32_t>()->default_value(workerThreads)->value_name("int"), "threads running the control loops")
    (GetConfigNameFromEnum(ScheduleIntervalMs),
     po::value<uint64_t>()->default_value(1000)->value_name("int"), "milliseconds between scheduling ticks")
    (GetConfigNameFromEnum(MonitorIntervalMs),
     po::value<uint64_t>()->default_value(30000)->value_name("int"), "milliseconds between progress monitor ticks")
    (GetConfigNameFromEnum(RecoveryIntervalMs),
     po::value<uint64_t>()->default_value(1000)->value_name("int"), "milliseconds between error recovery ticks")
    (GetConfigNameFromEnum(MissionTimeoutS),
     po::value<uint64_t>()->default_value(7200)->value_name("int"), "seconds without progress after which a running mission times out")
    (GetConfigNameFromEnum(MaxRetries),
     po::value<uint32_t>()->default_value(3)->value_name("int"), "retries per mission before it fails terminally")
    (GetConfigNameFromEnum(BackoffBaseMs),
     po::value<uint64_t>()->default_value(1000)->value_name("int"), "base of the exponential retry backoff in milliseconds")
    (GetConfigNameFromEnum(BackoffCapMs),
     po::value<uint64_t>()->default_value(300000)->value_name("int"), "upper bound of the retry backoff in milliseconds")
    (GetConfigNameFromEnum(DispatchBatch),
     po::value<uint32_t>()->default_value(16)->value_name("int"), "maximum missions dispatched per scheduling tick")
    (GetConfigNameFromEnum(KeepFinishedMissions),
     po::value<uint32_t>()->default_value(10000)->value_name("int"), "finished missions kept queryable before the oldest are forgotten")
    (GetConfigNameFromEnum(CrewMaxSlots),
     po::value<uint32_t>()->default_value(3)->value_name("int"), "concurrent missions per crew")
    (GetConfigNameFromEnum(CustomFloor),
     po::value<float>()->default_value(0.7f)->value_name("float"), "minimal reputation of custom domains")
    (GetConfigNameFromEnum(PrewarmedFloor),
     po::value<float>()->default_value(0.8f)->value_name("float"), "minimal reputation of pre-warmed domains")
    (GetConfigNameFromEnum(RetireAfterReadings),
     po::value<uint32_t>()->default_value(5)->value_name("int"), "consecutive readings below the floor after which a domain is retired")
    (GetConfigNameFromEnum(WarmupDays),
     po::value<uint32_t>()->default_value(14)->value_name("int"), "warmup days before a domain becomes active")
    (GetConfigNameFromEnum(ReputationEmaAlpha),
     po::value<float>()->default_value(0.1f)->value_name("float"), "weight of a single delivery outcome in the reputation average")
    (GetConfigNameFromEnum(DomainLeaseTtlS),
     po::value<uint64_t>()->default_value(14400)->value_name("int"), "seconds until an unreleased domain lease expires")
    (GetConfigNameFromEnum(QuotaRefillIntervalS),
     po::value<uint64_t>()->default_value(60)->value_name("int"), "seconds between API quota refills")
    (GetConfigNameFromEnum(LLMQuota),
     po::value<uint32_t>()->default_value(10000)->value_name("int"), "LLM calls per refill interval")
    (GetConfigNameFromEnum(EmailQuota),
     po::value<uint32_t>()->default_value(100)->value_name("int"), "email sends per refill interval")
    (GetConfigNameFromEnum(SMSQuota),
     po::value<uint32_t>()->default_value(50)->value_name("int"), "SMS sends per refill interval")
    (GetConfigNameFromEnum(Domains),
     po::value<StringVector>()->value_name("name:tier:reputation[:status[:campaign]]")->multitoken(), "sending domain to provision at startup (multiple entries possible)")
    (GetConfigNameFromEnum(ReasonerEndpoint),
     po::value<std::string>()->default_value("")->value_name("url"), "http endpoint of the reasoning provider, empty disables it")
    (GetConfigNameFromEnum(ReasonerTimeoutMs),
     po::value<uint64_t>()->default_value(5000)->value_name("int"), "hard timeout of a single reasoner call in milliseconds")
    (GetConfigNameFromEnum(ReasonerCacheTtlS),
     po::value<uint64_t>()->default_value(3600)->value_name("int"), "seconds a reasoner answer stays cached")
    (GetConfigNameFromEnum(ReasonerCacheSize),
     po::value<uint32_t>()->default_value(1024)->value_name("int"), "maximum cached reasoner answers")
    (GetConfigNameFromEnum(RuleBudgetMs),
     po::value<uint64_t>()->default_value(50)->value_name("int"), "evaluation budget of a single rule in milliseconds")
    (GetConfigNameFromEnum(EscalationPriority),
     po::value<int32_t>()->default_value(50)->value_name("int"), "minimal priority for escalation instead of terminal failure")
    (GetConfigNameFromEnum(PriorityBoostAfterS),
     po::value<uint64_t>()->default_value(86400)->value_name("int"), "seconds in queue after which a mission gets a priority boost")
    (GetConfigNameFromEnum(AuditFile),
     po::value<std::string>()->default_value("")->value_name("path"), "append decision records to this file, empty keeps them in memory")
    ;
  // clang-format on
}

Config::~Config() {}

bool
Config::parseParameters(int argc, const char* const argv[]) {
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(m_options).run(),
              vm);
    po::notify(vm);
  } catch(const std::exception& e) {
    rex_log(REX_GENERAL,
            REX_LOCALERROR,
            "Could not parse CLI parameters! Error: {}",
            e.what());
    return false;
  }
  return apply(vm);
}

bool
Config::parseConfigFile(std::string_view filePath) {
  std::ifstream file{ std::string(filePath) };
  if(!file) {
    rex_log(REX_GENERAL,
            REX_LOCALERROR,
            "Could not open config file \"{}\"!",
            filePath);
    return false;
  }

  po::variables_map vm;
  try {
    po::store(po::parse_config_file(file, m_options), vm);
    po::notify(vm);
  } catch(const std::exception& e) {
    rex_log(REX_GENERAL,
            REX_LOCALERROR,
            "Could not parse config file \"{}\"! Error: {}",
            filePath,
            e.what());
    return false;
  }
  return apply(vm);
}

bool
Config::apply(const po::variables_map& vm) {
  for(size_t i = 0; i < _KEY_COUNT; ++i) {
    Key key = static_cast<Key>(i);
    const char* name = GetConfigNameFromEnum(key);
    if(!vm.count(name) || vm[name].defaulted())
      continue;

    try {
      std::visit(
        [&vm, name](auto& target) {
          using T = std::decay_t<decltype(target)>;
          target = vm[name].as<T>();
        },
        m_config[key]);
    } catch(const boost::bad_any_cast&) {
      rex_log(REX_GENERAL,
              REX_LOCALERROR,
              "Config entry {} has an unexpected type!",
              name);
      return false;
    }
  }
  return true;
}

std::string
Config::getKeyAsString(Key key) const {
  const ConfigVariant& v = get(key);
  switch(v.index()) {
    case 0:
      return std::to_string(std::get<uint32_t>(v));
    case 1:
      return std::to_string(std::get<uint64_t>(v));
    case 2:
      return std::to_string(std::get<int32_t>(v));
    case 3:
      return std::to_string(std::get<float>(v));
    case 4:
      return std::get<std::string>(v);
    case 5:
      return boost::algorithm::join(std::get<StringVector>(v), ";");
    default:
      return "Unknown Type!";
  }
}
}
