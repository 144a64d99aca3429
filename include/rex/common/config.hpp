#ifndef REX_COMMON_CONFIG_HPP
#define REX_COMMON_CONFIG_HPP

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>

namespace rex {
/** @brief Store for all tunables of one orchestrator instance.
 *
 * Every value has a default, can be overridden on the command line and in a
 * configuration file. Components read their values once during construction.
 */
class Config {
  public:
  /** Configuration variable differentiator enumeration.
   */
  enum Key {
    LocalName,
    WorkerThreads,

    ScheduleIntervalMs,
    MonitorIntervalMs,
    RecoveryIntervalMs,
    MissionTimeoutS,
    MaxRetries,
    BackoffBaseMs,
    BackoffCapMs,
    DispatchBatch,
    KeepFinishedMissions,

    CrewMaxSlots,
    CustomFloor,
    PrewarmedFloor,
    RetireAfterReadings,
    WarmupDays,
    ReputationEmaAlpha,
    DomainLeaseTtlS,
    QuotaRefillIntervalS,
    LLMQuota,
    EmailQuota,
    SMSQuota,
    Domains,

    ReasonerEndpoint,
    ReasonerTimeoutMs,
    ReasonerCacheTtlS,
    ReasonerCacheSize,
    RuleBudgetMs,
    EscalationPriority,
    PriorityBoostAfterS,
    AuditFile,

    _KEY_COUNT
  };

  using StringVector = std::vector<std::string>;

  using ConfigVariant =
    std::variant<uint32_t, uint64_t, int32_t, float, std::string, StringVector>;

  Config();
  ~Config();

  /** @brief Parse command line parameters that belong to the config.
   *
   * Unknown parameters are an error.
   *
   * @return True if parsing succeeded.
   */
  bool parseParameters(int argc, const char* const argv[]);

  /** @brief Parse a configuration file in INI syntax (key = value).
   *
   * @return True if the file could be read and parsed.
   */
  bool parseConfigFile(std::string_view filePath);

  /** @brief Apply values from an already parsed variables map.
   */
  bool apply(const boost::program_options::variables_map& vm);

  const boost::program_options::options_description& options() const {
    return m_options;
  }

  std::string getKeyAsString(Key key) const;

  template<typename T>
  inline T& get(Key key) {
    return std::get<T>(m_config[key]);
  }
  template<typename T>
  inline const T& get(Key key) const {
    return std::get<T>(m_config[key]);
  }
  inline std::string_view getString(Key key) const {
    const std::string& str = get<std::string>(key);
    return std::string_view{ str.c_str(), str.size() };
  }
  inline uint32_t getUint32(Key key) const { return get<uint32_t>(key); }
  inline uint64_t getUint64(Key key) const { return get<uint64_t>(key); }
  inline int32_t getInt32(Key key) const { return get<int32_t>(key); }
  inline float getFloat(Key key) const { return get<float>(key); }
  inline const StringVector& getStringVector(Key key) const {
    return get<StringVector>(key);
  }

  std::chrono::milliseconds getMilliseconds(Key key) const {
    return std::chrono::milliseconds(getUint64(key));
  }
  std::chrono::seconds getSeconds(Key key) const {
    return std::chrono::seconds(getUint64(key));
  }

  inline ConfigVariant& get(Key key) { return m_config[key]; }
  inline const ConfigVariant& get(Key key) const { return m_config[key]; }

  /** @brief Set a configuration variable. The type must match the default.
   */
  inline void set(Key key, ConfigVariant&& val) { m_config[key] = val; }

  ConfigVariant& operator[](Key key) { return get(key); }

  private:
  using ConfigArray =
    std::array<ConfigVariant, static_cast<std::size_t>(_KEY_COUNT)>;
  ConfigArray m_config;

  boost::program_options::options_description m_options;
};

constexpr const char*
GetConfigNameFromEnum(Config::Key key) {
  switch(key) {
    case Config::LocalName:
      return "local-name";
    case Config::WorkerThreads:
      return "worker-threads";
    case Config::ScheduleIntervalMs:
      return "schedule-interval-ms";
    case Config::MonitorIntervalMs:
      return "monitor-interval-ms";
    case Config::RecoveryIntervalMs:
      return "recovery-interval-ms";
    case Config::MissionTimeoutS:
      return "mission-timeout-s";
    case Config::MaxRetries:
      return "max-retries";
    case Config::BackoffBaseMs:
      return "backoff-base-ms";
    case Config::BackoffCapMs:
      return "backoff-cap-ms";
    case Config::DispatchBatch:
      return "dispatch-batch";
    case Config::KeepFinishedMissions:
      return "keep-finished-missions";
    case Config::CrewMaxSlots:
      return "crew-max-slots";
    case Config::CustomFloor:
      return "custom-floor";
    case Config::PrewarmedFloor:
      return "prewarmed-floor";
    case Config::RetireAfterReadings:
      return "retire-after-readings";
    case Config::WarmupDays:
      return "warmup-days";
    case Config::ReputationEmaAlpha:
      return "reputation-ema-alpha";
    case Config::DomainLeaseTtlS:
      return "domain-lease-ttl-s";
    case Config::QuotaRefillIntervalS:
      return "quota-refill-interval-s";
    case Config::LLMQuota:
      return "llm-quota";
    case Config::EmailQuota:
      return "email-quota";
    case Config::SMSQuota:
      return "sms-quota";
    case Config::Domains:
      return "domain";
    case Config::ReasonerEndpoint:
      return "reasoner-endpoint";
    case Config::ReasonerTimeoutMs:
      return "reasoner-timeout-ms";
    case Config::ReasonerCacheTtlS:
      return "reasoner-cache-ttl-s";
    case Config::ReasonerCacheSize:
      return "reasoner-cache-size";
    case Config::RuleBudgetMs:
      return "rule-budget-ms";
    case Config::EscalationPriority:
      return "escalation-priority";
    case Config::PriorityBoostAfterS:
      return "priority-boost-after-s";
    case Config::AuditFile:
      return "audit-file";
    default:
      return "";
  }
}
}

#endif
