#pragma once

#include <rex/common/status.h>
#include <rex/decision/decision.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace rex::decision {
struct ReasonerRequest {
  RequestType type = StateTransition;
  ContextFields context;
  std::vector<std::string> allowed;
};

struct ReasonerResult {
  rex_status status = REX_UNAVAILABLE;
  std::string decision;
  float confidence = 0;
  std::string error;
};

/** @brief Heavy reasoning capability consulted for ambiguous requests.
 *
 * Implementations may block. The decision engine bounds every call with its
 * own timeout and treats anything but REX_OK as a failed call.
 */
class Reasoner {
  public:
  virtual ~Reasoner() = default;
  virtual ReasonerResult resolve(const ReasonerRequest& request) = 0;
  virtual const char* name() const = 0;
};

/// Used when no provider is configured. Every call fails.
class UnavailableReasoner : public Reasoner {
  public:
  ReasonerResult resolve(const ReasonerRequest& request) override;
  const char* name() const override { return "unavailable"; }
};

/** @brief Reasoner behind an HTTP endpoint.
 *
 * POSTs `{"requestType": ..., "context": {...}, "allowed": [...]}` and
 * expects `{"decision": ..., "confidence": ...}` back. The endpoint has the
 * form `http://host[:port][/path]`.
 */
class HttpReasoner : public Reasoner {
  public:
  HttpReasoner(std::string endpoint, std::chrono::milliseconds timeout);

  ReasonerResult resolve(const ReasonerRequest& request) override;
  const char* name() const override { return "http"; }

  /// Split an endpoint into host, port and target.
  static bool parseEndpoint(const std::string& endpoint,
                            std::string& host,
                            std::string& port,
                            std::string& target);

  static std::string encodeRequest(const ReasonerRequest& request);
  static ReasonerResult decodeResponse(const std::string& body);

  private:
  std::string m_endpoint;
  std::chrono::milliseconds m_timeout;
};
}
