#include "redact.hpp"

#include <regex>

#include <boost/algorithm/string/predicate.hpp>

namespace rex::decision {
static const std::regex matchEmail(
  "[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\\.[A-Za-z]{2,}");
static const std::regex matchNumber("\\+?[0-9][0-9 ()-]{5,}[0-9]");

static const char* const sensitiveKeys[] = { "email",   "phone",  "address",
                                             "password", "token", "secret",
                                             "api_key", "ssn" };

std::string
Redact(std::string_view text) {
  std::string s(text);
  s = std::regex_replace(s, matchEmail, "[email]");
  s = std::regex_replace(s, matchNumber, "[number]");
  return s;
}

ContextFields
RedactFields(const ContextFields& fields) {
  ContextFields out;
  out.reserve(fields.size());
  for(auto& [key, value] : fields) {
    bool sensitive = false;
    for(const char* k : sensitiveKeys) {
      if(boost::algorithm::icontains(key, k)) {
        sensitive = true;
        break;
      }
    }
    out.emplace_back(key, sensitive ? std::string("[redacted]") : Redact(value));
  }
  return out;
}
}
