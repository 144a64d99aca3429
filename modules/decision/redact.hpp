#pragma once

#include <rex/decision/decision.hpp>

#include <string>
#include <string_view>

namespace rex::decision {
/// Replace e-mail addresses, phone numbers and long digit runs.
std::string
Redact(std::string_view text);

/// Redact every value. Values of sensitive keys are dropped entirely.
ContextFields
RedactFields(const ContextFields& fields);
}
