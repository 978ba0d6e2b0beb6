#pragma once

#include <string>
#include <string_view>

#include "scanner/types.h"

namespace CryptoAudit {

/// Serializes every field of the report. Doubles are written with enough
/// digits to read back bit-exact.
[[nodiscard]] auto toJson(const AuditReport& report, bool pretty = false) -> std::string;

/// Parses toJson output. Returns false on malformed JSON or any missing or
/// mistyped field; report is left default-constructed in that case.
[[nodiscard]] auto fromJson(std::string_view text, AuditReport& report) -> bool;

} // namespace CryptoAudit
