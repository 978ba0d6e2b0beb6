#include "scanner/types.h"

#include <cctype>

namespace CryptoAudit {

namespace {

auto equalsIgnoreCase(std::string_view a, std::string_view b) noexcept -> bool {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

template<typename Enum, size_t N>
auto parseByName(std::string_view name, Enum& out, const Enum (&values)[N]) noexcept -> bool {
  for (const Enum value : values) {
    if (equalsIgnoreCase(name, toString(value))) {
      out = value;
      return true;
    }
  }
  return false;
}

} // namespace

auto toString(Severity severity) noexcept -> const char* {
  switch (severity) {
    case Severity::CRITICAL: return "CRITICAL";
    case Severity::HIGH:     return "HIGH";
    case Severity::MEDIUM:   return "MEDIUM";
    case Severity::LOW:      return "LOW";
    case Severity::INFO:     return "INFO";
  }
  return "UNKNOWN";
}

auto toString(Language language) noexcept -> const char* {
  switch (language) {
    case Language::PYTHON:     return "PYTHON";
    case Language::JAVASCRIPT: return "JAVASCRIPT";
    case Language::TYPESCRIPT: return "TYPESCRIPT";
    case Language::GO:         return "GO";
    case Language::JAVA:       return "JAVA";
    case Language::C_FAMILY:   return "C_FAMILY";
    case Language::UNKNOWN:    return "UNKNOWN";
  }
  return "UNKNOWN";
}

auto toString(PrimitiveFamily family) noexcept -> const char* {
  switch (family) {
    case PrimitiveFamily::INTEGER_FACTORIZATION_PK: return "INTEGER_FACTORIZATION_PK";
    case PrimitiveFamily::DISCRETE_LOG_PK:          return "DISCRETE_LOG_PK";
    case PrimitiveFamily::ELLIPTIC_CURVE_PK:        return "ELLIPTIC_CURVE_PK";
    case PrimitiveFamily::KEY_EXCHANGE:             return "KEY_EXCHANGE";
    case PrimitiveFamily::BROKEN_HASH:              return "BROKEN_HASH";
    case PrimitiveFamily::DEPRECATED_BLOCK_CIPHER:  return "DEPRECATED_BLOCK_CIPHER";
    case PrimitiveFamily::BROKEN_STREAM_CIPHER:     return "BROKEN_STREAM_CIPHER";
  }
  return "UNKNOWN";
}

auto toString(RiskLevel level) noexcept -> const char* {
  switch (level) {
    case RiskLevel::LOW:          return "LOW";
    case RiskLevel::MEDIUM:       return "MEDIUM";
    case RiskLevel::HIGH:         return "HIGH";
    case RiskLevel::CATASTROPHIC: return "CATASTROPHIC";
  }
  return "UNKNOWN";
}

auto toString(ErrorKind kind) noexcept -> const char* {
  switch (kind) {
    case ErrorKind::NONE:              return "NONE";
    case ErrorKind::CONFIG_ERROR:      return "CONFIG_ERROR";
    case ErrorKind::INVALID_INPUT:     return "INVALID_INPUT";
    case ErrorKind::PARSE_DEGRADED:    return "PARSE_DEGRADED";
    case ErrorKind::DETECTION_SKIPPED: return "DETECTION_SKIPPED";
    case ErrorKind::INTERNAL_ERROR:    return "INTERNAL_ERROR";
  }
  return "UNKNOWN";
}

auto parseSeverity(std::string_view name, Severity& out) noexcept -> bool {
  static constexpr Severity ALL[] = {Severity::CRITICAL, Severity::HIGH, Severity::MEDIUM,
                                     Severity::LOW, Severity::INFO};
  return parseByName(name, out, ALL);
}

auto parseLanguage(std::string_view name, Language& out) noexcept -> bool {
  static constexpr Language ALL[] = {Language::PYTHON, Language::JAVASCRIPT, Language::TYPESCRIPT,
                                     Language::GO, Language::JAVA, Language::C_FAMILY,
                                     Language::UNKNOWN};
  return parseByName(name, out, ALL);
}

auto parsePrimitiveFamily(std::string_view name, PrimitiveFamily& out) noexcept -> bool {
  static constexpr PrimitiveFamily ALL[] = {
    PrimitiveFamily::INTEGER_FACTORIZATION_PK, PrimitiveFamily::DISCRETE_LOG_PK,
    PrimitiveFamily::ELLIPTIC_CURVE_PK, PrimitiveFamily::KEY_EXCHANGE,
    PrimitiveFamily::BROKEN_HASH, PrimitiveFamily::DEPRECATED_BLOCK_CIPHER,
    PrimitiveFamily::BROKEN_STREAM_CIPHER};
  return parseByName(name, out, ALL);
}

auto parseRiskLevel(std::string_view name, RiskLevel& out) noexcept -> bool {
  static constexpr RiskLevel ALL[] = {RiskLevel::LOW, RiskLevel::MEDIUM, RiskLevel::HIGH,
                                      RiskLevel::CATASTROPHIC};
  return parseByName(name, out, ALL);
}

auto parseErrorKind(std::string_view name, ErrorKind& out) noexcept -> bool {
  static constexpr ErrorKind ALL[] = {ErrorKind::NONE, ErrorKind::CONFIG_ERROR,
                                      ErrorKind::INVALID_INPUT, ErrorKind::PARSE_DEGRADED,
                                      ErrorKind::DETECTION_SKIPPED, ErrorKind::INTERNAL_ERROR};
  return parseByName(name, out, ALL);
}

} // namespace CryptoAudit
