#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#define CRYPTO_AUDIT_VERSION "1.0.0"

namespace CryptoAudit {

// ========== Enumerations ==========

/// Lower value = more severe
enum class Severity : uint8_t {
  CRITICAL = 0,
  HIGH = 1,
  MEDIUM = 2,
  LOW = 3,
  INFO = 4
};

enum class Language : uint8_t {
  PYTHON = 0,
  JAVASCRIPT = 1,
  TYPESCRIPT = 2,
  GO = 3,
  JAVA = 4,
  C_FAMILY = 5,   // Rust, C, C++, C#
  UNKNOWN = 6
};

enum class PrimitiveFamily : uint8_t {
  INTEGER_FACTORIZATION_PK = 0,   // RSA
  DISCRETE_LOG_PK = 1,            // DSA
  ELLIPTIC_CURVE_PK = 2,          // ECDSA, EdDSA
  KEY_EXCHANGE = 3,               // DH, ECDH
  BROKEN_HASH = 4,                // MD5, SHA-1
  DEPRECATED_BLOCK_CIPHER = 5,    // DES, 3DES
  BROKEN_STREAM_CIPHER = 6        // RC4
};

constexpr size_t PRIMITIVE_FAMILY_COUNT = 7;

enum class RiskLevel : uint8_t {
  LOW = 0,
  MEDIUM = 1,
  HIGH = 2,
  CATASTROPHIC = 3
};

enum class ErrorKind : uint8_t {
  NONE = 0,
  CONFIG_ERROR = 1,       // rejected at engine construction
  INVALID_INPUT = 2,      // oversized payload or malformed path
  PARSE_DEGRADED = 3,     // lossy decode; informational
  DETECTION_SKIPPED = 4,  // one pattern/line pair failed; informational
  INTERNAL_ERROR = 5      // unexpected failure of a single call
};

[[nodiscard]] auto toString(Severity severity) noexcept -> const char*;
[[nodiscard]] auto toString(Language language) noexcept -> const char*;
[[nodiscard]] auto toString(PrimitiveFamily family) noexcept -> const char*;
[[nodiscard]] auto toString(RiskLevel level) noexcept -> const char*;
[[nodiscard]] auto toString(ErrorKind kind) noexcept -> const char*;

/// Case-insensitive; false on unknown names
[[nodiscard]] auto parseSeverity(std::string_view name, Severity& out) noexcept -> bool;
[[nodiscard]] auto parseLanguage(std::string_view name, Language& out) noexcept -> bool;
[[nodiscard]] auto parsePrimitiveFamily(std::string_view name, PrimitiveFamily& out) noexcept -> bool;
[[nodiscard]] auto parseRiskLevel(std::string_view name, RiskLevel& out) noexcept -> bool;
[[nodiscard]] auto parseErrorKind(std::string_view name, ErrorKind& out) noexcept -> bool;

/// True when severity is at or above threshold (CRITICAL is the top)
[[nodiscard]] constexpr auto meetsThreshold(Severity severity, Severity threshold) noexcept -> bool {
  return static_cast<uint8_t>(severity) <= static_cast<uint8_t>(threshold);
}

/// Weight used by the risk score: 10 / 7 / 4 / 1 / 0
[[nodiscard]] constexpr auto severityWeight(Severity severity) noexcept -> double {
  switch (severity) {
    case Severity::CRITICAL: return 10.0;
    case Severity::HIGH:     return 7.0;
    case Severity::MEDIUM:   return 4.0;
    case Severity::LOW:      return 1.0;
    case Severity::INFO:     return 0.0;
  }
  return 0.0;
}

/// Families a large quantum computer breaks with Shor's algorithm
[[nodiscard]] constexpr auto isQuantumVulnerableFamily(PrimitiveFamily family) noexcept -> bool {
  return family == PrimitiveFamily::INTEGER_FACTORIZATION_PK ||
         family == PrimitiveFamily::DISCRETE_LOG_PK ||
         family == PrimitiveFamily::ELLIPTIC_CURVE_PK ||
         family == PrimitiveFamily::KEY_EXCHANGE;
}

/// Families that are classically broken or deprecated
[[nodiscard]] constexpr auto isDeprecatedFamily(PrimitiveFamily family) noexcept -> bool {
  return family == PrimitiveFamily::BROKEN_HASH ||
         family == PrimitiveFamily::DEPRECATED_BLOCK_CIPHER ||
         family == PrimitiveFamily::BROKEN_STREAM_CIPHER;
}

// ========== Status ==========

struct Status {
  ErrorKind kind{ErrorKind::NONE};
  std::string message;

  [[nodiscard]] auto ok() const noexcept -> bool { return kind == ErrorKind::NONE; }

  [[nodiscard]] static auto success() -> Status { return Status{}; }
  [[nodiscard]] static auto error(ErrorKind kind, std::string message) -> Status {
    return Status{kind, std::move(message)};
  }
};

// ========== Parsed source ==========

/// Byte range [begin, end) of a string literal within one line
struct StringSpan {
  uint32_t begin{0};
  uint32_t end{0};

  bool operator==(const StringSpan&) const = default;
};

struct Line {
  uint32_t number{0};              // 1-based
  std::string text;                // raw text, without the line terminator
  std::string code;                // text with comment bytes blanked to spaces
  bool is_comment{false};          // no code on this line, only comment
  uint32_t indent{0};              // leading whitespace width, tab = 4
  std::vector<StringSpan> strings; // string literal spans on this line
};

struct Import {
  std::string module;   // verbatim, unresolved
  uint32_t line{0};
};

struct FunctionInfo {
  std::string name;
  uint32_t start_line{0};
  uint32_t end_line{0};
};

struct ParsedFile {
  Language language{Language::UNKNOWN};
  std::string path;
  std::vector<Line> lines;
  std::vector<Import> imports;
  std::vector<FunctionInfo> functions;  // ordered, non-overlapping
  bool degraded{false};                 // lossy decoding replaced invalid bytes
  bool comments_stripped{true};         // comment lines are excluded from matching
  size_t byte_size{0};
};

// ========== Detection results ==========

struct SourceLocation {
  std::string path;
  uint32_t line{0};     // 1-based
  uint32_t column{0};   // 1-based byte column
  std::string snippet;  // trimmed source line

  bool operator==(const SourceLocation&) const = default;
};

struct Detection {
  std::string pattern_id;
  SourceLocation location;
  double confidence{0.0};
  Severity severity{Severity::INFO};  // pattern severity after key-size escalation
  uint32_t key_size{0};               // 0 when unknown
};

struct Finding {
  std::string id;             // "F-" + 16 hex chars, derived from pattern and location
  std::string pattern_id;
  Severity severity{Severity::INFO};
  PrimitiveFamily family{PrimitiveFamily::BROKEN_HASH};
  SourceLocation location;
  std::string description;
  std::string recommendation;
  double confidence{0.0};
  bool quantum_vulnerable{false};
  uint32_t key_size{0};

  bool operator==(const Finding&) const = default;
};

struct RiskScore {
  double total{0.0};
  double normalized{0.0};
  uint32_t critical_count{0};
  uint32_t high_count{0};
  uint32_t medium_count{0};
  uint32_t low_count{0};
  uint32_t info_count{0};
  RiskLevel level{RiskLevel::LOW};

  bool operator==(const RiskScore&) const = default;
};

// ========== Configuration ==========

/// Context multiplier table: confidence = base * max(0, 1 + boosts - penalty)
struct ConfidenceWeights {
  double textual_base{0.70};
  double structural_base{0.75};
  double import_corroborated_base{0.80};
  double crypto_function_boost{0.20};
  double import_boost{0.20};
  double label_string_penalty{0.30};
};

constexpr size_t DEFAULT_PARSE_CACHE_ENTRIES = 1024;

struct AuditConfig {
  Severity severity_threshold{Severity::INFO};
  std::vector<std::string> include_patterns;
  std::vector<std::string> exclude_patterns;
  size_t max_input_size{10 * 1024 * 1024};
  size_t max_lines{500'000};
  bool strip_comments{true};
  double min_confidence{0.0};
  ConfidenceWeights confidence{};
  uint32_t worker_threads{1};   // 0 = hardware concurrency
  int numa_node{-1};
  bool enable_parse_cache{false};
  size_t parse_cache_max_entries{DEFAULT_PARSE_CACHE_ENTRIES};
  std::string tool_version{CRYPTO_AUDIT_VERSION};
  std::string report_timestamp;
};

// ========== Report ==========

struct FileError {
  std::string path;
  ErrorKind kind{ErrorKind::NONE};
  std::string message;

  bool operator==(const FileError&) const = default;
};

struct ReportSummary {
  uint32_t files_scanned{0};
  uint64_t lines_scanned{0};
  uint32_t total_findings{0};
  std::vector<PrimitiveFamily> quantum_vulnerable_families;  // distinct, enum order
  std::vector<PrimitiveFamily> deprecated_families;          // distinct, enum order
  std::vector<std::string> weak_key_sizes;                   // "RSA 1024-bit"
  std::vector<std::string> recommendations;

  bool operator==(const ReportSummary&) const = default;
};

struct ReportMetadata {
  std::string tool_version;
  std::string timestamp;
  std::vector<FileError> file_errors;
  uint32_t degraded_files{0};
  uint32_t skipped_detections{0};

  bool operator==(const ReportMetadata&) const = default;
};

struct AuditReport {
  std::vector<Finding> findings;  // sorted by path, line, pattern id, column
  RiskScore risk_score;
  ReportSummary summary;
  ReportMetadata metadata;

  bool operator==(const AuditReport&) const = default;
};

/// Input unit for batch audits
struct SourceFile {
  std::string path;
  std::string content;
};

} // namespace CryptoAudit
