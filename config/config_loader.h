#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "common/logging.h"
#include "scanner/types.h"

namespace CryptoAudit {

/// Host-side logging settings from the [logging] section
struct LoggingSettings {
  std::string log_file;
  Common::Logger::Level level{Common::Logger::INFO};
};

/// Loads AuditConfig from a TOML subset:
///
///   [audit]        severity_threshold, include_patterns, exclude_patterns,
///                  max_input_size, max_lines, strip_comments, min_confidence,
///                  report_timestamp
///   [confidence]   textual_base, structural_base, import_corroborated_base,
///                  crypto_function_boost, import_boost, label_string_penalty
///   [performance]  worker_threads, numa_node, enable_parse_cache,
///                  parse_cache_max_entries
///   [logging]      log_file, level
///
/// Keys absent from the file keep the values already in config. Unknown keys
/// are ignored with a warning; malformed values fail the load. Semantic checks
/// (ranges, known pattern ids) are left to AuditEngine::create.
class ConfigLoader {
public:
  [[nodiscard]] static auto loadFromFile(const char* path, AuditConfig& config,
                                         LoggingSettings* logging = nullptr) -> bool;

  [[nodiscard]] static auto loadFromString(std::string_view text, AuditConfig& config,
                                           LoggingSettings* logging = nullptr) -> bool;

  static auto printConfig(const AuditConfig& config) noexcept -> void;

private:
  static auto applyValue(std::string_view section, std::string_view key, std::string_view value,
                         AuditConfig& config, LoggingSettings& logging) -> bool;

  static auto parseStringValue(std::string_view raw, std::string& out) -> bool;
  static auto parseUintValue(std::string_view raw, uint64_t& out) noexcept -> bool;
  static auto parseIntValue(std::string_view raw, int64_t& out) noexcept -> bool;
  static auto parseDoubleValue(std::string_view raw, double& out) noexcept -> bool;
  static auto parseBoolValue(std::string_view raw, bool& out) noexcept -> bool;
  static auto parseStringArray(std::string_view raw, std::vector<std::string>& out) -> bool;
};

} // namespace CryptoAudit
