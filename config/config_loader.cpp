#include "config/config_loader.h"

#include <cerrno>
#include <cstdint>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>
#include <utility>

namespace CryptoAudit {

namespace {

auto trim(std::string_view s) noexcept -> std::string_view {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
  return s.substr(b, e - b);
}

/// Drops a trailing `# comment` that is not inside a quoted string
auto stripComment(std::string_view line) noexcept -> std::string_view {
  bool quoted = false;
  for (size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '"') quoted = !quoted;
    else if (line[i] == '#' && !quoted) return line.substr(0, i);
  }
  return line;
}

/// True when an array value has its closing bracket outside quotes
auto arrayClosed(std::string_view value) noexcept -> bool {
  bool quoted = false;
  for (const char c : value) {
    if (c == '"') quoted = !quoted;
    else if (c == ']' && !quoted) return true;
  }
  return false;
}

/// NUL-terminated copy with TOML digit separators removed
auto numberText(std::string_view raw) -> std::string {
  std::string text;
  text.reserve(raw.size());
  for (const char c : raw) {
    if (c != '_') text.push_back(c);
  }
  return text;
}

} // namespace

// ========== Loading ==========

auto ConfigLoader::loadFromFile(const char* path, AuditConfig& config, LoggingSettings* logging) -> bool {
  FILE* file = std::fopen(path, "r");
  if (!file) {
    LOG_ERROR("Cannot open config file: %s", path);
    return false;
  }

  std::string text;
  char buffer[4096];
  size_t n = 0;
  while ((n = std::fread(buffer, 1, sizeof(buffer), file)) > 0) {
    text.append(buffer, n);
  }
  const bool read_error = std::ferror(file) != 0;
  std::fclose(file);
  if (read_error) {
    LOG_ERROR("Failed reading config file: %s", path);
    return false;
  }

  if (!loadFromString(text, config, logging)) {
    LOG_ERROR("Failed to parse TOML config file: %s", path);
    return false;
  }
  LOG_INFO("Configuration loaded from %s", path);
  return true;
}

auto ConfigLoader::loadFromString(std::string_view text, AuditConfig& config, LoggingSettings* logging) -> bool {
  AuditConfig staged = config;
  LoggingSettings staged_logging = logging ? *logging : LoggingSettings{};

  std::string section;
  std::string pending_key;
  std::string pending_value;   // multi-line array being accumulated
  uint32_t line_no = 0;

  size_t pos = 0;
  while (pos <= text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) nl = text.size();
    const std::string_view line = trim(stripComment(text.substr(pos, nl - pos)));
    pos = nl + 1;
    ++line_no;

    if (!pending_key.empty()) {
      pending_value.append(" ").append(line);
      if (arrayClosed(line)) {
        if (!applyValue(section, pending_key, pending_value, staged, staged_logging)) {
          LOG_ERROR("Config line %u: invalid value for %s", line_no, pending_key.c_str());
          return false;
        }
        pending_key.clear();
        pending_value.clear();
      }
      continue;
    }

    if (line.empty()) continue;

    // Section header
    if (line.front() == '[') {
      const size_t end = line.find(']');
      if (end == std::string_view::npos) {
        LOG_ERROR("Config line %u: unterminated section header", line_no);
        return false;
      }
      section.assign(trim(line.substr(1, end - 1)));
      continue;
    }

    const size_t eq = line.find('=');
    if (eq == std::string_view::npos) {
      LOG_ERROR("Config line %u: expected key = value", line_no);
      return false;
    }
    const std::string_view key = trim(line.substr(0, eq));
    const std::string_view value = trim(line.substr(eq + 1));
    if (key.empty() || value.empty()) {
      LOG_ERROR("Config line %u: expected key = value", line_no);
      return false;
    }

    if (value.front() == '[' && !arrayClosed(value)) {
      pending_key.assign(key);
      pending_value.assign(value);
      continue;
    }

    if (!applyValue(section, key, value, staged, staged_logging)) {
      LOG_ERROR("Config line %u: invalid value for %.*s", line_no, static_cast<int>(key.size()), key.data());
      return false;
    }
  }

  if (!pending_key.empty()) {
    LOG_ERROR("Config: unterminated array for %s", pending_key.c_str());
    return false;
  }

  config = std::move(staged);
  if (logging) *logging = std::move(staged_logging);
  return true;
}

auto ConfigLoader::applyValue(std::string_view section, std::string_view key, std::string_view value,
                              AuditConfig& config, LoggingSettings& logging) -> bool {
  uint64_t u = 0;
  int64_t i = 0;
  std::string s;

  if (section == "audit") {
    if (key == "severity_threshold") {
      return parseStringValue(value, s) && parseSeverity(s, config.severity_threshold);
    }
    if (key == "include_patterns") return parseStringArray(value, config.include_patterns);
    if (key == "exclude_patterns") return parseStringArray(value, config.exclude_patterns);
    if (key == "max_input_size") {
      if (!parseUintValue(value, u)) return false;
      config.max_input_size = static_cast<size_t>(u);
      return true;
    }
    if (key == "max_lines") {
      if (!parseUintValue(value, u)) return false;
      config.max_lines = static_cast<size_t>(u);
      return true;
    }
    if (key == "strip_comments") return parseBoolValue(value, config.strip_comments);
    if (key == "min_confidence") return parseDoubleValue(value, config.min_confidence);
    if (key == "report_timestamp") return parseStringValue(value, config.report_timestamp);
  } else if (section == "confidence") {
    ConfidenceWeights& w = config.confidence;
    if (key == "textual_base") return parseDoubleValue(value, w.textual_base);
    if (key == "structural_base") return parseDoubleValue(value, w.structural_base);
    if (key == "import_corroborated_base") return parseDoubleValue(value, w.import_corroborated_base);
    if (key == "crypto_function_boost") return parseDoubleValue(value, w.crypto_function_boost);
    if (key == "import_boost") return parseDoubleValue(value, w.import_boost);
    if (key == "label_string_penalty") return parseDoubleValue(value, w.label_string_penalty);
  } else if (section == "performance") {
    if (key == "worker_threads") {
      if (!parseUintValue(value, u) || u > UINT32_MAX) return false;
      config.worker_threads = static_cast<uint32_t>(u);
      return true;
    }
    if (key == "numa_node") {
      if (!parseIntValue(value, i) || i < -1 || i > INT32_MAX) return false;
      config.numa_node = static_cast<int>(i);
      return true;
    }
    if (key == "enable_parse_cache") return parseBoolValue(value, config.enable_parse_cache);
    if (key == "parse_cache_max_entries") {
      if (!parseUintValue(value, u)) return false;
      config.parse_cache_max_entries = static_cast<size_t>(u);
      return true;
    }
  } else if (section == "logging") {
    if (key == "log_file") return parseStringValue(value, logging.log_file);
    if (key == "level") {
      return parseStringValue(value, s) && Common::Logger::parseLevel(s.c_str(), logging.level);
    }
  }

  LOG_WARN("Config: ignoring unknown key [%.*s] %.*s",
           static_cast<int>(section.size()), section.data(),
           static_cast<int>(key.size()), key.data());
  return true;
}

// ========== Value parsing ==========

auto ConfigLoader::parseStringValue(std::string_view raw, std::string& out) -> bool {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') return false;
  const std::string_view body = raw.substr(1, raw.size() - 2);

  std::string result;
  result.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c == '"') return false;
    if (c != '\\') {
      result.push_back(c);
      continue;
    }
    if (++i >= body.size()) return false;
    switch (body[i]) {
      case '"':  result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case 'n':  result.push_back('\n'); break;
      case 't':  result.push_back('\t'); break;
      default:   return false;
    }
  }
  out = std::move(result);
  return true;
}

auto ConfigLoader::parseUintValue(std::string_view raw, uint64_t& out) noexcept -> bool {
  if (raw.empty() || raw.front() == '-' || raw.front() == '+') return false;
  try {
    const std::string text = numberText(raw);
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = value;
    return true;
  } catch (const std::bad_alloc&) {
    return false;
  }
}

auto ConfigLoader::parseIntValue(std::string_view raw, int64_t& out) noexcept -> bool {
  if (raw.empty()) return false;
  try {
    const std::string text = numberText(raw);
    char* end = nullptr;
    errno = 0;
    const long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') return false;
    out = value;
    return true;
  } catch (const std::bad_alloc&) {
    return false;
  }
}

auto ConfigLoader::parseDoubleValue(std::string_view raw, double& out) noexcept -> bool {
  if (raw.empty()) return false;
  try {
    const std::string text = numberText(raw);
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(text.c_str(), &end);
    if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(value)) return false;
    out = value;
    return true;
  } catch (const std::bad_alloc&) {
    return false;
  }
}

auto ConfigLoader::parseBoolValue(std::string_view raw, bool& out) noexcept -> bool {
  if (raw == "true") {
    out = true;
    return true;
  }
  if (raw == "false") {
    out = false;
    return true;
  }
  return false;
}

auto ConfigLoader::parseStringArray(std::string_view raw, std::vector<std::string>& out) -> bool {
  raw = trim(raw);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') return false;
  std::string_view body = trim(raw.substr(1, raw.size() - 2));

  std::vector<std::string> items;
  while (!body.empty()) {
    if (body.front() != '"') return false;
    size_t close = 1;
    while (close < body.size() && (body[close] != '"' || body[close - 1] == '\\')) ++close;
    if (close >= body.size()) return false;

    std::string item;
    if (!parseStringValue(body.substr(0, close + 1), item)) return false;
    items.push_back(std::move(item));

    body = trim(body.substr(close + 1));
    if (body.empty()) break;
    if (body.front() != ',') return false;
    body = trim(body.substr(1));   // trailing comma allowed
  }
  out = std::move(items);
  return true;
}

// ========== Diagnostics ==========

auto ConfigLoader::printConfig(const AuditConfig& config) noexcept -> void {
  LOG_INFO("=== Crypto Audit Configuration ===");
  LOG_INFO("Audit:");
  LOG_INFO("  Severity threshold: %s", toString(config.severity_threshold));
  LOG_INFO("  Include patterns: %zu", config.include_patterns.size());
  LOG_INFO("  Exclude patterns: %zu", config.exclude_patterns.size());
  LOG_INFO("  Max input size: %zu bytes", config.max_input_size);
  LOG_INFO("  Max lines: %zu", config.max_lines);
  LOG_INFO("  Strip comments: %s", config.strip_comments ? "Enabled" : "Disabled");
  LOG_INFO("  Min confidence: %.2f", config.min_confidence);
  LOG_INFO("Confidence:");
  LOG_INFO("  Bases: textual=%.2f structural=%.2f import=%.2f",
           config.confidence.textual_base, config.confidence.structural_base,
           config.confidence.import_corroborated_base);
  LOG_INFO("  Boosts: function=%.2f import=%.2f  Penalty: label=%.2f",
           config.confidence.crypto_function_boost, config.confidence.import_boost,
           config.confidence.label_string_penalty);
  LOG_INFO("Performance:");
  LOG_INFO("  Worker threads: %u", config.worker_threads);
  LOG_INFO("  NUMA node: %d", config.numa_node);
  LOG_INFO("  Parse cache: %s (max %zu entries)", config.enable_parse_cache ? "Enabled" : "Disabled",
           config.parse_cache_max_entries);
  LOG_INFO("==================================");
}

} // namespace CryptoAudit
