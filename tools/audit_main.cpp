#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include "common/logging.h"
#include "common/time_utils.h"
#include "config/config_loader.h"
#include "scanner/audit_engine.h"
#include "scanner/report_json.h"
#include "scanner/source_files.h"
#include "tools/exit_codes.h"

namespace {

constexpr int EXIT_CLEAN = static_cast<int>(CryptoAudit::ExitCode::CLEAN);
constexpr int EXIT_CONFIG = static_cast<int>(CryptoAudit::ExitCode::CONFIG);

constexpr const char* DEFAULT_LOG_FILE = "logs/crypto_audit.log";

void printUsage(const char* program) {
  const char* usage = R"(
USAGE: %s [OPTIONS] <file|dir|->...

Crypto Audit - quantum-vulnerable and broken cryptography scanner

OPTIONS:
    --config <path>         TOML configuration file
    --json <path>           Write the full report as JSON
    --threshold <SEV>       Drop findings below CRITICAL|HIGH|MEDIUM|LOW|INFO
    --language <hint>       Language of stdin input ("-"), e.g. python, go, rust
    --include <id>          Report only this pattern id (repeatable)
    --exclude <id>          Never report this pattern id (repeatable)
    --threads <n>           Worker threads (0 = hardware concurrency)
    --log <path>            Log file (default: logs/crypto_audit.log)
    --verbose               Print every finding
    --list-patterns         Print the built-in pattern catalog and exit
    --help                  Show this help message

EXIT CODES:
    0 - No CRITICAL or HIGH findings
    1 - CRITICAL findings present
    2 - HIGH findings present
    3 - Configuration or usage error (nothing scanned)
    4 - Some files could not be analyzed
    5 - Internal error during the scan
)";
  fprintf(stdout, usage, program);
}

auto hasDotDotComponent(const char* path) noexcept -> bool {
  const char* p = path;
  while (*p) {
    if (p[0] == '.' && p[1] == '.' && (p[2] == '/' || p[2] == '\0') &&
        (p == path || p[-1] == '/')) {
      return true;
    }
    ++p;
  }
  return false;
}

auto readStdin(std::string& out) -> bool {
  char buffer[65536];
  while (true) {
    const ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    if (n == 0) return true;
    out.append(buffer, static_cast<size_t>(n));
  }
}

void printFinding(const CryptoAudit::Finding& f) {
  printf("[%-8s] %s:%u:%u  %s  (%.2f)\n", CryptoAudit::toString(f.severity),
         f.location.path.c_str(), f.location.line, f.location.column,
         f.pattern_id.c_str(), f.confidence);
  printf("           %s\n", f.location.snippet.c_str());
  printf("           %s\n", f.description.c_str());
}

} // namespace

int main(int argc, char* argv[]) {
  CryptoAudit::AuditConfig config;
  CryptoAudit::LoggingSettings logging;

  const char* config_path = nullptr;
  const char* json_path = nullptr;
  const char* log_path = nullptr;
  const char* language_hint = nullptr;
  const char* threshold = nullptr;
  long threads = -1;
  bool verbose = false;
  bool list_patterns = false;
  std::vector<std::string> includes;
  std::vector<std::string> excludes;
  std::vector<const char*> inputs;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return EXIT_CLEAN;
    }
    else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    }
    else if (std::strcmp(argv[i], "--json") == 0 && i + 1 < argc) {
      json_path = argv[++i];
    }
    else if (std::strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
      threshold = argv[++i];
    }
    else if (std::strcmp(argv[i], "--language") == 0 && i + 1 < argc) {
      language_hint = argv[++i];
    }
    else if (std::strcmp(argv[i], "--include") == 0 && i + 1 < argc) {
      includes.emplace_back(argv[++i]);
    }
    else if (std::strcmp(argv[i], "--exclude") == 0 && i + 1 < argc) {
      excludes.emplace_back(argv[++i]);
    }
    else if (std::strcmp(argv[i], "--threads") == 0 && i + 1 < argc) {
      char* end = nullptr;
      threads = std::strtol(argv[++i], &end, 10);
      if (end == argv[i] || *end != '\0' || threads < 0) {
        fprintf(stderr, "Invalid thread count: %s\n", argv[i]);
        return EXIT_CONFIG;
      }
    }
    else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
      log_path = argv[++i];
    }
    else if (std::strcmp(argv[i], "--verbose") == 0) {
      verbose = true;
    }
    else if (std::strcmp(argv[i], "--list-patterns") == 0) {
      list_patterns = true;
    }
    else if (argv[i][0] == '-' && argv[i][1] != '\0') {
      fprintf(stderr, "Unknown option: %s\n", argv[i]);
      printUsage(argv[0]);
      return EXIT_CONFIG;
    }
    else {
      inputs.push_back(argv[i]);
    }
  }

  if (list_patterns) {
    for (const auto& p : CryptoAudit::defaultCatalog()) {
      printf("%-16s %-9s %-26s %s\n", p.id.c_str(), CryptoAudit::toString(p.severity),
             CryptoAudit::toString(p.family), p.name.c_str());
    }
    return EXIT_CLEAN;
  }

  if (inputs.empty()) {
    fprintf(stderr, "No input files or directories given\n");
    printUsage(argv[0]);
    return EXIT_CONFIG;
  }

  // ---- Configuration ----
  if (config_path && !CryptoAudit::ConfigLoader::loadFromFile(config_path, config, &logging)) {
    fprintf(stderr, "Invalid configuration file: %s\n", config_path);
    return EXIT_CONFIG;
  }
  if (threshold && !CryptoAudit::parseSeverity(threshold, config.severity_threshold)) {
    fprintf(stderr, "Unknown severity: %s\n", threshold);
    return EXIT_CONFIG;
  }
  if (!includes.empty()) config.include_patterns = includes;
  for (auto& id : excludes) config.exclude_patterns.push_back(std::move(id));
  if (threads >= 0) config.worker_threads = static_cast<uint32_t>(threads > INT_MAX ? INT_MAX : threads);
  if (config.report_timestamp.empty()) {
    char stamp[32];
    if (Common::formatUtcTimestamp(stamp, sizeof(stamp)) > 0) config.report_timestamp = stamp;
  }

  const char* log_file = log_path ? log_path
                                  : (!logging.log_file.empty() ? logging.log_file.c_str() : DEFAULT_LOG_FILE);
  if (!Common::initLogging(log_file, verbose ? Common::Logger::DEBUG : logging.level)) {
    fprintf(stderr, "Warning: cannot open log file %s, continuing without logging\n", log_file);
  }

  LOG_INFO("=== CRYPTO AUDIT SESSION STARTED ===");
  CryptoAudit::ConfigLoader::printConfig(config);

  CryptoAudit::Status status;
  auto engine = CryptoAudit::AuditEngine::create(config, &status);
  if (!engine) {
    fprintf(stderr, "Configuration error: %s\n", status.message.c_str());
    Common::shutdownLogging();
    return EXIT_CONFIG;
  }

  // ---- Discovery ----
  std::vector<CryptoAudit::SourceFile> files;
  std::vector<CryptoAudit::FileError> read_errors;
  std::vector<std::string> paths;

  for (const char* input : inputs) {
    if (std::strcmp(input, "-") == 0) {
      CryptoAudit::SourceFile stdin_file;
      stdin_file.path = language_hint ? language_hint : "stdin";
      if (!readStdin(stdin_file.content)) {
        read_errors.push_back({"-", CryptoAudit::ErrorKind::INVALID_INPUT, "cannot read stdin"});
      } else {
        files.push_back(std::move(stdin_file));
      }
      continue;
    }

    std::string root = input;
    if (hasDotDotComponent(input)) {
      char resolved[PATH_MAX];
      if (::realpath(input, resolved) == nullptr) {
        read_errors.push_back({input, CryptoAudit::ErrorKind::INVALID_INPUT, std::strerror(errno)});
        continue;
      }
      root = resolved;
    }

    struct stat st;
    if (stat(root.c_str(), &st) != 0) {
      read_errors.push_back({root, CryptoAudit::ErrorKind::INVALID_INPUT, std::strerror(errno)});
      continue;
    }
    if (S_ISDIR(st.st_mode)) CryptoAudit::collectSourceFiles(root.c_str(), paths);
    else paths.push_back(root);
  }

  for (const auto& path : paths) {
    CryptoAudit::SourceFile file;
    file.path = path;
    std::string error;
    if (!CryptoAudit::readSourceFile(path.c_str(), config.max_input_size, file.content, error)) {
      LOG_WARN("Cannot read %s: %s", path.c_str(), error.c_str());
      read_errors.push_back({path, CryptoAudit::ErrorKind::INVALID_INPUT, error});
      continue;
    }
    files.push_back(std::move(file));
  }

  // ---- Audit ----
  const uint64_t start = Common::getNanosSinceEpoch();
  CryptoAudit::AuditReport report;
  status = engine->auditMany(files, report);
  if (!status.ok()) {
    fprintf(stderr, "Audit failed: %s\n", status.message.c_str());
    LOG_ERROR("Audit failed: %s", status.message.c_str());
    Common::shutdownLogging();
    return static_cast<int>(CryptoAudit::exitCodeForFailure(status));
  }
  report.metadata.file_errors.insert(report.metadata.file_errors.begin(),
                                     read_errors.begin(), read_errors.end());

  // ---- Output ----
  printf("==============================================\n");
  printf("CRYPTO AUDIT - Quantum Readiness Report\n");
  printf("==============================================\n");
  if (verbose) {
    for (const auto& f : report.findings) printFinding(f);
    printf("\n");
  }

  const auto& risk = report.risk_score;
  printf("FINDINGS SUMMARY\n");
  printf("----------------\n");
  printf("Files:    %u scanned, %zu not analyzed\n", report.summary.files_scanned,
         report.metadata.file_errors.size());
  printf("Lines:    %llu\n", static_cast<unsigned long long>(report.summary.lines_scanned));
  printf("Critical: %u\n", risk.critical_count);
  printf("High:     %u\n", risk.high_count);
  printf("Medium:   %u\n", risk.medium_count);
  printf("Low:      %u\n", risk.low_count);
  printf("Info:     %u\n", risk.info_count);
  printf("Risk:     %s (%.2f per 1000 lines, total %.2f)\n", CryptoAudit::toString(risk.level),
         risk.normalized, risk.total);
  for (const auto& weak : report.summary.weak_key_sizes) printf("Weak key: %s\n", weak.c_str());
  for (const auto& e : report.metadata.file_errors) {
    printf("Skipped:  %s (%s: %s)\n", e.path.c_str(), CryptoAudit::toString(e.kind), e.message.c_str());
  }
  if (!report.summary.recommendations.empty()) {
    printf("\nRECOMMENDATIONS\n");
    printf("---------------\n");
    for (const auto& rec : report.summary.recommendations) printf("  - %s\n", rec.c_str());
  }

  if (json_path) {
    const std::string json = CryptoAudit::toJson(report, true);
    FILE* out = std::fopen(json_path, "w");
    if (!out || std::fwrite(json.data(), 1, json.size(), out) != json.size()) {
      fprintf(stderr, "Cannot write JSON report: %s\n", json_path);
      LOG_ERROR("Cannot write JSON report: %s", json_path);
      if (out) std::fclose(out);
    } else {
      std::fclose(out);
      printf("\nJSON report: %s\n", json_path);
    }
  }

  LOG_INFO("=== CRYPTO AUDIT SESSION COMPLETED ===");
  LOG_INFO("Files: %u, findings: %u, risk: %s, elapsed %.1f ms", report.summary.files_scanned,
           report.summary.total_findings, CryptoAudit::toString(risk.level),
           Common::elapsedMillis(start));
  Common::shutdownLogging();

  return static_cast<int>(CryptoAudit::exitCodeForReport(report));
}
