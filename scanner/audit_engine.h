#pragma once

#include <atomic>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "scanner/detector.h"
#include "scanner/parser.h"
#include "scanner/pattern_catalog.h"
#include "scanner/types.h"

namespace CryptoAudit {

constexpr size_t MAX_PATH_LENGTH = 4096;
constexpr uint32_t MAX_WORKER_THREADS = 64;

/// Content-addressed store of parsed files, keyed by SHA-256 of the content
/// plus the resolved language. Identical content and language reuse the same
/// ParsedFile. Holds at most max_entries files; inserting past the cap evicts
/// the least recently used entry.
class ParseArena {
public:
  explicit ParseArena(size_t max_entries = DEFAULT_PARSE_CACHE_ENTRIES);
  ParseArena(const ParseArena&) = delete;
  ParseArena& operator=(const ParseArena&) = delete;

  /// Marks a hit as most recently used
  [[nodiscard]] auto find(const std::string& key) -> std::shared_ptr<const ParsedFile>;

  /// Keeps the first entry stored under key and returns it
  auto insert(const std::string& key, std::shared_ptr<const ParsedFile> file)
    -> std::shared_ptr<const ParsedFile>;

  void clear();

  [[nodiscard]] auto size() const -> size_t;
  [[nodiscard]] auto capacity() const noexcept -> size_t { return max_entries_; }
  [[nodiscard]] auto hits() const noexcept -> uint64_t { return hits_.load(std::memory_order_relaxed); }
  [[nodiscard]] auto evictions() const noexcept -> uint64_t { return evictions_.load(std::memory_order_relaxed); }

  /// Empty when hashing fails; such content is never cached
  [[nodiscard]] static auto makeKey(std::string_view content, Language language) -> std::string;

private:
  struct Entry {
    std::shared_ptr<const ParsedFile> file;
    std::list<std::string>::iterator order;
  };

  const size_t max_entries_;
  mutable std::mutex mutex_;
  std::list<std::string> order_;  // front = most recently used
  std::unordered_map<std::string, Entry> files_;
  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> evictions_{0};
};

/// Parser + Detector pipeline with filtering, aggregation and risk scoring.
///
/// Built once from a validated AuditConfig. auditOne and auditMany are const
/// and may be called from several threads; the optional parse arena is
/// internally synchronized.
class AuditEngine {
public:
  /// Validates config against the built-in catalog
  [[nodiscard]] static auto create(const AuditConfig& config, Status* status = nullptr)
    -> std::unique_ptr<AuditEngine>;

  [[nodiscard]] static auto create(const AuditConfig& config, std::vector<PatternSpec> catalog,
                                   Status* status = nullptr) -> std::unique_ptr<AuditEngine>;

  AuditEngine(const AuditEngine&) = delete;
  AuditEngine& operator=(const AuditEngine&) = delete;

  /// Audits one in-memory file. path_or_language names the file (its
  /// extension selects the language) or is a bare language alias.
  /// INVALID_INPUT for a malformed path or oversized content, INTERNAL_ERROR
  /// if the pipeline throws. report is reset in every case.
  [[nodiscard]] auto auditOne(std::string_view content, std::string_view path_or_language,
                              AuditReport& report) const -> Status;

  /// Audits a batch. Per-file failures land in report.metadata.file_errors and
  /// never abort the batch. Risk is normalized by the lines of all files.
  [[nodiscard]] auto auditMany(const std::vector<SourceFile>& files, AuditReport& report) const -> Status;

  [[nodiscard]] auto config() const noexcept -> const AuditConfig& { return config_; }
  [[nodiscard]] auto detector() const noexcept -> const Detector& { return *detector_; }
  [[nodiscard]] auto parseArena() const noexcept -> const ParseArena& { return arena_; }
  void clearParseArena() { arena_.clear(); }

  [[nodiscard]] static auto validateConfig(const AuditConfig& config,
                                           const std::vector<PatternSpec>& catalog) -> Status;

  /// Empty, NUL-containing, over-long or `..`-component paths are INVALID_INPUT
  [[nodiscard]] static auto validatePath(std::string_view path) -> Status;

  [[nodiscard]] static auto computeRiskScore(const std::vector<Finding>& findings,
                                             uint64_t total_lines) noexcept -> RiskScore;

  [[nodiscard]] static auto riskLevelFor(double normalized) noexcept -> RiskLevel;

  /// "F-" + first 16 hex chars of SHA-256("pattern|path|line|column")
  [[nodiscard]] static auto makeFindingId(std::string_view pattern_id, std::string_view path,
                                          uint32_t line, uint32_t column) -> std::string;

private:
  AuditEngine(const AuditConfig& config, std::unique_ptr<Detector> detector);

  /// Result of parse + detect for one distinct content
  struct UnitResult {
    Status status;
    std::vector<Detection> detections;
    uint64_t lines{0};
    bool degraded{false};
    uint32_t skipped{0};
  };

  [[nodiscard]] auto validateInput(std::string_view content, std::string_view path) const -> Status;
  [[nodiscard]] auto runUnit(std::string_view content, std::string_view path) const -> UnitResult;
  [[nodiscard]] auto parseCached(std::string_view content, std::string_view path) const
    -> std::shared_ptr<const ParsedFile>;
  void materialize(const UnitResult& unit, const std::string& path, std::vector<Finding>& out) const;
  void finalize(AuditReport& report, uint64_t total_lines) const;

  AuditConfig config_;
  Parser parser_;
  std::unique_ptr<Detector> detector_;
  mutable ParseArena arena_;
};

// ========== Free-function entry points ==========

/// One-shot audit: builds an engine from config, then audits
[[nodiscard]] auto auditOne(std::string_view content, std::string_view path_or_language,
                            const AuditConfig& config, AuditReport& report) -> Status;

[[nodiscard]] auto auditMany(const std::vector<SourceFile>& files, const AuditConfig& config,
                             AuditReport& report) -> Status;

} // namespace CryptoAudit
