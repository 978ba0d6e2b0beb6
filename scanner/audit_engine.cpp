#include "scanner/audit_engine.h"

#include <algorithm>
#include <exception>
#include <future>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>
#include <utility>

#include "common/hash_utils.h"
#include "common/logging.h"
#include "common/thread_utils.h"

namespace CryptoAudit {

namespace {

constexpr const char* REC_CRITICAL =
  "CRITICAL: Immediately migrate to quantum-safe algorithms (CRYSTALS-Kyber, CRYSTALS-Dilithium)";
constexpr const char* REC_HIGH =
  "HIGH PRIORITY: Plan migration to post-quantum cryptography within 6-12 months";
constexpr const char* REC_RSA =
  "Replace RSA with CRYSTALS-Dilithium for digital signatures or CRYSTALS-Kyber for encryption";
constexpr const char* REC_EC =
  "Replace ECDSA/ECDH with CRYSTALS-Dilithium (signatures) or CRYSTALS-Kyber (key exchange)";
constexpr const char* REC_DH =
  "Replace Diffie-Hellman key exchange with CRYSTALS-Kyber or NTRU";
constexpr const char* REC_NIST =
  "Follow NIST Post-Quantum Cryptography Standardization guidelines: "
  "https://csrc.nist.gov/projects/post-quantum-cryptography";

auto contains(const std::vector<std::string>& list, std::string_view value) noexcept -> bool {
  return std::find(list.begin(), list.end(), value) != list.end();
}

auto inUnitRange(double value) noexcept -> bool {
  return value >= 0.0 && value <= 1.0;  // false for NaN
}

auto findingOrder(const Finding& a, const Finding& b) noexcept -> bool {
  if (a.location.path != b.location.path) return a.location.path < b.location.path;
  if (a.location.line != b.location.line) return a.location.line < b.location.line;
  if (a.pattern_id != b.pattern_id) return a.pattern_id < b.pattern_id;
  return a.location.column < b.location.column;
}

} // namespace

// ========== ParseArena ==========

ParseArena::ParseArena(size_t max_entries) : max_entries_(std::max<size_t>(max_entries, 1)) {}

auto ParseArena::find(const std::string& key) -> std::shared_ptr<const ParsedFile> {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = files_.find(key);
  if (it == files_.end()) return nullptr;
  order_.splice(order_.begin(), order_, it->second.order);
  hits_.fetch_add(1, std::memory_order_relaxed);
  return it->second.file;
}

auto ParseArena::insert(const std::string& key, std::shared_ptr<const ParsedFile> file)
  -> std::shared_ptr<const ParsedFile> {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto existing = files_.find(key);
  if (existing != files_.end()) {
    order_.splice(order_.begin(), order_, existing->second.order);
    return existing->second.file;
  }

  while (files_.size() >= max_entries_ && !order_.empty()) {
    files_.erase(order_.back());
    order_.pop_back();
    evictions_.fetch_add(1, std::memory_order_relaxed);
  }
  order_.push_front(key);
  const auto result = files_.emplace(key, Entry{std::move(file), order_.begin()});
  return result.first->second.file;
}

void ParseArena::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  files_.clear();
  order_.clear();
}

auto ParseArena::size() const -> size_t {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.size();
}

auto ParseArena::makeKey(std::string_view content, Language language) -> std::string {
  std::string digest = Common::sha256Hex(content);
  if (digest.empty()) return digest;
  digest += ':';
  digest += toString(language);
  return digest;
}

// ========== Construction ==========

AuditEngine::AuditEngine(const AuditConfig& config, std::unique_ptr<Detector> detector)
  : config_(config),
    parser_(ParserLimits{config.max_input_size, config.max_lines, config.strip_comments}),
    detector_(std::move(detector)),
    arena_(config.parse_cache_max_entries) {}

auto AuditEngine::create(const AuditConfig& config, Status* status) -> std::unique_ptr<AuditEngine> {
  return create(config, defaultCatalog(), status);
}

auto AuditEngine::create(const AuditConfig& config, std::vector<PatternSpec> catalog,
                         Status* status) -> std::unique_ptr<AuditEngine> {
  Status st = validateConfig(config, catalog);
  if (!st.ok()) {
    LOG_ERROR("AuditEngine: invalid config: %s", st.message.c_str());
    if (status) *status = std::move(st);
    return nullptr;
  }

  auto detector = Detector::create(std::move(catalog), config.confidence, &st);
  if (!detector) {
    if (status) *status = std::move(st);
    return nullptr;
  }

  LOG_INFO("AuditEngine: ready, %zu patterns, threshold=%s, workers=%u, parse_cache=%s (max %zu)",
           detector->patterns().size(), toString(config.severity_threshold),
           config.worker_threads, config.enable_parse_cache ? "on" : "off",
           config.parse_cache_max_entries);
  if (status) *status = Status::success();
  // constructor is private; make_unique cannot reach it
  return std::unique_ptr<AuditEngine>(new AuditEngine(config, std::move(detector)));
}

auto AuditEngine::validateConfig(const AuditConfig& config,
                                 const std::vector<PatternSpec>& catalog) -> Status {
  auto fail = [](std::string message) { return Status::error(ErrorKind::CONFIG_ERROR, std::move(message)); };
  auto known = [&catalog](const std::string& id) {
    return std::any_of(catalog.begin(), catalog.end(), [&id](const PatternSpec& p) { return p.id == id; });
  };

  for (const auto& id : config.include_patterns) {
    if (contains(config.exclude_patterns, id)) return fail("pattern " + id + " is both included and excluded");
    if (!known(id)) return fail("unknown pattern id in include list: " + id);
  }
  for (const auto& id : config.exclude_patterns) {
    if (!known(id)) return fail("unknown pattern id in exclude list: " + id);
  }

  if (config.max_input_size == 0) return fail("max_input_size must be positive");
  if (config.max_lines == 0) return fail("max_lines must be positive");
  if (!inUnitRange(config.min_confidence)) return fail("min_confidence must be in [0, 1]");

  const ConfidenceWeights& w = config.confidence;
  const std::pair<const char*, double> weights[] = {
    {"textual_base", w.textual_base},
    {"structural_base", w.structural_base},
    {"import_corroborated_base", w.import_corroborated_base},
    {"crypto_function_boost", w.crypto_function_boost},
    {"import_boost", w.import_boost},
    {"label_string_penalty", w.label_string_penalty}};
  for (const auto& [name, value] : weights) {
    if (!inUnitRange(value)) return fail(std::string("confidence weight ") + name + " must be in [0, 1]");
  }

  if (config.parse_cache_max_entries == 0) return fail("parse_cache_max_entries must be positive");

  if (config.worker_threads > MAX_WORKER_THREADS) {
    return fail("worker_threads must be at most " + std::to_string(MAX_WORKER_THREADS));
  }
  return Status::success();
}

// ========== Validation ==========

auto AuditEngine::validatePath(std::string_view path) -> Status {
  if (path.empty()) return Status::error(ErrorKind::INVALID_INPUT, "empty path");
  if (path.size() > MAX_PATH_LENGTH) return Status::error(ErrorKind::INVALID_INPUT, "path too long");
  if (path.find('\0') != std::string_view::npos) {
    return Status::error(ErrorKind::INVALID_INPUT, "path contains NUL byte");
  }

  size_t begin = 0;
  while (begin <= path.size()) {
    size_t end = path.find_first_of("/\\", begin);
    if (end == std::string_view::npos) end = path.size();
    if (path.substr(begin, end - begin) == "..") {
      return Status::error(ErrorKind::INVALID_INPUT, "path traversal component '..'");
    }
    begin = end + 1;
  }
  return Status::success();
}

auto AuditEngine::validateInput(std::string_view content, std::string_view path) const -> Status {
  Status st = validatePath(path);
  if (!st.ok()) return st;
  if (content.size() > config_.max_input_size) {
    return Status::error(ErrorKind::INVALID_INPUT,
                         "input of " + std::to_string(content.size()) + " bytes exceeds max_input_size " +
                         std::to_string(config_.max_input_size));
  }
  return Status::success();
}

// ========== Pipeline ==========

auto AuditEngine::parseCached(std::string_view content, std::string_view path) const
  -> std::shared_ptr<const ParsedFile> {
  std::string key;
  if (config_.enable_parse_cache) {
    key = ParseArena::makeKey(content, Parser::resolveLanguage(path));
    if (!key.empty()) {
      if (auto hit = arena_.find(key)) return hit;
    }
  }

  auto parsed = std::make_shared<ParsedFile>();
  if (parser_.parse(content, path, *parsed) != ParseResult::OK) return nullptr;
  if (key.empty()) return parsed;
  return arena_.insert(key, std::move(parsed));
}

auto AuditEngine::runUnit(std::string_view content, std::string_view path) const -> UnitResult {
  UnitResult unit;
  try {
    const auto parsed = parseCached(content, path);
    if (!parsed) {
      unit.status = Status::error(ErrorKind::INVALID_INPUT,
                                  "input exceeds max_lines " + std::to_string(config_.max_lines));
      return unit;
    }
    DetectStats stats;
    unit.detections = detector_->detect(*parsed, &stats);
    unit.lines = parsed->lines.size();
    unit.degraded = parsed->degraded;
    unit.skipped = stats.skipped;
  } catch (const std::exception& e) {
    LOG_ERROR("AuditEngine: pipeline failed on %.*s: %s", static_cast<int>(path.size()), path.data(), e.what());
    unit = UnitResult{};
    unit.status = Status::error(ErrorKind::INTERNAL_ERROR, e.what());
  }
  return unit;
}

void AuditEngine::materialize(const UnitResult& unit, const std::string& path,
                              std::vector<Finding>& out) const {
  // one finding per (line, algorithm); the most severe, then most confident, wins
  std::map<std::pair<uint32_t, std::string_view>, size_t> by_algorithm;

  for (const Detection& d : unit.detections) {
    if (!config_.include_patterns.empty() && !contains(config_.include_patterns, d.pattern_id)) continue;
    if (contains(config_.exclude_patterns, d.pattern_id)) continue;
    if (!meetsThreshold(d.severity, config_.severity_threshold)) continue;
    if (d.confidence < config_.min_confidence) continue;

    const PatternSpec* spec = detector_->findPattern(d.pattern_id);
    if (spec == nullptr) throw std::logic_error("detection for unknown pattern " + d.pattern_id);

    Finding f;
    f.id = makeFindingId(d.pattern_id, path, d.location.line, d.location.column);
    f.pattern_id = d.pattern_id;
    f.severity = d.severity;
    f.family = spec->family;
    f.location = d.location;
    f.location.path = path;
    f.description = spec->description;
    f.recommendation = spec->recommendation;
    f.confidence = d.confidence;
    f.quantum_vulnerable = spec->quantum_vulnerable;
    f.key_size = d.key_size;
    if (f.key_size != 0 && f.key_size < 2048) {
      f.description += " (" + std::to_string(f.key_size) + "-bit key)";
    }

    const std::string_view algorithm = spec->algorithm.empty() ? std::string_view(spec->id)
                                                               : std::string_view(spec->algorithm);
    const auto [it, inserted] = by_algorithm.emplace(std::make_pair(d.location.line, algorithm), out.size());
    if (inserted) {
      out.push_back(std::move(f));
      continue;
    }
    Finding& kept = out[it->second];
    if (severityWeight(f.severity) > severityWeight(kept.severity) ||
        (f.severity == kept.severity && f.confidence > kept.confidence)) {
      LOG_DEBUG("AuditEngine: %s supersedes %s at %s:%u", f.pattern_id.c_str(), kept.pattern_id.c_str(),
                path.c_str(), f.location.line);
      kept = std::move(f);
    }
  }
}

void AuditEngine::finalize(AuditReport& report, uint64_t total_lines) const {
  std::sort(report.findings.begin(), report.findings.end(), findingOrder);

  report.risk_score = computeRiskScore(report.findings, total_lines);

  ReportSummary& summary = report.summary;
  summary.lines_scanned = total_lines;
  summary.total_findings = static_cast<uint32_t>(report.findings.size());

  bool present[PRIMITIVE_FAMILY_COUNT] = {};
  std::set<uint32_t> weak_keys;
  for (const Finding& f : report.findings) {
    present[static_cast<size_t>(f.family)] = true;
    if (f.family == PrimitiveFamily::INTEGER_FACTORIZATION_PK && f.key_size != 0 && f.key_size < 2048) {
      weak_keys.insert(f.key_size);
    }
  }
  for (size_t i = 0; i < PRIMITIVE_FAMILY_COUNT; ++i) {
    if (!present[i]) continue;
    const auto family = static_cast<PrimitiveFamily>(i);
    if (isQuantumVulnerableFamily(family)) summary.quantum_vulnerable_families.push_back(family);
    else if (isDeprecatedFamily(family)) summary.deprecated_families.push_back(family);
  }
  for (const uint32_t bits : weak_keys) {
    summary.weak_key_sizes.push_back("RSA " + std::to_string(bits) + "-bit");
  }

  // ---- Recommendations ----
  if (report.risk_score.critical_count > 0) summary.recommendations.emplace_back(REC_CRITICAL);
  if (report.risk_score.high_count > 0) summary.recommendations.emplace_back(REC_HIGH);
  if (present[static_cast<size_t>(PrimitiveFamily::INTEGER_FACTORIZATION_PK)]) {
    summary.recommendations.emplace_back(REC_RSA);
  }
  if (present[static_cast<size_t>(PrimitiveFamily::ELLIPTIC_CURVE_PK)]) {
    summary.recommendations.emplace_back(REC_EC);
  }
  if (present[static_cast<size_t>(PrimitiveFamily::KEY_EXCHANGE)]) {
    summary.recommendations.emplace_back(REC_DH);
  }
  if (!report.findings.empty()) summary.recommendations.emplace_back(REC_NIST);

  report.metadata.tool_version = config_.tool_version;
  report.metadata.timestamp = config_.report_timestamp;
}

// ========== Entry points ==========

auto AuditEngine::auditOne(std::string_view content, std::string_view path_or_language,
                           AuditReport& report) const -> Status {
  report = AuditReport{};

  Status st = validateInput(content, path_or_language);
  if (!st.ok()) {
    LOG_WARN("AuditEngine: rejected input: %s", st.message.c_str());
    return st;
  }

  const UnitResult unit = runUnit(content, path_or_language);
  if (!unit.status.ok()) return unit.status;

  try {
    materialize(unit, std::string(path_or_language), report.findings);
    report.summary.files_scanned = 1;
    report.metadata.degraded_files = unit.degraded ? 1 : 0;
    report.metadata.skipped_detections = unit.skipped;
    finalize(report, unit.lines);
  } catch (const std::exception& e) {
    LOG_ERROR("AuditEngine: report assembly failed: %s", e.what());
    report = AuditReport{};
    return Status::error(ErrorKind::INTERNAL_ERROR, e.what());
  }

  LOG_DEBUG("AuditEngine: %.*s: %u findings, %llu lines, risk %s",
            static_cast<int>(path_or_language.size()), path_or_language.data(),
            report.summary.total_findings, static_cast<unsigned long long>(unit.lines),
            toString(report.risk_score.level));
  return Status::success();
}

auto AuditEngine::auditMany(const std::vector<SourceFile>& files, AuditReport& report) const -> Status {
  report = AuditReport{};
  constexpr size_t NO_UNIT = static_cast<size_t>(-1);

  try {
    // ---- Validate and deduplicate on the calling thread ----
    std::vector<size_t> unit_of(files.size(), NO_UNIT);
    std::vector<size_t> unit_source;   // index into files of each unit's first occurrence
    std::unordered_map<std::string, size_t> unit_by_key;

    for (size_t i = 0; i < files.size(); ++i) {
      const SourceFile& file = files[i];
      Status st = validateInput(file.content, file.path);
      if (!st.ok()) {
        LOG_WARN("AuditEngine: skipping %s: %s", file.path.c_str(), st.message.c_str());
        report.metadata.file_errors.push_back(FileError{file.path, st.kind, std::move(st.message)});
        continue;
      }

      const std::string key = ParseArena::makeKey(file.content, Parser::resolveLanguage(file.path));
      if (!key.empty()) {
        const auto it = unit_by_key.find(key);
        if (it != unit_by_key.end()) {
          unit_of[i] = it->second;
          continue;
        }
        unit_by_key.emplace(key, unit_source.size());
      }
      unit_of[i] = unit_source.size();
      unit_source.push_back(i);
    }

    // ---- Map ----
    std::vector<UnitResult> results(unit_source.size());
    size_t workers = config_.worker_threads == 0 ? std::thread::hardware_concurrency()
                                                 : config_.worker_threads;
    workers = std::clamp<size_t>(workers, 1, std::max<size_t>(1, unit_source.size()));

    if (workers == 1) {
      for (size_t u = 0; u < unit_source.size(); ++u) {
        const SourceFile& file = files[unit_source[u]];
        results[u] = runUnit(file.content, file.path);
      }
    } else {
      Common::ThreadPool pool(workers, config_.numa_node);
      std::vector<std::future<UnitResult>> futures;
      futures.reserve(unit_source.size());
      for (const size_t source : unit_source) {
        const SourceFile* file = &files[source];
        futures.push_back(pool.enqueue([this, file] { return runUnit(file->content, file->path); }));
      }
      for (size_t u = 0; u < futures.size(); ++u) {
        try {
          results[u] = futures[u].get();
        } catch (const std::exception& e) {
          results[u] = UnitResult{};
          results[u].status = Status::error(ErrorKind::INTERNAL_ERROR, e.what());
        }
      }
    }

    // ---- Reduce in input order ----
    uint64_t total_lines = 0;
    for (size_t i = 0; i < files.size(); ++i) {
      if (unit_of[i] == NO_UNIT) continue;
      const UnitResult& unit = results[unit_of[i]];
      if (!unit.status.ok()) {
        LOG_WARN("AuditEngine: %s could not be analyzed: %s", files[i].path.c_str(), unit.status.message.c_str());
        report.metadata.file_errors.push_back(FileError{files[i].path, unit.status.kind, unit.status.message});
        continue;
      }
      materialize(unit, files[i].path, report.findings);
      ++report.summary.files_scanned;
      total_lines += unit.lines;
      if (unit.degraded) ++report.metadata.degraded_files;
      report.metadata.skipped_detections += unit.skipped;
    }

    finalize(report, total_lines);

    LOG_DEBUG("AuditEngine: batch of %zu files (%zu distinct): %u findings, %zu errors, risk %s",
              files.size(), unit_source.size(), report.summary.total_findings,
              report.metadata.file_errors.size(), toString(report.risk_score.level));
  } catch (const std::exception& e) {
    LOG_ERROR("AuditEngine: batch audit failed: %s", e.what());
    report = AuditReport{};
    return Status::error(ErrorKind::INTERNAL_ERROR, e.what());
  }
  return Status::success();
}

// ========== Scoring ==========

auto AuditEngine::riskLevelFor(double normalized) noexcept -> RiskLevel {
  if (normalized > 8.0) return RiskLevel::CATASTROPHIC;
  if (normalized >= 5.0) return RiskLevel::HIGH;
  if (normalized >= 2.0) return RiskLevel::MEDIUM;
  return RiskLevel::LOW;
}

auto AuditEngine::computeRiskScore(const std::vector<Finding>& findings,
                                   uint64_t total_lines) noexcept -> RiskScore {
  RiskScore score;
  for (const Finding& f : findings) {
    score.total += severityWeight(f.severity) * f.confidence;
    switch (f.severity) {
      case Severity::CRITICAL: ++score.critical_count; break;
      case Severity::HIGH:     ++score.high_count; break;
      case Severity::MEDIUM:   ++score.medium_count; break;
      case Severity::LOW:      ++score.low_count; break;
      case Severity::INFO:     ++score.info_count; break;
    }
  }
  const double per_thousand = std::max(1.0, static_cast<double>(total_lines) / 1000.0);
  score.normalized = score.total / per_thousand;
  score.level = riskLevelFor(score.normalized);
  return score;
}

auto AuditEngine::makeFindingId(std::string_view pattern_id, std::string_view path,
                                uint32_t line, uint32_t column) -> std::string {
  std::string material;
  material.reserve(pattern_id.size() + path.size() + 24);
  material.append(pattern_id).append("|").append(path).append("|");
  material.append(std::to_string(line)).append("|").append(std::to_string(column));

  const std::string digest = Common::sha256Hex(material);
  if (digest.size() < 16) throw std::runtime_error("SHA-256 digest unavailable");
  return "F-" + digest.substr(0, 16);
}

// ========== Free functions ==========

auto auditOne(std::string_view content, std::string_view path_or_language,
              const AuditConfig& config, AuditReport& report) -> Status {
  Status status;
  const auto engine = AuditEngine::create(config, &status);
  if (!engine) {
    report = AuditReport{};
    return status;
  }
  return engine->auditOne(content, path_or_language, report);
}

auto auditMany(const std::vector<SourceFile>& files, const AuditConfig& config,
               AuditReport& report) -> Status {
  Status status;
  const auto engine = AuditEngine::create(config, &status);
  if (!engine) {
    report = AuditReport{};
    return status;
  }
  return engine->auditMany(files, report);
}

} // namespace CryptoAudit
