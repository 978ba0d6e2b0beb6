#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "scanner/matcher.h"
#include "scanner/pattern_catalog.h"
#include "scanner/types.h"

namespace CryptoAudit {

/// Per-call counters reported by Detector::detect
struct DetectStats {
  uint32_t lines_scanned{0};
  uint32_t skipped{0};          // pattern/line pairs whose matcher failed
};

/// Runs a compiled pattern catalog over parsed files.
///
/// Matchers are compiled once in create() and never mutated afterwards, so one
/// Detector may serve any number of threads concurrently.
class Detector {
public:
  /// Compiles every pattern. Returns nullptr and fills status (CONFIG_ERROR)
  /// when an id is empty or duplicated or a matcher is malformed.
  [[nodiscard]] static auto create(std::vector<PatternSpec> patterns,
                                   const ConfidenceWeights& weights = ConfidenceWeights{},
                                   Status* status = nullptr) -> std::unique_ptr<Detector>;

  Detector(const Detector&) = delete;
  Detector& operator=(const Detector&) = delete;

  /// Detections in file order (line, then column). A pattern reports at most
  /// one detection per line; different patterns never suppress each other.
  [[nodiscard]] auto detect(const ParsedFile& file, DetectStats* stats = nullptr) const
    -> std::vector<Detection>;

  [[nodiscard]] auto patterns() const noexcept -> const std::vector<PatternSpec>& { return patterns_; }
  [[nodiscard]] auto weights() const noexcept -> const ConfidenceWeights& { return weights_; }

  /// Pattern by id, nullptr when unknown
  [[nodiscard]] auto findPattern(std::string_view id) const noexcept -> const PatternSpec*;

  /// base * max(0, 1 + boosts - penalty), clamped to [0, 1]
  [[nodiscard]] static auto computeConfidence(const ConfidenceWeights& weights, MatcherKind kind,
                                              bool in_crypto_function, bool import_corroborated,
                                              bool label_string) noexcept -> double;

  /// First RSA modulus size (512..8192) appearing in text at or after from; 0 if none
  [[nodiscard]] static auto extractKeySize(std::string_view text, size_t from) noexcept -> uint32_t;

  /// True when a function name suggests a cryptographic purpose
  [[nodiscard]] static auto isCryptoFunctionName(std::string_view name) noexcept -> bool;

private:
  Detector() = default;

  struct LineContext;

  auto evaluate(size_t pattern_idx, const LineContext& ctx, Detection& out) const -> MatchOutcome;

  std::vector<PatternSpec> patterns_;
  std::vector<CompiledMatcher> matchers_;
  ConfidenceWeights weights_;
};

/// Weak (sub-2048) keys escalate HIGH to CRITICAL
[[nodiscard]] constexpr auto escalateForKeySize(Severity severity, uint32_t key_size) noexcept -> Severity {
  if (key_size != 0 && key_size < 2048 && severity == Severity::HIGH) return Severity::CRITICAL;
  return severity;
}

} // namespace CryptoAudit
