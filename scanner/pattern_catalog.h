#pragma once

#include <string>
#include <vector>

#include "scanner/matcher.h"
#include "scanner/types.h"

namespace CryptoAudit {

/// Static description of one detection pattern
struct PatternSpec {
  std::string id;                 // stable identifier, e.g. "QV-RSA-KEYGEN"
  std::string name;
  /// Findings sharing an algorithm on one line collapse to the most severe;
  /// empty means the pattern id
  std::string algorithm;
  PrimitiveFamily family{PrimitiveFamily::BROKEN_HASH};
  Severity severity{Severity::INFO};
  bool quantum_vulnerable{false};
  MatcherSpec matcher;
  /// Import-name substrings that corroborate this primitive (raise confidence)
  std::vector<std::string> corroborating_imports;
  /// Key sizes after the match are extracted (RSA modulus sizes)
  bool extracts_key_size{false};
  std::string description;
  std::string recommendation;
};

/// Built-in catalog of quantum-vulnerable and classically broken primitives
[[nodiscard]] auto defaultCatalog() -> std::vector<PatternSpec>;

} // namespace CryptoAudit
