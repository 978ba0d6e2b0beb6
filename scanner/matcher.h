#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "scanner/nfa_matcher.h"

namespace CryptoAudit {

// ========== Matcher specifications ==========

/// Case-insensitive token search with identifier boundaries.
/// "rsa" matches `rsa.encrypt`, `RSA_sign` and `RSAPublicKey`, not `parsers`.
struct TextualSpec {
  std::vector<std::string> tokens;
};

/// Structural expression (call shapes such as `rsa.generate_private_key(`)
/// compiled to a Thompson NFA
struct CallShapeSpec {
  std::string expression;
  bool case_insensitive{true};
};

/// Token search that fires only when the file imports one of required_imports
/// (substring match on the verbatim module names, case-insensitive)
struct ImportCorroboratedSpec {
  std::vector<std::string> tokens;
  std::vector<std::string> required_imports;
};

using MatcherSpec = std::variant<TextualSpec, CallShapeSpec, ImportCorroboratedSpec>;

enum class MatcherKind : uint8_t {
  TEXTUAL = 0,
  CALL_SHAPE = 1,
  IMPORT_CORROBORATED = 2
};

[[nodiscard]] auto matcherKind(const MatcherSpec& spec) noexcept -> MatcherKind;
[[nodiscard]] auto toString(MatcherKind kind) noexcept -> const char*;

enum class MatchOutcome : uint8_t {
  NO_MATCH = 0,
  MATCH = 1,
  FAILED = 2    // matcher could not evaluate this line
};

/// One line as seen by matchers: raw bytes plus an ASCII-lowercased copy
struct LineView {
  std::string_view text;
  std::string_view lowered;
};

// ========== Compiled matcher ==========

/// Compiled form of a MatcherSpec. Immutable after compile(); find() is safe
/// to call concurrently.
class CompiledMatcher {
public:
  CompiledMatcher() = default;

  /// Validates and compiles spec. On failure returns false and fills error.
  [[nodiscard]] static auto compile(const MatcherSpec& spec, CompiledMatcher& out,
                                    std::string& error) -> bool;

  /// lowered_imports: the file's import names, ASCII-lowercased
  [[nodiscard]] auto find(const LineView& line, const std::vector<std::string>& lowered_imports,
                          MatchSpan& span) const noexcept -> MatchOutcome;

  [[nodiscard]] auto kind() const noexcept -> MatcherKind { return kind_; }

private:
  struct TokenSet {
    std::vector<std::string> tokens;  // lowercased
  };

  struct GatedTokenSet {
    TokenSet tokens;
    std::vector<std::string> imports;  // lowercased
  };

  [[nodiscard]] static auto findToken(const TokenSet& set, const LineView& line,
                                      MatchSpan& span) noexcept -> bool;

  std::variant<TokenSet, NfaMatcher, GatedTokenSet> impl_;
  MatcherKind kind_{MatcherKind::TEXTUAL};
};

// ========== Helpers ==========

/// ASCII lowercase copy
[[nodiscard]] auto asciiLower(std::string_view text) -> std::string;

/// Identifier-boundary test used by token matchers. A boundary exists before
/// `begin` when the previous byte is not alphanumeric or is a lower->Upper
/// camel-case step, and after `end` when the next byte is not a letter or
/// starts a new camel-case word.
[[nodiscard]] auto isTokenBoundary(std::string_view text, size_t begin, size_t end) noexcept -> bool;

} // namespace CryptoAudit
