#include "scanner/matcher.h"

#include <cctype>

namespace CryptoAudit {

namespace {

inline auto isAlnum(char c) noexcept -> bool { return std::isalnum(static_cast<unsigned char>(c)) != 0; }
inline auto isAlpha(char c) noexcept -> bool { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
inline auto isUpper(char c) noexcept -> bool { return std::isupper(static_cast<unsigned char>(c)) != 0; }
inline auto isLower(char c) noexcept -> bool { return std::islower(static_cast<unsigned char>(c)) != 0; }
inline auto isDigit(char c) noexcept -> bool { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

auto lowerAll(const std::vector<std::string>& in, std::vector<std::string>& out,
              const char* what, std::string& error) -> bool {
  if (in.empty()) {
    error = std::string("no ") + what;
    return false;
  }
  out.clear();
  out.reserve(in.size());
  for (const auto& item : in) {
    if (item.empty()) {
      error = std::string("empty entry in ") + what;
      return false;
    }
    out.push_back(asciiLower(item));
  }
  return true;
}

} // namespace

auto asciiLower(std::string_view text) -> std::string {
  std::string out(text);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

auto isTokenBoundary(std::string_view text, size_t begin, size_t end) noexcept -> bool {
  if (begin >= end || end > text.size()) return false;

  if (begin > 0 && isAlnum(text[begin])) {
    const char prev = text[begin - 1];
    const bool camel_step = isLower(prev) && isUpper(text[begin]);
    if (isAlnum(prev) && !camel_step) return false;
  }

  if (end < text.size() && isAlnum(text[end - 1])) {
    const char next = text[end];
    if (isAlpha(next)) {
      const char last = text[end - 1];
      const bool digit_to_letter = isDigit(last);
      const bool camel_step = isUpper(next) &&
                              (isLower(last) || (end + 1 < text.size() && isLower(text[end + 1])));
      if (!digit_to_letter && !camel_step) return false;
    }
  }
  return true;
}

auto matcherKind(const MatcherSpec& spec) noexcept -> MatcherKind {
  switch (spec.index()) {
    case 1:  return MatcherKind::CALL_SHAPE;
    case 2:  return MatcherKind::IMPORT_CORROBORATED;
    default: return MatcherKind::TEXTUAL;
  }
}

auto toString(MatcherKind kind) noexcept -> const char* {
  switch (kind) {
    case MatcherKind::TEXTUAL:             return "textual";
    case MatcherKind::CALL_SHAPE:          return "call-shape";
    case MatcherKind::IMPORT_CORROBORATED: return "import-corroborated";
  }
  return "unknown";
}

// ========== Compilation ==========

auto CompiledMatcher::compile(const MatcherSpec& spec, CompiledMatcher& out,
                              std::string& error) -> bool {
  out.kind_ = matcherKind(spec);

  if (const auto* textual = std::get_if<TextualSpec>(&spec)) {
    TokenSet set;
    if (!lowerAll(textual->tokens, set.tokens, "tokens", error)) return false;
    out.impl_ = std::move(set);
    return true;
  }

  if (const auto* shape = std::get_if<CallShapeSpec>(&spec)) {
    NfaMatcher nfa(shape->expression, shape->case_insensitive);
    if (!nfa.valid()) {
      error = "expression '" + shape->expression + "': " + nfa.error();
      return false;
    }
    out.impl_ = std::move(nfa);
    return true;
  }

  const auto& gated_spec = std::get<ImportCorroboratedSpec>(spec);
  GatedTokenSet gated;
  if (!lowerAll(gated_spec.tokens, gated.tokens.tokens, "tokens", error)) return false;
  if (!lowerAll(gated_spec.required_imports, gated.imports, "required imports", error)) return false;
  out.impl_ = std::move(gated);
  return true;
}

// ========== Matching ==========

auto CompiledMatcher::findToken(const TokenSet& set, const LineView& line,
                                MatchSpan& span) noexcept -> bool {
  bool found = false;
  size_t best_begin = 0;
  size_t best_end = 0;
  for (const auto& token : set.tokens) {
    size_t pos = line.lowered.find(token);
    while (pos != std::string_view::npos) {
      if (found && pos > best_begin) break;
      const size_t end = pos + token.size();
      if (isTokenBoundary(line.text, pos, end)) {
        if (!found || pos < best_begin || (pos == best_begin && end > best_end)) {
          found = true;
          best_begin = pos;
          best_end = end;
        }
        break;
      }
      pos = line.lowered.find(token, pos + 1);
    }
  }
  if (found) {
    span.begin = static_cast<uint32_t>(best_begin);
    span.end = static_cast<uint32_t>(best_end);
  }
  return found;
}

auto CompiledMatcher::find(const LineView& line, const std::vector<std::string>& lowered_imports,
                           MatchSpan& span) const noexcept -> MatchOutcome {
  if (line.text.size() != line.lowered.size()) return MatchOutcome::FAILED;

  switch (impl_.index()) {
    case 0:
      return findToken(std::get<0>(impl_), line, span) ? MatchOutcome::MATCH : MatchOutcome::NO_MATCH;
    case 1: {
      const NfaMatcher& nfa = std::get<1>(impl_);
      if (!nfa.valid()) return MatchOutcome::FAILED;
      return nfa.find(line.text, span) ? MatchOutcome::MATCH : MatchOutcome::NO_MATCH;
    }
    case 2: {
      const GatedTokenSet& gated = std::get<2>(impl_);
      bool corroborated = false;
      for (const auto& module : lowered_imports) {
        for (const auto& required : gated.imports) {
          if (module.find(required) != std::string::npos) {
            corroborated = true;
            break;
          }
        }
        if (corroborated) break;
      }
      if (!corroborated) return MatchOutcome::NO_MATCH;
      return findToken(gated.tokens, line, span) ? MatchOutcome::MATCH : MatchOutcome::NO_MATCH;
    }
    default:
      return MatchOutcome::FAILED;
  }
}

} // namespace CryptoAudit
