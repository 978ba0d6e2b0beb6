#include "scanner/detector.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <unordered_set>

#include "common/logging.h"
#include "common/macros.h"

namespace CryptoAudit {

namespace {

constexpr size_t MAX_SNIPPET_BYTES = 160;

constexpr uint32_t KNOWN_MODULUS_SIZES[] = {512, 768, 1024, 1536, 2048, 3072, 4096, 8192};

inline auto isIdentChar(char c) noexcept -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

/// Trimmed line, cut on a UTF-8 boundary
auto makeSnippet(std::string_view text) -> std::string {
  size_t b = 0;
  size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  if (e - b > MAX_SNIPPET_BYTES) {
    e = b + MAX_SNIPPET_BYTES;
    while (e > b && (static_cast<unsigned char>(text[e]) & 0xC0) == 0x80) --e;
  }
  return std::string(text.substr(b, e - b));
}

/// Output-only call on this line (print/log); string matches there are labels
auto isOutputLine(std::string_view lowered) noexcept -> bool {
  static constexpr const char* OUTPUT_CALLS[] = {
    "print(", "println", "printf", "console.", "fmt.print", "system.out", "system.err",
    "echo ", "log_", "logger.", "log.", "logging.", "puts("};
  for (const char* call : OUTPUT_CALLS) {
    const std::string_view needle(call);
    size_t pos = lowered.find(needle);
    while (pos != std::string_view::npos) {
      if (pos == 0 || !isIdentChar(lowered[pos - 1])) return true;
      pos = lowered.find(needle, pos + 1);
    }
  }
  return false;
}

/// Match sits inside a string literal that reads as human text: it contains
/// whitespace or is an argument of an output call
auto inLabelString(const Line& line, std::string_view text, const MatchSpan& span,
                   bool output_line) noexcept -> bool {
  for (const auto& s : line.strings) {
    if (span.begin >= s.begin && span.end <= s.end && s.end <= text.size()) {
      if (output_line) return true;
      const std::string_view literal = text.substr(s.begin, s.end - s.begin);
      return literal.find(' ') != std::string_view::npos;
    }
  }
  return false;
}

} // namespace

struct Detector::LineContext {
  const Line* line{nullptr};
  LineView view;
  const std::vector<std::string>* lowered_imports{nullptr};
  const std::string* path{nullptr};
  bool in_crypto_function{false};
  bool output_line{false};
};

// ========== Construction ==========

auto Detector::create(std::vector<PatternSpec> patterns, const ConfidenceWeights& weights,
                      Status* status) -> std::unique_ptr<Detector> {
  auto fail = [status](std::string message) -> std::unique_ptr<Detector> {
    LOG_ERROR("Detector: %s", message.c_str());
    if (status) *status = Status::error(ErrorKind::CONFIG_ERROR, std::move(message));
    return nullptr;
  };

  // constructor is private; make_unique cannot reach it
  std::unique_ptr<Detector> detector(new Detector());
  detector->matchers_.reserve(patterns.size());

  std::unordered_set<std::string> ids;
  for (auto& spec : patterns) {
    if (spec.id.empty()) return fail("pattern with empty id");
    if (!ids.insert(spec.id).second) return fail("duplicate pattern id " + spec.id);

    CompiledMatcher compiled;
    std::string error;
    if (!CompiledMatcher::compile(spec.matcher, compiled, error)) {
      return fail("pattern " + spec.id + ": " + error);
    }
    detector->matchers_.push_back(std::move(compiled));
    for (auto& hint : spec.corroborating_imports) hint = asciiLower(hint);
  }

  detector->patterns_ = std::move(patterns);
  detector->weights_ = weights;
  LOG_DEBUG("Detector: compiled %zu patterns", detector->patterns_.size());
  if (status) *status = Status::success();
  return detector;
}

auto Detector::findPattern(std::string_view id) const noexcept -> const PatternSpec* {
  for (const auto& spec : patterns_) {
    if (spec.id == id) return &spec;
  }
  return nullptr;
}

// ========== Scoring helpers ==========

auto Detector::computeConfidence(const ConfidenceWeights& weights, MatcherKind kind,
                                 bool in_crypto_function, bool import_corroborated,
                                 bool label_string) noexcept -> double {
  double base = weights.textual_base;
  switch (kind) {
    case MatcherKind::TEXTUAL:             base = weights.textual_base; break;
    case MatcherKind::CALL_SHAPE:          base = weights.structural_base; break;
    case MatcherKind::IMPORT_CORROBORATED: base = weights.import_corroborated_base; break;
  }

  double multiplier = 1.0;
  if (in_crypto_function) multiplier += weights.crypto_function_boost;
  if (import_corroborated) multiplier += weights.import_boost;
  if (label_string) multiplier -= weights.label_string_penalty;
  multiplier = std::max(0.0, multiplier);

  return std::clamp(base * multiplier, 0.0, 1.0);
}

auto Detector::extractKeySize(std::string_view text, size_t from) noexcept -> uint32_t {
  size_t i = from;
  while (i < text.size()) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      ++i;
      continue;
    }
    const size_t begin = i;
    uint64_t value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
      if (value < 100000) value = value * 10 + static_cast<uint64_t>(text[i] - '0');
      ++i;
    }
    if (i - begin > 4) continue;
    for (const uint32_t size : KNOWN_MODULUS_SIZES) {
      if (value == size) return size;
    }
  }
  return 0;
}

auto Detector::isCryptoFunctionName(std::string_view name) noexcept -> bool {
  // whole identifier words; "monkey", "design" and "assignment" do not count
  static constexpr std::string_view WORDS[] = {
    "sign", "signs", "signed", "signer", "signing", "signature", "signatures",
    "verify", "verifier", "verification", "key", "keys", "keypair", "keygen", "keystore",
    "hash", "hashes", "hashed", "hasher", "hashing", "digest", "digests",
    "cipher", "ciphers", "rsa", "dsa", "ecdsa", "ecdh", "ecc", "hmac", "tls", "ssl",
    "cert", "certs", "certificate", "certificates", "kex", "exchange"};

  auto isWord = [](std::string_view word) {
    if (word.find("crypt") != std::string_view::npos) return true;  // encrypt, decrypt, crypto
    for (const std::string_view w : WORDS) {
      if (word == w) return true;
    }
    return false;
  };
  auto isUpper = [](char c) { return std::isupper(static_cast<unsigned char>(c)) != 0; };
  auto isLower = [](char c) { return std::islower(static_cast<unsigned char>(c)) != 0; };

  // split on non-letters and camelCase steps (fooBar, RSAKey)
  char word[64];
  size_t len = 0;
  bool overflow = false;
  for (size_t i = 0; i <= name.size(); ++i) {
    const char c = i < name.size() ? name[i] : '\0';
    const bool letter = std::isalpha(static_cast<unsigned char>(c)) != 0;
    const bool step = letter && i > 0 && isUpper(c) &&
                      (isLower(name[i - 1]) ||
                       (isUpper(name[i - 1]) && i + 1 < name.size() && isLower(name[i + 1])));
    if ((!letter || step) && len > 0) {
      if (!overflow && isWord(std::string_view(word, len))) return true;
      len = 0;
      overflow = false;
    }
    if (!letter) continue;
    if (len < sizeof(word)) word[len++] = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    else overflow = true;
  }
  return false;
}

// ========== Detection ==========

auto Detector::evaluate(size_t pattern_idx, const LineContext& ctx, Detection& out) const -> MatchOutcome {
  const PatternSpec& spec = patterns_[pattern_idx];
  const CompiledMatcher& matcher = matchers_[pattern_idx];

  MatchSpan span;
  const MatchOutcome outcome = matcher.find(ctx.view, *ctx.lowered_imports, span);
  if (outcome != MatchOutcome::MATCH) return outcome;

  bool corroborated = false;
  for (const auto& module : *ctx.lowered_imports) {
    for (const auto& hint : spec.corroborating_imports) {
      if (module.find(hint) != std::string::npos) {
        corroborated = true;
        break;
      }
    }
    if (corroborated) break;
  }

  const bool label = inLabelString(*ctx.line, ctx.view.text, span, ctx.output_line);

  out.pattern_id = spec.id;
  out.location.path = *ctx.path;
  out.location.line = ctx.line->number;
  out.location.column = span.begin + 1;
  out.location.snippet = makeSnippet(ctx.line->text);
  out.confidence = computeConfidence(weights_, matcher.kind(), ctx.in_crypto_function, corroborated, label);
  out.key_size = spec.extracts_key_size ? extractKeySize(ctx.view.text, span.end) : 0;
  out.severity = escalateForKeySize(spec.severity, out.key_size);
  return MatchOutcome::MATCH;
}

auto Detector::detect(const ParsedFile& file, DetectStats* stats) const -> std::vector<Detection> {
  std::vector<Detection> detections;
  DetectStats local;

  std::vector<std::string> lowered_imports;
  lowered_imports.reserve(file.imports.size());
  for (const auto& imp : file.imports) {
    lowered_imports.push_back(asciiLower(imp.module));
  }
  std::vector<char> warned(patterns_.size(), 0);

  size_t fn_idx = 0;
  for (const Line& line : file.lines) {
    if (file.comments_stripped && line.is_comment) continue;
    const std::string& text = file.comments_stripped ? line.code : line.text;
    if (text.empty()) continue;
    ++local.lines_scanned;

    // functions are ordered and non-overlapping; advance with the line
    while (fn_idx < file.functions.size() && file.functions[fn_idx].end_line < line.number) ++fn_idx;
    const bool in_function = fn_idx < file.functions.size() &&
                             file.functions[fn_idx].start_line <= line.number;

    const std::string lowered = asciiLower(text);
    LineContext ctx;
    ctx.line = &line;
    ctx.view = LineView{text, lowered};
    ctx.lowered_imports = &lowered_imports;
    ctx.path = &file.path;
    ctx.in_crypto_function = in_function && isCryptoFunctionName(file.functions[fn_idx].name);
    ctx.output_line = isOutputLine(lowered);

    for (size_t p = 0; p < patterns_.size(); ++p) {
      MatchOutcome outcome = MatchOutcome::FAILED;
      Detection detection;
      try {
        outcome = evaluate(p, ctx, detection);
      } catch (const std::exception& e) {
        outcome = MatchOutcome::FAILED;
        if (!warned[p]) {
          warned[p] = 1;
          LOG_WARN("Detector: pattern %s threw on %s:%u: %s", patterns_[p].id.c_str(),
                   file.path.c_str(), line.number, e.what());
        }
      }

      if (UNLIKELY(outcome == MatchOutcome::FAILED)) {
        ++local.skipped;
        if (!warned[p]) {
          warned[p] = 1;
          LOG_WARN("Detector: skipped pattern %s on %s:%u", patterns_[p].id.c_str(),
                   file.path.c_str(), line.number);
        }
        continue;
      }
      if (outcome == MatchOutcome::MATCH) detections.push_back(std::move(detection));
    }
  }

  std::stable_sort(detections.begin(), detections.end(), [](const Detection& a, const Detection& b) {
    if (a.location.line != b.location.line) return a.location.line < b.location.line;
    return a.location.column < b.location.column;
  });

  if (stats) *stats = local;
  return detections;
}

} // namespace CryptoAudit
