#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "scanner/types.h"

namespace CryptoAudit {

enum class ParseResult : uint8_t {
  OK = 0,
  INPUT_TOO_LARGE = 1   // over max_input_size bytes or max_lines lines
};

struct ParserLimits {
  size_t max_input_size{10 * 1024 * 1024};
  size_t max_lines{500'000};
  bool strip_comments{true};
};

/// Turns raw source bytes into a line-indexed, comment-aware ParsedFile.
///
/// Never fails on content: malformed UTF-8 is decoded lossily (each invalid
/// byte becomes U+FFFD) and the file is marked degraded. Only the size limits
/// reject input. Stateless and safe to share across threads.
class Parser {
public:
  explicit Parser(const ParserLimits& limits = ParserLimits{}) noexcept : limits_(limits) {}

  /// path_or_language is either a language alias ("python", "rs", "c++") or
  /// a path whose extension selects the language
  [[nodiscard]] auto parse(std::string_view content, std::string_view path_or_language,
                           ParsedFile& out) const -> ParseResult;

  [[nodiscard]] auto limits() const noexcept -> const ParserLimits& { return limits_; }

  /// Alias first, then extension, else UNKNOWN
  [[nodiscard]] static auto resolveLanguage(std::string_view path_or_language) noexcept -> Language;

  /// Case-insensitive language alias lookup
  [[nodiscard]] static auto languageFromAlias(std::string_view alias, Language& out) noexcept -> bool;

  [[nodiscard]] static auto languageFromExtension(std::string_view path) noexcept -> Language;

  /// Copies bytes into out, replacing each invalid UTF-8 byte with U+FFFD.
  /// Returns true when the input was already valid.
  static auto decodeLossy(std::string_view bytes, std::string& out) -> bool;

  /// Number of lines: one per '\n', plus one for a non-empty final segment
  [[nodiscard]] static auto countLines(std::string_view text) noexcept -> size_t;

private:
  ParserLimits limits_;
};

} // namespace CryptoAudit
