#include "scanner/parser.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

#include "common/macros.h"

namespace CryptoAudit {

namespace {

constexpr size_t NPOS = std::string_view::npos;

// ========== Character helpers ==========

inline auto isSpace(char c) noexcept -> bool {
  return c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

inline auto isIdentChar(char c) noexcept -> bool {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

inline auto lowerChar(char c) noexcept -> char {
  return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

auto trim(std::string_view s) noexcept -> std::string_view {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && isSpace(s[b])) ++b;
  while (e > b && isSpace(s[e - 1])) --e;
  return s.substr(b, e - b);
}

auto startsWith(std::string_view s, std::string_view prefix) noexcept -> bool {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

auto endsWith(std::string_view s, std::string_view suffix) noexcept -> bool {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (lowerChar(a[i]) != lowerChar(b[i])) return false;
  }
  return true;
}

/// Keyword at pos with identifier boundaries on both sides
auto wordAt(std::string_view s, size_t pos, std::string_view word) noexcept -> bool {
  if (s.compare(pos, word.size(), word) != 0) return false;
  if (pos > 0 && isIdentChar(s[pos - 1])) return false;
  const size_t end = pos + word.size();
  return end >= s.size() || !isIdentChar(s[end]);
}

auto findWord(std::string_view s, std::string_view word, size_t from = 0) noexcept -> size_t {
  size_t pos = s.find(word, from);
  while (pos != NPOS) {
    if (wordAt(s, pos, word)) return pos;
    pos = s.find(word, pos + 1);
  }
  return NPOS;
}

auto skipSpaces(std::string_view s, size_t pos) noexcept -> size_t {
  while (pos < s.size() && isSpace(s[pos])) ++pos;
  return pos;
}

auto readIdentifier(std::string_view s, size_t pos) noexcept -> std::string_view {
  const size_t begin = pos;
  while (pos < s.size() && isIdentChar(s[pos])) ++pos;
  return s.substr(begin, pos - begin);
}

/// Reads a quoted literal starting at the first non-space byte from pos
auto readQuoted(std::string_view s, size_t pos, std::string& out) -> bool {
  pos = skipSpaces(s, pos);
  if (pos >= s.size()) return false;
  const char q = s[pos];
  if (q != '"' && q != '\'' && q != '`') return false;
  const size_t close = s.find(q, pos + 1);
  if (close == NPOS || close == pos + 1) return false;
  out.assign(s.substr(pos + 1, close - pos - 1));
  return true;
}

inline auto utf8SeqLen(unsigned char lead) noexcept -> size_t {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

// ========== Lexical syntax ==========

struct LexSyntax {
  const char* line_comment{nullptr};
  bool block_comments{false};     // /* ... */
  bool triple_quotes{false};      // Python """ and '''
  bool text_blocks{false};        // Java """
  bool single_quote_strings{false};
  bool backtick_strings{false};
  bool backtick_escapes{false};
  bool template_substitutions{false};  // ${ ... } inside backtick strings
  bool raw_strings{false};        // C++ R"d( ... )d" and Rust r#" ... "#
  bool char_literals{false};      // 'x' is a char/rune literal, otherwise a lifetime or stray quote
};

auto syntaxFor(Language language) noexcept -> LexSyntax {
  LexSyntax syn;
  switch (language) {
    case Language::PYTHON:
      syn.line_comment = "#";
      syn.triple_quotes = true;
      syn.single_quote_strings = true;
      break;
    case Language::JAVASCRIPT:
    case Language::TYPESCRIPT:
      syn.line_comment = "//";
      syn.block_comments = true;
      syn.single_quote_strings = true;
      syn.backtick_strings = true;
      syn.backtick_escapes = true;
      syn.template_substitutions = true;
      break;
    case Language::GO:
      syn.line_comment = "//";
      syn.block_comments = true;
      syn.backtick_strings = true;
      syn.char_literals = true;
      break;
    case Language::JAVA:
      syn.line_comment = "//";
      syn.block_comments = true;
      syn.text_blocks = true;
      syn.char_literals = true;
      break;
    case Language::C_FAMILY:
      syn.line_comment = "//";
      syn.block_comments = true;
      syn.raw_strings = true;
      syn.char_literals = true;
      break;
    case Language::UNKNOWN:
      break;
  }
  return syn;
}

enum class LexMode : uint8_t { CODE, BLOCK_COMMENT, DOCSTRING, STRING };

struct LexState {
  LexMode mode{LexMode::CODE};
  char delim{0};
  bool triple{false};
  bool multiline{false};
  bool escapes{true};
  std::string raw_close;                  // closing sequence of an open raw string
  std::vector<uint32_t> template_braces;  // brace depth per open ${ substitution
  uint32_t bracket_depth{0};              // open ( [ { in code, Python only
  bool continued{false};                  // previous line ended with a backslash
};

void enterString(LexState& state, char delim, bool triple, bool multiline, bool escapes) {
  state.mode = LexMode::STRING;
  state.delim = delim;
  state.triple = triple;
  state.multiline = multiline;
  state.escapes = escapes;
  state.raw_close.clear();
}

/// Closing quote index of a char literal opened at pos, or NPOS
auto charLiteralEnd(std::string_view text, size_t pos) noexcept -> size_t {
  if (pos + 2 >= text.size()) return NPOS;
  if (text[pos + 1] == '\\') {
    const size_t limit = std::min(text.size(), pos + 12);
    for (size_t j = pos + 3; j < limit; ++j) {
      if (text[j] == '\'') return j;
    }
    return NPOS;
  }
  if (text[pos + 1] == '\'') return NPOS;
  const size_t j = pos + 1 + utf8SeqLen(static_cast<unsigned char>(text[pos + 1]));
  return (j < text.size() && text[j] == '\'') ? j : NPOS;
}

/// Length of a raw string opener (`R"d(` or `r##"`) at pos, filling close
/// with its terminator; 0 when pos does not start a raw string.
auto rawStringOpen(std::string_view text, size_t pos, std::string& close) -> size_t {
  const char r = text[pos];
  if (pos + 1 >= text.size()) return 0;
  if (r == 'R' ? text[pos + 1] != '"' : (r != 'r' || (text[pos + 1] != '"' && text[pos + 1] != '#'))) {
    return 0;
  }

  // only encoding prefixes may precede the r: u8R, LR, uR, UR, br
  size_t word = pos;
  while (word > 0 && isIdentChar(text[word - 1])) --word;
  const std::string_view prefix = text.substr(word, pos - word);
  if (!prefix.empty() && prefix != "u8" && prefix != "u" && prefix != "U" &&
      prefix != "L" && prefix != "b") {
    return 0;
  }

  if (r == 'R') {
    // C++: R"delim( ... )delim", delimiter at most 16 chars
    const size_t limit = std::min(text.size(), pos + 2 + 17);
    for (size_t j = pos + 2; j < limit; ++j) {
      const char c = text[j];
      if (c == '(') {
        close.assign(")");
        close.append(text.substr(pos + 2, j - pos - 2));
        close.push_back('"');
        return j + 1 - pos;
      }
      if (c == ')' || c == '\\' || c == '"' || isSpace(c)) return 0;
    }
    return 0;
  }

  // Rust: r"..." or r#"..."#
  size_t j = pos + 1;
  while (j < text.size() && text[j] == '#') ++j;
  if (j >= text.size() || text[j] != '"') return 0;
  close.assign("\"");
  close.append(j - pos - 1, '#');
  return j + 1 - pos;
}

/// Fills line.code, line.strings and line.is_comment; state carries across lines
void lexLine(const LexSyntax& syn, LexState& state, Line& line) {
  const std::string_view text = line.text;
  line.code = line.text;
  const size_t n = text.size();

  bool has_code = false;
  bool has_comment = false;
  const bool started_in_comment = state.mode == LexMode::BLOCK_COMMENT || state.mode == LexMode::DOCSTRING;
  // a string at the start of a continuation line is an expression, not a docstring
  const bool continuation = state.bracket_depth > 0 || state.continued;
  bool open_span = state.mode == LexMode::STRING;
  size_t span_begin = 0;

  auto blank = [&line](size_t from, size_t to) {
    for (size_t k = from; k < to && k < line.code.size(); ++k) line.code[k] = ' ';
  };
  auto at = [text](size_t pos, std::string_view token) {
    return text.compare(pos, token.size(), token) == 0;
  };
  auto closeSpan = [&](size_t end) {
    line.strings.push_back(StringSpan{static_cast<uint32_t>(span_begin), static_cast<uint32_t>(end)});
    open_span = false;
  };

  size_t i = 0;
  while (i < n) {
    switch (state.mode) {
      case LexMode::CODE: {
        const char c = text[i];
        if (syn.line_comment != nullptr && at(i, syn.line_comment)) {
          blank(i, n);
          has_comment = true;
          i = n;
          break;
        }
        if (syn.block_comments && at(i, "/*")) {
          blank(i, i + 2);
          has_comment = true;
          state.mode = LexMode::BLOCK_COMMENT;
          i += 2;
          break;
        }
        if (syn.triple_quotes && (at(i, "\"\"\"") || at(i, "'''"))) {
          if (!has_code && !continuation) {
            // statement-level string literal: docstring
            state.delim = c;
            state.mode = LexMode::DOCSTRING;
            blank(i, i + 3);
            has_comment = true;
          } else {
            enterString(state, c, true, true, true);
            span_begin = i;
            open_span = true;
            has_code = true;
          }
          i += 3;
          break;
        }
        if (syn.text_blocks && at(i, "\"\"\"")) {
          enterString(state, '"', true, true, true);
          span_begin = i;
          open_span = true;
          has_code = true;
          i += 3;
          break;
        }
        if (syn.raw_strings) {
          std::string close;
          const size_t open = rawStringOpen(text, i, close);
          if (open != 0) {
            enterString(state, '"', false, true, false);
            state.raw_close = std::move(close);
            span_begin = i;
            open_span = true;
            has_code = true;
            i += open;
            break;
          }
        }
        if (c == '"' || (c == '\'' && syn.single_quote_strings) || (c == '`' && syn.backtick_strings)) {
          enterString(state, c, false, c == '`', c != '`' || syn.backtick_escapes);
          span_begin = i;
          open_span = true;
          has_code = true;
          ++i;
          break;
        }
        if (c == '\'' && syn.char_literals) {
          has_code = true;
          const size_t close = charLiteralEnd(text, i);
          if (close != NPOS) {
            line.strings.push_back(StringSpan{static_cast<uint32_t>(i), static_cast<uint32_t>(close + 1)});
            i = close + 1;
          } else {
            ++i;
          }
          break;
        }
        if (!state.template_braces.empty()) {
          if (c == '{') {
            ++state.template_braces.back();
          } else if (c == '}') {
            if (state.template_braces.back() == 0) {
              // end of ${ ... }: back inside the enclosing template literal
              state.template_braces.pop_back();
              enterString(state, '`', false, true, syn.backtick_escapes);
              has_code = true;
              ++i;
              span_begin = i;  // braces of ${ } stay code so brace depth balances
              open_span = true;
              break;
            }
            --state.template_braces.back();
          }
        }
        if (syn.triple_quotes) {
          if (c == '(' || c == '[' || c == '{') {
            ++state.bracket_depth;
          } else if ((c == ')' || c == ']' || c == '}') && state.bracket_depth > 0) {
            --state.bracket_depth;
          }
        }
        if (!isSpace(c)) has_code = true;
        ++i;
        break;
      }

      case LexMode::BLOCK_COMMENT: {
        has_comment = true;
        const size_t end = text.find("*/", i);
        if (end == NPOS) {
          blank(i, n);
          i = n;
        } else {
          blank(i, end + 2);
          i = end + 2;
          state.mode = LexMode::CODE;
        }
        break;
      }

      case LexMode::DOCSTRING: {
        has_comment = true;
        const char close[4] = {state.delim, state.delim, state.delim, '\0'};
        const size_t end = text.find(close, i);
        if (end == NPOS) {
          blank(i, n);
          i = n;
        } else {
          blank(i, end + 3);
          i = end + 3;
          state.mode = LexMode::CODE;
        }
        break;
      }

      case LexMode::STRING: {
        has_code = true;
        if (!state.raw_close.empty()) {
          const size_t end = text.find(state.raw_close, i);
          if (end == NPOS) {
            i = n;
            closeSpan(n);
          } else {
            i = end + state.raw_close.size();
            closeSpan(i);
            state.raw_close.clear();
            state.mode = LexMode::CODE;
          }
          break;
        }

        bool closed = false;
        bool substitution = false;
        while (i < n) {
          const char c = text[i];
          if (state.escapes && c == '\\') {
            i += 2;
            continue;
          }
          if (state.delim == '`' && syn.template_substitutions && c == '$' && at(i, "${")) {
            substitution = true;
            break;
          }
          if (c == state.delim) {
            if (!state.triple) {
              ++i;
              closed = true;
              break;
            }
            if (i + 2 < n && text[i + 1] == c && text[i + 2] == c) {
              i += 3;
              closed = true;
              break;
            }
          }
          ++i;
        }
        if (i > n) i = n;
        closeSpan(i);
        if (substitution) {
          state.template_braces.push_back(0);
          state.mode = LexMode::CODE;
          i += 2;
        } else if (closed || !state.multiline) {
          state.mode = LexMode::CODE;
        }
        break;
      }
    }
  }

  if (open_span && state.mode == LexMode::STRING && span_begin < n) {
    closeSpan(n);
  }
  if (state.mode == LexMode::STRING && !state.multiline) {
    // unterminated single-line literal ends with its line
    state.mode = LexMode::CODE;
  }
  state.continued = syn.triple_quotes && state.mode == LexMode::CODE && n > 0 && line.code.back() == '\\';

  line.is_comment = !has_code && (has_comment || started_in_comment);
}

// ========== Imports ==========

void pushImport(ParsedFile& out, std::string_view module, uint32_t line) {
  module = trim(module);
  if (module.empty()) return;
  out.imports.push_back(Import{std::string(module), line});
}

void extractPythonImports(ParsedFile& out) {
  for (const Line& line : out.lines) {
    if (line.is_comment) continue;
    const std::string_view t = trim(line.code);
    if (startsWith(t, "import ")) {
      std::string_view rest = t.substr(7);
      while (!rest.empty()) {
        const size_t comma = rest.find(',');
        std::string_view piece = trim(rest.substr(0, comma));
        const size_t as = piece.find(" as ");
        if (as != NPOS) piece = piece.substr(0, as);
        if (!piece.empty() && piece.back() == ';') piece.remove_suffix(1);
        if (!piece.empty() && piece.front() != '(') pushImport(out, piece, line.number);
        if (comma == NPOS) break;
        rest = rest.substr(comma + 1);
      }
    } else if (startsWith(t, "from ")) {
      const std::string_view rest = t.substr(5);
      const size_t imp = rest.find(" import");
      if (imp != NPOS) pushImport(out, rest.substr(0, imp), line.number);
    }
  }
}

void extractScriptImports(ParsedFile& out) {
  std::string module;
  for (const Line& line : out.lines) {
    if (line.is_comment) continue;
    const std::string_view code = line.code;

    for (size_t pos = findWord(code, "from"); pos != NPOS; pos = findWord(code, "from", pos + 4)) {
      if (readQuoted(code, pos + 4, module)) pushImport(out, module, line.number);
    }
    for (size_t pos = findWord(code, "require"); pos != NPOS; pos = findWord(code, "require", pos + 7)) {
      const size_t paren = skipSpaces(code, pos + 7);
      if (paren < code.size() && code[paren] == '(' && readQuoted(code, paren + 1, module)) {
        pushImport(out, module, line.number);
      }
    }
    for (size_t pos = findWord(code, "import"); pos != NPOS; pos = findWord(code, "import", pos + 6)) {
      const size_t next = skipSpaces(code, pos + 6);
      if (next >= code.size()) break;
      if (code[next] == '(') {
        if (readQuoted(code, next + 1, module)) pushImport(out, module, line.number);
      } else if (readQuoted(code, next, module)) {
        pushImport(out, module, line.number);
      }
    }
  }
}

void extractGoImports(ParsedFile& out) {
  std::string module;
  bool in_block = false;
  auto readAllQuoted = [&](std::string_view s, uint32_t line_no) {
    size_t pos = 0;
    while (pos < s.size()) {
      const size_t q = s.find_first_of("\"`", pos);
      if (q == NPOS) break;
      const size_t close = s.find(s[q], q + 1);
      if (close == NPOS) break;
      pushImport(out, s.substr(q + 1, close - q - 1), line_no);
      pos = close + 1;
    }
  };

  for (const Line& line : out.lines) {
    if (line.is_comment) continue;
    const std::string_view t = trim(line.code);
    if (in_block) {
      const size_t close = t.find(')');
      readAllQuoted(close == NPOS ? t : t.substr(0, close), line.number);
      if (close != NPOS) in_block = false;
      continue;
    }
    if (!startsWith(t, "import") || !wordAt(t, 0, "import")) continue;
    const std::string_view rest = trim(t.substr(6));
    if (!rest.empty() && rest.front() == '(') {
      const size_t close = rest.find(')');
      readAllQuoted(rest.substr(1, close == NPOS ? NPOS : close - 1), line.number);
      in_block = (close == NPOS);
    } else {
      const size_t q = rest.find_first_of("\"`");
      if (q != NPOS && readQuoted(rest, q, module)) pushImport(out, module, line.number);
    }
  }
}

void extractJavaImports(ParsedFile& out) {
  for (const Line& line : out.lines) {
    if (line.is_comment) continue;
    const std::string_view t = trim(line.code);
    if (!startsWith(t, "import ")) continue;
    std::string_view rest = trim(t.substr(7));
    if (startsWith(rest, "static ")) rest = trim(rest.substr(7));
    pushImport(out, rest.substr(0, rest.find(';')), line.number);
  }
}

void extractCFamilyImports(ParsedFile& out) {
  for (const Line& line : out.lines) {
    if (line.is_comment) continue;
    const std::string_view t = trim(line.code);
    if (t.empty()) continue;

    if (t.front() == '#') {
      const std::string_view directive = trim(t.substr(1));
      std::string_view rest;
      if (startsWith(directive, "include")) rest = trim(directive.substr(7));
      else if (startsWith(directive, "import")) rest = trim(directive.substr(6));
      else continue;
      if (rest.empty()) continue;
      const char close_char = rest.front() == '<' ? '>' : (rest.front() == '"' ? '"' : '\0');
      if (close_char == '\0') continue;
      const size_t close = rest.find(close_char, 1);
      if (close != NPOS) pushImport(out, rest.substr(1, close - 1), line.number);
      continue;
    }

    std::string_view rest;
    if (startsWith(t, "use ")) {
      rest = t.substr(4);
    } else if (startsWith(t, "pub use ")) {
      rest = t.substr(8);
    } else if (startsWith(t, "extern crate ")) {
      rest = t.substr(13);
      const size_t as = rest.find(" as ");
      if (as != NPOS) rest = rest.substr(0, as);
    } else if (startsWith(t, "using ") && t.find('(') == NPOS && t.find(';') != NPOS) {
      rest = trim(t.substr(6));
      if (startsWith(rest, "static ")) rest = rest.substr(7);
      const size_t eq = rest.find('=');
      if (eq != NPOS) rest = rest.substr(eq + 1);
    } else {
      continue;
    }
    pushImport(out, rest.substr(0, rest.find(';')), line.number);
  }
}

// ========== Functions ==========

void detectPythonFunctions(ParsedFile& out) {
  bool open = false;
  FunctionInfo current;
  uint32_t current_indent = 0;

  for (const Line& line : out.lines) {
    if (line.is_comment) continue;
    const std::string_view t = trim(line.code);
    if (t.empty()) continue;

    if (open && line.indent <= current_indent) {
      out.functions.push_back(current);
      open = false;
    }

    if (!open) {
      std::string_view def;
      if (startsWith(t, "def ")) def = t.substr(4);
      else if (startsWith(t, "async def ")) def = t.substr(10);
      if (!def.empty()) {
        const std::string_view name = readIdentifier(def, skipSpaces(def, 0));
        if (!name.empty()) {
          current = FunctionInfo{std::string(name), line.number, line.number};
          current_indent = line.indent;
          open = true;
        }
      }
      continue;
    }
    current.end_line = line.number;
  }
  if (open) out.functions.push_back(current);
}

/// Words that look like calls but never name a function definition
auto isControlKeyword(std::string_view word) noexcept -> bool {
  static constexpr const char* KEYWORDS[] = {
    "if", "else", "for", "while", "switch", "catch", "return", "sizeof", "new", "do",
    "try", "using", "lock", "foreach", "typeof", "delete", "throw", "case", "match",
    "loop", "when", "synchronized", "await", "yield", "assert", "defer", "go", "select",
    "elif", "with", "fixed", "checked", "unchecked", "decltype", "alignof", "static_assert",
    "function", "func", "fn", "super", "this", "let", "print", "printf", "echo", "in", "of"};
  for (const char* kw : KEYWORDS) {
    if (word == kw) return true;
  }
  return false;
}

/// Matching ')' for the '(' at open, or NPOS when it is not on this line
auto matchingParen(std::string_view s, size_t open) noexcept -> size_t {
  int depth = 0;
  for (size_t i = open; i < s.size(); ++i) {
    if (s[i] == '(') ++depth;
    else if (s[i] == ')' && --depth == 0) return i;
  }
  return NPOS;
}

/// Name declared by a JS/TS `function` keyword or arrow assignment; empty otherwise.
/// `handled` reports that the line is a function expression even when anonymous.
auto scriptFunctionName(std::string_view t, bool& handled) -> std::string_view {
  handled = false;
  const size_t fn = findWord(t, "function");
  if (fn != NPOS) {
    handled = true;
    size_t pos = skipSpaces(t, fn + 8);
    if (pos < t.size() && t[pos] == '*') pos = skipSpaces(t, pos + 1);
    std::string_view name = readIdentifier(t, pos);
    if (!name.empty()) return name;
    // name = function (...) / name: function (...)
    std::string_view before = trim(t.substr(0, fn));
    if (endsWith(before, "async")) before = trim(before.substr(0, before.size() - 5));
    if (!before.empty() && (before.back() == '=' || before.back() == ':')) {
      before = trim(before.substr(0, before.size() - 1));
      size_t b = before.size();
      while (b > 0 && isIdentChar(before[b - 1])) --b;
      return before.substr(b);
    }
    return {};
  }

  const size_t arrow = t.find("=>");
  if (arrow == NPOS) return {};
  size_t eq = t.find('=');
  while (eq != NPOS && eq < arrow && (t.compare(eq, 2, "==") == 0 || eq == arrow)) {
    eq = t.find('=', eq + 2);
  }
  if (eq == NPOS || eq >= arrow) return {};
  handled = true;
  std::string_view lhs = trim(t.substr(0, eq));
  size_t b = lhs.size();
  while (b > 0 && isIdentChar(lhs[b - 1])) --b;
  return lhs.substr(b);
}

/// Name of a function header on this line, or empty. `needs_brace` is set when
/// the body brace may arrive on a following line.
auto braceFunctionName(std::string_view code, Language language, bool& needs_brace) -> std::string_view {
  needs_brace = false;
  std::string_view t = trim(code);
  while (!t.empty() && t.front() == '}') t = trim(t.substr(1));
  if (t.empty() || t.front() == '@' || t.front() == '.' || t.front() == '#') return {};
  if (endsWith(t, ";")) return {};

  if (language == Language::GO) {
    if (!wordAt(t, 0, "func")) return {};
    size_t pos = skipSpaces(t, 4);
    if (pos < t.size() && t[pos] == '(') {
      if (pos == 4) return {};  // func(...) literal
      const size_t close = matchingParen(t, pos);
      if (close == NPOS) return {};
      pos = skipSpaces(t, close + 1);
    }
    needs_brace = t.find('{') == NPOS;
    return readIdentifier(t, pos);
  }

  if (language == Language::C_FAMILY) {
    const size_t fn = findWord(t, "fn");
    if (fn != NPOS) {
      needs_brace = t.find('{') == NPOS;
      return readIdentifier(t, skipSpaces(t, fn + 2));
    }
  }

  if (language == Language::JAVASCRIPT || language == Language::TYPESCRIPT) {
    bool handled = false;
    const std::string_view name = scriptFunctionName(t, handled);
    if (handled) {
      needs_brace = t.find('{') == NPOS && !endsWith(t, "=>");
      return name;
    }
  }

  // generic `[modifiers] [type] name(params) [qualifiers] {`
  const std::string_view first_word = readIdentifier(t, 0);
  if (isControlKeyword(first_word)) return {};

  const size_t paren = t.find('(');
  if (paren == NPOS || paren == 0) return {};
  if (t.substr(0, paren).find('=') != NPOS) return {};

  size_t name_end = paren;
  while (name_end > 0 && isSpace(t[name_end - 1])) --name_end;
  size_t name_begin = name_end;
  while (name_begin > 0 && (isIdentChar(t[name_begin - 1]) || t[name_begin - 1] == ':' || t[name_begin - 1] == '~')) {
    --name_begin;
  }
  std::string_view name = t.substr(name_begin, name_end - name_begin);
  if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) return {};

  const size_t last_colon = name.rfind(':');
  const std::string_view base = last_colon == NPOS ? name : name.substr(last_colon + 1);
  if (base.empty() || isControlKeyword(base)) return {};

  size_t prev = name_begin;
  while (prev > 0 && isSpace(t[prev - 1])) --prev;
  if (prev > 0) {
    const char p = t[prev - 1];
    if (!isIdentChar(p) && p != '*' && p != '&' && p != '>' && p != ']' && p != '?') return {};
  }

  const size_t close = matchingParen(t, paren);
  if (close == NPOS) {
    // multi-line parameter list; only trust it with a declared type before the name
    if (prev == 0) return {};
    needs_brace = true;
    return name;
  }

  const std::string_view rest = trim(t.substr(close + 1));
  if (rest.empty()) {
    needs_brace = true;
    return name;
  }
  if (rest.front() == '{') return name;
  if (startsWith(rest, "->") || rest.front() == ':' || std::isalpha(static_cast<unsigned char>(rest.front()))) {
    if (rest.find('{') != NPOS) return name;
    needs_brace = true;
    return name;
  }
  return {};
}

void detectBraceFunctions(ParsedFile& out) {
  constexpr uint32_t MAX_PENDING_LINES = 4;

  int depth = 0;
  bool open = false;
  bool entered = false;
  int base_depth = 0;
  FunctionInfo current;

  bool pending = false;
  uint32_t pending_waited = 0;

  for (const Line& line : out.lines) {
    if (line.is_comment) continue;
    const std::string_view code = line.code;

    if (!open) {
      if (pending) {
        const std::string_view t = trim(code);
        if (!t.empty()) {
          if (code.find('{') != NPOS) {
            open = true;
            entered = false;
            pending = false;
          } else if (endsWith(t, ";") || ++pending_waited > MAX_PENDING_LINES) {
            pending = false;
          }
        }
      }
      if (!open && !pending) {
        bool needs_brace = false;
        const std::string_view name = braceFunctionName(code, out.language, needs_brace);
        if (!name.empty()) {
          current = FunctionInfo{std::string(name), line.number, line.number};
          base_depth = depth;
          if (needs_brace) {
            pending = true;
            pending_waited = 0;
          } else {
            open = true;
            entered = false;
          }
        }
      }
    }

    // braces outside string literals
    size_t span = 0;
    for (size_t i = 0; i < code.size(); ++i) {
      while (span < line.strings.size() && line.strings[span].end <= i) ++span;
      if (span < line.strings.size() && line.strings[span].begin <= i) continue;
      if (code[i] == '{') {
        ++depth;
        if (open && depth > base_depth) entered = true;
      } else if (code[i] == '}') {
        if (depth > 0) --depth;
        if (open && entered && depth <= base_depth) {
          current.end_line = line.number;
          out.functions.push_back(current);
          open = false;
        }
      }
    }
  }

  if (open) {
    current.end_line = out.lines.empty() ? current.start_line : out.lines.back().number;
    out.functions.push_back(current);
  }
}

} // namespace

// ========== Language resolution ==========

auto Parser::languageFromAlias(std::string_view alias, Language& out) noexcept -> bool {
  struct Alias {
    const char* name;
    Language language;
  };
  static constexpr Alias ALIASES[] = {
    {"python", Language::PYTHON}, {"py", Language::PYTHON},
    {"javascript", Language::JAVASCRIPT}, {"js", Language::JAVASCRIPT}, {"node", Language::JAVASCRIPT},
    {"typescript", Language::TYPESCRIPT}, {"ts", Language::TYPESCRIPT},
    {"go", Language::GO}, {"golang", Language::GO},
    {"java", Language::JAVA},
    {"rust", Language::C_FAMILY}, {"rs", Language::C_FAMILY},
    {"c", Language::C_FAMILY}, {"cpp", Language::C_FAMILY}, {"c++", Language::C_FAMILY},
    {"cxx", Language::C_FAMILY}, {"csharp", Language::C_FAMILY}, {"cs", Language::C_FAMILY},
    {"c#", Language::C_FAMILY}, {"c_family", Language::C_FAMILY},
    {"unknown", Language::UNKNOWN}, {"text", Language::UNKNOWN}};
  for (const Alias& a : ALIASES) {
    if (iequals(alias, a.name)) {
      out = a.language;
      return true;
    }
  }
  return false;
}

auto Parser::languageFromExtension(std::string_view path) noexcept -> Language {
  const size_t slash = path.find_last_of("/\\");
  const std::string_view file = slash == NPOS ? path : path.substr(slash + 1);
  const size_t dot = file.rfind('.');
  if (dot == NPOS || dot + 1 >= file.size()) return Language::UNKNOWN;
  const std::string_view ext = file.substr(dot + 1);

  struct Extension {
    const char* ext;
    Language language;
  };
  static constexpr Extension EXTENSIONS[] = {
    {"py", Language::PYTHON}, {"pyw", Language::PYTHON}, {"pyi", Language::PYTHON},
    {"js", Language::JAVASCRIPT}, {"mjs", Language::JAVASCRIPT}, {"cjs", Language::JAVASCRIPT},
    {"jsx", Language::JAVASCRIPT},
    {"ts", Language::TYPESCRIPT}, {"tsx", Language::TYPESCRIPT}, {"mts", Language::TYPESCRIPT},
    {"cts", Language::TYPESCRIPT},
    {"go", Language::GO},
    {"java", Language::JAVA},
    {"rs", Language::C_FAMILY}, {"c", Language::C_FAMILY}, {"h", Language::C_FAMILY},
    {"cc", Language::C_FAMILY}, {"cpp", Language::C_FAMILY}, {"cxx", Language::C_FAMILY},
    {"hpp", Language::C_FAMILY}, {"hh", Language::C_FAMILY}, {"hxx", Language::C_FAMILY},
    {"cs", Language::C_FAMILY}};
  for (const Extension& e : EXTENSIONS) {
    if (iequals(ext, e.ext)) return e.language;
  }
  return Language::UNKNOWN;
}

auto Parser::resolveLanguage(std::string_view path_or_language) noexcept -> Language {
  Language language = Language::UNKNOWN;
  if (languageFromAlias(path_or_language, language)) return language;
  return languageFromExtension(path_or_language);
}

// ========== Decoding ==========

auto Parser::decodeLossy(std::string_view bytes, std::string& out) -> bool {
  static constexpr char REPLACEMENT[] = "\xEF\xBF\xBD";
  out.clear();
  out.reserve(bytes.size());
  bool valid = true;

  const size_t n = bytes.size();
  size_t i = 0;
  while (i < n) {
    const auto c0 = static_cast<unsigned char>(bytes[i]);
    if (c0 < 0x80) {
      out.push_back(static_cast<char>(c0));
      ++i;
      continue;
    }

    size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (c0 >= 0xC2 && c0 <= 0xDF) {
      len = 2;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
      len = 3;
      if (c0 == 0xE0) lo = 0xA0;        // overlong
      else if (c0 == 0xED) hi = 0x9F;   // surrogates
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
      len = 4;
      if (c0 == 0xF0) lo = 0x90;        // overlong
      else if (c0 == 0xF4) hi = 0x8F;   // > U+10FFFF
    }

    bool ok = len > 0 && i + len <= n;
    if (ok) {
      const auto c1 = static_cast<unsigned char>(bytes[i + 1]);
      ok = c1 >= lo && c1 <= hi;
      for (size_t k = 2; ok && k < len; ++k) {
        const auto ck = static_cast<unsigned char>(bytes[i + k]);
        ok = ck >= 0x80 && ck <= 0xBF;
      }
    }

    if (LIKELY(ok)) {
      out.append(bytes.data() + i, len);
      i += len;
    } else {
      out.append(REPLACEMENT, 3);
      valid = false;
      ++i;
    }
  }
  return valid;
}

auto Parser::countLines(std::string_view text) noexcept -> size_t {
  if (text.empty()) return 0;
  const size_t newlines = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
  return newlines + (text.back() == '\n' ? 0 : 1);
}

// ========== Parse ==========

auto Parser::parse(std::string_view content, std::string_view path_or_language,
                   ParsedFile& out) const -> ParseResult {
  out = ParsedFile{};
  if (content.size() > limits_.max_input_size) return ParseResult::INPUT_TOO_LARGE;
  const size_t line_count = countLines(content);
  if (line_count > limits_.max_lines) return ParseResult::INPUT_TOO_LARGE;

  out.language = resolveLanguage(path_or_language);
  out.path = std::string(path_or_language);
  out.byte_size = content.size();
  out.comments_stripped = limits_.strip_comments;

  std::string decoded;
  out.degraded = !decodeLossy(content, decoded);

  // ---- Split lines ----
  out.lines.reserve(line_count);
  const std::string_view text = decoded;
  size_t pos = 0;
  uint32_t number = 0;
  while (pos < text.size()) {
    size_t nl = text.find('\n', pos);
    if (nl == NPOS) nl = text.size();
    std::string_view raw = text.substr(pos, nl - pos);
    if (!raw.empty() && raw.back() == '\r') raw.remove_suffix(1);

    Line line;
    line.number = ++number;
    line.text.assign(raw);
    for (const char c : raw) {
      if (c == ' ') line.indent += 1;
      else if (c == '\t') line.indent += 4;
      else break;
    }
    out.lines.push_back(std::move(line));
    pos = nl + 1;
  }

  // ---- Comments and strings ----
  const LexSyntax syntax = syntaxFor(out.language);
  LexState state;
  for (Line& line : out.lines) {
    lexLine(syntax, state, line);
  }

  // ---- Imports and functions ----
  switch (out.language) {
    case Language::PYTHON:
      extractPythonImports(out);
      detectPythonFunctions(out);
      break;
    case Language::JAVASCRIPT:
    case Language::TYPESCRIPT:
      extractScriptImports(out);
      detectBraceFunctions(out);
      break;
    case Language::GO:
      extractGoImports(out);
      detectBraceFunctions(out);
      break;
    case Language::JAVA:
      extractJavaImports(out);
      detectBraceFunctions(out);
      break;
    case Language::C_FAMILY:
      extractCFamilyImports(out);
      detectBraceFunctions(out);
      break;
    case Language::UNKNOWN:
      break;
  }

  return ParseResult::OK;
}

} // namespace CryptoAudit
