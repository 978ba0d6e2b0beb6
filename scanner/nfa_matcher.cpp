#include "scanner/nfa_matcher.h"

#include <cctype>
#include <cstring>
#include <utility>

#include "common/macros.h"

namespace CryptoAudit {

namespace {

constexpr int MAX_GROUP_DEPTH = 64;

inline auto isWordByte(uint8_t c) noexcept -> bool {
  return std::isalnum(c) || c == '_';
}

inline auto foldByte(uint8_t c) noexcept -> uint8_t {
  return static_cast<uint8_t>(std::tolower(c));
}

} // namespace

// ========== Compiler ==========

/// Recursive-descent compiler from pattern text to NFA fragments
class NfaMatcher::Compiler {
public:
  Compiler(NfaMatcher& nfa, std::string_view pattern) noexcept : nfa_(nfa), pattern_(pattern) {}

  auto run() -> bool {
    Fragment frag;
    if (!parseAlternation(frag, 0)) return false;
    if (pos_ != pattern_.size()) {
      return fail("unbalanced ')'");
    }
    const int16_t match = addState(Op::MATCH);
    if (match < 0) return false;
    patch(frag.holes, match);
    nfa_.start_ = frag.start;
    return true;
  }

private:
  auto fail(const char* reason) -> bool {
    if (nfa_.error_.empty()) {
      nfa_.error_ = std::string(reason) + " at offset " + std::to_string(pos_);
    }
    return false;
  }

  auto addState(Op op, uint8_t ch = 0, uint16_t class_idx = 0) -> int16_t {
    if (nfa_.states_.size() >= static_cast<size_t>(MAX_STATES)) {
      fail("pattern too large");
      return -1;
    }
    State st;
    st.op = op;
    st.ch = ch;
    st.class_idx = class_idx;
    nfa_.states_.push_back(st);
    return static_cast<int16_t>(nfa_.states_.size() - 1);
  }

  void patch(const std::vector<Hole>& holes, int16_t target) noexcept {
    for (const Hole& h : holes) {
      State& st = nfa_.states_[static_cast<size_t>(h.state)];
      if (h.edge == 0) {
        st.out = target;
      } else {
        st.out1 = target;
      }
    }
  }

  auto single(int16_t state, Fragment& out) -> bool {
    if (state < 0) return false;
    out.start = state;
    out.holes.assign(1, Hole{state, 0});
    return true;
  }

  auto parseAlternation(Fragment& out, int depth) -> bool {
    if (depth > MAX_GROUP_DEPTH) return fail("groups nested too deeply");
    if (!parseConcat(out, depth)) return false;
    while (pos_ < pattern_.size() && pattern_[pos_] == '|') {
      ++pos_;
      Fragment rhs;
      if (!parseConcat(rhs, depth)) return false;
      const int16_t split = addState(Op::SPLIT);
      if (split < 0) return false;
      nfa_.states_[static_cast<size_t>(split)].out = out.start;
      nfa_.states_[static_cast<size_t>(split)].out1 = rhs.start;
      out.start = split;
      out.holes.insert(out.holes.end(), rhs.holes.begin(), rhs.holes.end());
    }
    return true;
  }

  auto parseConcat(Fragment& out, int depth) -> bool {
    bool have = false;
    while (pos_ < pattern_.size() && pattern_[pos_] != '|' && pattern_[pos_] != ')') {
      Fragment next;
      if (!parseQuantified(next, depth)) return false;
      if (!have) {
        out = std::move(next);
        have = true;
      } else {
        patch(out.holes, next.start);
        out.holes = std::move(next.holes);
      }
    }
    if (!have) {
      return single(addState(Op::EPSILON), out);
    }
    return true;
  }

  auto parseQuantified(Fragment& out, int depth) -> bool {
    if (!parseAtom(out, depth)) return false;
    while (pos_ < pattern_.size()) {
      const char q = pattern_[pos_];
      if (q != '*' && q != '+' && q != '?') break;
      ++pos_;
      const int16_t split = addState(Op::SPLIT);
      if (split < 0) return false;
      State& st = nfa_.states_[static_cast<size_t>(split)];
      st.out = out.start;
      if (q == '*') {
        patch(out.holes, split);
        out.start = split;
        out.holes.assign(1, Hole{split, 1});
      } else if (q == '+') {
        patch(out.holes, split);
        out.holes.assign(1, Hole{split, 1});
      } else {
        out.start = split;
        out.holes.push_back(Hole{split, 1});
      }
    }
    return true;
  }

  auto parseAtom(Fragment& out, int depth) -> bool {
    if (pos_ >= pattern_.size()) return fail("unexpected end of pattern");
    const char c = pattern_[pos_];
    switch (c) {
      case '(': {
        ++pos_;
        if (pattern_.substr(pos_, 2) == "?:") pos_ += 2;
        if (!parseAlternation(out, depth + 1)) return false;
        if (pos_ >= pattern_.size() || pattern_[pos_] != ')') return fail("missing ')'");
        ++pos_;
        return true;
      }
      case '[':
        ++pos_;
        return parseClass(out);
      case '.': {
        ++pos_;
        CharClass cls;
        cls.setRange(0, 255);
        cls.bits['\n' >> 6] &= ~(1ULL << ('\n' & 63));
        return single(addClass(cls), out);
      }
      case '\\':
        return parseEscape(out);
      case '*': case '+': case '?':
        return fail("nothing to repeat");
      case '^': case '$': case '{':
        return fail("unsupported operator");
      default:
        ++pos_;
        return single(addChar(static_cast<uint8_t>(c)), out);
    }
  }

  auto parseEscape(Fragment& out) -> bool {
    ++pos_;
    if (pos_ >= pattern_.size()) return fail("trailing backslash");
    const char e = pattern_[pos_++];
    if (e == 'b') {
      return single(addState(Op::WORD_BOUNDARY), out);
    }
    CharClass cls;
    if (shorthandClass(e, cls)) {
      return single(addClass(cls), out);
    }
    return single(addChar(escapedLiteral(e)), out);
  }

  auto parseClass(Fragment& out) -> bool {
    CharClass cls;
    bool negated = false;
    if (pos_ < pattern_.size() && pattern_[pos_] == '^') {
      negated = true;
      ++pos_;
    }
    bool first = true;
    while (pos_ < pattern_.size() && (pattern_[pos_] != ']' || first)) {
      first = false;
      uint8_t lo = 0;
      if (pattern_[pos_] == '\\') {
        if (pos_ + 1 >= pattern_.size()) return fail("trailing backslash in class");
        const char e = pattern_[pos_ + 1];
        pos_ += 2;
        CharClass shorthand;
        if (shorthandClass(e, shorthand)) {
          for (size_t w = 0; w < cls.bits.size(); ++w) cls.bits[w] |= shorthand.bits[w];
          continue;
        }
        lo = escapedLiteral(e);
      } else {
        lo = static_cast<uint8_t>(pattern_[pos_++]);
      }

      uint8_t hi = lo;
      if (pos_ + 1 < pattern_.size() && pattern_[pos_] == '-' && pattern_[pos_ + 1] != ']') {
        ++pos_;
        if (pattern_[pos_] == '\\') {
          if (pos_ + 1 >= pattern_.size()) return fail("trailing backslash in class");
          hi = escapedLiteral(pattern_[pos_ + 1]);
          pos_ += 2;
        } else {
          hi = static_cast<uint8_t>(pattern_[pos_++]);
        }
        if (hi < lo) return fail("reversed class range");
      }
      addRange(cls, lo, hi);
    }
    if (pos_ >= pattern_.size()) return fail("missing ']'");
    ++pos_;
    if (negated) cls.invert();
    return single(addClass(cls), out);
  }

  void addRange(CharClass& cls, uint8_t lo, uint8_t hi) const noexcept {
    for (int c = lo; c <= hi; ++c) {
      const auto b = static_cast<uint8_t>(c);
      cls.set(b);
      if (nfa_.case_insensitive_ && std::isalpha(b)) {
        cls.set(static_cast<uint8_t>(std::tolower(b)));
        cls.set(static_cast<uint8_t>(std::toupper(b)));
      }
    }
  }

  static auto shorthandClass(char e, CharClass& cls) noexcept -> bool {
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(e)));
    if (lower != 'd' && lower != 'w' && lower != 's') return false;
    for (int c = 0; c < 256; ++c) {
      const auto b = static_cast<uint8_t>(c);
      bool in = false;
      if (lower == 'd') in = std::isdigit(b) != 0;
      else if (lower == 'w') in = isWordByte(b);
      else in = (b == ' ' || b == '\t' || b == '\r' || b == '\n' || b == '\f' || b == '\v');
      if (in) cls.set(b);
    }
    if (std::isupper(static_cast<unsigned char>(e))) cls.invert();
    return true;
  }

  static auto escapedLiteral(char e) noexcept -> uint8_t {
    switch (e) {
      case 'n': return '\n';
      case 't': return '\t';
      case 'r': return '\r';
      default:  return static_cast<uint8_t>(e);
    }
  }

  auto addChar(uint8_t c) -> int16_t {
    return addState(Op::CHAR, nfa_.case_insensitive_ ? foldByte(c) : c);
  }

  auto addClass(const CharClass& cls) -> int16_t {
    if (nfa_.classes_.size() >= 0xFFFF) {
      fail("too many classes");
      return -1;
    }
    nfa_.classes_.push_back(cls);
    return addState(Op::CLASS, 0, static_cast<uint16_t>(nfa_.classes_.size() - 1));
  }

  NfaMatcher& nfa_;
  std::string_view pattern_;
  size_t pos_{0};
};

// ========== NfaMatcher ==========

NfaMatcher::NfaMatcher(std::string_view pattern, bool case_insensitive)
  : case_insensitive_(case_insensitive) {
  if (pattern.empty()) {
    error_ = "empty pattern";
    return;
  }
  Compiler compiler(*this, pattern);
  valid_ = compiler.run();
  if (!valid_) {
    states_.clear();
    classes_.clear();
    start_ = -1;
  }
}

auto NfaMatcher::stepMatches(const State& st, uint8_t byte) const noexcept -> bool {
  if (st.op == Op::CHAR) {
    return (case_insensitive_ ? foldByte(byte) : byte) == st.ch;
  }
  return classes_[st.class_idx].test(byte);
}

void NfaMatcher::addThread(ThreadList& list, int16_t state, uint32_t start,
                           std::string_view input, size_t pos) const noexcept {
  int16_t stack[2 * MAX_STATES + 1];
  int top = 0;
  stack[top++] = state;

  while (top > 0) {
    const int16_t s = stack[--top];
    if (s < 0) continue;
    uint64_t& word = list.present[s >> 6];
    const uint64_t bit = 1ULL << (s & 63);
    if (word & bit) continue;
    word |= bit;

    const State& st = states_[static_cast<size_t>(s)];
    switch (st.op) {
      case Op::SPLIT:
        stack[top++] = st.out1;
        stack[top++] = st.out;
        break;
      case Op::EPSILON:
        stack[top++] = st.out;
        break;
      case Op::WORD_BOUNDARY: {
        const bool before = pos > 0 && isWordByte(static_cast<uint8_t>(input[pos - 1]));
        const bool after = pos < input.size() && isWordByte(static_cast<uint8_t>(input[pos]));
        if (before != after) stack[top++] = st.out;
        break;
      }
      case Op::CHAR:
      case Op::CLASS:
      case Op::MATCH:
        list.states[list.count] = s;
        list.starts[list.count] = start;
        ++list.count;
        break;
    }
  }
}

auto NfaMatcher::find(std::string_view input, MatchSpan& span) const noexcept -> bool {
  if (UNLIKELY(!valid_ || start_ < 0)) return false;

  ThreadList lists[2];
  ThreadList* cur = &lists[0];
  ThreadList* next = &lists[1];
  cur->count = 0;
  std::memset(cur->present, 0, sizeof(cur->present));

  bool found = false;
  uint32_t best_begin = 0;
  uint32_t best_end = 0;
  const size_t n = input.size();

  for (size_t pos = 0;; ++pos) {
    if (!found) {
      addThread(*cur, start_, static_cast<uint32_t>(pos), input, pos);
    }

    for (int i = 0; i < cur->count; ++i) {
      if (states_[static_cast<size_t>(cur->states[i])].op != Op::MATCH) continue;
      const uint32_t begin = cur->starts[i];
      if (!found || begin < best_begin || (begin == best_begin && pos > best_end)) {
        found = true;
        best_begin = begin;
        best_end = static_cast<uint32_t>(pos);
      }
    }

    if (pos >= n) break;

    next->count = 0;
    std::memset(next->present, 0, sizeof(next->present));
    const auto byte = static_cast<uint8_t>(input[pos]);
    for (int i = 0; i < cur->count; ++i) {
      if (found && cur->starts[i] > best_begin) continue;
      const State& st = states_[static_cast<size_t>(cur->states[i])];
      if (st.op == Op::MATCH) continue;
      if (stepMatches(st, byte)) {
        addThread(*next, st.out, cur->starts[i], input, pos + 1);
      }
    }
    std::swap(cur, next);

    if (found && cur->count == 0) break;
  }

  if (found) {
    span.begin = best_begin;
    span.end = best_end;
  }
  return found;
}

} // namespace CryptoAudit
