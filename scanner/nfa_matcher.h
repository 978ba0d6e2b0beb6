#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace CryptoAudit {

/// Half-open byte range [begin, end) of a match within a line
struct MatchSpan {
  uint32_t begin{0};
  uint32_t end{0};
};

/// Thompson NFA over bytes.
///
/// Supported syntax: literals, `.`, `[...]`, `[^...]`, ranges, `* + ?`, `|`,
/// `( )`, `\` escapes, `\d \w \s` (and upper-case negations inside or outside
/// classes), and `\b` as a zero-width word boundary.
///
/// Simulation is Pike-style: every live state carries the input offset where
/// its thread started, so find() reports the leftmost match and, for that
/// start, the longest end. Cost is O(input * states) with no backtracking.
class NfaMatcher {
public:
  static constexpr int MAX_STATES = 512;
  static constexpr int SET_WORDS = MAX_STATES / 64;

  NfaMatcher() = default;
  explicit NfaMatcher(std::string_view pattern, bool case_insensitive = false);

  /// Did the pattern compile?
  [[nodiscard]] auto valid() const noexcept -> bool { return valid_; }

  /// Reason the last compile failed; empty when valid()
  [[nodiscard]] auto error() const noexcept -> const std::string& { return error_; }

  [[nodiscard]] auto stateCount() const noexcept -> size_t { return states_.size(); }

  /// Leftmost-longest search; false when nothing matches or the matcher is invalid
  [[nodiscard]] auto find(std::string_view input, MatchSpan& span) const noexcept -> bool;

  [[nodiscard]] auto matches(std::string_view input) const noexcept -> bool {
    MatchSpan span;
    return find(input, span);
  }

private:
  enum class Op : uint8_t { CHAR, CLASS, SPLIT, EPSILON, WORD_BOUNDARY, MATCH };

  struct State {
    Op op{Op::EPSILON};
    uint8_t ch{0};
    uint16_t class_idx{0};
    int16_t out{-1};
    int16_t out1{-1};
  };

  struct CharClass {
    std::array<uint64_t, 4> bits{};

    void set(uint8_t c) noexcept { bits[c >> 6] |= (1ULL << (c & 63)); }
    [[nodiscard]] auto test(uint8_t c) const noexcept -> bool { return (bits[c >> 6] >> (c & 63)) & 1ULL; }
    void setRange(uint8_t lo, uint8_t hi) noexcept {
      for (int c = lo; c <= hi; ++c) set(static_cast<uint8_t>(c));
    }
    void invert() noexcept {
      for (auto& w : bits) w = ~w;
    }
  };

  /// Dangling exit of a fragment: state index, and which edge (0 = out, 1 = out1)
  struct Hole {
    int16_t state;
    uint8_t edge;
  };

  struct Fragment {
    int16_t start{-1};
    std::vector<Hole> holes;
  };

  class Compiler;
  friend class Compiler;

  struct ThreadList {
    int count{0};
    int16_t states[MAX_STATES];
    uint32_t starts[MAX_STATES];
    uint64_t present[SET_WORDS];
  };

  void addThread(ThreadList& list, int16_t state, uint32_t start,
                 std::string_view input, size_t pos) const noexcept;
  [[nodiscard]] auto stepMatches(const State& st, uint8_t byte) const noexcept -> bool;

  std::vector<State> states_;
  std::vector<CharClass> classes_;
  int16_t start_{-1};
  bool case_insensitive_{false};
  bool valid_{false};
  std::string error_;
};

} // namespace CryptoAudit
