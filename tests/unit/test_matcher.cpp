#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include "common/logging.h"
#include "common/time_utils.h"
#include "scanner/matcher.h"
#include "scanner/nfa_matcher.h"

using namespace CryptoAudit;

class MatcherTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::string log_file = "logs/test_matcher_" + std::to_string(timestamp) + ".log";
        Common::initLogging(log_file.c_str());
        LOG_INFO("=== Starting Matcher Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== Matcher Test Completed ===");
        Common::shutdownLogging();
    }

    static MatchOutcome findIn(const CompiledMatcher& matcher, const std::string& text,
                               const std::vector<std::string>& imports, MatchSpan& span) {
        const std::string lowered = asciiLower(text);
        return matcher.find(LineView{text, lowered}, imports, span);
    }
};

// 1. UNIT TESTS - NFA SYNTAX

TEST_F(MatcherTestBase, NfaCompilesSupportedSyntax) {
    const char* patterns[] = {
        "rsa\\.generate_private_key",
        "(?:ab|cd)+e?",
        "[A-Za-z_][\\w]*\\(",
        "[^0-9\\s]+",
        "\\brsa_generate_key(_ex)?\\b",
        "getinstance\\(\\s*\"rsa\"",
        "diffie.?hellman",
    };
    for (const char* p : patterns) {
        NfaMatcher nfa(p, true);
        EXPECT_TRUE(nfa.valid()) << "Pattern should compile: " << p << " (" << nfa.error() << ")";
        EXPECT_TRUE(nfa.error().empty());
        EXPECT_GT(nfa.stateCount(), 0u);
    }

    LOG_INFO("PASS: Supported syntax compiles");
}

TEST_F(MatcherTestBase, NfaRejectsMalformedPatterns) {
    // === INPUT SPECIFICATION ===
    // Patterns using anchors, counted repetition, dangling operators,
    // unbalanced groups, broken classes, and an oversized literal

    // === EXPECTED OUTPUT SPECIFICATION ===
    // valid() is false, error() names the reason, find() never matches

    struct Case {
        std::string pattern;
        const char* reason;
    };
    const std::vector<Case> cases = {
        {"", "empty pattern"},
        {"^abc", "unsupported operator"},
        {"abc$", "unsupported operator"},
        {"a{2}", "unsupported operator"},
        {"*a", "nothing to repeat"},
        {"(ab", "missing ')'"},
        {"ab)", "unbalanced ')'"},
        {"[a-", "missing ']'"},
        {"[z-a]", "reversed class range"},
        {"abc\\", "trailing backslash"},
        {std::string(600, 'a'), "pattern too large"},
    };

    for (const auto& c : cases) {
        NfaMatcher nfa(c.pattern);
        EXPECT_FALSE(nfa.valid()) << "Pattern should be rejected: " << c.pattern.substr(0, 16);
        EXPECT_NE(nfa.error().find(c.reason), std::string::npos)
            << "Expected '" << c.reason << "', got '" << nfa.error() << "'";
        EXPECT_FALSE(nfa.matches("abc aaaa"));
    }

    LOG_INFO("PASS: Malformed patterns rejected");
}

// 2. UNIT TESTS - MATCH SEMANTICS

TEST_F(MatcherTestBase, NfaFindsLeftmostLongest) {
    MatchSpan span;

    NfaMatcher alt("a|ab|abc");
    ASSERT_TRUE(alt.find("xxabcd", span));
    EXPECT_EQ(span.begin, 2u);
    EXPECT_EQ(span.end, 5u) << "Longest alternative wins at the leftmost start";

    NfaMatcher star("(a|b)*c");
    ASSERT_TRUE(star.find("zzababcq", span));
    EXPECT_EQ(span.begin, 2u);
    EXPECT_EQ(span.end, 7u);

    NfaMatcher call("rsa\\.generate", true);
    ASSERT_TRUE(call.find("key = RSA.generate(2048)", span));
    EXPECT_EQ(span.begin, 6u);
    EXPECT_EQ(span.end, 18u);

    NfaMatcher digits("\\d+");
    ASSERT_TRUE(digits.find("key_size=2048)", span));
    EXPECT_EQ(span.begin, 9u);
    EXPECT_EQ(span.end, 13u);

    NfaMatcher negated("[^0-9]+");
    ASSERT_TRUE(negated.find("123abc456", span));
    EXPECT_EQ(span.begin, 3u);
    EXPECT_EQ(span.end, 6u);

    LOG_INFO("PASS: Leftmost-longest matching");
}

TEST_F(MatcherTestBase, NfaWordBoundaryAndCase) {
    NfaMatcher bounded("\\brsa\\b", true);
    EXPECT_FALSE(bounded.matches("parsers"));
    EXPECT_FALSE(bounded.matches("rsa_key"));
    EXPECT_TRUE(bounded.matches("use RSA now"));
    EXPECT_TRUE(bounded.matches("rsa"));

    NfaMatcher sensitive("DES", false);
    EXPECT_TRUE(sensitive.matches("Cipher.getInstance(DES)"));
    EXPECT_FALSE(sensitive.matches("des"));

    NfaMatcher insensitive("keypairgenerator", true);
    EXPECT_TRUE(insensitive.matches("KeyPairGenerator.getInstance"));

    NfaMatcher dot("a.c");
    EXPECT_TRUE(dot.matches("abc"));
    EXPECT_FALSE(dot.matches("a\nc")) << "Dot does not cross a newline";

    LOG_INFO("PASS: Word boundary and case folding");
}

TEST_F(MatcherTestBase, NfaLinearOnAdversarialInput) {
    // === GIVEN (Input Conditions) ===
    // Nested stars that backtracking engines explore exponentially
    NfaMatcher nested("(a*)*b");
    NfaMatcher alternation("(a|aa)*c");
    ASSERT_TRUE(nested.valid());
    ASSERT_TRUE(alternation.valid());
    const std::string input(20000, 'a');

    // === WHEN (Action) ===
    const uint64_t start = Common::getNanosSinceEpoch();
    const bool nested_hit = nested.matches(input);
    const bool alternation_hit = alternation.matches(input);
    const double elapsed_ms = Common::elapsedMillis(start);

    // === THEN (Output Verification) ===
    EXPECT_FALSE(nested_hit);
    EXPECT_FALSE(alternation_hit);
    EXPECT_LT(elapsed_ms, 5000.0) << "Simulation must not blow up on pathological patterns";

    LOG_INFO("PASS: Adversarial input finished in %.2f ms", elapsed_ms);
}

// 3. UNIT TESTS - TOKEN BOUNDARIES

TEST_F(MatcherTestBase, TokenBoundaryRules) {
    // "rsa" inside an ordinary word is not a token
    EXPECT_FALSE(isTokenBoundary("parsers", 2, 5));
    EXPECT_FALSE(isTokenBoundary("ecdsa", 2, 5));

    // punctuation, underscores and camel-case steps separate tokens
    EXPECT_TRUE(isTokenBoundary("rsa.encrypt", 0, 3));
    EXPECT_TRUE(isTokenBoundary("RSA_sign", 0, 3));
    EXPECT_TRUE(isTokenBoundary("RSAPublicKey", 0, 3));
    EXPECT_TRUE(isTokenBoundary("getRSAKey", 3, 6));
    EXPECT_TRUE(isTokenBoundary("md5sum", 0, 3)) << "Digit-to-letter step ends a token";

    EXPECT_FALSE(isTokenBoundary("abc", 2, 2)) << "Empty range";
    EXPECT_FALSE(isTokenBoundary("abc", 1, 9)) << "Range past the end";

    LOG_INFO("PASS: Token boundaries");
}

// 4. UNIT TESTS - COMPILED MATCHERS

TEST_F(MatcherTestBase, CompileValidatesSpecs) {
    CompiledMatcher matcher;
    std::string error;

    EXPECT_FALSE(CompiledMatcher::compile(TextualSpec{{}}, matcher, error));
    EXPECT_FALSE(error.empty());

    error.clear();
    EXPECT_FALSE(CompiledMatcher::compile(TextualSpec{{"md5", ""}}, matcher, error));
    EXPECT_NE(error.find("empty"), std::string::npos);

    error.clear();
    EXPECT_FALSE(CompiledMatcher::compile(CallShapeSpec{"^rsa", true}, matcher, error));
    EXPECT_NE(error.find("unsupported operator"), std::string::npos);

    error.clear();
    EXPECT_FALSE(CompiledMatcher::compile(ImportCorroboratedSpec{{"oaep"}, {}}, matcher, error));
    EXPECT_NE(error.find("required imports"), std::string::npos);

    ASSERT_TRUE(CompiledMatcher::compile(CallShapeSpec{"rsa\\.sign", true}, matcher, error));
    EXPECT_EQ(matcher.kind(), MatcherKind::CALL_SHAPE);

    LOG_INFO("PASS: Matcher specs validated");
}

TEST_F(MatcherTestBase, TextualMatcherPrefersEarliestToken) {
    CompiledMatcher matcher;
    std::string error;
    ASSERT_TRUE(CompiledMatcher::compile(TextualSpec{{"sha1", "SHA-1"}}, matcher, error)) << error;
    EXPECT_EQ(matcher.kind(), MatcherKind::TEXTUAL);

    MatchSpan span;
    EXPECT_EQ(findIn(matcher, "digest = SHA-1 then sha1()", {}, span), MatchOutcome::MATCH);
    EXPECT_EQ(span.begin, 9u) << "Earliest token occurrence is reported";
    EXPECT_EQ(span.end, 14u);

    EXPECT_EQ(findIn(matcher, "xsha1 = 1", {}, span), MatchOutcome::NO_MATCH);
    EXPECT_EQ(findIn(matcher, "hashlib.SHA1(data)", {}, span), MatchOutcome::MATCH)
        << "Tokens match case-insensitively";
    EXPECT_EQ(span.begin, 8u);

    LOG_INFO("PASS: Textual matcher");
}

TEST_F(MatcherTestBase, ImportCorroboratedMatcherNeedsImport) {
    // === GIVEN (Input Conditions) ===
    CompiledMatcher matcher;
    std::string error;
    ASSERT_TRUE(CompiledMatcher::compile(ImportCorroboratedSpec{{"oaep"}, {"Crypto"}}, matcher, error));
    const std::string line = "cipher = PKCS1_OAEP.new(key)";
    MatchSpan span;

    // === WHEN / THEN ===
    EXPECT_EQ(findIn(matcher, line, {}, span), MatchOutcome::NO_MATCH)
        << "No corroborating import, no match";
    EXPECT_EQ(findIn(matcher, line, {"os", "json"}, span), MatchOutcome::NO_MATCH);
    EXPECT_EQ(findIn(matcher, line, {"crypto.cipher"}, span), MatchOutcome::MATCH);
    EXPECT_EQ(span.begin, 15u);
    EXPECT_EQ(matcher.kind(), MatcherKind::IMPORT_CORROBORATED);

    LOG_INFO("PASS: Import-corroborated matcher");
}

TEST_F(MatcherTestBase, MismatchedLineViewFails) {
    CompiledMatcher matcher;
    std::string error;
    ASSERT_TRUE(CompiledMatcher::compile(TextualSpec{{"md5"}}, matcher, error));

    MatchSpan span;
    const std::string text = "md5(x)";
    const std::string lowered = "md5";
    EXPECT_EQ(matcher.find(LineView{text, lowered}, {}, span), MatchOutcome::FAILED)
        << "A view whose lowered copy does not line up cannot be evaluated";

    LOG_INFO("PASS: Mismatched view reported as failure");
}
