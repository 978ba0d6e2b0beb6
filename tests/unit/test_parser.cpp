#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include "common/logging.h"
#include "scanner/parser.h"

using namespace CryptoAudit;

class ParserTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::string log_file = "logs/test_parser_" + std::to_string(timestamp) + ".log";
        Common::initLogging(log_file.c_str());
        LOG_INFO("=== Starting Parser Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== Parser Test Completed ===");
        Common::shutdownLogging();
    }

    ParsedFile parseOk(const std::string& content, const std::string& path_or_language) {
        ParsedFile file;
        EXPECT_EQ(parser_.parse(content, path_or_language, file), ParseResult::OK)
            << "Parse of " << path_or_language << " should succeed";
        return file;
    }

    static std::vector<std::string> moduleNames(const ParsedFile& file) {
        std::vector<std::string> names;
        for (const auto& imp : file.imports) {
            names.push_back(imp.module);
        }
        return names;
    }

    static void expectOrderedFunctions(const ParsedFile& file) {
        for (size_t i = 0; i < file.functions.size(); ++i) {
            const auto& fn = file.functions[i];
            EXPECT_LE(fn.start_line, fn.end_line) << "Function " << fn.name << " has inverted range";
            if (i + 1 < file.functions.size()) {
                EXPECT_LT(fn.end_line, file.functions[i + 1].start_line)
                    << "Functions " << fn.name << " and " << file.functions[i + 1].name << " overlap";
            }
        }
    }

    Parser parser_;
};

// 1. UNIT TESTS - LANGUAGE RESOLUTION

TEST_F(ParserTestBase, ResolvesAliasesBeforeExtensions) {
    // === INPUT SPECIFICATION ===
    // Hints: bare aliases in mixed case, paths with known and unknown extensions

    // === EXPECTED OUTPUT SPECIFICATION ===
    // Aliases map case-insensitively; otherwise the extension decides; else UNKNOWN

    EXPECT_EQ(Parser::resolveLanguage("python"), Language::PYTHON);
    EXPECT_EQ(Parser::resolveLanguage("PY"), Language::PYTHON);
    EXPECT_EQ(Parser::resolveLanguage("golang"), Language::GO);
    EXPECT_EQ(Parser::resolveLanguage("c++"), Language::C_FAMILY);
    EXPECT_EQ(Parser::resolveLanguage("C#"), Language::C_FAMILY);
    EXPECT_EQ(Parser::resolveLanguage("src/main.rs"), Language::C_FAMILY);
    EXPECT_EQ(Parser::resolveLanguage("web/App.TSX"), Language::TYPESCRIPT);
    EXPECT_EQ(Parser::resolveLanguage("lib/index.mjs"), Language::JAVASCRIPT);
    EXPECT_EQ(Parser::resolveLanguage("com/acme/Keys.java"), Language::JAVA);
    EXPECT_EQ(Parser::resolveLanguage("Makefile"), Language::UNKNOWN);
    EXPECT_EQ(Parser::resolveLanguage("notes.txt"), Language::UNKNOWN);
    EXPECT_EQ(Parser::resolveLanguage("archive."), Language::UNKNOWN);
    EXPECT_EQ(Parser::resolveLanguage("dir.py/README"), Language::UNKNOWN);

    LOG_INFO("PASS: Language aliases and extensions resolved");
}

// 2. UNIT TESTS - LINE SPLITTING

TEST_F(ParserTestBase, LinesAreContiguousAndOneBased) {
    // === GIVEN (Input Conditions) ===
    const std::string content = "first\r\nsecond\n\tthird\nlast";

    // === WHEN (Action) ===
    auto file = parseOk(content, "notes.txt");

    // === THEN (Output Verification) ===
    ASSERT_EQ(file.lines.size(), 4u) << "Final segment without newline is a line";
    for (size_t i = 0; i < file.lines.size(); ++i) {
        EXPECT_EQ(file.lines[i].number, i + 1) << "Line numbers must be contiguous from 1";
    }
    EXPECT_EQ(file.lines[0].text, "first") << "CR of CRLF is stripped";
    EXPECT_EQ(file.lines[2].indent, 4u) << "Tab counts as four columns";
    EXPECT_EQ(file.byte_size, content.size());
    EXPECT_FALSE(file.degraded);

    LOG_INFO("PASS: Lines contiguous and 1-based");
}

TEST_F(ParserTestBase, EmptyAndTrailingNewlineInputs) {
    auto empty = parseOk("", "test.py");
    EXPECT_TRUE(empty.lines.empty()) << "Empty input has no lines";
    EXPECT_TRUE(empty.imports.empty());
    EXPECT_TRUE(empty.functions.empty());

    auto one = parseOk("x = 1\n", "test.py");
    EXPECT_EQ(one.lines.size(), 1u) << "Trailing newline does not open a new line";

    EXPECT_EQ(Parser::countLines(""), 0u);
    EXPECT_EQ(Parser::countLines("a"), 1u);
    EXPECT_EQ(Parser::countLines("a\n"), 1u);
    EXPECT_EQ(Parser::countLines("a\n\nb"), 3u);

    LOG_INFO("PASS: Empty and trailing-newline inputs");
}

// 3. UNIT TESTS - COMMENTS AND STRINGS

TEST_F(ParserTestBase, PythonCommentsAndDocstrings) {
    // === GIVEN (Input Conditions) ===
    const std::string content =
        "# uses md5 somewhere\n"
        "x = \"a#b\"  # trailing rsa note\n"
        "def f():\n"
        "    \"\"\"Uses md5 internally.\n"
        "    more text\n"
        "    \"\"\"\n"
        "    return 1\n";

    // === WHEN (Action) ===
    auto file = parseOk(content, "python");

    // === THEN (Output Verification) ===
    ASSERT_EQ(file.lines.size(), 7u);
    EXPECT_TRUE(file.lines[0].is_comment) << "Whole-line # comment";

    EXPECT_FALSE(file.lines[1].is_comment) << "Code with trailing comment is code";
    EXPECT_NE(file.lines[1].code.find("a#b"), std::string::npos) << "# inside a string is not a comment";
    EXPECT_EQ(file.lines[1].code.find("rsa"), std::string::npos) << "Trailing comment is blanked";
    EXPECT_EQ(file.lines[1].code.size(), file.lines[1].text.size()) << "Blanking keeps byte columns";
    ASSERT_EQ(file.lines[1].strings.size(), 1u);
    EXPECT_EQ(file.lines[1].strings[0].begin, 4u);

    EXPECT_TRUE(file.lines[3].is_comment) << "Docstring opening line";
    EXPECT_TRUE(file.lines[4].is_comment) << "Docstring body";
    EXPECT_TRUE(file.lines[5].is_comment) << "Docstring closing line";
    EXPECT_FALSE(file.lines[6].is_comment);

    LOG_INFO("PASS: Python comments and docstrings");
}

TEST_F(ParserTestBase, BlockCommentsSpanLines) {
    auto file = parseOk(
        "/* start\n"
        "   rsa middle\n"
        "   end */ int x;\n"
        "int y; // des\n", "legacy.c");

    ASSERT_EQ(file.lines.size(), 4u);
    EXPECT_TRUE(file.lines[0].is_comment);
    EXPECT_TRUE(file.lines[1].is_comment) << "Inside block comment";
    EXPECT_FALSE(file.lines[2].is_comment) << "Code after the block comment closes";
    EXPECT_EQ(file.lines[2].code.find("end"), std::string::npos);
    EXPECT_NE(file.lines[2].code.find("int x;"), std::string::npos);
    EXPECT_FALSE(file.lines[3].is_comment);
    EXPECT_EQ(file.lines[3].code.find("des"), std::string::npos);

    LOG_INFO("PASS: Block comments");
}

TEST_F(ParserTestBase, CommentMarkersInsideStringsAreCode) {
    auto js = parseOk("const s = \"// not a comment\";\n"
                      "const q = `\n"
                      "  md5 ${x}\n"
                      "`;\n", "javascript");

    ASSERT_EQ(js.lines.size(), 4u);
    EXPECT_FALSE(js.lines[0].is_comment);
    EXPECT_NE(js.lines[0].code.find("// not a comment"), std::string::npos);
    ASSERT_EQ(js.lines[0].strings.size(), 1u);
    EXPECT_FALSE(js.lines[2].is_comment) << "Template literal body is string, not comment";
    EXPECT_FALSE(js.lines[2].strings.empty()) << "Template literal continues across lines";

    auto rust = parseOk("fn parse<'a>(s: &'a str) -> &'a str {\n"
                        "    // md5 here\n"
                        "    s\n"
                        "}\n", "rust");
    ASSERT_EQ(rust.lines.size(), 4u);
    EXPECT_TRUE(rust.lines[0].strings.empty()) << "Lifetimes are not char literals";
    EXPECT_TRUE(rust.lines[1].is_comment);

    LOG_INFO("PASS: Strings protect comment markers");
}

TEST_F(ParserTestBase, StripCommentsDisabledKeepsRawText) {
    // === INPUT SPECIFICATION ===
    // "# md5 note" followed by code, parsed with strip_comments = false

    // === EXPECTED OUTPUT SPECIFICATION ===
    // Lines are still annotated; only the file-level flag changes

    Parser raw_parser(ParserLimits{1024, 100, false});
    ParsedFile file;
    ASSERT_EQ(raw_parser.parse("# md5 note\nx = 1  # rsa\n", "python", file), ParseResult::OK);

    EXPECT_FALSE(file.comments_stripped);
    ASSERT_EQ(file.lines.size(), 2u);
    EXPECT_TRUE(file.lines[0].is_comment) << "Comment annotation survives raw mode";
    EXPECT_EQ(file.lines[0].text, "# md5 note");
    EXPECT_FALSE(file.lines[1].is_comment);
    EXPECT_EQ(file.lines[1].text, "x = 1  # rsa");
    EXPECT_EQ(file.lines[1].code.find("rsa"), std::string::npos) << "code is the comment-blanked view";

    LOG_INFO("PASS: Comment stripping can be disabled");
}

TEST_F(ParserTestBase, RawStringsHideQuotes) {
    // === INPUT SPECIFICATION ===
    // C++ R"(...)" and R"delim(...)delim", Rust r#"..."#, each holding a bare quote

    // === EXPECTED OUTPUT SPECIFICATION ===
    // One string span per literal; code after the literal stays outside any span

    // === GIVEN / WHEN ===
    auto cpp = parseOk("auto s = R\"(\")\"; RSA_generate_key(1024);\n", "legacy.cpp");
    auto multi = parseOk("const char* q = R\"sql(\n"
                         "SELECT \"x\" FROM t\n"
                         ")sql\"; md5(x);\n", "query.cc");
    auto rust = parseOk("let s = r#\"not \" rsa \"#; md5(x);\n", "rust");

    // === THEN (Output Verification) ===
    ASSERT_EQ(cpp.lines[0].strings.size(), 1u);
    EXPECT_EQ(cpp.lines[0].strings[0].begin, 9u);
    EXPECT_EQ(cpp.lines[0].strings[0].end, 15u);

    ASSERT_EQ(multi.lines.size(), 3u);
    ASSERT_EQ(multi.lines[1].strings.size(), 1u) << "Raw string continues across lines";
    EXPECT_EQ(multi.lines[1].strings[0].begin, 0u);
    EXPECT_EQ(multi.lines[1].strings[0].end, static_cast<uint32_t>(multi.lines[1].text.size()));
    ASSERT_EQ(multi.lines[2].strings.size(), 1u);
    EXPECT_EQ(multi.lines[2].strings[0].end, 5u) << "Closes at the )sql\" terminator only";

    ASSERT_EQ(rust.lines[0].strings.size(), 1u);
    EXPECT_EQ(rust.lines[0].strings[0].begin, 8u);
    EXPECT_EQ(rust.lines[0].strings[0].end, 23u);

    auto identifiers = parseOk("for r in rows { bar(\"x\"); }\n", "rust");
    ASSERT_EQ(identifiers.lines[0].strings.size(), 1u) << "Identifiers ending in r are not raw prefixes";
    EXPECT_EQ(identifiers.lines[0].strings[0].begin, 20u);

    LOG_INFO("PASS: Raw strings lexed");
}

TEST_F(ParserTestBase, TemplateSubstitutionsAreCode) {
    // === GIVEN (Input Conditions) ===
    // Substitution holding a quoted backtick: ${a + "`"}
    auto js = parseOk("const t = `${a + \"`\"}`; md5(x);\n"
                      "const u = `pre ${\n"
                      "  { k: 1 }.k\n"
                      "} post`;\n", "javascript");

    // === THEN (Output Verification) ===
    ASSERT_EQ(js.lines.size(), 4u);
    const auto& spans = js.lines[0].strings;
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0].begin, 10u);
    EXPECT_EQ(spans[0].end, 11u);
    EXPECT_EQ(spans[1].begin, 17u) << "String inside the substitution";
    EXPECT_EQ(spans[1].end, 20u);
    EXPECT_EQ(spans[2].begin, 21u) << "Template resumes after the closing brace";
    EXPECT_EQ(spans[2].end, 22u);

    EXPECT_TRUE(js.lines[2].strings.empty()) << "Multi-line substitution body is code";
    ASSERT_EQ(js.lines[3].strings.size(), 1u);
    EXPECT_EQ(js.lines[3].strings[0].begin, 1u);
    EXPECT_EQ(js.lines[3].strings[0].end, 7u);

    LOG_INFO("PASS: Template substitutions lexed as code");
}

TEST_F(ParserTestBase, TripleQuotesOnContinuationLinesAreStrings) {
    auto file = parseOk("check(\n"
                        "    \"\"\"RSA_generate_key\"\"\")\n"
                        "x = \\\n"
                        "    '''md5'''\n"
                        "def f():\n"
                        "    \"\"\"Docstring.\"\"\"\n", "python");

    ASSERT_EQ(file.lines.size(), 6u);
    EXPECT_FALSE(file.lines[1].is_comment) << "Inside an open call";
    ASSERT_EQ(file.lines[1].strings.size(), 1u);
    EXPECT_NE(file.lines[1].code.find("RSA_generate_key"), std::string::npos);
    EXPECT_FALSE(file.lines[3].is_comment) << "After a backslash continuation";
    EXPECT_TRUE(file.lines[5].is_comment) << "Statement-level docstring";

    LOG_INFO("PASS: Continuation-line strings");
}

// 4. UNIT TESTS - IMPORTS

TEST_F(ParserTestBase, PythonImports) {
    auto file = parseOk("import os, hashlib as h\n"
                        "from cryptography.hazmat.primitives import hashes\n"
                        "# import rsa\n", "app.py");

    const std::vector<std::string> expected = {"os", "hashlib", "cryptography.hazmat.primitives"};
    EXPECT_EQ(moduleNames(file), expected);
    ASSERT_EQ(file.imports.size(), 3u);
    EXPECT_EQ(file.imports[0].line, 1u);
    EXPECT_EQ(file.imports[2].line, 2u);

    LOG_INFO("PASS: Python imports");
}

TEST_F(ParserTestBase, ScriptImports) {
    auto file = parseOk("import crypto from 'crypto';\n"
                        "const forge = require(\"node-forge\");\n"
                        "import './side-effect.js';\n", "server.ts");

    const std::vector<std::string> expected = {"crypto", "node-forge", "./side-effect.js"};
    EXPECT_EQ(moduleNames(file), expected);

    LOG_INFO("PASS: JavaScript/TypeScript imports");
}

TEST_F(ParserTestBase, GoImportBlocks) {
    auto file = parseOk("package main\n"
                        "\n"
                        "import (\n"
                        "\t\"crypto/md5\"\n"
                        "\tsha \"crypto/sha1\"\n"
                        ")\n"
                        "\n"
                        "import \"fmt\"\n", "main.go");

    const std::vector<std::string> expected = {"crypto/md5", "crypto/sha1", "fmt"};
    EXPECT_EQ(moduleNames(file), expected);
    ASSERT_EQ(file.imports.size(), 3u);
    EXPECT_EQ(file.imports[0].line, 4u);
    EXPECT_EQ(file.imports[2].line, 8u);

    LOG_INFO("PASS: Go imports");
}

TEST_F(ParserTestBase, JavaAndCFamilyImports) {
    auto java = parseOk("import java.security.KeyPairGenerator;\n"
                        "import static org.junit.Assert.*;\n", "Keys.java");
    const std::vector<std::string> java_expected = {"java.security.KeyPairGenerator", "org.junit.Assert.*"};
    EXPECT_EQ(moduleNames(java), java_expected);

    auto c_family = parseOk("#include <openssl/rsa.h>\n"
                            "#include \"local.h\"\n"
                            "use ring::signature;\n"
                            "using System.Security.Cryptography;\n", "c_family");
    const std::vector<std::string> c_expected = {
        "openssl/rsa.h", "local.h", "ring::signature", "System.Security.Cryptography"};
    EXPECT_EQ(moduleNames(c_family), c_expected);

    LOG_INFO("PASS: Java and C-family imports");
}

// 5. UNIT TESTS - FUNCTION BOUNDARIES

TEST_F(ParserTestBase, PythonFunctionsByIndentation) {
    auto file = parseOk("import hashlib\n"
                        "\n"
                        "def sign_payload(data):\n"
                        "    digest = hashlib.sha1(data)\n"
                        "    return digest\n"
                        "\n"
                        "class Foo:\n"
                        "    def method(self):\n"
                        "        pass\n"
                        "\n"
                        "x = 1\n", "python");

    ASSERT_EQ(file.functions.size(), 2u);
    EXPECT_EQ(file.functions[0].name, "sign_payload");
    EXPECT_EQ(file.functions[0].start_line, 3u);
    EXPECT_EQ(file.functions[0].end_line, 5u);
    EXPECT_EQ(file.functions[1].name, "method");
    expectOrderedFunctions(file);

    LOG_INFO("PASS: Python functions");
}

TEST_F(ParserTestBase, BraceFunctionsIgnoreBracesInStrings) {
    // === GIVEN (Input Conditions) ===
    const std::string c_source =
        "int main() {\n"
        "  const char* s = \"}{\";\n"
        "  return 0;\n"
        "}\n"
        "void helper(void) { }\n";

    // === WHEN (Action) ===
    auto file = parseOk(c_source, "main.c");

    // === THEN (Output Verification) ===
    ASSERT_EQ(file.functions.size(), 2u);
    EXPECT_EQ(file.functions[0].name, "main");
    EXPECT_EQ(file.functions[0].start_line, 1u);
    EXPECT_EQ(file.functions[0].end_line, 4u) << "Braces inside the string literal are ignored";
    EXPECT_EQ(file.functions[1].name, "helper");
    EXPECT_EQ(file.functions[1].start_line, 5u);
    expectOrderedFunctions(file);

    LOG_INFO("PASS: Brace functions");
}

TEST_F(ParserTestBase, GoJavaAndScriptFunctions) {
    auto go = parseOk("package main\n"
                      "\n"
                      "func hashIt(b []byte) []byte {\n"
                      "\th := md5.Sum(b)\n"
                      "\treturn h[:]\n"
                      "}\n"
                      "\n"
                      "func (s *Server) Handle() {\n"
                      "\tif x {\n"
                      "\t\ty()\n"
                      "\t}\n"
                      "}\n", "go");
    ASSERT_EQ(go.functions.size(), 2u);
    EXPECT_EQ(go.functions[0].name, "hashIt");
    EXPECT_EQ(go.functions[1].name, "Handle") << "Receiver is skipped";
    EXPECT_EQ(go.functions[1].end_line, 12u);
    expectOrderedFunctions(go);

    auto java = parseOk("public class Crypto {\n"
                        "    public KeyPair generate() throws Exception {\n"
                        "        KeyPairGenerator g = KeyPairGenerator.getInstance(\"RSA\");\n"
                        "        return g.generateKeyPair();\n"
                        "    }\n"
                        "}\n", "java");
    ASSERT_EQ(java.functions.size(), 1u);
    EXPECT_EQ(java.functions[0].name, "generate");
    EXPECT_EQ(java.functions[0].start_line, 2u);
    EXPECT_EQ(java.functions[0].end_line, 5u);

    auto js = parseOk("function signToken(payload) {\n"
                      "  return jwt.sign(payload, key);\n"
                      "}\n"
                      "const verify = async (token) => {\n"
                      "  return true;\n"
                      "};\n", "js");
    ASSERT_EQ(js.functions.size(), 2u);
    EXPECT_EQ(js.functions[0].name, "signToken");
    EXPECT_EQ(js.functions[1].name, "verify");
    expectOrderedFunctions(js);

    LOG_INFO("PASS: Go, Java and script functions");
}

TEST_F(ParserTestBase, UnbalancedBracesStayOrdered) {
    // Heuristic boundaries: only ordering and non-overlap are guaranteed
    auto file = parseOk("void a() {\n"
                        "  if (x) {\n"
                        "void b() {\n"
                        "}\n"
                        "}}}\n"
                        "void c() { return; }\n"
                        "void d() {\n", "broken.cpp");

    expectOrderedFunctions(file);
    for (const auto& fn : file.functions) {
        EXPECT_GE(fn.start_line, 1u);
        EXPECT_LE(fn.end_line, file.lines.size());
    }

    LOG_INFO("PASS: Unbalanced braces keep boundaries ordered");
}

// 6. UNIT TESTS - DECODING AND LIMITS

TEST_F(ParserTestBase, InvalidUtf8DegradesGracefully) {
    // === INPUT SPECIFICATION ===
    // Content: a valid line, a line with bytes 0xFF 0xFE, an import line

    // === EXPECTED OUTPUT SPECIFICATION ===
    // Parse succeeds, file marked degraded, invalid bytes become U+FFFD,
    // lines after the bad bytes are still analyzed

    auto file = parseOk("x = 1\n\xff\xfe bad\nimport rsa\n", "python");

    EXPECT_TRUE(file.degraded);
    ASSERT_EQ(file.lines.size(), 3u);
    EXPECT_EQ(file.lines[1].text, "\xEF\xBF\xBD\xEF\xBF\xBD bad");
    ASSERT_EQ(file.imports.size(), 1u);
    EXPECT_EQ(file.imports[0].module, "rsa");

    LOG_INFO("PASS: Invalid UTF-8 degraded, not rejected");
}

TEST_F(ParserTestBase, DecodeLossyRejectsOverlongAndSurrogates) {
    std::string out;

    EXPECT_TRUE(Parser::decodeLossy("h\xC3\xA9llo", out));
    EXPECT_EQ(out, "h\xC3\xA9llo") << "Valid multibyte sequence is kept";

    EXPECT_FALSE(Parser::decodeLossy("\xC0\xAF", out));
    EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD") << "Overlong encoding replaced byte by byte";

    EXPECT_FALSE(Parser::decodeLossy("\xED\xA0\x80", out));
    EXPECT_EQ(out, "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD") << "UTF-16 surrogate rejected";

    EXPECT_FALSE(Parser::decodeLossy("ok\xE2\x82", out));
    EXPECT_EQ(out, "ok\xEF\xBF\xBD\xEF\xBF\xBD") << "Truncated sequence at end of input";

    LOG_INFO("PASS: Lossy decoding");
}

TEST_F(ParserTestBase, SizeAndLineLimits) {
    Parser small(ParserLimits{10, 2, true});
    ParsedFile file;

    EXPECT_EQ(small.parse("0123456789A", "a.py", file), ParseResult::INPUT_TOO_LARGE);
    EXPECT_EQ(small.parse("a\nb\nc", "a.py", file), ParseResult::INPUT_TOO_LARGE);
    EXPECT_EQ(small.parse("a\nb\n", "a.py", file), ParseResult::OK);
    EXPECT_EQ(file.lines.size(), 2u);

    LOG_INFO("PASS: Size and line limits");
}
