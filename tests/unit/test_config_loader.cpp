#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "common/logging.h"
#include "config/config_loader.h"

using namespace CryptoAudit;

class ConfigLoaderTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        test_timestamp_ = std::to_string(std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
        log_file_ = "logs/test_config_loader_" + test_timestamp_ + ".log";
        Common::initLogging(log_file_.c_str());
        LOG_INFO("=== Starting ConfigLoader Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== ConfigLoader Test Completed ===");
        Common::shutdownLogging();
        if (!temp_config_.empty()) {
            std::error_code ec;
            std::filesystem::remove(temp_config_, ec);
        }
    }

    std::string readLog() {
        if (Common::g_logger) Common::g_logger->flush();
        std::ifstream file(log_file_);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::string writeTempConfig(const std::string& text) {
        temp_config_ = "logs/config_loader_" + test_timestamp_ + ".toml";
        std::ofstream out(temp_config_);
        out << text;
        return temp_config_;
    }

    std::string test_timestamp_;
    std::string log_file_;
    std::string temp_config_;
};

static const char* FULL_CONFIG = R"(# scanner settings
[audit]
severity_threshold = "high"       # case-insensitive
include_patterns = ["QV-RSA-KEYGEN", "WK-MD5"]
exclude_patterns = [
  "WK-JWT-RSA",   # noisy in token libraries
  "WK-SHA1",
]
max_input_size = 1_048_576
max_lines = 20_000
strip_comments = false
min_confidence = 0.55
report_timestamp = "2026-10-18T09:30:00Z"

[confidence]
textual_base = 0.65
structural_base = 0.7
import_corroborated_base = 0.85
crypto_function_boost = 0.1
import_boost = 0.15
label_string_penalty = 0.4

[performance]
worker_threads = 8
numa_node = 0
enable_parse_cache = true
parse_cache_max_entries = 256

[logging]
log_file = "logs/audit #1.log"
level = "warn"
)";

// 1. UNIT TESTS - PARSING

TEST_F(ConfigLoaderTestBase, LoadsEverySection) {
    // === INPUT SPECIFICATION ===
    // TOML text with all four sections, a multi-line array with comments,
    // digit separators, and a '#' inside a quoted string

    // === EXPECTED OUTPUT SPECIFICATION ===
    // Every key lands in AuditConfig or LoggingSettings with its typed value

    // === GIVEN (Input Conditions) ===
    AuditConfig config;
    LoggingSettings logging;

    // === WHEN (Action) ===
    ASSERT_TRUE(ConfigLoader::loadFromString(FULL_CONFIG, config, &logging));

    // === THEN (Output Verification) ===
    EXPECT_EQ(config.severity_threshold, Severity::HIGH);
    EXPECT_EQ(config.include_patterns, (std::vector<std::string>{"QV-RSA-KEYGEN", "WK-MD5"}));
    EXPECT_EQ(config.exclude_patterns, (std::vector<std::string>{"WK-JWT-RSA", "WK-SHA1"}));
    EXPECT_EQ(config.max_input_size, 1048576u);
    EXPECT_EQ(config.max_lines, 20000u);
    EXPECT_FALSE(config.strip_comments);
    EXPECT_DOUBLE_EQ(config.min_confidence, 0.55);
    EXPECT_EQ(config.report_timestamp, "2026-10-18T09:30:00Z");

    EXPECT_DOUBLE_EQ(config.confidence.textual_base, 0.65);
    EXPECT_DOUBLE_EQ(config.confidence.structural_base, 0.7);
    EXPECT_DOUBLE_EQ(config.confidence.import_corroborated_base, 0.85);
    EXPECT_DOUBLE_EQ(config.confidence.crypto_function_boost, 0.1);
    EXPECT_DOUBLE_EQ(config.confidence.import_boost, 0.15);
    EXPECT_DOUBLE_EQ(config.confidence.label_string_penalty, 0.4);

    EXPECT_EQ(config.worker_threads, 8u);
    EXPECT_EQ(config.numa_node, 0);
    EXPECT_TRUE(config.enable_parse_cache);
    EXPECT_EQ(config.parse_cache_max_entries, 256u);

    EXPECT_EQ(logging.log_file, "logs/audit #1.log") << "'#' inside quotes is not a comment";
    EXPECT_EQ(logging.level, Common::Logger::WARN);

    ConfigLoader::printConfig(config);

    LOG_INFO("PASS: All sections loaded");
}

TEST_F(ConfigLoaderTestBase, AbsentKeysKeepExistingValues) {
    AuditConfig config;
    config.max_lines = 42;
    config.tool_version = "9.9.9";

    ASSERT_TRUE(ConfigLoader::loadFromString("[performance]\nworker_threads = 3\n", config));
    EXPECT_EQ(config.worker_threads, 3u);
    EXPECT_EQ(config.max_lines, 42u);
    EXPECT_EQ(config.tool_version, "9.9.9");
    EXPECT_EQ(config.severity_threshold, Severity::INFO);

    ASSERT_TRUE(ConfigLoader::loadFromString("", config)) << "Empty text is a valid config";
    ASSERT_TRUE(ConfigLoader::loadFromString("[audit]\nexclude_patterns = []\n", config));
    EXPECT_TRUE(config.exclude_patterns.empty());

    LOG_INFO("PASS: Absent keys untouched");
}

TEST_F(ConfigLoaderTestBase, UnknownKeysAreIgnoredWithWarning) {
    AuditConfig config;
    ASSERT_TRUE(ConfigLoader::loadFromString(
        "[audit]\nfuture_option = 7\n[plugins]\nname = \"x\"\n[audit]\nmax_lines = 10\n", config));
    EXPECT_EQ(config.max_lines, 10u);

    const std::string log = readLog();
    EXPECT_NE(log.find("ignoring unknown key [audit] future_option"), std::string::npos);
    EXPECT_NE(log.find("ignoring unknown key [plugins] name"), std::string::npos);

    LOG_INFO("PASS: Unknown keys warned");
}

// 2. ERROR HANDLING TESTS

TEST_F(ConfigLoaderTestBase, MalformedValuesFailWithoutSideEffects) {
    // === INPUT SPECIFICATION ===
    // Configs that each carry one malformed line after valid ones

    // === EXPECTED OUTPUT SPECIFICATION ===
    // loadFromString returns false and leaves config and logging untouched

    const std::vector<std::string> bad_inputs = {
        "[audit]\nmax_lines = 5\nseverity_threshold = \"SEVERE\"\n",
        "[audit]\nmax_lines = 5\nseverity_threshold = HIGH\n",
        "[audit]\nmax_lines = 5\njust some words\n",
        "[audit]\nmax_lines = 5\nmax_input_size = -1\n",
        "[audit]\nmax_lines = 5\nmax_input_size = 12kb\n",
        "[audit]\nmax_lines = 5\nstrip_comments = yes\n",
        "[audit]\nmax_lines = 5\nmin_confidence = nan\n",
        "[audit]\nmax_lines = 5\ninclude_patterns = [\"WK-MD5\" \"WK-SHA1\"]\n",
        "[audit]\nmax_lines = 5\nexclude_patterns = [\n  \"WK-MD5\",\n",
        "[audit\nmax_lines = 5\n",
        "[audit]\nmax_lines =\n",
        "[audit]\nreport_timestamp = \"bad\\qescape\"\n",
        "[performance]\nnuma_node = -2\n",
        "[performance]\nworker_threads = 5_000_000_000\n",
        "[logging]\nlevel = \"verbose\"\n",
    };

    for (size_t i = 0; i < bad_inputs.size(); ++i) {
        // === GIVEN (Input Conditions) ===
        AuditConfig config;
        config.max_lines = 77;
        LoggingSettings logging;
        logging.log_file = "unchanged.log";

        // === WHEN (Action) ===
        const bool loaded = ConfigLoader::loadFromString(bad_inputs[i], config, &logging);

        // === THEN (Output Verification) ===
        EXPECT_FALSE(loaded) << "Input " << i << " should be rejected";
        EXPECT_EQ(config.max_lines, 77u) << "Input " << i << " leaked a partial update";
        EXPECT_EQ(config.severity_threshold, Severity::INFO);
        EXPECT_EQ(logging.log_file, "unchanged.log");
        EXPECT_EQ(logging.level, Common::Logger::INFO);
    }

    LOG_INFO("PASS: %zu malformed configs rejected", bad_inputs.size());
}

// 3. FILE LOADING TESTS

TEST_F(ConfigLoaderTestBase, LoadsFromFile) {
    const std::string path = writeTempConfig(FULL_CONFIG);

    AuditConfig config;
    LoggingSettings logging;
    ASSERT_TRUE(ConfigLoader::loadFromFile(path.c_str(), config, &logging));
    EXPECT_EQ(config.severity_threshold, Severity::HIGH);
    EXPECT_EQ(config.worker_threads, 8u);
    EXPECT_EQ(logging.level, Common::Logger::WARN);

    EXPECT_NE(readLog().find("Configuration loaded from " + path), std::string::npos);

    LOG_INFO("PASS: File config loaded");
}

TEST_F(ConfigLoaderTestBase, MissingOrInvalidFileFails) {
    AuditConfig config;
    config.max_lines = 77;

    EXPECT_FALSE(ConfigLoader::loadFromFile("logs/does_not_exist.toml", config));
    EXPECT_EQ(config.max_lines, 77u);

    const std::string path = writeTempConfig("[audit]\nmax_lines = ten\n");
    EXPECT_FALSE(ConfigLoader::loadFromFile(path.c_str(), config));
    EXPECT_EQ(config.max_lines, 77u);

    const std::string log = readLog();
    EXPECT_NE(log.find("Cannot open config file: logs/does_not_exist.toml"), std::string::npos);
    EXPECT_NE(log.find("Failed to parse TOML config file"), std::string::npos);

    LOG_INFO("PASS: Missing and invalid files rejected");
}
