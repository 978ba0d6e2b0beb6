#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <vector>

#include "common/logging.h"
#include "scanner/audit_engine.h"
#include "scanner/report_json.h"

using namespace CryptoAudit;

class ReportJsonTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        auto timestamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        std::string log_file = "logs/test_report_json_" + std::to_string(timestamp) + ".log";
        Common::initLogging(log_file.c_str());
        LOG_INFO("=== Starting ReportJson Test ===");
    }

    void TearDown() override {
        LOG_INFO("=== ReportJson Test Completed ===");
        Common::shutdownLogging();
    }

    // Batch report touching every field: findings, weak keys, file errors, degraded files
    static AuditReport sampleReport() {
        AuditConfig config;
        config.max_input_size = 4096;
        config.report_timestamp = "2026-10-18T09:30:00Z";
        Status status;
        auto engine = AuditEngine::create(config, &status);
        EXPECT_NE(engine, nullptr) << status.message;
        if (!engine) return AuditReport{};

        const std::vector<SourceFile> files = {
            {"keys/gen.py", "import rsa\nkey = rsa.generate_private_key(public_exponent=65537, key_size=1024)\n"},
            {"svc/hash.go", "package svc\n\nimport \"crypto/md5\"\n\nfunc Sum(b []byte) [16]byte { return md5.Sum(b) }\n"},
            {"web/kex.js", "const ecdh = crypto.createECDH('prime256v1');\n"},
            {"bin/latin1.py", "name = \"caf\xe9\"\nh = hashlib.sha1(name)\n"},
            {"../outside.py", "import hashlib\n"},
        };
        AuditReport report;
        EXPECT_TRUE(engine->auditMany(files, report).ok());
        return report;
    }
};

// 1. UNIT TESTS - ROUND TRIP

TEST_F(ReportJsonTestBase, EngineReportRoundTrips) {
    // === INPUT SPECIFICATION ===
    // Report: batch audit with critical, high and degraded files plus one rejected path

    // === EXPECTED OUTPUT SPECIFICATION ===
    // fromJson(toJson(report)) == report, field for field, compact and pretty

    // === GIVEN (Input Conditions) ===
    const AuditReport original = sampleReport();
    ASSERT_FALSE(original.findings.empty());
    ASSERT_FALSE(original.metadata.file_errors.empty());
    ASSERT_FALSE(original.summary.weak_key_sizes.empty());
    ASSERT_EQ(original.metadata.degraded_files, 1u);

    // === WHEN (Action) ===
    const std::string compact = toJson(original);
    const std::string pretty = toJson(original, true);

    AuditReport from_compact;
    AuditReport from_pretty;
    ASSERT_TRUE(fromJson(compact, from_compact));
    ASSERT_TRUE(fromJson(pretty, from_pretty));

    // === THEN (Output Verification) ===
    EXPECT_EQ(from_compact, original) << "Compact JSON must round-trip exactly";
    EXPECT_EQ(from_pretty, original) << "Pretty JSON must round-trip exactly";
    EXPECT_EQ(toJson(from_compact), compact) << "Re-serialization is byte-identical";
    EXPECT_EQ(compact.find('\n'), std::string::npos);
    EXPECT_NE(pretty.find("\n  \"findings\""), std::string::npos) << "Pretty output indents by two";

    LOG_INFO("PASS: Report round-trips (%zu bytes compact)", compact.size());
}

TEST_F(ReportJsonTestBase, SchemaUsesDocumentedKeys) {
    const std::string json = toJson(sampleReport());

    const char* keys[] = {
        "\"findings\":", "\"pattern_id\":", "\"severity\":\"CRITICAL\"", "\"family\":\"INTEGER_FACTORIZATION_PK\"",
        "\"location\":{\"path\":", "\"snippet\":", "\"confidence\":", "\"quantum_vulnerable\":true",
        "\"key_size\":1024", "\"risk_score\":{\"total\":", "\"level\":", "\"summary\":{\"files_scanned\":4",
        "\"weak_key_sizes\":[\"RSA 1024-bit\"]", "\"metadata\":{\"tool_version\":\"" CRYPTO_AUDIT_VERSION "\"",
        "\"timestamp\":\"2026-10-18T09:30:00Z\"", "\"kind\":\"INVALID_INPUT\"", "\"degraded_files\":1",
    };
    for (const char* key : keys) {
        EXPECT_NE(json.find(key), std::string::npos) << "Missing " << key;
    }

    LOG_INFO("PASS: Schema keys present");
}

TEST_F(ReportJsonTestBase, StringsWithEscapesRoundTrip) {
    AuditReport report;
    Finding f;
    f.id = "F-0123456789abcdef";
    f.pattern_id = "WK-MD5";
    f.severity = Severity::HIGH;
    f.family = PrimitiveFamily::BROKEN_HASH;
    f.location = SourceLocation{"dir with space/\xc3\xa9t\xc3\xa9.py", 7, 3,
                                "print(\"md5\\t\\\"quoted\\\"\")\t\x01"};
    f.description = "line1\nline2";
    f.recommendation = "use SHA-256 \xc2\xb5 or BLAKE2";
    f.confidence = 0.1 + 0.2;
    report.findings.push_back(f);
    report.risk_score.total = 7.0 * f.confidence;
    report.risk_score.normalized = report.risk_score.total / 1.234;
    report.summary.lines_scanned = 1234;

    AuditReport parsed;
    ASSERT_TRUE(fromJson(toJson(report), parsed));
    EXPECT_EQ(parsed, report);
    EXPECT_EQ(parsed.findings[0].confidence, 0.1 + 0.2) << "Doubles read back bit-exact";

    LOG_INFO("PASS: Escapes and doubles round-trip");
}

// 2. ERROR HANDLING TESTS

TEST_F(ReportJsonTestBase, MalformedOrIncompleteJsonIsRejected) {
    const std::string valid = toJson(sampleReport());

    auto without = [&valid](const std::string& fragment, const std::string& replacement) {
        std::string copy = valid;
        const size_t pos = copy.find(fragment);
        EXPECT_NE(pos, std::string::npos) << "Fixture lacks " << fragment;
        if (pos != std::string::npos) copy.replace(pos, fragment.size(), replacement);
        return copy;
    };

    const std::vector<std::string> bad_inputs = {
        "",
        "not json",
        "[]",
        "{}",
        valid.substr(0, valid.size() / 2),
        without("\"summary\":", "\"summery\":"),
        without("\"severity\":\"CRITICAL\"", "\"severity\":\"SEVERE\""),
        without("\"key_size\":1024", "\"key_size\":-1"),
        without("\"quantum_vulnerable\":true", "\"quantum_vulnerable\":1"),
        without("\"kind\":\"INVALID_INPUT\"", "\"kind\":42"),
    };

    for (size_t i = 0; i < bad_inputs.size(); ++i) {
        AuditReport report;
        report.summary.files_scanned = 77;
        EXPECT_FALSE(fromJson(bad_inputs[i], report)) << "Input " << i << " should be rejected";
        EXPECT_EQ(report, AuditReport{}) << "Report must be reset after rejecting input " << i;
    }

    LOG_INFO("PASS: Malformed JSON rejected");
}
