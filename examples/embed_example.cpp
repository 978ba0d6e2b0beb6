#include <cstdio>
#include <string>
#include <vector>

#include "common/logging.h"
#include "scanner/audit_engine.h"
#include "scanner/report_json.h"

// Embedding the audit core: in-memory sources in, report out.

namespace {

void singleFileExample(const CryptoAudit::AuditEngine& engine) {
  printf("=== auditOne ===\n");

  const char* source =
    "from cryptography.hazmat.primitives.asymmetric import rsa\n"
    "\n"
    "def make_signing_key():\n"
    "    # RSA-1024 kept for a legacy peer\n"
    "    return rsa.generate_private_key(public_exponent=65537, key_size=1024)\n";

  CryptoAudit::AuditReport report;
  const auto status = engine.auditOne(source, "keys/signing.py", report);
  if (!status.ok()) {
    printf("audit failed: %s (%s)\n", status.message.c_str(), CryptoAudit::toString(status.kind));
    return;
  }

  for (const auto& f : report.findings) {
    printf("  %s %s line %u col %u key=%u conf=%.2f\n", f.pattern_id.c_str(),
           CryptoAudit::toString(f.severity), f.location.line, f.location.column,
           f.key_size, f.confidence);
  }
  printf("  risk: %s (%.2f)\n\n", CryptoAudit::toString(report.risk_score.level),
         report.risk_score.normalized);
}

void batchExample(const CryptoAudit::AuditEngine& engine) {
  printf("=== auditMany ===\n");

  std::vector<CryptoAudit::SourceFile> files = {
    {"svc/hash.go", "package svc\n\nimport \"crypto/md5\"\n\nfunc Sum(b []byte) [16]byte { return md5.Sum(b) }\n"},
    {"web/token.js", "const jwt = require('jsonwebtoken');\nconst t = jwt.sign(claims, key, { algorithm: 'RS256' });\n"},
    {"lib/clean.rs", "fn add(a: u32, b: u32) -> u32 {\n    a + b\n}\n"},
    {"../escape.py", "import hashlib\n"},
  };

  CryptoAudit::AuditReport report;
  const auto status = engine.auditMany(files, report);
  if (!status.ok()) {
    printf("batch failed: %s\n", status.message.c_str());
    return;
  }

  printf("  files scanned: %u, lines: %llu, findings: %u\n", report.summary.files_scanned,
         static_cast<unsigned long long>(report.summary.lines_scanned), report.summary.total_findings);
  for (const auto& e : report.metadata.file_errors) {
    printf("  not analyzed: %s (%s)\n", e.path.c_str(), e.message.c_str());
  }
  printf("\n%s\n", CryptoAudit::toJson(report, true).c_str());
}

} // namespace

int main() {
  if (!Common::initLogging("logs/embed_example.log")) {
    fprintf(stderr, "logging unavailable, continuing\n");
  }

  CryptoAudit::AuditConfig config;
  config.severity_threshold = CryptoAudit::Severity::LOW;
  config.worker_threads = 2;
  config.report_timestamp = "2026-01-01T00:00:00Z";

  CryptoAudit::Status status;
  const auto engine = CryptoAudit::AuditEngine::create(config, &status);
  if (!engine) {
    fprintf(stderr, "engine: %s\n", status.message.c_str());
    Common::shutdownLogging();
    return 1;
  }

  singleFileExample(*engine);
  batchExample(*engine);

  Common::shutdownLogging();
  return 0;
}
