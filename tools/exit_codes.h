#pragma once

#include "scanner/types.h"

namespace CryptoAudit {

/// Process exit codes of crypto_audit_cli
enum class ExitCode : int {
  CLEAN = 0,        // no CRITICAL or HIGH finding
  CRITICAL = 1,
  HIGH = 2,
  CONFIG = 3,       // configuration or usage error, nothing scanned
  PARTIAL = 4,      // some files could not be analyzed
  INTERNAL = 5      // the scan itself failed
};

/// Exit code for an engine call that did not return a report
[[nodiscard]] inline auto exitCodeForFailure(const Status& status) noexcept -> ExitCode {
  return status.kind == ErrorKind::CONFIG_ERROR ? ExitCode::CONFIG : ExitCode::INTERNAL;
}

/// Exit code for a completed scan; severity outranks unreadable files
[[nodiscard]] inline auto exitCodeForReport(const AuditReport& report) noexcept -> ExitCode {
  if (report.risk_score.critical_count > 0) return ExitCode::CRITICAL;
  if (report.risk_score.high_count > 0) return ExitCode::HIGH;
  if (!report.metadata.file_errors.empty()) return ExitCode::PARTIAL;
  return ExitCode::CLEAN;
}

} // namespace CryptoAudit
