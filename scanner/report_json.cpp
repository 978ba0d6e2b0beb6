#include "scanner/report_json.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "common/logging.h"

namespace CryptoAudit {

namespace {

// ========== Writing ==========

template<typename Writer>
void writeString(Writer& w, const std::string& s) {
  w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

template<typename Writer>
void writeStringArray(Writer& w, const char* key, const std::vector<std::string>& values) {
  w.Key(key);
  w.StartArray();
  for (const auto& v : values) writeString(w, v);
  w.EndArray();
}

template<typename Writer>
void writeFamilies(Writer& w, const char* key, const std::vector<PrimitiveFamily>& families) {
  w.Key(key);
  w.StartArray();
  for (const auto family : families) w.String(toString(family));
  w.EndArray();
}

template<typename Writer>
void writeLocation(Writer& w, const SourceLocation& loc) {
  w.StartObject();
  w.Key("path");    writeString(w, loc.path);
  w.Key("line");    w.Uint(loc.line);
  w.Key("column");  w.Uint(loc.column);
  w.Key("snippet"); writeString(w, loc.snippet);
  w.EndObject();
}

template<typename Writer>
void writeFinding(Writer& w, const Finding& f) {
  w.StartObject();
  w.Key("id");                 writeString(w, f.id);
  w.Key("pattern_id");         writeString(w, f.pattern_id);
  w.Key("severity");           w.String(toString(f.severity));
  w.Key("family");             w.String(toString(f.family));
  w.Key("location");           writeLocation(w, f.location);
  w.Key("description");        writeString(w, f.description);
  w.Key("recommendation");     writeString(w, f.recommendation);
  w.Key("confidence");         w.Double(f.confidence);
  w.Key("quantum_vulnerable"); w.Bool(f.quantum_vulnerable);
  w.Key("key_size");           w.Uint(f.key_size);
  w.EndObject();
}

template<typename Writer>
void writeReport(Writer& w, const AuditReport& report) {
  w.StartObject();

  w.Key("findings");
  w.StartArray();
  for (const auto& f : report.findings) writeFinding(w, f);
  w.EndArray();

  const RiskScore& r = report.risk_score;
  w.Key("risk_score");
  w.StartObject();
  w.Key("total");          w.Double(r.total);
  w.Key("normalized");     w.Double(r.normalized);
  w.Key("critical_count"); w.Uint(r.critical_count);
  w.Key("high_count");     w.Uint(r.high_count);
  w.Key("medium_count");   w.Uint(r.medium_count);
  w.Key("low_count");      w.Uint(r.low_count);
  w.Key("info_count");     w.Uint(r.info_count);
  w.Key("level");          w.String(toString(r.level));
  w.EndObject();

  const ReportSummary& s = report.summary;
  w.Key("summary");
  w.StartObject();
  w.Key("files_scanned");  w.Uint(s.files_scanned);
  w.Key("lines_scanned");  w.Uint64(s.lines_scanned);
  w.Key("total_findings"); w.Uint(s.total_findings);
  writeFamilies(w, "quantum_vulnerable_families", s.quantum_vulnerable_families);
  writeFamilies(w, "deprecated_families", s.deprecated_families);
  writeStringArray(w, "weak_key_sizes", s.weak_key_sizes);
  writeStringArray(w, "recommendations", s.recommendations);
  w.EndObject();

  const ReportMetadata& m = report.metadata;
  w.Key("metadata");
  w.StartObject();
  w.Key("tool_version"); writeString(w, m.tool_version);
  w.Key("timestamp");    writeString(w, m.timestamp);
  w.Key("file_errors");
  w.StartArray();
  for (const auto& e : m.file_errors) {
    w.StartObject();
    w.Key("path");    writeString(w, e.path);
    w.Key("kind");    w.String(toString(e.kind));
    w.Key("message"); writeString(w, e.message);
    w.EndObject();
  }
  w.EndArray();
  w.Key("degraded_files");     w.Uint(m.degraded_files);
  w.Key("skipped_detections"); w.Uint(m.skipped_detections);
  w.EndObject();

  w.EndObject();
}

// ========== Reading ==========

using Value = rapidjson::Value;

auto getObject(const Value& obj, const char* key, const Value*& out) -> bool {
  const auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsObject()) return false;
  out = &it->value;
  return true;
}

auto getArray(const Value& obj, const char* key, const Value*& out) -> bool {
  const auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsArray()) return false;
  out = &it->value;
  return true;
}

auto getString(const Value& obj, const char* key, std::string& out) -> bool {
  const auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsString()) return false;
  out.assign(it->value.GetString(), it->value.GetStringLength());
  return true;
}

auto getUint(const Value& obj, const char* key, uint32_t& out) -> bool {
  const auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsUint()) return false;
  out = it->value.GetUint();
  return true;
}

auto getUint64(const Value& obj, const char* key, uint64_t& out) -> bool {
  const auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsUint64()) return false;
  out = it->value.GetUint64();
  return true;
}

auto getDouble(const Value& obj, const char* key, double& out) -> bool {
  const auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsNumber()) return false;
  out = it->value.GetDouble();
  return true;
}

auto getBool(const Value& obj, const char* key, bool& out) -> bool {
  const auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsBool()) return false;
  out = it->value.GetBool();
  return true;
}

template<typename Enum>
auto getEnum(const Value& obj, const char* key, Enum& out,
             bool (*parse)(std::string_view, Enum&) noexcept) -> bool {
  std::string name;
  return getString(obj, key, name) && parse(name, out);
}

auto readStringArray(const Value& obj, const char* key, std::vector<std::string>& out) -> bool {
  const Value* arr = nullptr;
  if (!getArray(obj, key, arr)) return false;
  out.clear();
  for (const auto& v : arr->GetArray()) {
    if (!v.IsString()) return false;
    out.emplace_back(v.GetString(), v.GetStringLength());
  }
  return true;
}

auto readFamilies(const Value& obj, const char* key, std::vector<PrimitiveFamily>& out) -> bool {
  const Value* arr = nullptr;
  if (!getArray(obj, key, arr)) return false;
  out.clear();
  for (const auto& v : arr->GetArray()) {
    PrimitiveFamily family{};
    if (!v.IsString() || !parsePrimitiveFamily(std::string_view(v.GetString(), v.GetStringLength()), family)) {
      return false;
    }
    out.push_back(family);
  }
  return true;
}

auto readFinding(const Value& v, Finding& f) -> bool {
  if (!v.IsObject()) return false;
  const Value* loc = nullptr;
  return getString(v, "id", f.id) &&
         getString(v, "pattern_id", f.pattern_id) &&
         getEnum(v, "severity", f.severity, &parseSeverity) &&
         getEnum(v, "family", f.family, &parsePrimitiveFamily) &&
         getObject(v, "location", loc) &&
         getString(*loc, "path", f.location.path) &&
         getUint(*loc, "line", f.location.line) &&
         getUint(*loc, "column", f.location.column) &&
         getString(*loc, "snippet", f.location.snippet) &&
         getString(v, "description", f.description) &&
         getString(v, "recommendation", f.recommendation) &&
         getDouble(v, "confidence", f.confidence) &&
         getBool(v, "quantum_vulnerable", f.quantum_vulnerable) &&
         getUint(v, "key_size", f.key_size);
}

auto readReport(const Value& root, AuditReport& report) -> bool {
  if (!root.IsObject()) return false;

  const Value* findings = nullptr;
  if (!getArray(root, "findings", findings)) return false;
  for (const auto& v : findings->GetArray()) {
    Finding f;
    if (!readFinding(v, f)) return false;
    report.findings.push_back(std::move(f));
  }

  const Value* risk = nullptr;
  RiskScore& r = report.risk_score;
  if (!getObject(root, "risk_score", risk) ||
      !getDouble(*risk, "total", r.total) ||
      !getDouble(*risk, "normalized", r.normalized) ||
      !getUint(*risk, "critical_count", r.critical_count) ||
      !getUint(*risk, "high_count", r.high_count) ||
      !getUint(*risk, "medium_count", r.medium_count) ||
      !getUint(*risk, "low_count", r.low_count) ||
      !getUint(*risk, "info_count", r.info_count) ||
      !getEnum(*risk, "level", r.level, &parseRiskLevel)) {
    return false;
  }

  const Value* summary = nullptr;
  ReportSummary& s = report.summary;
  if (!getObject(root, "summary", summary) ||
      !getUint(*summary, "files_scanned", s.files_scanned) ||
      !getUint64(*summary, "lines_scanned", s.lines_scanned) ||
      !getUint(*summary, "total_findings", s.total_findings) ||
      !readFamilies(*summary, "quantum_vulnerable_families", s.quantum_vulnerable_families) ||
      !readFamilies(*summary, "deprecated_families", s.deprecated_families) ||
      !readStringArray(*summary, "weak_key_sizes", s.weak_key_sizes) ||
      !readStringArray(*summary, "recommendations", s.recommendations)) {
    return false;
  }

  const Value* meta = nullptr;
  ReportMetadata& m = report.metadata;
  const Value* errors = nullptr;
  if (!getObject(root, "metadata", meta) ||
      !getString(*meta, "tool_version", m.tool_version) ||
      !getString(*meta, "timestamp", m.timestamp) ||
      !getArray(*meta, "file_errors", errors) ||
      !getUint(*meta, "degraded_files", m.degraded_files) ||
      !getUint(*meta, "skipped_detections", m.skipped_detections)) {
    return false;
  }
  for (const auto& v : errors->GetArray()) {
    FileError e;
    if (!v.IsObject() ||
        !getString(v, "path", e.path) ||
        !getEnum(v, "kind", e.kind, &parseErrorKind) ||
        !getString(v, "message", e.message)) {
      return false;
    }
    m.file_errors.push_back(std::move(e));
  }
  return true;
}

} // namespace

auto toJson(const AuditReport& report, bool pretty) -> std::string {
  rapidjson::StringBuffer buffer;
  if (pretty) {
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    writeReport(writer, report);
  } else {
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writeReport(writer, report);
  }
  return std::string(buffer.GetString(), buffer.GetSize());
}

auto fromJson(std::string_view text, AuditReport& report) -> bool {
  report = AuditReport{};

  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseFullPrecisionFlag>(text.data(), text.size());
  if (doc.HasParseError()) {
    LOG_WARN("Report JSON parse error at offset %zu: %s", doc.GetErrorOffset(),
             rapidjson::GetParseError_En(doc.GetParseError()));
    return false;
  }

  if (!readReport(doc, report)) {
    LOG_WARN("Report JSON does not match the report schema");
    report = AuditReport{};
    return false;
  }
  return true;
}

} // namespace CryptoAudit
