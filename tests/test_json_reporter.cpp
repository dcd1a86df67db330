/**
 * @file test_json_reporter.cpp
 * @brief JSON shape of results, scans and audit entries
 */

#include "sentrybox/reporters/json_reporter.hpp"
#include "sentrybox/core/execution_pipeline.hpp"

#include <gtest/gtest.h>

#include <fstream>

#include <unistd.h>

using namespace sentrybox;
using namespace sentrybox::reporters;
namespace fs = std::filesystem;

namespace {

core::ExecutionResult SampleResult() {
    core::ExecutionResult result;
    result.execution_id = "0123456789abcdef0123456789abcdef";
    result.success = false;
    result.stdout_output = "partial\n";
    result.stderr_output = "Traceback\n";
    result.exit_code = 137;
    result.wall_duration = std::chrono::milliseconds(1500);
    result.cpu_time = std::chrono::milliseconds(1001);
    result.termination_reason = core::TerminationReason::RESOURCE_LIMIT_EXCEEDED;
    result.peak_memory_bytes = 12345678;
    result.stdout_truncated = true;
    result.error_message = "cpu time limit";
    // Whole milliseconds survive the trip exactly
    result.started_at = std::chrono::system_clock::time_point(std::chrono::milliseconds(1760000000123));
    return result;
}

} // namespace

TEST(JsonReporterTest, ExecutionResultSurvivesRoundTrip) {
    auto original = SampleResult();
    auto j = JsonReporter::ToJson(original);

    EXPECT_EQ(j["termination_reason"], "resource_limit_exceeded");
    EXPECT_EQ(j["started_at_ms"], 1760000000123);

    auto parsed = JsonReporter::ExecutionResultFromJson(j);
    ASSERT_TRUE(parsed.ok()) << parsed.error().message;
    EXPECT_EQ(parsed.value(), original);
}

TEST(JsonReporterTest, MissingFieldIsParseError) {
    auto j = JsonReporter::ToJson(SampleResult());
    j.erase("exit_code");
    auto parsed = JsonReporter::ExecutionResultFromJson(j);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, utils::ErrorCode::PARSE_ERROR);
}

TEST(JsonReporterTest, UnknownTerminationReasonIsParseError) {
    auto j = JsonReporter::ToJson(SampleResult());
    j["termination_reason"] = "exploded";
    auto parsed = JsonReporter::ExecutionResultFromJson(j);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, utils::ErrorCode::PARSE_ERROR);
}

TEST(JsonReporterTest, ScanResultShape) {
    analyzers::ScanResult scan;
    analyzers::ThreatFinding finding;
    finding.pattern_id = "CMD-001";
    finding.category = analyzers::ThreatCategory::COMMAND_INJECTION;
    finding.severity = analyzers::ThreatSeverity::CRITICAL;
    finding.line = 2;
    finding.source = analyzers::FindingSource::PATTERN;
    scan.findings.push_back(finding);
    scan.max_severity = analyzers::ThreatSeverity::CRITICAL;
    scan.blocking = true;

    auto j = JsonReporter::ToJson(scan);
    EXPECT_EQ(j["max_severity"], "critical");
    EXPECT_TRUE(j["blocking"].get<bool>());
    EXPECT_EQ(j["finding_count"], 1);
    ASSERT_EQ(j["findings"].size(), 1u);
    EXPECT_EQ(j["findings"][0]["pattern_id"], "CMD-001");
    EXPECT_EQ(j["findings"][0]["category"], analyzers::CategoryToString(finding.category));
    EXPECT_EQ(j["findings"][0]["source"], "pattern");
    EXPECT_FALSE(j.contains("complexity"));
}

TEST(JsonReporterTest, AccessLogEntryShape) {
    security::AccessLogEntry entry;
    entry.id = 7;
    entry.principal = "abc";
    entry.action = "check";
    entry.permission = "code:execute";
    entry.resource_type = "process";
    entry.decision = security::AccessDecision::DENY;

    auto j = JsonReporter::ToJson(std::vector<security::AccessLogEntry>{entry});
    ASSERT_TRUE(j.is_array());
    ASSERT_EQ(j.size(), 1u);
    EXPECT_EQ(j[0]["decision"], "deny");
    EXPECT_TRUE(j[0]["resource_scope"].is_null());

    entry.resource_scope = "alpha";
    EXPECT_EQ(JsonReporter::ToJson(entry)["resource_scope"], "alpha");
}

TEST(JsonReporterTest, ReportOmitsDisabledSections) {
    core::PipelineResult result;
    result.execution_id = "exec";
    result.execution = SampleResult();
    result.scan = analyzers::ScanResult{};

    JsonReporterConfig config;
    config.include_output = false;
    config.include_findings = false;
    config.pretty_print = false;
    JsonReporter reporter(config);

    auto j = json::parse(reporter.GenerateJsonString(result));
    EXPECT_FALSE(j["execution"].contains("stdout"));
    EXPECT_FALSE(j["scan"].contains("findings"));
    EXPECT_TRUE(j["summary"].is_null());
    EXPECT_EQ(j["phase_reached"], "authorizing");
    EXPECT_TRUE(j.contains("generated_at"));
}

TEST(JsonReporterTest, BinaryOutputSurvivesFileRoundTrip) {
    auto original = SampleResult();
    original.stdout_output = std::string("ok\xff\xfe", 4);
    original.stderr_output = std::string("\x00\xc3(\n", 4);

    auto j = JsonReporter::ToJson(original);
    EXPECT_EQ(j["stdout_encoding"], "base64");
    EXPECT_EQ(j["stderr_encoding"], "base64");

    auto path = fs::temp_directory_path() /
                ("sentrybox-binary-" + std::to_string(::getpid()) + ".json");
    auto status = JsonReporter::SaveToFile(j, path);
    ASSERT_TRUE(status.ok()) << status.error().message;

    std::ifstream in(path);
    auto parsed = JsonReporter::ExecutionResultFromJson(json::parse(in));
    fs::remove(path);

    ASSERT_TRUE(parsed.ok()) << parsed.error().message;
    EXPECT_EQ(parsed.value().stdout_output, original.stdout_output);
    EXPECT_EQ(parsed.value().stderr_output, original.stderr_output);
    EXPECT_EQ(parsed.value(), original);
}

TEST(JsonReporterTest, TextOutputStaysReadable) {
    auto result = SampleResult();
    result.stdout_output = "caf\xc3\xa9 \xe2\x82\xac\n";
    auto j = JsonReporter::ToJson(result);
    EXPECT_EQ(j["stdout_encoding"], "utf-8");
    EXPECT_EQ(j["stdout"], result.stdout_output);
}

TEST(JsonReporterTest, UnknownOutputEncodingIsParseError) {
    auto j = JsonReporter::ToJson(SampleResult());
    j["stdout_encoding"] = "rot13";
    auto parsed = JsonReporter::ExecutionResultFromJson(j);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, utils::ErrorCode::PARSE_ERROR);

    j["stdout_encoding"] = "base64";
    j["stdout"] = "not base64!";
    parsed = JsonReporter::ExecutionResultFromJson(j);
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.error().code, utils::ErrorCode::PARSE_ERROR);
}

TEST(JsonReporterTest, SaveToFileCreatesParents) {
    auto dir = fs::temp_directory_path() / ("sentrybox-json-" + std::to_string(::getpid()));
    auto path = dir / "nested" / "out.json";

    auto status = JsonReporter::SaveToFile(JsonReporter::ToJson(SampleResult()), path);
    ASSERT_TRUE(status.ok()) << status.error().message;

    std::ifstream in(path);
    auto j = json::parse(in);
    EXPECT_EQ(j["execution_id"], "0123456789abcdef0123456789abcdef");

    fs::remove_all(dir);
}

TEST(JsonReporterTest, GenerateReportWritesOneFilePerExecution) {
    auto dir = fs::temp_directory_path() / ("sentrybox-report-" + std::to_string(::getpid()));
    JsonReporterConfig config;
    config.output_directory = dir;
    JsonReporter reporter(config);

    core::PipelineResult result;
    result.execution_id = "abc123";
    result.execution = SampleResult();

    auto path = reporter.GenerateReport(result);
    ASSERT_TRUE(path.ok()) << path.error().message;
    EXPECT_EQ(path.value(), dir / "abc123.json");

    std::ifstream in(path.value());
    auto j = json::parse(in);
    EXPECT_EQ(j["execution_id"], "abc123");
    EXPECT_EQ(j["execution"]["stdout"], "partial\n");

    fs::remove_all(dir);
}

TEST(JsonReporterTest, TimestampIsIsoUtc) {
    auto text = JsonReporter::FormatTimestamp(std::chrono::system_clock::time_point(std::chrono::seconds(0)));
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text.rfind("1970-01-01T00:00:00", 0), 0u);
    EXPECT_EQ(text.back(), 'Z');
}
