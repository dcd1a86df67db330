/**
 * @file test_threat_scanner.cpp
 * @brief Structural, pattern and heuristic passes and their aggregation
 */

#include "sentrybox/analyzers/threat_scanner.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace sentrybox::analyzers;

namespace {

bool HasFinding(const ScanResult& result, ThreatCategory category, ThreatSeverity at_least) {
    return std::any_of(result.findings.begin(), result.findings.end(), [&](const ThreatFinding& f) {
        return f.category == category && f.severity >= at_least;
    });
}

bool HasPattern(const ScanResult& result, const std::string& id) {
    return std::any_of(result.findings.begin(), result.findings.end(),
                       [&](const ThreatFinding& f) { return f.pattern_id == id; });
}

class FaultyScanner : public ThreatScanner {
protected:
    std::vector<ThreatFinding> PatternPass(const std::string&) const override {
        throw std::runtime_error("rule table corrupted");
    }
};

} // namespace

TEST(ThreatScannerTest, EmptyInputIsSafe) {
    ThreatScanner scanner;
    for (const std::string code : {"", "   \n\t\n"}) {
        auto result = scanner.Scan(code);
        EXPECT_EQ(result.max_severity, ThreatSeverity::SAFE);
        EXPECT_TRUE(result.findings.empty());
        EXPECT_FALSE(result.blocking);
    }
}

TEST(ThreatScannerTest, ArithmeticIsSafe) {
    ThreatScanner scanner;
    auto result = scanner.Scan("import math\nprint(sum(range(100)) + math.floor(2.5))\n");
    EXPECT_EQ(result.max_severity, ThreatSeverity::SAFE);
    EXPECT_FALSE(result.blocking);
    EXPECT_TRUE(result.parsed);
    ASSERT_TRUE(result.complexity.has_value());
    EXPECT_EQ(result.complexity->import_count, 1);
}

TEST(ThreatScannerTest, OsSystemIsCriticalCommandInjection) {
    ThreatScanner scanner;
    auto result = scanner.Scan("import os\nos.system(\"rm -rf /\")\n");
    EXPECT_EQ(result.max_severity, ThreatSeverity::CRITICAL);
    EXPECT_TRUE(result.blocking);
    EXPECT_TRUE(HasFinding(result, ThreatCategory::COMMAND_INJECTION, ThreatSeverity::CRITICAL));

    auto it = std::find_if(result.findings.begin(), result.findings.end(), [](const ThreatFinding& f) {
        return f.category == ThreatCategory::COMMAND_INJECTION;
    });
    ASSERT_NE(it, result.findings.end());
    EXPECT_EQ(it->line, 2);
}

TEST(ThreatScannerTest, AliasedSubprocessCallIsResolved) {
    ThreatScanner scanner;
    auto result = scanner.Scan("import subprocess as sp\nsp.run(['ls'])\n");
    EXPECT_TRUE(HasFinding(result, ThreatCategory::COMMAND_INJECTION, ThreatSeverity::CRITICAL));
    EXPECT_TRUE(result.blocking);
}

TEST(ThreatScannerTest, PlatformModuleAliasesOfOsAreResolved) {
    ThreatScanner scanner;
    for (const std::string code : {"import posix\nposix.system('id')\n",
                                   "from posix import system\nsystem('id')\n",
                                   "import nt as n\nn.popen('id')\n"}) {
        auto result = scanner.Scan(code);
        EXPECT_TRUE(HasFinding(result, ThreatCategory::COMMAND_INJECTION, ThreatSeverity::CRITICAL))
            << code;
        EXPECT_TRUE(result.blocking) << code;
    }
}

TEST(ThreatScannerTest, UncalledSpawnPrimitiveIsFlagged) {
    ThreatScanner scanner;
    for (const std::string code : {"import os\nf = os.system\nf('id')\n",
                                   "import subprocess\nrunners = [subprocess.Popen]\n",
                                   "from os import execv\nhandler = execv\n"}) {
        auto result = scanner.Scan(code);
        EXPECT_TRUE(HasPattern(result, "STRUCT-REF")) << code;
        EXPECT_TRUE(result.blocking) << code;
    }
}

TEST(ThreatScannerTest, HarmlessOsAttributeIsNotAReference) {
    ThreatScanner scanner;
    auto result = scanner.Scan("import os\nsep = os.sep\njoin = os.path.join\n");
    EXPECT_FALSE(HasPattern(result, "STRUCT-REF"));
    EXPECT_FALSE(HasFinding(result, ThreatCategory::COMMAND_INJECTION, ThreatSeverity::LOW));
}

TEST(ThreatScannerTest, DunderEscapeIsFlagged) {
    ThreatScanner scanner;
    auto result = scanner.Scan("x = ().__class__.__bases__[0].__subclasses__()\n");
    EXPECT_TRUE(HasFinding(result, ThreatCategory::UNAUTHORIZED_ACCESS, ThreatSeverity::HIGH));
}

TEST(ThreatScannerTest, FindingsAreDeduplicatedPerLineAndCategory) {
    ThreatScanner scanner;
    auto result = scanner.Scan("import os\nos.system('a'); os.popen('b')\n");
    int line2_cmd = 0;
    for (const auto& f : result.findings) {
        if (f.line == 2 && f.category == ThreatCategory::COMMAND_INJECTION) ++line2_cmd;
    }
    EXPECT_EQ(line2_cmd, 1);
}

TEST(ThreatScannerTest, UnparsableInputIsAFindingNotAFailure) {
    ThreatScanner scanner;
    auto result = scanner.Scan("def broken(:\n    pass\n");
    EXPECT_FALSE(result.parsed);
    EXPECT_FALSE(result.scan_failed);
    EXPECT_TRUE(HasPattern(result, "STRUCT-PARSE"));
    EXPECT_GE(result.max_severity, ThreatSeverity::MEDIUM);
}

TEST(ThreatScannerTest, PatternPassStillRunsOnUnparsableInput) {
    ThreatScanner scanner;
    auto result = scanner.Scan("import os\nos.system('id'\n");
    EXPECT_TRUE(HasFinding(result, ThreatCategory::COMMAND_INJECTION, ThreatSeverity::CRITICAL));
}

TEST(ThreatScannerTest, ObfuscatedEvalIsCritical) {
    ThreatScanner scanner;
    const std::string code =
        "payload = '\\x69\\x6d\\x70\\x6f\\x72\\x74\\x20\\x6f\\x73\\x3b\\x6f\\x73'\n"
        "eval(payload)\n";
    auto result = scanner.Scan(code);
    EXPECT_TRUE(HasPattern(result, "HEUR-ESCAPES"));
    EXPECT_TRUE(HasFinding(result, ThreatCategory::DYNAMIC_CODE_EXECUTION, ThreatSeverity::CRITICAL));
    EXPECT_TRUE(result.blocking);
}

TEST(ThreatScannerTest, ThresholdControlsBlocking) {
    ThreatScanner::Config lenient;
    lenient.block_threshold = ThreatSeverity::CRITICAL;
    ThreatScanner::Config strict;
    strict.block_threshold = ThreatSeverity::MEDIUM;

    const std::string code = "import socket\n";
    EXPECT_FALSE(ThreatScanner(lenient).Scan(code).blocking);
    EXPECT_TRUE(ThreatScanner(strict).Scan(code).blocking);
}

TEST(ThreatScannerTest, OversizedInputIsRejected) {
    ThreatScanner::Config config;
    config.max_code_bytes = 64;
    ThreatScanner scanner(config);
    auto result = scanner.Scan(std::string(200, '#') + "\n");
    EXPECT_TRUE(HasPattern(result, "SCANNER-SIZE"));
    EXPECT_TRUE(result.blocking);
}

TEST(ThreatScannerTest, InternalFaultFailsClosed) {
    FaultyScanner scanner;
    auto result = scanner.Scan("print('hello')\n");
    EXPECT_TRUE(result.scan_failed);
    EXPECT_EQ(result.max_severity, ThreatSeverity::HIGH);
    EXPECT_TRUE(result.blocking);
}

TEST(ThreatScannerTest, ScanIsDeterministic) {
    ThreatScanner scanner;
    const std::string code = "import os\nimport requests\nos.getenv('HOME')\nrequests.get('http://x')\n";
    auto a = scanner.Scan(code);
    auto b = scanner.Scan(code);
    ASSERT_EQ(a.findings.size(), b.findings.size());
    for (std::size_t i = 0; i < a.findings.size(); ++i) {
        EXPECT_EQ(a.findings[i].pattern_id, b.findings[i].pattern_id);
        EXPECT_EQ(a.findings[i].line, b.findings[i].line);
    }
    EXPECT_EQ(a.max_severity, b.max_severity);
}

TEST(ThreatTypesTest, SeverityNamesRoundTrip) {
    for (auto s : {ThreatSeverity::SAFE, ThreatSeverity::LOW, ThreatSeverity::MEDIUM,
                   ThreatSeverity::HIGH, ThreatSeverity::CRITICAL}) {
        auto parsed = SeverityFromString(SeverityToString(s));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(SeverityFromString("catastrophic").has_value());
}

TEST(ThreatTypesTest, CategoryNamesRoundTrip) {
    for (auto c : {ThreatCategory::COMMAND_INJECTION, ThreatCategory::NETWORK_ACCESS,
                   ThreatCategory::DYNAMIC_CODE_EXECUTION, ThreatCategory::UNAUTHORIZED_ACCESS}) {
        auto parsed = CategoryFromString(CategoryToString(c));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, c);
    }
    EXPECT_FALSE(CategoryFromString("telepathy").has_value());
}
