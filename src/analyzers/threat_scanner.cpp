/**
 * @file threat_scanner.cpp
 * @brief Implementation of the three-pass code-unit scanner
 *
 * **Structural pass**: the syntax tree is walked in source order. Import
 * statements populate an alias table (`import subprocess as sp`,
 * `from os import system as run`) so later calls resolve to their dotted
 * origin before being compared with the dangerous-call tables.
 *
 * **Complexity score** (weighted sum):
 * ```
 * functions*2 + classes*3 + loops*3 + conditions*2 + imports + max_depth
 * ```
 *
 * **Heuristic pass**: string literals are scored by Shannon entropy and by
 * the density of \xNN escapes; the token stream is scored by the share of
 * `+` operators adjacent to string literals (and `chr()` calls). Dynamic
 * execution present together with any obfuscation signal is critical.
 *
 * @date 2025
 */

#include "sentrybox/analyzers/threat_scanner.hpp"
#include "sentrybox/analyzers/script_parser.hpp"
#include "sentrybox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <regex>
#include <unordered_map>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace sentrybox {
namespace analyzers {

using utils::StringUtils;

// ============================================================================
// ENUM CONVERSIONS
// ============================================================================

std::string SeverityToString(ThreatSeverity severity) {
    switch (severity) {
        case ThreatSeverity::SAFE: return "safe";
        case ThreatSeverity::LOW: return "low";
        case ThreatSeverity::MEDIUM: return "medium";
        case ThreatSeverity::HIGH: return "high";
        case ThreatSeverity::CRITICAL: return "critical";
    }
    return "critical";
}

std::optional<ThreatSeverity> SeverityFromString(const std::string& name) {
    static const std::map<std::string, ThreatSeverity> table = {
        {"safe", ThreatSeverity::SAFE}, {"low", ThreatSeverity::LOW},
        {"medium", ThreatSeverity::MEDIUM}, {"high", ThreatSeverity::HIGH},
        {"critical", ThreatSeverity::CRITICAL}
    };
    auto it = table.find(StringUtils::ToLower(name));
    if (it == table.end()) return std::nullopt;
    return it->second;
}

namespace {

const std::map<ThreatCategory, std::string>& CategoryNames() {
    static const std::map<ThreatCategory, std::string> names = {
        {ThreatCategory::COMMAND_INJECTION, "command-injection"},
        {ThreatCategory::FILE_OPERATION, "file-operation"},
        {ThreatCategory::NETWORK_ACCESS, "network-access"},
        {ThreatCategory::SYSTEM_CALL, "system-call"},
        {ThreatCategory::CODE_INJECTION, "code-injection"},
        {ThreatCategory::PRIVILEGE_ESCALATION, "privilege-escalation"},
        {ThreatCategory::CRYPTOGRAPHIC_OPERATION, "cryptographic-operation"},
        {ThreatCategory::NETWORK_SCAN, "network-scan"},
        {ThreatCategory::DYNAMIC_CODE_EXECUTION, "dynamic-code-execution"},
        {ThreatCategory::UNAUTHORIZED_ACCESS, "unauthorized-access"},
        {ThreatCategory::DATA_EXFILTRATION, "data-exfiltration"},
    };
    return names;
}

} // namespace

std::string CategoryToString(ThreatCategory category) {
    return CategoryNames().at(category);
}

std::optional<ThreatCategory> CategoryFromString(const std::string& name) {
    for (const auto& [category, text] : CategoryNames()) {
        if (text == name) return category;
    }
    return std::nullopt;
}

std::string FindingSourceToString(FindingSource source) {
    switch (source) {
        case FindingSource::STRUCTURAL: return "structural";
        case FindingSource::PATTERN: return "pattern";
        case FindingSource::HEURISTIC: return "heuristic";
        case FindingSource::SCANNER: return "scanner";
    }
    return "scanner";
}

// ============================================================================
// STRUCTURAL ANALYSIS TABLES
// ============================================================================

namespace {

struct CallRule {
    ThreatCategory category;
    ThreatSeverity severity;
    const char* description;
};

using C = ThreatCategory;
using S = ThreatSeverity;

// Fully resolved call targets
const std::unordered_map<std::string, CallRule>& DangerousCalls() {
    static const std::unordered_map<std::string, CallRule> calls = {
        {"os.system", {C::COMMAND_INJECTION, S::CRITICAL, "call to os.system"}},
        {"os.popen", {C::COMMAND_INJECTION, S::CRITICAL, "call to os.popen"}},
        {"subprocess.Popen", {C::COMMAND_INJECTION, S::CRITICAL, "call to subprocess.Popen"}},
        {"subprocess.call", {C::COMMAND_INJECTION, S::CRITICAL, "call to subprocess.call"}},
        {"subprocess.run", {C::COMMAND_INJECTION, S::CRITICAL, "call to subprocess.run"}},
        {"subprocess.check_call", {C::COMMAND_INJECTION, S::CRITICAL, "call to subprocess.check_call"}},
        {"subprocess.check_output", {C::COMMAND_INJECTION, S::CRITICAL, "call to subprocess.check_output"}},
        {"subprocess.getoutput", {C::COMMAND_INJECTION, S::CRITICAL, "call to subprocess.getoutput"}},
        {"subprocess.getstatusoutput", {C::COMMAND_INJECTION, S::CRITICAL, "call to subprocess.getstatusoutput"}},
        {"pty.spawn", {C::COMMAND_INJECTION, S::HIGH, "call to pty.spawn"}},
        {"eval", {C::DYNAMIC_CODE_EXECUTION, S::HIGH, "string executed as code via eval"}},
        {"exec", {C::DYNAMIC_CODE_EXECUTION, S::HIGH, "string executed as code via exec"}},
        {"builtins.eval", {C::DYNAMIC_CODE_EXECUTION, S::HIGH, "string executed as code via eval"}},
        {"builtins.exec", {C::DYNAMIC_CODE_EXECUTION, S::HIGH, "string executed as code via exec"}},
        {"compile", {C::DYNAMIC_CODE_EXECUTION, S::MEDIUM, "code object compiled from string"}},
        {"__import__", {C::CODE_INJECTION, S::HIGH, "module imported by computed name"}},
        {"importlib.import_module", {C::CODE_INJECTION, S::HIGH, "module imported by computed name"}},
        {"getattr", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "reflective attribute access"}},
        {"setattr", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "reflective attribute mutation"}},
        {"delattr", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "reflective attribute deletion"}},
        {"globals", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "access to global namespace"}},
        {"locals", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "access to local namespace"}},
        {"vars", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "access to object namespace"}},
        {"os.setuid", {C::PRIVILEGE_ESCALATION, S::HIGH, "change of process user"}},
        {"os.setgid", {C::PRIVILEGE_ESCALATION, S::HIGH, "change of process group"}},
        {"os.chown", {C::PRIVILEGE_ESCALATION, S::HIGH, "change of file ownership"}},
        {"os.chroot", {C::PRIVILEGE_ESCALATION, S::HIGH, "change of root directory"}},
        {"shutil.rmtree", {C::FILE_OPERATION, S::HIGH, "recursive directory removal"}},
        {"os.remove", {C::FILE_OPERATION, S::MEDIUM, "file removal"}},
        {"os.unlink", {C::FILE_OPERATION, S::MEDIUM, "file removal"}},
        {"os.fork", {C::SYSTEM_CALL, S::MEDIUM, "process fork"}},
        {"os.kill", {C::SYSTEM_CALL, S::MEDIUM, "signal sent to a process"}},
        {"ctypes.CDLL", {C::SYSTEM_CALL, S::HIGH, "native library loaded"}},
        {"socket.socket", {C::NETWORK_ACCESS, S::MEDIUM, "raw socket created"}},
        {"socket.create_connection", {C::NETWORK_ACCESS, S::MEDIUM, "outbound connection"}},
    };
    return calls;
}

// Call-target prefixes (os.execv, os.spawnlp, ...)
const std::vector<std::pair<std::string, CallRule>>& DangerousCallPrefixes() {
    static const std::vector<std::pair<std::string, CallRule>> prefixes = {
        {"os.exec", {C::COMMAND_INJECTION, S::HIGH, "process image replaced via os.exec*"}},
        {"os.spawn", {C::COMMAND_INJECTION, S::HIGH, "process spawned via os.spawn*"}},
        {"os.posix_spawn", {C::COMMAND_INJECTION, S::HIGH, "process spawned via os.posix_spawn"}},
    };
    return prefixes;
}

// Top-level modules granting raw OS or network reach
const std::unordered_map<std::string, CallRule>& SensitiveModules() {
    static const std::unordered_map<std::string, CallRule> modules = {
        {"os", {C::SYSTEM_CALL, S::MEDIUM, "import of raw OS module"}},
        {"sys", {C::SYSTEM_CALL, S::MEDIUM, "import of interpreter internals module"}},
        {"posix", {C::SYSTEM_CALL, S::MEDIUM, "import of raw OS module"}},
        {"nt", {C::SYSTEM_CALL, S::MEDIUM, "import of raw OS module"}},
        {"signal", {C::SYSTEM_CALL, S::MEDIUM, "import of signal handling module"}},
        {"resource", {C::SYSTEM_CALL, S::MEDIUM, "import of resource limit module"}},
        {"fcntl", {C::SYSTEM_CALL, S::MEDIUM, "import of descriptor control module"}},
        {"mmap", {C::SYSTEM_CALL, S::MEDIUM, "import of memory mapping module"}},
        {"multiprocessing", {C::SYSTEM_CALL, S::MEDIUM, "import of process spawning module"}},
        {"ctypes", {C::SYSTEM_CALL, S::HIGH, "import of native call module"}},
        {"cffi", {C::SYSTEM_CALL, S::HIGH, "import of native call module"}},
        {"subprocess", {C::COMMAND_INJECTION, S::HIGH, "import of process spawning module"}},
        {"pty", {C::COMMAND_INJECTION, S::HIGH, "import of pseudo-terminal module"}},
        {"shutil", {C::FILE_OPERATION, S::MEDIUM, "import of file manipulation module"}},
        {"socket", {C::NETWORK_ACCESS, S::MEDIUM, "import of raw network module"}},
        {"ssl", {C::NETWORK_ACCESS, S::MEDIUM, "import of network transport module"}},
        {"urllib", {C::NETWORK_ACCESS, S::MEDIUM, "import of HTTP client module"}},
        {"http", {C::NETWORK_ACCESS, S::MEDIUM, "import of HTTP module"}},
        {"requests", {C::NETWORK_ACCESS, S::MEDIUM, "import of HTTP client module"}},
        {"httpx", {C::NETWORK_ACCESS, S::MEDIUM, "import of HTTP client module"}},
        {"aiohttp", {C::NETWORK_ACCESS, S::MEDIUM, "import of HTTP client module"}},
        {"websocket", {C::NETWORK_ACCESS, S::MEDIUM, "import of websocket module"}},
        {"websockets", {C::NETWORK_ACCESS, S::MEDIUM, "import of websocket module"}},
        {"ftplib", {C::DATA_EXFILTRATION, S::MEDIUM, "import of file transfer module"}},
        {"smtplib", {C::DATA_EXFILTRATION, S::MEDIUM, "import of mail transfer module"}},
        {"telnetlib", {C::DATA_EXFILTRATION, S::MEDIUM, "import of remote shell module"}},
        {"paramiko", {C::DATA_EXFILTRATION, S::MEDIUM, "import of SSH module"}},
        {"pickle", {C::CODE_INJECTION, S::MEDIUM, "import of code-executing deserializer"}},
        {"marshal", {C::CODE_INJECTION, S::MEDIUM, "import of code-executing deserializer"}},
        {"shelve", {C::CODE_INJECTION, S::MEDIUM, "import of code-executing deserializer"}},
        {"dill", {C::CODE_INJECTION, S::MEDIUM, "import of code-executing deserializer"}},
        {"importlib", {C::DYNAMIC_CODE_EXECUTION, S::MEDIUM, "import of dynamic import module"}},
        {"code", {C::DYNAMIC_CODE_EXECUTION, S::MEDIUM, "import of interactive interpreter module"}},
        {"codeop", {C::DYNAMIC_CODE_EXECUTION, S::MEDIUM, "import of code compilation module"}},
        {"builtins", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "import of builtins module"}},
        {"inspect", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "import of introspection module"}},
        {"gc", {C::UNAUTHORIZED_ACCESS, S::MEDIUM, "import of garbage collector internals"}},
    };
    return modules;
}

// Dunder attributes used to walk out of a restricted namespace
const std::unordered_set<std::string>& EscapeAttributes() {
    static const std::unordered_set<std::string> attrs = {
        "__class__", "__bases__", "__base__", "__mro__", "__subclasses__",
        "__globals__", "__builtins__", "__code__", "__closure__", "__dict__",
        "__getattribute__", "__reduce__", "__reduce_ex__"
    };
    return attrs;
}

std::string TopLevel(const std::string& module) {
    auto dot = module.find('.');
    return dot == std::string::npos ? module : module.substr(0, dot);
}

// posix and nt expose the same primitives as os
std::string CanonicalTarget(const std::string& target) {
    for (const char* platform : {"posix.", "nt."}) {
        if (StringUtils::StartsWith(target, platform)) {
            return "os." + target.substr(std::string(platform).size());
        }
    }
    return target;
}

const CallRule* FindCallRule(const std::string& target) {
    auto it = DangerousCalls().find(target);
    if (it != DangerousCalls().end()) {
        return &it->second;
    }
    for (const auto& [prefix, rule] : DangerousCallPrefixes()) {
        if (StringUtils::StartsWith(target, prefix)) {
            return &rule;
        }
    }
    return nullptr;
}

ThreatFinding MakeFinding(std::string id, ThreatCategory category, ThreatSeverity severity,
                          const Node& at, std::string description, FindingSource source) {
    ThreatFinding finding;
    finding.pattern_id = std::move(id);
    finding.category = category;
    finding.severity = severity;
    finding.line = at.line;
    finding.offset = at.offset;
    finding.description = std::move(description);
    finding.source = source;
    return finding;
}

/**
 * Walks one syntax tree collecting findings and complexity counters.
 * Dispatch over node payloads is a std::visit on the tagged variant.
 */
class StructuralVisitor {
public:
    StructuralVisitor(const ThreatScanner::Config& config,
                      std::vector<ThreatFinding>& findings,
                      ComplexityMetrics& metrics)
        : config_(config), findings_(findings), metrics_(metrics) {
    }

    void Run(const Node& root) {
        ScriptParser::Walk(root, [this](const Node& node, int depth) {
            metrics_.max_depth = std::max(metrics_.max_depth, depth);
            current_ = &node;
            std::visit(*this, node.data);
        });
    }

    void operator()(const ImportNode& node) {
        ++metrics_.import_count;
        for (const auto& alias : node.names) {
            const std::string bound = alias.asname.empty() ? TopLevel(alias.name) : alias.asname;
            aliases_[bound] = alias.asname.empty() ? TopLevel(alias.name) : alias.name;
            CheckModule(alias.name);
        }
    }

    void operator()(const ImportFromNode& node) {
        ++metrics_.import_count;
        if (node.level > 0) {
            return;
        }
        CheckModule(node.module);
        for (const auto& alias : node.names) {
            if (alias.name == "*") {
                Flag("STRUCT-STAR", C::UNAUTHORIZED_ACCESS, S::LOW,
                     "wildcard import from " + node.module);
                continue;
            }
            const std::string bound = alias.asname.empty() ? alias.name : alias.asname;
            aliases_[bound] = node.module + "." + alias.name;
        }
    }

    void operator()(const CallNode& node) {
        called_.insert(node.func.get());
        const std::string target = CanonicalTarget(Resolve(*node.func));
        if (target.empty()) {
            return;
        }

        if (const CallRule* rule = FindCallRule(target)) {
            Flag("STRUCT-CALL", rule->category, rule->severity, rule->description);
        }

        if (target == "open" || target == "io.open" || target == "builtins.open") {
            CheckOpenMode(node);
        }
        for (const auto& kw : node.keywords) {
            if (kw.name == "shell" && kw.value) {
                if (auto* c = std::get_if<ConstantNode>(&kw.value->data);
                    c && c->kind == ConstantKind::BOOLEAN && c->value == "True") {
                    Flag("STRUCT-SHELL", C::COMMAND_INJECTION, S::HIGH,
                         "command passed through a shell");
                }
            }
        }
    }

    void operator()(const AttributeNode& node) {
        if (EscapeAttributes().count(node.attr)) {
            Flag("STRUCT-DUNDER", C::UNAUTHORIZED_ACCESS, S::HIGH,
                 "introspection attribute " + node.attr);
        }
        CheckReference();
    }

    void operator()(const NameNode& node) {
        if (node.id == "__builtins__" || node.id == "__loader__" || node.id == "__spec__") {
            Flag("STRUCT-DUNDER", C::UNAUTHORIZED_ACCESS, S::HIGH,
                 "interpreter internal " + node.id);
        }
        CheckReference();
    }

    void operator()(const FunctionDefNode&) { ++metrics_.function_count; }
    void operator()(const ClassDefNode&) { ++metrics_.class_count; }

    void operator()(const BlockNode& node) {
        switch (node.kind) {
            case BlockKind::FOR:
            case BlockKind::WHILE:
                ++metrics_.loop_count;
                break;
            case BlockKind::IF:
            case BlockKind::ELIF:
            case BlockKind::TRY:
                ++metrics_.condition_count;
                break;
            default:
                break;
        }
    }

    template <typename T>
    void operator()(const T&) {}

private:
    const ThreatScanner::Config& config_;
    std::vector<ThreatFinding>& findings_;
    ComplexityMetrics& metrics_;
    std::unordered_map<std::string, std::string> aliases_;
    std::unordered_set<const Node*> called_;
    const Node* current_{nullptr};

    void Flag(const char* id, ThreatCategory category, ThreatSeverity severity,
              std::string description) {
        findings_.push_back(MakeFinding(id, category, severity, *current_,
                                        std::move(description), FindingSource::STRUCTURAL));
    }

    void CheckModule(const std::string& module) {
        if (module.empty()) {
            return;
        }
        const std::string top = TopLevel(module);
        if (config_.declared_modules.count(module) || config_.declared_modules.count(top)) {
            return;
        }
        auto it = SensitiveModules().find(top);
        if (it != SensitiveModules().end()) {
            Flag("STRUCT-IMPORT", it->second.category, it->second.severity,
                 std::string(it->second.description) + " (" + module + ")");
        } else {
            Flag("STRUCT-IMPORT", C::UNAUTHORIZED_ACCESS, S::LOW,
                 "import of undeclared module " + module);
        }
    }

    // A spawn primitive bound or passed around without being called here
    void CheckReference() {
        if (called_.count(current_)) {
            return;
        }
        const std::string target = CanonicalTarget(Resolve(*current_));
        if (target.find('.') == std::string::npos) {
            return;
        }
        const CallRule* rule = FindCallRule(target);
        if (rule && rule->category == C::COMMAND_INJECTION) {
            Flag("STRUCT-REF", rule->category, rule->severity, "reference to " + target);
        }
    }

    void CheckOpenMode(const CallNode& node) {
        const Node* mode = node.args.size() > 1 ? node.args[1].get() : nullptr;
        for (const auto& kw : node.keywords) {
            if (kw.name == "mode") mode = kw.value.get();
        }
        if (!mode) {
            return;
        }
        auto* c = std::get_if<ConstantNode>(&mode->data);
        if (!c) {
            Flag("STRUCT-OPEN", C::FILE_OPERATION, S::MEDIUM, "file opened with computed mode");
        } else if (c->value.find_first_of("wax+") != std::string::npos) {
            Flag("STRUCT-OPEN", C::FILE_OPERATION, S::MEDIUM, "file opened for writing");
        }
    }

    // Dotted origin of a call target, or empty when not statically known
    std::string Resolve(const Node& node) const {
        if (auto* name = std::get_if<NameNode>(&node.data)) {
            auto it = aliases_.find(name->id);
            return it != aliases_.end() ? it->second : name->id;
        }
        if (auto* attr = std::get_if<AttributeNode>(&node.data)) {
            if (!attr->value) return "";
            std::string base = Resolve(*attr->value);
            return base.empty() ? "" : base + "." + attr->attr;
        }
        return "";
    }
};

// String bodies from a source the tokenizer rejected
std::vector<std::pair<std::string, std::size_t>> ExtractQuotedLiterals(const std::string& code) {
    static const std::regex quoted(R"('([^'\\\n]|\\.)*'|"([^"\\\n]|\\.)*")");
    std::vector<std::pair<std::string, std::size_t>> literals;
    for (auto it = std::sregex_iterator(code.begin(), code.end(), quoted);
         it != std::sregex_iterator(); ++it) {
        const std::string match = it->str();
        literals.emplace_back(match.substr(1, match.size() - 2),
                              static_cast<std::size_t>(it->position()));
    }
    return literals;
}

std::size_t CountHexEscapes(const std::string& literal) {
    std::size_t count = 0;
    for (std::size_t i = 0; i + 3 < literal.size(); ++i) {
        if (literal[i] == '\\' && literal[i + 1] == 'x' &&
            std::isxdigit(static_cast<unsigned char>(literal[i + 2])) &&
            std::isxdigit(static_cast<unsigned char>(literal[i + 3]))) {
            ++count;
            i += 3;
        }
    }
    return count;
}

} // namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ThreatScanner::ThreatScanner()
    : ThreatScanner(Config{}) {
}

ThreatScanner::ThreatScanner(const Config& config)
    : config_(config) {
    spdlog::debug("Threat scanner initialized ({} pattern rules, block threshold {})",
                  ThreatRules::Default().size(), SeverityToString(config_.block_threshold));
}

// ============================================================================
// MAIN SCAN ENTRY POINT
// ============================================================================

ScanResult ThreatScanner::Scan(const std::string& code) const {
    auto start_time = std::chrono::steady_clock::now();
    auto finish = [&](ScanResult result) {
        result.duration = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_time);
        return result;
    };

    if (StringUtils::Trim(code).empty()) {
        return finish(ScanResult{});
    }

    std::vector<ThreatFinding> findings;

    if (code.size() > config_.max_code_bytes) {
        spdlog::warn("Code unit of {} bytes exceeds scanner limit of {}", code.size(),
                     config_.max_code_bytes);
        ThreatFinding finding;
        finding.pattern_id = "SCANNER-SIZE";
        finding.category = ThreatCategory::CODE_INJECTION;
        finding.severity = ThreatSeverity::HIGH;
        finding.description = "code unit exceeds scanner size limit";
        finding.source = FindingSource::SCANNER;
        findings.push_back(std::move(finding));
        return finish(Aggregate(std::move(findings)));
    }

    std::optional<ComplexityMetrics> metrics;
    bool failed = false;
    try {
        auto structural = StructuralPass(code, metrics);
        auto patterns = PatternPass(code);
        auto heuristics = HeuristicPass(code);

        findings.insert(findings.end(), structural.begin(), structural.end());
        findings.insert(findings.end(), patterns.begin(), patterns.end());
        findings.insert(findings.end(), heuristics.begin(), heuristics.end());
    } catch (const std::exception& e) {
        spdlog::error("Scanner failure, treating code unit as unsafe: {}", e.what());
        failed = true;
        ThreatFinding finding;
        finding.pattern_id = "SCANNER-FAILURE";
        finding.category = ThreatCategory::CODE_INJECTION;
        finding.severity = ThreatSeverity::HIGH;
        finding.description = "scanner failure: treat as unsafe";
        finding.source = FindingSource::SCANNER;
        findings.push_back(std::move(finding));
    }

    ScanResult result = Aggregate(std::move(findings));
    result.scan_failed = failed;
    result.parsed = metrics.has_value();
    result.complexity = metrics;

    if (config_.verbose_logging) {
        for (const auto& f : result.findings) {
            spdlog::debug("  [{}] {} line {}: {} ({})", SeverityToString(f.severity),
                          CategoryToString(f.category), f.line, f.description, f.pattern_id);
        }
    }
    if (result.blocking) {
        spdlog::warn("Scan verdict: {} ({} findings), blocking",
                     SeverityToString(result.max_severity), result.findings.size());
    } else {
        spdlog::debug("Scan verdict: {} ({} findings)",
                      SeverityToString(result.max_severity), result.findings.size());
    }
    return finish(std::move(result));
}

// ============================================================================
// STRUCTURAL PASS
// ============================================================================

std::vector<ThreatFinding> ThreatScanner::StructuralPass(
    const std::string& code, std::optional<ComplexityMetrics>& metrics) const {

    std::vector<ThreatFinding> findings;
    auto parsed = ScriptParser::Parse(code);
    if (!parsed) {
        spdlog::debug("Structural pass could not parse input: {}", parsed.error().message);
        ThreatFinding finding;
        finding.pattern_id = "STRUCT-PARSE";
        finding.category = ThreatCategory::CODE_INJECTION;
        finding.severity = ThreatSeverity::MEDIUM;
        finding.description = "unparsable input";
        finding.source = FindingSource::STRUCTURAL;
        findings.push_back(std::move(finding));
        return findings;
    }

    ComplexityMetrics m;
    m.total_lines = static_cast<int>(std::count(code.begin(), code.end(), '\n')) +
                    (code.back() == '\n' ? 0 : 1);

    StructuralVisitor visitor(config_, findings, m);
    visitor.Run(*parsed.value().module);

    m.total_complexity = m.function_count * 2 + m.class_count * 3 + m.loop_count * 3 +
                         m.condition_count * 2 + m.import_count + m.max_depth;
    if (m.total_complexity > config_.max_complexity) {
        ThreatFinding finding;
        finding.pattern_id = "STRUCT-COMPLEXITY";
        finding.category = ThreatCategory::CODE_INJECTION;
        finding.severity = ThreatSeverity::LOW;
        finding.description = "code complexity " + std::to_string(m.total_complexity) +
                              " exceeds " + std::to_string(config_.max_complexity);
        finding.source = FindingSource::STRUCTURAL;
        findings.push_back(std::move(finding));
    }
    metrics = m;
    return findings;
}

// ============================================================================
// PATTERN PASS
// ============================================================================

std::vector<ThreatFinding> ThreatScanner::PatternPass(const std::string& code) const {
    return ThreatRules::Apply(ThreatRules::Default(), code, config_.max_line_length);
}

// ============================================================================
// HEURISTIC PASS
// ============================================================================

std::vector<ThreatFinding> ThreatScanner::HeuristicPass(const std::string& code) const {
    std::vector<ThreatFinding> findings;

    auto add = [&](const char* id, ThreatCategory category, ThreatSeverity severity,
                   std::size_t offset, std::string description) {
        ThreatFinding finding;
        finding.pattern_id = id;
        finding.category = category;
        finding.severity = severity;
        finding.offset = offset;
        finding.line = StringUtils::LineOfOffset(code, offset);
        finding.description = std::move(description);
        finding.source = FindingSource::HEURISTIC;
        findings.push_back(std::move(finding));
    };

    // Literals and token statistics; fall back to raw quoted text
    std::vector<std::pair<std::string, std::size_t>> literals;
    std::size_t token_count = 0;
    std::size_t concat_count = 0;
    std::optional<std::size_t> first_concat;
    std::optional<std::size_t> dynamic_exec;

    Tokenizer tokenizer(code);
    auto tokens = tokenizer.Tokenize();
    if (tokens) {
        const auto& list = tokens.value();
        for (std::size_t i = 0; i < list.size(); ++i) {
            const Token& t = list[i];
            if (t.type == TokenType::NEWLINE || t.type == TokenType::INDENT ||
                t.type == TokenType::DEDENT || t.type == TokenType::END_OF_INPUT) {
                continue;
            }
            ++token_count;

            if (t.type == TokenType::STRING) {
                literals.emplace_back(t.text, t.offset);
            }
            const bool next_is_call = i + 1 < list.size() && list[i + 1].type == TokenType::OP &&
                                      list[i + 1].text == "(";
            if (t.type == TokenType::NAME && next_is_call &&
                (t.text == "eval" || t.text == "exec" || t.text == "compile" ||
                 t.text == "__import__")) {
                if (!dynamic_exec) dynamic_exec = t.offset;
            }
            bool concat = false;
            if (t.type == TokenType::OP && t.text == "+") {
                const bool prev_str = i > 0 && list[i - 1].type == TokenType::STRING;
                const bool next_str = i + 1 < list.size() && list[i + 1].type == TokenType::STRING;
                concat = prev_str || next_str;
            } else if (t.type == TokenType::NAME && t.text == "chr" && next_is_call) {
                concat = true;
            } else if (t.type == TokenType::OP && t.text == "." && i + 1 < list.size() &&
                       list[i + 1].text == "join" && i > 0 &&
                       list[i - 1].type == TokenType::STRING) {
                concat = true;
            }
            if (concat) {
                ++concat_count;
                if (!first_concat) first_concat = t.offset;
            }
        }
    } else {
        literals = ExtractQuotedLiterals(code);
        static const std::regex dyn(R"((^|[^\w.])(eval|exec|compile|__import__)\s*\()");
        std::smatch m;
        if (std::regex_search(code, m, dyn)) {
            dynamic_exec = static_cast<std::size_t>(m.position(2));
        }
    }

    bool obfuscated = false;

    // (a) literal entropy and escape density
    for (const auto& [literal, offset] : literals) {
        if (literal.size() >= config_.min_literal_length) {
            double entropy = StringUtils::ShannonEntropy(literal);
            if (entropy > config_.entropy_threshold) {
                obfuscated = true;
                add("HEUR-ENTROPY", ThreatCategory::CODE_INJECTION, ThreatSeverity::MEDIUM, offset,
                    fmt::format("high-entropy string literal ({:.2f} bits/byte)", entropy));
            }
        }
        if (CountHexEscapes(literal) > config_.max_hex_escapes) {
            obfuscated = true;
            add("HEUR-ESCAPES", ThreatCategory::CODE_INJECTION, ThreatSeverity::MEDIUM, offset,
                "hex-escaped string literal");
        }
    }

    // (b) concatenation ratio
    if (token_count >= config_.min_tokens_for_ratio && token_count > 0) {
        double ratio = static_cast<double>(concat_count) / static_cast<double>(token_count);
        if (ratio > config_.concat_ratio_threshold) {
            obfuscated = true;
            add("HEUR-CONCAT", ThreatCategory::CODE_INJECTION, ThreatSeverity::MEDIUM,
                first_concat.value_or(0), "excessive string concatenation");
        }
    }

    // (c) dynamic execution of obfuscated content
    if (dynamic_exec && obfuscated) {
        add("HEUR-DYNEXEC", ThreatCategory::DYNAMIC_CODE_EXECUTION, ThreatSeverity::CRITICAL,
            *dynamic_exec, "dynamic execution of obfuscated content");
    }
    return findings;
}

// ============================================================================
// AGGREGATION
// ============================================================================

ScanResult ThreatScanner::Aggregate(std::vector<ThreatFinding> findings) const {
    // Keep the highest severity per (line, category); first one wins ties
    std::map<std::pair<int, ThreatCategory>, std::size_t> best;
    std::vector<ThreatFinding> unique;
    for (auto& finding : findings) {
        auto key = std::make_pair(finding.line, finding.category);
        auto it = best.find(key);
        if (it == best.end()) {
            best.emplace(key, unique.size());
            unique.push_back(std::move(finding));
        } else if (finding.severity > unique[it->second].severity) {
            unique[it->second] = std::move(finding);
        }
    }

    std::stable_sort(unique.begin(), unique.end(),
                     [](const ThreatFinding& a, const ThreatFinding& b) {
                         if (a.line != b.line) return a.line < b.line;
                         return a.severity > b.severity;
                     });

    ScanResult result;
    for (const auto& f : unique) {
        result.max_severity = std::max(result.max_severity, f.severity);
    }
    result.findings = std::move(unique);
    result.blocking = !result.findings.empty() && result.max_severity >= config_.block_threshold;
    return result;
}

} // namespace analyzers
} // namespace sentrybox
