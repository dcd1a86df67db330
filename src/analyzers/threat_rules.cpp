/**
 * @file threat_rules.cpp
 * @brief Built-in pattern rules covering every threat category
 *
 * @date 2025
 */

#include "sentrybox/analyzers/threat_rules.hpp"

#include <algorithm>
#include <set>

namespace sentrybox {
namespace analyzers {

namespace {

struct RuleDefinition {
    const char* id;
    ThreatCategory category;
    ThreatSeverity severity;
    const char* expression;
    const char* description;
};

using C = ThreatCategory;
using S = ThreatSeverity;

// Order matters only for reporting; every rule is evaluated
const RuleDefinition kRuleTable[] = {
    // Command injection
    {"CMD-001", C::COMMAND_INJECTION, S::CRITICAL, R"(\b(?:os|posix|nt)\s*\.\s*system\s*\()",
     "os.system() executes a shell command"},
    {"CMD-002", C::COMMAND_INJECTION, S::CRITICAL,
     R"(\bsubprocess\s*\.\s*(Popen|call|run|check_call|check_output|getoutput|getstatusoutput)\s*\()",
     "subprocess call spawns an external process"},
    {"CMD-003", C::COMMAND_INJECTION, S::CRITICAL, R"(\b(?:os|posix|nt)\s*\.\s*popen\s*\()",
     "os.popen() executes a shell command"},
    {"CMD-004", C::COMMAND_INJECTION, S::HIGH, R"(\bshell\s*=\s*True\b)",
     "shell=True passes the command through a shell"},
    {"CMD-005", C::COMMAND_INJECTION, S::CRITICAL,
     R"(\brm\s+-[a-zA-Z]*(rf|fr)[a-zA-Z]*\b)",
     "recursive forced delete command"},
    {"CMD-006", C::COMMAND_INJECTION, S::HIGH,
     R"(\b(?:os|posix|nt)\s*\.\s*(exec[lv]p?e?|spawn[lv]p?e?|posix_spawnp?)\s*\()",
     "os.exec*/os.spawn* replaces or spawns a process"},
    {"CMD-007", C::COMMAND_INJECTION, S::HIGH, R"(\bpty\s*\.\s*spawn\s*\()",
     "pty.spawn() starts an interactive process"},

    // Dynamic code execution
    {"DYN-001", C::DYNAMIC_CODE_EXECUTION, S::HIGH, R"((^|[^\w.])eval\s*\()",
     "eval() executes a string as code"},
    {"DYN-002", C::DYNAMIC_CODE_EXECUTION, S::HIGH, R"((^|[^\w.])exec\s*\()",
     "exec() executes a string as code"},
    {"DYN-003", C::DYNAMIC_CODE_EXECUTION, S::MEDIUM, R"((^|[^\w.])compile\s*\()",
     "compile() builds code objects from strings"},

    // Code injection
    {"INJ-001", C::CODE_INJECTION, S::HIGH, R"(\b__import__\s*\()",
     "__import__() loads modules by computed name"},
    {"INJ-002", C::CODE_INJECTION, S::HIGH, R"(\b(pickle|cPickle|marshal|dill|shelve)\s*\.\s*loads?\s*\()",
     "deserialization of untrusted data can execute code"},
    {"INJ-003", C::CODE_INJECTION, S::MEDIUM, R"(\bimportlib\s*\.\s*import_module\s*\()",
     "importlib.import_module() loads modules by computed name"},
    {"INJ-004", C::CODE_INJECTION, S::MEDIUM,
     R"(\b(base64\s*\.\s*b(64|32|16)decode|codecs\s*\.\s*decode|binascii\s*\.\s*a2b_\w+)\s*\()",
     "decoding of an embedded payload"},

    // File operations
    {"FILE-001", C::FILE_OPERATION, S::MEDIUM,
     R"(\bopen\s*\([^)]*,\s*(mode\s*=\s*)?['"][^'"]*[wax+][^'"]*['"])",
     "file opened for writing"},
    {"FILE-002", C::FILE_OPERATION, S::HIGH, R"(\bshutil\s*\.\s*rmtree\s*\()",
     "recursive directory removal"},
    {"FILE-003", C::FILE_OPERATION, S::MEDIUM,
     R"(\b(?:os|posix|nt)\s*\.\s*(remove|unlink|rmdir|removedirs|rename|replace|truncate)\s*\()",
     "filesystem mutation through os module"},

    // Unauthorized access
    {"ACC-001", C::UNAUTHORIZED_ACCESS, S::HIGH,
     R"(/etc/(passwd|shadow|sudoers|gshadow)|\.ssh/(id_\w+|authorized_keys)|/proc/self/(environ|mem))",
     "access to sensitive host credentials"},
    {"ACC-002", C::UNAUTHORIZED_ACCESS, S::HIGH,
     R"(__(subclasses|globals|builtins|code|mro|bases|closure)__)",
     "introspection attribute used in sandbox escapes"},
    {"ACC-003", C::UNAUTHORIZED_ACCESS, S::MEDIUM,
     R"((^|[^\w.])(getattr|setattr|delattr|globals|locals|vars)\s*\()",
     "reflection bypasses static review"},

    // Network access
    {"NET-001", C::NETWORK_ACCESS, S::MEDIUM, R"(\bsocket\s*\.\s*(socket|create_connection)\s*\()",
     "raw socket creation"},
    {"NET-002", C::NETWORK_ACCESS, S::MEDIUM,
     R"(\b(requests\s*\.\s*(get|post|put|delete|patch|head|request|Session)|urlopen|urllib\.request\.\w+|http\.client\.HTTPS?Connection|httpx\.\w+|aiohttp\.ClientSession)\s*\()",
     "outbound HTTP request"},
    {"NET-003", C::NETWORK_ACCESS, S::HIGH, R"(/dev/(tcp|udp)/)",
     "shell network redirection"},

    // Network scanning
    {"SCAN-001", C::NETWORK_SCAN, S::HIGH, R"(\b(nmap|masscan|zmap)\b|\.connect_ex\s*\()",
     "port scanning"},

    // System calls
    {"SYS-001", C::SYSTEM_CALL, S::HIGH,
     R"(\bctypes\s*\.\s*(CDLL|cdll|PyDLL|pydll|LibraryLoader|CFUNCTYPE|memmove|cast)\b)",
     "foreign function call into native code"},
    {"SYS-002", C::SYSTEM_CALL, S::MEDIUM, R"(\b(?:os|posix|nt)\s*\.\s*(fork|forkpty|kill|killpg|_exit)\s*\()",
     "direct process control"},
    {"SYS-003", C::SYSTEM_CALL, S::MEDIUM, R"(\b(signal\s*\.\s*signal|resource\s*\.\s*setrlimit)\s*\()",
     "process signal or limit manipulation"},

    // Privilege escalation
    {"PRIV-001", C::PRIVILEGE_ESCALATION, S::HIGH,
     R"(\b(?:os|posix|nt)\s*\.\s*(setuid|setgid|seteuid|setegid|setreuid|setregid|setresuid|setresgid|chown|chroot)\s*\()",
     "change of process identity or ownership"},
    {"PRIV-002", C::PRIVILEGE_ESCALATION, S::HIGH, R"(\bsudo\s+|\bchmod\s+(\+s|u\+s|[0-7]?[4-7][0-7]{3})\b)",
     "privilege elevation command"},

    // Data exfiltration
    {"EXF-001", C::DATA_EXFILTRATION, S::MEDIUM, R"(\b(smtplib|ftplib|telnetlib|paramiko|pysftp)\b)",
     "remote transfer protocol"},
    {"EXF-002", C::DATA_EXFILTRATION, S::HIGH, R"(\b(curl|wget|nc|ncat|netcat)\s+-?\w)",
     "command-line transfer tool"},
    {"EXF-003", C::DATA_EXFILTRATION, S::LOW, R"(\b(?:os|posix|nt)\s*\.\s*(environ|getenv)\b)",
     "environment variable access"},

    // Cryptographic operations
    {"CRY-001", C::CRYPTOGRAPHIC_OPERATION, S::LOW,
     R"(\b(Crypto\s*\.\s*Cipher|cryptography\s*\.\s*hazmat|Fernet|AES\s*\.\s*new|nacl\s*\.\s*secret)\b)",
     "symmetric encryption primitive"},
    {"CRY-002", C::CRYPTOGRAPHIC_OPERATION, S::LOW, R"(\bhashlib\s*\.\s*\w+\s*\()",
     "hash computation"},
};

std::vector<ThreatRule> BuildRules() {
    std::vector<ThreatRule> rules;
    for (const auto& entry : kRuleTable) {
        ThreatRule rule;
        rule.id = entry.id;
        rule.category = entry.category;
        rule.severity = entry.severity;
        rule.expression = entry.expression;
        rule.pattern = std::regex(entry.expression, std::regex::ECMAScript | std::regex::optimize);
        rule.description = entry.description;
        rules.push_back(std::move(rule));
    }
    return rules;
}

} // namespace

const std::vector<ThreatRule>& ThreatRules::Default() {
    static const std::vector<ThreatRule> rules = BuildRules();
    return rules;
}

std::vector<ThreatFinding> ThreatRules::Apply(const std::vector<ThreatRule>& rules,
                                              const std::string& code,
                                              std::size_t max_line_length) {
    std::vector<ThreatFinding> findings;
    if (max_line_length < 64) {
        max_line_length = 64;
    }
    const std::size_t overlap = max_line_length / 8;

    int line_number = 0;
    std::size_t line_start = 0;
    while (line_start <= code.size()) {
        ++line_number;
        std::size_t line_end = code.find('\n', line_start);
        if (line_end == std::string::npos) {
            line_end = code.size();
        }

        // One finding per (rule, line), even when windows overlap
        std::set<std::size_t> matched_rules;
        for (std::size_t window = line_start; window < line_end;
             window += max_line_length - overlap) {
            const std::size_t length = std::min(max_line_length, line_end - window);
            const std::string text = code.substr(window, length);

            for (std::size_t r = 0; r < rules.size(); ++r) {
                if (matched_rules.count(r)) {
                    continue;
                }
                std::smatch match;
                if (!std::regex_search(text, match, rules[r].pattern)) {
                    continue;
                }
                matched_rules.insert(r);

                ThreatFinding finding;
                finding.pattern_id = rules[r].id;
                finding.category = rules[r].category;
                finding.severity = rules[r].severity;
                finding.line = line_number;
                finding.offset = window + static_cast<std::size_t>(match.position(0));
                finding.description = rules[r].description;
                finding.source = FindingSource::PATTERN;
                findings.push_back(std::move(finding));
            }
            if (window + length >= line_end) {
                break;
            }
        }

        if (line_end == code.size()) {
            break;
        }
        line_start = line_end + 1;
    }
    return findings;
}

} // namespace analyzers
} // namespace sentrybox
