/**
 * @file script_parser.cpp
 * @brief Tokenizer and recursive-descent parser for strategy scripts
 *
 * The tokenizer follows the usual indentation-sensitive scheme: a stack of
 * indentation widths yields INDENT/DEDENT tokens at logical line starts,
 * bracket depth suppresses NEWLINE, and blank or comment-only lines are
 * skipped entirely.
 *
 * The parser is a conventional precedence-climbing descent:
 * ```
 * test        := lambda | or_test ['if' or_test 'else' test]
 * or_test     := and_test ('or' and_test)*
 * and_test    := not_test ('and' not_test)*
 * not_test    := 'not' not_test | comparison
 * comparison  := expr (comp_op expr)*
 * expr        := xor ('|' xor)* ... term := factor (('*'|'/'|'//'|'%'|'@') factor)*
 * factor      := ('+'|'-'|'~') factor | power
 * power       := ['await'] atom trailer* ['**' factor]
 * ```
 *
 * Errors are raised internally as ParseFailure and converted to a
 * PARSE_ERROR result at the ScriptParser::Parse boundary.
 *
 * @date 2025
 */

#include "sentrybox/analyzers/script_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

namespace sentrybox {
namespace analyzers {

namespace {

bool IsNameStart(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool IsNameChar(char c) {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool IsStringPrefix(const std::string& word) {
    static const std::unordered_set<std::string> prefixes = {
        "r", "u", "b", "f", "br", "rb", "fr", "rf"
    };
    std::string lower;
    for (char c : word) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return prefixes.count(lower) > 0;
}

// Longest operators first
const std::array<const char*, 5> kThreeCharOps = {"...", "**=", "//=", ">>=", "<<="};
const std::array<const char*, 20> kTwoCharOps = {
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", ":=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=", "<>"
};
const std::string kSingleCharOps = "+-*/%@&|^~<>()[]{},:;.=!";

} // namespace

// ============================================================================
// TOKENIZER
// ============================================================================

Tokenizer::Tokenizer(const std::string& source)
    : source_(source) {
}

Token Tokenizer::Make(TokenType type, std::string text, std::size_t start,
                      int line, std::size_t line_start) const {
    Token token;
    token.type = type;
    token.text = std::move(text);
    token.line = line;
    token.column = static_cast<int>(start - line_start);
    token.offset = start;
    return token;
}

bool Tokenizer::ReadIndentation(std::vector<Token>& out, std::string& error) {
    // Measure leading whitespace; blank and comment-only lines produce nothing
    int width = 0;
    std::size_t p = pos_;
    while (p < source_.size() && (source_[p] == ' ' || source_[p] == '\t' ||
                                  source_[p] == '\f')) {
        if (source_[p] == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (source_[p] == ' ') {
            ++width;
        }
        ++p;
    }
    pos_ = p;
    if (p >= source_.size() || source_[p] == '\n' || source_[p] == '\r' ||
        source_[p] == '#') {
        return true;
    }
    if (source_[p] == '\\' && p + 1 < source_.size() && source_[p + 1] == '\n') {
        return true;
    }

    if (width > indents_.back()) {
        indents_.push_back(width);
        out.push_back(Make(TokenType::INDENT, "", p, line_, line_start_));
        return true;
    }
    while (width < indents_.back()) {
        indents_.pop_back();
        out.push_back(Make(TokenType::DEDENT, "", p, line_, line_start_));
    }
    if (width != indents_.back()) {
        error = "inconsistent dedent at line " + std::to_string(line_);
        return false;
    }
    return true;
}

bool Tokenizer::ReadString(std::vector<Token>& out, const std::string& prefix,
                           std::size_t start, std::string& error) {
    const int start_line = line_;
    const std::size_t start_line_begin = line_start_;
    const char quote = source_[pos_];
    const bool triple = pos_ + 2 < source_.size() &&
                        source_[pos_ + 1] == quote && source_[pos_ + 2] == quote;
    const std::size_t delim = triple ? 3 : 1;
    pos_ += delim;
    const std::size_t body_start = pos_;

    while (pos_ < source_.size()) {
        char c = source_[pos_];
        if (c == '\\') {
            if (pos_ + 1 < source_.size() && source_[pos_ + 1] == '\n') {
                ++line_;
                line_start_ = pos_ + 2;
            }
            pos_ += 2;
            continue;
        }
        if (c == '\n') {
            if (!triple) {
                error = "unterminated string at line " + std::to_string(start_line);
                return false;
            }
            ++line_;
            line_start_ = pos_ + 1;
            ++pos_;
            continue;
        }
        if (c == quote) {
            if (!triple) {
                break;
            }
            if (pos_ + 2 < source_.size() && source_[pos_ + 1] == quote &&
                source_[pos_ + 2] == quote) {
                break;
            }
        }
        ++pos_;
    }
    if (pos_ >= source_.size()) {
        error = "unterminated string at line " + std::to_string(start_line);
        return false;
    }

    Token token = Make(TokenType::STRING, source_.substr(body_start, pos_ - body_start),
                       start, start_line, start_line_begin);
    for (char c : prefix) {
        token.prefix += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    out.push_back(std::move(token));
    pos_ += delim;
    return true;
}

void Tokenizer::ReadNumber(std::vector<Token>& out) {
    const std::size_t start = pos_;
    if (source_[pos_] == '0' && pos_ + 1 < source_.size() &&
        std::strchr("xXoObB", source_[pos_ + 1]) != nullptr) {
        pos_ += 2;
        while (pos_ < source_.size() &&
               (std::isxdigit(static_cast<unsigned char>(source_[pos_])) ||
                source_[pos_] == '_')) {
            ++pos_;
        }
    } else {
        while (pos_ < source_.size()) {
            char c = source_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
                ++pos_;
            } else if ((c == 'e' || c == 'E') && pos_ + 1 < source_.size()) {
                ++pos_;
                if (source_[pos_] == '+' || source_[pos_] == '-') {
                    ++pos_;
                }
            } else {
                break;
            }
        }
        if (pos_ < source_.size() && (source_[pos_] == 'j' || source_[pos_] == 'J')) {
            ++pos_;
        }
    }
    out.push_back(Make(TokenType::NUMBER, source_.substr(start, pos_ - start),
                       start, line_, line_start_));
}

bool Tokenizer::ReadOperator(std::vector<Token>& out, std::string& error) {
    const std::size_t start = pos_;
    auto matches = [&](const char* op) {
        return source_.compare(pos_, std::strlen(op), op) == 0;
    };

    std::string op;
    for (const char* candidate : kThreeCharOps) {
        if (op.empty() && matches(candidate)) op = candidate;
    }
    for (const char* candidate : kTwoCharOps) {
        if (op.empty() && matches(candidate)) op = candidate;
    }
    if (op.empty()) {
        char c = source_[pos_];
        if (kSingleCharOps.find(c) == std::string::npos) {
            error = "unexpected character at line " + std::to_string(line_);
            return false;
        }
        op = std::string(1, c);
    }

    if (op == "(" || op == "[" || op == "{") {
        ++bracket_depth_;
    } else if (op == ")" || op == "]" || op == "}") {
        if (bracket_depth_ == 0) {
            error = "unbalanced bracket at line " + std::to_string(line_);
            return false;
        }
        --bracket_depth_;
    }

    pos_ += op.size();
    out.push_back(Make(TokenType::OP, op, start, line_, line_start_));
    return true;
}

utils::Result<std::vector<Token>> Tokenizer::Tokenize() {
    std::vector<Token> tokens;
    std::string error;
    bool at_line_start = true;

    auto fail = [&]() {
        return utils::Result<std::vector<Token>>::Failure(utils::ErrorCode::PARSE_ERROR, error);
    };

    while (pos_ < source_.size()) {
        if (at_line_start && bracket_depth_ == 0) {
            at_line_start = false;
            if (!ReadIndentation(tokens, error)) {
                return fail();
            }
            continue;
        }

        char c = source_[pos_];

        if (c == '\n') {
            if (bracket_depth_ == 0 && !tokens.empty() &&
                tokens.back().type != TokenType::NEWLINE &&
                tokens.back().type != TokenType::INDENT &&
                tokens.back().type != TokenType::DEDENT) {
                tokens.push_back(Make(TokenType::NEWLINE, "", pos_, line_, line_start_));
            }
            ++pos_;
            ++line_;
            line_start_ = pos_;
            at_line_start = bracket_depth_ == 0;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
            ++pos_;
            continue;
        }
        if (c == '#') {
            while (pos_ < source_.size() && source_[pos_] != '\n') {
                ++pos_;
            }
            continue;
        }
        if (c == '\\') {
            std::size_t next = pos_ + 1;
            if (next < source_.size() && source_[next] == '\r') ++next;
            if (next < source_.size() && source_[next] == '\n') {
                pos_ = next + 1;
                ++line_;
                line_start_ = pos_;
                continue;
            }
            error = "unexpected line continuation at line " + std::to_string(line_);
            return fail();
        }

        if (IsNameStart(c)) {
            const std::size_t start = pos_;
            while (pos_ < source_.size() && IsNameChar(source_[pos_])) {
                ++pos_;
            }
            std::string word = source_.substr(start, pos_ - start);
            if (pos_ < source_.size() && (source_[pos_] == '"' || source_[pos_] == '\'') &&
                IsStringPrefix(word)) {
                if (!ReadString(tokens, word, start, error)) {
                    return fail();
                }
                continue;
            }
            tokens.push_back(Make(TokenType::NAME, std::move(word), start, line_, line_start_));
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && pos_ + 1 < source_.size() &&
             std::isdigit(static_cast<unsigned char>(source_[pos_ + 1])))) {
            ReadNumber(tokens);
            continue;
        }
        if (c == '"' || c == '\'') {
            if (!ReadString(tokens, "", pos_, error)) {
                return fail();
            }
            continue;
        }
        if (!ReadOperator(tokens, error)) {
            return fail();
        }
    }

    if (bracket_depth_ > 0) {
        error = "unexpected end of input inside brackets";
        return fail();
    }
    if (!tokens.empty() && tokens.back().type != TokenType::NEWLINE &&
        tokens.back().type != TokenType::DEDENT) {
        tokens.push_back(Make(TokenType::NEWLINE, "", pos_, line_, line_start_));
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        tokens.push_back(Make(TokenType::DEDENT, "", pos_, line_, line_start_));
    }
    tokens.push_back(Make(TokenType::END_OF_INPUT, "", pos_, line_, line_start_));
    return tokens;
}

// ============================================================================
// PARSER
// ============================================================================

namespace {

struct ParseFailure : std::runtime_error {
    using std::runtime_error::runtime_error;
};

const std::unordered_set<std::string>& ReservedWords() {
    static const std::unordered_set<std::string> words = {
        "and", "as", "assert", "async", "break", "class", "continue", "def",
        "del", "elif", "else", "except", "finally", "for", "from", "global",
        "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass",
        "raise", "return", "try", "while", "with", "yield", "await"
    };
    return words;
}

template <typename T>
NodePtr MakeNode(T data, const Token& at) {
    auto node = std::make_unique<Node>();
    node->data = std::move(data);
    node->line = at.line;
    node->column = at.column;
    node->offset = at.offset;
    return node;
}

class Parser {
public:
    explicit Parser(const std::vector<Token>& tokens)
        : tokens_(tokens) {
    }

    NodePtr ParseModule() {
        ModuleNode module;
        const Token& first = Peek();
        while (!At(TokenType::END_OF_INPUT)) {
            if (At(TokenType::NEWLINE)) {
                Advance();
                continue;
            }
            ParseStatement(module.body);
        }
        return MakeNode(std::move(module), first);
    }

private:
    const std::vector<Token>& tokens_;
    std::size_t index_{0};
    int depth_{0};

    // Tracks recursion depth for the lifetime of one nested construct
    class DepthGuard {
    public:
        explicit DepthGuard(Parser& parser) : parser_(parser) {
            if (++parser_.depth_ > ScriptParser::kMaxNestingDepth) {
                throw ParseFailure("nesting too deep at line " +
                                   std::to_string(parser_.Peek().line));
            }
        }
        ~DepthGuard() { --parser_.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& parser_;
    };

    // ---- token helpers ---------------------------------------------------

    const Token& Peek(std::size_t ahead = 0) const {
        std::size_t i = std::min(index_ + ahead, tokens_.size() - 1);
        return tokens_[i];
    }

    const Token& Advance() {
        const Token& token = tokens_[index_];
        if (index_ < tokens_.size() - 1) {
            ++index_;
        }
        return token;
    }

    bool At(TokenType type) const { return Peek().type == type; }

    bool AtOp(const char* op, std::size_t ahead = 0) const {
        const Token& t = Peek(ahead);
        return t.type == TokenType::OP && t.text == op;
    }

    bool AtKeyword(const char* word, std::size_t ahead = 0) const {
        const Token& t = Peek(ahead);
        return t.type == TokenType::NAME && t.text == word;
    }

    bool AcceptOp(const char* op) {
        if (AtOp(op)) {
            Advance();
            return true;
        }
        return false;
    }

    bool AcceptKeyword(const char* word) {
        if (AtKeyword(word)) {
            Advance();
            return true;
        }
        return false;
    }

    [[noreturn]] void Fail(const std::string& what) const {
        throw ParseFailure(what + " at line " + std::to_string(Peek().line));
    }

    const Token& ExpectOp(const char* op) {
        if (!AtOp(op)) {
            Fail(std::string("expected '") + op + "'");
        }
        return Advance();
    }

    void ExpectKeyword(const char* word) {
        if (!AcceptKeyword(word)) {
            Fail(std::string("expected '") + word + "'");
        }
    }

    std::string ExpectName() {
        const Token& t = Peek();
        if (t.type != TokenType::NAME || ReservedWords().count(t.text)) {
            Fail("expected identifier");
        }
        return Advance().text;
    }

    void ExpectEndOfLine() {
        if (At(TokenType::NEWLINE)) {
            Advance();
        } else if (!At(TokenType::END_OF_INPUT) && !At(TokenType::DEDENT)) {
            Fail("expected end of statement");
        }
    }

    // ---- statements ------------------------------------------------------

    void ParseStatement(NodeList& out) {
        DepthGuard guard(*this);
        const Token& t = Peek();

        if (t.type == TokenType::INDENT) {
            Fail("unexpected indent");
        }
        if (AtOp("@")) {
            out.push_back(ParseDecorated());
            return;
        }
        if (t.type == TokenType::NAME) {
            if (t.text == "if") { out.push_back(ParseIf(BlockKind::IF)); return; }
            if (t.text == "for") { out.push_back(ParseFor(false)); return; }
            if (t.text == "while") { out.push_back(ParseWhile()); return; }
            if (t.text == "try") { out.push_back(ParseTry()); return; }
            if (t.text == "with") { out.push_back(ParseWith(false)); return; }
            if (t.text == "def") { out.push_back(ParseFunction({}, false)); return; }
            if (t.text == "class") { out.push_back(ParseClass({})); return; }
            if (t.text == "async") {
                if (AtKeyword("def", 1)) { Advance(); out.push_back(ParseFunction({}, true)); return; }
                if (AtKeyword("for", 1)) { Advance(); out.push_back(ParseFor(true)); return; }
                if (AtKeyword("with", 1)) { Advance(); out.push_back(ParseWith(true)); return; }
                Fail("unexpected 'async'");
            }
        }
        ParseSimpleLine(out);
    }

    void ParseSimpleLine(NodeList& out) {
        out.push_back(ParseSmallStatement());
        while (AcceptOp(";")) {
            if (At(TokenType::NEWLINE) || At(TokenType::END_OF_INPUT)) {
                break;
            }
            out.push_back(ParseSmallStatement());
        }
        ExpectEndOfLine();
    }

    NodeList ParseSuite() {
        DepthGuard guard(*this);
        ExpectOp(":");
        NodeList body;
        if (!At(TokenType::NEWLINE)) {
            ParseSimpleLine(body);
            return body;
        }
        Advance();
        if (!At(TokenType::INDENT)) {
            Fail("expected an indented block");
        }
        Advance();
        while (!At(TokenType::DEDENT) && !At(TokenType::END_OF_INPUT)) {
            if (At(TokenType::NEWLINE)) {
                Advance();
                continue;
            }
            ParseStatement(body);
        }
        if (At(TokenType::DEDENT)) {
            Advance();
        }
        return body;
    }

    NodePtr ParseSmallStatement() {
        const Token& t = Peek();
        if (t.type == TokenType::NAME) {
            const std::string& w = t.text;
            if (w == "pass" || w == "break" || w == "continue") {
                Advance();
                SimpleStmtNode stmt;
                stmt.keyword = w;
                return MakeNode(std::move(stmt), t);
            }
            if (w == "return" || w == "del") {
                Advance();
                SimpleStmtNode stmt;
                stmt.keyword = w;
                if (!AtStatementEnd()) {
                    stmt.values.push_back(ParseTestList());
                }
                return MakeNode(std::move(stmt), t);
            }
            if (w == "raise") {
                Advance();
                SimpleStmtNode stmt;
                stmt.keyword = w;
                if (!AtStatementEnd()) {
                    stmt.values.push_back(ParseTest());
                    if (AcceptKeyword("from")) {
                        stmt.values.push_back(ParseTest());
                    }
                }
                return MakeNode(std::move(stmt), t);
            }
            if (w == "assert") {
                Advance();
                SimpleStmtNode stmt;
                stmt.keyword = w;
                stmt.values.push_back(ParseTest());
                if (AcceptOp(",")) {
                    stmt.values.push_back(ParseTest());
                }
                return MakeNode(std::move(stmt), t);
            }
            if (w == "global" || w == "nonlocal") {
                Advance();
                SimpleStmtNode stmt;
                stmt.keyword = w;
                stmt.names.push_back(ExpectName());
                while (AcceptOp(",")) {
                    stmt.names.push_back(ExpectName());
                }
                return MakeNode(std::move(stmt), t);
            }
            if (w == "import") {
                return ParseImport();
            }
            if (w == "from") {
                return ParseImportFrom();
            }
        }
        return ParseExpressionStatement();
    }

    bool AtStatementEnd() const {
        return At(TokenType::NEWLINE) || At(TokenType::END_OF_INPUT) || AtOp(";");
    }

    std::string ParseDottedName() {
        std::string name = ExpectName();
        while (AcceptOp(".")) {
            name += "." + ExpectName();
        }
        return name;
    }

    NodePtr ParseImport() {
        const Token& t = Advance();
        ImportNode node;
        do {
            ImportAlias alias;
            alias.name = ParseDottedName();
            if (AcceptKeyword("as")) {
                alias.asname = ExpectName();
            }
            node.names.push_back(std::move(alias));
        } while (AcceptOp(","));
        return MakeNode(std::move(node), t);
    }

    NodePtr ParseImportFrom() {
        const Token& t = Advance();
        ImportFromNode node;
        while (AtOp(".") || AtOp("...")) {
            node.level += static_cast<int>(Advance().text.size());
        }
        if (!AtKeyword("import")) {
            node.module = ParseDottedName();
        }
        ExpectKeyword("import");

        if (AcceptOp("*")) {
            node.names.push_back(ImportAlias{"*", ""});
            return MakeNode(std::move(node), t);
        }
        const bool parenthesized = AcceptOp("(");
        do {
            if (parenthesized && AtOp(")")) {
                break;
            }
            ImportAlias alias;
            alias.name = ExpectName();
            if (AcceptKeyword("as")) {
                alias.asname = ExpectName();
            }
            node.names.push_back(std::move(alias));
        } while (AcceptOp(","));
        if (parenthesized) {
            ExpectOp(")");
        }
        return MakeNode(std::move(node), t);
    }

    NodePtr ParseExpressionStatement() {
        static const std::unordered_set<std::string> augmented = {
            "+=", "-=", "*=", "/=", "//=", "%=", "**=", ">>=", "<<=",
            "&=", "|=", "^=", "@="
        };
        const Token& start = Peek();
        NodePtr first = AtKeyword("yield") ? ParseYield() : ParseTestListStar();

        if (AtOp("=")) {
            AssignNode assign;
            assign.op = "=";
            NodePtr current = std::move(first);
            while (AcceptOp("=")) {
                assign.targets.push_back(std::move(current));
                current = AtKeyword("yield") ? ParseYield() : ParseTestListStar();
            }
            assign.value = std::move(current);
            return MakeNode(std::move(assign), start);
        }
        if (Peek().type == TokenType::OP && augmented.count(Peek().text)) {
            AssignNode assign;
            assign.op = Advance().text;
            assign.targets.push_back(std::move(first));
            assign.value = AtKeyword("yield") ? ParseYield() : ParseTestList();
            return MakeNode(std::move(assign), start);
        }
        if (AcceptOp(":")) {
            AssignNode assign;
            assign.op = ":";
            assign.targets.push_back(std::move(first));
            assign.targets.push_back(ParseTest());
            if (AcceptOp("=")) {
                assign.op = "=";
                assign.value = AtKeyword("yield") ? ParseYield() : ParseTestListStar();
            }
            return MakeNode(std::move(assign), start);
        }

        ExprStmtNode stmt;
        stmt.value = std::move(first);
        return MakeNode(std::move(stmt), start);
    }

    // ---- compound statements ---------------------------------------------

    NodePtr ParseIf(BlockKind kind) {
        const Token& t = Advance();  // 'if' or 'elif'
        BlockNode block;
        block.kind = kind;
        block.header.push_back(ParseNamedExpr());
        block.body = ParseSuite();
        if (AtKeyword("elif")) {
            block.orelse.push_back(ParseIf(BlockKind::ELIF));
        } else if (AtKeyword("else")) {
            block.orelse.push_back(ParseElse());
        }
        return MakeNode(std::move(block), t);
    }

    NodePtr ParseElse() {
        const Token& t = Advance();
        BlockNode block;
        block.kind = BlockKind::ELSE;
        block.body = ParseSuite();
        return MakeNode(std::move(block), t);
    }

    NodePtr ParseFor(bool is_async) {
        const Token& t = Advance();
        BlockNode block;
        block.kind = BlockKind::FOR;
        block.is_async = is_async;
        block.header.push_back(ParseTargetList());
        ExpectKeyword("in");
        block.header.push_back(ParseTestList());
        block.body = ParseSuite();
        if (AtKeyword("else")) {
            block.orelse.push_back(ParseElse());
        }
        return MakeNode(std::move(block), t);
    }

    NodePtr ParseWhile() {
        const Token& t = Advance();
        BlockNode block;
        block.kind = BlockKind::WHILE;
        block.header.push_back(ParseNamedExpr());
        block.body = ParseSuite();
        if (AtKeyword("else")) {
            block.orelse.push_back(ParseElse());
        }
        return MakeNode(std::move(block), t);
    }

    NodePtr ParseTry() {
        const Token& t = Advance();
        BlockNode block;
        block.kind = BlockKind::TRY;
        block.body = ParseSuite();

        bool has_handler = false;
        while (AtKeyword("except")) {
            const Token& et = Advance();
            AcceptOp("*");
            BlockNode handler;
            handler.kind = BlockKind::EXCEPT;
            if (!AtOp(":")) {
                handler.header.push_back(ParseTest());
                if (AcceptKeyword("as")) {
                    ExpectName();
                } else if (AcceptOp(",")) {
                    handler.header.push_back(ParseTest());
                }
            }
            handler.body = ParseSuite();
            block.orelse.push_back(MakeNode(std::move(handler), et));
            has_handler = true;
        }
        if (has_handler && AtKeyword("else")) {
            block.orelse.push_back(ParseElse());
        }
        if (AtKeyword("finally")) {
            const Token& ft = Advance();
            BlockNode fin;
            fin.kind = BlockKind::FINALLY;
            fin.body = ParseSuite();
            block.orelse.push_back(MakeNode(std::move(fin), ft));
            has_handler = true;
        }
        if (!has_handler) {
            Fail("expected 'except' or 'finally'");
        }
        return MakeNode(std::move(block), t);
    }

    NodePtr ParseWith(bool is_async) {
        const Token& t = Advance();
        BlockNode block;
        block.kind = BlockKind::WITH;
        block.is_async = is_async;
        do {
            block.header.push_back(ParseTest());
            if (AcceptKeyword("as")) {
                block.header.push_back(ParseTarget());
            }
        } while (AcceptOp(","));
        block.body = ParseSuite();
        return MakeNode(std::move(block), t);
    }

    NodePtr ParseDecorated() {
        NodeList decorators;
        while (AcceptOp("@")) {
            decorators.push_back(ParseNamedExpr());
            ExpectEndOfLine();
        }
        if (AtKeyword("def")) {
            return ParseFunction(std::move(decorators), false);
        }
        if (AtKeyword("async") && AtKeyword("def", 1)) {
            Advance();
            return ParseFunction(std::move(decorators), true);
        }
        if (AtKeyword("class")) {
            return ParseClass(std::move(decorators));
        }
        Fail("expected definition after decorator");
    }

    NodePtr ParseFunction(NodeList decorators, bool is_async) {
        const Token& t = Advance();  // 'def'
        FunctionDefNode fn;
        fn.is_async = is_async;
        fn.decorators = std::move(decorators);
        fn.name = ExpectName();
        ExpectOp("(");
        ParseParameters(")", true, fn.params, fn.defaults);
        ExpectOp(")");
        if (AcceptOp("->")) {
            fn.defaults.push_back(ParseTest());
        }
        fn.body = ParseSuite();
        return MakeNode(std::move(fn), t);
    }

    void ParseParameters(const char* closer, bool annotations,
                         std::vector<std::string>& params, NodeList& defaults) {
        while (!AtOp(closer)) {
            if (AcceptOp("/")) {
                // positional-only marker
            } else if (AcceptOp("**") || AcceptOp("*")) {
                if (Peek().type == TokenType::NAME) {
                    params.push_back(ExpectName());
                    if (annotations && AcceptOp(":")) {
                        defaults.push_back(ParseTest());
                    }
                }
            } else {
                params.push_back(ExpectName());
                if (annotations && AcceptOp(":")) {
                    defaults.push_back(ParseTest());
                }
                if (AcceptOp("=")) {
                    defaults.push_back(ParseTest());
                }
            }
            if (!AcceptOp(",")) {
                break;
            }
        }
    }

    NodePtr ParseClass(NodeList decorators) {
        const Token& t = Advance();  // 'class'
        ClassDefNode cls;
        cls.decorators = std::move(decorators);
        cls.name = ExpectName();
        if (AcceptOp("(")) {
            while (!AtOp(")")) {
                if (Peek().type == TokenType::NAME && AtOp("=", 1)) {
                    Advance();
                    Advance();
                }
                if (!AcceptOp("**")) {
                    AcceptOp("*");
                }
                cls.bases.push_back(ParseTest());
                if (!AcceptOp(",")) {
                    break;
                }
            }
            ExpectOp(")");
        }
        cls.body = ParseSuite();
        return MakeNode(std::move(cls), t);
    }

    // ---- expression lists ------------------------------------------------

    // Builds a tuple node when more than one element (or a trailing comma)
    template <typename ElementFn>
    NodePtr ParseList(ElementFn element, bool (Parser::*is_end)() const) {
        const Token& start = Peek();
        NodePtr first = (this->*element)();
        if (!AtOp(",")) {
            return first;
        }
        CollectionNode tuple;
        tuple.kind = CollectionKind::TUPLE;
        tuple.elements.push_back(std::move(first));
        while (AcceptOp(",")) {
            if ((this->*is_end)()) {
                break;
            }
            tuple.elements.push_back((this->*element)());
        }
        return MakeNode(std::move(tuple), start);
    }

    bool AtListEnd() const {
        const Token& t = Peek();
        if (t.type == TokenType::NEWLINE || t.type == TokenType::END_OF_INPUT) {
            return true;
        }
        if (t.type == TokenType::OP) {
            static const std::unordered_set<std::string> enders = {
                "=", ")", "]", "}", ";", ":", "+=", "-=", "*=", "/=", "//=",
                "%=", "**=", ">>=", "<<=", "&=", "|=", "^=", "@="
            };
            return enders.count(t.text) > 0;
        }
        return t.type == TokenType::NAME && t.text == "in";
    }

    NodePtr ParseTestList() { return ParseList(&Parser::ParseTest, &Parser::AtListEnd); }
    NodePtr ParseTestListStar() { return ParseList(&Parser::ParseTestOrStar, &Parser::AtListEnd); }
    NodePtr ParseTargetList() { return ParseList(&Parser::ParseTarget, &Parser::AtListEnd); }

    NodePtr ParseTestOrStar() {
        if (AtOp("*")) {
            const Token& t = Advance();
            UnaryOpNode star;
            star.op = "*";
            star.operand = ParseExpr();
            return MakeNode(std::move(star), t);
        }
        return ParseTest();
    }

    NodePtr ParseTarget() {
        if (AtOp("*")) {
            const Token& t = Advance();
            UnaryOpNode star;
            star.op = "*";
            star.operand = ParseExpr();
            return MakeNode(std::move(star), t);
        }
        return ParseExpr();
    }

    NodePtr ParseYield() {
        const Token& t = Advance();
        CompoundExprNode node;
        node.kind = "yield";
        if (AcceptKeyword("from")) {
            node.kind = "yield_from";
            node.parts.push_back(ParseTest());
        } else if (!AtStatementEnd() && !AtOp(")") && !AtOp("=")) {
            node.parts.push_back(ParseTestListStar());
        }
        return MakeNode(std::move(node), t);
    }

    // ---- expressions -----------------------------------------------------

    NodePtr ParseNamedExpr() {
        const Token& start = Peek();
        NodePtr target = ParseTest();
        if (AcceptOp(":=")) {
            CompoundExprNode walrus;
            walrus.kind = "walrus";
            walrus.parts.push_back(std::move(target));
            walrus.parts.push_back(ParseTest());
            return MakeNode(std::move(walrus), start);
        }
        return target;
    }

    NodePtr ParseTest() {
        DepthGuard guard(*this);
        if (AtKeyword("lambda")) {
            return ParseLambda();
        }
        const Token& start = Peek();
        NodePtr value = ParseOrTest();
        if (AcceptKeyword("if")) {
            CompoundExprNode ifexp;
            ifexp.kind = "ifexp";
            ifexp.parts.push_back(std::move(value));
            ifexp.parts.push_back(ParseOrTest());
            ExpectKeyword("else");
            ifexp.parts.push_back(ParseTest());
            return MakeNode(std::move(ifexp), start);
        }
        return value;
    }

    NodePtr ParseLambda() {
        const Token& t = Advance();
        LambdaNode lambda;
        ParseParameters(":", false, lambda.params, lambda.defaults);
        ExpectOp(":");
        lambda.body = ParseTest();
        return MakeNode(std::move(lambda), t);
    }

    NodePtr Binary(const Token& at, std::string op, NodePtr left, NodePtr right) {
        BinOpNode bin;
        bin.op = std::move(op);
        bin.left = std::move(left);
        bin.right = std::move(right);
        return MakeNode(std::move(bin), at);
    }

    void CheckChain(int& length) const {
        if (++length > ScriptParser::kMaxChainLength) {
            Fail("expression too long");
        }
    }

    NodePtr ParseOrTest() {
        const Token& start = Peek();
        NodePtr left = ParseAndTest();
        int chain = 0;
        while (AcceptKeyword("or")) {
            CheckChain(chain);
            left = Binary(start, "or", std::move(left), ParseAndTest());
        }
        return left;
    }

    NodePtr ParseAndTest() {
        const Token& start = Peek();
        NodePtr left = ParseNotTest();
        int chain = 0;
        while (AcceptKeyword("and")) {
            CheckChain(chain);
            left = Binary(start, "and", std::move(left), ParseNotTest());
        }
        return left;
    }

    NodePtr ParseNotTest() {
        if (AtKeyword("not")) {
            DepthGuard guard(*this);
            const Token& t = Advance();
            UnaryOpNode node;
            node.op = "not";
            node.operand = ParseNotTest();
            return MakeNode(std::move(node), t);
        }
        return ParseComparison();
    }

    NodePtr ParseComparison() {
        static const std::unordered_set<std::string> ops = {
            "<", ">", "==", ">=", "<=", "!=", "<>"
        };
        const Token& start = Peek();
        NodePtr left = ParseExpr();
        int chain = 0;
        for (;;) {
            std::string op;
            if (Peek().type == TokenType::OP && ops.count(Peek().text)) {
                op = Advance().text;
            } else if (AtKeyword("in")) {
                Advance();
                op = "in";
            } else if (AtKeyword("not") && AtKeyword("in", 1)) {
                Advance();
                Advance();
                op = "not in";
            } else if (AtKeyword("is")) {
                Advance();
                op = AcceptKeyword("not") ? "is not" : "is";
            } else {
                break;
            }
            CheckChain(chain);
            left = Binary(start, op, std::move(left), ParseExpr());
        }
        return left;
    }

    // Left-associative binary level over a set of operator tokens
    NodePtr ParseBinaryLevel(const std::unordered_set<std::string>& ops,
                             NodePtr (Parser::*next)()) {
        const Token& start = Peek();
        NodePtr left = (this->*next)();
        int chain = 0;
        while (Peek().type == TokenType::OP && ops.count(Peek().text)) {
            CheckChain(chain);
            std::string op = Advance().text;
            left = Binary(start, op, std::move(left), (this->*next)());
        }
        return left;
    }

    NodePtr ParseExpr() {
        static const std::unordered_set<std::string> ops = {"|"};
        return ParseBinaryLevel(ops, &Parser::ParseXor);
    }

    NodePtr ParseXor() {
        static const std::unordered_set<std::string> ops = {"^"};
        return ParseBinaryLevel(ops, &Parser::ParseAnd);
    }

    NodePtr ParseAnd() {
        static const std::unordered_set<std::string> ops = {"&"};
        return ParseBinaryLevel(ops, &Parser::ParseShift);
    }

    NodePtr ParseShift() {
        static const std::unordered_set<std::string> ops = {"<<", ">>"};
        return ParseBinaryLevel(ops, &Parser::ParseArith);
    }

    NodePtr ParseArith() {
        static const std::unordered_set<std::string> ops = {"+", "-"};
        return ParseBinaryLevel(ops, &Parser::ParseTerm);
    }

    NodePtr ParseTerm() {
        static const std::unordered_set<std::string> ops = {"*", "/", "//", "%", "@"};
        return ParseBinaryLevel(ops, &Parser::ParseFactor);
    }

    NodePtr ParseFactor() {
        if (AtOp("+") || AtOp("-") || AtOp("~")) {
            DepthGuard guard(*this);
            const Token& t = Advance();
            UnaryOpNode node;
            node.op = t.text;
            node.operand = ParseFactor();
            return MakeNode(std::move(node), t);
        }
        return ParsePower();
    }

    NodePtr ParsePower() {
        const Token& start = Peek();
        NodePtr base;
        if (AtKeyword("await")) {
            DepthGuard guard(*this);
            const Token& t = Advance();
            UnaryOpNode node;
            node.op = "await";
            node.operand = ParseAtomExpr();
            base = MakeNode(std::move(node), t);
        } else {
            base = ParseAtomExpr();
        }
        if (AcceptOp("**")) {
            DepthGuard guard(*this);
            return Binary(start, "**", std::move(base), ParseFactor());
        }
        return base;
    }

    NodePtr ParseAtomExpr() {
        const Token& start = Peek();
        NodePtr value = ParseAtom();
        int chain = 0;
        for (;;) {
            if (AtOp("(")) {
                CheckChain(chain);
                value = ParseCall(start, std::move(value));
            } else if (AtOp("[")) {
                CheckChain(chain);
                Advance();
                SubscriptNode sub;
                sub.value = std::move(value);
                ParseSubscripts(sub.indices);
                ExpectOp("]");
                value = MakeNode(std::move(sub), start);
            } else if (AtOp(".")) {
                CheckChain(chain);
                Advance();
                AttributeNode attr;
                attr.value = std::move(value);
                attr.attr = ExpectName();
                value = MakeNode(std::move(attr), start);
            } else {
                break;
            }
        }
        return value;
    }

    NodePtr ParseCall(const Token& start, NodePtr func) {
        ExpectOp("(");
        CallNode call;
        call.func = std::move(func);
        while (!AtOp(")")) {
            if (AcceptOp("**")) {
                call.keywords.push_back(KeywordArg{"", ParseTest()});
            } else if (AtOp("*")) {
                call.args.push_back(ParseTestOrStar());
            } else if (Peek().type == TokenType::NAME && AtOp("=", 1)) {
                std::string name = Advance().text;
                Advance();
                call.keywords.push_back(KeywordArg{name, ParseTest()});
            } else {
                const Token& arg_start = Peek();
                NodePtr arg = ParseNamedExpr();
                if (AtKeyword("for") || (AtKeyword("async") && AtKeyword("for", 1))) {
                    arg = ParseComprehension(arg_start, std::move(arg));
                }
                call.args.push_back(std::move(arg));
            }
            if (!AcceptOp(",")) {
                break;
            }
        }
        ExpectOp(")");
        return MakeNode(std::move(call), start);
    }

    void ParseSubscripts(NodeList& out) {
        do {
            if (AtOp("]")) {
                break;
            }
            if (!AtOp(":")) {
                out.push_back(ParseTestOrStar());
            }
            // slice bounds [lower]:[upper][:[step]]
            for (int i = 0; i < 2 && AcceptOp(":"); ++i) {
                if (!AtOp(":") && !AtOp("]") && !AtOp(",")) {
                    out.push_back(ParseTest());
                }
            }
        } while (AcceptOp(","));
    }

    NodePtr ParseComprehension(const Token& start, NodePtr element) {
        CollectionNode comp;
        comp.kind = CollectionKind::COMPREHENSION;
        comp.elements.push_back(std::move(element));
        while (AtKeyword("for") || (AtKeyword("async") && AtKeyword("for", 1))) {
            AcceptKeyword("async");
            Advance();  // 'for'
            comp.elements.push_back(ParseTargetList());
            ExpectKeyword("in");
            comp.elements.push_back(ParseOrTest());
            while (AcceptKeyword("if")) {
                comp.elements.push_back(ParseOrTest());
            }
        }
        return MakeNode(std::move(comp), start);
    }

    NodePtr ParseAtom() {
        DepthGuard guard(*this);
        const Token& t = Peek();

        switch (t.type) {
            case TokenType::NUMBER: {
                Advance();
                return MakeNode(ConstantNode{ConstantKind::NUMBER, t.text}, t);
            }
            case TokenType::STRING:
                return ParseStrings();
            case TokenType::NAME: {
                if (t.text == "True" || t.text == "False") {
                    Advance();
                    return MakeNode(ConstantNode{ConstantKind::BOOLEAN, t.text}, t);
                }
                if (t.text == "None") {
                    Advance();
                    return MakeNode(ConstantNode{ConstantKind::NONE, t.text}, t);
                }
                if (ReservedWords().count(t.text)) {
                    Fail("unexpected keyword '" + t.text + "'");
                }
                Advance();
                return MakeNode(NameNode{t.text}, t);
            }
            case TokenType::OP:
                break;
            default:
                Fail("unexpected token");
        }

        if (t.text == "...") {
            Advance();
            return MakeNode(ConstantNode{ConstantKind::ELLIPSIS, "..."}, t);
        }
        if (t.text == "(") {
            return ParseParenthesized();
        }
        if (t.text == "[") {
            return ParseListDisplay();
        }
        if (t.text == "{") {
            return ParseBraceDisplay();
        }
        Fail("unexpected '" + t.text + "'");
    }

    NodePtr ParseStrings() {
        const Token& first = Peek();
        ConstantNode constant;
        constant.kind = ConstantKind::STRING;
        while (At(TokenType::STRING)) {
            const Token& s = Advance();
            if (s.prefix.find('b') != std::string::npos) {
                constant.kind = ConstantKind::BYTES;
            } else if (s.prefix.find('f') != std::string::npos) {
                constant.kind = ConstantKind::FSTRING;
            }
            constant.value += s.text;
        }
        return MakeNode(std::move(constant), first);
    }

    NodePtr ParseParenthesized() {
        const Token& t = Advance();
        if (AcceptOp(")")) {
            CollectionNode empty;
            empty.kind = CollectionKind::TUPLE;
            return MakeNode(std::move(empty), t);
        }
        if (AtKeyword("yield")) {
            NodePtr y = ParseYield();
            ExpectOp(")");
            return y;
        }
        NodePtr first = AtOp("*") ? ParseTestOrStar() : ParseNamedExpr();
        if (AtKeyword("for") || (AtKeyword("async") && AtKeyword("for", 1))) {
            NodePtr comp = ParseComprehension(t, std::move(first));
            ExpectOp(")");
            return comp;
        }
        if (!AtOp(",")) {
            ExpectOp(")");
            return first;
        }
        CollectionNode tuple;
        tuple.kind = CollectionKind::TUPLE;
        tuple.elements.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (AtOp(")")) {
                break;
            }
            tuple.elements.push_back(AtOp("*") ? ParseTestOrStar() : ParseNamedExpr());
        }
        ExpectOp(")");
        return MakeNode(std::move(tuple), t);
    }

    NodePtr ParseListDisplay() {
        const Token& t = Advance();
        CollectionNode list;
        list.kind = CollectionKind::LIST;
        if (AcceptOp("]")) {
            return MakeNode(std::move(list), t);
        }
        NodePtr first = AtOp("*") ? ParseTestOrStar() : ParseNamedExpr();
        if (AtKeyword("for") || (AtKeyword("async") && AtKeyword("for", 1))) {
            NodePtr comp = ParseComprehension(t, std::move(first));
            ExpectOp("]");
            return comp;
        }
        list.elements.push_back(std::move(first));
        while (AcceptOp(",")) {
            if (AtOp("]")) {
                break;
            }
            list.elements.push_back(AtOp("*") ? ParseTestOrStar() : ParseNamedExpr());
        }
        ExpectOp("]");
        return MakeNode(std::move(list), t);
    }

    NodePtr ParseBraceDisplay() {
        const Token& t = Advance();
        CollectionNode coll;
        coll.kind = CollectionKind::DICT;
        if (AcceptOp("}")) {
            return MakeNode(std::move(coll), t);
        }

        bool is_dict = false;
        auto parse_item = [&](bool first_item) {
            if (AcceptOp("**")) {
                is_dict = is_dict || first_item;
                coll.elements.push_back(ParseExpr());
                return;
            }
            coll.elements.push_back(AtOp("*") ? ParseTestOrStar() : ParseTest());
            if (AcceptOp(":")) {
                is_dict = is_dict || first_item;
                coll.elements.push_back(ParseTest());
            }
        };

        parse_item(true);
        if (AtKeyword("for") || (AtKeyword("async") && AtKeyword("for", 1))) {
            NodePtr element;
            if (coll.elements.size() == 1) {
                element = std::move(coll.elements.front());
            } else {
                CollectionNode pair;
                pair.kind = CollectionKind::TUPLE;
                pair.elements = std::move(coll.elements);
                element = MakeNode(std::move(pair), t);
            }
            NodePtr comp = ParseComprehension(t, std::move(element));
            ExpectOp("}");
            return comp;
        }
        while (AcceptOp(",")) {
            if (AtOp("}")) {
                break;
            }
            parse_item(false);
        }
        ExpectOp("}");
        coll.kind = is_dict ? CollectionKind::DICT : CollectionKind::SET;
        return MakeNode(std::move(coll), t);
    }
};

// Collects child pointers of each node kind in source order
struct ChildCollector {
    std::vector<const Node*>& out;

    void Add(const NodePtr& node) {
        if (node) out.push_back(node.get());
    }
    void Add(const NodeList& nodes) {
        for (const auto& n : nodes) Add(n);
    }

    void operator()(const ModuleNode& n) { Add(n.body); }
    void operator()(const NameNode&) {}
    void operator()(const ConstantNode&) {}
    void operator()(const AttributeNode& n) { Add(n.value); }
    void operator()(const CallNode& n) {
        Add(n.func);
        Add(n.args);
        for (const auto& kw : n.keywords) Add(kw.value);
    }
    void operator()(const BinOpNode& n) { Add(n.left); Add(n.right); }
    void operator()(const UnaryOpNode& n) { Add(n.operand); }
    void operator()(const SubscriptNode& n) { Add(n.value); Add(n.indices); }
    void operator()(const CollectionNode& n) { Add(n.elements); }
    void operator()(const LambdaNode& n) { Add(n.defaults); Add(n.body); }
    void operator()(const CompoundExprNode& n) { Add(n.parts); }
    void operator()(const ImportNode&) {}
    void operator()(const ImportFromNode&) {}
    void operator()(const AssignNode& n) { Add(n.targets); Add(n.value); }
    void operator()(const ExprStmtNode& n) { Add(n.value); }
    void operator()(const FunctionDefNode& n) { Add(n.decorators); Add(n.defaults); Add(n.body); }
    void operator()(const ClassDefNode& n) { Add(n.decorators); Add(n.bases); Add(n.body); }
    void operator()(const BlockNode& n) { Add(n.header); Add(n.body); Add(n.orelse); }
    void operator()(const SimpleStmtNode& n) { Add(n.values); }
};

} // namespace

// ============================================================================
// PUBLIC ENTRY POINTS
// ============================================================================

utils::Result<ParsedScript> ScriptParser::Parse(const std::string& source) {
    Tokenizer tokenizer(source);
    auto tokens = tokenizer.Tokenize();
    if (!tokens) {
        return tokens.error();
    }

    ParsedScript script;
    script.tokens = std::move(tokens).value();
    try {
        Parser parser(script.tokens);
        script.module = parser.ParseModule();
    } catch (const ParseFailure& e) {
        return utils::Result<ParsedScript>::Failure(utils::ErrorCode::PARSE_ERROR, e.what());
    }
    return script;
}

std::vector<const Node*> ScriptParser::Children(const Node& node) {
    std::vector<const Node*> children;
    std::visit(ChildCollector{children}, node.data);
    return children;
}

} // namespace analyzers
} // namespace sentrybox
