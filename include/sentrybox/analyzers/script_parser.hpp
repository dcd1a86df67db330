/**
 * @file script_parser.hpp
 * @brief Tokenizer and recursive-descent parser for strategy scripts
 *
 * Turns a Python-style code unit into a tree of tagged-variant nodes. The
 * grammar covers the statement and expression forms user strategies use:
 * imports, assignments (plain, augmented, annotated), function and class
 * definitions with decorators, if/for/while/try/with blocks, lambdas,
 * comprehensions, conditional expressions, slicing and calls with keyword,
 * star and double-star arguments.
 *
 * The tree is deliberately lossy: it keeps what the threat scanner needs to
 * reason about (names, attribute chains, call targets, literals, nesting)
 * and folds everything else into generic nodes.
 *
 * @date 2025
 */

#pragma once

#include "sentrybox/utils/result.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace sentrybox {
namespace analyzers {

/***************************************************************************
 * Tokens
 ***************************************************************************/

enum class TokenType {
    NAME,
    NUMBER,
    STRING,
    OP,
    NEWLINE,
    INDENT,
    DEDENT,
    END_OF_INPUT
};

struct Token {
    TokenType type{TokenType::END_OF_INPUT};
    std::string text;          ///< Raw lexeme (string tokens: body without quotes)
    std::string prefix;        ///< String prefix letters, lower-cased (r, b, f, ...)
    int line{0};
    int column{0};
    std::size_t offset{0};
};

/**
 * @class Tokenizer
 * @brief Produces logical-line tokens with INDENT/DEDENT markers
 *
 * Newlines inside brackets and after a backslash continuation are ignored.
 * Tabs advance indentation to the next multiple of 8.
 */
class Tokenizer {
public:
    explicit Tokenizer(const std::string& source);

    /**
     * @brief Tokenize the whole input
     * @return Token stream ending with END_OF_INPUT, or PARSE_ERROR
     */
    utils::Result<std::vector<Token>> Tokenize();

private:
    const std::string& source_;
    std::size_t pos_{0};
    int line_{1};
    std::size_t line_start_{0};
    int bracket_depth_{0};
    std::vector<int> indents_{0};

    bool ReadIndentation(std::vector<Token>& out, std::string& error);
    bool ReadString(std::vector<Token>& out, const std::string& prefix,
                    std::size_t start, std::string& error);
    void ReadNumber(std::vector<Token>& out);
    bool ReadOperator(std::vector<Token>& out, std::string& error);
    Token Make(TokenType type, std::string text, std::size_t start,
               int line, std::size_t line_start) const;
};

/***************************************************************************
 * Syntax tree
 ***************************************************************************/

struct Node;
using NodePtr = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

enum class ConstantKind { STRING, BYTES, FSTRING, NUMBER, BOOLEAN, NONE, ELLIPSIS };

struct ModuleNode { NodeList body; };

struct NameNode { std::string id; };

struct ConstantNode {
    ConstantKind kind{ConstantKind::NONE};
    std::string value;
};

struct AttributeNode {
    NodePtr value;
    std::string attr;
};

struct KeywordArg {
    std::string name;          ///< Empty for **kwargs expansion
    NodePtr value;
};

struct CallNode {
    NodePtr func;
    NodeList args;             ///< Positional arguments (including *args)
    std::vector<KeywordArg> keywords;
};

struct BinOpNode {
    std::string op;            ///< "+", "*", "and", "<", "in", ...
    NodePtr left;
    NodePtr right;
};

struct UnaryOpNode {
    std::string op;            ///< "-", "+", "~", "not", "await", "*", "**"
    NodePtr operand;
};

struct SubscriptNode {
    NodePtr value;
    NodeList indices;          ///< Slice bounds are flattened in
};

enum class CollectionKind { LIST, TUPLE, SET, DICT, COMPREHENSION };

struct CollectionNode {
    CollectionKind kind{CollectionKind::LIST};
    NodeList elements;         ///< Dict keys and values interleaved
};

struct LambdaNode {
    std::vector<std::string> params;
    NodeList defaults;
    NodePtr body;
};

/// Conditional expressions, walrus targets, starred targets, yield
struct CompoundExprNode {
    std::string kind;          ///< "ifexp", "walrus", "yield", "yield_from"
    NodeList parts;
};

struct ImportAlias {
    std::string name;          ///< Dotted module or symbol name
    std::string asname;        ///< Empty when not aliased
};

struct ImportNode { std::vector<ImportAlias> names; };

struct ImportFromNode {
    std::string module;        ///< May be empty for "from . import x"
    int level{0};              ///< Leading dots
    std::vector<ImportAlias> names;  ///< "*" for star import
};

struct AssignNode {
    NodeList targets;
    std::string op;            ///< "=", "+=", ":" (annotation only), ...
    NodePtr value;             ///< Null for bare annotations
};

struct ExprStmtNode { NodePtr value; };

struct FunctionDefNode {
    std::string name;
    bool is_async{false};
    std::vector<std::string> params;
    NodeList defaults;         ///< Default values and annotations
    NodeList decorators;
    NodeList body;
};

struct ClassDefNode {
    std::string name;
    NodeList bases;            ///< Bases and keyword values
    NodeList decorators;
    NodeList body;
};

enum class BlockKind { IF, ELIF, ELSE, FOR, WHILE, TRY, EXCEPT, FINALLY, WITH };

struct BlockNode {
    BlockKind kind{BlockKind::IF};
    bool is_async{false};
    NodeList header;           ///< Condition, iterable, context managers, ...
    NodeList body;
    NodeList orelse;           ///< Chained elif/else/except/finally blocks
};

/// return, pass, break, continue, raise, del, global, nonlocal, assert
struct SimpleStmtNode {
    std::string keyword;
    NodeList values;
    std::vector<std::string> names;   ///< global / nonlocal names
};

using NodeData = std::variant<
    ModuleNode, NameNode, ConstantNode, AttributeNode, CallNode, BinOpNode,
    UnaryOpNode, SubscriptNode, CollectionNode, LambdaNode, CompoundExprNode,
    ImportNode, ImportFromNode, AssignNode, ExprStmtNode, FunctionDefNode,
    ClassDefNode, BlockNode, SimpleStmtNode>;

struct Node {
    NodeData data;
    int line{0};
    int column{0};
    std::size_t offset{0};
};

/**
 * @struct ParsedScript
 * @brief Parser output: the tree plus the token stream it came from
 */
struct ParsedScript {
    NodePtr module;
    std::vector<Token> tokens;
};

/**
 * @class ScriptParser
 * @brief Recursive-descent parser producing a ModuleNode tree
 *
 * **Usage Example**:
 * @code
 * auto parsed = ScriptParser::Parse("import os\nos.system('ls')\n");
 * if (!parsed) {
 *     spdlog::warn("Unparsable: {}", parsed.error().message);
 * }
 * @endcode
 */
class ScriptParser {
public:
    /// Nesting beyond this depth is rejected as a parse error
    static constexpr int kMaxNestingDepth = 200;

    /// Longest chain of binary operators or trailers in one expression
    static constexpr int kMaxChainLength = 1000;

    static utils::Result<ParsedScript> Parse(const std::string& source);

    /**
     * @brief Visit every node in pre-order with its nesting depth
     *
     * Children are visited in source order.
     */
    template <typename Fn>
    static void Walk(const Node& node, Fn&& fn, int depth = 0);

    /**
     * @brief Direct children of a node, in source order
     */
    static std::vector<const Node*> Children(const Node& node);
};

template <typename Fn>
void ScriptParser::Walk(const Node& node, Fn&& fn, int depth) {
    fn(node, depth);
    for (const Node* child : Children(node)) {
        Walk(*child, fn, depth + 1);
    }
}

} // namespace analyzers
} // namespace sentrybox
