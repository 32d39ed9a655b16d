#include "when/cel_expression.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>
#include <utility>

namespace stepgate::when {

using core::errors::ErrorCategory;
using core::errors::StepError;

enum class TokenType {
    Identifier,
    String,
    Int,
    Double,
    OpOr,
    OpAnd,
    OpEq,
    OpNe,
    OpLt,
    OpLte,
    OpGt,
    OpGte,
    OpIn,
    OpPlus,
    OpMinus,
    OpMul,
    OpDiv,
    OpMod,
    OpNot,
    Question,
    Colon,
    LParen,
    RParen,
    LBracket,
    RBracket,
    Comma,
    Dot,
    End
};

struct Token {
    TokenType type;
    std::string value;
    std::size_t offset;
};

struct CelNode {
    enum class Kind {
        Literal,
        List,
        Not,
        Negate,
        Binary,
        And,
        Or,
        Conditional,
        Call,
        Index
    };

    Kind kind = Kind::Literal;
    CelValue literal;
    TokenType op = TokenType::End;
    std::string function;
    std::vector<std::shared_ptr<const CelNode>> children;
    std::size_t height = 1;
};

namespace {

using NodePtr = std::shared_ptr<const CelNode>;

StepError compile_error(const std::string& source, const std::string& why) {
    return StepError{ErrorCategory::Evaluation,
                     "Failed to compile expression \"" + source + "\": " + why,
                     "cel_compile_failed"};
}

StepError eval_error(const std::string& why) {
    return StepError{ErrorCategory::Evaluation, "Failed to evaluate expression: " + why,
                     "cel_evaluation_failed"};
}

StepError no_overload(const std::string& op, const CelValue& lhs, const CelValue& rhs) {
    return eval_error("no such overload: " + type_name(lhs) + " " + op + " " +
                      type_name(rhs));
}

// --- Lexer ---

core::errors::Result<std::vector<Token>> tokenize(const std::string& source) {
    struct CodeMap {
        const char* code;
        TokenType token;
    };

    static const CodeMap op2_table[] = {
        {"||", TokenType::OpOr},  {"&&", TokenType::OpAnd}, {"==", TokenType::OpEq},
        {"!=", TokenType::OpNe},  {"<=", TokenType::OpLte}, {">=", TokenType::OpGte},
    };
    static const CodeMap op_table[] = {
        {"<", TokenType::OpLt},      {">", TokenType::OpGt},      {"+", TokenType::OpPlus},
        {"-", TokenType::OpMinus},   {"*", TokenType::OpMul},     {"/", TokenType::OpDiv},
        {"%", TokenType::OpMod},     {"!", TokenType::OpNot},     {"?", TokenType::Question},
        {":", TokenType::Colon},     {"(", TokenType::LParen},    {")", TokenType::RParen},
        {"[", TokenType::LBracket},  {"]", TokenType::RBracket},  {",", TokenType::Comma},
        {".", TokenType::Dot},
    };

    std::vector<Token> tokens;
    std::size_t i = 0;
    while (i < source.size()) {
        const char code = source[i];
        if (std::isspace(static_cast<unsigned char>(code))) {
            ++i;
            continue;
        }

        if (std::isalpha(static_cast<unsigned char>(code)) || code == '_') {
            const std::size_t start = i;
            while (i < source.size() &&
                   (std::isalnum(static_cast<unsigned char>(source[i])) || source[i] == '_')) {
                ++i;
            }
            auto word = source.substr(start, i - start);
            tokens.push_back({word == "in" ? TokenType::OpIn : TokenType::Identifier,
                              std::move(word), start});
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(code))) {
            const std::size_t start = i;
            bool is_double = false;
            while (i < source.size() && std::isdigit(static_cast<unsigned char>(source[i]))) {
                ++i;
            }
            if (i + 1 < source.size() && source[i] == '.' &&
                std::isdigit(static_cast<unsigned char>(source[i + 1]))) {
                is_double = true;
                ++i;
                while (i < source.size() && std::isdigit(static_cast<unsigned char>(source[i]))) {
                    ++i;
                }
            }
            if (i < source.size() && (source[i] == 'e' || source[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < source.size() && (source[j] == '+' || source[j] == '-')) {
                    ++j;
                }
                if (j < source.size() && std::isdigit(static_cast<unsigned char>(source[j]))) {
                    is_double = true;
                    i = j;
                    while (i < source.size() &&
                           std::isdigit(static_cast<unsigned char>(source[i]))) {
                        ++i;
                    }
                }
            }
            tokens.push_back({is_double ? TokenType::Double : TokenType::Int,
                              source.substr(start, i - start), start});
            continue;
        }

        if (code == '"' || code == '\'') {
            const char quote = code;
            const std::size_t start = i++;
            std::string value;
            bool closed = false;
            while (i < source.size()) {
                const char c = source[i++];
                if (c == quote) {
                    closed = true;
                    break;
                }
                if (c != '\\') {
                    value.push_back(c);
                    continue;
                }
                if (i >= source.size()) {
                    break;
                }
                const char escaped = source[i++];
                switch (escaped) {
                    case 'n': value.push_back('\n'); break;
                    case 't': value.push_back('\t'); break;
                    case 'r': value.push_back('\r'); break;
                    case '\\': value.push_back('\\'); break;
                    case '\'': value.push_back('\''); break;
                    case '"': value.push_back('"'); break;
                    default:
                        return compile_error(source, std::string("invalid escape \\") + escaped);
                }
            }
            if (!closed) {
                return compile_error(source, "unterminated string literal");
            }
            tokens.push_back({TokenType::String, std::move(value), start});
            continue;
        }

        bool found = false;
        for (const auto& entry : op2_table) {
            if (source.compare(i, 2, entry.code) == 0) {
                tokens.push_back({entry.token, entry.code, i});
                i += 2;
                found = true;
                break;
            }
        }
        if (!found) {
            for (const auto& entry : op_table) {
                if (code == entry.code[0]) {
                    tokens.push_back({entry.token, entry.code, i});
                    ++i;
                    found = true;
                    break;
                }
            }
        }
        if (!found) {
            return compile_error(source, std::string("unexpected character '") + code +
                                             "' at offset " + std::to_string(i));
        }
    }
    tokens.push_back({TokenType::End, "", source.size()});
    return tokens;
}

// --- Parser ---

// Same nesting limit as cel-go; evaluation recurses once per level.
constexpr std::size_t kMaxNestingDepth = 250;

int precedence_of(const TokenType op) {
    switch (op) {
        case TokenType::OpOr: return 1;
        case TokenType::OpAnd: return 2;
        case TokenType::OpEq:
        case TokenType::OpNe:
        case TokenType::OpLt:
        case TokenType::OpLte:
        case TokenType::OpGt:
        case TokenType::OpGte:
        case TokenType::OpIn: return 3;
        case TokenType::OpPlus:
        case TokenType::OpMinus: return 4;
        case TokenType::OpMul:
        case TokenType::OpDiv:
        case TokenType::OpMod: return 5;
        default: return 0;
    }
}

bool is_global_function(const std::string& name) {
    return name == "size" || name == "int" || name == "string" || name == "double";
}

bool is_member_function(const std::string& name) {
    return name == "size" || name == "startsWith" || name == "endsWith" ||
           name == "contains" || name == "matches";
}

class Parser {
public:
    Parser(std::string source, std::vector<Token> tokens)
        : source_(std::move(source)), tokens_(std::move(tokens)) {}

    core::errors::Result<NodePtr> parse() {
        auto root = parse_expression();
        if (core::errors::is_error(root)) {
            return root;
        }
        if (!match(TokenType::End)) {
            return unexpected();
        }
        return root;
    }

private:
    const Token& peek() const { return tokens_[current_]; }
    const Token& advance() { return tokens_[current_++]; }
    bool match(const TokenType type) const { return peek().type == type; }

    class NestingScope {
    public:
        explicit NestingScope(std::size_t& depth) : depth_(depth) { ++depth_; }
        ~NestingScope() { --depth_; }
        NestingScope(const NestingScope&) = delete;
        NestingScope& operator=(const NestingScope&) = delete;

    private:
        std::size_t& depth_;
    };

    StepError too_deep() const {
        return compile_error(source_, "expression nests deeper than " +
                                          std::to_string(kMaxNestingDepth) + " levels");
    }

    StepError unexpected() const {
        if (peek().type == TokenType::End) {
            return compile_error(source_, "unexpected end of input");
        }
        return compile_error(source_, "unexpected token '" + peek().value + "' at offset " +
                                          std::to_string(peek().offset));
    }

    static NodePtr make_node(CelNode::Kind kind, std::vector<NodePtr> children = {},
                             TokenType op = TokenType::End, std::string function = "") {
        auto node = std::make_shared<CelNode>();
        node->kind = kind;
        node->children = std::move(children);
        for (const auto& child : node->children) {
            node->height = std::max(node->height, child->height + 1);
        }
        node->op = op;
        node->function = std::move(function);
        return node;
    }

    static NodePtr make_literal(CelValue value) {
        auto node = std::make_shared<CelNode>();
        node->kind = CelNode::Kind::Literal;
        node->literal = std::move(value);
        return node;
    }

    // cond ? a : b binds loosest and is right associative.
    core::errors::Result<NodePtr> parse_expression() {
        if (depth_ >= kMaxNestingDepth) {
            return too_deep();
        }
        NestingScope scope(depth_);
        auto condition = parse_binary(1);
        if (core::errors::is_error(condition) || !match(TokenType::Question)) {
            return condition;
        }
        advance();
        auto when_true = parse_binary(1);
        if (core::errors::is_error(when_true)) {
            return when_true;
        }
        if (!match(TokenType::Colon)) {
            return unexpected();
        }
        advance();
        auto when_false = parse_expression();
        if (core::errors::is_error(when_false)) {
            return when_false;
        }
        return make_node(CelNode::Kind::Conditional,
                         {core::errors::get_value(condition), core::errors::get_value(when_true),
                          core::errors::get_value(when_false)});
    }

    // i.e. a + b * c
    core::errors::Result<NodePtr> parse_binary(const int min_precedence) {
        auto left = parse_unary();
        if (core::errors::is_error(left)) {
            return left;
        }
        NodePtr node = core::errors::get_value(left);

        while (true) {
            const TokenType op = peek().type;
            const int precedence = precedence_of(op);
            if (precedence == 0 || precedence < min_precedence) {
                break;
            }
            advance();
            auto right = parse_binary(precedence + 1);
            if (core::errors::is_error(right)) {
                return right;
            }

            CelNode::Kind kind = CelNode::Kind::Binary;
            if (op == TokenType::OpAnd) {
                kind = CelNode::Kind::And;
            } else if (op == TokenType::OpOr) {
                kind = CelNode::Kind::Or;
            }
            node = make_node(kind, {node, core::errors::get_value(right)}, op);
            if (node->height > kMaxNestingDepth) {
                return too_deep();
            }
        }
        return node;
    }

    core::errors::Result<NodePtr> parse_unary() {
        if (depth_ >= kMaxNestingDepth) {
            return too_deep();
        }
        NestingScope scope(depth_);
        if (match(TokenType::OpNot) || match(TokenType::OpMinus)) {
            const TokenType op = advance().type;
            // Fold "-<number>" so the most negative int literal is representable.
            if (op == TokenType::OpMinus &&
                (match(TokenType::Int) || match(TokenType::Double))) {
                const Token number = advance();
                auto literal = parse_number(number, true);
                if (core::errors::is_error(literal)) {
                    return literal;
                }
                return parse_member(core::errors::get_value(literal));
            }
            auto operand = parse_unary();
            if (core::errors::is_error(operand)) {
                return operand;
            }
            return make_node(op == TokenType::OpNot ? CelNode::Kind::Not : CelNode::Kind::Negate,
                             {core::errors::get_value(operand)});
        }

        auto primary = parse_primary();
        if (core::errors::is_error(primary)) {
            return primary;
        }
        return parse_member(core::errors::get_value(primary));
    }

    core::errors::Result<NodePtr> parse_number(const Token& token, const bool negative) {
        const std::string text = (negative ? "-" : "") + token.value;
        if (token.type == TokenType::Int) {
            std::int64_t value = 0;
            const auto* first = text.data();
            const auto* last = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr != last) {
                return compile_error(source_, "integer literal out of range: " + text);
            }
            return make_literal(CelValue(value));
        }
        char* end = nullptr;
        const double value = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size()) {
            return compile_error(source_, "invalid double literal: " + text);
        }
        return make_literal(CelValue(value));
    }

    // Consumes everything that is
    // "literals"
    // (paren)
    // [list]
    // func(args)
    core::errors::Result<NodePtr> parse_primary() {
        const Token token = advance();
        switch (token.type) {
            case TokenType::Int:
            case TokenType::Double:
                return parse_number(token, false);
            case TokenType::String:
                return make_literal(CelValue(token.value));
            case TokenType::LParen: {
                auto inner = parse_expression();
                if (core::errors::is_error(inner)) {
                    return inner;
                }
                if (!match(TokenType::RParen)) {
                    return unexpected();
                }
                advance();
                return inner;
            }
            case TokenType::LBracket: {
                auto items = parse_arguments(TokenType::RBracket);
                if (core::errors::is_error(items)) {
                    return core::errors::get_error(items);
                }
                return make_node(CelNode::Kind::List, core::errors::get_value(items));
            }
            case TokenType::Identifier:
                break;
            default:
                --current_;
                return unexpected();
        }

        if (token.value == "true" || token.value == "false") {
            return make_literal(CelValue(token.value == "true"));
        }
        if (token.value == "null") {
            return make_literal(CelValue());
        }
        if (!match(TokenType::LParen)) {
            return compile_error(source_, "undeclared reference to '" + token.value + "'");
        }
        if (!is_global_function(token.value)) {
            return compile_error(source_, "undeclared reference to '" + token.value + "'");
        }
        advance();
        auto args = parse_arguments(TokenType::RParen);
        if (core::errors::is_error(args)) {
            return core::errors::get_error(args);
        }
        if (core::errors::get_value(args).size() != 1) {
            return compile_error(source_, token.value + "() takes exactly one argument");
        }
        return make_node(CelNode::Kind::Call, core::errors::get_value(args), TokenType::End,
                         token.value);
    }

    // i.e. x.startsWith("a")[0]
    core::errors::Result<NodePtr> parse_member(NodePtr target) {
        while (true) {
            if (match(TokenType::Dot)) {
                advance();
                if (!match(TokenType::Identifier)) {
                    return unexpected();
                }
                const std::string name = advance().value;
                if (!match(TokenType::LParen)) {
                    return compile_error(source_, "field selection ." + name +
                                                      " is not supported");
                }
                if (!is_member_function(name)) {
                    return compile_error(source_, "undeclared reference to '" + name + "'");
                }
                advance();
                auto args = parse_arguments(TokenType::RParen);
                if (core::errors::is_error(args)) {
                    return core::errors::get_error(args);
                }
                auto children = core::errors::get_value(args);
                const std::size_t expected = name == "size" ? 0 : 1;
                if (children.size() != expected) {
                    return compile_error(source_, name + "() takes " +
                                                      std::to_string(expected) + " argument(s)");
                }
                children.insert(children.begin(), target);
                target = make_node(CelNode::Kind::Call, std::move(children), TokenType::Dot,
                                   name);
                if (target->height > kMaxNestingDepth) {
                    return too_deep();
                }
                continue;
            }
            if (match(TokenType::LBracket)) {
                advance();
                auto index = parse_expression();
                if (core::errors::is_error(index)) {
                    return index;
                }
                if (!match(TokenType::RBracket)) {
                    return unexpected();
                }
                advance();
                target = make_node(CelNode::Kind::Index,
                                   {target, core::errors::get_value(index)});
                if (target->height > kMaxNestingDepth) {
                    return too_deep();
                }
                continue;
            }
            return target;
        }
    }

    // Comma separated expressions up to `closing`, which is consumed.
    core::errors::Result<std::vector<NodePtr>> parse_arguments(const TokenType closing) {
        std::vector<NodePtr> items;
        if (match(closing)) {
            advance();
            return items;
        }
        while (true) {
            auto item = parse_expression();
            if (core::errors::is_error(item)) {
                return core::errors::get_error(item);
            }
            items.push_back(core::errors::get_value(item));
            if (match(TokenType::Comma)) {
                advance();
                continue;
            }
            if (match(closing)) {
                advance();
                return items;
            }
            return unexpected();
        }
    }

    std::string source_;
    std::vector<Token> tokens_;
    std::size_t current_ = 0;
    std::size_t depth_ = 0;
};

// --- Evaluation ---

bool is_numeric(const CelValue& value) { return value.is_int() || value.is_double(); }

double as_double(const CelValue& value) {
    return value.is_int() ? static_cast<double>(std::get<std::int64_t>(value.data))
                          : std::get<double>(value.data);
}

std::size_t utf8_length(const std::string& text) {
    std::size_t count = 0;
    for (const char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::string format_double(const double value) {
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

bool values_equal(const CelValue& lhs, const CelValue& rhs) {
    if (is_numeric(lhs) && is_numeric(rhs)) {
        if (lhs.is_int() && rhs.is_int()) {
            return std::get<std::int64_t>(lhs.data) == std::get<std::int64_t>(rhs.data);
        }
        return as_double(lhs) == as_double(rhs);
    }
    if (lhs.data.index() != rhs.data.index()) {
        return false;
    }
    if (lhs.is_list()) {
        const auto& left = std::get<CelValue::List>(lhs.data);
        const auto& right = std::get<CelValue::List>(rhs.data);
        if (left.size() != right.size()) {
            return false;
        }
        for (std::size_t i = 0; i < left.size(); ++i) {
            if (!values_equal(left[i], right[i])) {
                return false;
            }
        }
        return true;
    }
    if (lhs.is_bool()) {
        return std::get<bool>(lhs.data) == std::get<bool>(rhs.data);
    }
    if (lhs.is_string()) {
        return std::get<std::string>(lhs.data) == std::get<std::string>(rhs.data);
    }
    // Both null.
    return true;
}

// Negative, zero or positive like strcmp.
core::errors::Result<int> compare_values(const std::string& op, const CelValue& lhs,
                                         const CelValue& rhs) {
    if (lhs.is_int() && rhs.is_int()) {
        const auto l = std::get<std::int64_t>(lhs.data);
        const auto r = std::get<std::int64_t>(rhs.data);
        return l < r ? -1 : (l > r ? 1 : 0);
    }
    if (is_numeric(lhs) && is_numeric(rhs)) {
        const double l = as_double(lhs);
        const double r = as_double(rhs);
        if (std::isnan(l) || std::isnan(r)) {
            return eval_error("cannot order NaN");
        }
        return l < r ? -1 : (l > r ? 1 : 0);
    }
    if (lhs.is_string() && rhs.is_string()) {
        const int c = std::get<std::string>(lhs.data).compare(std::get<std::string>(rhs.data));
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (lhs.is_bool() && rhs.is_bool()) {
        return static_cast<int>(std::get<bool>(lhs.data)) -
               static_cast<int>(std::get<bool>(rhs.data));
    }
    return no_overload(op, lhs, rhs);
}

core::errors::Result<CelValue> int_arithmetic(const TokenType op, const std::int64_t l,
                                              const std::int64_t r) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    switch (op) {
        case TokenType::OpPlus:
            if ((r > 0 && l > kMax - r) || (r < 0 && l < kMin - r)) {
                return eval_error("integer overflow");
            }
            return CelValue(l + r);
        case TokenType::OpMinus:
            if ((r < 0 && l > kMax + r) || (r > 0 && l < kMin + r)) {
                return eval_error("integer overflow");
            }
            return CelValue(l - r);
        case TokenType::OpMul:
            if (l == 0 || r == 0) {
                return CelValue(std::int64_t{0});
            }
            // Bounds are checked before multiplying; the quotients truncate toward zero.
            if (l > 0 ? (r > 0 ? l > kMax / r : r < kMin / l)
                      : (r > 0 ? l < kMin / r : l < kMax / r)) {
                return eval_error("integer overflow");
            }
            return CelValue(l * r);
        case TokenType::OpDiv:
            if (r == 0) {
                return eval_error("division by zero");
            }
            if (l == kMin && r == -1) {
                return eval_error("integer overflow");
            }
            return CelValue(l / r);
        case TokenType::OpMod:
            if (r == 0) {
                return eval_error("modulus by zero");
            }
            if (l == kMin && r == -1) {
                return CelValue(std::int64_t{0});
            }
            return CelValue(l % r);
        default:
            return eval_error("unsupported integer operator");
    }
}

std::string op_text(const TokenType op) {
    switch (op) {
        case TokenType::OpEq: return "==";
        case TokenType::OpNe: return "!=";
        case TokenType::OpLt: return "<";
        case TokenType::OpLte: return "<=";
        case TokenType::OpGt: return ">";
        case TokenType::OpGte: return ">=";
        case TokenType::OpIn: return "in";
        case TokenType::OpPlus: return "+";
        case TokenType::OpMinus: return "-";
        case TokenType::OpMul: return "*";
        case TokenType::OpDiv: return "/";
        case TokenType::OpMod: return "%";
        default: return "?";
    }
}

core::errors::Result<CelValue> apply_binary(const TokenType op, const CelValue& lhs,
                                            const CelValue& rhs) {
    switch (op) {
        case TokenType::OpEq:
            return CelValue(values_equal(lhs, rhs));
        case TokenType::OpNe:
            return CelValue(!values_equal(lhs, rhs));
        case TokenType::OpLt:
        case TokenType::OpLte:
        case TokenType::OpGt:
        case TokenType::OpGte: {
            auto compared = compare_values(op_text(op), lhs, rhs);
            if (core::errors::is_error(compared)) {
                return core::errors::get_error(compared);
            }
            const int c = core::errors::get_value(compared);
            if (op == TokenType::OpLt) return CelValue(c < 0);
            if (op == TokenType::OpLte) return CelValue(c <= 0);
            if (op == TokenType::OpGt) return CelValue(c > 0);
            return CelValue(c >= 0);
        }
        case TokenType::OpIn: {
            if (!rhs.is_list()) {
                return no_overload("in", lhs, rhs);
            }
            for (const auto& item : std::get<CelValue::List>(rhs.data)) {
                if (values_equal(lhs, item)) {
                    return CelValue(true);
                }
            }
            return CelValue(false);
        }
        case TokenType::OpPlus:
            if (lhs.is_string() && rhs.is_string()) {
                return CelValue(std::get<std::string>(lhs.data) +
                                std::get<std::string>(rhs.data));
            }
            if (lhs.is_list() && rhs.is_list()) {
                auto joined = std::get<CelValue::List>(lhs.data);
                const auto& tail = std::get<CelValue::List>(rhs.data);
                joined.insert(joined.end(), tail.begin(), tail.end());
                return CelValue(std::move(joined));
            }
            [[fallthrough]];
        case TokenType::OpMinus:
        case TokenType::OpMul:
        case TokenType::OpDiv:
        case TokenType::OpMod:
            if (lhs.is_int() && rhs.is_int()) {
                return int_arithmetic(op, std::get<std::int64_t>(lhs.data),
                                      std::get<std::int64_t>(rhs.data));
            }
            if (lhs.is_double() && rhs.is_double() && op != TokenType::OpMod) {
                const double l = std::get<double>(lhs.data);
                const double r = std::get<double>(rhs.data);
                if (op == TokenType::OpPlus) return CelValue(l + r);
                if (op == TokenType::OpMinus) return CelValue(l - r);
                if (op == TokenType::OpMul) return CelValue(l * r);
                return CelValue(l / r);
            }
            return no_overload(op_text(op), lhs, rhs);
        default:
            return eval_error("unsupported operator");
    }
}

core::errors::Result<CelValue> convert_to_int(const CelValue& value) {
    if (value.is_int()) {
        return value;
    }
    if (value.is_double()) {
        const double d = std::get<double>(value.data);
        // 2^63 is exactly representable; anything at or beyond it overflows.
        if (std::isnan(d) || d >= 9223372036854775808.0 || d < -9223372036854775808.0) {
            return eval_error("double out of int range");
        }
        return CelValue(static_cast<std::int64_t>(d));
    }
    if (value.is_string()) {
        const auto& text = std::get<std::string>(value.data);
        std::int64_t parsed = 0;
        const auto* first = text.data();
        const auto* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, parsed);
        if (text.empty() || ec != std::errc() || ptr != last) {
            return eval_error("cannot convert \"" + text + "\" to int");
        }
        return CelValue(parsed);
    }
    return eval_error("no such overload: int(" + type_name(value) + ")");
}

core::errors::Result<CelValue> convert_to_double(const CelValue& value) {
    if (value.is_double()) {
        return value;
    }
    if (value.is_int()) {
        return CelValue(static_cast<double>(std::get<std::int64_t>(value.data)));
    }
    if (value.is_string()) {
        const auto& text = std::get<std::string>(value.data);
        char* end = nullptr;
        const double parsed = std::strtod(text.c_str(), &end);
        if (text.empty() || end != text.c_str() + text.size()) {
            return eval_error("cannot convert \"" + text + "\" to double");
        }
        return CelValue(parsed);
    }
    return eval_error("no such overload: double(" + type_name(value) + ")");
}

core::errors::Result<CelValue> convert_to_string(const CelValue& value) {
    if (value.is_string()) {
        return value;
    }
    if (value.is_int()) {
        return CelValue(std::to_string(std::get<std::int64_t>(value.data)));
    }
    if (value.is_double()) {
        return CelValue(format_double(std::get<double>(value.data)));
    }
    if (value.is_bool()) {
        return CelValue(std::string(std::get<bool>(value.data) ? "true" : "false"));
    }
    return eval_error("no such overload: string(" + type_name(value) + ")");
}

core::errors::Result<CelValue> size_of(const CelValue& value) {
    if (value.is_string()) {
        return CelValue(static_cast<std::int64_t>(utf8_length(std::get<std::string>(value.data))));
    }
    if (value.is_list()) {
        return CelValue(static_cast<std::int64_t>(std::get<CelValue::List>(value.data).size()));
    }
    return eval_error("no such overload: size(" + type_name(value) + ")");
}

core::errors::Result<CelValue> string_predicate(const std::string& name, const CelValue& target,
                                                const CelValue& arg) {
    if (!target.is_string() || !arg.is_string()) {
        return eval_error("no such overload: " + type_name(target) + "." + name + "(" +
                          type_name(arg) + ")");
    }
    const auto& text = std::get<std::string>(target.data);
    const auto& needle = std::get<std::string>(arg.data);

    if (name == "startsWith") {
        return CelValue(text.compare(0, needle.size(), needle) == 0 &&
                        text.size() >= needle.size());
    }
    if (name == "endsWith") {
        return CelValue(text.size() >= needle.size() &&
                        text.compare(text.size() - needle.size(), needle.size(), needle) == 0);
    }
    if (name == "contains") {
        return CelValue(text.find(needle) != std::string::npos);
    }
    try {
        const std::regex pattern(needle, std::regex::ECMAScript);
        return CelValue(std::regex_search(text, pattern));
    } catch (const std::regex_error& e) {
        return eval_error("invalid regular expression \"" + needle + "\": " + e.what());
    }
}

core::errors::Result<CelValue> evaluate_node(const CelNode& node);

// CEL logic: an error on one side is absorbed when the other side alone
// decides the result.
core::errors::Result<CelValue> evaluate_logical(const CelNode& node) {
    const bool is_and = node.kind == CelNode::Kind::And;
    const bool deciding = !is_and;

    auto lhs = evaluate_node(*node.children[0]);
    auto rhs = evaluate_node(*node.children[1]);

    auto decides = [deciding](const core::errors::Result<CelValue>& side) {
        return !core::errors::is_error(side) && core::errors::get_value(side).is_bool() &&
               std::get<bool>(core::errors::get_value(side).data) == deciding;
    };
    if (decides(lhs) || decides(rhs)) {
        return CelValue(deciding);
    }
    for (const auto* side : {&lhs, &rhs}) {
        if (core::errors::is_error(*side)) {
            return core::errors::get_error(*side);
        }
        if (!core::errors::get_value(*side).is_bool()) {
            return eval_error(std::string("no such overload: ") +
                              (is_and ? "&&" : "||") + " on " +
                              type_name(core::errors::get_value(*side)));
        }
    }
    return CelValue(!deciding);
}

core::errors::Result<CelValue> evaluate_node(const CelNode& node) {
    switch (node.kind) {
        case CelNode::Kind::Literal:
            return node.literal;

        case CelNode::Kind::List: {
            CelValue::List items;
            for (const auto& child : node.children) {
                auto item = evaluate_node(*child);
                if (core::errors::is_error(item)) {
                    return item;
                }
                items.push_back(core::errors::get_value(item));
            }
            return CelValue(std::move(items));
        }

        case CelNode::Kind::Not: {
            auto operand = evaluate_node(*node.children[0]);
            if (core::errors::is_error(operand)) {
                return operand;
            }
            const auto& value = core::errors::get_value(operand);
            if (!value.is_bool()) {
                return eval_error("no such overload: !" + type_name(value));
            }
            return CelValue(!std::get<bool>(value.data));
        }

        case CelNode::Kind::Negate: {
            auto operand = evaluate_node(*node.children[0]);
            if (core::errors::is_error(operand)) {
                return operand;
            }
            const auto& value = core::errors::get_value(operand);
            if (value.is_int()) {
                const auto i = std::get<std::int64_t>(value.data);
                if (i == std::numeric_limits<std::int64_t>::min()) {
                    return eval_error("integer overflow");
                }
                return CelValue(-i);
            }
            if (value.is_double()) {
                return CelValue(-std::get<double>(value.data));
            }
            return eval_error("no such overload: -" + type_name(value));
        }

        case CelNode::Kind::And:
        case CelNode::Kind::Or:
            return evaluate_logical(node);

        case CelNode::Kind::Conditional: {
            auto condition = evaluate_node(*node.children[0]);
            if (core::errors::is_error(condition)) {
                return condition;
            }
            const auto& value = core::errors::get_value(condition);
            if (!value.is_bool()) {
                return eval_error("condition of ?: must be bool, got " + type_name(value));
            }
            return evaluate_node(*node.children[std::get<bool>(value.data) ? 1 : 2]);
        }

        case CelNode::Kind::Binary: {
            auto lhs = evaluate_node(*node.children[0]);
            if (core::errors::is_error(lhs)) {
                return lhs;
            }
            auto rhs = evaluate_node(*node.children[1]);
            if (core::errors::is_error(rhs)) {
                return rhs;
            }
            return apply_binary(node.op, core::errors::get_value(lhs),
                                core::errors::get_value(rhs));
        }

        case CelNode::Kind::Index: {
            auto target = evaluate_node(*node.children[0]);
            if (core::errors::is_error(target)) {
                return target;
            }
            auto index = evaluate_node(*node.children[1]);
            if (core::errors::is_error(index)) {
                return index;
            }
            const auto& list = core::errors::get_value(target);
            const auto& position = core::errors::get_value(index);
            if (!list.is_list() || !position.is_int()) {
                return no_overload("[]", list, position);
            }
            const auto& items = std::get<CelValue::List>(list.data);
            const auto i = std::get<std::int64_t>(position.data);
            if (i < 0 || static_cast<std::size_t>(i) >= items.size()) {
                return eval_error("index " + std::to_string(i) + " out of range");
            }
            return items[static_cast<std::size_t>(i)];
        }

        case CelNode::Kind::Call: {
            std::vector<CelValue> args;
            for (const auto& child : node.children) {
                auto arg = evaluate_node(*child);
                if (core::errors::is_error(arg)) {
                    return arg;
                }
                args.push_back(core::errors::get_value(arg));
            }
            if (node.function == "size") {
                return size_of(args[0]);
            }
            if (node.function == "int") {
                return convert_to_int(args[0]);
            }
            if (node.function == "double") {
                return convert_to_double(args[0]);
            }
            if (node.function == "string") {
                return convert_to_string(args[0]);
            }
            return string_predicate(node.function, args[0], args[1]);
        }
    }
    return eval_error("unknown expression node");
}

}  // namespace

std::string type_name(const CelValue& value) {
    switch (value.data.index()) {
        case 0: return "null_type";
        case 1: return "bool";
        case 2: return "int";
        case 3: return "double";
        case 4: return "string";
        case 5: return "list";
        default: return "unknown";
    }
}

CelProgram::CelProgram(std::string source, std::shared_ptr<const CelNode> root)
    : source_(std::move(source)), root_(std::move(root)) {}

core::errors::Result<CelProgram> CelProgram::compile(const std::string& source) {
    auto tokens = tokenize(source);
    if (core::errors::is_error(tokens)) {
        return core::errors::get_error(tokens);
    }
    if (core::errors::get_value(tokens).size() == 1) {
        return compile_error(source, "expression is empty");
    }

    Parser parser(source, core::errors::get_value(tokens));
    auto root = parser.parse();
    if (core::errors::is_error(root)) {
        return core::errors::get_error(root);
    }
    return CelProgram(source, core::errors::get_value(root));
}

core::errors::Result<CelValue> CelProgram::evaluate() const {
    return evaluate_node(*root_);
}

}  // namespace stepgate::when
