#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stencil::syntax {

enum class TokenKind : uint16_t {
    kEof = 0,
    kError,

    kIdent,
    kIntLit,
    kFloatLit,
    kStringLit,

    kKwTrue,
    kKwFalse,
    kKwNone,

    kLParen,
    kRParen,
    kLBrace,
    kRBrace,
    kLBracket,
    kRBracket,
    kComma,
    kColon,
    kDot,
    kPipe,

    kPlus,
    kMinus,
    kStar,
    kStarStar,
    kSlash,
    kSlashSlash,
    kPercent,
    kEqEq,
    kBangEq,
    kLt,
    kLtEq,
    kGt,
    kGtEq,

    kKwAnd,
    kKwOr,
    kKwNot,
    kKwIn,
    kKwNotIn,
    kKwIs,
    kKwIsNot,
};

struct Token {
    TokenKind kind = TokenKind::kError;
    std::string lexeme;
    uint32_t offset = 0;
};

constexpr std::string_view token_kind_name(TokenKind k) {
    switch (k) {
        case TokenKind::kEof: return "eof";
        case TokenKind::kError: return "error";
        case TokenKind::kIdent: return "ident";
        case TokenKind::kIntLit: return "int_lit";
        case TokenKind::kFloatLit: return "float_lit";
        case TokenKind::kStringLit: return "string_lit";
        case TokenKind::kKwTrue: return "True";
        case TokenKind::kKwFalse: return "False";
        case TokenKind::kKwNone: return "None";
        case TokenKind::kLParen: return "(";
        case TokenKind::kRParen: return ")";
        case TokenKind::kLBrace: return "{";
        case TokenKind::kRBrace: return "}";
        case TokenKind::kLBracket: return "[";
        case TokenKind::kRBracket: return "]";
        case TokenKind::kComma: return ",";
        case TokenKind::kColon: return ":";
        case TokenKind::kDot: return ".";
        case TokenKind::kPipe: return "|";
        case TokenKind::kPlus: return "+";
        case TokenKind::kMinus: return "-";
        case TokenKind::kStar: return "*";
        case TokenKind::kStarStar: return "**";
        case TokenKind::kSlash: return "/";
        case TokenKind::kSlashSlash: return "//";
        case TokenKind::kPercent: return "%";
        case TokenKind::kEqEq: return "==";
        case TokenKind::kBangEq: return "!=";
        case TokenKind::kLt: return "<";
        case TokenKind::kLtEq: return "<=";
        case TokenKind::kGt: return ">";
        case TokenKind::kGtEq: return ">=";
        case TokenKind::kKwAnd: return "and";
        case TokenKind::kKwOr: return "or";
        case TokenKind::kKwNot: return "not";
        case TokenKind::kKwIn: return "in";
        case TokenKind::kKwNotIn: return "not in";
        case TokenKind::kKwIs: return "is";
        case TokenKind::kKwIsNot: return "is not";
    }
    return "unknown";
}

} // namespace stencil::syntax
