#pragma once

#include <stencil/syntax/TokenKind.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stencil::ast {

// Byte offset into the expression source.
struct Span {
    uint32_t offset = 0;
};

struct Expr;

enum class ExprKind : uint8_t {
    kInt,
    kFloat,
    kString,
    kBool,
    kNone,
    kIdent,
    kUnary,
    kBinary,
    kMember,
    kIndex,
    kCall,
    kList,
    kDict,
    kFilter,
};

struct DictItem {
    std::unique_ptr<Expr> key;
    std::unique_ptr<Expr> value;
};

/// One node of an expression tree. Which fields are meaningful depends on
/// `kind`:
///   kInt/kFloat/kBool   -> int_value / float_value / bool_value
///   kString/kIdent      -> text
///   kUnary              -> op, rhs
///   kBinary             -> op, lhs, rhs
///   kMember             -> lhs, text (attribute name)
///   kIndex              -> lhs, rhs (key)
///   kCall               -> lhs (callee), args
///   kList               -> items
///   kDict               -> dict_items
///   kFilter             -> lhs (input), text (filter name), args
struct Expr {
    ExprKind kind = ExprKind::kIdent;
    Span span{};

    syntax::TokenKind op = syntax::TokenKind::kError;

    int64_t int_value = 0;
    double float_value = 0.0;
    bool bool_value = false;
    std::string text{};

    std::vector<std::unique_ptr<Expr>> items{};
    std::vector<DictItem> dict_items{};
    std::vector<std::unique_ptr<Expr>> args{};

    std::unique_ptr<Expr> lhs{};
    std::unique_ptr<Expr> rhs{};
};

using ExprPtr = std::unique_ptr<Expr>;

} // namespace stencil::ast
