#pragma once

#include <stencil/ast/Nodes.hpp>
#include <stencil/diag/DiagCode.hpp>
#include <stencil/parse/Cursor.hpp>
#include <stencil/syntax/TokenKind.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stencil::parse {

/// Tokenizes an expression. The returned list always ends with kEof; on a
/// lexical error a C_LEX_ERROR is added and the list ends early.
std::vector<syntax::Token> lex(std::string_view source, std::string_view where, diag::Bag& diags);

class Parser {
public:
    Parser(std::vector<syntax::Token> tokens,
           std::string where,
           diag::Bag& diags)
        : cursor_(std::move(tokens)),
          where_(std::move(where)),
          diags_(diags) {}

    /// Parses one complete expression (filter pipeline included). Returns
    /// nullptr after reporting exactly one C_SYNTAX_ERROR.
    ast::ExprPtr parse_expression();

private:
    using K = syntax::TokenKind;

    const syntax::Token& peek(size_t k = 0) const;
    bool at(K k) const;
    const syntax::Token& bump();
    bool eat(K k);
    bool expect(K k, std::string_view what);

    ast::ExprPtr parse_pipeline();
    ast::ExprPtr parse_expr_pratt(int min_prec);
    ast::ExprPtr parse_prefix();
    ast::ExprPtr parse_postfix(ast::ExprPtr base);
    ast::ExprPtr parse_primary();

    ast::ExprPtr parse_list_lit();
    ast::ExprPtr parse_dict_lit();
    bool parse_call_args(std::vector<ast::ExprPtr>& out);

    void diag_expected(const syntax::Token& t, std::string_view what);

    TokenCursor cursor_;
    std::string where_;
    diag::Bag& diags_;
    bool failed_ = false;
    int nesting_ = 0;
};

/// lex + parse in one step. Returns nullptr on any lexical or syntax error.
ast::ExprPtr parse_source(std::string_view source, std::string_view where, diag::Bag& diags);

} // namespace stencil::parse
