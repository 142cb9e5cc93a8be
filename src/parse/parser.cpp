#include <stencil/parse/Parser.hpp>
#include <stencil/syntax/Precedence.hpp>

#include <charconv>
#include <cstdlib>

namespace stencil::parse {

namespace {

constexpr int kMaxNesting = 200;

ast::ExprPtr make_expr(ast::ExprKind k, const syntax::Token& t) {
    auto e = std::make_unique<ast::Expr>();
    e->kind = k;
    e->span = ast::Span{t.offset};
    return e;
}

} // namespace

const syntax::Token& Parser::peek(size_t k) const { return cursor_.peek(k); }
bool Parser::at(K k) const { return peek().kind == k; }
const syntax::Token& Parser::bump() { return cursor_.bump(); }

bool Parser::eat(K k) {
    if (!at(k)) return false;
    bump();
    return true;
}

bool Parser::expect(K k, std::string_view what) {
    if (eat(k)) return true;
    diag_expected(peek(), what);
    return false;
}

void Parser::diag_expected(const syntax::Token& t, std::string_view what) {
    // first error wins; everything after it is noise
    if (failed_) return;
    failed_ = true;
    const std::string got = (t.kind == K::kEof || t.lexeme.empty())
                                ? std::string(syntax::token_kind_name(t.kind))
                                : t.lexeme;
    diags_.add(diag::Code::C_SYNTAX_ERROR,
               where_,
               t.offset,
               "expected " + std::string(what) + ", got '" + got + "'");
}

ast::ExprPtr Parser::parse_expression() {
    auto e = parse_pipeline();
    if (!e || failed_) return nullptr;
    if (!cursor_.done()) {
        diag_expected(peek(), "end of expression");
        return nullptr;
    }
    return e;
}

ast::ExprPtr Parser::parse_pipeline() {
    auto e = parse_expr_pratt(0);
    if (!e) return nullptr;

    while (at(K::kPipe)) {
        const syntax::Token pipe = bump();
        if (!at(K::kIdent)) {
            diag_expected(peek(), "filter name after '|'");
            return nullptr;
        }
        auto f = make_expr(ast::ExprKind::kFilter, pipe);
        f->text = bump().lexeme;
        f->lhs = std::move(e);
        if (eat(K::kLParen)) {
            if (!parse_call_args(f->args)) return nullptr;
        }
        e = std::move(f);
    }
    return e;
}

ast::ExprPtr Parser::parse_expr_pratt(int min_prec) {
    if (nesting_ >= kMaxNesting) {
        diag_expected(peek(), "shallower expression nesting");
        return nullptr;
    }
    ++nesting_;
    auto lhs = parse_prefix();

    while (lhs) {
        const auto& tok = peek();
        auto info = syntax::infix_info(tok.kind);
        if (!info.has_value()) break;

        const int prec = info->prec;
        if (prec < min_prec) break;

        const syntax::Token op_tok = bump();
        const int next_min = (info->assoc == syntax::Assoc::kLeft) ? (prec + 1) : prec;

        auto rhs = parse_expr_pratt(next_min);
        if (!rhs) {
            lhs.reset();
            break;
        }

        auto e = make_expr(ast::ExprKind::kBinary, op_tok);
        e->op = op_tok.kind;
        e->text = op_tok.lexeme;
        e->lhs = std::move(lhs);
        e->rhs = std::move(rhs);
        lhs = std::move(e);
    }

    --nesting_;
    return lhs;
}

ast::ExprPtr Parser::parse_prefix() {
    if (auto info = syntax::prefix_info(peek().kind)) {
        const syntax::Token op_tok = bump();
        auto operand = parse_expr_pratt(info->prec);
        if (!operand) return nullptr;

        auto e = make_expr(ast::ExprKind::kUnary, op_tok);
        e->op = op_tok.kind;
        e->text = op_tok.lexeme;
        e->rhs = std::move(operand);
        return e;
    }

    auto base = parse_primary();
    if (!base) return nullptr;
    return parse_postfix(std::move(base));
}

bool Parser::parse_call_args(std::vector<ast::ExprPtr>& out) {
    // '(' already consumed
    if (!at(K::kRParen)) {
        while (true) {
            auto arg = parse_pipeline();
            if (!arg) return false;
            out.push_back(std::move(arg));
            if (eat(K::kComma)) {
                if (at(K::kRParen)) break;
                continue;
            }
            break;
        }
    }
    return expect(K::kRParen, "')'");
}

ast::ExprPtr Parser::parse_postfix(ast::ExprPtr e) {
    while (true) {
        if (at(K::kLParen)) {
            auto c = make_expr(ast::ExprKind::kCall, bump());
            c->lhs = std::move(e);
            if (!parse_call_args(c->args)) return nullptr;
            e = std::move(c);
            continue;
        }
        if (at(K::kDot)) {
            auto m = make_expr(ast::ExprKind::kMember, bump());
            m->lhs = std::move(e);
            if (!at(K::kIdent)) {
                diag_expected(peek(), "attribute name after '.'");
                return nullptr;
            }
            m->text = bump().lexeme;
            e = std::move(m);
            continue;
        }
        if (at(K::kLBracket)) {
            auto idx = make_expr(ast::ExprKind::kIndex, bump());
            idx->lhs = std::move(e);
            idx->rhs = parse_pipeline();
            if (!idx->rhs) return nullptr;
            if (!expect(K::kRBracket, "']'")) return nullptr;
            e = std::move(idx);
            continue;
        }
        break;
    }
    return e;
}

ast::ExprPtr Parser::parse_primary() {
    const syntax::Token t = peek();

    if (eat(K::kIntLit)) {
        auto e = make_expr(ast::ExprKind::kInt, t);
        const char* first = t.lexeme.data();
        const char* last = first + t.lexeme.size();
        auto [ptr, ec] = std::from_chars(first, last, e->int_value);
        if (ec != std::errc{} || ptr != last) {
            diag_expected(t, "integer literal in 64-bit range");
            return nullptr;
        }
        return e;
    }

    if (eat(K::kFloatLit)) {
        auto e = make_expr(ast::ExprKind::kFloat, t);
        e->float_value = std::strtod(t.lexeme.c_str(), nullptr);
        return e;
    }

    if (eat(K::kStringLit)) {
        auto e = make_expr(ast::ExprKind::kString, t);
        e->text = t.lexeme;
        return e;
    }

    if (eat(K::kKwTrue) || eat(K::kKwFalse)) {
        auto e = make_expr(ast::ExprKind::kBool, t);
        e->bool_value = (t.kind == K::kKwTrue);
        return e;
    }

    if (eat(K::kKwNone)) {
        return make_expr(ast::ExprKind::kNone, t);
    }

    if (eat(K::kIdent)) {
        auto e = make_expr(ast::ExprKind::kIdent, t);
        e->text = t.lexeme;
        return e;
    }

    if (at(K::kLBracket)) return parse_list_lit();
    if (at(K::kLBrace)) return parse_dict_lit();

    if (eat(K::kLParen)) {
        auto e = parse_pipeline();
        if (!e) return nullptr;
        if (!expect(K::kRParen, "')'")) return nullptr;
        return e;
    }

    diag_expected(t, "expression");
    return nullptr;
}

ast::ExprPtr Parser::parse_list_lit() {
    auto e = make_expr(ast::ExprKind::kList, bump()); // [

    if (!at(K::kRBracket)) {
        while (true) {
            auto item = parse_pipeline();
            if (!item) return nullptr;
            e->items.push_back(std::move(item));
            if (eat(K::kComma)) {
                if (at(K::kRBracket)) break;
                continue;
            }
            break;
        }
    }

    if (!expect(K::kRBracket, "']'")) return nullptr;
    return e;
}

ast::ExprPtr Parser::parse_dict_lit() {
    auto e = make_expr(ast::ExprKind::kDict, bump()); // {

    if (!at(K::kRBrace)) {
        while (true) {
            ast::DictItem item{};
            item.key = parse_pipeline();
            if (!item.key) return nullptr;
            if (!expect(K::kColon, "':' after dict key")) return nullptr;
            item.value = parse_pipeline();
            if (!item.value) return nullptr;
            e->dict_items.push_back(std::move(item));
            if (eat(K::kComma)) {
                if (at(K::kRBrace)) break;
                continue;
            }
            break;
        }
    }

    if (!expect(K::kRBrace, "'}'")) return nullptr;
    return e;
}

ast::ExprPtr parse_source(std::string_view source, std::string_view where, diag::Bag& diags) {
    const std::size_t before = diags.size();
    auto tokens = lex(source, where, diags);
    if (diags.size() != before) return nullptr;

    Parser parser(std::move(tokens), std::string(where), diags);
    return parser.parse_expression();
}

} // namespace stencil::parse
