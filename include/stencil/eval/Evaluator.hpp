#pragma once

#include <stencil/ast/Nodes.hpp>
#include <stencil/diag/DiagCode.hpp>
#include <stencil/eval/Registry.hpp>
#include <stencil/eval/Value.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::eval {

enum class Definedness : uint8_t {
    kDefined,
    kUndefined, // base identifier unbound, nothing resolved it
    kRescued,   // base identifier unbound, a filter produced a value anyway
};

struct Outcome {
    Value value{};
    Definedness state = Definedness::kDefined;
};

class Evaluator {
public:
    Evaluator(const Environment& env, diag::Bag& diags, std::string where = "<expr>")
        : env_(env), diags_(diags), where_(std::move(where)) {}

    /// Strict evaluation: every unbound identifier is E_UNDEFINED_VARIABLE.
    std::optional<Value> evaluate(const ast::Expr& expr, const Context& ctx);

    /// Output evaluation: an unbound base identifier is tracked as
    /// kUndefined through the filter pipeline instead of failing.
    std::optional<Outcome> evaluate_output(const ast::Expr& expr, const Context& ctx);

private:
    std::optional<Value> eval_expr(const ast::Expr* expr, const Context& ctx, uint32_t depth);
    std::optional<Outcome> eval_pipeline(const ast::Expr* expr, const Context& ctx, uint32_t depth);

    std::optional<Value> eval_logical(const ast::Expr* expr, const Context& ctx, uint32_t depth);
    std::optional<Value> eval_member(const ast::Expr* expr, const Value& obj);
    std::optional<Value> eval_index(const ast::Expr* expr, const Value& obj, const Value& key);
    std::optional<Value> eval_call(const ast::Expr* expr, const Value& callee, const std::vector<Value>& args);
    bool eval_args(const std::vector<ast::ExprPtr>& in,
                   const Context& ctx,
                   uint32_t depth,
                   std::vector<Value>& out);

    std::optional<Value> lookup_ident(const ast::Expr* expr, const Context& ctx);
    bool is_bound(std::string_view name, const Context& ctx) const;

    CallSite site(const ast::Span& span) const;
    void add_diag(diag::Code code, const ast::Span& span, std::string msg);

    const Environment& env_;
    diag::Bag& diags_;
    std::string where_;
};

/// Follows the object side of member / index / call nodes down to the
/// identifier the chain starts from. nullptr when it starts elsewhere.
const ast::Expr* root_identifier(const ast::Expr* expr);

/// lex -> parse -> evaluate a bare expression. An unbound base identifier
/// is an error unless a filter such as `default` resolved it.
std::optional<Value> evaluate_expression(std::string_view source,
                                         const Context& ctx,
                                         const Environment& env,
                                         diag::Bag& diags);

} // namespace stencil::eval
