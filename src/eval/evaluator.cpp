#include <stencil/eval/Evaluator.hpp>

#include <stencil/eval/Operators.hpp>
#include <stencil/parse/Parser.hpp>
#include <stencil/text/Utf8.hpp>

#include <cctype>
#include <cmath>

namespace stencil::eval {

namespace {

using K = syntax::TokenKind;

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

const ast::Expr* pipeline_base(const ast::Expr* expr) {
    while (expr && expr->kind == ast::ExprKind::kFilter) expr = expr->lhs.get();
    return expr;
}

} // namespace

const ast::Expr* root_identifier(const ast::Expr* expr) {
    while (expr) {
        switch (expr->kind) {
            case ast::ExprKind::kIdent:
                return expr;
            case ast::ExprKind::kMember:
            case ast::ExprKind::kIndex:
            case ast::ExprKind::kCall:
                expr = expr->lhs.get();
                continue;
            default:
                return nullptr;
        }
    }
    return nullptr;
}

CallSite Evaluator::site(const ast::Span& span) const {
    return CallSite{where_, span.offset};
}

void Evaluator::add_diag(diag::Code code, const ast::Span& span, std::string msg) {
    diags_.add(code, where_, span.offset, std::move(msg));
}

bool Evaluator::is_bound(std::string_view name, const Context& ctx) const {
    if (ctx.find(std::string(name)) != ctx.end()) return true;
    return env_.functions.has_function(name);
}

std::optional<Value> Evaluator::evaluate(const ast::Expr& expr, const Context& ctx) {
    return eval_expr(&expr, ctx, 0);
}

std::optional<Outcome> Evaluator::evaluate_output(const ast::Expr& expr, const Context& ctx) {
    return eval_pipeline(&expr, ctx, 0);
}

std::optional<Value> Evaluator::lookup_ident(const ast::Expr* expr, const Context& ctx) {
    auto it = ctx.find(expr->text);
    if (it != ctx.end()) return it->second;
    if (auto fn = env_.functions.find_function(expr->text)) return fn;
    add_diag(diag::Code::E_UNDEFINED_VARIABLE, expr->span, "undefined variable: " + expr->text);
    return std::nullopt;
}

bool Evaluator::eval_args(const std::vector<ast::ExprPtr>& in,
                          const Context& ctx,
                          uint32_t depth,
                          std::vector<Value>& out) {
    out.reserve(in.size());
    for (const auto& a : in) {
        auto v = eval_expr(a.get(), ctx, depth);
        if (!v) return false;
        out.push_back(std::move(*v));
    }
    return true;
}

std::optional<Outcome> Evaluator::eval_pipeline(const ast::Expr* expr, const Context& ctx, uint32_t depth) {
    std::vector<const ast::Expr*> chain;
    const ast::Expr* base = expr;
    while (base->kind == ast::ExprKind::kFilter) {
        chain.push_back(base);
        base = base->lhs.get();
    }

    Outcome out{};
    const ast::Expr* root = root_identifier(base);
    if (root && !is_bound(root->text, ctx)) {
        out.state = Definedness::kUndefined;
    } else {
        auto v = eval_expr(base, ctx, depth + 1);
        if (!v) return std::nullopt;
        out.value = std::move(*v);
    }

    // chain is outermost-first
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        const ast::Expr* f = *it;
        const Filter* filter = env_.filters.find(f->text);
        if (!filter) {
            add_diag(diag::Code::E_UNKNOWN_FILTER, f->span, "unknown filter: " + f->text);
            return std::nullopt;
        }
        if (out.state == Definedness::kUndefined && !filter->resolves_undefined) continue;

        std::vector<Value> args;
        if (!eval_args(f->args, ctx, depth + 1, args)) return std::nullopt;

        const size_t before = diags_.size();
        auto v = filter->callback(out.value, args, site(f->span), diags_);
        if (!v) {
            if (diags_.size() == before) {
                add_diag(diag::Code::E_CALL_FAILED, f->span, "filter '" + f->text + "' failed");
            }
            return std::nullopt;
        }
        out.value = std::move(*v);
        if (out.state == Definedness::kUndefined) out.state = Definedness::kRescued;
    }

    return out;
}

std::optional<Value> Evaluator::eval_logical(const ast::Expr* expr, const Context& ctx, uint32_t depth) {
    auto lhs = eval_expr(expr->lhs.get(), ctx, depth + 1);
    if (!lhs) return std::nullopt;
    if (expr->op == K::kKwAnd) {
        if (!truthy(*lhs)) return lhs;
    } else {
        if (truthy(*lhs)) return lhs;
    }
    return eval_expr(expr->rhs.get(), ctx, depth + 1);
}

std::optional<Value> Evaluator::eval_member(const ast::Expr* expr, const Value& obj) {
    const std::string& name = expr->text;

    if (auto o = obj.as_object()) {
        auto it = o->find(name);
        if (it != o->end()) return it->second;
        if (auto m = env_.functions.bind_method(obj, name)) return m;
        add_diag(diag::Code::E_ATTRIBUTE_NOT_FOUND, expr->span, "map has no key or method '" + name + "'");
        return std::nullopt;
    }

    if (auto native = obj.as_native_object()) {
        const CallSite s = site(expr->span);
        if (native->get_attribute) {
            const size_t before = diags_.size();
            auto v = native->get_attribute(name, s, diags_);
            if (v) return v;
            if (diags_.size() != before) return std::nullopt;

            if (native->keys) {
                for (const auto& k : native->keys()) {
                    if (k == name || !iequals(k, name)) continue;
                    auto folded = native->get_attribute(k, s, diags_);
                    if (folded) return folded;
                    if (diags_.size() != before) return std::nullopt;
                    break;
                }
            }
        }
        if (auto m = env_.functions.bind_method(obj, name)) return m;
        add_diag(diag::Code::E_ATTRIBUTE_NOT_FOUND,
                 expr->span,
                 "'" + native->name + "' object has no attribute '" + name + "'");
        return std::nullopt;
    }

    if (auto m = env_.functions.bind_method(obj, name)) return m;
    add_diag(diag::Code::E_ATTRIBUTE_NOT_FOUND,
             expr->span,
             "'" + type_name(obj) + "' object has no attribute '" + name + "'");
    return std::nullopt;
}

std::optional<Value> Evaluator::eval_index(const ast::Expr* expr, const Value& obj, const Value& key) {
    if (auto o = obj.as_object()) {
        const std::string k = stringify_key(key);
        auto it = o->find(k);
        if (it != o->end()) return it->second;
        add_diag(diag::Code::E_ATTRIBUTE_NOT_FOUND, expr->span, "key '" + k + "' not found in map");
        return std::nullopt;
    }

    if (obj.is_array() || obj.is_string()) {
        int64_t idx = 0;
        if (auto pi = std::get_if<int64_t>(&key.data)) {
            idx = *pi;
        } else if (auto pb = std::get_if<bool>(&key.data)) {
            idx = *pb ? 1 : 0;
        } else if (auto pf = std::get_if<double>(&key.data); pf && std::isfinite(*pf)) {
            // [-2^63, 2^63) converts without overflow
            constexpr double kLimit = 9223372036854775808.0;
            if (*pf < -kLimit || *pf >= kLimit) {
                add_diag(diag::Code::E_INDEX_ERROR, expr->span, type_name(obj) + " index out of range");
                return std::nullopt;
            }
            idx = static_cast<int64_t>(*pf);
        } else {
            add_diag(diag::Code::E_TYPE_ERROR,
                     expr->span,
                     "indices must be integers, not '" + type_name(key) + "'");
            return std::nullopt;
        }

        // strings index by UTF-8 character, matching for-loops and `list`
        std::vector<std::string> chars;
        if (auto str = obj.as_string()) chars = text::split_chars(*str);
        const int64_t len = obj.is_array()
                                ? static_cast<int64_t>(obj.as_array()->size())
                                : static_cast<int64_t>(chars.size());
        if (idx < 0) idx += len;
        if (idx < 0 || idx >= len) {
            add_diag(diag::Code::E_INDEX_ERROR,
                     expr->span,
                     type_name(obj) + " index out of range (length " + std::to_string(len) + ")");
            return std::nullopt;
        }

        if (auto arr = obj.as_array()) return (*arr)[static_cast<size_t>(idx)];
        Value out;
        out.data = std::move(chars[static_cast<size_t>(idx)]);
        return out;
    }

    if (auto native = obj.as_native_object(); native && native->get_item) {
        const size_t before = diags_.size();
        auto v = native->get_item(key, site(expr->span), diags_);
        if (v) return v;
        if (diags_.size() == before) {
            add_diag(diag::Code::E_ATTRIBUTE_NOT_FOUND,
                     expr->span,
                     "key '" + stringify_key(key) + "' not found in '" + native->name + "'");
        }
        return std::nullopt;
    }

    add_diag(diag::Code::E_TYPE_ERROR, expr->span, "'" + type_name(obj) + "' object is not subscriptable");
    return std::nullopt;
}

std::optional<Value> Evaluator::eval_call(const ast::Expr* expr, const Value& callee, const std::vector<Value>& args) {
    const CallSite s = site(expr->span);
    const size_t before = diags_.size();

    std::optional<Value> out;
    std::string name;
    if (auto fn = callee.as_native_function(); fn && fn->callback) {
        name = fn->name;
        out = fn->callback(args, s, diags_);
    } else if (auto native = callee.as_native_object(); native && native->call) {
        name = native->name;
        out = native->call(args, s, diags_);
    } else {
        add_diag(diag::Code::E_NOT_CALLABLE, expr->span, "'" + type_name(callee) + "' object is not callable");
        return std::nullopt;
    }

    if (!out && diags_.size() == before) {
        add_diag(diag::Code::E_CALL_FAILED, expr->span, "call to '" + name + "' failed");
    }
    return out;
}

std::optional<Value> Evaluator::eval_expr(const ast::Expr* expr, const Context& ctx, uint32_t depth) {
    if (!expr) return std::nullopt;
    if (depth > env_.budget.max_expr_depth) {
        add_diag(diag::Code::E_BUDGET_EXCEEDED, expr->span, "expression nesting exceeds evaluation budget");
        return std::nullopt;
    }

    switch (expr->kind) {
        case ast::ExprKind::kInt: {
            Value v;
            v.data = expr->int_value;
            return v;
        }
        case ast::ExprKind::kFloat: {
            Value v;
            v.data = expr->float_value;
            return v;
        }
        case ast::ExprKind::kString: {
            Value v;
            v.data = expr->text;
            return v;
        }
        case ast::ExprKind::kBool: {
            Value v;
            v.data = expr->bool_value;
            return v;
        }
        case ast::ExprKind::kNone:
            return Value{};
        case ast::ExprKind::kIdent:
            return lookup_ident(expr, ctx);
        case ast::ExprKind::kUnary: {
            auto rhs = eval_expr(expr->rhs.get(), ctx, depth + 1);
            if (!rhs) return std::nullopt;
            return unary_op(expr->op, *rhs, site(expr->span), diags_);
        }
        case ast::ExprKind::kBinary: {
            if (expr->op == K::kKwAnd || expr->op == K::kKwOr) return eval_logical(expr, ctx, depth);
            auto lhs = eval_expr(expr->lhs.get(), ctx, depth + 1);
            if (!lhs) return std::nullopt;
            auto rhs = eval_expr(expr->rhs.get(), ctx, depth + 1);
            if (!rhs) return std::nullopt;
            return binary_op(expr->op, *lhs, *rhs, env_.budget, site(expr->span), diags_);
        }
        case ast::ExprKind::kMember: {
            auto obj = eval_expr(expr->lhs.get(), ctx, depth + 1);
            if (!obj) return std::nullopt;
            return eval_member(expr, *obj);
        }
        case ast::ExprKind::kIndex: {
            auto obj = eval_expr(expr->lhs.get(), ctx, depth + 1);
            if (!obj) return std::nullopt;
            auto key = eval_expr(expr->rhs.get(), ctx, depth + 1);
            if (!key) return std::nullopt;
            return eval_index(expr, *obj, *key);
        }
        case ast::ExprKind::kCall: {
            auto callee = eval_expr(expr->lhs.get(), ctx, depth + 1);
            if (!callee) return std::nullopt;
            std::vector<Value> args;
            if (!eval_args(expr->args, ctx, depth + 1, args)) return std::nullopt;
            return eval_call(expr, *callee, args);
        }
        case ast::ExprKind::kList: {
            Value::Array arr;
            if (!eval_args(expr->items, ctx, depth + 1, arr)) return std::nullopt;
            Value out;
            out.data = std::move(arr);
            return out;
        }
        case ast::ExprKind::kDict: {
            Value::Object obj;
            for (const auto& item : expr->dict_items) {
                auto k = eval_expr(item.key.get(), ctx, depth + 1);
                if (!k) return std::nullopt;
                auto v = eval_expr(item.value.get(), ctx, depth + 1);
                if (!v) return std::nullopt;
                obj[stringify_key(*k)] = std::move(*v);
            }
            Value out;
            out.data = std::move(obj);
            return out;
        }
        case ast::ExprKind::kFilter: {
            auto out = eval_pipeline(expr, ctx, depth);
            if (!out) return std::nullopt;
            if (out->state == Definedness::kUndefined) {
                const ast::Expr* root = root_identifier(pipeline_base(expr));
                add_diag(diag::Code::E_UNDEFINED_VARIABLE,
                         root ? root->span : expr->span,
                         "undefined variable: " + (root ? root->text : std::string("<expr>")));
                return std::nullopt;
            }
            return std::move(out->value);
        }
    }

    add_diag(diag::Code::E_TYPE_ERROR, expr->span, "unsupported expression");
    return std::nullopt;
}

std::optional<Value> evaluate_expression(std::string_view source,
                                         const Context& ctx,
                                         const Environment& env,
                                         diag::Bag& diags) {
    auto expr = parse::parse_source(source, "<expr>", diags);
    if (!expr) return std::nullopt;

    Evaluator ev(env, diags);
    return ev.evaluate(*expr, ctx);
}

} // namespace stencil::eval
