#include <stencil/Engine.hpp>

#include <stencil/eval/Evaluator.hpp>
#include <stencil/tmpl/Renderer.hpp>

namespace stencil {

std::optional<std::string> render_template(std::string_view tpl,
                                           const eval::Context& ctx,
                                           diag::Bag& diags,
                                           const eval::Environment& env) {
    return tmpl::render_template(tpl, ctx, env, diags);
}

std::optional<eval::Value> evaluate_expression(std::string_view expr,
                                               const eval::Context& ctx,
                                               diag::Bag& diags,
                                               const eval::Environment& env) {
    return eval::evaluate_expression(expr, ctx, env, diags);
}

std::optional<std::string> Engine::render(std::string_view tpl,
                                          const eval::Context& ctx,
                                          diag::Bag& diags,
                                          std::string where) const {
    const auto nodes = cache_.get_or_parse(tpl);
    tmpl::Renderer r(env_, diags, std::move(where));
    return r.render(*nodes, ctx);
}

std::optional<eval::Value> Engine::evaluate(std::string_view expr,
                                            const eval::Context& ctx,
                                            diag::Bag& diags) const {
    return eval::evaluate_expression(expr, ctx, env_, diags);
}

} // namespace stencil
