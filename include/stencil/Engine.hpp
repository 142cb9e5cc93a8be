#pragma once

#include <stencil/builtins/Register.hpp>
#include <stencil/cache/TemplateCache.hpp>
#include <stencil/diag/DiagCode.hpp>
#include <stencil/eval/Registry.hpp>
#include <stencil/eval/Value.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace stencil {

/// Full pipeline on one template. An undefined variable inside `{{ }}`
/// renders as nothing; inside a condition or loop head it is an error.
std::optional<std::string> render_template(std::string_view tpl,
                                           const eval::Context& ctx,
                                           diag::Bag& diags,
                                           const eval::Environment& env = builtins::default_environment());

/// Bare expression. An unbound base identifier is always an error unless a
/// filter such as `default` resolved it.
std::optional<eval::Value> evaluate_expression(std::string_view expr,
                                               const eval::Context& ctx,
                                               diag::Bag& diags,
                                               const eval::Environment& env = builtins::default_environment());

/// Owns an environment and reuses segmented templates across renders.
/// render() may be called from several threads at once.
class Engine {
public:
    Engine() : env_(builtins::make_default_environment()) {}
    explicit Engine(eval::Environment env) : env_(std::move(env)) {}

    std::optional<std::string> render(std::string_view tpl,
                                      const eval::Context& ctx,
                                      diag::Bag& diags,
                                      std::string where = "<template>") const;

    std::optional<eval::Value> evaluate(std::string_view expr,
                                        const eval::Context& ctx,
                                        diag::Bag& diags) const;

    const eval::Environment& environment() const { return env_; }
    cache::TemplateCache& template_cache() const { return cache_; }

private:
    eval::Environment env_;
    mutable cache::TemplateCache cache_{};
};

} // namespace stencil
