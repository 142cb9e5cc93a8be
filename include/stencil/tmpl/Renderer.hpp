#pragma once

#include <stencil/diag/DiagCode.hpp>
#include <stencil/eval/Registry.hpp>
#include <stencil/eval/Value.hpp>
#include <stencil/tmpl/Blocks.hpp>
#include <stencil/tmpl/Segmenter.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::tmpl {

/// Walks a node sequence and produces the rendered text. Any diagnostic
/// means the render failed and no output is returned.
class Renderer {
public:
    Renderer(const eval::Environment& env, diag::Bag& diags, std::string where = "<template>")
        : env_(env), diags_(diags), where_(std::move(where)) {}

    std::optional<std::string> render(const std::vector<TemplateNode>& nodes, const eval::Context& ctx);

private:
    using Nodes = std::vector<TemplateNode>;

    bool render_range(const Nodes& nodes, size_t begin, size_t end,
                      const eval::Context& ctx, uint32_t depth, std::string& out);

    bool render_expression(const TemplateNode& node, const eval::Context& ctx, std::string& out);

    // Both return the index just past the structure's closing tag.
    std::optional<size_t> render_if(const Nodes& nodes, size_t open, size_t limit,
                                    const eval::Context& ctx, uint32_t depth, std::string& out);
    std::optional<size_t> render_for(const Nodes& nodes, size_t open, size_t limit,
                                     const eval::Context& ctx, uint32_t depth, std::string& out);

    std::optional<eval::Value> eval_condition(const TemplateNode& node, const eval::Context& ctx);
    bool collect_items(const eval::Value& coll, size_t arity, const TemplateNode& node,
                       std::vector<std::vector<eval::Value>>& items);

    void malformed(const TemplateNode& node, std::string msg);
    void unclosed(const TemplateNode& node, size_t index);
    std::string location_note(const TemplateNode& node, size_t index) const;

    const eval::Environment& env_;
    diag::Bag& diags_;
    std::string where_;
    uint64_t iterations_ = 0;
};

/// segment + render. `where` labels diagnostics.
std::optional<std::string> render_template(std::string_view tpl,
                                           const eval::Context& ctx,
                                           const eval::Environment& env,
                                           diag::Bag& diags,
                                           std::string where = "<template>");

} // namespace stencil::tmpl
