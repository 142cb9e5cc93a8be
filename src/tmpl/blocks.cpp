#include <stencil/tmpl/Blocks.hpp>

#include <algorithm>

namespace stencil::tmpl {

namespace {

bool is_if_family(ControlTagKind k) {
    return k == ControlTagKind::kIf || k == ControlTagKind::kElseIf ||
           k == ControlTagKind::kElse || k == ControlTagKind::kEndIf;
}

} // namespace

std::optional<BlockSpan> find_block(const std::vector<TemplateNode>& nodes,
                                    size_t open,
                                    size_t limit,
                                    ControlTagKind closer,
                                    const std::vector<ControlTagKind>& stoppers) {
    limit = std::min(limit, nodes.size());
    if (open >= limit || nodes[open].kind != NodeKind::kControlTag) return std::nullopt;

    const bool if_family = is_if_family(nodes[open].control.kind);
    int if_depth = if_family ? 1 : 0;
    int for_depth = if_family ? 0 : 1;
    int& own = if_family ? if_depth : for_depth;
    int& other = if_family ? for_depth : if_depth;

    for (size_t i = open + 1; i < limit; ++i) {
        const TemplateNode& n = nodes[i];
        if (n.kind != NodeKind::kControlTag) continue;
        const ControlTagKind k = n.control.kind;

        if (own == 1 && other == 0) {
            const bool stop = k == ControlTagKind::kUnknown ||
                              std::find(stoppers.begin(), stoppers.end(), k) != stoppers.end();
            if (stop) return BlockSpan{open, i, k};
        }

        switch (k) {
            case ControlTagKind::kIf: ++if_depth; break;
            case ControlTagKind::kFor: ++for_depth; break;
            case ControlTagKind::kEndIf:
                if (if_family || if_depth > 0) --if_depth;
                break;
            case ControlTagKind::kEndFor:
                if (!if_family || for_depth > 0) --for_depth;
                break;
            default:
                break;
        }

        if (k == closer && own == 0) return BlockSpan{open, i, k};
    }

    return std::nullopt;
}

} // namespace stencil::tmpl
