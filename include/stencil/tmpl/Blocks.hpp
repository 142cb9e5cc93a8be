#pragma once

#include <stencil/tmpl/Segmenter.hpp>

#include <optional>
#include <vector>

namespace stencil::tmpl {

struct BlockSpan {
    size_t open = 0;
    // index of the node that ended the segment; the body is (open, end)
    size_t end = 0;
    ControlTagKind ended_by = ControlTagKind::kUnknown;
};

/// Scans nodes[open+1, limit) for the end of the segment opened at `open`.
/// If/EndIf and For/EndFor nest independently. While the opener's family is
/// at depth 1 and the other family at depth 0, a node whose kind is in
/// `stoppers`, or any kUnknown node, ends the segment. Otherwise the segment
/// ends at the `closer` that brings the opener's family back to depth 0.
/// nullopt when no such node exists before `limit`.
std::optional<BlockSpan> find_block(const std::vector<TemplateNode>& nodes,
                                    size_t open,
                                    size_t limit,
                                    ControlTagKind closer,
                                    const std::vector<ControlTagKind>& stoppers = {});

} // namespace stencil::tmpl
