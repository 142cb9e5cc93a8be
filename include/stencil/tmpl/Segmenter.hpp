#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::tmpl {

enum class NodeKind : uint8_t {
    kText,
    kExpression,
    kComment,
    kControlTag,
};

enum class ControlTagKind : uint8_t {
    kIf,
    kElseIf,
    kElse,
    kEndIf,
    kFor,
    kEndFor,
    kUnknown,
};

const char* control_tag_kind_name(ControlTagKind k);

struct ControlTag {
    ControlTagKind kind = ControlTagKind::kUnknown;
    // condition for if/elif, loop head for for, empty otherwise
    std::string expression{};
    // set only for kUnknown; reported when the renderer reaches the tag
    std::string error{};
};

struct TemplateNode {
    NodeKind kind = NodeKind::kText;
    // text, expression / control interior (trimmed), or comment body
    std::string content{};
    ControlTag control{};
    // byte offset of the node in the template
    uint32_t offset = 0;
};

/// `<var> in <expr>` or `<key>, <value> in <expr>`.
struct ForHead {
    std::vector<std::string> vars{};
    std::string collection{};
};

/// Strips the space, tab, CR and LF bytes surrounding tag content.
std::string_view trim_tag_space(std::string_view s);

std::optional<ForHead> parse_for_head(std::string_view raw, std::string* err = nullptr);

/// Classifies the trimmed interior of a `{% ... %}` tag. Never fails:
/// anything unrecognized comes back as kUnknown with `error` filled in.
ControlTag parse_control_tag(std::string_view interior);

/// Resumable scanner over one template. Every call to next() consumes at
/// least one byte until the input is exhausted.
class Segmenter {
public:
    explicit Segmenter(std::string_view text) : text_(text) {}

    std::optional<TemplateNode> next();
    bool done() const { return pos_ >= text_.size(); }
    size_t pos() const { return pos_; }

private:
    size_t find_marker(size_t from) const;

    bool scan_expression(size_t open, size_t& close) const;
    bool scan_control(size_t open, size_t& close) const;
    bool scan_comment(size_t open, size_t& close) const;

    TemplateNode make_text(size_t begin, size_t end);

    std::string_view text_;
    size_t pos_ = 0;
};

std::vector<TemplateNode> segment_template(std::string_view text);

} // namespace stencil::tmpl
