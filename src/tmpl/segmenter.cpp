#include <stencil/tmpl/Segmenter.hpp>

#include <algorithm>

namespace stencil::tmpl {

namespace {

constexpr std::string_view kExprOpen = "{{";
constexpr std::string_view kExprClose = "}}";
constexpr std::string_view kCtrlOpen = "{%";
constexpr std::string_view kCtrlClose = "%}";
constexpr std::string_view kCommentOpen = "{#";
constexpr std::string_view kCommentClose = "#}";

bool starts_at(std::string_view s, size_t i, std::string_view pat) {
    return i + pat.size() <= s.size() && s.compare(i, pat.size(), pat) == 0;
}

// Index just past the closing quote of the string starting at `i`, or npos
// when the string never closes. A backslash always consumes the next byte,
// so only an unescaped quote ends the string.
size_t skip_quoted(std::string_view s, size_t i) {
    const char quote = s[i];
    size_t j = i + 1;
    while (j < s.size()) {
        if (s[j] == '\\') {
            j += 2;
            continue;
        }
        if (s[j] == quote) return j + 1;
        ++j;
    }
    return std::string_view::npos;
}

} // namespace

size_t Segmenter::find_marker(size_t from) const {
    size_t best = std::string_view::npos;
    for (auto m : {kCommentOpen, kCtrlOpen, kExprOpen}) {
        const size_t at = text_.find(m, from);
        if (at != std::string_view::npos) best = std::min(best, at);
    }
    return best;
}

// On success `close` is the index of the terminating "}}".
bool Segmenter::scan_expression(size_t open, size_t& close) const {
    int depth = 1;
    size_t i = open + kExprOpen.size();
    while (i < text_.size()) {
        const char c = text_[i];
        if (c == '"' || c == '\'') {
            i = skip_quoted(text_, i);
            if (i == std::string_view::npos) return false;
            continue;
        }
        if (starts_at(text_, i, kExprOpen)) {
            ++depth;
            i += 2;
            continue;
        }
        if (starts_at(text_, i, kExprClose)) {
            if (--depth == 0) {
                close = i;
                return true;
            }
            i += 2;
            continue;
        }
        ++i;
    }
    return false;
}

bool Segmenter::scan_control(size_t open, size_t& close) const {
    size_t i = open + kCtrlOpen.size();
    while (i < text_.size()) {
        const char c = text_[i];
        if (c == '"' || c == '\'') {
            i = skip_quoted(text_, i);
            if (i == std::string_view::npos) return false;
            continue;
        }
        if (starts_at(text_, i, kCtrlClose)) {
            close = i;
            return true;
        }
        ++i;
    }
    return false;
}

bool Segmenter::scan_comment(size_t open, size_t& close) const {
    const size_t at = text_.find(kCommentClose, open + kCommentOpen.size());
    if (at == std::string_view::npos) return false;
    close = at;
    return true;
}

TemplateNode Segmenter::make_text(size_t begin, size_t end) {
    TemplateNode n{};
    n.kind = NodeKind::kText;
    n.content = std::string(text_.substr(begin, end - begin));
    n.offset = static_cast<uint32_t>(begin);
    pos_ = end;
    return n;
}

std::optional<TemplateNode> Segmenter::next() {
    if (done()) return std::nullopt;

    const size_t open = find_marker(pos_);
    if (open == std::string_view::npos) return make_text(pos_, text_.size());
    if (open > pos_) return make_text(pos_, open);

    size_t close = 0;
    TemplateNode n{};
    n.offset = static_cast<uint32_t>(open);

    bool ok = false;
    if (starts_at(text_, open, kCommentOpen)) {
        ok = scan_comment(open, close);
        n.kind = NodeKind::kComment;
    } else if (starts_at(text_, open, kCtrlOpen)) {
        ok = scan_control(open, close);
        n.kind = NodeKind::kControlTag;
    } else {
        ok = scan_expression(open, close);
        n.kind = NodeKind::kExpression;
    }

    if (!ok) {
        // Unclosed tag: keep it as literal text up to the next candidate.
        size_t until = find_marker(open + 1);
        if (until == std::string_view::npos) until = text_.size();
        return make_text(open, until);
    }

    const std::string_view inner = text_.substr(open + 2, close - open - 2);
    switch (n.kind) {
        case NodeKind::kComment:
            n.content = std::string(inner);
            break;
        case NodeKind::kControlTag:
            n.content = std::string(trim_tag_space(inner));
            n.control = parse_control_tag(n.content);
            break;
        default:
            n.content = std::string(trim_tag_space(inner));
            break;
    }

    pos_ = close + 2;
    return n;
}

std::vector<TemplateNode> segment_template(std::string_view text) {
    std::vector<TemplateNode> out;
    Segmenter seg(text);
    while (auto n = seg.next()) out.push_back(std::move(*n));
    return out;
}

} // namespace stencil::tmpl
