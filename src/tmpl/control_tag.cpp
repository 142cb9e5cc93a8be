#include <stencil/tmpl/Segmenter.hpp>

#include <stencil/builtins/ValueUtil.hpp>

#include <cctype>

namespace stencil::tmpl {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    const auto first = static_cast<unsigned char>(s[0]);
    if (!(std::isalpha(first) || first == '_')) return false;
    for (const char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || u == '_')) return false;
    }
    return true;
}

// Position of the first whitespace-delimited `in` (any case), or npos.
size_t find_in_keyword(std::string_view s) {
    for (size_t i = 1; i + 2 < s.size(); ++i) {
        if (!is_space(s[i - 1]) || !is_space(s[i + 2])) continue;
        if (std::tolower(static_cast<unsigned char>(s[i])) == 'i' &&
            std::tolower(static_cast<unsigned char>(s[i + 1])) == 'n') {
            return i;
        }
    }
    return std::string_view::npos;
}

ControlTag unknown(std::string_view interior, std::string why) {
    ControlTag t{};
    t.kind = ControlTagKind::kUnknown;
    t.expression = std::string(interior);
    t.error = "error parsing tag '" + std::string(interior) + "': " + why;
    return t;
}

} // namespace

std::string_view trim_tag_space(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

const char* control_tag_kind_name(ControlTagKind k) {
    switch (k) {
        case ControlTagKind::kIf: return "if";
        case ControlTagKind::kElseIf: return "elif";
        case ControlTagKind::kElse: return "else";
        case ControlTagKind::kEndIf: return "endif";
        case ControlTagKind::kFor: return "for";
        case ControlTagKind::kEndFor: return "endfor";
        case ControlTagKind::kUnknown: return "unknown";
    }
    return "unknown";
}

std::optional<ForHead> parse_for_head(std::string_view raw, std::string* err) {
    auto fail = [&](std::string msg) -> std::optional<ForHead> {
        if (err) *err = std::move(msg);
        return std::nullopt;
    };

    raw = trim_tag_space(raw);
    const size_t in_pos = find_in_keyword(raw);
    if (in_pos == std::string_view::npos) return fail("expected '<var> in <collection>'");

    const std::string_view lhs = trim_tag_space(raw.substr(0, in_pos));
    const std::string_view rhs = trim_tag_space(raw.substr(in_pos + 2));
    if (rhs.empty()) return fail("missing collection after 'in'");

    ForHead head{};
    const size_t comma = lhs.find(',');
    if (comma == std::string_view::npos) {
        if (!is_identifier(lhs)) return fail("invalid loop variable '" + std::string(lhs) + "'");
        head.vars.emplace_back(lhs);
    } else {
        const std::string_view k = trim_tag_space(lhs.substr(0, comma));
        const std::string_view v = trim_tag_space(lhs.substr(comma + 1));
        if (!is_identifier(k) || !is_identifier(v)) {
            return fail("invalid key-value unpacking '" + std::string(lhs) + "'");
        }
        head.vars.emplace_back(k);
        head.vars.emplace_back(v);
    }

    head.collection = std::string(rhs);
    return head;
}

ControlTag parse_control_tag(std::string_view interior) {
    interior = trim_tag_space(interior);
    if (interior.empty()) return unknown(interior, "empty control tag");

    size_t kw_end = 0;
    while (kw_end < interior.size() && !is_space(interior[kw_end])) ++kw_end;
    const std::string keyword = builtins::util::to_lower_ascii(std::string(interior.substr(0, kw_end)));
    const std::string_view rest = trim_tag_space(interior.substr(kw_end));

    ControlTag t{};
    if (keyword == "if" || keyword == "elif") {
        if (rest.empty()) return unknown(interior, "'" + keyword + "' requires a condition");
        t.kind = keyword == "if" ? ControlTagKind::kIf : ControlTagKind::kElseIf;
        t.expression = std::string(rest);
        return t;
    }

    if (keyword == "else" || keyword == "endif" || keyword == "endfor") {
        if (!rest.empty()) return unknown(interior, "'" + keyword + "' takes no arguments");
        if (keyword == "else") t.kind = ControlTagKind::kElse;
        else if (keyword == "endif") t.kind = ControlTagKind::kEndIf;
        else t.kind = ControlTagKind::kEndFor;
        return t;
    }

    if (keyword == "for") {
        std::string why;
        if (!parse_for_head(rest, &why)) return unknown(interior, why);
        t.kind = ControlTagKind::kFor;
        t.expression = std::string(rest);
        return t;
    }

    return unknown(interior, "unknown control tag '" + keyword + "'");
}

} // namespace stencil::tmpl
