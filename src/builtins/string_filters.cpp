#include <stencil/builtins/ValueUtil.hpp>

#include <string>
#include <vector>

namespace stencil::builtins::detail {

namespace {

std::optional<eval::Value> upper_filter(const eval::Value& input,
                                        const std::vector<eval::Value>& args,
                                        const eval::CallSite& site,
                                        diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "upper", site, diags)) return std::nullopt;
    return util::make_string(util::to_upper_ascii(util::coerce_text(input)));
}

std::optional<eval::Value> lower_filter(const eval::Value& input,
                                        const std::vector<eval::Value>& args,
                                        const eval::CallSite& site,
                                        diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "lower", site, diags)) return std::nullopt;
    return util::make_string(util::to_lower_ascii(util::coerce_text(input)));
}

std::optional<eval::Value> capitalize_filter(const eval::Value& input,
                                             const std::vector<eval::Value>& args,
                                             const eval::CallSite& site,
                                             diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "capitalize", site, diags)) return std::nullopt;
    std::string s = util::coerce_text(input);
    if (s.empty()) return util::make_string("");
    return util::make_string(util::to_upper_ascii(s.substr(0, 1)) + util::to_lower_ascii(s.substr(1)));
}

std::optional<eval::Value> replace_filter(const eval::Value& input,
                                          const std::vector<eval::Value>& args,
                                          const eval::CallSite& site,
                                          diag::Bag& diags) {
    std::string from;
    std::string to;
    int64_t count = -1;
    if (!util::expect_arg_range(args, 2, 3, "replace", site, diags)) return std::nullopt;
    if (!util::arg_as_string(args, 0, from, "replace", site, diags)) return std::nullopt;
    if (!util::arg_as_string(args, 1, to, "replace", site, diags)) return std::nullopt;
    if (args.size() == 3 && !util::arg_as_int(args, 2, count, "replace", site, diags)) return std::nullopt;

    std::string s = util::coerce_text(input);
    if (from.empty() || count == 0) return util::make_string(std::move(s));

    std::string out;
    out.reserve(s.size());
    size_t pos = 0;
    int64_t done = 0;
    while (count < 0 || done < count) {
        const size_t next = s.find(from, pos);
        if (next == std::string::npos) break;
        out.append(s, pos, next - pos);
        out += to;
        pos = next + from.size();
        ++done;
    }
    out.append(s, pos, std::string::npos);
    return util::make_string(std::move(out));
}

std::optional<eval::Value> trim_filter(const eval::Value& input,
                                       const std::vector<eval::Value>& args,
                                       const eval::CallSite& site,
                                       diag::Bag& diags) {
    if (!util::expect_arg_range(args, 0, 1, "trim", site, diags)) return std::nullopt;
    std::string s = util::coerce_text(input);
    if (args.empty()) return util::make_string(util::trim_ascii(std::move(s)));

    std::string cutset;
    if (!util::arg_as_string(args, 0, cutset, "trim", site, diags)) return std::nullopt;
    const size_t first = s.find_first_not_of(cutset);
    if (first == std::string::npos) return util::make_string("");
    const size_t last = s.find_last_not_of(cutset);
    return util::make_string(s.substr(first, last - first + 1));
}

std::optional<eval::Value> escape_filter(const eval::Value& input,
                                         const std::vector<eval::Value>& args,
                                         const eval::CallSite& site,
                                         diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "escape", site, diags)) return std::nullopt;
    const std::string s = util::coerce_text(input);
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&#34;"; break;
            case '\'': out += "&#39;"; break;
            default: out.push_back(c); break;
        }
    }
    return util::make_string(std::move(out));
}

} // namespace

void register_string_filters(eval::FilterRegistry& reg) {
    reg.register_filter("upper", upper_filter);
    reg.register_filter("lower", lower_filter);
    reg.register_filter("capitalize", capitalize_filter);
    reg.register_filter("replace", replace_filter);
    reg.register_filter("trim", trim_filter);
    reg.register_filter("escape", escape_filter);
}

} // namespace stencil::builtins::detail
