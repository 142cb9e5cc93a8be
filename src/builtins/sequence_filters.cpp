#include <stencil/builtins/ValueUtil.hpp>
#include <stencil/text/Utf8.hpp>

#include <string>
#include <vector>

namespace stencil::builtins::detail {

namespace {

// Numbers, including 0, are never replaced unless the second argument asks
// for plain truthiness.
bool needs_default(const eval::Value& v, bool by_truthiness) {
    if (by_truthiness) return !eval::truthy(v);
    if (v.is_null()) return true;
    if (auto b = std::get_if<bool>(&v.data)) return !*b;
    if (auto s = v.as_string()) return s->empty();
    if (auto a = v.as_array()) return a->empty();
    if (auto o = v.as_object()) return o->empty();
    return false;
}

std::optional<eval::Value> default_filter(const eval::Value& input,
                                          const std::vector<eval::Value>& args,
                                          const eval::CallSite& site,
                                          diag::Bag& diags) {
    if (!util::expect_arg_range(args, 1, 2, "default", site, diags)) return std::nullopt;
    const bool by_truthiness = args.size() == 2 && eval::truthy(args[1]);
    if (needs_default(input, by_truthiness)) return args[0];
    return input;
}

std::optional<eval::Value> join_filter(const eval::Value& input,
                                       const std::vector<eval::Value>& args,
                                       const eval::CallSite& site,
                                       diag::Bag& diags) {
    std::string delim;
    if (!util::expect_arg_range(args, 0, 1, "join", site, diags)) return std::nullopt;
    if (args.size() == 1 && !util::arg_as_string(args, 0, delim, "join", site, diags)) return std::nullopt;

    if (input.is_null()) return util::make_string("");
    if (input.is_string()) return input;

    auto arr = input.as_array();
    if (!arr) {
        util::type_error(site, diags, "join expects a list, got " + eval::type_name(input));
        return std::nullopt;
    }

    std::string out;
    bool first = true;
    for (const auto& item : *arr) {
        if (!first) out += delim;
        first = false;
        out += eval::to_display(item);
    }
    return util::make_string(std::move(out));
}

std::optional<eval::Value> list_filter(const eval::Value& input,
                                       const std::vector<eval::Value>& args,
                                       const eval::CallSite& site,
                                       diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "list", site, diags)) return std::nullopt;

    if (input.is_null()) return util::make_array();
    if (input.is_array()) return input;

    eval::Value::Array out;
    if (auto s = input.as_string()) {
        for (auto& ch : text::split_chars(*s)) out.push_back(util::make_string(std::move(ch)));
        return util::make_array(std::move(out));
    }
    if (auto o = input.as_object()) {
        out.reserve(o->size());
        for (const auto& [k, _] : *o) out.push_back(util::make_string(k));
        return util::make_array(std::move(out));
    }
    out.push_back(input);
    return util::make_array(std::move(out));
}

} // namespace

void register_sequence_filters(eval::FilterRegistry& reg) {
    reg.register_filter("default", default_filter, /*resolves_undefined=*/true);
    reg.register_filter("join", join_filter);
    reg.register_filter("list", list_filter);
}

} // namespace stencil::builtins::detail
