#include <stencil/builtins/ValueUtil.hpp>

#include <cctype>
#include <string>
#include <vector>

namespace stencil::builtins::detail {

namespace {

// map.get(key[, default]); missing key without default is None
std::optional<eval::Value> map_get(const eval::Value& self,
                                   const std::vector<eval::Value>& args,
                                   const eval::CallSite& site,
                                   diag::Bag& diags) {
    if (!util::expect_arg_range(args, 1, 2, "map.get", site, diags)) return std::nullopt;
    const auto& obj = *self.as_object();
    auto it = obj.find(eval::stringify_key(args[0]));
    if (it != obj.end()) return it->second;
    if (args.size() == 2) return args[1];
    return util::make_null();
}

std::optional<eval::Value> map_keys(const eval::Value& self,
                                    const std::vector<eval::Value>& args,
                                    const eval::CallSite& site,
                                    diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "map.keys", site, diags)) return std::nullopt;
    eval::Value::Array out;
    for (const auto& [k, _] : *self.as_object()) out.push_back(util::make_string(k));
    return util::make_array(std::move(out));
}

std::optional<eval::Value> map_values(const eval::Value& self,
                                      const std::vector<eval::Value>& args,
                                      const eval::CallSite& site,
                                      diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "map.values", site, diags)) return std::nullopt;
    eval::Value::Array out;
    for (const auto& [_, v] : *self.as_object()) out.push_back(v);
    return util::make_array(std::move(out));
}

std::optional<eval::Value> map_items(const eval::Value& self,
                                     const std::vector<eval::Value>& args,
                                     const eval::CallSite& site,
                                     diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "map.items", site, diags)) return std::nullopt;
    eval::Value::Array out;
    for (const auto& [k, v] : *self.as_object()) {
        out.push_back(util::make_array({util::make_string(k), v}));
    }
    return util::make_array(std::move(out));
}

std::optional<eval::Value> str_upper(const eval::Value& self,
                                     const std::vector<eval::Value>& args,
                                     const eval::CallSite& site,
                                     diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "string.upper", site, diags)) return std::nullopt;
    return util::make_string(util::to_upper_ascii(*self.as_string()));
}

std::optional<eval::Value> str_lower(const eval::Value& self,
                                     const std::vector<eval::Value>& args,
                                     const eval::CallSite& site,
                                     diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "string.lower", site, diags)) return std::nullopt;
    return util::make_string(util::to_lower_ascii(*self.as_string()));
}

std::optional<eval::Value> str_strip(const eval::Value& self,
                                     const std::vector<eval::Value>& args,
                                     const eval::CallSite& site,
                                     diag::Bag& diags) {
    if (!util::expect_arg_count(args, 0, "string.strip", site, diags)) return std::nullopt;
    return util::make_string(util::trim_ascii(*self.as_string()));
}

std::optional<eval::Value> str_startswith(const eval::Value& self,
                                          const std::vector<eval::Value>& args,
                                          const eval::CallSite& site,
                                          diag::Bag& diags) {
    std::string prefix;
    if (!util::expect_arg_count(args, 1, "string.startswith", site, diags)) return std::nullopt;
    if (!util::arg_as_string(args, 0, prefix, "string.startswith", site, diags)) return std::nullopt;
    const std::string& s = *self.as_string();
    if (prefix.size() > s.size()) return util::make_bool(false);
    return util::make_bool(s.compare(0, prefix.size(), prefix) == 0);
}

std::optional<eval::Value> str_endswith(const eval::Value& self,
                                        const std::vector<eval::Value>& args,
                                        const eval::CallSite& site,
                                        diag::Bag& diags) {
    std::string suffix;
    if (!util::expect_arg_count(args, 1, "string.endswith", site, diags)) return std::nullopt;
    if (!util::arg_as_string(args, 0, suffix, "string.endswith", site, diags)) return std::nullopt;
    const std::string& s = *self.as_string();
    if (suffix.size() > s.size()) return util::make_bool(false);
    return util::make_bool(s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
}

// split() on whitespace runs, split(sep) on every occurrence of sep
std::optional<eval::Value> str_split(const eval::Value& self,
                                     const std::vector<eval::Value>& args,
                                     const eval::CallSite& site,
                                     diag::Bag& diags) {
    if (!util::expect_arg_range(args, 0, 1, "string.split", site, diags)) return std::nullopt;
    const std::string& s = *self.as_string();
    eval::Value::Array out{};

    if (args.empty()) {
        size_t i = 0;
        while (i < s.size()) {
            while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
            const size_t start = i;
            while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
            if (i > start) out.push_back(util::make_string(s.substr(start, i - start)));
        }
        return util::make_array(std::move(out));
    }

    std::string sep;
    if (!util::arg_as_string(args, 0, sep, "string.split", site, diags)) return std::nullopt;
    if (sep.empty()) {
        util::type_error(site, diags, "string.split separator must not be empty");
        return std::nullopt;
    }

    size_t pos = 0;
    while (true) {
        const size_t next = s.find(sep, pos);
        if (next == std::string::npos) {
            out.push_back(util::make_string(s.substr(pos)));
            break;
        }
        out.push_back(util::make_string(s.substr(pos, next - pos)));
        pos = next + sep.size();
    }
    return util::make_array(std::move(out));
}

} // namespace

void register_map_methods(eval::FunctionRegistry& reg) {
    reg.register_method("map", "get", map_get);
    reg.register_method("map", "keys", map_keys);
    reg.register_method("map", "values", map_values);
    reg.register_method("map", "items", map_items);
}

void register_string_methods(eval::FunctionRegistry& reg) {
    reg.register_method("string", "upper", str_upper);
    reg.register_method("string", "lower", str_lower);
    reg.register_method("string", "strip", str_strip);
    reg.register_method("string", "startswith", str_startswith);
    reg.register_method("string", "endswith", str_endswith);
    reg.register_method("string", "split", str_split);
}

} // namespace stencil::builtins::detail
