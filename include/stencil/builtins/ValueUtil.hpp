#pragma once

#include <stencil/eval/Registry.hpp>
#include <stencil/eval/Value.hpp>

#include <cctype>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil::builtins::util {

inline eval::Value make_null() {
    return eval::Value{};
}

inline eval::Value make_int(int64_t v) {
    eval::Value out{};
    out.data = v;
    return out;
}

inline eval::Value make_float(double v) {
    eval::Value out{};
    out.data = v;
    return out;
}

inline eval::Value make_string(std::string v) {
    eval::Value out{};
    out.data = std::move(v);
    return out;
}

inline eval::Value make_bool(bool v) {
    eval::Value out{};
    out.data = v;
    return out;
}

inline eval::Value make_array(eval::Value::Array arr = {}) {
    eval::Value out{};
    out.data = std::move(arr);
    return out;
}

inline eval::Value make_object(eval::Value::Object obj = {}) {
    eval::Value out{};
    out.data = std::move(obj);
    return out;
}

inline eval::Value make_native_object(std::shared_ptr<eval::NativeObject> obj) {
    eval::Value out{};
    out.data = std::move(obj);
    return out;
}

inline void type_error(const eval::CallSite& site, diag::Bag& diags, std::string msg) {
    diags.add(diag::Code::E_TYPE_ERROR, site.where, site.offset, std::move(msg));
}

inline bool expect_arg_count(const std::vector<eval::Value>& args,
                             size_t expected,
                             std::string_view fn,
                             const eval::CallSite& site,
                             diag::Bag& diags) {
    if (args.size() == expected) return true;
    type_error(site, diags,
               std::string(fn) + " expects " + std::to_string(expected)
                   + " args, got " + std::to_string(args.size()));
    return false;
}

inline bool expect_arg_range(const std::vector<eval::Value>& args,
                             size_t min_count,
                             size_t max_count,
                             std::string_view fn,
                             const eval::CallSite& site,
                             diag::Bag& diags) {
    if (args.size() >= min_count && args.size() <= max_count) return true;
    type_error(site, diags,
               std::string(fn) + " expects "
                   + std::to_string(min_count) + ".." + std::to_string(max_count)
                   + " args, got " + std::to_string(args.size()));
    return false;
}

inline bool arg_as_int(const std::vector<eval::Value>& args,
                       size_t idx,
                       int64_t& out,
                       std::string_view fn,
                       const eval::CallSite& site,
                       diag::Bag& diags) {
    if (idx >= args.size() || !args[idx].is_int()) {
        type_error(site, diags,
                   std::string(fn) + " arg[" + std::to_string(idx)
                       + "] must be int, got " + (idx < args.size() ? eval::type_name(args[idx]) : "missing"));
        return false;
    }
    out = std::get<int64_t>(args[idx].data);
    return true;
}

inline bool arg_as_string(const std::vector<eval::Value>& args,
                          size_t idx,
                          std::string& out,
                          std::string_view fn,
                          const eval::CallSite& site,
                          diag::Bag& diags) {
    if (idx >= args.size() || !args[idx].is_string()) {
        type_error(site, diags,
                   std::string(fn) + " arg[" + std::to_string(idx)
                       + "] must be string, got " + (idx < args.size() ? eval::type_name(args[idx]) : "missing"));
        return false;
    }
    out = *args[idx].as_string();
    return true;
}

// Filters that work on text accept any input and stringify it; Null is "".
inline std::string coerce_text(const eval::Value& v) {
    if (auto s = v.as_string()) return *s;
    return eval::to_display(v);
}

inline std::string to_upper_ascii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

inline std::string to_lower_ascii(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

inline std::string trim_ascii(std::string s) {
    auto is_space = [](unsigned char c) -> bool { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

} // namespace stencil::builtins::util
