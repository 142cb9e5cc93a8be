#include <stencil/eval/Value.hpp>

#include <charconv>
#include <cmath>
#include <system_error>

namespace stencil::eval {

namespace {

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc{}) return std::to_string(d);
    return std::string(buf, ptr);
}

std::string quote(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('\'');
    for (char c : s) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string render(const Value& v, bool nested) {
    if (v.is_null()) return nested ? "None" : "";
    if (auto p = std::get_if<bool>(&v.data)) return *p ? "true" : "false";
    if (auto p = std::get_if<int64_t>(&v.data)) return std::to_string(*p);
    if (auto p = std::get_if<double>(&v.data)) return format_float(*p);
    if (auto p = std::get_if<std::string>(&v.data)) return nested ? quote(*p) : *p;
    if (auto p = v.as_array()) {
        std::string out = "[";
        bool first = true;
        for (const auto& x : *p) {
            if (!first) out += ", ";
            first = false;
            out += render(x, true);
        }
        out += "]";
        return out;
    }
    if (auto p = v.as_object()) {
        std::string out = "{";
        bool first = true;
        for (const auto& [k, x] : *p) {
            if (!first) out += ", ";
            first = false;
            out += quote(k) + ": " + render(x, true);
        }
        out += "}";
        return out;
    }
    if (auto fn = v.as_native_function()) return "<function " + fn->name + ">";
    if (auto obj = v.as_native_object()) return "<object " + obj->name + ">";
    return "<unknown>";
}

} // namespace

bool truthy(const Value& v) {
    if (v.is_null()) return false;
    if (auto p = std::get_if<bool>(&v.data)) return *p;
    if (auto p = std::get_if<int64_t>(&v.data)) return *p != 0;
    if (auto p = std::get_if<double>(&v.data)) return *p != 0.0;
    if (auto p = std::get_if<std::string>(&v.data)) return !p->empty();
    if (auto p = v.as_array()) return !p->empty();
    if (auto p = v.as_object()) return !p->empty();
    return true;
}

bool numeric_promote(const Value& v, double& out) {
    if (auto p = std::get_if<int64_t>(&v.data)) {
        out = static_cast<double>(*p);
        return true;
    }
    if (auto p = std::get_if<double>(&v.data)) {
        out = *p;
        return true;
    }
    if (auto p = std::get_if<bool>(&v.data)) {
        out = *p ? 1.0 : 0.0;
        return true;
    }
    return false;
}

bool values_equal(const Value& a, const Value& b) {
    if (a.data.index() == b.data.index()) {
        if (a.is_null()) return true;
        if (auto pa = std::get_if<bool>(&a.data)) return *pa == std::get<bool>(b.data);
        if (auto pa = std::get_if<int64_t>(&a.data)) return *pa == std::get<int64_t>(b.data);
        if (auto pa = std::get_if<double>(&a.data)) return *pa == std::get<double>(b.data);
        if (auto pa = std::get_if<std::string>(&a.data)) return *pa == std::get<std::string>(b.data);
        if (auto pa = a.as_array()) {
            const auto& pb = *b.as_array();
            if (pa->size() != pb.size()) return false;
            for (size_t i = 0; i < pa->size(); ++i) {
                if (!values_equal((*pa)[i], pb[i])) return false;
            }
            return true;
        }
        if (auto pa = a.as_object()) {
            const auto& pb = *b.as_object();
            if (pa->size() != pb.size()) return false;
            for (const auto& [k, av] : *pa) {
                auto it = pb.find(k);
                if (it == pb.end()) return false;
                if (!values_equal(av, it->second)) return false;
            }
            return true;
        }
        if (auto pa = std::get_if<Value::NativeFunction>(&a.data)) {
            return *pa == std::get<Value::NativeFunction>(b.data);
        }
        if (auto pa = std::get_if<Value::Native>(&a.data)) {
            return *pa == std::get<Value::Native>(b.data);
        }
        return false;
    }

    // int == float by value; bool is not numeric here
    const bool a_num = a.is_int() || a.is_float();
    const bool b_num = b.is_int() || b.is_float();
    if (a_num && b_num) {
        double da = 0.0;
        double db = 0.0;
        numeric_promote(a, da);
        numeric_promote(b, db);
        return da == db;
    }
    return false;
}

std::string type_name(const Value& v) {
    if (v.is_null()) return "null";
    if (v.is_bool()) return "bool";
    if (v.is_int()) return "int";
    if (v.is_float()) return "float";
    if (v.is_string()) return "string";
    if (v.is_array()) return "list";
    if (v.is_object()) return "map";
    if (v.is_native_function()) return "function";
    if (v.is_native_object()) return "object";
    return "unknown";
}

std::string to_display(const Value& v) {
    return render(v, false);
}

std::string to_repr(const Value& v) {
    return render(v, true);
}

std::string stringify_key(const Value& v) {
    if (auto s = v.as_string()) return *s;
    return to_display(v);
}

} // namespace stencil::eval
