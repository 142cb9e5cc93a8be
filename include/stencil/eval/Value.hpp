#pragma once

#include <stencil/diag/DiagCode.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace stencil::eval {

struct BuiltinFunction;
struct NativeObject;

struct Value {
    using Null = std::monostate;
    using Object = std::map<std::string, Value>;
    using Array = std::vector<Value>;
    using NativeFunction = std::shared_ptr<BuiltinFunction>;
    using Native = std::shared_ptr<NativeObject>;

    std::variant<Null, bool, int64_t, double, std::string, Array, Object, NativeFunction, Native> data;

    bool is_null() const { return std::holds_alternative<Null>(data); }
    bool is_bool() const { return std::holds_alternative<bool>(data); }
    bool is_int() const { return std::holds_alternative<int64_t>(data); }
    bool is_float() const { return std::holds_alternative<double>(data); }
    bool is_string() const { return std::holds_alternative<std::string>(data); }
    bool is_array() const { return std::holds_alternative<Array>(data); }
    bool is_object() const { return std::holds_alternative<Object>(data); }
    bool is_native_function() const { return std::holds_alternative<NativeFunction>(data); }
    bool is_native_object() const { return std::holds_alternative<Native>(data); }

    const std::string* as_string() const { return std::get_if<std::string>(&data); }
    const Object* as_object() const { return std::get_if<Object>(&data); }
    Object* as_object() { return std::get_if<Object>(&data); }
    const Array* as_array() const { return std::get_if<Array>(&data); }
    Array* as_array() { return std::get_if<Array>(&data); }
    const BuiltinFunction* as_native_function() const {
        auto p = std::get_if<NativeFunction>(&data);
        if (!p) return nullptr;
        return p->get();
    }
    const NativeObject* as_native_object() const {
        auto p = std::get_if<Native>(&data);
        if (!p) return nullptr;
        return p->get();
    }
};

/// Variable bindings for one render / evaluate call.
using Context = std::unordered_map<std::string, Value>;

/// Where a callable was invoked from, for diagnostics raised inside it.
struct CallSite {
    std::string where;
    uint32_t offset = 0;
};

struct BuiltinFunction {
    using Callback = std::function<std::optional<Value>(const std::vector<Value>& args,
                                                        const CallSite& site,
                                                        diag::Bag& diags)>;

    std::string name{};
    Callback callback{};
};

/// Host object seam. A resolver that returns nullopt without adding a
/// diagnostic means "no such member"; the evaluator reports it.
struct NativeObject {
    using AttributeResolver = std::function<std::optional<Value>(std::string_view name,
                                                                 const CallSite& site,
                                                                 diag::Bag& diags)>;
    using ItemResolver = std::function<std::optional<Value>(const Value& key,
                                                            const CallSite& site,
                                                            diag::Bag& diags)>;
    using KeysProvider = std::function<std::vector<std::string>()>;

    std::string name{};
    AttributeResolver get_attribute{};
    ItemResolver get_item{};
    BuiltinFunction::Callback call{};
    KeysProvider keys{};
};

bool truthy(const Value& v);
bool values_equal(const Value& a, const Value& b);

// int / float / bool widened to double
bool numeric_promote(const Value& v, double& out);

std::string type_name(const Value& v);

// Rendered form: Null is "", strings are unquoted.
std::string to_display(const Value& v);
// Nested form used inside lists and maps: None, quoted strings.
std::string to_repr(const Value& v);
// Map keys and `in` needles against maps.
std::string stringify_key(const Value& v);

} // namespace stencil::eval
