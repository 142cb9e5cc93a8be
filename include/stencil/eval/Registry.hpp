#pragma once

#include <stencil/eval/Value.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stencil::eval {

struct EvalBudget {
    uint32_t max_expr_depth = 256;
    uint32_t max_block_depth = 128;
    uint64_t max_loop_iterations = 1000000;
    // elements (list) or bytes (string) a single repetition may produce
    uint64_t max_sequence_length = 16u * 1024u * 1024u;
};

/// Callable that receives a subject value: the filter input, or the
/// receiver of a method call.
using BoundCallback = std::function<std::optional<Value>(const Value& self,
                                                         const std::vector<Value>& args,
                                                         const CallSite& site,
                                                         diag::Bag& diags)>;

struct Filter {
    std::string name{};
    BoundCallback callback{};
    // true when the filter turns an undefined input into a defined result
    bool resolves_undefined = false;
};

class FilterRegistry {
public:
    void register_filter(std::string name, BoundCallback callback, bool resolves_undefined = false);

    const Filter* find(std::string_view name) const;

private:
    std::unordered_map<std::string, Filter> filters_{};
};

/// Free functions by bare name, methods by (type tag, name). Type tags are
/// the names returned by eval::type_name().
class FunctionRegistry {
public:
    void register_function(std::string name, BuiltinFunction::Callback callback);
    void register_method(std::string type_tag, std::string name, BoundCallback callback);

    std::optional<Value> find_function(std::string_view name) const;
    bool has_function(std::string_view name) const;

    // Returns a callable with `self` already bound, or nullopt.
    std::optional<Value> bind_method(const Value& self, std::string_view name) const;

private:
    std::unordered_map<std::string, Value> functions_{};
    std::map<std::pair<std::string, std::string>, BoundCallback, std::less<>> methods_{};
};

struct Environment {
    FilterRegistry filters{};
    FunctionRegistry functions{};
    EvalBudget budget{};
};

} // namespace stencil::eval
