#include <stencil/builtins/Register.hpp>

namespace stencil::builtins::detail {

void register_string_filters(eval::FilterRegistry& reg);
void register_sequence_filters(eval::FilterRegistry& reg);
void register_lookup_functions(eval::FunctionRegistry& reg);
void register_map_methods(eval::FunctionRegistry& reg);
void register_string_methods(eval::FunctionRegistry& reg);

} // namespace stencil::builtins::detail

namespace stencil::builtins {

void register_builtin_filters(eval::FilterRegistry& reg) {
    detail::register_string_filters(reg);
    detail::register_sequence_filters(reg);
}

void register_builtin_functions(eval::FunctionRegistry& reg) {
    detail::register_lookup_functions(reg);
    detail::register_map_methods(reg);
    detail::register_string_methods(reg);
}

eval::Environment make_default_environment() {
    eval::Environment env{};
    register_builtin_filters(env.filters);
    register_builtin_functions(env.functions);
    return env;
}

const eval::Environment& default_environment() {
    static const eval::Environment env = make_default_environment();
    return env;
}

} // namespace stencil::builtins
