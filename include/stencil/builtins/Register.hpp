#pragma once

#include <stencil/eval/Registry.hpp>

namespace stencil::builtins {

void register_builtin_filters(eval::FilterRegistry& reg);
void register_builtin_functions(eval::FunctionRegistry& reg);

// Registries with every builtin filter, function and method, default budget.
eval::Environment make_default_environment();

// Shared immutable instance of make_default_environment().
const eval::Environment& default_environment();

} // namespace stencil::builtins
