#include <stencil/eval/Registry.hpp>

#include <memory>

namespace stencil::eval {

void FilterRegistry::register_filter(std::string name, BoundCallback callback, bool resolves_undefined) {
    Filter f{};
    f.name = name;
    f.callback = std::move(callback);
    f.resolves_undefined = resolves_undefined;
    filters_[std::move(name)] = std::move(f);
}

const Filter* FilterRegistry::find(std::string_view name) const {
    auto it = filters_.find(std::string(name));
    if (it == filters_.end()) return nullptr;
    return &it->second;
}

void FunctionRegistry::register_function(std::string name, BuiltinFunction::Callback callback) {
    auto fn = std::make_shared<BuiltinFunction>();
    fn->name = name;
    fn->callback = std::move(callback);
    Value v{};
    v.data = std::move(fn);
    functions_[std::move(name)] = std::move(v);
}

void FunctionRegistry::register_method(std::string type_tag, std::string name, BoundCallback callback) {
    methods_[{std::move(type_tag), std::move(name)}] = std::move(callback);
}

std::optional<Value> FunctionRegistry::find_function(std::string_view name) const {
    auto it = functions_.find(std::string(name));
    if (it == functions_.end()) return std::nullopt;
    return it->second;
}

bool FunctionRegistry::has_function(std::string_view name) const {
    return functions_.find(std::string(name)) != functions_.end();
}

std::optional<Value> FunctionRegistry::bind_method(const Value& self, std::string_view name) const {
    auto it = methods_.find(std::make_pair(type_name(self), std::string(name)));
    if (it == methods_.end()) return std::nullopt;

    auto fn = std::make_shared<BuiltinFunction>();
    fn->name = type_name(self) + "." + std::string(name);
    fn->callback = [cb = it->second, self](const std::vector<Value>& args,
                                           const CallSite& site,
                                           diag::Bag& diags) -> std::optional<Value> {
        return cb(self, args, site, diags);
    };
    Value v{};
    v.data = std::move(fn);
    return v;
}

} // namespace stencil::eval
