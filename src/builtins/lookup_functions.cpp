#include <stencil/builtins/ValueUtil.hpp>
#include <stencil/os/File.hpp>

#include <cstdlib>
#include <string>
#include <vector>

namespace stencil::builtins::detail {

namespace {

std::optional<eval::Value> lookup(const std::vector<eval::Value>& args,
                                  const eval::CallSite& site,
                                  diag::Bag& diags) {
    std::string kind;
    std::string target;
    if (!util::expect_arg_count(args, 2, "lookup", site, diags)) return std::nullopt;
    if (!util::arg_as_string(args, 0, kind, "lookup", site, diags)) return std::nullopt;
    if (!util::arg_as_string(args, 1, target, "lookup", site, diags)) return std::nullopt;

    if (kind == "env") {
        const char* v = std::getenv(target.c_str());
        return util::make_string(v ? std::string(v) : std::string());
    }

    if (kind == "file") {
        auto r = os::read_text_file(target);
        if (!r.ok) {
            diags.add(diag::Code::E_CALL_FAILED, site.where, site.offset, "lookup('file'): " + r.err);
            return std::nullopt;
        }
        return util::make_string(std::move(r.text));
    }

    diags.add(diag::Code::E_CALL_FAILED, site.where, site.offset, "unsupported lookup type: " + kind);
    return std::nullopt;
}

} // namespace

void register_lookup_functions(eval::FunctionRegistry& reg) {
    reg.register_function("lookup", lookup);
}

} // namespace stencil::builtins::detail
