#include <stencil/Engine.hpp>
#include <stencil/builtins/ValueUtil.hpp>
#include <stencil/text/Utf8.hpp>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

    using stencil::eval::Context;
    using stencil::eval::Value;
    namespace util = stencil::builtins::util;
    namespace diag = stencil::diag;

    static bool require_(bool cond, const std::string& msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool expect_render(const std::string& tpl, const std::string& want, const Context& ctx = {}) {
        diag::Bag bag;
        auto out = stencil::render_template(tpl, ctx, bag);
        if (!out || bag.has_error()) {
            std::cerr << "  - unexpected failure for: " << tpl << "\n" << bag.render_text();
            return false;
        }
        return require_(*out == want, "render of `" + tpl + "`: want `" + want + "`, got `" + *out + "`");
    }

    static bool expect_code(const std::string& src, diag::Code code, const Context& ctx = {}) {
        diag::Bag bag;
        auto v = stencil::evaluate_expression(src, ctx, bag);
        bool ok = true;
        ok &= require_(!v.has_value(), src + " should fail");
        ok &= require_(bag.has_code(code), src + " should report " + diag::code_name(code) + "\n" + bag.render_text());
        return ok;
    }

    static bool test_string_filters() {
        bool ok = true;
        ok &= expect_render("{{ 'abc' | upper }}", "ABC");
        ok &= expect_render("{{ 'AbC' | lower }}", "abc");
        ok &= expect_render("{{ 'hELLO world' | capitalize }}", "Hello world");
        ok &= expect_render("{{ '' | capitalize }}", "");
        ok &= expect_render("{{ 'a-b-c' | replace('-', '+') }}", "a+b+c");
        ok &= expect_render("{{ 'a-b-c' | replace('-', '', 1) }}", "ab-c");
        ok &= expect_render("{{ '  pad  ' | trim }}|", "pad|");
        ok &= expect_render("{{ 'xxhixx' | trim('x') }}", "hi");
        ok &= expect_render("{{ '<p class=\"a\">it\\'s</p>' | escape }}",
                            "&lt;p class=&#34;a&#34;&gt;it&#39;s&lt;/p&gt;");
        ok &= expect_render("{{ 42 | upper }}", "42");
        return ok;
    }

    static bool test_sequence_filters() {
        Context ctx;
        ctx["empty"] = util::make_string("");
        ctx["zero"] = util::make_int(0);
        ctx["m"] = util::make_object({{"b", util::make_int(2)}, {"a", util::make_int(1)}});

        bool ok = true;
        ok &= expect_render("{{ [1, 'a', 2.5] | join(', ') }}", "1, a, 2.5");
        ok &= expect_render("{{ ['x', 'y'] | join }}", "xy");
        ok &= expect_render("{{ 'ab' | list }}", "['a', 'b']");
        ok &= expect_render("{{ m | list }}", "['a', 'b']", ctx);
        ok &= expect_render("{{ 5 | list }}", "[5]");
        ok &= expect_render("{{ missing | default('fallback') }}", "fallback");
        ok &= expect_render("{{ empty | default('fallback') }}", "fallback", ctx);
        ok &= expect_render("{{ zero | default('fallback') }}", "0", ctx);
        ok &= expect_render("{{ zero | default('fallback', true) }}", "fallback", ctx);
        ok &= expect_render("{{ missing | default(none_like) | join }}", "", {{"none_like", util::make_array()}});

        ok &= expect_code("5 | join", diag::Code::E_TYPE_ERROR);
        ok &= expect_code("'a' | default", diag::Code::E_TYPE_ERROR);
        ok &= expect_code("'a' | upper(1)", diag::Code::E_TYPE_ERROR);
        ok &= expect_code("'a' | replace(1, 'b')", diag::Code::E_TYPE_ERROR);
        return ok;
    }

    static bool test_methods() {
        Context ctx;
        ctx["cfg"] = util::make_object({{"port", util::make_int(8080)}, {"host", util::make_string("db")}});

        bool ok = true;
        ok &= expect_render("{{ cfg.get('port') }}", "8080", ctx);
        ok &= expect_render("{{ cfg.get('user', 'root') }}", "root", ctx);
        ok &= expect_render("[{{ cfg.get('user') }}]", "[]", ctx);
        ok &= expect_render("{{ cfg.keys() }}", "['host', 'port']", ctx);
        ok &= expect_render("{{ cfg.values() }}", "['db', 8080]", ctx);
        ok &= expect_render("{{ cfg.items()[0] }}", "['host', 'db']", ctx);
        ok &= expect_render("{{ 'Mixed'.upper() }}{{ 'Mixed'.lower() }}", "MIXEDmixed");
        ok &= expect_render("[{{ '  s  '.strip() }}]", "[s]");
        ok &= expect_render("{{ 'prefix_x'.startswith('prefix') }} {{ 'x.txt'.endswith('.md') }}", "true false");
        ok &= expect_render("{{ 'a,b,,c'.split(',') }}", "['a', 'b', '', 'c']");
        ok &= expect_render("{{ ' a  b '.split() | join('|') }}", "a|b");

        ok &= expect_code("cfg.nope()", diag::Code::E_ATTRIBUTE_NOT_FOUND, ctx);
        ok &= expect_code("'s'.nope()", diag::Code::E_ATTRIBUTE_NOT_FOUND);
        ok &= expect_code("cfg.get()", diag::Code::E_TYPE_ERROR, ctx);
        ok &= expect_code("'a'.split('')", diag::Code::E_TYPE_ERROR);
        return ok;
    }

    static bool test_lookup() {
        bool ok = true;

        ::setenv("STENCIL_LOOKUP_TEST", "from-env", 1);
        ok &= expect_render("{{ lookup('env', 'STENCIL_LOOKUP_TEST') }}", "from-env");
        ::unsetenv("STENCIL_LOOKUP_TEST");
        ok &= expect_render("[{{ lookup('env', 'STENCIL_LOOKUP_TEST') }}]", "[]");

        const std::filesystem::path fixture = std::filesystem::path(STENCIL_TEST_CASE_DIR) / "lookup_fixture.txt";
        Context ctx;
        ctx["path"] = util::make_string(fixture.string());
        ok &= expect_render("{{ lookup('file', path) | trim }}", "fixture-contents", ctx);

        ok &= expect_code("lookup('file', '/nonexistent/stencil/fixture')", diag::Code::E_CALL_FAILED);
        ok &= expect_code("lookup('dns', 'x')", diag::Code::E_CALL_FAILED);
        ok &= expect_code("lookup('env')", diag::Code::E_TYPE_ERROR);
        return ok;
    }

    static bool test_custom_registration() {
        stencil::eval::Environment env = stencil::builtins::make_default_environment();

        env.filters.register_filter("suffix", [](const Value& input, const std::vector<Value>& args,
                                                 const stencil::eval::CallSite& site, diag::Bag& diags)
                                                  -> std::optional<Value> {
            std::string s;
            if (!util::arg_as_string(args, 0, s, "suffix", site, diags)) return std::nullopt;
            return util::make_string(util::coerce_text(input) + s);
        });

        env.functions.register_function("twice", [](const std::vector<Value>& args,
                                                    const stencil::eval::CallSite& site, diag::Bag& diags)
                                                     -> std::optional<Value> {
            int64_t n = 0;
            if (!util::arg_as_int(args, 0, n, "twice", site, diags)) return std::nullopt;
            return util::make_int(n * 2);
        });

        env.functions.register_method("list", "size", [](const Value& self, const std::vector<Value>&,
                                                         const stencil::eval::CallSite&, diag::Bag&)
                                                          -> std::optional<Value> {
            return util::make_int(static_cast<int64_t>(self.as_array()->size()));
        });

        env.functions.register_function("silent_failure", [](const std::vector<Value>&,
                                                             const stencil::eval::CallSite&, diag::Bag&)
                                                              -> std::optional<Value> {
            return std::nullopt;
        });

        bool ok = true;
        diag::Bag bag;
        auto out = stencil::render_template("{{ 'v' | suffix('1') }} {{ twice(21) }} {{ [1, 2, 3].size() }}",
                                            {}, bag, env);
        ok &= require_(out && *out == "v1 42 3", "host-registered filter, function and method");

        auto fn = stencil::evaluate_expression("twice", {}, bag, env);
        ok &= require_(fn && fn->is_native_function() && stencil::eval::to_display(*fn) == "<function twice>",
                       "bare function name resolves to a callable");
        ok &= require_(!bag.has_error(), "no diagnostics from custom registrations\n" + bag.render_text());

        diag::Bag bag2;
        auto bad = stencil::evaluate_expression("silent_failure()", {}, bag2, env);
        ok &= require_(!bad && bag2.has_code(diag::Code::E_CALL_FAILED),
                       "a callable failing without a diagnostic gets a generic one");

        diag::Bag bag3;
        auto shadow = stencil::evaluate_expression("twice", {{"twice", util::make_int(7)}}, bag3, env);
        auto p = shadow ? std::get_if<int64_t>(&shadow->data) : nullptr;
        ok &= require_(p && *p == 7, "context binding shadows a registered function");

        diag::Bag bag4;
        auto plain = stencil::render_template("{{ 'v' | suffix('1') }}", {}, bag4);
        ok &= require_(!plain && bag4.has_code(diag::Code::E_UNKNOWN_FILTER),
                       "registrations do not leak into the default environment");
        return ok;
    }

    static bool test_utf8_split() {
        const auto parts = stencil::text::split_chars("a\xC3\xA9\xE2\x82\xAC\xFF");
        bool ok = true;
        ok &= require_(parts.size() == 4, "split into four pieces, got " + std::to_string(parts.size()));
        if (parts.size() == 4) {
            ok &= require_(parts[1] == "\xC3\xA9", "two-byte sequence stays whole");
            ok &= require_(parts[2] == "\xE2\x82\xAC", "three-byte sequence stays whole");
            ok &= require_(parts[3] == "\xFF", "invalid byte comes out alone");
        }
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"string_filters", test_string_filters},
        {"sequence_filters", test_sequence_filters},
        {"methods", test_methods},
        {"lookup", test_lookup},
        {"custom_registration", test_custom_registration},
        {"utf8_split", test_utf8_split},
    };

    int failed = 0;
    for (const auto& c : cases) {
        if (!c.fn()) {
            std::cerr << "[FAIL] " << c.name << "\n";
            ++failed;
        }
    }

    if (failed != 0) {
        std::cerr << failed << " builtin test case(s) failed\n";
        return 1;
    }

    std::cout << "builtin tests passed\n";
    return 0;
}
