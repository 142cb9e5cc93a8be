#include <stencil/Engine.hpp>
#include <stencil/builtins/ValueUtil.hpp>
#include <stencil/eval/Evaluator.hpp>
#include <stencil/parse/Parser.hpp>

#include <cmath>
#include <iostream>
#include <memory>
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

    static std::optional<Value> eval_ok(const std::string& src, const Context& ctx = {}) {
        diag::Bag bag;
        auto v = stencil::evaluate_expression(src, ctx, bag);
        if (!v || bag.has_error()) {
            std::cerr << "  - unexpected failure for: " << src << "\n" << bag.render_text();
            return std::nullopt;
        }
        return v;
    }

    static bool expect_int(const std::string& src, int64_t want, const Context& ctx = {}) {
        auto v = eval_ok(src, ctx);
        if (!v) return false;
        auto p = std::get_if<int64_t>(&v->data);
        return require_(p && *p == want,
                        src + " should be int " + std::to_string(want) + ", got " + stencil::eval::to_repr(*v));
    }

    static bool expect_float(const std::string& src, double want, const Context& ctx = {}) {
        auto v = eval_ok(src, ctx);
        if (!v) return false;
        auto p = std::get_if<double>(&v->data);
        return require_(p && std::fabs(*p - want) < 1e-9,
                        src + " should be float " + std::to_string(want) + ", got " + stencil::eval::to_repr(*v));
    }

    static bool expect_bool(const std::string& src, bool want, const Context& ctx = {}) {
        auto v = eval_ok(src, ctx);
        if (!v) return false;
        auto p = std::get_if<bool>(&v->data);
        return require_(p && *p == want,
                        src + " should be " + (want ? "true" : "false") + ", got " + stencil::eval::to_repr(*v));
    }

    static bool expect_str(const std::string& src, const std::string& want, const Context& ctx = {}) {
        auto v = eval_ok(src, ctx);
        if (!v) return false;
        auto p = v->as_string();
        return require_(p && *p == want, src + " should be '" + want + "', got " + stencil::eval::to_repr(*v));
    }

    static bool expect_code(const std::string& src, diag::Code code, const Context& ctx = {}) {
        diag::Bag bag;
        auto v = stencil::evaluate_expression(src, ctx, bag);
        bool ok = true;
        ok &= require_(!v.has_value(), src + " should fail");
        ok &= require_(bag.has_code(code),
                       src + " should report " + diag::code_name(code) + "\n" + bag.render_text());
        return ok;
    }

    static bool test_literals() {
        bool ok = true;
        ok &= expect_int("42", 42);
        ok &= expect_float("3.5", 3.5);
        ok &= expect_str("'hi'", "hi");
        ok &= expect_str("\"say \\\"hi\\\"\"", "say \"hi\"");
        ok &= expect_bool("True", true);
        ok &= expect_bool("false", false);

        auto none = eval_ok("None");
        ok &= require_(none && none->is_null(), "None should evaluate to null");

        auto list = eval_ok("[1, 'a', None]");
        ok &= require_(list && stencil::eval::to_display(*list) == "[1, 'a', None]", "list literal display");

        auto dict = eval_ok("{'b': 2, 'a': [1, 2]}");
        ok &= require_(dict && stencil::eval::to_display(*dict) == "{'a': [1, 2], 'b': 2}", "dict literal display");
        return ok;
    }

    static bool test_precedence() {
        bool ok = true;
        ok &= expect_int("1 + 2 * 3", 7);
        ok &= expect_int("(1 + 2) * 3", 9);
        ok &= expect_int("2 ** 3 * 2 + 3", 19);
        ok &= expect_int("-2 ** 2", -4);
        ok &= expect_int("10 - 4 - 3", 3);
        ok &= expect_int("2 ** 3 ** 2", 64);
        ok &= expect_bool("not 1 == 2", true);
        ok &= expect_bool("1 < 2 and 3 > 4 or 5 >= 5", true);
        return ok;
    }

    static bool test_arithmetic() {
        bool ok = true;
        ok &= expect_float("7 / 2", 3.5);
        ok &= expect_float("4 / 2", 2.0);
        ok &= expect_int("7 // 2", 3);
        ok &= expect_int("-7 // 2", -4);
        ok &= expect_int("-7 % 3", 2);
        ok &= expect_float("7.5 // 2", 3.0);
        ok &= expect_float("2 ** -1", 0.5);
        ok &= expect_float("1 + 2.5", 3.5);
        ok &= expect_int("+5", 5);
        ok &= expect_str("'ab' + 'cd'", "abcd");
        ok &= expect_str("'ab' * 3", "ababab");
        ok &= expect_int("([1, 2] + [3])[2]", 3);
        ok &= expect_int("([0] * 4)[3]", 0);

        ok &= expect_code("1 / 0", diag::Code::E_DIVISION_BY_ZERO);
        ok &= expect_code("1 // 0", diag::Code::E_DIVISION_BY_ZERO);
        ok &= expect_code("5 % 0", diag::Code::E_DIVISION_BY_ZERO);
        ok &= expect_code("'a' - 1", diag::Code::E_TYPE_ERROR);
        ok &= expect_code("-'a'", diag::Code::E_TYPE_ERROR);
        ok &= expect_code("1 < 'a'", diag::Code::E_TYPE_ERROR);
        return ok;
    }

    static bool test_comparison_and_membership() {
        bool ok = true;
        ok &= expect_bool("1 < 2.5", true);
        ok &= expect_bool("'abc' < 'abd'", true);
        ok &= expect_bool("1 == 1.0", true);
        ok &= expect_bool("[1, 2.0] == [1, 2]", true);
        ok &= expect_bool("{'a': 1} != {'a': 2}", true);
        ok &= expect_bool("1 is 1.0", true);
        ok &= expect_bool("None is not None", false);
        ok &= expect_bool("'ell' in 'hello'", true);
        ok &= expect_bool("2 in [1, 2, 3]", true);
        ok &= expect_bool("3 not in [1, 2]", true);
        ok &= expect_bool("'k' in {'k': 0}", true);
        ok &= expect_bool("1 in {'1': 'x'}", true);
        ok &= expect_code("1 in 'abc'", diag::Code::E_TYPE_ERROR);
        return ok;
    }

    static bool test_short_circuit() {
        bool ok = true;
        Context ctx;
        ctx["false"] = util::make_bool(false);
        ctx["true"] = util::make_bool(true);
        ok &= expect_bool("false and undefined_var", false, ctx);
        ok &= expect_bool("true or undefined_var", true, ctx);
        ok &= expect_int("0 or 5", 5);
        ok &= expect_str("'x' and 'y'", "y");
        ok &= expect_code("true and undefined_var", diag::Code::E_UNDEFINED_VARIABLE, ctx);
        return ok;
    }

    static bool test_access() {
        bool ok = true;
        Context ctx;
        ctx["items"] = util::make_array({util::make_int(10), util::make_int(20), util::make_int(30)});
        ctx["user"] = util::make_object({{"name", util::make_string("ada")},
                                          {"tags", util::make_array({util::make_string("x")})}});

        ok &= expect_int("items[-1]", 30, ctx);
        ok &= expect_int("items[0]", 10, ctx);
        ok &= expect_int("items[1.0]", 20, ctx);
        ok &= expect_str("user.name", "ada", ctx);
        ok &= expect_str("user['name']", "ada", ctx);
        ok &= expect_str("user.tags[0]", "x", ctx);
        ok &= expect_str("'hello'[-1]", "o");
        ok &= expect_int("{'a': [1, 2]}['a'][1]", 2);

        ok &= expect_code("items[3]", diag::Code::E_INDEX_ERROR, ctx);
        ok &= expect_code("items[-4]", diag::Code::E_INDEX_ERROR, ctx);
        ok &= expect_code("items['a']", diag::Code::E_TYPE_ERROR, ctx);
        ok &= expect_code("user.email", diag::Code::E_ATTRIBUTE_NOT_FOUND, ctx);
        ok &= expect_code("user['email']", diag::Code::E_ATTRIBUTE_NOT_FOUND, ctx);
        ok &= expect_code("items(1)", diag::Code::E_NOT_CALLABLE, ctx);
        ok &= expect_code("5[0]", diag::Code::E_TYPE_ERROR);

        // float keys beyond int64 are out of range, not a wrapped index
        ok &= expect_code("items[10.0 ** 300]", diag::Code::E_INDEX_ERROR, ctx);
        ok &= expect_code("items[-(10.0 ** 300)]", diag::Code::E_INDEX_ERROR, ctx);
        ok &= expect_code("items[9223372036854775808.0]", diag::Code::E_INDEX_ERROR, ctx);

        // string positions are characters, not bytes
        ok &= expect_str("'h\xC3\xA9llo'[1]", "\xC3\xA9");
        ok &= expect_str("'h\xC3\xA9llo'[-4]", "\xC3\xA9");
        ok &= expect_str("'h\xC3\xA9llo'[4]", "o");
        ok &= expect_code("'h\xC3\xA9llo'[5]", diag::Code::E_INDEX_ERROR);
        return ok;
    }

    static bool test_repetition() {
        bool ok = true;
        ok &= expect_str("'ab' * 3", "ababab");
        ok &= expect_str("2 * 'xy'", "xyxy");
        ok &= expect_str("'ab' * -3", "");
        ok &= expect_str("'' * 9223372036854775807", "");

        auto empty = eval_ok("[] * 9223372036854775807");
        ok &= require_(empty && empty->is_array() && empty->as_array()->empty(),
                       "empty list repeated any number of times stays empty");

        ok &= expect_code("'ab' * 4611686018427387904", diag::Code::E_BUDGET_EXCEEDED);
        ok &= expect_code("[1, 2] * 9223372036854775807", diag::Code::E_BUDGET_EXCEEDED);

        stencil::eval::Environment env = stencil::builtins::make_default_environment();
        env.budget.max_sequence_length = 4;

        diag::Bag bag;
        auto fits = stencil::evaluate_expression("'ab' * 2", {}, bag, env);
        ok &= require_(fits && fits->as_string() && *fits->as_string() == "abab",
                       "repetition at the length limit succeeds");

        diag::Bag bag2;
        auto over = stencil::evaluate_expression("'ab' * 3", {}, bag2, env);
        ok &= require_(!over && bag2.has_code(diag::Code::E_BUDGET_EXCEEDED),
                       "repetition past the length limit reports a budget error");
        return ok;
    }

    static bool test_native_object() {
        auto obj = std::make_shared<stencil::eval::NativeObject>();
        obj->name = "Host";
        obj->get_attribute = [](std::string_view name, const stencil::eval::CallSite&, diag::Bag&)
            -> std::optional<Value> {
            if (name == "Name") return util::make_string("box");
            if (name == "Size") return util::make_int(3);
            return std::nullopt;
        };
        obj->keys = [] { return std::vector<std::string>{"Name", "Size"}; };
        obj->get_item = [](const Value& key, const stencil::eval::CallSite&, diag::Bag&) -> std::optional<Value> {
            if (auto p = std::get_if<int64_t>(&key.data)) return util::make_int(*p * 10);
            return std::nullopt;
        };
        obj->call = [](const std::vector<Value>& args, const stencil::eval::CallSite&, diag::Bag&)
            -> std::optional<Value> {
            return util::make_int(static_cast<int64_t>(args.size()));
        };

        Context ctx;
        ctx["host"] = util::make_native_object(obj);

        bool ok = true;
        ok &= expect_str("host.Name", "box", ctx);
        ok &= expect_str("host.name", "box", ctx);
        ok &= expect_int("host.size + 1", 4, ctx);
        ok &= expect_int("host[4]", 40, ctx);
        ok &= expect_int("host(1, 2, 3)", 3, ctx);
        ok &= expect_bool("'Size' in host", true, ctx);
        ok &= expect_code("host.color", diag::Code::E_ATTRIBUTE_NOT_FOUND, ctx);
        ok &= expect_code("host['x']", diag::Code::E_ATTRIBUTE_NOT_FOUND, ctx);
        return ok;
    }

    static bool test_undefined_and_filters() {
        bool ok = true;
        ok &= expect_code("x", diag::Code::E_UNDEFINED_VARIABLE);
        ok &= expect_code("x.y", diag::Code::E_UNDEFINED_VARIABLE);
        ok &= expect_code("x | upper", diag::Code::E_UNDEFINED_VARIABLE);
        ok &= expect_str("x | default('d')", "d");
        ok &= expect_str("x | default('d') | upper", "D");
        return ok;
    }

    static bool test_unknown_filter() {
        return expect_code("'a' | bogus_filter", diag::Code::E_UNKNOWN_FILTER);
    }

    static bool test_syntax_errors() {
        bool ok = true;
        ok &= expect_code("1 +", diag::Code::C_SYNTAX_ERROR);
        ok &= expect_code("(1 + 2", diag::Code::C_SYNTAX_ERROR);
        ok &= expect_code("1 2", diag::Code::C_SYNTAX_ERROR);
        ok &= expect_code("a.", diag::Code::C_SYNTAX_ERROR);
        ok &= expect_code("99999999999999999999", diag::Code::C_SYNTAX_ERROR);
        ok &= expect_code("'abc", diag::Code::C_LEX_ERROR);
        ok &= expect_code("1 $ 2", diag::Code::C_LEX_ERROR);

        diag::Bag bag;
        auto e = stencil::parse::parse_source("(1 +", "<expr>", bag);
        ok &= require_(e == nullptr, "truncated expression must not parse");
        ok &= require_(bag.size() == 1, "parser reports only the first syntax error");
        return ok;
    }

    static bool test_budget() {
        stencil::eval::Environment env = stencil::builtins::make_default_environment();
        env.budget.max_expr_depth = 4;

        diag::Bag bag;
        auto v = stencil::evaluate_expression("1 + 2 + 3 + 4 + 5 + 6", {}, bag, env);
        bool ok = true;
        ok &= require_(!v.has_value(), "deep expression should exceed budget");
        ok &= require_(bag.has_code(diag::Code::E_BUDGET_EXCEEDED), "budget diagnostic expected");

        diag::Bag bag2;
        auto w = stencil::evaluate_expression("1 + 2", {}, bag2, env);
        ok &= require_(w && !bag2.has_error(), "shallow expression fits budget");
        return ok;
    }

    static bool test_diagnostic_render() {
        diag::Bag bag;
        (void)stencil::evaluate_expression("missing", {}, bag);
        const std::string text = bag.render_text();
        bool ok = true;
        ok &= require_(text.find("error[E_UNDEFINED_VARIABLE]") != std::string::npos, "render_text shows code");
        ok &= require_(text.find("--> <expr>:0") != std::string::npos, "render_text shows location");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"literals", test_literals},
        {"precedence", test_precedence},
        {"arithmetic", test_arithmetic},
        {"comparison_and_membership", test_comparison_and_membership},
        {"short_circuit", test_short_circuit},
        {"access", test_access},
        {"repetition", test_repetition},
        {"native_object", test_native_object},
        {"undefined_and_filters", test_undefined_and_filters},
        {"unknown_filter", test_unknown_filter},
        {"syntax_errors", test_syntax_errors},
        {"budget", test_budget},
        {"diagnostic_render", test_diagnostic_render},
    };

    int failed = 0;
    for (const auto& c : cases) {
        if (!c.fn()) {
            std::cerr << "[FAIL] " << c.name << "\n";
            ++failed;
        }
    }

    if (failed != 0) {
        std::cerr << failed << " expression test case(s) failed\n";
        return 1;
    }

    std::cout << "expression tests passed\n";
    return 0;
}
