#include <stencil/eval/Operators.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace stencil::eval {

namespace {

using K = syntax::TokenKind;

Value make(Value::Array a) { Value v; v.data = std::move(a); return v; }
Value make(std::string s) { Value v; v.data = std::move(s); return v; }
Value make_int(int64_t i) { Value v; v.data = i; return v; }
Value make_float(double d) { Value v; v.data = d; return v; }
Value make_bool(bool b) { Value v; v.data = b; return v; }

// Integer arithmetic wraps instead of overflowing.
int64_t wrap_add(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}
int64_t wrap_sub(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}
int64_t wrap_mul(int64_t a, int64_t b) {
    return static_cast<int64_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

int64_t int_pow(int64_t base, int64_t exp) {
    int64_t out = 1;
    while (exp > 0) {
        if (exp & 1) out = wrap_mul(out, base);
        base = wrap_mul(base, base);
        exp >>= 1;
    }
    return out;
}

// floor division, result sign follows the divisor
int64_t floor_div(int64_t a, int64_t b) {
    if (b == -1) return wrap_sub(0, a);
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

int64_t floor_mod(int64_t a, int64_t b) {
    if (b == -1) return 0;
    int64_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

double float_mod(double a, double b) {
    double r = std::fmod(a, b);
    if (r != 0.0 && ((r < 0.0) != (b < 0.0))) r += b;
    return r;
}

bool is_number(const Value& v) {
    return v.is_int() || v.is_float();
}

void type_error(const CallSite& site, diag::Bag& diags, std::string_view op, const Value& lhs, const Value& rhs) {
    diags.add(diag::Code::E_TYPE_ERROR,
              site.where,
              site.offset,
              "unsupported operand types for '" + std::string(op) + "': '"
                  + type_name(lhs) + "' and '" + type_name(rhs) + "'");
}

void div_by_zero(const CallSite& site, diag::Bag& diags, std::string_view op) {
    diags.add(diag::Code::E_DIVISION_BY_ZERO,
              site.where,
              site.offset,
              "division by zero in '" + std::string(op) + "'");
}

std::optional<Value> repeat(const Value& seq,
                            int64_t count,
                            const EvalBudget& budget,
                            const CallSite& site,
                            diag::Bag& diags) {
    const uint64_t unit = seq.is_string() ? seq.as_string()->size() : seq.as_array()->size();
    if (count <= 0 || unit == 0) {
        if (seq.is_string()) return make(std::string{});
        return make(Value::Array{});
    }

    const uint64_t n = static_cast<uint64_t>(count);
    if (n > budget.max_sequence_length / unit) {
        diags.add(diag::Code::E_BUDGET_EXCEEDED,
                  site.where,
                  site.offset,
                  "repetition result exceeds the sequence length budget ("
                      + std::to_string(budget.max_sequence_length) + ")");
        return std::nullopt;
    }

    if (auto s = seq.as_string()) {
        std::string out;
        out.reserve(static_cast<size_t>(unit * n));
        for (uint64_t i = 0; i < n; ++i) out += *s;
        return make(std::move(out));
    }
    const auto& arr = *seq.as_array();
    Value::Array out;
    out.reserve(static_cast<size_t>(unit * n));
    for (uint64_t i = 0; i < n; ++i) out.insert(out.end(), arr.begin(), arr.end());
    return make(std::move(out));
}

std::optional<Value> compare(K op, const Value& lhs, const Value& rhs, const CallSite& site, diag::Bag& diags) {
    int cmp = 0;
    if (lhs.is_string() && rhs.is_string()) {
        const int c = lhs.as_string()->compare(*rhs.as_string());
        cmp = (c < 0) ? -1 : (c > 0 ? 1 : 0);
    } else {
        double a = 0.0;
        double b = 0.0;
        if (!numeric_promote(lhs, a) || !numeric_promote(rhs, b)) {
            type_error(site, diags, syntax::token_kind_name(op), lhs, rhs);
            return std::nullopt;
        }
        if (std::isnan(a) || std::isnan(b)) return make_bool(false);
        cmp = (a < b) ? -1 : (a > b ? 1 : 0);
    }

    switch (op) {
        case K::kLt: return make_bool(cmp < 0);
        case K::kLtEq: return make_bool(cmp <= 0);
        case K::kGt: return make_bool(cmp > 0);
        case K::kGtEq: return make_bool(cmp >= 0);
        default: break;
    }
    return std::nullopt;
}

std::optional<bool> contains(const Value& needle, const Value& haystack, const CallSite& site, diag::Bag& diags) {
    if (auto s = haystack.as_string()) {
        auto n = needle.as_string();
        if (!n) {
            diags.add(diag::Code::E_TYPE_ERROR,
                      site.where,
                      site.offset,
                      "'in <string>' requires string as left operand, not '" + type_name(needle) + "'");
            return std::nullopt;
        }
        return s->find(*n) != std::string::npos;
    }
    if (auto arr = haystack.as_array()) {
        for (const auto& x : *arr) {
            if (values_equal(needle, x)) return true;
        }
        return false;
    }
    if (auto obj = haystack.as_object()) {
        return obj->find(stringify_key(needle)) != obj->end();
    }
    if (auto native = haystack.as_native_object()) {
        if (native->keys) {
            const std::string key = stringify_key(needle);
            for (const auto& k : native->keys()) {
                if (k == key) return true;
            }
            return false;
        }
    }
    diags.add(diag::Code::E_TYPE_ERROR,
              site.where,
              site.offset,
              "argument of type '" + type_name(haystack) + "' is not a container");
    return std::nullopt;
}

std::optional<Value> arithmetic(K op, const Value& lhs, const Value& rhs, const CallSite& site, diag::Bag& diags) {
    const std::string_view name = syntax::token_kind_name(op);
    if (!is_number(lhs) || !is_number(rhs)) {
        type_error(site, diags, name, lhs, rhs);
        return std::nullopt;
    }

    const bool both_int = lhs.is_int() && rhs.is_int();
    double a = 0.0;
    double b = 0.0;
    numeric_promote(lhs, a);
    numeric_promote(rhs, b);

    if (both_int) {
        const int64_t ai = std::get<int64_t>(lhs.data);
        const int64_t bi = std::get<int64_t>(rhs.data);
        switch (op) {
            case K::kPlus: return make_int(wrap_add(ai, bi));
            case K::kMinus: return make_int(wrap_sub(ai, bi));
            case K::kStar: return make_int(wrap_mul(ai, bi));
            case K::kSlashSlash:
                if (bi == 0) { div_by_zero(site, diags, name); return std::nullopt; }
                return make_int(floor_div(ai, bi));
            case K::kPercent:
                if (bi == 0) { div_by_zero(site, diags, name); return std::nullopt; }
                return make_int(floor_mod(ai, bi));
            case K::kStarStar:
                if (bi >= 0) return make_int(int_pow(ai, bi));
                break;
            default:
                break;
        }
    }

    switch (op) {
        case K::kPlus: return make_float(a + b);
        case K::kMinus: return make_float(a - b);
        case K::kStar: return make_float(a * b);
        case K::kSlash:
            if (b == 0.0) { div_by_zero(site, diags, name); return std::nullopt; }
            return make_float(a / b);
        case K::kSlashSlash:
            if (b == 0.0) { div_by_zero(site, diags, name); return std::nullopt; }
            return make_float(std::floor(a / b));
        case K::kPercent:
            if (b == 0.0) { div_by_zero(site, diags, name); return std::nullopt; }
            return make_float(float_mod(a, b));
        case K::kStarStar:
            if (a == 0.0 && b < 0.0) { div_by_zero(site, diags, name); return std::nullopt; }
            return make_float(std::pow(a, b));
        default:
            break;
    }

    type_error(site, diags, name, lhs, rhs);
    return std::nullopt;
}

} // namespace

std::optional<Value> binary_op(K op,
                               const Value& lhs,
                               const Value& rhs,
                               const EvalBudget& budget,
                               const CallSite& site,
                               diag::Bag& diags) {
    switch (op) {
        case K::kEqEq:
        case K::kKwIs:
            return make_bool(values_equal(lhs, rhs));
        case K::kBangEq:
        case K::kKwIsNot:
            return make_bool(!values_equal(lhs, rhs));

        case K::kLt:
        case K::kLtEq:
        case K::kGt:
        case K::kGtEq:
            return compare(op, lhs, rhs, site, diags);

        case K::kKwIn:
        case K::kKwNotIn: {
            auto found = contains(lhs, rhs, site, diags);
            if (!found) return std::nullopt;
            return make_bool(op == K::kKwIn ? *found : !*found);
        }

        case K::kPlus:
            if (lhs.is_string() && rhs.is_string()) {
                return make(*lhs.as_string() + *rhs.as_string());
            }
            if (lhs.is_array() && rhs.is_array()) {
                Value::Array out = *lhs.as_array();
                out.insert(out.end(), rhs.as_array()->begin(), rhs.as_array()->end());
                return make(std::move(out));
            }
            return arithmetic(op, lhs, rhs, site, diags);

        case K::kStar:
            if ((lhs.is_string() || lhs.is_array()) && rhs.is_int()) {
                return repeat(lhs, std::get<int64_t>(rhs.data), budget, site, diags);
            }
            if (lhs.is_int() && (rhs.is_string() || rhs.is_array())) {
                return repeat(rhs, std::get<int64_t>(lhs.data), budget, site, diags);
            }
            return arithmetic(op, lhs, rhs, site, diags);

        case K::kMinus:
        case K::kSlash:
        case K::kSlashSlash:
        case K::kPercent:
        case K::kStarStar:
            return arithmetic(op, lhs, rhs, site, diags);

        default:
            break;
    }

    diags.add(diag::Code::E_TYPE_ERROR,
              site.where,
              site.offset,
              "unsupported binary operator: " + std::string(syntax::token_kind_name(op)));
    return std::nullopt;
}

std::optional<Value> unary_op(K op,
                              const Value& operand,
                              const CallSite& site,
                              diag::Bag& diags) {
    if (op == K::kKwNot) return make_bool(!truthy(operand));

    if (op == K::kMinus) {
        if (auto pi = std::get_if<int64_t>(&operand.data)) return make_int(wrap_sub(0, *pi));
        if (auto pf = std::get_if<double>(&operand.data)) return make_float(-*pf);
    }
    if (op == K::kPlus && is_number(operand)) return operand;

    diags.add(diag::Code::E_TYPE_ERROR,
              site.where,
              site.offset,
              "bad operand type for unary '" + std::string(syntax::token_kind_name(op))
                  + "': '" + type_name(operand) + "'");
    return std::nullopt;
}

} // namespace stencil::eval
