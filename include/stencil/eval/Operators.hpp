#pragma once

#include <stencil/diag/DiagCode.hpp>
#include <stencil/eval/Registry.hpp>
#include <stencil/eval/Value.hpp>
#include <stencil/syntax/TokenKind.hpp>

#include <optional>

namespace stencil::eval {

/// Strict binary operators (everything except `and` / `or`, which the
/// evaluator short-circuits itself). Sequence repetition is bounded by
/// `budget.max_sequence_length`.
std::optional<Value> binary_op(syntax::TokenKind op,
                               const Value& lhs,
                               const Value& rhs,
                               const EvalBudget& budget,
                               const CallSite& site,
                               diag::Bag& diags);

std::optional<Value> unary_op(syntax::TokenKind op,
                              const Value& operand,
                              const CallSite& site,
                              diag::Bag& diags);

} // namespace stencil::eval
