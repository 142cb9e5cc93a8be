#pragma once

#include <stencil/syntax/TokenKind.hpp>

#include <optional>

namespace stencil::syntax {

    // Higher number = tighter binding.
    enum class Assoc : uint8_t {
        kLeft, kRight
    };

    struct InfixInfo {
        int prec;
        Assoc assoc;
    };

    struct PrefixInfo {
        int prec;
    };

    // '|' filter pipeline sits below every operator.
    inline constexpr int k_prec_pipeline = 5;

    constexpr std::optional<InfixInfo> infix_info(TokenKind k) {
        switch (k) {
            case TokenKind::kKwOr:
                return InfixInfo{10, Assoc::kLeft};

            case TokenKind::kKwAnd:
                return InfixInfo{20, Assoc::kLeft};

            // comparison / membership / identity
            case TokenKind::kEqEq:
            case TokenKind::kBangEq:
            case TokenKind::kLt:
            case TokenKind::kLtEq:
            case TokenKind::kGt:
            case TokenKind::kGtEq:
            case TokenKind::kKwIn:
            case TokenKind::kKwNotIn:
            case TokenKind::kKwIs:
            case TokenKind::kKwIsNot:
                return InfixInfo{40, Assoc::kLeft};

            case TokenKind::kPlus:
            case TokenKind::kMinus:
                return InfixInfo{50, Assoc::kLeft};

            case TokenKind::kStar:
            case TokenKind::kSlash:
            case TokenKind::kSlashSlash:
            case TokenKind::kPercent:
                return InfixInfo{60, Assoc::kLeft};

            case TokenKind::kStarStar:
                return InfixInfo{70, Assoc::kLeft};

            default:
                return std::nullopt;
        }
    }

    // The operand of a prefix operator is parsed with `prec` as its minimum,
    // so `not a == b` is `not (a == b)` and `-2 ** 2` is `-(2 ** 2)`.
    constexpr std::optional<PrefixInfo> prefix_info(TokenKind k) {
        switch (k) {
            case TokenKind::kKwNot:
                return PrefixInfo{30};
            case TokenKind::kPlus:
            case TokenKind::kMinus:
                return PrefixInfo{70};
            default:
                return std::nullopt;
        }
    }

} // namespace stencil::syntax
