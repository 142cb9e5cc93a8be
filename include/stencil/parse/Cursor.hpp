#pragma once

#include <stencil/syntax/TokenKind.hpp>

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace stencil::parse {

/// Forward-only view over a lexed expression. Reads past the end yield the
/// trailing kEof token, which the constructor appends if the lexer did not.
class TokenCursor {
public:
    explicit TokenCursor(std::vector<syntax::Token> tokens) : tokens_(std::move(tokens)) {
        if (tokens_.empty() || tokens_.back().kind != syntax::TokenKind::kEof) {
            const uint32_t off = tokens_.empty() ? 0u : tokens_.back().offset;
            tokens_.push_back(syntax::Token{syntax::TokenKind::kEof, {}, off});
        }
    }

    const syntax::Token& peek(std::size_t k = 0) const {
        const std::size_t i = pos_ + k;
        return i < tokens_.size() ? tokens_[i] : tokens_.back();
    }

    const syntax::Token& bump() {
        const syntax::Token& t = peek();
        if (pos_ + 1 < tokens_.size()) ++pos_;
        return t;
    }

    bool done() const { return peek().kind == syntax::TokenKind::kEof; }

private:
    std::vector<syntax::Token> tokens_;
    std::size_t pos_ = 0;
};

} // namespace stencil::parse
