#include <stencil/parse/Parser.hpp>

#include <cctype>
#include <unordered_map>

namespace stencil::parse {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_continue(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

syntax::TokenKind keyword_or_ident(std::string_view s) {
    using K = syntax::TokenKind;
    static const std::unordered_map<std::string_view, K> kMap = {
        {"True", K::kKwTrue},
        {"true", K::kKwTrue},
        {"False", K::kKwFalse},
        {"false", K::kKwFalse},
        {"None", K::kKwNone},
        {"none", K::kKwNone},
        {"and", K::kKwAnd},
        {"or", K::kKwOr},
        {"not", K::kKwNot},
        {"in", K::kKwIn},
        {"is", K::kKwIs},
    };

    auto it = kMap.find(s);
    if (it == kMap.end()) return K::kIdent;
    return it->second;
}

} // namespace

std::vector<syntax::Token> lex(std::string_view source, std::string_view where, diag::Bag& diags) {
    using K = syntax::TokenKind;

    std::vector<syntax::Token> toks;
    toks.reserve(source.size() / 3 + 1);

    size_t i = 0;

    auto at = [&](size_t off) -> char {
        const size_t p = i + off;
        if (p >= source.size()) return '\0';
        return source[p];
    };

    auto push = [&](K kind, std::string lexeme, size_t offset) {
        toks.push_back(syntax::Token{kind, std::move(lexeme), static_cast<uint32_t>(offset)});
    };

    auto fail = [&](size_t offset, std::string msg) {
        diags.add(diag::Code::C_LEX_ERROR, std::string(where), static_cast<uint32_t>(offset), std::move(msg));
        push(K::kEof, "", offset);
        return toks;
    };

    // Returns the end of the word starting after whitespace at `from` if it
    // equals `word`, otherwise 0.
    auto follow_word = [&](size_t from, std::string_view word) -> size_t {
        size_t p = from;
        if (p >= source.size() || !std::isspace(static_cast<unsigned char>(source[p]))) return 0;
        while (p < source.size() && std::isspace(static_cast<unsigned char>(source[p]))) ++p;
        if (source.substr(p, word.size()) != word) return 0;
        const size_t end = p + word.size();
        if (end < source.size() && is_ident_continue(source[end])) return 0;
        return end;
    };

    while (i < source.size()) {
        const char c = at(0);
        const size_t start = i;

        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        // two-character operators first
        if (c == '*' && at(1) == '*') { push(K::kStarStar, "**", start); i += 2; continue; }
        if (c == '/' && at(1) == '/') { push(K::kSlashSlash, "//", start); i += 2; continue; }
        if (c == '=' && at(1) == '=') { push(K::kEqEq, "==", start); i += 2; continue; }
        if (c == '!' && at(1) == '=') { push(K::kBangEq, "!=", start); i += 2; continue; }
        if (c == '<' && at(1) == '=') { push(K::kLtEq, "<=", start); i += 2; continue; }
        if (c == '>' && at(1) == '=') { push(K::kGtEq, ">=", start); i += 2; continue; }

        switch (c) {
            case '(': push(K::kLParen, "(", start); ++i; continue;
            case ')': push(K::kRParen, ")", start); ++i; continue;
            case '{': push(K::kLBrace, "{", start); ++i; continue;
            case '}': push(K::kRBrace, "}", start); ++i; continue;
            case '[': push(K::kLBracket, "[", start); ++i; continue;
            case ']': push(K::kRBracket, "]", start); ++i; continue;
            case ',': push(K::kComma, ",", start); ++i; continue;
            case ':': push(K::kColon, ":", start); ++i; continue;
            case '.': push(K::kDot, ".", start); ++i; continue;
            case '|': push(K::kPipe, "|", start); ++i; continue;
            case '+': push(K::kPlus, "+", start); ++i; continue;
            case '-': push(K::kMinus, "-", start); ++i; continue;
            case '*': push(K::kStar, "*", start); ++i; continue;
            case '/': push(K::kSlash, "/", start); ++i; continue;
            case '%': push(K::kPercent, "%", start); ++i; continue;
            case '<': push(K::kLt, "<", start); ++i; continue;
            case '>': push(K::kGt, ">", start); ++i; continue;
            default: break;
        }

        // string
        if (c == '"' || c == '\'') {
            const char quote = c;
            ++i;
            std::string out;
            bool ok = false;
            while (i < source.size()) {
                const char ch = at(0);
                if (ch == '\\' && i + 1 < source.size()) {
                    const char esc = at(1);
                    switch (esc) {
                        case 'n': out.push_back('\n'); break;
                        case 't': out.push_back('\t'); break;
                        case 'r': out.push_back('\r'); break;
                        case '"': out.push_back('"'); break;
                        case '\'': out.push_back('\''); break;
                        case '\\': out.push_back('\\'); break;
                        default:
                            out.push_back('\\');
                            out.push_back(esc);
                            break;
                    }
                    i += 2;
                    continue;
                }
                if (ch == quote) {
                    ++i;
                    ok = true;
                    break;
                }
                out.push_back(ch);
                ++i;
            }
            if (!ok) return fail(start, "unterminated string literal");
            push(K::kStringLit, std::move(out), start);
            continue;
        }

        // number: float iff a '.' followed by a digit is present
        if (is_digit(c)) {
            bool is_float = false;
            while (is_digit(at(0))) ++i;
            if (at(0) == '.' && is_digit(at(1))) {
                is_float = true;
                ++i;
                while (is_digit(at(0))) ++i;
            }
            push(is_float ? K::kFloatLit : K::kIntLit, std::string(source.substr(start, i - start)), start);
            continue;
        }

        // identifiers, keywords, word operators
        if (is_ident_start(c)) {
            while (is_ident_continue(at(0))) ++i;
            const std::string_view word = source.substr(start, i - start);
            K kind = keyword_or_ident(word);

            if (kind == K::kKwNot) {
                if (const size_t end = follow_word(i, "in")) {
                    i = end;
                    push(K::kKwNotIn, "not in", start);
                    continue;
                }
            } else if (kind == K::kKwIs) {
                if (const size_t end = follow_word(i, "not")) {
                    i = end;
                    push(K::kKwIsNot, "is not", start);
                    continue;
                }
            }

            push(kind, std::string(word), start);
            continue;
        }

        return fail(start, std::string("unexpected character '") + c + "'");
    }

    push(K::kEof, "", source.size());
    return toks;
}

} // namespace stencil::parse
