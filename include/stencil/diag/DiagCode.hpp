#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stencil::diag {

enum class Code : uint16_t {
    C_LEX_ERROR = 1,
    C_SYNTAX_ERROR,

    E_UNDEFINED_VARIABLE = 100,
    E_TYPE_ERROR,
    E_INDEX_ERROR,
    E_ATTRIBUTE_NOT_FOUND,
    E_DIVISION_BY_ZERO,
    E_NOT_CALLABLE,
    E_NOT_ITERABLE,
    E_UNKNOWN_FILTER,
    E_CALL_FAILED,
    E_BUDGET_EXCEEDED,

    T_UNCLOSED_BLOCK = 200,
    T_MALFORMED_CONTROL_TAG,
};

inline const char* code_name(Code c) {
    switch (c) {
        case Code::C_LEX_ERROR: return "C_LEX_ERROR";
        case Code::C_SYNTAX_ERROR: return "C_SYNTAX_ERROR";
        case Code::E_UNDEFINED_VARIABLE: return "E_UNDEFINED_VARIABLE";
        case Code::E_TYPE_ERROR: return "E_TYPE_ERROR";
        case Code::E_INDEX_ERROR: return "E_INDEX_ERROR";
        case Code::E_ATTRIBUTE_NOT_FOUND: return "E_ATTRIBUTE_NOT_FOUND";
        case Code::E_DIVISION_BY_ZERO: return "E_DIVISION_BY_ZERO";
        case Code::E_NOT_CALLABLE: return "E_NOT_CALLABLE";
        case Code::E_NOT_ITERABLE: return "E_NOT_ITERABLE";
        case Code::E_UNKNOWN_FILTER: return "E_UNKNOWN_FILTER";
        case Code::E_CALL_FAILED: return "E_CALL_FAILED";
        case Code::E_BUDGET_EXCEEDED: return "E_BUDGET_EXCEEDED";
        case Code::T_UNCLOSED_BLOCK: return "T_UNCLOSED_BLOCK";
        case Code::T_MALFORMED_CONTROL_TAG: return "T_MALFORMED_CONTROL_TAG";
    }
    return "UNKNOWN";
}

/// `where` names the input the offset points into: "<expr>", "<template>",
/// or whatever label the host passed for the template.
struct Diagnostic {
    Code code{};
    std::string where;
    uint32_t offset = 0;
    std::string message;
    std::vector<std::string> notes{};
};

class Bag {
public:
    void add(Code code, std::string where, uint32_t offset, std::string message) {
        diagnostics_.push_back(Diagnostic{code, std::move(where), offset, std::move(message), {}});
    }

    bool has_error() const { return !diagnostics_.empty(); }

    bool has_code(Code code) const {
        for (const auto& d : diagnostics_) {
            if (d.code == code) return true;
        }
        return false;
    }

    std::size_t size() const { return diagnostics_.size(); }

    const std::vector<Diagnostic>& all() const { return diagnostics_; }

    // Appends a context note to every diagnostic added at or after `from`.
    void attach_note(std::size_t from, const std::string& note) {
        for (std::size_t i = from; i < diagnostics_.size(); ++i) {
            diagnostics_[i].notes.push_back(note);
        }
    }

    std::string render_text() const {
        std::ostringstream oss;
        for (const auto& d : diagnostics_) {
            oss << "error[" << code_name(d.code) << "]: " << d.message << "\n";
            oss << " --> " << d.where << ":" << d.offset << "\n";
            for (const auto& n : d.notes) {
                oss << "  = note: " << n << "\n";
            }
        }
        return oss.str();
    }

private:
    std::vector<Diagnostic> diagnostics_{};
};

} // namespace stencil::diag
