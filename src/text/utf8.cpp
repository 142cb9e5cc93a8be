#include <stencil/text/Utf8.hpp>

namespace stencil::text {

std::size_t utf8_sequence_length(std::string_view s, std::size_t i) {
    const auto is_cont = [](unsigned char b) -> bool {
        return (b & 0xC0) == 0x80;
    };
    if (i >= s.size()) return 0;

    const unsigned char b0 = static_cast<unsigned char>(s[i]);
    if (b0 < 0x80) return 1;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        if (i + 1 >= s.size()) return 0;
        if (!is_cont(static_cast<unsigned char>(s[i + 1]))) return 0;
        return 2;
    }

    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (i + 2 >= s.size()) return 0;
        const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
        const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
        if (!is_cont(b1) || !is_cont(b2)) return 0;
        if (b0 == 0xE0 && b1 < 0xA0) return 0;
        if (b0 == 0xED && b1 >= 0xA0) return 0;
        return 3;
    }

    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (i + 3 >= s.size()) return 0;
        const unsigned char b1 = static_cast<unsigned char>(s[i + 1]);
        const unsigned char b2 = static_cast<unsigned char>(s[i + 2]);
        const unsigned char b3 = static_cast<unsigned char>(s[i + 3]);
        if (!is_cont(b1) || !is_cont(b2) || !is_cont(b3)) return 0;
        if (b0 == 0xF0 && b1 < 0x90) return 0;
        if (b0 == 0xF4 && b1 > 0x8F) return 0;
        return 4;
    }

    return 0;
}

std::vector<std::string> split_chars(std::string_view s) {
    std::vector<std::string> out;
    out.reserve(s.size());
    std::size_t i = 0;
    while (i < s.size()) {
        std::size_t n = utf8_sequence_length(s, i);
        if (n == 0) n = 1;
        out.emplace_back(s.substr(i, n));
        i += n;
    }
    return out;
}

} // namespace stencil::text
